#pragma once

#include "core/fixed_buffer.hpp"
#include "core/result.hpp"

#include <QByteArray>
#include <QHostAddress>
#include <cstddef>

namespace lanpeer::network {

// Largest payload sent or received in one datagram.
inline constexpr std::size_t kMaxDatagramSize = 1024;

using DatagramBuffer = FixedBuffer<kMaxDatagramSize>;

/**
 * OutboundMessage - One datagram waiting to be sent to a peer.
 */
struct OutboundMessage {
    QHostAddress host;
    quint16 port = 0;
    DatagramBuffer payload;

    /**
     * Create a message, failing with ErrorCode::Overflow when the payload
     * does not fit in one datagram.
     */
    [[nodiscard]] static Result<OutboundMessage> create(const QHostAddress& host,
                                                        quint16 port,
                                                        const QByteArray& payload);

    [[nodiscard]] QByteArray bytes() const {
        return QByteArray(payload.data(), static_cast<qsizetype>(payload.size()));
    }
};

} // namespace lanpeer::network
