#include "network/outbound_message.hpp"

#include <string_view>

namespace lanpeer::network {

Result<OutboundMessage> OutboundMessage::create(const QHostAddress& host,
                                                quint16 port,
                                                const QByteArray& payload) {
    OutboundMessage message;
    message.host = host;
    message.port = port;

    auto written = message.payload.append(
        std::string_view(payload.constData(), static_cast<size_t>(payload.size())));
    if (written.is_err()) {
        return Result<OutboundMessage>::err(written.unwrap_err());
    }
    return Result<OutboundMessage>::ok(std::move(message));
}

} // namespace lanpeer::network
