#pragma once

#include "core/result.hpp"
#include "network/service_record.hpp"

#include <QByteArray>
#include <QString>

namespace lanpeer::network {

// Beacon helpers used by UdpDiscoveryBackend.
// Kept separate so encode/decode can be tested without sockets.

struct Beacon {
    ServiceRecord record;
    QString nonce;  // identifies the sending backend instance
};

QByteArray encode_beacon(const ServiceRecord& record, const QString& nonce);

Result<Beacon, Error> decode_beacon(const QByteArray& datagram);

} // namespace lanpeer::network
