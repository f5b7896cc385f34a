#pragma once

#include "core/result.hpp"

#include <QHostAddress>
#include <QList>
#include <QNetworkInterface>
#include <QString>

namespace lanpeer::network {

/**
 * InterfaceCandidate - The parts of a network interface the bind
 * heuristic looks at. Kept as plain data so selection is testable.
 */
struct InterfaceCandidate {
    QString name;
    QNetworkInterface::InterfaceFlags flags;
    QList<QHostAddress> addresses;
};

/**
 * Snapshot of the machine's interfaces.
 */
[[nodiscard]] QList<InterfaceCandidate> local_interfaces();

/**
 * Pick the first usable IPv4 address inside `subnet` (CIDR, e.g. "192.168.0.0/16").
 *
 * Interfaces that are down or loopback are skipped, as are non-IPv4 and
 * link-local addresses. Fails with ErrorCode::NoInterface when nothing matches.
 */
[[nodiscard]] Result<QHostAddress> select_bind_address(const QList<InterfaceCandidate>& interfaces,
                                                       const QString& subnet);

} // namespace lanpeer::network
