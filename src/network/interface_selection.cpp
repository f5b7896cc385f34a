#include "network/interface_selection.hpp"

#include <QNetworkAddressEntry>

namespace lanpeer::network {

QList<InterfaceCandidate> local_interfaces() {
    QList<InterfaceCandidate> candidates;

    const auto interfaces = QNetworkInterface::allInterfaces();
    for (const auto& iface : interfaces) {
        InterfaceCandidate candidate;
        candidate.name = iface.humanReadableName();
        candidate.flags = iface.flags();
        for (const auto& entry : iface.addressEntries()) {
            candidate.addresses.append(entry.ip());
        }
        candidates.append(std::move(candidate));
    }
    return candidates;
}

Result<QHostAddress> select_bind_address(const QList<InterfaceCandidate>& interfaces,
                                         const QString& subnet) {
    const auto range = QHostAddress::parseSubnet(subnet);
    if (range.first.isNull()) {
        return Result<QHostAddress>::err(Error{
            "invalid subnet: `" + subnet.toStdString() + "`", ErrorCode::InvalidArgument});
    }

    for (const auto& iface : interfaces) {
        if (!iface.flags.testFlag(QNetworkInterface::IsUp) ||
            iface.flags.testFlag(QNetworkInterface::IsLoopBack)) {
            continue;
        }

        for (const auto& address : iface.addresses) {
            if (address.protocol() != QAbstractSocket::IPv4Protocol) continue;
            if (address.isLoopback() || address.isLinkLocal()) continue;
            if (!address.isInSubnet(range)) continue;
            return Result<QHostAddress>::ok(address);
        }
    }

    return Result<QHostAddress>::err(Error{
        "no up, non-loopback IPv4 interface address in " + subnet.toStdString(),
        ErrorCode::NoInterface});
}

} // namespace lanpeer::network
