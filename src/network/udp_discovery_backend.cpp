#include "network/udp_discovery_backend.hpp"
#include "network/discovery_datagram.hpp"

#include <QByteArray>
#include <QLoggingCategory>
#include <QMetaObject>
#include <QTimer>
#include <QUdpSocket>
#include <QUuid>

Q_LOGGING_CATEGORY(lanpeerUdpDiscovery, "lanpeer.udpdiscovery")

namespace lanpeer::network {
namespace {

const QHostAddress kMulticastGroup(QStringLiteral("239.255.77.78"));

} // namespace

UdpDiscoveryBackend::UdpDiscoveryBackend(QObject* parent)
    : QObject(parent)
    , advertise_timer_(std::make_unique<QTimer>(this))
    , prune_timer_(std::make_unique<QTimer>(this))
    , nonce_(QUuid::createUuid().toString(QUuid::WithoutBraces))
{
    advertise_timer_->setInterval(ADVERTISE_INTERVAL_MS);
    prune_timer_->setInterval(PRUNE_INTERVAL_MS);

    connect(advertise_timer_.get(), &QTimer::timeout, this, &UdpDiscoveryBackend::onAdvertiseTick);
    connect(prune_timer_.get(), &QTimer::timeout, this, &UdpDiscoveryBackend::onPruneTick);
}

UdpDiscoveryBackend::~UdpDiscoveryBackend() {
    on_event = nullptr;
    on_failure = nullptr;
    unregister_service();
    stop_browse();
}

Result<void, Error> UdpDiscoveryBackend::ensureSocket() {
    if (socket_) {
        return Result<void, Error>::ok();
    }

    socket_ = std::make_unique<QUdpSocket>(this);
    socket_->setSocketOption(QAbstractSocket::MulticastTtlOption, 1);

    if (!socket_->bind(QHostAddress::AnyIPv4,
                       DISCOVERY_PORT,
                       QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        auto msg = "discovery socket bind failed: " + socket_->errorString().toStdString();
        socket_.reset();
        return Result<void, Error>::err(Error{msg, ErrorCode::Discovery});
    }

    if (!socket_->joinMulticastGroup(kMulticastGroup)) {
        qCWarning(lanpeerUdpDiscovery) << "Cannot join" << kMulticastGroup
                                       << socket_->errorString() << "- relying on broadcast";
    }
    connect(socket_.get(), &QUdpSocket::readyRead, this, &UdpDiscoveryBackend::onReadyRead);

    return Result<void, Error>::ok();
}

void UdpDiscoveryBackend::closeSocket() {
    if (!socket_) return;
    socket_->leaveMulticastGroup(kMulticastGroup);
    socket_.reset();
}

Result<void, Error> UdpDiscoveryBackend::register_service(const ServiceRecord& record) {
    advertised_ = record;
    advertising_ = true;

    auto socket = ensureSocket();
    if (socket.is_err()) {
        advertising_ = false;
        return socket;
    }

    advertise_timer_->start();
    announceOnce();
    return Result<void, Error>::ok();
}

void UdpDiscoveryBackend::unregister_service() {
    advertising_ = false;
    advertise_timer_->stop();
    if (!browsing_) {
        closeSocket();
    }
}

Result<void, Error> UdpDiscoveryBackend::browse(const QString& service_type) {
    browse_type_ = service_type;
    browsing_ = true;

    auto socket = ensureSocket();
    if (socket.is_err()) {
        browsing_ = false;
        return socket;
    }

    prune_timer_->start();

    DiscoveryEvent started;
    started.kind = DiscoveryEventKind::SearchStarted;
    started.service_type = service_type;
    deliver(std::move(started));
    return Result<void, Error>::ok();
}

void UdpDiscoveryBackend::stop_browse() {
    if (!browsing_) return;
    browsing_ = false;
    prune_timer_->stop();
    peers_.clear();

    if (on_event) {
        DiscoveryEvent stopped;
        stopped.kind = DiscoveryEventKind::SearchStopped;
        stopped.service_type = browse_type_;
        on_event(std::move(stopped));
    }

    if (!advertising_) {
        closeSocket();
    }
}

void UdpDiscoveryBackend::deliver(DiscoveryEvent event) {
    // Queued, so callers never see an event from inside browse().
    QMetaObject::invokeMethod(this, [this, event = std::move(event)]() mutable {
        if (browsing_ && on_event) on_event(std::move(event));
    }, Qt::QueuedConnection);
}

DiscoveryEvent UdpDiscoveryBackend::resolvedEvent(const PeerEntry& entry) const {
    DiscoveryEvent event;
    event.kind = DiscoveryEventKind::ServiceResolved;
    event.service_type = entry.record.service_type;
    event.fullname = entry.record.fullname();
    event.host_name = entry.record.host_name;
    event.addresses = {entry.host};
    event.port = entry.record.port;
    event.properties = entry.record.properties;
    return event;
}

void UdpDiscoveryBackend::onReadyRead() {
    if (!socket_) return;

    while (socket_->hasPendingDatagrams()) {
        QByteArray datagram;
        datagram.resize(static_cast<qsizetype>(socket_->pendingDatagramSize()));

        QHostAddress sender;
        if (socket_->readDatagram(datagram.data(), datagram.size(), &sender) < 0) {
            qCDebug(lanpeerUdpDiscovery) << "Read failed:" << socket_->errorString();
            continue;
        }

        if (!browsing_) continue;

        auto decoded = decode_beacon(datagram);
        if (decoded.is_err()) {
            qCDebug(lanpeerUdpDiscovery) << "Ignoring datagram from" << sender << ":"
                                         << decoded.unwrap_err().message.c_str();
            continue;
        }

        auto beacon = std::move(decoded).unwrap();
        if (beacon.nonce == nonce_) continue;
        if (beacon.record.service_type != browse_type_) continue;

        const auto fullname = beacon.record.fullname();
        if (advertising_ && fullname == advertised_.fullname()) {
            if (on_failure) {
                on_failure(Error{"service name conflict: " + fullname.toStdString() +
                                     " is already announced by " + sender.toString().toStdString(),
                                 ErrorCode::NameConflict});
            }
            return;
        }

        // Bound to AnyIPv4, but normalise in case the stack reports a mapped address.
        bool is_v4 = false;
        const auto v4 = sender.toIPv4Address(&is_v4);
        const auto host = is_v4 ? QHostAddress(v4) : sender;
        const auto now = QDateTime::currentMSecsSinceEpoch();

        auto it = peers_.find(fullname);
        if (it == peers_.end()) {
            PeerEntry entry{beacon.record, host, now};

            DiscoveryEvent found;
            found.kind = DiscoveryEventKind::ServiceFound;
            found.service_type = beacon.record.service_type;
            found.fullname = fullname;
            deliver(std::move(found));
            deliver(resolvedEvent(entry));

            peers_.emplace(fullname, std::move(entry));
        } else {
            it->second.last_seen_ms = now;
            const bool changed = (it->second.host != host) ||
                                 (it->second.record.port != beacon.record.port) ||
                                 (it->second.record.properties != beacon.record.properties);
            if (changed) {
                it->second.record = beacon.record;
                it->second.host = host;
                deliver(resolvedEvent(it->second));
            }
        }
    }
}

void UdpDiscoveryBackend::announceOnce() {
    if (!socket_ || !advertising_) return;

    const auto bytes = encode_beacon(advertised_, nonce_);

    // Multicast (preferred), then broadcast for networks without multicast.
    // A beacon that fails is retried on the next tick.
    for (const auto& target : {kMulticastGroup, QHostAddress(QHostAddress::Broadcast)}) {
        if (socket_->writeDatagram(bytes, target, DISCOVERY_PORT) < 0) {
            qCDebug(lanpeerUdpDiscovery) << "Beacon to" << target << "failed:"
                                         << socket_->errorString();
        }
    }
}

void UdpDiscoveryBackend::onAdvertiseTick() {
    announceOnce();
}

void UdpDiscoveryBackend::onPruneTick() {
    if (!browsing_) return;

    const auto now = QDateTime::currentMSecsSinceEpoch();
    std::vector<QString> expired;
    for (const auto& [name, entry] : peers_) {
        if (now - entry.last_seen_ms > PEER_TTL_MS) {
            expired.push_back(name);
        }
    }

    for (const auto& name : expired) {
        auto it = peers_.find(name);
        DiscoveryEvent removed;
        removed.kind = DiscoveryEventKind::ServiceRemoved;
        removed.service_type = it->second.record.service_type;
        removed.fullname = name;
        peers_.erase(it);
        deliver(std::move(removed));
    }
}

} // namespace lanpeer::network
