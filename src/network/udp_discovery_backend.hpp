#pragma once

#include "network/discovery.hpp"

#include <QDateTime>
#include <QHostAddress>
#include <QObject>
#include <memory>
#include <unordered_map>

class QUdpSocket;
class QTimer;

namespace lanpeer::network {

/**
 * UDP multicast/broadcast discovery backend.
 *
 * Doesn't need a system mDNS daemon. It periodically announces the
 * registered record and turns peer announcements into discovery events.
 */
class UdpDiscoveryBackend final : public QObject, public DiscoveryBackend {
    Q_OBJECT

public:
    static constexpr quint16 DISCOVERY_PORT = 47778;
    static constexpr int ADVERTISE_INTERVAL_MS = 1000;
    static constexpr int PRUNE_INTERVAL_MS = 1000;
    static constexpr qint64 PEER_TTL_MS = 5000;

    explicit UdpDiscoveryBackend(QObject* parent = nullptr);
    ~UdpDiscoveryBackend() override;

    Result<void, Error> register_service(const ServiceRecord& record) override;
    void unregister_service() override;

    Result<void, Error> browse(const QString& service_type) override;
    void stop_browse() override;

private slots:
    void onReadyRead();
    void onAdvertiseTick();
    void onPruneTick();

private:
    struct PeerEntry {
        ServiceRecord record;
        QHostAddress host;
        qint64 last_seen_ms = 0;
    };

    Result<void, Error> ensureSocket();
    void closeSocket();
    void announceOnce();
    void deliver(DiscoveryEvent event);
    DiscoveryEvent resolvedEvent(const PeerEntry& entry) const;

    std::unique_ptr<QUdpSocket> socket_;
    std::unique_ptr<QTimer> advertise_timer_;
    std::unique_ptr<QTimer> prune_timer_;

    QString nonce_;
    bool advertising_ = false;
    bool browsing_ = false;
    ServiceRecord advertised_{};
    QString browse_type_;

    std::unordered_map<QString, PeerEntry> peers_;
};

} // namespace lanpeer::network
