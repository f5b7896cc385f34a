#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/task_group.hpp"
#include "network/message_queue.hpp"
#include "network/outbound_message.hpp"
#include "network/service_record.hpp"

#include <QHostAddress>
#include <QList>
#include <QObject>
#include <QString>
#include <deque>
#include <functional>
#include <memory>
#include <vector>

class QTimer;

namespace lanpeer::network {

enum class DiscoveryEventKind {
    SearchStarted,
    ServiceFound,
    ServiceResolved,
    ServiceRemoved,
    SearchStopped
};

[[nodiscard]] const char* to_string(DiscoveryEventKind kind);

/**
 * DiscoveryEvent - One notification from a browse.
 *
 * Only ServiceResolved events carry host_name, addresses, port and properties.
 */
struct DiscoveryEvent {
    DiscoveryEventKind kind = DiscoveryEventKind::SearchStarted;
    QString service_type;
    QString fullname;
    QString host_name;
    QList<QHostAddress> addresses;
    quint16 port = 0;
    Properties properties;
};

/**
 * DiscoveryBackend - Abstract interface for the mDNS collaborator.
 *
 * Callbacks are always invoked on the thread that owns the Qt event loop.
 */
class DiscoveryBackend {
public:
    virtual ~DiscoveryBackend() = default;

    /**
     * Publish a record. Conflicts detected later are reported via on_failure.
     */
    virtual Result<void, Error> register_service(const ServiceRecord& record) = 0;
    virtual void unregister_service() = 0;

    /**
     * Start delivering events for a fully qualified service type.
     */
    virtual Result<void, Error> browse(const QString& service_type) = 0;
    virtual void stop_browse() = 0;

    // Callbacks
    std::function<void(DiscoveryEvent)> on_event;
    // The daemon failed, the name collided, or the event stream closed.
    std::function<void(Error)> on_failure;
};

/**
 * Create the platform-appropriate discovery backend.
 *
 * LANPEER_DISCOVERY_BACKEND=udp forces the multicast beacon backend,
 * LANPEER_DISCOVERY_BACKEND=mdns forces Avahi when it was built in.
 */
std::unique_ptr<DiscoveryBackend> create_discovery_backend();

/**
 * Text a peer receives when we resolve it.
 */
[[nodiscard]] QByteArray announcement_payload(const QString& instance_name,
                                              const QString& peer_fullname);

/**
 * Messages for one event: one per IPv4 address of a ServiceResolved event,
 * none for any other kind.
 */
[[nodiscard]] Result<std::vector<OutboundMessage>> messages_for_event(const DiscoveryEvent& event,
                                                                      const QString& instance_name);

/**
 * DiscoveryTask - Registers this instance, browses for peers, and queues
 * an announcement for every resolved peer address.
 *
 * Events are handled strictly in arrival order. After each event the task
 * pauses for Config::pacing. While the queue is full the task waits for
 * space before touching the next event.
 */
class DiscoveryTask : public Task {
    Q_OBJECT

public:
    DiscoveryTask(Config config,
                  quint16 local_port,
                  MessageQueue& outbound,
                  std::unique_ptr<DiscoveryBackend> backend,
                  QObject* parent = nullptr);
    ~DiscoveryTask() override;

    void start() override;

    /**
     * The registered record (valid once start() succeeded).
     */
    [[nodiscard]] const ServiceRecord& record() const { return record_; }

    [[nodiscard]] std::size_t pendingEvents() const { return events_.size(); }
    [[nodiscard]] std::size_t pendingMessages() const { return pending_.size(); }

signals:
    void registered(const QString& fullname);
    void eventHandled(lanpeer::network::DiscoveryEventKind kind, int queued_messages);

protected:
    void on_cancel() override;

private:
    void onEvent(DiscoveryEvent event);
    void onBackendFailure(Error error);
    void pump();
    bool flushPending();

    Config config_;
    quint16 local_port_;
    MessageQueue& outbound_;
    std::unique_ptr<DiscoveryBackend> backend_;
    std::unique_ptr<QTimer> pacing_timer_;

    ServiceRecord record_;
    std::deque<DiscoveryEvent> events_;
    std::deque<OutboundMessage> pending_;
    DiscoveryEventKind current_kind_ = DiscoveryEventKind::SearchStarted;
    int current_count_ = 0;
    bool event_in_progress_ = false;
    bool waiting_for_space_ = false;
};

} // namespace lanpeer::network

Q_DECLARE_METATYPE(lanpeer::network::DiscoveryEvent)
Q_DECLARE_METATYPE(lanpeer::network::DiscoveryEventKind)
