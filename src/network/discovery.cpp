#include "network/discovery.hpp"
#include "network/udp_discovery_backend.hpp"

#include <QLoggingCategory>
#include <QTimer>

Q_LOGGING_CATEGORY(lanpeerDiscovery, "lanpeer.discovery")

namespace lanpeer::network {

const char* to_string(DiscoveryEventKind kind) {
    switch (kind) {
        case DiscoveryEventKind::SearchStarted: return "SearchStarted";
        case DiscoveryEventKind::ServiceFound: return "ServiceFound";
        case DiscoveryEventKind::ServiceResolved: return "ServiceResolved";
        case DiscoveryEventKind::ServiceRemoved: return "ServiceRemoved";
        case DiscoveryEventKind::SearchStopped: return "SearchStopped";
    }
    return "?";
}

QByteArray announcement_payload(const QString& instance_name, const QString& peer_fullname) {
    return QStringLiteral("MESSAGE %1 Resolved %2 END").arg(instance_name, peer_fullname).toUtf8();
}

Result<std::vector<OutboundMessage>> messages_for_event(const DiscoveryEvent& event,
                                                        const QString& instance_name) {
    std::vector<OutboundMessage> messages;
    if (event.kind != DiscoveryEventKind::ServiceResolved) {
        return Result<std::vector<OutboundMessage>>::ok(std::move(messages));
    }

    const auto payload = announcement_payload(instance_name, event.fullname);
    for (const auto& address : event.addresses) {
        if (address.protocol() != QAbstractSocket::IPv4Protocol) continue;

        auto message = OutboundMessage::create(address, event.port, payload);
        if (message.is_err()) {
            return Result<std::vector<OutboundMessage>>::err(message.unwrap_err());
        }
        messages.push_back(std::move(message).unwrap());
    }
    return Result<std::vector<OutboundMessage>>::ok(std::move(messages));
}

// ============================================================================
// DiscoveryTask
// ============================================================================

DiscoveryTask::DiscoveryTask(Config config,
                             quint16 local_port,
                             MessageQueue& outbound,
                             std::unique_ptr<DiscoveryBackend> backend,
                             QObject* parent)
    : Task(QStringLiteral("discovery"), parent)
    , config_(std::move(config))
    , local_port_(local_port)
    , outbound_(outbound)
    , backend_(std::move(backend))
    , pacing_timer_(std::make_unique<QTimer>(this))
{
    pacing_timer_->setSingleShot(true);
    pacing_timer_->setInterval(config_.pacing);
    connect(pacing_timer_.get(), &QTimer::timeout, this, &DiscoveryTask::pump);

    connect(&outbound_, &MessageQueue::spaceAvailable, this, [this]() {
        if (!waiting_for_space_) return;
        waiting_for_space_ = false;
        pump();
    });
    connect(&outbound_, &MessageQueue::closed, this, [this]() {
        fail(Error{"outbound queue closed", ErrorCode::ChannelClosed});
    });
}

DiscoveryTask::~DiscoveryTask() {
    cancel();
}

void DiscoveryTask::start() {
    if (!backend_) {
        fail(Error{"no discovery backend available", ErrorCode::Discovery});
        return;
    }

    auto record = make_service_record(config_, local_port_, local_host_name());
    if (record.is_err()) {
        fail(record.unwrap_err());
        return;
    }
    record_ = std::move(record).unwrap();

    backend_->on_event = [this](DiscoveryEvent event) {
        onEvent(std::move(event));
    };
    backend_->on_failure = [this](Error error) {
        onBackendFailure(std::move(error));
    };

    qCInfo(lanpeerDiscovery) << "Registering" << record_.fullname()
                             << "port" << record_.port << "host" << record_.host_name;

    auto registered_result = backend_->register_service(record_);
    if (registered_result.is_err()) {
        fail(registered_result.unwrap_err());
        return;
    }

    auto browse_result = backend_->browse(record_.service_type);
    if (browse_result.is_err()) {
        fail(browse_result.unwrap_err());
        return;
    }

    emit registered(record_.fullname());
}

void DiscoveryTask::on_cancel() {
    pacing_timer_->stop();
    disconnect(&outbound_, nullptr, this, nullptr);

    if (backend_) {
        backend_->on_event = nullptr;
        backend_->on_failure = nullptr;
        backend_->stop_browse();
        backend_->unregister_service();
    }

    events_.clear();
    pending_.clear();
    waiting_for_space_ = false;
}

void DiscoveryTask::onEvent(DiscoveryEvent event) {
    if (isStopped()) return;
    events_.push_back(std::move(event));
    pump();
}

void DiscoveryTask::onBackendFailure(Error error) {
    qCWarning(lanpeerDiscovery) << "Discovery backend failed:" << error.message.c_str();
    fail(std::move(error));
}

void DiscoveryTask::pump() {
    if (isStopped() || waiting_for_space_ || pacing_timer_->isActive()) return;

    if (!event_in_progress_) {
        if (events_.empty()) return;

        auto event = std::move(events_.front());
        events_.pop_front();
        event_in_progress_ = true;
        current_kind_ = event.kind;

        qCDebug(lanpeerDiscovery) << "Event:" << to_string(event.kind) << event.fullname
                                  << event.addresses << "port" << event.port;

        auto messages = messages_for_event(event, record_.instance_name);
        if (messages.is_err()) {
            qCWarning(lanpeerDiscovery) << "Skipping" << event.fullname << ":"
                                        << messages.unwrap_err().message.c_str();
        } else {
            for (auto& message : messages.unwrap()) {
                pending_.push_back(std::move(message));
            }
        }
        current_count_ = static_cast<int>(pending_.size());

        if (event.kind == DiscoveryEventKind::ServiceResolved) {
            qCInfo(lanpeerDiscovery) << "Resolved" << event.fullname << "->"
                                     << current_count_ << "message(s)";
        }
    }

    if (!flushPending()) return;

    event_in_progress_ = false;
    emit eventHandled(current_kind_, current_count_);
    if (!isStopped()) {
        pacing_timer_->start();
    }
}

bool DiscoveryTask::flushPending() {
    while (!pending_.empty()) {
        switch (outbound_.push(pending_.front())) {
            case MessageQueue::PushResult::Queued:
                pending_.pop_front();
                break;
            case MessageQueue::PushResult::Full:
                qCDebug(lanpeerDiscovery) << "Outbound queue full, waiting";
                waiting_for_space_ = true;
                return false;
            case MessageQueue::PushResult::Closed:
                fail(Error{"outbound queue closed", ErrorCode::ChannelClosed});
                return false;
        }
    }
    return true;
}

// ============================================================================
// Backends
// ============================================================================

namespace {

// Used when mDNS was requested but not built in.
class FallbackDiscoveryBackend : public DiscoveryBackend {
public:
    Result<void, Error> register_service(const ServiceRecord&) override {
        return Result<void, Error>::err(
            Error{"mDNS not available on this platform", ErrorCode::Discovery});
    }

    void unregister_service() override {}

    Result<void, Error> browse(const QString&) override {
        return Result<void, Error>::err(
            Error{"mDNS not available on this platform", ErrorCode::Discovery});
    }

    void stop_browse() override {}
};

} // namespace

#ifdef LANPEER_HAS_AVAHI
// Implemented in platform/linux/avahi_discovery.cpp
std::unique_ptr<DiscoveryBackend> create_avahi_backend();
#endif

std::unique_ptr<DiscoveryBackend> create_discovery_backend() {
    const auto backend = qEnvironmentVariable("LANPEER_DISCOVERY_BACKEND").trimmed().toLower();
    if (backend == QLatin1String("udp")) {
        return std::make_unique<UdpDiscoveryBackend>();
    }

#ifdef LANPEER_HAS_AVAHI
    return create_avahi_backend();
#else
    if (backend == QLatin1String("mdns")) {
        return std::make_unique<FallbackDiscoveryBackend>();
    }
    return std::make_unique<UdpDiscoveryBackend>();
#endif
}

} // namespace lanpeer::network
