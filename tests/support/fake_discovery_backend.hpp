#pragma once

#include "network/discovery.hpp"

#include <QCoreApplication>
#include <QMetaObject>
#include <QObject>
#include <algorithm>
#include <memory>
#include <optional>
#include <vector>

namespace lanpeer::testing {

using network::DiscoveryBackend;
using network::DiscoveryEvent;
using network::DiscoveryEventKind;
using network::ServiceRecord;

/**
 * Scriptable backend: records what the task asked for and lets the test
 * push events and failures by hand.
 */
class FakeDiscoveryBackend : public DiscoveryBackend {
public:
    std::optional<ServiceRecord> registered;
    QString browsed_type;
    bool browsing = false;
    int unregister_calls = 0;
    int stop_browse_calls = 0;
    std::optional<Error> register_error;
    std::optional<Error> browse_error;

    Result<void, Error> register_service(const ServiceRecord& record) override {
        if (register_error) return Result<void, Error>::err(*register_error);
        registered = record;
        return Result<void, Error>::ok();
    }

    void unregister_service() override { ++unregister_calls; }

    Result<void, Error> browse(const QString& service_type) override {
        if (browse_error) return Result<void, Error>::err(*browse_error);
        browsed_type = service_type;
        browsing = true;
        return Result<void, Error>::ok();
    }

    void stop_browse() override {
        browsing = false;
        ++stop_browse_calls;
    }

    void emitEvent(DiscoveryEvent event) {
        if (on_event) on_event(std::move(event));
    }

    void emitFailure(Error error) {
        if (on_failure) on_failure(std::move(error));
    }
};

inline DiscoveryEvent resolved_event(const QString& fullname,
                                     QList<QHostAddress> addresses,
                                     quint16 port) {
    DiscoveryEvent event;
    event.kind = DiscoveryEventKind::ServiceResolved;
    event.service_type = QStringLiteral("_example._udp.local.");
    event.fullname = fullname;
    event.host_name = QStringLiteral("peer.local.");
    event.addresses = std::move(addresses);
    event.port = port;
    return event;
}

class BusDiscoveryBackend;

/**
 * In-memory stand-in for the LAN: every browsing member is told about
 * every other registered member with a matching service type.
 */
class FakeDiscoveryBus {
public:
    void join(BusDiscoveryBackend* member) { members_.push_back(member); }
    void leave(BusDiscoveryBackend* member) {
        members_.erase(std::remove(members_.begin(), members_.end(), member), members_.end());
    }
    void refresh();

private:
    std::vector<BusDiscoveryBackend*> members_;
};

class BusDiscoveryBackend : public DiscoveryBackend {
public:
    BusDiscoveryBackend(FakeDiscoveryBus& bus, QHostAddress address)
        : bus_(bus), address_(std::move(address)), context_(std::make_unique<QObject>()) {
        bus_.join(this);
    }

    ~BusDiscoveryBackend() override { bus_.leave(this); }

    Result<void, Error> register_service(const ServiceRecord& record) override {
        record_ = record;
        bus_.refresh();
        return Result<void, Error>::ok();
    }

    void unregister_service() override { record_.reset(); }

    Result<void, Error> browse(const QString& service_type) override {
        browse_type_ = service_type;
        bus_.refresh();
        return Result<void, Error>::ok();
    }

    void stop_browse() override { browse_type_.clear(); }

    const std::optional<ServiceRecord>& record() const { return record_; }
    const QHostAddress& address() const { return address_; }

    void offer(const BusDiscoveryBackend& peer) {
        if (&peer == this || browse_type_.isEmpty() || !peer.record_) return;
        if (peer.record_->service_type != browse_type_) return;

        const auto fullname = peer.record_->fullname();
        if (std::find(seen_.begin(), seen_.end(), fullname) != seen_.end()) return;
        seen_.push_back(fullname);

        auto event = resolved_event(fullname, {peer.address_}, peer.record_->port);
        event.service_type = peer.record_->service_type;
        QMetaObject::invokeMethod(context_.get(), [this, event = std::move(event)]() mutable {
            if (on_event) on_event(std::move(event));
        }, Qt::QueuedConnection);
    }

private:
    FakeDiscoveryBus& bus_;
    QHostAddress address_;
    std::unique_ptr<QObject> context_;
    std::optional<ServiceRecord> record_;
    QString browse_type_;
    std::vector<QString> seen_;
};

inline void FakeDiscoveryBus::refresh() {
    for (auto* browser : members_) {
        for (auto* peer : members_) {
            browser->offer(*peer);
        }
    }
}

} // namespace lanpeer::testing
