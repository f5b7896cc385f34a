#include "network/discovery.hpp"

#ifdef LANPEER_HAS_AVAHI

#include <avahi-client/client.h>
#include <avahi-client/publish.h>
#include <avahi-client/lookup.h>
#include <avahi-common/error.h>
#include <avahi-common/malloc.h>
#include <avahi-common/strlst.h>
#include <avahi-common/thread-watch.h>

#include <QLoggingCategory>
#include <QMetaObject>
#include <QObject>

#include <memory>

Q_LOGGING_CATEGORY(lanpeerAvahi, "lanpeer.avahi")

namespace lanpeer::network {
namespace {

// Holds the Avahi poll lock for calls made outside the poll thread.
class PollLock {
public:
    explicit PollLock(AvahiThreadedPoll* poll) : poll_(poll) {
        if (poll_) avahi_threaded_poll_lock(poll_);
    }
    ~PollLock() {
        if (poll_) avahi_threaded_poll_unlock(poll_);
    }
    PollLock(const PollLock&) = delete;
    PollLock& operator=(const PollLock&) = delete;

private:
    AvahiThreadedPoll* poll_;
};

QString dotted(const char* first, const char* second = nullptr, const char* third = nullptr) {
    QString out = QString::fromUtf8(first);
    for (const char* part : {second, third}) {
        if (part) out += QLatin1Char('.') + QString::fromUtf8(part);
    }
    return out + QLatin1Char('.');
}

} // namespace

/**
 * Avahi-based mDNS discovery backend for Linux.
 *
 * Avahi calls back on its own poll thread; every event and failure is
 * re-posted to the Qt thread that created the backend.
 */
class AvahiDiscoveryBackend : public DiscoveryBackend {
public:
    AvahiDiscoveryBackend()
        : context_(std::make_unique<QObject>())
    {
    }

    ~AvahiDiscoveryBackend() override {
        on_event = nullptr;
        on_failure = nullptr;

        if (threaded_poll_) {
            avahi_threaded_poll_stop(threaded_poll_);
        }
        if (entry_group_) {
            avahi_entry_group_free(entry_group_);
        }
        if (browser_) {
            avahi_service_browser_free(browser_);
        }
        if (client_) {
            avahi_client_free(client_);
        }
        if (threaded_poll_) {
            avahi_threaded_poll_free(threaded_poll_);
        }
    }

    Result<void, Error> register_service(const ServiceRecord& record) override {
        auto client = ensure_client();
        if (client.is_err()) return client;

        PollLock lock(threaded_poll_);

        entry_group_ = avahi_entry_group_new(client_, entry_group_callback, this);
        if (!entry_group_) {
            return avahi_error("Failed to create entry group", ErrorCode::Discovery);
        }

        AvahiStringList* txt = nullptr;
        for (const auto& [key, value] : record.properties) {
            txt = avahi_string_list_add_pair(txt,
                                             key.toUtf8().constData(),
                                             value.toUtf8().constData());
        }

        // A null host lets Avahi publish every address of this machine.
        const auto type = bare_service_type(record.service_type).toUtf8();
        int ret = avahi_entry_group_add_service_strlst(
            entry_group_,
            AVAHI_IF_UNSPEC,
            AVAHI_PROTO_UNSPEC,
            static_cast<AvahiPublishFlags>(0),
            record.instance_name.toUtf8().constData(),
            type.constData(),
            nullptr,  // domain
            record.address_auto ? nullptr : record.host_name.toUtf8().constData(),
            record.port,
            txt
        );

        avahi_string_list_free(txt);

        if (ret == AVAHI_ERR_COLLISION) {
            return Result<void, Error>::err(Error{
                "service name conflict: " + record.fullname().toStdString(),
                ErrorCode::NameConflict});
        }
        if (ret < 0) {
            return Result<void, Error>::err(Error{
                "Failed to add service: " + std::string(avahi_strerror(ret)),
                ErrorCode::Discovery});
        }

        ret = avahi_entry_group_commit(entry_group_);
        if (ret < 0) {
            return Result<void, Error>::err(Error{
                "Failed to commit service: " + std::string(avahi_strerror(ret)),
                ErrorCode::Discovery});
        }

        return Result<void, Error>::ok();
    }

    void unregister_service() override {
        PollLock lock(threaded_poll_);
        if (entry_group_) {
            avahi_entry_group_reset(entry_group_);
            avahi_entry_group_free(entry_group_);
            entry_group_ = nullptr;
        }
    }

    Result<void, Error> browse(const QString& service_type) override {
        auto client = ensure_client();
        if (client.is_err()) return client;

        PollLock lock(threaded_poll_);

        const auto type = bare_service_type(service_type).toUtf8();
        browser_ = avahi_service_browser_new(
            client_,
            AVAHI_IF_UNSPEC,
            AVAHI_PROTO_UNSPEC,
            type.constData(),
            nullptr,  // domain
            static_cast<AvahiLookupFlags>(0),
            browse_callback,
            this
        );

        if (!browser_) {
            return avahi_error("Failed to create service browser", ErrorCode::Discovery);
        }

        DiscoveryEvent started;
        started.kind = DiscoveryEventKind::SearchStarted;
        started.service_type = service_type;
        post_event(std::move(started));

        return Result<void, Error>::ok();
    }

    void stop_browse() override {
        PollLock lock(threaded_poll_);
        if (browser_) {
            avahi_service_browser_free(browser_);
            browser_ = nullptr;
        }
    }

private:
    std::unique_ptr<QObject> context_;
    AvahiThreadedPoll* threaded_poll_ = nullptr;
    AvahiClient* client_ = nullptr;
    AvahiEntryGroup* entry_group_ = nullptr;
    AvahiServiceBrowser* browser_ = nullptr;

    Result<void, Error> avahi_error(const std::string& what, ErrorCode code) const {
        const int err = client_ ? avahi_client_errno(client_) : AVAHI_ERR_FAILURE;
        return Result<void, Error>::err(Error{what + ": " + avahi_strerror(err), code});
    }

    Result<void, Error> ensure_client() {
        if (client_) return Result<void, Error>::ok();

        threaded_poll_ = avahi_threaded_poll_new();
        if (!threaded_poll_) {
            return Result<void, Error>::err(
                Error{"Failed to create Avahi poll", ErrorCode::Discovery});
        }

        int error = 0;
        client_ = avahi_client_new(
            avahi_threaded_poll_get(threaded_poll_),
            static_cast<AvahiClientFlags>(0),
            client_callback,
            this,
            &error
        );

        if (!client_) {
            avahi_threaded_poll_free(threaded_poll_);
            threaded_poll_ = nullptr;
            return Result<void, Error>::err(Error{
                "Failed to create Avahi client: " + std::string(avahi_strerror(error)),
                ErrorCode::Discovery});
        }

        if (avahi_threaded_poll_start(threaded_poll_) < 0) {
            avahi_client_free(client_);
            client_ = nullptr;
            avahi_threaded_poll_free(threaded_poll_);
            threaded_poll_ = nullptr;
            return Result<void, Error>::err(
                Error{"Failed to start Avahi poll thread", ErrorCode::Discovery});
        }

        return Result<void, Error>::ok();
    }

    void post_event(DiscoveryEvent event) {
        QMetaObject::invokeMethod(context_.get(), [this, event = std::move(event)]() mutable {
            if (on_event) on_event(std::move(event));
        }, Qt::QueuedConnection);
    }

    void post_failure(Error error) {
        QMetaObject::invokeMethod(context_.get(), [this, error = std::move(error)]() mutable {
            if (on_failure) on_failure(std::move(error));
        }, Qt::QueuedConnection);
    }

    static void client_callback(AvahiClient* client, AvahiClientState state, void* userdata) {
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

        switch (state) {
            case AVAHI_CLIENT_S_RUNNING:
                qCDebug(lanpeerAvahi) << "Avahi client running";
                break;
            case AVAHI_CLIENT_FAILURE:
                self->post_failure(Error{
                    "Avahi client failure: " + std::string(avahi_strerror(avahi_client_errno(client))),
                    ErrorCode::Discovery});
                break;
            case AVAHI_CLIENT_S_COLLISION:
            case AVAHI_CLIENT_S_REGISTERING:
                qCDebug(lanpeerAvahi) << "Avahi host name registering";
                break;
            case AVAHI_CLIENT_CONNECTING:
                qCDebug(lanpeerAvahi) << "Waiting for avahi-daemon";
                break;
        }
    }

    static void entry_group_callback(AvahiEntryGroup* group,
                                     AvahiEntryGroupState state,
                                     void* userdata) {
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

        switch (state) {
            case AVAHI_ENTRY_GROUP_ESTABLISHED:
                qCInfo(lanpeerAvahi) << "Service registered";
                break;
            case AVAHI_ENTRY_GROUP_COLLISION:
                self->post_failure(Error{"service name conflict", ErrorCode::NameConflict});
                break;
            case AVAHI_ENTRY_GROUP_FAILURE:
                self->post_failure(Error{
                    "service registration failed: " +
                        std::string(avahi_strerror(avahi_client_errno(avahi_entry_group_get_client(group)))),
                    ErrorCode::Discovery});
                break;
            case AVAHI_ENTRY_GROUP_UNCOMMITED:
            case AVAHI_ENTRY_GROUP_REGISTERING:
                break;
        }
    }

    static void browse_callback(AvahiServiceBrowser* browser,
                                AvahiIfIndex interface,
                                AvahiProtocol protocol,
                                AvahiBrowserEvent event,
                                const char* name,
                                const char* type,
                                const char* domain,
                                AvahiLookupResultFlags /*flags*/,
                                void* userdata) {
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

        switch (event) {
            case AVAHI_BROWSER_NEW: {
                DiscoveryEvent found;
                found.kind = DiscoveryEventKind::ServiceFound;
                found.service_type = dotted(type, domain);
                found.fullname = dotted(name, type, domain);
                self->post_event(std::move(found));

                // Freed in resolve_callback, or with the client.
                if (!avahi_service_resolver_new(self->client_,
                                                interface,
                                                protocol,
                                                name,
                                                type,
                                                domain,
                                                AVAHI_PROTO_UNSPEC,
                                                static_cast<AvahiLookupFlags>(0),
                                                resolve_callback,
                                                userdata)) {
                    qCWarning(lanpeerAvahi) << "Cannot resolve" << name << ":"
                                            << avahi_strerror(avahi_client_errno(self->client_));
                }
                break;
            }

            case AVAHI_BROWSER_REMOVE: {
                DiscoveryEvent removed;
                removed.kind = DiscoveryEventKind::ServiceRemoved;
                removed.service_type = dotted(type, domain);
                removed.fullname = dotted(name, type, domain);
                self->post_event(std::move(removed));
                break;
            }

            case AVAHI_BROWSER_FAILURE:
                self->post_failure(Error{
                    "browse event stream closed: " +
                        std::string(avahi_strerror(avahi_client_errno(
                            avahi_service_browser_get_client(browser)))),
                    ErrorCode::ChannelClosed});
                break;

            case AVAHI_BROWSER_ALL_FOR_NOW:
            case AVAHI_BROWSER_CACHE_EXHAUSTED:
                break;
        }
    }

    static void resolve_callback(AvahiServiceResolver* resolver,
                                 AvahiIfIndex /*interface*/,
                                 AvahiProtocol /*protocol*/,
                                 AvahiResolverEvent event,
                                 const char* name,
                                 const char* type,
                                 const char* domain,
                                 const char* host_name,
                                 const AvahiAddress* address,
                                 uint16_t port,
                                 AvahiStringList* txt,
                                 AvahiLookupResultFlags /*flags*/,
                                 void* userdata) {
        auto* self = static_cast<AvahiDiscoveryBackend*>(userdata);

        if (event == AVAHI_RESOLVER_FOUND) {
            DiscoveryEvent resolved;
            resolved.kind = DiscoveryEventKind::ServiceResolved;
            resolved.service_type = dotted(type, domain);
            resolved.fullname = dotted(name, type, domain);
            resolved.host_name = dotted(host_name);
            resolved.port = port;

            char addr_str[AVAHI_ADDRESS_STR_MAX];
            avahi_address_snprint(addr_str, sizeof(addr_str), address);
            resolved.addresses.append(QHostAddress(QString::fromUtf8(addr_str)));

            for (AvahiStringList* item = txt; item; item = avahi_string_list_get_next(item)) {
                char* key = nullptr;
                char* value = nullptr;
                if (avahi_string_list_get_pair(item, &key, &value, nullptr) == 0) {
                    resolved.properties.emplace_back(QString::fromUtf8(key),
                                                     value ? QString::fromUtf8(value) : QString());
                    avahi_free(key);
                    avahi_free(value);
                }
            }

            self->post_event(std::move(resolved));
        } else {
            qCDebug(lanpeerAvahi) << "Resolve failed for" << name << ":"
                                  << avahi_strerror(avahi_client_errno(self->client_));
        }

        avahi_service_resolver_free(resolver);
    }
};

std::unique_ptr<DiscoveryBackend> create_avahi_backend() {
    return std::make_unique<AvahiDiscoveryBackend>();
}

} // namespace lanpeer::network

#endif // LANPEER_HAS_AVAHI
