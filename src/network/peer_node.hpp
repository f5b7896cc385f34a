#pragma once

#include "core/config.hpp"
#include "core/result.hpp"
#include "core/task_group.hpp"
#include "network/discovery.hpp"
#include "network/message_queue.hpp"
#include "network/transport.hpp"

#include <QHostAddress>
#include <QObject>
#include <memory>
#include <optional>

namespace lanpeer::network {

/**
 * PeerNode - Wires the transport and discovery tasks together.
 *
 * start() binds the transport first, because discovery advertises the
 * bound port, then runs both tasks in one fail-fast TaskGroup. When either
 * task fails the other is cancelled and failed() carries the original error.
 */
class PeerNode : public QObject {
    Q_OBJECT

public:
    PeerNode(Config config,
             std::unique_ptr<DiscoveryBackend> backend,
             QObject* parent = nullptr);
    ~PeerNode() override;

    /**
     * Bind and start both tasks. Errors raised while starting are returned
     * here; later ones arrive through failed().
     */
    Result<void, Error> start();

    /**
     * Cancel both tasks without reporting an error.
     */
    void stop();

    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] UdpTransport& transport() { return transport_; }
    [[nodiscard]] MessageQueue& queue() { return queue_; }
    [[nodiscard]] DiscoveryTask* discovery() { return discovery_.get(); }
    [[nodiscard]] bool isRunning() const { return group_.isRunning(); }
    [[nodiscard]] const std::optional<Error>& error() const { return group_.error(); }

signals:
    void failed(const lanpeer::Error& error);

private:
    [[nodiscard]] Result<QHostAddress, Error> bindAddress() const;

    Config config_;
    std::unique_ptr<DiscoveryBackend> backend_;
    MessageQueue queue_;
    UdpTransport transport_;
    std::unique_ptr<DiscoveryTask> discovery_;
    // Declared last so it is destroyed before the tasks it cancels.
    TaskGroup group_;
    bool started_ = false;
};

} // namespace lanpeer::network
