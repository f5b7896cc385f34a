#pragma once

#include "network/outbound_message.hpp"

#include <QObject>
#include <cstddef>
#include <deque>
#include <optional>

namespace lanpeer::network {

/**
 * MessageQueue - Bounded single-producer/single-consumer channel.
 *
 * The producer pushes until the queue reports Full, then waits for
 * spaceAvailable(). The consumer pops on messageAvailable(). Notifications
 * are queued on the event loop, so neither side is re-entered from inside
 * push() or pop().
 */
class MessageQueue : public QObject {
    Q_OBJECT

public:
    static constexpr std::size_t DEFAULT_CAPACITY = 10;

    enum class PushResult {
        Queued,
        Full,
        Closed
    };

    explicit MessageQueue(std::size_t capacity = DEFAULT_CAPACITY, QObject* parent = nullptr);
    ~MessageQueue() override = default;

    /**
     * Append a message. On Full or Closed the message is not taken.
     */
    [[nodiscard]] PushResult push(OutboundMessage message);

    /**
     * Take the oldest message, or nothing when the queue is empty.
     */
    [[nodiscard]] std::optional<OutboundMessage> pop();

    /**
     * Close the channel. Queued messages are dropped and both sides
     * are told through closed().
     */
    void close();

    [[nodiscard]] bool isClosed() const { return closed_; }
    [[nodiscard]] bool isFull() const { return messages_.size() >= capacity_; }
    [[nodiscard]] bool isEmpty() const { return messages_.empty(); }
    [[nodiscard]] std::size_t size() const { return messages_.size(); }
    [[nodiscard]] std::size_t capacity() const { return capacity_; }

signals:
    void messageAvailable();
    void spaceAvailable();
    void closed();

private:
    void notifyMessageAvailable();
    void notifySpaceAvailable();

    std::size_t capacity_;
    std::deque<OutboundMessage> messages_;
    bool closed_ = false;
    bool message_notice_pending_ = false;
    bool space_notice_pending_ = false;
};

} // namespace lanpeer::network
