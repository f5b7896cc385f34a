#include "network/message_queue.hpp"

#include <QMetaObject>

namespace lanpeer::network {

MessageQueue::MessageQueue(std::size_t capacity, QObject* parent)
    : QObject(parent)
    , capacity_(capacity == 0 ? 1 : capacity)
{
}

MessageQueue::PushResult MessageQueue::push(OutboundMessage message) {
    if (closed_) return PushResult::Closed;
    if (isFull()) return PushResult::Full;

    messages_.push_back(std::move(message));
    notifyMessageAvailable();
    return PushResult::Queued;
}

std::optional<OutboundMessage> MessageQueue::pop() {
    if (messages_.empty()) {
        return std::nullopt;
    }

    const bool was_full = isFull();
    auto message = std::move(messages_.front());
    messages_.pop_front();

    if (was_full) {
        notifySpaceAvailable();
    }
    return message;
}

void MessageQueue::close() {
    if (closed_) return;
    closed_ = true;
    messages_.clear();
    emit closed();
}

void MessageQueue::notifyMessageAvailable() {
    if (message_notice_pending_) return;
    message_notice_pending_ = true;

    QMetaObject::invokeMethod(this, [this]() {
        message_notice_pending_ = false;
        if (!closed_ && !messages_.empty()) {
            emit messageAvailable();
        }
    }, Qt::QueuedConnection);
}

void MessageQueue::notifySpaceAvailable() {
    if (space_notice_pending_) return;
    space_notice_pending_ = true;

    QMetaObject::invokeMethod(this, [this]() {
        space_notice_pending_ = false;
        if (!closed_ && !isFull()) {
            emit spaceAvailable();
        }
    }, Qt::QueuedConnection);
}

} // namespace lanpeer::network
