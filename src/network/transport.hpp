#pragma once

#include "core/result.hpp"
#include "core/task_group.hpp"
#include "network/message_queue.hpp"
#include "network/outbound_message.hpp"

#include <QAbstractSocket>
#include <QByteArray>
#include <QHostAddress>
#include <memory>

class QUdpSocket;

namespace lanpeer::network {

/**
 * UdpTransport - Owns the UDP socket and the consuming side of the
 * outbound queue.
 *
 * Once started it runs two independent directions on one socket:
 * - send: every queued message goes to its own destination;
 * - receive: each datagram is read into a kMaxDatagramSize buffer,
 *   logged and re-emitted. Longer datagrams are cut off silently.
 *
 * A socket error or the queue closing fails the task.
 */
class UdpTransport : public Task {
    Q_OBJECT

public:
    explicit UdpTransport(MessageQueue& outbound, QObject* parent = nullptr);
    ~UdpTransport() override;

    /**
     * Bind the socket.
     * @param address Local IPv4 address to bind
     * @param port Port to bind (0 for auto-assign)
     * @return The port actually bound
     */
    Result<quint16, Error> bind(const QHostAddress& address, quint16 port = 0);

    void start() override;

    [[nodiscard]] QHostAddress localAddress() const;
    [[nodiscard]] quint16 localPort() const;
    [[nodiscard]] bool isBound() const;

    [[nodiscard]] quint64 sentCount() const { return sent_; }
    [[nodiscard]] quint64 receivedCount() const { return received_; }

signals:
    void datagramReceived(const QHostAddress& sender, quint16 sender_port, const QByteArray& payload);
    void datagramSent(const QHostAddress& host, quint16 port, qint64 bytes);

protected:
    void on_cancel() override;

private slots:
    void onMessageAvailable();
    void onReadyRead();
    void onSocketError(QAbstractSocket::SocketError error);

private:
    MessageQueue& outbound_;
    std::unique_ptr<QUdpSocket> socket_;
    quint64 sent_ = 0;
    quint64 received_ = 0;
};

} // namespace lanpeer::network
