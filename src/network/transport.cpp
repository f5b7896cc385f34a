#include "network/transport.hpp"

#include <QLoggingCategory>
#include <QUdpSocket>

#include <array>

Q_LOGGING_CATEGORY(lanpeerTransport, "lanpeer.transport")

namespace lanpeer::network {

UdpTransport::UdpTransport(MessageQueue& outbound, QObject* parent)
    : Task(QStringLiteral("transport"), parent)
    , outbound_(outbound)
    , socket_(std::make_unique<QUdpSocket>(this))
{
}

UdpTransport::~UdpTransport() {
    cancel();
}

Result<quint16, Error> UdpTransport::bind(const QHostAddress& address, quint16 port) {
    if (!socket_->bind(address, port)) {
        return Result<quint16, Error>::err(Error{
            "bind " + address.toString().toStdString() + ":" + std::to_string(port) +
                " failed: " + socket_->errorString().toStdString(),
            ErrorCode::Socket});
    }

    qCInfo(lanpeerTransport) << "Bound" << socket_->localAddress().toString()
                             << "port" << socket_->localPort();
    return Result<quint16, Error>::ok(socket_->localPort());
}

QHostAddress UdpTransport::localAddress() const {
    return socket_ ? socket_->localAddress() : QHostAddress();
}

quint16 UdpTransport::localPort() const {
    return socket_ ? socket_->localPort() : 0;
}

bool UdpTransport::isBound() const {
    return socket_ && socket_->state() == QAbstractSocket::BoundState;
}

void UdpTransport::start() {
    if (!isBound()) {
        fail(Error{"transport started before bind", ErrorCode::Socket});
        return;
    }
    if (outbound_.isClosed()) {
        fail(Error{"outbound queue closed", ErrorCode::ChannelClosed});
        return;
    }

    connect(socket_.get(), &QUdpSocket::readyRead,
            this, &UdpTransport::onReadyRead);
    connect(socket_.get(), &QUdpSocket::errorOccurred,
            this, &UdpTransport::onSocketError);
    connect(&outbound_, &MessageQueue::messageAvailable,
            this, &UdpTransport::onMessageAvailable);
    connect(&outbound_, &MessageQueue::closed, this, [this]() {
        fail(Error{"outbound queue closed", ErrorCode::ChannelClosed});
    });

    // Anything queued or received before start() is handled now.
    onMessageAvailable();
    onReadyRead();
}

void UdpTransport::on_cancel() {
    disconnect(&outbound_, nullptr, this, nullptr);
    if (socket_) {
        disconnect(socket_.get(), nullptr, this, nullptr);
        socket_->close();
    }
}

void UdpTransport::onMessageAvailable() {
    while (!isStopped()) {
        auto message = outbound_.pop();
        if (!message) break;

        const auto bytes = message->bytes();
        const auto written = socket_->writeDatagram(bytes, message->host, message->port);
        if (written < 0) {
            fail(Error{"send to " + message->host.toString().toStdString() + ":" +
                           std::to_string(message->port) + " failed: " +
                           socket_->errorString().toStdString(),
                       ErrorCode::Socket});
            return;
        }

        ++sent_;
        qCDebug(lanpeerTransport) << "Sent" << written << "bytes to"
                                  << message->host.toString() << message->port;
        emit datagramSent(message->host, message->port, written);
    }
}

void UdpTransport::onReadyRead() {
    std::array<char, kMaxDatagramSize> buffer{};

    while (!isStopped() && socket_->hasPendingDatagrams()) {
        QHostAddress sender;
        quint16 sender_port = 0;

        // Anything past kMaxDatagramSize is discarded by the read.
        const auto read = socket_->readDatagram(buffer.data(),
                                                static_cast<qint64>(buffer.size()),
                                                &sender,
                                                &sender_port);
        if (read < 0) {
            fail(Error{"receive failed: " + socket_->errorString().toStdString(),
                       ErrorCode::Socket});
            return;
        }

        ++received_;
        const QByteArray payload(buffer.data(), static_cast<qsizetype>(read));
        qCInfo(lanpeerTransport).noquote() << "Received from"
                                           << QStringLiteral("%1:%2").arg(sender.toString()).arg(sender_port)
                                           << QString::fromUtf8(payload);
        emit datagramReceived(sender, sender_port, payload);
    }
}

void UdpTransport::onSocketError(QAbstractSocket::SocketError error) {
    fail(Error{"socket error " + std::to_string(static_cast<int>(error)) + ": " +
                   socket_->errorString().toStdString(),
               ErrorCode::Socket});
}

} // namespace lanpeer::network
