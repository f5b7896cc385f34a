#include <QCommandLineParser>
#include <QCoreApplication>
#include <QHostAddress>
#include <QTextStream>
#include <QUdpSocket>

#include "core/env_file.hpp"
#include "core/logging.hpp"

// Sends one datagram to a peer, e.g. to poke a running lanpeer instance.
int main(int argc, char **argv) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("lanpeer_udp_send");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Send one UDP datagram."));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption portOption(
        QStringList{QStringLiteral("p"), QStringLiteral("port")},
        QStringLiteral("Destination port."),
        QStringLiteral("port"),
        QStringLiteral("0"));
    parser.addOption(portOption);
    parser.addPositionalArgument(QStringLiteral("address"), QStringLiteral("Destination IP address."));
    parser.addPositionalArgument(QStringLiteral("message"), QStringLiteral("Payload (default: Hello There)."),
                                 QStringLiteral("[message]"));
    parser.process(app);

    const auto env = lanpeer::load_env_file(QStringLiteral(".env"));
    lanpeer::install_logging();
    if (env.is_err()) {
        qCWarning(lanpeerApp) << "Ignoring env file:" << env.unwrap_err().message.c_str();
    }

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }

    const QHostAddress destination(positional.first());
    if (destination.isNull()) {
        QTextStream(stderr) << "error: invalid address `" << positional.first() << "`\n";
        return 1;
    }

    bool ok = false;
    const auto port = parser.value(portOption).toUShort(&ok);
    if (!ok) {
        QTextStream(stderr) << "error: invalid port `" << parser.value(portOption) << "`\n";
        return 1;
    }

    const auto payload = positional.size() > 1 ? positional.at(1).toUtf8() : QByteArray("Hello There");

    QUdpSocket socket;
    const auto any = destination.protocol() == QAbstractSocket::IPv6Protocol
        ? QHostAddress(QHostAddress::AnyIPv6)
        : QHostAddress(QHostAddress::AnyIPv4);
    if (!socket.bind(any, 0)) {
        qCCritical(lanpeerApp) << "bind failed:" << socket.errorString();
        return 2;
    }

    if (socket.writeDatagram(payload, destination, port) < 0) {
        qCCritical(lanpeerApp) << "send failed:" << socket.errorString();
        return 3;
    }

    qCInfo(lanpeerApp) << "Sent" << payload.size() << "bytes to" << destination.toString() << port;
    return 0;
}
