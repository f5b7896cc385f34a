#include "core/config.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>

namespace lanpeer {
namespace {

const QCommandLineOption& service_option() {
    static const QCommandLineOption option(
        QStringList{QStringLiteral("s"), QStringLiteral("service")},
        QStringLiteral("Service name to advertise and browse."),
        QStringLiteral("service_name"),
        QString::fromLatin1(Config::DEFAULT_SERVICE_NAME));
    return option;
}

const QCommandLineOption& port_option() {
    static const QCommandLineOption option(
        QStringList{QStringLiteral("p"), QStringLiteral("port")},
        QStringLiteral("UDP port to bind (0 picks an ephemeral port)."),
        QStringLiteral("port"),
        QStringLiteral("0"));
    return option;
}

const QCommandLineOption& bind_option() {
    static const QCommandLineOption option(
        QStringList{QStringLiteral("b"), QStringLiteral("bind")},
        QStringLiteral("Bind to this IPv4 address instead of picking an interface."),
        QStringLiteral("address"));
    return option;
}

const QCommandLineOption& subnet_option() {
    static const QCommandLineOption option(
        QStringList{QStringLiteral("subnet")},
        QStringLiteral("Private range the picked interface address must fall in."),
        QStringLiteral("cidr"),
        QString::fromLatin1(Config::DEFAULT_SUBNET));
    return option;
}

const QCommandLineOption& env_file_option() {
    static const QCommandLineOption option(
        QStringList{QStringLiteral("env-file")},
        QStringLiteral("Environment file loaded before logging starts."),
        QStringLiteral("path"),
        QStringLiteral(".env"));
    return option;
}

Result<quint16> parse_port(const QString& text) {
    bool ok = false;
    const auto port = text.toUShort(&ok);
    if (!ok) {
        return Result<quint16>::err(Error{
            "invalid port: `" + text.toStdString() + "`", ErrorCode::InvalidArgument});
    }
    return Result<quint16>::ok(port);
}

} // namespace

Result<Property> parse_key_value(const QString& text) {
    const auto pos = text.indexOf(QLatin1Char('='));
    if (pos < 0) {
        return Result<Property>::err(Error{
            "invalid KEY=value: no `=` found in `" + text.toStdString() + "`",
            ErrorCode::InvalidArgument});
    }
    return Result<Property>::ok(Property{text.left(pos), text.mid(pos + 1)});
}

void add_command_line_options(QCommandLineParser& parser) {
    parser.addOption(service_option());
    parser.addOption(port_option());
    parser.addOption(bind_option());
    parser.addOption(subnet_option());
    parser.addOption(env_file_option());
    parser.addPositionalArgument(QStringLiteral("instance_name"),
                                 QStringLiteral("Instance name to register."));
    parser.addPositionalArgument(QStringLiteral("properties"),
                                 QStringLiteral("Key=Value properties to share with peers."),
                                 QStringLiteral("[key=value...]"));
}

Result<Config> config_from_parser(const QCommandLineParser& parser) {
    const auto positional = parser.positionalArguments();
    if (positional.isEmpty() || positional.first().isEmpty()) {
        return Result<Config>::err(Error{"missing instance name", ErrorCode::InvalidArgument});
    }

    Config config;
    config.instance_name = positional.first();
    config.service_name = parser.value(service_option());
    config.subnet = parser.value(subnet_option());

    auto port = parse_port(parser.value(port_option()));
    if (port.is_err()) {
        return Result<Config>::err(port.unwrap_err());
    }
    config.port = port.unwrap();

    if (parser.isSet(bind_option())) {
        const QHostAddress address(parser.value(bind_option()));
        if (address.isNull() || address.protocol() != QAbstractSocket::IPv4Protocol) {
            return Result<Config>::err(Error{
                "invalid bind address: `" + parser.value(bind_option()).toStdString() + "`",
                ErrorCode::InvalidArgument});
        }
        config.bind_address = address;
    }

    if (!config.bind_address) {
        const auto subnet = QHostAddress::parseSubnet(config.subnet);
        if (subnet.first.isNull()) {
            return Result<Config>::err(Error{
                "invalid subnet: `" + config.subnet.toStdString() + "`",
                ErrorCode::InvalidArgument});
        }
    }

    for (qsizetype i = 1; i < positional.size(); ++i) {
        auto property = parse_key_value(positional.at(i));
        if (property.is_err()) {
            return Result<Config>::err(property.unwrap_err());
        }
        config.properties.push_back(std::move(property).unwrap());
    }

    return Result<Config>::ok(std::move(config));
}

QString env_file_from_parser(const QCommandLineParser& parser) {
    return parser.value(env_file_option());
}

} // namespace lanpeer
