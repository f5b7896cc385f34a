#pragma once

#include "core/result.hpp"

#include <QHostAddress>
#include <QString>
#include <chrono>
#include <optional>
#include <utility>
#include <vector>

class QCommandLineParser;

namespace lanpeer {

using Property = std::pair<QString, QString>;
using Properties = std::vector<Property>;

/**
 * Config - Process configuration, parsed once at startup and then only read.
 */
struct Config {
    static constexpr const char* DEFAULT_SERVICE_NAME = "_example._udp";
    static constexpr const char* DEFAULT_SUBNET = "192.168.0.0/16";

    QString instance_name;
    QString service_name = QString::fromLatin1(DEFAULT_SERVICE_NAME);
    quint16 port = 0;  // 0 lets the OS pick an ephemeral port
    Properties properties;

    // Explicit bind address; when unset the interface heuristic picks one.
    std::optional<QHostAddress> bind_address;
    QString subnet = QString::fromLatin1(DEFAULT_SUBNET);

    // Delay between handling one discovery event and taking the next.
    std::chrono::milliseconds pacing{500};
};

/**
 * Split a property argument on its first '='. "a=b=c" yields ("a", "b=c").
 */
[[nodiscard]] Result<Property> parse_key_value(const QString& text);

/**
 * Register the lanpeer options and positional arguments on a parser.
 */
void add_command_line_options(QCommandLineParser& parser);

/**
 * Build a Config from a parser that already ran parse() or process().
 */
[[nodiscard]] Result<Config> config_from_parser(const QCommandLineParser& parser);

/**
 * Path of the env file named on the command line (".env" by default).
 */
[[nodiscard]] QString env_file_from_parser(const QCommandLineParser& parser);

} // namespace lanpeer
