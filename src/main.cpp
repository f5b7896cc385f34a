#include <QCoreApplication>
#include <QCommandLineParser>
#include <QTextStream>

#include "core/config.hpp"
#include "core/env_file.hpp"
#include "core/logging.hpp"
#include "network/discovery.hpp"
#include "network/peer_node.hpp"

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("lanpeer");
    app.setApplicationVersion("0.1.0");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "An experiment in discovery.\n"
        "Registers an mDNS service instance, browses for peers advertising the same\n"
        "service, and sends each resolved peer a short UDP message."));
    parser.addHelpOption();
    parser.addVersionOption();
    lanpeer::add_command_line_options(parser);
    parser.process(app);

    // The env file may set LANPEER_LOG, so it has to be read before logging starts.
    const auto env = lanpeer::load_env_file(lanpeer::env_file_from_parser(parser));
    lanpeer::install_logging();
    if (env.is_err()) {
        qCWarning(lanpeerApp) << "Ignoring env file:" << env.unwrap_err().message.c_str();
    } else if (env.unwrap() > 0) {
        qCDebug(lanpeerApp) << "Loaded" << env.unwrap() << "variable(s) from env file";
    }

    const auto config = lanpeer::config_from_parser(parser);
    if (config.is_err()) {
        QTextStream(stderr) << "error: " << QString::fromStdString(config.unwrap_err().message)
                            << QLatin1Char('\n') << QLatin1Char('\n') << parser.helpText();
        return 1;
    }

    const auto& cfg = config.unwrap();
    qCInfo(lanpeerApp) << "Hi there!" << cfg.instance_name
                       << "service" << cfg.service_name
                       << "port" << cfg.port
                       << "properties" << static_cast<int>(cfg.properties.size());

    lanpeer::network::PeerNode node(cfg, lanpeer::network::create_discovery_backend());

    auto started = node.start();
    if (started.is_err()) {
        qCCritical(lanpeerApp) << "Startup failed:" << started.unwrap_err().message.c_str()
                               << "(" << lanpeer::to_string(started.unwrap_err().code) << ")";
        return 2;
    }

    QObject::connect(&node, &lanpeer::network::PeerNode::failed, &app,
                     [](const lanpeer::Error& error) {
        qCCritical(lanpeerApp) << "Fatal:" << error.message.c_str()
                               << "(" << lanpeer::to_string(error.code) << ")";
        QCoreApplication::exit(3);
    });

    return app.exec();
}
