#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutex>
#include <QtGlobal>

#include <cstdio>

Q_LOGGING_CATEGORY(lanpeerApp, "lanpeer.app")

namespace lanpeer {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "DEBUG";
        case QtInfoMsg: return "INFO";
        case QtWarningMsg: return "WARN";
        case QtCriticalMsg: return "ERROR";
        case QtFatalMsg: return "FATAL";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void open_log_file(LoggerState& s) {
    const auto path = qEnvironmentVariable("LANPEER_LOG_FILE");
    if (path.isEmpty()) {
        return;
    }

    QDir dir(QFileInfo(path).absolutePath());
    dir.mkpath(QStringLiteral("."));

    s.file.setFileName(path);
    if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "lanpeer: cannot open log file %s\n", qPrintable(path));
    }
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QString();

    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg)
                          .toUtf8();

    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stderr);
    std::fflush(stderr);

    if (s.file.isOpen()) {
        s.file.write(line);
        s.file.flush();
    }
}

} // namespace

QString filter_rules_for_level(const QString& level) {
    const auto normalized = level.trimmed().toLower();

    if (normalized == QLatin1String("error")) {
        return QStringLiteral("lanpeer.*.debug=false\n"
                              "lanpeer.*.info=false\n"
                              "lanpeer.*.warning=false\n");
    }
    if (normalized == QLatin1String("warn") || normalized == QLatin1String("warning")) {
        return QStringLiteral("lanpeer.*.debug=false\n"
                              "lanpeer.*.info=false\n");
    }
    if (normalized == QLatin1String("debug") || normalized == QLatin1String("trace")) {
        return QStringLiteral("lanpeer.*=true\n");
    }
    return QStringLiteral("lanpeer.*.debug=false\n"
                          "lanpeer.*.info=true\n");
}

void install_logging() {
    open_log_file(state());
    QLoggingCategory::setFilterRules(filter_rules_for_level(qEnvironmentVariable("LANPEER_LOG")));
    qInstallMessageHandler(message_handler);
}

} // namespace lanpeer
