#include "core/env_file.hpp"

#include <QFile>
#include <QFileInfo>
#include <QtGlobal>

namespace lanpeer {
namespace {

QByteArray unquote(QByteArray value) {
    if (value.size() >= 2) {
        const char first = value.front();
        const char last = value.back();
        if ((first == '"' || first == '\'') && first == last) {
            return value.mid(1, value.size() - 2);
        }
    }
    return value;
}

} // namespace

Result<std::vector<EnvEntry>> parse_env(const QByteArray& contents) {
    std::vector<EnvEntry> entries;

    const auto lines = contents.split('\n');
    for (qsizetype i = 0; i < lines.size(); ++i) {
        auto line = lines.at(i).trimmed();
        if (line.isEmpty() || line.startsWith('#')) {
            continue;
        }
        if (line.startsWith("export ")) {
            line = line.mid(7).trimmed();
        }

        const auto eq = line.indexOf('=');
        if (eq <= 0) {
            return Result<std::vector<EnvEntry>>::err(Error{
                "env file line " + std::to_string(i + 1) + ": expected KEY=value",
                ErrorCode::InvalidArgument});
        }

        entries.emplace_back(line.left(eq).trimmed(), unquote(line.mid(eq + 1).trimmed()));
    }

    return Result<std::vector<EnvEntry>>::ok(std::move(entries));
}

Result<int> load_env_file(const QString& path) {
    if (path.isEmpty() || !QFileInfo::exists(path)) {
        return Result<int>::ok(0);
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return Result<int>::err(Error{
            "cannot read env file " + path.toStdString() + ": " + file.errorString().toStdString(),
            ErrorCode::InvalidArgument});
    }

    auto parsed = parse_env(file.readAll());
    if (parsed.is_err()) {
        return Result<int>::err(parsed.unwrap_err());
    }

    int applied = 0;
    for (const auto& [key, value] : parsed.unwrap()) {
        if (qEnvironmentVariableIsSet(key.constData())) {
            continue;
        }
        qputenv(key.constData(), value);
        ++applied;
    }
    return Result<int>::ok(applied);
}

} // namespace lanpeer
