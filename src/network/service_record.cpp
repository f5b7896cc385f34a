#include "network/service_record.hpp"

#include <QSysInfo>

namespace lanpeer::network {
namespace {

const QString kLocalSuffix = QStringLiteral(".local.");

Result<ServiceRecord> invalid(std::string message) {
    return Result<ServiceRecord>::err(Error{std::move(message), ErrorCode::InvalidArgument});
}

} // namespace

QString ServiceRecord::fullname() const {
    return instance_name + QLatin1Char('.') + service_type;
}

QString qualified_service_type(const QString& service_name) {
    auto name = service_name.trimmed();
    if (name.endsWith(kLocalSuffix)) {
        return name;
    }
    if (name.endsWith(QStringLiteral(".local"))) {
        return name + QLatin1Char('.');
    }
    if (name.endsWith(QLatin1Char('.'))) {
        name.chop(1);
    }
    return name + kLocalSuffix;
}

QString bare_service_type(const QString& service_type) {
    auto name = service_type;
    if (name.endsWith(kLocalSuffix)) {
        name.chop(kLocalSuffix.size());
    } else if (name.endsWith(QLatin1Char('.'))) {
        name.chop(1);
    }
    return name;
}

QString local_host_name() {
    auto host = QSysInfo::machineHostName().trimmed();
    if (host.isEmpty()) {
        host = QStringLiteral("localhost");
    }
    const auto dot = host.indexOf(QLatin1Char('.'));
    if (dot > 0) {
        host.truncate(dot);
    }
    return host + kLocalSuffix;
}

Result<ServiceRecord> make_service_record(const Config& config,
                                          quint16 port,
                                          const QString& host_name) {
    const auto instance = config.instance_name.trimmed();
    if (instance.isEmpty()) {
        return invalid("instance name must not be empty");
    }
    if (instance.toUtf8().size() > ServiceRecord::MAX_LABEL_BYTES) {
        return invalid("instance name `" + instance.toStdString() + "` exceeds " +
                       std::to_string(ServiceRecord::MAX_LABEL_BYTES) + " bytes");
    }

    const auto bare = bare_service_type(config.service_name.trimmed());
    if (!bare.startsWith(QLatin1Char('_')) ||
        !(bare.endsWith(QStringLiteral("._udp")) || bare.endsWith(QStringLiteral("._tcp")))) {
        return invalid("service name `" + config.service_name.toStdString() +
                       "` must look like `_name._udp` or `_name._tcp`");
    }

    for (const auto& [key, value] : config.properties) {
        if (key.isEmpty()) {
            return invalid("property key must not be empty");
        }
        const auto entry_size = key.toUtf8().size() + 1 + value.toUtf8().size();
        if (entry_size > ServiceRecord::MAX_TXT_BYTES) {
            return invalid("property `" + key.toStdString() + "` exceeds " +
                           std::to_string(ServiceRecord::MAX_TXT_BYTES) + " bytes");
        }
    }

    if (port == 0) {
        return invalid("service port must be bound before registering");
    }

    ServiceRecord record;
    record.service_type = qualified_service_type(bare);
    record.instance_name = instance;
    record.host_name = host_name;
    record.port = port;
    record.properties = config.properties;
    record.address_auto = true;
    return Result<ServiceRecord>::ok(std::move(record));
}

} // namespace lanpeer::network
