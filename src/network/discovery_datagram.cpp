#include "network/discovery_datagram.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

namespace lanpeer::network {
namespace {

constexpr const char* kMsgType = "lanpeer-svc";

QJsonObject to_json(const ServiceRecord& record, const QString& nonce) {
    QJsonArray props;
    for (const auto& [key, value] : record.properties) {
        props.append(QJsonArray{key, value});
    }

    QJsonObject obj;
    obj["t"] = QString::fromLatin1(kMsgType);
    obj["type"] = record.service_type;
    obj["name"] = record.instance_name;
    obj["host"] = record.host_name;
    obj["port"] = static_cast<int>(record.port);
    obj["props"] = props;
    obj["nonce"] = nonce;
    return obj;
}

Result<Beacon, Error> invalid(const char* why) {
    return Result<Beacon, Error>::err(Error{why, ErrorCode::InvalidArgument});
}

} // namespace

QByteArray encode_beacon(const ServiceRecord& record, const QString& nonce) {
    return QJsonDocument(to_json(record, nonce)).toJson(QJsonDocument::Compact);
}

Result<Beacon, Error> decode_beacon(const QByteArray& datagram) {
    const auto doc = QJsonDocument::fromJson(datagram);
    if (doc.isNull() || !doc.isObject()) {
        return invalid("invalid json");
    }

    const auto obj = doc.object();
    if (obj["t"].toString() != QString::fromLatin1(kMsgType)) {
        return invalid("wrong message type");
    }
    if (!obj.contains("type") || !obj.contains("name") || !obj.contains("port") ||
        !obj.contains("nonce")) {
        return invalid("missing fields");
    }

    const int port_int = obj["port"].toInt();
    if (port_int <= 0 || port_int > 65535) {
        return invalid("invalid port");
    }

    const auto name = obj["name"].toString();
    if (name.isEmpty()) {
        return invalid("empty instance name");
    }

    Beacon beacon;
    beacon.nonce = obj["nonce"].toString();
    beacon.record.service_type = obj["type"].toString();
    beacon.record.instance_name = name;
    beacon.record.host_name = obj["host"].toString();
    beacon.record.port = static_cast<quint16>(port_int);

    for (const auto& entry : obj["props"].toArray()) {
        const auto pair = entry.toArray();
        if (pair.size() != 2) continue;
        beacon.record.properties.emplace_back(pair.at(0).toString(), pair.at(1).toString());
    }

    return Result<Beacon, Error>::ok(std::move(beacon));
}

} // namespace lanpeer::network
