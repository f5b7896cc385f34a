#include <catch2/catch_test_macros.hpp>

#include "network/discovery_datagram.hpp"
#include "network/udp_discovery_backend.hpp"

#include <QTest>
#include <QUdpSocket>

#include <vector>

using namespace lanpeer;
using namespace lanpeer::network;

namespace {

ServiceRecord peer_record(QString instance, quint16 port) {
    ServiceRecord record;
    record.service_type = QStringLiteral("_example._udp.local.");
    record.instance_name = std::move(instance);
    record.host_name = QStringLiteral("peer.local.");
    record.port = port;
    return record;
}

void send_beacon(const ServiceRecord& record, const QString& nonce) {
    QUdpSocket socket;
    REQUIRE(socket.writeDatagram(encode_beacon(record, nonce), QHostAddress::LocalHost,
                                 UdpDiscoveryBackend::DISCOVERY_PORT) > 0);
}

bool has_kind(const std::vector<DiscoveryEvent>& events, DiscoveryEventKind kind) {
    for (const auto& event : events) {
        if (event.kind == kind) return true;
    }
    return false;
}

} // namespace

TEST_CASE("Backend factory honours LANPEER_DISCOVERY_BACKEND=udp", "[integration][discovery]") {
    qputenv("LANPEER_DISCOVERY_BACKEND", "udp");
    auto backend = create_discovery_backend();
    REQUIRE(dynamic_cast<UdpDiscoveryBackend*>(backend.get()) != nullptr);
}

TEST_CASE("UDP discovery: a peer beacon is found and resolved", "[integration][discovery]") {
    UdpDiscoveryBackend backend;
    std::vector<DiscoveryEvent> events;
    backend.on_event = [&](DiscoveryEvent event) { events.push_back(std::move(event)); };

    REQUIRE(backend.browse(QStringLiteral("_example._udp.local.")).is_ok());
    REQUIRE(QTest::qWaitFor([&]() { return has_kind(events, DiscoveryEventKind::SearchStarted); }, 1000));

    auto bob = peer_record(QStringLiteral("bob"), 42000);
    bob.properties = {{QStringLiteral("room"), QStringLiteral("lobby")}};
    send_beacon(bob, QStringLiteral("bob-nonce"));

    REQUIRE(QTest::qWaitFor([&]() { return has_kind(events, DiscoveryEventKind::ServiceResolved); }, 2000));
    REQUIRE(has_kind(events, DiscoveryEventKind::ServiceFound));

    const auto& resolved = events.back();
    REQUIRE(resolved.kind == DiscoveryEventKind::ServiceResolved);
    REQUIRE(resolved.fullname == QStringLiteral("bob._example._udp.local."));
    REQUIRE(resolved.port == 42000);
    REQUIRE(resolved.addresses == QList<QHostAddress>{QHostAddress(QHostAddress::LocalHost)});
    REQUIRE(resolved.properties == bob.properties);

    // A repeat beacon with nothing new is not reported again.
    const auto count = events.size();
    send_beacon(bob, QStringLiteral("bob-nonce"));
    QTest::qWait(100);
    REQUIRE(events.size() == count);
}

TEST_CASE("UDP discovery: other service types are ignored", "[integration][discovery]") {
    UdpDiscoveryBackend backend;
    std::vector<DiscoveryEvent> events;
    backend.on_event = [&](DiscoveryEvent event) { events.push_back(std::move(event)); };
    REQUIRE(backend.browse(QStringLiteral("_example._udp.local.")).is_ok());

    auto other = peer_record(QStringLiteral("bob"), 42000);
    other.service_type = QStringLiteral("_other._udp.local.");
    send_beacon(other, QStringLiteral("bob-nonce"));

    QTest::qWait(150);
    REQUIRE_FALSE(has_kind(events, DiscoveryEventKind::ServiceResolved));
}

TEST_CASE("UDP discovery: same name from another process is a conflict", "[integration][discovery]") {
    UdpDiscoveryBackend backend;
    std::optional<Error> failure;
    backend.on_failure = [&](Error error) { failure = std::move(error); };

    const auto alice = peer_record(QStringLiteral("alice"), 41000);
    REQUIRE(backend.register_service(alice).is_ok());
    REQUIRE(backend.browse(alice.service_type).is_ok());

    send_beacon(alice, QStringLiteral("someone-else"));

    REQUIRE(QTest::qWaitFor([&]() { return failure.has_value(); }, 2000));
    REQUIRE(failure->code == ErrorCode::NameConflict);
}
