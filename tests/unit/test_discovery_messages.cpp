#include <catch2/catch_test_macros.hpp>

#include "network/discovery.hpp"

using namespace lanpeer;
using namespace lanpeer::network;

namespace {

DiscoveryEvent resolved(QList<QHostAddress> addresses) {
    DiscoveryEvent event;
    event.kind = DiscoveryEventKind::ServiceResolved;
    event.service_type = QStringLiteral("_example._udp.local.");
    event.fullname = QStringLiteral("bob._example._udp.local.");
    event.host_name = QStringLiteral("bobs-box.local.");
    event.addresses = std::move(addresses);
    event.port = 41000;
    return event;
}

} // namespace

TEST_CASE("Discovery messages: announcement text", "[discovery]") {
    REQUIRE(announcement_payload(QStringLiteral("alice"), QStringLiteral("bob._example._udp.local.")) ==
            QByteArray("MESSAGE alice Resolved bob._example._udp.local. END"));
}

TEST_CASE("Discovery messages: one message per resolved IPv4 address", "[discovery]") {
    auto messages = messages_for_event(
        resolved({QHostAddress(QStringLiteral("192.168.1.5")), QHostAddress(QStringLiteral("10.0.0.5"))}),
        QStringLiteral("alice"));
    REQUIRE(messages.is_ok());

    const auto& list = messages.unwrap();
    REQUIRE(list.size() == 2);
    REQUIRE(list[0].host == QHostAddress(QStringLiteral("192.168.1.5")));
    REQUIRE(list[1].host == QHostAddress(QStringLiteral("10.0.0.5")));
    for (const auto& m : list) {
        REQUIRE(m.port == 41000);
        REQUIRE(m.bytes() == QByteArray("MESSAGE alice Resolved bob._example._udp.local. END"));
    }
}

TEST_CASE("Discovery messages: IPv6 addresses are skipped", "[discovery]") {
    auto messages = messages_for_event(
        resolved({QHostAddress(QStringLiteral("fe80::1")), QHostAddress(QStringLiteral("192.168.1.5"))}),
        QStringLiteral("alice"));
    REQUIRE(messages.is_ok());
    REQUIRE(messages.unwrap().size() == 1);
}

TEST_CASE("Discovery messages: no addresses, no messages", "[discovery]") {
    auto messages = messages_for_event(resolved({}), QStringLiteral("alice"));
    REQUIRE(messages.is_ok());
    REQUIRE(messages.unwrap().empty());
}

TEST_CASE("Discovery messages: other event kinds produce nothing", "[discovery]") {
    for (auto kind : {DiscoveryEventKind::SearchStarted, DiscoveryEventKind::ServiceFound,
                      DiscoveryEventKind::ServiceRemoved, DiscoveryEventKind::SearchStopped}) {
        auto event = resolved({QHostAddress(QStringLiteral("192.168.1.5"))});
        event.kind = kind;

        auto messages = messages_for_event(event, QStringLiteral("alice"));
        REQUIRE(messages.is_ok());
        REQUIRE(messages.unwrap().empty());
    }
}

TEST_CASE("Discovery messages: oversized announcement is an overflow", "[discovery]") {
    auto event = resolved({QHostAddress(QStringLiteral("192.168.1.5"))});
    event.fullname = QString(1100, QLatin1Char('x'));

    auto messages = messages_for_event(event, QStringLiteral("alice"));
    REQUIRE(messages.is_err());
    REQUIRE(messages.unwrap_err().code == ErrorCode::Overflow);
}
