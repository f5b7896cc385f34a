#include <catch2/catch_test_macros.hpp>

#include "network/interface_selection.hpp"

using namespace lanpeer;
using namespace lanpeer::network;

namespace {

const QNetworkInterface::InterfaceFlags kUp =
    QNetworkInterface::IsUp | QNetworkInterface::IsRunning | QNetworkInterface::CanMulticast;

InterfaceCandidate iface(QString name, QNetworkInterface::InterfaceFlags flags,
                         QList<QHostAddress> addresses) {
    return InterfaceCandidate{std::move(name), flags, std::move(addresses)};
}

const QString kDefaultSubnet = QStringLiteral("192.168.0.0/16");

} // namespace

TEST_CASE("Interface selection: picks the first matching IPv4 address", "[interfaces]") {
    const QList<InterfaceCandidate> interfaces{
        iface(QStringLiteral("lo"), kUp | QNetworkInterface::IsLoopBack,
              {QHostAddress(QStringLiteral("127.0.0.1"))}),
        iface(QStringLiteral("eth0"), kUp,
              {QHostAddress(QStringLiteral("fe80::1")),
               QHostAddress(QStringLiteral("169.254.3.4")),
               QHostAddress(QStringLiteral("10.0.0.5")),
               QHostAddress(QStringLiteral("192.168.1.20"))}),
        iface(QStringLiteral("wlan0"), kUp, {QHostAddress(QStringLiteral("192.168.7.7"))}),
    };

    auto selected = select_bind_address(interfaces, kDefaultSubnet);
    REQUIRE(selected.is_ok());
    REQUIRE(selected.unwrap() == QHostAddress(QStringLiteral("192.168.1.20")));
}

TEST_CASE("Interface selection: skips interfaces that are down", "[interfaces]") {
    const QList<InterfaceCandidate> interfaces{
        iface(QStringLiteral("eth0"), QNetworkInterface::CanMulticast,
              {QHostAddress(QStringLiteral("192.168.1.20"))}),
        iface(QStringLiteral("eth1"), kUp, {QHostAddress(QStringLiteral("192.168.2.30"))}),
    };

    auto selected = select_bind_address(interfaces, kDefaultSubnet);
    REQUIRE(selected.is_ok());
    REQUIRE(selected.unwrap() == QHostAddress(QStringLiteral("192.168.2.30")));
}

TEST_CASE("Interface selection: other subnets are honoured", "[interfaces]") {
    const QList<InterfaceCandidate> interfaces{
        iface(QStringLiteral("eth0"), kUp, {QHostAddress(QStringLiteral("10.1.2.3"))}),
    };

    REQUIRE(select_bind_address(interfaces, kDefaultSubnet).is_err());

    auto selected = select_bind_address(interfaces, QStringLiteral("10.0.0.0/8"));
    REQUIRE(selected.is_ok());
    REQUIRE(selected.unwrap() == QHostAddress(QStringLiteral("10.1.2.3")));
}

TEST_CASE("Interface selection: no match is NoInterface", "[interfaces]") {
    const QList<InterfaceCandidate> interfaces{
        iface(QStringLiteral("lo"), kUp | QNetworkInterface::IsLoopBack,
              {QHostAddress(QStringLiteral("127.0.0.1"))}),
    };

    auto selected = select_bind_address(interfaces, kDefaultSubnet);
    REQUIRE(selected.is_err());
    REQUIRE(selected.unwrap_err().code == ErrorCode::NoInterface);

    auto empty = select_bind_address({}, kDefaultSubnet);
    REQUIRE(empty.is_err());
    REQUIRE(empty.unwrap_err().code == ErrorCode::NoInterface);
}

TEST_CASE("Interface selection: invalid subnet", "[interfaces]") {
    auto selected = select_bind_address({}, QStringLiteral("not-a-subnet"));
    REQUIRE(selected.is_err());
    REQUIRE(selected.unwrap_err().code == ErrorCode::InvalidArgument);
}
