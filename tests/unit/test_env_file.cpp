#include <catch2/catch_test_macros.hpp>

#include "core/env_file.hpp"

#include <QFile>
#include <QTemporaryDir>

using namespace lanpeer;

TEST_CASE("parse_env: keys, comments and quoting", "[env]") {
    const QByteArray contents =
        "# peer settings\n"
        "\n"
        "LANPEER_LOG=debug\n"
        "export LANPEER_DISCOVERY_BACKEND = udp\n"
        "NAME=\"two words\"\n"
        "SINGLE='x=y'\n";

    auto parsed = parse_env(contents);
    REQUIRE(parsed.is_ok());

    const auto& entries = parsed.unwrap();
    REQUIRE(entries.size() == 4);
    REQUIRE(entries[0] == EnvEntry{"LANPEER_LOG", "debug"});
    REQUIRE(entries[1] == EnvEntry{"LANPEER_DISCOVERY_BACKEND", "udp"});
    REQUIRE(entries[2] == EnvEntry{"NAME", "two words"});
    REQUIRE(entries[3] == EnvEntry{"SINGLE", "x=y"});
}

TEST_CASE("parse_env: malformed line names its number", "[env]") {
    auto parsed = parse_env("A=1\nnot a pair\n");
    REQUIRE(parsed.is_err());
    REQUIRE(parsed.unwrap_err().message == "env file line 2: expected KEY=value");
    REQUIRE(parsed.unwrap_err().code == ErrorCode::InvalidArgument);
}

TEST_CASE("load_env_file: missing file is not an error", "[env]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    auto loaded = load_env_file(dir.filePath(QStringLiteral("absent.env")));
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.unwrap() == 0);
}

TEST_CASE("load_env_file: existing variables win", "[env]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    const auto path = dir.filePath(QStringLiteral("peer.env"));
    QFile file(path);
    REQUIRE(file.open(QIODevice::WriteOnly));
    file.write("LANPEER_TEST_PRESET=from-file\nLANPEER_TEST_FRESH=from-file\n");
    file.close();

    qputenv("LANPEER_TEST_PRESET", "from-env");
    qunsetenv("LANPEER_TEST_FRESH");

    auto loaded = load_env_file(path);
    REQUIRE(loaded.is_ok());
    REQUIRE(loaded.unwrap() == 1);
    REQUIRE(qgetenv("LANPEER_TEST_PRESET") == "from-env");
    REQUIRE(qgetenv("LANPEER_TEST_FRESH") == "from-file");

    qunsetenv("LANPEER_TEST_PRESET");
    qunsetenv("LANPEER_TEST_FRESH");
}
