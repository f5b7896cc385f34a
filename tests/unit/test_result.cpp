#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

using namespace lanpeer;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err keeps message and code", "[result]") {
    auto result = Result<int>::err(Error{"bind failed", ErrorCode::Socket});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "bind failed");
    REQUIRE(result.unwrap_err().code == ErrorCode::Socket);
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{"error"});

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms value and propagates error", "[result]") {
    auto mapped = Result<int>::ok(21).map([](int x) { return x * 2; });
    REQUIRE(mapped.unwrap() == 42);

    auto failed = Result<int>::err(Error{"error", ErrorCode::Overflow}).map([](int x) { return x * 2; });
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().code == ErrorCode::Overflow);
}

TEST_CASE("Result::and_then short-circuits on error", "[result]") {
    auto half = [](int x) -> Result<int> {
        if (x % 2 != 0) return Result<int>::err(Error{"odd", ErrorCode::InvalidArgument});
        return Result<int>::ok(x / 2);
    };

    REQUIRE(Result<int>::ok(8).and_then(half).unwrap() == 4);
    REQUIRE(Result<int>::ok(7).and_then(half).unwrap_err().message == "odd");
    REQUIRE(Result<int>::err(Error{"first"}).and_then(half).unwrap_err().message == "first");
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{"error", ErrorCode::ChannelClosed});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());
    REQUIRE(err_result.unwrap_err().code == ErrorCode::ChannelClosed);

    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
}

TEST_CASE("ErrorCode has a printable name", "[result]") {
    REQUIRE(std::string(to_string(ErrorCode::NameConflict)) == "name-conflict");
    REQUIRE(std::string(to_string(ErrorCode::NoInterface)) == "no-interface");
}
