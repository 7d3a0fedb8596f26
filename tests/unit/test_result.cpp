#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

#include <stdexcept>

using namespace pagetree;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries message and code", "[result]") {
    auto result = Result<int>::err(Error{"reference does not point backward", ErrorCode::Malformed});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "reference does not point backward");
    REQUIRE(result.unwrap_err().code == ErrorCode::Malformed);
}

TEST_CASE("Result::unwrap throws logic_error on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::logic_error);
}

TEST_CASE("Result::unwrap_err throws on success", "[result]") {
    auto result = Result<int>::ok(1);

    REQUIRE_THROWS_AS(result.unwrap_err(), std::logic_error);
}

TEST_CASE("Result::value_or returns fallback on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error{"error"});

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success and keeps errors", "[result]") {
    auto doubled = Result<int>::ok(21).map([](int x) { return x * 2; });
    REQUIRE(doubled.unwrap() == 42);

    auto failed = Result<int>::err(Error{"error"}).map([](int x) { return x * 2; });
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().message == "error");
}

TEST_CASE("Result::and_then chains and short-circuits", "[result]") {
    auto checked_index = [](int x) -> Result<int> {
        if (x < 0) return Result<int>::err(Error{"negative", ErrorCode::OutOfRange});
        return Result<int>::ok(x + 1);
    };

    REQUIRE(Result<int>::ok(1).and_then(checked_index).unwrap() == 2);

    auto negative = Result<int>::ok(-1).and_then(checked_index);
    REQUIRE(negative.unwrap_err().code == ErrorCode::OutOfRange);

    auto initial = Result<int>::err(Error{"initial"}).and_then(checked_index);
    REQUIRE(initial.unwrap_err().message == "initial");
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{"error"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());

    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
}

TEST_CASE("Result moves out of rvalues", "[result]") {
    auto result = Result<std::string>::ok("pages");
    const auto value = std::move(result).unwrap();

    REQUIRE(value == "pages");
}
