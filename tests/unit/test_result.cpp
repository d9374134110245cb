#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

using namespace tether;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries the error kind and message", "[result]") {
    auto result = Result<int>::err(Error::not_found("workspace w1 not found"));

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().is(ErrorKind::NotFound));
    REQUIRE(result.unwrap_err().message == "workspace w1 not found");
    REQUIRE(result.unwrap_err().to_string() == "NotFound: workspace w1 not found");
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error::transport("offline", true));

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    auto ok_result = Result<int>::ok(42);
    auto err_result = Result<int>::err(Error::validation("bad"));

    REQUIRE(ok_result.value_or(0) == 42);
    REQUIRE(err_result.value_or(0) == 0);
}

TEST_CASE("Result::map transforms success and propagates error", "[result]") {
    auto doubled = Result<int>::ok(21).map([](int x) { return x * 2; });
    REQUIRE(doubled.unwrap() == 42);

    auto failed = Result<int>::err(Error::conflict("busy")).map([](int x) { return x * 2; });
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().is(ErrorKind::Conflict));
}

TEST_CASE("Result::and_then short-circuits on error", "[result]") {
    auto divide = [](int x) -> Result<int> {
        if (x == 0) return Result<int>::err(Error::validation("division by zero"));
        return Result<int>::ok(100 / x);
    };

    REQUIRE(Result<int>::ok(5).and_then(divide).unwrap() == 20);
    REQUIRE(Result<int>::ok(0).and_then(divide).unwrap_err().is(ErrorKind::Validation));

    auto initial = Result<int>::err(Error::permission_denied("no")).and_then(divide);
    REQUIRE(initial.unwrap_err().is(ErrorKind::PermissionDenied));
}

TEST_CASE("Result::match handles both cases", "[result]") {
    auto ok_value = Result<int>::ok(42).match(
        [](int x) { return x; },
        [](const Error&) { return -1; }
    );
    auto err_value = Result<int>::err(Error::transport("down")).match(
        [](int x) { return x; },
        [](const Error&) { return -1; }
    );

    REQUIRE(ok_value == 42);
    REQUIRE(err_value == -1);
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error::transport("down"));

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());

    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
    REQUIRE_THROWS(ok_result.unwrap_err());
}

TEST_CASE("Result<Error, Error> keeps success and failure apart", "[result]") {
    auto ok_result = Result<Error, Error>::ok(Error::validation("payload"));
    auto err_result = Result<Error, Error>::err(Error::transport("failure"));

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());
    REQUIRE(ok_result.unwrap().is(ErrorKind::Validation));
}

TEST_CASE("Error kinds have stable names", "[result]") {
    REQUIRE(kind_name(ErrorKind::Validation) == "ValidationError");
    REQUIRE(kind_name(ErrorKind::PermissionDenied) == "PermissionDenied");
    REQUIRE(kind_name(ErrorKind::NotFound) == "NotFound");
    REQUIRE(kind_name(ErrorKind::Conflict) == "ConflictError");
    REQUIRE(kind_name(ErrorKind::Transport) == "TransportError");
    REQUIRE(Error::transport("x", true).retryable);
    REQUIRE_FALSE(Error::transport("x").retryable);
}
