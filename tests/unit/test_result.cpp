#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

#include <memory>

using namespace folio;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err keeps message, code and kind", "[result]") {
    auto result = Result<int>::err(Error::store("disk I/O error", 10));

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "disk I/O error");
    REQUIRE(result.unwrap_err().code == 10);
    REQUIRE(result.unwrap_err().kind == ErrorKind::StoreIo);
}

TEST_CASE("Error factories set the kind", "[result]") {
    REQUIRE(Error::invalid("self drop").kind == ErrorKind::InvalidRequest);
    REQUIRE(Error::missing("gone").kind == ErrorKind::SectionMissing);
    REQUIRE(Error("plain").kind == ErrorKind::Unknown);
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

TEST_CASE("Result::map transforms success and propagates error", "[result]") {
    auto mapped = Result<int>::ok(21).map([](int x) { return x * 2; });
    REQUIRE(mapped.unwrap() == 42);

    auto failed = Result<int>::err(Error::missing("gone")).map([](int x) { return x * 2; });
    REQUIRE(failed.is_err());
    REQUIRE(failed.unwrap_err().kind == ErrorKind::SectionMissing);
}

TEST_CASE("Result::and_then short-circuits on error", "[result]") {
    auto level = [](int x) -> Result<int> {
        if (x < 1 || x > 6) return Result<int>::err(Error::invalid("level out of range"));
        return Result<int>::ok(x);
    };

    REQUIRE(Result<int>::ok(3).and_then(level).unwrap() == 3);
    REQUIRE(Result<int>::ok(9).and_then(level).is_err());
    REQUIRE(Result<int>::err(Error{"initial"}).and_then(level).unwrap_err().message == "initial");
}

TEST_CASE("Result holds move-only values", "[result]") {
    auto result = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(7));
    REQUIRE(result.is_ok());

    auto owned = std::move(result).unwrap();
    REQUIRE(*owned == 7);
}

TEST_CASE("Result with the same value and error type", "[result]") {
    auto ok = Result<Error, Error>::ok(Error{"value"});
    auto err = Result<Error, Error>::err(Error{"error"});

    REQUIRE(ok.is_ok());
    REQUIRE(ok.unwrap().message == "value");
    REQUIRE(err.is_err());
}

TEST_CASE("Result<void> works correctly", "[result]") {
    auto ok_result = Result<void>::ok();
    auto err_result = Result<void>::err(Error{"error"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());

    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());

    int calls = 0;
    auto chained = err_result.and_then([&]() {
        ++calls;
        return Result<void>::ok();
    });
    REQUIRE(chained.is_err());
    REQUIRE(calls == 0);
}
