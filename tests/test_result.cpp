#include <catch2/catch.hpp>
#include <softpack/result.hpp>
#include <memory>
#include <string>

using namespace softpack;

// Helper function that uses SOFTPACK_TRY
static Result<int> try_double(Result<int> input) {
    SOFTPACK_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Result<int> try_chain(bool fail_first) {
    auto first = fail_first
        ? Result<int>::err(SoftpackError{SoftpackError::Parse, "first failed"})
        : Result<int>::ok(10);
    SOFTPACK_TRY(first);
    auto second = Result<int>::ok(first.value() + 5);
    SOFTPACK_TRY(second);
    return Result<int>::ok(second.value());
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(SoftpackError{SoftpackError::NotFound, "missing item"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(r.is_ok());
    REQUIRE(r.error().code == SoftpackError::NotFound);
    REQUIRE(r.error().message == "missing item");
}

TEST_CASE("Bool conversion", "[result]") {
    auto ok = Result<int>::ok(1);
    auto err = Result<int>::err(SoftpackError{SoftpackError::IO, "fail"});
    REQUIRE(static_cast<bool>(ok) == true);
    REQUIRE(static_cast<bool>(err) == false);
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(SoftpackError{SoftpackError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("Error access on Ok throws bad_variant_access", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE_THROWS_AS(r.error(), std::bad_variant_access);
}

TEST_CASE("map() transforms Ok value", "[result]") {
    auto r = Result<int>::ok(5);
    auto mapped = r.map([](int x) { return x * 2; });
    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.value() == 10);
}

TEST_CASE("map() passes through Err", "[result]") {
    auto r = Result<int>::err(SoftpackError{SoftpackError::Parse, "bad input"});
    bool called = false;
    auto mapped = r.map([&](int x) { called = true; return x * 2; });
    REQUIRE(mapped.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(mapped.error().code == SoftpackError::Parse);
    REQUIRE(mapped.error().message == "bad input");
}

TEST_CASE("and_then() chains Ok results", "[result]") {
    auto r = Result<int>::ok(5);
    auto chained = r.and_then([](int x) {
        return Result<int>::ok(x + 10);
    });
    REQUIRE(chained.is_ok());
    REQUIRE(chained.value() == 15);
}

TEST_CASE("and_then() short-circuits on Err", "[result]") {
    auto r = Result<int>::err(SoftpackError{SoftpackError::ConcurrentModification, "lost a race"});
    bool called = false;
    auto chained = r.and_then([&](int x) {
        called = true;
        return Result<int>::ok(x + 10);
    });
    REQUIRE(chained.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(chained.error().code == SoftpackError::ConcurrentModification);
}

TEST_CASE("SOFTPACK_TRY propagates errors", "[result]") {
    auto input = Result<int>::err(SoftpackError{SoftpackError::Parse, "syntax error"});
    auto output = try_double(input);
    REQUIRE(output.is_err());
    REQUIRE(output.error().code == SoftpackError::Parse);
    REQUIRE(output.error().message == "syntax error");
}

TEST_CASE("SOFTPACK_TRY passes through Ok", "[result]") {
    auto input = Result<int>::ok(7);
    auto output = try_double(input);
    REQUIRE(output.is_ok());
    REQUIRE(output.value() == 14);
}

TEST_CASE("SOFTPACK_TRY chained - all Ok", "[result]") {
    auto r = try_chain(false);
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == 15);
}

TEST_CASE("SOFTPACK_TRY chained - first fails", "[result]") {
    auto r = try_chain(true);
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "first failed");
}

TEST_CASE("Status (void result) Ok", "[result]") {
    auto s = ok_status();
    REQUIRE(s.is_ok());
}

TEST_CASE("Status (void result) Err", "[result]") {
    auto s = Status::err(SoftpackError{SoftpackError::Config, "bad config"});
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == SoftpackError::Config);
}

TEST_CASE("SoftpackError format() output", "[error]") {
    SoftpackError e{SoftpackError::IO, "file not found", "check the path", "main.cpp", 42};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[IO]") != std::string::npos);
    REQUIRE(formatted.find("file not found") != std::string::npos);
    REQUIRE(formatted.find("hint: check the path") != std::string::npos);
    REQUIRE(formatted.find("--> main.cpp:42") != std::string::npos);
}

TEST_CASE("SoftpackError format() without hint or file", "[error]") {
    SoftpackError e{SoftpackError::Parse, "unexpected token"};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Parse]") != std::string::npos);
    REQUIRE(formatted.find("unexpected token") != std::string::npos);
    REQUIRE(formatted.find("hint:") == std::string::npos);
    REQUIRE(formatted.find("-->") == std::string::npos);
}

TEST_CASE("SoftpackError code_name() for all codes", "[error]") {
    REQUIRE(std::string(SoftpackError::code_name(SoftpackError::IO)) == "IO");
    REQUIRE(std::string(SoftpackError::code_name(SoftpackError::Parse)) == "Parse");
    REQUIRE(std::string(SoftpackError::code_name(SoftpackError::Config)) == "Config");
    REQUIRE(std::string(SoftpackError::code_name(SoftpackError::Manifest)) == "Manifest");
    REQUIRE(std::string(SoftpackError::code_name(SoftpackError::Network)) == "Network");
    REQUIRE(std::string(SoftpackError::code_name(SoftpackError::Timeout)) == "Timeout");
    REQUIRE(std::string(SoftpackError::code_name(SoftpackError::NotFound)) == "NotFound");
    REQUIRE(std::string(SoftpackError::code_name(SoftpackError::Duplicate)) == "Duplicate");
    REQUIRE(std::string(SoftpackError::code_name(SoftpackError::InvalidArg)) == "InvalidArg");
    REQUIRE(std::string(SoftpackError::code_name(SoftpackError::InvalidPath)) == "InvalidPath");
    REQUIRE(std::string(SoftpackError::code_name(SoftpackError::FileExists)) == "FileExists");
    REQUIRE(std::string(SoftpackError::code_name(SoftpackError::NoChanges)) == "NoChanges");
    REQUIRE(std::string(SoftpackError::code_name(SoftpackError::NothingToCommit)) == "NothingToCommit");
    REQUIRE(std::string(SoftpackError::code_name(SoftpackError::ConcurrentModification)) ==
            "ConcurrentModification");
    REQUIRE(std::string(SoftpackError::code_name(SoftpackError::PushRejected)) == "PushRejected");
    REQUIRE(std::string(SoftpackError::code_name(SoftpackError::RepositoryUnavailable)) ==
            "RepositoryUnavailable");
    REQUIRE(std::string(SoftpackError::code_name(SoftpackError::Builder)) == "Builder");
}

TEST_CASE("Only races and transport failures are retryable", "[error]") {
    REQUIRE(SoftpackError{SoftpackError::ConcurrentModification, ""}.is_retryable());
    REQUIRE(SoftpackError{SoftpackError::PushRejected, ""}.is_retryable());
    REQUIRE(SoftpackError{SoftpackError::Network, ""}.is_retryable());
    REQUIRE(SoftpackError{SoftpackError::Timeout, ""}.is_retryable());
    REQUIRE_FALSE(SoftpackError{SoftpackError::NotFound, ""}.is_retryable());
    REQUIRE_FALSE(SoftpackError{SoftpackError::InvalidPath, ""}.is_retryable());
    REQUIRE_FALSE(SoftpackError{SoftpackError::NoChanges, ""}.is_retryable());
}

TEST_CASE("is_err(code) matches only that code", "[result]") {
    auto r = Result<int>::err(SoftpackError{SoftpackError::NoChanges, "same tree"});
    REQUIRE(r.is_err(SoftpackError::NoChanges));
    REQUIRE_FALSE(r.is_err(SoftpackError::NotFound));
    REQUIRE_FALSE(Result<int>::ok(1).is_err(SoftpackError::NoChanges));
}

TEST_CASE("value_or() falls back on Err", "[result]") {
    REQUIRE(Result<int>::ok(3).value_or(7) == 3);
    REQUIRE(Result<int>::err(SoftpackError{SoftpackError::IO, "x"}).value_or(7) == 7);
}

TEST_CASE("Implicit conversion from SoftpackError", "[result]") {
    Result<std::string> r = SoftpackError{SoftpackError::FileExists, "exists"};
    REQUIRE(r.is_err(SoftpackError::FileExists));
}

TEST_CASE("Result with move-only type (unique_ptr)", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(r.is_ok());
    REQUIRE(*r.value() == 99);

    auto r2 = Result<std::unique_ptr<int>>::err(SoftpackError{SoftpackError::IO, "fail"});
    REQUIRE(r2.is_err());
}
