#include <catch2/catch.hpp>
#include <uaver/result.hpp>
#include <uaver/constraint.hpp>
#include <memory>
#include <string>

using namespace uaver;

static Result<int> try_double(Result<int> input) {
    UAVER_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

// Mirrors how configuration code chains a strategy lookup
static Result<std::string> strategy_round_trip(const std::string& name) {
    auto s = parse_strategy(name);
    UAVER_TRY(s);
    return Result<std::string>::ok(strategy_name(s.value()));
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
    REQUIRE(static_cast<bool>(r));
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(UaverError{UaverError::NotFound, "missing rule"});
    REQUIRE(r.is_err());
    REQUIRE_FALSE(static_cast<bool>(r));
    REQUIRE(r.error().code == UaverError::NotFound);
    REQUIRE(r.error().message == "missing rule");
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("UAVER_TRY propagates errors", "[result]") {
    auto output = try_double(Result<int>::err(UaverError{UaverError::Parse, "syntax error"}));
    REQUIRE(output.is_err());
    REQUIRE(output.error().code == UaverError::Parse);

    REQUIRE(try_double(Result<int>::ok(7)).value() == 14);
}

TEST_CASE("UAVER_TRY across result types", "[result]") {
    REQUIRE(strategy_round_trip("ordinal").value() == "ordinal");
    auto bad = strategy_round_trip("fuzzy");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().code == UaverError::InvalidArg);
}

TEST_CASE("Status (void result)", "[result]") {
    REQUIRE(ok_status().is_ok());
    auto s = Status::err(UaverError{UaverError::Config, "bad config"});
    REQUIRE(s.is_err());
    REQUIRE(s.error().code == UaverError::Config);
}

TEST_CASE("Result with move-only type", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(*r.value() == 99);
}

TEST_CASE("UaverError format() output", "[error]") {
    UaverError e{UaverError::Config, "unknown log level 'loud'",
                 "expected one of: trace, debug, info, warn, error", "uaver.toml", 4};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Config]: unknown log level 'loud'") != std::string::npos);
    REQUIRE(formatted.find("hint: expected one of") != std::string::npos);
    REQUIRE(formatted.find("--> uaver.toml:4") != std::string::npos);
}

TEST_CASE("UaverError format() without hint or file", "[error]") {
    UaverError e{UaverError::Constraint, "empty version requirement"};
    auto formatted = e.format();
    REQUIRE(formatted == "error[Constraint]: empty version requirement");
}

TEST_CASE("UaverError file without line", "[error]") {
    UaverError e{UaverError::IO, "cannot open", "", "missing.toml", 0};
    REQUIRE(e.format() == "error[IO]: cannot open\n  --> missing.toml");
}

TEST_CASE("UaverError code_name() for all codes", "[error]") {
    REQUIRE(std::string(UaverError::code_name(UaverError::IO)) == "IO");
    REQUIRE(std::string(UaverError::code_name(UaverError::Parse)) == "Parse");
    REQUIRE(std::string(UaverError::code_name(UaverError::Config)) == "Config");
    REQUIRE(std::string(UaverError::code_name(UaverError::Constraint)) == "Constraint");
    REQUIRE(std::string(UaverError::code_name(UaverError::NotFound)) == "NotFound");
    REQUIRE(std::string(UaverError::code_name(UaverError::InvalidArg)) == "InvalidArg");
}
