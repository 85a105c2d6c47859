#include <catch2/catch.hpp>
#include <cnbkit/result.hpp>
#include <memory>
#include <string>

using namespace cnbkit;

static Result<int> try_double(Result<int> input) {
    CNBKIT_TRY(input);
    return Result<int>::ok(input.value() * 2);
}

static Status try_steps(bool fail_second, int& steps) {
    CNBKIT_TRY(ok_status());
    ++steps;
    CNBKIT_TRY(fail_second
        ? Status::err(CnbError{CnbError::IO, "second failed"})
        : ok_status());
    ++steps;
    return ok_status();
}

TEST_CASE("Create Ok result and access value", "[result]") {
    auto r = Result<int>::ok(42);
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.is_err());
    REQUIRE(r.value() == 42);
}

TEST_CASE("Create Err result and access error", "[result]") {
    auto r = Result<int>::err(CnbError{CnbError::NotFound, "missing item"});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == CnbError::NotFound);
    REQUIRE(r.error().message == "missing item");
    REQUIRE_FALSE(static_cast<bool>(r));
}

TEST_CASE("Value access on Err throws bad_variant_access", "[result]") {
    auto r = Result<int>::err(CnbError{CnbError::IO, "fail"});
    REQUIRE_THROWS_AS(r.value(), std::bad_variant_access);
}

TEST_CASE("map() and and_then() skip the callback on Err", "[result]") {
    auto r = Result<int>::err(CnbError{CnbError::Parse, "bad input"});
    bool called = false;
    auto mapped = r.map([&](int x) { called = true; return x * 2; });
    auto chained = r.and_then([&](int x) { called = true; return Result<int>::ok(x); });
    REQUIRE(mapped.is_err());
    REQUIRE(chained.is_err());
    REQUIRE_FALSE(called);
    REQUIRE(mapped.error().message == "bad input");
}

TEST_CASE("map() transforms Ok value", "[result]") {
    auto r = Result<int>::ok(5);
    auto mapped = r.map([](int x) { return std::to_string(x); });
    REQUIRE(mapped.is_ok());
    REQUIRE(mapped.value() == "5");
}

TEST_CASE("or_else() recovers from Err", "[result]") {
    auto r = Result<int>::err(CnbError{CnbError::IO, "disk full"});
    auto recovered = r.or_else([](CnbError&) { return Result<int>::ok(0); });
    REQUIRE(recovered.is_ok());
    REQUIRE(recovered.value() == 0);
}

TEST_CASE("map_err() prepends context", "[result]") {
    auto r = Result<int>::err(CnbError{CnbError::IO, "permission denied"})
        .map_err([](CnbError e) {
            e.message = "layer 'jdk': " + e.message;
            return e;
        });
    REQUIRE(r.is_err());
    REQUIRE(r.error().message == "layer 'jdk': permission denied");

    auto ok = Result<int>::ok(3).map_err([](CnbError e) { return e; });
    REQUIRE(ok.value() == 3);
}

TEST_CASE("CNBKIT_TRY propagates errors and passes Ok through", "[result]") {
    auto failed = try_double(Result<int>::err(CnbError{CnbError::Parse, "syntax error"}));
    REQUIRE(failed.is_err());
    REQUIRE(failed.error().code == CnbError::Parse);

    auto doubled = try_double(Result<int>::ok(7));
    REQUIRE(doubled.value() == 14);
}

TEST_CASE("CNBKIT_TRY stops at the first failing Status", "[result]") {
    int steps = 0;
    auto s = try_steps(true, steps);
    REQUIRE(s.is_err());
    REQUIRE(s.error().message == "second failed");
    REQUIRE(steps == 1);

    steps = 0;
    REQUIRE(try_steps(false, steps).is_ok());
    REQUIRE(steps == 2);
}

TEST_CASE("CnbError format() output", "[error]") {
    CnbError e{CnbError::Contract, "missing 'api'", "add api = \"0.10\"", "buildpack.toml", 3};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[Contract]") != std::string::npos);
    REQUIRE(formatted.find("missing 'api'") != std::string::npos);
    REQUIRE(formatted.find("hint: add api") != std::string::npos);
    REQUIRE(formatted.find("--> buildpack.toml:3") != std::string::npos);
}

TEST_CASE("CnbError format() without hint or file", "[error]") {
    CnbError e{CnbError::FrameworkMisuse, "layer finalized twice"};
    auto formatted = e.format();
    REQUIRE(formatted.find("error[FrameworkMisuse]") != std::string::npos);
    REQUIRE(formatted.find("hint:") == std::string::npos);
    REQUIRE(formatted.find("-->") == std::string::npos);
}

TEST_CASE("CnbError code_name() for all codes", "[error]") {
    REQUIRE(std::string(CnbError::code_name(CnbError::IO)) == "IO");
    REQUIRE(std::string(CnbError::code_name(CnbError::LayerIO)) == "LayerIO");
    REQUIRE(std::string(CnbError::code_name(CnbError::Parse)) == "Parse");
    REQUIRE(std::string(CnbError::code_name(CnbError::Contract)) == "Contract");
    REQUIRE(std::string(CnbError::code_name(CnbError::ApiMismatch)) == "ApiMismatch");
    REQUIRE(std::string(CnbError::code_name(CnbError::FrameworkMisuse)) == "FrameworkMisuse");
    REQUIRE(std::string(CnbError::code_name(CnbError::Buildpack)) == "Buildpack");
    REQUIRE(std::string(CnbError::code_name(CnbError::InvalidArg)) == "InvalidArg");
    REQUIRE(std::string(CnbError::code_name(CnbError::NotFound)) == "NotFound");
    REQUIRE(std::string(CnbError::code_name(CnbError::Duplicate)) == "Duplicate");
}

TEST_CASE("Result with move-only type (unique_ptr)", "[result]") {
    auto r = Result<std::unique_ptr<int>>::ok(std::make_unique<int>(99));
    REQUIRE(r.is_ok());
    REQUIRE(*r.value() == 99);
    auto owned = std::move(r).value();
    REQUIRE(*owned == 99);
}
