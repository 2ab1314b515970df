// onca_core Error and Result tests

#include <catch2/catch_test_macros.hpp>
#include <onca_engine/core/error.hpp>
#include <string>

using namespace onca_core;

// =============================================================================
// Error Tests
// =============================================================================

TEST_CASE("Error construction", "[core][error]") {
    SECTION("from string") {
        Error err("Test error");
        REQUIRE(err.message() == "Test error");
        REQUIRE(err.code() == ErrorCode::Unknown);
        REQUIRE(err.is<std::string>());
    }

    SECTION("from code and message") {
        Error err(ErrorCode::ParseError, "Bad settings");
        REQUIRE(err.code() == ErrorCode::ParseError);
        REQUIRE(err.message() == "Bad settings");
    }

    SECTION("with context") {
        Error err = Error("Base error").with_context("key", "value");
        auto* ctx = err.get_context("key");
        REQUIRE(ctx != nullptr);
        REQUIRE(*ctx == "value");
        REQUIRE(err.get_context("missing") == nullptr);
    }
}

TEST_CASE("RalError kinds map onto error codes", "[core][error]") {
    SECTION("invalid parameter") {
        Error err = RalError::invalid_parameter("size is 0");
        REQUIRE(err.code() == ErrorCode::InvalidArgument);
        REQUIRE(err.is_ral(RalError::Kind::InvalidParameter));
        REQUIRE(err.message().find("size is 0") != std::string::npos);
    }

    SECTION("not implemented") {
        Error err = RalError::not_implemented("reserve_memory");
        REQUIRE(err.code() == ErrorCode::NotSupported);
        REQUIRE(err.is_ral(RalError::Kind::NotImplemented));
    }

    SECTION("use after device dropped") {
        Error err = RalError::use_after_device_dropped();
        REQUIRE(err.code() == ErrorCode::InvalidState);
        REQUIRE(err.is_ral(RalError::Kind::UseAfterDeviceDropped));
    }

    SECTION("memory exhaustion") {
        REQUIRE(Error(RalError::out_of_host_memory()).code() == ErrorCode::OutOfMemory);
        REQUIRE(Error(RalError::out_of_device_memory()).code() == ErrorCode::OutOfMemory);
    }

    SECTION("timeout") {
        Error err = RalError::timeout();
        REQUIRE(err.code() == ErrorCode::Timeout);
    }

    SECTION("other keeps the native message") {
        Error err = RalError::other("vkQueueSubmit2 failed");
        REQUIRE(err.code() == ErrorCode::Unknown);
        REQUIRE(err.message() == "vkQueueSubmit2 failed");
    }

    SECTION("kind check does not match other kinds") {
        Error err = RalError::timeout();
        REQUIRE_FALSE(err.is_ral(RalError::Kind::DeviceLost));
        REQUIRE_FALSE(Error("plain").is_ral(RalError::Kind::Timeout));
    }
}

TEST_CASE("Unsupported swap-chain formats list the requested formats", "[core][error]") {
    Error err = RalError::unsupported_swap_chain_formats({"R8G8B8A8Typeless", "BC1UNorm"});
    REQUIRE(err.is_ral(RalError::Kind::UnsupportedSwapChainFormats));

    const auto* ral = err.as<RalError>();
    REQUIRE(ral != nullptr);
    REQUIRE(ral->formats.size() == 2);
    REQUIRE(ral->formats[0] == "R8G8B8A8Typeless");
    REQUIRE(err.message().find("BC1UNorm") != std::string::npos);
}

TEST_CASE("LibraryError kinds", "[core][error]") {
    SECTION("dyn_lib") {
        Error err = LibraryError::dyn_lib("onca_ral_missing.so", "file not found");
        REQUIRE(err.code() == ErrorCode::NotFound);
        REQUIRE(err.is_library(LibraryError::Kind::DynLib));
        REQUIRE(err.message().find("onca_ral_missing.so") != std::string::npos);
    }

    SECTION("load_function") {
        Error err = LibraryError::load_function("onca_ral_null.so", "create_ral");
        REQUIRE(err.code() == ErrorCode::DependencyMissing);
        REQUIRE(err.is_library(LibraryError::Kind::LoadFunction));
        REQUIRE(err.as<LibraryError>()->symbol == "create_ral");
    }
}

TEST_CASE("Error chain formatting", "[core][error]") {
    Error err = RalError::missing_feature("timelineSemaphore");
    err.with_context("device", "Null Adapter");

    const std::string chain = build_error_chain(err);
    REQUIRE(chain.find("[NotSupported]") != std::string::npos);
    REQUIRE(chain.find("RalError::MissingFeature") != std::string::npos);
    REQUIRE(chain.find("device: Null Adapter") != std::string::npos);
}

// =============================================================================
// Result<T> Tests
// =============================================================================

TEST_CASE("Result construction", "[core][result]") {
    SECTION("Ok with value") {
        Result<int> r = Ok(42);
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
        REQUIRE(r.value() == 42);
    }

    SECTION("Ok void") {
        Result<void> r = Ok();
        REQUIRE(r.is_ok());
        REQUIRE_FALSE(r.is_err());
    }

    SECTION("from Error") {
        Result<int> r = Error(RalError::device_lost());
        REQUIRE(r.is_err());
        REQUIRE(r.error().is_ral(RalError::Kind::DeviceLost));
    }

    SECTION("void from Error") {
        Result<void> r = Error(RalError::timeout());
        REQUIRE_FALSE(r);
        REQUIRE(r.error().code() == ErrorCode::Timeout);
    }
}

TEST_CASE("Result value access", "[core][result]") {
    SECTION("value_or on Ok") {
        Result<int> r = Ok(42);
        REQUIRE(r.value_or(0) == 42);
    }

    SECTION("value_or on Err") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE(r.value_or(0) == 0);
    }

    SECTION("unwrap on Err throws") {
        Result<int> r = Err<int>(Error("error"));
        REQUIRE_THROWS_AS(r.unwrap(), std::runtime_error);
    }

    SECTION("move value out") {
        Result<std::string> r = Ok(std::string("hello"));
        std::string s = std::move(r).value();
        REQUIRE(s == "hello");
    }
}

TEST_CASE("Result chaining", "[core][result]") {
    SECTION("map on Ok") {
        Result<int> r = Ok(21);
        auto r2 = r.map([](int x) { return x * 2; });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 42);
    }

    SECTION("and_then on Err keeps the error") {
        Result<int> r = Error(RalError::invalid_parameter("x"));
        auto r2 = r.and_then([](int x) -> Result<std::string> {
            return Ok(std::to_string(x));
        });
        REQUIRE(r2.is_err());
        REQUIRE(r2.error().is_ral(RalError::Kind::InvalidParameter));
    }

    SECTION("or_else on Err") {
        Result<int> r = Err<int>(Error("error"));
        auto r2 = r.or_else([](const Error& /*e*/) -> Result<int> {
            return Ok(0);
        });
        REQUIRE(r2.is_ok());
        REQUIRE(r2.value() == 0);
    }
}
