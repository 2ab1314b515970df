// onca_core DynamicLibrary tests

#include <catch2/catch_test_macros.hpp>
#include <onca_engine/core/dynamic_library.hpp>
#include <string>

using namespace onca_core;

namespace {

using EntryFn = void* (*)();

} // namespace

TEST_CASE("DynamicLibrary extension", "[core][dynamic_library]") {
    const std::string ext = DynamicLibrary::extension();
    REQUIRE(ext.size() > 1);
    REQUIRE(ext[0] == '.');
}

TEST_CASE("DynamicLibrary loading", "[core][dynamic_library]") {
    DynamicLibrary lib;

    SECTION("not loaded by default") {
        REQUIRE_FALSE(lib.is_loaded());
        REQUIRE(lib.get_function<EntryFn>("create_ral") == nullptr);
    }

    SECTION("missing file") {
        auto result = lib.load("onca_ral_does_not_exist" + std::string(DynamicLibrary::extension()));
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_library(LibraryError::Kind::DynLib));
        REQUIRE(result.error().code() == ErrorCode::NotFound);
        REQUIRE(result.error().message().find("onca_ral_does_not_exist") != std::string::npos);
        REQUIRE_FALSE(lib.is_loaded());
        REQUIRE_FALSE(lib.error().empty());
    }

    SECTION("backend module exports its entry points") {
        auto result = lib.load(ONCA_TEST_MODULE_PATH);
        REQUIRE(result.is_ok());
        REQUIRE(lib.is_loaded());
        REQUIRE(lib.get_function<EntryFn>("create_ral") != nullptr);
        REQUIRE(lib.get_function<EntryFn>("destroy_ral") != nullptr);

        SECTION("missing symbol") {
            REQUIRE(lib.get_function<EntryFn>("onca_not_exported") == nullptr);

            auto func = lib.require_function<EntryFn>("onca_not_exported");
            REQUIRE(func.is_err());
            REQUIRE(func.error().is_library(LibraryError::Kind::LoadFunction));
            REQUIRE(func.error().code() == ErrorCode::DependencyMissing);
        }

        SECTION("unload") {
            lib.unload();
            REQUIRE_FALSE(lib.is_loaded());
            REQUIRE(lib.path().empty());
        }
    }

    SECTION("move transfers ownership") {
        auto result = lib.load(ONCA_TEST_MODULE_PATH);
        REQUIRE(result.is_ok());

        DynamicLibrary moved = std::move(lib);
        REQUIRE(moved.is_loaded());
        REQUIRE_FALSE(lib.is_loaded());
        REQUIRE(moved.require_function<EntryFn>("create_ral").is_ok());
    }
}
