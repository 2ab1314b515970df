// onca_ral backend loading tests

#include <catch2/catch_test_macros.hpp>
#include "null_fixture.hpp"
#include <array>
#include <string>

using namespace onca_ral;
using onca_test::RalLogCapture;

TEST_CASE("Ral loads a backend module", "[ral][loader]") {
    auto ral = Ral::load(Settings::for_api("null"), ONCA_RAL_TEST_MODULE_DIR);
    REQUIRE(ral.is_ok());
    REQUIRE((*ral)->settings().api_name == "null");

    SECTION("adapters are enumerated in a stable order") {
        auto first = (*ral)->get_physical_devices();
        auto second = (*ral)->get_physical_devices();
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        REQUIRE(first->size() == 1);
        REQUIRE(first->front().properties.description == second->front().properties.description);
        REQUIRE(first->front().properties.dev_type == PhysicalDeviceType::Software);
    }

    SECTION("device created through the module works") {
        auto adapters = (*ral)->get_physical_devices();
        REQUIRE(adapters.is_ok());

        auto device = (*ral)->create_device(adapters->front());
        REQUIRE(device.is_ok());

        BufferDesc desc;
        desc.size = 256;
        desc.usages = BufferUsage::CopySrc;
        desc.alloc_desc.memory_type = MemoryType::Upload;

        auto buffer = (*device)->create_buffer(desc);
        REQUIRE(buffer.is_ok());

        auto mapped = (*buffer)->map(0, 16);
        REQUIRE(mapped.is_ok());
        const std::array<std::uint8_t, 4> data{1, 2, 3, 4};
        REQUIRE(mapped->write(data) == 4u);
        (*buffer)->unmap(*mapped);

        REQUIRE((*device)->flush().is_ok());
    }
}

TEST_CASE("Ral reports module loading failures", "[ral][loader]") {
    SECTION("module does not exist") {
        auto ral = Ral::load(Settings::for_api("does_not_exist"), ONCA_RAL_TEST_MODULE_DIR);
        REQUIRE(ral.is_err());
        REQUIRE(ral.error().is_library(onca_core::LibraryError::Kind::DynLib));
        REQUIRE(ral.error().message().find("onca_ral_does_not_exist") != std::string::npos);
    }

    SECTION("backend errors are passed through") {
        Settings settings = Settings::for_api("null");
        settings.api_specific = {{"adapters", 99}};

        auto ral = Ral::load(settings, ONCA_RAL_TEST_MODULE_DIR);
        REQUIRE(ral.is_err());
        REQUIRE(ral.error().code() == onca_core::ErrorCode::ParseError);
        REQUIRE(ral.error().message().find("adapters") != std::string::npos);
    }

    SECTION("module without entry points") {
        auto ral = Ral::load(Settings::for_api("no_entry"), ONCA_RAL_TEST_MODULE_DIR);
        REQUIRE(ral.is_err());
        REQUIRE(ral.error().is_library(onca_core::LibraryError::Kind::LoadFunction));
        REQUIRE(ral.error().message().find(CREATE_RAL_SYMBOL) != std::string::npos);
    }
}

TEST_CASE("Ral without a destroy entry point leaks the backend", "[ral][loader]") {
    RalLogCapture capture;
    {
        auto ral = Ral::load(Settings::for_api("create_only"), ONCA_RAL_TEST_MODULE_DIR);
        REQUIRE(ral.is_ok());
        REQUIRE((*ral)->get_physical_devices().is_ok());
        REQUIRE_FALSE(capture.contains("leaking the backend"));
    }
    REQUIRE(capture.contains("`destroy_ral` does not exist for the current RAL, leaking the backend"));
}

TEST_CASE("Backends receive the host allocator id", "[ral][loader]") {
    RalCreateInfo create_info;
    create_info.settings = Settings::for_api("null");
    create_info.logger = ral_logger();

    SECTION("default") {
        auto ral = null::NullRal::create(create_info);
        REQUIRE(ral.is_ok());
        REQUIRE((*ral)->context()->allocator_id == DEFAULT_ALLOCATOR_ID);
    }

    SECTION("explicit") {
        create_info.allocator_id = 7;
        auto ral = null::NullRal::create(create_info);
        REQUIRE(ral.is_ok());
        REQUIRE((*ral)->context()->allocator_id == 7);
    }
}
