// onca_ral buffer range and view tests

#include <catch2/catch_test_macros.hpp>
#include "null_fixture.hpp"

using namespace onca_ral;
using onca_test::NullDeviceFixture;

namespace {

Handle<Buffer> make_buffer(Device& device, std::uint64_t size) {
    BufferDesc desc;
    desc.size = size;
    desc.usages = BufferUsage::StorageBuffer | BufferUsage::ConstantTexelBuffer;
    auto buffer = device.create_buffer(desc);
    REQUIRE(buffer.is_ok());
    return *buffer;
}

} // namespace

TEST_CASE("BufferRange creation", "[ral][buffer]") {
    SECTION("aligned ranges") {
        auto range = BufferRange::create(4, 16);
        REQUIRE(range.has_value());
        REQUIRE(range->offset() == 4);
        REQUIRE(range->size() == 16);
        REQUIRE(BufferRange::create(0, 4).has_value());
    }

    SECTION("rejected ranges") {
        REQUIRE_FALSE(BufferRange::create(0, 0).has_value());
        REQUIRE_FALSE(BufferRange::create(0, 6).has_value());
        REQUIRE_FALSE(BufferRange::create(2, 8).has_value());
    }
}

TEST_CASE("StructuredBufferViewDesc creation", "[ral][buffer]") {
    auto view = StructuredBufferViewDesc::create(2, 10, 16);
    REQUIRE(view.has_value());
    REQUIRE(view->offset() == 2);
    REQUIRE(view->count() == 10);
    REQUIRE(view->elem_size() == 16);

    REQUIRE_FALSE(StructuredBufferViewDesc::create(0, 0, 16).has_value());
    REQUIRE_FALSE(StructuredBufferViewDesc::create(0, 4, 0).has_value());
    REQUIRE_FALSE(StructuredBufferViewDesc::create(0, 4, 6).has_value());
}

TEST_CASE("TexelBufferViewDesc creation", "[ral][buffer]") {
    auto view = TexelBufferViewDesc::create(Format::R32G32B32A32SFloat, 32, 64);
    REQUIRE(view.has_value());
    REQUIRE(view->format() == Format::R32G32B32A32SFloat);
    REQUIRE(view->offset() == 32);
    REQUIRE(view->count() == 64);
    REQUIRE(view->texel_size() == 16);

    SECTION("offset must be a whole number of texels") {
        REQUIRE_FALSE(TexelBufferViewDesc::create(Format::R32G32B32A32SFloat, 8, 64).has_value());
        REQUIRE(TexelBufferViewDesc::create(Format::R32SFloat, 8, 64).has_value());
    }

    SECTION("block-compressed formats are rejected") {
        REQUIRE_FALSE(TexelBufferViewDesc::create(Format::BC1UNorm, 0, 64).has_value());
    }

    SECTION("empty views are rejected") {
        REQUIRE_FALSE(TexelBufferViewDesc::create(Format::R32SFloat, 0, 0).has_value());
    }
}

TEST_CASE("Buffer view range checks", "[ral][buffer]") {
    NullDeviceFixture fixture;
    Handle<Buffer> buffer = make_buffer(*fixture.device, 256);

    SECTION("ranges inside the buffer") {
        REQUIRE(BufferRange::create(0, 256)->validate(*buffer).is_ok());
        REQUIRE(BufferRange::create(252, 4)->validate(*buffer).is_ok());
        REQUIRE(StructuredBufferViewDesc::create(4, 12, 16)->validate(*buffer).is_ok());
        REQUIRE(TexelBufferViewDesc::create(Format::R32SFloat, 128, 32)->validate(*buffer).is_ok());
    }

#if ONCA_RAL_VALIDATION
    SECTION("offset past the end") {
        auto result = BufferRange::create(256, 4)->validate(*buffer);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_ral(RalError::Kind::InvalidParameter));
        REQUIRE(result.error().message().find("cannot reach") != std::string::npos);
    }

    SECTION("end past the end") {
        auto range = BufferRange::create(128, 132)->validate(*buffer);
        REQUIRE(range.is_err());
        REQUIRE(range.error().message().find("goes past") != std::string::npos);

        REQUIRE(StructuredBufferViewDesc::create(8, 9, 16)->validate(*buffer).is_err());
        REQUIRE(TexelBufferViewDesc::create(Format::R32SFloat, 200, 15)->validate(*buffer).is_err());
        REQUIRE(TexelBufferViewDesc::create(Format::R32SFloat, 200, 14)->validate(*buffer).is_ok());
    }

    SECTION("element counts that overflow 64 bits") {
        auto far_offset = StructuredBufferViewDesc::create(1ull << 62, 1, 4)->validate(*buffer);
        REQUIRE(far_offset.is_err());
        REQUIRE(far_offset.error().message().find("cannot reach") != std::string::npos);

        auto huge_count = StructuredBufferViewDesc::create(0, 1ull << 62, 4)->validate(*buffer);
        REQUIRE(huge_count.is_err());
        REQUIRE(huge_count.error().message().find("goes past") != std::string::npos);

        REQUIRE(TexelBufferViewDesc::create(Format::R32G32B32A32SFloat, 0, 1ull << 60)->validate(*buffer).is_err());
    }
#else
    SECTION("ranges are not checked") {
        REQUIRE(BufferRange::create(256, 4)->validate(*buffer).is_ok());
        REQUIRE(BufferRange::create(128, 132)->validate(*buffer).is_ok());
    }
#endif
}
