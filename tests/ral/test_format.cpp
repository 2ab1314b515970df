// onca_ral pixel format tests

#include <catch2/catch_test_macros.hpp>
#include <onca_engine/ral/format.hpp>
#include <set>
#include <string>

using namespace onca_ral;

TEST_CASE("Format components and data type", "[ral][format]") {
    SECTION("split") {
        auto [components, data_type] = format_to_components_and_data_type(Format::R8G8B8A8Srgb);
        REQUIRE(components == FormatComponents::R8G8B8A8);
        REQUIRE(data_type == FormatDataType::Srgb);

        REQUIRE(format_components(Format::BC6HUFloat) == FormatComponents::BC6H);
        REQUIRE(format_data_type(Format::BC6HUFloat) == FormatDataType::UFloat);
    }

    SECTION("combine") {
        auto format = format_from_components_and_data_type(FormatComponents::B8G8R8A8, FormatDataType::UNorm);
        REQUIRE(format.has_value());
        REQUIRE(*format == Format::B8G8R8A8UNorm);
    }

    SECTION("combinations without a format") {
        REQUIRE_FALSE(format_from_components_and_data_type(FormatComponents::R32, FormatDataType::Srgb).has_value());
        REQUIRE_FALSE(format_from_components_and_data_type(FormatComponents::D32, FormatDataType::UNorm).has_value());
        REQUIRE_FALSE(format_from_components_and_data_type(FormatComponents::BC1, FormatDataType::SFloat).has_value());
    }

    SECTION("every format maps back onto itself") {
        for (std::size_t i = 0; i < FORMAT_COUNT; ++i) {
            const Format format = format_from_index(i);
            auto [components, data_type] = format_to_components_and_data_type(format);
            auto back = format_from_components_and_data_type(components, data_type);
            REQUIRE(back.has_value());
            REQUIRE(*back == format);
        }
    }
}

TEST_CASE("Format sizes", "[ral][format]") {
    SECTION("uncompressed") {
        REQUIRE(format_bits_per_pixel(Format::R32G32B32A32SFloat) == 128);
        REQUIRE(format_unit_byte_size(Format::R32G32B32A32SFloat) == 16);
        REQUIRE(format_unit_byte_size(Format::R16G16UNorm) == 4);
        REQUIRE(format_unit_byte_size(Format::R8UNorm) == 1);
        REQUIRE(format_block_byte_size(Format::R8UNorm) == 0);
        REQUIRE_FALSE(format_is_block_compressed(Format::R11G11B10UFloat));
    }

    SECTION("block compressed") {
        REQUIRE(format_is_block_compressed(Format::BC1UNorm));
        REQUIRE(format_unit_byte_size(Format::BC1UNorm) == 0);
        REQUIRE(format_block_byte_size(Format::BC1UNorm) == 8);
        REQUIRE(format_block_byte_size(Format::BC7Srgb) == 16);
        REQUIRE(format_bits_per_pixel(Format::BC4UNorm) == 4);

        auto [w, h] = format_min_mip_size(Format::BC3UNorm);
        REQUIRE(w == 4);
        REQUIRE(h == 4);
    }

    SECTION("opaque formats have no texel size") {
        REQUIRE(format_unit_byte_size(Format::SamplerFeedbackMinMipOpaque) == 0);
        REQUIRE(format_bits_per_pixel(Format::SamplerFeedbackMipRegionUsedOpaque) == 0);
    }
}

TEST_CASE("Format aspects", "[ral][format]") {
    SECTION("color") {
        REQUIRE(format_aspect(Format::R8G8B8A8UNorm) == FormatAspect::Color);
        REQUIRE_FALSE(format_has_depth(Format::R8G8B8A8UNorm));
        REQUIRE_FALSE(format_is_depth_stencil(Format::R8G8B8A8UNorm));
    }

    SECTION("depth") {
        REQUIRE(format_has_depth(Format::D32SFloat));
        REQUIRE_FALSE(format_has_stencil(Format::D32SFloat));
        REQUIRE(format_is_depth_stencil(Format::D32SFloat));
    }

    SECTION("depth stencil is planar") {
        REQUIRE(format_has_depth(Format::D32SFloatS8UInt));
        REQUIRE(format_has_stencil(Format::D32SFloatS8UInt));
        REQUIRE(format_num_planes(Format::D32SFloatS8UInt) == 2);
        REQUIRE(format_is_planar(Format::D32SFloatS8UInt));
        REQUIRE_FALSE(format_is_planar(Format::D32SFloat));
    }

    SECTION("stencil only") {
        REQUIRE(format_has_stencil(Format::S8UInt));
        REQUIRE_FALSE(format_has_depth(Format::S8UInt));
    }
}

TEST_CASE("Format data type classes", "[ral][format]") {
    REQUIRE(is_integer(FormatDataType::UInt));
    REQUIRE(is_integer(FormatDataType::SInt));
    REQUIRE_FALSE(is_integer(FormatDataType::UNorm));
    REQUIRE(is_non_integer(FormatDataType::Srgb));
    REQUIRE(is_non_integer(FormatDataType::SFloat));
    REQUIRE_FALSE(is_non_integer(FormatDataType::Typeless));
    REQUIRE_FALSE(is_non_integer(FormatDataType::UInt));
}

TEST_CASE("Format availability", "[ral][format]") {
    REQUIRE(format_is_always_available(Format::R8G8B8A8UNorm));
    REQUIRE(format_is_always_available(Format::D32SFloat));
    REQUIRE_FALSE(format_is_always_available(Format::R8G8B8A8Typeless));
    REQUIRE_FALSE(format_is_always_available(Format::BC7UNorm));
    REQUIRE_FALSE(format_is_always_available(Format::D32SFloatS8UInt));
}

TEST_CASE("Format names", "[ral][format]") {
    REQUIRE(std::string(format_name(Format::R10G10B10A2UNorm)) == "R10G10B10A2UNorm");
    REQUIRE(std::string(format_components_name(FormatComponents::BC6H)) == "BC6H");
    REQUIRE(std::string(format_data_type_name(FormatDataType::Srgb)) == "Srgb");

    std::set<std::string> names;
    for (std::size_t i = 0; i < FORMAT_COUNT; ++i) {
        names.insert(format_name(format_from_index(i)));
    }
    REQUIRE(names.size() == FORMAT_COUNT);
}
