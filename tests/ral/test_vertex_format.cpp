// onca_ral vertex format tests

#include <catch2/catch_test_macros.hpp>
#include <onca_engine/ral/vertex_format.hpp>
#include <string>

using namespace onca_ral;

TEST_CASE("Vertex format components and data type", "[ral][vertex_format]") {
    SECTION("split") {
        auto [components, data_type] = vertex_format_to_components_and_data_type(VertexFormat::X16Y16SNorm);
        REQUIRE(components == VertexComponents::X16Y16);
        REQUIRE(data_type == VertexDataType::SNorm);
    }

    SECTION("combine") {
        auto format = vertex_format_from_components_and_data_type(VertexComponents::X32Y32Z32, VertexDataType::SFloat);
        REQUIRE(format.has_value());
        REQUIRE(*format == VertexFormat::X32Y32Z32SFloat);
    }

    SECTION("combinations without a format") {
        REQUIRE_FALSE(vertex_format_from_components_and_data_type(VertexComponents::X8Y8Z8W8, VertexDataType::SFloat).has_value());
        REQUIRE_FALSE(vertex_format_from_components_and_data_type(VertexComponents::X32, VertexDataType::UNorm).has_value());
        REQUIRE_FALSE(vertex_format_from_components_and_data_type(VertexComponents::X11Y11Z10, VertexDataType::UInt).has_value());
    }

    SECTION("every format maps back onto itself") {
        for (std::size_t i = 0; i < VERTEX_FORMAT_COUNT; ++i) {
            const VertexFormat format = vertex_format_from_index(i);
            auto [components, data_type] = vertex_format_to_components_and_data_type(format);
            auto back = vertex_format_from_components_and_data_type(components, data_type);
            REQUIRE(back.has_value());
            REQUIRE(*back == format);
        }
    }
}

TEST_CASE("Vertex format sizes", "[ral][vertex_format]") {
    REQUIRE(vertex_format_byte_size(VertexFormat::X32Y32Z32W32SFloat) == 16);
    REQUIRE(vertex_format_byte_size(VertexFormat::X32Y32Z32UInt) == 12);
    REQUIRE(vertex_format_byte_size(VertexFormat::X16Y16Z16W16UNorm) == 8);
    REQUIRE(vertex_format_byte_size(VertexFormat::X8UNorm) == 1);
    REQUIRE(vertex_format_byte_size(VertexFormat::X10Y10Z10W2UNorm) == 4);
    REQUIRE(vertex_format_byte_size(VertexFormat::X11Y11Z10UFloat) == 4);

    REQUIRE(vertex_format_component_count(VertexFormat::X32Y32Z32SFloat) == 3);
    REQUIRE(vertex_format_component_count(VertexFormat::X16SFloat) == 1);
    REQUIRE(vertex_format_component_count(VertexFormat::X10Y10Z10W2UInt) == 4);
    REQUIRE(vertex_format_component_count(VertexFormat::X11Y11Z10UFloat) == 3);
}

TEST_CASE("Vertex formats usable as acceleration-structure positions", "[ral][vertex_format]") {
    REQUIRE(vertex_format_supports_acceleration_structure(VertexFormat::X32Y32Z32SFloat));
    REQUIRE(vertex_format_supports_acceleration_structure(VertexFormat::X32Y32SFloat));
    REQUIRE(vertex_format_supports_acceleration_structure(VertexFormat::X16Y16Z16W16SFloat));
    REQUIRE(vertex_format_supports_acceleration_structure(VertexFormat::X8Y8Z8W8UNorm));
    REQUIRE(vertex_format_supports_acceleration_structure(VertexFormat::X10Y10Z10W2UNorm));

    REQUIRE_FALSE(vertex_format_supports_acceleration_structure(VertexFormat::X32Y32Z32W32SFloat));
    REQUIRE_FALSE(vertex_format_supports_acceleration_structure(VertexFormat::X32SFloat));
    REQUIRE_FALSE(vertex_format_supports_acceleration_structure(VertexFormat::X16Y16UInt));
    REQUIRE_FALSE(vertex_format_supports_acceleration_structure(VertexFormat::X11Y11Z10UFloat));
}

TEST_CASE("Vertex format names", "[ral][vertex_format]") {
    REQUIRE(std::string(vertex_format_name(VertexFormat::X8Y8Z8W8UNorm)) == "X8Y8Z8W8UNorm");
    REQUIRE(std::string(vertex_format_name(VertexFormat::X11Y11Z10UFloat)) == "X11Y11Z10UFloat");
}
