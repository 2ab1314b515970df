#pragma once

/// @file vertex_format.hpp
/// @brief Vertex attribute formats for onca_ral

#include "fwd.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>

namespace onca_ral {

/// Component layout of a vertex attribute
enum class VertexComponents : std::uint8_t {
    X32Y32Z32W32,
    X32Y32Z32,
    X32Y32,
    X32,
    X16Y16Z16W16,
    X16Y16,
    X16,
    X8Y8Z8W8,
    X8Y8,
    X8,
    X10Y10Z10W2,
    X11Y11Z10,
};

constexpr std::size_t VERTEX_COMPONENTS_COUNT = 12;

/// Numeric representation of a vertex attribute
enum class VertexDataType : std::uint8_t {
    SFloat,
    UFloat,
    SInt,
    UInt,
    SNorm,
    UNorm,
};

constexpr std::size_t VERTEX_DATA_TYPE_COUNT = 6;

/// Vertex attribute format
enum class VertexFormat : std::uint8_t {
    X32Y32Z32W32SFloat,
    X32Y32Z32W32SInt,
    X32Y32Z32W32UInt,
    X32Y32Z32SFloat,
    X32Y32Z32SInt,
    X32Y32Z32UInt,
    X32Y32SFloat,
    X32Y32SInt,
    X32Y32UInt,
    X32SFloat,
    X32SInt,
    X32UInt,
    X16Y16Z16W16SFloat,
    X16Y16Z16W16SInt,
    X16Y16Z16W16UInt,
    X16Y16Z16W16SNorm,
    X16Y16Z16W16UNorm,
    X16Y16SFloat,
    X16Y16SInt,
    X16Y16UInt,
    X16Y16SNorm,
    X16Y16UNorm,
    X16SFloat,
    X16SInt,
    X16UInt,
    X16SNorm,
    X16UNorm,
    X8Y8Z8W8SInt,
    X8Y8Z8W8UInt,
    X8Y8Z8W8SNorm,
    X8Y8Z8W8UNorm,
    X8Y8SInt,
    X8Y8UInt,
    X8Y8SNorm,
    X8Y8UNorm,
    X8SInt,
    X8UInt,
    X8SNorm,
    X8UNorm,
    X10Y10Z10W2UInt,
    X10Y10Z10W2UNorm,
    X11Y11Z10UFloat,
};

constexpr std::size_t VERTEX_FORMAT_COUNT = 42;

[[nodiscard]] std::pair<VertexComponents, VertexDataType> vertex_format_to_components_and_data_type(VertexFormat format) noexcept;
[[nodiscard]] std::optional<VertexFormat> vertex_format_from_components_and_data_type(VertexComponents components, VertexDataType data_type) noexcept;

/// Size in bytes of one attribute
[[nodiscard]] std::uint32_t vertex_format_byte_size(VertexFormat format) noexcept;

/// Number of components (1 to 4)
[[nodiscard]] std::uint32_t vertex_format_component_count(VertexFormat format) noexcept;

/// Check if the format can be used as acceleration-structure vertex position
[[nodiscard]] bool vertex_format_supports_acceleration_structure(VertexFormat format) noexcept;

[[nodiscard]] const char* vertex_format_name(VertexFormat format) noexcept;

[[nodiscard]] constexpr VertexFormat vertex_format_from_index(std::size_t index) noexcept {
    return static_cast<VertexFormat>(index);
}

} // namespace onca_ral
