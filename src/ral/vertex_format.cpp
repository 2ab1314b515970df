/// @file vertex_format.cpp
/// @brief Vertex format tables for onca_ral

#include <onca_engine/ral/vertex_format.hpp>
#include <array>

namespace onca_ral {

namespace {

using C = VertexComponents;
using D = VertexDataType;
using F = VertexFormat;

struct VertexFormatEntry {
    VertexFormat format;
    VertexComponents components;
    VertexDataType data_type;
    std::uint8_t byte_size;
    bool acceleration_structure;
    const char* name;
};

constexpr std::array<VertexFormatEntry, VERTEX_FORMAT_COUNT> VERTEX_FORMAT_TABLE = {{
    {F::X32Y32Z32W32SFloat, C::X32Y32Z32W32, D::SFloat, 16, false, "X32Y32Z32W32SFloat"},
    {F::X32Y32Z32W32SInt,   C::X32Y32Z32W32, D::SInt,   16, false, "X32Y32Z32W32SInt"},
    {F::X32Y32Z32W32UInt,   C::X32Y32Z32W32, D::UInt,   16, false, "X32Y32Z32W32UInt"},
    {F::X32Y32Z32SFloat,    C::X32Y32Z32,    D::SFloat, 12, true,  "X32Y32Z32SFloat"},
    {F::X32Y32Z32SInt,      C::X32Y32Z32,    D::SInt,   12, false, "X32Y32Z32SInt"},
    {F::X32Y32Z32UInt,      C::X32Y32Z32,    D::UInt,   12, false, "X32Y32Z32UInt"},
    {F::X32Y32SFloat,       C::X32Y32,       D::SFloat, 8,  true,  "X32Y32SFloat"},
    {F::X32Y32SInt,         C::X32Y32,       D::SInt,   8,  false, "X32Y32SInt"},
    {F::X32Y32UInt,         C::X32Y32,       D::UInt,   8,  false, "X32Y32UInt"},
    {F::X32SFloat,          C::X32,          D::SFloat, 4,  false, "X32SFloat"},
    {F::X32SInt,            C::X32,          D::SInt,   4,  false, "X32SInt"},
    {F::X32UInt,            C::X32,          D::UInt,   4,  false, "X32UInt"},
    {F::X16Y16Z16W16SFloat, C::X16Y16Z16W16, D::SFloat, 8,  true,  "X16Y16Z16W16SFloat"},
    {F::X16Y16Z16W16SInt,   C::X16Y16Z16W16, D::SInt,   8,  false, "X16Y16Z16W16SInt"},
    {F::X16Y16Z16W16UInt,   C::X16Y16Z16W16, D::UInt,   8,  false, "X16Y16Z16W16UInt"},
    {F::X16Y16Z16W16SNorm,  C::X16Y16Z16W16, D::SNorm,  8,  true,  "X16Y16Z16W16SNorm"},
    {F::X16Y16Z16W16UNorm,  C::X16Y16Z16W16, D::UNorm,  8,  true,  "X16Y16Z16W16UNorm"},
    {F::X16Y16SFloat,       C::X16Y16,       D::SFloat, 4,  true,  "X16Y16SFloat"},
    {F::X16Y16SInt,         C::X16Y16,       D::SInt,   4,  false, "X16Y16SInt"},
    {F::X16Y16UInt,         C::X16Y16,       D::UInt,   4,  false, "X16Y16UInt"},
    {F::X16Y16SNorm,        C::X16Y16,       D::SNorm,  4,  true,  "X16Y16SNorm"},
    {F::X16Y16UNorm,        C::X16Y16,       D::UNorm,  4,  true,  "X16Y16UNorm"},
    {F::X16SFloat,          C::X16,          D::SFloat, 2,  false, "X16SFloat"},
    {F::X16SInt,            C::X16,          D::SInt,   2,  false, "X16SInt"},
    {F::X16UInt,            C::X16,          D::UInt,   2,  false, "X16UInt"},
    {F::X16SNorm,           C::X16,          D::SNorm,  2,  false, "X16SNorm"},
    {F::X16UNorm,           C::X16,          D::UNorm,  2,  false, "X16UNorm"},
    {F::X8Y8Z8W8SInt,       C::X8Y8Z8W8,     D::SInt,   4,  false, "X8Y8Z8W8SInt"},
    {F::X8Y8Z8W8UInt,       C::X8Y8Z8W8,     D::UInt,   4,  false, "X8Y8Z8W8UInt"},
    {F::X8Y8Z8W8SNorm,      C::X8Y8Z8W8,     D::SNorm,  4,  true,  "X8Y8Z8W8SNorm"},
    {F::X8Y8Z8W8UNorm,      C::X8Y8Z8W8,     D::UNorm,  4,  true,  "X8Y8Z8W8UNorm"},
    {F::X8Y8SInt,           C::X8Y8,         D::SInt,   2,  false, "X8Y8SInt"},
    {F::X8Y8UInt,           C::X8Y8,         D::UInt,   2,  false, "X8Y8UInt"},
    {F::X8Y8SNorm,          C::X8Y8,         D::SNorm,  2,  true,  "X8Y8SNorm"},
    {F::X8Y8UNorm,          C::X8Y8,         D::UNorm,  2,  true,  "X8Y8UNorm"},
    {F::X8SInt,             C::X8,           D::SInt,   1,  false, "X8SInt"},
    {F::X8UInt,             C::X8,           D::UInt,   1,  false, "X8UInt"},
    {F::X8SNorm,            C::X8,           D::SNorm,  1,  false, "X8SNorm"},
    {F::X8UNorm,            C::X8,           D::UNorm,  1,  false, "X8UNorm"},
    {F::X10Y10Z10W2UInt,    C::X10Y10Z10W2,  D::UInt,   4,  false, "X10Y10Z10W2UInt"},
    {F::X10Y10Z10W2UNorm,   C::X10Y10Z10W2,  D::UNorm,  4,  true,  "X10Y10Z10W2UNorm"},
    {F::X11Y11Z10UFloat,    C::X11Y11Z10,    D::UFloat, 4,  false, "X11Y11Z10UFloat"},
}};

constexpr bool vertex_table_is_ordered() {
    for (std::size_t i = 0; i < VERTEX_FORMAT_TABLE.size(); ++i) {
        if (static_cast<std::size_t>(VERTEX_FORMAT_TABLE[i].format) != i) {
            return false;
        }
    }
    return true;
}
static_assert(vertex_table_is_ordered(), "VERTEX_FORMAT_TABLE must follow the order of VertexFormat");

constexpr std::array<std::uint8_t, VERTEX_COMPONENTS_COUNT> COMPONENT_COUNTS = {{
    4, 3, 2, 1, 4, 2, 1, 4, 2, 1, 4, 3,
}};

constexpr std::int8_t NO_FORMAT = -1;

using InverseTable = std::array<std::array<std::int8_t, VERTEX_DATA_TYPE_COUNT>, VERTEX_COMPONENTS_COUNT>;

constexpr InverseTable build_inverse_table() {
    InverseTable table{};
    for (auto& row : table) {
        for (auto& cell : row) {
            cell = NO_FORMAT;
        }
    }
    for (const auto& entry : VERTEX_FORMAT_TABLE) {
        table[static_cast<std::size_t>(entry.components)][static_cast<std::size_t>(entry.data_type)] =
            static_cast<std::int8_t>(entry.format);
    }
    return table;
}

constexpr InverseTable INVERSE_TABLE = build_inverse_table();

const VertexFormatEntry& entry(VertexFormat format) noexcept {
    return VERTEX_FORMAT_TABLE[static_cast<std::size_t>(format)];
}

} // anonymous namespace

std::pair<VertexComponents, VertexDataType> vertex_format_to_components_and_data_type(VertexFormat format) noexcept {
    const auto& e = entry(format);
    return {e.components, e.data_type};
}

std::optional<VertexFormat> vertex_format_from_components_and_data_type(VertexComponents components, VertexDataType data_type) noexcept {
    const std::size_t c = static_cast<std::size_t>(components);
    const std::size_t d = static_cast<std::size_t>(data_type);
    if (c >= VERTEX_COMPONENTS_COUNT || d >= VERTEX_DATA_TYPE_COUNT || INVERSE_TABLE[c][d] == NO_FORMAT) {
        return std::nullopt;
    }
    return static_cast<VertexFormat>(INVERSE_TABLE[c][d]);
}

std::uint32_t vertex_format_byte_size(VertexFormat format) noexcept {
    return entry(format).byte_size;
}

std::uint32_t vertex_format_component_count(VertexFormat format) noexcept {
    return COMPONENT_COUNTS[static_cast<std::size_t>(entry(format).components)];
}

bool vertex_format_supports_acceleration_structure(VertexFormat format) noexcept {
    return entry(format).acceleration_structure;
}

const char* vertex_format_name(VertexFormat format) noexcept {
    const std::size_t index = static_cast<std::size_t>(format);
    return index < VERTEX_FORMAT_COUNT ? VERTEX_FORMAT_TABLE[index].name : "Unknown";
}

} // namespace onca_ral
