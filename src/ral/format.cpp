/// @file format.cpp
/// @brief Pixel format tables for onca_ral

#include <onca_engine/ral/format.hpp>
#include <array>

namespace onca_ral {

namespace {

using C = FormatComponents;
using D = FormatDataType;

struct FormatEntry {
    Format format;
    FormatComponents components;
    FormatDataType data_type;
    const char* name;
    bool always_available;
};

// Ordered like Format; checked below
constexpr std::array<FormatEntry, FORMAT_COUNT> FORMAT_TABLE = {{
    {Format::R32G32B32A32Typeless, C::R32G32B32A32, D::Typeless, "R32G32B32A32Typeless", false},
    {Format::R32G32B32A32SFloat,   C::R32G32B32A32, D::SFloat,   "R32G32B32A32SFloat",   true},
    {Format::R32G32B32A32UInt,     C::R32G32B32A32, D::UInt,     "R32G32B32A32UInt",     true},
    {Format::R32G32B32A32SInt,     C::R32G32B32A32, D::SInt,     "R32G32B32A32SInt",     true},

    {Format::R32G32Typeless, C::R32G32, D::Typeless, "R32G32Typeless", false},
    {Format::R32G32SFloat,   C::R32G32, D::SFloat,   "R32G32SFloat",   true},
    {Format::R32G32UInt,     C::R32G32, D::UInt,     "R32G32UInt",     true},
    {Format::R32G32SInt,     C::R32G32, D::SInt,     "R32G32SInt",     true},

    {Format::R32Typeless, C::R32, D::Typeless, "R32Typeless", false},
    {Format::R32SFloat,   C::R32, D::SFloat,   "R32SFloat",   true},
    {Format::R32UInt,     C::R32, D::UInt,     "R32UInt",     true},
    {Format::R32SInt,     C::R32, D::SInt,     "R32SInt",     true},

    {Format::R16G16B16A16Typeless, C::R16G16B16A16, D::Typeless, "R16G16B16A16Typeless", false},
    {Format::R16G16B16A16SFloat,   C::R16G16B16A16, D::SFloat,   "R16G16B16A16SFloat",   true},
    {Format::R16G16B16A16UInt,     C::R16G16B16A16, D::UInt,     "R16G16B16A16UInt",     true},
    {Format::R16G16B16A16SInt,     C::R16G16B16A16, D::SInt,     "R16G16B16A16SInt",     true},
    {Format::R16G16B16A16UNorm,    C::R16G16B16A16, D::UNorm,    "R16G16B16A16UNorm",    true},
    {Format::R16G16B16A16SNorm,    C::R16G16B16A16, D::SNorm,    "R16G16B16A16SNorm",    true},

    {Format::R16G16Typeless, C::R16G16, D::Typeless, "R16G16Typeless", false},
    {Format::R16G16SFloat,   C::R16G16, D::SFloat,   "R16G16SFloat",   true},
    {Format::R16G16UInt,     C::R16G16, D::UInt,     "R16G16UInt",     true},
    {Format::R16G16SInt,     C::R16G16, D::SInt,     "R16G16SInt",     true},
    {Format::R16G16UNorm,    C::R16G16, D::UNorm,    "R16G16UNorm",    false},
    {Format::R16G16SNorm,    C::R16G16, D::SNorm,    "R16G16SNorm",    false},

    {Format::R16Typeless, C::R16, D::Typeless, "R16Typeless", false},
    {Format::R16SFloat,   C::R16, D::SFloat,   "R16SFloat",   true},
    {Format::R16UInt,     C::R16, D::UInt,     "R16UInt",     true},
    {Format::R16SInt,     C::R16, D::SInt,     "R16SInt",     true},
    {Format::R16UNorm,    C::R16, D::UNorm,    "R16UNorm",    false},
    {Format::R16SNorm,    C::R16, D::SNorm,    "R16SNorm",    false},

    {Format::R8G8B8A8Typeless, C::R8G8B8A8, D::Typeless, "R8G8B8A8Typeless", false},
    {Format::R8G8B8A8UInt,     C::R8G8B8A8, D::UInt,     "R8G8B8A8UInt",     true},
    {Format::R8G8B8A8SInt,     C::R8G8B8A8, D::SInt,     "R8G8B8A8SInt",     true},
    {Format::R8G8B8A8UNorm,    C::R8G8B8A8, D::UNorm,    "R8G8B8A8UNorm",    true},
    {Format::R8G8B8A8SNorm,    C::R8G8B8A8, D::SNorm,    "R8G8B8A8SNorm",    true},
    {Format::R8G8B8A8Srgb,     C::R8G8B8A8, D::Srgb,     "R8G8B8A8Srgb",     true},

    {Format::R8G8Typeless, C::R8G8, D::Typeless, "R8G8Typeless", false},
    {Format::R8G8UInt,     C::R8G8, D::UInt,     "R8G8UInt",     true},
    {Format::R8G8SInt,     C::R8G8, D::SInt,     "R8G8SInt",     true},
    {Format::R8G8UNorm,    C::R8G8, D::UNorm,    "R8G8UNorm",    true},
    {Format::R8G8SNorm,    C::R8G8, D::SNorm,    "R8G8SNorm",    true},

    {Format::R8Typeless, C::R8, D::Typeless, "R8Typeless", false},
    {Format::R8UInt,     C::R8, D::UInt,     "R8UInt",     true},
    {Format::R8SInt,     C::R8, D::SInt,     "R8SInt",     true},
    {Format::R8UNorm,    C::R8, D::UNorm,    "R8UNorm",    true},
    {Format::R8SNorm,    C::R8, D::SNorm,    "R8SNorm",    true},

    {Format::B8G8R8A8Typeless, C::B8G8R8A8, D::Typeless, "B8G8R8A8Typeless", false},
    {Format::B8G8R8A8UNorm,    C::B8G8R8A8, D::UNorm,    "B8G8R8A8UNorm",    true},
    {Format::B8G8R8A8Srgb,     C::B8G8R8A8, D::Srgb,     "B8G8R8A8Srgb",     true},

    {Format::R10G10B10A2Typeless, C::R10G10B10A2, D::Typeless, "R10G10B10A2Typeless", false},
    {Format::R10G10B10A2UInt,     C::R10G10B10A2, D::UInt,     "R10G10B10A2UInt",     true},
    {Format::R10G10B10A2UNorm,    C::R10G10B10A2, D::UNorm,    "R10G10B10A2UNorm",    true},

    {Format::R11G11B10UFloat, C::R11G11B10, D::UFloat, "R11G11B10UFloat", true},
    {Format::R9G9B9E5UFloat,  C::R9G9B9E5,  D::UFloat, "R9G9B9E5UFloat",  true},

    {Format::D32SFloat,       C::D32,   D::SFloat, "D32SFloat",       true},
    {Format::D32SFloatS8UInt, C::D32S8, D::SFloat, "D32SFloatS8UInt", false},
    {Format::S8UInt,          C::S8,    D::UInt,   "S8UInt",          false},

    {Format::BC1Typeless, C::BC1, D::Typeless, "BC1Typeless", false},
    {Format::BC1UNorm,    C::BC1, D::UNorm,    "BC1UNorm",    false},
    {Format::BC1Srgb,     C::BC1, D::Srgb,     "BC1Srgb",     false},
    {Format::BC2Typeless, C::BC2, D::Typeless, "BC2Typeless", false},
    {Format::BC2UNorm,    C::BC2, D::UNorm,    "BC2UNorm",    false},
    {Format::BC2Srgb,     C::BC2, D::Srgb,     "BC2Srgb",     false},
    {Format::BC3Typeless, C::BC3, D::Typeless, "BC3Typeless", false},
    {Format::BC3UNorm,    C::BC3, D::UNorm,    "BC3UNorm",    false},
    {Format::BC3Srgb,     C::BC3, D::Srgb,     "BC3Srgb",     false},
    {Format::BC4Typeless, C::BC4, D::Typeless, "BC4Typeless", false},
    {Format::BC4UNorm,    C::BC4, D::UNorm,    "BC4UNorm",    false},
    {Format::BC4SNorm,    C::BC4, D::SNorm,    "BC4SNorm",    false},
    {Format::BC5Typeless, C::BC5, D::Typeless, "BC5Typeless", false},
    {Format::BC5UNorm,    C::BC5, D::UNorm,    "BC5UNorm",    false},
    {Format::BC5SNorm,    C::BC5, D::SNorm,    "BC5SNorm",    false},
    {Format::BC6HTypeless, C::BC6H, D::Typeless, "BC6HTypeless", false},
    {Format::BC6HSFloat,   C::BC6H, D::SFloat,   "BC6HSFloat",   false},
    {Format::BC6HUFloat,   C::BC6H, D::UFloat,   "BC6HUFloat",   false},
    {Format::BC7Typeless, C::BC7, D::Typeless, "BC7Typeless", false},
    {Format::BC7UNorm,    C::BC7, D::UNorm,    "BC7UNorm",    false},
    {Format::BC7Srgb,     C::BC7, D::Srgb,     "BC7Srgb",     false},

    {Format::SamplerFeedbackMinMipOpaque,        C::SamplerFeedbackMinMip,        D::Typeless, "SamplerFeedbackMinMipOpaque",        false},
    {Format::SamplerFeedbackMipRegionUsedOpaque, C::SamplerFeedbackMipRegionUsed, D::Typeless, "SamplerFeedbackMipRegionUsedOpaque", false},
}};

constexpr bool format_table_is_ordered() {
    for (std::size_t i = 0; i < FORMAT_TABLE.size(); ++i) {
        if (static_cast<std::size_t>(FORMAT_TABLE[i].format) != i) {
            return false;
        }
    }
    return true;
}
static_assert(format_table_is_ordered(), "FORMAT_TABLE must follow the order of Format");

constexpr FormatAspect COLOR = FormatAspect::Color;

// aspect, bits per pixel, unit bytes, block bytes, planes, min mip w, min mip h
constexpr std::array<FormatComponentInfo, FORMAT_COMPONENTS_COUNT> COMPONENTS_TABLE = {{
    /* R32G32B32A32 */ {COLOR, 128, 16, 0, 1, 1, 1},
    /* R32G32       */ {COLOR, 64, 8, 0, 1, 1, 1},
    /* R32          */ {COLOR, 32, 4, 0, 1, 1, 1},
    /* R16G16B16A16 */ {COLOR, 64, 8, 0, 1, 1, 1},
    /* R16G16       */ {COLOR, 32, 4, 0, 1, 1, 1},
    /* R16          */ {COLOR, 16, 2, 0, 1, 1, 1},
    /* R8G8B8A8     */ {COLOR, 32, 4, 0, 1, 1, 1},
    /* R8G8         */ {COLOR, 16, 2, 0, 1, 1, 1},
    /* R8           */ {COLOR, 8, 1, 0, 1, 1, 1},
    /* B8G8R8A8     */ {COLOR, 32, 4, 0, 1, 1, 1},
    /* R10G10B10A2  */ {COLOR, 32, 4, 0, 1, 1, 1},
    /* R11G11B10    */ {COLOR, 32, 4, 0, 1, 1, 1},
    /* R9G9B9E5     */ {COLOR, 32, 4, 0, 1, 1, 1},
    /* D32          */ {FormatAspect::Depth, 32, 4, 0, 1, 1, 1},
    /* D32S8        */ {FormatAspect::DepthStencil, 64, 8, 0, 2, 1, 1},
    /* S8           */ {FormatAspect::Stencil, 8, 1, 0, 1, 1, 1},
    /* BC1          */ {COLOR, 4, 0, 8, 1, 4, 4},
    /* BC2          */ {COLOR, 8, 0, 16, 1, 4, 4},
    /* BC3          */ {COLOR, 8, 0, 16, 1, 4, 4},
    /* BC4          */ {COLOR, 4, 0, 8, 1, 4, 4},
    /* BC5          */ {COLOR, 8, 0, 16, 1, 4, 4},
    /* BC6H         */ {COLOR, 8, 0, 16, 1, 4, 4},
    /* BC7          */ {COLOR, 8, 0, 16, 1, 4, 4},
    /* SamplerFeedbackMinMip        */ {COLOR, 0, 0, 0, 1, 1, 1},
    /* SamplerFeedbackMipRegionUsed */ {COLOR, 0, 0, 0, 1, 1, 1},
}};

constexpr std::array<const char*, FORMAT_COMPONENTS_COUNT> COMPONENTS_NAMES = {{
    "R32G32B32A32", "R32G32", "R32", "R16G16B16A16", "R16G16", "R16", "R8G8B8A8", "R8G8", "R8",
    "B8G8R8A8", "R10G10B10A2", "R11G11B10", "R9G9B9E5", "D32", "D32S8", "S8",
    "BC1", "BC2", "BC3", "BC4", "BC5", "BC6H", "BC7",
    "SamplerFeedbackMinMip", "SamplerFeedbackMipRegionUsed",
}};

constexpr std::array<const char*, FORMAT_DATA_TYPE_COUNT> DATA_TYPE_NAMES = {{
    "Typeless", "UFloat", "SFloat", "UInt", "SInt", "UNorm", "SNorm", "Srgb",
}};

constexpr std::int16_t NO_FORMAT = -1;

using InverseTable = std::array<std::array<std::int16_t, FORMAT_DATA_TYPE_COUNT>, FORMAT_COMPONENTS_COUNT>;

constexpr InverseTable build_inverse_table() {
    InverseTable table{};
    for (auto& row : table) {
        for (auto& cell : row) {
            cell = NO_FORMAT;
        }
    }
    for (const auto& entry : FORMAT_TABLE) {
        table[static_cast<std::size_t>(entry.components)][static_cast<std::size_t>(entry.data_type)] =
            static_cast<std::int16_t>(entry.format);
    }
    return table;
}

constexpr InverseTable INVERSE_TABLE = build_inverse_table();

constexpr bool inverse_table_is_bijective() {
    std::size_t count = 0;
    for (const auto& row : INVERSE_TABLE) {
        for (auto cell : row) {
            if (cell != NO_FORMAT) {
                ++count;
            }
        }
    }
    return count == FORMAT_COUNT;
}
static_assert(inverse_table_is_bijective(), "Every format needs a unique (components, data type) pair");

const FormatEntry& entry(Format format) noexcept {
    return FORMAT_TABLE[static_cast<std::size_t>(format)];
}

const FormatComponentInfo& info(Format format) noexcept {
    return COMPONENTS_TABLE[static_cast<std::size_t>(entry(format).components)];
}

} // anonymous namespace

std::pair<FormatComponents, FormatDataType> format_to_components_and_data_type(Format format) noexcept {
    const auto& e = entry(format);
    return {e.components, e.data_type};
}

std::optional<Format> format_from_components_and_data_type(FormatComponents components, FormatDataType data_type) noexcept {
    const std::size_t c = static_cast<std::size_t>(components);
    const std::size_t d = static_cast<std::size_t>(data_type);
    if (c >= FORMAT_COMPONENTS_COUNT || d >= FORMAT_DATA_TYPE_COUNT) {
        return std::nullopt;
    }
    const std::int16_t value = INVERSE_TABLE[c][d];
    if (value == NO_FORMAT) {
        return std::nullopt;
    }
    return static_cast<Format>(value);
}

FormatComponents format_components(Format format) noexcept {
    return entry(format).components;
}

FormatDataType format_data_type(Format format) noexcept {
    return entry(format).data_type;
}

const FormatComponentInfo& format_components_info(FormatComponents components) noexcept {
    return COMPONENTS_TABLE[static_cast<std::size_t>(components)];
}

FormatAspect format_aspect(Format format) noexcept {
    return info(format).aspect;
}

std::uint32_t format_bits_per_pixel(Format format) noexcept {
    return info(format).bits_per_pixel;
}

std::uint32_t format_unit_byte_size(Format format) noexcept {
    return info(format).unit_byte_size;
}

std::uint32_t format_block_byte_size(Format format) noexcept {
    return info(format).block_byte_size;
}

bool format_is_block_compressed(Format format) noexcept {
    return info(format).block_byte_size != 0;
}

bool format_has_depth(Format format) noexcept {
    return has_flag(info(format).aspect, FormatAspect::Depth);
}

bool format_has_stencil(Format format) noexcept {
    return has_flag(info(format).aspect, FormatAspect::Stencil);
}

bool format_is_depth_stencil(Format format) noexcept {
    return has_any_flag(info(format).aspect, FormatAspect::DepthStencil);
}

std::uint32_t format_num_planes(Format format) noexcept {
    return info(format).num_planes;
}

bool format_is_planar(Format format) noexcept {
    return info(format).num_planes > 1;
}

std::pair<std::uint32_t, std::uint32_t> format_min_mip_size(Format format) noexcept {
    const auto& i = info(format);
    return {i.min_mip_width, i.min_mip_height};
}

bool format_is_always_available(Format format) noexcept {
    return entry(format).always_available;
}

const char* format_name(Format format) noexcept {
    const std::size_t index = static_cast<std::size_t>(format);
    return index < FORMAT_COUNT ? FORMAT_TABLE[index].name : "Unknown";
}

const char* format_components_name(FormatComponents components) noexcept {
    const std::size_t index = static_cast<std::size_t>(components);
    return index < FORMAT_COMPONENTS_COUNT ? COMPONENTS_NAMES[index] : "Unknown";
}

const char* format_data_type_name(FormatDataType data_type) noexcept {
    const std::size_t index = static_cast<std::size_t>(data_type);
    return index < FORMAT_DATA_TYPE_COUNT ? DATA_TYPE_NAMES[index] : "Unknown";
}

} // namespace onca_ral
