#pragma once

/// @file format.hpp
/// @brief Pixel format registry for onca_ral
///
/// Every Format maps to exactly one (FormatComponents, FormatDataType) pair and back.
/// All queries are table lookups; nothing here allocates or holds state.

#include "fwd.hpp"
#include "common.hpp"
#include <cstdint>
#include <optional>
#include <utility>

namespace onca_ral {

// =============================================================================
// Components & Data Types
// =============================================================================

/// Numeric representation of a format's components
enum class FormatDataType : std::uint8_t {
    Typeless,
    UFloat,
    SFloat,
    UInt,
    SInt,
    UNorm,
    SNorm,
    Srgb,
};

constexpr std::size_t FORMAT_DATA_TYPE_COUNT = 8;

/// Check if the data type is an integer type (UInt/SInt)
[[nodiscard]] constexpr bool is_integer(FormatDataType type) noexcept {
    return type == FormatDataType::UInt || type == FormatDataType::SInt;
}

/// Check if the data type is a non-integer, typed representation
[[nodiscard]] constexpr bool is_non_integer(FormatDataType type) noexcept {
    return type != FormatDataType::Typeless && !is_integer(type);
}

/// Component layout of a format
enum class FormatComponents : std::uint8_t {
    R32G32B32A32,
    R32G32,
    R32,
    R16G16B16A16,
    R16G16,
    R16,
    R8G8B8A8,
    R8G8,
    R8,
    B8G8R8A8,
    R10G10B10A2,
    R11G11B10,
    R9G9B9E5,
    D32,
    D32S8,
    S8,
    BC1,
    BC2,
    BC3,
    BC4,
    BC5,
    BC6H,
    BC7,
    SamplerFeedbackMinMip,
    SamplerFeedbackMipRegionUsed,
};

constexpr std::size_t FORMAT_COMPONENTS_COUNT = 25;

/// Aspects contained in a format
enum class FormatAspect : std::uint8_t {
    None = 0,
    Color = 1 << 0,
    Depth = 1 << 1,
    Stencil = 1 << 2,
    DepthStencil = Depth | Stencil,
};
ONCA_RAL_FLAGS(FormatAspect)

/// Static description of a component layout
struct FormatComponentInfo {
    FormatAspect aspect;
    /// Bits per texel (per pixel for block-compressed layouts)
    std::uint16_t bits_per_pixel;
    /// Size in bytes of one texel, 0 for block-compressed and opaque layouts
    std::uint8_t unit_byte_size;
    /// Size in bytes of one 4x4 block, 0 for uncompressed layouts
    std::uint8_t block_byte_size;
    std::uint8_t num_planes;
    std::uint8_t min_mip_width;
    std::uint8_t min_mip_height;
};

// =============================================================================
// Format
// =============================================================================

/// Pixel format
enum class Format : std::uint8_t {
    R32G32B32A32Typeless,
    R32G32B32A32SFloat,
    R32G32B32A32UInt,
    R32G32B32A32SInt,

    R32G32Typeless,
    R32G32SFloat,
    R32G32UInt,
    R32G32SInt,

    R32Typeless,
    R32SFloat,
    R32UInt,
    R32SInt,

    R16G16B16A16Typeless,
    R16G16B16A16SFloat,
    R16G16B16A16UInt,
    R16G16B16A16SInt,
    R16G16B16A16UNorm,
    R16G16B16A16SNorm,

    R16G16Typeless,
    R16G16SFloat,
    R16G16UInt,
    R16G16SInt,
    R16G16UNorm,
    R16G16SNorm,

    R16Typeless,
    R16SFloat,
    R16UInt,
    R16SInt,
    R16UNorm,
    R16SNorm,

    R8G8B8A8Typeless,
    R8G8B8A8UInt,
    R8G8B8A8SInt,
    R8G8B8A8UNorm,
    R8G8B8A8SNorm,
    R8G8B8A8Srgb,

    R8G8Typeless,
    R8G8UInt,
    R8G8SInt,
    R8G8UNorm,
    R8G8SNorm,

    R8Typeless,
    R8UInt,
    R8SInt,
    R8UNorm,
    R8SNorm,

    B8G8R8A8Typeless,
    B8G8R8A8UNorm,
    B8G8R8A8Srgb,

    R10G10B10A2Typeless,
    R10G10B10A2UInt,
    R10G10B10A2UNorm,

    R11G11B10UFloat,
    R9G9B9E5UFloat,

    D32SFloat,
    D32SFloatS8UInt,
    S8UInt,

    BC1Typeless,
    BC1UNorm,
    BC1Srgb,
    BC2Typeless,
    BC2UNorm,
    BC2Srgb,
    BC3Typeless,
    BC3UNorm,
    BC3Srgb,
    BC4Typeless,
    BC4UNorm,
    BC4SNorm,
    BC5Typeless,
    BC5UNorm,
    BC5SNorm,
    BC6HTypeless,
    BC6HSFloat,
    BC6HUFloat,
    BC7Typeless,
    BC7UNorm,
    BC7Srgb,

    SamplerFeedbackMinMipOpaque,
    SamplerFeedbackMipRegionUsedOpaque,
};

constexpr std::size_t FORMAT_COUNT = 80;

/// Format support flags reported per physical device
enum class FormatSupport : std::uint16_t {
    None = 0,
    Atomics = 1 << 0,
    ConstantTexelBuffer = 1 << 1,
    StorageTexelBuffer = 1 << 2,
    Sampled = 1 << 3,
    Storage = 1 << 4,
    RenderTarget = 1 << 5,
    DepthStencil = 1 << 6,
    Display = 1 << 7,
};
ONCA_RAL_FLAGS(FormatSupport)

// =============================================================================
// Queries
// =============================================================================

/// Split a format into its components and data type
[[nodiscard]] std::pair<FormatComponents, FormatDataType> format_to_components_and_data_type(Format format) noexcept;

/// Combine components and data type into a format, if the combination exists
[[nodiscard]] std::optional<Format> format_from_components_and_data_type(FormatComponents components, FormatDataType data_type) noexcept;

[[nodiscard]] FormatComponents format_components(Format format) noexcept;
[[nodiscard]] FormatDataType format_data_type(Format format) noexcept;

/// Static info about a component layout
[[nodiscard]] const FormatComponentInfo& format_components_info(FormatComponents components) noexcept;

[[nodiscard]] FormatAspect format_aspect(Format format) noexcept;
[[nodiscard]] std::uint32_t format_bits_per_pixel(Format format) noexcept;

/// Size in bytes of one texel, 0 for block-compressed formats
[[nodiscard]] std::uint32_t format_unit_byte_size(Format format) noexcept;

/// Size in bytes of one 4x4 block, 0 for uncompressed formats
[[nodiscard]] std::uint32_t format_block_byte_size(Format format) noexcept;

[[nodiscard]] bool format_is_block_compressed(Format format) noexcept;
[[nodiscard]] bool format_has_depth(Format format) noexcept;
[[nodiscard]] bool format_has_stencil(Format format) noexcept;
[[nodiscard]] bool format_is_depth_stencil(Format format) noexcept;
[[nodiscard]] std::uint32_t format_num_planes(Format format) noexcept;
[[nodiscard]] bool format_is_planar(Format format) noexcept;

/// Smallest width/height a mip level of this format can have
[[nodiscard]] std::pair<std::uint32_t, std::uint32_t> format_min_mip_size(Format format) noexcept;

/// Check if the format is supported by every backend
[[nodiscard]] bool format_is_always_available(Format format) noexcept;

[[nodiscard]] const char* format_name(Format format) noexcept;
[[nodiscard]] const char* format_components_name(FormatComponents components) noexcept;
[[nodiscard]] const char* format_data_type_name(FormatDataType data_type) noexcept;

/// Get a format by index in [0, FORMAT_COUNT)
[[nodiscard]] constexpr Format format_from_index(std::size_t index) noexcept {
    return static_cast<Format>(index);
}

} // namespace onca_ral
