#pragma once

/// @file common.hpp
/// @brief Shared types, flags and helpers for onca_ral

#include "fwd.hpp"
#include <onca_engine/core/error.hpp>
#include <onca_engine/core/handle.hpp>
#include <onca_engine/core/version.hpp>
#include <spdlog/spdlog.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <type_traits>

/// Compile-time switch for RAL contract validation (double map, wrong-buffer unmap, out-of-range views)
#ifndef ONCA_RAL_VALIDATION
#define ONCA_RAL_VALIDATION 0
#endif

/// Return InvalidParameter from the enclosing function when a precondition fails
#define ONCA_RAL_CHECK_PARAM(cond, msg) \
    do { \
        if (!(cond)) { \
            return ::onca_core::Error(::onca_core::RalError::invalid_parameter(msg)); \
        } \
    } while (0)

/// Define bitwise operators for a flags enum
#define ONCA_RAL_FLAGS(FlagsType) \
    [[nodiscard]] constexpr FlagsType operator|(FlagsType a, FlagsType b) noexcept { \
        using U = std::underlying_type_t<FlagsType>; \
        return static_cast<FlagsType>(static_cast<U>(a) | static_cast<U>(b)); \
    } \
    [[nodiscard]] constexpr FlagsType operator&(FlagsType a, FlagsType b) noexcept { \
        using U = std::underlying_type_t<FlagsType>; \
        return static_cast<FlagsType>(static_cast<U>(a) & static_cast<U>(b)); \
    } \
    [[nodiscard]] constexpr FlagsType operator~(FlagsType a) noexcept { \
        using U = std::underlying_type_t<FlagsType>; \
        return static_cast<FlagsType>(~static_cast<U>(a)); \
    } \
    constexpr FlagsType& operator|=(FlagsType& a, FlagsType b) noexcept { \
        return a = a | b; \
    } \
    constexpr FlagsType& operator&=(FlagsType& a, FlagsType b) noexcept { \
        return a = a & b; \
    }

namespace onca_ral {

using onca_core::Error;
using onca_core::Handle;
using onca_core::RalError;
using onca_core::Result;
using onca_core::Version;
using onca_core::WeakHandle;
using onca_core::Ok;

/// Check whether every bit of `flag` is set in `flags`
template<typename FlagsType>
[[nodiscard]] constexpr bool has_flag(FlagsType flags, FlagsType flag) noexcept {
    using U = std::underlying_type_t<FlagsType>;
    return (static_cast<U>(flags) & static_cast<U>(flag)) == static_cast<U>(flag);
}

/// Check whether any bit of `mask` is set in `flags`
template<typename FlagsType>
[[nodiscard]] constexpr bool has_any_flag(FlagsType flags, FlagsType mask) noexcept {
    using U = std::underlying_type_t<FlagsType>;
    return (static_cast<U>(flags) & static_cast<U>(mask)) != 0;
}

/// Get the logger used for RAL diagnostics ("onca_ral")
std::shared_ptr<spdlog::logger> ral_logger();

// =============================================================================
// Constants
// =============================================================================

/// Default alignment of GPU allocations
constexpr std::uint64_t MIN_ALLOCATION_ALIGN = 64 * 1024;

/// Alignment of multisampled texture allocations
constexpr std::uint64_t MIN_MSAA_ALLOCATION_ALIGN = 4 * 1024 * 1024;

/// Maximum number of swap-chain backbuffers
constexpr std::uint8_t MAX_BACKBUFFERS = 8;

/// Align a value up to the given power-of-two alignment
[[nodiscard]] constexpr std::uint64_t align_up(std::uint64_t value, std::uint64_t align) noexcept {
    return (value + align - 1) & ~(align - 1);
}

[[nodiscard]] constexpr bool is_power_of_two(std::uint64_t value) noexcept {
    return value != 0 && (value & (value - 1)) == 0;
}

// =============================================================================
// Queues
// =============================================================================

/// Command queue type
enum class QueueType : std::uint8_t {
    Graphics,
    Compute,
    Copy,
};

constexpr std::size_t QUEUE_TYPE_COUNT = 3;

/// Command queue priority
enum class QueuePriority : std::uint8_t {
    High,
    Normal,
    /// Aliases the High queue on backends without a dedicated realtime band
    GlobalRealtime,
};

constexpr std::size_t QUEUE_PRIORITY_COUNT = 3;

/// Priority bands a backend has to produce per queue type (High, Normal)
constexpr std::size_t BACKEND_QUEUE_PRIORITY_COUNT = 2;

/// Native queue family index
struct QueueIndex {
    std::uint8_t value = 0;

    constexpr bool operator==(const QueueIndex&) const noexcept = default;
};

[[nodiscard]] const char* queue_type_name(QueueType type);
[[nodiscard]] const char* queue_priority_name(QueuePriority priority);

// =============================================================================
// Memory
// =============================================================================

/// Memory type a resource lives in
enum class MemoryType : std::uint8_t {
    /// Device-local memory
    Gpu,
    /// Host-visible memory written by the CPU
    Upload,
    /// Host-visible memory read by the CPU
    Readback,
};

constexpr std::size_t MEMORY_TYPE_COUNT = 3;

/// Set of memory types
enum class MemoryTypeMask : std::uint8_t {
    None = 0,
    Gpu = 1 << 0,
    Upload = 1 << 1,
    Readback = 1 << 2,
    All = Gpu | Upload | Readback,
};
ONCA_RAL_FLAGS(MemoryTypeMask)

[[nodiscard]] constexpr MemoryTypeMask to_mask(MemoryType type) noexcept {
    return static_cast<MemoryTypeMask>(1u << static_cast<std::uint8_t>(type));
}

[[nodiscard]] const char* memory_type_name(MemoryType type);

// =============================================================================
// Geometry
// =============================================================================

/// Rectangle in pixels
struct Rect {
    std::int32_t x = 0;
    std::int32_t y = 0;
    std::uint32_t width = 0;
    std::uint32_t height = 0;

    constexpr bool operator==(const Rect&) const noexcept = default;
};

} // namespace onca_ral
