#pragma once

/// @file physical_device.hpp
/// @brief Adapter descriptions reported by a RAL backend

#include "fwd.hpp"
#include "common.hpp"
#include "format.hpp"
#include "vertex_format.hpp"
#include <array>
#include <memory>
#include <string>

namespace onca_ral {

// =============================================================================
// Properties
// =============================================================================

enum class PhysicalDeviceType : std::uint8_t {
    Discrete,
    Integrated,
    Virtual,
    Software,
};

[[nodiscard]] const char* physical_device_type_name(PhysicalDeviceType type);

/// Optional capabilities of a physical device
enum class Capabilities : std::uint32_t {
    None = 0,
    RasterizerOrderViews = 1 << 0,
    BackgroundShaderRecompilation = 1 << 1,
    MinSampleShading = 1 << 2,
};
ONCA_RAL_FLAGS(Capabilities)

/// General adapter properties
struct Properties {
    std::string description;
    Version api_version;
    Version driver_version;
    std::uint32_t vendor_id = 0;
    std::uint32_t product_id = 0;
    PhysicalDeviceType dev_type = PhysicalDeviceType::Discrete;
};

// =============================================================================
// Memory
// =============================================================================

constexpr std::size_t MAX_MEMORY_TYPES = 16;
constexpr std::size_t MAX_MEMORY_HEAPS = 16;

enum class MemoryTypeFlags : std::uint8_t {
    None = 0,
    DeviceLocal = 1 << 0,
    HostVisible = 1 << 1,
    HostCoherent = 1 << 2,
    HostCached = 1 << 3,
    LazilyAllocated = 1 << 4,
    Protected = 1 << 5,
};
ONCA_RAL_FLAGS(MemoryTypeFlags)

/// Native memory type
struct MemoryTypeInfo {
    MemoryTypeFlags flags = MemoryTypeFlags::None;
    std::uint8_t heap_index = 0;

    /// Unused slots have no flags
    [[nodiscard]] bool is_valid() const noexcept { return flags != MemoryTypeFlags::None; }
};

enum class MemoryHeapFlags : std::uint8_t {
    None = 0,
    DeviceLocal = 1 << 0,
    MultiInstance = 1 << 1,
};
ONCA_RAL_FLAGS(MemoryHeapFlags)

/// Native memory heap
struct MemoryHeapInfo {
    MemoryHeapFlags flags = MemoryHeapFlags::None;
    std::uint64_t size = 0;
};

struct MemoryInfo {
    std::array<MemoryTypeInfo, MAX_MEMORY_TYPES> types{};
    std::array<MemoryHeapInfo, MAX_MEMORY_HEAPS> heaps{};
};

/// Budget of a single heap, in bytes
struct MemoryBudgetValue {
    std::uint64_t budget = 0;
    std::uint64_t in_use = 0;
    std::uint64_t available_reservation = 0;
    std::uint64_t reserved = 0;
};

struct MemoryBudgetInfo {
    std::array<MemoryBudgetValue, MAX_MEMORY_HEAPS> budgets{};
    MemoryBudgetValue total;
};

// =============================================================================
// Queues
// =============================================================================

/// Number of native queues in a family, 0 when the backend cannot tell
struct QueueCount {
    std::uint8_t value = 0;

    [[nodiscard]] static constexpr QueueCount known(std::uint8_t count) noexcept { return QueueCount{count}; }
    [[nodiscard]] static constexpr QueueCount unknown() noexcept { return QueueCount{0}; }
    [[nodiscard]] constexpr bool is_known() const noexcept { return value != 0; }
};

struct QueueInfo {
    std::uint8_t index = 0;
    QueueCount count;
};

// =============================================================================
// Vertex format support
// =============================================================================

enum class VertexFormatSupport : std::uint8_t {
    None = 0,
    Vertex = 1 << 0,
    AccelerationStructure = 1 << 1,
};
ONCA_RAL_FLAGS(VertexFormatSupport)

// =============================================================================
// PhysicalDevice
// =============================================================================

/// Backend side of a physical device
class PhysicalDeviceInterface {
public:
    virtual ~PhysicalDeviceInterface() = default;

    [[nodiscard]] virtual Result<MemoryBudgetInfo> get_memory_budget_info() const = 0;
    [[nodiscard]] virtual Result<void> reserve_memory(std::uint8_t heap_index, std::uint64_t bytes) = 0;
};

/// Immutable description of an adapter, produced by `Ral::get_physical_devices()`
struct PhysicalDevice {
    std::shared_ptr<PhysicalDeviceInterface> handle;
    Properties properties;
    MemoryInfo memory_info;
    /// RAL memory types the backend can allocate from
    MemoryTypeMask memory_types = MemoryTypeMask::All;
    Capabilities capabilities = Capabilities::None;
    std::array<FormatSupport, FORMAT_COUNT> format_support{};
    std::array<VertexFormatSupport, VERTEX_FORMAT_COUNT> vertex_format_support{};
    std::array<QueueInfo, QUEUE_TYPE_COUNT> queue_infos{};

    [[nodiscard]] FormatSupport get_format_support(Format format) const noexcept {
        return format_support[static_cast<std::size_t>(format)];
    }

    [[nodiscard]] bool supports_format(Format format, FormatSupport support) const noexcept {
        return has_flag(get_format_support(format), support);
    }

    [[nodiscard]] const QueueInfo& queue_info(QueueType type) const noexcept {
        return queue_infos[static_cast<std::size_t>(type)];
    }

    [[nodiscard]] Result<MemoryBudgetInfo> memory_budget() const;
    [[nodiscard]] Result<void> reserve_memory(std::uint8_t heap_index, std::uint64_t bytes) const;
};

} // namespace onca_ral
