#pragma once

/// @file api.hpp
/// @brief Contract between onca_ral and its backends
///
/// A backend is a dynamic module named `onca_ral_<name>` exporting:
/// @code
/// extern "C" onca_ral::RalInterface* create_ral(const onca_ral::RalCreateInfo&, onca_core::Error&);
/// extern "C" void destroy_ral(onca_ral::RalInterface*);
/// @endcode
/// `create_ral` returns nullptr and fills the error on failure.

#include "fwd.hpp"
#include "common.hpp"
#include "settings.hpp"
#include "physical_device.hpp"
#include "memory.hpp"
#include "command_queue.hpp"
#include "fence.hpp"
#include "buffer.hpp"
#include "texture.hpp"
#include "swap_chain.hpp"
#include "device.hpp"
#include <array>
#include <memory>
#include <memory_resource>
#include <vector>

namespace onca_ral {

// =============================================================================
// Device Interface
// =============================================================================

/// Result of native buffer creation
struct BufferCreateResult {
    std::unique_ptr<BufferInterface> handle;
    GpuAllocation allocation;
    GpuAddress address;
};

struct TextureCreateResult {
    std::unique_ptr<TextureInterface> handle;
    GpuAllocation allocation;
};

/// Backend side of a device
class DeviceInterface {
public:
    virtual ~DeviceInterface() = default;

    [[nodiscard]] virtual Result<SwapChainResultInfo> create_swap_chain(const PhysicalDevice& phys_dev, const SwapChainDesc& desc) = 0;
    [[nodiscard]] virtual Result<std::unique_ptr<CommandPoolInterface>> create_command_pool(CommandListType list_type, CommandPoolFlags flags) = 0;
    [[nodiscard]] virtual Result<std::unique_ptr<FenceInterface>> create_fence() = 0;

    /// Create a native buffer, allocating its memory through `allocator`
    [[nodiscard]] virtual Result<BufferCreateResult> create_buffer(const BufferDesc& desc, GpuAllocator& allocator) = 0;
    [[nodiscard]] virtual Result<TextureCreateResult> create_texture(const TextureDesc& desc, GpuAllocator& allocator) = 0;

    /// Wait until every queue is idle
    [[nodiscard]] virtual Result<void> flush(const QueueMatrix& queues) = 0;

    [[nodiscard]] virtual Result<std::unique_ptr<MemoryHeapInterface>> allocate_heap(std::uint64_t size, std::uint64_t alignment,
        MemoryType memory_type, const MemoryInfo& mem_info) = 0;
};

// =============================================================================
// RAL Interface
// =============================================================================

/// Native queue produced for one (type, priority) slot
struct QueueCreateResult {
    std::unique_ptr<CommandQueueInterface> handle;
    QueueIndex index;
};

/// Result of native device creation; queues are indexed by [QueueType][High, Normal]
struct DeviceCreateResult {
    std::unique_ptr<DeviceInterface> handle;
    std::array<std::array<QueueCreateResult, BACKEND_QUEUE_PRIORITY_COUNT>, QUEUE_TYPE_COUNT> queues;
    DeviceExtensions extensions = DeviceExtensions::None;
};

/// Entry object of a backend
class RalInterface {
public:
    virtual ~RalInterface() = default;

    [[nodiscard]] virtual const Settings& settings() const = 0;

    /// Enumerate adapters, in a stable order
    [[nodiscard]] virtual Result<std::vector<PhysicalDevice>> get_physical_devices() = 0;

    [[nodiscard]] virtual Result<DeviceCreateResult> create_device(const PhysicalDevice& phys_dev) = 0;
};

// =============================================================================
// Module ABI
// =============================================================================

/// Identifies the host allocator a backend tags its allocations with
using AllocatorId = std::uint16_t;

/// Use whatever allocator the host considers default
constexpr AllocatorId DEFAULT_ALLOCATOR_ID = 0xFFFF;

/// Everything a backend receives on creation
struct RalCreateInfo {
    /// Memory resource for the backend's own bookkeeping
    std::pmr::memory_resource* memory = std::pmr::get_default_resource();
    AllocatorId allocator_id = DEFAULT_ALLOCATOR_ID;
    /// Host logger; backends log through a clone sharing its sinks
    std::shared_ptr<spdlog::logger> logger;
    Settings settings;
};

using CreateRalFn = RalInterface* (*)(const RalCreateInfo& create_info, onca_core::Error& error);
using DestroyRalFn = void (*)(RalInterface* ral);

constexpr const char* CREATE_RAL_SYMBOL = "create_ral";
constexpr const char* DESTROY_RAL_SYMBOL = "destroy_ral";

} // namespace onca_ral
