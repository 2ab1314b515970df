#pragma once

/// @file device.hpp
/// @brief Logical device, factory for every GPU resource

#include "fwd.hpp"
#include "common.hpp"
#include "physical_device.hpp"
#include "memory.hpp"
#include "command_queue.hpp"
#include "swap_chain.hpp"
#include "buffer.hpp"
#include "texture.hpp"
#include <array>
#include <memory>

namespace onca_ral {

/// Optional extensions the device was created with
enum class DeviceExtensions : std::uint32_t {
    None = 0,
    /// Present can take update rects
    IncrementalPresent = 1 << 0,
    /// Present modes can change without recreating the swap chain
    SwapChainMaintenance1 = 1 << 1,
    /// Present can wait on a fence
    PresentFence = 1 << 2,
};
ONCA_RAL_FLAGS(DeviceExtensions)

/// Queues of a device, indexed by [QueueType][QueuePriority]
using QueueMatrix = std::array<std::array<Handle<CommandQueue>, QUEUE_PRIORITY_COUNT>, QUEUE_TYPE_COUNT>;

/// Logical device
///
/// Created by `Ral::create_device()`. Every resource created from a device keeps a weak
/// reference to it, so the device may be dropped first; those resources then report the
/// error instead of touching the device. All queues must be flushed before the last
/// handle to the device is dropped.
class Device {
public:
    Device(std::unique_ptr<DeviceInterface> handle, PhysicalDevice phys_dev, QueueMatrix queues,
        DeviceExtensions extensions, WeakHandle<Device> self, std::unique_ptr<GpuAllocatorImpl> alloc_impl);
    ~Device();

    Device(const Device&) = delete;
    Device& operator=(const Device&) = delete;
    Device& operator=(Device&&) = delete;

    /// Create a device handle; `alloc_impl` defaults to DefaultGpuAllocator
    [[nodiscard]] static Handle<Device> create(std::unique_ptr<DeviceInterface> handle, PhysicalDevice phys_dev,
        QueueMatrix queues, DeviceExtensions extensions, std::unique_ptr<GpuAllocatorImpl> alloc_impl = nullptr);

    [[nodiscard]] const PhysicalDevice& physical_device() const noexcept { return m_phys_dev; }

    [[nodiscard]] Handle<CommandQueue> get_queue(QueueType type, QueuePriority priority) const;

    [[nodiscard]] DeviceExtensions supported_extensions() const noexcept { return m_extensions; }
    [[nodiscard]] bool has_extension(DeviceExtensions extension) const noexcept { return has_flag(m_extensions, extension); }

    // Resource creation

    [[nodiscard]] Result<Handle<SwapChain>> create_swap_chain(const SwapChainDesc& desc);
    [[nodiscard]] Result<Handle<CommandPool>> create_graphics_command_pool(CommandPoolFlags flags);
    [[nodiscard]] Result<Handle<CommandPool>> create_compute_command_pool(CommandPoolFlags flags);
    [[nodiscard]] Result<Handle<CommandPool>> create_copy_command_pool(CommandPoolFlags flags);
    /// Bundle pools submit through the graphics family
    [[nodiscard]] Result<Handle<CommandPool>> create_bundle_command_pool(CommandPoolFlags flags);
    [[nodiscard]] Result<Handle<Fence>> create_fence();
    [[nodiscard]] Result<Handle<Buffer>> create_buffer(const BufferDesc& desc);
    [[nodiscard]] Result<Handle<Texture>> create_texture(const TextureDesc& desc);

    /// Wait until every queue is idle
    [[nodiscard]] Result<void> flush();

    // Memory

    /// Allocate a heap, aligned for MSAA resources when `msaa_support` is set
    [[nodiscard]] Result<Handle<MemoryHeap>> allocate_heap(std::uint64_t size, bool msaa_support, MemoryType memory_type);

    /// Release a heap reference; the native memory goes away with its last reference
    void free_heap(Handle<MemoryHeap> heap);

    [[nodiscard]] GpuAllocator& gpu_allocator() noexcept { return m_gpu_allocator; }

    [[nodiscard]] DeviceInterface& interface() const noexcept { return *m_handle; }

private:
    [[nodiscard]] Result<Handle<CommandPool>> create_command_pool(CommandListType list_type, QueueType queue_type, CommandPoolFlags flags);

    std::unique_ptr<DeviceInterface> m_handle;
    PhysicalDevice m_phys_dev;
    QueueMatrix m_queues;
    DeviceExtensions m_extensions;
    WeakHandle<Device> m_self;
    GpuAllocator m_gpu_allocator;
};

} // namespace onca_ral
