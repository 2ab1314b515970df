/// @file device.cpp
/// @brief Logical device and resource creation

#include <onca_engine/ral/device.hpp>
#include <onca_engine/ral/api.hpp>
#include <string>

namespace onca_ral {

namespace {

/// Format capabilities a texture needs for its usages
FormatSupport required_format_support(TextureUsage usages) {
    FormatSupport support = FormatSupport::None;
    if (has_flag(usages, TextureUsage::Sampled)) {
        support |= FormatSupport::Sampled;
    }
    if (has_flag(usages, TextureUsage::Storage)) {
        support |= FormatSupport::Storage;
    }
    if (has_flag(usages, TextureUsage::ColorAttachment)) {
        support |= FormatSupport::RenderTarget;
    }
    if (has_flag(usages, TextureUsage::DepthStencilAttachment)) {
        support |= FormatSupport::DepthStencil;
    }
    return support;
}

} // anonymous namespace

Device::Device(std::unique_ptr<DeviceInterface> handle, PhysicalDevice phys_dev, QueueMatrix queues,
        DeviceExtensions extensions, WeakHandle<Device> self, std::unique_ptr<GpuAllocatorImpl> alloc_impl)
    : m_handle(std::move(handle))
    , m_phys_dev(std::move(phys_dev))
    , m_queues(std::move(queues))
    , m_extensions(extensions)
    , m_self(self)
    , m_gpu_allocator(std::move(self), m_phys_dev.memory_info, m_phys_dev.memory_types, std::move(alloc_impl)) {}

Device::~Device() {
    ral_logger()->trace("Destroying device '{}'", m_phys_dev.properties.description);
}

Handle<Device> Device::create(std::unique_ptr<DeviceInterface> handle, PhysicalDevice phys_dev, QueueMatrix queues,
        DeviceExtensions extensions, std::unique_ptr<GpuAllocatorImpl> alloc_impl) {
    return Handle<Device>::create_cyclic([&](const WeakHandle<Device>& self) {
        return Device(std::move(handle), std::move(phys_dev), std::move(queues), extensions, self, std::move(alloc_impl));
    });
}

Handle<CommandQueue> Device::get_queue(QueueType type, QueuePriority priority) const {
    return m_queues[static_cast<std::size_t>(type)][static_cast<std::size_t>(priority)];
}

// =============================================================================
// Resource creation
// =============================================================================

Result<Handle<SwapChain>> Device::create_swap_chain(const SwapChainDesc& desc) {
#if ONCA_RAL_VALIDATION
    ONCA_RAL_CHECK_PARAM(desc.width != 0 && desc.height != 0,
        "Swap chain dimensions may not be 0 (" + std::to_string(desc.width) + "x" + std::to_string(desc.height) + ")");
    ONCA_RAL_CHECK_PARAM(desc.num_backbuffers != 0 && desc.num_backbuffers <= MAX_BACKBUFFERS,
        "Swap chain backbuffer count must be in [1, " + std::to_string(MAX_BACKBUFFERS) + "], got " +
        std::to_string(desc.num_backbuffers));
    ONCA_RAL_CHECK_PARAM(!desc.formats.empty(), "Swap chain needs at least 1 format");
#endif

    SwapChainDesc actual_desc = desc;
    if (!actual_desc.queue) {
        actual_desc.queue = get_queue(QueueType::Graphics, QueuePriority::High);
    }

    auto result = m_handle->create_swap_chain(m_phys_dev, actual_desc);
    if (!result) {
        return result.error();
    }
    return Handle<SwapChain>::create(m_self, actual_desc, std::move(*result));
}

Result<Handle<CommandPool>> Device::create_graphics_command_pool(CommandPoolFlags flags) {
    return create_command_pool(CommandListType::Graphics, QueueType::Graphics, flags);
}

Result<Handle<CommandPool>> Device::create_compute_command_pool(CommandPoolFlags flags) {
    return create_command_pool(CommandListType::Compute, QueueType::Compute, flags);
}

Result<Handle<CommandPool>> Device::create_copy_command_pool(CommandPoolFlags flags) {
    return create_command_pool(CommandListType::Copy, QueueType::Copy, flags);
}

Result<Handle<CommandPool>> Device::create_bundle_command_pool(CommandPoolFlags flags) {
    return create_command_pool(CommandListType::Bundle, QueueType::Graphics, flags);
}

Result<Handle<CommandPool>> Device::create_command_pool(CommandListType list_type, QueueType queue_type, CommandPoolFlags flags) {
    auto result = m_handle->create_command_pool(list_type, flags);
    if (!result) {
        return result.error();
    }

    const QueueIndex queue_index = get_queue(queue_type, QueuePriority::High)->index();
    return Handle<CommandPool>::create(std::move(*result), list_type, flags, queue_index);
}

Result<Handle<Fence>> Device::create_fence() {
    auto result = m_handle->create_fence();
    if (!result) {
        return result.error();
    }
    return Handle<Fence>::create(std::move(*result));
}

Result<Handle<Buffer>> Device::create_buffer(const BufferDesc& desc) {
#if ONCA_RAL_VALIDATION
    ONCA_RAL_CHECK_PARAM(desc.size != 0, "Buffer size may not be 0");
#endif

    auto result = m_handle->create_buffer(desc, m_gpu_allocator);
    if (!result) {
        return result.error();
    }
    return Handle<Buffer>::create(m_self, std::move(result->handle), std::move(result->allocation), result->address, desc);
}

Result<Handle<Texture>> Device::create_texture(const TextureDesc& desc) {
#if ONCA_RAL_VALIDATION
    const TextureSize& size = desc.size;
    ONCA_RAL_CHECK_PARAM(size.width != 0 && size.height != 0 && size.depth_or_layers != 0,
        "Texture dimensions may not be 0");
    ONCA_RAL_CHECK_PARAM(size.mip_levels != 0 && size.mip_levels <= size.max_mip_levels(),
        "Texture mip count must be in [1, " + std::to_string(size.max_mip_levels()) + "], got " +
        std::to_string(size.mip_levels));

    const FormatSupport required = required_format_support(desc.usages);
    ONCA_RAL_CHECK_PARAM(m_phys_dev.supports_format(desc.format, required),
        std::string("Format ") + format_name(desc.format) + " does not support the requested texture usages");
#endif

    auto result = m_handle->create_texture(desc, m_gpu_allocator);
    if (!result) {
        return result.error();
    }
    return Handle<Texture>::create(m_self, std::move(result->handle), std::optional<GpuAllocation>(std::move(result->allocation)), desc);
}

Result<void> Device::flush() {
    return m_handle->flush(m_queues);
}

// =============================================================================
// Memory
// =============================================================================

Result<Handle<MemoryHeap>> Device::allocate_heap(std::uint64_t size, bool msaa_support, MemoryType memory_type) {
    const std::uint64_t alignment = msaa_support ? MIN_MSAA_ALLOCATION_ALIGN : MIN_ALLOCATION_ALIGN;
    const std::uint64_t aligned_size = align_up(size, alignment);

    auto result = m_handle->allocate_heap(aligned_size, alignment, memory_type, m_phys_dev.memory_info);
    if (!result) {
        return result.error();
    }

    ral_logger()->trace("Allocated {} heap of {} bytes", memory_type_name(memory_type), aligned_size);
    return Handle<MemoryHeap>::create(std::move(*result), aligned_size, memory_type, msaa_support);
}

void Device::free_heap(Handle<MemoryHeap> heap) {
    if (heap) {
        ral_logger()->trace("Releasing {} heap of {} bytes", memory_type_name(heap->memory_type()), heap->size());
    }
}

} // namespace onca_ral
