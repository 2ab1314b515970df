/// @file vulkan_device.cpp
/// @brief Vulkan resources, queues and synchronization

#include "vulkan_ral.hpp"
#include <algorithm>
#include <utility>

namespace onca_ral::vulkan {

namespace {

std::uint64_t to_vk_timeout(std::chrono::nanoseconds timeout) {
    return timeout.count() < 0 ? 0 : static_cast<std::uint64_t>(timeout.count());
}

ApiMemoryRequest to_memory_request(const MemoryInfo& mem_info, const VkMemoryRequirements2& reqs,
        const VkMemoryDedicatedRequirements& dedicated) {
    ApiMemoryRequest request;
    request.size = reqs.memoryRequirements.size;
    request.alignment = std::max<std::uint64_t>(reqs.memoryRequirements.alignment, 1);
    request.memory_types = memory_type_mask(mem_info, reqs.memoryRequirements.memoryTypeBits);
    request.prefer_dedicated = dedicated.prefersDedicatedAllocation == VK_TRUE;
    request.require_dedicated = dedicated.requiresDedicatedAllocation == VK_TRUE;
    return request;
}

VulkanMemoryHeap& heap_of(const GpuAllocation& allocation) {
    return dynamic_cast<VulkanMemoryHeap&>(allocation.heap->interface());
}

} // anonymous namespace

// =============================================================================
// Memory & Resources
// =============================================================================

VulkanMemoryHeap::VulkanMemoryHeap(VulkanDeviceContextPtr context, VkDeviceMemory memory, std::uint8_t* mapped)
    : m_context(std::move(context))
    , m_memory(memory)
    , m_mapped(mapped) {}

VulkanMemoryHeap::~VulkanMemoryHeap() {
    if (m_mapped) {
        vkUnmapMemory(m_context->device, m_memory);
    }
    vkFreeMemory(m_context->device, m_memory, nullptr);
}

VulkanBuffer::VulkanBuffer(VulkanDeviceContextPtr context, VkBuffer buffer)
    : m_context(std::move(context))
    , m_buffer(buffer) {}

VulkanBuffer::~VulkanBuffer() {
    vkDestroyBuffer(m_context->device, m_buffer, nullptr);
}

Result<std::uint8_t*> VulkanBuffer::map(const GpuAllocation& allocation, std::uint64_t offset, std::uint64_t size) {
    auto* heap = dynamic_cast<VulkanMemoryHeap*>(&allocation.heap->interface());
    if (!heap) {
        return Error(RalError::other("Buffer memory does not belong to the Vulkan RAL"));
    }
    if (!heap->mapped()) {
        return Error(RalError::invalid_parameter("Cannot map memory that is not host visible"));
    }
    if (offset > allocation.size || size > allocation.size - offset) {
        return Error(RalError::invalid_parameter("Mapped range exceeds the buffer's allocation"));
    }
    return heap->mapped() + allocation.offset + offset;
}

void VulkanBuffer::unmap(const GpuAllocation& /*allocation*/, const MappedMemory& /*memory*/) {
    // Host-visible heaps are coherent and stay mapped for their lifetime
}

VulkanTexture::VulkanTexture(VulkanDeviceContextPtr context, VkImage image, bool owned)
    : m_context(std::move(context))
    , m_image(image)
    , m_owned(owned) {}

VulkanTexture::~VulkanTexture() {
    if (m_owned) {
        vkDestroyImage(m_context->device, m_image, nullptr);
    }
}

VulkanRenderTargetView::VulkanRenderTargetView(VulkanDeviceContextPtr context, VkImageView view)
    : m_context(std::move(context))
    , m_view(view) {}

VulkanRenderTargetView::~VulkanRenderTargetView() {
    vkDestroyImageView(m_context->device, m_view, nullptr);
}

// =============================================================================
// Queues & Synchronization
// =============================================================================

VulkanCommandQueue::VulkanCommandQueue(VulkanDeviceContextPtr context, VkQueue queue, std::uint32_t family,
        std::shared_ptr<std::mutex> mutex)
    : m_context(std::move(context))
    , m_queue(queue)
    , m_family(family)
    , m_mutex(std::move(mutex)) {}

Result<void> VulkanCommandQueue::flush() {
    std::lock_guard lock(*m_mutex);
    const VkResult vk_res = vkQueueWaitIdle(m_queue);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkQueueWaitIdle");
    }
    return Ok();
}

Result<void> VulkanCommandQueue::submit_and_wait(const std::function<void(VkCommandBuffer)>& record) {
    VkDevice device = m_context->device;

    VkCommandPoolCreateInfo pool_info{};
    pool_info.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    pool_info.flags = VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
    pool_info.queueFamilyIndex = m_family;
    VkCommandPool pool = VK_NULL_HANDLE;
    VkResult vk_res = vkCreateCommandPool(device, &pool_info, nullptr, &pool);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkCreateCommandPool");
    }
    VulkanCommandPool pool_guard(m_context, pool);

    VkCommandBufferAllocateInfo alloc_info{};
    alloc_info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
    alloc_info.commandPool = pool;
    alloc_info.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
    alloc_info.commandBufferCount = 1;
    VkCommandBuffer cmd_buf = VK_NULL_HANDLE;
    vk_res = vkAllocateCommandBuffers(device, &alloc_info, &cmd_buf);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkAllocateCommandBuffers");
    }

    VkCommandBufferBeginInfo begin_info{};
    begin_info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
    begin_info.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
    vk_res = vkBeginCommandBuffer(cmd_buf, &begin_info);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkBeginCommandBuffer");
    }
    record(cmd_buf);
    vk_res = vkEndCommandBuffer(cmd_buf);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkEndCommandBuffer");
    }

    VkCommandBufferSubmitInfo cmd_info{};
    cmd_info.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_SUBMIT_INFO;
    cmd_info.commandBuffer = cmd_buf;
    VkSubmitInfo2 submit_info{};
    submit_info.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO_2;
    submit_info.commandBufferInfoCount = 1;
    submit_info.pCommandBufferInfos = &cmd_info;

    std::lock_guard lock(*m_mutex);
    vk_res = vkQueueSubmit2(m_queue, 1, &submit_info, VK_NULL_HANDLE);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkQueueSubmit2");
    }
    vk_res = vkQueueWaitIdle(m_queue);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkQueueWaitIdle");
    }
    return Ok();
}

VkResult VulkanCommandQueue::present(const VkPresentInfoKHR& present_info) {
    std::lock_guard lock(*m_mutex);
    return vkQueuePresentKHR(m_queue, &present_info);
}

VulkanCommandPool::VulkanCommandPool(VulkanDeviceContextPtr context, VkCommandPool pool)
    : m_context(std::move(context))
    , m_pool(pool) {}

VulkanCommandPool::~VulkanCommandPool() {
    vkDestroyCommandPool(m_context->device, m_pool, nullptr);
}

Result<void> VulkanCommandPool::reset() {
    const VkResult vk_res = vkResetCommandPool(m_context->device, m_pool, 0);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkResetCommandPool");
    }
    return Ok();
}

VulkanFence::VulkanFence(VulkanDeviceContextPtr context, VkSemaphore semaphore)
    : m_context(std::move(context))
    , m_semaphore(semaphore) {}

VulkanFence::~VulkanFence() {
    vkDestroySemaphore(m_context->device, m_semaphore, nullptr);
}

Result<std::uint64_t> VulkanFence::get_value() const {
    std::uint64_t value = 0;
    const VkResult vk_res = vkGetSemaphoreCounterValue(m_context->device, m_semaphore, &value);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkGetSemaphoreCounterValue");
    }
    return value;
}

Result<void> VulkanFence::signal(std::uint64_t value) {
    VkSemaphoreSignalInfo signal_info{};
    signal_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_SIGNAL_INFO;
    signal_info.semaphore = m_semaphore;
    signal_info.value = value;
    const VkResult vk_res = vkSignalSemaphore(m_context->device, &signal_info);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkSignalSemaphore");
    }
    return Ok();
}

Result<bool> VulkanFence::wait(std::uint64_t value, std::chrono::nanoseconds timeout) {
    VkSemaphoreWaitInfo wait_info{};
    wait_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_WAIT_INFO;
    wait_info.semaphoreCount = 1;
    wait_info.pSemaphores = &m_semaphore;
    wait_info.pValues = &value;

    const VkResult vk_res = vkWaitSemaphores(m_context->device, &wait_info, to_vk_timeout(timeout));
    if (vk_res == VK_TIMEOUT) {
        return false;
    }
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkWaitSemaphores");
    }
    return true;
}

Result<bool> VulkanFence::wait_multiple(std::span<const FenceWait> fences, bool wait_for_all,
        std::chrono::nanoseconds timeout) {
    std::pmr::vector<VkSemaphore> semaphores(m_context->instance->memory);
    std::pmr::vector<std::uint64_t> values(m_context->instance->memory);
    semaphores.reserve(fences.size());
    values.reserve(fences.size());
    for (const auto& [fence, value] : fences) {
        auto* vk_fence = dynamic_cast<VulkanFence*>(&fence->interface());
        if (!vk_fence) {
            return Error(RalError::invalid_parameter("Fence does not belong to the Vulkan RAL"));
        }
        semaphores.push_back(vk_fence->semaphore());
        values.push_back(value);
    }

    VkSemaphoreWaitInfo wait_info{};
    wait_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_WAIT_INFO;
    wait_info.flags = wait_for_all ? 0 : VK_SEMAPHORE_WAIT_ANY_BIT;
    wait_info.semaphoreCount = static_cast<std::uint32_t>(semaphores.size());
    wait_info.pSemaphores = semaphores.data();
    wait_info.pValues = values.data();

    const VkResult vk_res = vkWaitSemaphores(m_context->device, &wait_info, to_vk_timeout(timeout));
    if (vk_res == VK_TIMEOUT) {
        return false;
    }
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkWaitSemaphores");
    }
    return true;
}

// =============================================================================
// VulkanDevice
// =============================================================================

VulkanDevice::VulkanDevice(VulkanDeviceContextPtr context, QueueFamilies families)
    : m_context(std::move(context))
    , m_families(families) {}

Result<SwapChainResultInfo> VulkanDevice::create_swap_chain(const PhysicalDevice& phys_dev, const SwapChainDesc& desc) {
    return VulkanSwapChain::create(m_context, phys_dev, desc);
}

Result<std::unique_ptr<CommandPoolInterface>> VulkanDevice::create_command_pool(CommandListType list_type, CommandPoolFlags flags) {
    QueueType queue_type = QueueType::Graphics;
    switch (list_type) {
        case CommandListType::Graphics:
        case CommandListType::Bundle:
            queue_type = QueueType::Graphics;
            break;
        case CommandListType::Compute:
            queue_type = QueueType::Compute;
            break;
        case CommandListType::Copy:
            queue_type = QueueType::Copy;
            break;
    }

    VkCommandPoolCreateInfo pool_info{};
    pool_info.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
    pool_info.queueFamilyIndex = m_families[static_cast<std::size_t>(queue_type)];
    if (has_flag(flags, CommandPoolFlags::Transient)) {
        pool_info.flags |= VK_COMMAND_POOL_CREATE_TRANSIENT_BIT;
    }
    if (has_flag(flags, CommandPoolFlags::ResetList)) {
        pool_info.flags |= VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
    }

    VkCommandPool pool = VK_NULL_HANDLE;
    const VkResult vk_res = vkCreateCommandPool(m_context->device, &pool_info, nullptr, &pool);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkCreateCommandPool");
    }
    return std::unique_ptr<CommandPoolInterface>(std::make_unique<VulkanCommandPool>(m_context, pool));
}

Result<std::unique_ptr<FenceInterface>> VulkanDevice::create_fence() {
    VkSemaphoreTypeCreateInfo type_info{};
    type_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_TYPE_CREATE_INFO;
    type_info.semaphoreType = VK_SEMAPHORE_TYPE_TIMELINE;
    type_info.initialValue = 0;
    VkSemaphoreCreateInfo semaphore_info{};
    semaphore_info.sType = VK_STRUCTURE_TYPE_SEMAPHORE_CREATE_INFO;
    semaphore_info.pNext = &type_info;

    VkSemaphore semaphore = VK_NULL_HANDLE;
    const VkResult vk_res = vkCreateSemaphore(m_context->device, &semaphore_info, nullptr, &semaphore);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkCreateSemaphore");
    }
    return std::unique_ptr<FenceInterface>(std::make_unique<VulkanFence>(m_context, semaphore));
}

Result<BufferCreateResult> VulkanDevice::create_buffer(const BufferDesc& desc, GpuAllocator& allocator) {
    VkDevice device = m_context->device;

    VkBufferCreateInfo buffer_info{};
    buffer_info.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
    buffer_info.size = desc.size;
    buffer_info.usage = to_vk_buffer_usage(desc.usages) | VK_BUFFER_USAGE_SHADER_DEVICE_ADDRESS_BIT;
    buffer_info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

    VkBuffer native = VK_NULL_HANDLE;
    VkResult vk_res = vkCreateBuffer(device, &buffer_info, nullptr, &native);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkCreateBuffer");
    }
    auto buffer = std::make_unique<VulkanBuffer>(m_context, native);

    VkBufferMemoryRequirementsInfo2 reqs_info{};
    reqs_info.sType = VK_STRUCTURE_TYPE_BUFFER_MEMORY_REQUIREMENTS_INFO_2;
    reqs_info.buffer = native;
    VkMemoryDedicatedRequirements dedicated{};
    dedicated.sType = VK_STRUCTURE_TYPE_MEMORY_DEDICATED_REQUIREMENTS;
    VkMemoryRequirements2 reqs{};
    reqs.sType = VK_STRUCTURE_TYPE_MEMORY_REQUIREMENTS_2;
    reqs.pNext = &dedicated;
    vkGetBufferMemoryRequirements2(device, &reqs_info, &reqs);

    auto allocation = allocator.alloc(desc.alloc_desc, to_memory_request(allocator.memory_info(), reqs, dedicated));
    if (!allocation) {
        return allocation.error();
    }

    vk_res = vkBindBufferMemory(device, native, heap_of(*allocation).memory(), allocation->offset);
    if (vk_res != VK_SUCCESS) {
        buffer.reset();
        allocator.free(std::move(*allocation));
        return vk_error(vk_res, "vkBindBufferMemory");
    }

    VkBufferDeviceAddressInfo address_info{};
    address_info.sType = VK_STRUCTURE_TYPE_BUFFER_DEVICE_ADDRESS_INFO;
    address_info.buffer = native;
    const GpuAddress address(vkGetBufferDeviceAddress(device, &address_info));

    BufferCreateResult result;
    result.handle = std::move(buffer);
    result.allocation = std::move(*allocation);
    result.address = address;
    return result;
}

Result<TextureCreateResult> VulkanDevice::create_texture(const TextureDesc& desc, GpuAllocator& allocator) {
    const VkFormat format = to_vk_format(desc.format);
    if (format == VK_FORMAT_UNDEFINED) {
        return Error(RalError::invalid_parameter(std::string("Format ") + format_name(desc.format) +
            " cannot be used to create a texture"));
    }

    VkDevice device = m_context->device;
    const TextureSize& size = desc.size;

    VkImageCreateInfo image_info{};
    image_info.sType = VK_STRUCTURE_TYPE_IMAGE_CREATE_INFO;
    image_info.format = format;
    image_info.extent.width = size.width;
    image_info.extent.height = size.type == TextureType::Texture1D ? 1 : size.height;
    image_info.extent.depth = size.type == TextureType::Texture3D ? size.depth_or_layers : 1;
    image_info.mipLevels = size.mip_levels;
    image_info.arrayLayers = size.type == TextureType::Texture3D ? 1 : size.depth_or_layers;
    image_info.samples = VK_SAMPLE_COUNT_1_BIT;
    image_info.tiling = VK_IMAGE_TILING_OPTIMAL;
    image_info.usage = to_vk_image_usage(desc.usages);
    image_info.sharingMode = VK_SHARING_MODE_EXCLUSIVE;
    image_info.initialLayout = VK_IMAGE_LAYOUT_UNDEFINED;
    switch (size.type) {
        case TextureType::Texture1D: image_info.imageType = VK_IMAGE_TYPE_1D; break;
        case TextureType::Texture2D: image_info.imageType = VK_IMAGE_TYPE_2D; break;
        case TextureType::Texture3D: image_info.imageType = VK_IMAGE_TYPE_3D; break;
    }
    if (has_flag(desc.flags, TextureFlags::CubeCompatible)) {
        image_info.flags |= VK_IMAGE_CREATE_CUBE_COMPATIBLE_BIT;
    }

    VkImage native = VK_NULL_HANDLE;
    VkResult vk_res = vkCreateImage(device, &image_info, nullptr, &native);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkCreateImage");
    }
    auto texture = std::make_unique<VulkanTexture>(m_context, native, true);

    VkImageMemoryRequirementsInfo2 reqs_info{};
    reqs_info.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_REQUIREMENTS_INFO_2;
    reqs_info.image = native;
    VkMemoryDedicatedRequirements dedicated{};
    dedicated.sType = VK_STRUCTURE_TYPE_MEMORY_DEDICATED_REQUIREMENTS;
    VkMemoryRequirements2 reqs{};
    reqs.sType = VK_STRUCTURE_TYPE_MEMORY_REQUIREMENTS_2;
    reqs.pNext = &dedicated;
    vkGetImageMemoryRequirements2(device, &reqs_info, &reqs);

    auto allocation = allocator.alloc(desc.alloc_desc, to_memory_request(allocator.memory_info(), reqs, dedicated));
    if (!allocation) {
        return allocation.error();
    }

    vk_res = vkBindImageMemory(device, native, heap_of(*allocation).memory(), allocation->offset);
    if (vk_res != VK_SUCCESS) {
        texture.reset();
        allocator.free(std::move(*allocation));
        return vk_error(vk_res, "vkBindImageMemory");
    }

    TextureCreateResult result;
    result.handle = std::move(texture);
    result.allocation = std::move(*allocation);
    return result;
}

Result<void> VulkanDevice::flush(const QueueMatrix& queues) {
    for (const auto& queues_of_type : queues) {
        for (std::size_t prio = 0; prio < BACKEND_QUEUE_PRIORITY_COUNT; ++prio) {
            auto result = queues_of_type[prio]->flush();
            if (!result) {
                return result;
            }
        }
    }
    return Ok();
}

Result<std::unique_ptr<MemoryHeapInterface>> VulkanDevice::allocate_heap(std::uint64_t size, std::uint64_t /*alignment*/,
        MemoryType memory_type, const MemoryInfo& mem_info) {
    const auto type_index = find_memory_type_index(mem_info, memory_type);
    if (!type_index) {
        return Error(RalError::invalid_parameter(std::string("Device has no ") + memory_type_name(memory_type) + " memory"));
    }

    VkMemoryAllocateFlagsInfo flags_info{};
    flags_info.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_FLAGS_INFO;
    flags_info.flags = VK_MEMORY_ALLOCATE_DEVICE_ADDRESS_BIT;
    VkMemoryAllocateInfo alloc_info{};
    alloc_info.sType = VK_STRUCTURE_TYPE_MEMORY_ALLOCATE_INFO;
    alloc_info.pNext = &flags_info;
    alloc_info.allocationSize = size;
    alloc_info.memoryTypeIndex = *type_index;

    VkDeviceMemory memory = VK_NULL_HANDLE;
    VkResult vk_res = vkAllocateMemory(m_context->device, &alloc_info, nullptr, &memory);
    if (vk_res != VK_SUCCESS) {
        m_context->logger().error("Failed to allocate {} bytes of {} memory: {}", size, memory_type_name(memory_type),
            vk_result_name(vk_res));
        return vk_error(vk_res, "vkAllocateMemory");
    }

    void* mapped = nullptr;
    if (memory_type != MemoryType::Gpu) {
        vk_res = vkMapMemory(m_context->device, memory, 0, VK_WHOLE_SIZE, 0, &mapped);
        if (vk_res != VK_SUCCESS) {
            vkFreeMemory(m_context->device, memory, nullptr);
            return vk_error(vk_res, "vkMapMemory");
        }
    }
    return std::unique_ptr<MemoryHeapInterface>(
        std::make_unique<VulkanMemoryHeap>(m_context, memory, static_cast<std::uint8_t*>(mapped)));
}

} // namespace onca_ral::vulkan
