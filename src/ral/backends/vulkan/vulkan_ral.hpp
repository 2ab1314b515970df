#pragma once

/// @file vulkan_ral.hpp
/// @brief Vulkan RAL backend
///
/// Requires Vulkan 1.3 with timeline semaphores, buffer device addresses, synchronization2
/// and dynamic rendering. Swap chains always recreate on a present-mode change.
///
/// Settings (`vulkan` table, all optional):
/// - `app-name`: application name reported to the driver (default "Onca App")
/// - `app-version`: application version, "major.minor.patch" (default 1.0.0)
/// - `additional-layers`: extra instance layers to enable when available

#include "vulkan_common.hpp"
#include <array>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <vector>

namespace onca_ral::vulkan {

/// Queue family used for each queue type, indexed by QueueType
using QueueFamilies = std::array<std::uint32_t, QUEUE_TYPE_COUNT>;

// =============================================================================
// Memory & Resources
// =============================================================================

class VulkanMemoryHeap : public MemoryHeapInterface {
public:
    /// Takes ownership of `memory`; `mapped` is its persistent mapping, if host visible
    VulkanMemoryHeap(VulkanDeviceContextPtr context, VkDeviceMemory memory, std::uint8_t* mapped);
    ~VulkanMemoryHeap() override;

    [[nodiscard]] VkDeviceMemory memory() const noexcept { return m_memory; }
    [[nodiscard]] std::uint8_t* mapped() const noexcept { return m_mapped; }

private:
    VulkanDeviceContextPtr m_context;
    VkDeviceMemory m_memory;
    std::uint8_t* m_mapped;
};

class VulkanBuffer : public BufferInterface {
public:
    VulkanBuffer(VulkanDeviceContextPtr context, VkBuffer buffer);
    ~VulkanBuffer() override;

    [[nodiscard]] Result<std::uint8_t*> map(const GpuAllocation& allocation, std::uint64_t offset, std::uint64_t size) override;
    void unmap(const GpuAllocation& allocation, const MappedMemory& memory) override;

    [[nodiscard]] VkBuffer buffer() const noexcept { return m_buffer; }

private:
    VulkanDeviceContextPtr m_context;
    VkBuffer m_buffer;
};

class VulkanTexture : public TextureInterface {
public:
    /// Swap-chain images are not owned and never destroyed here
    VulkanTexture(VulkanDeviceContextPtr context, VkImage image, bool owned);
    ~VulkanTexture() override;

    [[nodiscard]] VkImage image() const noexcept { return m_image; }

private:
    VulkanDeviceContextPtr m_context;
    VkImage m_image;
    bool m_owned;
};

class VulkanRenderTargetView : public RenderTargetViewInterface {
public:
    VulkanRenderTargetView(VulkanDeviceContextPtr context, VkImageView view);
    ~VulkanRenderTargetView() override;

    [[nodiscard]] VkImageView view() const noexcept { return m_view; }

private:
    VulkanDeviceContextPtr m_context;
    VkImageView m_view;
};

// =============================================================================
// Queues & Synchronization
// =============================================================================

class VulkanCommandQueue : public CommandQueueInterface {
public:
    /// `mutex` is shared by every slot aliasing the same native queue
    VulkanCommandQueue(VulkanDeviceContextPtr context, VkQueue queue, std::uint32_t family,
        std::shared_ptr<std::mutex> mutex);

    [[nodiscard]] Result<void> flush() override;

    /// Record a one-shot command buffer, submit it and wait for completion
    [[nodiscard]] Result<void> submit_and_wait(const std::function<void(VkCommandBuffer)>& record);

    /// Present under the queue lock
    [[nodiscard]] VkResult present(const VkPresentInfoKHR& present_info);

    [[nodiscard]] VkQueue queue() const noexcept { return m_queue; }
    [[nodiscard]] std::uint32_t family() const noexcept { return m_family; }

private:
    VulkanDeviceContextPtr m_context;
    VkQueue m_queue;
    std::uint32_t m_family;
    std::shared_ptr<std::mutex> m_mutex;
};

class VulkanCommandPool : public CommandPoolInterface {
public:
    VulkanCommandPool(VulkanDeviceContextPtr context, VkCommandPool pool);
    ~VulkanCommandPool() override;

    [[nodiscard]] Result<void> reset() override;

private:
    VulkanDeviceContextPtr m_context;
    VkCommandPool m_pool;
};

/// Timeline semaphore
class VulkanFence : public FenceInterface {
public:
    VulkanFence(VulkanDeviceContextPtr context, VkSemaphore semaphore);
    ~VulkanFence() override;

    [[nodiscard]] Result<std::uint64_t> get_value() const override;
    [[nodiscard]] Result<void> signal(std::uint64_t value) override;
    [[nodiscard]] Result<bool> wait(std::uint64_t value, std::chrono::nanoseconds timeout) override;
    [[nodiscard]] Result<bool> wait_multiple(std::span<const FenceWait> fences, bool wait_for_all,
        std::chrono::nanoseconds timeout) override;

    [[nodiscard]] VkSemaphore semaphore() const noexcept { return m_semaphore; }

private:
    VulkanDeviceContextPtr m_context;
    VkSemaphore m_semaphore;
};

// =============================================================================
// SwapChain
// =============================================================================

class VulkanSwapChain : public SwapChainInterface {
public:
    VulkanSwapChain(VulkanDeviceContextPtr context, VkSurfaceKHR surface, VkFence acquire_fence);
    ~VulkanSwapChain() override;

    /// Create the surface and first native swap chain for a window
    [[nodiscard]] static Result<SwapChainResultInfo> create(VulkanDeviceContextPtr context, const PhysicalDevice& phys_dev,
        const SwapChainDesc& desc);

    [[nodiscard]] Result<void> present(PresentMode present_mode, std::uint8_t backbuffer_index,
        const CommandQueue& queue, const PresentInfo& present_info) override;
    [[nodiscard]] Result<std::uint8_t> acquire_next_backbuffer() override;
    [[nodiscard]] bool needs_present_mode_recreate() const override { return true; }
    [[nodiscard]] Result<SwapChainRecreateResultInfo> recreate_swapchain(const PhysicalDevice& phys_dev,
        const SwapChainChangeParams& params) override;
    [[nodiscard]] Result<SwapChainResizeResultInfo> resize(const PhysicalDevice& phys_dev,
        const SwapChainChangeParams& params) override;

private:
    /// Parameters resolved against the surface capabilities
    struct BuildParams {
        VkExtent2D extent{};
        std::uint32_t num_images = 0;
        Format format = Format::B8G8R8A8UNorm;
        VkImageUsageFlags usage = 0;
        PresentMode present_mode = PresentMode::Fifo;
        VkCompositeAlphaFlagBitsKHR alpha = VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
    };

    [[nodiscard]] Result<BuildParams> resolve(std::uint16_t width, std::uint16_t height, std::uint8_t num_backbuffers,
        std::span<const Format> formats, TextureUsage usages, PresentMode present_mode, SwapChainAlphaMode alpha_mode,
        std::uint32_t queue_family) const;

    /// Create a native swap chain replacing the current one, returns its backbuffers
    [[nodiscard]] Result<std::vector<BackbufferInterfaces>> build(const BuildParams& params, VulkanCommandQueue& queue);

    VulkanDeviceContextPtr m_context;
    VkSurfaceKHR m_surface;
    VkSwapchainKHR m_swap_chain = VK_NULL_HANDLE;
    /// Previous swap chain, kept until the backbuffers referencing its images are gone
    VkSwapchainKHR m_retired = VK_NULL_HANDLE;
    std::vector<VkImage> m_images;
    VkFence m_acquire_fence;
    std::mutex m_mutex;
};

// =============================================================================
// Device & RAL
// =============================================================================

class VulkanPhysicalDevice : public PhysicalDeviceInterface {
public:
    VulkanPhysicalDevice(VulkanInstancePtr instance, VkPhysicalDevice phys_dev, QueueFamilies families,
        bool memory_budget, std::uint32_t heap_count);

    /// Requires VK_EXT_memory_budget
    [[nodiscard]] Result<MemoryBudgetInfo> get_memory_budget_info() const override;
    [[nodiscard]] Result<void> reserve_memory(std::uint8_t heap_index, std::uint64_t bytes) override;

    [[nodiscard]] VkPhysicalDevice native() const noexcept { return m_phys_dev; }
    [[nodiscard]] const QueueFamilies& queue_families() const noexcept { return m_families; }

private:
    VulkanInstancePtr m_instance;
    VkPhysicalDevice m_phys_dev;
    QueueFamilies m_families;
    bool m_memory_budget;
    std::uint32_t m_heap_count;
};

class VulkanDevice : public DeviceInterface {
public:
    VulkanDevice(VulkanDeviceContextPtr context, QueueFamilies families);

    [[nodiscard]] Result<SwapChainResultInfo> create_swap_chain(const PhysicalDevice& phys_dev, const SwapChainDesc& desc) override;
    [[nodiscard]] Result<std::unique_ptr<CommandPoolInterface>> create_command_pool(CommandListType list_type, CommandPoolFlags flags) override;
    [[nodiscard]] Result<std::unique_ptr<FenceInterface>> create_fence() override;
    [[nodiscard]] Result<BufferCreateResult> create_buffer(const BufferDesc& desc, GpuAllocator& allocator) override;
    [[nodiscard]] Result<TextureCreateResult> create_texture(const TextureDesc& desc, GpuAllocator& allocator) override;
    [[nodiscard]] Result<void> flush(const QueueMatrix& queues) override;
    [[nodiscard]] Result<std::unique_ptr<MemoryHeapInterface>> allocate_heap(std::uint64_t size, std::uint64_t alignment,
        MemoryType memory_type, const MemoryInfo& mem_info) override;

private:
    VulkanDeviceContextPtr m_context;
    QueueFamilies m_families;
};

class VulkanRal : public RalInterface {
public:
    VulkanRal(Settings settings, VulkanInstancePtr instance);
    ~VulkanRal() override;

    /// Create the Vulkan instance from the host's create info
    [[nodiscard]] static Result<std::unique_ptr<VulkanRal>> create(const RalCreateInfo& create_info);

    [[nodiscard]] const Settings& settings() const override { return m_settings; }
    [[nodiscard]] Result<std::vector<PhysicalDevice>> get_physical_devices() override;
    [[nodiscard]] Result<DeviceCreateResult> create_device(const PhysicalDevice& phys_dev) override;

private:
    Settings m_settings;
    VulkanInstancePtr m_instance;
};

} // namespace onca_ral::vulkan
