#pragma once

/// @file vulkan_common.hpp
/// @brief Shared Vulkan state, type conversion and error translation

#if defined(_WIN32) && !defined(VK_USE_PLATFORM_WIN32_KHR)
    #define VK_USE_PLATFORM_WIN32_KHR
    #ifndef NOMINMAX
        #define NOMINMAX
    #endif
#endif

#include <onca_engine/ral/api.hpp>
#include <vulkan/vulkan.h>
#include <memory>
#include <memory_resource>
#include <optional>
#include <string>

namespace onca_ral::vulkan {

/// Lowest Vulkan version a device has to support
constexpr std::uint32_t MIN_VULKAN_API_VERSION = VK_API_VERSION_1_3;

// =============================================================================
// Shared state
// =============================================================================

/// Vulkan instance shared by every object of one RAL
struct VulkanInstance {
    VkInstance instance = VK_NULL_HANDLE;
    VkDebugUtilsMessengerEXT messenger = VK_NULL_HANDLE;
    PFN_vkDestroyDebugUtilsMessengerEXT destroy_messenger = nullptr;
    std::shared_ptr<spdlog::logger> logger;
    std::pmr::memory_resource* memory = std::pmr::get_default_resource();
    AllocatorId allocator_id = DEFAULT_ALLOCATOR_ID;

    bool xlib_surface = false;
    bool wayland_surface = false;
    bool win32_surface = false;

    VulkanInstance() = default;
    ~VulkanInstance();

    VulkanInstance(const VulkanInstance&) = delete;
    VulkanInstance& operator=(const VulkanInstance&) = delete;
};

using VulkanInstancePtr = std::shared_ptr<VulkanInstance>;

/// Logical device shared by every resource created from it
struct VulkanDeviceContext {
    VulkanInstancePtr instance;
    VkPhysicalDevice phys_dev = VK_NULL_HANDLE;
    VkDevice device = VK_NULL_HANDLE;
    bool incremental_present = false;

    VulkanDeviceContext() = default;
    ~VulkanDeviceContext();

    VulkanDeviceContext(const VulkanDeviceContext&) = delete;
    VulkanDeviceContext& operator=(const VulkanDeviceContext&) = delete;

    [[nodiscard]] spdlog::logger& logger() const { return *instance->logger; }
};

using VulkanDeviceContextPtr = std::shared_ptr<VulkanDeviceContext>;

// =============================================================================
// Errors
// =============================================================================

[[nodiscard]] const char* vk_result_name(VkResult result);

/// Translate a failed VkResult, `what` names the failing call
[[nodiscard]] Error vk_error(VkResult result, const std::string& what);

// =============================================================================
// Conversion
// =============================================================================

[[nodiscard]] std::uint32_t to_vk_version(const Version& version);
[[nodiscard]] Version from_vk_version(std::uint32_t version);

/// VK_FORMAT_UNDEFINED for typeless and opaque formats
[[nodiscard]] VkFormat to_vk_format(Format format);
[[nodiscard]] VkFormat to_vk_vertex_format(VertexFormat format);

[[nodiscard]] VkBufferUsageFlags to_vk_buffer_usage(BufferUsage usages);
[[nodiscard]] VkImageUsageFlags to_vk_image_usage(TextureUsage usages);
[[nodiscard]] TextureUsage from_vk_image_usage(VkImageUsageFlags usages);
[[nodiscard]] VkPresentModeKHR to_vk_present_mode(PresentMode mode);
[[nodiscard]] VkCompositeAlphaFlagBitsKHR to_vk_alpha_mode(SwapChainAlphaMode mode);
[[nodiscard]] VkImageAspectFlags to_vk_aspect(Format format);

/// First memory type suitable for `memory_type`
[[nodiscard]] std::optional<std::uint32_t> find_memory_type_index(const MemoryInfo& mem_info, MemoryType memory_type);

/// Memory types a resource with the given `memoryTypeBits` can live in
[[nodiscard]] MemoryTypeMask memory_type_mask(const MemoryInfo& mem_info, std::uint32_t type_bits);

} // namespace onca_ral::vulkan
