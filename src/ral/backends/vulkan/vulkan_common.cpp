/// @file vulkan_common.cpp
/// @brief Vulkan type conversion and error translation

#include "vulkan_common.hpp"
#include <iterator>

namespace onca_ral::vulkan {

VulkanInstance::~VulkanInstance() {
    if (messenger != VK_NULL_HANDLE && destroy_messenger) {
        destroy_messenger(instance, messenger, nullptr);
    }
    if (instance != VK_NULL_HANDLE) {
        vkDestroyInstance(instance, nullptr);
    }
}

VulkanDeviceContext::~VulkanDeviceContext() {
    if (device != VK_NULL_HANDLE) {
        vkDestroyDevice(device, nullptr);
    }
}

// =============================================================================
// Errors
// =============================================================================

const char* vk_result_name(VkResult result) {
    switch (result) {
        case VK_SUCCESS: return "VK_SUCCESS";
        case VK_NOT_READY: return "VK_NOT_READY";
        case VK_TIMEOUT: return "VK_TIMEOUT";
        case VK_INCOMPLETE: return "VK_INCOMPLETE";
        case VK_SUBOPTIMAL_KHR: return "VK_SUBOPTIMAL_KHR";
        case VK_ERROR_OUT_OF_HOST_MEMORY: return "VK_ERROR_OUT_OF_HOST_MEMORY";
        case VK_ERROR_OUT_OF_DEVICE_MEMORY: return "VK_ERROR_OUT_OF_DEVICE_MEMORY";
        case VK_ERROR_INITIALIZATION_FAILED: return "VK_ERROR_INITIALIZATION_FAILED";
        case VK_ERROR_DEVICE_LOST: return "VK_ERROR_DEVICE_LOST";
        case VK_ERROR_MEMORY_MAP_FAILED: return "VK_ERROR_MEMORY_MAP_FAILED";
        case VK_ERROR_LAYER_NOT_PRESENT: return "VK_ERROR_LAYER_NOT_PRESENT";
        case VK_ERROR_EXTENSION_NOT_PRESENT: return "VK_ERROR_EXTENSION_NOT_PRESENT";
        case VK_ERROR_FEATURE_NOT_PRESENT: return "VK_ERROR_FEATURE_NOT_PRESENT";
        case VK_ERROR_INCOMPATIBLE_DRIVER: return "VK_ERROR_INCOMPATIBLE_DRIVER";
        case VK_ERROR_TOO_MANY_OBJECTS: return "VK_ERROR_TOO_MANY_OBJECTS";
        case VK_ERROR_FORMAT_NOT_SUPPORTED: return "VK_ERROR_FORMAT_NOT_SUPPORTED";
        case VK_ERROR_SURFACE_LOST_KHR: return "VK_ERROR_SURFACE_LOST_KHR";
        case VK_ERROR_NATIVE_WINDOW_IN_USE_KHR: return "VK_ERROR_NATIVE_WINDOW_IN_USE_KHR";
        case VK_ERROR_OUT_OF_DATE_KHR: return "VK_ERROR_OUT_OF_DATE_KHR";
        default: return "VK_ERROR_UNKNOWN";
    }
}

Error vk_error(VkResult result, const std::string& what) {
    switch (result) {
        case VK_TIMEOUT:
            return Error(RalError::timeout());
        case VK_ERROR_OUT_OF_HOST_MEMORY:
            return Error(RalError::out_of_host_memory());
        case VK_ERROR_OUT_OF_DEVICE_MEMORY:
            return Error(RalError::out_of_device_memory());
        case VK_ERROR_DEVICE_LOST:
            return Error(RalError::device_lost());
        case VK_ERROR_LAYER_NOT_PRESENT:
        case VK_ERROR_EXTENSION_NOT_PRESENT:
        case VK_ERROR_FEATURE_NOT_PRESENT:
            return Error(RalError::missing_feature(what + " (" + vk_result_name(result) + ")"));
        default:
            return Error(RalError::other(what + " failed with " + vk_result_name(result)));
    }
}

// =============================================================================
// Conversion
// =============================================================================

std::uint32_t to_vk_version(const Version& version) {
    return VK_MAKE_API_VERSION(0, version.major, version.minor, version.patch);
}

Version from_vk_version(std::uint32_t version) {
    return Version(static_cast<std::uint16_t>(VK_API_VERSION_MAJOR(version)),
        static_cast<std::uint16_t>(VK_API_VERSION_MINOR(version)),
        static_cast<std::uint16_t>(VK_API_VERSION_PATCH(version)));
}

namespace {

// R10G10B10A2 lists components lowest bit first, Vulkan highest first (A2B10G10R10)
constexpr VkFormat VULKAN_FORMATS[] = {
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_R32G32B32A32_SFLOAT,
    VK_FORMAT_R32G32B32A32_UINT,
    VK_FORMAT_R32G32B32A32_SINT,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_R32G32_SFLOAT,
    VK_FORMAT_R32G32_UINT,
    VK_FORMAT_R32G32_SINT,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_R32_SFLOAT,
    VK_FORMAT_R32_UINT,
    VK_FORMAT_R32_SINT,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_R16G16B16A16_SFLOAT,
    VK_FORMAT_R16G16B16A16_UINT,
    VK_FORMAT_R16G16B16A16_SINT,
    VK_FORMAT_R16G16B16A16_UNORM,
    VK_FORMAT_R16G16B16A16_SNORM,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_R16G16_SFLOAT,
    VK_FORMAT_R16G16_UINT,
    VK_FORMAT_R16G16_SINT,
    VK_FORMAT_R16G16_UNORM,
    VK_FORMAT_R16G16_SNORM,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_R16_SFLOAT,
    VK_FORMAT_R16_UINT,
    VK_FORMAT_R16_SINT,
    VK_FORMAT_R16_UNORM,
    VK_FORMAT_R16_SNORM,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_R8G8B8A8_UINT,
    VK_FORMAT_R8G8B8A8_SINT,
    VK_FORMAT_R8G8B8A8_UNORM,
    VK_FORMAT_R8G8B8A8_SNORM,
    VK_FORMAT_R8G8B8A8_SRGB,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_R8G8_UINT,
    VK_FORMAT_R8G8_SINT,
    VK_FORMAT_R8G8_UNORM,
    VK_FORMAT_R8G8_SNORM,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_R8_UINT,
    VK_FORMAT_R8_SINT,
    VK_FORMAT_R8_UNORM,
    VK_FORMAT_R8_SNORM,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_B8G8R8A8_UNORM,
    VK_FORMAT_B8G8R8A8_SRGB,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_A2B10G10R10_UINT_PACK32,
    VK_FORMAT_A2B10G10R10_UNORM_PACK32,
    VK_FORMAT_B10G11R11_UFLOAT_PACK32,
    VK_FORMAT_E5B9G9R9_UFLOAT_PACK32,
    VK_FORMAT_D32_SFLOAT,
    VK_FORMAT_D32_SFLOAT_S8_UINT,
    VK_FORMAT_S8_UINT,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_BC1_RGBA_UNORM_BLOCK,
    VK_FORMAT_BC1_RGBA_SRGB_BLOCK,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_BC2_UNORM_BLOCK,
    VK_FORMAT_BC2_SRGB_BLOCK,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_BC3_UNORM_BLOCK,
    VK_FORMAT_BC3_SRGB_BLOCK,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_BC4_UNORM_BLOCK,
    VK_FORMAT_BC4_SNORM_BLOCK,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_BC5_UNORM_BLOCK,
    VK_FORMAT_BC5_SNORM_BLOCK,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_BC6H_SFLOAT_BLOCK,
    VK_FORMAT_BC6H_UFLOAT_BLOCK,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_BC7_UNORM_BLOCK,
    VK_FORMAT_BC7_SRGB_BLOCK,
    VK_FORMAT_UNDEFINED,
    VK_FORMAT_UNDEFINED,
};
static_assert(std::size(VULKAN_FORMATS) == FORMAT_COUNT, "Vulkan format table out of sync with Format");

constexpr VkFormat VULKAN_VERTEX_FORMATS[] = {
    VK_FORMAT_R32G32B32A32_SFLOAT,
    VK_FORMAT_R32G32B32A32_SINT,
    VK_FORMAT_R32G32B32A32_UINT,
    VK_FORMAT_R32G32B32_SFLOAT,
    VK_FORMAT_R32G32B32_SINT,
    VK_FORMAT_R32G32B32_UINT,
    VK_FORMAT_R32G32_SFLOAT,
    VK_FORMAT_R32G32_SINT,
    VK_FORMAT_R32G32_UINT,
    VK_FORMAT_R32_SFLOAT,
    VK_FORMAT_R32_SINT,
    VK_FORMAT_R32_UINT,
    VK_FORMAT_R16G16B16A16_SFLOAT,
    VK_FORMAT_R16G16B16A16_SINT,
    VK_FORMAT_R16G16B16A16_UINT,
    VK_FORMAT_R16G16B16A16_SNORM,
    VK_FORMAT_R16G16B16A16_UNORM,
    VK_FORMAT_R16G16_SFLOAT,
    VK_FORMAT_R16G16_SINT,
    VK_FORMAT_R16G16_UINT,
    VK_FORMAT_R16G16_SNORM,
    VK_FORMAT_R16G16_UNORM,
    VK_FORMAT_R16_SFLOAT,
    VK_FORMAT_R16_SINT,
    VK_FORMAT_R16_UINT,
    VK_FORMAT_R16_SNORM,
    VK_FORMAT_R16_UNORM,
    VK_FORMAT_R8G8B8A8_SINT,
    VK_FORMAT_R8G8B8A8_UINT,
    VK_FORMAT_R8G8B8A8_SNORM,
    VK_FORMAT_R8G8B8A8_UNORM,
    VK_FORMAT_R8G8_SINT,
    VK_FORMAT_R8G8_UINT,
    VK_FORMAT_R8G8_SNORM,
    VK_FORMAT_R8G8_UNORM,
    VK_FORMAT_R8_SINT,
    VK_FORMAT_R8_UINT,
    VK_FORMAT_R8_SNORM,
    VK_FORMAT_R8_UNORM,
    VK_FORMAT_A2B10G10R10_UINT_PACK32,
    VK_FORMAT_A2B10G10R10_UNORM_PACK32,
    VK_FORMAT_B10G11R11_UFLOAT_PACK32,
};
static_assert(std::size(VULKAN_VERTEX_FORMATS) == VERTEX_FORMAT_COUNT, "Vulkan vertex format table out of sync with VertexFormat");

} // anonymous namespace

VkFormat to_vk_format(Format format) {
    return VULKAN_FORMATS[static_cast<std::size_t>(format)];
}

VkFormat to_vk_vertex_format(VertexFormat format) {
    return VULKAN_VERTEX_FORMATS[static_cast<std::size_t>(format)];
}

VkBufferUsageFlags to_vk_buffer_usage(BufferUsage usages) {
    VkBufferUsageFlags flags = 0;
    if (has_flag(usages, BufferUsage::CopySrc)) flags |= VK_BUFFER_USAGE_TRANSFER_SRC_BIT;
    if (has_flag(usages, BufferUsage::CopyDst)) flags |= VK_BUFFER_USAGE_TRANSFER_DST_BIT;
    if (has_flag(usages, BufferUsage::ConstantTexelBuffer)) flags |= VK_BUFFER_USAGE_UNIFORM_TEXEL_BUFFER_BIT;
    if (has_flag(usages, BufferUsage::StorageTexelBuffer)) flags |= VK_BUFFER_USAGE_STORAGE_TEXEL_BUFFER_BIT;
    if (has_flag(usages, BufferUsage::ConstantBuffer)) flags |= VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
    if (has_flag(usages, BufferUsage::StorageBuffer)) flags |= VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
    if (has_flag(usages, BufferUsage::IndexBuffer)) flags |= VK_BUFFER_USAGE_INDEX_BUFFER_BIT;
    if (has_flag(usages, BufferUsage::VertexBuffer)) flags |= VK_BUFFER_USAGE_VERTEX_BUFFER_BIT;
    if (has_flag(usages, BufferUsage::IndirectBuffer)) flags |= VK_BUFFER_USAGE_INDIRECT_BUFFER_BIT;
    if (has_flag(usages, BufferUsage::ConditionalRendering)) flags |= VK_BUFFER_USAGE_CONDITIONAL_RENDERING_BIT_EXT;
    return flags;
}

VkImageUsageFlags to_vk_image_usage(TextureUsage usages) {
    VkImageUsageFlags flags = 0;
    if (has_flag(usages, TextureUsage::CopySrc)) flags |= VK_IMAGE_USAGE_TRANSFER_SRC_BIT;
    if (has_flag(usages, TextureUsage::CopyDst)) flags |= VK_IMAGE_USAGE_TRANSFER_DST_BIT;
    if (has_flag(usages, TextureUsage::Sampled)) flags |= VK_IMAGE_USAGE_SAMPLED_BIT;
    if (has_flag(usages, TextureUsage::Storage)) flags |= VK_IMAGE_USAGE_STORAGE_BIT;
    if (has_flag(usages, TextureUsage::ColorAttachment)) flags |= VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    if (has_flag(usages, TextureUsage::DepthStencilAttachment)) flags |= VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT;
    return flags;
}

TextureUsage from_vk_image_usage(VkImageUsageFlags flags) {
    TextureUsage usages = TextureUsage::None;
    if (flags & VK_IMAGE_USAGE_TRANSFER_SRC_BIT) usages |= TextureUsage::CopySrc;
    if (flags & VK_IMAGE_USAGE_TRANSFER_DST_BIT) usages |= TextureUsage::CopyDst;
    if (flags & VK_IMAGE_USAGE_SAMPLED_BIT) usages |= TextureUsage::Sampled;
    if (flags & VK_IMAGE_USAGE_STORAGE_BIT) usages |= TextureUsage::Storage;
    if (flags & VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT) usages |= TextureUsage::ColorAttachment;
    if (flags & VK_IMAGE_USAGE_DEPTH_STENCIL_ATTACHMENT_BIT) usages |= TextureUsage::DepthStencilAttachment;
    return usages;
}

VkPresentModeKHR to_vk_present_mode(PresentMode mode) {
    switch (mode) {
        case PresentMode::Immediate: return VK_PRESENT_MODE_IMMEDIATE_KHR;
        case PresentMode::Mailbox: return VK_PRESENT_MODE_MAILBOX_KHR;
        case PresentMode::Fifo: return VK_PRESENT_MODE_FIFO_KHR;
    }
    return VK_PRESENT_MODE_FIFO_KHR;
}

VkCompositeAlphaFlagBitsKHR to_vk_alpha_mode(SwapChainAlphaMode mode) {
    switch (mode) {
        case SwapChainAlphaMode::Ignore: return VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
        case SwapChainAlphaMode::Premultiplied: return VK_COMPOSITE_ALPHA_PRE_MULTIPLIED_BIT_KHR;
        case SwapChainAlphaMode::PostMultiplied: return VK_COMPOSITE_ALPHA_POST_MULTIPLIED_BIT_KHR;
        case SwapChainAlphaMode::Unspecified: return VK_COMPOSITE_ALPHA_INHERIT_BIT_KHR;
    }
    return VK_COMPOSITE_ALPHA_OPAQUE_BIT_KHR;
}

VkImageAspectFlags to_vk_aspect(Format format) {
    VkImageAspectFlags aspect = 0;
    if (format_has_depth(format)) aspect |= VK_IMAGE_ASPECT_DEPTH_BIT;
    if (format_has_stencil(format)) aspect |= VK_IMAGE_ASPECT_STENCIL_BIT;
    return aspect != 0 ? aspect : VK_IMAGE_ASPECT_COLOR_BIT;
}

std::optional<std::uint32_t> find_memory_type_index(const MemoryInfo& mem_info, MemoryType memory_type) {
    auto find = [&](MemoryTypeFlags required, MemoryTypeFlags excluded) -> std::optional<std::uint32_t> {
        for (std::uint32_t i = 0; i < MAX_MEMORY_TYPES; ++i) {
            const MemoryTypeFlags flags = mem_info.types[i].flags;
            if (has_flag(flags, required) && !has_any_flag(flags, excluded)) {
                return i;
            }
        }
        return std::nullopt;
    };

    const MemoryTypeFlags host = MemoryTypeFlags::HostVisible | MemoryTypeFlags::HostCoherent;
    switch (memory_type) {
        case MemoryType::Gpu:
            return find(MemoryTypeFlags::DeviceLocal, MemoryTypeFlags::None);
        case MemoryType::Upload:
            if (auto index = find(host, MemoryTypeFlags::HostCached)) {
                return index;
            }
            return find(host, MemoryTypeFlags::None);
        case MemoryType::Readback:
            if (auto index = find(host | MemoryTypeFlags::HostCached, MemoryTypeFlags::None)) {
                return index;
            }
            return find(host, MemoryTypeFlags::None);
    }
    return std::nullopt;
}

MemoryTypeMask memory_type_mask(const MemoryInfo& mem_info, std::uint32_t type_bits) {
    MemoryTypeMask mask = MemoryTypeMask::None;
    for (std::size_t i = 0; i < MEMORY_TYPE_COUNT; ++i) {
        const auto memory_type = static_cast<MemoryType>(i);
        const auto index = find_memory_type_index(mem_info, memory_type);
        if (index && (type_bits & (1u << *index)) != 0) {
            mask |= to_mask(memory_type);
        }
    }
    return mask;
}

} // namespace onca_ral::vulkan
