/// @file vulkan_swap_chain.cpp
/// @brief Vulkan surfaces and swap chains

#include "vulkan_ral.hpp"
#include <algorithm>
#include <utility>

namespace onca_ral::vulkan {

namespace {

Result<VkSurfaceKHR> create_surface(const VulkanInstance& instance, const WindowHandle& window) {
    VkSurfaceKHR surface = VK_NULL_HANDLE;
    VkResult vk_res = VK_ERROR_EXTENSION_NOT_PRESENT;

    switch (window.system) {
        case WindowSystem::Win32:
#ifdef VK_USE_PLATFORM_WIN32_KHR
            if (instance.win32_surface) {
                VkWin32SurfaceCreateInfoKHR info{};
                info.sType = VK_STRUCTURE_TYPE_WIN32_SURFACE_CREATE_INFO_KHR;
                info.hinstance = static_cast<HINSTANCE>(window.app_handle);
                info.hwnd = reinterpret_cast<HWND>(window.window);
                vk_res = vkCreateWin32SurfaceKHR(instance.instance, &info, nullptr, &surface);
            }
#endif
            break;
        case WindowSystem::Xlib:
#ifdef VK_USE_PLATFORM_XLIB_KHR
            if (instance.xlib_surface) {
                VkXlibSurfaceCreateInfoKHR info{};
                info.sType = VK_STRUCTURE_TYPE_XLIB_SURFACE_CREATE_INFO_KHR;
                info.dpy = static_cast<Display*>(window.app_handle);
                info.window = static_cast<Window>(window.window);
                vk_res = vkCreateXlibSurfaceKHR(instance.instance, &info, nullptr, &surface);
            }
#endif
            break;
        case WindowSystem::Wayland:
#ifdef VK_USE_PLATFORM_WAYLAND_KHR
            if (instance.wayland_surface) {
                VkWaylandSurfaceCreateInfoKHR info{};
                info.sType = VK_STRUCTURE_TYPE_WAYLAND_SURFACE_CREATE_INFO_KHR;
                info.display = static_cast<wl_display*>(window.app_handle);
                info.surface = reinterpret_cast<wl_surface*>(window.window);
                vk_res = vkCreateWaylandSurfaceKHR(instance.instance, &info, nullptr, &surface);
            }
#endif
            break;
        case WindowSystem::None:
            return Error(RalError::invalid_parameter("Swap chain needs a window"));
    }

    if (vk_res == VK_ERROR_EXTENSION_NOT_PRESENT) {
        return Error(RalError::not_implemented("Surfaces for this window system are not supported by this build"));
    }
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "Surface creation");
    }
    return surface;
}

std::vector<std::string> format_names(std::span<const Format> formats) {
    std::vector<std::string> names;
    names.reserve(formats.size());
    for (Format format : formats) {
        names.emplace_back(format_name(format));
    }
    return names;
}

} // anonymous namespace

VulkanSwapChain::VulkanSwapChain(VulkanDeviceContextPtr context, VkSurfaceKHR surface, VkFence acquire_fence)
    : m_context(std::move(context))
    , m_surface(surface)
    , m_acquire_fence(acquire_fence) {}

VulkanSwapChain::~VulkanSwapChain() {
    VkDevice device = m_context->device;
    vkDeviceWaitIdle(device);
    if (m_swap_chain != VK_NULL_HANDLE) {
        vkDestroySwapchainKHR(device, m_swap_chain, nullptr);
    }
    if (m_retired != VK_NULL_HANDLE) {
        vkDestroySwapchainKHR(device, m_retired, nullptr);
    }
    vkDestroyFence(device, m_acquire_fence, nullptr);
    vkDestroySurfaceKHR(m_context->instance->instance, m_surface, nullptr);
}

Result<SwapChainResultInfo> VulkanSwapChain::create(VulkanDeviceContextPtr context, const PhysicalDevice& /*phys_dev*/,
        const SwapChainDesc& desc) {
    auto* queue = dynamic_cast<VulkanCommandQueue*>(&desc.queue->interface());
    if (!queue) {
        return Error(RalError::invalid_parameter("Swap-chain queue does not belong to the Vulkan RAL"));
    }

    auto surface = create_surface(*context->instance, desc.window);
    if (!surface) {
        return surface.error();
    }

    VkBool32 supported = VK_FALSE;
    VkResult vk_res = vkGetPhysicalDeviceSurfaceSupportKHR(context->phys_dev, queue->family(), *surface, &supported);
    if (vk_res != VK_SUCCESS || !supported) {
        vkDestroySurfaceKHR(context->instance->instance, *surface, nullptr);
        return Error(RalError::unmet_requirement("Queue family " + std::to_string(queue->family()) +
            " cannot present to the window"));
    }

    VkFenceCreateInfo fence_info{};
    fence_info.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
    VkFence acquire_fence = VK_NULL_HANDLE;
    vk_res = vkCreateFence(context->device, &fence_info, nullptr, &acquire_fence);
    if (vk_res != VK_SUCCESS) {
        vkDestroySurfaceKHR(context->instance->instance, *surface, nullptr);
        return vk_error(vk_res, "vkCreateFence");
    }

    auto swap_chain = std::make_unique<VulkanSwapChain>(context, *surface, acquire_fence);

    auto params = swap_chain->resolve(desc.width, desc.height, desc.num_backbuffers, desc.formats, desc.usages,
        desc.present_mode, desc.alpha_mode, queue->family());
    if (!params) {
        return params.error();
    }

    auto backbuffers = swap_chain->build(*params, *queue);
    if (!backbuffers) {
        return backbuffers.error();
    }

    context->logger().info("Created Vulkan swap chain {}x{} with {} backbuffer(s), format {}, {}",
        params->extent.width, params->extent.height, params->num_images, format_name(params->format),
        present_mode_name(params->present_mode));

    SwapChainResultInfo result;
    result.handle = std::move(swap_chain);
    result.backbuffers = std::move(*backbuffers);
    result.width = static_cast<std::uint16_t>(params->extent.width);
    result.height = static_cast<std::uint16_t>(params->extent.height);
    result.num_backbuffers = static_cast<std::uint8_t>(result.backbuffers.size());
    result.format = params->format;
    result.backbuffer_usages = from_vk_image_usage(params->usage);
    result.present_mode = params->present_mode;
    return result;
}

Result<VulkanSwapChain::BuildParams> VulkanSwapChain::resolve(std::uint16_t width, std::uint16_t height,
        std::uint8_t num_backbuffers, std::span<const Format> formats, TextureUsage usages, PresentMode present_mode,
        SwapChainAlphaMode alpha_mode, std::uint32_t /*queue_family*/) const {
    VkPhysicalDevice phys_dev = m_context->phys_dev;

    VkSurfaceCapabilitiesKHR caps{};
    VkResult vk_res = vkGetPhysicalDeviceSurfaceCapabilitiesKHR(phys_dev, m_surface, &caps);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkGetPhysicalDeviceSurfaceCapabilitiesKHR");
    }

    std::uint32_t count = 0;
    vkGetPhysicalDeviceSurfaceFormatsKHR(phys_dev, m_surface, &count, nullptr);
    std::pmr::vector<VkSurfaceFormatKHR> surface_formats(count, m_context->instance->memory);
    vkGetPhysicalDeviceSurfaceFormatsKHR(phys_dev, m_surface, &count, surface_formats.data());
    surface_formats.resize(count);

    count = 0;
    vkGetPhysicalDeviceSurfacePresentModesKHR(phys_dev, m_surface, &count, nullptr);
    std::pmr::vector<VkPresentModeKHR> present_modes(count, m_context->instance->memory);
    vkGetPhysicalDeviceSurfacePresentModesKHR(phys_dev, m_surface, &count, present_modes.data());
    present_modes.resize(count);

    BuildParams params;

    auto format = std::find_if(formats.begin(), formats.end(), [&](Format candidate) {
        const VkFormat vk_format = to_vk_format(candidate);
        return vk_format != VK_FORMAT_UNDEFINED &&
            std::any_of(surface_formats.begin(), surface_formats.end(), [&](const VkSurfaceFormatKHR& surface_format) {
                return surface_format.format == vk_format && surface_format.colorSpace == VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
            });
    });
    if (format == formats.end()) {
        return Error(RalError::unsupported_swap_chain_formats(format_names(formats)));
    }
    params.format = *format;

    // Wayland leaves the extent up to the swap chain
    if (caps.currentExtent.width != UINT32_MAX) {
        params.extent = caps.currentExtent;
    } else {
        params.extent.width = std::clamp<std::uint32_t>(width, caps.minImageExtent.width, caps.maxImageExtent.width);
        params.extent.height = std::clamp<std::uint32_t>(height, caps.minImageExtent.height, caps.maxImageExtent.height);
    }
    if (params.extent.width == 0 || params.extent.height == 0) {
        return Error(RalError::invalid_parameter("Window has a zero-sized surface"));
    }

    if (caps.minImageCount > MAX_BACKBUFFERS) {
        return Error(RalError::unmet_requirement("Surface needs at least " + std::to_string(caps.minImageCount) +
            " images, more than the supported maximum of " + std::to_string(MAX_BACKBUFFERS)));
    }
    const std::uint32_t max_images = caps.maxImageCount == 0
        ? MAX_BACKBUFFERS
        : std::min<std::uint32_t>(caps.maxImageCount, MAX_BACKBUFFERS);
    params.num_images = std::clamp<std::uint32_t>(num_backbuffers, caps.minImageCount, max_images);

    params.usage = to_vk_image_usage(usages) & caps.supportedUsageFlags;
    if (params.usage == 0) {
        params.usage = VK_IMAGE_USAGE_COLOR_ATTACHMENT_BIT;
    }

    params.present_mode = present_mode;
    if (std::find(present_modes.begin(), present_modes.end(), to_vk_present_mode(present_mode)) == present_modes.end()) {
        m_context->logger().warn("Present mode {} is not supported by the surface, falling back to {}",
            present_mode_name(present_mode), present_mode_name(PresentMode::Fifo));
        params.present_mode = PresentMode::Fifo;
    }

    params.alpha = to_vk_alpha_mode(alpha_mode);
    if ((caps.supportedCompositeAlpha & params.alpha) == 0) {
        for (std::uint32_t bit = 1; bit != 0 && bit <= caps.supportedCompositeAlpha; bit <<= 1) {
            if (caps.supportedCompositeAlpha & bit) {
                params.alpha = static_cast<VkCompositeAlphaFlagBitsKHR>(bit);
                break;
            }
        }
    }
    return params;
}

Result<std::vector<BackbufferInterfaces>> VulkanSwapChain::build(const BuildParams& params, VulkanCommandQueue& queue) {
    VkDevice device = m_context->device;

    // Images of the current swap chain may still be in flight
    auto flushed = queue.flush();
    if (!flushed) {
        return flushed.error();
    }

    VkSwapchainCreateInfoKHR create_info{};
    create_info.sType = VK_STRUCTURE_TYPE_SWAPCHAIN_CREATE_INFO_KHR;
    create_info.surface = m_surface;
    create_info.minImageCount = params.num_images;
    create_info.imageFormat = to_vk_format(params.format);
    create_info.imageColorSpace = VK_COLOR_SPACE_SRGB_NONLINEAR_KHR;
    create_info.imageExtent = params.extent;
    create_info.imageArrayLayers = 1;
    create_info.imageUsage = params.usage;
    create_info.imageSharingMode = VK_SHARING_MODE_EXCLUSIVE;
    create_info.preTransform = VK_SURFACE_TRANSFORM_IDENTITY_BIT_KHR;
    create_info.compositeAlpha = params.alpha;
    create_info.presentMode = to_vk_present_mode(params.present_mode);
    create_info.clipped = VK_TRUE;
    create_info.oldSwapchain = m_swap_chain;

    VkSurfaceCapabilitiesKHR caps{};
    if (vkGetPhysicalDeviceSurfaceCapabilitiesKHR(m_context->phys_dev, m_surface, &caps) == VK_SUCCESS &&
        (caps.supportedTransforms & VK_SURFACE_TRANSFORM_IDENTITY_BIT_KHR) == 0) {
        create_info.preTransform = caps.currentTransform;
    }

    VkSwapchainKHR swap_chain = VK_NULL_HANDLE;
    VkResult vk_res = vkCreateSwapchainKHR(device, &create_info, nullptr, &swap_chain);
    if (vk_res != VK_SUCCESS) {
        m_context->logger().error("Failed to create swap chain: {}", vk_result_name(vk_res));
        return vk_error(vk_res, "vkCreateSwapchainKHR");
    }

    std::uint32_t count = 0;
    vkGetSwapchainImagesKHR(device, swap_chain, &count, nullptr);
    std::vector<VkImage> images(count);
    vk_res = vkGetSwapchainImagesKHR(device, swap_chain, &count, images.data());
    images.resize(count);
    if (vk_res != VK_SUCCESS || count > MAX_BACKBUFFERS) {
        vkDestroySwapchainKHR(device, swap_chain, nullptr);
        if (vk_res != VK_SUCCESS) {
            return vk_error(vk_res, "vkGetSwapchainImagesKHR");
        }
        return Error(RalError::other("Swap chain returned " + std::to_string(count) + " images"));
    }

    std::vector<BackbufferInterfaces> backbuffers;
    backbuffers.reserve(images.size());
    auto fail = [&](VkResult result, const char* what) -> Error {
        backbuffers.clear();
        vkDestroySwapchainKHR(device, swap_chain, nullptr);
        return vk_error(result, what);
    };

    for (VkImage image : images) {
        VkImageViewCreateInfo view_info{};
        view_info.sType = VK_STRUCTURE_TYPE_IMAGE_VIEW_CREATE_INFO;
        view_info.image = image;
        view_info.viewType = VK_IMAGE_VIEW_TYPE_2D;
        view_info.format = create_info.imageFormat;
        view_info.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
        view_info.subresourceRange.levelCount = 1;
        view_info.subresourceRange.layerCount = 1;

        VkImageView view = VK_NULL_HANDLE;
        vk_res = vkCreateImageView(device, &view_info, nullptr, &view);
        if (vk_res != VK_SUCCESS) {
            return fail(vk_res, "vkCreateImageView");
        }
        backbuffers.push_back(BackbufferInterfaces{
            std::make_unique<VulkanTexture>(m_context, image, false),
            std::make_unique<VulkanRenderTargetView>(m_context, view),
        });
    }

    // Backbuffers start out presentable
    auto transitioned = queue.submit_and_wait([&](VkCommandBuffer cmd_buf) {
        std::vector<VkImageMemoryBarrier2> barriers;
        barriers.reserve(images.size());
        for (VkImage image : images) {
            VkImageMemoryBarrier2 barrier{};
            barrier.sType = VK_STRUCTURE_TYPE_IMAGE_MEMORY_BARRIER_2;
            barrier.srcStageMask = VK_PIPELINE_STAGE_2_ALL_COMMANDS_BIT;
            barrier.dstStageMask = VK_PIPELINE_STAGE_2_NONE;
            barrier.oldLayout = VK_IMAGE_LAYOUT_UNDEFINED;
            barrier.newLayout = VK_IMAGE_LAYOUT_PRESENT_SRC_KHR;
            barrier.srcQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
            barrier.dstQueueFamilyIndex = VK_QUEUE_FAMILY_IGNORED;
            barrier.image = image;
            barrier.subresourceRange.aspectMask = VK_IMAGE_ASPECT_COLOR_BIT;
            barrier.subresourceRange.levelCount = 1;
            barrier.subresourceRange.layerCount = 1;
            barriers.push_back(barrier);
        }

        VkDependencyInfo dependency{};
        dependency.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
        dependency.imageMemoryBarrierCount = static_cast<std::uint32_t>(barriers.size());
        dependency.pImageMemoryBarriers = barriers.data();
        vkCmdPipelineBarrier2(cmd_buf, &dependency);
    });
    if (!transitioned) {
        backbuffers.clear();
        vkDestroySwapchainKHR(device, swap_chain, nullptr);
        return transitioned.error();
    }

    // Backbuffers of the retired chain were released when the last set was swapped out
    if (m_retired != VK_NULL_HANDLE) {
        vkDestroySwapchainKHR(device, m_retired, nullptr);
    }
    m_retired = m_swap_chain;
    m_swap_chain = swap_chain;
    m_images = std::move(images);
    return backbuffers;
}

Result<void> VulkanSwapChain::present(PresentMode /*present_mode*/, std::uint8_t backbuffer_index,
        const CommandQueue& queue, const PresentInfo& present_info) {
    auto* vk_queue = dynamic_cast<VulkanCommandQueue*>(&queue.interface());
    if (!vk_queue) {
        return Error(RalError::invalid_parameter("Present queue does not belong to the Vulkan RAL"));
    }

    if (present_info.wait_fence) {
        const auto& [fence, value] = *present_info.wait_fence;
        if (!fence) {
            return Error(RalError::invalid_parameter("Present wait fence is null"));
        }
        auto waited = fence->wait(value, std::chrono::nanoseconds::max());
        if (!waited) {
            return waited.error();
        }
    }

    std::lock_guard lock(m_mutex);
    if (backbuffer_index >= m_images.size()) {
        return Error(RalError::invalid_parameter("Backbuffer index " + std::to_string(backbuffer_index) + " out of range"));
    }

    std::uint32_t image_index = backbuffer_index;
    VkPresentInfoKHR info{};
    info.sType = VK_STRUCTURE_TYPE_PRESENT_INFO_KHR;
    info.swapchainCount = 1;
    info.pSwapchains = &m_swap_chain;
    info.pImageIndices = &image_index;

    std::vector<VkRectLayerKHR> rects;
    VkPresentRegionKHR region{};
    VkPresentRegionsKHR regions{};
    if (m_context->incremental_present && present_info.update_rects) {
        rects.reserve(present_info.update_rects->size());
        for (const Rect& rect : *present_info.update_rects) {
            rects.push_back(VkRectLayerKHR{{rect.x, rect.y}, {rect.width, rect.height}, 0});
        }
        region.rectangleCount = static_cast<std::uint32_t>(rects.size());
        region.pRectangles = rects.data();
        regions.sType = VK_STRUCTURE_TYPE_PRESENT_REGIONS_KHR;
        regions.swapchainCount = 1;
        regions.pRegions = &region;
        info.pNext = &regions;
    }
    if (present_info.scroll_rect) {
        m_context->logger().debug("Vulkan has no present scroll rects, ignoring it");
    }

    const VkResult vk_res = vk_queue->present(info);
    if (vk_res != VK_SUCCESS && vk_res != VK_SUBOPTIMAL_KHR) {
        return vk_error(vk_res, "vkQueuePresentKHR");
    }
    return Ok();
}

Result<std::uint8_t> VulkanSwapChain::acquire_next_backbuffer() {
    std::lock_guard lock(m_mutex);
    VkDevice device = m_context->device;

    std::uint32_t index = 0;
    VkResult vk_res = vkAcquireNextImageKHR(device, m_swap_chain, UINT64_MAX, VK_NULL_HANDLE, m_acquire_fence, &index);
    if (vk_res != VK_SUCCESS && vk_res != VK_SUBOPTIMAL_KHR) {
        return vk_error(vk_res, "vkAcquireNextImageKHR");
    }

    vk_res = vkWaitForFences(device, 1, &m_acquire_fence, VK_TRUE, UINT64_MAX);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkWaitForFences");
    }
    vk_res = vkResetFences(device, 1, &m_acquire_fence);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkResetFences");
    }
    return static_cast<std::uint8_t>(index);
}

Result<SwapChainRecreateResultInfo> VulkanSwapChain::recreate_swapchain(const PhysicalDevice& /*phys_dev*/,
        const SwapChainChangeParams& params) {
    auto* queue = dynamic_cast<VulkanCommandQueue*>(&params.queue->interface());
    if (!queue) {
        return Error(RalError::invalid_parameter("Swap-chain queue does not belong to the Vulkan RAL"));
    }

    std::lock_guard lock(m_mutex);
    const Format formats[] = {params.format};
    auto build_params = resolve(params.width, params.height, params.num_backbuffers, formats, params.backbuffer_usages,
        params.present_mode, params.alpha_mode, queue->family());
    if (!build_params) {
        return build_params.error();
    }
    auto backbuffers = build(*build_params, *queue);
    if (!backbuffers) {
        return backbuffers.error();
    }

    SwapChainRecreateResultInfo result;
    result.backbuffers = std::move(*backbuffers);
    result.width = static_cast<std::uint16_t>(build_params->extent.width);
    result.height = static_cast<std::uint16_t>(build_params->extent.height);
    result.num_backbuffers = static_cast<std::uint8_t>(result.backbuffers.size());
    result.format = build_params->format;
    result.backbuffer_usages = from_vk_image_usage(build_params->usage);
    result.present_mode = build_params->present_mode;
    return result;
}

Result<SwapChainResizeResultInfo> VulkanSwapChain::resize(const PhysicalDevice& phys_dev, const SwapChainChangeParams& params) {
    auto recreated = recreate_swapchain(phys_dev, params);
    if (!recreated) {
        return recreated.error();
    }

    SwapChainResizeResultInfo result;
    result.backbuffers = std::move(recreated->backbuffers);
    result.width = recreated->width;
    result.height = recreated->height;
    result.num_backbuffers = recreated->num_backbuffers;
    return result;
}

} // namespace onca_ral::vulkan
