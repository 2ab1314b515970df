/// @file vulkan_ral.cpp
/// @brief Vulkan instance, adapter enumeration and device creation

#include "vulkan_ral.hpp"
#include <onca_engine/core/log.hpp>
#include <algorithm>
#include <cstring>
#include <map>
#include <utility>

namespace onca_ral::vulkan {

namespace {

constexpr const char* VALIDATION_LAYER = "VK_LAYER_KHRONOS_validation";

// =============================================================================
// Instance helpers
// =============================================================================

VKAPI_ATTR VkBool32 VKAPI_CALL debug_callback(VkDebugUtilsMessageSeverityFlagBitsEXT severity,
        VkDebugUtilsMessageTypeFlagsEXT /*types*/, const VkDebugUtilsMessengerCallbackDataEXT* data, void* user_data) {
    auto* logger = static_cast<spdlog::logger*>(user_data);
    const char* id = data->pMessageIdName ? data->pMessageIdName : "";
    const char* message = data->pMessage ? data->pMessage : "";

    if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT) {
        logger->error("[{}] {}", id, message);
    } else if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT) {
        logger->warn("[{}] {}", id, message);
    } else if (severity & VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT) {
        logger->info("[{}] {}", id, message);
    } else {
        logger->trace("[{}] {}", id, message);
    }
    return VK_FALSE;
}

VkDebugUtilsMessageSeverityFlagsEXT debug_severities(DebugLogLevel level) {
    VkDebugUtilsMessageSeverityFlagsEXT flags = VK_DEBUG_UTILS_MESSAGE_SEVERITY_ERROR_BIT_EXT;
    switch (level) {
        case DebugLogLevel::Verbose:
            flags |= VK_DEBUG_UTILS_MESSAGE_SEVERITY_VERBOSE_BIT_EXT;
            [[fallthrough]];
        case DebugLogLevel::Info:
            flags |= VK_DEBUG_UTILS_MESSAGE_SEVERITY_INFO_BIT_EXT;
            [[fallthrough]];
        case DebugLogLevel::Warning:
            flags |= VK_DEBUG_UTILS_MESSAGE_SEVERITY_WARNING_BIT_EXT;
            [[fallthrough]];
        case DebugLogLevel::Error:
            break;
    }
    return flags;
}

bool contains_name(const std::pmr::vector<const char*>& names, const char* name) {
    return std::any_of(names.begin(), names.end(), [&](const char* n) { return std::strcmp(n, name) == 0; });
}

/// Settings read from the `vulkan` table
struct VulkanConfig {
    std::string app_name = "Onca App";
    Version app_version = Version(1, 0, 0);
    std::vector<std::string> additional_layers;
};

Result<VulkanConfig> read_config(const nlohmann::json& j, spdlog::logger& logger) {
    VulkanConfig config;
    if (j.is_null()) {
        return config;
    }
    if (!j.is_object()) {
        return Error(onca_core::ErrorCode::ParseError, "'vulkan' settings must be a table");
    }

    if (auto it = j.find("app-name"); it != j.end()) {
        if (!it->is_string()) {
            return Error(onca_core::ErrorCode::ParseError, "'vulkan.app-name' must be a string");
        }
        config.app_name = it->get<std::string>();
    }
    if (auto it = j.find("app-version"); it != j.end()) {
        auto version = it->is_string() ? Version::parse(it->get<std::string>()) : std::nullopt;
        if (version) {
            config.app_version = *version;
        } else {
            logger.warn("Invalid 'vulkan.app-version' {}, using {}", it->dump(), config.app_version.to_string());
        }
    }
    if (auto it = j.find("additional-layers"); it != j.end()) {
        if (!it->is_array()) {
            return Error(onca_core::ErrorCode::ParseError, "'vulkan.additional-layers' must be an array");
        }
        for (const auto& layer : *it) {
            if (!layer.is_string()) {
                return Error(onca_core::ErrorCode::ParseError, "'vulkan.additional-layers' must only contain strings");
            }
            config.additional_layers.push_back(layer.get<std::string>());
        }
    }
    return config;
}

// =============================================================================
// Physical device helpers
// =============================================================================

std::vector<VkExtensionProperties> device_extensions(VkPhysicalDevice phys_dev) {
    std::uint32_t count = 0;
    vkEnumerateDeviceExtensionProperties(phys_dev, nullptr, &count, nullptr);
    std::vector<VkExtensionProperties> extensions(count);
    vkEnumerateDeviceExtensionProperties(phys_dev, nullptr, &count, extensions.data());
    extensions.resize(count);
    return extensions;
}

bool has_extension(const std::vector<VkExtensionProperties>& extensions, const char* name) {
    return std::any_of(extensions.begin(), extensions.end(),
        [&](const VkExtensionProperties& ext) { return std::strcmp(ext.extensionName, name) == 0; });
}

PhysicalDeviceType to_device_type(VkPhysicalDeviceType type) {
    switch (type) {
        case VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU: return PhysicalDeviceType::Discrete;
        case VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU: return PhysicalDeviceType::Integrated;
        case VK_PHYSICAL_DEVICE_TYPE_CPU: return PhysicalDeviceType::Software;
        default: return PhysicalDeviceType::Virtual;
    }
}

MemoryInfo to_memory_info(const VkPhysicalDeviceMemoryProperties& props) {
    MemoryInfo info;
    const std::uint32_t type_count = std::min<std::uint32_t>(props.memoryTypeCount, MAX_MEMORY_TYPES);
    for (std::uint32_t i = 0; i < type_count; ++i) {
        const VkMemoryPropertyFlags vk_flags = props.memoryTypes[i].propertyFlags;
        MemoryTypeFlags flags = MemoryTypeFlags::None;
        if (vk_flags & VK_MEMORY_PROPERTY_DEVICE_LOCAL_BIT) flags |= MemoryTypeFlags::DeviceLocal;
        if (vk_flags & VK_MEMORY_PROPERTY_HOST_VISIBLE_BIT) flags |= MemoryTypeFlags::HostVisible;
        if (vk_flags & VK_MEMORY_PROPERTY_HOST_COHERENT_BIT) flags |= MemoryTypeFlags::HostCoherent;
        if (vk_flags & VK_MEMORY_PROPERTY_HOST_CACHED_BIT) flags |= MemoryTypeFlags::HostCached;
        if (vk_flags & VK_MEMORY_PROPERTY_LAZILY_ALLOCATED_BIT) flags |= MemoryTypeFlags::LazilyAllocated;
        if (vk_flags & VK_MEMORY_PROPERTY_PROTECTED_BIT) flags |= MemoryTypeFlags::Protected;
        info.types[i] = MemoryTypeInfo{flags, static_cast<std::uint8_t>(props.memoryTypes[i].heapIndex)};
    }

    const std::uint32_t heap_count = std::min<std::uint32_t>(props.memoryHeapCount, MAX_MEMORY_HEAPS);
    for (std::uint32_t i = 0; i < heap_count; ++i) {
        MemoryHeapFlags flags = MemoryHeapFlags::None;
        if (props.memoryHeaps[i].flags & VK_MEMORY_HEAP_DEVICE_LOCAL_BIT) flags |= MemoryHeapFlags::DeviceLocal;
        if (props.memoryHeaps[i].flags & VK_MEMORY_HEAP_MULTI_INSTANCE_BIT) flags |= MemoryHeapFlags::MultiInstance;
        info.heaps[i] = MemoryHeapInfo{flags, props.memoryHeaps[i].size};
    }
    return info;
}

FormatSupport to_format_support(Format format, const VkFormatProperties& props) {
    FormatSupport support = FormatSupport::None;
    const VkFormatFeatureFlags tiling = props.optimalTilingFeatures;
    const VkFormatFeatureFlags buffer = props.bufferFeatures;

    if (tiling & VK_FORMAT_FEATURE_SAMPLED_IMAGE_BIT) support |= FormatSupport::Sampled;
    if (tiling & VK_FORMAT_FEATURE_STORAGE_IMAGE_BIT) support |= FormatSupport::Storage;
    if (tiling & VK_FORMAT_FEATURE_COLOR_ATTACHMENT_BIT) support |= FormatSupport::RenderTarget;
    if (tiling & VK_FORMAT_FEATURE_DEPTH_STENCIL_ATTACHMENT_BIT) support |= FormatSupport::DepthStencil;
    if ((tiling & VK_FORMAT_FEATURE_STORAGE_IMAGE_ATOMIC_BIT) || (buffer & VK_FORMAT_FEATURE_STORAGE_TEXEL_BUFFER_ATOMIC_BIT)) {
        support |= FormatSupport::Atomics;
    }
    if (buffer & VK_FORMAT_FEATURE_UNIFORM_TEXEL_BUFFER_BIT) support |= FormatSupport::ConstantTexelBuffer;
    if (buffer & VK_FORMAT_FEATURE_STORAGE_TEXEL_BUFFER_BIT) support |= FormatSupport::StorageTexelBuffer;

    // Surfaces commonly expose these; the actual surface formats are checked on swap-chain creation
    switch (format) {
        case Format::R8G8B8A8UNorm:
        case Format::R8G8B8A8Srgb:
        case Format::B8G8R8A8UNorm:
        case Format::B8G8R8A8Srgb:
        case Format::R10G10B10A2UNorm:
        case Format::R16G16B16A16SFloat:
            if (has_flag(support, FormatSupport::RenderTarget)) {
                support |= FormatSupport::Display;
            }
            break;
        default:
            break;
    }
    return support;
}

/// Pick graphics, compute and copy families, preferring dedicated ones
std::optional<QueueFamilies> pick_queue_families(const std::vector<VkQueueFamilyProperties>& families) {
    auto find = [&](VkQueueFlags required, VkQueueFlags excluded) -> std::optional<std::uint32_t> {
        for (std::uint32_t i = 0; i < families.size(); ++i) {
            const VkQueueFlags flags = families[i].queueFlags;
            if (families[i].queueCount > 0 && (flags & required) == required && (flags & excluded) == 0) {
                return i;
            }
        }
        return std::nullopt;
    };

    auto graphics = find(VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT, 0);
    if (!graphics) {
        return std::nullopt;
    }
    auto compute = find(VK_QUEUE_COMPUTE_BIT, VK_QUEUE_GRAPHICS_BIT);
    auto copy = find(VK_QUEUE_TRANSFER_BIT, VK_QUEUE_GRAPHICS_BIT | VK_QUEUE_COMPUTE_BIT);
    if (!copy) {
        copy = find(VK_QUEUE_TRANSFER_BIT, VK_QUEUE_GRAPHICS_BIT);
    }

    QueueFamilies result{};
    result[static_cast<std::size_t>(QueueType::Graphics)] = *graphics;
    result[static_cast<std::size_t>(QueueType::Compute)] = compute.value_or(*graphics);
    result[static_cast<std::size_t>(QueueType::Copy)] = copy.value_or(compute.value_or(*graphics));
    return result;
}

} // anonymous namespace

// =============================================================================
// VulkanPhysicalDevice
// =============================================================================

VulkanPhysicalDevice::VulkanPhysicalDevice(VulkanInstancePtr instance, VkPhysicalDevice phys_dev, QueueFamilies families,
        bool memory_budget, std::uint32_t heap_count)
    : m_instance(std::move(instance))
    , m_phys_dev(phys_dev)
    , m_families(families)
    , m_memory_budget(memory_budget)
    , m_heap_count(std::min<std::uint32_t>(heap_count, MAX_MEMORY_HEAPS)) {}

Result<MemoryBudgetInfo> VulkanPhysicalDevice::get_memory_budget_info() const {
    if (!m_memory_budget) {
        return Error(RalError::not_implemented("Memory budget requires VK_EXT_memory_budget"));
    }

    VkPhysicalDeviceMemoryBudgetPropertiesEXT budget_props{};
    budget_props.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_MEMORY_BUDGET_PROPERTIES_EXT;
    VkPhysicalDeviceMemoryProperties2 props{};
    props.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_MEMORY_PROPERTIES_2;
    props.pNext = &budget_props;
    vkGetPhysicalDeviceMemoryProperties2(m_phys_dev, &props);

    MemoryBudgetInfo info;
    for (std::uint32_t i = 0; i < m_heap_count; ++i) {
        MemoryBudgetValue& value = info.budgets[i];
        value.budget = budget_props.heapBudget[i];
        value.in_use = budget_props.heapUsage[i];

        info.total.budget += value.budget;
        info.total.in_use += value.in_use;
    }
    return info;
}

Result<void> VulkanPhysicalDevice::reserve_memory(std::uint8_t /*heap_index*/, std::uint64_t /*bytes*/) {
    return Error(RalError::not_implemented("Vulkan has no memory reservations"));
}

// =============================================================================
// VulkanRal
// =============================================================================

VulkanRal::VulkanRal(Settings settings, VulkanInstancePtr instance)
    : m_settings(std::move(settings))
    , m_instance(std::move(instance)) {}

VulkanRal::~VulkanRal() {
    m_instance->logger->info("Destroying Vulkan RAL");
}

Result<std::unique_ptr<VulkanRal>> VulkanRal::create(const RalCreateInfo& create_info) {
    const Settings& settings = create_info.settings;
    auto logger = create_info.logger
        ? create_info.logger->clone("onca_ral_vulkan")
        : onca_core::get_logger("onca_ral_vulkan");
    logger->set_level(to_spdlog_level(settings.debug_log_level));

    auto config = read_config(settings.api_specific, *logger);
    if (!config) {
        logger->error("Invalid Vulkan RAL settings: {}", config.error().message());
        return config.error();
    }

    std::pmr::memory_resource* memory = create_info.memory ? create_info.memory : std::pmr::get_default_resource();

    std::uint32_t loader_version = VK_API_VERSION_1_0;
    vkEnumerateInstanceVersion(&loader_version);
    if (loader_version < MIN_VULKAN_API_VERSION) {
        return Error(RalError::unmet_requirement("Vulkan loader " + from_vk_version(loader_version).to_string() +
            " is older than 1.3"));
    }

    // Available layers and extensions
    std::uint32_t count = 0;
    vkEnumerateInstanceLayerProperties(&count, nullptr);
    std::pmr::vector<VkLayerProperties> available_layers(count, memory);
    vkEnumerateInstanceLayerProperties(&count, available_layers.data());
    available_layers.resize(count);

    count = 0;
    vkEnumerateInstanceExtensionProperties(nullptr, &count, nullptr);
    std::pmr::vector<VkExtensionProperties> available_extensions(count, memory);
    vkEnumerateInstanceExtensionProperties(nullptr, &count, available_extensions.data());
    available_extensions.resize(count);

    auto layer_available = [&](const char* name) {
        return std::any_of(available_layers.begin(), available_layers.end(),
            [&](const VkLayerProperties& layer) { return std::strcmp(layer.layerName, name) == 0; });
    };
    auto extension_available = [&](const char* name) {
        return std::any_of(available_extensions.begin(), available_extensions.end(),
            [&](const VkExtensionProperties& ext) { return std::strcmp(ext.extensionName, name) == 0; });
    };

    std::pmr::vector<const char*> layers(memory);
    if (settings.debug_validation) {
        if (layer_available(VALIDATION_LAYER)) {
            layers.push_back(VALIDATION_LAYER);
        } else {
            logger->warn("Validation requested, but '{}' is not available", VALIDATION_LAYER);
        }
    }
    for (const std::string& layer : config->additional_layers) {
        if (!layer_available(layer.c_str())) {
            logger->warn("Instance layer '{}' is not available, skipping it", layer);
        } else if (!contains_name(layers, layer.c_str())) {
            layers.push_back(layer.c_str());
        }
    }

    auto instance = std::make_shared<VulkanInstance>();
    instance->logger = logger;
    instance->memory = memory;
    instance->allocator_id = create_info.allocator_id;

    std::pmr::vector<const char*> extensions(memory);
    if (!extension_available(VK_KHR_SURFACE_EXTENSION_NAME)) {
        return Error(RalError::missing_feature(VK_KHR_SURFACE_EXTENSION_NAME));
    }
    extensions.push_back(VK_KHR_SURFACE_EXTENSION_NAME);
#ifdef VK_USE_PLATFORM_WIN32_KHR
    if (extension_available(VK_KHR_WIN32_SURFACE_EXTENSION_NAME)) {
        extensions.push_back(VK_KHR_WIN32_SURFACE_EXTENSION_NAME);
        instance->win32_surface = true;
    }
#endif
#ifdef VK_USE_PLATFORM_XLIB_KHR
    if (extension_available(VK_KHR_XLIB_SURFACE_EXTENSION_NAME)) {
        extensions.push_back(VK_KHR_XLIB_SURFACE_EXTENSION_NAME);
        instance->xlib_surface = true;
    }
#endif
#ifdef VK_USE_PLATFORM_WAYLAND_KHR
    if (extension_available(VK_KHR_WAYLAND_SURFACE_EXTENSION_NAME)) {
        extensions.push_back(VK_KHR_WAYLAND_SURFACE_EXTENSION_NAME);
        instance->wayland_surface = true;
    }
#endif

    const bool debug_utils = settings.debug_enabled && extension_available(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    if (debug_utils) {
        extensions.push_back(VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    } else if (settings.debug_enabled) {
        logger->warn("Debugging requested, but '{}' is not available", VK_EXT_DEBUG_UTILS_EXTENSION_NAME);
    }

    const std::string engine_name = "Onca Engine";
    VkApplicationInfo app_info{};
    app_info.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    app_info.pApplicationName = config->app_name.c_str();
    app_info.applicationVersion = to_vk_version(config->app_version);
    app_info.pEngineName = engine_name.c_str();
    app_info.engineVersion = to_vk_version(Version(0, 1, 0));
    app_info.apiVersion = MIN_VULKAN_API_VERSION;

    VkDebugUtilsMessengerCreateInfoEXT messenger_info{};
    messenger_info.sType = VK_STRUCTURE_TYPE_DEBUG_UTILS_MESSENGER_CREATE_INFO_EXT;
    messenger_info.messageSeverity = debug_severities(settings.debug_log_level);
    messenger_info.messageType = VK_DEBUG_UTILS_MESSAGE_TYPE_GENERAL_BIT_EXT |
        VK_DEBUG_UTILS_MESSAGE_TYPE_VALIDATION_BIT_EXT;
    if (settings.debug_performance) {
        messenger_info.messageType |= VK_DEBUG_UTILS_MESSAGE_TYPE_PERFORMANCE_BIT_EXT;
    }
    messenger_info.pfnUserCallback = debug_callback;
    messenger_info.pUserData = logger.get();

    std::pmr::vector<VkValidationFeatureEnableEXT> validation_features(memory);
    if (settings.debug_gbv) {
        validation_features.push_back(VK_VALIDATION_FEATURE_ENABLE_GPU_ASSISTED_EXT);
    }
    if (settings.debug_performance) {
        validation_features.push_back(VK_VALIDATION_FEATURE_ENABLE_BEST_PRACTICES_EXT);
    }
    VkValidationFeaturesEXT validation_info{};
    validation_info.sType = VK_STRUCTURE_TYPE_VALIDATION_FEATURES_EXT;
    validation_info.enabledValidationFeatureCount = static_cast<std::uint32_t>(validation_features.size());
    validation_info.pEnabledValidationFeatures = validation_features.data();

    VkInstanceCreateInfo instance_info{};
    instance_info.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    instance_info.pApplicationInfo = &app_info;
    instance_info.enabledLayerCount = static_cast<std::uint32_t>(layers.size());
    instance_info.ppEnabledLayerNames = layers.data();
    instance_info.enabledExtensionCount = static_cast<std::uint32_t>(extensions.size());
    instance_info.ppEnabledExtensionNames = extensions.data();

    const void* chain = nullptr;
    if (debug_utils) {
        messenger_info.pNext = chain;
        chain = &messenger_info;
    }
    if (!validation_features.empty() && contains_name(layers, VALIDATION_LAYER)) {
        validation_info.pNext = chain;
        chain = &validation_info;
    }
    instance_info.pNext = chain;

    VkResult vk_res = vkCreateInstance(&instance_info, nullptr, &instance->instance);
    if (vk_res != VK_SUCCESS) {
        logger->error("Failed to create Vulkan instance: {}", vk_result_name(vk_res));
        return vk_error(vk_res, "vkCreateInstance");
    }

    if (debug_utils) {
        auto create_messenger = reinterpret_cast<PFN_vkCreateDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance->instance, "vkCreateDebugUtilsMessengerEXT"));
        instance->destroy_messenger = reinterpret_cast<PFN_vkDestroyDebugUtilsMessengerEXT>(
            vkGetInstanceProcAddr(instance->instance, "vkDestroyDebugUtilsMessengerEXT"));
        if (create_messenger) {
            messenger_info.pNext = nullptr;
            vk_res = create_messenger(instance->instance, &messenger_info, nullptr, &instance->messenger);
            if (vk_res != VK_SUCCESS) {
                logger->warn("Failed to create debug messenger: {}", vk_result_name(vk_res));
            }
        }
    }

    logger->info("Created Vulkan RAL (loader {}, {} layer(s), {} extension(s))",
        from_vk_version(loader_version).to_string(), layers.size(), extensions.size());
    return std::make_unique<VulkanRal>(settings, std::move(instance));
}

Result<std::vector<PhysicalDevice>> VulkanRal::get_physical_devices() {
    std::uint32_t count = 0;
    VkResult vk_res = vkEnumeratePhysicalDevices(m_instance->instance, &count, nullptr);
    if (vk_res != VK_SUCCESS) {
        return vk_error(vk_res, "vkEnumeratePhysicalDevices");
    }
    std::pmr::vector<VkPhysicalDevice> natives(count, m_instance->memory);
    vk_res = vkEnumeratePhysicalDevices(m_instance->instance, &count, natives.data());
    if (vk_res != VK_SUCCESS && vk_res != VK_INCOMPLETE) {
        return vk_error(vk_res, "vkEnumeratePhysicalDevices");
    }
    natives.resize(count);

    std::vector<PhysicalDevice> devices;
    devices.reserve(natives.size());
    for (VkPhysicalDevice native : natives) {
        VkPhysicalDeviceProperties props{};
        vkGetPhysicalDeviceProperties(native, &props);
        if (props.apiVersion < MIN_VULKAN_API_VERSION) {
            m_instance->logger->info("Skipping '{}', Vulkan {} is older than 1.3", props.deviceName,
                from_vk_version(props.apiVersion).to_string());
            continue;
        }

        std::uint32_t family_count = 0;
        vkGetPhysicalDeviceQueueFamilyProperties(native, &family_count, nullptr);
        std::vector<VkQueueFamilyProperties> families(family_count);
        vkGetPhysicalDeviceQueueFamilyProperties(native, &family_count, families.data());
        auto queue_families = pick_queue_families(families);
        if (!queue_families) {
            m_instance->logger->info("Skipping '{}', it has no graphics queue", props.deviceName);
            continue;
        }

        const auto extensions = device_extensions(native);

        PhysicalDevice dev;
        dev.properties.description = props.deviceName;
        dev.properties.api_version = from_vk_version(props.apiVersion);
        dev.properties.driver_version = from_vk_version(props.driverVersion);
        dev.properties.vendor_id = props.vendorID;
        dev.properties.product_id = props.deviceID;
        dev.properties.dev_type = to_device_type(props.deviceType);

        VkPhysicalDeviceMemoryProperties mem_props{};
        vkGetPhysicalDeviceMemoryProperties(native, &mem_props);
        dev.memory_info = to_memory_info(mem_props);
        dev.memory_types = MemoryTypeMask::None;
        for (std::size_t i = 0; i < MEMORY_TYPE_COUNT; ++i) {
            const auto memory_type = static_cast<MemoryType>(i);
            if (find_memory_type_index(dev.memory_info, memory_type)) {
                dev.memory_types |= to_mask(memory_type);
            }
        }

        VkPhysicalDeviceFeatures features{};
        vkGetPhysicalDeviceFeatures(native, &features);
        if (features.sampleRateShading) {
            dev.capabilities |= Capabilities::MinSampleShading;
        }
        if (has_extension(extensions, VK_EXT_FRAGMENT_SHADER_INTERLOCK_EXTENSION_NAME)) {
            dev.capabilities |= Capabilities::RasterizerOrderViews;
        }

        for (std::size_t f = 0; f < FORMAT_COUNT; ++f) {
            const Format format = format_from_index(f);
            const VkFormat vk_format = to_vk_format(format);
            if (vk_format == VK_FORMAT_UNDEFINED) {
                continue;
            }
            VkFormatProperties format_props{};
            vkGetPhysicalDeviceFormatProperties(native, vk_format, &format_props);
            dev.format_support[f] = to_format_support(format, format_props);
        }

        const bool acceleration_structures = has_extension(extensions, VK_KHR_ACCELERATION_STRUCTURE_EXTENSION_NAME);
        for (std::size_t v = 0; v < VERTEX_FORMAT_COUNT; ++v) {
            VkFormatProperties format_props{};
            vkGetPhysicalDeviceFormatProperties(native, to_vk_vertex_format(vertex_format_from_index(v)), &format_props);
            VertexFormatSupport support = VertexFormatSupport::None;
            if (format_props.bufferFeatures & VK_FORMAT_FEATURE_VERTEX_BUFFER_BIT) {
                support |= VertexFormatSupport::Vertex;
            }
            if (acceleration_structures &&
                (format_props.bufferFeatures & VK_FORMAT_FEATURE_ACCELERATION_STRUCTURE_VERTEX_BUFFER_BIT_KHR)) {
                support |= VertexFormatSupport::AccelerationStructure;
            }
            dev.vertex_format_support[v] = support;
        }

        for (std::size_t type = 0; type < QUEUE_TYPE_COUNT; ++type) {
            const std::uint32_t family = (*queue_families)[type];
            const std::uint32_t queue_count = std::min<std::uint32_t>(families[family].queueCount, UINT8_MAX);
            dev.queue_infos[type] = QueueInfo{static_cast<std::uint8_t>(family),
                QueueCount::known(static_cast<std::uint8_t>(queue_count))};
        }

        dev.handle = std::make_shared<VulkanPhysicalDevice>(m_instance, native, *queue_families,
            has_extension(extensions, VK_EXT_MEMORY_BUDGET_EXTENSION_NAME), mem_props.memoryHeapCount);
        devices.push_back(std::move(dev));
    }
    return devices;
}

Result<DeviceCreateResult> VulkanRal::create_device(const PhysicalDevice& phys_dev) {
    auto* vk_phys_dev = dynamic_cast<VulkanPhysicalDevice*>(phys_dev.handle.get());
    if (!vk_phys_dev) {
        return Error(RalError::invalid_parameter("Physical device does not belong to the Vulkan RAL"));
    }
    VkPhysicalDevice native = vk_phys_dev->native();
    auto& logger = *m_instance->logger;

    // Required features
    VkPhysicalDeviceFragmentShaderInterlockFeaturesEXT interlock_features{};
    interlock_features.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FRAGMENT_SHADER_INTERLOCK_FEATURES_EXT;
    VkPhysicalDeviceVulkan13Features features13{};
    features13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
    VkPhysicalDeviceVulkan12Features features12{};
    features12.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES;
    features12.pNext = &features13;
    VkPhysicalDeviceFeatures2 features{};
    features.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
    features.pNext = &features12;

    const auto available = device_extensions(native);
    const bool interlock = has_extension(available, VK_EXT_FRAGMENT_SHADER_INTERLOCK_EXTENSION_NAME);
    if (interlock) {
        features13.pNext = &interlock_features;
    }
    vkGetPhysicalDeviceFeatures2(native, &features);

    const std::pair<VkBool32, const char*> required[] = {
        {features12.timelineSemaphore, "timelineSemaphore"},
        {features12.bufferDeviceAddress, "bufferDeviceAddress"},
        {features13.synchronization2, "synchronization2"},
        {features13.dynamicRendering, "dynamicRendering"},
    };
    for (const auto& [supported, name] : required) {
        if (!supported) {
            logger.error("'{}' does not support {}", phys_dev.properties.description, name);
            return Error(RalError::missing_feature(name));
        }
    }

    std::pmr::vector<const char*> extensions(m_instance->memory);
    if (!has_extension(available, VK_KHR_SWAPCHAIN_EXTENSION_NAME)) {
        return Error(RalError::missing_feature(VK_KHR_SWAPCHAIN_EXTENSION_NAME));
    }
    extensions.push_back(VK_KHR_SWAPCHAIN_EXTENSION_NAME);

    const bool incremental_present = has_extension(available, VK_KHR_INCREMENTAL_PRESENT_EXTENSION_NAME);
    if (incremental_present) {
        extensions.push_back(VK_KHR_INCREMENTAL_PRESENT_EXTENSION_NAME);
    }
    if (has_extension(available, VK_EXT_MEMORY_BUDGET_EXTENSION_NAME)) {
        extensions.push_back(VK_EXT_MEMORY_BUDGET_EXTENSION_NAME);
    }
    if (interlock) {
        extensions.push_back(VK_EXT_FRAGMENT_SHADER_INTERLOCK_EXTENSION_NAME);
    }

    // Only enable what is used, on top of what is required
    VkPhysicalDeviceFeatures2 enabled = features;
    enabled.features = VkPhysicalDeviceFeatures{};
    enabled.features.sampleRateShading = features.features.sampleRateShading;
    VkPhysicalDeviceVulkan12Features enabled12{};
    enabled12.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES;
    enabled12.timelineSemaphore = VK_TRUE;
    enabled12.bufferDeviceAddress = VK_TRUE;
    VkPhysicalDeviceVulkan13Features enabled13{};
    enabled13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
    enabled13.synchronization2 = VK_TRUE;
    enabled13.dynamicRendering = VK_TRUE;
    enabled.pNext = &enabled12;
    enabled12.pNext = &enabled13;
    if (interlock) {
        enabled13.pNext = &interlock_features;
    }

    // One create info per distinct family, with up to a High and a Normal queue
    std::uint32_t family_count = 0;
    vkGetPhysicalDeviceQueueFamilyProperties(native, &family_count, nullptr);
    std::vector<VkQueueFamilyProperties> family_props(family_count);
    vkGetPhysicalDeviceQueueFamilyProperties(native, &family_count, family_props.data());

    static const float priorities[BACKEND_QUEUE_PRIORITY_COUNT] = {1.0f, 0.5f};
    const QueueFamilies& families = vk_phys_dev->queue_families();
    std::map<std::uint32_t, std::uint32_t> queues_per_family;
    for (std::uint32_t family : families) {
        queues_per_family[family] = std::min<std::uint32_t>(family_props[family].queueCount,
            static_cast<std::uint32_t>(BACKEND_QUEUE_PRIORITY_COUNT));
    }

    std::pmr::vector<VkDeviceQueueCreateInfo> queue_infos(m_instance->memory);
    for (const auto& [family, count] : queues_per_family) {
        VkDeviceQueueCreateInfo info{};
        info.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        info.queueFamilyIndex = family;
        info.queueCount = count;
        info.pQueuePriorities = priorities;
        queue_infos.push_back(info);
    }

    VkDeviceCreateInfo device_info{};
    device_info.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
    device_info.pNext = &enabled;
    device_info.queueCreateInfoCount = static_cast<std::uint32_t>(queue_infos.size());
    device_info.pQueueCreateInfos = queue_infos.data();
    device_info.enabledExtensionCount = static_cast<std::uint32_t>(extensions.size());
    device_info.ppEnabledExtensionNames = extensions.data();

    auto context = std::make_shared<VulkanDeviceContext>();
    context->instance = m_instance;
    context->phys_dev = native;
    context->incremental_present = incremental_present;

    VkResult vk_res = vkCreateDevice(native, &device_info, nullptr, &context->device);
    if (vk_res != VK_SUCCESS) {
        logger.error("Failed to create Vulkan device for '{}': {}", phys_dev.properties.description, vk_result_name(vk_res));
        return vk_error(vk_res, "vkCreateDevice");
    }

    DeviceCreateResult result;
    result.handle = std::make_unique<VulkanDevice>(context, families);
    result.extensions = DeviceExtensions::PresentFence;
    if (incremental_present) {
        result.extensions |= DeviceExtensions::IncrementalPresent;
    }

    // Slots aliasing the same native queue share its submission lock
    std::map<std::pair<std::uint32_t, std::uint32_t>, std::shared_ptr<std::mutex>> queue_mutexes;
    for (std::size_t type = 0; type < QUEUE_TYPE_COUNT; ++type) {
        const std::uint32_t family = families[type];
        const std::uint32_t count = queues_per_family[family];
        for (std::size_t prio = 0; prio < BACKEND_QUEUE_PRIORITY_COUNT; ++prio) {
            const std::uint32_t queue_index = prio < count ? static_cast<std::uint32_t>(prio) : 0;
            auto& mutex = queue_mutexes[{family, queue_index}];
            if (!mutex) {
                mutex = std::make_shared<std::mutex>();
            }

            VkQueue queue = VK_NULL_HANDLE;
            vkGetDeviceQueue(context->device, family, queue_index, &queue);
            result.queues[type][prio] = QueueCreateResult{
                std::make_unique<VulkanCommandQueue>(context, queue, family, mutex),
                QueueIndex{static_cast<std::uint8_t>(family)},
            };
        }
    }

    logger.info("Created Vulkan device on '{}' with {} queue famil{}", phys_dev.properties.description,
        queues_per_family.size(), queues_per_family.size() == 1 ? "y" : "ies");
    return result;
}

} // namespace onca_ral::vulkan
