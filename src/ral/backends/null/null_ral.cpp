/// @file null_ral.cpp
/// @brief Null RAL backend implementation

#include "null_ral.hpp"
#include <onca_engine/core/log.hpp>
#include <algorithm>
#include <string>
#include <thread>

namespace onca_ral::null {

namespace {

/// Timeouts this long are treated as "wait forever"
[[nodiscard]] bool is_infinite(std::chrono::nanoseconds timeout) {
    return timeout >= std::chrono::hours(24 * 365);
}

template<typename T>
Result<void> read_uint(const nlohmann::json& j, const char* key, T& out, std::uint64_t min_value, std::uint64_t max_value) {
    auto it = j.find(key);
    if (it == j.end()) {
        return Ok();
    }
    if (!it->is_number_integer()) {
        return Error(onca_core::ErrorCode::ParseError, std::string("'null.") + key + "' must be an integer");
    }
    const auto value = it->get<std::int64_t>();
    if (value < 0 || static_cast<std::uint64_t>(value) < min_value || static_cast<std::uint64_t>(value) > max_value) {
        return Error(onca_core::ErrorCode::ParseError, std::string("'null.") + key + "' must be in [" +
            std::to_string(min_value) + ", " + std::to_string(max_value) + "]");
    }
    out = static_cast<T>(value);
    return Ok();
}

Result<void> read_bool(const nlohmann::json& j, const char* key, bool& out) {
    auto it = j.find(key);
    if (it == j.end()) {
        return Ok();
    }
    if (!it->is_boolean()) {
        return Error(onca_core::ErrorCode::ParseError, std::string("'null.") + key + "' must be a boolean");
    }
    out = it->get<bool>();
    return Ok();
}

std::optional<PresentMode> parse_present_mode(const std::string& str) {
    if (str == "immediate") return PresentMode::Immediate;
    if (str == "mailbox") return PresentMode::Mailbox;
    if (str == "fifo") return PresentMode::Fifo;
    return std::nullopt;
}

PresentMode resolve_present_mode(const NullConfig& config, PresentMode mode) {
    return config.supports_present_mode(mode) ? mode : PresentMode::Fifo;
}

std::uint16_t clamp_extent(const NullConfig& config, std::uint16_t extent) {
    return std::clamp(extent, config.min_extent, config.max_extent);
}

std::vector<BackbufferInterfaces> create_backbuffer_interfaces(const NullContextPtr& context, std::uint8_t count) {
    std::vector<BackbufferInterfaces> backbuffers;
    backbuffers.reserve(count);
    for (std::uint8_t i = 0; i < count; ++i) {
        BackbufferInterfaces iface;
        iface.texture = std::make_unique<NullTexture>(context, true);
        iface.rtv = std::make_unique<NullRenderTargetView>();
        backbuffers.push_back(std::move(iface));
    }
    return backbuffers;
}

FormatSupport null_format_support(Format format) {
    const FormatComponents components = format_components(format);
    if (format_data_type(format) == FormatDataType::Typeless ||
        components == FormatComponents::SamplerFeedbackMinMip ||
        components == FormatComponents::SamplerFeedbackMipRegionUsed) {
        return FormatSupport::None;
    }
    if (format_is_block_compressed(format)) {
        return FormatSupport::Sampled;
    }
    if (format_has_depth(format) || format_has_stencil(format)) {
        return FormatSupport::Sampled | FormatSupport::DepthStencil;
    }

    FormatSupport support = FormatSupport::Sampled | FormatSupport::Storage | FormatSupport::RenderTarget |
        FormatSupport::ConstantTexelBuffer | FormatSupport::StorageTexelBuffer;
    switch (format) {
        case Format::R32UInt:
        case Format::R32SInt:
            support |= FormatSupport::Atomics;
            break;
        case Format::R8G8B8A8UNorm:
        case Format::R8G8B8A8Srgb:
        case Format::B8G8R8A8UNorm:
        case Format::B8G8R8A8Srgb:
        case Format::R10G10B10A2UNorm:
        case Format::R16G16B16A16SFloat:
            support |= FormatSupport::Display;
            break;
        default:
            break;
    }
    return support;
}

MemoryInfo null_memory_info() {
    MemoryInfo info;
    info.heaps[0] = MemoryHeapInfo{MemoryHeapFlags::DeviceLocal, 4ull * 1024 * 1024 * 1024};
    info.heaps[1] = MemoryHeapInfo{MemoryHeapFlags::None, 8ull * 1024 * 1024 * 1024};
    info.types[0] = MemoryTypeInfo{MemoryTypeFlags::DeviceLocal, 0};
    info.types[1] = MemoryTypeInfo{MemoryTypeFlags::HostVisible | MemoryTypeFlags::HostCoherent, 1};
    info.types[2] = MemoryTypeInfo{MemoryTypeFlags::HostVisible | MemoryTypeFlags::HostCoherent | MemoryTypeFlags::HostCached, 1};
    return info;
}

} // anonymous namespace

// =============================================================================
// NullConfig
// =============================================================================

Result<NullConfig> NullConfig::from_json(const nlohmann::json& j) {
    NullConfig config;
    if (j.is_null()) {
        return config;
    }
    if (!j.is_object()) {
        return Error(onca_core::ErrorCode::ParseError, "'null' settings must be a table");
    }

    Result<void> results[] = {
        read_uint(j, "adapters", config.adapters, 0, 16),
        read_bool(j, "single-queue", config.single_queue),
        read_uint(j, "min-extent", config.min_extent, 1, UINT16_MAX),
        read_uint(j, "max-extent", config.max_extent, 1, UINT16_MAX),
        read_uint(j, "min-backbuffers", config.min_backbuffers, 1, MAX_BACKBUFFERS),
        read_uint(j, "max-backbuffers", config.max_backbuffers, 1, MAX_BACKBUFFERS),
        read_bool(j, "present-mode-recreate", config.present_mode_recreate),
        read_uint(j, "recreate-backbuffers", config.recreate_backbuffers, 0, MAX_BACKBUFFERS),
    };
    for (auto& result : results) {
        if (!result) {
            return result.error();
        }
    }

    if (config.min_extent > config.max_extent) {
        return Error(onca_core::ErrorCode::ParseError, "'null.min-extent' may not exceed 'null.max-extent'");
    }
    if (config.min_backbuffers > config.max_backbuffers) {
        return Error(onca_core::ErrorCode::ParseError, "'null.min-backbuffers' may not exceed 'null.max-backbuffers'");
    }

    if (auto it = j.find("present-modes"); it != j.end()) {
        if (!it->is_array()) {
            return Error(onca_core::ErrorCode::ParseError, "'null.present-modes' must be an array");
        }
        config.present_modes.clear();
        for (const auto& mode : *it) {
            auto parsed = mode.is_string() ? parse_present_mode(mode.get<std::string>()) : std::nullopt;
            if (!parsed) {
                return Error(onca_core::ErrorCode::ParseError, "Unknown present mode '" + mode.dump() + "'");
            }
            config.present_modes.push_back(*parsed);
        }
    }
    return config;
}

bool NullConfig::supports_present_mode(PresentMode mode) const {
    // Fifo is always available
    return mode == PresentMode::Fifo ||
        std::find(present_modes.begin(), present_modes.end(), mode) != present_modes.end();
}

// =============================================================================
// Memory & Resources
// =============================================================================

NullMemoryHeap::NullMemoryHeap(NullContextPtr context, std::uint64_t size)
    : m_context(std::move(context))
    , m_memory(static_cast<std::size_t>(size), 0, m_context->memory) {
    ++m_context->counters.heaps_allocated;
}

NullMemoryHeap::~NullMemoryHeap() {
    ++m_context->counters.heaps_freed;
}

NullBuffer::NullBuffer(NullContextPtr context)
    : m_context(std::move(context)) {
    ++m_context->counters.buffers_created;
}

NullBuffer::~NullBuffer() {
    ++m_context->counters.buffers_destroyed;
}

Result<std::uint8_t*> NullBuffer::map(const GpuAllocation& allocation, std::uint64_t offset, std::uint64_t size) {
    ++m_context->counters.maps;

    if (allocation.memory_type == MemoryType::Gpu) {
        return Error(RalError::invalid_parameter("GPU-only memory cannot be mapped"));
    }

    auto* heap = dynamic_cast<NullMemoryHeap*>(&allocation.heap->interface());
    if (!heap) {
        return Error(RalError::other("Buffer memory was not allocated by the null backend"));
    }

    const std::uint64_t start = allocation.offset + offset;
    if (start > heap->size() || size > heap->size() - start) {
        return Error(RalError::invalid_parameter("Mapped range exceeds the buffer's memory"));
    }
    return heap->data() + start;
}

void NullBuffer::unmap(const GpuAllocation& /*allocation*/, const MappedMemory& /*memory*/) {
    ++m_context->counters.unmaps;
}

NullTexture::NullTexture(NullContextPtr context, bool is_backbuffer)
    : m_context(std::move(context))
    , m_is_backbuffer(is_backbuffer) {
    if (!m_is_backbuffer) {
        ++m_context->counters.textures_created;
    }
}

NullTexture::~NullTexture() {
    if (!m_is_backbuffer) {
        ++m_context->counters.textures_destroyed;
    }
}

// =============================================================================
// Queues & Synchronization
// =============================================================================

NullCommandQueue::NullCommandQueue(NullContextPtr context, std::uint32_t native_id)
    : m_context(std::move(context))
    , m_native_id(native_id) {}

Result<void> NullCommandQueue::flush() {
    ++m_context->counters.queue_flushes;
    return Ok();
}

Result<void> NullCommandPool::reset() {
    ++m_resets;
    return Ok();
}

Result<std::uint64_t> NullFence::get_value() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_value;
}

Result<void> NullFence::signal(std::uint64_t value) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (value < m_value) {
            return Error(RalError::invalid_parameter("Fence value may not decrease (current " +
                std::to_string(m_value) + ", signaled " + std::to_string(value) + ")"));
        }
        m_value = value;
    }
    m_cond.notify_all();
    return Ok();
}

Result<bool> NullFence::wait(std::uint64_t value, std::chrono::nanoseconds timeout) {
    std::unique_lock<std::mutex> lock(m_mutex);
    auto reached = [&] { return m_value >= value; };
    if (is_infinite(timeout)) {
        m_cond.wait(lock, reached);
        return true;
    }
    const bool result = m_cond.wait_for(lock, timeout, reached);
    return result;
}

Result<bool> NullFence::wait_multiple(std::span<const FenceWait> fences, bool wait_for_all, std::chrono::nanoseconds timeout) {
    std::vector<std::pair<NullFence*, std::uint64_t>> null_fences;
    null_fences.reserve(fences.size());
    for (const auto& fence_wait : fences) {
        auto* fence = dynamic_cast<NullFence*>(&fence_wait.first->interface());
        if (!fence) {
            return Error(RalError::invalid_parameter("Fence does not belong to the null backend"));
        }
        null_fences.emplace_back(fence, fence_wait.second);
    }

    const auto start = std::chrono::steady_clock::now();
    for (;;) {
        std::size_t num_reached = 0;
        for (const auto& [fence, value] : null_fences) {
            std::lock_guard<std::mutex> lock(fence->m_mutex);
            if (fence->m_value >= value) {
                ++num_reached;
            }
        }

        const bool done = wait_for_all ? num_reached == null_fences.size() : num_reached != 0;
        if (done) {
            return true;
        }
        if (!is_infinite(timeout) && std::chrono::steady_clock::now() - start >= timeout) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::microseconds(100));
    }
}

// =============================================================================
// SwapChain
// =============================================================================

NullSwapChain::NullSwapChain(NullContextPtr context, std::uint8_t num_backbuffers)
    : m_context(std::move(context))
    , m_num_backbuffers(num_backbuffers) {}

Result<SwapChainResultInfo> NullSwapChain::create(NullContextPtr context, const PhysicalDevice& phys_dev,
        const SwapChainDesc& desc) {
    const NullConfig& config = context->config;

    auto format_it = std::find_if(desc.formats.begin(), desc.formats.end(), [&](Format format) {
        return phys_dev.supports_format(format, FormatSupport::Display);
    });
    if (format_it == desc.formats.end()) {
        std::vector<std::string> names;
        for (Format format : desc.formats) {
            names.emplace_back(format_name(format));
        }
        return Error(RalError::unsupported_swap_chain_formats(std::move(names)));
    }

    SwapChainResultInfo result;
    result.width = clamp_extent(config, desc.width);
    result.height = clamp_extent(config, desc.height);
    result.num_backbuffers = std::clamp(desc.num_backbuffers, config.min_backbuffers, config.max_backbuffers);
    result.format = *format_it;
    result.backbuffer_usages = desc.usages;
    result.present_mode = resolve_present_mode(config, desc.present_mode);
    result.backbuffers = create_backbuffer_interfaces(context, result.num_backbuffers);

    if (result.present_mode != desc.present_mode) {
        context->logger->warn("Present mode {} is not supported, falling back to {}",
            present_mode_name(desc.present_mode), present_mode_name(result.present_mode));
    }

    ++context->counters.swap_chains_created;
    result.handle = std::make_unique<NullSwapChain>(context, result.num_backbuffers);
    return result;
}

Result<void> NullSwapChain::present(PresentMode present_mode, std::uint8_t backbuffer_index,
        const CommandQueue& /*queue*/, const PresentInfo& present_info) {
    ++m_context->counters.presents;

    if (backbuffer_index >= m_num_backbuffers) {
        return Error(RalError::other("Presenting backbuffer " + std::to_string(backbuffer_index) + " of " +
            std::to_string(m_num_backbuffers)));
    }
    if (present_info.wait_fence && !present_info.wait_fence->first) {
        return Error(RalError::invalid_parameter("Present wait fence is null"));
    }

    m_last_present_mode = resolve_present_mode(m_context->config, present_mode);
    return Ok();
}

Result<std::uint8_t> NullSwapChain::acquire_next_backbuffer() {
    ++m_context->counters.acquires;

    const std::uint8_t index = m_next_index;
    m_next_index = static_cast<std::uint8_t>((m_next_index + 1) % m_num_backbuffers);
    return index;
}

std::uint8_t NullSwapChain::rebuilt_backbuffer_count(std::uint8_t requested) const {
    const NullConfig& config = m_context->config;
    const std::uint8_t count = config.recreate_backbuffers != 0 ? config.recreate_backbuffers : requested;
    return std::clamp(count, config.min_backbuffers, config.max_backbuffers);
}

bool NullSwapChain::needs_present_mode_recreate() const {
    return m_context->config.present_mode_recreate;
}

Result<SwapChainRecreateResultInfo> NullSwapChain::recreate_swapchain(const PhysicalDevice& /*phys_dev*/,
        const SwapChainChangeParams& params) {
    ++m_context->counters.swap_chain_recreates;
    if (m_fail_next_recreate.exchange(false)) {
        return Error(RalError::other("Injected swap chain recreation failure"));
    }

    m_num_backbuffers = rebuilt_backbuffer_count(params.num_backbuffers);

    SwapChainRecreateResultInfo result;
    result.width = clamp_extent(m_context->config, params.width);
    result.height = clamp_extent(m_context->config, params.height);
    result.num_backbuffers = m_num_backbuffers;
    result.format = params.format;
    result.backbuffer_usages = params.backbuffer_usages;
    result.present_mode = resolve_present_mode(m_context->config, params.present_mode);
    result.backbuffers = create_backbuffer_interfaces(m_context, m_num_backbuffers);

    m_next_index = 0;
    return result;
}

Result<SwapChainResizeResultInfo> NullSwapChain::resize(const PhysicalDevice& /*phys_dev*/,
        const SwapChainChangeParams& params) {
    ++m_context->counters.swap_chain_resizes;
    if (m_fail_next_recreate.exchange(false)) {
        return Error(RalError::other("Injected swap chain resize failure"));
    }

    m_num_backbuffers = rebuilt_backbuffer_count(params.num_backbuffers);

    SwapChainResizeResultInfo result;
    result.width = clamp_extent(m_context->config, params.width);
    result.height = clamp_extent(m_context->config, params.height);
    result.num_backbuffers = m_num_backbuffers;
    result.backbuffers = create_backbuffer_interfaces(m_context, m_num_backbuffers);

    m_next_index = 0;
    return result;
}

// =============================================================================
// NullPhysicalDevice
// =============================================================================

NullPhysicalDevice::NullPhysicalDevice(const MemoryInfo& mem_info)
    : m_mem_info(mem_info) {}

Result<MemoryBudgetInfo> NullPhysicalDevice::get_memory_budget_info() const {
    std::lock_guard<std::mutex> lock(m_mutex);

    MemoryBudgetInfo info;
    for (std::size_t i = 0; i < MAX_MEMORY_HEAPS; ++i) {
        const std::uint64_t size = m_mem_info.heaps[i].size;
        if (size == 0) {
            continue;
        }

        MemoryBudgetValue& budget = info.budgets[i];
        budget.budget = size;
        budget.available_reservation = size / 2;
        budget.reserved = m_reserved[i];

        info.total.budget += budget.budget;
        info.total.available_reservation += budget.available_reservation;
        info.total.reserved += budget.reserved;
    }
    return info;
}

Result<void> NullPhysicalDevice::reserve_memory(std::uint8_t heap_index, std::uint64_t bytes) {
    if (heap_index >= MAX_MEMORY_HEAPS || m_mem_info.heaps[heap_index].size == 0) {
        return Error(RalError::invalid_parameter("Heap " + std::to_string(heap_index) + " does not exist"));
    }
    if (bytes > m_mem_info.heaps[heap_index].size / 2) {
        return Error(RalError::out_of_device_memory());
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    m_reserved[heap_index] = bytes;
    return Ok();
}

// =============================================================================
// NullDevice
// =============================================================================

NullDevice::NullDevice(NullContextPtr context)
    : m_context(std::move(context)) {}

Result<SwapChainResultInfo> NullDevice::create_swap_chain(const PhysicalDevice& phys_dev, const SwapChainDesc& desc) {
    return NullSwapChain::create(m_context, phys_dev, desc);
}

Result<std::unique_ptr<CommandPoolInterface>> NullDevice::create_command_pool(CommandListType /*list_type*/, CommandPoolFlags /*flags*/) {
    return std::unique_ptr<CommandPoolInterface>(std::make_unique<NullCommandPool>());
}

Result<std::unique_ptr<FenceInterface>> NullDevice::create_fence() {
    return std::unique_ptr<FenceInterface>(std::make_unique<NullFence>());
}

Result<BufferCreateResult> NullDevice::create_buffer(const BufferDesc& desc, GpuAllocator& allocator) {
    ApiMemoryRequest request;
    request.size = desc.size;
    request.alignment = MIN_ALLOCATION_ALIGN;

    auto allocation = allocator.alloc(desc.alloc_desc, request);
    if (!allocation) {
        return allocation.error();
    }

    BufferCreateResult result;
    result.handle = std::make_unique<NullBuffer>(m_context);
    result.allocation = std::move(*allocation);
    result.address = GpuAddress(m_context->next_address.fetch_add(align_up(desc.size, MIN_ALLOCATION_ALIGN)));
    return result;
}

Result<TextureCreateResult> NullDevice::create_texture(const TextureDesc& desc, GpuAllocator& allocator) {
    const TextureSize& size = desc.size;
    std::uint64_t bytes = static_cast<std::uint64_t>(size.width) * size.height * size.depth_or_layers *
        format_bits_per_pixel(desc.format) / 8;
    if (size.mip_levels > 1) {
        // A full mip chain adds at most a third
        bytes += bytes / 3 + 1;
    }

    ApiMemoryRequest request;
    request.size = std::max<std::uint64_t>(bytes, 1);
    request.alignment = MIN_ALLOCATION_ALIGN;

    auto allocation = allocator.alloc(desc.alloc_desc, request);
    if (!allocation) {
        return allocation.error();
    }

    TextureCreateResult result;
    result.handle = std::make_unique<NullTexture>(m_context, false);
    result.allocation = std::move(*allocation);
    return result;
}

Result<void> NullDevice::flush(const QueueMatrix& queues) {
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

Result<std::unique_ptr<MemoryHeapInterface>> NullDevice::allocate_heap(std::uint64_t size, std::uint64_t /*alignment*/,
        MemoryType memory_type, const MemoryInfo& /*mem_info*/) {
    m_context->logger->trace("Allocating {} bytes of {} memory", size, memory_type_name(memory_type));
    return std::unique_ptr<MemoryHeapInterface>(std::make_unique<NullMemoryHeap>(m_context, size));
}

// =============================================================================
// NullRal
// =============================================================================

NullRal::NullRal(Settings settings, NullContextPtr context)
    : m_settings(std::move(settings))
    , m_context(std::move(context)) {}

NullRal::~NullRal() {
    m_context->logger->debug("Destroying null RAL");
}

Result<std::unique_ptr<NullRal>> NullRal::create(const RalCreateInfo& create_info) {
    auto logger = create_info.logger
        ? create_info.logger->clone("onca_ral_null")
        : onca_core::get_logger("onca_ral_null");
    logger->set_level(to_spdlog_level(create_info.settings.debug_log_level));

    auto config = NullConfig::from_json(create_info.settings.api_specific);
    if (!config) {
        logger->error("Invalid null RAL settings: {}", config.error().message());
        return config.error();
    }

    auto context = std::make_shared<NullContext>();
    context->config = std::move(*config);
    context->memory = create_info.memory ? create_info.memory : std::pmr::get_default_resource();
    context->allocator_id = create_info.allocator_id;
    context->logger = std::move(logger);

    context->logger->info("Created null RAL with {} adapter(s), allocator {}", context->config.adapters,
        context->allocator_id);
    return std::make_unique<NullRal>(create_info.settings, std::move(context));
}

Result<std::vector<PhysicalDevice>> NullRal::get_physical_devices() {
    const NullConfig& config = m_context->config;
    const std::uint8_t queue_count = config.single_queue ? 1 : 2;

    std::vector<PhysicalDevice> devices;
    devices.reserve(config.adapters);
    for (std::uint8_t i = 0; i < config.adapters; ++i) {
        PhysicalDevice dev;
        dev.properties.description = "Onca Null Adapter " + std::to_string(i);
        dev.properties.api_version = Version(1, 0, 0);
        dev.properties.driver_version = Version(1, 0, 0);
        dev.properties.vendor_id = 0;
        dev.properties.product_id = i;
        dev.properties.dev_type = PhysicalDeviceType::Software;
        dev.memory_info = null_memory_info();
        dev.memory_types = MemoryTypeMask::All;
        dev.capabilities = Capabilities::RasterizerOrderViews | Capabilities::BackgroundShaderRecompilation |
            Capabilities::MinSampleShading;

        for (std::size_t f = 0; f < FORMAT_COUNT; ++f) {
            dev.format_support[f] = null_format_support(format_from_index(f));
        }
        for (std::size_t v = 0; v < VERTEX_FORMAT_COUNT; ++v) {
            const VertexFormat format = vertex_format_from_index(v);
            dev.vertex_format_support[v] = vertex_format_supports_acceleration_structure(format)
                ? VertexFormatSupport::Vertex | VertexFormatSupport::AccelerationStructure
                : VertexFormatSupport::Vertex;
        }
        for (std::size_t type = 0; type < QUEUE_TYPE_COUNT; ++type) {
            dev.queue_infos[type] = QueueInfo{static_cast<std::uint8_t>(type), QueueCount::known(queue_count)};
        }

        dev.handle = std::make_shared<NullPhysicalDevice>(dev.memory_info);
        devices.push_back(std::move(dev));
    }
    return devices;
}

Result<DeviceCreateResult> NullRal::create_device(const PhysicalDevice& phys_dev) {
    if (!dynamic_cast<NullPhysicalDevice*>(phys_dev.handle.get())) {
        return Error(RalError::invalid_parameter("Physical device was not enumerated by the null backend"));
    }

    DeviceCreateResult result;
    result.handle = std::make_unique<NullDevice>(m_context);

    std::uint32_t next_id = 0;
    for (std::size_t type = 0; type < QUEUE_TYPE_COUNT; ++type) {
        const QueueIndex index{phys_dev.queue_infos[type].index};
        const std::uint32_t high_id = next_id++;
        const std::uint32_t normal_id = m_context->config.single_queue ? high_id : next_id++;

        result.queues[type][0] = QueueCreateResult{std::make_unique<NullCommandQueue>(m_context, high_id), index};
        result.queues[type][1] = QueueCreateResult{std::make_unique<NullCommandQueue>(m_context, normal_id), index};
    }

    result.extensions = DeviceExtensions::IncrementalPresent | DeviceExtensions::PresentFence;
    if (!m_context->config.present_mode_recreate) {
        result.extensions |= DeviceExtensions::SwapChainMaintenance1;
    }

    m_context->logger->info("Created null device on '{}'", phys_dev.properties.description);
    return result;
}

} // namespace onca_ral::null
