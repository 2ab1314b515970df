#pragma once

/// @file null_ral.hpp
/// @brief Null RAL backend for testing and headless operation
///
/// The null backend performs no GPU work. Heaps are CPU memory, so buffer mapping really
/// reads and writes bytes; adapters, queues and swap chains are deterministic and driven by
/// the `null` settings table. Every backend entry point bumps a counter in NullCounters so
/// tests can tell whether a call reached the backend.
///
/// Settings (`null` table, all optional):
/// - `adapters`: number of reported adapters (default 1)
/// - `single-queue`: one native queue per family, so High and Normal alias (default false)
/// - `min-extent` / `max-extent`: swap-chain extent clamping (default 1 / 16384)
/// - `min-backbuffers` / `max-backbuffers`: backbuffer count clamping (default 2 / 8)
/// - `present-mode-recreate`: present-mode changes need a swap-chain recreation (default false)
/// - `present-modes`: supported present modes, `"immediate" | "mailbox" | "fifo"` (default all)

#include <onca_engine/ral/api.hpp>
#include <atomic>
#include <condition_variable>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <vector>

namespace onca_ral::null {

// =============================================================================
// Configuration & Counters
// =============================================================================

struct NullConfig {
    std::uint8_t adapters = 1;
    bool single_queue = false;
    std::uint16_t min_extent = 1;
    std::uint16_t max_extent = 16384;
    std::uint8_t min_backbuffers = 2;
    std::uint8_t max_backbuffers = MAX_BACKBUFFERS;
    bool present_mode_recreate = false;
    /// Image count handed out on recreation and resize, 0 keeps the current count
    std::uint8_t recreate_backbuffers = 0;
    std::vector<PresentMode> present_modes{PresentMode::Immediate, PresentMode::Mailbox, PresentMode::Fifo};

    /// Read the `null` settings table
    [[nodiscard]] static Result<NullConfig> from_json(const nlohmann::json& j);

    [[nodiscard]] bool supports_present_mode(PresentMode mode) const;
};

/// Number of calls that reached the backend
struct NullCounters {
    std::atomic<std::uint64_t> maps{0};
    std::atomic<std::uint64_t> unmaps{0};
    std::atomic<std::uint64_t> buffers_created{0};
    std::atomic<std::uint64_t> buffers_destroyed{0};
    std::atomic<std::uint64_t> textures_created{0};
    std::atomic<std::uint64_t> textures_destroyed{0};
    std::atomic<std::uint64_t> heaps_allocated{0};
    std::atomic<std::uint64_t> heaps_freed{0};
    std::atomic<std::uint64_t> swap_chains_created{0};
    std::atomic<std::uint64_t> swap_chain_recreates{0};
    std::atomic<std::uint64_t> swap_chain_resizes{0};
    std::atomic<std::uint64_t> presents{0};
    std::atomic<std::uint64_t> acquires{0};
    std::atomic<std::uint64_t> queue_flushes{0};
};

/// State shared by every object of one null RAL instance
struct NullContext {
    NullConfig config;
    NullCounters counters;
    std::pmr::memory_resource* memory = std::pmr::get_default_resource();
    AllocatorId allocator_id = DEFAULT_ALLOCATOR_ID;
    std::shared_ptr<spdlog::logger> logger;
    std::atomic<std::uint64_t> next_address{0x1'0000'0000};
};

using NullContextPtr = std::shared_ptr<NullContext>;

// =============================================================================
// Memory & Resources
// =============================================================================

class NullMemoryHeap : public MemoryHeapInterface {
public:
    NullMemoryHeap(NullContextPtr context, std::uint64_t size);
    ~NullMemoryHeap() override;

    [[nodiscard]] std::uint8_t* data() noexcept { return m_memory.data(); }
    [[nodiscard]] std::uint64_t size() const noexcept { return m_memory.size(); }

private:
    NullContextPtr m_context;
    std::pmr::vector<std::uint8_t> m_memory;
};

class NullBuffer : public BufferInterface {
public:
    explicit NullBuffer(NullContextPtr context);
    ~NullBuffer() override;

    [[nodiscard]] Result<std::uint8_t*> map(const GpuAllocation& allocation, std::uint64_t offset, std::uint64_t size) override;
    void unmap(const GpuAllocation& allocation, const MappedMemory& memory) override;

private:
    NullContextPtr m_context;
};

class NullTexture : public TextureInterface {
public:
    NullTexture(NullContextPtr context, bool is_backbuffer);
    ~NullTexture() override;

    [[nodiscard]] bool is_backbuffer() const noexcept { return m_is_backbuffer; }

private:
    NullContextPtr m_context;
    bool m_is_backbuffer;
};

class NullRenderTargetView : public RenderTargetViewInterface {};

// =============================================================================
// Queues & Synchronization
// =============================================================================

class NullCommandQueue : public CommandQueueInterface {
public:
    NullCommandQueue(NullContextPtr context, std::uint32_t native_id);

    [[nodiscard]] Result<void> flush() override;

    /// Identifies the simulated native queue; aliased slots share an id
    [[nodiscard]] std::uint32_t native_id() const noexcept { return m_native_id; }

private:
    NullContextPtr m_context;
    std::uint32_t m_native_id;
};

class NullCommandPool : public CommandPoolInterface {
public:
    [[nodiscard]] Result<void> reset() override;

    [[nodiscard]] std::uint64_t reset_count() const noexcept { return m_resets; }

private:
    std::uint64_t m_resets = 0;
};

class NullFence : public FenceInterface {
public:
    [[nodiscard]] Result<std::uint64_t> get_value() const override;
    [[nodiscard]] Result<void> signal(std::uint64_t value) override;
    [[nodiscard]] Result<bool> wait(std::uint64_t value, std::chrono::nanoseconds timeout) override;
    [[nodiscard]] Result<bool> wait_multiple(std::span<const FenceWait> fences, bool wait_for_all,
        std::chrono::nanoseconds timeout) override;

private:
    mutable std::mutex m_mutex;
    std::condition_variable m_cond;
    std::uint64_t m_value = 0;
};

// =============================================================================
// SwapChain
// =============================================================================

class NullSwapChain : public SwapChainInterface {
public:
    NullSwapChain(NullContextPtr context, std::uint8_t num_backbuffers);

    /// Pick format, extent, backbuffer count and present mode for a swap chain
    [[nodiscard]] static Result<SwapChainResultInfo> create(NullContextPtr context, const PhysicalDevice& phys_dev,
        const SwapChainDesc& desc);

    [[nodiscard]] Result<void> present(PresentMode present_mode, std::uint8_t backbuffer_index,
        const CommandQueue& queue, const PresentInfo& present_info) override;
    [[nodiscard]] Result<std::uint8_t> acquire_next_backbuffer() override;
    [[nodiscard]] bool needs_present_mode_recreate() const override;
    [[nodiscard]] Result<SwapChainRecreateResultInfo> recreate_swapchain(const PhysicalDevice& phys_dev,
        const SwapChainChangeParams& params) override;
    [[nodiscard]] Result<SwapChainResizeResultInfo> resize(const PhysicalDevice& phys_dev,
        const SwapChainChangeParams& params) override;

    /// Make the next recreation or resize fail with a backend error
    void fail_next_recreate() noexcept { m_fail_next_recreate = true; }

    [[nodiscard]] PresentMode last_present_mode() const noexcept { return m_last_present_mode.load(); }

private:
    [[nodiscard]] std::uint8_t rebuilt_backbuffer_count(std::uint8_t requested) const;

    NullContextPtr m_context;
    std::uint8_t m_num_backbuffers;
    std::uint8_t m_next_index = 0;
    std::atomic<PresentMode> m_last_present_mode{PresentMode::Fifo};
    std::atomic<bool> m_fail_next_recreate{false};
};

// =============================================================================
// Device & RAL
// =============================================================================

class NullPhysicalDevice : public PhysicalDeviceInterface {
public:
    explicit NullPhysicalDevice(const MemoryInfo& mem_info);

    [[nodiscard]] Result<MemoryBudgetInfo> get_memory_budget_info() const override;
    [[nodiscard]] Result<void> reserve_memory(std::uint8_t heap_index, std::uint64_t bytes) override;

private:
    mutable std::mutex m_mutex;
    MemoryInfo m_mem_info;
    std::array<std::uint64_t, MAX_MEMORY_HEAPS> m_reserved{};
};

class NullDevice : public DeviceInterface {
public:
    explicit NullDevice(NullContextPtr context);

    [[nodiscard]] Result<SwapChainResultInfo> create_swap_chain(const PhysicalDevice& phys_dev, const SwapChainDesc& desc) override;
    [[nodiscard]] Result<std::unique_ptr<CommandPoolInterface>> create_command_pool(CommandListType list_type, CommandPoolFlags flags) override;
    [[nodiscard]] Result<std::unique_ptr<FenceInterface>> create_fence() override;
    [[nodiscard]] Result<BufferCreateResult> create_buffer(const BufferDesc& desc, GpuAllocator& allocator) override;
    [[nodiscard]] Result<TextureCreateResult> create_texture(const TextureDesc& desc, GpuAllocator& allocator) override;
    [[nodiscard]] Result<void> flush(const QueueMatrix& queues) override;
    [[nodiscard]] Result<std::unique_ptr<MemoryHeapInterface>> allocate_heap(std::uint64_t size, std::uint64_t alignment,
        MemoryType memory_type, const MemoryInfo& mem_info) override;

private:
    NullContextPtr m_context;
};

class NullRal : public RalInterface {
public:
    NullRal(Settings settings, NullContextPtr context);
    ~NullRal() override;

    /// Create a null RAL from the host's create info
    [[nodiscard]] static Result<std::unique_ptr<NullRal>> create(const RalCreateInfo& create_info);

    [[nodiscard]] const Settings& settings() const override { return m_settings; }
    [[nodiscard]] Result<std::vector<PhysicalDevice>> get_physical_devices() override;
    [[nodiscard]] Result<DeviceCreateResult> create_device(const PhysicalDevice& phys_dev) override;

    [[nodiscard]] const NullConfig& config() const noexcept { return m_context->config; }
    [[nodiscard]] const NullCounters& counters() const noexcept { return m_context->counters; }
    [[nodiscard]] const NullContextPtr& context() const noexcept { return m_context; }

private:
    Settings m_settings;
    NullContextPtr m_context;
};

} // namespace onca_ral::null
