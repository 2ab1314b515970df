/// @file memory.cpp
/// @brief GPU memory allocation for onca_ral

#include <onca_engine/ral/memory.hpp>
#include <onca_engine/ral/device.hpp>
#include <algorithm>
#include <cstring>

namespace onca_ral {

// =============================================================================
// MemoryHeap
// =============================================================================

MemoryHeap::MemoryHeap(std::unique_ptr<MemoryHeapInterface> handle, std::uint64_t size, MemoryType memory_type, bool msaa_support)
    : m_handle(std::move(handle))
    , m_size(size)
    , m_memory_type(memory_type)
    , m_msaa_support(msaa_support) {}

MemoryHeap::~MemoryHeap() = default;

// =============================================================================
// DefaultGpuAllocator
// =============================================================================

Result<GpuAllocation> DefaultGpuAllocator::alloc(Device& device, const MemoryInfo& /*mem_info*/,
        const GpuAllocationDesc& desc, const ApiMemoryRequest& request) {
    const bool msaa_support = request.alignment >= MIN_MSAA_ALLOCATION_ALIGN;
    auto heap = device.allocate_heap(request.size, msaa_support, desc.memory_type);
    if (!heap) {
        return heap.error();
    }

    GpuAllocation allocation;
    allocation.heap = std::move(*heap);
    allocation.offset = 0;
    allocation.size = request.size;
    allocation.align = request.alignment;
    allocation.memory_type = desc.memory_type;
    allocation.dedicated = true;
    return allocation;
}

void DefaultGpuAllocator::free(Device& device, GpuAllocation allocation) {
    if (!allocation.dedicated) {
        ral_logger()->error("DefaultGpuAllocator cannot free a non-dedicated allocation, dropping the heap reference");
    }
    device.free_heap(std::move(allocation.heap));
}

// =============================================================================
// GpuAllocator
// =============================================================================

GpuAllocator::GpuAllocator(WeakHandle<Device> device, MemoryInfo mem_info, MemoryTypeMask memory_types,
        std::unique_ptr<GpuAllocatorImpl> impl)
    : m_device(std::move(device))
    , m_mem_info(mem_info)
    , m_memory_types(memory_types)
    , m_impl(impl ? std::move(impl) : std::make_unique<DefaultGpuAllocator>()) {}

Result<GpuAllocation> GpuAllocator::alloc(const GpuAllocationDesc& desc, const ApiMemoryRequest& request) {
    const MemoryTypeMask type_mask = to_mask(desc.memory_type);
    if (!has_flag(request.memory_types, type_mask)) {
        return Error(RalError::invalid_parameter(
            std::string("Memory type '") + memory_type_name(desc.memory_type) + "' is not allowed for the allocation"));
    }
    if (!has_flag(m_memory_types, type_mask)) {
        return Error(RalError::invalid_parameter(
            std::string("Memory type '") + memory_type_name(desc.memory_type) + "' is not supported by the device"));
    }

    auto device = m_device.upgrade();
    if (!device) {
        return Error(RalError::use_after_device_dropped());
    }
    return m_impl->alloc(**device, m_mem_info, desc, request);
}

void GpuAllocator::free(GpuAllocation allocation) {
    auto device = m_device.upgrade();
    if (!device) {
        ral_logger()->error("Freeing a GPU allocation after its device was dropped");
        return;
    }
    m_impl->free(**device, std::move(allocation));
}

// =============================================================================
// MappedMemory
// =============================================================================

std::optional<std::uint64_t> MappedMemory::write(std::span<const std::uint8_t> data) noexcept {
    if (!is_writable()) {
        return std::nullopt;
    }
    const std::uint64_t len = std::min<std::uint64_t>(data.size(), m_size);
    std::memcpy(m_ptr, data.data(), static_cast<std::size_t>(len));
    return len;
}

std::optional<std::uint64_t> MappedMemory::read(std::span<std::uint8_t> dst) const noexcept {
    if (!is_readable()) {
        return std::nullopt;
    }
    const std::uint64_t len = std::min<std::uint64_t>(dst.size(), m_size);
    std::memcpy(dst.data(), m_ptr, static_cast<std::size_t>(len));
    return len;
}

} // namespace onca_ral
