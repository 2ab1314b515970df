#pragma once

/// @file memory.hpp
/// @brief GPU memory allocation contract for onca_ral
///
/// Resources never allocate GPU memory themselves. The backend computes an ApiMemoryRequest
/// and asks the device's GpuAllocator for a GpuAllocation; the resource hands the allocation
/// back exactly once, after its native object is destroyed.

#include "fwd.hpp"
#include "common.hpp"
#include "physical_device.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <span>

namespace onca_ral {

// =============================================================================
// Allocation Requests
// =============================================================================

enum class MemoryAllocationFlags : std::uint8_t {
    None = 0,
    /// Resource requires its own heap
    Dedicated = 1 << 0,
    /// Memory may be aliased by other resources
    CanAlias = 1 << 1,
};
ONCA_RAL_FLAGS(MemoryAllocationFlags)

/// Caller side of an allocation request
struct GpuAllocationDesc {
    MemoryType memory_type = MemoryType::Gpu;
    MemoryAllocationFlags flags = MemoryAllocationFlags::None;
};

/// Backend side of an allocation request
struct ApiMemoryRequest {
    std::uint64_t size = 0;
    std::uint64_t alignment = MIN_ALLOCATION_ALIGN;
    /// Memory types the native resource can be bound to
    MemoryTypeMask memory_types = MemoryTypeMask::All;
    bool prefer_dedicated = false;
    bool require_dedicated = false;
};

/// GPU virtual address
class GpuAddress {
public:
    constexpr GpuAddress() noexcept = default;
    constexpr explicit GpuAddress(std::uint64_t address) noexcept : m_address(address) {}

    [[nodiscard]] constexpr std::uint64_t raw() const noexcept { return m_address; }

    /// Address `offset` bytes past this one
    [[nodiscard]] constexpr GpuAddress at(std::uint64_t offset) const noexcept { return GpuAddress(m_address + offset); }

    /// Address moved by a signed delta
    [[nodiscard]] constexpr GpuAddress offset(std::int64_t delta) const noexcept {
        return GpuAddress(static_cast<std::uint64_t>(static_cast<std::int64_t>(m_address) + delta));
    }

    constexpr bool operator==(const GpuAddress&) const noexcept = default;

private:
    std::uint64_t m_address = 0;
};

// =============================================================================
// MemoryHeap
// =============================================================================

/// Backend side of a memory heap; releases the native memory on destruction
class MemoryHeapInterface {
public:
    virtual ~MemoryHeapInterface() = default;
};

/// Block of native memory allocations are placed in
class MemoryHeap {
public:
    MemoryHeap(std::unique_ptr<MemoryHeapInterface> handle, std::uint64_t size, MemoryType memory_type, bool msaa_support);
    ~MemoryHeap();

    MemoryHeap(const MemoryHeap&) = delete;
    MemoryHeap& operator=(const MemoryHeap&) = delete;

    [[nodiscard]] std::uint64_t size() const noexcept { return m_size; }
    [[nodiscard]] MemoryType memory_type() const noexcept { return m_memory_type; }
    [[nodiscard]] bool has_msaa_support() const noexcept { return m_msaa_support; }

    /// Backend object, for the backend and command recording only
    [[nodiscard]] MemoryHeapInterface& interface() const noexcept { return *m_handle; }

private:
    std::unique_ptr<MemoryHeapInterface> m_handle;
    std::uint64_t m_size;
    MemoryType m_memory_type;
    bool m_msaa_support;
};

/// Region of a heap backing a resource
struct GpuAllocation {
    Handle<MemoryHeap> heap;
    std::uint64_t offset = 0;
    std::uint64_t size = 0;
    std::uint64_t align = MIN_ALLOCATION_ALIGN;
    MemoryType memory_type = MemoryType::Gpu;
    bool dedicated = false;
};

// =============================================================================
// GpuAllocator
// =============================================================================

/// Allocation strategy, supplied by the application
class GpuAllocatorImpl {
public:
    virtual ~GpuAllocatorImpl() = default;

    [[nodiscard]] virtual Result<GpuAllocation> alloc(Device& device, const MemoryInfo& mem_info,
        const GpuAllocationDesc& desc, const ApiMemoryRequest& request) = 0;

    /// Called exactly once per allocation, after the owning native resource is destroyed
    virtual void free(Device& device, GpuAllocation allocation) = 0;
};

/// Strategy placing every allocation in its own dedicated heap
class DefaultGpuAllocator : public GpuAllocatorImpl {
public:
    [[nodiscard]] Result<GpuAllocation> alloc(Device& device, const MemoryInfo& mem_info,
        const GpuAllocationDesc& desc, const ApiMemoryRequest& request) override;
    void free(Device& device, GpuAllocation allocation) override;
};

/// Device-owned front of the allocation strategy
class GpuAllocator {
public:
    GpuAllocator(WeakHandle<Device> device, MemoryInfo mem_info, MemoryTypeMask memory_types,
        std::unique_ptr<GpuAllocatorImpl> impl);

    [[nodiscard]] const MemoryInfo& memory_info() const noexcept { return m_mem_info; }

    /// Allocate memory for a resource
    ///
    /// Fails with InvalidParameter when the requested memory type is not allowed by the
    /// request or not provided by the device, and with UseAfterDeviceDropped when the device is gone.
    [[nodiscard]] Result<GpuAllocation> alloc(const GpuAllocationDesc& desc, const ApiMemoryRequest& request);

    /// Release an allocation; logs and drops the heap reference when the device is gone
    void free(GpuAllocation allocation);

private:
    WeakHandle<Device> m_device;
    MemoryInfo m_mem_info;
    MemoryTypeMask m_memory_types;
    std::unique_ptr<GpuAllocatorImpl> m_impl;
};

// =============================================================================
// MappedMemory
// =============================================================================

/// CPU view of mapped GPU memory
class MappedMemory {
public:
    enum class Access : std::uint8_t {
        Read,
        Write,
        ReadWrite,
    };

    MappedMemory(Access access, std::uint8_t* ptr, std::uint64_t offset, std::uint64_t size) noexcept
        : m_access(access), m_ptr(ptr), m_offset(offset), m_size(size) {}

    [[nodiscard]] Access access() const noexcept { return m_access; }
    [[nodiscard]] bool is_readable() const noexcept { return m_access != Access::Write; }
    [[nodiscard]] bool is_writable() const noexcept { return m_access != Access::Read; }

    /// Offset into the resource the mapping starts at
    [[nodiscard]] std::uint64_t offset() const noexcept { return m_offset; }
    [[nodiscard]] std::uint64_t size() const noexcept { return m_size; }

    [[nodiscard]] const std::uint8_t* ptr() const noexcept { return m_ptr; }

    /// Writable pointer, nullptr for read-only mappings
    [[nodiscard]] std::uint8_t* mut_ptr() const noexcept { return is_writable() ? m_ptr : nullptr; }

    /// Copy up to `size()` bytes into the mapping, returns the number of bytes written
    std::optional<std::uint64_t> write(std::span<const std::uint8_t> data) noexcept;

    /// Copy up to `size()` bytes out of the mapping, returns the number of bytes read
    std::optional<std::uint64_t> read(std::span<std::uint8_t> dst) const noexcept;

private:
    Access m_access;
    std::uint8_t* m_ptr;
    std::uint64_t m_offset;
    std::uint64_t m_size;
};

} // namespace onca_ral
