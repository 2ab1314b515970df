#pragma once

/// @file buffer.hpp
/// @brief Linear GPU memory resources and buffer views

#include "fwd.hpp"
#include "common.hpp"
#include "format.hpp"
#include "memory.hpp"
#include <memory>
#include <mutex>
#include <optional>

namespace onca_ral {

// =============================================================================
// Buffer Description
// =============================================================================

enum class BufferUsage : std::uint16_t {
    None = 0,
    CopySrc = 1 << 0,
    CopyDst = 1 << 1,
    ConstantTexelBuffer = 1 << 2,
    StorageTexelBuffer = 1 << 3,
    ConstantBuffer = 1 << 4,
    StorageBuffer = 1 << 5,
    IndexBuffer = 1 << 6,
    VertexBuffer = 1 << 7,
    IndirectBuffer = 1 << 8,
    ConditionalRendering = 1 << 9,
};
ONCA_RAL_FLAGS(BufferUsage)

struct BufferDesc {
    std::uint64_t size = 0;
    BufferUsage usages = BufferUsage::None;
    GpuAllocationDesc alloc_desc;
};

// =============================================================================
// Buffer
// =============================================================================

/// Backend side of a buffer; destroys the native buffer on destruction
class BufferInterface {
public:
    virtual ~BufferInterface() = default;

    /// Map `size` bytes at `offset`, returns the CPU address of `offset`
    [[nodiscard]] virtual Result<std::uint8_t*> map(const GpuAllocation& allocation, std::uint64_t offset, std::uint64_t size) = 0;
    virtual void unmap(const GpuAllocation& allocation, const MappedMemory& memory) = 0;
};

/// Linear GPU memory resource
///
/// Only one mapping can be live at a time. Validation builds reject a second `map()` and
/// log unmaps of memory this buffer did not hand out; other builds leave it to the backend.
class Buffer {
public:
    Buffer(WeakHandle<Device> device, std::unique_ptr<BufferInterface> handle, GpuAllocation allocation,
        GpuAddress address, BufferDesc desc);

    /// Destroys the native buffer, then returns the allocation to the device's allocator
    ~Buffer();

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    [[nodiscard]] std::uint64_t size() const noexcept { return m_desc.size; }
    [[nodiscard]] BufferUsage usages() const noexcept { return m_desc.usages; }
    [[nodiscard]] MemoryType memory_type() const noexcept { return m_desc.alloc_desc.memory_type; }
    [[nodiscard]] const BufferDesc& desc() const noexcept { return m_desc; }
    [[nodiscard]] GpuAddress gpu_address() const noexcept { return m_address; }
    [[nodiscard]] const GpuAllocation& allocation() const noexcept { return m_allocation; }

    /// Map a range of the buffer
    ///
    /// The size is clamped to the end of the buffer. Readback buffers map read-only,
    /// every other memory type maps write-only.
    [[nodiscard]] Result<MappedMemory> map(std::uint64_t offset, std::uint64_t size);

    /// Unmap memory returned by `map()`
    void unmap(const MappedMemory& memory);

    [[nodiscard]] BufferInterface& interface() const noexcept { return *m_handle; }

private:
#if ONCA_RAL_VALIDATION
    struct ValidationData {
        bool is_mapped = false;
        const std::uint8_t* mapped_ptr = nullptr;
    };
#endif

    WeakHandle<Device> m_device;
    std::unique_ptr<BufferInterface> m_handle;
    GpuAllocation m_allocation;
    GpuAddress m_address;
    BufferDesc m_desc;
#if ONCA_RAL_VALIDATION
    std::mutex m_validation_mutex;
    ValidationData m_validation;
#endif
};

// =============================================================================
// Buffer Views
// =============================================================================

/// Byte range of a buffer, offset and size are multiples of 4 and the size is never 0
class BufferRange {
public:
    [[nodiscard]] static std::optional<BufferRange> create(std::uint64_t offset, std::uint64_t size) noexcept;

    [[nodiscard]] std::uint64_t offset() const noexcept { return m_offset; }
    [[nodiscard]] std::uint64_t size() const noexcept { return m_size; }

    /// Check that the range lies inside the buffer
    [[nodiscard]] Result<void> validate(const Buffer& buffer) const;

private:
    BufferRange(std::uint64_t offset, std::uint64_t size) noexcept : m_offset(offset), m_size(size) {}

    std::uint64_t m_offset;
    std::uint64_t m_size;
};

/// View of a buffer as an array of structures
class StructuredBufferViewDesc {
public:
    /// `offset` is in elements; the element size must be a non-zero multiple of 4 and the count non-zero
    [[nodiscard]] static std::optional<StructuredBufferViewDesc> create(std::uint64_t offset, std::uint64_t count, std::uint64_t elem_size) noexcept;

    [[nodiscard]] std::uint64_t offset() const noexcept { return m_offset; }
    [[nodiscard]] std::uint64_t count() const noexcept { return m_count; }
    [[nodiscard]] std::uint64_t elem_size() const noexcept { return m_elem_size; }

    [[nodiscard]] Result<void> validate(const Buffer& buffer) const;

private:
    StructuredBufferViewDesc(std::uint64_t offset, std::uint64_t count, std::uint64_t elem_size) noexcept
        : m_offset(offset), m_count(count), m_elem_size(elem_size) {}

    std::uint64_t m_offset;
    std::uint64_t m_count;
    std::uint64_t m_elem_size;
};

/// View of a buffer as typed texels
class TexelBufferViewDesc {
public:
    /// `offset` is in bytes and must be aligned to the format's texel size; `count` is in texels.
    /// Block-compressed formats are rejected
    [[nodiscard]] static std::optional<TexelBufferViewDesc> create(Format format, std::uint64_t offset, std::uint64_t count) noexcept;

    [[nodiscard]] Format format() const noexcept { return m_format; }
    [[nodiscard]] std::uint64_t offset() const noexcept { return m_offset; }
    [[nodiscard]] std::uint64_t count() const noexcept { return m_count; }
    [[nodiscard]] std::uint64_t texel_size() const noexcept;

    [[nodiscard]] Result<void> validate(const Buffer& buffer) const;

private:
    TexelBufferViewDesc(Format format, std::uint64_t offset, std::uint64_t count) noexcept
        : m_format(format), m_offset(offset), m_count(count) {}

    Format m_format;
    std::uint64_t m_offset;
    std::uint64_t m_count;
};

} // namespace onca_ral
