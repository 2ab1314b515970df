/// @file buffer.cpp
/// @brief Buffer resources and buffer views

#include <onca_engine/ral/buffer.hpp>
#include <onca_engine/ral/device.hpp>
#include <algorithm>
#include <string>

namespace onca_ral {

// =============================================================================
// Buffer
// =============================================================================

Buffer::Buffer(WeakHandle<Device> device, std::unique_ptr<BufferInterface> handle, GpuAllocation allocation,
        GpuAddress address, BufferDesc desc)
    : m_device(std::move(device))
    , m_handle(std::move(handle))
    , m_allocation(std::move(allocation))
    , m_address(address)
    , m_desc(desc) {}

Buffer::~Buffer() {
    // The native buffer may still reference its memory, so it goes first
    m_handle.reset();

    auto device = m_device.upgrade();
    if (!device) {
        ral_logger()->error("Buffer outlived its device, the allocation cannot be returned to the allocator");
        return;
    }
    (*device)->gpu_allocator().free(std::move(m_allocation));
}

Result<MappedMemory> Buffer::map(std::uint64_t offset, std::uint64_t size) {
#if ONCA_RAL_VALIDATION
    if (offset >= m_desc.size) {
        return Error(RalError::invalid_parameter("Memory map offset out of range, offset: " + std::to_string(offset) +
            ", buffer size: " + std::to_string(m_desc.size)));
    }

    std::lock_guard<std::mutex> lock(m_validation_mutex);
    if (m_validation.is_mapped) {
        return Error(RalError::invalid_parameter("Buffer is already mapped"));
    }
#endif

    const std::uint64_t clamped_size = offset < m_desc.size ? std::min(size, m_desc.size - offset) : 0;
    auto ptr = m_handle->map(m_allocation, offset, clamped_size);
    if (!ptr) {
        return ptr.error();
    }

#if ONCA_RAL_VALIDATION
    m_validation.is_mapped = true;
    m_validation.mapped_ptr = *ptr;
#endif

    const auto access = m_desc.alloc_desc.memory_type == MemoryType::Readback
        ? MappedMemory::Access::Read
        : MappedMemory::Access::Write;
    return MappedMemory(access, *ptr, offset, clamped_size);
}

void Buffer::unmap(const MappedMemory& memory) {
#if ONCA_RAL_VALIDATION
    std::lock_guard<std::mutex> lock(m_validation_mutex);
    if (!m_validation.is_mapped) {
        ral_logger()->error("Trying to unmap memory that's not mapped");
        return;
    }
    if (memory.ptr() != m_validation.mapped_ptr) {
        ral_logger()->error("Trying to unmap memory from another buffer");
        return;
    }
    m_validation.is_mapped = false;
    m_validation.mapped_ptr = nullptr;
#endif

    m_handle->unmap(m_allocation, memory);
}

// =============================================================================
// BufferRange
// =============================================================================

namespace {

Result<void> validate_range(const char* what, std::uint64_t offset, std::uint64_t size, const Buffer& buffer) {
#if ONCA_RAL_VALIDATION
    ONCA_RAL_CHECK_PARAM(offset < buffer.size(),
        std::string(what) + " offset (" + std::to_string(offset) + ") cannot reach the buffer's length (" +
        std::to_string(buffer.size()) + ")");
    ONCA_RAL_CHECK_PARAM(size <= buffer.size() - offset,
        std::string(what) + " end (" + std::to_string(offset) + " + " + std::to_string(size) +
        ") goes past the buffer's length (" + std::to_string(buffer.size()) + ")");
#else
    (void)what;
    (void)offset;
    (void)size;
    (void)buffer;
#endif
    return Ok();
}

// `count * elem_size` may not fit in 64 bits, so the end is checked by division
Result<void> validate_elements(const char* what, std::uint64_t offset, std::uint64_t count, std::uint64_t elem_size,
        const Buffer& buffer) {
#if ONCA_RAL_VALIDATION
    ONCA_RAL_CHECK_PARAM(offset < buffer.size(),
        std::string(what) + " offset (" + std::to_string(offset) + ") cannot reach the buffer's length (" +
        std::to_string(buffer.size()) + ")");
    ONCA_RAL_CHECK_PARAM(count <= (buffer.size() - offset) / elem_size,
        std::string(what) + " end (" + std::to_string(offset) + " + " + std::to_string(count) + " x " +
        std::to_string(elem_size) + ") goes past the buffer's length (" + std::to_string(buffer.size()) + ")");
#else
    (void)what;
    (void)offset;
    (void)count;
    (void)elem_size;
    (void)buffer;
#endif
    return Ok();
}

} // anonymous namespace

std::optional<BufferRange> BufferRange::create(std::uint64_t offset, std::uint64_t size) noexcept {
    if (size == 0 || (size & 0x3) != 0 || (offset & 0x3) != 0) {
        return std::nullopt;
    }
    return BufferRange(offset, size);
}

Result<void> BufferRange::validate(const Buffer& buffer) const {
    return validate_range("Buffer range", m_offset, m_size, buffer);
}

// =============================================================================
// StructuredBufferViewDesc
// =============================================================================

std::optional<StructuredBufferViewDesc> StructuredBufferViewDesc::create(std::uint64_t offset, std::uint64_t count, std::uint64_t elem_size) noexcept {
    if (count == 0 || elem_size == 0 || (elem_size & 0x3) != 0) {
        return std::nullopt;
    }
    return StructuredBufferViewDesc(offset, count, elem_size);
}

Result<void> StructuredBufferViewDesc::validate(const Buffer& buffer) const {
#if ONCA_RAL_VALIDATION
    ONCA_RAL_CHECK_PARAM(m_offset < buffer.size() / m_elem_size,
        "Structured buffer view offset (" + std::to_string(m_offset) + " elements of " + std::to_string(m_elem_size) +
        " bytes) cannot reach the buffer's length (" + std::to_string(buffer.size()) + ")");
#endif
    return validate_elements("Structured buffer view", m_offset * m_elem_size, m_count, m_elem_size, buffer);
}

// =============================================================================
// TexelBufferViewDesc
// =============================================================================

std::optional<TexelBufferViewDesc> TexelBufferViewDesc::create(Format format, std::uint64_t offset, std::uint64_t count) noexcept {
    const std::uint64_t unit = format_unit_byte_size(format);
    if (unit == 0 || count == 0 || offset % unit != 0) {
        return std::nullopt;
    }
    return TexelBufferViewDesc(format, offset, count);
}

std::uint64_t TexelBufferViewDesc::texel_size() const noexcept {
    return format_unit_byte_size(m_format);
}

Result<void> TexelBufferViewDesc::validate(const Buffer& buffer) const {
    return validate_elements("Texel buffer view", m_offset, m_count, texel_size(), buffer);
}

} // namespace onca_ral
