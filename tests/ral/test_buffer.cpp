// onca_ral buffer tests

#include <catch2/catch_test_macros.hpp>
#include "null_fixture.hpp"
#include <array>

using namespace onca_ral;
using onca_test::NullDeviceFixture;
using onca_test::RalLogCapture;

namespace {

BufferDesc make_desc(std::uint64_t size, MemoryType memory_type) {
    BufferDesc desc;
    desc.size = size;
    desc.usages = BufferUsage::CopySrc | BufferUsage::CopyDst;
    desc.alloc_desc.memory_type = memory_type;
    return desc;
}

/// Raw bytes of the heap backing a null buffer
std::uint8_t* heap_bytes(const Buffer& buffer) {
    auto* heap = dynamic_cast<null::NullMemoryHeap*>(&buffer.allocation().heap->interface());
    REQUIRE(heap != nullptr);
    return heap->data() + buffer.allocation().offset;
}

} // namespace

TEST_CASE("Buffer creation", "[ral][buffer]") {
    NullDeviceFixture fixture;
    auto& device = fixture.device;

    SECTION("description is kept") {
        auto buffer = device->create_buffer(make_desc(256, MemoryType::Gpu));
        REQUIRE(buffer.is_ok());
        REQUIRE((*buffer)->size() == 256);
        REQUIRE((*buffer)->memory_type() == MemoryType::Gpu);
        REQUIRE((*buffer)->usages() == (BufferUsage::CopySrc | BufferUsage::CopyDst));
        REQUIRE(fixture.counters().buffers_created.load() == 1);
    }

    SECTION("gpu addresses do not overlap") {
        auto a = device->create_buffer(make_desc(100, MemoryType::Gpu));
        auto b = device->create_buffer(make_desc(100, MemoryType::Gpu));
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());
        REQUIRE((*a)->gpu_address().raw() == 0x1'0000'0000);
        REQUIRE((*b)->gpu_address() == (*a)->gpu_address().at(MIN_ALLOCATION_ALIGN));
    }

    SECTION("destruction returns the allocation") {
        {
            auto buffer = device->create_buffer(make_desc(64, MemoryType::Upload));
            REQUIRE(buffer.is_ok());
            REQUIRE(fixture.counters().heaps_freed.load() == 0);
        }
        REQUIRE(fixture.counters().buffers_destroyed.load() == 1);
        REQUIRE(fixture.counters().heaps_freed.load() == 1);
    }

    SECTION("buffer outliving its device") {
        RalLogCapture log;
        auto buffer = device->create_buffer(make_desc(64, MemoryType::Upload));
        REQUIRE(buffer.is_ok());

        REQUIRE(device->flush().is_ok());
        device.reset();
        buffer->reset();

        REQUIRE(log.contains("Buffer outlived its device"));
        REQUIRE(fixture.counters().buffers_destroyed.load() == 1);
        REQUIRE(fixture.counters().heaps_freed.load() == 1);
    }

#if ONCA_RAL_VALIDATION
    SECTION("zero size is rejected") {
        auto buffer = device->create_buffer(make_desc(0, MemoryType::Upload));
        REQUIRE(buffer.is_err());
        REQUIRE(buffer.error().is_ral(RalError::Kind::InvalidParameter));
        REQUIRE(fixture.counters().buffers_created.load() == 0);
    }
#endif
}

TEST_CASE("Buffer mapping", "[ral][buffer]") {
    NullDeviceFixture fixture;
    auto& device = fixture.device;

    SECTION("upload buffers map write-only") {
        auto buffer = device->create_buffer(make_desc(256, MemoryType::Upload));
        REQUIRE(buffer.is_ok());

        auto mapped = (*buffer)->map(16, 8);
        REQUIRE(mapped.is_ok());
        REQUIRE(mapped->access() == MappedMemory::Access::Write);
        REQUIRE(mapped->offset() == 16);
        REQUIRE(mapped->size() == 8);

        const std::array<std::uint8_t, 4> data{1, 2, 3, 4};
        REQUIRE(mapped->write(data) == 4u);
        (*buffer)->unmap(*mapped);

        const std::uint8_t* bytes = heap_bytes(**buffer);
        REQUIRE(bytes[16] == 1);
        REQUIRE(bytes[19] == 4);
        REQUIRE(fixture.counters().maps.load() == 1);
        REQUIRE(fixture.counters().unmaps.load() == 1);
    }

    SECTION("readback buffers map read-only") {
        auto buffer = device->create_buffer(make_desc(64, MemoryType::Readback));
        REQUIRE(buffer.is_ok());
        heap_bytes(**buffer)[0] = 0xAB;

        auto mapped = (*buffer)->map(0, 64);
        REQUIRE(mapped.is_ok());
        REQUIRE(mapped->access() == MappedMemory::Access::Read);
        REQUIRE(mapped->mut_ptr() == nullptr);

        std::array<std::uint8_t, 1> dst{};
        REQUIRE(mapped->read(dst) == 1u);
        REQUIRE(dst[0] == 0xAB);
        (*buffer)->unmap(*mapped);
    }

    SECTION("size is clamped to the end of the buffer") {
        auto buffer = device->create_buffer(make_desc(256, MemoryType::Upload));
        REQUIRE(buffer.is_ok());

        auto mapped = (*buffer)->map(128, 1000);
        REQUIRE(mapped.is_ok());
        REQUIRE(mapped->size() == 128);
        (*buffer)->unmap(*mapped);
    }

    SECTION("gpu memory cannot be mapped") {
        auto buffer = device->create_buffer(make_desc(256, MemoryType::Gpu));
        REQUIRE(buffer.is_ok());

        auto mapped = (*buffer)->map(0, 16);
        REQUIRE(mapped.is_err());
        REQUIRE(mapped.error().is_ral(RalError::Kind::InvalidParameter));
    }

    SECTION("buffer can be mapped again after unmapping") {
        auto buffer = device->create_buffer(make_desc(64, MemoryType::Upload));
        REQUIRE(buffer.is_ok());

        for (int i = 0; i < 3; ++i) {
            auto mapped = (*buffer)->map(0, 64);
            REQUIRE(mapped.is_ok());
            (*buffer)->unmap(*mapped);
        }
        REQUIRE(fixture.counters().maps.load() == 3);
        REQUIRE(fixture.counters().unmaps.load() == 3);
    }
}

#if ONCA_RAL_VALIDATION

TEST_CASE("Buffer mapping validation", "[ral][buffer][validation]") {
    NullDeviceFixture fixture;
    auto buffer = fixture.device->create_buffer(make_desc(64, MemoryType::Upload));
    REQUIRE(buffer.is_ok());
    Buffer& buf = **buffer;

    SECTION("offset past the end") {
        auto mapped = buf.map(64, 4);
        REQUIRE(mapped.is_err());
        REQUIRE(mapped.error().is_ral(RalError::Kind::InvalidParameter));
        REQUIRE(fixture.counters().maps.load() == 0);
    }

    SECTION("second map is rejected") {
        auto first = buf.map(0, 16);
        REQUIRE(first.is_ok());

        auto second = buf.map(16, 16);
        REQUIRE(second.is_err());
        REQUIRE(second.error().message().find("already mapped") != std::string::npos);
        REQUIRE(fixture.counters().maps.load() == 1);

        buf.unmap(*first);
    }

    SECTION("unmap without a mapping") {
        RalLogCapture log;
        std::array<std::uint8_t, 4> storage{};
        buf.unmap(MappedMemory(MappedMemory::Access::Write, storage.data(), 0, storage.size()));

        REQUIRE(log.contains("Trying to unmap memory that's not mapped"));
        REQUIRE(fixture.counters().unmaps.load() == 0);
    }

    SECTION("unmap of memory from another buffer") {
        auto other = fixture.device->create_buffer(make_desc(64, MemoryType::Upload));
        REQUIRE(other.is_ok());

        auto mine = buf.map(0, 16);
        auto theirs = (*other)->map(0, 16);
        REQUIRE(mine.is_ok());
        REQUIRE(theirs.is_ok());

        RalLogCapture log;
        buf.unmap(*theirs);
        REQUIRE(log.contains("Trying to unmap memory from another buffer"));
        REQUIRE(fixture.counters().unmaps.load() == 0);

        buf.unmap(*mine);
        (*other)->unmap(*theirs);
        REQUIRE(fixture.counters().unmaps.load() == 2);
    }
}

#else

TEST_CASE("Buffer mapping without validation", "[ral][buffer]") {
    NullDeviceFixture fixture;
    auto buffer = fixture.device->create_buffer(make_desc(64, MemoryType::Upload));
    REQUIRE(buffer.is_ok());
    Buffer& buf = **buffer;

    SECTION("double map reaches the backend") {
        auto first = buf.map(0, 16);
        auto second = buf.map(16, 16);
        REQUIRE(first.is_ok());
        REQUIRE(second.is_ok());
        REQUIRE(fixture.counters().maps.load() == 2);
    }

    SECTION("unmap is forwarded unchecked") {
        std::array<std::uint8_t, 4> storage{};
        buf.unmap(MappedMemory(MappedMemory::Access::Write, storage.data(), 0, storage.size()));
        REQUIRE(fixture.counters().unmaps.load() == 1);
    }
}

#endif
