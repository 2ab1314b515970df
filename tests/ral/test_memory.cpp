// onca_ral memory allocation tests

#include <catch2/catch_test_macros.hpp>
#include "null_fixture.hpp"
#include <array>
#include <vector>

using namespace onca_ral;
using onca_test::NullDeviceFixture;
using onca_test::NullRalFixture;

namespace {

constexpr std::uint64_t GIB = 1024ull * 1024 * 1024;

/// Forwards to DefaultGpuAllocator and records what it was asked to do
class RecordingAllocator : public GpuAllocatorImpl {
public:
    struct Log {
        std::vector<std::uint64_t> alloc_sizes;
        std::size_t frees = 0;
        /// Native buffers destroyed when each free happened
        std::vector<std::uint64_t> buffers_destroyed_at_free;
    };

    RecordingAllocator(Log& log, const null::NullCounters& counters)
        : m_log(log), m_counters(counters) {}

    Result<GpuAllocation> alloc(Device& device, const MemoryInfo& mem_info,
            const GpuAllocationDesc& desc, const ApiMemoryRequest& request) override {
        m_log.alloc_sizes.push_back(request.size);
        return m_default.alloc(device, mem_info, desc, request);
    }

    void free(Device& device, GpuAllocation allocation) override {
        ++m_log.frees;
        m_log.buffers_destroyed_at_free.push_back(m_counters.buffers_destroyed.load());
        m_default.free(device, std::move(allocation));
    }

private:
    Log& m_log;
    const null::NullCounters& m_counters;
    DefaultGpuAllocator m_default;
};

BufferDesc upload_buffer(std::uint64_t size) {
    BufferDesc desc;
    desc.size = size;
    desc.usages = BufferUsage::CopySrc;
    desc.alloc_desc.memory_type = MemoryType::Upload;
    return desc;
}

} // namespace

TEST_CASE("Memory helpers", "[ral][memory]") {
    SECTION("alignment") {
        REQUIRE(align_up(0, 64) == 0);
        REQUIRE(align_up(1, 64) == 64);
        REQUIRE(align_up(64, 64) == 64);
        REQUIRE(align_up(100, MIN_ALLOCATION_ALIGN) == MIN_ALLOCATION_ALIGN);
        REQUIRE(is_power_of_two(MIN_MSAA_ALLOCATION_ALIGN));
        REQUIRE_FALSE(is_power_of_two(0));
        REQUIRE_FALSE(is_power_of_two(96));
    }

    SECTION("memory type masks") {
        REQUIRE(to_mask(MemoryType::Gpu) == MemoryTypeMask::Gpu);
        REQUIRE(to_mask(MemoryType::Readback) == MemoryTypeMask::Readback);
        REQUIRE(has_flag(MemoryTypeMask::All, to_mask(MemoryType::Upload)));
        REQUIRE_FALSE(has_flag(MemoryTypeMask::Gpu | MemoryTypeMask::Readback, to_mask(MemoryType::Upload)));
        REQUIRE(has_any_flag(MemoryTypeMask::Gpu | MemoryTypeMask::Readback, MemoryTypeMask::Readback | MemoryTypeMask::Upload));
    }

    SECTION("gpu addresses") {
        const GpuAddress base(0x1000);
        REQUIRE(base.at(0x20).raw() == 0x1020);
        REQUIRE(base.offset(-0x800).raw() == 0x800);
        REQUIRE(GpuAddress().raw() == 0);
        REQUIRE(base.at(0x10) == GpuAddress(0x1010));
    }
}

TEST_CASE("Mapped memory access", "[ral][memory]") {
    std::array<std::uint8_t, 8> storage{};

    SECTION("write-only mapping") {
        MappedMemory memory(MappedMemory::Access::Write, storage.data(), 0, 4);
        REQUIRE(memory.is_writable());
        REQUIRE_FALSE(memory.is_readable());
        REQUIRE(memory.mut_ptr() == storage.data());

        const std::array<std::uint8_t, 6> data{9, 8, 7, 6, 5, 4};
        REQUIRE(memory.write(data) == 4u);
        REQUIRE(storage[3] == 6);
        REQUIRE(storage[4] == 0);

        std::array<std::uint8_t, 4> dst{};
        REQUIRE_FALSE(memory.read(dst).has_value());
    }

    SECTION("read-only mapping") {
        storage[0] = 42;
        MappedMemory memory(MappedMemory::Access::Read, storage.data(), 16, 8);
        REQUIRE(memory.offset() == 16);
        REQUIRE(memory.mut_ptr() == nullptr);

        const std::array<std::uint8_t, 1> data{1};
        REQUIRE_FALSE(memory.write(data).has_value());

        std::array<std::uint8_t, 2> dst{};
        REQUIRE(memory.read(dst) == 2u);
        REQUIRE(dst[0] == 42);
    }
}

TEST_CASE("Default allocator places every allocation in its own heap", "[ral][memory]") {
    NullDeviceFixture fixture;
    auto& device = fixture.device;

    {
        auto a = device->create_buffer(upload_buffer(100));
        auto b = device->create_buffer(upload_buffer(200));
        REQUIRE(a.is_ok());
        REQUIRE(b.is_ok());

        const GpuAllocation& alloc = (*a)->allocation();
        REQUIRE(alloc.dedicated);
        REQUIRE(alloc.offset == 0);
        REQUIRE(alloc.size == 100);
        REQUIRE(alloc.memory_type == MemoryType::Upload);
        REQUIRE(alloc.heap->size() == MIN_ALLOCATION_ALIGN);
        REQUIRE(alloc.heap->memory_type() == MemoryType::Upload);
        REQUIRE_FALSE(alloc.heap->has_msaa_support());
        REQUIRE_FALSE(alloc.heap.ptr_eq((*b)->allocation().heap));

        REQUIRE(fixture.counters().heaps_allocated.load() == 2);
    }
    REQUIRE(fixture.counters().heaps_freed.load() == 2);
}

TEST_CASE("Heaps", "[ral][memory]") {
    NullDeviceFixture fixture;
    auto& device = fixture.device;

    SECTION("size is aligned") {
        auto heap = device->allocate_heap(1000, false, MemoryType::Gpu);
        REQUIRE(heap.is_ok());
        REQUIRE((*heap)->size() == MIN_ALLOCATION_ALIGN);
    }

    SECTION("msaa heaps use the larger alignment") {
        auto heap = device->allocate_heap(MIN_ALLOCATION_ALIGN + 1, true, MemoryType::Gpu);
        REQUIRE(heap.is_ok());
        REQUIRE((*heap)->size() == MIN_MSAA_ALLOCATION_ALIGN);
        REQUIRE((*heap)->has_msaa_support());
    }

    SECTION("free releases the memory with the last reference") {
        auto heap = device->allocate_heap(64, false, MemoryType::Readback);
        REQUIRE(heap.is_ok());
        Handle<MemoryHeap> extra = *heap;

        device->free_heap(std::move(*heap));
        REQUIRE(fixture.counters().heaps_freed.load() == 0);

        extra.reset();
        REQUIRE(fixture.counters().heaps_freed.load() == 1);
    }
}

TEST_CASE("Custom allocator strategy", "[ral][memory]") {
    NullRalFixture fixture;
    auto adapters = fixture.ral->get_physical_devices();
    REQUIRE(adapters.is_ok());

    RecordingAllocator::Log log;
    auto device = fixture.ral->create_device(adapters->front(),
        std::make_unique<RecordingAllocator>(log, fixture.counters()));
    REQUIRE(device.is_ok());

    {
        auto buffer = (*device)->create_buffer(upload_buffer(512));
        REQUIRE(buffer.is_ok());
        REQUIRE(log.alloc_sizes.size() == 1);
        REQUIRE(log.alloc_sizes[0] == 512);
        REQUIRE(log.frees == 0);
    }

    // Freed exactly once, after the native buffer was destroyed
    REQUIRE(log.frees == 1);
    REQUIRE(log.buffers_destroyed_at_free[0] == 1);
}

TEST_CASE("Allocation memory type checks", "[ral][memory]") {
    SECTION("request does not allow the memory type") {
        NullDeviceFixture fixture;
        GpuAllocationDesc desc;
        desc.memory_type = MemoryType::Readback;
        ApiMemoryRequest request;
        request.size = 128;
        request.memory_types = MemoryTypeMask::Gpu | MemoryTypeMask::Upload;

        auto allocation = fixture.device->gpu_allocator().alloc(desc, request);
        REQUIRE(allocation.is_err());
        REQUIRE(allocation.error().is_ral(RalError::Kind::InvalidParameter));
        REQUIRE(fixture.counters().heaps_allocated.load() == 0);
    }

    SECTION("device does not provide the memory type") {
        NullRalFixture fixture;
        auto adapters = fixture.ral->get_physical_devices();
        REQUIRE(adapters.is_ok());

        PhysicalDevice gpu_only = adapters->front();
        gpu_only.memory_types = MemoryTypeMask::Gpu;
        auto device = fixture.ral->create_device(gpu_only);
        REQUIRE(device.is_ok());

        auto buffer = (*device)->create_buffer(upload_buffer(64));
        REQUIRE(buffer.is_err());
        REQUIRE(buffer.error().is_ral(RalError::Kind::InvalidParameter));
        REQUIRE(buffer.error().message().find("not supported by the device") != std::string::npos);
        REQUIRE(fixture.counters().buffers_created.load() == 0);
    }
}

TEST_CASE("Memory budget", "[ral][memory]") {
    NullRalFixture fixture;
    auto adapters = fixture.ral->get_physical_devices();
    REQUIRE(adapters.is_ok());
    const PhysicalDevice& dev = adapters->front();

    SECTION("budget per heap") {
        auto budget = dev.memory_budget();
        REQUIRE(budget.is_ok());
        REQUIRE(budget->budgets[0].budget == 4 * GIB);
        REQUIRE(budget->budgets[0].available_reservation == 2 * GIB);
        REQUIRE(budget->budgets[1].budget == 8 * GIB);
        REQUIRE(budget->budgets[2].budget == 0);
        REQUIRE(budget->total.budget == 12 * GIB);
    }

    SECTION("reservation") {
        REQUIRE(dev.reserve_memory(1, GIB).is_ok());
        auto budget = dev.memory_budget();
        REQUIRE(budget.is_ok());
        REQUIRE(budget->budgets[1].reserved == GIB);
        REQUIRE(budget->total.reserved == GIB);
    }

    SECTION("reservation failures") {
        auto too_much = dev.reserve_memory(0, 3 * GIB);
        REQUIRE(too_much.is_err());
        REQUIRE(too_much.error().is_ral(RalError::Kind::OutOfDeviceMemory));

        REQUIRE(dev.reserve_memory(5, 1).error().is_ral(RalError::Kind::InvalidParameter));
        REQUIRE(dev.reserve_memory(16, 1).error().is_ral(RalError::Kind::InvalidParameter));
    }

    SECTION("backend without a budget query") {
        PhysicalDevice detached = dev;
        detached.handle.reset();
        REQUIRE(detached.memory_budget().error().is_ral(RalError::Kind::NotImplemented));
    }

    SECTION("memory layout") {
        REQUIRE(has_flag(dev.memory_info.types[0].flags, MemoryTypeFlags::DeviceLocal));
        REQUIRE(has_flag(dev.memory_info.types[2].flags, MemoryTypeFlags::HostCached));
        REQUIRE(dev.memory_info.types[2].heap_index == 1);
        REQUIRE_FALSE(dev.memory_info.types[3].is_valid());
        REQUIRE(dev.memory_info.heaps[0].flags == MemoryHeapFlags::DeviceLocal);
    }
}
