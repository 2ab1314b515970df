// onca_ral device, queue and physical device tests

// First, so the header has to stand on its own
#include <onca_engine/ral/device.hpp>
#include <catch2/catch_test_macros.hpp>
#include "null_fixture.hpp"

using namespace onca_ral;
using onca_test::NullDeviceFixture;
using onca_test::NullRalFixture;

namespace {

std::uint32_t native_queue_id(const Handle<CommandQueue>& queue) {
    auto* null_queue = dynamic_cast<null::NullCommandQueue*>(&queue->interface());
    REQUIRE(null_queue != nullptr);
    return null_queue->native_id();
}

} // namespace

TEST_CASE("Physical device enumeration", "[ral][device]") {
    NullRalFixture fixture({{"adapters", 3}});

    auto adapters = fixture.ral->get_physical_devices();
    REQUIRE(adapters.is_ok());
    REQUIRE(adapters->size() == 3);

    SECTION("properties") {
        const PhysicalDevice& dev = (*adapters)[2];
        REQUIRE(dev.properties.description == "Onca Null Adapter 2");
        REQUIRE(dev.properties.product_id == 2);
        REQUIRE(dev.properties.dev_type == PhysicalDeviceType::Software);
        REQUIRE(dev.memory_types == MemoryTypeMask::All);
        REQUIRE(has_flag(dev.capabilities, Capabilities::RasterizerOrderViews));
    }

    SECTION("format support") {
        const PhysicalDevice& dev = adapters->front();
        REQUIRE(dev.supports_format(Format::B8G8R8A8UNorm, FormatSupport::Display));
        REQUIRE(dev.supports_format(Format::R8G8B8A8UNorm, FormatSupport::RenderTarget | FormatSupport::Sampled));
        REQUIRE(dev.supports_format(Format::R32UInt, FormatSupport::Atomics));
        REQUIRE(dev.supports_format(Format::D32SFloat, FormatSupport::DepthStencil));
        REQUIRE(dev.supports_format(Format::BC1UNorm, FormatSupport::Sampled));
        REQUIRE_FALSE(dev.supports_format(Format::BC1UNorm, FormatSupport::RenderTarget));
        REQUIRE_FALSE(dev.supports_format(Format::R8UNorm, FormatSupport::Display));
        REQUIRE(dev.get_format_support(Format::R8G8B8A8Typeless) == FormatSupport::None);
    }

    SECTION("vertex format support") {
        const PhysicalDevice& dev = adapters->front();
        const auto position = dev.vertex_format_support[static_cast<std::size_t>(VertexFormat::X32Y32Z32SFloat)];
        REQUIRE(has_flag(position, VertexFormatSupport::AccelerationStructure));
        const auto color = dev.vertex_format_support[static_cast<std::size_t>(VertexFormat::X8Y8Z8W8UInt)];
        REQUIRE(color == VertexFormatSupport::Vertex);
    }

    SECTION("queues") {
        const PhysicalDevice& dev = adapters->front();
        REQUIRE(dev.queue_info(QueueType::Compute).index == 1);
        REQUIRE(dev.queue_info(QueueType::Copy).count.is_known());
        REQUIRE(dev.queue_info(QueueType::Copy).count.value == 2);
    }
}

TEST_CASE("Physical device without adapters", "[ral][device]") {
    NullRalFixture fixture({{"adapters", 0}});
    auto adapters = fixture.ral->get_physical_devices();
    REQUIRE(adapters.is_ok());
    REQUIRE(adapters->empty());
}

TEST_CASE("Device creation", "[ral][device]") {
    NullDeviceFixture fixture;
    const auto& device = fixture.device;

    REQUIRE(device.is_valid());
    REQUIRE(device->physical_device().properties.description == "Onca Null Adapter 0");
    REQUIRE(device->has_extension(DeviceExtensions::IncrementalPresent));
    REQUIRE(device->has_extension(DeviceExtensions::PresentFence));
    REQUIRE(device->has_extension(DeviceExtensions::SwapChainMaintenance1));
}

TEST_CASE("Device rejects foreign physical devices", "[ral][device]") {
    NullRalFixture fixture;
    PhysicalDevice foreign;
    foreign.properties.description = "Not enumerated";

    auto device = fixture.ral->create_device(foreign);
    REQUIRE(device.is_err());
    REQUIRE(device.error().is_ral(RalError::Kind::InvalidParameter));
}

TEST_CASE("Device queues", "[ral][device]") {
    SECTION("one native queue per priority") {
        NullDeviceFixture fixture;
        const auto& device = fixture.device;

        for (QueueType type : {QueueType::Graphics, QueueType::Compute, QueueType::Copy}) {
            auto high = device->get_queue(type, QueuePriority::High);
            auto normal = device->get_queue(type, QueuePriority::Normal);
            auto realtime = device->get_queue(type, QueuePriority::GlobalRealtime);

            REQUIRE(high.is_valid());
            REQUIRE(high->type() == type);
            REQUIRE(high->priority() == QueuePriority::High);
            REQUIRE(normal->priority() == QueuePriority::Normal);
            REQUIRE_FALSE(high.ptr_eq(normal));
            REQUIRE(native_queue_id(high) != native_queue_id(normal));

            // Realtime shares the high priority queue
            REQUIRE(realtime.ptr_eq(high));
        }
    }

    SECTION("single native queue") {
        NullDeviceFixture fixture({{"single-queue", true}});
        auto high = fixture.device->get_queue(QueueType::Graphics, QueuePriority::High);
        auto normal = fixture.device->get_queue(QueueType::Graphics, QueuePriority::Normal);

        REQUIRE_FALSE(high.ptr_eq(normal));
        REQUIRE(native_queue_id(high) == native_queue_id(normal));
    }

    SECTION("queue index follows the family") {
        NullDeviceFixture fixture;
        REQUIRE(fixture.device->get_queue(QueueType::Copy, QueuePriority::Normal)->index() == QueueIndex{2});
    }
}

TEST_CASE("Device flush", "[ral][device]") {
    NullDeviceFixture fixture;
    const auto before = fixture.counters().queue_flushes.load();

    REQUIRE(fixture.device->flush().is_ok());
    // High and Normal for each of the three queue types
    REQUIRE(fixture.counters().queue_flushes.load() == before + 6);

    REQUIRE(fixture.device->get_queue(QueueType::Compute, QueuePriority::High)->flush().is_ok());
    REQUIRE(fixture.counters().queue_flushes.load() == before + 7);
}

TEST_CASE("Command pools", "[ral][device]") {
    NullDeviceFixture fixture;
    auto& device = fixture.device;

    SECTION("graphics") {
        auto pool = device->create_graphics_command_pool(CommandPoolFlags::Transient);
        REQUIRE(pool.is_ok());
        REQUIRE((*pool)->list_type() == CommandListType::Graphics);
        REQUIRE((*pool)->flags() == CommandPoolFlags::Transient);
        REQUIRE((*pool)->queue_index() == QueueIndex{0});
        REQUIRE((*pool)->reset().is_ok());
    }

    SECTION("compute and copy") {
        auto compute = device->create_compute_command_pool(CommandPoolFlags::None);
        auto copy = device->create_copy_command_pool(CommandPoolFlags::ResetList);
        REQUIRE(compute.is_ok());
        REQUIRE(copy.is_ok());
        REQUIRE((*compute)->queue_index() == QueueIndex{1});
        REQUIRE((*copy)->queue_index() == QueueIndex{2});
    }

    SECTION("bundles submit through the graphics queue") {
        auto pool = device->create_bundle_command_pool(CommandPoolFlags::None);
        REQUIRE(pool.is_ok());
        REQUIRE((*pool)->list_type() == CommandListType::Bundle);
        REQUIRE((*pool)->queue_index() == QueueIndex{0});
    }
}

TEST_CASE("Textures", "[ral][device]") {
    NullDeviceFixture fixture;
    auto& device = fixture.device;

    TextureDesc desc;
    desc.size = TextureSize::texture_2d(256, 128, 1, 4);
    desc.format = Format::R8G8B8A8UNorm;
    desc.usages = TextureUsage::Sampled | TextureUsage::ColorAttachment;

    SECTION("create and destroy") {
        {
            auto texture = device->create_texture(desc);
            REQUIRE(texture.is_ok());
            REQUIRE((*texture)->format() == Format::R8G8B8A8UNorm);
            REQUIRE((*texture)->size().mip_levels == 4);
            REQUIRE_FALSE((*texture)->is_backbuffer());
            REQUIRE((*texture)->allocation().has_value());
            REQUIRE(fixture.counters().textures_created.load() == 1);
        }
        REQUIRE(fixture.counters().textures_destroyed.load() == 1);
        REQUIRE(fixture.counters().heaps_freed.load() == fixture.counters().heaps_allocated.load());
    }

    SECTION("mip levels") {
        REQUIRE(TextureSize::texture_2d(256, 128).max_mip_levels() == 9);
        REQUIRE(TextureSize::texture_1d(1).max_mip_levels() == 1);
        REQUIRE(TextureSize::texture_3d(4, 4, 64).max_mip_levels() == 7);
    }

#if ONCA_RAL_VALIDATION
    SECTION("zero size is rejected") {
        desc.size = TextureSize::texture_2d(0, 16);
        auto texture = device->create_texture(desc);
        REQUIRE(texture.is_err());
        REQUIRE(texture.error().is_ral(RalError::Kind::InvalidParameter));
        REQUIRE(fixture.counters().textures_created.load() == 0);
    }

    SECTION("too many mips are rejected") {
        desc.size = TextureSize::texture_2d(16, 16, 1, 6);
        REQUIRE(device->create_texture(desc).is_err());
    }

    SECTION("format must support the usages") {
        desc.format = Format::BC1UNorm;
        auto texture = device->create_texture(desc);
        REQUIRE(texture.is_err());
        REQUIRE(texture.error().message().find("BC1UNorm") != std::string::npos);
    }
#endif
}
