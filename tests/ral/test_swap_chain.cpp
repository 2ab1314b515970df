// onca_ral swap chain tests

#include <catch2/catch_test_macros.hpp>
#include "null_fixture.hpp"

using namespace onca_ral;
using onca_test::NullDeviceFixture;

namespace {

SwapChainDesc make_desc(std::uint16_t width, std::uint16_t height, std::uint8_t num_backbuffers = 3) {
    SwapChainDesc desc;
    desc.width = width;
    desc.height = height;
    desc.num_backbuffers = num_backbuffers;
    desc.formats = {Format::B8G8R8A8Srgb, Format::R8G8B8A8UNorm};
    return desc;
}

null::NullSwapChain& null_swap_chain(const Handle<SwapChain>& swap_chain) {
    auto* native = dynamic_cast<null::NullSwapChain*>(&swap_chain->interface());
    REQUIRE(native != nullptr);
    return *native;
}

/// Whether both sets hold the same backbuffer textures
bool same_backbuffers(const std::vector<Backbuffer>& a, const std::vector<Backbuffer>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        if (!a[i].texture.ptr_eq(b[i].texture)) {
            return false;
        }
    }
    return true;
}

} // namespace

TEST_CASE("Swap chain creation", "[ral][swap_chain]") {
    SECTION("first displayable format is picked") {
        NullDeviceFixture fixture;
        SwapChainDesc desc = make_desc(800, 600);
        desc.formats = {Format::R32SFloat, Format::R8G8B8A8UNorm, Format::B8G8R8A8UNorm};

        auto swap_chain = fixture.device->create_swap_chain(desc);
        REQUIRE(swap_chain.is_ok());
        const SwapChain& sc = **swap_chain;
        REQUIRE(sc.backbuffer_format() == Format::R8G8B8A8UNorm);
        REQUIRE(sc.width() == 800);
        REQUIRE(sc.height() == 600);
        REQUIRE(sc.num_backbuffers() == 3);
        REQUIRE(sc.backbuffers().size() == 3);
        REQUIRE(sc.current_backbuffer_index() == 0);
        REQUIRE(sc.present_mode() == PresentMode::Fifo);
        REQUIRE(sc.backbuffer_usages() == TextureUsage::ColorAttachment);

        const TextureSize size = sc.backbuffer_size();
        REQUIRE(size.width == 800);
        REQUIRE(size.height == 600);

        REQUIRE(fixture.counters().swap_chains_created.load() == 1);
        REQUIRE(fixture.counters().textures_created.load() == 0);
    }

    SECTION("no displayable format") {
        NullDeviceFixture fixture;
        SwapChainDesc desc = make_desc(800, 600);
        desc.formats = {Format::R32SFloat, Format::BC1UNorm};

        auto swap_chain = fixture.device->create_swap_chain(desc);
        REQUIRE(swap_chain.is_err());
        REQUIRE(swap_chain.error().is_ral(RalError::Kind::UnsupportedSwapChainFormats));
        REQUIRE(swap_chain.error().message().find("BC1UNorm") != std::string::npos);
        REQUIRE(fixture.counters().swap_chains_created.load() == 0);
    }

    SECTION("extent and backbuffer count are clamped") {
        NullDeviceFixture fixture({{"max-extent", 1024}, {"min-backbuffers", 2}, {"max-backbuffers", 3}});

        auto large = fixture.device->create_swap_chain(make_desc(4000, 300, 5));
        REQUIRE(large.is_ok());
        REQUIRE((*large)->width() == 1024);
        REQUIRE((*large)->height() == 300);
        REQUIRE((*large)->num_backbuffers() == 3);

        auto small = fixture.device->create_swap_chain(make_desc(16, 16, 1));
        REQUIRE(small.is_ok());
        REQUIRE((*small)->num_backbuffers() == 2);
        REQUIRE((*small)->backbuffers().size() == 2);
    }

    SECTION("unsupported present mode falls back to fifo") {
        NullDeviceFixture fixture({{"present-modes", nlohmann::json::array({"immediate"})}});
        SwapChainDesc desc = make_desc(640, 480);
        desc.present_mode = PresentMode::Mailbox;

        auto swap_chain = fixture.device->create_swap_chain(desc);
        REQUIRE(swap_chain.is_ok());
        REQUIRE((*swap_chain)->present_mode() == PresentMode::Fifo);
    }

    SECTION("queue defaults to the high priority graphics queue") {
        NullDeviceFixture fixture;
        auto swap_chain = fixture.device->create_swap_chain(make_desc(640, 480));
        REQUIRE(swap_chain.is_ok());
        REQUIRE((*swap_chain)->queue().ptr_eq(fixture.device->get_queue(QueueType::Graphics, QueuePriority::High)));
    }

    SECTION("explicit queue is kept") {
        NullDeviceFixture fixture;
        SwapChainDesc desc = make_desc(640, 480);
        desc.queue = fixture.device->get_queue(QueueType::Compute, QueuePriority::Normal);

        auto swap_chain = fixture.device->create_swap_chain(desc);
        REQUIRE(swap_chain.is_ok());
        REQUIRE((*swap_chain)->queue().ptr_eq(desc.queue));
    }

#if ONCA_RAL_VALIDATION
    SECTION("invalid descriptions") {
        NullDeviceFixture fixture;

        auto zero_width = fixture.device->create_swap_chain(make_desc(0, 480));
        REQUIRE(zero_width.error().is_ral(RalError::Kind::InvalidParameter));

        auto no_backbuffers = fixture.device->create_swap_chain(make_desc(640, 480, 0));
        REQUIRE(no_backbuffers.error().is_ral(RalError::Kind::InvalidParameter));

        auto too_many = fixture.device->create_swap_chain(make_desc(640, 480, MAX_BACKBUFFERS + 1));
        REQUIRE(too_many.error().is_ral(RalError::Kind::InvalidParameter));

        SwapChainDesc no_formats = make_desc(640, 480);
        no_formats.formats.clear();
        REQUIRE(fixture.device->create_swap_chain(no_formats).error().is_ral(RalError::Kind::InvalidParameter));

        REQUIRE(fixture.counters().swap_chains_created.load() == 0);
    }
#endif
}

TEST_CASE("Swap chain acquire and present", "[ral][swap_chain]") {
    NullDeviceFixture fixture;
    auto created = fixture.device->create_swap_chain(make_desc(640, 480));
    REQUIRE(created.is_ok());
    Handle<SwapChain> swap_chain = *created;

    SECTION("acquire cycles through the backbuffers") {
        const auto backbuffers = swap_chain->backbuffers();
        for (std::uint8_t expected : {0, 1, 2, 0, 1}) {
            REQUIRE(swap_chain->acquire_next_backbuffer().is_ok());
            REQUIRE(swap_chain->current_backbuffer_index() == expected);
            REQUIRE(swap_chain->current_backbuffer().texture.ptr_eq(backbuffers[expected].texture));
        }
        REQUIRE(fixture.counters().acquires.load() == 5);
    }

    SECTION("backbuffers carry the swap chain's size and format") {
        const Backbuffer backbuffer = swap_chain->current_backbuffer();
        REQUIRE(backbuffer.texture->size().width == 640);
        REQUIRE(backbuffer.texture->size().height == 480);
        REQUIRE(backbuffer.texture->format() == Format::B8G8R8A8Srgb);
        REQUIRE(backbuffer.rtv);
    }

    SECTION("present uses the current present mode") {
        REQUIRE(swap_chain->acquire_next_backbuffer().is_ok());
        REQUIRE(swap_chain->present(PresentInfo{}).is_ok());
        REQUIRE(null_swap_chain(swap_chain).last_present_mode() == PresentMode::Fifo);

        REQUIRE(swap_chain->change_present_mode(PresentMode::Immediate).is_ok());
        REQUIRE(swap_chain->present(PresentInfo{}).is_ok());
        REQUIRE(null_swap_chain(swap_chain).last_present_mode() == PresentMode::Immediate);
        REQUIRE(fixture.counters().presents.load() == 2);
    }

    SECTION("present with update rects") {
        PresentInfo info;
        info.update_rects = std::vector<Rect>{Rect{0, 0, 64, 64}};
        info.scroll_rect = PresentScrollRect{0, 0, 0, 16, 640, 464};
        REQUIRE(swap_chain->present(info).is_ok());
    }

    SECTION("present waiting on a fence") {
        auto fence = fixture.device->create_fence();
        REQUIRE(fence.is_ok());

        PresentInfo info;
        info.wait_fence = FenceWait(*fence, 1);
        REQUIRE(swap_chain->present(info).is_ok());

        info.wait_fence = FenceWait(Handle<Fence>(), 1);
        auto result = swap_chain->present(info);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_ral(RalError::Kind::InvalidParameter));
    }

#if ONCA_RAL_VALIDATION
    SECTION("empty update rects are rejected") {
        PresentInfo info;
        info.update_rects = std::vector<Rect>{};
        auto result = swap_chain->present(info);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_ral(RalError::Kind::InvalidParameter));
        REQUIRE(fixture.counters().presents.load() == 0);
    }
#endif
}

TEST_CASE("Swap chain present mode changes", "[ral][swap_chain]") {
    SECTION("without recreation") {
        NullDeviceFixture fixture;
        REQUIRE(fixture.device->has_extension(DeviceExtensions::SwapChainMaintenance1));

        auto swap_chain = fixture.device->create_swap_chain(make_desc(640, 480));
        REQUIRE(swap_chain.is_ok());
        const auto before = (*swap_chain)->backbuffers();

        REQUIRE((*swap_chain)->change_present_mode(PresentMode::Mailbox).is_ok());
        REQUIRE((*swap_chain)->present_mode() == PresentMode::Mailbox);
        REQUIRE(same_backbuffers(before, (*swap_chain)->backbuffers()));
        REQUIRE(fixture.counters().swap_chain_recreates.load() == 0);
    }

    SECTION("with recreation") {
        NullDeviceFixture fixture({{"present-mode-recreate", true}});
        REQUIRE_FALSE(fixture.device->has_extension(DeviceExtensions::SwapChainMaintenance1));

        auto swap_chain = fixture.device->create_swap_chain(make_desc(640, 480));
        REQUIRE(swap_chain.is_ok());
        SwapChain& sc = **swap_chain;
        REQUIRE(sc.acquire_next_backbuffer().is_ok());
        REQUIRE(sc.acquire_next_backbuffer().is_ok());
        REQUIRE(sc.current_backbuffer_index() == 1);
        const auto before = sc.backbuffers();

        REQUIRE(sc.change_present_mode(PresentMode::Immediate).is_ok());
        REQUIRE(sc.present_mode() == PresentMode::Immediate);
        REQUIRE(sc.current_backbuffer_index() == 0);
        REQUIRE(sc.backbuffers().size() == before.size());
        REQUIRE_FALSE(same_backbuffers(before, sc.backbuffers()));
        REQUIRE(fixture.counters().swap_chain_recreates.load() == 1);

        SECTION("same mode is a no-op") {
            REQUIRE(sc.change_present_mode(PresentMode::Immediate).is_ok());
            REQUIRE(fixture.counters().swap_chain_recreates.load() == 1);
        }
    }

    SECTION("failed recreation keeps the old backbuffers") {
        NullDeviceFixture fixture({{"present-mode-recreate", true}});
        auto swap_chain = fixture.device->create_swap_chain(make_desc(640, 480));
        REQUIRE(swap_chain.is_ok());
        SwapChain& sc = **swap_chain;
        REQUIRE(sc.acquire_next_backbuffer().is_ok());
        REQUIRE(sc.acquire_next_backbuffer().is_ok());
        const auto before = sc.backbuffers();

        null_swap_chain(*swap_chain).fail_next_recreate();
        auto result = sc.change_present_mode(PresentMode::Mailbox);
        REQUIRE(result.is_err());
        REQUIRE(sc.present_mode() == PresentMode::Fifo);
        REQUIRE(sc.current_backbuffer_index() == 1);
        REQUIRE(same_backbuffers(before, sc.backbuffers()));

        // The failure is one-shot
        REQUIRE(sc.change_present_mode(PresentMode::Mailbox).is_ok());
        REQUIRE(sc.present_mode() == PresentMode::Mailbox);
    }
}

TEST_CASE("Swap chain resize", "[ral][swap_chain]") {
    NullDeviceFixture fixture({{"max-extent", 2048}});
    auto created = fixture.device->create_swap_chain(make_desc(640, 480));
    REQUIRE(created.is_ok());
    Handle<SwapChain> swap_chain = *created;

    SECTION("same size is a no-op") {
        REQUIRE(swap_chain->resize(640, 480).is_ok());
        REQUIRE(fixture.counters().swap_chain_resizes.load() == 0);
    }

    SECTION("new size replaces the backbuffers") {
        REQUIRE(swap_chain->acquire_next_backbuffer().is_ok());
        REQUIRE(swap_chain->acquire_next_backbuffer().is_ok());
        const auto before = swap_chain->backbuffers();

        REQUIRE(swap_chain->resize(1280, 720).is_ok());
        REQUIRE(swap_chain->width() == 1280);
        REQUIRE(swap_chain->height() == 720);
        REQUIRE(swap_chain->current_backbuffer_index() == 0);
        REQUIRE(swap_chain->current_backbuffer().texture->size().width == 1280);
        REQUIRE_FALSE(same_backbuffers(before, swap_chain->backbuffers()));
        REQUIRE(fixture.counters().swap_chain_resizes.load() == 1);
    }

    SECTION("backend limits the size") {
        REQUIRE(swap_chain->resize(4096, 720).is_ok());
        REQUIRE(swap_chain->width() == 2048);
        REQUIRE(swap_chain->height() == 720);
    }

    SECTION("failed resize keeps the old state") {
        const auto before = swap_chain->backbuffers();
        null_swap_chain(swap_chain).fail_next_recreate();

        REQUIRE(swap_chain->resize(1280, 720).is_err());
        REQUIRE(swap_chain->width() == 640);
        REQUIRE(swap_chain->height() == 480);
        REQUIRE(same_backbuffers(before, swap_chain->backbuffers()));
    }

    SECTION("device dropped") {
        REQUIRE(fixture.device->flush().is_ok());
        fixture.device.reset();

        auto result = swap_chain->resize(1280, 720);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_ral(RalError::Kind::UseAfterDeviceDropped));
        REQUIRE(fixture.counters().swap_chain_resizes.load() == 0);
    }

#if ONCA_RAL_VALIDATION
    SECTION("zero size is rejected") {
        REQUIRE(swap_chain->resize(0, 480).error().is_ral(RalError::Kind::InvalidParameter));
        REQUIRE(swap_chain->width() == 640);
        REQUIRE(fixture.counters().swap_chain_resizes.load() == 0);
    }
#endif
}

TEST_CASE("Swap chain follows the backend's backbuffer count", "[ral][swap_chain]") {
    NullDeviceFixture fixture({{"present-mode-recreate", true}, {"recreate-backbuffers", 5}});
    auto created = fixture.device->create_swap_chain(make_desc(640, 480, 3));
    REQUIRE(created.is_ok());
    Handle<SwapChain> swap_chain = *created;
    REQUIRE(swap_chain->num_backbuffers() == 3);
    REQUIRE(swap_chain->backbuffers().size() == 3);

    SECTION("after recreation") {
        REQUIRE(swap_chain->change_present_mode(PresentMode::Mailbox).is_ok());
        REQUIRE(swap_chain->num_backbuffers() == 5);
        REQUIRE(swap_chain->backbuffers().size() == swap_chain->num_backbuffers());
        REQUIRE(swap_chain->backbuffer_format() == Format::B8G8R8A8Srgb);
        REQUIRE(swap_chain->backbuffer_usages() == TextureUsage::ColorAttachment);
    }

    SECTION("after resize") {
        REQUIRE(swap_chain->resize(800, 600).is_ok());
        REQUIRE(swap_chain->num_backbuffers() == 5);
        REQUIRE(swap_chain->backbuffers().size() == swap_chain->num_backbuffers());
        for (const Backbuffer& backbuffer : swap_chain->backbuffers()) {
            REQUIRE(backbuffer.texture->size().width == 800);
        }
    }

    SECTION("acquire cycles through the new set") {
        REQUIRE(swap_chain->resize(800, 600).is_ok());
        for (std::uint8_t i = 0; i < 5; ++i) {
            REQUIRE(swap_chain->acquire_next_backbuffer().is_ok());
            REQUIRE(swap_chain->current_backbuffer_index() == i);
        }
        REQUIRE(swap_chain->acquire_next_backbuffer().is_ok());
        REQUIRE(swap_chain->current_backbuffer_index() == 0);
    }

    SECTION("failed recreation keeps the count") {
        null_swap_chain(swap_chain).fail_next_recreate();
        REQUIRE(swap_chain->resize(800, 600).is_err());
        REQUIRE(swap_chain->num_backbuffers() == 3);
        REQUIRE(swap_chain->backbuffers().size() == 3);
    }
}
