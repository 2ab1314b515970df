// onca_ral fence tests

#include <catch2/catch_test_macros.hpp>
#include "null_fixture.hpp"
#include <chrono>
#include <thread>
#include <vector>

using namespace onca_ral;
using namespace std::chrono_literals;
using onca_test::NullDeviceFixture;

TEST_CASE("Fence signaling", "[ral][fence]") {
    NullDeviceFixture fixture;
    auto created = fixture.device->create_fence();
    REQUIRE(created.is_ok());
    Handle<Fence> fence = *created;

    SECTION("starts at zero") {
        REQUIRE(fence->get_value().unwrap() == 0);
    }

    SECTION("signal raises the value") {
        REQUIRE(fence->signal(5).is_ok());
        REQUIRE(fence->get_value().unwrap() == 5);
        REQUIRE(fence->signal(5).is_ok());
        REQUIRE(fence->signal(9).is_ok());
        REQUIRE(fence->get_value().unwrap() == 9);
    }

    SECTION("value may not decrease") {
        REQUIRE(fence->signal(10).is_ok());
        auto result = fence->signal(3);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_ral(RalError::Kind::InvalidParameter));
        REQUIRE(fence->get_value().unwrap() == 10);
    }

    SECTION("wait on a reached value") {
        REQUIRE(fence->signal(2).is_ok());
        REQUIRE(fence->wait(1, 0ns).unwrap());
        REQUIRE(fence->wait(2, 1ms).unwrap());
    }

    SECTION("wait times out") {
        REQUIRE_FALSE(fence->wait(1, 1ms).unwrap());
    }

    SECTION("wait for a signal from another thread") {
        std::thread signaler([&] {
            std::this_thread::sleep_for(5ms);
            (void)fence->signal(4);
        });
        auto reached = fence->wait(4, std::chrono::seconds(10));
        signaler.join();
        REQUIRE(reached.unwrap());
        REQUIRE(fence->get_value().unwrap() == 4);
    }
}

TEST_CASE("Waiting on multiple fences", "[ral][fence]") {
    NullDeviceFixture fixture;
    auto a = fixture.device->create_fence();
    auto b = fixture.device->create_fence();
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());

    const std::vector<FenceWait> waits{FenceWait(*a, 1), FenceWait(*b, 2)};

    SECTION("all") {
        REQUIRE((*a)->signal(1).is_ok());
        REQUIRE_FALSE(Fence::wait_multiple(waits, true, 1ms).unwrap());

        REQUIRE((*b)->signal(2).is_ok());
        REQUIRE(Fence::wait_multiple(waits, true, 1ms).unwrap());
    }

    SECTION("any") {
        REQUIRE_FALSE(Fence::wait_multiple(waits, false, 1ms).unwrap());

        REQUIRE((*b)->signal(7).is_ok());
        REQUIRE(Fence::wait_multiple(waits, false, 1ms).unwrap());
    }

    SECTION("signaled while waiting") {
        std::thread signaler([&] {
            std::this_thread::sleep_for(5ms);
            (void)(*a)->signal(1);
            (void)(*b)->signal(2);
        });
        auto reached = Fence::wait_multiple(waits, true, std::chrono::seconds(10));
        signaler.join();
        REQUIRE(reached.unwrap());
    }

    SECTION("empty list") {
        auto result = Fence::wait_multiple({}, true, 1ms);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_ral(RalError::Kind::InvalidParameter));
    }

    SECTION("null fence") {
        const std::vector<FenceWait> with_null{FenceWait(*a, 1), FenceWait(Handle<Fence>(), 1)};
        auto result = Fence::wait_multiple(with_null, false, 1ms);
        REQUIRE(result.is_err());
        REQUIRE(result.error().is_ral(RalError::Kind::InvalidParameter));
    }
}
