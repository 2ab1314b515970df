#pragma once

/// @file fence.hpp
/// @brief Timeline fences

#include "fwd.hpp"
#include "common.hpp"
#include <chrono>
#include <memory>
#include <span>
#include <utility>

namespace onca_ral {

/// Fence together with the value to wait for
using FenceWait = std::pair<Handle<Fence>, std::uint64_t>;

/// Backend side of a fence
class FenceInterface {
public:
    virtual ~FenceInterface() = default;

    [[nodiscard]] virtual Result<std::uint64_t> get_value() const = 0;
    [[nodiscard]] virtual Result<void> signal(std::uint64_t value) = 0;
    [[nodiscard]] virtual Result<bool> wait(std::uint64_t value, std::chrono::nanoseconds timeout) = 0;

    /// Wait for several fences of the same backend
    [[nodiscard]] virtual Result<bool> wait_multiple(std::span<const FenceWait> fences, bool wait_for_all,
        std::chrono::nanoseconds timeout) = 0;
};

/// Monotonically increasing timeline fence
class Fence {
public:
    explicit Fence(std::unique_ptr<FenceInterface> handle);
    ~Fence();

    Fence(const Fence&) = delete;
    Fence& operator=(const Fence&) = delete;

    /// Current completed value
    [[nodiscard]] Result<std::uint64_t> get_value() const;

    /// Signal the fence from the CPU
    [[nodiscard]] Result<void> signal(std::uint64_t value);

    /// Wait until the fence reaches `value`, returns false on timeout
    [[nodiscard]] Result<bool> wait(std::uint64_t value, std::chrono::nanoseconds timeout);

    /// Wait for all (or any) of the fences, returns false on timeout
    [[nodiscard]] static Result<bool> wait_multiple(std::span<const FenceWait> fences, bool wait_for_all,
        std::chrono::nanoseconds timeout);

    [[nodiscard]] FenceInterface& interface() const noexcept { return *m_handle; }

private:
    std::unique_ptr<FenceInterface> m_handle;
};

} // namespace onca_ral
