/// @file fence.cpp
/// @brief Timeline fences

#include <onca_engine/ral/fence.hpp>

namespace onca_ral {

Fence::Fence(std::unique_ptr<FenceInterface> handle)
    : m_handle(std::move(handle)) {}

Fence::~Fence() = default;

Result<std::uint64_t> Fence::get_value() const {
    return m_handle->get_value();
}

Result<void> Fence::signal(std::uint64_t value) {
    return m_handle->signal(value);
}

Result<bool> Fence::wait(std::uint64_t value, std::chrono::nanoseconds timeout) {
    return m_handle->wait(value, timeout);
}

Result<bool> Fence::wait_multiple(std::span<const FenceWait> fences, bool wait_for_all, std::chrono::nanoseconds timeout) {
    if (fences.empty()) {
        return Error(RalError::invalid_parameter("Fence::wait_multiple() needs at least one fence"));
    }
    for (const auto& fence_wait : fences) {
        if (!fence_wait.first) {
            return Error(RalError::invalid_parameter("Fence::wait_multiple() was given a null fence"));
        }
    }
    return fences.front().first->interface().wait_multiple(fences, wait_for_all, timeout);
}

} // namespace onca_ral
