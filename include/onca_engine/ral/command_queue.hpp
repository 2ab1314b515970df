#pragma once

/// @file command_queue.hpp
/// @brief Command queues and command pools

#include "fwd.hpp"
#include "common.hpp"
#include <memory>

namespace onca_ral {

// =============================================================================
// CommandQueue
// =============================================================================

/// Backend side of a command queue
class CommandQueueInterface {
public:
    virtual ~CommandQueueInterface() = default;

    /// Block until all work submitted to the queue has finished
    [[nodiscard]] virtual Result<void> flush() = 0;
};

/// Command queue owned by a device
///
/// Obtained through `Device::get_queue()`. The GlobalRealtime slot shares the High queue.
class CommandQueue {
public:
    CommandQueue(std::unique_ptr<CommandQueueInterface> handle, QueueIndex index, QueueType type, QueuePriority priority);
    ~CommandQueue();

    CommandQueue(const CommandQueue&) = delete;
    CommandQueue& operator=(const CommandQueue&) = delete;

    [[nodiscard]] QueueIndex index() const noexcept { return m_index; }
    [[nodiscard]] QueueType type() const noexcept { return m_type; }
    [[nodiscard]] QueuePriority priority() const noexcept { return m_priority; }

    /// Wait until the queue is idle
    [[nodiscard]] Result<void> flush() const;

    [[nodiscard]] CommandQueueInterface& interface() const noexcept { return *m_handle; }

private:
    std::unique_ptr<CommandQueueInterface> m_handle;
    QueueIndex m_index;
    QueueType m_type;
    QueuePriority m_priority;
};

// =============================================================================
// CommandPool
// =============================================================================

/// Kind of command list a pool allocates
enum class CommandListType : std::uint8_t {
    Graphics,
    Compute,
    Copy,
    /// Secondary lists, only executable from graphics lists
    Bundle,
};

[[nodiscard]] const char* command_list_type_name(CommandListType type);

enum class CommandPoolFlags : std::uint8_t {
    None = 0,
    /// Lists are short lived and reset often
    Transient = 1 << 0,
    /// Lists can be reset individually
    ResetList = 1 << 1,
};
ONCA_RAL_FLAGS(CommandPoolFlags)

/// Backend side of a command pool
class CommandPoolInterface {
public:
    virtual ~CommandPoolInterface() = default;

    [[nodiscard]] virtual Result<void> reset() = 0;
};

/// Pool command lists are allocated from
class CommandPool {
public:
    CommandPool(std::unique_ptr<CommandPoolInterface> handle, CommandListType list_type, CommandPoolFlags flags, QueueIndex queue_index);
    ~CommandPool();

    CommandPool(const CommandPool&) = delete;
    CommandPool& operator=(const CommandPool&) = delete;

    [[nodiscard]] CommandListType list_type() const noexcept { return m_list_type; }
    [[nodiscard]] CommandPoolFlags flags() const noexcept { return m_flags; }

    /// Queue family lists from this pool are submitted to
    [[nodiscard]] QueueIndex queue_index() const noexcept { return m_queue_index; }

    /// Reset all lists allocated from the pool
    [[nodiscard]] Result<void> reset();

    [[nodiscard]] CommandPoolInterface& interface() const noexcept { return *m_handle; }

private:
    std::unique_ptr<CommandPoolInterface> m_handle;
    CommandListType m_list_type;
    CommandPoolFlags m_flags;
    QueueIndex m_queue_index;
};

} // namespace onca_ral
