/// @file command_queue.cpp
/// @brief Command queues and command pools

#include <onca_engine/ral/command_queue.hpp>

namespace onca_ral {

const char* command_list_type_name(CommandListType type) {
    switch (type) {
        case CommandListType::Graphics: return "Graphics";
        case CommandListType::Compute: return "Compute";
        case CommandListType::Copy: return "Copy";
        case CommandListType::Bundle: return "Bundle";
        default: return "Unknown";
    }
}

// =============================================================================
// CommandQueue
// =============================================================================

CommandQueue::CommandQueue(std::unique_ptr<CommandQueueInterface> handle, QueueIndex index, QueueType type, QueuePriority priority)
    : m_handle(std::move(handle))
    , m_index(index)
    , m_type(type)
    , m_priority(priority) {}

CommandQueue::~CommandQueue() = default;

Result<void> CommandQueue::flush() const {
    return m_handle->flush();
}

// =============================================================================
// CommandPool
// =============================================================================

CommandPool::CommandPool(std::unique_ptr<CommandPoolInterface> handle, CommandListType list_type, CommandPoolFlags flags, QueueIndex queue_index)
    : m_handle(std::move(handle))
    , m_list_type(list_type)
    , m_flags(flags)
    , m_queue_index(queue_index) {}

CommandPool::~CommandPool() = default;

Result<void> CommandPool::reset() {
    return m_handle->reset();
}

} // namespace onca_ral
