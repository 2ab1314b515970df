/// @file common.cpp
/// @brief Shared helpers for onca_ral

#include <onca_engine/ral/common.hpp>
#include <onca_engine/core/log.hpp>

namespace onca_ral {

std::shared_ptr<spdlog::logger> ral_logger() {
    static std::shared_ptr<spdlog::logger> logger = onca_core::get_logger("onca_ral");
    return logger;
}

const char* queue_type_name(QueueType type) {
    switch (type) {
        case QueueType::Graphics: return "Graphics";
        case QueueType::Compute: return "Compute";
        case QueueType::Copy: return "Copy";
        default: return "Unknown";
    }
}

const char* queue_priority_name(QueuePriority priority) {
    switch (priority) {
        case QueuePriority::High: return "High";
        case QueuePriority::Normal: return "Normal";
        case QueuePriority::GlobalRealtime: return "GlobalRealtime";
        default: return "Unknown";
    }
}

const char* memory_type_name(MemoryType type) {
    switch (type) {
        case MemoryType::Gpu: return "Gpu";
        case MemoryType::Upload: return "Upload";
        case MemoryType::Readback: return "Readback";
        default: return "Unknown";
    }
}

} // namespace onca_ral
