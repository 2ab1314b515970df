/// @file physical_device.cpp
/// @brief Physical device queries

#include <onca_engine/ral/physical_device.hpp>

namespace onca_ral {

const char* physical_device_type_name(PhysicalDeviceType type) {
    switch (type) {
        case PhysicalDeviceType::Discrete: return "Discrete";
        case PhysicalDeviceType::Integrated: return "Integrated";
        case PhysicalDeviceType::Virtual: return "Virtual";
        case PhysicalDeviceType::Software: return "Software";
        default: return "Unknown";
    }
}

Result<MemoryBudgetInfo> PhysicalDevice::memory_budget() const {
    if (!handle) {
        return Error(RalError::not_implemented("memory budget query"));
    }
    return handle->get_memory_budget_info();
}

Result<void> PhysicalDevice::reserve_memory(std::uint8_t heap_index, std::uint64_t bytes) const {
#if ONCA_RAL_VALIDATION
    ONCA_RAL_CHECK_PARAM(heap_index < MAX_MEMORY_HEAPS, "Memory heap index out of range");
#endif
    if (!handle) {
        return Error(RalError::not_implemented("memory reservation"));
    }
    return handle->reserve_memory(heap_index, bytes);
}

} // namespace onca_ral
