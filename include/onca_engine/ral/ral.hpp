#pragma once

/// @file ral.hpp
/// @brief Render abstraction layer entry point
///
/// Usage:
/// @code
/// auto settings = onca_ral::Settings::parse(text);
/// auto ral = onca_ral::Ral::load(*settings, module_dir);
/// auto adapters = (*ral)->get_physical_devices();
/// auto device = (*ral)->create_device((*adapters)[0]);
/// @endcode

#include "fwd.hpp"
#include "api.hpp"
#include <onca_engine/core/dynamic_library.hpp>
#include <filesystem>
#include <memory>
#include <memory_resource>
#include <vector>

namespace onca_ral {

/// Loaded RAL backend
///
/// Every device and resource runs backend code, so the Ral must outlive all of them.
class Ral {
public:
    ~Ral();

    Ral(const Ral&) = delete;
    Ral& operator=(const Ral&) = delete;

    /// Load the backend module selected by `settings` from `module_dir`
    ///
    /// Fails with DynLib when the module cannot be opened and with LoadFunction when it does not
    /// export `create_ral`; errors reported by the backend are returned as-is.
    [[nodiscard]] static Result<std::unique_ptr<Ral>> load(const Settings& settings, const std::filesystem::path& module_dir,
        std::pmr::memory_resource* memory = std::pmr::get_default_resource(), AllocatorId allocator_id = DEFAULT_ALLOCATOR_ID);

    /// Wrap a backend living in the current process
    [[nodiscard]] static std::unique_ptr<Ral> from_interface(std::unique_ptr<RalInterface> ral);

    /// Path of the module for `settings` inside `module_dir`
    [[nodiscard]] static std::filesystem::path module_path(const Settings& settings, const std::filesystem::path& module_dir);

    [[nodiscard]] const Settings& settings() const;

    [[nodiscard]] Result<std::vector<PhysicalDevice>> get_physical_devices() const;

    /// Create a device; `alloc_impl` defaults to DefaultGpuAllocator
    [[nodiscard]] Result<Handle<Device>> create_device(const PhysicalDevice& phys_dev,
        std::unique_ptr<GpuAllocatorImpl> alloc_impl = nullptr) const;

    [[nodiscard]] RalInterface& interface() const noexcept { return *m_ral; }

private:
    Ral() = default;

    onca_core::DynamicLibrary m_library;
    /// Owned through `destroy_ral` when loaded from a module
    RalInterface* m_ral = nullptr;
    std::unique_ptr<RalInterface> m_owned;
};

} // namespace onca_ral
