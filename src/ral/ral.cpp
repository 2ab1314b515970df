/// @file ral.cpp
/// @brief Backend loading and device creation

#include <onca_engine/ral/ral.hpp>

namespace onca_ral {

Ral::~Ral() {
    if (m_owned) {
        m_owned.reset();
        return;
    }
    if (!m_ral) {
        return;
    }

    auto destroy_ral = m_library.get_function<DestroyRalFn>(DESTROY_RAL_SYMBOL);
    if (!destroy_ral) {
        ral_logger()->error("`{}` does not exist for the current RAL, leaking the backend", DESTROY_RAL_SYMBOL);
        return;
    }
    destroy_ral(m_ral);
    m_ral = nullptr;
}

std::filesystem::path Ral::module_path(const Settings& settings, const std::filesystem::path& module_dir) {
    return module_dir / (settings.module_name() + onca_core::DynamicLibrary::extension());
}

Result<std::unique_ptr<Ral>> Ral::load(const Settings& settings, const std::filesystem::path& module_dir,
        std::pmr::memory_resource* memory, AllocatorId allocator_id) {
    const auto path = module_path(settings, module_dir);
    ral_logger()->info("Loading RAL backend '{}'", path.string());

    std::unique_ptr<Ral> ral(new Ral());
    auto loaded = ral->m_library.load(path);
    if (!loaded) {
        ral_logger()->error("Failed to load RAL backend: {}", loaded.error().message());
        return loaded.error();
    }

    auto create_ral = ral->m_library.require_function<CreateRalFn>(CREATE_RAL_SYMBOL);
    if (!create_ral) {
        ral_logger()->error("Failed to load RAL backend: {}", create_ral.error().message());
        return create_ral.error();
    }

    RalCreateInfo create_info;
    create_info.memory = memory;
    create_info.allocator_id = allocator_id;
    create_info.logger = ral_logger();
    create_info.settings = settings;

    Error error;
    RalInterface* iface = (*create_ral)(create_info, error);
    if (!iface) {
        ral_logger()->error("Failed to create RAL backend: {}", error.message());
        return error;
    }

    ral->m_ral = iface;
    return ral;
}

std::unique_ptr<Ral> Ral::from_interface(std::unique_ptr<RalInterface> iface) {
    std::unique_ptr<Ral> ral(new Ral());
    ral->m_ral = iface.get();
    ral->m_owned = std::move(iface);
    return ral;
}

const Settings& Ral::settings() const {
    return m_ral->settings();
}

Result<std::vector<PhysicalDevice>> Ral::get_physical_devices() const {
    return m_ral->get_physical_devices();
}

Result<Handle<Device>> Ral::create_device(const PhysicalDevice& phys_dev, std::unique_ptr<GpuAllocatorImpl> alloc_impl) const {
    auto result = m_ral->create_device(phys_dev);
    if (!result) {
        return result.error();
    }

    QueueMatrix queues;
    for (std::size_t type = 0; type < QUEUE_TYPE_COUNT; ++type) {
        for (std::size_t prio = 0; prio < BACKEND_QUEUE_PRIORITY_COUNT; ++prio) {
            auto& queue = result->queues[type][prio];
            queues[type][prio] = Handle<CommandQueue>::create(std::move(queue.handle), queue.index,
                static_cast<QueueType>(type), static_cast<QueuePriority>(prio));
        }
        queues[type][static_cast<std::size_t>(QueuePriority::GlobalRealtime)] =
            queues[type][static_cast<std::size_t>(QueuePriority::High)];
    }

    ral_logger()->info("Created device on '{}'", phys_dev.properties.description);
    return Device::create(std::move(result->handle), phys_dev, std::move(queues), result->extensions, std::move(alloc_impl));
}

} // namespace onca_ral
