/// @file swap_chain.cpp
/// @brief Swap chain state machine

#include <onca_engine/ral/swap_chain.hpp>
#include <onca_engine/ral/device.hpp>
#include <mutex>

namespace onca_ral {

const char* present_mode_name(PresentMode mode) {
    switch (mode) {
        case PresentMode::Immediate: return "Immediate";
        case PresentMode::Mailbox: return "Mailbox";
        case PresentMode::Fifo: return "Fifo";
    }
    return "Unknown";
}

// =============================================================================
// SwapChain
// =============================================================================

SwapChain::SwapChain(WeakHandle<Device> device, const SwapChainDesc& desc, SwapChainResultInfo result)
    : m_handle(std::move(result.handle))
    , m_device(std::move(device))
    , m_window(desc.window)
    , m_alpha_mode(desc.alpha_mode)
    , m_preserve_after_present(desc.preserve_after_present)
    , m_queue(desc.queue) {
    m_dynamic.width = result.width;
    m_dynamic.height = result.height;
    m_dynamic.num_backbuffers = result.num_backbuffers;
    m_dynamic.format = result.format;
    m_dynamic.usages = result.backbuffer_usages;
    m_dynamic.present_mode = result.present_mode;
    m_dynamic.backbuffers = create_backbuffers(std::move(result.backbuffers), result.width, result.height,
        result.format, result.backbuffer_usages);

    ral_logger()->debug("Created swap chain ({}x{}, {} backbuffers, {}, {})", m_dynamic.width, m_dynamic.height,
        m_dynamic.backbuffers.size(), format_name(m_dynamic.format), present_mode_name(m_dynamic.present_mode));
}

SwapChain::~SwapChain() {
    // Backbuffers reference the native swap chain and have to go first
    m_dynamic.backbuffers.clear();
}

Result<void> SwapChain::present(const PresentInfo& present_info) {
    std::shared_lock<std::shared_mutex> lock(m_dynamic_mutex);

#if ONCA_RAL_VALIDATION
    if (present_info.update_rects) {
        ONCA_RAL_CHECK_PARAM(!present_info.update_rects->empty(), "Update rects may not be empty when provided");
    }
#endif

    return m_handle->present(m_dynamic.present_mode, m_dynamic.current_index, *m_queue, present_info);
}

Result<void> SwapChain::acquire_next_backbuffer() {
    std::unique_lock<std::shared_mutex> lock(m_dynamic_mutex);

    auto index = m_handle->acquire_next_backbuffer();
    if (!index) {
        return index.error();
    }
    m_dynamic.current_index = *index;
    return Ok();
}

Result<void> SwapChain::change_present_mode(PresentMode present_mode) {
    std::unique_lock<std::shared_mutex> lock(m_dynamic_mutex);
    if (m_dynamic.present_mode == present_mode) {
        return Ok();
    }

    if (!m_handle->needs_present_mode_recreate()) {
        m_dynamic.present_mode = present_mode;
        return Ok();
    }

    auto device = m_device.upgrade();
    if (!device) {
        return Error(RalError::use_after_device_dropped());
    }

    SwapChainChangeParams params = change_params(m_dynamic);
    params.present_mode = present_mode;

    auto result = m_handle->recreate_swapchain((*device)->physical_device(), params);
    if (!result) {
        return result.error();
    }

    auto backbuffers = create_backbuffers(std::move(result->backbuffers), result->width, result->height,
        result->format, result->backbuffer_usages);
    m_dynamic.backbuffers.swap(backbuffers);
    m_dynamic.width = result->width;
    m_dynamic.height = result->height;
    m_dynamic.num_backbuffers = result->num_backbuffers;
    m_dynamic.format = result->format;
    m_dynamic.usages = result->backbuffer_usages;
    m_dynamic.present_mode = result->present_mode;
    m_dynamic.current_index = 0;

    ral_logger()->debug("Recreated swap chain for present mode {} ({} backbuffers)",
        present_mode_name(m_dynamic.present_mode), m_dynamic.num_backbuffers);
    return Ok();
}

Result<void> SwapChain::resize(std::uint16_t width, std::uint16_t height) {
    std::unique_lock<std::shared_mutex> lock(m_dynamic_mutex);
    if (m_dynamic.width == width && m_dynamic.height == height) {
        return Ok();
    }

#if ONCA_RAL_VALIDATION
    ONCA_RAL_CHECK_PARAM(width != 0 && height != 0, "Swap chain dimensions may not be 0");
#endif

    auto device = m_device.upgrade();
    if (!device) {
        return Error(RalError::use_after_device_dropped());
    }

    SwapChainChangeParams params = change_params(m_dynamic);
    params.width = width;
    params.height = height;

    auto result = m_handle->resize((*device)->physical_device(), params);
    if (!result) {
        return result.error();
    }

    auto backbuffers = create_backbuffers(std::move(result->backbuffers), result->width, result->height,
        m_dynamic.format, m_dynamic.usages);
    m_dynamic.backbuffers.swap(backbuffers);
    m_dynamic.width = result->width;
    m_dynamic.height = result->height;
    m_dynamic.num_backbuffers = result->num_backbuffers;
    m_dynamic.current_index = 0;

    ral_logger()->debug("Resized swap chain to {}x{} (requested {}x{}), {} backbuffers", m_dynamic.width,
        m_dynamic.height, width, height, m_dynamic.num_backbuffers);
    return Ok();
}

std::uint16_t SwapChain::width() const {
    std::shared_lock<std::shared_mutex> lock(m_dynamic_mutex);
    return m_dynamic.width;
}

std::uint16_t SwapChain::height() const {
    std::shared_lock<std::shared_mutex> lock(m_dynamic_mutex);
    return m_dynamic.height;
}

TextureSize SwapChain::backbuffer_size() const {
    std::shared_lock<std::shared_mutex> lock(m_dynamic_mutex);
    return TextureSize::texture_2d(m_dynamic.width, m_dynamic.height);
}

PresentMode SwapChain::present_mode() const {
    std::shared_lock<std::shared_mutex> lock(m_dynamic_mutex);
    return m_dynamic.present_mode;
}

std::vector<Backbuffer> SwapChain::backbuffers() const {
    std::shared_lock<std::shared_mutex> lock(m_dynamic_mutex);
    return m_dynamic.backbuffers;
}

std::uint8_t SwapChain::current_backbuffer_index() const {
    std::shared_lock<std::shared_mutex> lock(m_dynamic_mutex);
    return m_dynamic.current_index;
}

Backbuffer SwapChain::current_backbuffer() const {
    std::shared_lock<std::shared_mutex> lock(m_dynamic_mutex);
    return m_dynamic.backbuffers[m_dynamic.current_index];
}

std::uint8_t SwapChain::num_backbuffers() const {
    std::shared_lock<std::shared_mutex> lock(m_dynamic_mutex);
    return m_dynamic.num_backbuffers;
}

Format SwapChain::backbuffer_format() const {
    std::shared_lock<std::shared_mutex> lock(m_dynamic_mutex);
    return m_dynamic.format;
}

TextureUsage SwapChain::backbuffer_usages() const {
    std::shared_lock<std::shared_mutex> lock(m_dynamic_mutex);
    return m_dynamic.usages;
}

std::vector<Backbuffer> SwapChain::create_backbuffers(std::vector<BackbufferInterfaces> interfaces,
        std::uint16_t width, std::uint16_t height, Format format, TextureUsage usages) const {
    std::vector<Backbuffer> backbuffers;
    backbuffers.reserve(interfaces.size());

    for (auto& iface : interfaces) {
        TextureDesc desc;
        desc.size = TextureSize::texture_2d(width, height);
        desc.format = format;
        desc.usages = usages;

        auto texture = Handle<Texture>::create(m_device, std::move(iface.texture), std::optional<GpuAllocation>{}, desc);
        auto rtv = Handle<RenderTargetView>::create(texture.downgrade(), std::move(iface.rtv), TextureViewDesc::rtv_2d(format));
        backbuffers.push_back(Backbuffer{std::move(texture), std::move(rtv)});
    }
    return backbuffers;
}

SwapChainChangeParams SwapChain::change_params(const Dynamic& dynamic) const {
    SwapChainChangeParams params;
    params.width = dynamic.width;
    params.height = dynamic.height;
    params.num_backbuffers = dynamic.num_backbuffers;
    params.format = dynamic.format;
    params.backbuffer_usages = dynamic.usages;
    params.present_mode = dynamic.present_mode;
    params.alpha_mode = m_alpha_mode;
    params.queue = m_queue;
    return params;
}

} // namespace onca_ral
