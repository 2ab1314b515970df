/// @file texture.cpp
/// @brief Textures and render target views

#include <onca_engine/ral/texture.hpp>
#include <onca_engine/ral/device.hpp>
#include <algorithm>

namespace onca_ral {

std::uint8_t TextureSize::max_mip_levels() const noexcept {
    std::uint32_t largest = width;
    if (type != TextureType::Texture1D) {
        largest = std::max<std::uint32_t>(largest, height);
    }
    if (type == TextureType::Texture3D) {
        largest = std::max<std::uint32_t>(largest, depth_or_layers);
    }

    std::uint8_t levels = 1;
    while (largest > 1) {
        largest >>= 1;
        ++levels;
    }
    return levels;
}

// =============================================================================
// Texture
// =============================================================================

Texture::Texture(WeakHandle<Device> device, std::unique_ptr<TextureInterface> handle,
        std::optional<GpuAllocation> allocation, TextureDesc desc)
    : m_device(std::move(device))
    , m_handle(std::move(handle))
    , m_allocation(std::move(allocation))
    , m_desc(desc) {}

Texture::~Texture() {
    m_handle.reset();

    if (!m_allocation) {
        return;
    }

    auto device = m_device.upgrade();
    if (!device) {
        ral_logger()->error("Texture outlived its device, the allocation cannot be returned to the allocator");
        return;
    }
    (*device)->gpu_allocator().free(std::move(*m_allocation));
    m_allocation.reset();
}

// =============================================================================
// RenderTargetView
// =============================================================================

RenderTargetView::RenderTargetView(WeakHandle<Texture> texture, std::unique_ptr<RenderTargetViewInterface> handle,
        TextureViewDesc desc)
    : m_texture(std::move(texture))
    , m_handle(std::move(handle))
    , m_desc(desc) {}

RenderTargetView::~RenderTargetView() = default;

} // namespace onca_ral
