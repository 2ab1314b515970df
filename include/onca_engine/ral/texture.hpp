#pragma once

/// @file texture.hpp
/// @brief Textures and render target views

#include "fwd.hpp"
#include "common.hpp"
#include "format.hpp"
#include "memory.hpp"
#include <memory>
#include <optional>

namespace onca_ral {

// =============================================================================
// Texture Description
// =============================================================================

enum class TextureType : std::uint8_t {
    Texture1D,
    Texture2D,
    Texture3D,
};

/// Dimensions of a texture, including array layers and mip levels
struct TextureSize {
    TextureType type = TextureType::Texture2D;
    std::uint16_t width = 1;
    std::uint16_t height = 1;
    /// Depth for 3D textures, array layers otherwise
    std::uint16_t depth_or_layers = 1;
    std::uint8_t mip_levels = 1;

    [[nodiscard]] static constexpr TextureSize texture_1d(std::uint16_t width, std::uint16_t layers = 1, std::uint8_t mips = 1) noexcept {
        return TextureSize{TextureType::Texture1D, width, 1, layers, mips};
    }

    [[nodiscard]] static constexpr TextureSize texture_2d(std::uint16_t width, std::uint16_t height, std::uint16_t layers = 1, std::uint8_t mips = 1) noexcept {
        return TextureSize{TextureType::Texture2D, width, height, layers, mips};
    }

    [[nodiscard]] static constexpr TextureSize texture_3d(std::uint16_t width, std::uint16_t height, std::uint16_t depth, std::uint8_t mips = 1) noexcept {
        return TextureSize{TextureType::Texture3D, width, height, depth, mips};
    }

    /// Number of mips down to a 1x1(x1) level
    [[nodiscard]] std::uint8_t max_mip_levels() const noexcept;

    constexpr bool operator==(const TextureSize&) const noexcept = default;
};

enum class TextureUsage : std::uint16_t {
    None = 0,
    CopySrc = 1 << 0,
    CopyDst = 1 << 1,
    Sampled = 1 << 2,
    Storage = 1 << 3,
    ColorAttachment = 1 << 4,
    DepthStencilAttachment = 1 << 5,
};
ONCA_RAL_FLAGS(TextureUsage)

enum class TextureFlags : std::uint8_t {
    None = 0,
    /// 2D array texture that can be viewed as a cube map
    CubeCompatible = 1 << 0,
};
ONCA_RAL_FLAGS(TextureFlags)

struct TextureDesc {
    TextureSize size;
    Format format = Format::R8G8B8A8UNorm;
    TextureUsage usages = TextureUsage::None;
    TextureFlags flags = TextureFlags::None;
    GpuAllocationDesc alloc_desc;
};

// =============================================================================
// Texture
// =============================================================================

/// Backend side of a texture; destroys the native image on destruction
class TextureInterface {
public:
    virtual ~TextureInterface() = default;
};

/// GPU image resource
///
/// Swap-chain backbuffers have no allocation, their memory belongs to the swap chain.
class Texture {
public:
    Texture(WeakHandle<Device> device, std::unique_ptr<TextureInterface> handle, std::optional<GpuAllocation> allocation,
        TextureDesc desc);

    /// Destroys the native texture, then returns the allocation to the device's allocator
    ~Texture();

    Texture(const Texture&) = delete;
    Texture& operator=(const Texture&) = delete;

    [[nodiscard]] const TextureSize& size() const noexcept { return m_desc.size; }
    [[nodiscard]] Format format() const noexcept { return m_desc.format; }
    [[nodiscard]] TextureUsage usages() const noexcept { return m_desc.usages; }
    [[nodiscard]] TextureFlags flags() const noexcept { return m_desc.flags; }
    [[nodiscard]] const TextureDesc& desc() const noexcept { return m_desc; }
    [[nodiscard]] const std::optional<GpuAllocation>& allocation() const noexcept { return m_allocation; }
    [[nodiscard]] bool is_backbuffer() const noexcept { return !m_allocation.has_value(); }

    [[nodiscard]] TextureInterface& interface() const noexcept { return *m_handle; }

private:
    WeakHandle<Device> m_device;
    std::unique_ptr<TextureInterface> m_handle;
    std::optional<GpuAllocation> m_allocation;
    TextureDesc m_desc;
};

// =============================================================================
// RenderTargetView
// =============================================================================

enum class TextureViewType : std::uint8_t {
    View1D,
    View2D,
    View3D,
    View1DArray,
    View2DArray,
    ViewCube,
};

struct TextureViewDesc {
    TextureViewType view_type = TextureViewType::View2D;
    Format format = Format::R8G8B8A8UNorm;

    /// Single-mip 2D color view
    [[nodiscard]] static constexpr TextureViewDesc rtv_2d(Format format) noexcept {
        return TextureViewDesc{TextureViewType::View2D, format};
    }
};

/// Backend side of a render target view
class RenderTargetViewInterface {
public:
    virtual ~RenderTargetViewInterface() = default;
};

/// View of a texture used as color attachment
class RenderTargetView {
public:
    RenderTargetView(WeakHandle<Texture> texture, std::unique_ptr<RenderTargetViewInterface> handle, TextureViewDesc desc);
    ~RenderTargetView();

    RenderTargetView(const RenderTargetView&) = delete;
    RenderTargetView& operator=(const RenderTargetView&) = delete;

    /// Viewed texture, if it still exists
    [[nodiscard]] std::optional<Handle<Texture>> texture() const { return m_texture.upgrade(); }
    [[nodiscard]] const TextureViewDesc& desc() const noexcept { return m_desc; }
    [[nodiscard]] Format format() const noexcept { return m_desc.format; }

    [[nodiscard]] RenderTargetViewInterface& interface() const noexcept { return *m_handle; }

private:
    WeakHandle<Texture> m_texture;
    std::unique_ptr<RenderTargetViewInterface> m_handle;
    TextureViewDesc m_desc;
};

} // namespace onca_ral
