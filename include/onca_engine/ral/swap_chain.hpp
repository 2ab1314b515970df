#pragma once

/// @file swap_chain.hpp
/// @brief Presentation surfaces

#include "fwd.hpp"
#include "common.hpp"
#include "format.hpp"
#include "texture.hpp"
#include <memory>
#include <optional>
#include <shared_mutex>
#include <vector>

namespace onca_ral {

// =============================================================================
// Presentation Types
// =============================================================================

enum class PresentMode : std::uint8_t {
    /// Present as soon as rendering is done, may tear
    Immediate,
    /// Present on v-blank, queued backbuffers can be replaced by newer ones
    Mailbox,
    /// Present on v-blank in submission order; always supported
    Fifo,
};

[[nodiscard]] const char* present_mode_name(PresentMode mode);

enum class SwapChainAlphaMode : std::uint8_t {
    /// Alpha is ignored and implicitly 1
    Ignore,
    /// Color is already multiplied by alpha
    Premultiplied,
    /// Color is not multiplied by alpha
    PostMultiplied,
    /// Compositor decides
    Unspecified,
};

/// Region of an image that moved on screen since the last present
struct PresentScrollRect {
    std::int32_t src_x = 0;
    std::int32_t src_y = 0;
    std::int32_t dst_x = 0;
    std::int32_t dst_y = 0;
    std::uint32_t width = 0;
    std::uint32_t height = 0;
};

struct PresentInfo {
    /// Fence and value to wait for before presenting
    std::optional<std::pair<Handle<Fence>, std::uint64_t>> wait_fence;
    /// Regions that changed since the last present; must not be empty when set
    std::optional<std::vector<Rect>> update_rects;
    std::optional<PresentScrollRect> scroll_rect;
};

/// Window system a window handle belongs to
enum class WindowSystem : std::uint8_t {
    None,
    Win32,
    Xlib,
    Wayland,
};

/// Native window, supplied by the window layer
///
/// - Win32: `app_handle` is the HINSTANCE, `window` the HWND
/// - Xlib: `app_handle` is the Display*, `window` the Window id
/// - Wayland: `app_handle` is the wl_display*, `window` the wl_surface*
struct WindowHandle {
    WindowSystem system = WindowSystem::None;
    void* app_handle = nullptr;
    std::uintptr_t window = 0;
};

struct SwapChainDesc {
    WindowHandle window;
    std::uint16_t width = 0;
    std::uint16_t height = 0;
    std::uint8_t num_backbuffers = 2;
    /// Formats in order of preference, the first supported one is used
    std::vector<Format> formats;
    TextureUsage usages = TextureUsage::ColorAttachment;
    PresentMode present_mode = PresentMode::Fifo;
    bool preserve_after_present = false;
    SwapChainAlphaMode alpha_mode = SwapChainAlphaMode::Ignore;
    Handle<CommandQueue> queue;
};

/// Backbuffer texture and its render target view
struct Backbuffer {
    Handle<Texture> texture;
    Handle<RenderTargetView> rtv;
};

// =============================================================================
// Backend Interface
// =============================================================================

/// Native backbuffer objects produced by a backend
struct BackbufferInterfaces {
    std::unique_ptr<TextureInterface> texture;
    std::unique_ptr<RenderTargetViewInterface> rtv;
};

/// Parameters for recreating or resizing a swap chain
struct SwapChainChangeParams {
    std::uint16_t width = 0;
    std::uint16_t height = 0;
    std::uint8_t num_backbuffers = 0;
    Format format = Format::B8G8R8A8UNorm;
    TextureUsage backbuffer_usages = TextureUsage::None;
    PresentMode present_mode = PresentMode::Fifo;
    SwapChainAlphaMode alpha_mode = SwapChainAlphaMode::Ignore;
    Handle<CommandQueue> queue;
};

struct SwapChainRecreateResultInfo {
    std::vector<BackbufferInterfaces> backbuffers;
    std::uint16_t width = 0;
    std::uint16_t height = 0;
    std::uint8_t num_backbuffers = 0;
    Format format = Format::B8G8R8A8UNorm;
    TextureUsage backbuffer_usages = TextureUsage::None;
    PresentMode present_mode = PresentMode::Fifo;
};

struct SwapChainResizeResultInfo {
    std::vector<BackbufferInterfaces> backbuffers;
    std::uint16_t width = 0;
    std::uint16_t height = 0;
    /// The backend may hand out a different image count than before
    std::uint8_t num_backbuffers = 0;
};

/// Backend side of a swap chain
class SwapChainInterface {
public:
    virtual ~SwapChainInterface() = default;

    [[nodiscard]] virtual Result<void> present(PresentMode present_mode, std::uint8_t backbuffer_index,
        const CommandQueue& queue, const PresentInfo& present_info) = 0;

    /// Block until a backbuffer is available, returns its index
    [[nodiscard]] virtual Result<std::uint8_t> acquire_next_backbuffer() = 0;

    /// Whether changing the present mode requires recreating the backbuffers
    [[nodiscard]] virtual bool needs_present_mode_recreate() const = 0;

    /// Build a replacement native swap chain; the current one stays valid when this fails
    [[nodiscard]] virtual Result<SwapChainRecreateResultInfo> recreate_swapchain(const PhysicalDevice& phys_dev,
        const SwapChainChangeParams& params) = 0;

    /// Resize the backbuffers; the current ones stay valid when this fails
    [[nodiscard]] virtual Result<SwapChainResizeResultInfo> resize(const PhysicalDevice& phys_dev,
        const SwapChainChangeParams& params) = 0;
};

/// Result of swap-chain creation
struct SwapChainResultInfo {
    std::unique_ptr<SwapChainInterface> handle;
    std::vector<BackbufferInterfaces> backbuffers;
    std::uint16_t width = 0;
    std::uint16_t height = 0;
    std::uint8_t num_backbuffers = 0;
    Format format = Format::B8G8R8A8UNorm;
    TextureUsage backbuffer_usages = TextureUsage::None;
    PresentMode present_mode = PresentMode::Fifo;
};

// =============================================================================
// SwapChain
// =============================================================================

/// Presentation surface of a window, owning a ring of backbuffers
///
/// Everything produced by the backend (extent, backbuffer count, format, usages, present mode,
/// backbuffers and the current index) can change at run time and is guarded by a reader/writer lock. Replacement backbuffers are fully built before they
/// are swapped in, so a failed resize or mode change leaves the previous set intact.
class SwapChain {
public:
    SwapChain(WeakHandle<Device> device, const SwapChainDesc& desc, SwapChainResultInfo result);
    ~SwapChain();

    SwapChain(const SwapChain&) = delete;
    SwapChain& operator=(const SwapChain&) = delete;

    /// Present the current backbuffer
    [[nodiscard]] Result<void> present(const PresentInfo& present_info);

    /// Acquire the next backbuffer and make it current
    [[nodiscard]] Result<void> acquire_next_backbuffer();

    /// Change the present mode, recreating the backbuffers if the backend requires it
    [[nodiscard]] Result<void> change_present_mode(PresentMode present_mode);

    /// Resize the backbuffers, no-op when the size is unchanged
    [[nodiscard]] Result<void> resize(std::uint16_t width, std::uint16_t height);

    [[nodiscard]] std::uint16_t width() const;
    [[nodiscard]] std::uint16_t height() const;
    [[nodiscard]] TextureSize backbuffer_size() const;
    [[nodiscard]] PresentMode present_mode() const;
    [[nodiscard]] std::vector<Backbuffer> backbuffers() const;
    [[nodiscard]] std::uint8_t current_backbuffer_index() const;
    [[nodiscard]] Backbuffer current_backbuffer() const;
    [[nodiscard]] std::uint8_t num_backbuffers() const;
    [[nodiscard]] Format backbuffer_format() const;
    [[nodiscard]] TextureUsage backbuffer_usages() const;

    [[nodiscard]] SwapChainAlphaMode alpha_mode() const noexcept { return m_alpha_mode; }
    [[nodiscard]] bool preserve_after_present() const noexcept { return m_preserve_after_present; }
    [[nodiscard]] const WindowHandle& window() const noexcept { return m_window; }
    [[nodiscard]] const Handle<CommandQueue>& queue() const noexcept { return m_queue; }

    [[nodiscard]] SwapChainInterface& interface() const noexcept { return *m_handle; }

private:
    struct Dynamic {
        std::uint16_t width = 0;
        std::uint16_t height = 0;
        std::uint8_t num_backbuffers = 0;
        Format format = Format::B8G8R8A8UNorm;
        TextureUsage usages = TextureUsage::None;
        PresentMode present_mode = PresentMode::Fifo;
        std::vector<Backbuffer> backbuffers;
        std::uint8_t current_index = 0;
    };

    [[nodiscard]] std::vector<Backbuffer> create_backbuffers(std::vector<BackbufferInterfaces> interfaces,
        std::uint16_t width, std::uint16_t height, Format format, TextureUsage usages) const;
    [[nodiscard]] SwapChainChangeParams change_params(const Dynamic& dynamic) const;

    std::unique_ptr<SwapChainInterface> m_handle;
    WeakHandle<Device> m_device;
    WindowHandle m_window;
    SwapChainAlphaMode m_alpha_mode;
    bool m_preserve_after_present;
    Handle<CommandQueue> m_queue;

    mutable std::shared_mutex m_dynamic_mutex;
    Dynamic m_dynamic;
};

} // namespace onca_ral
