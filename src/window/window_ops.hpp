#pragma once

// =============================================================================
// window_ops.hpp — the window-system bridge
// =============================================================================
// WindowOps is what the core may ask of a native window. WindowCallbacks is
// what the native window reports back; the connection keeps the callbacks
// alive until the window is closed. All calls happen on the GUI thread.
// =============================================================================

#include "../config/key_assignment.hpp"
#include "../core/types.hpp"
#include "font_config.hpp"
#include "render_surface.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace termwin
{

    enum class MouseButton
    {
        None,
        Left,
        Middle,
        Right,
    };

    enum class MouseEventKind
    {
        Move,
        Press,
        Release,
        VertWheel,
    };

    struct MouseEvent
    {
        MouseEventKind kind = MouseEventKind::Move;
        MouseButton button = MouseButton::None;
        int x = 0; // pixels from the window's left edge
        int y = 0;
        int wheel = 0; // positive scrolls up
        uint8_t mods = MOD_NONE;
        bool left_held = false;
    };

    class WindowOps
    {
    public:
        virtual ~WindowOps() = default;

        /// Request a paint.
        virtual void invalidate() = 0;
        virtual void close() = 0;
        virtual void show() = 0;
        virtual void hide() = 0;
        virtual void toggle_fullscreen() = 0;
        virtual void set_title(const std::string &title) = 0;
        virtual void set_inner_size(std::size_t pixel_width, std::size_t pixel_height) = 0;
        virtual void set_text_cursor_position(const PixelRect &rect) = 0;
        virtual void config_did_change() = 0;
    };

    class WindowCallbacks
    {
    public:
        virtual ~WindowCallbacks() = default;

        virtual void focus_change(bool focused) = 0;
        virtual void resize(const Dimensions &dims) = 0;
        /// Returns true when the key was consumed.
        virtual bool key_event(const KeyEvent &event) = 0;
        virtual void mouse_event(const MouseEvent &event) = 0;
        /// Returns true when the window may close right away.
        virtual bool can_close() = 0;
        /// The graphics context is gone; rebuild window and surface.
        virtual void context_lost() = 0;
        virtual void paint() = 0;
        /// Run closures queued from other threads.
        virtual void drain_pending() = 0;
    };

    class WindowConnection
    {
    public:
        virtual ~WindowConnection() = default;

        /// Create a native window; the connection holds `callbacks` until the
        /// window closes. Throws WindowError.
        virtual std::shared_ptr<WindowOps> new_window(const std::string &window_class,
                                                      const std::string &title,
                                                      std::size_t pixel_width,
                                                      std::size_t pixel_height,
                                                      std::shared_ptr<WindowCallbacks> callbacks) = 0;

        /// Throws RenderSurfaceError.
        virtual std::unique_ptr<RenderSurface> create_render_surface(WindowOps &window,
                                                                     const RenderMetrics &metrics,
                                                                     std::size_t pixel_width,
                                                                     std::size_t pixel_height) = 0;

        /// Throws FontError.
        virtual std::unique_ptr<FontConfiguration> new_font_configuration(const Config &config) = 0;

        /// Call `tick` on the GUI thread every `interval` until it returns
        /// false.
        virtual void schedule_timer(std::chrono::milliseconds interval,
                                    std::function<bool()> tick) = 0;
    };

} // namespace termwin
