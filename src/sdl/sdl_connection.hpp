#pragma once

// =============================================================================
// sdl_connection.hpp — native windows, timers and the event loop on SDL2
// =============================================================================
// The connection owns every SDL window together with the callbacks it reports
// to. SDL events are translated into KeyEvent/MouseEvent/Dimensions and
// dispatched on the thread that calls run(); timers fire there too, carried
// by a user event pushed from SDL's timer thread.
//
// close() only marks a window. The loop reaps marked windows after the
// current batch of events, dropping the callbacks before the SDL window so
// the renderer goes first.
// =============================================================================

#include "../window/window_ops.hpp"

#include <cstdint>
#include <map>
#include <memory>
#include <optional>

struct SDL_Window;
union SDL_Event;

namespace termwin
{

    class SdlWindow : public WindowOps
    {
    public:
        explicit SdlWindow(SDL_Window *window);
        ~SdlWindow() override;

        SdlWindow(const SdlWindow &) = delete;
        SdlWindow &operator=(const SdlWindow &) = delete;

        void invalidate() override { needs_paint_ = true; }
        void close() override { closed_ = true; }
        void show() override;
        void hide() override;
        void toggle_fullscreen() override;
        void set_title(const std::string &title) override;
        void set_inner_size(std::size_t pixel_width, std::size_t pixel_height) override;
        void set_text_cursor_position(const PixelRect &rect) override;
        void config_did_change() override;

        SDL_Window *sdl_window() const { return window_; }
        uint32_t window_id() const;
        bool is_closed() const { return closed_; }

        /// Returns whether a paint was requested and clears the request.
        bool take_paint_request();

    private:
        SDL_Window *window_;
        bool needs_paint_ = true;
        bool closed_ = false;
    };

    class SdlConnection : public WindowConnection
    {
    public:
        /// SDL and SDL_ttf must be initialised. `dpi_override` replaces the
        /// display DPI SDL reports.
        explicit SdlConnection(std::optional<std::size_t> dpi_override = std::nullopt);
        ~SdlConnection() override;

        SdlConnection(const SdlConnection &) = delete;
        SdlConnection &operator=(const SdlConnection &) = delete;

        std::shared_ptr<WindowOps> new_window(const std::string &window_class,
                                              const std::string &title,
                                              std::size_t pixel_width, std::size_t pixel_height,
                                              std::shared_ptr<WindowCallbacks> callbacks) override;

        std::unique_ptr<RenderSurface> create_render_surface(WindowOps &window,
                                                             const RenderMetrics &metrics,
                                                             std::size_t pixel_width,
                                                             std::size_t pixel_height) override;

        std::unique_ptr<FontConfiguration> new_font_configuration(const Config &config) override;

        void schedule_timer(std::chrono::milliseconds interval,
                            std::function<bool()> tick) override;

        /// Dispatch events until the last window has closed. RenderSurfaceLost
        /// and other fatal errors propagate.
        void run();

    private:
        struct Entry
        {
            std::shared_ptr<SdlWindow> window;
            std::shared_ptr<WindowCallbacks> callbacks;
        };

        struct Timer
        {
            int sdl_timer = 0;
            std::function<bool()> tick;
        };

        std::optional<std::size_t> dpi_override_;
        uint32_t timer_event_type_;
        std::map<uint32_t, Entry> windows_;
        std::map<intptr_t, Timer> timers_;
        intptr_t next_timer_id_ = 1;

        Entry *entry_for(uint32_t window_id);
        Dimensions dimensions_of(const SdlWindow &window) const;
        void dispatch(const SDL_Event &event);
        void dispatch_window_event(const SDL_Event &event);
        void dispatch_key(const SDL_Event &event);
        void dispatch_text(const SDL_Event &event);
        void dispatch_mouse(const SDL_Event &event);
        void fire_timer(intptr_t timer_id);
        void quit_requested();
        void paint_windows();
        void reap_closed_windows();
    };

} // namespace termwin
