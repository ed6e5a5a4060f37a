// =============================================================================
// sdl_connection.cpp — SDL2 windows and event dispatch
// =============================================================================

#include "sdl_connection.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"
#include "sdl_render_surface.hpp"
#include "ttf_font_config.hpp"

#include <SDL2/SDL.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <vector>

namespace termwin
{

    // =============================================================================
    // SdlWindow
    // =============================================================================

    SdlWindow::SdlWindow(SDL_Window *window) : window_(window) {}

    SdlWindow::~SdlWindow()
    {
        if (window_)
            SDL_DestroyWindow(window_);
    }

    uint32_t SdlWindow::window_id() const
    {
        return SDL_GetWindowID(window_);
    }

    void SdlWindow::show()
    {
        SDL_ShowWindow(window_);
    }

    void SdlWindow::hide()
    {
        SDL_HideWindow(window_);
    }

    void SdlWindow::toggle_fullscreen()
    {
        bool fullscreen = (SDL_GetWindowFlags(window_) & SDL_WINDOW_FULLSCREEN_DESKTOP) != 0;
        if (SDL_SetWindowFullscreen(window_, fullscreen ? 0 : SDL_WINDOW_FULLSCREEN_DESKTOP) != 0)
            TERMWIN_LOG_WARN("cannot toggle fullscreen: " << SDL_GetError());
    }

    void SdlWindow::set_title(const std::string &title)
    {
        SDL_SetWindowTitle(window_, title.c_str());
    }

    void SdlWindow::set_inner_size(std::size_t pixel_width, std::size_t pixel_height)
    {
        SDL_SetWindowSize(window_, static_cast<int>(pixel_width), static_cast<int>(pixel_height));
    }

    void SdlWindow::set_text_cursor_position(const PixelRect &rect)
    {
        SDL_Rect r = {rect.x, rect.y, rect.width, rect.height};
        SDL_SetTextInputRect(&r);
    }

    void SdlWindow::config_did_change()
    {
        needs_paint_ = true;
    }

    bool SdlWindow::take_paint_request()
    {
        bool requested = needs_paint_;
        needs_paint_ = false;
        return requested;
    }

    // =============================================================================
    // Timers
    // =============================================================================
    // SDL calls timer callbacks on its own thread; all they do is wake the
    // event loop.

    namespace
    {
        // Registered once per process; the callback reads it from SDL's
        // timer thread.
        std::atomic<Uint32> g_timer_event_type{0};

        Uint32 push_timer_event(Uint32 interval, void *param)
        {
            SDL_Event event;
            SDL_zero(event);
            event.type = g_timer_event_type.load();
            event.user.code = static_cast<Sint32>(reinterpret_cast<intptr_t>(param));
            SDL_PushEvent(&event);
            return interval;
        }

        uint8_t sdl_mods(Uint16 mod)
        {
            uint8_t mods = MOD_NONE;
            if (mod & KMOD_SHIFT)
                mods |= MOD_SHIFT;
            if (mod & KMOD_CTRL)
                mods |= MOD_CTRL;
            if (mod & KMOD_ALT)
                mods |= MOD_ALT;
            if (mod & KMOD_GUI)
                mods |= MOD_SUPER;
            return mods;
        }

        KeyCode named_key(SDL_Keycode sym)
        {
            switch (sym)
            {
            case SDLK_RETURN:
            case SDLK_KP_ENTER:
                return KeyCode::Enter;
            case SDLK_ESCAPE:
                return KeyCode::Escape;
            case SDLK_TAB:
                return KeyCode::Tab;
            case SDLK_BACKSPACE:
                return KeyCode::Backspace;
            case SDLK_DELETE:
                return KeyCode::Delete;
            case SDLK_INSERT:
                return KeyCode::Insert;
            case SDLK_UP:
                return KeyCode::UpArrow;
            case SDLK_DOWN:
                return KeyCode::DownArrow;
            case SDLK_LEFT:
                return KeyCode::LeftArrow;
            case SDLK_RIGHT:
                return KeyCode::RightArrow;
            case SDLK_PAGEUP:
                return KeyCode::PageUp;
            case SDLK_PAGEDOWN:
                return KeyCode::PageDown;
            case SDLK_HOME:
                return KeyCode::Home;
            case SDLK_END:
                return KeyCode::End;
            default:
                return KeyCode::Unknown;
            }
        }

        MouseButton sdl_button(Uint8 button)
        {
            switch (button)
            {
            case SDL_BUTTON_LEFT:
                return MouseButton::Left;
            case SDL_BUTTON_MIDDLE:
                return MouseButton::Middle;
            case SDL_BUTTON_RIGHT:
                return MouseButton::Right;
            default:
                return MouseButton::None;
            }
        }
    } // namespace

    // =============================================================================
    // SdlConnection
    // =============================================================================

    SdlConnection::SdlConnection(std::optional<std::size_t> dpi_override)
        : dpi_override_(dpi_override)
    {
        if (g_timer_event_type.load() == 0)
        {
            Uint32 type = SDL_RegisterEvents(1);
            if (type == static_cast<Uint32>(-1))
                throw WindowError("SdlError", std::string("SDL_RegisterEvents: ") + SDL_GetError());
            g_timer_event_type.store(type);
        }
        timer_event_type_ = g_timer_event_type.load();
    }

    SdlConnection::~SdlConnection()
    {
        for (auto &entry : timers_)
            SDL_RemoveTimer(entry.second.sdl_timer);
        timers_.clear();

        // Callbacks (and with them the render surfaces) before the windows.
        for (auto &entry : windows_)
            entry.second.callbacks.reset();
        windows_.clear();
    }

    std::shared_ptr<WindowOps> SdlConnection::new_window(const std::string &window_class,
                                                         const std::string &title,
                                                         std::size_t pixel_width,
                                                         std::size_t pixel_height,
                                                         std::shared_ptr<WindowCallbacks> callbacks)
    {
        // Read by the X11 backend for WM_CLASS.
        SDL_SetHint("SDL_VIDEO_X11_WMCLASS", window_class.c_str());

        SDL_Window *sdl_window = SDL_CreateWindow(
            title.c_str(), SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
            static_cast<int>(pixel_width), static_cast<int>(pixel_height),
            SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE);
        if (!sdl_window)
            throw WindowError("SdlError", std::string("SDL_CreateWindow: ") + SDL_GetError());

        auto window = std::make_shared<SdlWindow>(sdl_window);
        windows_[window->window_id()] = Entry{window, std::move(callbacks)};
        SDL_StartTextInput();
        return window;
    }

    std::unique_ptr<RenderSurface> SdlConnection::create_render_surface(
        WindowOps &window, const RenderMetrics &metrics, std::size_t pixel_width,
        std::size_t pixel_height)
    {
        SdlWindow *sdl = dynamic_cast<SdlWindow *>(&window);
        if (!sdl)
            throw RenderSurfaceError("window was not created by the SDL connection");
        TERMWIN_LOG_DEBUG("creating SDL renderer for " << pixel_width << "x" << pixel_height);
        return std::make_unique<SdlRenderSurface>(sdl->sdl_window(), metrics);
    }

    std::unique_ptr<FontConfiguration> SdlConnection::new_font_configuration(const Config &config)
    {
        return std::make_unique<TtfFontConfiguration>(config);
    }

    void SdlConnection::schedule_timer(std::chrono::milliseconds interval,
                                       std::function<bool()> tick)
    {
        intptr_t timer_id = next_timer_id_++;
        SDL_TimerID sdl_timer = SDL_AddTimer(static_cast<Uint32>(interval.count()),
                                             push_timer_event,
                                             reinterpret_cast<void *>(timer_id));
        if (sdl_timer == 0)
            throw WindowError("SdlError", std::string("SDL_AddTimer: ") + SDL_GetError());
        timers_[timer_id] = Timer{sdl_timer, std::move(tick)};
    }

    SdlConnection::Entry *SdlConnection::entry_for(uint32_t window_id)
    {
        auto it = windows_.find(window_id);
        if (it == windows_.end() || it->second.window->is_closed() || !it->second.callbacks)
            return nullptr;
        return &it->second;
    }

    Dimensions SdlConnection::dimensions_of(const SdlWindow &window) const
    {
        Dimensions dims;
        int w = 0, h = 0;
        SDL_GetWindowSize(window.sdl_window(), &w, &h);
        dims.pixel_width = static_cast<std::size_t>(std::max(w, 0));
        dims.pixel_height = static_cast<std::size_t>(std::max(h, 0));

        if (dpi_override_)
        {
            dims.dpi = *dpi_override_;
            return dims;
        }
        float ddpi = 0.0f;
        int display = SDL_GetWindowDisplayIndex(window.sdl_window());
        if (display >= 0 && SDL_GetDisplayDPI(display, &ddpi, nullptr, nullptr) == 0 && ddpi > 0.0f)
            dims.dpi = static_cast<std::size_t>(std::lround(ddpi));
        else
            dims.dpi = DEFAULT_DPI;
        return dims;
    }

    // =============================================================================
    // Main loop
    // =============================================================================

    void SdlConnection::run()
    {
        while (!windows_.empty())
        {
            SDL_Event event;
            while (SDL_PollEvent(&event))
                dispatch(event);

            paint_windows();
            reap_closed_windows();

            // Small sleep to avoid burning CPU when idle
            SDL_Delay(4);
        }
        TERMWIN_LOG_DEBUG("last window closed");
    }

    void SdlConnection::dispatch(const SDL_Event &event)
    {
        if (event.type == timer_event_type_)
        {
            fire_timer(event.user.code);
            return;
        }

        switch (event.type)
        {
        case SDL_QUIT:
            quit_requested();
            break;

        case SDL_WINDOWEVENT:
            dispatch_window_event(event);
            break;

        case SDL_KEYDOWN:
            dispatch_key(event);
            break;

        case SDL_TEXTINPUT:
            dispatch_text(event);
            break;

        case SDL_MOUSEBUTTONDOWN:
        case SDL_MOUSEBUTTONUP:
        case SDL_MOUSEMOTION:
        case SDL_MOUSEWHEEL:
            dispatch_mouse(event);
            break;

        case SDL_RENDER_TARGETS_RESET:
        case SDL_RENDER_DEVICE_RESET:
        {
            TERMWIN_LOG_WARN("graphics device reset; rebuilding windows");
            std::vector<std::shared_ptr<WindowCallbacks>> callbacks;
            for (auto &entry : windows_)
            {
                if (!entry.second.window->is_closed() && entry.second.callbacks)
                    callbacks.push_back(entry.second.callbacks);
            }
            for (auto &cb : callbacks)
                cb->context_lost();
            break;
        }

        default:
            break;
        }
    }

    void SdlConnection::dispatch_window_event(const SDL_Event &event)
    {
        Entry *entry = entry_for(event.window.windowID);
        if (!entry)
            return;
        auto callbacks = entry->callbacks;
        auto window = entry->window;

        switch (event.window.event)
        {
        case SDL_WINDOWEVENT_SIZE_CHANGED:
            callbacks->resize(dimensions_of(*window));
            break;
        case SDL_WINDOWEVENT_DISPLAY_CHANGED:
            callbacks->resize(dimensions_of(*window));
            break;
        case SDL_WINDOWEVENT_FOCUS_GAINED:
            callbacks->focus_change(true);
            break;
        case SDL_WINDOWEVENT_FOCUS_LOST:
            callbacks->focus_change(false);
            break;
        case SDL_WINDOWEVENT_EXPOSED:
            window->invalidate();
            break;
        case SDL_WINDOWEVENT_CLOSE:
            if (callbacks->can_close())
                window->close();
            break;
        default:
            break;
        }
    }

    void SdlConnection::dispatch_key(const SDL_Event &event)
    {
        Entry *entry = entry_for(event.key.windowID);
        if (!entry)
            return;

        SDL_Keycode sym = event.key.keysym.sym;
        uint8_t mods = sdl_mods(event.key.keysym.mod);

        KeyCode named = named_key(sym);
        if (named != KeyCode::Unknown)
        {
            auto callbacks = entry->callbacks;
            callbacks->key_event(KeyEvent::named(named, mods));
            return;
        }

        // Plain characters arrive as SDL_TEXTINPUT; only chords with a
        // command modifier are taken from the key event.
        if ((mods & (MOD_CTRL | MOD_ALT | MOD_SUPER)) && sym >= 0x20 && sym < 0x7f)
        {
            auto callbacks = entry->callbacks;
            callbacks->key_event(KeyEvent::chr(static_cast<char32_t>(sym), mods));
        }
    }

    void SdlConnection::dispatch_text(const SDL_Event &event)
    {
        if (SDL_GetModState() & (KMOD_CTRL | KMOD_ALT | KMOD_GUI))
            return;
        Entry *entry = entry_for(event.text.windowID);
        if (!entry)
            return;
        auto callbacks = entry->callbacks;

        // SDL_TextInput gives us UTF-8 text directly
        std::string text = event.text.text;
        std::size_t i = 0;
        while (i < text.size())
            callbacks->key_event(KeyEvent::chr(next_codepoint(text, i)));
    }

    void SdlConnection::dispatch_mouse(const SDL_Event &event)
    {
        uint32_t window_id = 0;
        MouseEvent me;
        me.mods = sdl_mods(static_cast<Uint16>(SDL_GetModState()));

        switch (event.type)
        {
        case SDL_MOUSEBUTTONDOWN:
        case SDL_MOUSEBUTTONUP:
            window_id = event.button.windowID;
            me.kind = event.type == SDL_MOUSEBUTTONDOWN ? MouseEventKind::Press
                                                        : MouseEventKind::Release;
            me.button = sdl_button(event.button.button);
            me.x = event.button.x;
            me.y = event.button.y;
            me.left_held = (SDL_GetMouseState(nullptr, nullptr) & SDL_BUTTON_LMASK) != 0;
            break;
        case SDL_MOUSEMOTION:
            window_id = event.motion.windowID;
            me.kind = MouseEventKind::Move;
            me.x = event.motion.x;
            me.y = event.motion.y;
            me.left_held = (event.motion.state & SDL_BUTTON_LMASK) != 0;
            break;
        case SDL_MOUSEWHEEL:
            window_id = event.wheel.windowID;
            me.kind = MouseEventKind::VertWheel;
            me.wheel = event.wheel.direction == SDL_MOUSEWHEEL_FLIPPED ? -event.wheel.y
                                                                       : event.wheel.y;
            me.left_held = (SDL_GetMouseState(&me.x, &me.y) & SDL_BUTTON_LMASK) != 0;
            if (me.wheel == 0)
                return;
            break;
        default:
            return;
        }

        Entry *entry = entry_for(window_id);
        if (!entry)
            return;
        auto callbacks = entry->callbacks;
        callbacks->mouse_event(me);
    }

    void SdlConnection::fire_timer(intptr_t timer_id)
    {
        auto it = timers_.find(timer_id);
        if (it == timers_.end())
            return;

        // The tick may schedule further timers; hold our own copy of it.
        std::function<bool()> tick = it->second.tick;
        if (tick())
            return;

        it = timers_.find(timer_id);
        if (it != timers_.end())
        {
            SDL_RemoveTimer(it->second.sdl_timer);
            timers_.erase(it);
        }
    }

    void SdlConnection::quit_requested()
    {
        std::vector<Entry> entries;
        for (auto &entry : windows_)
        {
            if (!entry.second.window->is_closed() && entry.second.callbacks)
                entries.push_back(entry.second);
        }
        for (auto &entry : entries)
        {
            if (entry.callbacks->can_close())
                entry.window->close();
        }
    }

    void SdlConnection::paint_windows()
    {
        std::vector<Entry> dirty;
        for (auto &entry : windows_)
        {
            if (!entry.second.window->is_closed() && entry.second.callbacks &&
                entry.second.window->take_paint_request())
                dirty.push_back(entry.second);
        }
        for (auto &entry : dirty)
            entry.callbacks->paint();
    }

    void SdlConnection::reap_closed_windows()
    {
        for (auto it = windows_.begin(); it != windows_.end();)
        {
            if (!it->second.window->is_closed())
            {
                ++it;
                continue;
            }
            TERMWIN_LOG_DEBUG("destroying SDL window " << it->first);
            it->second.callbacks.reset();
            it = windows_.erase(it);
        }
    }

} // namespace termwin
