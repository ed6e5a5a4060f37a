// =============================================================================
// sdl_clipboard.cpp — SDL clipboard and primary selection
// =============================================================================

#include "sdl_clipboard.hpp"
#include "../core/log.hpp"

#include <SDL2/SDL.h>

namespace termwin
{

    namespace
    {
        std::string take_sdl_text(char *text)
        {
            if (!text)
                return {};
            std::string out(text);
            SDL_free(text);
            return out;
        }
    } // namespace

    void SdlClipboard::set_contents(ClipboardKind kind, const std::string &text)
    {
        if (kind == ClipboardKind::Clipboard)
        {
            if (SDL_SetClipboardText(text.c_str()) != 0)
                TERMWIN_LOG_WARN("cannot set clipboard: " << SDL_GetError());
            return;
        }
#if SDL_VERSION_ATLEAST(2, 26, 0)
        if (SDL_SetPrimarySelectionText(text.c_str()) != 0)
            TERMWIN_LOG_WARN("cannot set primary selection: " << SDL_GetError());
#else
        std::lock_guard<std::mutex> lock(mutex_);
        primary_ = text;
#endif
    }

    void SdlClipboard::get_contents(ClipboardKind kind, std::function<void(std::string)> done)
    {
        std::string text;
        if (kind == ClipboardKind::Clipboard)
            text = take_sdl_text(SDL_GetClipboardText());
        else
        {
#if SDL_VERSION_ATLEAST(2, 26, 0)
            text = take_sdl_text(SDL_GetPrimarySelectionText());
#else
            std::lock_guard<std::mutex> lock(mutex_);
            text = primary_;
#endif
        }
        done(std::move(text));
    }

} // namespace termwin
