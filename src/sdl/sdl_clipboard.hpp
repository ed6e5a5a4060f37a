#pragma once

// =============================================================================
// sdl_clipboard.hpp — Clipboard on top of SDL's clipboard API
// =============================================================================
// SDL reads are synchronous, so get_contents() calls back before returning.
// Older SDL releases have no primary selection; it is then kept in-process.
// =============================================================================

#include "../window/clipboard.hpp"

#include <mutex>
#include <string>

namespace termwin
{

    class SdlClipboard : public Clipboard
    {
    public:
        void set_contents(ClipboardKind kind, const std::string &text) override;
        void get_contents(ClipboardKind kind, std::function<void(std::string)> done) override;

    private:
        std::mutex mutex_;
        std::string primary_; // used when SDL has no primary selection
    };

} // namespace termwin
