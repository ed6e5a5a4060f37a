#pragma once

// =============================================================================
// clipboard.hpp — system clipboard access
// =============================================================================

#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace termwin
{

    enum class ClipboardKind
    {
        Clipboard,
        PrimarySelection,
    };

    class Clipboard
    {
    public:
        virtual ~Clipboard() = default;

        virtual void set_contents(ClipboardKind kind, const std::string &text) = 0;

        /// Read asynchronously; `done` may be called on any thread.
        virtual void get_contents(ClipboardKind kind,
                                  std::function<void(std::string)> done) = 0;
    };

    /// Where an asynchronous read parks its text until the GUI thread picks
    /// it up.
    class ClipboardContents
    {
    public:
        void store(std::string text)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            text_ = std::move(text);
        }

        std::optional<std::string> take()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::optional<std::string> out = std::move(text_);
            text_.reset();
            return out;
        }

    private:
        std::mutex mutex_;
        std::optional<std::string> text_;
    };

} // namespace termwin
