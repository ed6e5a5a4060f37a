// =============================================================================
// overlay_pane.cpp
// =============================================================================

#include "overlay_pane.hpp"

namespace termwin
{

    OverlayPane::OverlayPane(PaneId pane_id, const PtySize &size, PaneKind kind,
                             std::string title)
        : BufferPane(pane_id, size, std::move(title), 0), kind_(kind)
    {
        set_cursor_visible(false);
    }

    void OverlayPane::key_down(const KeyEvent &event)
    {
        {
            std::lock_guard<std::mutex> lock(key_mutex_);
            if (killed_)
                return;
            keys_.push_back(event);
        }
        key_cv_.notify_one();
    }

    void OverlayPane::kill()
    {
        BufferPane::kill();
        {
            std::lock_guard<std::mutex> lock(key_mutex_);
            killed_ = true;
        }
        key_cv_.notify_all();
    }

    std::optional<KeyEvent> OverlayPane::wait_key()
    {
        std::unique_lock<std::mutex> lock(key_mutex_);
        key_cv_.wait(lock, [this] { return killed_ || !keys_.empty(); });
        if (keys_.empty())
            return std::nullopt;
        KeyEvent event = keys_.front();
        keys_.pop_front();
        return event;
    }

    void OverlayTerm::render(const std::vector<std::string> &lines)
    {
        pane_->clear();
        std::string text;
        for (std::size_t i = 0; i < lines.size(); ++i)
        {
            if (i > 0)
                text += '\n';
            text += lines[i];
        }
        pane_->print(text);
    }

} // namespace termwin
