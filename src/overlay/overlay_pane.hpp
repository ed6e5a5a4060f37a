#pragma once

// =============================================================================
// overlay_pane.hpp — panes driven by an overlay task
// =============================================================================
// An OverlayPane is drawn like any BufferPane, but keys sent to it are queued
// for the task that runs the overlay instead of being encoded for a child
// process. Killing the pane (the multiplexer does that when the window
// releases the overlay) wakes the task so it can finish.
//
// OverlayTerm is the task's side of the pane.
// =============================================================================

#include "../mux/buffer_pane.hpp"

#include <condition_variable>
#include <deque>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace termwin
{

    class OverlayPane : public BufferPane
    {
    public:
        OverlayPane(PaneId pane_id, const PtySize &size, PaneKind kind, std::string title);

        PaneKind kind() const override { return kind_; }
        void key_down(const KeyEvent &event) override;
        void kill() override;

        /// Block until a key arrives. Empty once the pane was killed.
        std::optional<KeyEvent> wait_key();

    private:
        PaneKind kind_;
        std::mutex key_mutex_;
        std::condition_variable key_cv_;
        std::deque<KeyEvent> keys_;
        bool killed_ = false;
    };

    class OverlayTerm
    {
    public:
        explicit OverlayTerm(std::shared_ptr<OverlayPane> pane) : pane_(std::move(pane)) {}

        std::optional<KeyEvent> read_key() { return pane_->wait_key(); }

        /// Replace the pane's content with `lines`.
        void render(const std::vector<std::string> &lines);

        PtySize size() const { return pane_->size(); }
        PaneId pane_id() const { return pane_->pane_id(); }

    private:
        std::shared_ptr<OverlayPane> pane_;
    };

} // namespace termwin
