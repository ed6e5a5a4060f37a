#pragma once

// =============================================================================
// mux.hpp — the multiplexer interface consumed by the window core
// =============================================================================
// The multiplexer owns windows, tabs and panes and their lifecycles. The
// window core only enumerates, queries and asks for removals. All calls are
// made from the GUI thread.
// =============================================================================

#include "pane.hpp"

#include <memory>
#include <string>
#include <vector>

namespace termwin
{

    class Tab
    {
    public:
        virtual ~Tab() = default;

        virtual TabId tab_id() const = 0;
        virtual std::shared_ptr<Pane> get_active_pane() const = 0;
        virtual void set_active_pane(PaneId pane_id) = 0;

        /// Panes with their placement; a zoomed tab yields only the active
        /// pane at full size.
        virtual std::vector<PositionedPane> iter_panes() const = 0;

        virtual PtySize get_size() const = 0;
        virtual void resize(const PtySize &size) = 0;
        virtual std::size_t count_panes() const = 0;
        virtual void kill_pane(PaneId pane_id) = 0;
        virtual bool can_close_without_prompting() const = 0;
        virtual void toggle_zoom() = 0;
    };

    class MuxWindow
    {
    public:
        virtual ~MuxWindow() = default;

        virtual std::size_t len() const = 0;
        bool is_empty() const { return len() == 0; }

        virtual std::size_t get_active_idx() const = 0;
        virtual void set_active(std::size_t idx) = 0;
        virtual std::shared_ptr<Tab> get_by_idx(std::size_t idx) const = 0;
        virtual std::shared_ptr<Tab> remove_by_idx(std::size_t idx) = 0;
        virtual void insert(std::size_t idx, std::shared_ptr<Tab> tab) = 0;
        virtual std::vector<std::shared_ptr<Tab>> tabs() const = 0;

        /// True when something asked this window to repaint since the last
        /// call; the flag is cleared by the call.
        virtual bool check_and_reset_invalidated() = 0;
        virtual void invalidate() = 0;
    };

    class Mux
    {
    public:
        virtual ~Mux() = default;

        /// nullptr when the window does not exist (any more).
        virtual MuxWindow *get_window(MuxWindowId window_id) = 0;
        virtual std::shared_ptr<Tab> get_active_tab_for_window(MuxWindowId window_id) = 0;
        virtual std::shared_ptr<Pane> get_pane(PaneId pane_id) const = 0;

        virtual PaneId allocate_pane_id() = 0;
        /// Register a pane created outside a tab (overlays).
        virtual void add_pane(std::shared_ptr<Pane> pane) = 0;
        /// Unregister and kill a pane. Unknown ids are ignored.
        virtual void remove_pane(PaneId pane_id) = 0;
        virtual void remove_tab(TabId tab_id) = 0;
        virtual void kill_window(MuxWindowId window_id) = 0;

        /// Create a tab running `command` in the given window.
        virtual std::shared_ptr<Tab> spawn_tab(MuxWindowId window_id,
                                               const std::string &command,
                                               const PtySize &size) = 0;
    };

} // namespace termwin
