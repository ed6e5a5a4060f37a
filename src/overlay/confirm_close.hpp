#pragma once

// =============================================================================
// confirm_close.hpp — "really close?" overlays
// =============================================================================
// Each runs on the overlay executor: it asks the question in its overlay pane
// and, on 'y', queues the close on the window's thread. The caller cancels
// the overlay afterwards either way.
// =============================================================================

#include "../core/types.hpp"
#include "../window/window_handle.hpp"
#include "overlay_pane.hpp"

#include <string>

namespace termwin
{

    /// Show `message` and wait for y/n. Escape, Ctrl-C and a killed pane
    /// count as "no".
    bool run_confirmation(OverlayTerm &term, const std::string &message);

    void confirm_close_pane(PaneId pane_id, OverlayTerm &term, const WindowHandle &window);
    void confirm_close_tab(TabId tab_id, OverlayTerm &term, const WindowHandle &window);
    void confirm_close_window(MuxWindowId mux_window_id, OverlayTerm &term,
                              const WindowHandle &window);

} // namespace termwin
