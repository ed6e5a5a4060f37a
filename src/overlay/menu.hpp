#pragma once

// =============================================================================
// menu.hpp — pick-one-item overlays: tab navigator and launcher
// =============================================================================

#include "../core/types.hpp"
#include "../window/window_handle.hpp"
#include "overlay_pane.hpp"

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace termwin
{

    /// Let the user pick one of `items`: Up/Down or k/j move, Enter picks,
    /// digits 1-9 pick directly, Escape cancels.
    std::optional<std::size_t> run_menu(OverlayTerm &term, const std::string &heading,
                                        const std::vector<std::string> &items,
                                        std::size_t selected);

    /// List the window's tabs and activate the chosen one.
    void tab_navigator(OverlayTerm &term, const std::vector<std::string> &tab_titles,
                       std::size_t active_idx, const WindowHandle &window);

    struct LauncherEntry
    {
        std::string label;
        std::function<void(TermWindow &)> action;
    };

    /// Show `entries` and run the chosen entry's action on the window.
    void launcher(OverlayTerm &term, std::vector<LauncherEntry> entries,
                  const WindowHandle &window);

} // namespace termwin
