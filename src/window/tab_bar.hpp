#pragma once

// =============================================================================
// tab_bar.hpp — the one-row strip of tab titles
// =============================================================================

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace termwin
{

    struct TabBarEntry
    {
        std::string label;
        bool active = false;
        std::size_t start_col = 0;
        std::size_t width = 0;

        bool operator==(const TabBarEntry &o) const
        {
            return label == o.label && active == o.active && start_col == o.start_col &&
                   width == o.width;
        }
    };

    struct TabBarState
    {
        static constexpr std::size_t MAX_TAB_WIDTH = 24;

        std::vector<TabBarEntry> tabs;

        /// Lay out `titles` across `cols` columns. Labels read " 1: title "
        /// and are cut to the tab width.
        static TabBarState compute(const std::vector<std::string> &titles, std::size_t active,
                                   std::size_t cols);

        /// Index of the tab drawn at `col`.
        std::optional<std::size_t> tab_at_column(std::size_t col) const;

        bool operator==(const TabBarState &o) const { return tabs == o.tabs; }
        bool operator!=(const TabBarState &o) const { return !(*this == o); }
    };

} // namespace termwin
