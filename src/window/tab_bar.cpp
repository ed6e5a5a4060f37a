// =============================================================================
// tab_bar.cpp
// =============================================================================

#include "tab_bar.hpp"
#include "../core/types.hpp"

#include <algorithm>

namespace termwin
{

    // Keep at most `width` codepoints of `s`, padding with spaces.
    static std::string fit(const std::string &s, std::size_t width)
    {
        std::string out;
        std::size_t i = 0, n = 0;
        while (i < s.size() && n < width)
        {
            append_utf8(out, next_codepoint(s, i));
            ++n;
        }
        out.append(width - n, ' ');
        return out;
    }

    TabBarState TabBarState::compute(const std::vector<std::string> &titles, std::size_t active,
                                     std::size_t cols)
    {
        TabBarState state;
        if (titles.empty() || cols == 0)
            return state;

        std::size_t width = std::min(MAX_TAB_WIDTH, std::max<std::size_t>(cols / titles.size(), 1));
        std::size_t col = 0;
        for (std::size_t i = 0; i < titles.size() && col < cols; ++i)
        {
            TabBarEntry entry;
            entry.active = i == active;
            entry.start_col = col;
            entry.width = std::min(width, cols - col);
            entry.label = fit(" " + std::to_string(i + 1) + ": " + titles[i] + " ", entry.width);
            state.tabs.push_back(entry);
            col += entry.width;
        }
        return state;
    }

    std::optional<std::size_t> TabBarState::tab_at_column(std::size_t col) const
    {
        for (std::size_t i = 0; i < tabs.size(); ++i)
            if (col >= tabs[i].start_col && col < tabs[i].start_col + tabs[i].width)
                return i;
        return std::nullopt;
    }

} // namespace termwin
