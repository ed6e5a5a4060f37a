#pragma once

// =============================================================================
// palette.hpp — colors the render surface paints with
// =============================================================================

#include "../config/config.hpp"

namespace termwin
{

    struct ColorPalette
    {
        Color foreground = Color::default_fg();
        Color background = Color::default_bg();
        Color cursor_bg = Color::white();
        Color selection_bg = Color(80, 130, 200, 100);
        Color tab_bar_bg = Color(30, 30, 32);
        Color active_tab_bg = Color(60, 60, 66);
        Color scroll_thumb = Color(90, 90, 95, 160);

        static ColorPalette from_config(const Config &config)
        {
            ColorPalette p;
            p.foreground = config.colors.foreground;
            p.background = config.colors.background;
            p.cursor_bg = config.colors.cursor_bg;
            p.selection_bg = config.colors.selection_bg;
            return p;
        }
    };

} // namespace termwin
