// =============================================================================
// geometry.cpp — pixel/cell geometry
// =============================================================================

#include "geometry.hpp"
#include "../config/config.hpp"

#include <algorithm>
#include <limits>

namespace termwin
{

    static std::size_t saturating_sub(std::size_t a, std::size_t b)
    {
        return a > b ? a - b : 0;
    }

    static uint16_t to_u16(std::size_t v)
    {
        return static_cast<uint16_t>(std::min<std::size_t>(v, std::numeric_limits<uint16_t>::max()));
    }

    double theoretical_font_height(double font_size, double font_scale, std::size_t dpi)
    {
        return font_size * font_scale * static_cast<double>(dpi) / 72.0;
    }

    std::size_t effective_right_padding(const Config &config, const RenderMetrics &metrics)
    {
        if (config.enable_scroll_bar && config.window_padding.right == 0)
            return metrics.cell_size.width;
        return config.window_padding.right;
    }

    bool tab_bar_visible(const Config &config, std::size_t num_tabs)
    {
        return config.enable_tab_bar &&
               (num_tabs > 1 || !config.hide_tab_bar_if_only_one_tab);
    }

    Geometry scale_preserving_geometry(const RowsAndCols &cells, std::size_t dpi,
                                       const RenderMetrics &metrics, const Config &config,
                                       bool show_tab_bar)
    {
        const CellSize &cell = metrics.cell_size;
        const WindowPadding &pad = config.window_padding;

        Geometry g;
        g.terminal_size.rows = to_u16(cells.rows);
        g.terminal_size.cols = to_u16(cells.cols);
        g.terminal_size.pixel_width = to_u16(cells.cols * cell.width);
        g.terminal_size.pixel_height = to_u16(cells.rows * cell.height);

        std::size_t rows_with_tab_bar = cells.rows + (show_tab_bar ? 1 : 0);
        g.dimensions.pixel_height = rows_with_tab_bar * cell.height + pad.top + pad.bottom;
        g.dimensions.pixel_width =
            cells.cols * cell.width + pad.left + effective_right_padding(config, metrics);
        g.dimensions.dpi = dpi;
        return g;
    }

    Geometry window_driven_geometry(const Dimensions &dims, const RenderMetrics &metrics,
                                    const Config &config, bool show_tab_bar)
    {
        const CellSize &cell = metrics.cell_size;
        const WindowPadding &pad = config.window_padding;

        std::size_t avail_width = saturating_sub(
            dims.pixel_width, pad.left + effective_right_padding(config, metrics));
        std::size_t avail_height = saturating_sub(dims.pixel_height, pad.top + pad.bottom);

        std::size_t rows = cell.height ? avail_height / cell.height : 0;
        rows = saturating_sub(rows, show_tab_bar ? 1 : 0);
        std::size_t cols = cell.width ? avail_width / cell.width : 0;

        Geometry g;
        g.dimensions = dims;
        g.terminal_size.rows = to_u16(rows);
        g.terminal_size.cols = to_u16(cols);
        g.terminal_size.pixel_width = to_u16(avail_width);
        g.terminal_size.pixel_height = to_u16(avail_height);
        return g;
    }

    PixelRect text_cursor_rect(const StableCursorPosition &cursor, StableRowIndex physical_top,
                               const RenderMetrics &metrics, const Config &config,
                               bool show_tab_bar)
    {
        // The tab bar occupies the row above the first terminal row.
        StableRowIndex top = physical_top - (show_tab_bar ? 1 : 0);
        StableRowIndex row = std::max<StableRowIndex>(cursor.y - top, 0);

        const CellSize &cell = metrics.cell_size;
        PixelRect r;
        r.x = static_cast<int>(cursor.x * cell.width + config.window_padding.left);
        r.y = static_cast<int>(static_cast<std::size_t>(row) * cell.height +
                               config.window_padding.top);
        r.width = static_cast<int>(cell.width);
        r.height = static_cast<int>(cell.height);
        return r;
    }

} // namespace termwin
