#pragma once

// =============================================================================
// geometry.hpp — mapping between window pixels and terminal cells
// =============================================================================
// Two directions:
//
//   * scale-preserving: keep rows/cols, derive the window size they need
//     (DPI or font scale changed, or the tab bar appeared/disappeared);
//   * window-driven: keep the window size, derive how many rows/cols fit
//     (the user resized the window).
//
// Feeding the window size produced by the first into the second yields the
// same rows/cols again.
// =============================================================================

#include "../core/types.hpp"

#include <string>

namespace termwin
{

    struct Config;

    struct CellSize
    {
        std::size_t width = 0;
        std::size_t height = 0;

        bool operator==(const CellSize &o) const { return width == o.width && height == o.height; }
        bool operator!=(const CellSize &o) const { return !(*this == o); }
    };

    /// Font metrics at the current scale and DPI.
    struct RenderMetrics
    {
        CellSize cell_size;
        /// Pixels below the baseline, for underline placement.
        int descender = 0;
        /// Face and pixel size the cells were measured with; the render
        /// surface rasterizes glyphs from the same.
        std::string font_path;
        int pixel_size = 0;
    };

    /// Fonts rendering below this height are refused.
    constexpr double MIN_FONT_HEIGHT_PX = 2.0;

    /// Pixel height a font of `font_size` points would have at `font_scale`
    /// and `dpi`.
    double theoretical_font_height(double font_size, double font_scale, std::size_t dpi);

    inline bool is_degenerate_scale(double font_size, double font_scale, std::size_t dpi)
    {
        return theoretical_font_height(font_size, font_scale, dpi) < MIN_FONT_HEIGHT_PX;
    }

    /// Right padding in pixels; reserves one cell for the scroll bar when it
    /// is enabled and no right padding is configured.
    std::size_t effective_right_padding(const Config &config, const RenderMetrics &metrics);

    bool tab_bar_visible(const Config &config, std::size_t num_tabs);

    struct Geometry
    {
        Dimensions dimensions;
        PtySize terminal_size;
    };

    /// Window size needed to show `cells` with the tab bar row (if shown)
    /// and padding.
    Geometry scale_preserving_geometry(const RowsAndCols &cells, std::size_t dpi,
                                       const RenderMetrics &metrics, const Config &config,
                                       bool show_tab_bar);

    /// Rows/cols that fit into `dims` after padding and the tab bar row.
    /// Subtractions saturate at zero.
    Geometry window_driven_geometry(const Dimensions &dims, const RenderMetrics &metrics,
                                    const Config &config, bool show_tab_bar);

    /// Pixel rectangle of the text cursor for IME placement.
    PixelRect text_cursor_rect(const StableCursorPosition &cursor, StableRowIndex physical_top,
                               const RenderMetrics &metrics, const Config &config,
                               bool show_tab_bar);

} // namespace termwin
