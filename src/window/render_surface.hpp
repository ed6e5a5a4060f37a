#pragma once

// =============================================================================
// render_surface.hpp — what the window hands to the renderer
// =============================================================================
// The window builds a PaintModel (layout, visible lines, selection, cursor,
// chrome) and the render surface turns it into pixels. Glyph caches and
// atlases live on the surface side.
// =============================================================================

#include "../config/config.hpp"
#include "../mux/pane.hpp"
#include "../selection/selection.hpp"
#include "background_image.hpp"
#include "geometry.hpp"
#include "palette.hpp"
#include "scroll_bar.hpp"
#include "tab_bar.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace termwin
{

    struct PaintPane
    {
        PositionedPane pos;
        /// Stable row shown on the pane's first line.
        StableRowIndex top = 0;
        std::vector<Line> lines;
        std::optional<SelectionRange> selection;
        StableCursorPosition cursor;
        bool draw_cursor = false;
    };

    struct PaintModel
    {
        Dimensions dimensions;
        RenderMetrics metrics;
        WindowPadding padding;
        std::size_t right_padding = 0;
        ColorPalette palette;
        bool show_tab_bar = false;
        TabBarState tab_bar;
        std::optional<ScrollThumb> scroll_thumb;
        std::vector<PaintPane> panes;
        std::shared_ptr<const ImageData> background;
    };

    class RenderSurface
    {
    public:
        virtual ~RenderSurface() = default;

        /// Throws RenderSurfaceError; the surface keeps its old size then.
        virtual void advise_of_window_size_change(const RenderMetrics &metrics,
                                                  std::size_t pixel_width,
                                                  std::size_t pixel_height) = 0;

        /// Rebuild glyph storage for new metrics. Throws RenderSurfaceError.
        virtual void recreate_glyph_atlas(const RenderMetrics &metrics) = 0;

        virtual void clear_glyph_cache() = 0;

        virtual void paint(const PaintModel &model) = 0;
    };

} // namespace termwin
