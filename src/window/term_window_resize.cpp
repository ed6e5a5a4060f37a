// =============================================================================
// term_window_resize.cpp — font scale changes and geometry recompute
// =============================================================================
// Two ways in: the window system reports a new size (rows/cols follow the
// pixels), or the DPI or font scale changed (rows/cols are kept and the
// window is asked to resize around them). Both end in apply_dimensions.
// =============================================================================

#include "term_window.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"

namespace termwin
{

    bool TermWindow::apply_scale_change(const Dimensions &dims, double font_scale)
    {
        if (is_degenerate_scale(config_->font_size, font_scale, dims.dpi))
        {
            TERMWIN_LOG_WARN("refusing to change font scale to " << font_scale << " at "
                                                                 << dims.dpi
                                                                 << " dpi: glyphs would be under "
                                                                 << MIN_FONT_HEIGHT_PX << "px");
            return false;
        }

        auto prior = fonts_->change_scaling(font_scale,
                                            static_cast<double>(dims.dpi) / DEFAULT_DPI);
        try
        {
            metrics_ = fonts_->metrics();
        }
        catch (const FontError &e)
        {
            TERMWIN_LOG_ERROR("keeping font scale " << prior.first << ": " << e.what());
            fonts_->change_scaling(prior.first, prior.second);
            return false;
        }

        if (render_surface_)
        {
            render_surface_->clear_glyph_cache();
            try
            {
                render_surface_->recreate_glyph_atlas(metrics_);
            }
            catch (const RenderSurfaceError &e)
            {
                // paint() retries the rebuild if the stale atlas overflows.
                TERMWIN_LOG_ERROR("failed to rebuild glyph atlas: " << e.what());
            }
        }
        return true;
    }

    void TermWindow::apply_dimensions(const Dimensions &dims,
                                      std::optional<RowsAndCols> scale_changed_cells)
    {
        apply_dimensions_impl(dims, scale_changed_cells, true);
    }

    void TermWindow::apply_dimensions_impl(const Dimensions &dims,
                                           std::optional<RowsAndCols> scale_changed_cells,
                                           bool allow_regeometry)
    {
        Dimensions orig = dimensions_;
        dimensions_ = dims;

        Geometry geometry =
            scale_changed_cells
                ? scale_preserving_geometry(*scale_changed_cells, dims.dpi, metrics_, *config_,
                                            show_tab_bar_)
                : window_driven_geometry(dims, metrics_, *config_, show_tab_bar_);

        bool accepted = true;
        if (render_surface_)
        {
            try
            {
                render_surface_->advise_of_window_size_change(metrics_, dims.pixel_width,
                                                              dims.pixel_height);
            }
            catch (const RenderSurfaceError &e)
            {
                TERMWIN_LOG_ERROR("failed to resize from " << orig.pixel_width << "x"
                                                           << orig.pixel_height << " to "
                                                           << dims.pixel_width << "x"
                                                           << dims.pixel_height << ": "
                                                           << e.what());
                dimensions_ = orig;
                scale_changed_cells.reset();
                accepted = false;
            }
        }

        if (accepted)
        {
            terminal_size_ = geometry.terminal_size;
            if (MuxWindow *window = mux_.get_window(mux_window_id_))
            {
                for (const auto &tab : window->tabs())
                    tab->resize(terminal_size_);
            }
        }

        bool tab_bar_before = show_tab_bar_;
        update_title_impl(allow_regeometry);

        // When the tab bar flipped, the nested pass already sized the window
        // for the new layout.
        if (scale_changed_cells && window_ && show_tab_bar_ == tab_bar_before)
        {
            TERMWIN_LOG_TRACE("resizing window to " << geometry.dimensions.pixel_width << "x"
                                                    << geometry.dimensions.pixel_height
                                                    << " to keep " << scale_changed_cells->cols
                                                    << "x" << scale_changed_cells->rows);
            window_->set_inner_size(geometry.dimensions.pixel_width,
                                    geometry.dimensions.pixel_height);
        }
        invalidate();
    }

    void TermWindow::scaling_changed(const Dimensions &dims, double font_scale)
    {
        bool scale_changed = dims.dpi != dimensions_.dpi ||
                             font_scale != fonts_->get_font_scale();

        std::optional<RowsAndCols> scale_changed_cells;
        if (scale_changed)
        {
            scale_changed_cells = current_cell_dimensions();
            if (!apply_scale_change(dims, font_scale))
                return;
        }
        apply_dimensions(dims, scale_changed_cells);
    }

    void TermWindow::adjust_font_scale(double font_scale)
    {
        Dimensions dims = dimensions_;
        if (config_->adjust_window_size_when_changing_font_size)
            scaling_changed(dims, font_scale);
        else if (apply_scale_change(dims, font_scale))
            apply_dimensions(dims, std::nullopt);
    }

    void TermWindow::reset_font_and_window_size()
    {
        RowsAndCols size = config_->initial_size();

        std::unique_ptr<FontConfiguration> fonts = connection_.new_font_configuration(*config_);
        fonts->change_scaling(1.0, static_cast<double>(dimensions_.dpi) / DEFAULT_DPI);
        RenderMetrics metrics = fonts->metrics();

        bool show_tab_bar = config_->enable_tab_bar && !config_->hide_tab_bar_if_only_one_tab;
        Geometry geometry =
            scale_preserving_geometry(size, dimensions_.dpi, metrics, *config_, show_tab_bar);

        if (!apply_scale_change(geometry.dimensions, 1.0))
            return;
        apply_dimensions(geometry.dimensions, size);
    }

} // namespace termwin
