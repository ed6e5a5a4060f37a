// =============================================================================
// term_window.cpp — creation, window events, title, scroll bar and paint
// =============================================================================

#include "term_window.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"

#include <algorithm>

namespace termwin
{

    // =========================================================================
    // Creation
    // =========================================================================

    TermWindow::TermWindow(Private, MuxWindowId mux_window_id, Services services,
                           std::map<std::string, std::string> config_overrides)
        : mux_(services.mux),
          config_store_(services.config_store),
          connection_(services.connection),
          executor_(services.executor),
          clipboard_(services.clipboard),
          now_(std::move(services.now)),
          mux_window_id_(mux_window_id),
          config_overrides_(std::move(config_overrides)),
          config_(load_effective_config()),
          overlays_(mux_),
          viewport_(overlays_, [this]
                    { invalidate(); }),
          mutations_(std::make_shared<MutationQueue>()),
          input_map_(*config_)
    {
        std::size_t dpi = config_->dpi.value_or(DEFAULT_DPI);

        fonts_ = connection_.new_font_configuration(*config_);
        fonts_->change_scaling(1.0, static_cast<double>(dpi) / DEFAULT_DPI);
        metrics_ = fonts_->metrics();

        background_ = load_background_image(*config_);

        MuxWindow *window = mux_.get_window(mux_window_id_);
        show_tab_bar_ = tab_bar_visible(*config_, window ? window->len() : 0);
        show_scroll_bar_ = config_->enable_scroll_bar;

        Geometry geometry = scale_preserving_geometry(config_->initial_size(), dpi, metrics_,
                                                      *config_, show_tab_bar_);
        dimensions_ = geometry.dimensions;
        terminal_size_ = geometry.terminal_size;

        if (window)
        {
            for (const auto &tab : window->tabs())
                tab->resize(terminal_size_);
        }

        last_blink_paint_ = now_();
    }

    std::shared_ptr<TermWindow> TermWindow::new_window(
        MuxWindowId mux_window_id, Services services,
        std::map<std::string, std::string> config_overrides)
    {
        auto tw = std::make_shared<TermWindow>(Private{}, mux_window_id, std::move(services),
                                               std::move(config_overrides));

        tw->window_ = tw->connection_.new_window(tw->config_->window_class, "termwin",
                                                 tw->dimensions_.pixel_width,
                                                 tw->dimensions_.pixel_height, tw);
        tw->created();
        tw->update_title();
        tw->start_periodic_maintenance();

        TERMWIN_LOG_DEBUG("window " << mux_window_id << " opened at "
                                    << tw->dimensions_.pixel_width << "x"
                                    << tw->dimensions_.pixel_height << " ("
                                    << tw->terminal_size_.cols << "x"
                                    << tw->terminal_size_.rows << " cells)");
        return tw;
    }

    TermWindow::~TermWindow()
    {
        mutations_->close();
        overlays_.release_all();
    }

    void TermWindow::created()
    {
        render_surface_.reset();
        try
        {
            render_surface_ = connection_.create_render_surface(
                *window_, metrics_, dimensions_.pixel_width, dimensions_.pixel_height);
        }
        catch (const RenderSurfaceError &e)
        {
            throw RenderSurfaceLost("failed to create a render surface: " + e.detail());
        }
        if (!render_surface_)
            throw RenderSurfaceLost("the window system returned no render surface");
    }

    ConfigHandle TermWindow::load_effective_config() const
    {
        ConfigHandle handle = config_store_.configuration();
        if (config_overrides_.empty())
            return handle;
        try
        {
            handle.config = std::make_shared<const Config>(
                handle.config->with_overrides(config_overrides_));
        }
        catch (const ConfigError &e)
        {
            TERMWIN_LOG_ERROR("ignoring window config overrides: " << e.what());
        }
        return handle;
    }

    // =========================================================================
    // Window events
    // =========================================================================

    void TermWindow::focus_change(bool focused)
    {
        TERMWIN_LOG_TRACE("focus_change " << focused);
        if (focused)
            focused_ = now_();
        else
        {
            focused_.reset();
            last_mouse_click_.reset();
            dragging_selection_ = false;
            dragging_scroll_bar_ = false;
        }

        // Restart the blink cycle so the cursor shows right away.
        last_blink_paint_ = now_();
        invalidate();

        if (auto pane = active_pane_or_overlay().pane)
            pane->focus_changed(focused);
    }

    void TermWindow::resize(const Dimensions &dims)
    {
        if (dims.pixel_width == 0 || dims.pixel_height == 0)
        {
            // Minimized.
            TERMWIN_LOG_TRACE("ignoring resize to " << dims.pixel_width << "x"
                                                    << dims.pixel_height);
            return;
        }
        scaling_changed(dims, fonts_->get_font_scale());
    }

    void TermWindow::context_lost()
    {
        auto self = shared_from_this();
        TERMWIN_LOG_WARN("graphics context lost; recreating the window");

        render_surface_.reset();
        std::shared_ptr<WindowOps> old = std::move(window_);
        if (old)
            old->close();

        try
        {
            window_ = connection_.new_window(config_->window_class, "termwin",
                                             dimensions_.pixel_width, dimensions_.pixel_height,
                                             self);
        }
        catch (const WindowError &e)
        {
            throw RenderSurfaceLost("failed to recreate the window: " + e.detail());
        }
        created();
        update_title();
        invalidate();
    }

    void TermWindow::drain_pending()
    {
        auto self = shared_from_this();
        for (auto &mutation : mutations_->take())
        {
            try
            {
                mutation(*this);
            }
            catch (const RenderSurfaceLost &)
            {
                throw;
            }
            catch (const WindowError &e)
            {
                TERMWIN_LOG_ERROR("queued window update failed: " << e.what());
            }
        }
    }

    // =========================================================================
    // Layout
    // =========================================================================

    std::vector<RenderedPane> TermWindow::panes_to_render()
    {
        auto tab = mux_.get_active_tab_for_window(mux_window_id_);
        if (!tab)
            return {};
        return overlays_.panes_to_render(*tab, metrics_.cell_size);
    }

    PaneSlot TermWindow::active_pane_or_overlay()
    {
        auto tab = mux_.get_active_tab_for_window(mux_window_id_);
        if (!tab)
            return {};
        return overlays_.active_pane_or_overlay(*tab);
    }

    // =========================================================================
    // Chrome
    // =========================================================================

    void TermWindow::invalidate()
    {
        if (window_)
            window_->invalidate();
    }

    const ColorPalette &TermWindow::palette()
    {
        if (!palette_)
            palette_ = ColorPalette::from_config(*config_);
        return *palette_;
    }

    void TermWindow::update_title()
    {
        update_title_impl(true);
    }

    void TermWindow::update_title_impl(bool allow_regeometry)
    {
        MuxWindow *window = mux_.get_window(mux_window_id_);
        if (!window)
            return;

        std::vector<std::string> titles;
        for (const auto &tab : window->tabs())
        {
            PaneSlot slot = overlays_.active_pane_or_overlay(*tab);
            titles.push_back(slot.pane ? slot.pane->get_title() : std::string());
        }
        std::size_t num_tabs = titles.size();
        std::size_t active_idx = window->get_active_idx();

        TabBarState tab_bar = TabBarState::compute(titles, active_idx, terminal_size_.cols);
        if (tab_bar != tab_bar_)
        {
            tab_bar_ = std::move(tab_bar);
            invalidate();
        }

        bool show_tab_bar = tab_bar_visible(*config_, num_tabs);
        if (show_tab_bar != show_tab_bar_)
        {
            show_tab_bar_ = show_tab_bar;
            invalidate();
            // The tab bar row moved in or out; keep rows/cols and let the
            // window grow or shrink around them. The nested pass may not
            // recompute again.
            if (allow_regeometry)
                apply_dimensions_impl(dimensions_, current_cell_dimensions(), false);
        }

        auto tab = mux_.get_active_tab_for_window(mux_window_id_);
        if (!tab || !window_)
            return;
        PaneSlot slot = overlays_.active_pane_or_overlay(*tab);
        if (!slot.pane)
            return;

        bool zoomed = false;
        for (const auto &pos : tab->iter_panes())
            zoomed = zoomed || pos.is_zoomed;

        std::string title = zoomed ? "[Z] " : "";
        if (num_tabs > 1)
            title += "[" + std::to_string(active_idx + 1) + "/" + std::to_string(num_tabs) + "] ";
        title += slot.pane->get_title();
        window_->set_title(title);
    }

    void TermWindow::update_scrollbar()
    {
        if (!show_scroll_bar_)
            return;
        PaneSlot slot = active_pane_or_overlay();
        if (!slot.pane)
            return;
        RenderableDimensions dims = slot.pane->get_dimensions();
        if (last_scroll_info_ == dims)
            return;
        last_scroll_info_ = dims;
        invalidate();
    }

    void TermWindow::update_text_cursor(const Pane &pane)
    {
        if (!window_)
            return;
        RenderableDimensions dims = pane.get_dimensions();
        window_->set_text_cursor_position(text_cursor_rect(
            pane.get_cursor_position(), dims.physical_top, metrics_, *config_, show_tab_bar_));
    }

    // =========================================================================
    // Paint
    // =========================================================================

    bool TermWindow::cursor_blink_visible(CursorShape shape) const
    {
        if (!focused_ || !is_blinking(shape) || config_->cursor_blink_rate == 0)
            return true;
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now_() - *focused_);
        auto ticks = static_cast<uint64_t>(elapsed.count()) / config_->cursor_blink_rate;
        return ticks % 2 == 0;
    }

    PaintModel TermWindow::build_paint_model()
    {
        PaintModel model;
        model.dimensions = dimensions_;
        model.metrics = metrics_;
        model.padding = config_->window_padding;
        model.right_padding = effective_right_padding(*config_, metrics_);
        model.palette = palette();
        model.show_tab_bar = show_tab_bar_;
        model.tab_bar = tab_bar_;
        model.background = background_;

        std::size_t track_height = static_cast<std::size_t>(terminal_size_.rows) *
                                   metrics_.cell_size.height;

        for (const auto &rp : panes_to_render())
        {
            const Pane &pane = *rp.pos.pane;
            RenderableDimensions dims = pane.get_dimensions();
            std::optional<StableRowIndex> viewport = get_viewport(rp.state_id);
            StableRowIndex top = viewport.value_or(dims.physical_top);

            PaintPane pp;
            pp.pos = rp.pos;
            auto fetched = pane.get_lines(top, top + static_cast<StableRowIndex>(rp.pos.height));
            pp.top = fetched.first;
            pp.lines = std::move(fetched.second);

            const Selection &sel = selection(rp.state_id);
            if (sel.range)
                pp.selection = sel.range->normalize();

            pp.cursor = pane.get_cursor_position();
            pp.cursor.shape = effective_shape(config_->default_cursor_style, pp.cursor.shape);
            bool on_screen = pp.cursor.y >= top &&
                             pp.cursor.y < top + static_cast<StableRowIndex>(rp.pos.height);
            pp.draw_cursor = rp.pos.is_active && pp.cursor.visible && on_screen &&
                             cursor_blink_visible(pp.cursor.shape);

            if (rp.pos.is_active && show_scroll_bar_)
                model.scroll_thumb = scroll_thumb(dims, viewport, track_height);

            model.panes.push_back(std::move(pp));
        }
        return model;
    }

    void TermWindow::paint()
    {
        if (!render_surface_)
            return;

        PaintModel model = build_paint_model();
        try
        {
            render_surface_->paint(model);
        }
        catch (const RenderSurfaceError &e)
        {
            // Usually a full glyph atlas; rebuild it and try once more.
            TERMWIN_LOG_WARN("paint failed, rebuilding glyph atlas: " << e.what());
            try
            {
                render_surface_->recreate_glyph_atlas(metrics_);
                render_surface_->paint(model);
            }
            catch (const RenderSurfaceError &again)
            {
                TERMWIN_LOG_ERROR("paint failed: " << again.what());
                return;
            }
        }

        for (const auto &rp : panes_to_render())
        {
            rp.pos.pane->make_all_lines_clean();
            if (rp.pos.is_active)
                update_text_cursor(*rp.pos.pane);
        }
    }

} // namespace termwin
