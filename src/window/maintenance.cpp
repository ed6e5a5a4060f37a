// =============================================================================
// maintenance.cpp — the periodic tick and configuration reload
// =============================================================================
// Panes do not push repaint requests; every MAINTENANCE_INTERVAL the window
// polls what changed (config generation, cursor blink, dirty rows, the
// multiplexer's invalidated flag) and asks for at most one repaint.
// =============================================================================

#include "term_window.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"

namespace termwin
{

    void TermWindow::start_periodic_maintenance()
    {
        std::weak_ptr<TermWindow> weak = shared_from_this();
        connection_.schedule_timer(MAINTENANCE_INTERVAL, [weak]()
                                   {
                                       auto tw = weak.lock();
                                       if (!tw || tw->is_closed())
                                           return false;
                                       tw->periodic_window_maintenance();
                                       return !tw->is_closed(); });
    }

    void TermWindow::periodic_window_maintenance()
    {
        drain_pending();
        check_for_config_reload();

        std::vector<RenderedPane> panes = panes_to_render();
        if (panes.empty())
        {
            // The last tab went away.
            TERMWIN_LOG_DEBUG("window " << mux_window_id_ << " has no panes left; closing");
            closed_ = true;
            if (window_)
                window_->close();
            return;
        }

        bool needs_invalidate = false;

        if (focused_ && config_->cursor_blink_rate != 0)
        {
            for (const auto &rp : panes)
            {
                if (!rp.pos.is_active)
                    continue;
                CursorShape shape = effective_shape(config_->default_cursor_style,
                                                    rp.pos.pane->get_cursor_position().shape);
                if (!is_blinking(shape))
                    continue;
                Clock::time_point now = now_();
                if (now - last_blink_paint_ > std::chrono::milliseconds(config_->cursor_blink_rate))
                {
                    last_blink_paint_ = now;
                    needs_invalidate = true;
                }
            }
        }

        for (const auto &rp : panes)
        {
            const Pane &pane = *rp.pos.pane;
            RenderableDimensions dims = pane.get_dimensions();
            StableRowIndex top = get_viewport(rp.state_id).value_or(dims.physical_top);
            std::vector<StableRowIndex> dirty =
                pane.get_dirty_lines(top, top + static_cast<StableRowIndex>(dims.viewport_rows));
            if (dirty.empty())
                continue;

            needs_invalidate = true;
            // Search and copy mode repaint their own highlighting and must
            // keep the selection they made.
            if (is_viewport_aware(pane.kind()))
                continue;
            Selection &sel = selection(rp.state_id);
            if (sel.intersects_rows(dirty))
                sel.clear();
        }

        if (MuxWindow *window = mux_.get_window(mux_window_id_))
        {
            if (window->check_and_reset_invalidated())
                needs_invalidate = true;
        }

        if (show_scroll_bar_)
        {
            PaneSlot slot = active_pane_or_overlay();
            if (slot.pane)
            {
                RenderableDimensions dims = slot.pane->get_dimensions();
                if (last_scroll_info_ != dims)
                {
                    last_scroll_info_ = dims;
                    needs_invalidate = true;
                }
            }
        }

        if (needs_invalidate)
            invalidate();
    }

    void TermWindow::check_for_config_reload()
    {
        if (config_store_.generation() != config_.generation)
            config_was_reloaded();
    }

    void TermWindow::config_was_reloaded()
    {
        config_ = load_effective_config();
        TERMWIN_LOG_DEBUG("window " << mux_window_id_ << " picking up config generation "
                                    << config_.generation);

        palette_.reset();
        background_ = reload_background_image(*config_, background_);

        MuxWindow *window = mux_.get_window(mux_window_id_);
        show_tab_bar_ = tab_bar_visible(*config_, window ? window->len() : 0);
        show_scroll_bar_ = config_->enable_scroll_bar;
        last_scroll_info_.reset();
        input_map_ = InputMap(*config_);

        try
        {
            fonts_->config_changed(*config_);
        }
        catch (const FontError &e)
        {
            TERMWIN_LOG_ERROR("keeping previous fonts: " << e.what());
        }

        Dimensions dims = dimensions_;
        RowsAndCols cells = current_cell_dimensions();
        apply_scale_change(dims, fonts_->get_font_scale());
        apply_dimensions(dims, cells);

        if (window_)
            window_->config_did_change();
        invalidate();
    }

} // namespace termwin
