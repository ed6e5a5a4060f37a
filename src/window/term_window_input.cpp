// =============================================================================
// term_window_input.cpp — keys, key assignments, tabs, clipboard and mouse
// =============================================================================

#include "term_window.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"

#include <algorithm>

namespace termwin
{

    // =========================================================================
    // Keyboard
    // =========================================================================

    bool TermWindow::key_event(const KeyEvent &event)
    {
        bool handled = false;
        if (auto assignment = input_map_.lookup(event))
        {
            perform_key_assignment(*assignment);
            handled = true;
        }
        else
        {
            PaneSlot slot = active_pane_or_overlay();
            if (slot.pane)
            {
                if (config_->scroll_to_bottom_on_input && !is_viewport_aware(slot.pane->kind()))
                    viewport_.scroll_to_bottom(slot.state_id);
                slot.pane->key_down(event);
                handled = true;
            }
        }
        drain_pending();
        return handled;
    }

    void TermWindow::perform_key_assignment(const KeyAssignment &assignment)
    {
        using Action = KeyAssignment::Action;
        TERMWIN_LOG_TRACE("key assignment " << static_cast<int>(assignment.action) << "("
                                            << assignment.arg << ")");
        try
        {
            switch (assignment.action)
            {
            case Action::Copy:
            {
                PaneSlot slot = active_pane_or_overlay();
                if (!slot.pane)
                    break;
                std::string text = selection_text(slot.state_id, *slot.pane);
                copy_to_clipboard(ClipboardKind::Clipboard, text);
                copy_to_clipboard(ClipboardKind::PrimarySelection, text);
                break;
            }
            case Action::Paste:
                paste_from_clipboard(ClipboardKind::Clipboard);
                break;
            case Action::PastePrimarySelection:
                paste_from_clipboard(ClipboardKind::PrimarySelection);
                break;
            case Action::ActivateTab:
                activate_tab(assignment.arg);
                break;
            case Action::ActivateTabRelative:
                activate_tab_relative(assignment.arg);
                break;
            case Action::MoveTab:
                if (assignment.arg < 0)
                    throw MuxError("cannot move a tab to index " + std::to_string(assignment.arg));
                move_tab(static_cast<std::size_t>(assignment.arg));
                break;
            case Action::MoveTabRelative:
                move_tab_relative(assignment.arg);
                break;
            case Action::IncreaseFontSize:
                increase_font_size();
                break;
            case Action::DecreaseFontSize:
                decrease_font_size();
                break;
            case Action::ResetFontSize:
                reset_font_size();
                break;
            case Action::ResetFontAndWindowSize:
                reset_font_and_window_size();
                break;
            case Action::ScrollByPage:
                scroll_by_page(assignment.arg);
                break;
            case Action::ScrollByLine:
                scroll_by_line(assignment.arg);
                break;
            case Action::ScrollToPrompt:
                scroll_to_prompt(assignment.arg);
                break;
            case Action::ScrollToBottom:
                scroll_to_bottom();
                break;
            case Action::ShowTabNavigator:
                show_tab_navigator();
                break;
            case Action::ShowLauncher:
                show_launcher();
                break;
            case Action::CloseCurrentPane:
                close_current_pane(assignment.confirm);
                break;
            case Action::CloseCurrentTab:
                close_current_tab(assignment.confirm);
                break;
            case Action::Search:
                show_search();
                break;
            case Action::ActivateCopyMode:
                activate_copy_mode();
                break;
            case Action::TogglePaneZoomState:
                if (auto tab = mux_.get_active_tab_for_window(mux_window_id_))
                {
                    tab->toggle_zoom();
                    update_title();
                    invalidate();
                }
                break;
            case Action::SendString:
                if (auto pane = active_pane_or_overlay().pane)
                    pane->send_paste(assignment.text);
                break;
            case Action::ReloadConfiguration:
                // A new generation is picked up by the next maintenance tick.
                config_store_.reload();
                break;
            case Action::Hide:
                if (window_)
                    window_->hide();
                break;
            case Action::Show:
                if (window_)
                    window_->show();
                break;
            case Action::ToggleFullScreen:
                if (window_)
                    window_->toggle_fullscreen();
                break;
            }
        }
        catch (const RenderSurfaceLost &)
        {
            throw;
        }
        catch (const WindowError &e)
        {
            TERMWIN_LOG_ERROR("key assignment failed: " << e.what());
        }
    }

    // =========================================================================
    // Tabs
    // =========================================================================

    void TermWindow::activate_tab(long tab_idx)
    {
        MuxWindow *window = mux_.get_window(mux_window_id_);
        if (!window)
            return;

        long max = static_cast<long>(window->len());
        if (tab_idx < 0)
            tab_idx = std::max(0L, max + tab_idx);
        if (tab_idx >= max)
            return;

        if (auto pane = active_pane_or_overlay().pane)
            pane->focus_changed(false);
        window->set_active(static_cast<std::size_t>(tab_idx));
        if (auto pane = active_pane_or_overlay().pane)
            pane->focus_changed(true);

        update_title();
        update_scrollbar();
    }

    void TermWindow::activate_tab_relative(long delta)
    {
        MuxWindow *window = mux_.get_window(mux_window_id_);
        if (!window)
            return;
        long max = static_cast<long>(window->len());
        if (max == 0)
            throw MuxError("no more tabs");

        long tab = static_cast<long>(window->get_active_idx()) + delta;
        activate_tab(((tab % max) + max) % max);
    }

    void TermWindow::move_tab(std::size_t tab_idx)
    {
        MuxWindow *window = mux_.get_window(mux_window_id_);
        if (!window)
            return;
        std::size_t max = window->len();
        if (tab_idx >= max)
            throw MuxError("cannot move a tab to index " + std::to_string(tab_idx) + " of " +
                           std::to_string(max));

        auto tab = window->remove_by_idx(window->get_active_idx());
        if (!tab)
            throw MuxError("window " + std::to_string(mux_window_id_) + " has no active tab");
        window->insert(tab_idx, std::move(tab));
        window->set_active(tab_idx);

        update_title();
        update_scrollbar();
    }

    void TermWindow::move_tab_relative(long delta)
    {
        MuxWindow *window = mux_.get_window(mux_window_id_);
        if (!window)
            return;
        long max = static_cast<long>(window->len());
        if (max == 0)
            throw MuxError("no more tabs");

        long tab = static_cast<long>(window->get_active_idx()) + delta;
        tab = std::min(std::max(tab, 0L), max - 1);
        move_tab(static_cast<std::size_t>(tab));
    }

    void TermWindow::close_tab_idx(std::size_t idx)
    {
        MuxWindow *window = mux_.get_window(mux_window_id_);
        if (!window)
            return;
        if (auto tab = window->remove_by_idx(idx))
            mux_.remove_tab(tab->tab_id());

        window = mux_.get_window(mux_window_id_);
        if (window && !window->is_empty())
            activate_tab_relative(0);
    }

    void TermWindow::spawn_tab(const std::string &command)
    {
        auto tab = mux_.spawn_tab(mux_window_id_, command, terminal_size_);
        MuxWindow *window = mux_.get_window(mux_window_id_);
        if (!window)
            return;
        auto tabs = window->tabs();
        for (std::size_t i = 0; i < tabs.size(); ++i)
        {
            if (tabs[i]->tab_id() == tab->tab_id())
            {
                activate_tab(static_cast<long>(i));
                return;
            }
        }
    }

    // =========================================================================
    // Scrolling
    // =========================================================================

    void TermWindow::scroll_to_bottom()
    {
        PaneSlot slot = active_pane_or_overlay();
        if (slot.pane)
            viewport_.scroll_to_bottom(slot.state_id);
    }

    void TermWindow::scroll_by_line(long amount)
    {
        PaneSlot slot = active_pane_or_overlay();
        if (slot.pane)
            viewport_.scroll_by_line(slot.state_id, *slot.pane, amount);
    }

    void TermWindow::scroll_by_page(long amount)
    {
        PaneSlot slot = active_pane_or_overlay();
        if (slot.pane)
            viewport_.scroll_by_page(slot.state_id, *slot.pane, amount);
    }

    void TermWindow::scroll_to_prompt(long amount)
    {
        PaneSlot slot = active_pane_or_overlay();
        if (slot.pane)
            viewport_.scroll_to_prompt(slot.state_id, *slot.pane, amount);
    }

    // =========================================================================
    // Clipboard
    // =========================================================================

    void TermWindow::copy_to_clipboard(ClipboardKind kind, const std::string &text)
    {
        clipboard_.set_contents(kind, text);
    }

    void TermWindow::paste_from_clipboard(ClipboardKind kind)
    {
        PaneSlot slot = active_pane_or_overlay();
        if (!slot.pane)
            return;

        std::weak_ptr<Pane> target = slot.pane;
        std::shared_ptr<ClipboardContents> contents = clipboard_contents_;
        WindowHandle window = handle();
        clipboard_.get_contents(kind, [contents, window, target](std::string text)
                                {
                                    contents->store(std::move(text));
                                    window.apply([target](TermWindow &tw)
                                                 { tw.complete_paste(target); }); });
    }

    void TermWindow::complete_paste(const std::weak_ptr<Pane> &target)
    {
        std::optional<std::string> text = clipboard_contents_->take();
        if (!text)
            return;
        std::shared_ptr<Pane> pane = target.lock();
        if (!pane)
            return;

        PaneSlot slot = active_pane_or_overlay();
        if (slot.pane == pane && config_->scroll_to_bottom_on_input &&
            !is_viewport_aware(pane->kind()))
            viewport_.scroll_to_bottom(slot.state_id);
        pane->send_paste(*text);
    }

    // =========================================================================
    // Selection
    // =========================================================================

    std::string TermWindow::selection_text(PaneId state_id, const Pane &pane)
    {
        return ::termwin::selection_text(selection(state_id), pane);
    }

    void TermWindow::select_text_at_mouse_cursor(SelectionMode mode)
    {
        PaneSlot slot = active_pane_or_overlay();
        if (!slot.pane)
            return;
        SelectionCoordinate coord{mouse_col_, mouse_row_};
        selection(slot.state_id).begin(mode, coord, *slot.pane, config_->selection_word_boundary);
        invalidate();
    }

    void TermWindow::extend_selection_at_mouse_cursor(std::optional<SelectionMode> mode)
    {
        PaneSlot slot = active_pane_or_overlay();
        if (!slot.pane)
            return;
        SelectionCoordinate coord{mouse_col_, mouse_row_};
        selection(slot.state_id)
            .extend(mode.value_or(SelectionMode::Cell), coord, *slot.pane,
                    config_->selection_word_boundary);
        viewport_.keep_row_visible(slot.state_id, coord.y, slot.pane->get_dimensions(),
                                   SELECTION_SCROLL_GAP);
        invalidate();
    }

    // =========================================================================
    // Mouse
    // =========================================================================

    bool TermWindow::mouse_in_tab_bar(const MouseEvent &event) const
    {
        if (!show_tab_bar_)
            return false;
        int top = static_cast<int>(config_->window_padding.top);
        return event.y >= top && event.y < top + static_cast<int>(metrics_.cell_size.height);
    }

    bool TermWindow::mouse_in_scroll_bar(const MouseEvent &event) const
    {
        if (!show_scroll_bar_)
            return false;
        std::size_t right = effective_right_padding(*config_, metrics_);
        if (right == 0 || event.x < 0)
            return false;
        return static_cast<std::size_t>(event.x) + right >= dimensions_.pixel_width &&
               !mouse_in_tab_bar(event);
    }

    std::optional<RenderedPane> TermWindow::update_mouse_cell(const MouseEvent &event)
    {
        const CellSize &cell = metrics_.cell_size;
        if (cell.width == 0 || cell.height == 0)
            return std::nullopt;

        long x = (event.x - static_cast<long>(config_->window_padding.left)) /
                 static_cast<long>(cell.width);
        long y = (event.y - static_cast<long>(config_->window_padding.top)) /
                     static_cast<long>(cell.height) -
                 (show_tab_bar_ ? 1 : 0);
        x = std::max(x, 0L);
        y = std::max(y, 0L);

        std::vector<RenderedPane> panes = panes_to_render();
        std::optional<RenderedPane> hit;
        for (const auto &rp : panes)
        {
            long left = static_cast<long>(rp.pos.left);
            long top = static_cast<long>(rp.pos.top);
            if (x >= left && x < left + static_cast<long>(rp.pos.width) && y >= top &&
                y < top + static_cast<long>(rp.pos.height))
            {
                hit = rp;
                break;
            }
        }
        if (!hit)
        {
            for (const auto &rp : panes)
                if (rp.pos.is_active)
                    hit = rp;
        }
        if (!hit)
            return std::nullopt;

        RenderableDimensions dims = hit->pos.pane->get_dimensions();
        StableRowIndex top_row = get_viewport(hit->state_id).value_or(dims.physical_top);
        mouse_col_ = static_cast<std::size_t>(std::max(0L, x - static_cast<long>(hit->pos.left)));
        mouse_row_ = top_row + std::max(0L, y - static_cast<long>(hit->pos.top));
        return hit;
    }

    void TermWindow::drag_scroll_bar(const MouseEvent &event)
    {
        PaneSlot slot = active_pane_or_overlay();
        if (!slot.pane)
            return;
        std::size_t cell_h = metrics_.cell_size.height;
        int track_top = static_cast<int>(config_->window_padding.top) +
                        static_cast<int>(show_tab_bar_ ? cell_h : 0);
        std::size_t track_height = static_cast<std::size_t>(terminal_size_.rows) * cell_h;
        std::size_t y = static_cast<std::size_t>(std::max(0, event.y - track_top));

        RenderableDimensions dims = slot.pane->get_dimensions();
        set_viewport(slot.state_id, viewport_for_track_position(dims, y, track_height), dims);
    }

    void TermWindow::mouse_press(const MouseEvent &event)
    {
        if (event.button == MouseButton::Middle)
        {
            paste_from_clipboard(ClipboardKind::PrimarySelection);
            return;
        }
        if (event.button != MouseButton::Left)
            return;

        if (mouse_in_tab_bar(event))
        {
            long col = (event.x - static_cast<long>(config_->window_padding.left)) /
                       static_cast<long>(std::max<std::size_t>(metrics_.cell_size.width, 1));
            if (auto idx = tab_bar_.tab_at_column(static_cast<std::size_t>(std::max(col, 0L))))
                activate_tab(static_cast<long>(*idx));
            return;
        }
        if (mouse_in_scroll_bar(event))
        {
            dragging_scroll_bar_ = true;
            drag_scroll_bar(event);
            return;
        }

        std::optional<RenderedPane> hit = update_mouse_cell(event);
        if (!hit)
            return;
        if (!hit->pos.is_active)
        {
            if (auto tab = mux_.get_active_tab_for_window(mux_window_id_))
            {
                tab->set_active_pane(hit->tab_pane_id);
                update_title();
                invalidate();
            }
        }

        Clock::time_point now = now_();
        unsigned count = 1;
        if (last_mouse_click_ && last_mouse_click_->col == mouse_col_ &&
            last_mouse_click_->row == mouse_row_ &&
            now - last_mouse_click_->at <= CLICK_STREAK_INTERVAL)
            count = last_mouse_click_->count % 3 + 1;
        last_mouse_click_ = ClickStreak{now, mouse_col_, mouse_row_, count};

        switch (count)
        {
        case 2:
            drag_mode_ = SelectionMode::Word;
            break;
        case 3:
            drag_mode_ = SelectionMode::Line;
            break;
        default:
            drag_mode_ = SelectionMode::Cell;
            break;
        }
        dragging_selection_ = true;
        select_text_at_mouse_cursor(drag_mode_);
    }

    void TermWindow::mouse_event(const MouseEvent &event)
    {
        switch (event.kind)
        {
        case MouseEventKind::Press:
            mouse_press(event);
            break;

        case MouseEventKind::Release:
            if (event.button != MouseButton::Left)
                break;
            dragging_scroll_bar_ = false;
            if (dragging_selection_)
            {
                dragging_selection_ = false;
                PaneSlot slot = active_pane_or_overlay();
                if (slot.pane)
                {
                    std::string text = selection_text(slot.state_id, *slot.pane);
                    if (!text.empty())
                        copy_to_clipboard(ClipboardKind::PrimarySelection, text);
                }
            }
            break;

        case MouseEventKind::Move:
            if (dragging_scroll_bar_ && event.left_held)
                drag_scroll_bar(event);
            else if (dragging_selection_ && event.left_held)
            {
                update_mouse_cell(event);
                extend_selection_at_mouse_cursor(drag_mode_);
            }
            else
                update_mouse_cell(event);
            break;

        case MouseEventKind::VertWheel:
            if (event.wheel != 0)
                scroll_by_line(-static_cast<long>(event.wheel) * WHEEL_LINES);
            break;
        }
        drain_pending();
    }

} // namespace termwin
