// =============================================================================
// term_window_overlays.cpp — installing, cancelling and starting overlays
// =============================================================================
// Task driven overlays (confirmation, tab navigator, launcher) run on the
// executor. Whatever way the task ends, it queues the cancellation of its own
// overlay; by then the user may have replaced it, so the cancel names the
// overlay it expects and is dropped when another one is installed.
//
// Search and copy mode are plain panes driven by keys on the GUI thread and
// cancel themselves.
// =============================================================================

#include "term_window.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"
#include "../overlay/confirm_close.hpp"
#include "../overlay/copy_overlay.hpp"
#include "../overlay/menu.hpp"
#include "../overlay/overlay_pane.hpp"
#include "../overlay/search_overlay.hpp"

namespace termwin
{

    namespace
    {
        /// Runs a closure when the scope is left, however it is left.
        class ScopeExit
        {
        public:
            explicit ScopeExit(std::function<void()> fn) : fn_(std::move(fn)) {}
            ~ScopeExit()
            {
                try
                {
                    fn_();
                }
                catch (const std::exception &e)
                {
                    TERMWIN_LOG_ERROR("overlay cleanup failed: " << e.what());
                }
            }

            ScopeExit(const ScopeExit &) = delete;
            ScopeExit &operator=(const ScopeExit &) = delete;

        private:
            std::function<void()> fn_;
        };
    } // namespace

    // =========================================================================
    // Registry
    // =========================================================================

    void TermWindow::assign_tab_overlay(TabId tab_id, std::shared_ptr<Pane> overlay)
    {
        overlays_.assign_tab_overlay(tab_id, std::move(overlay));
        update_title();
    }

    void TermWindow::assign_pane_overlay(PaneId pane_id, std::shared_ptr<Pane> overlay)
    {
        overlays_.assign_pane_overlay(pane_id, std::move(overlay));
        update_title();
    }

    void TermWindow::cancel_tab_overlay(TabId tab_id, std::optional<PaneId> expected)
    {
        if (!overlays_.cancel_tab_overlay(tab_id, expected))
        {
            TERMWIN_LOG_DEBUG("ignoring stale cancel of overlay " << *expected << " on tab "
                                                                  << tab_id);
            return;
        }
        update_title();
        invalidate();
    }

    void TermWindow::cancel_pane_overlay(PaneId pane_id)
    {
        overlays_.cancel_pane_overlay(pane_id);
        update_title();
        invalidate();
    }

    // =========================================================================
    // Task driven overlays
    // =========================================================================

    void TermWindow::start_tab_overlay(const std::shared_ptr<Tab> &tab, PaneKind kind,
                                       const std::string &title, TabOverlayTask task)
    {
        TabId tab_id = tab->tab_id();
        auto overlay = std::make_shared<OverlayPane>(mux_.allocate_pane_id(), tab->get_size(),
                                                     kind, title);
        PaneId overlay_id = overlay->pane_id();
        mux_.add_pane(overlay);
        assign_tab_overlay(tab_id, overlay);
        invalidate();

        WindowHandle window = handle();
        executor_.spawn(title, [overlay, tab_id, overlay_id, window, task]()
                        {
                            ScopeExit cancel([&]
                                             { window.apply([tab_id, overlay_id](TermWindow &w)
                                                            { w.cancel_tab_overlay(tab_id, overlay_id); }); });
                            OverlayTerm term(overlay);
                            task(tab_id, term); });
    }

    void TermWindow::start_pane_overlay(const std::shared_ptr<Pane> &pane, PaneKind kind,
                                        const std::string &title, PaneOverlayTask task)
    {
        PaneId pane_id = pane->pane_id();
        RenderableDimensions dims = pane->get_dimensions();

        PtySize size;
        size.rows = static_cast<uint16_t>(dims.viewport_rows);
        size.cols = static_cast<uint16_t>(dims.cols);
        size.pixel_width = static_cast<uint16_t>(dims.cols * metrics_.cell_size.width);
        size.pixel_height = static_cast<uint16_t>(dims.viewport_rows * metrics_.cell_size.height);

        auto overlay = std::make_shared<OverlayPane>(mux_.allocate_pane_id(), size, kind, title);
        PaneId overlay_id = overlay->pane_id();
        mux_.add_pane(overlay);
        assign_pane_overlay(pane_id, overlay);
        invalidate();

        WindowHandle window = handle();
        executor_.spawn(title, [overlay, pane_id, overlay_id, window, task]()
                        {
                            ScopeExit cancel([&]
                                             { window.apply([pane_id, overlay_id](TermWindow &w)
                                                            {
                                                                auto current = w.pane_state(pane_id).overlay;
                                                                if (current && current->pane_id() == overlay_id)
                                                                    w.cancel_pane_overlay(pane_id);
                                                            }); });
                            OverlayTerm term(overlay);
                            task(pane_id, term); });
    }

    // =========================================================================
    // Closing
    // =========================================================================

    bool TermWindow::can_close()
    {
        if (config_->window_close_confirmation == WindowCloseConfirmation::NeverPrompt)
        {
            mux_.kill_window(mux_window_id_);
            return true;
        }

        MuxWindow *window = mux_.get_window(mux_window_id_);
        auto tab = mux_.get_active_tab_for_window(mux_window_id_);
        if (!window || !tab)
            return true;

        bool all_closable = true;
        for (const auto &t : window->tabs())
            all_closable = all_closable && t->can_close_without_prompting();
        if (all_closable)
        {
            mux_.kill_window(mux_window_id_);
            return true;
        }

        MuxWindowId mux_window_id = mux_window_id_;
        WindowHandle handle = this->handle();
        start_tab_overlay(tab, PaneKind::Confirmation, "Close window",
                          [mux_window_id, handle](TabId, OverlayTerm &term)
                          { confirm_close_window(mux_window_id, term, handle); });
        return false;
    }

    void TermWindow::close_current_pane(bool confirm)
    {
        auto tab = mux_.get_active_tab_for_window(mux_window_id_);
        if (!tab)
            return;
        auto pane = tab->get_active_pane();
        if (!pane)
            return;

        if (confirm && !pane->can_close_without_prompting())
        {
            WindowHandle handle = this->handle();
            start_pane_overlay(pane, PaneKind::Confirmation, "Close pane",
                               [handle](PaneId pane_id, OverlayTerm &term)
                               { confirm_close_pane(pane_id, term, handle); });
        }
        else
            tab->kill_pane(pane->pane_id());
    }

    void TermWindow::close_current_tab(bool confirm)
    {
        auto tab = mux_.get_active_tab_for_window(mux_window_id_);
        if (!tab)
            return;

        if (confirm && !tab->can_close_without_prompting())
        {
            WindowHandle handle = this->handle();
            start_tab_overlay(tab, PaneKind::Confirmation, "Close tab",
                              [handle](TabId tab_id, OverlayTerm &term)
                              { confirm_close_tab(tab_id, term, handle); });
        }
        else
            mux_.remove_tab(tab->tab_id());
    }

    // =========================================================================
    // Menus
    // =========================================================================

    void TermWindow::show_tab_navigator()
    {
        MuxWindow *window = mux_.get_window(mux_window_id_);
        auto tab = mux_.get_active_tab_for_window(mux_window_id_);
        if (!window || !tab)
            return;

        std::vector<std::string> titles;
        for (const auto &t : window->tabs())
        {
            auto pane = t->get_active_pane();
            titles.push_back(pane ? pane->get_title() : std::string());
        }
        std::size_t active_idx = window->get_active_idx();

        WindowHandle handle = this->handle();
        start_tab_overlay(tab, PaneKind::TabNavigator, "Tab navigator",
                          [titles, active_idx, handle](TabId, OverlayTerm &term)
                          { tab_navigator(term, titles, active_idx, handle); });
    }

    void TermWindow::show_launcher()
    {
        MuxWindow *window = mux_.get_window(mux_window_id_);
        auto tab = mux_.get_active_tab_for_window(mux_window_id_);
        if (!window || !tab)
            return;

        std::vector<LauncherEntry> entries;
        auto tabs = window->tabs();
        for (std::size_t i = 0; i < tabs.size(); ++i)
        {
            auto pane = tabs[i]->get_active_pane();
            long idx = static_cast<long>(i);
            entries.push_back({std::to_string(i + 1) + ": " + (pane ? pane->get_title() : ""),
                               [idx](TermWindow &w)
                               { w.activate_tab(idx); }});
        }
        for (const auto &command : config_->launch_menu)
        {
            entries.push_back({"New tab: " + command,
                               [command](TermWindow &w)
                               { w.spawn_tab(command); }});
        }

        WindowHandle handle = this->handle();
        start_tab_overlay(tab, PaneKind::Launcher, "Launcher",
                          [entries, handle](TabId, OverlayTerm &term)
                          { launcher(term, entries, handle); });
    }

    // =========================================================================
    // Search and copy mode
    // =========================================================================

    void TermWindow::show_search()
    {
        auto tab = mux_.get_active_tab_for_window(mux_window_id_);
        if (!tab)
            return;
        auto pane = tab->get_active_pane();
        if (!pane)
            return;

        PaneId pane_id = pane->pane_id();
        auto overlay = std::make_shared<SearchOverlay>(mux_.allocate_pane_id(), pane, handle(),
                                                       get_viewport(pane_id));
        mux_.add_pane(overlay);
        assign_pane_overlay(pane_id, overlay);
        invalidate();
    }

    void TermWindow::activate_copy_mode()
    {
        auto tab = mux_.get_active_tab_for_window(mux_window_id_);
        if (!tab)
            return;
        auto pane = tab->get_active_pane();
        if (!pane)
            return;

        PaneId pane_id = pane->pane_id();
        auto overlay = std::make_shared<CopyOverlay>(mux_.allocate_pane_id(), pane, handle(),
                                                     get_viewport(pane_id));
        mux_.add_pane(overlay);
        assign_pane_overlay(pane_id, overlay);
        invalidate();
    }

} // namespace termwin
