// =============================================================================
// local_mux.cpp — in-process windows, tabs and panes
// =============================================================================

#include "local_mux.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"

#include <algorithm>

namespace termwin
{

    // =========================================================================
    // LocalTab
    // =========================================================================

    LocalTab::LocalTab(LocalMux &mux, TabId tab_id, const PtySize &size)
        : mux_(mux), tab_id_(tab_id), size_(size) {}

    std::shared_ptr<Pane> LocalTab::get_active_pane() const
    {
        if (panes_.empty())
            return nullptr;
        return panes_[std::min(active_, panes_.size() - 1)];
    }

    void LocalTab::set_active_pane(PaneId pane_id)
    {
        for (std::size_t i = 0; i < panes_.size(); ++i)
        {
            if (panes_[i]->pane_id() == pane_id)
            {
                active_ = i;
                return;
            }
        }
    }

    // Column ranges of `n` side-by-side panes in `cols` columns, separated by
    // one column each. The last pane takes the remainder.
    static std::vector<std::pair<std::size_t, std::size_t>> split_columns(std::size_t cols,
                                                                          std::size_t n)
    {
        std::vector<std::pair<std::size_t, std::size_t>> out;
        if (n == 0)
            return out;
        std::size_t usable = cols > n - 1 ? cols - (n - 1) : n;
        std::size_t each = std::max<std::size_t>(usable / n, 1);
        std::size_t left = 0;
        for (std::size_t i = 0; i < n; ++i)
        {
            std::size_t width = (i + 1 == n) ? (usable > each * (n - 1) ? usable - each * (n - 1) : 1)
                                             : each;
            out.emplace_back(left, width);
            left += width + 1;
        }
        return out;
    }

    std::vector<PositionedPane> LocalTab::iter_panes() const
    {
        std::vector<PositionedPane> out;
        if (panes_.empty())
            return out;

        std::size_t cell_w = size_.cols ? size_.pixel_width / size_.cols : 0;

        if (zoomed_)
        {
            PositionedPane p;
            p.index = active_;
            p.is_active = true;
            p.is_zoomed = true;
            p.width = size_.cols;
            p.height = size_.rows;
            p.pixel_width = size_.pixel_width;
            p.pixel_height = size_.pixel_height;
            p.pane = panes_[active_];
            out.push_back(p);
            return out;
        }

        auto columns = split_columns(size_.cols, panes_.size());
        for (std::size_t i = 0; i < panes_.size(); ++i)
        {
            PositionedPane p;
            p.index = i;
            p.is_active = i == active_;
            p.left = columns[i].first;
            p.width = columns[i].second;
            p.height = size_.rows;
            p.pixel_width = p.width * cell_w;
            p.pixel_height = size_.pixel_height;
            p.pane = panes_[i];
            out.push_back(p);
        }
        return out;
    }

    void LocalTab::resize(const PtySize &size)
    {
        size_ = size;
        relayout();
    }

    void LocalTab::relayout()
    {
        for (const auto &pos : iter_panes())
        {
            PtySize ps;
            ps.rows = static_cast<uint16_t>(pos.height);
            ps.cols = static_cast<uint16_t>(pos.width);
            ps.pixel_width = static_cast<uint16_t>(pos.pixel_width);
            ps.pixel_height = static_cast<uint16_t>(pos.pixel_height);
            pos.pane->resize(ps);
        }
    }

    void LocalTab::kill_pane(PaneId pane_id)
    {
        mux_.remove_pane(pane_id);
    }

    bool LocalTab::can_close_without_prompting() const
    {
        for (const auto &pane : panes_)
            if (!pane->can_close_without_prompting())
                return false;
        return true;
    }

    void LocalTab::toggle_zoom()
    {
        if (panes_.size() < 2 && !zoomed_)
            return;
        zoomed_ = !zoomed_;
        relayout();
    }

    void LocalTab::split(std::shared_ptr<Pane> pane)
    {
        zoomed_ = false;
        panes_.push_back(std::move(pane));
        active_ = panes_.size() - 1;
        relayout();
    }

    bool LocalTab::detach_pane(PaneId pane_id)
    {
        auto it = std::find_if(panes_.begin(), panes_.end(),
                               [&](const std::shared_ptr<Pane> &p)
                               { return p->pane_id() == pane_id; });
        if (it == panes_.end())
            return false;
        std::size_t idx = static_cast<std::size_t>(it - panes_.begin());
        panes_.erase(it);
        if (active_ > idx || active_ >= panes_.size())
            active_ = active_ > 0 ? active_ - 1 : 0;
        if (panes_.size() < 2)
            zoomed_ = false;
        relayout();
        return true;
    }

    // =========================================================================
    // LocalWindow
    // =========================================================================

    void LocalWindow::set_active(std::size_t idx)
    {
        if (idx >= tabs_.size())
            throw MuxError("tab index " + std::to_string(idx) + " out of range");
        if (active_ != idx)
            invalidated_ = true;
        active_ = idx;
    }

    std::shared_ptr<Tab> LocalWindow::get_by_idx(std::size_t idx) const
    {
        if (idx >= tabs_.size())
            return nullptr;
        return tabs_[idx];
    }

    std::shared_ptr<Tab> LocalWindow::remove_by_idx(std::size_t idx)
    {
        if (idx >= tabs_.size())
            return nullptr;
        auto tab = tabs_[idx];
        tabs_.erase(tabs_.begin() + static_cast<std::ptrdiff_t>(idx));
        if (active_ > idx || active_ >= tabs_.size())
            active_ = active_ > 0 ? active_ - 1 : 0;
        invalidated_ = true;
        return tab;
    }

    void LocalWindow::insert(std::size_t idx, std::shared_ptr<Tab> tab)
    {
        idx = std::min(idx, tabs_.size());
        tabs_.insert(tabs_.begin() + static_cast<std::ptrdiff_t>(idx), std::move(tab));
        invalidated_ = true;
    }

    void LocalWindow::push(std::shared_ptr<Tab> tab)
    {
        tabs_.push_back(std::move(tab));
        active_ = tabs_.size() - 1;
        invalidated_ = true;
    }

    std::size_t LocalWindow::idx_by_id(TabId tab_id) const
    {
        for (std::size_t i = 0; i < tabs_.size(); ++i)
            if (tabs_[i]->tab_id() == tab_id)
                return i;
        return tabs_.size();
    }

    bool LocalWindow::check_and_reset_invalidated()
    {
        bool was = invalidated_;
        invalidated_ = false;
        return was;
    }

    // =========================================================================
    // LocalMux
    // =========================================================================

    MuxWindowId LocalMux::new_window()
    {
        MuxWindowId id = next_window_id_++;
        windows_[id] = std::make_unique<LocalWindow>();
        return id;
    }

    MuxWindow *LocalMux::get_window(MuxWindowId window_id)
    {
        auto it = windows_.find(window_id);
        return it == windows_.end() ? nullptr : it->second.get();
    }

    std::shared_ptr<Tab> LocalMux::get_active_tab_for_window(MuxWindowId window_id)
    {
        MuxWindow *window = get_window(window_id);
        if (!window || window->is_empty())
            return nullptr;
        return window->get_by_idx(window->get_active_idx());
    }

    std::shared_ptr<Pane> LocalMux::get_pane(PaneId pane_id) const
    {
        auto it = panes_.find(pane_id);
        return it == panes_.end() ? nullptr : it->second;
    }

    void LocalMux::add_pane(std::shared_ptr<Pane> pane)
    {
        PaneId id = pane->pane_id();
        panes_[id] = std::move(pane);
    }

    void LocalMux::forget_pane(PaneId pane_id)
    {
        auto it = panes_.find(pane_id);
        if (it == panes_.end())
            return;
        auto pane = it->second;
        panes_.erase(it);
        ++released_[pane_id];
        pane->kill();
        TERMWIN_LOG_DEBUG("released pane " << pane_id);
    }

    void LocalMux::remove_pane(PaneId pane_id)
    {
        if (!panes_.count(pane_id))
            return;

        // Take the pane out of whichever tab holds it; an emptied tab goes.
        for (auto &entry : windows_)
        {
            LocalWindow &window = *entry.second;
            for (const auto &tab : window.tabs())
            {
                auto local = std::static_pointer_cast<LocalTab>(tab);
                if (local->detach_pane(pane_id))
                {
                    window.invalidate();
                    if (local->count_panes() == 0)
                    {
                        window.remove_by_idx(window.idx_by_id(local->tab_id()));
                        tabs_.erase(local->tab_id());
                    }
                    break;
                }
            }
        }
        forget_pane(pane_id);
    }

    void LocalMux::forget_tab(TabId tab_id)
    {
        auto it = tabs_.find(tab_id);
        if (it == tabs_.end())
            return;
        auto tab = it->second;
        tabs_.erase(it);
        for (const auto &pane : tab->panes())
            forget_pane(pane->pane_id());
    }

    // The tab may already have been taken out of its window (close_tab_idx
    // does that first); it is still known here until removed.
    void LocalMux::remove_tab(TabId tab_id)
    {
        for (auto &entry : windows_)
        {
            LocalWindow &window = *entry.second;
            std::size_t idx = window.idx_by_id(tab_id);
            if (idx != window.len())
            {
                window.remove_by_idx(idx);
                break;
            }
        }
        forget_tab(tab_id);
    }

    void LocalMux::kill_window(MuxWindowId window_id)
    {
        auto it = windows_.find(window_id);
        if (it == windows_.end())
            return;
        std::vector<TabId> ids;
        for (const auto &tab : it->second->tabs())
            ids.push_back(tab->tab_id());
        for (TabId id : ids)
            remove_tab(id);
        windows_.erase(window_id);
    }

    std::shared_ptr<Tab> LocalMux::spawn_tab(MuxWindowId window_id, const std::string &command,
                                             const PtySize &size)
    {
        auto it = windows_.find(window_id);
        if (it == windows_.end())
            throw MuxError("no window " + std::to_string(window_id));

        auto tab = std::make_shared<LocalTab>(*this, next_tab_id_++, size);
        tabs_[tab->tab_id()] = tab;
        auto pane = std::make_shared<BufferPane>(allocate_pane_id(), size, command);
        add_pane(pane);
        tab->split(pane);
        it->second->push(tab);
        TERMWIN_LOG_DEBUG("spawned tab " << tab->tab_id() << " running '" << command << "'");
        return tab;
    }

    std::shared_ptr<BufferPane> LocalMux::split_active_tab(MuxWindowId window_id,
                                                           const std::string &command)
    {
        auto tab = std::static_pointer_cast<LocalTab>(get_active_tab_for_window(window_id));
        if (!tab)
            throw MuxError("window " + std::to_string(window_id) + " has no active tab");
        auto pane = std::make_shared<BufferPane>(allocate_pane_id(), tab->get_size(), command);
        add_pane(pane);
        tab->split(pane);
        if (auto *window = get_window(window_id))
            window->invalidate();
        return pane;
    }

    std::size_t LocalMux::release_count(PaneId pane_id) const
    {
        auto it = released_.find(pane_id);
        return it == released_.end() ? 0 : it->second;
    }

} // namespace termwin
