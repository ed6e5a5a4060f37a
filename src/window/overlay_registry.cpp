// =============================================================================
// overlay_registry.cpp
// =============================================================================

#include "overlay_registry.hpp"
#include "../core/log.hpp"

namespace termwin
{

    std::shared_ptr<Pane> OverlayRegistry::tab_overlay(TabId tab_id) const
    {
        auto it = tabs_.find(tab_id);
        return it == tabs_.end() ? nullptr : it->second.overlay;
    }

    std::shared_ptr<Pane> OverlayRegistry::pane_overlay(PaneId pane_id) const
    {
        auto it = panes_.find(pane_id);
        return it == panes_.end() ? nullptr : it->second.overlay;
    }

    void OverlayRegistry::release(const std::shared_ptr<Pane> &overlay)
    {
        if (!overlay)
            return;
        TERMWIN_LOG_DEBUG("releasing overlay pane " << overlay->pane_id());
        mux_.remove_pane(overlay->pane_id());
    }

    void OverlayRegistry::assign_tab_overlay(TabId tab_id, std::shared_ptr<Pane> overlay)
    {
        std::shared_ptr<Pane> prior = std::move(tab_state(tab_id).overlay);
        tab_state(tab_id).overlay = std::move(overlay);
        release(prior);
    }

    void OverlayRegistry::assign_pane_overlay(PaneId pane_id, std::shared_ptr<Pane> overlay)
    {
        std::shared_ptr<Pane> prior = std::move(pane_state(pane_id).overlay);
        pane_state(pane_id).overlay = std::move(overlay);
        release(prior);
    }

    bool OverlayRegistry::cancel_tab_overlay(TabId tab_id, std::optional<PaneId> expected)
    {
        TabState &state = tab_state(tab_id);
        if (expected)
        {
            if (!state.overlay || state.overlay->pane_id() != *expected)
                return false;
        }
        std::shared_ptr<Pane> prior = std::move(state.overlay);
        state.overlay.reset();
        release(prior);
        return true;
    }

    void OverlayRegistry::cancel_pane_overlay(PaneId pane_id)
    {
        PaneState &state = pane_state(pane_id);
        std::shared_ptr<Pane> prior = std::move(state.overlay);
        state.overlay.reset();
        release(prior);
    }

    std::vector<RenderedPane> OverlayRegistry::panes_to_render(const Tab &tab,
                                                               const CellSize &cell) const
    {
        std::vector<RenderedPane> out;

        if (auto overlay = tab_overlay(tab.tab_id()))
        {
            PtySize size = tab.get_size();
            RenderedPane rp;
            rp.pos.index = 0;
            rp.pos.is_active = true;
            rp.pos.width = size.cols;
            rp.pos.height = size.rows;
            rp.pos.pixel_width = size.cols * cell.width;
            rp.pos.pixel_height = size.rows * cell.height;
            rp.pos.pane = overlay;
            rp.state_id = overlay->pane_id();
            rp.tab_pane_id = overlay->pane_id();
            out.push_back(rp);
            return out;
        }

        for (auto &pos : tab.iter_panes())
        {
            RenderedPane rp;
            rp.tab_pane_id = pos.pane->pane_id();
            rp.state_id = rp.tab_pane_id;
            rp.pos = pos;
            if (auto overlay = pane_overlay(rp.tab_pane_id))
            {
                rp.pos.pane = overlay;
                rp.state_id = overlay_state_id(rp.tab_pane_id, *overlay);
            }
            out.push_back(rp);
        }
        return out;
    }

    PaneSlot OverlayRegistry::active_pane_or_overlay(const Tab &tab) const
    {
        PaneSlot slot;
        if (auto overlay = tab_overlay(tab.tab_id()))
        {
            slot.pane = overlay;
            slot.state_id = overlay->pane_id();
            return slot;
        }
        auto pane = tab.get_active_pane();
        if (!pane)
            return slot;
        slot.state_id = pane->pane_id();
        slot.pane = pane;
        if (auto overlay = pane_overlay(pane->pane_id()))
        {
            slot.pane = overlay;
            slot.state_id = overlay_state_id(pane->pane_id(), *overlay);
        }
        return slot;
    }

    void OverlayRegistry::release_all()
    {
        for (auto &entry : tabs_)
        {
            std::shared_ptr<Pane> prior = std::move(entry.second.overlay);
            entry.second.overlay.reset();
            release(prior);
        }
        for (auto &entry : panes_)
        {
            std::shared_ptr<Pane> prior = std::move(entry.second.overlay);
            entry.second.overlay.reset();
            release(prior);
        }
    }

} // namespace termwin
