#pragma once

// =============================================================================
// overlay_registry.hpp — per-tab and per-pane window state
// =============================================================================
// TabState and PaneState entries are created on first access and never
// removed; only the overlay they hold comes and goes. The registry is the
// sole owner of an installed overlay: replacing or cancelling one hands the
// old pane to Mux::remove_pane exactly once.
//
// Precedence when reading: a tab overlay hides the whole tab layout;
// otherwise each pane slot shows its pane overlay, if any, instead of the
// pane.
// =============================================================================

#include "../mux/mux.hpp"
#include "../selection/selection.hpp"
#include "geometry.hpp"

#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace termwin
{

    struct TabState
    {
        std::shared_ptr<Pane> overlay;
    };

    struct PaneState
    {
        /// Top row of the view; empty means following the live screen.
        std::optional<StableRowIndex> viewport;
        Selection selection;
        std::shared_ptr<Pane> overlay;
    };

    /// A pane as drawn, and the id its viewport and selection live under.
    /// Search and copy mode read the covered pane's rows and share its state;
    /// every other overlay keeps state under its own id.
    struct RenderedPane
    {
        PositionedPane pos;
        PaneId state_id = 0;
        /// The tab's pane in this slot, under any pane overlay.
        PaneId tab_pane_id = 0;
    };

    struct PaneSlot
    {
        std::shared_ptr<Pane> pane;
        PaneId state_id = 0;
    };

    /// Id whose PaneState applies while `overlay` covers `pane_id`.
    inline PaneId overlay_state_id(PaneId pane_id, const Pane &overlay)
    {
        return is_viewport_aware(overlay.kind()) ? pane_id : overlay.pane_id();
    }

    class OverlayRegistry
    {
    public:
        explicit OverlayRegistry(Mux &mux) : mux_(mux) {}

        TabState &tab_state(TabId tab_id) { return tabs_[tab_id]; }
        PaneState &pane_state(PaneId pane_id) { return panes_[pane_id]; }

        std::shared_ptr<Pane> tab_overlay(TabId tab_id) const;
        std::shared_ptr<Pane> pane_overlay(PaneId pane_id) const;

        void assign_tab_overlay(TabId tab_id, std::shared_ptr<Pane> overlay);
        void assign_pane_overlay(PaneId pane_id, std::shared_ptr<Pane> overlay);

        /// Remove and release the tab overlay. When `expected` is given and
        /// is not the installed overlay's id nothing happens and false is
        /// returned.
        bool cancel_tab_overlay(TabId tab_id, std::optional<PaneId> expected);

        void cancel_pane_overlay(PaneId pane_id);

        /// Layout of `tab` as it should be drawn.
        std::vector<RenderedPane> panes_to_render(const Tab &tab, const CellSize &cell) const;

        /// The pane keys go to in `tab`; pane is null when the tab is empty.
        PaneSlot active_pane_or_overlay(const Tab &tab) const;

        /// Release every installed overlay.
        void release_all();

    private:
        Mux &mux_;
        std::map<TabId, TabState> tabs_;
        std::map<PaneId, PaneState> panes_;

        void release(const std::shared_ptr<Pane> &overlay);
    };

} // namespace termwin
