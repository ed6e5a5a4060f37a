#pragma once

// =============================================================================
// viewport.hpp — which scrollback rows a pane shows
// =============================================================================
// A viewport is the stable row at the top of the view, or nothing while the
// pane follows its live screen. Values are clamped to what the pane still
// holds; anything at or past the live screen means "live". Setting the value
// a pane already has does nothing, so scrolling code can call set_viewport
// freely.
// =============================================================================

#include "overlay_registry.hpp"

#include <functional>
#include <optional>

namespace termwin
{

    class ViewportController
    {
    public:
        ViewportController(OverlayRegistry &registry, std::function<void()> invalidate)
            : registry_(registry), invalidate_(std::move(invalidate)) {}

        std::optional<StableRowIndex> get_viewport(PaneId pane_id)
        {
            return registry_.pane_state(pane_id).viewport;
        }

        /// Returns true when the stored viewport changed; only then is a
        /// viewport-aware overlay told and a repaint requested.
        bool set_viewport(PaneId pane_id, std::optional<StableRowIndex> position,
                          const RenderableDimensions &dims);

        void scroll_to_bottom(PaneId pane_id);
        void scroll_by_line(PaneId pane_id, const Pane &pane, long amount);
        void scroll_by_page(PaneId pane_id, const Pane &pane, long amount);

        /// Jump `amount` prompts from the current top row.
        void scroll_to_prompt(PaneId pane_id, const Pane &pane, long amount);

        /// Scroll so that `row` keeps `gap` rows between it and the edge of
        /// the view it is approaching. The gap drops to one row while the
        /// pane has little scrollback.
        void keep_row_visible(PaneId pane_id, StableRowIndex row,
                              const RenderableDimensions &dims, StableRowIndex gap);

    private:
        OverlayRegistry &registry_;
        std::function<void()> invalidate_;
    };

} // namespace termwin
