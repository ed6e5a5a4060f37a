// =============================================================================
// viewport.cpp
// =============================================================================

#include "viewport.hpp"

#include <algorithm>
#include <vector>

namespace termwin
{

    bool ViewportController::set_viewport(PaneId pane_id, std::optional<StableRowIndex> position,
                                          const RenderableDimensions &dims)
    {
        std::optional<StableRowIndex> pos;
        if (position)
        {
            StableRowIndex clamped = std::max(*position, dims.scrollback_top);
            if (clamped < dims.physical_top)
                pos = clamped;
        }

        PaneState &state = registry_.pane_state(pane_id);
        if (pos == state.viewport)
            return false;

        state.viewport = pos;
        if (state.overlay && is_viewport_aware(state.overlay->kind()))
            state.overlay->viewport_changed(pos);
        invalidate_();
        return true;
    }

    void ViewportController::scroll_to_bottom(PaneId pane_id)
    {
        set_viewport(pane_id, std::nullopt, RenderableDimensions{});
    }

    void ViewportController::scroll_by_line(PaneId pane_id, const Pane &pane, long amount)
    {
        RenderableDimensions dims = pane.get_dimensions();
        StableRowIndex position = get_viewport(pane_id).value_or(dims.physical_top) + amount;
        set_viewport(pane_id, position, dims);
    }

    void ViewportController::scroll_by_page(PaneId pane_id, const Pane &pane, long amount)
    {
        RenderableDimensions dims = pane.get_dimensions();
        StableRowIndex rows = static_cast<StableRowIndex>(dims.viewport_rows);
        StableRowIndex position = get_viewport(pane_id).value_or(dims.physical_top) + amount * rows;
        set_viewport(pane_id, position, dims);
    }

    void ViewportController::scroll_to_prompt(PaneId pane_id, const Pane &pane, long amount)
    {
        RenderableDimensions dims = pane.get_dimensions();
        StableRowIndex position = get_viewport(pane_id).value_or(dims.physical_top);

        std::vector<SemanticZone> prompts;
        for (const auto &zone : pane.get_semantic_zones())
            if (zone.semantic_type == SemanticType::Prompt)
                prompts.push_back(zone);

        // An exact hit and the insertion point are treated alike.
        auto it = std::lower_bound(prompts.begin(), prompts.end(), position,
                                   [](const SemanticZone &z, StableRowIndex row)
                                   { return z.start_y < row; });
        long idx = static_cast<long>(it - prompts.begin()) + amount;
        idx = std::max(idx, 0L);

        if (static_cast<std::size_t>(idx) < prompts.size())
            set_viewport(pane_id, prompts[static_cast<std::size_t>(idx)].start_y, dims);
        invalidate_();
    }

    void ViewportController::keep_row_visible(PaneId pane_id, StableRowIndex row,
                                              const RenderableDimensions &dims,
                                              StableRowIndex gap)
    {
        StableRowIndex top = get_viewport(pane_id).value_or(dims.physical_top);
        StableRowIndex vertical_gap = dims.physical_top <= gap ? 1 : gap;
        StableRowIndex top_gap = row - top;
        if (top_gap < vertical_gap)
        {
            set_viewport(pane_id, row - vertical_gap, dims);
            return;
        }
        StableRowIndex bottom_gap = static_cast<StableRowIndex>(dims.viewport_rows) - top_gap;
        if (bottom_gap < vertical_gap)
            set_viewport(pane_id, top + vertical_gap - bottom_gap, dims);
    }

} // namespace termwin
