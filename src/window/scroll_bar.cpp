// =============================================================================
// scroll_bar.cpp
// =============================================================================

#include "scroll_bar.hpp"

#include <algorithm>

namespace termwin
{

    ScrollThumb scroll_thumb(const RenderableDimensions &dims,
                             std::optional<StableRowIndex> viewport, std::size_t track_height)
    {
        ScrollThumb thumb;
        std::size_t total = std::max<std::size_t>(
            static_cast<std::size_t>(std::max<StableRowIndex>(dims.scrollback_rows, 0)),
            dims.viewport_rows);
        if (total == 0 || track_height == 0)
            return thumb;

        thumb.height = std::max(std::min(MIN_THUMB_HEIGHT, track_height),
                                track_height * dims.viewport_rows / total);
        thumb.height = std::min(thumb.height, track_height);

        StableRowIndex max_offset = dims.physical_top - dims.scrollback_top;
        if (max_offset <= 0)
        {
            thumb.top = track_height - thumb.height;
            return thumb;
        }
        StableRowIndex top = std::clamp(viewport.value_or(dims.physical_top),
                                        dims.scrollback_top, dims.physical_top);
        StableRowIndex offset = top - dims.scrollback_top;
        thumb.top = static_cast<std::size_t>((track_height - thumb.height) *
                                             static_cast<std::size_t>(offset) /
                                             static_cast<std::size_t>(max_offset));
        return thumb;
    }

    StableRowIndex viewport_for_track_position(const RenderableDimensions &dims, std::size_t y,
                                               std::size_t track_height)
    {
        StableRowIndex max_offset = dims.physical_top - dims.scrollback_top;
        if (max_offset <= 0 || track_height == 0)
            return dims.physical_top;
        y = std::min(y, track_height);
        StableRowIndex offset = static_cast<StableRowIndex>(
            static_cast<std::size_t>(max_offset) * y / track_height);
        return dims.scrollback_top + offset;
    }

} // namespace termwin
