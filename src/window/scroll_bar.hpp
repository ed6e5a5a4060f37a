#pragma once

// =============================================================================
// scroll_bar.hpp — thumb placement and click-to-row mapping
// =============================================================================
// The track spans the terminal area on the right edge. Thumb height is the
// visible fraction of all rows; its position follows the viewport, with the
// live view at the bottom of the track.
// =============================================================================

#include "../core/types.hpp"

#include <optional>

namespace termwin
{

    struct ScrollThumb
    {
        std::size_t top = 0;
        std::size_t height = 0;

        bool operator==(const ScrollThumb &o) const { return top == o.top && height == o.height; }
    };

    constexpr std::size_t MIN_THUMB_HEIGHT = 20;

    ScrollThumb scroll_thumb(const RenderableDimensions &dims,
                             std::optional<StableRowIndex> viewport, std::size_t track_height);

    /// Viewport top for a press at `y` pixels down the track.
    StableRowIndex viewport_for_track_position(const RenderableDimensions &dims, std::size_t y,
                                               std::size_t track_height);

} // namespace termwin
