#pragma once

// =============================================================================
// copy_overlay.hpp — keyboard driven selection over a pane
// =============================================================================
// Covers one pane with a movable cursor. Moving with a selection started
// extends it; 'y' copies the selection to the clipboard and closes.
//
//   h j k l, arrows   move            0 / $, Home / End   row start / end
//   PageUp, PageDown  move a page     g / G               top / bottom
//   v                 cell selection  V                   line selection
//   y                 copy and close  Escape, q           close
//
// The view follows the cursor, keeping a few rows of context ahead of it.
// =============================================================================

#include "../mux/pane.hpp"
#include "../selection/selection.hpp"
#include "../window/window_handle.hpp"

#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace termwin
{

    class CopyOverlay : public Pane
    {
    public:
        /// Rows of context kept between the cursor and the view edge.
        static constexpr StableRowIndex VERTICAL_GAP = 5;

        CopyOverlay(PaneId pane_id, std::shared_ptr<Pane> delegate, WindowHandle window,
                    std::optional<StableRowIndex> viewport);

        PaneId pane_id() const override { return pane_id_; }
        PaneKind kind() const override { return PaneKind::CopyMode; }
        std::string get_title() const override;
        RenderableDimensions get_dimensions() const override;
        StableCursorPosition get_cursor_position() const override;
        std::vector<StableRowIndex> get_dirty_lines(StableRowIndex begin,
                                                    StableRowIndex end) const override;
        std::pair<StableRowIndex, std::vector<Line>> get_lines(StableRowIndex begin,
                                                               StableRowIndex end) const override;
        std::vector<SemanticZone> get_semantic_zones() const override;
        void make_all_lines_clean() override;
        void resize(const PtySize &) override {}
        void key_down(const KeyEvent &event) override;
        void send_paste(const std::string &) override {}
        void viewport_changed(std::optional<StableRowIndex> viewport) override;

        SelectionCoordinate cursor() const { return cursor_; }
        std::optional<SelectionMode> selection_mode() const { return mode_; }

    private:
        PaneId pane_id_;
        std::shared_ptr<Pane> delegate_;
        WindowHandle window_;
        std::optional<StableRowIndex> viewport_;

        SelectionCoordinate cursor_;
        std::optional<SelectionMode> mode_;
        std::set<StableRowIndex> dirty_;

        void move_to(std::size_t x, StableRowIndex y);
        void toggle_selection(SelectionMode mode);
        void copy_and_close();
        void close();
    };

} // namespace termwin
