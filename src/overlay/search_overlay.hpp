#pragma once

// =============================================================================
// search_overlay.hpp — incremental search over a pane's scrollback
// =============================================================================
// Covers one pane: its content shows through with every match highlighted,
// and the bottom row of the view becomes the search bar. The current match
// is made the pane's selection and scrolled into view. Repainting the
// highlights marks rows dirty, which must not clear that selection, so this
// pane is viewport aware.
//
//   typing        edit the pattern
//   Enter, Up     previous (older) match
//   Down          next match
//   Ctrl-U        clear the pattern
//   Escape        close
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

    struct SearchMatch
    {
        StableRowIndex y = 0;
        std::size_t start_x = 0;
        std::size_t end_x = 0; // exclusive
    };

    class SearchOverlay : public Pane
    {
    public:
        static constexpr Color MATCH_BG = Color(110, 90, 20);

        SearchOverlay(PaneId pane_id, std::shared_ptr<Pane> delegate, WindowHandle window,
                      std::optional<StableRowIndex> viewport);

        PaneId pane_id() const override { return pane_id_; }
        PaneKind kind() const override { return PaneKind::Search; }
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
        void send_paste(const std::string &text) override;
        void viewport_changed(std::optional<StableRowIndex> viewport) override;

        const std::string &pattern() const { return pattern_; }
        const std::vector<SearchMatch> &matches() const { return matches_; }
        std::optional<std::size_t> current_match() const { return current_; }

    private:
        PaneId pane_id_;
        std::shared_ptr<Pane> delegate_;
        WindowHandle window_;
        std::optional<StableRowIndex> viewport_;

        std::string pattern_;
        std::vector<SearchMatch> matches_;
        std::optional<std::size_t> current_;
        std::set<StableRowIndex> dirty_;

        StableRowIndex bar_row() const;
        std::string bar_text() const;
        void mark_matches_dirty();
        void update_search();
        void select_current();
    };

    /// Occurrences of `pattern` in each line of `lines`, the first of which is
    /// stable row `first_row`. Matches do not span rows.
    std::vector<SearchMatch> find_matches(const std::string &pattern, StableRowIndex first_row,
                                          const std::vector<Line> &lines);

} // namespace termwin
