#pragma once

// =============================================================================
// pane.hpp — the Pane capability
// =============================================================================
// Everything the window shows is "a pane": real terminal sessions and the
// transient overlays (search, copy mode, confirmation, launcher, tab
// navigator) all implement this interface. Window state stores
// std::shared_ptr<Pane> and never a concrete type, so overlay replacement and
// precedence logic do not care what kind of pane they hold.
// =============================================================================

#include "../config/key_assignment.hpp"
#include "../core/types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace termwin
{

    enum class PaneKind
    {
        Real,
        Search,
        CopyMode,
        Confirmation,
        Launcher,
        TabNavigator,
    };

    /// Search and copy mode mark lines dirty to repaint their highlighting
    /// while deliberately keeping a selection alive; they also follow the
    /// viewport.
    inline bool is_viewport_aware(PaneKind kind)
    {
        return kind == PaneKind::Search || kind == PaneKind::CopyMode;
    }

    class Pane
    {
    public:
        virtual ~Pane() = default;

        virtual PaneId pane_id() const = 0;
        virtual PaneKind kind() const { return PaneKind::Real; }

        virtual std::string get_title() const = 0;
        virtual RenderableDimensions get_dimensions() const = 0;
        virtual StableCursorPosition get_cursor_position() const = 0;

        /// Rows in [begin, end) changed since the last paint, ascending.
        virtual std::vector<StableRowIndex> get_dirty_lines(StableRowIndex begin,
                                                            StableRowIndex end) const = 0;

        /// Lines in [begin, end), clamped to what the pane holds. Returns the
        /// stable index of the first returned line.
        virtual std::pair<StableRowIndex, std::vector<Line>> get_lines(StableRowIndex begin,
                                                                       StableRowIndex end) const = 0;

        virtual std::vector<SemanticZone> get_semantic_zones() const = 0;

        /// Called after a paint consumed the dirty state.
        virtual void make_all_lines_clean() = 0;

        virtual void resize(const PtySize &size) = 0;
        virtual void key_down(const KeyEvent &event) = 0;
        virtual void send_paste(const std::string &text) = 0;
        virtual void focus_changed(bool /*focused*/) {}
        virtual bool can_close_without_prompting() const { return true; }

        /// Viewport-aware overlays override this to follow scrolling of the
        /// pane they cover.
        virtual void viewport_changed(std::optional<StableRowIndex> /*viewport*/) {}

        /// Release resources. The multiplexer calls this once when it removes
        /// the pane.
        virtual void kill() {}
    };

    /// A pane together with where it sits inside its tab.
    struct PositionedPane
    {
        std::size_t index = 0;
        bool is_active = false;
        bool is_zoomed = false;
        std::size_t left = 0;
        std::size_t top = 0;
        std::size_t width = 0;
        std::size_t height = 0;
        std::size_t pixel_width = 0;
        std::size_t pixel_height = 0;
        std::shared_ptr<Pane> pane;
    };

} // namespace termwin
