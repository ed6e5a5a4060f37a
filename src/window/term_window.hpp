#pragma once

// =============================================================================
// term_window.hpp — the state of one terminal window
// =============================================================================
// A TermWindow shows one multiplexer window: its tabs, the panes of the
// active tab, and whatever overlays cover them. It owns the per-tab and
// per-pane state (overlays, viewports, selections), keeps pixel and cell
// geometry consistent with the font metrics, and decides when a repaint is
// needed.
//
// Everything here runs on the GUI thread. Other threads reach the window only
// through a WindowHandle, whose closures run on the next drain_pending().
//
// The implementation is split by concern:
//
//   term_window.cpp           creation, events, title, scroll bar, paint
//   term_window_input.cpp     keys, key assignments, mouse, tabs, clipboard
//   term_window_resize.cpp    font scale and geometry recompute
//   term_window_overlays.cpp  overlay install/cancel and the built-in overlays
//   maintenance.cpp           the periodic tick and config reload
// =============================================================================

#include "../config/config.hpp"
#include "../mux/mux.hpp"
#include "../overlay/task_executor.hpp"
#include "background_image.hpp"
#include "clipboard.hpp"
#include "font_config.hpp"
#include "geometry.hpp"
#include "input_map.hpp"
#include "overlay_registry.hpp"
#include "palette.hpp"
#include "render_surface.hpp"
#include "tab_bar.hpp"
#include "viewport.hpp"
#include "window_handle.hpp"
#include "window_ops.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace termwin
{

    class OverlayTerm;

    class TermWindow : public WindowCallbacks, public std::enable_shared_from_this<TermWindow>
    {
        struct Private
        {
        };

    public:
        using Clock = std::chrono::steady_clock;

        static constexpr std::chrono::milliseconds MAINTENANCE_INTERVAL{35};
        static constexpr std::chrono::milliseconds CLICK_STREAK_INTERVAL{500};
        /// Rows kept between a selection being dragged and the view edge.
        static constexpr StableRowIndex SELECTION_SCROLL_GAP = 2;
        static constexpr long WHEEL_LINES = 3;

        /// Collaborators; all must outlive the window.
        struct Services
        {
            Mux &mux;
            ConfigStore &config_store;
            WindowConnection &connection;
            TaskExecutor &executor;
            Clipboard &clipboard;
            std::function<Clock::time_point()> now = [] { return Clock::now(); };
        };

        /// Open a window for `mux_window_id`: fonts, native window, render
        /// surface and the maintenance timer. Throws FontError and
        /// WindowError; RenderSurfaceLost when no surface can be created.
        static std::shared_ptr<TermWindow> new_window(
            MuxWindowId mux_window_id, Services services,
            std::map<std::string, std::string> config_overrides = {});

        TermWindow(Private, MuxWindowId mux_window_id, Services services,
                   std::map<std::string, std::string> config_overrides);
        ~TermWindow() override;

        TermWindow(const TermWindow &) = delete;
        TermWindow &operator=(const TermWindow &) = delete;

        // --- WindowCallbacks ---
        void focus_change(bool focused) override;
        void resize(const Dimensions &dims) override;
        bool key_event(const KeyEvent &event) override;
        void mouse_event(const MouseEvent &event) override;
        bool can_close() override;
        void context_lost() override;
        void paint() override;
        void drain_pending() override;

        // --- State ---
        MuxWindowId mux_window_id() const { return mux_window_id_; }
        Mux &mux() { return mux_; }
        const Config &config() const { return *config_; }
        uint64_t config_generation() const { return config_.generation; }
        const Dimensions &dimensions() const { return dimensions_; }
        const PtySize &terminal_size() const { return terminal_size_; }
        const RenderMetrics &render_metrics() const { return metrics_; }
        bool show_tab_bar() const { return show_tab_bar_; }
        bool show_scroll_bar() const { return show_scroll_bar_; }
        bool has_render_surface() const { return render_surface_ != nullptr; }
        bool is_focused() const { return focused_.has_value(); }
        bool is_closed() const { return closed_; }
        const TabBarState &tab_bar() const { return tab_bar_; }
        const ColorPalette &palette();
        std::shared_ptr<const ImageData> background_image() const { return background_; }
        const InputMap &input_map() const { return input_map_; }

        /// Handle for other threads to queue work on this window.
        WindowHandle handle() const { return WindowHandle(mutations_); }

        // --- Overlay registry ---
        TabState &tab_state(TabId tab_id) { return overlays_.tab_state(tab_id); }
        PaneState &pane_state(PaneId pane_id) { return overlays_.pane_state(pane_id); }

        /// Install `overlay` over the whole tab, releasing any previous one.
        void assign_tab_overlay(TabId tab_id, std::shared_ptr<Pane> overlay);
        /// Install `overlay` over one pane, releasing any previous one.
        void assign_pane_overlay(PaneId pane_id, std::shared_ptr<Pane> overlay);
        /// Remove the tab overlay unless `expected` names a different one.
        void cancel_tab_overlay(TabId tab_id, std::optional<PaneId> expected = std::nullopt);
        void cancel_pane_overlay(PaneId pane_id);

        /// Panes of the active tab as they should be drawn.
        std::vector<RenderedPane> panes_to_render();
        /// What keys go to: tab overlay, else pane overlay, else the active
        /// pane.
        PaneSlot active_pane_or_overlay();

        // --- Selection ---
        Selection &selection(PaneId pane_id) { return pane_state(pane_id).selection; }
        std::string selection_text(PaneId state_id, const Pane &pane);

        /// Start a selection at the cell under the mouse.
        void select_text_at_mouse_cursor(SelectionMode mode);
        /// Extend the selection to the cell under the mouse; `mode`
        /// defaults to Cell.
        void extend_selection_at_mouse_cursor(std::optional<SelectionMode> mode);

        // --- Viewport ---
        std::optional<StableRowIndex> get_viewport(PaneId pane_id)
        {
            return viewport_.get_viewport(pane_id);
        }
        void set_viewport(PaneId pane_id, std::optional<StableRowIndex> position,
                          const RenderableDimensions &dims)
        {
            viewport_.set_viewport(pane_id, position, dims);
        }
        ViewportController &viewport() { return viewport_; }

        void scroll_to_bottom();
        void scroll_by_line(long amount);
        void scroll_by_page(long amount);
        void scroll_to_prompt(long amount);

        // --- Geometry ---

        /// Switch fonts to `font_scale` at `dims.dpi`. Returns false, leaving
        /// everything as it was, when that would render fonts too small.
        bool apply_scale_change(const Dimensions &dims, double font_scale);

        /// Recompute and push geometry. With `scale_changed_cells` the
        /// rows/cols are kept and the window is asked to resize around them;
        /// otherwise rows/cols follow `dims`.
        void apply_dimensions(const Dimensions &dims,
                              std::optional<RowsAndCols> scale_changed_cells);

        void scaling_changed(const Dimensions &dims, double font_scale);
        void adjust_font_scale(double font_scale);
        void increase_font_size() { adjust_font_scale(fonts_->get_font_scale() * 1.1); }
        void decrease_font_size() { adjust_font_scale(fonts_->get_font_scale() * 0.9); }
        void reset_font_size() { adjust_font_scale(1.0); }
        void reset_font_and_window_size();

        RowsAndCols current_cell_dimensions() const
        {
            return {terminal_size_.rows, terminal_size_.cols};
        }

        // --- Maintenance ---
        void periodic_window_maintenance();
        void check_for_config_reload();
        void config_was_reloaded();

        // --- Tabs ---
        void activate_tab(long tab_idx);
        void activate_tab_relative(long delta);
        void move_tab(std::size_t tab_idx);
        void move_tab_relative(long delta);
        void close_current_pane(bool confirm);
        void close_current_tab(bool confirm);
        void close_tab_idx(std::size_t idx);
        void spawn_tab(const std::string &command);

        // --- Commands ---
        void perform_key_assignment(const KeyAssignment &assignment);
        void copy_to_clipboard(ClipboardKind kind, const std::string &text);
        void paste_from_clipboard(ClipboardKind kind);

        void show_tab_navigator();
        void show_launcher();
        void show_search();
        void activate_copy_mode();

        // --- Chrome ---
        void update_title();
        void update_scrollbar();
        void update_text_cursor(const Pane &pane);

        /// Ask the native window for a repaint.
        void invalidate();

    private:
        Mux &mux_;
        ConfigStore &config_store_;
        WindowConnection &connection_;
        TaskExecutor &executor_;
        Clipboard &clipboard_;
        std::function<Clock::time_point()> now_;

        MuxWindowId mux_window_id_;
        std::map<std::string, std::string> config_overrides_;
        ConfigHandle config_;

        std::shared_ptr<WindowOps> window_;
        std::unique_ptr<RenderSurface> render_surface_;
        std::unique_ptr<FontConfiguration> fonts_;
        RenderMetrics metrics_;
        Dimensions dimensions_;
        PtySize terminal_size_;

        OverlayRegistry overlays_;
        ViewportController viewport_;
        std::shared_ptr<MutationQueue> mutations_;

        InputMap input_map_;
        std::optional<ColorPalette> palette_;
        std::shared_ptr<const ImageData> background_;

        bool show_tab_bar_ = false;
        bool show_scroll_bar_ = false;
        TabBarState tab_bar_;
        std::optional<RenderableDimensions> last_scroll_info_;

        std::optional<Clock::time_point> focused_;
        Clock::time_point last_blink_paint_;
        bool closed_ = false;

        // Mouse
        struct ClickStreak
        {
            Clock::time_point at;
            std::size_t col = 0;
            StableRowIndex row = 0;
            unsigned count = 0;
        };
        std::optional<ClickStreak> last_mouse_click_;
        SelectionMode drag_mode_ = SelectionMode::Cell;
        bool dragging_selection_ = false;
        bool dragging_scroll_bar_ = false;
        /// Cell under the pointer, relative to the pane it is over.
        std::size_t mouse_col_ = 0;
        StableRowIndex mouse_row_ = 0;

        std::shared_ptr<ClipboardContents> clipboard_contents_ =
            std::make_shared<ClipboardContents>();

        // term_window.cpp
        void created();
        void start_periodic_maintenance();
        void update_title_impl(bool allow_regeometry);
        PaintModel build_paint_model();
        bool cursor_blink_visible(CursorShape shape) const;
        ConfigHandle load_effective_config() const;

        // term_window_resize.cpp
        void apply_dimensions_impl(const Dimensions &dims,
                                   std::optional<RowsAndCols> scale_changed_cells,
                                   bool allow_regeometry);

        // term_window_input.cpp
        bool mouse_in_tab_bar(const MouseEvent &event) const;
        bool mouse_in_scroll_bar(const MouseEvent &event) const;
        /// Track the cell under the pointer; returns the pane it is over.
        std::optional<RenderedPane> update_mouse_cell(const MouseEvent &event);
        void mouse_press(const MouseEvent &event);
        void drag_scroll_bar(const MouseEvent &event);
        void complete_paste(const std::weak_ptr<Pane> &target);

        // term_window_overlays.cpp
        using TabOverlayTask = std::function<void(TabId, OverlayTerm &)>;
        using PaneOverlayTask = std::function<void(PaneId, OverlayTerm &)>;
        void start_tab_overlay(const std::shared_ptr<Tab> &tab, PaneKind kind,
                               const std::string &title, TabOverlayTask task);
        void start_pane_overlay(const std::shared_ptr<Pane> &pane, PaneKind kind,
                                const std::string &title, PaneOverlayTask task);
    };

} // namespace termwin
