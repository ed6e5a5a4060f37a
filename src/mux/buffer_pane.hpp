#pragma once

// =============================================================================
// buffer_pane.hpp — a Pane backed by a line buffer with scrollback
// =============================================================================
// Maintains the visible screen plus a scrollback history, addressed by stable
// row indices: row N keeps its index while newer output scrolls it into
// history, until it is trimmed off the top. Content arrives through print();
// every mutation marks the touched lines dirty until the next paint calls
// make_all_lines_clean().
//
// All members are guarded by an internal mutex because overlay tasks write
// into their panes from executor threads while the GUI thread reads them.
// =============================================================================

#include "pane.hpp"

#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace termwin
{

    class BufferPane : public Pane
    {
    public:
        static constexpr std::size_t DEFAULT_SCROLLBACK = 5000;

        BufferPane(PaneId pane_id, const PtySize &size, std::string title,
                   std::size_t max_scrollback = DEFAULT_SCROLLBACK);

        // --- Pane ---
        PaneId pane_id() const override { return pane_id_; }
        std::string get_title() const override;
        RenderableDimensions get_dimensions() const override;
        StableCursorPosition get_cursor_position() const override;
        std::vector<StableRowIndex> get_dirty_lines(StableRowIndex begin,
                                                    StableRowIndex end) const override;
        std::pair<StableRowIndex, std::vector<Line>> get_lines(StableRowIndex begin,
                                                               StableRowIndex end) const override;
        std::vector<SemanticZone> get_semantic_zones() const override;
        void make_all_lines_clean() override;
        void resize(const PtySize &size) override;
        void key_down(const KeyEvent &event) override;
        void send_paste(const std::string &text) override;
        void focus_changed(bool focused) override;
        void kill() override;

        // --- Content ---

        /// Write UTF-8 text at the cursor. Handles \n, \r, \t and \b; text
        /// running past the last column soft-wraps onto the next row.
        void print(const std::string &text);

        /// Close the current semantic zone at the cursor and open a new one
        /// of `type` there (shell integration marks).
        void mark_zone(SemanticType type);

        /// Erase screen and scrollback and home the cursor.
        void clear();

        /// Replace the contents of a screen/scrollback row. Out-of-range rows
        /// are ignored.
        void set_line(StableRowIndex row, Line line);

        void move_cursor(std::size_t x, std::size_t screen_row);
        void set_cursor_shape(CursorShape shape);
        void set_cursor_visible(bool visible);
        void set_title(std::string title);

        /// Receives encoded key input and pastes. Without a handler the bytes
        /// accumulate and can be collected with take_input().
        void set_input_handler(std::function<void(const std::string &)> handler);
        std::string take_input();

        bool has_focus() const;
        bool is_dead() const;
        PtySize size() const;

    protected:
        /// Deliver encoded input; called without the lock held.
        void write_input(const std::string &bytes);

        mutable std::mutex mutex_;

    private:
        PaneId pane_id_;
        std::string title_;
        std::size_t max_scrollback_;

        PtySize size_;
        std::deque<Line> lines_;        // scrollback followed by the screen
        StableRowIndex first_row_ = 0;  // stable index of lines_[0]

        std::size_t cursor_x_ = 0;
        std::size_t cursor_y_ = 0; // screen row
        bool pending_wrap_ = false;
        CursorShape cursor_shape_ = CursorShape::Default;
        bool cursor_visible_ = true;

        std::vector<SemanticZone> zones_;
        bool zone_open_ = false;

        std::function<void(const std::string &)> input_handler_;
        std::string input_;
        bool focused_ = false;
        bool dead_ = false;

        // Helpers; mutex_ held.
        std::size_t rows() const { return size_.rows; }
        std::size_t cols() const { return size_.cols; }
        StableRowIndex physical_top() const;
        Line &screen_line(std::size_t screen_row);
        StableRowIndex cursor_stable_row() const;
        void put_char(char32_t ch);
        void newline();
        void trim_scrollback();
        void mark_all_dirty();
    };

} // namespace termwin
