// =============================================================================
// buffer_pane.cpp — line buffer with stable-row scrollback
// =============================================================================

#include "buffer_pane.hpp"
#include "key_encoding.hpp"

#include <algorithm>

namespace termwin
{

    static bool is_blank(const Line &line)
    {
        for (const auto &cell : line.cells)
            if (cell.ch != U' ')
                return false;
        return true;
    }

    // -----------------------------------------------------------------------------
    // Construction
    // -----------------------------------------------------------------------------

    BufferPane::BufferPane(PaneId pane_id, const PtySize &size, std::string title,
                           std::size_t max_scrollback)
        : pane_id_(pane_id), title_(std::move(title)), max_scrollback_(max_scrollback),
          size_(size)
    {
        size_.rows = std::max<uint16_t>(size_.rows, 1);
        size_.cols = std::max<uint16_t>(size_.cols, 1);
        for (std::size_t r = 0; r < rows(); ++r)
            lines_.emplace_back(cols());
    }

    // -----------------------------------------------------------------------------
    // Pane queries
    // -----------------------------------------------------------------------------

    std::string BufferPane::get_title() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return title_;
    }

    RenderableDimensions BufferPane::get_dimensions() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        RenderableDimensions dims;
        dims.cols = cols();
        dims.viewport_rows = rows();
        dims.scrollback_rows = static_cast<StableRowIndex>(lines_.size());
        dims.physical_top = physical_top();
        dims.scrollback_top = first_row_;
        return dims;
    }

    StableCursorPosition BufferPane::get_cursor_position() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        StableCursorPosition pos;
        pos.x = cursor_x_;
        pos.y = cursor_stable_row();
        pos.shape = cursor_shape_;
        pos.visible = cursor_visible_;
        return pos;
    }

    std::vector<StableRowIndex> BufferPane::get_dirty_lines(StableRowIndex begin,
                                                            StableRowIndex end) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<StableRowIndex> dirty;
        StableRowIndex last = first_row_ + static_cast<StableRowIndex>(lines_.size());
        for (StableRowIndex row = std::max(begin, first_row_); row < std::min(end, last); ++row)
        {
            if (lines_[static_cast<std::size_t>(row - first_row_)].dirty)
                dirty.push_back(row);
        }
        return dirty;
    }

    std::pair<StableRowIndex, std::vector<Line>> BufferPane::get_lines(StableRowIndex begin,
                                                                       StableRowIndex end) const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        StableRowIndex last = first_row_ + static_cast<StableRowIndex>(lines_.size());
        StableRowIndex from = std::max(begin, first_row_);
        std::vector<Line> out;
        for (StableRowIndex row = from; row < std::min(end, last); ++row)
            out.push_back(lines_[static_cast<std::size_t>(row - first_row_)]);
        return {from, std::move(out)};
    }

    std::vector<SemanticZone> BufferPane::get_semantic_zones() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<SemanticZone> zones = zones_;
        // The open zone extends to the cursor.
        if (zone_open_ && !zones.empty())
        {
            zones.back().end_x = cursor_x_;
            zones.back().end_y = cursor_stable_row();
        }
        return zones;
    }

    void BufferPane::make_all_lines_clean()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto &line : lines_)
            line.dirty = false;
    }

    // -----------------------------------------------------------------------------
    // Resize
    // -----------------------------------------------------------------------------

    void BufferPane::resize(const PtySize &requested)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        PtySize size = requested;
        size.rows = std::max<uint16_t>(size.rows, 1);
        size.cols = std::max<uint16_t>(size.cols, 1);
        if (size == size_)
            return;

        if (size.cols != size_.cols)
        {
            for (auto &line : lines_)
            {
                bool wrapped = !line.cells.empty() && line.cells.back().wrapped;
                if (!line.cells.empty())
                    line.cells.back().wrapped = false;
                line.cells.resize(size.cols);
                if (wrapped)
                    line.cells.back().wrapped = true;
            }
        }

        std::size_t old_rows = rows();
        std::size_t new_rows = size.rows;
        if (new_rows > old_rows)
        {
            // Pull history back onto the screen before adding blank rows.
            std::size_t delta = new_rows - old_rows;
            std::size_t history = lines_.size() - old_rows;
            std::size_t take = std::min(delta, history);
            cursor_y_ += take;
            for (std::size_t i = take; i < delta; ++i)
                lines_.emplace_back(size.cols);
        }
        else if (new_rows < old_rows)
        {
            std::size_t delta = old_rows - new_rows;
            std::size_t cur_rows = old_rows;
            // Blank rows below the cursor are dropped first.
            while (delta > 0 && cursor_y_ + 1 < cur_rows && is_blank(lines_.back()))
            {
                lines_.pop_back();
                --cur_rows;
                --delta;
            }
            // The rest scroll into history.
            cursor_y_ = cursor_y_ >= delta ? cursor_y_ - delta : 0;
        }

        size_ = size;
        cursor_x_ = std::min(cursor_x_, cols() - 1);
        cursor_y_ = std::min(cursor_y_, rows() - 1);
        pending_wrap_ = false;
        trim_scrollback();
        mark_all_dirty();
    }

    // -----------------------------------------------------------------------------
    // Input
    // -----------------------------------------------------------------------------

    void BufferPane::key_down(const KeyEvent &event)
    {
        std::string bytes = encode_key(event);
        if (!bytes.empty())
            write_input(bytes);
    }

    void BufferPane::send_paste(const std::string &text)
    {
        write_input(text);
    }

    void BufferPane::focus_changed(bool focused)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        focused_ = focused;
    }

    void BufferPane::kill()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        dead_ = true;
        input_handler_ = nullptr;
    }

    void BufferPane::set_input_handler(std::function<void(const std::string &)> handler)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        input_handler_ = std::move(handler);
    }

    std::string BufferPane::take_input()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string out;
        out.swap(input_);
        return out;
    }

    void BufferPane::write_input(const std::string &bytes)
    {
        std::function<void(const std::string &)> handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (dead_)
                return;
            if (!input_handler_)
            {
                input_ += bytes;
                return;
            }
            handler = input_handler_;
        }
        handler(bytes);
    }

    bool BufferPane::has_focus() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return focused_;
    }

    bool BufferPane::is_dead() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return dead_;
    }

    PtySize BufferPane::size() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return size_;
    }

    // -----------------------------------------------------------------------------
    // Content
    // -----------------------------------------------------------------------------

    void BufferPane::print(const std::string &text)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t i = 0;
        while (i < text.size())
        {
            char32_t cp = next_codepoint(text, i);

            switch (cp)
            {
            case U'\n':
                pending_wrap_ = false;
                newline();
                cursor_x_ = 0;
                break;
            case U'\r':
                pending_wrap_ = false;
                cursor_x_ = 0;
                break;
            case U'\t':
            {
                // Next tab stop (every 8 columns)
                std::size_t next_tab = ((cursor_x_ / 8) + 1) * 8;
                cursor_x_ = std::min(next_tab, cols() - 1);
                break;
            }
            case U'\b':
                pending_wrap_ = false;
                if (cursor_x_ > 0)
                    --cursor_x_;
                break;
            default:
                if (cp >= 0x20)
                    put_char(cp);
                break;
            }
        }
    }

    void BufferPane::mark_zone(SemanticType type)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        StableRowIndex row = cursor_stable_row();
        if (zone_open_ && !zones_.empty())
        {
            SemanticZone &prev = zones_.back();
            if (cursor_x_ > 0)
            {
                prev.end_x = cursor_x_ - 1;
                prev.end_y = row;
            }
            else if (row > prev.start_y)
            {
                prev.end_x = cols() - 1;
                prev.end_y = row - 1;
            }
            else
            {
                prev.end_x = prev.start_x;
                prev.end_y = prev.start_y;
            }
        }
        SemanticZone zone;
        zone.start_x = cursor_x_;
        zone.start_y = row;
        zone.end_x = cursor_x_;
        zone.end_y = row;
        zone.semantic_type = type;
        zones_.push_back(zone);
        zone_open_ = true;
    }

    void BufferPane::clear()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        first_row_ += static_cast<StableRowIndex>(lines_.size());
        lines_.clear();
        for (std::size_t r = 0; r < rows(); ++r)
            lines_.emplace_back(cols());
        cursor_x_ = 0;
        cursor_y_ = 0;
        pending_wrap_ = false;
        zones_.clear();
        zone_open_ = false;
    }

    void BufferPane::set_line(StableRowIndex row, Line line)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (row < first_row_ || row >= first_row_ + static_cast<StableRowIndex>(lines_.size()))
            return;
        line.dirty = true;
        lines_[static_cast<std::size_t>(row - first_row_)] = std::move(line);
    }

    void BufferPane::move_cursor(std::size_t x, std::size_t screen_row)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cursor_x_ = std::min(x, cols() - 1);
        cursor_y_ = std::min(screen_row, rows() - 1);
        pending_wrap_ = false;
    }

    void BufferPane::set_cursor_shape(CursorShape shape)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cursor_shape_ = shape;
    }

    void BufferPane::set_cursor_visible(bool visible)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cursor_visible_ = visible;
    }

    void BufferPane::set_title(std::string title)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        title_ = std::move(title);
    }

    // -----------------------------------------------------------------------------
    // Internal helpers
    // -----------------------------------------------------------------------------

    StableRowIndex BufferPane::physical_top() const
    {
        return first_row_ + static_cast<StableRowIndex>(lines_.size() - rows());
    }

    Line &BufferPane::screen_line(std::size_t screen_row)
    {
        return lines_[lines_.size() - rows() + screen_row];
    }

    StableRowIndex BufferPane::cursor_stable_row() const
    {
        return physical_top() + static_cast<StableRowIndex>(cursor_y_);
    }

    void BufferPane::put_char(char32_t ch)
    {
        if (pending_wrap_)
        {
            Line &line = screen_line(cursor_y_);
            if (!line.cells.empty())
                line.cells.back().wrapped = true;
            line.dirty = true;
            pending_wrap_ = false;
            newline();
            cursor_x_ = 0;
        }

        Line &line = screen_line(cursor_y_);
        if (line.cells.size() < cols())
            line.cells.resize(cols());
        Cell &cell = line.cells[cursor_x_];
        cell.reset();
        cell.ch = ch;
        line.dirty = true;

        if (cursor_x_ + 1 >= cols())
            pending_wrap_ = true;
        else
            ++cursor_x_;
    }

    void BufferPane::newline()
    {
        ++cursor_y_;
        if (cursor_y_ >= rows())
        {
            lines_.emplace_back(cols());
            cursor_y_ = rows() - 1;
            trim_scrollback();
        }
    }

    void BufferPane::trim_scrollback()
    {
        while (lines_.size() > rows() + max_scrollback_)
        {
            lines_.pop_front();
            ++first_row_;
        }
        // Zones that scrolled entirely out of history go too. The open zone
        // is kept; its end follows the cursor.
        std::size_t keep_open = zone_open_ ? 1 : 0;
        std::size_t closed = zones_.size() - std::min(zones_.size(), keep_open);
        std::size_t drop = 0;
        while (drop < closed && zones_[drop].end_y < first_row_)
            ++drop;
        zones_.erase(zones_.begin(), zones_.begin() + static_cast<std::ptrdiff_t>(drop));
    }

    void BufferPane::mark_all_dirty()
    {
        for (auto &line : lines_)
            line.dirty = true;
    }

} // namespace termwin
