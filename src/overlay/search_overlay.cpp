// =============================================================================
// search_overlay.cpp
// =============================================================================

#include "search_overlay.hpp"
#include "../window/term_window.hpp"

#include <algorithm>

namespace termwin
{

    std::vector<SearchMatch> find_matches(const std::string &pattern, StableRowIndex first_row,
                                          const std::vector<Line> &lines)
    {
        std::vector<SearchMatch> out;
        std::u32string needle;
        for (std::size_t i = 0; i < pattern.size();)
            needle.push_back(next_codepoint(pattern, i));
        if (needle.empty())
            return out;

        for (std::size_t r = 0; r < lines.size(); ++r)
        {
            std::u32string hay;
            for (const auto &cell : lines[r].cells)
                hay.push_back(cell.ch);

            std::size_t pos = hay.find(needle);
            while (pos != std::u32string::npos)
            {
                out.push_back({first_row + static_cast<StableRowIndex>(r), pos, pos + needle.size()});
                pos = hay.find(needle, pos + needle.size());
            }
        }
        return out;
    }

    SearchOverlay::SearchOverlay(PaneId pane_id, std::shared_ptr<Pane> delegate,
                                 WindowHandle window, std::optional<StableRowIndex> viewport)
        : pane_id_(pane_id), delegate_(std::move(delegate)), window_(std::move(window)),
          viewport_(viewport)
    {
        dirty_.insert(bar_row());
    }

    std::string SearchOverlay::get_title() const
    {
        return "Search: " + delegate_->get_title();
    }

    RenderableDimensions SearchOverlay::get_dimensions() const
    {
        return delegate_->get_dimensions();
    }

    StableRowIndex SearchOverlay::bar_row() const
    {
        RenderableDimensions dims = delegate_->get_dimensions();
        StableRowIndex top = viewport_.value_or(dims.physical_top);
        return top + static_cast<StableRowIndex>(dims.viewport_rows) - 1;
    }

    std::string SearchOverlay::bar_text() const
    {
        std::string text = "Search: " + pattern_;
        std::string status;
        if (!pattern_.empty())
        {
            if (matches_.empty())
                status = " (no matches)";
            else
                status = " (" + std::to_string(current_.value_or(0) + 1) + "/" +
                         std::to_string(matches_.size()) + " matches)";
        }
        return text + status;
    }

    StableCursorPosition SearchOverlay::get_cursor_position() const
    {
        StableCursorPosition pos;
        std::size_t width = 0;
        std::string prefix = "Search: " + pattern_;
        for (std::size_t i = 0; i < prefix.size(); ++width)
            next_codepoint(prefix, i);
        pos.x = width;
        pos.y = bar_row();
        pos.shape = CursorShape::SteadyBar;
        return pos;
    }

    std::vector<StableRowIndex> SearchOverlay::get_dirty_lines(StableRowIndex begin,
                                                               StableRowIndex end) const
    {
        std::vector<StableRowIndex> rows = delegate_->get_dirty_lines(begin, end);
        for (StableRowIndex row : dirty_)
            if (row >= begin && row < end)
                rows.push_back(row);
        std::sort(rows.begin(), rows.end());
        rows.erase(std::unique(rows.begin(), rows.end()), rows.end());
        return rows;
    }

    std::pair<StableRowIndex, std::vector<Line>> SearchOverlay::get_lines(StableRowIndex begin,
                                                                          StableRowIndex end) const
    {
        auto fetched = delegate_->get_lines(begin, end);
        StableRowIndex first = fetched.first;
        auto &lines = fetched.second;

        for (const auto &m : matches_)
        {
            if (m.y < first || m.y >= first + static_cast<StableRowIndex>(lines.size()))
                continue;
            Line &line = lines[static_cast<std::size_t>(m.y - first)];
            for (std::size_t x = m.start_x; x < m.end_x && x < line.cells.size(); ++x)
                line.cells[x].bg = MATCH_BG;
        }

        StableRowIndex bar = bar_row();
        if (bar >= first && bar < first + static_cast<StableRowIndex>(lines.size()))
        {
            Line &line = lines[static_cast<std::size_t>(bar - first)];
            std::size_t width = line.cells.size();
            Line text = Line::from_text(bar_text());
            line = Line(width);
            for (std::size_t x = 0; x < width; ++x)
            {
                if (x < text.cells.size())
                    line.cells[x].ch = text.cells[x].ch;
                std::swap(line.cells[x].fg, line.cells[x].bg);
            }
        }
        return fetched;
    }

    std::vector<SemanticZone> SearchOverlay::get_semantic_zones() const
    {
        return delegate_->get_semantic_zones();
    }

    void SearchOverlay::make_all_lines_clean()
    {
        dirty_.clear();
        delegate_->make_all_lines_clean();
    }

    void SearchOverlay::viewport_changed(std::optional<StableRowIndex> viewport)
    {
        dirty_.insert(bar_row());
        viewport_ = viewport;
        dirty_.insert(bar_row());
    }

    void SearchOverlay::mark_matches_dirty()
    {
        for (const auto &m : matches_)
            dirty_.insert(m.y);
        dirty_.insert(bar_row());
    }

    void SearchOverlay::update_search()
    {
        mark_matches_dirty();

        RenderableDimensions dims = delegate_->get_dimensions();
        auto fetched = delegate_->get_lines(
            dims.scrollback_top, dims.physical_top + static_cast<StableRowIndex>(dims.viewport_rows));
        matches_ = find_matches(pattern_, fetched.first, fetched.second);

        // Start from the newest match, closest to the live screen.
        if (matches_.empty())
            current_.reset();
        else
            current_ = matches_.size() - 1;

        mark_matches_dirty();
        select_current();
    }

    void SearchOverlay::select_current()
    {
        PaneId state_id = delegate_->pane_id();
        std::optional<SelectionRange> range;
        std::optional<StableRowIndex> scroll_to;

        if (current_)
        {
            const SearchMatch &m = matches_[*current_];
            range = SelectionRange{{m.start_x, m.y}, {m.end_x - 1, m.y}};

            RenderableDimensions dims = delegate_->get_dimensions();
            StableRowIndex top = viewport_.value_or(dims.physical_top);
            StableRowIndex rows = static_cast<StableRowIndex>(dims.viewport_rows);
            if (m.y < top || m.y >= top + rows - 1)
                scroll_to = m.y - rows / 2;
        }

        std::shared_ptr<Pane> delegate = delegate_;
        window_.apply([state_id, range, scroll_to, delegate](TermWindow &w)
                      {
                          Selection &sel = w.selection(state_id);
                          if (range)
                          {
                              sel.start = range->start;
                              sel.range = range;
                          }
                          else
                              sel.clear();
                          if (scroll_to)
                              w.set_viewport(state_id, scroll_to, delegate->get_dimensions());
                          w.invalidate();
                      });
    }

    void SearchOverlay::key_down(const KeyEvent &event)
    {
        switch (event.key)
        {
        case KeyCode::Escape:
        {
            PaneId state_id = delegate_->pane_id();
            window_.apply([state_id](TermWindow &w) { w.cancel_pane_overlay(state_id); });
            return;
        }
        case KeyCode::Enter:
        case KeyCode::UpArrow:
            if (current_ && *current_ > 0)
            {
                --*current_;
                dirty_.insert(bar_row());
                select_current();
            }
            return;
        case KeyCode::DownArrow:
            if (current_ && *current_ + 1 < matches_.size())
            {
                ++*current_;
                dirty_.insert(bar_row());
                select_current();
            }
            return;
        case KeyCode::Backspace:
            if (!pattern_.empty())
            {
                // Drop the last codepoint.
                std::size_t cut = pattern_.size() - 1;
                while (cut > 0 && (static_cast<unsigned char>(pattern_[cut]) & 0xC0) == 0x80)
                    --cut;
                pattern_.erase(cut);
                update_search();
            }
            return;
        case KeyCode::Char:
            if (event.mods & MOD_CTRL)
            {
                if (event.ch == U'u' || event.ch == U'U')
                {
                    pattern_.clear();
                    update_search();
                }
                return;
            }
            append_utf8(pattern_, event.ch);
            update_search();
            return;
        default:
            return;
        }
    }

    void SearchOverlay::send_paste(const std::string &text)
    {
        pattern_ += text;
        update_search();
    }

} // namespace termwin
