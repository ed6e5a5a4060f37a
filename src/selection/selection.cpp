// =============================================================================
// selection.cpp — selection ranges and unit snapping
// =============================================================================

#include "selection.hpp"
#include "../mux/pane.hpp"

#include <algorithm>

namespace termwin
{

    // =========================================================================
    // SelectionRange
    // =========================================================================

    static bool is_boundary(char32_t ch, const std::u32string &boundary)
    {
        return ch == 0 || boundary.find(ch) != std::u32string::npos;
    }

    static std::u32string decode(const std::string &s)
    {
        std::u32string out;
        std::size_t i = 0;
        while (i < s.size())
            out.push_back(next_codepoint(s, i));
        return out;
    }

    SelectionRange SelectionRange::word_around(SelectionCoordinate coord, const Pane &pane,
                                               const std::string &word_boundary)
    {
        auto fetched = pane.get_lines(coord.y, coord.y + 1);
        if (fetched.second.empty() || fetched.first != coord.y)
            return at(coord);

        const Line &line = fetched.second.front();
        std::u32string boundary = decode(word_boundary);
        if (coord.x >= line.cells.size() || is_boundary(line.cells[coord.x].ch, boundary))
            return at(coord);

        std::size_t left = coord.x;
        while (left > 0 && !is_boundary(line.cells[left - 1].ch, boundary))
            --left;
        std::size_t right = coord.x;
        while (right + 1 < line.cells.size() && !is_boundary(line.cells[right + 1].ch, boundary))
            ++right;

        return {{left, coord.y}, {right, coord.y}};
    }

    SelectionRange SelectionRange::line_around(SelectionCoordinate coord)
    {
        return {{0, coord.y}, {END_OF_ROW, coord.y}};
    }

    SelectionRange SelectionRange::zone_around(SelectionCoordinate coord, const Pane &pane)
    {
        for (const auto &zone : pane.get_semantic_zones())
        {
            SelectionCoordinate zs{zone.start_x, zone.start_y};
            SelectionCoordinate ze{zone.end_x, zone.end_y};
            if (zs <= coord && coord <= ze)
                return {zs, ze};
        }
        return at(coord);
    }

    SelectionRange SelectionRange::extend_with(const SelectionRange &other) const
    {
        SelectionRange a = normalize();
        SelectionRange b = other.normalize();
        return {std::min(a.start, b.start), std::max(a.end, b.end)};
    }

    SelectionRange SelectionRange::normalize() const
    {
        if (start <= end)
            return *this;
        return {end, start};
    }

    std::pair<StableRowIndex, StableRowIndex> SelectionRange::rows() const
    {
        SelectionRange n = normalize();
        return {n.start.y, n.end.y + 1};
    }

    static std::size_t one_past(std::size_t x)
    {
        return x == END_OF_ROW ? END_OF_ROW : x + 1;
    }

    std::pair<std::size_t, std::size_t> SelectionRange::cols_for_row(StableRowIndex row) const
    {
        SelectionRange n = normalize();
        if (row < n.start.y || row > n.end.y)
            return {0, 0};
        if (n.start.y == n.end.y)
            return {std::min(n.start.x, n.end.x), one_past(std::max(n.start.x, n.end.x))};
        if (row == n.end.y)
            return {0, one_past(n.end.x)};
        if (row == n.start.y)
            return {n.start.x, END_OF_ROW};
        return {0, END_OF_ROW};
    }

    bool SelectionRange::contains(SelectionCoordinate coord) const
    {
        auto cols = cols_for_row(coord.y);
        return coord.x >= cols.first && coord.x < cols.second;
    }

    // =========================================================================
    // Selection
    // =========================================================================

    static SelectionRange unit_around(SelectionMode mode, SelectionCoordinate coord,
                                      const Pane &pane, const std::string &word_boundary)
    {
        switch (mode)
        {
        case SelectionMode::Word:
            return SelectionRange::word_around(coord, pane, word_boundary);
        case SelectionMode::Line:
            return SelectionRange::line_around(coord);
        case SelectionMode::SemanticZone:
            return SelectionRange::zone_around(coord, pane);
        case SelectionMode::Cell:
            break;
        }
        return SelectionRange::at(coord);
    }

    void Selection::begin(SelectionMode new_mode, SelectionCoordinate coord, const Pane &pane,
                          const std::string &word_boundary)
    {
        mode = new_mode;
        if (mode == SelectionMode::Cell)
        {
            start = coord;
            range.reset();
            return;
        }
        SelectionRange unit = unit_around(mode, coord, pane, word_boundary);
        start = unit.start;
        range = unit;
    }

    void Selection::extend(SelectionMode new_mode, SelectionCoordinate coord, const Pane &pane,
                           const std::string &word_boundary)
    {
        mode = new_mode;
        if (mode == SelectionMode::Cell)
        {
            if (range)
                range = range->extend(coord);
            else
                range = SelectionRange::at(start.value_or(coord)).extend(coord);
            return;
        }

        SelectionRange end_unit = unit_around(mode, coord, pane, word_boundary);
        SelectionCoordinate anchor = start.value_or(end_unit.start);
        SelectionRange start_unit = unit_around(mode, anchor, pane, word_boundary);
        range = start_unit.extend_with(end_unit);
    }

    bool Selection::intersects_rows(const std::vector<StableRowIndex> &dirty) const
    {
        if (!range)
            return false;
        auto span = range->rows();
        for (StableRowIndex row : dirty)
            if (row >= span.first && row < span.second)
                return true;
        return false;
    }

    // =========================================================================
    // Text extraction
    // =========================================================================

    std::string selection_text(const Selection &selection, const Pane &pane)
    {
        std::string s;
        if (!selection.range)
            return s;

        SelectionRange sel = selection.range->normalize();
        auto span = sel.rows();
        auto fetched = pane.get_lines(span.first, span.second);

        bool last_was_wrapped = false;
        StableRowIndex row = fetched.first;
        for (const auto &line : fetched.second)
        {
            auto cols = sel.cols_for_row(row);
            if (!s.empty() && !last_was_wrapped)
                s += '\n';

            std::string text = line.columns_as_str(cols.first, cols.second);
            trim_end(text);
            s += text;

            last_was_wrapped = false;
            std::size_t end = std::min(cols.second, line.cells.size());
            if (end > 0)
            {
                const Cell &last_cell = line.cells[end - 1];
                last_was_wrapped = last_cell.wrapped && last_cell.ch != U' ';
            }
            ++row;
        }
        return s;
    }

} // namespace termwin
