#pragma once

// =============================================================================
// selection.hpp — per-pane text selection
// =============================================================================
// A Selection keeps an anchor (`start`) and the resolved `range`. Cell ranges
// follow the pointer exactly; Word, Line and SemanticZone ranges are snapped
// to their unit's boundaries. The anchor is kept separately so a drag that
// changes direction still knows where it started.
// =============================================================================

#include "../core/types.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace termwin
{

    class Pane;

    enum class SelectionMode
    {
        Cell,
        Word,
        Line,
        SemanticZone,
    };

    struct SelectionCoordinate
    {
        std::size_t x = 0;
        StableRowIndex y = 0;

        bool operator==(const SelectionCoordinate &o) const { return x == o.x && y == o.y; }
        bool operator!=(const SelectionCoordinate &o) const { return !(*this == o); }
        /// Reading order: row first, then column.
        bool operator<(const SelectionCoordinate &o) const
        {
            return y < o.y || (y == o.y && x < o.x);
        }
        bool operator<=(const SelectionCoordinate &o) const { return !(o < *this); }
    };

    /// Column used for "to the end of the row".
    constexpr std::size_t END_OF_ROW = static_cast<std::size_t>(-1);

    // -----------------------------------------------------------------------------
    // SelectionRange — two inclusive endpoints in any order
    // -----------------------------------------------------------------------------
    struct SelectionRange
    {
        SelectionCoordinate start;
        SelectionCoordinate end;

        static SelectionRange at(SelectionCoordinate coord) { return {coord, coord}; }

        /// Word of the row at `coord`; a word is a run of characters not in
        /// `word_boundary`. On a boundary character the range is that cell.
        static SelectionRange word_around(SelectionCoordinate coord, const Pane &pane,
                                          const std::string &word_boundary);

        /// The whole row of `coord`.
        static SelectionRange line_around(SelectionCoordinate coord);

        /// The semantic zone containing `coord`, or that cell alone.
        static SelectionRange zone_around(SelectionCoordinate coord, const Pane &pane);

        /// Keep the start, move the end to `coord`.
        SelectionRange extend(SelectionCoordinate coord) const { return {start, coord}; }

        /// Smallest range covering both; neither operand is assumed to be the
        /// earlier one.
        SelectionRange extend_with(const SelectionRange &other) const;

        /// Same range with start <= end in reading order.
        SelectionRange normalize() const;

        /// First and one-past-last stable row covered.
        std::pair<StableRowIndex, StableRowIndex> rows() const;

        /// Half-open column range selected on `row`; empty outside rows().
        std::pair<std::size_t, std::size_t> cols_for_row(StableRowIndex row) const;

        bool contains(SelectionCoordinate coord) const;

        bool operator==(const SelectionRange &o) const { return start == o.start && end == o.end; }
        bool operator!=(const SelectionRange &o) const { return !(*this == o); }
    };

    // -----------------------------------------------------------------------------
    // Selection — the state machine
    // -----------------------------------------------------------------------------
    struct Selection
    {
        std::optional<SelectionCoordinate> start;
        std::optional<SelectionRange> range;
        SelectionMode mode = SelectionMode::Cell;

        /// Start selecting at `coord`. Cell mode sets an open anchor with no
        /// range; the other modes resolve the unit around `coord` and anchor
        /// at its start.
        void begin(SelectionMode mode, SelectionCoordinate coord, const Pane &pane,
                   const std::string &word_boundary);

        /// Extend to `coord` in `mode`.
        void extend(SelectionMode mode, SelectionCoordinate coord, const Pane &pane,
                    const std::string &word_boundary);

        void clear()
        {
            start.reset();
            range.reset();
        }

        bool is_empty() const { return !range.has_value(); }

        /// True when any of `rows` falls inside the selected rows.
        bool intersects_rows(const std::vector<StableRowIndex> &rows) const;
    };

    /// Selected text of `pane`: rows trimmed of trailing whitespace, soft
    /// wrapped rows joined directly, hard wrapped rows joined with '\n'.
    std::string selection_text(const Selection &selection, const Pane &pane);

} // namespace termwin
