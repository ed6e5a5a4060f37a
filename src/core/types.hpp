#pragma once

// =============================================================================
// types.hpp — Core data types shared by every termwin module
// =============================================================================
// Identifiers, stable row coordinates, cells and lines, window/terminal sizes
// and the cursor description a pane reports. These are plain value types;
// nothing in here knows about windows, overlays or the multiplexer.
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace termwin
{

    using PaneId = std::size_t;
    using TabId = std::size_t;
    using MuxWindowId = std::size_t;

    /// A row identifier that stays valid while scrollback grows or is trimmed.
    using StableRowIndex = std::int64_t;

    // -----------------------------------------------------------------------------
    // Color — RGBA color used for foreground/background of each cell
    // -----------------------------------------------------------------------------
    struct Color
    {
        uint8_t r, g, b, a;

        constexpr Color() : r(0), g(0), b(0), a(255) {}
        constexpr Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
            : r(r), g(g), b(b), a(a) {}

        bool operator==(const Color &o) const
        {
            return r == o.r && g == o.g && b == o.b && a == o.a;
        }
        bool operator!=(const Color &o) const { return !(*this == o); }

        static constexpr Color white() { return {255, 255, 255}; }
        static constexpr Color black() { return {0, 0, 0}; }
        static constexpr Color default_fg() { return {204, 204, 204}; } // #CCCCCC
        static constexpr Color default_bg() { return {18, 18, 18}; }    // #121212
    };

    // -----------------------------------------------------------------------------
    // Cell — one character position of a line
    // -----------------------------------------------------------------------------
    struct Cell
    {
        char32_t ch = U' ';
        Color fg = Color::default_fg();
        Color bg = Color::default_bg();
        bool bold = false;
        bool italic = false;
        bool underline = false;
        bool wrapped = false; // the line continues on the next row (soft wrap)

        void reset()
        {
            *this = Cell{};
        }
    };

    /// Encode a single codepoint as UTF-8 and append it to `out`.
    void append_utf8(std::string &out, char32_t cp);

    /// Decode one codepoint starting at `i`, advancing `i`. Malformed input
    /// yields U+FFFD and consumes a single byte.
    char32_t next_codepoint(const std::string &s, std::size_t &i);

    // -----------------------------------------------------------------------------
    // Line — a physical row of cells
    // -----------------------------------------------------------------------------
    struct Line
    {
        std::vector<Cell> cells;
        bool dirty = true; // changed since the last paint

        Line() = default;
        explicit Line(std::size_t width) : cells(width) {}

        /// Build a line from UTF-8 text; when `wrapped` the last cell carries
        /// the soft-wrap attribute.
        static Line from_text(const std::string &text, bool wrapped = false);

        /// Text of the half-open column range [col_begin, col_end) as UTF-8.
        /// The end is clamped to the line width.
        std::string columns_as_str(std::size_t col_begin, std::size_t col_end) const;

        /// Whole line as UTF-8 text.
        std::string as_str() const { return columns_as_str(0, cells.size()); }
    };

    /// Remove trailing ASCII whitespace in place.
    void trim_end(std::string &s);

    // -----------------------------------------------------------------------------
    // Semantic zones (prompt / input / output regions of shell output)
    // -----------------------------------------------------------------------------
    enum class SemanticType
    {
        Output,
        Input,
        Prompt,
    };

    struct SemanticZone
    {
        std::size_t start_x = 0;
        StableRowIndex start_y = 0;
        std::size_t end_x = 0;
        StableRowIndex end_y = 0;
        SemanticType semantic_type = SemanticType::Output;
    };

    // -----------------------------------------------------------------------------
    // Cursor
    // -----------------------------------------------------------------------------
    enum class CursorShape
    {
        Default,
        BlinkingBlock,
        SteadyBlock,
        BlinkingUnderline,
        SteadyUnderline,
        BlinkingBar,
        SteadyBar,
    };

    inline bool is_blinking(CursorShape shape)
    {
        return shape == CursorShape::BlinkingBlock ||
               shape == CursorShape::BlinkingUnderline ||
               shape == CursorShape::BlinkingBar;
    }

    /// Resolve `Default` against the configured default style.
    inline CursorShape effective_shape(CursorShape configured, CursorShape reported)
    {
        return reported == CursorShape::Default ? configured : reported;
    }

    struct StableCursorPosition
    {
        std::size_t x = 0;
        StableRowIndex y = 0;
        CursorShape shape = CursorShape::Default;
        bool visible = true;
    };

    // -----------------------------------------------------------------------------
    // Sizes
    // -----------------------------------------------------------------------------

    /// Terminal size as seen by the child process.
    struct PtySize
    {
        uint16_t rows = 24;
        uint16_t cols = 80;
        uint16_t pixel_width = 0;
        uint16_t pixel_height = 0;

        bool operator==(const PtySize &o) const
        {
            return rows == o.rows && cols == o.cols &&
                   pixel_width == o.pixel_width && pixel_height == o.pixel_height;
        }
        bool operator!=(const PtySize &o) const { return !(*this == o); }
    };

    /// Window dimensions and dpi.
    struct Dimensions
    {
        std::size_t pixel_width = 0;
        std::size_t pixel_height = 0;
        std::size_t dpi = 96;

        bool operator==(const Dimensions &o) const
        {
            return pixel_width == o.pixel_width && pixel_height == o.pixel_height &&
                   dpi == o.dpi;
        }
        bool operator!=(const Dimensions &o) const { return !(*this == o); }
    };

    constexpr std::size_t DEFAULT_DPI = 96;

    struct RowsAndCols
    {
        std::size_t rows = 0;
        std::size_t cols = 0;
    };

    /// Scrollback extent of a pane, in stable rows.
    struct RenderableDimensions
    {
        std::size_t cols = 0;
        std::size_t viewport_rows = 0;
        StableRowIndex scrollback_rows = 0;
        /// First row of the live screen.
        StableRowIndex physical_top = 0;
        /// Oldest row still held in scrollback.
        StableRowIndex scrollback_top = 0;

        bool operator==(const RenderableDimensions &o) const
        {
            return cols == o.cols && viewport_rows == o.viewport_rows &&
                   scrollback_rows == o.scrollback_rows &&
                   physical_top == o.physical_top &&
                   scrollback_top == o.scrollback_top;
        }
        bool operator!=(const RenderableDimensions &o) const { return !(*this == o); }
    };

    struct PixelRect
    {
        int x = 0;
        int y = 0;
        int width = 0;
        int height = 0;

        bool operator==(const PixelRect &o) const
        {
            return x == o.x && y == o.y && width == o.width && height == o.height;
        }
    };

} // namespace termwin
