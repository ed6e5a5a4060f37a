// =============================================================================
// termwin Geometry Tests
// =============================================================================
// Pixel <-> cell mapping in both directions, the degenerate font guard,
// scroll bar padding, tab bar visibility and layout, and the scroll thumb.
// =============================================================================

#include "test_support.hpp"

#include "../src/window/geometry.hpp"
#include "../src/window/scroll_bar.hpp"
#include "../src/window/tab_bar.hpp"

using namespace termwin;

static RenderMetrics metrics(std::size_t w, std::size_t h)
{
    RenderMetrics m;
    m.cell_size = {w, h};
    return m;
}

// ============================================================================
// Section 1: Font height
// ============================================================================

static void testFontHeight()
{
    std::cout << "\n===== Font Height =====\n";

    runTest("12pt at 96 dpi is 16px", []()
            { XASSERT(std::abs(theoretical_font_height(12.0, 1.0, 96) - 16.0) < 1e-9); });

    runTest("font scale multiplies the height", []()
            { XASSERT(std::abs(theoretical_font_height(12.0, 2.0, 96) - 32.0) < 1e-9); });

    runTest("tiny scale is degenerate", []()
            {
                XASSERT(is_degenerate_scale(12.0, 0.1, 96));
                XASSERT(!is_degenerate_scale(12.0, 0.2, 96)); });

    runTest("zero dpi is degenerate", []()
            { XASSERT(is_degenerate_scale(12.0, 1.0, 0)); });
}

// ============================================================================
// Section 2: Padding and tab bar visibility
// ============================================================================

static void testPaddingAndTabBar()
{
    std::cout << "\n===== Padding & Tab Bar Visibility =====\n";

    runTest("right padding is configured value without scroll bar", []()
            {
                Config c;
                c.window_padding.right = 5;
                XASSERT_EQ(effective_right_padding(c, metrics(8, 16)), 5u); });

    runTest("scroll bar reserves one cell when right padding is zero", []()
            {
                Config c;
                c.enable_scroll_bar = true;
                XASSERT_EQ(effective_right_padding(c, metrics(9, 18)), 9u); });

    runTest("explicit right padding wins over the scroll bar cell", []()
            {
                Config c;
                c.enable_scroll_bar = true;
                c.window_padding.right = 3;
                XASSERT_EQ(effective_right_padding(c, metrics(9, 18)), 3u); });

    runTest("tab bar shown for a single tab by default", []()
            {
                Config c;
                XASSERT(tab_bar_visible(c, 1)); });

    runTest("hide_tab_bar_if_only_one_tab hides it for one tab only", []()
            {
                Config c;
                c.hide_tab_bar_if_only_one_tab = true;
                XASSERT(!tab_bar_visible(c, 1));
                XASSERT(tab_bar_visible(c, 2)); });

    runTest("disabled tab bar never shows", []()
            {
                Config c;
                c.enable_tab_bar = false;
                XASSERT(!tab_bar_visible(c, 5)); });
}

// ============================================================================
// Section 3: Scale-preserving and window-driven geometry
// ============================================================================

static void testGeometry()
{
    std::cout << "\n===== Geometry =====\n";

    runTest("scale-preserving adds tab bar row and padding", []()
            {
                Config c;
                c.window_padding = {2, 4, 6, 8};
                Geometry g = scale_preserving_geometry({24, 80}, 96, metrics(8, 16), c, true);
                XASSERT_EQ(g.dimensions.pixel_width, 80u * 8 + 2 + 4);
                XASSERT_EQ(g.dimensions.pixel_height, 25u * 16 + 6 + 8);
                XASSERT_EQ(g.dimensions.dpi, 96u);
                XASSERT_EQ(g.terminal_size.rows, 24);
                XASSERT_EQ(g.terminal_size.cols, 80);
                XASSERT_EQ(g.terminal_size.pixel_width, 640);
                XASSERT_EQ(g.terminal_size.pixel_height, 384); });

    runTest("window-driven subtracts tab bar row", []()
            {
                Config c;
                Dimensions d{800, 416, 96};
                Geometry g = window_driven_geometry(d, metrics(8, 16), c, true);
                XASSERT_EQ(g.terminal_size.rows, 25);
                XASSERT_EQ(g.terminal_size.cols, 100);
                XASSERT(g.dimensions == d); });

    runTest("window-driven inverts scale-preserving", []()
            {
                Config c;
                c.window_padding = {3, 0, 5, 7};
                c.enable_scroll_bar = true;
                RenderMetrics m = metrics(9, 19);
                for (bool tab_bar : {false, true})
                {
                    Geometry there = scale_preserving_geometry({37, 113}, 144, m, c, tab_bar);
                    Geometry back = window_driven_geometry(there.dimensions, m, c, tab_bar);
                    XASSERT_EQ(back.terminal_size.rows, 37);
                    XASSERT_EQ(back.terminal_size.cols, 113);
                } });

    runTest("tiny window saturates at zero", []()
            {
                Config c;
                c.window_padding = {10, 10, 10, 10};
                Geometry g = window_driven_geometry({5, 5, 96}, metrics(8, 16), c, true);
                XASSERT_EQ(g.terminal_size.rows, 0);
                XASSERT_EQ(g.terminal_size.cols, 0);
                XASSERT_EQ(g.terminal_size.pixel_width, 0); });

    runTest("text cursor rect sits below the tab bar", []()
            {
                Config c;
                c.window_padding.left = 4;
                StableCursorPosition cur;
                cur.x = 3;
                cur.y = 102;
                PixelRect r = text_cursor_rect(cur, 100, metrics(8, 16), c, true);
                XASSERT_EQ(r.x, 3 * 8 + 4);
                XASSERT_EQ(r.y, 3 * 16);
                XASSERT_EQ(r.width, 8);
                XASSERT_EQ(r.height, 16); });
}

// ============================================================================
// Section 4: Tab bar layout
// ============================================================================

static void testTabBarLayout()
{
    std::cout << "\n===== Tab Bar Layout =====\n";

    runTest("labels are numbered and padded", []()
            {
                TabBarState s = TabBarState::compute({"bash", "vim"}, 1, 80);
                XASSERT_EQ(s.tabs.size(), 2u);
                XASSERT_EQ(s.tabs[0].width, TabBarState::MAX_TAB_WIDTH);
                XASSERT_EQ(s.tabs[0].label.substr(0, 9), std::string(" 1: bash "));
                XASSERT(!s.tabs[0].active);
                XASSERT(s.tabs[1].active);
                XASSERT_EQ(s.tabs[1].start_col, 24u); });

    runTest("narrow window shares the columns", []()
            {
                TabBarState s = TabBarState::compute({"a", "b", "c", "d"}, 0, 20);
                XASSERT_EQ(s.tabs[0].width, 5u);
                XASSERT_EQ(s.tabs[3].start_col, 15u); });

    runTest("tab_at_column finds the tab under a column", []()
            {
                TabBarState s = TabBarState::compute({"a", "b"}, 0, 80);
                XASSERT_EQ(*s.tab_at_column(0), 0u);
                XASSERT_EQ(*s.tab_at_column(30), 1u);
                XASSERT(!s.tab_at_column(60)); });
}

// ============================================================================
// Section 5: Scroll thumb
// ============================================================================

static void testScrollThumb()
{
    std::cout << "\n===== Scroll Thumb =====\n";

    RenderableDimensions dims;
    dims.cols = 80;
    dims.viewport_rows = 24;
    dims.scrollback_rows = 240;
    dims.scrollback_top = 0;
    dims.physical_top = 216;

    runTest("live view puts the thumb at the bottom", [dims]()
            {
                ScrollThumb t = scroll_thumb(dims, std::nullopt, 480);
                XASSERT_EQ(t.height, 48u);
                XASSERT_EQ(t.top, 480u - 48u); });

    runTest("oldest row puts the thumb at the top", [dims]()
            {
                ScrollThumb t = scroll_thumb(dims, 0, 480);
                XASSERT_EQ(t.top, 0u); });

    runTest("thumb never shrinks below the minimum", []()
            {
                RenderableDimensions d;
                d.viewport_rows = 10;
                d.scrollback_rows = 10000;
                d.physical_top = 9990;
                ScrollThumb t = scroll_thumb(d, std::nullopt, 200);
                XASSERT_EQ(t.height, MIN_THUMB_HEIGHT); });

    runTest("track position maps back to a viewport row", [dims]()
            {
                XASSERT_EQ(viewport_for_track_position(dims, 0, 480), 0);
                XASSERT_EQ(viewport_for_track_position(dims, 240, 480), 108);
                XASSERT_EQ(viewport_for_track_position(dims, 9999, 480), 216); });

    runTest("no scrollback maps to the live screen", []()
            {
                RenderableDimensions d;
                d.viewport_rows = 24;
                d.scrollback_rows = 24;
                XASSERT_EQ(viewport_for_track_position(d, 100, 480), 0); });
}

// ============================================================================
// main
// ============================================================================

int main()
{
    testFontHeight();
    testPaddingAndTabBar();
    testGeometry();
    testTabBarLayout();
    testScrollThumb();
    return summarize();
}
