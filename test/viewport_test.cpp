// =============================================================================
// termwin Viewport Tests
// =============================================================================
// Clamping, the live-screen convention, line/page/prompt scrolling and
// keeping a row in view, against a BufferPane with real scrollback.
// =============================================================================

#include "test_support.hpp"

#include "../src/window/viewport.hpp"

#include <algorithm>

using namespace termwin;

// Pane with five screen rows showing "0".."19": rows 0-14 are history,
// physical_top is 15. Prompts are marked on rows 2, 8 and 13.
static std::shared_ptr<BufferPane> scrolled_pane(LocalMux &mux)
{
    PtySize size;
    size.rows = 5;
    size.cols = 10;
    auto pane = std::make_shared<BufferPane>(mux.allocate_pane_id(), size, "scrolled");
    const std::vector<int> prompts = {2, 8, 13};
    for (int i = 0; i < 20; ++i)
    {
        if (std::find(prompts.begin(), prompts.end(), i) != prompts.end())
            pane->mark_zone(SemanticType::Prompt);
        pane->print(std::to_string(i));
        if (i < 19)
            pane->print("\n");
    }
    mux.add_pane(pane);
    return pane;
}

/// A viewport-aware overlay that records what it was told.
class RecordingOverlay : public BufferPane
{
public:
    using BufferPane::BufferPane;

    PaneKind kind() const override { return PaneKind::Search; }
    void viewport_changed(std::optional<StableRowIndex> viewport) override
    {
        seen.push_back(viewport);
    }

    std::vector<std::optional<StableRowIndex>> seen;
};

struct ViewportFixture
{
    LocalMux mux;
    OverlayRegistry registry{mux};
    int invalidations = 0;
    ViewportController viewport{registry, [this]
                                { ++invalidations; }};
    std::shared_ptr<BufferPane> pane = scrolled_pane(mux);
    PaneId id = pane->pane_id();

    RenderableDimensions dims() const { return pane->get_dimensions(); }
};

// ============================================================================
// Section 1: set_viewport
// ============================================================================

static void testSetViewport()
{
    std::cout << "\n===== set_viewport =====\n";

    runTest("scrollback layout is as expected", []()
            {
                ViewportFixture f;
                XASSERT_EQ(f.dims().physical_top, 15);
                XASSERT_EQ(f.dims().scrollback_top, 0);
                XASSERT_EQ(f.dims().scrollback_rows, 20); });

    runTest("storing a position invalidates once", []()
            {
                ViewportFixture f;
                XASSERT(f.viewport.set_viewport(f.id, 5, f.dims()));
                XASSERT_EQ(*f.viewport.get_viewport(f.id), 5);
                XASSERT_EQ(f.invalidations, 1);
                XASSERT(!f.viewport.set_viewport(f.id, 5, f.dims()));
                XASSERT_EQ(f.invalidations, 1); });

    runTest("positions above history clamp to the oldest row", []()
            {
                ViewportFixture f;
                f.viewport.set_viewport(f.id, -30, f.dims());
                XASSERT_EQ(*f.viewport.get_viewport(f.id), 0); });

    runTest("positions at or past the live screen mean live", []()
            {
                ViewportFixture f;
                f.viewport.set_viewport(f.id, 3, f.dims());
                f.viewport.set_viewport(f.id, 15, f.dims());
                XASSERT(!f.viewport.get_viewport(f.id));
                f.viewport.set_viewport(f.id, 3, f.dims());
                f.viewport.set_viewport(f.id, 400, f.dims());
                XASSERT(!f.viewport.get_viewport(f.id)); });

    runTest("without scrollback every position is live", []()
            {
                LocalMux mux;
                OverlayRegistry registry(mux);
                ViewportController viewport(registry, [] {});
                RenderableDimensions d;
                d.viewport_rows = 5;
                XASSERT(!viewport.set_viewport(7, -1, d));
                XASSERT(!viewport.get_viewport(7)); });

    runTest("viewport-aware overlay follows changes", []()
            {
                ViewportFixture f;
                auto overlay = std::make_shared<RecordingOverlay>(f.mux.allocate_pane_id(),
                                                                  PtySize{}, "search");
                f.mux.add_pane(overlay);
                f.registry.assign_pane_overlay(f.id, overlay);

                f.viewport.set_viewport(f.id, 4, f.dims());
                f.viewport.set_viewport(f.id, 4, f.dims());
                f.viewport.scroll_to_bottom(f.id);
                XASSERT_EQ(overlay->seen.size(), 2u);
                XASSERT_EQ(*overlay->seen[0], 4);
                XASSERT(!overlay->seen[1]); });
}

// ============================================================================
// Section 2: Scrolling
// ============================================================================

static void testScrolling()
{
    std::cout << "\n===== Scrolling =====\n";

    runTest("scroll by line and page from the live screen", []()
            {
                ViewportFixture f;
                f.viewport.scroll_by_line(f.id, *f.pane, -3);
                XASSERT_EQ(*f.viewport.get_viewport(f.id), 12);
                f.viewport.scroll_by_page(f.id, *f.pane, -1);
                XASSERT_EQ(*f.viewport.get_viewport(f.id), 7);
                f.viewport.scroll_by_page(f.id, *f.pane, -5);
                XASSERT_EQ(*f.viewport.get_viewport(f.id), 0);
                f.viewport.scroll_by_page(f.id, *f.pane, 5);
                XASSERT(!f.viewport.get_viewport(f.id)); });

    runTest("scroll_to_bottom returns to live", []()
            {
                ViewportFixture f;
                f.viewport.scroll_by_line(f.id, *f.pane, -1);
                f.viewport.scroll_to_bottom(f.id);
                XASSERT(!f.viewport.get_viewport(f.id)); });

    runTest("scroll_to_prompt walks prompts", []()
            {
                ViewportFixture f;
                f.viewport.scroll_to_prompt(f.id, *f.pane, -1);
                XASSERT_EQ(*f.viewport.get_viewport(f.id), 13);
                f.viewport.scroll_to_prompt(f.id, *f.pane, -1);
                XASSERT_EQ(*f.viewport.get_viewport(f.id), 8);
                f.viewport.scroll_to_prompt(f.id, *f.pane, 1);
                XASSERT_EQ(*f.viewport.get_viewport(f.id), 13); });

    runTest("scroll_to_prompt past the last prompt stays put", []()
            {
                ViewportFixture f;
                f.viewport.set_viewport(f.id, 13, f.dims());
                f.viewport.scroll_to_prompt(f.id, *f.pane, 1);
                XASSERT_EQ(*f.viewport.get_viewport(f.id), 13); });

    runTest("scroll_to_prompt clamps at the first prompt", []()
            {
                ViewportFixture f;
                f.viewport.set_viewport(f.id, 13, f.dims());
                f.viewport.scroll_to_prompt(f.id, *f.pane, -5);
                XASSERT_EQ(*f.viewport.get_viewport(f.id), 2); });
}

// ============================================================================
// Section 3: keep_row_visible
// ============================================================================

static void testKeepRowVisible()
{
    std::cout << "\n===== keep_row_visible =====\n";

    runTest("row near the top scrolls up by the gap", []()
            {
                ViewportFixture f;
                f.viewport.keep_row_visible(f.id, 15, f.dims(), 2);
                XASSERT_EQ(*f.viewport.get_viewport(f.id), 13); });

    runTest("row above the view scrolls to it", []()
            {
                ViewportFixture f;
                f.viewport.keep_row_visible(f.id, 14, f.dims(), 2);
                XASSERT_EQ(*f.viewport.get_viewport(f.id), 12); });

    runTest("row near the bottom scrolls down", []()
            {
                ViewportFixture f;
                f.viewport.set_viewport(f.id, 5, f.dims());
                f.viewport.keep_row_visible(f.id, 9, f.dims(), 2);
                XASSERT_EQ(*f.viewport.get_viewport(f.id), 6); });

    runTest("scrolling down past history returns to live", []()
            {
                ViewportFixture f;
                f.viewport.set_viewport(f.id, 13, f.dims());
                f.viewport.keep_row_visible(f.id, 19, f.dims(), 2);
                XASSERT(!f.viewport.get_viewport(f.id)); });

    runTest("row comfortably inside leaves the view alone", []()
            {
                ViewportFixture f;
                f.viewport.set_viewport(f.id, 5, f.dims());
                int before = f.invalidations;
                f.viewport.keep_row_visible(f.id, 7, f.dims(), 2);
                XASSERT_EQ(*f.viewport.get_viewport(f.id), 5);
                XASSERT_EQ(f.invalidations, before); });

    runTest("gap shrinks to one row with little scrollback", []()
            {
                LocalMux mux;
                OverlayRegistry registry(mux);
                ViewportController viewport(registry, [] {});
                RenderableDimensions d;
                d.viewport_rows = 5;
                d.scrollback_rows = 7;
                d.physical_top = 2;
                viewport.keep_row_visible(1, 2, d, 5);
                XASSERT_EQ(*viewport.get_viewport(1), 1); });
}

// ============================================================================
// main
// ============================================================================

int main()
{
    log::set_level(log::Level::Error);
    testSetViewport();
    testScrolling();
    testKeepRowVisible();
    return summarize();
}
