// =============================================================================
// termwin Mux Tests
// =============================================================================
// The in-process multiplexer (windows, tabs, side-by-side panes, release
// bookkeeping), the scrollback line buffer behind every pane, key encoding
// and the key queue of overlay panes.
// =============================================================================

#include "test_support.hpp"

#include "../src/mux/buffer_pane.hpp"
#include "../src/mux/key_encoding.hpp"
#include "../src/mux/local_mux.hpp"
#include "../src/overlay/overlay_pane.hpp"

using namespace termwin;

static PtySize pty(uint16_t rows, uint16_t cols, uint16_t cell_w = 8, uint16_t cell_h = 16)
{
    PtySize size;
    size.rows = rows;
    size.cols = cols;
    size.pixel_width = static_cast<uint16_t>(cols * cell_w);
    size.pixel_height = static_cast<uint16_t>(rows * cell_h);
    return size;
}

static std::string row_text(const Pane &pane, StableRowIndex row)
{
    auto lines = pane.get_lines(row, row + 1);
    if (lines.second.empty() || lines.first != row)
        return "<missing>";
    std::string s = lines.second[0].as_str();
    trim_end(s);
    return s;
}

// ============================================================================
// Section 1: Windows and tabs
// ============================================================================

static void testWindowsAndTabs()
{
    std::cout << "\n===== Windows & Tabs =====\n";

    runTest("spawn_tab registers tab and pane", []()
            {
                LocalMux mux;
                MuxWindowId w = mux.new_window();
                auto tab = mux.spawn_tab(w, "vim", pty(10, 40));
                MuxWindow *window = mux.get_window(w);
                XASSERT(window != nullptr);
                XASSERT_EQ(window->len(), 1u);
                XASSERT(mux.get_active_tab_for_window(w) == tab);
                auto pane = tab->get_active_pane();
                XASSERT_EQ(pane->get_title(), std::string("vim"));
                XASSERT(mux.get_pane(pane->pane_id()) == pane); });

    runTest("spawn_tab on an unknown window throws", []()
            {
                LocalMux mux;
                XASSERT_THROWS(mux.spawn_tab(7, "sh", pty(10, 40)), MuxError); });

    runTest("new tabs become active", []()
            {
                LocalMux mux;
                MuxWindowId w = mux.new_window();
                mux.spawn_tab(w, "a", pty(10, 40));
                auto b = mux.spawn_tab(w, "b", pty(10, 40));
                XASSERT_EQ(mux.get_window(w)->get_active_idx(), 1u);
                XASSERT(mux.get_active_tab_for_window(w) == b); });

    runTest("set_active out of range throws", []()
            {
                LocalMux mux;
                MuxWindowId w = mux.new_window();
                mux.spawn_tab(w, "a", pty(10, 40));
                XASSERT_THROWS(mux.get_window(w)->set_active(3), MuxError); });

    runTest("activation invalidates the window once", []()
            {
                LocalMux mux;
                MuxWindowId w = mux.new_window();
                mux.spawn_tab(w, "a", pty(10, 40));
                mux.spawn_tab(w, "b", pty(10, 40));
                MuxWindow *window = mux.get_window(w);
                window->check_and_reset_invalidated();
                window->set_active(1);
                XASSERT(!window->check_and_reset_invalidated());
                window->set_active(0);
                XASSERT(window->check_and_reset_invalidated());
                XASSERT(!window->check_and_reset_invalidated()); });

    runTest("removing an earlier tab keeps the active one", []()
            {
                LocalMux mux;
                MuxWindowId w = mux.new_window();
                auto a = mux.spawn_tab(w, "a", pty(10, 40));
                mux.spawn_tab(w, "b", pty(10, 40));
                auto c = mux.spawn_tab(w, "c", pty(10, 40));
                mux.remove_tab(a->tab_id());
                MuxWindow *window = mux.get_window(w);
                XASSERT_EQ(window->len(), 2u);
                XASSERT_EQ(window->get_active_idx(), 1u);
                XASSERT(mux.get_active_tab_for_window(w) == c); });

    runTest("remove_tab releases every pane once", []()
            {
                LocalMux mux;
                MuxWindowId w = mux.new_window();
                auto tab = mux.spawn_tab(w, "a", pty(10, 41));
                PaneId first = tab->get_active_pane()->pane_id();
                auto second = mux.split_active_tab(w, "b");
                mux.remove_tab(tab->tab_id());
                mux.remove_tab(tab->tab_id());
                XASSERT_EQ(mux.release_count(first), 1u);
                XASSERT_EQ(mux.release_count(second->pane_id()), 1u);
                XASSERT(second->is_dead());
                XASSERT(!mux.get_pane(first));
                XASSERT(mux.get_window(w)->is_empty()); });

    runTest("insert places a tab at an index", []()
            {
                LocalMux mux;
                MuxWindowId w = mux.new_window();
                auto a = mux.spawn_tab(w, "a", pty(10, 40));
                auto b = mux.spawn_tab(w, "b", pty(10, 40));
                MuxWindow *window = mux.get_window(w);
                auto moved = window->remove_by_idx(1);
                window->insert(0, moved);
                XASSERT(window->get_by_idx(0) == b);
                XASSERT(window->get_by_idx(1) == a);
                XASSERT(!window->get_by_idx(2)); });

    runTest("kill_window releases all panes", []()
            {
                LocalMux mux;
                MuxWindowId w = mux.new_window();
                auto a = mux.spawn_tab(w, "a", pty(10, 40));
                auto b = mux.spawn_tab(w, "b", pty(10, 40));
                PaneId pa = a->get_active_pane()->pane_id();
                PaneId pb = b->get_active_pane()->pane_id();
                mux.kill_window(w);
                XASSERT(mux.get_window(w) == nullptr);
                XASSERT_EQ(mux.release_count(pa), 1u);
                XASSERT_EQ(mux.release_count(pb), 1u);
                XASSERT(!mux.get_active_tab_for_window(w)); });
}

// ============================================================================
// Section 2: Panes in a tab
// ============================================================================

static void testPanes()
{
    std::cout << "\n===== Panes In A Tab =====\n";

    runTest("split lays panes out side by side", []()
            {
                LocalMux mux;
                MuxWindowId w = mux.new_window();
                auto tab = mux.spawn_tab(w, "left", pty(10, 41));
                auto left = std::dynamic_pointer_cast<BufferPane>(tab->get_active_pane());
                auto right = mux.split_active_tab(w, "right");
                XASSERT_EQ(tab->count_panes(), 2u);
                XASSERT(tab->get_active_pane() == right);
                XASSERT_EQ(left->size().cols, 20);
                XASSERT_EQ(right->size().cols, 20);
                XASSERT_EQ(left->size().pixel_width, 160);
                auto panes = tab->iter_panes();
                XASSERT_EQ(panes[1].left, 21u);
                XASSERT(!panes[0].is_active); });

    runTest("set_active_pane picks the pane", []()
            {
                LocalMux mux;
                MuxWindowId w = mux.new_window();
                auto tab = mux.spawn_tab(w, "left", pty(10, 41));
                PaneId left = tab->get_active_pane()->pane_id();
                mux.split_active_tab(w, "right");
                tab->set_active_pane(left);
                XASSERT_EQ(tab->get_active_pane()->pane_id(), left); });

    runTest("resize relays out the panes", []()
            {
                LocalMux mux;
                MuxWindowId w = mux.new_window();
                auto tab = mux.spawn_tab(w, "left", pty(10, 41));
                auto left = std::dynamic_pointer_cast<BufferPane>(tab->get_active_pane());
                auto right = mux.split_active_tab(w, "right");
                tab->resize(pty(12, 61));
                XASSERT_EQ(left->size().cols, 30);
                XASSERT_EQ(right->size().cols, 30);
                XASSERT_EQ(right->size().rows, 12); });

    runTest("zoom shows only the active pane", []()
            {
                LocalMux mux;
                MuxWindowId w = mux.new_window();
                auto tab = std::static_pointer_cast<LocalTab>(mux.spawn_tab(w, "left", pty(10, 41)));
                tab->toggle_zoom();
                XASSERT(!tab->is_zoomed());

                auto right = mux.split_active_tab(w, "right");
                tab->toggle_zoom();
                XASSERT(tab->is_zoomed());
                auto panes = tab->iter_panes();
                XASSERT_EQ(panes.size(), 1u);
                XASSERT(panes[0].is_zoomed);
                XASSERT_EQ(right->size().cols, 41);

                tab->toggle_zoom();
                XASSERT_EQ(tab->iter_panes().size(), 2u);
                XASSERT_EQ(right->size().cols, 20); });

    runTest("removing a pane keeps the tab", []()
            {
                LocalMux mux;
                MuxWindowId w = mux.new_window();
                auto tab = mux.spawn_tab(w, "left", pty(10, 41));
                auto left = std::dynamic_pointer_cast<BufferPane>(tab->get_active_pane());
                auto right = mux.split_active_tab(w, "right");
                mux.remove_pane(right->pane_id());
                XASSERT_EQ(tab->count_panes(), 1u);
                XASSERT(tab->get_active_pane() == left);
                XASSERT_EQ(left->size().cols, 41);
                XASSERT(right->is_dead());
                XASSERT_EQ(mux.release_count(right->pane_id()), 1u); });

    runTest("removing the last pane removes the tab", []()
            {
                LocalMux mux;
                MuxWindowId w = mux.new_window();
                auto tab = mux.spawn_tab(w, "only", pty(10, 40));
                PaneId id = tab->get_active_pane()->pane_id();
                mux.remove_pane(id);
                mux.remove_pane(id);
                XASSERT(mux.get_window(w)->is_empty());
                XASSERT_EQ(mux.release_count(id), 1u); });

    runTest("a busy pane makes the tab prompt", []()
            {
                LocalMux mux;
                MuxWindowId w = mux.new_window();
                auto tab = std::static_pointer_cast<LocalTab>(mux.spawn_tab(w, "sh", pty(10, 40)));
                XASSERT(tab->can_close_without_prompting());
                auto busy = std::make_shared<testing::BusyPane>(mux.allocate_pane_id(), pty(10, 40), "make");
                mux.add_pane(busy);
                tab->split(busy);
                XASSERT(!tab->can_close_without_prompting()); });
}

// ============================================================================
// Section 3: BufferPane
// ============================================================================

static void testBufferPane()
{
    std::cout << "\n===== BufferPane =====\n";

    runTest("print writes at the cursor", []()
            {
                BufferPane pane(1, pty(3, 10), "t");
                pane.print("hello\r\nab\tc");
                XASSERT_EQ(row_text(pane, 0), std::string("hello"));
                XASSERT_EQ(row_text(pane, 1), std::string("ab      c"));
                StableCursorPosition cur = pane.get_cursor_position();
                XASSERT_EQ(cur.x, 9u);
                XASSERT_EQ(cur.y, 1); });

    runTest("long text soft-wraps", []()
            {
                BufferPane pane(1, pty(3, 5), "t");
                pane.print("abcdefg");
                auto lines = pane.get_lines(0, 2).second;
                XASSERT(lines[0].cells.back().wrapped);
                XASSERT(!lines[1].cells.back().wrapped);
                XASSERT_EQ(row_text(pane, 1), std::string("fg"));
                XASSERT_EQ(pane.get_cursor_position().x, 2u); });

    runTest("text exactly filling a row wraps only on the next char", []()
            {
                BufferPane pane(1, pty(3, 5), "t");
                pane.print("abcde");
                XASSERT_EQ(pane.get_cursor_position().y, 0);
                pane.print("\n");
                XASSERT(!pane.get_lines(0, 1).second[0].cells.back().wrapped); });

    runTest("output scrolls into stable scrollback", []()
            {
                BufferPane pane(1, pty(3, 10), "t");
                pane.print("0\n1\n2\n3\n4");
                RenderableDimensions d = pane.get_dimensions();
                XASSERT_EQ(d.scrollback_rows, 5);
                XASSERT_EQ(d.physical_top, 2);
                XASSERT_EQ(d.scrollback_top, 0);
                XASSERT_EQ(row_text(pane, 0), std::string("0"));
                XASSERT_EQ(row_text(pane, 4), std::string("4")); });

    runTest("scrollback is trimmed from the top", []()
            {
                BufferPane pane(1, pty(2, 10), "t", 3);
                for (int i = 0; i < 10; ++i)
                    pane.print(std::to_string(i) + (i < 9 ? "\n" : ""));
                RenderableDimensions d = pane.get_dimensions();
                XASSERT_EQ(d.scrollback_top, 5);
                XASSERT_EQ(d.physical_top, 8);
                XASSERT_EQ(pane.get_lines(0, 6).first, 5);
                XASSERT_EQ(row_text(pane, 5), std::string("5"));
                XASSERT_EQ(row_text(pane, 9), std::string("9")); });

    runTest("clear keeps stable rows increasing", []()
            {
                BufferPane pane(1, pty(3, 10), "t");
                pane.print("a\nb");
                pane.clear();
                RenderableDimensions d = pane.get_dimensions();
                XASSERT_EQ(d.scrollback_top, 3);
                XASSERT_EQ(d.physical_top, 3);
                XASSERT_EQ(pane.get_cursor_position().y, 3);
                XASSERT(pane.get_semantic_zones().empty()); });

    runTest("dirty lines until painted", []()
            {
                BufferPane pane(1, pty(3, 10), "t");
                XASSERT_EQ(pane.get_dirty_lines(0, 10).size(), 3u);
                pane.make_all_lines_clean();
                XASSERT(pane.get_dirty_lines(0, 10).empty());
                pane.print("\nx");
                auto dirty = pane.get_dirty_lines(0, 10);
                XASSERT_EQ(dirty.size(), 1u);
                XASSERT_EQ(dirty[0], 1); });

    runTest("growing pulls history back onto the screen", []()
            {
                BufferPane pane(1, pty(3, 10), "t");
                pane.print("0\n1\n2\n3\n4");
                pane.resize(pty(5, 10));
                XASSERT_EQ(pane.get_dimensions().physical_top, 0);
                XASSERT_EQ(pane.get_cursor_position().y, 4);

                pane.resize(pty(2, 10));
                XASSERT_EQ(pane.get_dimensions().physical_top, 3);
                XASSERT_EQ(pane.get_cursor_position().y, 4); });

    runTest("shrinking drops blank rows below the cursor first", []()
            {
                BufferPane pane(1, pty(5, 10), "t");
                pane.print("a\nb");
                pane.resize(pty(3, 10));
                RenderableDimensions d = pane.get_dimensions();
                XASSERT_EQ(d.physical_top, 0);
                XASSERT_EQ(d.scrollback_rows, 3);
                XASSERT_EQ(pane.get_cursor_position().y, 1); });

    runTest("resizing columns moves the soft-wrap mark", []()
            {
                BufferPane pane(1, pty(3, 5), "t");
                pane.print("abcdefg");
                pane.resize(pty(3, 8));
                auto lines = pane.get_lines(0, 2).second;
                XASSERT_EQ(lines[0].cells.size(), 8u);
                XASSERT(lines[0].cells.back().wrapped);
                XASSERT(!lines[0].cells[4].wrapped); });

    runTest("semantic zones close at the next mark", []()
            {
                BufferPane pane(1, pty(5, 20), "t");
                pane.mark_zone(SemanticType::Prompt);
                pane.print("$ ");
                pane.mark_zone(SemanticType::Input);
                pane.print("ls -l");
                auto zones = pane.get_semantic_zones();
                XASSERT_EQ(zones.size(), 2u);
                XASSERT(zones[0].semantic_type == SemanticType::Prompt);
                XASSERT_EQ(zones[0].end_x, 1u);
                XASSERT_EQ(zones[1].start_x, 2u);
                XASSERT_EQ(zones[1].end_x, 7u); });

    runTest("input accumulates without a handler", []()
            {
                BufferPane pane(1, pty(3, 10), "t");
                pane.key_down(KeyEvent::chr(U'l'));
                pane.key_down(KeyEvent::chr(U's'));
                pane.key_down(KeyEvent::named(KeyCode::Enter));
                pane.send_paste("xy");
                XASSERT_EQ(pane.take_input(), std::string("ls\rxy"));
                XASSERT_EQ(pane.take_input(), std::string()); });

    runTest("input handler receives encoded keys", []()
            {
                BufferPane pane(1, pty(3, 10), "t");
                std::string got;
                pane.set_input_handler([&](const std::string &bytes)
                                       { got += bytes; });
                pane.key_down(KeyEvent::chr(U'c', MOD_CTRL));
                XASSERT_EQ(got, std::string("\x03"));
                XASSERT_EQ(pane.take_input(), std::string()); });

    runTest("killed pane drops input", []()
            {
                BufferPane pane(1, pty(3, 10), "t");
                pane.kill();
                pane.key_down(KeyEvent::chr(U'a'));
                XASSERT(pane.is_dead());
                XASSERT_EQ(pane.take_input(), std::string()); });

    runTest("set_line replaces a row", []()
            {
                BufferPane pane(1, pty(3, 10), "t");
                pane.set_line(1, Line::from_text("replaced"));
                pane.set_line(40, Line::from_text("ignored"));
                XASSERT_EQ(row_text(pane, 1), std::string("replaced")); });
}

// ============================================================================
// Section 4: Key encoding
// ============================================================================

static void testKeyEncoding()
{
    std::cout << "\n===== Key Encoding =====\n";

    runTest("characters and control codes", []()
            {
                XASSERT_EQ(encode_key(KeyEvent::chr(U'a')), std::string("a"));
                XASSERT_EQ(encode_key(KeyEvent::chr(U'a', MOD_CTRL)), std::string("\x01"));
                XASSERT_EQ(encode_key(KeyEvent::chr(U'Z', MOD_CTRL)), std::string("\x1a"));
                XASSERT_EQ(encode_key(KeyEvent::chr(U'[', MOD_CTRL)), std::string("\x1b"));
                XASSERT_EQ(encode_key(KeyEvent::chr(U'x', MOD_ALT)), std::string("\033x"));
                XASSERT_EQ(encode_key(KeyEvent::chr(U'é')), std::string("\xc3\xa9")); });

    runTest("cursor keys carry modifiers", []()
            {
                XASSERT_EQ(encode_key(KeyEvent::named(KeyCode::UpArrow)), std::string("\033[A"));
                XASSERT_EQ(encode_key(KeyEvent::named(KeyCode::UpArrow, MOD_SHIFT)),
                           std::string("\033[1;2A"));
                XASSERT_EQ(encode_key(KeyEvent::named(KeyCode::RightArrow, MOD_CTRL)),
                           std::string("\033[1;5C"));
                XASSERT_EQ(encode_key(KeyEvent::named(KeyCode::LeftArrow, MOD_CTRL | MOD_SHIFT)),
                           std::string("\033[1;6D")); });

    runTest("navigation and editing keys", []()
            {
                XASSERT_EQ(encode_key(KeyEvent::named(KeyCode::Enter)), std::string("\r"));
                XASSERT_EQ(encode_key(KeyEvent::named(KeyCode::Tab, MOD_SHIFT)), std::string("\033[Z"));
                XASSERT_EQ(encode_key(KeyEvent::named(KeyCode::Backspace)), std::string("\x7f"));
                XASSERT_EQ(encode_key(KeyEvent::named(KeyCode::PageUp)), std::string("\033[5~"));
                XASSERT_EQ(encode_key(KeyEvent::named(KeyCode::Delete)), std::string("\033[3~"));
                XASSERT_EQ(encode_key(KeyEvent::named(KeyCode::Unknown)), std::string()); });
}

// ============================================================================
// Section 5: Overlay panes
// ============================================================================

static void testOverlayPane()
{
    std::cout << "\n===== Overlay Panes =====\n";

    runTest("keys are queued in order", []()
            {
                auto pane = std::make_shared<OverlayPane>(1, pty(3, 10), PaneKind::Confirmation, "c");
                pane->key_down(KeyEvent::chr(U'a'));
                pane->key_down(KeyEvent::chr(U'b'));
                XASSERT(pane->wait_key()->ch == U'a');
                XASSERT(pane->wait_key()->ch == U'b');
                XASSERT(pane->take_input().empty()); });

    runTest("kill wakes the reader with nothing", []()
            {
                auto pane = std::make_shared<OverlayPane>(1, pty(3, 10), PaneKind::Launcher, "l");
                pane->kill();
                XASSERT(!pane->wait_key());
                pane->key_down(KeyEvent::chr(U'a'));
                XASSERT(!pane->wait_key()); });

    runTest("render replaces the content", []()
            {
                auto pane = std::make_shared<OverlayPane>(1, pty(3, 10), PaneKind::TabNavigator, "n");
                OverlayTerm term(pane);
                term.render({"one", "two"});
                term.render({"three"});
                StableRowIndex top = pane->get_dimensions().physical_top;
                XASSERT_EQ(row_text(*pane, top), std::string("three"));
                XASSERT_EQ(row_text(*pane, top + 1), std::string());
                XASSERT(!pane->get_cursor_position().visible);
                XASSERT(pane->kind() == PaneKind::TabNavigator); });
}

// ============================================================================
// main
// ============================================================================

int main()
{
    log::set_level(log::Level::Error);
    testWindowsAndTabs();
    testPanes();
    testBufferPane();
    testKeyEncoding();
    testOverlayPane();
    return summarize();
}
