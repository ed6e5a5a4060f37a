// =============================================================================
// termwin Maintenance Tests
// =============================================================================
// The periodic tick: repaint requests, selection invalidation, cursor blink,
// config reload and closing a window whose panes are gone. The tick is driven
// through FakeConnection::fire_timers, the way the window system runs it.
// =============================================================================

#include "test_support.hpp"

#include <filesystem>
#include <fstream>

using namespace termwin;
using namespace termwin::testing;

/// Paint and tick once so nothing is left dirty; returns the invalidation
/// count afterwards.
static int settle(WindowFixture &f)
{
    f.tw->paint();
    f.connection.fire_timers();
    return f.window().invalidations;
}

// ============================================================================
// Section 1: Repaint requests
// ============================================================================

static void testInvalidation()
{
    std::cout << "\n===== Invalidation =====\n";

    runTest("quiet window is not repainted", []()
            {
                WindowFixture f;
                int before = settle(f);
                f.connection.fire_timers();
                f.connection.fire_timers();
                XASSERT_EQ(f.window().invalidations, before); });

    runTest("output in the viewport requests a paint", []()
            {
                WindowFixture f;
                int before = settle(f);
                f.active_pane()->print("x");
                f.connection.fire_timers();
                XASSERT(f.window().invalidations > before); });

    runTest("output above the viewport does not", []()
            {
                WindowFixture f;
                auto pane = f.active_pane();
                for (int i = 0; i < 60; ++i)
                    pane->print("row\n");
                f.tw->scroll_by_line(-30);
                int before = settle(f);

                // The live screen moved, the viewport did not.
                pane->set_line(59, Line());
                f.connection.fire_timers();
                XASSERT_EQ(f.window().invalidations, before); });

    runTest("multiplexer invalidation requests a paint", []()
            {
                WindowFixture f;
                int before = settle(f);
                f.mux_window().invalidate();
                f.connection.fire_timers();
                XASSERT(f.window().invalidations > before);
                int after = f.window().invalidations;
                f.connection.fire_timers();
                XASSERT_EQ(f.window().invalidations, after); });

    runTest("scroll bar follows new output", []()
            {
                Config c;
                c.enable_scroll_bar = true;
                WindowFixture f(c);
                int before = settle(f);
                for (int i = 0; i < 30; ++i)
                    f.active_pane()->print("row\n");
                f.tw->paint();
                f.connection.fire_timers();
                XASSERT(f.window().invalidations > before); });

    runTest("tick applies queued mutations", []()
            {
                WindowFixture f;
                bool ran = false;
                XASSERT(f.tw->handle().apply([&ran](TermWindow &)
                                             { ran = true; }));
                XASSERT(!ran);
                f.connection.fire_timers();
                XASSERT(ran); });

    runTest("a failing mutation does not stop the others", []()
            {
                WindowFixture f;
                int ran = 0;
                f.tw->handle().apply([](TermWindow &)
                                     { throw MuxError("gone"); });
                f.tw->handle().apply([&ran](TermWindow &)
                                     { ++ran; });
                f.connection.fire_timers();
                XASSERT_EQ(ran, 1); });

    runTest("handle outlives the window", []()
            {
                WindowFixture f;
                WindowHandle handle = f.tw->handle();
                f.tw.reset();
                for (auto &w : f.connection.windows)
                    w.callbacks.reset();
                XASSERT(!handle.apply([](TermWindow &) {})); });
}

// ============================================================================
// Section 2: Selection invalidation
// ============================================================================

static void testSelection()
{
    std::cout << "\n===== Selection Invalidation =====\n";

    runTest("output under the selection clears it", []()
            {
                WindowFixture f;
                auto pane = f.active_pane();
                pane->print("hello");
                settle(f);
                f.tw->selection(pane->pane_id()).range = SelectionRange{{0, 0}, {4, 0}};
                pane->print("!");
                f.connection.fire_timers();
                XASSERT(f.tw->selection(pane->pane_id()).is_empty()); });

    runTest("output elsewhere keeps it", []()
            {
                WindowFixture f;
                auto pane = f.active_pane();
                pane->print("hello\n\n\n\n\nworld");
                settle(f);
                f.tw->selection(pane->pane_id()).range = SelectionRange{{0, 0}, {4, 0}};
                pane->print("!");
                f.connection.fire_timers();
                XASSERT(!f.tw->selection(pane->pane_id()).is_empty()); });

    runTest("search keeps the match it selected", []()
            {
                WindowFixture f;
                auto pane = f.active_pane();
                pane->print("foo bar foo");
                settle(f);
                f.type({ctrl_shift(U'f'), KeyEvent::chr(U'b')});
                XASSERT(!f.tw->selection(pane->pane_id()).is_empty());
                f.connection.fire_timers();
                XASSERT(!f.tw->selection(pane->pane_id()).is_empty()); });
}

// ============================================================================
// Section 3: Cursor blink
// ============================================================================

static void testBlink()
{
    std::cout << "\n===== Cursor Blink =====\n";

    runTest("blinking cursor repaints each interval", []()
            {
                Config c;
                c.default_cursor_style = CursorShape::BlinkingBlock;
                WindowFixture f(c);
                settle(f);
                f.tw->focus_change(true);
                int before = f.window().invalidations;

                f.clock.advance(std::chrono::milliseconds(400));
                f.connection.fire_timers();
                XASSERT_EQ(f.window().invalidations, before);

                f.clock.advance(std::chrono::milliseconds(500));
                f.connection.fire_timers();
                XASSERT_EQ(f.window().invalidations, before + 1);

                f.connection.fire_timers();
                XASSERT_EQ(f.window().invalidations, before + 1); });

    runTest("unfocused window does not blink", []()
            {
                Config c;
                c.default_cursor_style = CursorShape::BlinkingBlock;
                WindowFixture f(c);
                int before = settle(f);
                f.clock.advance(std::chrono::milliseconds(2000));
                f.connection.fire_timers();
                XASSERT_EQ(f.window().invalidations, before); });

    runTest("pane cursor shape overrides the default", []()
            {
                WindowFixture f;
                f.active_pane()->set_cursor_shape(CursorShape::BlinkingBar);
                settle(f);
                f.tw->focus_change(true);
                int before = f.window().invalidations;
                f.clock.advance(std::chrono::milliseconds(900));
                f.connection.fire_timers();
                XASSERT_EQ(f.window().invalidations, before + 1); });

    runTest("zero blink rate disables blinking", []()
            {
                Config c;
                c.default_cursor_style = CursorShape::BlinkingBlock;
                c.cursor_blink_rate = 0;
                WindowFixture f(c);
                settle(f);
                f.tw->focus_change(true);
                int before = f.window().invalidations;
                f.clock.advance(std::chrono::milliseconds(5000));
                f.connection.fire_timers();
                XASSERT_EQ(f.window().invalidations, before); });
}

// ============================================================================
// Section 4: Config reload
// ============================================================================

static void testConfigReload()
{
    std::cout << "\n===== Config Reload =====\n";

    runTest("published config reaches the window on the next tick", []()
            {
                WindowFixture f;
                Config c;
                c.enable_scroll_bar = true;
                f.config_store.publish(c);
                XASSERT(!f.tw->show_scroll_bar());

                f.connection.fire_timers();
                XASSERT(f.tw->show_scroll_bar());
                XASSERT_EQ(f.window().config_changes, 1);
                XASSERT_EQ(f.tw->terminal_size().cols, 80);
                XASSERT(!f.window().inner_sizes.empty());
                XASSERT_EQ(f.window().inner_sizes.back().first, 648u);
                XASSERT_EQ(f.window().inner_sizes.back().second, 400u); });

    runTest("same generation is not reapplied", []()
            {
                WindowFixture f;
                f.config_store.publish(Config{});
                f.connection.fire_timers();
                f.connection.fire_timers();
                XASSERT_EQ(f.window().config_changes, 1); });

    runTest("key bindings are rebuilt", []()
            {
                WindowFixture f;
                XASSERT(f.tw->input_map().size() > 0);
                f.config_store.publish(parse_config("disable_default_key_bindings = true\n"));
                f.connection.fire_timers();
                XASSERT_EQ(f.tw->input_map().size(), 0u);

                // CTRL|SHIFT+c now goes to the pane.
                f.tw->key_event(ctrl_shift(U'c'));
                XASSERT(!f.active_pane()->take_input().empty()); });

    runTest("tab bar can be turned off", []()
            {
                WindowFixture f;
                Config c;
                c.enable_tab_bar = false;
                f.config_store.publish(c);
                f.connection.fire_timers();
                XASSERT(!f.tw->show_tab_bar());
                XASSERT_EQ(f.tw->terminal_size().rows, 24);
                XASSERT(!f.window().inner_sizes.empty());
                XASSERT_EQ(f.window().inner_sizes.back().second, 384u); });

    runTest("window overrides survive a reload", []()
            {
                WindowFixture f(Config{}, {"shell"}, {{"enable_scroll_bar", "true"}});
                XASSERT(f.tw->show_scroll_bar());
                f.config_store.publish(Config{});
                f.connection.fire_timers();
                XASSERT(f.tw->show_scroll_bar());
                XASSERT_EQ(f.tw->config().initial_cols, 80u); });

    runTest("palette follows the new colors", []()
            {
                WindowFixture f;
                Config c = parse_config("foreground = #112233\n");
                f.config_store.publish(c);
                f.connection.fire_timers();
                XASSERT(f.tw->palette().foreground == c.colors.foreground); });

    runTest("reload key reads the rc file again", []()
            {
                auto path = std::filesystem::temp_directory_path() / "termwin_maintenance_test.rc";
                {
                    std::ofstream out(path);
                    out << "enable_scroll_bar = false\n";
                }
                LocalMux mux;
                ConfigStore store(path);
                FakeConnection connection;
                ManualExecutor executor;
                FakeClipboard clipboard;
                MuxWindowId id = mux.new_window();
                mux.spawn_tab(id, "shell", PtySize{});
                mux.get_window(id)->set_active(0);
                TermWindow::Services services{mux, store, connection, executor, clipboard};
                auto tw = TermWindow::new_window(id, services);
                XASSERT(!tw->show_scroll_bar());

                {
                    std::ofstream out(path);
                    out << "enable_scroll_bar = true\n";
                }
                tw->key_event(ctrl_shift(U'r'));
                connection.fire_timers();
                XASSERT(tw->show_scroll_bar());

                tw.reset();
                for (auto &w : connection.windows)
                    w.callbacks.reset();
                std::filesystem::remove(path); });
}

// ============================================================================
// Section 5: Closing
// ============================================================================

static void testClose()
{
    std::cout << "\n===== Closing =====\n";

    runTest("window closes once its panes are gone", []()
            {
                WindowFixture f;
                f.mux.kill_window(f.window_id);
                f.connection.fire_timers();
                XASSERT(f.tw->is_closed());
                XASSERT(f.window().closed);
                XASSERT(f.connection.timers.empty()); });

    runTest("closing the last tab closes the window", []()
            {
                WindowFixture f;
                f.tw->close_current_tab(false);
                XASSERT(!f.tw->is_closed());
                f.connection.fire_timers();
                XASSERT(f.tw->is_closed());
                XASSERT(f.window().closed); });

    runTest("timer stops once the window is gone", []()
            {
                WindowFixture f;
                f.tw.reset();
                for (auto &w : f.connection.windows)
                    w.callbacks.reset();
                f.connection.fire_timers();
                XASSERT(f.connection.timers.empty()); });
}

// ============================================================================
// main
// ============================================================================

int main()
{
    log::set_level(log::Level::Error);
    testInvalidation();
    testSelection();
    testBlink();
    testConfigReload();
    testClose();
    return summarize();
}
