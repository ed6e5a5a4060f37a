#pragma once

// =============================================================================
// test_support.hpp — harness macros and fakes shared by the termwin tests
// =============================================================================
// The fakes stand in for the window system: FakeConnection hands out
// FakeWindowOps, FakeRenderSurface and FakeFontConfiguration and records what
// the core asked of them. Failures can be switched on through the shared
// FakeControls. ManualExecutor keeps overlay tasks until the test runs them,
// so a test queues the keys first and the task never blocks.
// =============================================================================

#include "../src/config/config.hpp"
#include "../src/core/errors.hpp"
#include "../src/core/log.hpp"
#include "../src/mux/local_mux.hpp"
#include "../src/overlay/task_executor.hpp"
#include "../src/window/clipboard.hpp"
#include "../src/window/term_window.hpp"
#include "../src/window/window_ops.hpp"

#include <chrono>
#include <cmath>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

// ---- Minimal test framework ------------------------------------------------

static int g_passed = 0;
static int g_failed = 0;

#define XASSERT(cond)                                                      \
    do                                                                     \
    {                                                                      \
        if (!(cond))                                                       \
        {                                                                  \
            std::ostringstream os;                                         \
            os << "Assertion failed: " #cond " (line " << __LINE__ << ")"; \
            throw std::runtime_error(os.str());                            \
        }                                                                  \
    } while (0)

#define XASSERT_EQ(a, b)                                 \
    do                                                   \
    {                                                    \
        if ((a) != (b))                                  \
        {                                                \
            std::ostringstream os;                       \
            os << "Expected [" << (a) << "] == [" << (b) \
               << "] (line " << __LINE__ << ")";         \
            throw std::runtime_error(os.str());          \
        }                                                \
    } while (0)

#define XASSERT_THROWS(expr, ExType)                                          \
    do                                                                        \
    {                                                                         \
        bool caught_ = false;                                                 \
        try                                                                   \
        {                                                                     \
            expr;                                                             \
        }                                                                     \
        catch (const ExType &)                                                \
        {                                                                     \
            caught_ = true;                                                   \
        }                                                                     \
        if (!caught_)                                                         \
        {                                                                     \
            std::ostringstream os;                                            \
            os << "Expected " #ExType " from " #expr " (line " << __LINE__ << ")"; \
            throw std::runtime_error(os.str());                               \
        }                                                                     \
    } while (0)

static void runTest(const std::string &name, std::function<void()> fn)
{
    try
    {
        fn();
        std::cout << "  PASS: " << name << "\n";
        g_passed++;
    }
    catch (const std::exception &e)
    {
        std::cout << "  FAIL: " << name << "\n        " << e.what() << "\n";
        g_failed++;
    }
}

static int summarize()
{
    std::cout << "\n============================================\n";
    std::cout << "  Total: " << (g_passed + g_failed)
              << "  |  Passed: " << g_passed
              << "  |  Failed: " << g_failed << "\n";
    std::cout << "============================================\n";
    return g_failed == 0 ? 0 : 1;
}

namespace termwin
{
    namespace testing
    {

        // =====================================================================
        // Failure switches
        // =====================================================================

        struct FakeControls
        {
            bool fail_font_metrics = false;
            bool fail_surface_create = false;
            bool fail_advise = false;
            bool fail_atlas = false;
            /// Number of upcoming paints that throw.
            int fail_paints = 0;
        };

        // =====================================================================
        // FakeWindowOps
        // =====================================================================

        class FakeWindowOps : public WindowOps
        {
        public:
            int invalidations = 0;
            bool closed = false;
            bool visible = true;
            int fullscreen_toggles = 0;
            int config_changes = 0;
            std::vector<std::string> titles;
            std::vector<std::pair<std::size_t, std::size_t>> inner_sizes;
            PixelRect text_cursor;

            void invalidate() override { ++invalidations; }
            void close() override { closed = true; }
            void show() override { visible = true; }
            void hide() override { visible = false; }
            void toggle_fullscreen() override { ++fullscreen_toggles; }
            void set_title(const std::string &title) override { titles.push_back(title); }
            void set_inner_size(std::size_t w, std::size_t h) override
            {
                inner_sizes.emplace_back(w, h);
            }
            void set_text_cursor_position(const PixelRect &rect) override { text_cursor = rect; }
            void config_did_change() override { ++config_changes; }

            std::string title() const { return titles.empty() ? std::string() : titles.back(); }
        };

        // =====================================================================
        // FakeRenderSurface
        // =====================================================================

        class FakeRenderSurface : public RenderSurface
        {
        public:
            explicit FakeRenderSurface(std::shared_ptr<FakeControls> controls)
                : controls_(std::move(controls)) {}

            int advises = 0;
            int atlas_rebuilds = 0;
            int cache_clears = 0;
            int paints = 0;
            PaintModel last_model;

            void advise_of_window_size_change(const RenderMetrics &, std::size_t,
                                              std::size_t) override
            {
                if (controls_->fail_advise)
                    throw RenderSurfaceError("resize refused");
                ++advises;
            }

            void recreate_glyph_atlas(const RenderMetrics &) override
            {
                if (controls_->fail_atlas)
                    throw RenderSurfaceError("atlas allocation failed");
                ++atlas_rebuilds;
            }

            void clear_glyph_cache() override { ++cache_clears; }

            void paint(const PaintModel &model) override
            {
                if (controls_->fail_paints > 0)
                {
                    --controls_->fail_paints;
                    throw RenderSurfaceError("glyph atlas is full");
                }
                ++paints;
                last_model = model;
            }

        private:
            std::shared_ptr<FakeControls> controls_;
        };

        // =====================================================================
        // FakeFontConfiguration
        // =====================================================================
        // Cells are 8x16 pixels at scale 1 and 96 dpi, growing with both.

        class FakeFontConfiguration : public FontConfiguration
        {
        public:
            static constexpr double BASE_WIDTH = 8.0;
            static constexpr double BASE_HEIGHT = 16.0;

            explicit FakeFontConfiguration(std::shared_ptr<FakeControls> controls)
                : controls_(std::move(controls)) {}

            int config_changes = 0;

            double get_font_scale() const override { return font_scale_; }
            double get_dpi_scale() const override { return dpi_scale_; }

            std::pair<double, double> change_scaling(double font_scale, double dpi_scale) override
            {
                std::pair<double, double> prior{font_scale_, dpi_scale_};
                font_scale_ = font_scale;
                dpi_scale_ = dpi_scale;
                return prior;
            }

            RenderMetrics metrics() override
            {
                if (controls_->fail_font_metrics)
                    throw FontError("cannot measure font");
                double scale = font_scale_ * dpi_scale_;
                RenderMetrics m;
                m.cell_size.width = static_cast<std::size_t>(std::lround(BASE_WIDTH * scale));
                m.cell_size.height = static_cast<std::size_t>(std::lround(BASE_HEIGHT * scale));
                m.descender = 3;
                m.font_path = "fake.ttf";
                m.pixel_size = static_cast<int>(m.cell_size.height);
                return m;
            }

            void config_changed(const Config &) override { ++config_changes; }

        private:
            std::shared_ptr<FakeControls> controls_;
            double font_scale_ = 1.0;
            double dpi_scale_ = 1.0;
        };

        // =====================================================================
        // FakeConnection
        // =====================================================================

        class FakeConnection : public WindowConnection
        {
        public:
            std::shared_ptr<FakeControls> controls = std::make_shared<FakeControls>();

            struct Created
            {
                std::string window_class;
                std::size_t pixel_width = 0;
                std::size_t pixel_height = 0;
                std::shared_ptr<FakeWindowOps> window;
                std::shared_ptr<WindowCallbacks> callbacks;
            };

            std::vector<Created> windows;
            /// Most recently created surface; owned by the window.
            FakeRenderSurface *surface = nullptr;
            int surfaces_created = 0;

            struct Timer
            {
                std::chrono::milliseconds interval;
                std::function<bool()> tick;
            };
            std::vector<Timer> timers;

            std::shared_ptr<WindowOps> new_window(const std::string &window_class,
                                                  const std::string &,
                                                  std::size_t pixel_width,
                                                  std::size_t pixel_height,
                                                  std::shared_ptr<WindowCallbacks> callbacks) override
            {
                auto window = std::make_shared<FakeWindowOps>();
                windows.push_back({window_class, pixel_width, pixel_height, window,
                                   std::move(callbacks)});
                return window;
            }

            std::unique_ptr<RenderSurface> create_render_surface(WindowOps &,
                                                                 const RenderMetrics &,
                                                                 std::size_t,
                                                                 std::size_t) override
            {
                if (controls->fail_surface_create)
                    throw RenderSurfaceError("no GPU");
                auto s = std::make_unique<FakeRenderSurface>(controls);
                surface = s.get();
                ++surfaces_created;
                return s;
            }

            std::unique_ptr<FontConfiguration> new_font_configuration(const Config &) override
            {
                return std::make_unique<FakeFontConfiguration>(controls);
            }

            void schedule_timer(std::chrono::milliseconds interval,
                                std::function<bool()> tick) override
            {
                timers.push_back({interval, std::move(tick)});
            }

            /// Fire every timer once, dropping those that return false.
            void fire_timers()
            {
                std::vector<Timer> keep;
                std::vector<Timer> current;
                current.swap(timers);
                for (auto &t : current)
                    if (t.tick())
                        keep.push_back(std::move(t));
                for (auto &t : timers)
                    keep.push_back(std::move(t));
                timers.swap(keep);
            }

            FakeWindowOps &window() { return *windows.back().window; }
        };

        // =====================================================================
        // FakeClipboard
        // =====================================================================

        class FakeClipboard : public Clipboard
        {
        public:
            std::map<ClipboardKind, std::string> contents;
            int writes = 0;

            void set_contents(ClipboardKind kind, const std::string &text) override
            {
                contents[kind] = text;
                ++writes;
            }

            void get_contents(ClipboardKind kind, std::function<void(std::string)> done) override
            {
                done(contents[kind]);
            }
        };

        // =====================================================================
        // ManualExecutor
        // =====================================================================

        class ManualExecutor : public TaskExecutor
        {
        public:
            std::vector<std::pair<std::string, std::function<void()>>> tasks;

            void spawn(const std::string &name, std::function<void()> task) override
            {
                tasks.emplace_back(name, std::move(task));
            }

            /// Run everything queued so far; tasks queued while running wait
            /// for the next call.
            void run_all()
            {
                auto current = std::move(tasks);
                tasks.clear();
                for (auto &t : current)
                    run_logged(t.first, t.second);
            }
        };

        // =====================================================================
        // Helpers
        // =====================================================================

        /// A BufferPane that wants confirmation before it is closed.
        class BusyPane : public BufferPane
        {
        public:
            using BufferPane::BufferPane;
            bool can_close_without_prompting() const override { return false; }
        };

        struct FakeClock
        {
            TermWindow::Clock::time_point now = TermWindow::Clock::time_point{} + std::chrono::hours(1);

            void advance(std::chrono::milliseconds ms) { now += ms; }
        };

        inline KeyEvent ctrl_shift(char32_t c) { return KeyEvent::chr(c, MOD_CTRL | MOD_SHIFT); }

        inline MouseEvent mouse(MouseEventKind kind, int x, int y,
                                MouseButton button = MouseButton::Left, bool left_held = false)
        {
            MouseEvent e;
            e.kind = kind;
            e.button = button;
            e.x = x;
            e.y = y;
            e.left_held = left_held;
            return e;
        }

        // =====================================================================
        // WindowFixture — a TermWindow over a LocalMux and the fakes
        // =====================================================================
        // Members are destroyed bottom-up: the window goes before the
        // connection that holds its callbacks, the multiplexer last.

        struct WindowFixture
        {
            LocalMux mux;
            ConfigStore config_store;
            FakeConnection connection;
            ManualExecutor executor;
            FakeClipboard clipboard;
            FakeClock clock;
            MuxWindowId window_id = 0;
            std::shared_ptr<TermWindow> tw;

            explicit WindowFixture(Config config = Config{},
                                   std::vector<std::string> tab_titles = {"shell"},
                                   std::map<std::string, std::string> overrides = {})
            {
                log::set_level(log::Level::Error);
                config_store.publish(std::move(config));
                window_id = mux.new_window();
                for (const auto &title : tab_titles)
                    mux.spawn_tab(window_id, title, PtySize{});
                if (MuxWindow *w = mux.get_window(window_id))
                    if (!w->is_empty())
                        w->set_active(0);

                TermWindow::Services services{mux, config_store, connection, executor, clipboard};
                FakeClock *c = &clock;
                services.now = [c]
                { return c->now; };
                tw = TermWindow::new_window(window_id, services, std::move(overrides));
            }

            ~WindowFixture()
            {
                // The connection's copy of the callbacks would otherwise keep
                // the window alive past the multiplexer.
                tw.reset();
                for (auto &w : connection.windows)
                    w.callbacks.reset();
            }

            WindowFixture(const WindowFixture &) = delete;
            WindowFixture &operator=(const WindowFixture &) = delete;

            FakeWindowOps &window() { return connection.window(); }
            FakeRenderSurface &surface() { return *connection.surface; }

            std::shared_ptr<Tab> active_tab() { return mux.get_active_tab_for_window(window_id); }

            std::shared_ptr<BufferPane> active_pane()
            {
                auto tab = active_tab();
                return tab ? std::dynamic_pointer_cast<BufferPane>(tab->get_active_pane()) : nullptr;
            }

            MuxWindow &mux_window() { return *mux.get_window(window_id); }

            /// Send keys, run queued overlay tasks and apply what they queued.
            void type(const std::vector<KeyEvent> &keys)
            {
                for (const auto &k : keys)
                    tw->key_event(k);
                executor.run_all();
                tw->drain_pending();
            }

            /// Pixel position of the middle of cell (col, row) of the terminal
            /// area.
            std::pair<int, int> cell_center(std::size_t col, std::size_t row) const
            {
                const RenderMetrics &m = tw->render_metrics();
                const Config &c = tw->config();
                int x = static_cast<int>(c.window_padding.left + col * m.cell_size.width +
                                         m.cell_size.width / 2);
                std::size_t tab_rows = tw->show_tab_bar() ? 1 : 0;
                int y = static_cast<int>(c.window_padding.top + (row + tab_rows) * m.cell_size.height +
                                         m.cell_size.height / 2);
                return {x, y};
            }
        };

    } // namespace testing
} // namespace termwin
