// =============================================================================
// main.cpp — termwin entry point
// =============================================================================
// Opens one window onto an in-process multiplexer whose first pane shows a
// text file (or stdin with "-"). Typed text is echoed into the pane. The
// launcher and tab commands work as usual; new tabs start empty.
//
//   termwin [FILE | -]
// =============================================================================

#include "../config/config.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"
#include "../mux/local_mux.hpp"
#include "../overlay/task_executor.hpp"
#include "../window/term_window.hpp"
#include "sdl_clipboard.hpp"
#include "sdl_connection.hpp"

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <map>
#include <optional>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace
{

    /// SDL and SDL_ttf for the lifetime of the program.
    class SdlSession
    {
    public:
        SdlSession()
        {
            if (SDL_Init(SDL_INIT_VIDEO | SDL_INIT_TIMER) != 0)
                throw termwin::WindowError("SdlError", std::string("SDL_Init: ") + SDL_GetError());
            if (TTF_Init() != 0)
            {
                std::string error = TTF_GetError();
                SDL_Quit();
                throw termwin::FontError("TTF_Init: " + error);
            }
        }

        ~SdlSession()
        {
            TTF_Quit();
            SDL_Quit();
        }

        SdlSession(const SdlSession &) = delete;
        SdlSession &operator=(const SdlSession &) = delete;
    };

    // =============================================================================
    // Resolve font path relative to the executable
    // =============================================================================
    // A relative font path that does not exist from the working directory is
    // looked up next to the binary, where the bundled font is installed.

    std::string resolve_font_path(const std::string &configured)
    {
        fs::path path(configured);
        std::error_code ec;
        if (path.is_absolute() || fs::exists(path, ec))
            return configured;

        // SDL_GetBasePath() returns the directory containing the executable
        char *base = SDL_GetBasePath();
        if (!base)
            return configured;
        std::string beside = std::string(base) + configured;
        SDL_free(base);
        return fs::exists(beside, ec) ? beside : configured;
    }

    std::string read_content(const std::string &source)
    {
        if (source == "-")
            return std::string(std::istreambuf_iterator<char>(std::cin),
                               std::istreambuf_iterator<char>());

        std::ifstream in(source, std::ios::binary);
        if (!in)
            throw termwin::WindowError("IOError", "cannot open " + source);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    /// Local echo: printable input is shown, Enter starts a new line and
    /// Backspace rubs out. Escape sequences are dropped.
    void echo_input(termwin::BufferPane &pane, const std::string &bytes)
    {
        std::string out;
        for (std::size_t i = 0; i < bytes.size(); ++i)
        {
            char c = bytes[i];
            if (c == '\r')
                out += "\r\n";
            else if (c == '\x7f' || c == '\b')
                out += "\b \b";
            else if (c == '\x1b')
                break;
            else if (static_cast<unsigned char>(c) >= 0x20 || c == '\t')
                out += c;
        }
        if (!out.empty())
            pane.print(out);
    }

} // namespace

// =============================================================================
// Main
// =============================================================================

int main(int argc, char *argv[])
{
    termwin::log::init_from_env();

    std::string source = argc >= 2 ? argv[1] : "";

    try
    {
        std::optional<fs::path> rc = termwin::ConfigStore::default_path();
        termwin::ConfigStore config_store = rc ? termwin::ConfigStore(*rc) : termwin::ConfigStore();
        termwin::ConfigHandle config = config_store.configuration();

        std::string content = source.empty() ? std::string() : read_content(source);

        SdlSession sdl;

        // Destroyed in reverse: the connection (and with it every window)
        // first, the executor joins its overlay tasks last.
        termwin::ThreadExecutor executor;
        termwin::SdlClipboard clipboard;
        termwin::LocalMux mux;
        termwin::SdlConnection connection(config->dpi);

        termwin::MuxWindowId window_id = mux.new_window();
        std::string title = source.empty() ? "termwin" : (source == "-" ? "stdin" : source);
        auto tab = mux.spawn_tab(window_id, title, termwin::PtySize{});

        auto pane = std::dynamic_pointer_cast<termwin::BufferPane>(tab->get_active_pane());
        if (pane)
        {
            pane->print(content);
            std::weak_ptr<termwin::BufferPane> weak = pane;
            pane->set_input_handler([weak](const std::string &bytes)
                                    {
                                        if (auto p = weak.lock())
                                            echo_input(*p, bytes); });
        }

        std::map<std::string, std::string> overrides;
        std::string font_path = resolve_font_path(config->font_path);
        if (font_path != config->font_path)
            overrides["font_path"] = font_path;

        termwin::TermWindow::Services services{mux, config_store, connection, executor, clipboard};
        termwin::TermWindow::new_window(window_id, services, overrides);

        TERMWIN_LOG_INFO("window open; config "
                         << (rc ? rc->string() : std::string("defaults")));
        connection.run();
    }
    catch (const termwin::WindowError &e)
    {
        std::cerr << e.what() << "\n";
        return 1;
    }

    return 0;
}
