#pragma once

// =============================================================================
// config.hpp — versioned configuration snapshots
// =============================================================================
// Config is an immutable value once published by the ConfigStore. Windows hold
// a ConfigHandle (snapshot + generation) and detect staleness by comparing
// their generation with the store's.
//
// The rc file is "key = value" per line, '#' starts a comment:
//
//     font_size = 13
//     window_padding_right = 0
//     enable_scroll_bar = true
//     bind = CTRL|SHIFT+c Copy
//     launch_menu = htop
// =============================================================================

#include "../core/types.hpp"
#include "key_assignment.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace termwin
{

    struct WindowPadding
    {
        uint16_t left = 0;
        uint16_t right = 0;
        uint16_t top = 0;
        uint16_t bottom = 0;
    };

    enum class WindowCloseConfirmation
    {
        AlwaysPrompt,
        NeverPrompt,
    };

    struct ColorConfig
    {
        Color foreground = Color::default_fg();
        Color background = Color::default_bg();
        Color cursor_bg = Color::white();
        Color selection_bg = Color(80, 130, 200, 100);
    };

    struct KeyBinding
    {
        KeyChord chord;
        KeyAssignment assignment;
    };

    struct Config
    {
        std::string font_path = "assets/fonts/JetBrainsMono-Regular.ttf";
        double font_size = 12.0;
        std::optional<std::size_t> dpi;
        WindowPadding window_padding;
        bool enable_tab_bar = true;
        bool hide_tab_bar_if_only_one_tab = false;
        bool enable_scroll_bar = false;
        uint64_t cursor_blink_rate = 800; // ms, 0 disables blinking
        CursorShape default_cursor_style = CursorShape::SteadyBlock;
        bool scroll_to_bottom_on_input = true;
        bool adjust_window_size_when_changing_font_size = true;
        std::size_t initial_rows = 24;
        std::size_t initial_cols = 80;
        std::optional<std::filesystem::path> window_background_image;
        WindowCloseConfirmation window_close_confirmation =
            WindowCloseConfirmation::AlwaysPrompt;
        std::string window_class = "org.termwin.termwin";
        std::string selection_word_boundary = " \t\n{}[]()\"'`";
        ColorConfig colors;
        std::vector<std::string> launch_menu;
        std::vector<KeyBinding> keys;
        bool disable_default_key_bindings = false;

        /// Apply one "key = value" setting. Throws ConfigError.
        void set(const std::string &key, const std::string &value, int line = 0);

        /// Copy with per-window overrides applied. Throws ConfigError.
        Config with_overrides(const std::map<std::string, std::string> &overrides) const;

        /// Rows/cols to use for a new window or ResetFontAndWindowSize.
        RowsAndCols initial_size() const { return {initial_rows, initial_cols}; }
    };

    /// Parse rc text into a Config. Throws ConfigError.
    Config parse_config(const std::string &text);

    // -----------------------------------------------------------------------------
    // ConfigHandle — a snapshot and the generation it was published under
    // -----------------------------------------------------------------------------
    struct ConfigHandle
    {
        std::shared_ptr<const Config> config;
        uint64_t generation = 0;

        const Config *operator->() const { return config.get(); }
        const Config &operator*() const { return *config; }
    };

    // -----------------------------------------------------------------------------
    // ConfigStore — owns the current snapshot
    // -----------------------------------------------------------------------------
    class ConfigStore
    {
    public:
        /// Store holding a default Config and no backing file.
        ConfigStore();

        /// Store backed by an rc file; a missing file means defaults.
        explicit ConfigStore(std::filesystem::path path);

        /// $TERMWIN_CONFIG_FILE, else $HOME/.termwin.rc.
        static std::optional<std::filesystem::path> default_path();

        ConfigHandle configuration() const;
        uint64_t generation() const;

        /// Re-read the backing file. On failure the error is logged, the
        /// previous snapshot stays current and false is returned.
        bool reload();

        /// Publish `config` as a new generation.
        void publish(Config config);

    private:
        mutable std::mutex mutex_;
        std::optional<std::filesystem::path> path_;
        std::shared_ptr<const Config> current_;
        uint64_t generation_ = 0;
    };

} // namespace termwin
