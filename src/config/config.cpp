// =============================================================================
// config.cpp — rc file parsing and the snapshot store
// =============================================================================

#include "config.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace termwin
{

    // =========================================================================
    // Value parsing helpers
    // =========================================================================

    static std::string trimmed(const std::string &s)
    {
        std::size_t i = 0, j = s.size();
        while (i < j && std::isspace(static_cast<unsigned char>(s[i])))
            ++i;
        while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1])))
            --j;
        return s.substr(i, j - i);
    }

    static bool parse_bool(const std::string &key, const std::string &v, int line)
    {
        if (v == "true" || v == "yes" || v == "on" || v == "1")
            return true;
        if (v == "false" || v == "no" || v == "off" || v == "0")
            return false;
        throw ConfigError("expected a boolean for " + key + ", got '" + v + "'", line);
    }

    static unsigned long parse_unsigned(const std::string &key, const std::string &v, int line)
    {
        char *end = nullptr;
        unsigned long n = std::strtoul(v.c_str(), &end, 10);
        if (v.empty() || v[0] == '-' || end == nullptr || *end != '\0')
            throw ConfigError("expected a non-negative integer for " + key +
                                  ", got '" + v + "'",
                              line);
        return n;
    }

    static uint16_t parse_u16(const std::string &key, const std::string &v, int line)
    {
        unsigned long n = parse_unsigned(key, v, line);
        if (n > 0xFFFF)
            throw ConfigError(key + " is out of range", line);
        return static_cast<uint16_t>(n);
    }

    static double parse_positive_double(const std::string &key, const std::string &v, int line)
    {
        char *end = nullptr;
        double d = std::strtod(v.c_str(), &end);
        if (v.empty() || end == nullptr || *end != '\0' || !(d > 0.0))
            throw ConfigError("expected a positive number for " + key +
                                  ", got '" + v + "'",
                              line);
        return d;
    }

    static Color parse_color(const std::string &key, const std::string &v, int line)
    {
        auto hex = [&](std::size_t pos) -> uint8_t
        {
            std::string pair = v.substr(pos, 2);
            char *end = nullptr;
            long n = std::strtol(pair.c_str(), &end, 16);
            if (end == nullptr || *end != '\0')
                throw ConfigError("bad color '" + v + "' for " + key, line);
            return static_cast<uint8_t>(n);
        };
        if ((v.size() != 7 && v.size() != 9) || v[0] != '#')
            throw ConfigError("expected #rrggbb or #rrggbbaa for " + key, line);
        Color c(hex(1), hex(3), hex(5));
        if (v.size() == 9)
            c.a = hex(7);
        return c;
    }

    static CursorShape parse_cursor_shape(const std::string &v, int line)
    {
        if (v == "BlinkingBlock")
            return CursorShape::BlinkingBlock;
        if (v == "SteadyBlock")
            return CursorShape::SteadyBlock;
        if (v == "BlinkingUnderline")
            return CursorShape::BlinkingUnderline;
        if (v == "SteadyUnderline")
            return CursorShape::SteadyUnderline;
        if (v == "BlinkingBar")
            return CursorShape::BlinkingBar;
        if (v == "SteadyBar")
            return CursorShape::SteadyBar;
        throw ConfigError("unknown cursor style '" + v + "'", line);
    }

    // =========================================================================
    // Config
    // =========================================================================

    void Config::set(const std::string &key, const std::string &raw, int line)
    {
        std::string value = trimmed(raw);

        if (key == "font_path")
            font_path = value;
        else if (key == "font_size")
            font_size = parse_positive_double(key, value, line);
        else if (key == "dpi")
            dpi = static_cast<std::size_t>(parse_unsigned(key, value, line));
        else if (key == "window_padding_left")
            window_padding.left = parse_u16(key, value, line);
        else if (key == "window_padding_right")
            window_padding.right = parse_u16(key, value, line);
        else if (key == "window_padding_top")
            window_padding.top = parse_u16(key, value, line);
        else if (key == "window_padding_bottom")
            window_padding.bottom = parse_u16(key, value, line);
        else if (key == "enable_tab_bar")
            enable_tab_bar = parse_bool(key, value, line);
        else if (key == "hide_tab_bar_if_only_one_tab")
            hide_tab_bar_if_only_one_tab = parse_bool(key, value, line);
        else if (key == "enable_scroll_bar")
            enable_scroll_bar = parse_bool(key, value, line);
        else if (key == "cursor_blink_rate")
            cursor_blink_rate = parse_unsigned(key, value, line);
        else if (key == "default_cursor_style")
            default_cursor_style = parse_cursor_shape(value, line);
        else if (key == "scroll_to_bottom_on_input")
            scroll_to_bottom_on_input = parse_bool(key, value, line);
        else if (key == "adjust_window_size_when_changing_font_size")
            adjust_window_size_when_changing_font_size = parse_bool(key, value, line);
        else if (key == "initial_rows")
            initial_rows = parse_u16(key, value, line);
        else if (key == "initial_cols")
            initial_cols = parse_u16(key, value, line);
        else if (key == "window_background_image")
        {
            if (value.empty())
                window_background_image.reset();
            else
                window_background_image = std::filesystem::path(value);
        }
        else if (key == "window_close_confirmation")
        {
            if (value == "AlwaysPrompt")
                window_close_confirmation = WindowCloseConfirmation::AlwaysPrompt;
            else if (value == "NeverPrompt")
                window_close_confirmation = WindowCloseConfirmation::NeverPrompt;
            else
                throw ConfigError("expected AlwaysPrompt|NeverPrompt, got '" + value + "'", line);
        }
        else if (key == "window_class")
            window_class = value;
        else if (key == "selection_word_boundary")
            selection_word_boundary = raw; // leading/trailing spaces are significant
        else if (key == "foreground")
            colors.foreground = parse_color(key, value, line);
        else if (key == "background")
            colors.background = parse_color(key, value, line);
        else if (key == "cursor_bg")
            colors.cursor_bg = parse_color(key, value, line);
        else if (key == "selection_bg")
            colors.selection_bg = parse_color(key, value, line);
        else if (key == "launch_menu")
        {
            if (value.empty())
                throw ConfigError("launch_menu entry is empty", line);
            launch_menu.push_back(value);
        }
        else if (key == "disable_default_key_bindings")
            disable_default_key_bindings = parse_bool(key, value, line);
        else if (key == "bind")
        {
            // bind = <chord> <assignment>
            auto space = value.find(' ');
            if (space == std::string::npos)
                throw ConfigError("bind expects '<chord> <action>'", line);
            try
            {
                KeyBinding b;
                b.chord = parse_key_chord(value.substr(0, space));
                b.assignment = parse_key_assignment(value.substr(space + 1));
                keys.push_back(b);
            }
            catch (const ConfigError &e)
            {
                throw ConfigError(e.detail(), line);
            }
        }
        else
            throw ConfigError("unknown setting '" + key + "'", line);
    }

    Config Config::with_overrides(const std::map<std::string, std::string> &overrides) const
    {
        Config copy = *this;
        for (const auto &kv : overrides)
            copy.set(kv.first, kv.second);
        return copy;
    }

    Config parse_config(const std::string &text)
    {
        Config config;
        std::istringstream in(text);
        std::string raw;
        int line_no = 0;
        while (std::getline(in, raw))
        {
            ++line_no;
            std::string s = trimmed(raw);
            if (s.empty() || s[0] == '#')
                continue;
            auto eq = raw.find('=');
            if (eq == std::string::npos)
                throw ConfigError("expected 'key = value'", line_no);
            std::string key = trimmed(raw.substr(0, eq));
            std::string value = raw.substr(eq + 1);
            // A single separating space after '=' is not part of the value.
            if (!value.empty() && value[0] == ' ')
                value.erase(0, 1);
            if (key != "selection_word_boundary")
                value = trimmed(value);
            config.set(key, value, line_no);
        }
        return config;
    }

    // =========================================================================
    // ConfigStore
    // =========================================================================

    ConfigStore::ConfigStore()
        : current_(std::make_shared<const Config>()) {}

    ConfigStore::ConfigStore(std::filesystem::path path)
        : path_(std::move(path)), current_(std::make_shared<const Config>())
    {
        reload();
    }

    std::optional<std::filesystem::path> ConfigStore::default_path()
    {
        const char *env = std::getenv("TERMWIN_CONFIG_FILE");
        if (env && env[0])
            return std::filesystem::path(env);
        const char *home = std::getenv("HOME");
        if (home && home[0])
            return std::filesystem::path(home) / ".termwin.rc";
        return std::nullopt;
    }

    ConfigHandle ConfigStore::configuration() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return {current_, generation_};
    }

    uint64_t ConfigStore::generation() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return generation_;
    }

    bool ConfigStore::reload()
    {
        if (!path_)
            return false;

        std::error_code ec;
        if (!std::filesystem::exists(*path_, ec))
        {
            TERMWIN_LOG_DEBUG("no config file at " << path_->string() << ", using defaults");
            publish(Config{});
            return true;
        }

        std::ifstream in(*path_);
        if (!in)
        {
            TERMWIN_LOG_ERROR("failed to open config file " << path_->string());
            return false;
        }
        std::stringstream buf;
        buf << in.rdbuf();

        try
        {
            publish(parse_config(buf.str()));
        }
        catch (const ConfigError &e)
        {
            TERMWIN_LOG_ERROR("failed to load " << path_->string() << ": " << e.what());
            return false;
        }
        TERMWIN_LOG_DEBUG("loaded config " << path_->string());
        return true;
    }

    void ConfigStore::publish(Config config)
    {
        auto snapshot = std::make_shared<const Config>(std::move(config));
        std::lock_guard<std::mutex> lock(mutex_);
        current_ = std::move(snapshot);
        ++generation_;
    }

} // namespace termwin
