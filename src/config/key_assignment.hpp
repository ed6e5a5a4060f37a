#pragma once

// =============================================================================
// key_assignment.hpp — keys, modifiers and the actions bound to them
// =============================================================================
// Platform-neutral key events (the SDL front end translates its events into
// these) and the KeyAssignment actions a chord can trigger.
// =============================================================================

#include <cstdint>
#include <optional>
#include <string>

namespace termwin
{

    enum class KeyCode
    {
        Char, // .ch holds the character
        Enter,
        Escape,
        Tab,
        Backspace,
        Delete,
        Insert,
        UpArrow,
        DownArrow,
        LeftArrow,
        RightArrow,
        PageUp,
        PageDown,
        Home,
        End,
        Unknown,
    };

    enum Modifiers : uint8_t
    {
        MOD_NONE = 0,
        MOD_SHIFT = 1 << 0,
        MOD_CTRL = 1 << 1,
        MOD_ALT = 1 << 2,
        MOD_SUPER = 1 << 3,
    };

    struct KeyEvent
    {
        KeyCode key = KeyCode::Unknown;
        char32_t ch = 0; // valid when key == KeyCode::Char
        uint8_t mods = MOD_NONE;

        static KeyEvent chr(char32_t c, uint8_t mods = MOD_NONE)
        {
            KeyEvent e;
            e.key = KeyCode::Char;
            e.ch = c;
            e.mods = mods;
            return e;
        }
        static KeyEvent named(KeyCode k, uint8_t mods = MOD_NONE)
        {
            KeyEvent e;
            e.key = k;
            e.mods = mods;
            return e;
        }
    };

    /// Lookup key for the input map: named key or lower-cased character.
    struct KeyChord
    {
        KeyCode key = KeyCode::Unknown;
        char32_t ch = 0;
        uint8_t mods = MOD_NONE;

        static KeyChord from_event(const KeyEvent &event);

        bool operator==(const KeyChord &o) const
        {
            return key == o.key && ch == o.ch && mods == o.mods;
        }
    };

    struct KeyChordHash
    {
        std::size_t operator()(const KeyChord &k) const
        {
            return (static_cast<std::size_t>(k.key) << 40) ^
                   (static_cast<std::size_t>(k.ch) << 8) ^ k.mods;
        }
    };

    // -----------------------------------------------------------------------------
    // KeyAssignment — what a chord does
    // -----------------------------------------------------------------------------
    struct KeyAssignment
    {
        enum class Action
        {
            Copy,
            Paste,
            PastePrimarySelection,
            ActivateTab,         // arg: index, negative counts from the end
            ActivateTabRelative, // arg: delta, wraps
            MoveTab,             // arg: index
            MoveTabRelative,     // arg: delta, clamped
            IncreaseFontSize,
            DecreaseFontSize,
            ResetFontSize,
            ResetFontAndWindowSize,
            ScrollByPage, // arg
            ScrollByLine, // arg
            ScrollToPrompt, // arg
            ScrollToBottom,
            ShowTabNavigator,
            ShowLauncher,
            CloseCurrentPane, // confirm
            CloseCurrentTab,  // confirm
            Search,
            ActivateCopyMode,
            TogglePaneZoomState,
            SendString, // text
            ReloadConfiguration,
            Hide,
            Show,
            ToggleFullScreen,
        };

        Action action = Action::Copy;
        long arg = 0;
        bool confirm = true;
        std::string text;

        static KeyAssignment make(Action a, long arg = 0)
        {
            KeyAssignment k;
            k.action = a;
            k.arg = arg;
            return k;
        }

        bool operator==(const KeyAssignment &o) const
        {
            return action == o.action && arg == o.arg && confirm == o.confirm &&
                   text == o.text;
        }
    };

    /// Parse "CTRL|SHIFT+c", "SHIFT+PageUp", "ALT+9". Throws ConfigError.
    KeyChord parse_key_chord(const std::string &spec);

    /// Parse "Copy", "ActivateTab(-1)", "CloseCurrentTab(noconfirm)",
    /// "SendString(text)". Throws ConfigError.
    KeyAssignment parse_key_assignment(const std::string &spec);

} // namespace termwin
