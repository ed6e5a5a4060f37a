// =============================================================================
// input_map.cpp — default bindings
// =============================================================================

#include "input_map.hpp"

namespace termwin
{

    using Action = KeyAssignment::Action;

    static KeyBinding bind(const char *chord, Action action, long arg = 0)
    {
        return {parse_key_chord(chord), KeyAssignment::make(action, arg)};
    }

    std::vector<KeyBinding> default_key_bindings()
    {
        std::vector<KeyBinding> keys = {
            bind("CTRL|SHIFT+c", Action::Copy),
            bind("CTRL|SHIFT+v", Action::Paste),
            bind("SHIFT+Insert", Action::PastePrimarySelection),
            bind("CTRL+Tab", Action::ActivateTabRelative, 1),
            bind("CTRL|SHIFT+Tab", Action::ActivateTabRelative, -1),
            bind("CTRL|SHIFT+PageUp", Action::MoveTabRelative, -1),
            bind("CTRL|SHIFT+PageDown", Action::MoveTabRelative, 1),
            bind("CTRL+=", Action::IncreaseFontSize),
            bind("CTRL+-", Action::DecreaseFontSize),
            bind("CTRL+0", Action::ResetFontSize),
            bind("CTRL|SHIFT+0", Action::ResetFontAndWindowSize),
            bind("SHIFT+PageUp", Action::ScrollByPage, -1),
            bind("SHIFT+PageDown", Action::ScrollByPage, 1),
            bind("SHIFT+UpArrow", Action::ScrollToPrompt, -1),
            bind("SHIFT+DownArrow", Action::ScrollToPrompt, 1),
            bind("SHIFT+End", Action::ScrollToBottom),
            bind("CTRL|SHIFT+n", Action::ShowTabNavigator),
            bind("CTRL|SHIFT+l", Action::ShowLauncher),
            bind("CTRL|SHIFT+d", Action::CloseCurrentPane),
            bind("CTRL|SHIFT+w", Action::CloseCurrentTab),
            bind("CTRL|SHIFT+f", Action::Search),
            bind("CTRL|SHIFT+x", Action::ActivateCopyMode),
            bind("CTRL|SHIFT+z", Action::TogglePaneZoomState),
            bind("CTRL|SHIFT+r", Action::ReloadConfiguration),
            bind("CTRL|SHIFT+m", Action::Hide),
            bind("ALT+Enter", Action::ToggleFullScreen),
        };
        for (long i = 1; i <= 8; ++i)
            keys.push_back(bind(("ALT+" + std::to_string(i)).c_str(), Action::ActivateTab, i - 1));
        keys.push_back(bind("ALT+9", Action::ActivateTab, -1));
        return keys;
    }

    InputMap::InputMap(const Config &config)
    {
        if (!config.disable_default_key_bindings)
            for (const auto &b : default_key_bindings())
                keys_[b.chord] = b.assignment;
        for (const auto &b : config.keys)
            keys_[b.chord] = b.assignment;
    }

    std::optional<KeyAssignment> InputMap::lookup(const KeyEvent &event) const
    {
        auto it = keys_.find(KeyChord::from_event(event));
        if (it == keys_.end())
            return std::nullopt;
        return it->second;
    }

} // namespace termwin
