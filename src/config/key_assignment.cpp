// =============================================================================
// key_assignment.cpp — chord and action parsing
// =============================================================================

#include "key_assignment.hpp"
#include "../core/errors.hpp"

#include <cctype>
#include <cstdlib>
#include <unordered_map>

namespace termwin
{

    KeyChord KeyChord::from_event(const KeyEvent &event)
    {
        KeyChord chord;
        chord.key = event.key;
        chord.mods = event.mods;
        if (event.key == KeyCode::Char)
        {
            char32_t c = event.ch;
            if (c < 0x80)
                c = static_cast<char32_t>(std::tolower(static_cast<int>(c)));
            chord.ch = c;
        }
        return chord;
    }

    static std::string trimmed(const std::string &s)
    {
        std::size_t i = 0, j = s.size();
        while (i < j && std::isspace(static_cast<unsigned char>(s[i])))
            ++i;
        while (j > i && std::isspace(static_cast<unsigned char>(s[j - 1])))
            --j;
        return s.substr(i, j - i);
    }

    static uint8_t parse_modifier(const std::string &name)
    {
        if (name == "CTRL")
            return MOD_CTRL;
        if (name == "SHIFT")
            return MOD_SHIFT;
        if (name == "ALT" || name == "OPT")
            return MOD_ALT;
        if (name == "SUPER" || name == "CMD")
            return MOD_SUPER;
        if (name == "NONE")
            return MOD_NONE;
        throw ConfigError("unknown modifier '" + name + "'");
    }

    KeyChord parse_key_chord(const std::string &spec)
    {
        static const std::unordered_map<std::string, KeyCode> named = {
            {"Enter", KeyCode::Enter},
            {"Escape", KeyCode::Escape},
            {"Tab", KeyCode::Tab},
            {"Backspace", KeyCode::Backspace},
            {"Delete", KeyCode::Delete},
            {"Insert", KeyCode::Insert},
            {"UpArrow", KeyCode::UpArrow},
            {"DownArrow", KeyCode::DownArrow},
            {"LeftArrow", KeyCode::LeftArrow},
            {"RightArrow", KeyCode::RightArrow},
            {"PageUp", KeyCode::PageUp},
            {"PageDown", KeyCode::PageDown},
            {"Home", KeyCode::Home},
            {"End", KeyCode::End},
        };

        std::string s = trimmed(spec);
        KeyChord chord;

        std::string key_part = s;
        auto plus = s.rfind('+');
        if (plus != std::string::npos && plus + 1 < s.size())
        {
            std::string mods = s.substr(0, plus);
            key_part = s.substr(plus + 1);
            std::size_t start = 0;
            while (start <= mods.size())
            {
                auto bar = mods.find('|', start);
                if (bar == std::string::npos)
                    bar = mods.size();
                std::string m = trimmed(mods.substr(start, bar - start));
                if (!m.empty())
                    chord.mods |= parse_modifier(m);
                start = bar + 1;
            }
        }

        key_part = trimmed(key_part);
        if (key_part.empty())
            throw ConfigError("empty key in chord '" + spec + "'");

        auto it = named.find(key_part);
        if (it != named.end())
        {
            chord.key = it->second;
        }
        else if (key_part.size() == 1)
        {
            chord.key = KeyCode::Char;
            chord.ch = static_cast<char32_t>(
                std::tolower(static_cast<unsigned char>(key_part[0])));
        }
        else
        {
            throw ConfigError("unknown key '" + key_part + "'");
        }
        return chord;
    }

    KeyAssignment parse_key_assignment(const std::string &spec)
    {
        using A = KeyAssignment::Action;
        static const std::unordered_map<std::string, A> actions = {
            {"Copy", A::Copy},
            {"Paste", A::Paste},
            {"PastePrimarySelection", A::PastePrimarySelection},
            {"ActivateTab", A::ActivateTab},
            {"ActivateTabRelative", A::ActivateTabRelative},
            {"MoveTab", A::MoveTab},
            {"MoveTabRelative", A::MoveTabRelative},
            {"IncreaseFontSize", A::IncreaseFontSize},
            {"DecreaseFontSize", A::DecreaseFontSize},
            {"ResetFontSize", A::ResetFontSize},
            {"ResetFontAndWindowSize", A::ResetFontAndWindowSize},
            {"ScrollByPage", A::ScrollByPage},
            {"ScrollByLine", A::ScrollByLine},
            {"ScrollToPrompt", A::ScrollToPrompt},
            {"ScrollToBottom", A::ScrollToBottom},
            {"ShowTabNavigator", A::ShowTabNavigator},
            {"ShowLauncher", A::ShowLauncher},
            {"CloseCurrentPane", A::CloseCurrentPane},
            {"CloseCurrentTab", A::CloseCurrentTab},
            {"Search", A::Search},
            {"ActivateCopyMode", A::ActivateCopyMode},
            {"TogglePaneZoomState", A::TogglePaneZoomState},
            {"SendString", A::SendString},
            {"ReloadConfiguration", A::ReloadConfiguration},
            {"Hide", A::Hide},
            {"Show", A::Show},
            {"ToggleFullScreen", A::ToggleFullScreen},
        };

        std::string s = trimmed(spec);
        std::string name = s;
        std::string param;
        bool has_param = false;

        auto open = s.find('(');
        if (open != std::string::npos)
        {
            if (s.back() != ')')
                throw ConfigError("unterminated argument in '" + spec + "'");
            name = trimmed(s.substr(0, open));
            param = s.substr(open + 1, s.size() - open - 2);
            has_param = true;
        }

        auto it = actions.find(name);
        if (it == actions.end())
            throw ConfigError("unknown key assignment '" + name + "'");

        KeyAssignment k;
        k.action = it->second;

        switch (k.action)
        {
        case A::ActivateTab:
        case A::ActivateTabRelative:
        case A::MoveTab:
        case A::MoveTabRelative:
        case A::ScrollByPage:
        case A::ScrollByLine:
        case A::ScrollToPrompt:
        {
            if (!has_param)
                throw ConfigError(name + " requires a numeric argument");
            std::string num = trimmed(param);
            char *end = nullptr;
            long v = std::strtol(num.c_str(), &end, 10);
            if (num.empty() || end == nullptr || *end != '\0')
                throw ConfigError("bad number '" + num + "' for " + name);
            k.arg = v;
            break;
        }
        case A::CloseCurrentPane:
        case A::CloseCurrentTab:
        {
            std::string p = trimmed(param);
            if (!has_param || p == "confirm")
                k.confirm = true;
            else if (p == "noconfirm")
                k.confirm = false;
            else
                throw ConfigError("expected confirm|noconfirm for " + name);
            break;
        }
        case A::SendString:
            if (!has_param)
                throw ConfigError("SendString requires text");
            k.text = param;
            break;
        default:
            if (has_param && !trimmed(param).empty())
                throw ConfigError(name + " takes no argument");
            break;
        }
        return k;
    }

} // namespace termwin
