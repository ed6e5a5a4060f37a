// =============================================================================
// key_encoding.cpp — KeyEvent → terminal byte sequence translation
// =============================================================================

#include "key_encoding.hpp"
#include "../core/types.hpp"

namespace termwin
{

    // xterm modifier parameter: 1 + shift(1) + alt(2) + ctrl(4)
    static int modifier_param(uint8_t mods)
    {
        int p = 1;
        if (mods & MOD_SHIFT)
            p += 1;
        if (mods & MOD_ALT)
            p += 2;
        if (mods & MOD_CTRL)
            p += 4;
        return p;
    }

    static std::string cursor_key(char final_byte, uint8_t mods)
    {
        int p = modifier_param(mods);
        if (p == 1)
            return std::string("\033[") + final_byte;
        return "\033[1;" + std::to_string(p) + final_byte;
    }

    std::string encode_key(const KeyEvent &event)
    {
        bool ctrl = (event.mods & MOD_CTRL) != 0;
        bool shift = (event.mods & MOD_SHIFT) != 0;
        bool alt = (event.mods & MOD_ALT) != 0;

        switch (event.key)
        {
        case KeyCode::Char:
        {
            char32_t c = event.ch;
            if (ctrl && !shift)
            {
                // Ctrl+A through Ctrl+Z → 0x01 through 0x1A
                if (c >= U'a' && c <= U'z')
                    c = c - U'a' + 1;
                else if (c >= U'A' && c <= U'Z')
                    c = c - U'A' + 1;
                else if (c == U'[')
                    c = 0x1b;
                else if (c == U'\\')
                    c = 0x1c;
                else if (c == U']')
                    c = 0x1d;
            }
            std::string out;
            if (alt)
                out += '\033';
            append_utf8(out, c);
            return out;
        }

        case KeyCode::Enter:
            if (shift)
                return "\033[13;2u";
            return alt ? "\033\r" : "\r";
        case KeyCode::Backspace:
            return "\x7f";
        case KeyCode::Tab:
            return shift ? "\033[Z" : "\t";
        case KeyCode::Escape:
            return "\x1b";

        case KeyCode::UpArrow:
            return cursor_key('A', event.mods);
        case KeyCode::DownArrow:
            return cursor_key('B', event.mods);
        case KeyCode::RightArrow:
            return cursor_key('C', event.mods);
        case KeyCode::LeftArrow:
            return cursor_key('D', event.mods);

        case KeyCode::Home:
            return "\033[H";
        case KeyCode::End:
            return "\033[F";
        case KeyCode::Insert:
            return "\033[2~";
        case KeyCode::Delete:
            return "\033[3~";
        case KeyCode::PageUp:
            return "\033[5~";
        case KeyCode::PageDown:
            return "\033[6~";

        case KeyCode::Unknown:
            break;
        }
        return {};
    }

} // namespace termwin
