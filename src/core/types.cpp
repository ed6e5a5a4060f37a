// =============================================================================
// types.cpp — UTF-8 helpers and Line text extraction
// =============================================================================

#include "types.hpp"

#include <algorithm>

namespace termwin
{

    void append_utf8(std::string &out, char32_t cp)
    {
        if (cp < 0x80)
        {
            out += static_cast<char>(cp);
        }
        else if (cp < 0x800)
        {
            out += static_cast<char>(0xC0 | (cp >> 6));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x10000)
        {
            out += static_cast<char>(0xE0 | (cp >> 12));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
        else if (cp < 0x110000)
        {
            out += static_cast<char>(0xF0 | (cp >> 18));
            out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
            out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
            out += static_cast<char>(0x80 | (cp & 0x3F));
        }
    }

    char32_t next_codepoint(const std::string &s, std::size_t &i)
    {
        unsigned char c = static_cast<unsigned char>(s[i]);
        int extra = 0;
        char32_t cp = 0;
        if (c < 0x80)
        {
            ++i;
            return c;
        }
        else if ((c & 0xE0) == 0xC0)
        {
            extra = 1;
            cp = c & 0x1F;
        }
        else if ((c & 0xF0) == 0xE0)
        {
            extra = 2;
            cp = c & 0x0F;
        }
        else if ((c & 0xF8) == 0xF0)
        {
            extra = 3;
            cp = c & 0x07;
        }
        else
        {
            ++i;
            return 0xFFFD;
        }

        if (i + extra >= s.size())
        {
            ++i;
            return 0xFFFD;
        }
        for (int k = 1; k <= extra; ++k)
        {
            unsigned char cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80)
            {
                ++i;
                return 0xFFFD;
            }
            cp = (cp << 6) | (cc & 0x3F);
        }
        i += extra + 1;
        return cp;
    }

    Line Line::from_text(const std::string &text, bool wrapped)
    {
        Line line;
        std::size_t i = 0;
        while (i < text.size())
        {
            Cell cell;
            cell.ch = next_codepoint(text, i);
            line.cells.push_back(cell);
        }
        if (wrapped && !line.cells.empty())
            line.cells.back().wrapped = true;
        return line;
    }

    std::string Line::columns_as_str(std::size_t col_begin, std::size_t col_end) const
    {
        std::string out;
        col_end = std::min(col_end, cells.size());
        for (std::size_t c = col_begin; c < col_end; ++c)
            append_utf8(out, cells[c].ch == 0 ? U' ' : cells[c].ch);
        return out;
    }

    void trim_end(std::string &s)
    {
        while (!s.empty() &&
               (s.back() == ' ' || s.back() == '\t' || s.back() == '\r' || s.back() == '\n'))
            s.pop_back();
    }

} // namespace termwin
