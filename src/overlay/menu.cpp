// =============================================================================
// menu.cpp
// =============================================================================

#include "menu.hpp"
#include "../window/term_window.hpp"

#include <algorithm>

namespace termwin
{

    static void render_menu(OverlayTerm &term, const std::string &heading,
                            const std::vector<std::string> &items, std::size_t selected)
    {
        std::vector<std::string> lines;
        lines.push_back(heading);
        lines.push_back("");
        for (std::size_t i = 0; i < items.size(); ++i)
        {
            std::string marker = i == selected ? "> " : "  ";
            lines.push_back(marker + std::to_string(i + 1) + ". " + items[i]);
        }
        term.render(lines);
    }

    std::optional<std::size_t> run_menu(OverlayTerm &term, const std::string &heading,
                                        const std::vector<std::string> &items,
                                        std::size_t selected)
    {
        if (items.empty())
            return std::nullopt;
        selected = std::min(selected, items.size() - 1);
        render_menu(term, heading, items, selected);

        while (auto key = term.read_key())
        {
            switch (key->key)
            {
            case KeyCode::Escape:
                return std::nullopt;
            case KeyCode::Enter:
                return selected;
            case KeyCode::UpArrow:
                selected = selected > 0 ? selected - 1 : 0;
                break;
            case KeyCode::DownArrow:
                selected = std::min(selected + 1, items.size() - 1);
                break;
            case KeyCode::Char:
                if ((key->mods & MOD_CTRL) && (key->ch == U'c' || key->ch == U'g'))
                    return std::nullopt;
                if (key->ch == U'k')
                    selected = selected > 0 ? selected - 1 : 0;
                else if (key->ch == U'j')
                    selected = std::min(selected + 1, items.size() - 1);
                else if (key->ch >= U'1' && key->ch <= U'9')
                {
                    std::size_t idx = static_cast<std::size_t>(key->ch - U'1');
                    if (idx < items.size())
                        return idx;
                }
                break;
            default:
                break;
            }
            render_menu(term, heading, items, selected);
        }
        return std::nullopt;
    }

    void tab_navigator(OverlayTerm &term, const std::vector<std::string> &tab_titles,
                       std::size_t active_idx, const WindowHandle &window)
    {
        auto choice = run_menu(term, "Select a tab and press Enter to activate it. Escape cancels.",
                               tab_titles, active_idx);
        if (!choice)
            return;
        long idx = static_cast<long>(*choice);
        window.apply([idx](TermWindow &w) { w.activate_tab(idx); });
    }

    void launcher(OverlayTerm &term, std::vector<LauncherEntry> entries,
                  const WindowHandle &window)
    {
        std::vector<std::string> labels;
        for (const auto &e : entries)
            labels.push_back(e.label);

        auto choice = run_menu(term, "Launcher: pick an entry and press Enter. Escape cancels.",
                               labels, 0);
        if (!choice)
            return;
        window.apply(std::move(entries[*choice].action));
    }

} // namespace termwin
