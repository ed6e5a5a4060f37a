// =============================================================================
// confirm_close.cpp
// =============================================================================

#include "confirm_close.hpp"
#include "../core/log.hpp"
#include "../window/term_window.hpp"

namespace termwin
{

    bool run_confirmation(OverlayTerm &term, const std::string &message)
    {
        term.render({"", "  " + message, "", "  Press 'y' to confirm, 'n' or Escape to cancel."});

        while (auto key = term.read_key())
        {
            if (key->key == KeyCode::Escape)
                return false;
            if (key->key != KeyCode::Char)
                continue;
            if ((key->mods & MOD_CTRL) && (key->ch == U'c' || key->ch == U'C'))
                return false;
            if (key->ch == U'y' || key->ch == U'Y')
                return true;
            if (key->ch == U'n' || key->ch == U'N')
                return false;
        }
        return false;
    }

    void confirm_close_pane(PaneId pane_id, OverlayTerm &term, const WindowHandle &window)
    {
        if (!run_confirmation(term, "Really kill this pane?"))
            return;
        window.apply([pane_id](TermWindow &w)
                     {
                         TERMWIN_LOG_DEBUG("closing pane " << pane_id);
                         w.mux().remove_pane(pane_id);
                     });
    }

    void confirm_close_tab(TabId tab_id, OverlayTerm &term, const WindowHandle &window)
    {
        if (!run_confirmation(term, "Really kill this tab?"))
            return;
        window.apply([tab_id](TermWindow &w)
                     {
                         TERMWIN_LOG_DEBUG("closing tab " << tab_id);
                         w.mux().remove_tab(tab_id);
                     });
    }

    void confirm_close_window(MuxWindowId mux_window_id, OverlayTerm &term,
                              const WindowHandle &window)
    {
        if (!run_confirmation(term, "Really kill this window?"))
            return;
        // Once the window has no tabs the next maintenance tick closes it.
        window.apply([mux_window_id](TermWindow &w)
                     { w.mux().kill_window(mux_window_id); });
    }

} // namespace termwin
