// =============================================================================
// copy_overlay.cpp
// =============================================================================

#include "copy_overlay.hpp"
#include "../window/term_window.hpp"

#include <algorithm>

namespace termwin
{

    CopyOverlay::CopyOverlay(PaneId pane_id, std::shared_ptr<Pane> delegate, WindowHandle window,
                             std::optional<StableRowIndex> viewport)
        : pane_id_(pane_id), delegate_(std::move(delegate)), window_(std::move(window)),
          viewport_(viewport)
    {
        StableCursorPosition pos = delegate_->get_cursor_position();
        cursor_ = {pos.x, pos.y};
        dirty_.insert(cursor_.y);
    }

    std::string CopyOverlay::get_title() const
    {
        return "Copy mode: " + delegate_->get_title();
    }

    RenderableDimensions CopyOverlay::get_dimensions() const
    {
        return delegate_->get_dimensions();
    }

    StableCursorPosition CopyOverlay::get_cursor_position() const
    {
        StableCursorPosition pos;
        pos.x = cursor_.x;
        pos.y = cursor_.y;
        pos.shape = CursorShape::SteadyBlock;
        return pos;
    }

    std::vector<StableRowIndex> CopyOverlay::get_dirty_lines(StableRowIndex begin,
                                                             StableRowIndex end) const
    {
        std::vector<StableRowIndex> rows = delegate_->get_dirty_lines(begin, end);
        for (StableRowIndex row : dirty_)
            if (row >= begin && row < end)
                rows.push_back(row);
        std::sort(rows.begin(), rows.end());
        rows.erase(std::unique(rows.begin(), rows.end()), rows.end());
        return rows;
    }

    std::pair<StableRowIndex, std::vector<Line>> CopyOverlay::get_lines(StableRowIndex begin,
                                                                        StableRowIndex end) const
    {
        return delegate_->get_lines(begin, end);
    }

    std::vector<SemanticZone> CopyOverlay::get_semantic_zones() const
    {
        return delegate_->get_semantic_zones();
    }

    void CopyOverlay::make_all_lines_clean()
    {
        dirty_.clear();
        delegate_->make_all_lines_clean();
    }

    void CopyOverlay::viewport_changed(std::optional<StableRowIndex> viewport)
    {
        viewport_ = viewport;
    }

    void CopyOverlay::move_to(std::size_t x, StableRowIndex y)
    {
        RenderableDimensions dims = delegate_->get_dimensions();
        StableRowIndex last_row = dims.physical_top + static_cast<StableRowIndex>(dims.viewport_rows) - 1;
        y = std::clamp(y, dims.scrollback_top, std::max(last_row, dims.scrollback_top));
        x = std::min(x, dims.cols > 0 ? dims.cols - 1 : 0);

        dirty_.insert(cursor_.y);
        cursor_ = {x, y};
        dirty_.insert(cursor_.y);

        PaneId state_id = delegate_->pane_id();
        SelectionCoordinate coord = cursor_;
        std::optional<SelectionMode> mode = mode_;
        std::shared_ptr<Pane> delegate = delegate_;
        window_.apply([state_id, coord, mode, delegate](TermWindow &w)
                      {
                          if (mode)
                              w.selection(state_id).extend(*mode, coord, *delegate,
                                                           w.config().selection_word_boundary);
                          w.viewport().keep_row_visible(state_id, coord.y,
                                                        delegate->get_dimensions(), VERTICAL_GAP);
                          w.invalidate();
                      });
    }

    void CopyOverlay::toggle_selection(SelectionMode mode)
    {
        PaneId state_id = delegate_->pane_id();
        SelectionCoordinate coord = cursor_;
        std::shared_ptr<Pane> delegate = delegate_;

        if (mode_ == mode)
        {
            mode_.reset();
            window_.apply([state_id](TermWindow &w)
                          {
                              w.selection(state_id).clear();
                              w.invalidate();
                          });
            return;
        }

        mode_ = mode;
        window_.apply([state_id, coord, mode, delegate](TermWindow &w)
                      {
                          Selection &sel = w.selection(state_id);
                          sel.begin(mode, coord, *delegate, w.config().selection_word_boundary);
                          sel.extend(mode, coord, *delegate, w.config().selection_word_boundary);
                          w.invalidate();
                      });
    }

    void CopyOverlay::copy_and_close()
    {
        PaneId state_id = delegate_->pane_id();
        std::shared_ptr<Pane> delegate = delegate_;
        window_.apply([state_id, delegate](TermWindow &w)
                      {
                          std::string text = w.selection_text(state_id, *delegate);
                          if (!text.empty())
                              w.copy_to_clipboard(ClipboardKind::Clipboard, text);
                          w.cancel_pane_overlay(state_id);
                      });
    }

    void CopyOverlay::close()
    {
        PaneId state_id = delegate_->pane_id();
        window_.apply([state_id](TermWindow &w) { w.cancel_pane_overlay(state_id); });
    }

    void CopyOverlay::key_down(const KeyEvent &event)
    {
        RenderableDimensions dims = delegate_->get_dimensions();
        StableRowIndex page = static_cast<StableRowIndex>(dims.viewport_rows);
        std::size_t x = cursor_.x;
        StableRowIndex y = cursor_.y;

        switch (event.key)
        {
        case KeyCode::Escape:
            close();
            return;
        case KeyCode::LeftArrow:
            move_to(x > 0 ? x - 1 : 0, y);
            return;
        case KeyCode::RightArrow:
            move_to(x + 1, y);
            return;
        case KeyCode::UpArrow:
            move_to(x, y - 1);
            return;
        case KeyCode::DownArrow:
            move_to(x, y + 1);
            return;
        case KeyCode::PageUp:
            move_to(x, y - page);
            return;
        case KeyCode::PageDown:
            move_to(x, y + page);
            return;
        case KeyCode::Home:
            move_to(0, y);
            return;
        case KeyCode::End:
            move_to(dims.cols, y);
            return;
        case KeyCode::Char:
            break;
        default:
            return;
        }

        if ((event.mods & MOD_CTRL) && (event.ch == U'c' || event.ch == U'C'))
        {
            close();
            return;
        }

        switch (event.ch)
        {
        case U'q':
            close();
            break;
        case U'h':
            move_to(x > 0 ? x - 1 : 0, y);
            break;
        case U'l':
            move_to(x + 1, y);
            break;
        case U'k':
            move_to(x, y - 1);
            break;
        case U'j':
            move_to(x, y + 1);
            break;
        case U'0':
            move_to(0, y);
            break;
        case U'$':
            move_to(dims.cols, y);
            break;
        case U'g':
            move_to(0, dims.scrollback_top);
            break;
        case U'G':
            move_to(0, dims.physical_top + page - 1);
            break;
        case U'v':
            toggle_selection(SelectionMode::Cell);
            break;
        case U'V':
            toggle_selection(SelectionMode::Line);
            break;
        case U'y':
            copy_and_close();
            break;
        default:
            break;
        }
    }

} // namespace termwin
