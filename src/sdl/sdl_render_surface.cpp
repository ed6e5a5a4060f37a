// =============================================================================
// sdl_render_surface.cpp — SDL2 + SDL_ttf painting
// =============================================================================

#include "sdl_render_surface.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"

#include <SDL2/SDL.h>
#include <SDL2/SDL_ttf.h>

#include <algorithm>

namespace termwin
{

    // =============================================================================
    // Lifecycle
    // =============================================================================

    SdlRenderSurface::SdlRenderSurface(SDL_Window *window, const RenderMetrics &metrics)
    {
        // Hardware-accelerated with vsync
        renderer_ = SDL_CreateRenderer(window, -1,
                                       SDL_RENDERER_ACCELERATED | SDL_RENDERER_PRESENTVSYNC);
        if (!renderer_)
        {
            // Fallback to software renderer
            renderer_ = SDL_CreateRenderer(window, -1, SDL_RENDERER_SOFTWARE);
            if (!renderer_)
                throw RenderSurfaceError(std::string("SDL_CreateRenderer: ") + SDL_GetError());
        }

        // Enable blending for text rendering
        SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);

        try
        {
            recreate_glyph_atlas(metrics);
        }
        catch (const RenderSurfaceError &)
        {
            SDL_DestroyRenderer(renderer_);
            throw;
        }
    }

    SdlRenderSurface::~SdlRenderSurface()
    {
        clear_glyph_cache();
        if (background_)
            SDL_DestroyTexture(background_);
        font_.reset();
        if (renderer_)
            SDL_DestroyRenderer(renderer_);
    }

    void SdlRenderSurface::advise_of_window_size_change(const RenderMetrics &metrics,
                                                        std::size_t pixel_width,
                                                        std::size_t pixel_height)
    {
        // SDL resizes the renderer's output with the window; only the font
        // may need to follow.
        int out_w = 0, out_h = 0;
        if (SDL_GetRendererOutputSize(renderer_, &out_w, &out_h) != 0)
            throw RenderSurfaceError(std::string("SDL_GetRendererOutputSize: ") + SDL_GetError());
        TERMWIN_LOG_TRACE("surface " << out_w << "x" << out_h << " advised of "
                                     << pixel_width << "x" << pixel_height);
        if (metrics.pixel_size != metrics_.pixel_size || metrics.font_path != metrics_.font_path)
            recreate_glyph_atlas(metrics);
    }

    void SdlRenderSurface::recreate_glyph_atlas(const RenderMetrics &metrics)
    {
        TtfFontPtr font;
        try
        {
            font = open_ttf_font(metrics.font_path, std::max(metrics.pixel_size, 1));
        }
        catch (const FontError &e)
        {
            throw RenderSurfaceError(e.detail());
        }
        clear_glyph_cache();
        font_ = std::move(font);
        metrics_ = metrics;
    }

    // =============================================================================
    // Glyph texture cache
    // =============================================================================

    void SdlRenderSurface::clear_glyph_cache()
    {
        for (auto &entry : glyph_cache_)
        {
            if (entry.second)
                SDL_DestroyTexture(entry.second);
        }
        glyph_cache_.clear();
    }

    SDL_Texture *SdlRenderSurface::get_glyph_texture(char32_t ch, Color fg, bool bold)
    {
        GlyphKey key = {ch, fg.r, fg.g, fg.b, bold};

        auto it = glyph_cache_.find(key);
        if (it != glyph_cache_.end())
            return it->second;

        // Evict everything if the cache gets too large (prevent memory bloat)
        if (glyph_cache_.size() >= MAX_CACHED_GLYPHS)
            clear_glyph_cache();

        TTF_Font *f = font_.get();
        if (bold)
            TTF_SetFontStyle(f, TTF_STYLE_BOLD);

        SDL_Color sdl_color = {fg.r, fg.g, fg.b, fg.a};
        std::string utf8;
        append_utf8(utf8, ch);
        SDL_Surface *surface = TTF_RenderUTF8_Blended(f, utf8.c_str(), sdl_color);

        if (bold)
            TTF_SetFontStyle(f, TTF_STYLE_NORMAL);

        if (!surface)
        {
            glyph_cache_[key] = nullptr;
            return nullptr;
        }

        SDL_Texture *texture = SDL_CreateTextureFromSurface(renderer_, surface);
        SDL_FreeSurface(surface);
        glyph_cache_[key] = texture;
        return texture;
    }

    // =============================================================================
    // Frame
    // =============================================================================

    void SdlRenderSurface::paint(const PaintModel &model)
    {
        if (model.metrics.pixel_size != metrics_.pixel_size ||
            model.metrics.font_path != metrics_.font_path)
            recreate_glyph_atlas(model.metrics);

        const Color &bg = model.palette.background;
        SDL_SetRenderDrawColor(renderer_, bg.r, bg.g, bg.b, 255);
        SDL_RenderClear(renderer_);

        draw_background(model);
        for (const auto &pane : model.panes)
            draw_pane(model, pane);
        if (model.show_tab_bar)
            draw_tab_bar(model);
        if (model.scroll_thumb)
            draw_scroll_bar(model);

        SDL_RenderPresent(renderer_);
    }

    void SdlRenderSurface::draw_background(const PaintModel &model)
    {
        if (model.background != background_source_)
        {
            if (background_)
                SDL_DestroyTexture(background_);
            background_ = nullptr;
            background_source_ = model.background;

            // SDL core decodes BMP only.
            if (background_source_ && !background_source_->data.empty())
            {
                SDL_RWops *rw = SDL_RWFromConstMem(background_source_->data.data(),
                                                   static_cast<int>(background_source_->data.size()));
                SDL_Surface *surface = rw ? SDL_LoadBMP_RW(rw, 1) : nullptr;
                if (surface)
                {
                    background_ = SDL_CreateTextureFromSurface(renderer_, surface);
                    SDL_FreeSurface(surface);
                }
                else
                    TERMWIN_LOG_WARN("cannot decode window background image: " << SDL_GetError());
            }
        }
        if (background_)
            SDL_RenderCopy(renderer_, background_, nullptr, nullptr);
    }

    // =============================================================================
    // Cells
    // =============================================================================

    void SdlRenderSurface::draw_cell(int x, int y, const Cell &cell)
    {
        int cell_w = static_cast<int>(metrics_.cell_size.width);
        int cell_h = static_cast<int>(metrics_.cell_size.height);

        // Default backgrounds show the window background through.
        if (cell.bg != Color::default_bg())
        {
            SDL_Rect bg_rect = {x, y, cell_w, cell_h};
            SDL_SetRenderDrawColor(renderer_, cell.bg.r, cell.bg.g, cell.bg.b, cell.bg.a);
            SDL_RenderFillRect(renderer_, &bg_rect);
        }

        // Skip spaces for performance
        if (cell.ch != U' ' && cell.ch != 0)
        {
            SDL_Texture *tex = get_glyph_texture(cell.ch, cell.fg, cell.bold);
            if (tex)
            {
                int tex_w, tex_h;
                SDL_QueryTexture(tex, nullptr, nullptr, &tex_w, &tex_h);

                // Center the glyph in the cell
                SDL_Rect dst = {x + (cell_w - tex_w) / 2, y + (cell_h - tex_h) / 2, tex_w, tex_h};
                SDL_RenderCopy(renderer_, tex, nullptr, &dst);
            }
        }

        if (cell.underline)
        {
            int uy = y + cell_h - std::max(metrics_.descender / 2, 1);
            SDL_SetRenderDrawColor(renderer_, cell.fg.r, cell.fg.g, cell.fg.b, cell.fg.a);
            SDL_RenderDrawLine(renderer_, x, uy, x + cell_w - 1, uy);
        }
    }

    void SdlRenderSurface::draw_text(int x, int y, const std::string &text, Color fg)
    {
        Line line = Line::from_text(text);
        int cell_w = static_cast<int>(metrics_.cell_size.width);
        for (std::size_t i = 0; i < line.cells.size(); ++i)
        {
            Cell cell = line.cells[i];
            cell.fg = fg;
            cell.bg = Color::default_bg();
            draw_cell(x + static_cast<int>(i) * cell_w, y, cell);
        }
    }

    // =============================================================================
    // Panes
    // =============================================================================

    void SdlRenderSurface::draw_pane(const PaintModel &model, const PaintPane &pane)
    {
        int cell_w = static_cast<int>(metrics_.cell_size.width);
        int cell_h = static_cast<int>(metrics_.cell_size.height);
        int x0 = model.padding.left + static_cast<int>(pane.pos.left) * cell_w;
        int y0 = model.padding.top + (model.show_tab_bar ? cell_h : 0) +
                 static_cast<int>(pane.pos.top) * cell_h;

        for (std::size_t r = 0; r < pane.lines.size() && r < pane.pos.height; ++r)
        {
            const Line &line = pane.lines[r];
            std::size_t width = std::min(line.cells.size(), pane.pos.width);
            for (std::size_t c = 0; c < width; ++c)
                draw_cell(x0 + static_cast<int>(c) * cell_w, y0 + static_cast<int>(r) * cell_h,
                          line.cells[c]);
        }

        draw_selection(model, pane, x0, y0);
        if (pane.draw_cursor)
            draw_cursor(model, pane, x0, y0);
    }

    void SdlRenderSurface::draw_selection(const PaintModel &model, const PaintPane &pane, int x0,
                                          int y0)
    {
        if (!pane.selection)
            return;
        int cell_w = static_cast<int>(metrics_.cell_size.width);
        int cell_h = static_cast<int>(metrics_.cell_size.height);
        const Color &sel = model.palette.selection_bg;

        for (std::size_t r = 0; r < pane.pos.height; ++r)
        {
            StableRowIndex row = pane.top + static_cast<StableRowIndex>(r);
            auto cols = pane.selection->cols_for_row(row);
            std::size_t end = std::min(cols.second, pane.pos.width);
            if (cols.first >= end)
                continue;
            SDL_Rect rect = {x0 + static_cast<int>(cols.first) * cell_w,
                             y0 + static_cast<int>(r) * cell_h,
                             static_cast<int>(end - cols.first) * cell_w, cell_h};
            SDL_SetRenderDrawColor(renderer_, sel.r, sel.g, sel.b, sel.a);
            SDL_RenderFillRect(renderer_, &rect);
        }
    }

    void SdlRenderSurface::draw_cursor(const PaintModel &model, const PaintPane &pane, int x0,
                                       int y0)
    {
        int cell_w = static_cast<int>(metrics_.cell_size.width);
        int cell_h = static_cast<int>(metrics_.cell_size.height);
        std::size_t r = static_cast<std::size_t>(pane.cursor.y - pane.top);
        int x = x0 + static_cast<int>(pane.cursor.x) * cell_w;
        int y = y0 + static_cast<int>(r) * cell_h;
        const Color &cc = model.palette.cursor_bg;
        SDL_SetRenderDrawColor(renderer_, cc.r, cc.g, cc.b, 200); // slightly transparent

        switch (pane.cursor.shape)
        {
        case CursorShape::BlinkingUnderline:
        case CursorShape::SteadyUnderline:
        {
            SDL_Rect rect = {x, y + cell_h - 2, cell_w, 2};
            SDL_RenderFillRect(renderer_, &rect);
            return;
        }
        case CursorShape::BlinkingBar:
        case CursorShape::SteadyBar:
        {
            SDL_Rect rect = {x, y, 2, cell_h};
            SDL_RenderFillRect(renderer_, &rect);
            return;
        }
        default:
            break;
        }

        SDL_Rect cursor_rect = {x, y, cell_w, cell_h};
        SDL_RenderFillRect(renderer_, &cursor_rect);

        // Draw the character under the cursor in inverse color
        if (r < pane.lines.size() && pane.cursor.x < pane.lines[r].cells.size())
        {
            Cell cell = pane.lines[r].cells[pane.cursor.x];
            if (cell.ch != U' ' && cell.ch != 0)
            {
                SDL_Texture *tex = get_glyph_texture(cell.ch, model.palette.background, cell.bold);
                if (tex)
                {
                    int tex_w, tex_h;
                    SDL_QueryTexture(tex, nullptr, nullptr, &tex_w, &tex_h);
                    SDL_Rect dst = {x + (cell_w - tex_w) / 2, y + (cell_h - tex_h) / 2, tex_w, tex_h};
                    SDL_RenderCopy(renderer_, tex, nullptr, &dst);
                }
            }
        }
    }

    // =============================================================================
    // Chrome
    // =============================================================================

    void SdlRenderSurface::draw_tab_bar(const PaintModel &model)
    {
        int cell_w = static_cast<int>(metrics_.cell_size.width);
        int cell_h = static_cast<int>(metrics_.cell_size.height);
        int y = model.padding.top;

        const Color &bar = model.palette.tab_bar_bg;
        SDL_Rect strip = {0, y, static_cast<int>(model.dimensions.pixel_width), cell_h};
        SDL_SetRenderDrawColor(renderer_, bar.r, bar.g, bar.b, bar.a);
        SDL_RenderFillRect(renderer_, &strip);

        for (const auto &tab : model.tab_bar.tabs)
        {
            int x = model.padding.left + static_cast<int>(tab.start_col) * cell_w;
            if (tab.active)
            {
                const Color &a = model.palette.active_tab_bg;
                SDL_Rect rect = {x, y, static_cast<int>(tab.width) * cell_w, cell_h};
                SDL_SetRenderDrawColor(renderer_, a.r, a.g, a.b, a.a);
                SDL_RenderFillRect(renderer_, &rect);
            }
            draw_text(x, y, tab.label, model.palette.foreground);
        }
    }

    void SdlRenderSurface::draw_scroll_bar(const PaintModel &model)
    {
        int cell_h = static_cast<int>(metrics_.cell_size.height);
        int width = static_cast<int>(model.right_padding);
        int x = static_cast<int>(model.dimensions.pixel_width) - width;
        int top = model.padding.top + (model.show_tab_bar ? cell_h : 0);

        const Color &thumb = model.palette.scroll_thumb;
        SDL_Rect rect = {x + 1, top + static_cast<int>(model.scroll_thumb->top),
                         std::max(width - 2, 1), static_cast<int>(model.scroll_thumb->height)};
        SDL_SetRenderDrawColor(renderer_, thumb.r, thumb.g, thumb.b, thumb.a);
        SDL_RenderFillRect(renderer_, &rect);
    }

} // namespace termwin
