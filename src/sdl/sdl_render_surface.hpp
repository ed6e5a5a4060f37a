#pragma once

// =============================================================================
// sdl_render_surface.hpp — paints a PaintModel with SDL2 + SDL_ttf
// =============================================================================
// Draws the panes as grids of monospace glyphs, then the selection, cursor,
// tab bar and scroll bar on top. Glyph textures are cached per (char, color,
// bold) so repeated characters are not re-rendered from the font every frame.
// =============================================================================

#include "../window/render_surface.hpp"
#include "ttf_font_config.hpp"

#include <cstdint>
#include <functional>
#include <unordered_map>

struct SDL_Window;
struct SDL_Renderer;
struct SDL_Texture;

namespace termwin
{

    class SdlRenderSurface : public RenderSurface
    {
    public:
        /// Throws RenderSurfaceError when no SDL renderer can be created.
        SdlRenderSurface(SDL_Window *window, const RenderMetrics &metrics);
        ~SdlRenderSurface() override;

        SdlRenderSurface(const SdlRenderSurface &) = delete;
        SdlRenderSurface &operator=(const SdlRenderSurface &) = delete;

        void advise_of_window_size_change(const RenderMetrics &metrics, std::size_t pixel_width,
                                          std::size_t pixel_height) override;
        void recreate_glyph_atlas(const RenderMetrics &metrics) override;
        void clear_glyph_cache() override;
        void paint(const PaintModel &model) override;

    private:
        SDL_Renderer *renderer_ = nullptr;
        TtfFontPtr font_;
        RenderMetrics metrics_;

        // Glyph texture cache
        struct GlyphKey
        {
            char32_t ch;
            uint8_t fg_r, fg_g, fg_b;
            bool bold;
            bool operator==(const GlyphKey &o) const
            {
                return ch == o.ch && fg_r == o.fg_r && fg_g == o.fg_g &&
                       fg_b == o.fg_b && bold == o.bold;
            }
        };

        struct GlyphKeyHash
        {
            size_t operator()(const GlyphKey &k) const
            {
                size_t h = std::hash<char32_t>{}(k.ch);
                h ^= std::hash<uint8_t>{}(k.fg_r) << 1;
                h ^= std::hash<uint8_t>{}(k.fg_g) << 2;
                h ^= std::hash<uint8_t>{}(k.fg_b) << 3;
                h ^= std::hash<bool>{}(k.bold) << 4;
                return h;
            }
        };

        static constexpr std::size_t MAX_CACHED_GLYPHS = 8192;
        std::unordered_map<GlyphKey, SDL_Texture *, GlyphKeyHash> glyph_cache_;

        // Decoded window background; rebuilt when the image bytes change.
        std::shared_ptr<const ImageData> background_source_;
        SDL_Texture *background_ = nullptr;

        SDL_Texture *get_glyph_texture(char32_t ch, Color fg, bool bold);
        void draw_background(const PaintModel &model);
        void draw_cell(int x, int y, const Cell &cell);
        void draw_text(int x, int y, const std::string &text, Color fg);
        void draw_pane(const PaintModel &model, const PaintPane &pane);
        void draw_selection(const PaintModel &model, const PaintPane &pane, int x0, int y0);
        void draw_cursor(const PaintModel &model, const PaintPane &pane, int x0, int y0);
        void draw_tab_bar(const PaintModel &model);
        void draw_scroll_bar(const PaintModel &model);
    };

} // namespace termwin
