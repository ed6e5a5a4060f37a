// =============================================================================
// ttf_font_config.cpp
// =============================================================================

#include "ttf_font_config.hpp"
#include "../config/config.hpp"
#include "../core/errors.hpp"
#include "../core/log.hpp"

#include <SDL2/SDL_ttf.h>

#include <algorithm>
#include <cmath>

namespace termwin
{

    void TtfFontCloser::operator()(TTF_Font *font) const
    {
        if (font)
            TTF_CloseFont(font);
    }

    TtfFontPtr open_ttf_font(const std::string &path, int pixel_size)
    {
        TtfFontPtr font(TTF_OpenFont(path.c_str(), pixel_size));
        if (!font)
            throw FontError("cannot open '" + path + "' at " + std::to_string(pixel_size) +
                            "px: " + TTF_GetError());
        return font;
    }

    TtfFontConfiguration::TtfFontConfiguration(const Config &config)
        : font_path_(config.font_path), font_size_(config.font_size)
    {
        open_ttf_font(font_path_, pixel_size());
    }

    std::pair<double, double> TtfFontConfiguration::change_scaling(double font_scale,
                                                                   double dpi_scale)
    {
        std::pair<double, double> prior{font_scale_, dpi_scale_};
        font_scale_ = font_scale;
        dpi_scale_ = dpi_scale;
        return prior;
    }

    int TtfFontConfiguration::pixel_size() const
    {
        double px = font_size_ * font_scale_ * dpi_scale_ * DEFAULT_DPI / 72.0;
        return std::max(1, static_cast<int>(std::lround(px)));
    }

    RenderMetrics TtfFontConfiguration::metrics()
    {
        int px = pixel_size();
        TtfFontPtr font = open_ttf_font(font_path_, px);

        RenderMetrics m;
        m.font_path = font_path_;
        m.pixel_size = px;

        // Cell width is the advance of 'M'.
        int advance = 0;
        if (TTF_GlyphMetrics(font.get(), 'M', nullptr, nullptr, nullptr, nullptr, &advance) == 0)
            m.cell_size.width = static_cast<std::size_t>(std::max(advance, 1));
        else
            m.cell_size.width = static_cast<std::size_t>(std::max(px * 6 / 10, 1));
        m.cell_size.height = static_cast<std::size_t>(std::max(TTF_FontLineSkip(font.get()), 1));
        m.descender = -TTF_FontDescent(font.get());

        TERMWIN_LOG_TRACE("font " << font_path_ << " at " << px << "px: cell "
                                  << m.cell_size.width << "x" << m.cell_size.height);
        return m;
    }

    void TtfFontConfiguration::config_changed(const Config &config)
    {
        open_ttf_font(config.font_path, pixel_size());
        font_path_ = config.font_path;
        font_size_ = config.font_size;
    }

} // namespace termwin
