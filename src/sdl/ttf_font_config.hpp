#pragma once

// =============================================================================
// ttf_font_config.hpp — cell metrics measured with SDL_ttf
// =============================================================================
// SDL_ttf renders at 72 dpi, so a point size equals a pixel size there. The
// pixel size is font_size * font_scale * dpi / 72, with dpi = 96 * dpi_scale.
// =============================================================================

#include "../window/font_config.hpp"

#include <memory>
#include <string>

struct _TTF_Font;
typedef struct _TTF_Font TTF_Font;

namespace termwin
{

    struct TtfFontCloser
    {
        void operator()(TTF_Font *font) const;
    };
    using TtfFontPtr = std::unique_ptr<TTF_Font, TtfFontCloser>;

    /// Open `path` at `pixel_size`. Throws FontError.
    TtfFontPtr open_ttf_font(const std::string &path, int pixel_size);

    class TtfFontConfiguration : public FontConfiguration
    {
    public:
        /// Throws FontError when the configured font cannot be opened.
        explicit TtfFontConfiguration(const Config &config);

        double get_font_scale() const override { return font_scale_; }
        double get_dpi_scale() const override { return dpi_scale_; }
        std::pair<double, double> change_scaling(double font_scale, double dpi_scale) override;
        RenderMetrics metrics() override;
        void config_changed(const Config &config) override;

        int pixel_size() const;

    private:
        std::string font_path_;
        double font_size_;
        double font_scale_ = 1.0;
        double dpi_scale_ = 1.0;
    };

} // namespace termwin
