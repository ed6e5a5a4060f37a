#pragma once

// =============================================================================
// font_config.hpp — font metrics provider
// =============================================================================

#include "geometry.hpp"

#include <utility>

namespace termwin
{

    struct Config;

    class FontConfiguration
    {
    public:
        virtual ~FontConfiguration() = default;

        virtual double get_font_scale() const = 0;
        virtual double get_dpi_scale() const = 0;

        /// Switch scaling; returns the previous (font_scale, dpi_scale) so a
        /// failed switch can be undone.
        virtual std::pair<double, double> change_scaling(double font_scale, double dpi_scale) = 0;

        /// Cell metrics at the current scaling. Throws FontError.
        virtual RenderMetrics metrics() = 0;

        /// Pick up new font settings. Throws FontError.
        virtual void config_changed(const Config &config) = 0;
    };

} // namespace termwin
