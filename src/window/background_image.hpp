#pragma once

// =============================================================================
// background_image.hpp — raw bytes of the configured window background
// =============================================================================
// Decoding is left to the render surface; the core only keeps the bytes so a
// reload can tell whether the image actually changed.
// =============================================================================

#include <cstdint>
#include <memory>
#include <vector>

namespace termwin
{

    struct Config;

    struct ImageData
    {
        std::vector<uint8_t> data;
    };

    /// Read `config.window_background_image`. Read errors are logged and give
    /// nullptr.
    std::shared_ptr<const ImageData> load_background_image(const Config &config);

    /// Like load_background_image, but returns `existing` when the file holds
    /// the same bytes.
    std::shared_ptr<const ImageData> reload_background_image(
        const Config &config, const std::shared_ptr<const ImageData> &existing);

} // namespace termwin
