// =============================================================================
// background_image.cpp
// =============================================================================

#include "background_image.hpp"
#include "../config/config.hpp"
#include "../core/log.hpp"

#include <fstream>
#include <iterator>

namespace termwin
{

    std::shared_ptr<const ImageData> load_background_image(const Config &config)
    {
        if (!config.window_background_image)
            return nullptr;

        const auto &path = *config.window_background_image;
        std::ifstream file(path, std::ios::binary);
        if (!file)
        {
            TERMWIN_LOG_ERROR("unable to load window background image " << path.string());
            return nullptr;
        }

        auto image = std::make_shared<ImageData>();
        image->data.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
        if (file.bad())
        {
            TERMWIN_LOG_ERROR("error reading window background image " << path.string());
            return nullptr;
        }
        return image;
    }

    std::shared_ptr<const ImageData> reload_background_image(
        const Config &config, const std::shared_ptr<const ImageData> &existing)
    {
        auto image = load_background_image(config);
        if (image && existing && image->data == existing->data)
            return existing;
        return image;
    }

} // namespace termwin
