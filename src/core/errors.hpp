#pragma once

// =============================================================================
// termwin Error Hierarchy
// =============================================================================
// Every error the window core can raise lives here. All inherit from
// WindowError, which inherits from std::runtime_error, so a single
// `catch (WindowError&)` catches any termwin-specific error. Each subclass
// carries a category and provides a formatted `.what()` message.
//
// Recoverable errors (config, font, render surface resize) are caught at the
// core boundary, logged, and the prior state is kept. RenderSurfaceLost is
// fatal and is left to propagate to the front end.
// =============================================================================

#include <stdexcept>
#include <string>

namespace termwin
{

    // ========================================================================
    // Base: WindowError
    // ========================================================================
    // Standardised "[termwin] Category: message" format.
    // ========================================================================

    class WindowError : public std::runtime_error
    {
    public:
        WindowError(const std::string &category, const std::string &message)
            : std::runtime_error(formatMessage(category, message)),
              category_(category), detail_(message) {}

        const std::string &category() const noexcept { return category_; }
        const std::string &detail() const noexcept { return detail_; }

    private:
        std::string category_;
        std::string detail_;

        static std::string formatMessage(const std::string &category,
                                         const std::string &message)
        {
            return "[termwin] " + category + ": " + message;
        }
    };

    // ========================================================================
    // 1. Configuration errors
    // ========================================================================

    /// Malformed rc file line, unknown key, bad value or override.
    class ConfigError : public WindowError
    {
    public:
        ConfigError(const std::string &message, int line = 0)
            : WindowError("ConfigError",
                          line > 0 ? "line " + std::to_string(line) + ": " + message
                                   : message),
              line_(line) {}

        int line() const noexcept { return line_; }

    private:
        int line_;
    };

    // ========================================================================
    // 2. Resource errors (recoverable)
    // ========================================================================

    /// Font could not be loaded or measured at the requested scale.
    class FontError : public WindowError
    {
    public:
        explicit FontError(const std::string &message)
            : WindowError("FontError", message) {}
    };

    /// The render surface refused a resize or atlas rebuild.
    class RenderSurfaceError : public WindowError
    {
    public:
        explicit RenderSurfaceError(const std::string &message)
            : WindowError("RenderSurfaceError", message) {}
    };

    // ========================================================================
    // 3. Fatal errors
    // ========================================================================

    /// No render surface could be acquired for a live window. There is no
    /// degraded mode for a window without a renderer.
    class RenderSurfaceLost : public WindowError
    {
    public:
        explicit RenderSurfaceLost(const std::string &message)
            : WindowError("RenderSurfaceLost", message) {}
    };

    // ========================================================================
    // 4. Multiplexer / overlay errors
    // ========================================================================

    /// Operation on a window or tab that is not in a state to perform it.
    class MuxError : public WindowError
    {
    public:
        explicit MuxError(const std::string &message)
            : WindowError("MuxError", message) {}
    };

    /// An overlay lifecycle task failed.
    class OverlayError : public WindowError
    {
    public:
        explicit OverlayError(const std::string &message)
            : WindowError("OverlayError", message) {}
    };

} // namespace termwin
