#pragma once

// =============================================================================
// log.hpp — leveled diagnostics on stderr
// =============================================================================
// Lines look like "[termwin] WARN refusing to go to ...". Overlay tasks log
// from executor threads, so writes are serialized.
// =============================================================================

#include <sstream>
#include <string>

namespace termwin
{
    namespace log
    {

        enum class Level
        {
            Trace = 0,
            Debug,
            Info,
            Warn,
            Error,
        };

        void set_level(Level level);
        Level level();
        bool enabled(Level level);

        /// Parse "trace|debug|info|warn|error"; anything else yields `fallback`.
        Level level_from_string(const std::string &name, Level fallback);

        /// Apply $TERMWIN_LOG if set.
        void init_from_env();

        void write(Level level, const std::string &message);

    } // namespace log
} // namespace termwin

#define TERMWIN_LOG_AT(lvl, expr)                            \
    do                                                       \
    {                                                        \
        if (::termwin::log::enabled(lvl))                    \
        {                                                    \
            std::ostringstream termwin_log_os_;              \
            termwin_log_os_ << expr;                         \
            ::termwin::log::write(lvl, termwin_log_os_.str()); \
        }                                                    \
    } while (0)

#define TERMWIN_LOG_TRACE(expr) TERMWIN_LOG_AT(::termwin::log::Level::Trace, expr)
#define TERMWIN_LOG_DEBUG(expr) TERMWIN_LOG_AT(::termwin::log::Level::Debug, expr)
#define TERMWIN_LOG_INFO(expr) TERMWIN_LOG_AT(::termwin::log::Level::Info, expr)
#define TERMWIN_LOG_WARN(expr) TERMWIN_LOG_AT(::termwin::log::Level::Warn, expr)
#define TERMWIN_LOG_ERROR(expr) TERMWIN_LOG_AT(::termwin::log::Level::Error, expr)
