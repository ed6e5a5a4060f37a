// =============================================================================
// log.cpp — leveled diagnostics on stderr
// =============================================================================

#include "log.hpp"

#include <atomic>
#include <cstdlib>
#include <iostream>
#include <mutex>

namespace termwin
{
    namespace log
    {

        static std::atomic<int> g_level{static_cast<int>(Level::Info)};
        static std::mutex g_write_mutex;

        void set_level(Level lvl)
        {
            g_level.store(static_cast<int>(lvl));
        }

        Level level()
        {
            return static_cast<Level>(g_level.load());
        }

        bool enabled(Level lvl)
        {
            return static_cast<int>(lvl) >= g_level.load();
        }

        Level level_from_string(const std::string &name, Level fallback)
        {
            if (name == "trace")
                return Level::Trace;
            if (name == "debug")
                return Level::Debug;
            if (name == "info")
                return Level::Info;
            if (name == "warn")
                return Level::Warn;
            if (name == "error")
                return Level::Error;
            return fallback;
        }

        void init_from_env()
        {
            const char *env = std::getenv("TERMWIN_LOG");
            if (env && env[0])
                set_level(level_from_string(env, level()));
        }

        static const char *level_name(Level lvl)
        {
            switch (lvl)
            {
            case Level::Trace:
                return "TRACE";
            case Level::Debug:
                return "DEBUG";
            case Level::Info:
                return "INFO";
            case Level::Warn:
                return "WARN";
            case Level::Error:
                return "ERROR";
            }
            return "?";
        }

        void write(Level lvl, const std::string &message)
        {
            std::lock_guard<std::mutex> lock(g_write_mutex);
            std::cerr << "[termwin] " << level_name(lvl) << " " << message << std::endl;
        }

    } // namespace log
} // namespace termwin
