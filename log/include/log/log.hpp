#pragma once

#include <log/level.hpp>
#include <log/logger.hpp>

#include <string_view>
#include <utility>

/**
 * Process wide logging. Everything goes to standard error, standard output carries rewritten content.
 */
namespace Log
{
    Logger& globalLogger();

    void setupConsoleLogger(bool colored = true);

    inline void setLevel(Level level)
    {
        globalLogger().setLevel(level);
    }
    inline Level level()
    {
        return globalLogger().level();
    }

    template <typename... Args>
    void log(Level level, std::string_view fmt, Args&&... args)
    {
        globalLogger().log(level, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void trace(std::string_view fmt, Args&&... args)
    {
        log(Level::Trace, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void debug(std::string_view fmt, Args&&... args)
    {
        log(Level::Debug, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void info(std::string_view fmt, Args&&... args)
    {
        log(Level::Info, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void warn(std::string_view fmt, Args&&... args)
    {
        log(Level::Warning, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void error(std::string_view fmt, Args&&... args)
    {
        log(Level::Error, fmt, std::forward<Args>(args)...);
    }
    template <typename... Args>
    void critical(std::string_view fmt, Args&&... args)
    {
        log(Level::Critical, fmt, std::forward<Args>(args)...);
    }
}
