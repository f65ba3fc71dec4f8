#pragma once

#include <log/level.hpp>

#include <spdlog/spdlog.h>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    /**
     * @brief Wraps one spdlog logger. Messages below the level are dropped before they are formatted.
     */
    class Logger
    {
      public:
        /**
         * @brief (Re)creates the standard error sink.
         *
         * @param colored Use a color sink, only sensible when standard error is a terminal.
         */
        void setup(bool colored);

        void setLevel(Level level);
        Level level() const
        {
            return level_.load();
        }

        template <typename... Args>
        void log(Level level, std::string_view fmt, Args&&... args)
        {
            if (level < level_.load() || level == Level::Off)
                return;
            write(level, spdlog::fmt_lib::format(spdlog::fmt_lib::runtime(fmt), std::forward<Args>(args)...));
        }

      private:
        void write(Level level, std::string const& message);

      private:
        std::mutex sinkGuard_{};
        std::shared_ptr<spdlog::logger> sink_{};
        std::atomic<Level> level_{Level::Info};
    };
}
