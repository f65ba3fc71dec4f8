#include <log/log.hpp>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace Log
{
    namespace
    {
        constexpr char const* loggerName = "mane";

        spdlog::level::level_enum toSpdlog(Level level)
        {
            using enum Level;
            switch (level)
            {
                case Trace:
                    return spdlog::level::trace;
                case Debug:
                    return spdlog::level::debug;
                case Info:
                    return spdlog::level::info;
                case Warning:
                    return spdlog::level::warn;
                case Error:
                    return spdlog::level::err;
                case Critical:
                    return spdlog::level::critical;
                case Off:
                    break;
            }
            return spdlog::level::off;
        }
    }

    Logger& globalLogger()
    {
        static Logger logger;
        return logger;
    }

    void setupConsoleLogger(bool colored)
    {
        globalLogger().setup(colored);
    }

    void Logger::setup(bool colored)
    {
        std::scoped_lock lock{sinkGuard_};

        // The registry rejects a second logger with the same name.
        spdlog::drop(loggerName);
        sink_ = colored ? spdlog::stderr_color_mt(loggerName) : spdlog::stderr_logger_mt(loggerName);
        sink_->set_pattern("[%^%l%$] %v");
        sink_->set_level(toSpdlog(level_.load()));
    }

    void Logger::setLevel(Level level)
    {
        level_.store(level);

        std::scoped_lock lock{sinkGuard_};
        if (sink_)
            sink_->set_level(toSpdlog(level));
        else
            spdlog::set_level(toSpdlog(level));
    }

    void Logger::write(Level level, std::string const& message)
    {
        std::scoped_lock lock{sinkGuard_};
        if (sink_)
            sink_->log(toSpdlog(level), message);
        else
            spdlog::log(toSpdlog(level), message);
    }
}
