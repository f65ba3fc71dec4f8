#pragma once

#include <utility/algorithm/case_convert.hpp>

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace Log
{
    // Ordered by severity, comparisons decide what gets through.
    enum class Level
    {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
        Critical,
        Off
    };

    namespace Detail
    {
        inline constexpr std::array<std::pair<std::string_view, Level>, 8> levelNames{{
            {"trace", Level::Trace},
            {"debug", Level::Debug},
            {"info", Level::Info},
            {"warning", Level::Warning},
            {"warn", Level::Warning},
            {"error", Level::Error},
            {"critical", Level::Critical},
            {"off", Level::Off},
        }};
    }

    /**
     * @brief Case insensitive, "warn" is an alias of "warning".
     */
    inline std::optional<Level> parseLevel(std::string_view name)
    {
        const auto lowered = Utility::Algorithm::toLowerCase(std::string{name});
        for (auto const& [levelName, level] : Detail::levelNames)
        {
            if (levelName == lowered)
                return level;
        }
        return std::nullopt;
    }

    inline Level levelFromString(std::string_view name)
    {
        return parseLevel(name).value_or(Level::Info);
    }
}
