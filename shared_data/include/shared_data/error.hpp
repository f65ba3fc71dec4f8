#pragma once

#include <shared_data/error_type.hpp>

#include <fmt/format.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace SharedData
{
    struct Error
    {
        ErrorType type;
        std::optional<std::filesystem::path> path = std::nullopt;
        std::optional<std::string> extraInfo = std::nullopt;

        std::string toString() const
        {
            const auto enumString = boost::describe::enum_to_string(type, "INVALID_ENUM_VALUE");
            if (path.has_value())
            {
                if (extraInfo)
                    return fmt::format("{}: '{}': {}.", enumString, path->generic_string(), *extraInfo);
                else
                    return fmt::format("{}: '{}'.", enumString, path->generic_string());
            }
            if (extraInfo)
                return fmt::format("{}: {}.", enumString, *extraInfo);
            return enumString;
        }
    };

    inline Error ioFailure(std::filesystem::path path, std::error_code const& ec, std::string_view action)
    {
        return Error{
            .type = ErrorType::IOFailure,
            .path = std::move(path),
            .extraInfo = fmt::format("{}: {}", action, ec.message()),
        };
    }
}
