#pragma once

#include <nlohmann/json.hpp>

#include <optional>

namespace Persistence
{
    // Absent and null keys both read as "not set", unset members are not written.
    template <typename T>
    void readOptional(nlohmann::json const& json, char const* key, std::optional<T>& member)
    {
        const auto iter = json.find(key);
        if (iter == json.end() || iter->is_null())
            member.reset();
        else
            member = iter->template get<T>();
    }

    template <typename T>
    void writeOptional(nlohmann::json& json, char const* key, std::optional<T> const& member)
    {
        if (member.has_value())
            json[key] = *member;
    }
}

#define TO_JSON_OPTIONAL(JSON, OBJECT, MEMBER) ::Persistence::writeOptional(JSON, #MEMBER, (OBJECT).MEMBER)
#define FROM_JSON_OPTIONAL(JSON, OBJECT, MEMBER) ::Persistence::readOptional(JSON, #MEMBER, (OBJECT).MEMBER)
