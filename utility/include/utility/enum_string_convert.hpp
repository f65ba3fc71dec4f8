#pragma once

#include <utility/describe.hpp>

#include <stdexcept>
#include <string>

namespace Utility
{
    /**
     * @brief Name of a described enumerator.
     *
     * @throws std::invalid_argument for values that are no enumerator.
     */
    template <typename EnumType>
    std::string enumToString(EnumType const& enumValue)
    {
        char const* name = boost::describe::enum_to_string(enumValue, nullptr);
        if (name == nullptr)
            throw std::invalid_argument("Value is not an enumerator");
        return name;
    }
}
