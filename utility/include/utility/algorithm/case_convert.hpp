#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace Utility::Algorithm
{
    // <cctype> is undefined for negative char values, UTF-8 continuation bytes are passed through untouched.
    inline bool isUpper(char c)
    {
        return std::isupper(static_cast<unsigned char>(c)) != 0;
    }
    inline bool isLower(char c)
    {
        return std::islower(static_cast<unsigned char>(c)) != 0;
    }
    inline bool isAlpha(char c)
    {
        return std::isalpha(static_cast<unsigned char>(c)) != 0;
    }
    inline bool isDigit(char c)
    {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    }
    inline char toUpper(char c)
    {
        return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    inline char toLower(char c)
    {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    /**
     * @brief Converts the passed string to upper case by out paramter.
     *
     * @param input The string to convert.
     */
    inline void toUpperCaseInplace(std::string& input)
    {
        std::transform(input.begin(), input.end(), input.begin(), [](char c) {
            return toUpper(c);
        });
    }

    /**
     * @brief Converts the passed string to upper case and returns it.
     *
     * @param input The string to convert.
     * @return std::string The string in upper case.
     */
    inline std::string toUpperCase(std::string_view input)
    {
        std::string result{input};
        toUpperCaseInplace(result);
        return result;
    }

    /**
     * @brief Converts the passed string to lower case by out paramter.
     *
     * @param input The string to convert.
     */
    inline void toLowerCaseInplace(std::string& input)
    {
        std::transform(input.begin(), input.end(), input.begin(), [](char c) {
            return toLower(c);
        });
    }

    /**
     * @brief Converts the passed string to lower case and returns it.
     *
     * @param input The string to convert.
     * @return std::string The string in lower case.
     */
    inline std::string toLowerCase(std::string_view input)
    {
        std::string result{input};
        toLowerCaseInplace(result);
        return result;
    }

    /**
     * @brief Upper cases the first character, leaves the rest as is.
     */
    inline std::string capitalize(std::string_view input)
    {
        std::string result{input};
        if (!result.empty())
            result.front() = toUpper(result.front());
        return result;
    }
}
