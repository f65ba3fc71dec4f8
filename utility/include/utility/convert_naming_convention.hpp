#pragma once

#include <utility/describe.hpp>

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace Utility
{
    BOOST_DEFINE_ENUM_CLASS(NamingConvention, Pascal, Camel, Kebab, Snake, ScreamingSnake, Unknown)

    /// All conventions a word sequence can be rendered in unambiguously.
    inline constexpr std::array<NamingConvention, 5> renderableConventions{
        NamingConvention::Pascal,
        NamingConvention::Camel,
        NamingConvention::Kebab,
        NamingConvention::Snake,
        NamingConvention::ScreamingSnake,
    };

    /**
     * @brief An identifier split into lower case words, together with the convention it was written in.
     */
    struct SegmentedString
    {
        std::vector<std::string> normalizedSegments{};
        NamingConvention convention{NamingConvention::Unknown};

        std::string camelCase() const;
        std::string pascalCase() const;
        std::string snakeCase() const;
        std::string screamingSnakeCase() const;
        std::string kebabCase() const;
        std::string joined(std::string_view delimiter) const;

        /**
         * @brief Renders the words in the given convention. Unknown joins the words without a separator.
         */
        std::string render(NamingConvention target) const;

        /**
         * @brief Renders the words in the convention they were tokenized from.
         */
        std::string render() const
        {
            return render(convention);
        }
    };

    /**
     * @brief Splits on every occurrence of separator. Words are lower cased, empty words are dropped.
     */
    SegmentedString splitBySeparator(std::string_view input, char separator);

    /**
     * @brief Splits camelCase and PascalCase identifiers. A word starts at an upper case letter following a lower
     * case letter or digit, and at the last upper case letter of an acronym ("XMLParser" -> xml, parser).
     */
    SegmentedString splitByCaseBoundaries(std::string_view input);

    /**
     * @brief Splits input into words and detects its naming convention.
     *
     * '-' takes precedence over '_', which takes precedence over case boundaries. Input that yields fewer than two
     * words has the Unknown convention.
     */
    SegmentedString tokenize(std::string_view input);
}
