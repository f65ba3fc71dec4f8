#include <utility/convert_naming_convention.hpp>
#include <utility/algorithm/case_convert.hpp>

#include <algorithm>

namespace Utility
{
    using namespace Utility::Algorithm;

    std::string SegmentedString::camelCase() const
    {
        if (normalizedSegments.empty())
            return {};

        std::string result = normalizedSegments[0];
        for (std::size_t i = 1; i < normalizedSegments.size(); ++i)
            result += capitalize(normalizedSegments[i]);
        return result;
    }

    std::string SegmentedString::pascalCase() const
    {
        std::string result;
        for (auto const& segment : normalizedSegments)
            result += capitalize(segment);
        return result;
    }

    std::string SegmentedString::snakeCase() const
    {
        return joined("_");
    }

    std::string SegmentedString::screamingSnakeCase() const
    {
        return toUpperCase(joined("_"));
    }

    std::string SegmentedString::kebabCase() const
    {
        return joined("-");
    }

    std::string SegmentedString::joined(std::string_view delimiter) const
    {
        if (normalizedSegments.empty())
            return {};

        std::string result = normalizedSegments[0];
        for (std::size_t i = 1; i < normalizedSegments.size(); ++i)
        {
            result += delimiter;
            result += normalizedSegments[i];
        }
        return result;
    }

    std::string SegmentedString::render(NamingConvention target) const
    {
        switch (target)
        {
            case NamingConvention::Pascal:
                return pascalCase();
            case NamingConvention::Camel:
                return camelCase();
            case NamingConvention::Kebab:
                return kebabCase();
            case NamingConvention::Snake:
                return snakeCase();
            case NamingConvention::ScreamingSnake:
                return screamingSnakeCase();
            case NamingConvention::Unknown:
                return joined("");
        }
        return joined("");
    }

    SegmentedString splitBySeparator(std::string_view input, char separator)
    {
        SegmentedString result;

        std::string currentSegment{};
        for (auto const ch : input)
        {
            if (ch == separator)
            {
                if (!currentSegment.empty())
                    result.normalizedSegments.push_back(std::move(currentSegment));
                currentSegment.clear();
            }
            else
                currentSegment += toLower(ch);
        }
        if (!currentSegment.empty())
            result.normalizedSegments.push_back(std::move(currentSegment));
        return result;
    }

    SegmentedString splitByCaseBoundaries(std::string_view input)
    {
        SegmentedString result;

        std::string currentSegment{};
        for (std::size_t i = 0; i < input.size(); ++i)
        {
            const char ch = input[i];
            if (i > 0 && isUpper(ch) && !currentSegment.empty())
            {
                const char previous = input[i - 1];
                const bool endsAcronym = isUpper(previous) && i + 1 < input.size() && isLower(input[i + 1]);
                if (isLower(previous) || isDigit(previous) || endsAcronym)
                {
                    result.normalizedSegments.push_back(std::move(currentSegment));
                    currentSegment.clear();
                }
            }
            currentSegment += toLower(ch);
        }
        if (!currentSegment.empty())
            result.normalizedSegments.push_back(std::move(currentSegment));
        return result;
    }

    SegmentedString tokenize(std::string_view input)
    {
        SegmentedString result;
        if (input.empty())
            return result;

        if (input.find('-') != std::string_view::npos)
        {
            result = splitBySeparator(input, '-');
            result.convention = NamingConvention::Kebab;
        }
        else if (input.find('_') != std::string_view::npos)
        {
            result = splitBySeparator(input, '_');
            const bool hasLetters = std::any_of(input.begin(), input.end(), isAlpha);
            const bool allUpper = std::none_of(input.begin(), input.end(), isLower);
            result.convention =
                hasLetters && allUpper ? NamingConvention::ScreamingSnake : NamingConvention::Snake;
        }
        else
        {
            result = splitByCaseBoundaries(input);
            result.convention = isUpper(input.front()) ? NamingConvention::Pascal : NamingConvention::Camel;
        }

        if (result.normalizedSegments.size() < 2)
            result.convention = NamingConvention::Unknown;
        return result;
    }
}
