#pragma once

#include <shared_data/error.hpp>

#include <expected>
#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace Ignore
{
    /**
     * @brief A single gitignore pattern, compiled to a regular expression.
     *
     * Supports comments, escapes, negation with '!', directory only patterns with a trailing '/', anchoring by a
     * contained '/', the wildcards '*' and '?', bracket expressions and '**'.
     */
    class Pattern
    {
      public:
        /**
         * @brief Parses one line of an ignore file.
         *
         * @return std::nullopt for blank and comment lines, an InvalidIgnorePattern error for malformed patterns.
         */
        static std::expected<std::optional<Pattern>, SharedData::Error> parse(std::string_view line);

        /**
         * @param relativePath '/' separated path relative to the directory the pattern is anchored at.
         */
        bool matches(std::string const& relativePath, bool isDirectory) const;

        bool negated() const
        {
            return negated_;
        }
        bool directoryOnly() const
        {
            return directoryOnly_;
        }
        bool anchored() const
        {
            return anchored_;
        }
        std::string const& source() const
        {
            return source_;
        }

      private:
        Pattern() = default;

      private:
        std::string source_{};
        bool negated_{false};
        bool directoryOnly_{false};
        bool anchored_{false};
        std::regex regex_{};
    };

    /**
     * @brief Translates a glob (without negation and trailing slash) into an ECMAScript regex body.
     *
     * @return The regex or an error message for unterminated bracket expressions and dangling escapes.
     */
    std::expected<std::string, std::string> globToRegex(std::string_view glob);
}
