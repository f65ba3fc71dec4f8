#pragma once

#include <ignore/pattern.hpp>
#include <shared_data/error.hpp>

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace Ignore
{
    /**
     * @brief Decides whether a path below the walk root is excluded by gitignore rules.
     *
     * Rules are kept in groups. A group only applies to paths below its scope (a directory relative to the walk
     * root, empty for everything). Before matching, paths are made relative to the group's scope and prepended
     * with its prefix, so ignore files anchored above the walk root see paths relative to their own directory.
     * The last matching pattern decides, a negated pattern re-includes. A path is excluded as well when any of
     * its parent directories is.
     */
    class Matcher
    {
      public:
        struct PatternGroup
        {
            std::string scope{};
            std::string prefix{};
            std::vector<Pattern> patterns{};
        };

        /// Excludes nothing until patterns are added.
        Matcher() = default;

        /// A matcher that ignores all added patterns.
        static Matcher disabled();

        /**
         * @brief Compiles patterns that are rooted at the walk root. Fails on the first malformed pattern.
         */
        static std::expected<Matcher, SharedData::Error> compile(std::vector<std::string> const& lines);

        /**
         * @brief Adds lines of an ignore file. Fails on the first malformed pattern without adding any.
         */
        std::expected<void, SharedData::Error>
        addPatterns(std::vector<std::string> const& lines, std::string scope = {}, std::string prefix = {});

        /**
         * @brief Adds the lines that parse and returns the errors of the lines that do not.
         */
        std::vector<SharedData::Error>
        addPatternsSkippingInvalid(std::vector<std::string> const& lines, std::string scope = {}, std::string prefix = {});

        bool isExcluded(std::filesystem::path const& relativePath, bool isDirectory) const;

        bool isDisabled() const
        {
            return disabled_;
        }
        std::size_t patternCount() const;

      private:
        bool decide(std::string const& path, bool isDirectory) const;

      private:
        std::vector<PatternGroup> groups_{};
        bool disabled_{false};
    };
}
