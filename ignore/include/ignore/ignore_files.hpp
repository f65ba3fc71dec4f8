#pragma once

#include <ignore/matcher.hpp>
#include <shared_data/error.hpp>

#include <expected>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace Ignore
{
    struct IgnoreFile
    {
        // Lines as read, comments and blanks included.
        std::vector<std::string> lines{};
        // Directory the patterns are relative to.
        std::filesystem::path anchorDirectory{};
        std::filesystem::path source{};
    };

    std::expected<IgnoreFile, SharedData::Error>
    readIgnoreFile(std::filesystem::path const& file, std::filesystem::path anchorDirectory);

    /**
     * @brief Collects the ignore files that apply to startPath: ".git/info/exclude" of the enclosing repository
     * followed by every ".gitignore" from the repository root down to startPath. Outside
     * of a repository only the ".gitignore" of startPath itself is used. Outer files come first, so inner files take precedence.
     */
    std::vector<IgnoreFile> locateIgnoreFiles(std::filesystem::path const& startPath);

    using IgnoreFileLocator = std::function<std::vector<IgnoreFile>(std::filesystem::path const&)>;

    /**
     * @brief Builds a matcher for walking root from the ignore files the locator finds. Malformed patterns are
     * logged and skipped.
     */
    Matcher buildMatcher(std::filesystem::path const& root, IgnoreFileLocator const& locator = locateIgnoreFiles);

    /**
     * @brief Adds an ignore file found inside the walk, at scope relative to the walk root.
     */
    void addNestedIgnoreFile(Matcher& matcher, IgnoreFile const& file, std::filesystem::path const& scope);
}
