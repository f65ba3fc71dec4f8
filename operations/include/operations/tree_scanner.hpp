#pragma once

#include <ignore/matcher.hpp>
#include <shared_data/directory_entry.hpp>
#include <shared_data/error.hpp>

#include <expected>
#include <filesystem>
#include <functional>
#include <vector>

namespace Operations
{
    struct TreeScanOptions
    {
        bool skipHidden{true};
    };

    /**
     * @brief Lists one directory for Utility::DeepDirectoryWalker. Drops ".git", hidden entries (if configured) and
     * everything the ignore matcher excludes, so excluded directories are never descended into. Entries are
     * sorted by name.
     *
     * A ".gitignore" inside the walked tree is added to the matcher before the directory's children are filtered.
     * The one in the root directory is expected to be loaded by Ignore::buildMatcher already.
     *
     * Only a directory that cannot be opened fails as a whole. Entries that cannot be inspected, and a listing
     * that breaks off midway, are handed to the entry error handler and the entries found so far are kept.
     */
    class TreeScanner
    {
      public:
        using EntryErrorHandler = std::function<void(SharedData::Error)>;

        TreeScanner(
            std::filesystem::path root,
            Ignore::Matcher& matcher,
            TreeScanOptions options = {},
            EntryErrorHandler onEntryError = {});

        std::expected<std::vector<SharedData::DirectoryEntry>, SharedData::Error>
        operator()(std::filesystem::path const& directory);

      private:
        void loadNestedIgnoreFile(std::filesystem::path const& directory, std::filesystem::path const& relative);
        void entryFailed(SharedData::Error error) const;

      private:
        std::filesystem::path root_;
        Ignore::Matcher* matcher_;
        TreeScanOptions options_;
        EntryErrorHandler onEntryError_;
    };
}
