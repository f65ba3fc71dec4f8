#include <operations/tree_scanner.hpp>
#include <ignore/ignore_files.hpp>
#include <log/log.hpp>

#include <algorithm>
#include <system_error>

namespace Operations
{
    TreeScanner::TreeScanner(
        std::filesystem::path root,
        Ignore::Matcher& matcher,
        TreeScanOptions options,
        EntryErrorHandler onEntryError)
        : root_{std::move(root)}
        , matcher_{&matcher}
        , options_{options}
        , onEntryError_{std::move(onEntryError)}
    {}

    void TreeScanner::entryFailed(SharedData::Error error) const
    {
        if (onEntryError_)
            onEntryError_(std::move(error));
        else
            Log::warn("TreeScanner: {}", error.toString());
    }

    void TreeScanner::loadNestedIgnoreFile(std::filesystem::path const& directory, std::filesystem::path const& relative)
    {
        const auto ignoreFilePath = directory / ".gitignore";
        std::error_code ec;
        if (!std::filesystem::is_regular_file(ignoreFilePath, ec))
            return;

        auto ignoreFile = Ignore::readIgnoreFile(ignoreFilePath, directory);
        if (!ignoreFile)
        {
            Log::warn("TreeScanner: {}", ignoreFile.error().toString());
            return;
        }
        Log::debug("TreeScanner: Using '{}'.", ignoreFilePath.generic_string());
        Ignore::addNestedIgnoreFile(*matcher_, *ignoreFile, relative);
    }

    std::expected<std::vector<SharedData::DirectoryEntry>, SharedData::Error>
    TreeScanner::operator()(std::filesystem::path const& directory)
    {
        const auto relativeDirectory = directory == root_ ? std::filesystem::path{} : directory.lexically_relative(root_);
        if (!relativeDirectory.empty() && !matcher_->isDisabled())
            loadNestedIgnoreFile(directory, relativeDirectory);

        std::error_code ec;
        std::filesystem::directory_iterator iter{directory, ec};
        if (ec)
            return std::unexpected(SharedData::ioFailure(directory, ec, "Could not list directory"));

        std::vector<SharedData::DirectoryEntry> entries{};
        for (; iter != std::filesystem::directory_iterator{}; iter.increment(ec))
        {
            if (ec)
                break;

            const auto name = iter->path().filename();
            const auto nameString = name.string();
            if (nameString == ".git")
                continue;
            if (options_.skipHidden && nameString.starts_with('.'))
            {
                Log::trace("TreeScanner: Skipping hidden '{}'.", iter->path().generic_string());
                continue;
            }

            std::error_code statusError;
            const auto status = iter->symlink_status(statusError);
            if (statusError)
            {
                entryFailed(SharedData::ioFailure(iter->path(), statusError, "Could not stat"));
                continue;
            }

            SharedData::DirectoryEntry entry{
                .path = name,
                .type = SharedData::fileTypeOf(status),
            };

            if (matcher_->isExcluded(relativeDirectory / name, entry.isDirectory()))
            {
                Log::debug("TreeScanner: Ignoring '{}'.", iter->path().generic_string());
                continue;
            }

            entries.push_back(std::move(entry));
        }
        if (ec)
            entryFailed(SharedData::ioFailure(directory, ec, "Listing broke off"));

        std::sort(entries.begin(), entries.end(), [](auto const& lhs, auto const& rhs) {
            return lhs.path < rhs.path;
        });
        return entries;
    }
}
