#include <operations/in_place_operation.hpp>
#include <operations/tree_scanner.hpp>
#include <log/log.hpp>
#include <utility/directory_traversal.hpp>
#include <utility/file_io.hpp>
#include <utility/text_detection.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <system_error>

namespace Operations
{
    InPlaceOperation::InPlaceOperation(
        Replace::RuleSet const& rules,
        InPlaceOperationOptions options,
        MatcherFactory matcherFactory)
        : Operation{}
        , rules_{&rules}
        , options_{std::move(options)}
        , matcherFactory_{std::move(matcherFactory)}
    {}

    InPlaceOperation::~InPlaceOperation() = default;

    void InPlaceOperation::recordError(Error error)
    {
        Log::error("InPlaceOperation: {}", error.toString());
        report_.errors.push_back(std::move(error));
    }

    void InPlaceOperation::scanPath(std::filesystem::path const& path)
    {
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(path, ec);
        if (!std::filesystem::exists(status))
        {
            return recordError(Error{
                .type = ErrorType::SourceNotFound,
                .path = path,
                .extraInfo = "Path does not exist",
            });
        }

        if (!std::filesystem::is_directory(status))
        {
            if (std::filesystem::is_regular_file(status))
                files_.push_back(path);
            renames_.push_back(path);
            return;
        }

        auto matcher = matcherFactory_ ? matcherFactory_(path) : Ignore::Matcher{};
        Utility::DeepDirectoryWalker<SharedData::DirectoryEntry, Error, TreeScanner> walker{
            path,
            TreeScanner{
                path,
                matcher,
                TreeScanOptions{.skipHidden = options_.skipHidden},
                [this](Error error) {
                    recordError(std::move(error));
                },
            },
        };
        walker.walkAll([this](Error&& error) {
            recordError(std::move(error));
        });

        for (auto const& entry : walker.entries())
        {
            auto fullPath = walker.fullPath(entry);
            if (entry.isRegularFile())
                files_.push_back(fullPath);
            renames_.push_back(std::move(fullPath));
        }
    }

    void InPlaceOperation::printFile(std::filesystem::path const& path)
    {
        std::error_code ec;
        const auto status = std::filesystem::status(path, ec);
        if (!std::filesystem::exists(status))
        {
            return recordError(Error{
                .type = ErrorType::SourceNotFound,
                .path = path,
                .extraInfo = "File does not exist",
            });
        }
        if (std::filesystem::is_directory(status))
        {
            Log::warn("InPlaceOperation: Skipping directory '{}'.", path.generic_string());
            return;
        }

        auto content = Utility::readFile(path);
        if (!content)
            return recordError(SharedData::ioFailure(path, content.error(), "Could not read file"));
        if (!Utility::looksLikeText(*content))
        {
            Log::warn("InPlaceOperation: Skipping binary file '{}'.", path.generic_string());
            return;
        }

        const auto rewritten = rules_->apply(*content);
        if (rewritten != *content)
            report_.replacementsMade = true;
        else
            Log::debug("InPlaceOperation: No replacements in '{}'.", path.generic_string());

        if (auto written = Utility::writeStream(*options_.output, rewritten); !written)
            return recordError(SharedData::ioFailure(path, written.error(), "Could not write rewritten content"));
        ++report_.rewrittenCount;
    }

    void InPlaceOperation::rewriteFile(std::filesystem::path const& path)
    {
        auto content = Utility::readFile(path);
        if (!content)
            return recordError(SharedData::ioFailure(path, content.error(), "Could not read file"));
        if (!Utility::looksLikeText(*content))
        {
            Log::debug("InPlaceOperation: Leaving binary file '{}' alone.", path.generic_string());
            return;
        }

        const auto rewritten = rules_->apply(*content);
        if (rewritten == *content)
            return;

        if (auto written = Utility::writeFile(path, rewritten); !written)
            return recordError(SharedData::ioFailure(path, written.error(), "Could not write file"));

        Log::info("InPlaceOperation: Modified content of '{}'.", path.generic_string());
        ++report_.rewrittenCount;
        report_.replacementsMade = true;
    }

    void InPlaceOperation::renamePath(std::filesystem::path const& path)
    {
        const auto name = path.filename().string();
        if (name.empty() || name == "." || name == "..")
            return;

        std::error_code ec;
        const auto status = std::filesystem::symlink_status(path, ec);
        if (!std::filesystem::exists(status))
            return recordError(SharedData::ioFailure(path, ec, "Could not stat"));

        const bool isDirectory = std::filesystem::is_directory(status);
        if (isDirectory ? !options_.renameDirectories : !options_.renameFiles)
            return;

        const auto newName = rules_->applyToName(name);
        if (newName == name || newName.empty())
            return;

        const auto newPath = path.parent_path() / newName;
        if (std::filesystem::exists(std::filesystem::symlink_status(newPath, ec)))
        {
            return recordError(Error{
                .type = ErrorType::DestinationCollision,
                .path = path,
                .extraInfo = fmt::format("Cannot rename to '{}', it already exists", newPath.generic_string()),
            });
        }

        std::filesystem::rename(path, newPath, ec);
        if (ec)
            return recordError(SharedData::ioFailure(path, ec, fmt::format("Could not rename to '{}'", newName)));

        Log::info("InPlaceOperation: Renamed '{}' -> '{}'.", path.generic_string(), newPath.generic_string());
        ++report_.renamedCount;
        report_.replacementsMade = true;
    }

    std::expected<InPlaceOperation::WorkStatus, InPlaceOperation::Error> InPlaceOperation::work()
    {
        using enum OperationState;

        switch (state_)
        {
            case (NotStarted):
            {
                if (!options_.inPlace)
                {
                    if (options_.output == nullptr)
                    {
                        return enterErrorState<WorkStatus>(Error{
                            .type = ErrorType::InvalidOperationState,
                            .extraInfo = "No output stream for rewritten content",
                        });
                    }
                    files_ = options_.paths;
                    enterState(Running);
                    return WorkStatus::MoreWork;
                }

                if (options_.paths.empty())
                    options_.paths.push_back(".");
                enterState(Scanning);
                return WorkStatus::MoreWork;
            }
            case (Scanning):
            {
                if (currentPath_ >= options_.paths.size())
                {
                    enterState(Running);
                    return WorkStatus::MoreWork;
                }
                scanPath(options_.paths[currentPath_++]);
                return WorkStatus::MoreWork;
            }
            case (Running):
            {
                if (currentItem_ >= files_.size())
                {
                    if (!options_.inPlace)
                    {
                        enterState(Finalizing);
                        return WorkStatus::MoreWork;
                    }

                    // Children are renamed before their parents, so pending paths stay valid.
                    std::stable_sort(renames_.begin(), renames_.end(), [](auto const& lhs, auto const& rhs) {
                        return std::distance(lhs.begin(), lhs.end()) > std::distance(rhs.begin(), rhs.end());
                    });
                    currentItem_ = 0;
                    enterState(Renaming);
                    return WorkStatus::MoreWork;
                }

                auto const& path = files_[currentItem_++];
                if (options_.inPlace)
                    rewriteFile(path);
                else
                    printFile(path);
                return WorkStatus::MoreWork;
            }
            case (Renaming):
            {
                if (currentItem_ >= renames_.size())
                {
                    enterState(Finalizing);
                    return WorkStatus::MoreWork;
                }
                renamePath(renames_[currentItem_++]);
                return WorkStatus::MoreWork;
            }
            case (Finalizing):
            {
                if (!report_.replacementsMade && !rules_->empty())
                    Log::warn("InPlaceOperation: No replacements were made, check that the patterns exist.");
                enterState(Completed);
                return WorkStatus::Complete;
            }
            case (Completed):
            case (Failed):
                return workInFinalState("InPlaceOperation");
        }
        return enterErrorState<WorkStatus>(
            Error{.type = ErrorType::InvalidOperationState, .extraInfo = "Unknown operation state"});
    }
}
