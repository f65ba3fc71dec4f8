#include <operations/copy_operation.hpp>
#include <ignore/ignore_files.hpp>
#include <log/log.hpp>
#include <utility/directory_traversal.hpp>
#include <utility/file_io.hpp>
#include <utility/text_detection.hpp>

#include <fmt/format.h>

#include <optional>
#include <system_error>

namespace Operations
{
    namespace
    {
        std::filesystem::path baseNameOf(std::filesystem::path const& path)
        {
            std::error_code ec;
            auto resolved = std::filesystem::weakly_canonical(std::filesystem::absolute(path, ec), ec);
            if (ec)
                resolved = path.lexically_normal();
            if (resolved.filename().empty())
                return resolved.parent_path().filename();
            return resolved.filename();
        }

        bool isSamePath(std::filesystem::path const& lhs, std::filesystem::path const& rhs)
        {
            std::error_code ec;
            return std::filesystem::equivalent(lhs, rhs, ec) && !ec;
        }
    }

    MatcherFactory gitIgnoreMatchers()
    {
        return [](std::filesystem::path const& root) {
            return Ignore::buildMatcher(root);
        };
    }

    MatcherFactory disabledMatchers()
    {
        return [](std::filesystem::path const&) {
            return Ignore::Matcher::disabled();
        };
    }

    CopyOperation::CopyOperation(
        Replace::RuleSet const& rules,
        CopyOperationOptions options,
        MatcherFactory matcherFactory)
        : Operation{}
        , rules_{&rules}
        , options_{std::move(options)}
        , matcherFactory_{std::move(matcherFactory)}
    {}

    CopyOperation::~CopyOperation() = default;

    void CopyOperation::recordError(Error error)
    {
        Log::error("CopyOperation: {}", error.toString());
        report_.errors.push_back(std::move(error));
    }

    std::string CopyOperation::rewriteName(std::string const& name, bool isDirectory) const
    {
        if (!options_.inPlaceRenaming)
            return name;
        if (isDirectory ? !options_.renameDirectories : !options_.renameFiles)
            return name;

        auto rewritten = rules_->applyToName(name);
        if (rewritten.empty())
        {
            Log::warn("CopyOperation: Renaming '{}' would leave an empty name, keeping it.", name);
            return name;
        }
        return rewritten;
    }

    void CopyOperation::plan()
    {
        const bool singleSource = options_.sources.size() == 1;

        std::error_code ec;
        const auto destinationStatus = std::filesystem::status(options_.destination, ec);
        const bool destinationExists = std::filesystem::exists(destinationStatus);
        const bool destinationIsDirectory = std::filesystem::is_directory(destinationStatus);

        std::vector<PlannedSource> candidates{};
        for (auto const& source : options_.sources)
        {
            std::error_code statusError;
            const auto status = std::filesystem::status(source, statusError);
            if (!std::filesystem::exists(status))
            {
                recordError(Error{
                    .type = ErrorType::SourceNotFound,
                    .path = source,
                    .extraInfo = "Source does not exist",
                });
                continue;
            }

            const bool isDirectory = std::filesystem::is_directory(status);
            if (destinationExists && !destinationIsDirectory && (isDirectory || !singleSource))
            {
                recordError(Error{
                    .type = ErrorType::IOFailure,
                    .path = source,
                    .extraInfo = fmt::format(
                        "Cannot copy into '{}', it is not a directory", options_.destination.generic_string()),
                });
                continue;
            }

            // A single source copied to a path that does not exist yet becomes that path.
            std::filesystem::path target;
            if (destinationIsDirectory || (!singleSource && !destinationExists))
                target = options_.destination / rewriteName(baseNameOf(source).string(), isDirectory);
            else
                target = options_.destination;

            candidates.push_back(PlannedSource{
                .source = source,
                .target = target.lexically_normal(),
                .isDirectory = isDirectory,
            });
        }

        for (std::size_t i = 0; i != candidates.size(); ++i)
        {
            bool collides = false;
            for (std::size_t j = 0; j != candidates.size(); ++j)
            {
                if (i != j && candidates[i].target == candidates[j].target)
                {
                    collides = true;
                    recordError(Error{
                        .type = ErrorType::DestinationCollision,
                        .path = candidates[i].source,
                        .extraInfo = fmt::format(
                            "'{}' is copied to '{}' as well",
                            candidates[j].source.generic_string(),
                            candidates[i].target.generic_string()),
                    });
                    break;
                }
            }
            if (!collides)
                plannedSources_.push_back(candidates[i]);
        }
    }

    void CopyOperation::scanSource(PlannedSource const& planned)
    {
        if (!planned.isDirectory)
        {
            std::error_code ec;
            const auto status = std::filesystem::symlink_status(planned.source, ec);
            if (!seenTargets_.insert(planned.target).second)
            {
                recordError(Error{
                    .type = ErrorType::DestinationCollision,
                    .path = planned.source,
                    .extraInfo = fmt::format("'{}' was already copied", planned.target.generic_string()),
                });
                return;
            }
            items_.push_back(CopyItem{
                .source = planned.source,
                .target = planned.target,
                .type = SharedData::fileTypeOf(status),
            });
            return;
        }

        auto matcher = matcherFactory_ ? matcherFactory_(planned.source) : Ignore::Matcher{};
        Utility::DeepDirectoryWalker<SharedData::DirectoryEntry, Error, TreeScanner> walker{
            planned.source,
            TreeScanner{
                planned.source,
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

        auto const& entries = walker.entries();
        Log::debug("CopyOperation: Found {} entries in '{}'.", entries.size(), planned.source.generic_string());

        // Target per entry, std::nullopt for skipped entries (their children are skipped too).
        std::vector<std::optional<std::filesystem::path>> targets(entries.size());
        targets[0] = planned.target;
        seenTargets_.insert(planned.target);
        items_.push_back(CopyItem{
            .source = planned.source,
            .target = planned.target,
            .type = SharedData::FileType::Directory,
        });

        for (std::size_t i = 1; i < entries.size(); ++i)
        {
            auto const& entry = entries[i];
            auto const& parentTarget = targets[entry.parent.value()];
            if (!parentTarget)
                continue;

            auto source = walker.fullPath(entry);
            if (entry.isDirectory() && isSamePath(source, planned.target))
            {
                Log::debug("CopyOperation: Not copying the destination '{}' into itself.", source.generic_string());
                continue;
            }

            auto target = *parentTarget / rewriteName(entry.path.string(), entry.isDirectory());
            if (!seenTargets_.insert(target).second)
            {
                recordError(Error{
                    .type = ErrorType::DestinationCollision,
                    .path = std::move(source),
                    .extraInfo = fmt::format("'{}' was already copied", target.generic_string()),
                });
                continue;
            }

            targets[i] = target;
            items_.push_back(CopyItem{
                .source = std::move(source),
                .target = std::move(target),
                .type = entry.type,
            });
        }
    }

    void CopyOperation::copyFileContent(std::filesystem::path const& source, std::filesystem::path const& target)
    {
        std::error_code ec;
        std::filesystem::create_directories(target.parent_path(), ec);
        if (ec)
            return recordError(SharedData::ioFailure(target.parent_path(), ec, "Could not create directory"));

        auto content = Utility::readFile(source);
        if (!content)
            return recordError(SharedData::ioFailure(source, content.error(), "Could not read file"));

        auto written = Utility::looksLikeText(*content) ? Utility::writeFile(target, rules_->apply(*content))
                                                        : Utility::writeFile(target, *content);
        if (!written)
            return recordError(SharedData::ioFailure(target, written.error(), "Could not write file"));

        Log::log(
            options_.verbose ? Log::Level::Info : Log::Level::Debug,
            "CopyOperation: '{}' -> '{}'",
            source.generic_string(),
            target.generic_string());
        ++report_.copiedCount;
    }

    void CopyOperation::copyItem(CopyItem const& item)
    {
        switch (item.type)
        {
            case SharedData::FileType::Directory:
            {
                std::error_code ec;
                std::filesystem::create_directories(item.target, ec);
                if (ec)
                    return recordError(SharedData::ioFailure(item.target, ec, "Could not create directory"));
                if (!std::filesystem::is_directory(item.target, ec))
                {
                    return recordError(Error{
                        .type = ErrorType::IOFailure,
                        .path = item.target,
                        .extraInfo = "Exists and is not a directory",
                    });
                }

                Log::log(
                    options_.verbose ? Log::Level::Info : Log::Level::Debug,
                    "CopyOperation: '{}' -> '{}'",
                    item.source.generic_string(),
                    item.target.generic_string());
                ++report_.copiedCount;
                return;
            }
            case SharedData::FileType::Regular:
                return copyFileContent(item.source, item.target);
            case SharedData::FileType::Symlink:
            {
                // Links are not recreated, a link to a file is copied as the file's content.
                std::error_code ec;
                const auto status = std::filesystem::status(item.source, ec);
                if (!std::filesystem::exists(status))
                {
                    return recordError(Error{
                        .type = ErrorType::IOFailure,
                        .path = item.source,
                        .extraInfo = "Dangling symbolic link",
                    });
                }
                if (std::filesystem::is_directory(status))
                {
                    Log::warn(
                        "CopyOperation: Not following symbolic link to directory '{}'.", item.source.generic_string());
                    return;
                }
                return copyFileContent(item.source, item.target);
            }
            case SharedData::FileType::Unknown:
            case SharedData::FileType::Other:
                break;
        }
        Log::warn("CopyOperation: Skipping unsupported file type of '{}'.", item.source.generic_string());
    }

    std::expected<CopyOperation::WorkStatus, CopyOperation::Error> CopyOperation::work()
    {
        using enum OperationState;

        switch (state_)
        {
            case (NotStarted):
            {
                Log::debug(
                    "CopyOperation: Copying {} source(s) to '{}'.",
                    options_.sources.size(),
                    options_.destination.generic_string());
                plan();
                enterState(Scanning);
                return WorkStatus::MoreWork;
            }
            case (Scanning):
            {
                if (currentSource_ >= plannedSources_.size())
                {
                    enterState(Running);
                    return WorkStatus::MoreWork;
                }
                scanSource(plannedSources_[currentSource_++]);
                return WorkStatus::MoreWork;
            }
            case (Running):
            {
                if (currentItem_ >= items_.size())
                {
                    enterState(Finalizing);
                    return WorkStatus::MoreWork;
                }
                copyItem(items_[currentItem_++]);
                return WorkStatus::MoreWork;
            }
            case (Finalizing):
            {
                if (report_.succeeded())
                    Log::debug("CopyOperation: Copied {} entries.", report_.copiedCount);
                else
                    Log::error(
                        "CopyOperation: Copied {} entries, {} errors occurred.",
                        report_.copiedCount,
                        report_.errors.size());
                enterState(Completed);
                return WorkStatus::Complete;
            }
            case (Renaming):
                Log::error("CopyOperation: Invalid state: {}", static_cast<int>(state_));
                return enterErrorState<WorkStatus>(Error{.type = ErrorType::InvalidOperationState});
            case (Completed):
            case (Failed):
                return workInFinalState("CopyOperation");
        }
        return enterErrorState<WorkStatus>(
            Error{.type = ErrorType::InvalidOperationState, .extraInfo = "Unknown operation state"});
    }

    std::expected<CopyReport, SharedData::Error> execute(
        std::vector<std::filesystem::path> const& sources,
        std::filesystem::path const& destination,
        Replace::RuleSet const& rules,
        bool inPlaceRenaming,
        MatcherFactory matcherFactory)
    {
        CopyOperation operation{
            rules,
            CopyOperation::CopyOperationOptions{
                .sources = sources,
                .destination = destination,
                .inPlaceRenaming = inPlaceRenaming,
            },
            std::move(matcherFactory),
        };
        if (auto result = operation.runToCompletion(); !result)
            return std::unexpected(std::move(result).error());
        return operation.report();
    }
}
