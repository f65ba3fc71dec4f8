#pragma once

#include <operations/operation.hpp>
#include <operations/tree_scanner.hpp>
#include <ignore/matcher.hpp>
#include <replace/rule_set.hpp>
#include <shared_data/directory_entry.hpp>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <set>
#include <string>
#include <vector>

namespace Operations
{
    using MatcherFactory = std::function<Ignore::Matcher(std::filesystem::path const& root)>;

    /// Matchers from the gitignore files that apply to the walked root.
    MatcherFactory gitIgnoreMatchers();

    /// Matchers that exclude nothing.
    MatcherFactory disabledMatchers();

    struct CopyReport
    {
        // Files and directories written.
        std::size_t copiedCount{0};
        std::vector<SharedData::Error> errors{};

        bool succeeded() const
        {
            return errors.empty();
        }
    };

    /**
     * @brief Copies files and directory trees into a destination, rewriting text contents and (optionally) names
     * with a rule set.
     *
     * The operation first plans the sources, then scans one source tree per work() call and finally copies one
     * entry per work() call.
     */
    class CopyOperation : public Operation
    {
      public:
        struct CopyOperationOptions
        {
            std::vector<std::filesystem::path> sources{};
            std::filesystem::path destination{};
            // Rewrite names of copied entries.
            bool inPlaceRenaming{false};
            bool renameFiles{true};
            bool renameDirectories{true};
            bool skipHidden{true};
            // Log every copied entry at info level instead of debug.
            bool verbose{false};
        };

        CopyOperation(Replace::RuleSet const& rules, CopyOperationOptions options, MatcherFactory matcherFactory);
        ~CopyOperation() override;
        CopyOperation(CopyOperation const&) = delete;
        CopyOperation(CopyOperation&&) = delete;
        CopyOperation& operator=(CopyOperation const&) = delete;
        CopyOperation& operator=(CopyOperation&&) = delete;

        std::expected<WorkStatus, Error> work() override;

        CopyReport const& report() const
        {
            return report_;
        }

      private:
        struct PlannedSource
        {
            std::filesystem::path source;
            std::filesystem::path target;
            bool isDirectory;
        };

        struct CopyItem
        {
            std::filesystem::path source;
            std::filesystem::path target;
            SharedData::FileType type;
        };

        void plan();
        void scanSource(PlannedSource const& planned);
        void copyItem(CopyItem const& item);
        void copyFileContent(std::filesystem::path const& source, std::filesystem::path const& target);
        std::string rewriteName(std::string const& name, bool isDirectory) const;
        void recordError(Error error);

      private:
        Replace::RuleSet const* rules_;
        CopyOperationOptions options_;
        MatcherFactory matcherFactory_;
        std::vector<PlannedSource> plannedSources_{};
        std::size_t currentSource_{0};
        std::vector<CopyItem> items_{};
        std::set<std::filesystem::path> seenTargets_{};
        std::size_t currentItem_{0};
        CopyReport report_{};
    };

    /**
     * @brief Runs a copy operation to completion.
     */
    std::expected<CopyReport, SharedData::Error> execute(
        std::vector<std::filesystem::path> const& sources,
        std::filesystem::path const& destination,
        Replace::RuleSet const& rules,
        bool inPlaceRenaming,
        MatcherFactory matcherFactory = gitIgnoreMatchers());
}
