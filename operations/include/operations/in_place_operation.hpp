#pragma once

#include <operations/copy_operation.hpp>
#include <operations/operation.hpp>
#include <replace/rule_set.hpp>

#include <filesystem>
#include <ostream>
#include <vector>

namespace Operations
{
    struct InPlaceReport
    {
        std::size_t rewrittenCount{0};
        std::size_t renamedCount{0};
        bool replacementsMade{false};
        std::vector<SharedData::Error> errors{};

        bool succeeded() const
        {
            return errors.empty();
        }
    };

    /**
     * @brief Rewrites given files.
     *
     * Without inPlace the rewritten content of every given file is written to the output stream, directories are
     * skipped. With inPlace every given path is walked, text files are rewritten where they are, then files and
     * directories are renamed, deepest paths first.
     */
    class InPlaceOperation : public Operation
    {
      public:
        struct InPlaceOperationOptions
        {
            // Defaults to the working directory when inPlace is set.
            std::vector<std::filesystem::path> paths{};
            bool inPlace{false};
            bool renameFiles{true};
            bool renameDirectories{true};
            bool skipHidden{false};
            // Receives the rewritten contents without inPlace.
            std::ostream* output{nullptr};
        };

        InPlaceOperation(Replace::RuleSet const& rules, InPlaceOperationOptions options, MatcherFactory matcherFactory);
        ~InPlaceOperation() override;
        InPlaceOperation(InPlaceOperation const&) = delete;
        InPlaceOperation(InPlaceOperation&&) = delete;
        InPlaceOperation& operator=(InPlaceOperation const&) = delete;
        InPlaceOperation& operator=(InPlaceOperation&&) = delete;

        std::expected<WorkStatus, Error> work() override;

        InPlaceReport const& report() const
        {
            return report_;
        }

      private:
        void scanPath(std::filesystem::path const& path);
        void printFile(std::filesystem::path const& path);
        void rewriteFile(std::filesystem::path const& path);
        void renamePath(std::filesystem::path const& path);
        void recordError(Error error);

      private:
        Replace::RuleSet const* rules_;
        InPlaceOperationOptions options_;
        MatcherFactory matcherFactory_;
        std::size_t currentPath_{0};
        // Files for the content phase, every entry for the rename phase.
        std::vector<std::filesystem::path> files_{};
        std::vector<std::filesystem::path> renames_{};
        std::size_t currentItem_{0};
        InPlaceReport report_{};
    };
}
