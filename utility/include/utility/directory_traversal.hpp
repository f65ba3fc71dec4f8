#pragma once

#include <concepts>
#include <expected>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace Utility
{
    /// Lists the direct children of one directory.
    template <typename ScannerT, typename EntryT, typename ErrorT>
    concept DirectoryScanner = std::invocable<ScannerT&, std::filesystem::path const&> &&
        std::same_as<std::invoke_result_t<ScannerT&, std::filesystem::path const&>,
                     std::expected<std::vector<EntryT>, ErrorT>>;

    /**
     * @brief Breadth first walk that collects a directory tree into one flat list.
     *
     * Entry 0 is the root. Every other entry holds its own file name and the index of its parent, which always comes
     * before it. Subtrees the scanner does not report are never visited, that is how callers prune ignored
     * directories.
     */
    template <typename EntryT, typename ErrorT, typename ScannerT>
    requires DirectoryScanner<ScannerT, EntryT, ErrorT>
    class DeepDirectoryWalker
    {
      public:
        DeepDirectoryWalker(std::filesystem::path root, ScannerT scanner)
            : root_{std::move(root)}
            , scanner_{std::move(scanner)}
            , entries_{EntryT{.path = root_, .type = EntryT::FileType::Directory}}
        {}

        /**
         * @brief Lists the next pending directory.
         *
         * @return true once nothing is left to scan. A directory that cannot be listed yields its error and is
         * skipped, so calling walk again continues with the rest of the tree.
         */
        std::expected<bool, ErrorT> walk()
        {
            if (completed())
                return true;

            const auto parent = next_++;
            auto children = scanner_(fullPath(entries_[parent]));
            if (children)
            {
                entries_.reserve(entries_.size() + children->size());
                for (auto& child : *children)
                {
                    child.parent = parent;
                    entries_.push_back(std::move(child));
                }
            }
            advanceToDirectory();

            if (!children)
                return std::unexpected(std::move(children).error());
            return completed();
        }

        /// Walks to the end and hands every error to onError.
        void walkAll(std::function<void(ErrorT&&)> const& onError)
        {
            while (!completed())
            {
                if (auto result = walk(); !result && onError)
                    onError(std::move(result).error());
            }
        }

        /// Walks until done or until the first error.
        std::expected<void, ErrorT> walkAll()
        {
            while (!completed())
            {
                if (auto result = walk(); !result)
                    return std::unexpected(std::move(result).error());
            }
            return {};
        }

        std::filesystem::path fullPath(EntryT const& entry) const
        {
            if (!entry.parent)
                return root_;
            return root_ / relativePath(entry);
        }

        /// Empty for the root.
        std::filesystem::path relativePath(EntryT const& entry) const
        {
            std::vector<EntryT const*> chain;
            for (auto const* current = &entry; current->parent; current = &at(*current->parent))
                chain.push_back(current);

            std::filesystem::path result;
            for (auto iter = chain.rbegin(); iter != chain.rend(); ++iter)
                result /= (*iter)->path;
            return result;
        }

        std::vector<EntryT> const& entries() const
        {
            return entries_;
        }
        bool completed() const
        {
            return next_ >= entries_.size();
        }

      private:
        EntryT const& at(std::size_t index) const
        {
            if (index >= entries_.size())
                throw std::out_of_range("Parent index is out of range");
            return entries_[index];
        }

        void advanceToDirectory()
        {
            while (next_ < entries_.size() && !entries_[next_].isDirectory())
                ++next_;
        }

      private:
        std::filesystem::path root_;
        ScannerT scanner_;
        std::vector<EntryT> entries_{};
        std::size_t next_{0};
    };
}
