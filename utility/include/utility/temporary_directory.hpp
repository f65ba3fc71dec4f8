#pragma once

#include <filesystem>

namespace Utility
{
    /**
     * @brief Scratch directory for tests. A fresh "dirXXXXXX" directory is made below the parent and deleted
     * recursively on destruction.
     */
    class TemporaryDirectory
    {
      public:
        /**
         * @param parent Created when missing.
         * @param removeParentIfEmpty Also delete the parent on destruction, if nothing else lives in it.
         *
         * @throws std::filesystem::filesystem_error
         */
        explicit TemporaryDirectory(
            std::filesystem::path parent = std::filesystem::temp_directory_path() / "mane_tmpdir",
            bool removeParentIfEmpty = false);
        ~TemporaryDirectory();

        TemporaryDirectory(TemporaryDirectory const&) = delete;
        TemporaryDirectory& operator=(TemporaryDirectory const&) = delete;

        // Canonical, so it compares equal to paths resolved by the code under test.
        std::filesystem::path const& path() const
        {
            return path_;
        }

      private:
        std::filesystem::path parent_;
        std::filesystem::path path_{};
        bool removeParentIfEmpty_;
    };
}
