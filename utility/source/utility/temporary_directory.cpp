#include <utility/temporary_directory.hpp>

#include <cerrno>
#include <cstdlib>
#include <string>
#include <system_error>

namespace Utility
{
    TemporaryDirectory::TemporaryDirectory(std::filesystem::path parent, bool removeParentIfEmpty)
        : parent_{std::move(parent)}
        , removeParentIfEmpty_{removeParentIfEmpty}
    {
        std::filesystem::create_directories(parent_);

        auto pattern = (parent_ / "dirXXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr)
        {
            throw std::filesystem::filesystem_error(
                "mkdtemp", parent_, std::error_code{errno, std::generic_category()});
        }
        path_ = std::filesystem::canonical(pattern);
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code ignored;
        std::filesystem::remove_all(path_, ignored);
        // remove fails on non empty directories, which is exactly the condition wanted here.
        if (removeParentIfEmpty_)
            std::filesystem::remove(parent_, ignored);
    }
}
