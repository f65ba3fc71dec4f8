#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>

namespace SharedData
{
    enum class FileType : std::uint8_t
    {
        Unknown = 0,
        Regular = 1,
        Directory = 2,
        Symlink = 3,
        Other = 4
    };

    struct DirectoryEntry
    {
        using FileType = SharedData::FileType;

        // File name for children, the full path for the root entry.
        std::filesystem::path path{};
        FileType type{FileType::Unknown};

        bool isDirectory() const
        {
            return type == FileType::Directory;
        }
        bool isRegularFile() const
        {
            return type == FileType::Regular;
        }
        bool isSymlink() const
        {
            return type == FileType::Symlink;
        }

        // Used for directory traversal. Avoids pointer instability in vector and unique_ptr
        std::optional<std::size_t> parent{std::nullopt};
    };

    /**
     * @brief Maps a status obtained with symlink_status, so links are reported as links.
     */
    inline FileType fileTypeOf(std::filesystem::file_status const& status)
    {
        switch (status.type())
        {
            case std::filesystem::file_type::regular:
                return FileType::Regular;
            case std::filesystem::file_type::directory:
                return FileType::Directory;
            case std::filesystem::file_type::symlink:
                return FileType::Symlink;
            case std::filesystem::file_type::none:
            case std::filesystem::file_type::not_found:
            case std::filesystem::file_type::unknown:
                return FileType::Unknown;
            default:
                return FileType::Other;
        }
    }
}
