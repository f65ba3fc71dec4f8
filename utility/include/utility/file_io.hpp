#pragma once

#include <expected>
#include <filesystem>
#include <istream>
#include <ostream>
#include <string>
#include <string_view>
#include <system_error>

namespace Utility
{
    /**
     * @brief Reads the whole file in binary mode.
     */
    std::expected<std::string, std::error_code> readFile(std::filesystem::path const& path);

    /**
     * @brief Writes data in binary mode, truncating an existing file.
     */
    std::expected<void, std::error_code> writeFile(std::filesystem::path const& path, std::string_view data);

    /**
     * @brief Reads a stream until EOF.
     */
    std::expected<std::string, std::error_code> readStream(std::istream& stream);

    std::expected<void, std::error_code> writeStream(std::ostream& stream, std::string_view data);
}
