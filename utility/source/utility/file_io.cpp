#include <utility/file_io.hpp>

#include <cerrno>
#include <fstream>
#include <iterator>
#include <sstream>

namespace Utility
{
    namespace
    {
        std::error_code lastErrorOr(std::errc fallback)
        {
            if (errno != 0)
                return std::error_code{errno, std::generic_category()};
            return std::make_error_code(fallback);
        }
    }

    std::expected<std::string, std::error_code> readFile(std::filesystem::path const& path)
    {
        errno = 0;
        std::ifstream file{path, std::ios_base::binary};
        if (!file.is_open())
            return std::unexpected(lastErrorOr(std::errc::no_such_file_or_directory));

        std::string content{std::istreambuf_iterator<char>{file}, std::istreambuf_iterator<char>{}};
        if (file.bad())
            return std::unexpected(lastErrorOr(std::errc::io_error));
        return content;
    }

    std::expected<void, std::error_code> writeFile(std::filesystem::path const& path, std::string_view data)
    {
        errno = 0;
        std::ofstream file{path, std::ios_base::binary | std::ios_base::trunc};
        if (!file.is_open())
            return std::unexpected(lastErrorOr(std::errc::permission_denied));

        file.write(data.data(), static_cast<std::streamsize>(data.size()));
        file.flush();
        if (!file.good())
            return std::unexpected(lastErrorOr(std::errc::io_error));
        return {};
    }

    std::expected<std::string, std::error_code> readStream(std::istream& stream)
    {
        std::stringstream buffer;
        buffer << stream.rdbuf();
        if (stream.bad())
            return std::unexpected(std::make_error_code(std::errc::io_error));
        return std::move(buffer).str();
    }

    std::expected<void, std::error_code> writeStream(std::ostream& stream, std::string_view data)
    {
        stream.write(data.data(), static_cast<std::streamsize>(data.size()));
        stream.flush();
        if (!stream.good())
            return std::unexpected(std::make_error_code(std::errc::io_error));
        return {};
    }
}
