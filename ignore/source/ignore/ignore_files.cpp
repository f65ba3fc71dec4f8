#include <ignore/ignore_files.hpp>
#include <log/log.hpp>
#include <utility/file_io.hpp>

#include <optional>
#include <string_view>
#include <system_error>

namespace Ignore
{
    namespace
    {
        std::filesystem::path resolve(std::filesystem::path const& path)
        {
            std::error_code ec;
            auto absolute = std::filesystem::absolute(path, ec);
            if (ec)
                return path.lexically_normal();
            auto canonical = std::filesystem::weakly_canonical(absolute, ec);
            if (ec)
                return absolute.lexically_normal();
            return canonical;
        }

        bool isWithin(std::filesystem::path const& path, std::filesystem::path const& base)
        {
            auto const relative = path.lexically_relative(base);
            return !relative.empty() && *relative.begin() != "..";
        }

        std::string relativeString(std::filesystem::path const& path, std::filesystem::path const& base)
        {
            auto relative = path.lexically_relative(base).generic_string();
            if (relative == ".")
                return {};
            return relative;
        }

        void addLogged(Matcher& matcher, IgnoreFile const& file, std::string scope, std::string prefix)
        {
            for (auto const& error : matcher.addPatternsSkippingInvalid(file.lines, std::move(scope), std::move(prefix)))
                Log::warn("Ignore: Skipping pattern in '{}': {}", file.source.generic_string(), error.toString());
        }
    }

    std::expected<IgnoreFile, SharedData::Error>
    readIgnoreFile(std::filesystem::path const& file, std::filesystem::path anchorDirectory)
    {
        auto content = Utility::readFile(file);
        if (!content)
            return std::unexpected(SharedData::ioFailure(file, content.error(), "Could not read ignore file"));

        IgnoreFile ignoreFile{.lines = {}, .anchorDirectory = std::move(anchorDirectory), .source = file};
        std::string_view rest{*content};
        while (!rest.empty())
        {
            const auto newline = rest.find('\n');
            ignoreFile.lines.emplace_back(rest.substr(0, newline));
            if (newline == std::string_view::npos)
                break;
            rest.remove_prefix(newline + 1);
        }
        return ignoreFile;
    }

    std::vector<IgnoreFile> locateIgnoreFiles(std::filesystem::path const& startPath)
    {
        auto start = resolve(startPath);
        std::error_code ec;
        if (!std::filesystem::is_directory(start, ec))
            start = start.parent_path();

        // Innermost first, up to and including the repository root.
        std::vector<std::filesystem::path> chain{};
        std::optional<std::filesystem::path> repositoryRoot{};
        for (auto current = start;; current = current.parent_path())
        {
            chain.push_back(current);
            if (std::filesystem::exists(current / ".git", ec))
            {
                repositoryRoot = current;
                break;
            }
            if (current == current.parent_path())
                break;
        }
        // Outside of a repository, ignore files of the surrounding directories do not apply.
        if (!repositoryRoot)
            chain.resize(1);

        std::vector<IgnoreFile> files{};
        auto tryRead = [&files](std::filesystem::path const& file, std::filesystem::path const& anchor) {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(file, ec))
                return;
            auto ignoreFile = readIgnoreFile(file, anchor);
            if (!ignoreFile)
            {
                Log::warn("Ignore: {}", ignoreFile.error().toString());
                return;
            }
            Log::debug("Ignore: Using '{}'.", file.generic_string());
            files.push_back(std::move(ignoreFile).value());
        };

        if (repositoryRoot)
            tryRead(*repositoryRoot / ".git" / "info" / "exclude", *repositoryRoot);

        for (auto iter = chain.rbegin(); iter != chain.rend(); ++iter)
            tryRead(*iter / ".gitignore", *iter);

        return files;
    }

    Matcher buildMatcher(std::filesystem::path const& root, IgnoreFileLocator const& locator)
    {
        Matcher matcher;
        if (!locator)
            return matcher;

        const auto resolvedRoot = resolve(root);
        for (auto const& file : locator(resolvedRoot))
        {
            const auto anchor = resolve(file.anchorDirectory);
            if (anchor == resolvedRoot || isWithin(resolvedRoot, anchor))
                addLogged(matcher, file, {}, relativeString(resolvedRoot, anchor));
            else if (isWithin(anchor, resolvedRoot))
                addLogged(matcher, file, relativeString(anchor, resolvedRoot), {});
            else
                Log::debug(
                    "Ignore: '{}' does not apply to '{}'.",
                    file.source.generic_string(),
                    resolvedRoot.generic_string());
        }
        return matcher;
    }

    void addNestedIgnoreFile(Matcher& matcher, IgnoreFile const& file, std::filesystem::path const& scope)
    {
        addLogged(matcher, file, scope.generic_string(), {});
    }
}
