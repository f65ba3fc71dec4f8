#include <ignore/matcher.hpp>

#include <algorithm>
#include <optional>
#include <utility>

namespace Ignore
{
    namespace
    {
        std::string normalize(std::filesystem::path const& path)
        {
            auto result = path.lexically_normal().generic_string();
            if (result == ".")
                return {};
            if (result.starts_with("./"))
                result.erase(0, 2);
            while (!result.empty() && result.back() == '/')
                result.pop_back();
            return result;
        }
    }

    Matcher Matcher::disabled()
    {
        Matcher matcher;
        matcher.disabled_ = true;
        return matcher;
    }

    std::expected<Matcher, SharedData::Error> Matcher::compile(std::vector<std::string> const& lines)
    {
        Matcher matcher;
        if (auto result = matcher.addPatterns(lines); !result)
            return std::unexpected(std::move(result).error());
        return matcher;
    }

    std::expected<void, SharedData::Error>
    Matcher::addPatterns(std::vector<std::string> const& lines, std::string scope, std::string prefix)
    {
        PatternGroup group{.scope = normalize(scope), .prefix = normalize(prefix), .patterns = {}};
        for (auto const& line : lines)
        {
            auto pattern = Pattern::parse(line);
            if (!pattern)
                return std::unexpected(std::move(pattern).error());
            if (pattern->has_value())
                group.patterns.push_back(std::move(**pattern));
        }
        groups_.push_back(std::move(group));
        return {};
    }

    std::vector<SharedData::Error>
    Matcher::addPatternsSkippingInvalid(std::vector<std::string> const& lines, std::string scope, std::string prefix)
    {
        std::vector<SharedData::Error> errors{};
        PatternGroup group{.scope = normalize(scope), .prefix = normalize(prefix), .patterns = {}};
        for (auto const& line : lines)
        {
            auto pattern = Pattern::parse(line);
            if (!pattern)
                errors.push_back(std::move(pattern).error());
            else if (pattern->has_value())
                group.patterns.push_back(std::move(**pattern));
        }
        groups_.push_back(std::move(group));
        return errors;
    }

    std::size_t Matcher::patternCount() const
    {
        std::size_t count = 0;
        for (auto const& group : groups_)
            count += group.patterns.size();
        return count;
    }

    bool Matcher::isExcluded(std::filesystem::path const& relativePath, bool isDirectory) const
    {
        if (disabled_ || groups_.empty())
            return false;

        const auto path = normalize(relativePath);
        if (path.empty())
            return false;

        for (auto slash = path.find('/'); slash != std::string::npos; slash = path.find('/', slash + 1))
        {
            if (decide(path.substr(0, slash), true))
                return true;
        }
        return decide(path, isDirectory);
    }

    bool Matcher::decide(std::string const& path, bool isDirectory) const
    {
        std::optional<bool> excluded{};
        for (auto const& group : groups_)
        {
            std::string local;
            if (group.scope.empty())
                local = path;
            else if (path.size() > group.scope.size() && path.starts_with(group.scope) && path[group.scope.size()] == '/')
                local = path.substr(group.scope.size() + 1);
            else
                continue;

            if (!group.prefix.empty())
                local = group.prefix + "/" + local;

            for (auto const& pattern : group.patterns)
            {
                if (pattern.matches(local, isDirectory))
                    excluded = !pattern.negated();
            }
        }
        return excluded.value_or(false);
    }
}
