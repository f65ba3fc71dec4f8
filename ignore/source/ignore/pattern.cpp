#include <ignore/pattern.hpp>

#include <utility/algorithm/case_convert.hpp>

#include <fmt/format.h>

#include <string_view>

namespace Ignore
{
    namespace
    {
        constexpr std::string_view regexSpecials = R"(.^$|()[]{}*+?\)";

        void appendLiteral(std::string& regex, char c)
        {
            if (regexSpecials.find(c) != std::string_view::npos)
                regex += '\\';
            regex += c;
        }

        bool hasUnescapedSlash(std::string_view glob)
        {
            for (std::size_t i = 0; i < glob.size(); ++i)
            {
                if (glob[i] == '\\')
                    ++i;
                else if (glob[i] == '/')
                    return true;
            }
            return false;
        }

        // Trailing spaces are dropped unless escaped with a backslash.
        std::string_view trimTrailingSpaces(std::string_view line)
        {
            while (!line.empty() && line.back() == ' ')
            {
                std::size_t backslashes = 0;
                for (auto i = line.size() - 1; i > 0 && line[i - 1] == '\\'; --i)
                    ++backslashes;
                if (backslashes % 2 == 1)
                    break;
                line.remove_suffix(1);
            }
            return line;
        }
    }

    std::expected<std::string, std::string> globToRegex(std::string_view glob)
    {
        std::string regex;
        regex.reserve(glob.size() * 2);

        for (std::size_t i = 0; i < glob.size();)
        {
            const char c = glob[i];
            switch (c)
            {
                case '*':
                {
                    auto end = i;
                    while (end < glob.size() && glob[end] == '*')
                        ++end;

                    const bool doubleStar = end - i >= 2;
                    const bool segmentStart = i == 0 || glob[i - 1] == '/';
                    const bool segmentEnd = end == glob.size() || glob[end] == '/';
                    if (doubleStar && segmentStart && segmentEnd)
                    {
                        if (end == glob.size())
                            regex += ".*";
                        else
                        {
                            // "**/" matches zero or more directories.
                            regex += "(?:.*/)?";
                            ++end;
                        }
                    }
                    else
                        regex += "[^/]*";
                    i = end;
                    break;
                }
                case '?':
                {
                    regex += "[^/]";
                    ++i;
                    break;
                }
                case '[':
                {
                    auto pos = i + 1;
                    bool negatedClass = false;
                    if (pos < glob.size() && (glob[pos] == '!' || glob[pos] == '^'))
                    {
                        negatedClass = true;
                        ++pos;
                    }

                    std::string classBody;
                    bool first = true;
                    bool closed = false;
                    for (; pos < glob.size(); ++pos)
                    {
                        const char member = glob[pos];
                        if (member == ']' && !first)
                        {
                            closed = true;
                            break;
                        }
                        first = false;
                        if (member == '\\')
                        {
                            if (pos + 1 >= glob.size())
                                return std::unexpected(std::string{"dangling escape in bracket expression"});
                            ++pos;
                            if (!Utility::Algorithm::isAlpha(glob[pos]) && !Utility::Algorithm::isDigit(glob[pos]))
                                classBody += '\\';
                            classBody += glob[pos];
                        }
                        else if (member == '[' || member == ']' || member == '^')
                        {
                            classBody += '\\';
                            classBody += member;
                        }
                        else
                            classBody += member;
                    }
                    if (!closed)
                        return std::unexpected(std::string{"unterminated bracket expression"});

                    if (negatedClass)
                        regex += "[^/" + classBody + "]";
                    else
                        regex += "[" + classBody + "]";
                    i = pos + 1;
                    break;
                }
                case '\\':
                {
                    if (i + 1 >= glob.size())
                        return std::unexpected(std::string{"dangling escape at end of pattern"});
                    appendLiteral(regex, glob[i + 1]);
                    i += 2;
                    break;
                }
                default:
                {
                    appendLiteral(regex, c);
                    ++i;
                    break;
                }
            }
        }
        return regex;
    }

    std::expected<std::optional<Pattern>, SharedData::Error> Pattern::parse(std::string_view line)
    {
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if (line.empty() || line.front() == '#')
            return std::nullopt;

        line = trimTrailingSpaces(line);
        if (line.empty())
            return std::nullopt;

        Pattern pattern;
        pattern.source_ = std::string{line};

        if (line.front() == '!')
        {
            pattern.negated_ = true;
            line.remove_prefix(1);
        }

        while (!line.empty() && line.back() == '/')
        {
            pattern.directoryOnly_ = true;
            line.remove_suffix(1);
        }

        if (line.empty())
            return std::nullopt;

        pattern.anchored_ = hasUnescapedSlash(line);
        while (!line.empty() && line.front() == '/')
            line.remove_prefix(1);

        auto body = globToRegex(line);
        if (!body)
        {
            return std::unexpected(SharedData::Error{
                .type = SharedData::ErrorType::InvalidIgnorePattern,
                .extraInfo = fmt::format("'{}': {}", pattern.source_, body.error()),
            });
        }

        // Without a slash the pattern matches a name at any depth.
        const auto prefix = pattern.anchored_ ? std::string{} : std::string{"(?:.*/)?"};
        try
        {
            pattern.regex_ = std::regex{"^" + prefix + *body + "$", std::regex::ECMAScript | std::regex::optimize};
        }
        catch (std::regex_error const& exc)
        {
            return std::unexpected(SharedData::Error{
                .type = SharedData::ErrorType::InvalidIgnorePattern,
                .extraInfo = fmt::format("'{}': {}", pattern.source_, exc.what()),
            });
        }
        return pattern;
    }

    bool Pattern::matches(std::string const& relativePath, bool isDirectory) const
    {
        if (directoryOnly_ && !isDirectory)
            return false;
        return std::regex_match(relativePath, regex_);
    }
}
