#include <replace/rule_set.hpp>
#include <log/log.hpp>
#include <utility/algorithm/case_convert.hpp>
#include <utility/enum_string_convert.hpp>

#include <algorithm>

namespace Replace
{
    using Utility::NamingConvention;

    std::optional<NamingConvention> resolveConvention(
        std::vector<NamingConvention> const& matchedConventions,
        bool isLiteral,
        NamingConvention fromConvention,
        NamingConvention toConvention)
    {
        auto contains = [&matchedConventions](NamingConvention convention) {
            return std::find(matchedConventions.begin(), matchedConventions.end(), convention) !=
                matchedConventions.end();
        };

        if (fromConvention != NamingConvention::Unknown && contains(fromConvention))
            return fromConvention;
        if (matchedConventions.size() == 1)
            return matchedConventions.front();
        if (isLiteral || matchedConventions.empty())
            return std::nullopt;
        if (toConvention != NamingConvention::Unknown && contains(toConvention))
            return toConvention;
        return matchedConventions.front();
    }

    std::string mirrorCase(std::string_view matched, std::string_view replacement)
    {
        if (matched.size() != replacement.size())
            return std::string{replacement};

        std::string result{replacement};
        for (std::size_t i = 0; i < result.size(); ++i)
        {
            if (Utility::Algorithm::isUpper(matched[i]))
                result[i] = Utility::Algorithm::toUpper(result[i]);
            else if (Utility::Algorithm::isLower(matched[i]))
                result[i] = Utility::Algorithm::toLower(result[i]);
        }
        return result;
    }

    std::expected<RuleSet, SharedData::Error> RuleSet::create(std::vector<Rule> rules, RuleSetOptions options)
    {
        RuleSet ruleSet;
        for (auto const& rule : rules)
        {
            if (rule.from.empty())
            {
                return std::unexpected(SharedData::Error{
                    .type = SharedData::ErrorType::InvalidRule,
                    .extraInfo = fmt::format("Empty FROM is not allowed (replacement '{}')", rule.to),
                });
            }

            if (rule.from == rule.to)
            {
                Log::debug("RuleSet: Rule '{}' -> '{}' replaces a text by itself, skipping it.", rule.from, rule.to);
                continue;
            }
            ruleSet.compiled_.push_back(compile(rule, options));
        }
        ruleSet.rules_ = std::move(rules);
        return ruleSet;
    }

    RuleSet::CompiledRule RuleSet::compile(Rule const& rule, RuleSetOptions const& options)
    {
        CompiledRule compiled;
        if (!options.caseAware)
        {
            compiled.candidates.push_back(Candidate{.text = rule.from, .replacement = rule.to});
            return compiled;
        }

        const auto from = Utility::tokenize(rule.from);
        const auto to = Utility::tokenize(rule.to);

        // Distinct renderings, each with all conventions that produce it.
        struct Rendering
        {
            std::string text;
            std::vector<NamingConvention> conventions;
            bool isLiteral;
        };
        std::vector<Rendering> renderings{Rendering{.text = rule.from, .conventions = {}, .isLiteral = true}};

        for (auto const convention : Utility::renderableConventions)
        {
            auto text = from.render(convention);
            if (text.empty())
                continue;

            auto iter = std::find_if(renderings.begin(), renderings.end(), [&text](auto const& rendering) {
                return rendering.text == text;
            });
            if (iter == renderings.end())
                renderings.push_back(Rendering{.text = std::move(text), .conventions = {convention}, .isLiteral = false});
            else
                iter->conventions.push_back(convention);
        }

        for (auto const& rendering : renderings)
        {
            const auto convention =
                resolveConvention(rendering.conventions, rendering.isLiteral, from.convention, to.convention);

            Candidate candidate{
                .text = rendering.text,
                .replacement = convention ? to.render(*convention) : mirrorCase(rendering.text, rule.to),
            };
            Log::trace(
                "RuleSet: '{}' -> '{}' ({}).",
                candidate.text,
                candidate.replacement,
                convention ? Utility::enumToString(*convention) : std::string{"literal"});
            compiled.candidates.push_back(std::move(candidate));
        }

        std::stable_sort(compiled.candidates.begin(), compiled.candidates.end(), [](auto const& lhs, auto const& rhs) {
            return lhs.text.size() > rhs.text.size();
        });
        return compiled;
    }

    std::string RuleSet::applyRule(CompiledRule const& rule, std::string_view text)
    {
        std::string result;
        result.reserve(text.size());

        std::size_t offset = 0;
        while (offset < text.size())
        {
            const auto rest = text.substr(offset);
            auto match = std::find_if(rule.candidates.begin(), rule.candidates.end(), [&rest](auto const& candidate) {
                return rest.starts_with(candidate.text);
            });

            if (match == rule.candidates.end())
            {
                result += text[offset];
                ++offset;
                continue;
            }

            result += match->replacement;
            offset += match->text.size();
        }
        return result;
    }

    std::string RuleSet::apply(std::string_view text) const
    {
        std::string result{text};
        for (auto const& rule : compiled_)
            result = applyRule(rule, result);
        return result;
    }

    std::string RuleSet::applyToName(std::string_view name) const
    {
        std::string result;
        result.reserve(name.size());

        std::size_t begin = 0;
        while (true)
        {
            const auto end = name.find('/', begin);
            result += apply(name.substr(begin, end == std::string_view::npos ? std::string_view::npos : end - begin));
            if (end == std::string_view::npos)
                break;
            result += '/';
            begin = end + 1;
        }
        return result;
    }

    std::vector<Rule> mergeRules(std::vector<Rule> base, std::vector<Rule> const& overrides)
    {
        for (auto const& rule : overrides)
        {
            std::erase_if(base, [&rule](Rule const& existing) {
                return existing.from == rule.from;
            });
            base.push_back(rule);
        }
        return base;
    }
}
