#pragma once

#include <shared_data/error.hpp>
#include <utility/convert_naming_convention.hpp>

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Replace
{
    struct Rule
    {
        std::string from{};
        std::string to{};

        bool operator==(Rule const&) const = default;
    };

    struct RuleSetOptions
    {
        // Off: only the literal from text is matched and replaced verbatim.
        bool caseAware{true};
    };

    /**
     * @brief Ordered replacement rules, applied as a left fold: every rule sees the output of the previous one.
     *
     * For each rule the from text is rendered in every naming convention. Text is scanned left to right, at each
     * offset the longest rendering wins, and the to text is rendered in the convention of the matched rendering.
     * Matches do not need to sit on word boundaries, "foo" inside "foobar" is replaced.
     */
    class RuleSet
    {
      public:
        RuleSet() = default;

        /**
         * @brief Validates and compiles the rules. An empty from text is an InvalidRule error. Rules that replace
         * a text by itself are accepted and skipped.
         */
        static std::expected<RuleSet, SharedData::Error> create(std::vector<Rule> rules, RuleSetOptions options = {});

        std::string apply(std::string_view text) const;

        /**
         * @brief Same as apply, but every '/' separated component is rewritten on its own.
         */
        std::string applyToName(std::string_view name) const;

        std::vector<Rule> const& rules() const
        {
            return rules_;
        }
        bool empty() const
        {
            return compiled_.empty();
        }

      private:
        struct Candidate
        {
            std::string text;
            std::string replacement;
        };

        struct CompiledRule
        {
            // Longest first, so the first hit at an offset is the longest one.
            std::vector<Candidate> candidates;
        };

        static CompiledRule compile(Rule const& rule, RuleSetOptions const& options);
        static std::string applyRule(CompiledRule const& rule, std::string_view text);

      private:
        std::vector<Rule> rules_{};
        std::vector<CompiledRule> compiled_{};
    };

    /**
     * @brief Picks the convention to render the replacement in for a match that equals the renderings of the from
     * text in all of matchedConventions.
     *
     * @return std::nullopt when the match is the literal from text and no convention applies, the replacement is
     * then built by mirrorCase.
     */
    std::optional<Utility::NamingConvention> resolveConvention(
        std::vector<Utility::NamingConvention> const& matchedConventions,
        bool isLiteral,
        Utility::NamingConvention fromConvention,
        Utility::NamingConvention toConvention);

    /**
     * @brief Copies the case of every letter of matched onto the character at the same position of replacement.
     * Replacements of a different length are returned unchanged.
     */
    std::string mirrorCase(std::string_view matched, std::string_view replacement);

    /**
     * @brief Appends overrides to base. Any earlier rule with the same from text is dropped, so the last
     * definition of a from text wins and takes the position of that last definition.
     */
    std::vector<Rule> mergeRules(std::vector<Rule> base, std::vector<Rule> const& overrides);
}
