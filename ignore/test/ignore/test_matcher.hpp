#pragma once

#include <ignore/matcher.hpp>

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>
#include <vector>

namespace Ignore::Test
{
    class MatcherTests : public ::testing::Test
    {
      protected:
        Matcher compile(std::vector<std::string> const& lines)
        {
            auto matcher = Matcher::compile(lines);
            if (!matcher)
                throw std::runtime_error("Could not compile: " + matcher.error().toString());
            return std::move(matcher).value();
        }
    };

    TEST_F(MatcherTests, DefaultMatcherExcludesNothing)
    {
        Matcher matcher;
        EXPECT_FALSE(matcher.isExcluded("anything", false));
        EXPECT_EQ(matcher.patternCount(), 0);
    }

    TEST_F(MatcherTests, NegationReincludes)
    {
        const auto matcher = compile({"*.log", "!keep.log"});

        EXPECT_TRUE(matcher.isExcluded("debug.log", false));
        EXPECT_FALSE(matcher.isExcluded("keep.log", false));
        EXPECT_FALSE(matcher.isExcluded("main.cpp", false));
    }

    TEST_F(MatcherTests, LastMatchingPatternDecides)
    {
        const auto matcher = compile({"!keep.log", "*.log"});

        EXPECT_TRUE(matcher.isExcluded("keep.log", false));
    }

    TEST_F(MatcherTests, ChildrenOfExcludedDirectoriesAreExcluded)
    {
        const auto matcher = compile({"build/", "!build/keep.txt"});

        EXPECT_TRUE(matcher.isExcluded("build", true));
        EXPECT_TRUE(matcher.isExcluded("build/out.o", false));
        EXPECT_TRUE(matcher.isExcluded("build/keep.txt", false));
        EXPECT_FALSE(matcher.isExcluded("src/build.cpp", false));
    }

    TEST_F(MatcherTests, CommentsAndBlankLinesAreSkipped)
    {
        const auto matcher = compile({"# *.cpp", "", "*.o"});

        EXPECT_EQ(matcher.patternCount(), 1);
        EXPECT_FALSE(matcher.isExcluded("main.cpp", false));
        EXPECT_TRUE(matcher.isExcluded("main.o", false));
    }

    TEST_F(MatcherTests, ScopedPatternsOnlyApplyBelowTheirDirectory)
    {
        Matcher matcher;
        ASSERT_TRUE(matcher.addPatterns({"*.tmp", "/local"}, "sub").has_value());

        EXPECT_TRUE(matcher.isExcluded("sub/a.tmp", false));
        EXPECT_TRUE(matcher.isExcluded("sub/deeper/a.tmp", false));
        EXPECT_TRUE(matcher.isExcluded("sub/local", false));
        EXPECT_FALSE(matcher.isExcluded("sub/deeper/local", false));
        EXPECT_FALSE(matcher.isExcluded("a.tmp", false));
        EXPECT_FALSE(matcher.isExcluded("subway/a.tmp", false));
    }

    TEST_F(MatcherTests, PrefixedPatternsSeePathsFromTheirOwnDirectory)
    {
        Matcher matcher;
        ASSERT_TRUE(matcher.addPatterns({"/project/generated", "/generated"}, {}, "project").has_value());

        EXPECT_TRUE(matcher.isExcluded("generated", true));
        EXPECT_TRUE(matcher.isExcluded("generated/file.cpp", false));
        EXPECT_FALSE(matcher.isExcluded("src/generated", true));
    }

    TEST_F(MatcherTests, DisabledMatcherExcludesNothing)
    {
        auto matcher = Matcher::disabled();
        ASSERT_TRUE(matcher.addPatterns({"*"}).has_value());

        EXPECT_TRUE(matcher.isDisabled());
        EXPECT_FALSE(matcher.isExcluded("anything", false));
    }

    TEST_F(MatcherTests, CompileFailsOnMalformedPatterns)
    {
        auto matcher = Matcher::compile({"*.o", "[oops"});

        ASSERT_FALSE(matcher.has_value());
        EXPECT_EQ(matcher.error().type, SharedData::ErrorType::InvalidIgnorePattern);
    }

    TEST_F(MatcherTests, MalformedPatternsCanBeSkipped)
    {
        Matcher matcher;
        const auto errors = matcher.addPatternsSkippingInvalid({"*.o", "[oops", "*.a"});

        ASSERT_EQ(errors.size(), 1);
        EXPECT_EQ(errors.front().type, SharedData::ErrorType::InvalidIgnorePattern);
        EXPECT_EQ(matcher.patternCount(), 2);
        EXPECT_TRUE(matcher.isExcluded("lib.a", false));
    }
}
