#pragma once

#include "common_fixture.hpp"

#include <operations/stream_operation.hpp>

#include <gtest/gtest.h>

#include <sstream>

namespace Operations::Test
{
    class StreamOperationTests : public CommonFixture
    {};

    TEST_F(StreamOperationTests, InputIsRewrittenToOutput)
    {
        std::istringstream input{"Hello, World"};
        std::ostringstream output;

        auto const& rules = makeRules({{.from = "Hello", .to = "Hi"}, {.from = "World", .to = "Japan"}});
        StreamOperation operation{rules, input, output};

        ASSERT_TRUE(operation.runToCompletion().has_value());
        EXPECT_EQ(output.str(), "Hi, Japan");
        EXPECT_TRUE(operation.replacementsMade());
        EXPECT_EQ(operation.state(), SharedData::OperationState::Completed);
    }

    TEST_F(StreamOperationTests, UnmatchedInputIsPassedThrough)
    {
        std::istringstream input{"nothing here\n"};
        std::ostringstream output;

        auto const& rules = makeRules({{.from = "Hello", .to = "Hi"}});
        StreamOperation operation{rules, input, output};

        ASSERT_TRUE(operation.runToCompletion().has_value());
        EXPECT_EQ(output.str(), "nothing here\n");
        EXPECT_FALSE(operation.replacementsMade());
    }

    TEST_F(StreamOperationTests, EmptyInputIsAnError)
    {
        std::istringstream input{""};
        std::ostringstream output;

        auto const& rules = makeRules({{.from = "Hello", .to = "Hi"}});
        StreamOperation operation{rules, input, output};

        const auto result = operation.runToCompletion();
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().type, SharedData::ErrorType::IOFailure);
        EXPECT_EQ(operation.state(), SharedData::OperationState::Failed);
        EXPECT_TRUE(output.str().empty());
    }
}
