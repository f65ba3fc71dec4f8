#pragma once

#include <utility/file_io.hpp>
#include <utility/temporary_directory.hpp>
#include <utility/text_detection.hpp>

#include <gtest/gtest.h>

#include <sstream>
#include <string>

using namespace std::string_literals;

extern std::filesystem::path programDirectory;

namespace Utility::Test
{
    class TextDetectionTests : public ::testing::Test
    {};

    TEST_F(TextDetectionTests, AsciiAndUtf8AreText)
    {
        EXPECT_TRUE(looksLikeText("plain ascii\n"));
        EXPECT_TRUE(looksLikeText(""));
        EXPECT_TRUE(looksLikeText("gr\xc3\xbc\xc3\x9f dich \xe6\x97\xa5\xe6\x9c\xac \xf0\x9f\x98\x80"));
    }

    TEST_F(TextDetectionTests, NulByteMeansBinary)
    {
        EXPECT_FALSE(looksLikeText("abc\0def"s));
    }

    TEST_F(TextDetectionTests, MalformedUtf8IsRejected)
    {
        EXPECT_FALSE(isValidUtf8("\xff"));
        // Truncated sequence.
        EXPECT_FALSE(isValidUtf8("\xe6\x97"));
        // Overlong encoding of '/'.
        EXPECT_FALSE(isValidUtf8("\xc0\xaf"));
        // Encoded surrogate.
        EXPECT_FALSE(isValidUtf8("\xed\xa0\x80"));
        // Above U+10FFFF.
        EXPECT_FALSE(isValidUtf8("\xf4\x90\x80\x80"));
        EXPECT_TRUE(isValidUtf8("\xf4\x8f\xbf\xbf"));
    }

    class FileIoTests : public ::testing::Test
    {
      protected:
        Utility::TemporaryDirectory isolateDirectory_{programDirectory / "temp", true};
    };

    TEST_F(FileIoTests, WrittenBytesAreReadBack)
    {
        const auto path = isolateDirectory_.path() / "data.bin";
        const auto data = "line\r\n\0\xff"s;

        ASSERT_TRUE(writeFile(path, data).has_value());
        const auto content = readFile(path);
        ASSERT_TRUE(content.has_value());
        EXPECT_EQ(*content, data);

        ASSERT_TRUE(writeFile(path, "short").has_value());
        EXPECT_EQ(readFile(path).value(), "short");
    }

    TEST_F(FileIoTests, MissingFileIsAnError)
    {
        const auto content = readFile(isolateDirectory_.path() / "missing");
        ASSERT_FALSE(content.has_value());
        EXPECT_TRUE(static_cast<bool>(content.error()));
    }

    TEST_F(FileIoTests, StreamsAreReadCompletely)
    {
        std::istringstream input{"first\nsecond"};
        EXPECT_EQ(readStream(input).value(), "first\nsecond");

        std::ostringstream output;
        ASSERT_TRUE(writeStream(output, "out").has_value());
        EXPECT_EQ(output.str(), "out");
    }

    TEST_F(FileIoTests, TemporaryDirectoryIsRemoved)
    {
        std::filesystem::path path;
        {
            Utility::TemporaryDirectory directory{isolateDirectory_.path() / "nested"};
            path = directory.path();
            EXPECT_TRUE(std::filesystem::is_directory(path));
            ASSERT_TRUE(writeFile(path / "file", "x").has_value());
        }
        EXPECT_FALSE(std::filesystem::exists(path));
    }
}
