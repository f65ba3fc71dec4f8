#pragma once

#include <ignore/ignore_files.hpp>
#include <utility/file_io.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>

#include <filesystem>
#include <stdexcept>
#include <string>

extern std::filesystem::path programDirectory;

namespace Ignore::Test
{
    class IgnoreFilesTests : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            std::filesystem::create_directories(root() / ".git" / "info");
        }

        std::filesystem::path root() const
        {
            return isolateDirectory_.path();
        }

        void writeFile(std::filesystem::path const& path, std::string const& content)
        {
            std::filesystem::create_directories(path.parent_path());
            if (!Utility::writeFile(path, content))
                throw std::runtime_error("Could not write " + path.string());
        }

      protected:
        Utility::TemporaryDirectory isolateDirectory_{programDirectory / "temp", true};
    };

    TEST_F(IgnoreFilesTests, LinesAreReadAsTheyAre)
    {
        writeFile(root() / ".gitignore", "# comment\n*.log\r\n\nbuild/");

        auto file = readIgnoreFile(root() / ".gitignore", root());

        ASSERT_TRUE(file.has_value());
        ASSERT_EQ(file->lines.size(), 4);
        EXPECT_EQ(file->lines[1], "*.log\r");
        EXPECT_EQ(file->lines[3], "build/");
        EXPECT_EQ(file->anchorDirectory, root());
    }

    TEST_F(IgnoreFilesTests, MissingFileIsAnIOFailure)
    {
        auto file = readIgnoreFile(root() / "nope", root());

        ASSERT_FALSE(file.has_value());
        EXPECT_EQ(file.error().type, SharedData::ErrorType::IOFailure);
    }

    TEST_F(IgnoreFilesTests, FilesFromTheRepositoryRootDownAreLocated)
    {
        writeFile(root() / ".git" / "info" / "exclude", "*.secret\n");
        writeFile(root() / ".gitignore", "*.log\n");
        writeFile(root() / "sub" / ".gitignore", "*.tmp\n");
        writeFile(root() / "sub" / "inner" / ".gitignore", "*.bak\n");

        const auto files = locateIgnoreFiles(root() / "sub");

        ASSERT_EQ(files.size(), 3);
        EXPECT_EQ(files[0].source, root() / ".git" / "info" / "exclude");
        EXPECT_EQ(files[1].source, root() / ".gitignore");
        EXPECT_EQ(files[2].source, root() / "sub" / ".gitignore");
        EXPECT_EQ(files[2].anchorDirectory, root() / "sub");
    }

    TEST_F(IgnoreFilesTests, OuterFilesAreUnusedOutsideARepository)
    {
        // The build directory may sit inside a repository, the system temporary directory usually does not.
        Utility::TemporaryDirectory outside{std::filesystem::temp_directory_path() / "mane_tmpdir", true};
        for (auto current = outside.path();; current = current.parent_path())
        {
            if (std::filesystem::exists(current / ".git"))
                GTEST_SKIP() << "Temporary directory is inside the repository " << current;
            if (current == current.parent_path())
                break;
        }
        writeFile(outside.path() / ".gitignore", "*.log\n");
        writeFile(outside.path() / "sub" / ".gitignore", "*.tmp\n");

        const auto files = locateIgnoreFiles(outside.path() / "sub");

        ASSERT_EQ(files.size(), 1);
        EXPECT_EQ(files[0].source, outside.path() / "sub" / ".gitignore");
        EXPECT_FALSE(buildMatcher(outside.path() / "sub").isExcluded("a.log", false));
    }

    TEST_F(IgnoreFilesTests, MatcherForASubdirectoryHonorsOuterFiles)
    {
        writeFile(root() / ".gitignore", "*.log\n/sub/generated/\n");
        std::filesystem::create_directories(root() / "sub" / "generated");

        const auto matcher = buildMatcher(root() / "sub");

        EXPECT_TRUE(matcher.isExcluded("a.log", false));
        EXPECT_TRUE(matcher.isExcluded("generated", true));
        EXPECT_TRUE(matcher.isExcluded("generated/a.cpp", false));
        EXPECT_FALSE(matcher.isExcluded("a.cpp", false));
    }

    TEST_F(IgnoreFilesTests, MalformedLinesAreSkipped)
    {
        writeFile(root() / ".gitignore", "[broken\n*.log\n");

        const auto matcher = buildMatcher(root());

        EXPECT_EQ(matcher.patternCount(), 1);
        EXPECT_TRUE(matcher.isExcluded("a.log", false));
    }

    TEST_F(IgnoreFilesTests, LocatorCanBeReplaced)
    {
        const auto matcher = buildMatcher(root(), [this](std::filesystem::path const&) {
            return std::vector<IgnoreFile>{IgnoreFile{
                .lines = {"*.gen"},
                .anchorDirectory = root() / "nested",
                .source = "in-memory",
            }};
        });

        EXPECT_TRUE(matcher.isExcluded("nested/a.gen", false));
        EXPECT_FALSE(matcher.isExcluded("a.gen", false));
    }

    TEST_F(IgnoreFilesTests, NestedFilesAreScoped)
    {
        Matcher matcher;
        addNestedIgnoreFile(matcher, IgnoreFile{.lines = {"*.o"}, .anchorDirectory = {}, .source = {}}, "lib");

        EXPECT_TRUE(matcher.isExcluded("lib/a.o", false));
        EXPECT_FALSE(matcher.isExcluded("a.o", false));
    }
}
