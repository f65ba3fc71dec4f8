#pragma once

#include <mane/application.hpp>
#include <mane/version.hpp>
#include <utility/file_io.hpp>
#include <utility/temporary_directory.hpp>

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <filesystem>
#include <sstream>
#include <stdexcept>
#include <string>

extern std::filesystem::path programDirectory;

namespace Mane::Test
{
    class ApplicationTests : public ::testing::Test
    {
      protected:
        void SetUp() override
        {
            std::filesystem::create_directories(root() / ".git");
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

        std::string readFile(std::filesystem::path const& path)
        {
            auto content = Utility::readFile(path);
            if (!content)
                throw std::runtime_error("Could not read " + path.string());
            return std::move(content).value();
        }

        // Logging stays off regardless of what the application would pick.
        Arguments quiet(Arguments arguments)
        {
            if (!arguments.logLevel)
                arguments.logLevel = "off";
            return arguments;
        }

        int run(Arguments arguments, std::string const& input = {}, bool inputIsTerminal = true)
        {
            input_.str(input);
            Application application{
                quiet(std::move(arguments)),
                Environment{
                    .input = &input_,
                    .output = &output_,
                    .errorOutput = &errorOutput_,
                    .inputIsTerminal = inputIsTerminal,
                    .workingDirectory = root(),
                },
            };
            return application.run();
        }

      protected:
        Utility::TemporaryDirectory isolateDirectory_{programDirectory / "temp", true};
        std::istringstream input_{};
        std::ostringstream output_{};
        std::ostringstream errorOutput_{};
    };

    TEST_F(ApplicationTests, StreamModeRewritesInput)
    {
        Arguments arguments;
        arguments.rules = {{.from = "Hello", .to = "Hi"}, {.from = "World", .to = "Japan"}};

        EXPECT_EQ(run(arguments, "Hello, World", false), exitSuccess);
        EXPECT_EQ(output_.str(), "Hi, Japan");
    }

    TEST_F(ApplicationTests, EmptyStreamFails)
    {
        Arguments arguments;
        arguments.rules = {{.from = "Hello", .to = "Hi"}};

        EXPECT_EQ(run(arguments, "", false), exitFailure);
    }

    TEST_F(ApplicationTests, TerminalInputWithoutFilesIsUsageError)
    {
        Arguments arguments;
        arguments.rules = {{.from = "Hello", .to = "Hi"}};

        EXPECT_EQ(run(arguments, "", true), exitUsage);
        EXPECT_TRUE(output_.str().empty());
        EXPECT_THAT(errorOutput_.str(), ::testing::HasSubstr("Usage: mane"));
    }

    TEST_F(ApplicationTests, RulesAreRequiredOutsideCopyMode)
    {
        Arguments arguments;
        EXPECT_EQ(run(arguments, "Hello", false), exitUsage);
    }

    TEST_F(ApplicationTests, EmptyFromIsUsageError)
    {
        Arguments arguments;
        arguments.rules = {{.from = "", .to = "x"}};
        EXPECT_EQ(run(arguments, "Hello", false), exitUsage);
    }

    TEST_F(ApplicationTests, HelpAndVersion)
    {
        Arguments help;
        help.showHelp = true;
        EXPECT_EQ(run(help), exitSuccess);
        EXPECT_THAT(output_.str(), ::testing::HasSubstr("Usage: mane"));

        output_.str("");
        Arguments showVersion;
        showVersion.showVersion = true;
        EXPECT_EQ(run(showVersion), exitSuccess);
        EXPECT_THAT(output_.str(), ::testing::HasSubstr(version));
    }

    TEST_F(ApplicationTests, CopyWithRelativePaths)
    {
        writeFile(root() / "Awesome" / "foo" / "index.tsx", "export const Foo = foo;\n");
        writeFile(root() / "Awesome" / "foo" / "sub" / "foo-item.tsx", "FOO\n");

        Arguments arguments;
        arguments.rules = {{.from = "foo", .to = "bar"}};
        arguments.copySources = {"Awesome/foo"};
        arguments.copyDestination = "Cool";
        std::filesystem::create_directories(root() / "Cool");
        arguments.inPlace = true;

        EXPECT_EQ(run(arguments), exitSuccess);
        EXPECT_EQ(readFile(root() / "Cool" / "bar" / "index.tsx"), "export const Bar = bar;\n");
        EXPECT_EQ(readFile(root() / "Cool" / "bar" / "sub" / "bar-item.tsx"), "BAR\n");
    }

    TEST_F(ApplicationTests, CopyWithoutRulesCopiesVerbatim)
    {
        writeFile(root() / "src" / "foo.txt", "foo\n");

        Arguments arguments;
        arguments.copySources = {"src"};
        arguments.copyDestination = "dst";

        EXPECT_EQ(run(arguments), exitSuccess);
        EXPECT_EQ(readFile(root() / "dst" / "foo.txt"), "foo\n");
    }

    TEST_F(ApplicationTests, MissingCopySourceFails)
    {
        Arguments arguments;
        arguments.copySources = {"nowhere"};
        arguments.copyDestination = "dst";

        EXPECT_EQ(run(arguments), exitFailure);
    }

    TEST_F(ApplicationTests, FilesModePrintsRewrittenContent)
    {
        writeFile(root() / "a.txt", "foo_bar\n");

        Arguments arguments;
        arguments.rules = {{.from = "foo", .to = "qux"}};
        arguments.files = {"a.txt"};

        EXPECT_EQ(run(arguments), exitSuccess);
        EXPECT_EQ(output_.str(), "qux_bar\n");
        EXPECT_EQ(readFile(root() / "a.txt"), "foo_bar\n");
    }

    TEST_F(ApplicationTests, MissingFileFailsFilesMode)
    {
        writeFile(root() / "a.txt", "a\n");

        Arguments arguments;
        arguments.rules = {{.from = "a", .to = "b"}};
        arguments.files = {"a.txt", "missing.txt"};

        EXPECT_EQ(run(arguments), exitFailure);
        EXPECT_EQ(output_.str(), "b\n");
    }

    TEST_F(ApplicationTests, InPlaceRewritesHiddenFiles)
    {
        writeFile(root() / "project" / ".foo.env", "FOO=1\n");

        Arguments arguments;
        arguments.rules = {{.from = "foo", .to = "bar"}};
        arguments.files = {"project"};
        arguments.inPlace = true;

        EXPECT_EQ(run(arguments), exitSuccess);
        EXPECT_EQ(readFile(root() / "project" / ".bar.env"), "BAR=1\n");
    }

    TEST_F(ApplicationTests, InPlaceDefaultsToWorkingDirectory)
    {
        writeFile(root() / "foo_dir" / "foo.txt", "FooBar\n");

        Arguments arguments;
        arguments.rules = {{.from = "foo", .to = "qux"}};
        arguments.inPlace = true;

        EXPECT_EQ(run(arguments), exitSuccess);
        EXPECT_TRUE(std::filesystem::is_directory(root()));
        EXPECT_EQ(readFile(root() / "qux_dir" / "qux.txt"), "QuxBar\n");
    }

    TEST_F(ApplicationTests, ConfigurationRulesAreMergedWithCommandLine)
    {
        writeFile(
            root() / ".mane.json",
            R"({"rules": [{"from": "foo", "to": "bar"}, {"from": "alpha", "to": "beta"}]})");

        Arguments arguments;
        arguments.rules = {{.from = "foo", .to = "baz"}};

        Application application{
            quiet(arguments),
            Environment{.input = &input_, .output = &output_, .workingDirectory = root()},
        };
        const auto config = application.effectiveConfig();
        ASSERT_TRUE(config.has_value()) << config.error().toString();
        EXPECT_EQ(
            *config->rules,
            (std::vector<Replace::Rule>{{.from = "alpha", .to = "beta"}, {.from = "foo", .to = "baz"}}));
        EXPECT_EQ(config->caseAware, std::optional<bool>{true});

        EXPECT_EQ(run(arguments, "foo alpha", false), exitSuccess);
        EXPECT_EQ(output_.str(), "baz beta");
    }

    TEST_F(ApplicationTests, ConfigurationCanDisableCaseAwareness)
    {
        writeFile(root() / "settings.json", R"({"caseAware": false})");

        Arguments arguments;
        arguments.rules = {{.from = "foo", .to = "bar"}};
        arguments.configPath = "settings.json";

        EXPECT_EQ(run(arguments, "foo Foo", false), exitSuccess);
        EXPECT_EQ(output_.str(), "bar Foo");
    }

    TEST_F(ApplicationTests, VerboseWithoutLevelLogsDebug)
    {
        Arguments arguments;
        arguments.verbose = true;

        Application application{arguments, Environment{.input = &input_, .output = &output_, .workingDirectory = root()}};
        const auto config = application.effectiveConfig();
        ASSERT_TRUE(config.has_value());
        EXPECT_EQ(config->logLevel, std::optional<std::string>{"debug"});
        EXPECT_EQ(config->verbose, std::optional<bool>{true});
    }

    TEST_F(ApplicationTests, InvalidConfigurationIsUsageError)
    {
        writeFile(root() / ".mane.json", "{ not json");

        Arguments arguments;
        arguments.rules = {{.from = "foo", .to = "bar"}};

        EXPECT_EQ(run(arguments, "foo", false), exitUsage);
        EXPECT_TRUE(output_.str().empty());
    }

    TEST_F(ApplicationTests, MissingExplicitConfigurationIsUsageError)
    {
        Arguments arguments;
        arguments.rules = {{.from = "foo", .to = "bar"}};
        arguments.configPath = "absent.json";

        EXPECT_EQ(run(arguments, "foo", false), exitUsage);
    }
}
