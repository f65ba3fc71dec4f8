#pragma once

#include <replace/rule_set.hpp>
#include <shared_data/error.hpp>
#include <utility/describe.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Mane
{
    BOOST_DEFINE_ENUM_CLASS(Mode, Stream, Files, FilesAndNames, Copy)

    struct Arguments
    {
        // In command line order.
        std::vector<Replace::Rule> rules{};
        std::vector<std::filesystem::path> copySources{};
        std::optional<std::filesystem::path> copyDestination{std::nullopt};
        std::vector<std::filesystem::path> files{};
        bool inPlace{false};
        bool includeGitIgnore{false};
        bool verbose{false};
        std::optional<std::string> logLevel{std::nullopt};
        std::optional<std::filesystem::path> configPath{std::nullopt};
        bool showHelp{false};
        bool showVersion{false};

        bool isCopy() const
        {
            return copyDestination.has_value();
        }
    };

    /**
     * @brief Parses the command line. Does not touch the file system.
     *
     * "-r" takes exactly two values, further values of the same occurrence are positional files. "-c" takes all
     * values up to the next option, the last of them is the destination.
     */
    std::expected<Arguments, SharedData::Error> parseArguments(int argc, char const* const* argv);

    /**
     * @brief Picks the mode of operation.
     *
     * @param inputIsTerminal Standard input is interactive, so there is no input to stream.
     */
    std::expected<Mode, SharedData::Error> resolveMode(Arguments const& arguments, bool inputIsTerminal);

    std::string usage();
}
