#pragma once

#include <mane/arguments.hpp>
#include <persistence/config.hpp>
#include <replace/rule_set.hpp>
#include <shared_data/error.hpp>

#include <expected>
#include <filesystem>
#include <iostream>
#include <istream>
#include <ostream>

namespace Mane
{
    constexpr int exitSuccess = 0;
    constexpr int exitFailure = 1;
    constexpr int exitUsage = 2;

    /**
     * @brief What the process was started with, besides its arguments.
     */
    struct Environment
    {
        std::istream* input;
        std::ostream* output;
        // Usage text after argument errors, standard output stays reserved for content.
        std::ostream* errorOutput{&std::cerr};
        bool inputIsTerminal{false};
        // Relative paths and the default configuration file are resolved against this.
        std::filesystem::path workingDirectory{};
    };

    class Application
    {
      public:
        Application(Arguments arguments, Environment environment);

        /**
         * @brief Runs the selected mode.
         *
         * @return exitSuccess, exitFailure when an entry or the operation failed, exitUsage for invalid arguments
         * or configuration.
         */
        int run();

        /**
         * @brief Configuration file values overridden by the command line, completed with the defaults.
         */
        std::expected<Persistence::Config, SharedData::Error> effectiveConfig() const;

      private:
        std::filesystem::path resolvePath(std::filesystem::path const& path) const;
        std::vector<std::filesystem::path> resolvePaths(std::vector<std::filesystem::path> const& paths) const;

        int runCopy(Replace::RuleSet const& rules, Persistence::Config const& config);
        int runFiles(Replace::RuleSet const& rules, Persistence::Config const& config, bool inPlace);
        int runStream(Replace::RuleSet const& rules);

      private:
        Arguments arguments_;
        Environment environment_;
    };
}
