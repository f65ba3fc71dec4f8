#include <mane/arguments.hpp>
#include <log/level.hpp>

#include <boost/program_options.hpp>
#include <fmt/format.h>

#include <sstream>

namespace po = boost::program_options;

namespace Mane
{
    namespace
    {
        po::options_description visibleOptions()
        {
            po::options_description options{"Options"};
            // clang-format off
            options.add_options()
                ("copy,c", po::value<std::vector<std::string>>()->multitoken()->composing(),
                    "SOURCE... TARGET: copy files and directories into TARGET, rewriting contents")
                ("replace,r", po::value<std::vector<std::string>>()->multitoken()->composing(),
                    "FROM TO: replace FROM with TO in every naming convention, repeatable")
                ("in-place,i", po::bool_switch(), "rename copied entries, or rewrite FILEs and their names in place")
                ("include-git-ignore", po::bool_switch(), "do not skip entries excluded by .gitignore files")
                ("verbose", po::bool_switch(), "log every processed entry")
                ("log-level", po::value<std::string>(), "trace, debug, info, warning, error, critical or off")
                ("config", po::value<std::string>(), "JSON configuration file (default: ./.mane.json if present)")
                ("help,h", po::bool_switch(), "show this help")
                ("version,V", po::bool_switch(), "show the version");
            // clang-format on
            return options;
        }

        SharedData::Error invalidArguments(std::string message)
        {
            return SharedData::Error{.type = SharedData::ErrorType::InvalidArguments, .extraInfo = std::move(message)};
        }
    }

    std::string usage()
    {
        std::stringstream stream;
        stream << "Usage: mane [OPTIONS] -r FROM TO [-r FROM TO...] [FILE...]\n"
               << "       mane [OPTIONS] [-r FROM TO...] -c SOURCE... TARGET\n"
               << "Without -c and FILEs standard input is rewritten to standard output.\n\n"
               << visibleOptions();
        return stream.str();
    }

    std::expected<Arguments, SharedData::Error> parseArguments(int argc, char const* const* argv)
    {
        auto options = visibleOptions();
        po::options_description hidden;
        hidden.add_options()("files", po::value<std::vector<std::string>>()->composing());
        po::options_description all;
        all.add(options).add(hidden);

        po::positional_options_description positional;
        positional.add("files", -1);

        Arguments arguments;
        try
        {
            const auto parsed = po::command_line_parser(argc, argv).options(all).positional(positional).run();

            po::variables_map variables;
            po::store(parsed, variables);
            po::notify(variables);

            arguments.inPlace = variables["in-place"].as<bool>();
            arguments.includeGitIgnore = variables["include-git-ignore"].as<bool>();
            arguments.verbose = variables["verbose"].as<bool>();
            arguments.showHelp = variables["help"].as<bool>();
            arguments.showVersion = variables["version"].as<bool>();
            if (variables.count("log-level"))
                arguments.logLevel = variables["log-level"].as<std::string>();
            if (variables.count("config"))
                arguments.configPath = variables["config"].as<std::string>();

            // Values of list options are taken per occurrence, the variables map would merge them.
            std::vector<std::string> copyValues{};
            for (auto const& option : parsed.options)
            {
                if (option.string_key == "replace")
                {
                    if (option.value.size() < 2)
                        return std::unexpected(invalidArguments("-r/--replace requires FROM and TO"));
                    arguments.rules.push_back(Replace::Rule{.from = option.value[0], .to = option.value[1]});
                    for (auto iter = option.value.begin() + 2; iter != option.value.end(); ++iter)
                        arguments.files.emplace_back(*iter);
                }
                else if (option.string_key == "copy")
                    copyValues.insert(copyValues.end(), option.value.begin(), option.value.end());
                else if (option.string_key == "files")
                {
                    for (auto const& value : option.value)
                        arguments.files.emplace_back(value);
                }
            }

            if (variables.count("copy"))
            {
                if (copyValues.size() < 2)
                    return std::unexpected(invalidArguments("-c/--copy requires at least one SOURCE and a TARGET"));
                arguments.copyDestination = copyValues.back();
                copyValues.pop_back();
                arguments.copySources.assign(copyValues.begin(), copyValues.end());
            }
        }
        catch (po::error const& exc)
        {
            return std::unexpected(invalidArguments(exc.what()));
        }

        if (arguments.logLevel && !Log::parseLevel(*arguments.logLevel))
            return std::unexpected(invalidArguments(fmt::format("Unknown log level '{}'", *arguments.logLevel)));

        if (arguments.isCopy() && !arguments.files.empty())
        {
            return std::unexpected(invalidArguments(fmt::format(
                "FILE arguments cannot be combined with -c/--copy, got '{}'", arguments.files.front().string())));
        }

        return arguments;
    }

    std::expected<Mode, SharedData::Error> resolveMode(Arguments const& arguments, bool inputIsTerminal)
    {
        if (arguments.isCopy())
            return Mode::Copy;
        if (arguments.inPlace)
            return Mode::FilesAndNames;
        if (!arguments.files.empty())
            return Mode::Files;
        if (inputIsTerminal)
            return std::unexpected(invalidArguments("Nothing to do, provide FILEs, -c or standard input"));
        return Mode::Stream;
    }
}
