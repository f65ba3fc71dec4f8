#include <mane/application.hpp>
#include <mane/version.hpp>
#include <operations/copy_operation.hpp>
#include <operations/in_place_operation.hpp>
#include <operations/stream_operation.hpp>
#include <log/log.hpp>
#include <utility/enum_string_convert.hpp>

#include <fmt/format.h>

namespace Mane
{
    namespace
    {
        int reportErrors(std::vector<SharedData::Error> const& errors)
        {
            if (errors.empty())
                return exitSuccess;
            Log::error("Application: {} error(s) occurred:", errors.size());
            for (auto const& error : errors)
                Log::error("  {}", error.toString());
            return exitFailure;
        }
    }

    Application::Application(Arguments arguments, Environment environment)
        : arguments_{std::move(arguments)}
        , environment_{std::move(environment)}
    {}

    std::filesystem::path Application::resolvePath(std::filesystem::path const& path) const
    {
        if (path.is_absolute() || environment_.workingDirectory.empty())
            return path;
        return environment_.workingDirectory / path;
    }

    std::vector<std::filesystem::path> Application::resolvePaths(std::vector<std::filesystem::path> const& paths) const
    {
        std::vector<std::filesystem::path> resolved;
        resolved.reserve(paths.size());
        for (auto const& path : paths)
            resolved.push_back(resolvePath(path));
        return resolved;
    }

    std::expected<Persistence::Config, SharedData::Error> Application::effectiveConfig() const
    {
        const auto configPath =
            arguments_.configPath ? std::optional{resolvePath(*arguments_.configPath)} : std::nullopt;
        auto fileConfig = Persistence::locateConfig(configPath, environment_.workingDirectory);
        if (!fileConfig)
            return std::unexpected(std::move(fileConfig).error());

        // Switches can only be turned on from the command line.
        Persistence::Config config;
        if (arguments_.includeGitIgnore)
            config.includeGitIgnore = true;
        if (arguments_.verbose)
            config.verbose = true;
        config.logLevel = arguments_.logLevel;

        if (fileConfig->has_value())
        {
            auto const& fromFile = fileConfig->value();
            config.rules = Replace::mergeRules(fromFile.rules.value_or(std::vector<Replace::Rule>{}), arguments_.rules);
            config.useDefaultsFrom(fromFile);
        }
        else
            config.rules = arguments_.rules;

        if (!config.logLevel && config.verbose.value_or(false))
            config.logLevel = "debug";

        config.useDefaultsFrom(Persistence::Config::defaults());
        return config;
    }

    int Application::run()
    {
        if (arguments_.showHelp)
        {
            *environment_.output << usage();
            return exitSuccess;
        }
        if (arguments_.showVersion)
        {
            *environment_.output << "mane " << version << "\n";
            return exitSuccess;
        }

        const auto config = effectiveConfig();
        if (!config)
        {
            Log::error("Application: {}", config.error().toString());
            return exitUsage;
        }
        Log::setLevel(Log::levelFromString(*config->logLevel));

        const auto ruleSet = Replace::RuleSet::create(*config->rules, {.caseAware = *config->caseAware});
        if (!ruleSet)
        {
            Log::error("Application: {}", ruleSet.error().toString());
            return exitUsage;
        }

        const auto mode = resolveMode(arguments_, environment_.inputIsTerminal);
        if (!mode)
        {
            Log::error("Application: {}", mode.error().toString());
            *environment_.errorOutput << usage();
            return exitUsage;
        }
        Log::debug(
            "Application: Running in {} mode with {} rule(s).", Utility::enumToString(*mode), config->rules->size());

        if (*mode != Mode::Copy && ruleSet->rules().empty())
        {
            const SharedData::Error error{
                .type = SharedData::ErrorType::InvalidArguments,
                .extraInfo = "At least one -r/--replace rule is required",
            };
            Log::error("Application: {}", error.toString());
            return exitUsage;
        }

        switch (*mode)
        {
            case (Mode::Copy):
                return runCopy(*ruleSet, *config);
            case (Mode::FilesAndNames):
                return runFiles(*ruleSet, *config, true);
            case (Mode::Files):
                return runFiles(*ruleSet, *config, false);
            case (Mode::Stream):
                return runStream(*ruleSet);
        }
        return exitUsage;
    }

    int Application::runCopy(Replace::RuleSet const& rules, Persistence::Config const& config)
    {
        Operations::CopyOperation operation{
            rules,
            Operations::CopyOperation::CopyOperationOptions{
                .sources = resolvePaths(arguments_.copySources),
                .destination = resolvePath(*arguments_.copyDestination),
                .inPlaceRenaming = arguments_.inPlace,
                .renameFiles = *config.renameFiles,
                .renameDirectories = *config.renameDirectories,
                .skipHidden = config.skipHidden.value_or(true),
                .verbose = *config.verbose,
            },
            *config.includeGitIgnore ? Operations::disabledMatchers() : Operations::gitIgnoreMatchers(),
        };

        if (auto result = operation.runToCompletion(); !result)
        {
            Log::error("Application: Copy failed: {}", result.error().toString());
            return exitFailure;
        }

        Log::info("Application: Copied {} entries.", operation.report().copiedCount);
        return reportErrors(operation.report().errors);
    }

    int Application::runFiles(Replace::RuleSet const& rules, Persistence::Config const& config, bool inPlace)
    {
        auto paths = resolvePaths(arguments_.files);
        // The working directory itself is walked but never renamed.
        if (inPlace && paths.empty())
            paths.push_back(environment_.workingDirectory.empty() ? std::filesystem::path{"."}
                                                                  : environment_.workingDirectory / ".");

        Operations::InPlaceOperation operation{
            rules,
            Operations::InPlaceOperation::InPlaceOperationOptions{
                .paths = std::move(paths),
                .inPlace = inPlace,
                .renameFiles = *config.renameFiles,
                .renameDirectories = *config.renameDirectories,
                .skipHidden = config.skipHidden.value_or(false),
                .output = environment_.output,
            },
            *config.includeGitIgnore ? Operations::disabledMatchers() : Operations::gitIgnoreMatchers(),
        };

        if (auto result = operation.runToCompletion(); !result)
        {
            Log::error("Application: Rewrite failed: {}", result.error().toString());
            return exitFailure;
        }
        return reportErrors(operation.report().errors);
    }

    int Application::runStream(Replace::RuleSet const& rules)
    {
        Operations::StreamOperation operation{rules, *environment_.input, *environment_.output};
        if (auto result = operation.runToCompletion(); !result)
        {
            Log::error("Application: {}", result.error().toString());
            return exitFailure;
        }
        return exitSuccess;
    }
}
