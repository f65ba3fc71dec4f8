#include <persistence/config.hpp>
#include <log/level.hpp>
#include <log/log.hpp>
#include <utility/file_io.hpp>

#include <fmt/format.h>

#include <system_error>

namespace Persistence
{
    void Config::useDefaultsFrom(Config const& other)
    {
        if (!rules.has_value())
            rules = other.rules;
        if (!logLevel.has_value())
            logLevel = other.logLevel;
        if (!includeGitIgnore.has_value())
            includeGitIgnore = other.includeGitIgnore;
        if (!caseAware.has_value())
            caseAware = other.caseAware;
        if (!renameFiles.has_value())
            renameFiles = other.renameFiles;
        if (!renameDirectories.has_value())
            renameDirectories = other.renameDirectories;
        if (!skipHidden.has_value())
            skipHidden = other.skipHidden;
        if (!verbose.has_value())
            verbose = other.verbose;
    }

    Config Config::defaults()
    {
        return Config{
            .rules = std::vector<Replace::Rule>{},
            .logLevel = "info",
            .includeGitIgnore = false,
            .caseAware = true,
            .renameFiles = true,
            .renameDirectories = true,
            .verbose = false,
        };
    }

    void to_json(nlohmann::json& j, Config const& config)
    {
        j = nlohmann::json::object();
        if (config.rules.has_value())
        {
            auto& rules = j["rules"] = nlohmann::json::array();
            for (auto const& rule : *config.rules)
                rules.push_back({{"from", rule.from}, {"to", rule.to}});
        }
        TO_JSON_OPTIONAL(j, config, logLevel);
        TO_JSON_OPTIONAL(j, config, includeGitIgnore);
        TO_JSON_OPTIONAL(j, config, caseAware);
        TO_JSON_OPTIONAL(j, config, renameFiles);
        TO_JSON_OPTIONAL(j, config, renameDirectories);
        TO_JSON_OPTIONAL(j, config, skipHidden);
        TO_JSON_OPTIONAL(j, config, verbose);
    }
    void from_json(nlohmann::json const& j, Config& config)
    {
        if (j.contains("rules"))
        {
            std::vector<Replace::Rule> rules;
            for (auto const& rule : j["rules"])
                rules.push_back(Replace::Rule{
                    .from = rule.at("from").get<std::string>(),
                    .to = rule.at("to").get<std::string>(),
                });
            config.rules = std::move(rules);
        }
        FROM_JSON_OPTIONAL(j, config, logLevel);
        FROM_JSON_OPTIONAL(j, config, includeGitIgnore);
        FROM_JSON_OPTIONAL(j, config, caseAware);
        FROM_JSON_OPTIONAL(j, config, renameFiles);
        FROM_JSON_OPTIONAL(j, config, renameDirectories);
        FROM_JSON_OPTIONAL(j, config, skipHidden);
        FROM_JSON_OPTIONAL(j, config, verbose);
    }

    std::expected<Config, SharedData::Error> loadConfig(std::filesystem::path const& path)
    {
        auto content = Utility::readFile(path);
        if (!content)
        {
            return std::unexpected(SharedData::Error{
                .type = SharedData::ErrorType::InvalidConfiguration,
                .path = path,
                .extraInfo = fmt::format("Could not read configuration: {}", content.error().message()),
            });
        }

        Config config;
        try
        {
            const auto json = nlohmann::json::parse(*content, nullptr, true, true);
            if (!json.is_object())
            {
                return std::unexpected(SharedData::Error{
                    .type = SharedData::ErrorType::InvalidConfiguration,
                    .path = path,
                    .extraInfo = "Configuration must be a JSON object",
                });
            }
            json.get_to(config);
        }
        catch (nlohmann::json::exception const& exc)
        {
            return std::unexpected(SharedData::Error{
                .type = SharedData::ErrorType::InvalidConfiguration,
                .path = path,
                .extraInfo = exc.what(),
            });
        }

        if (config.logLevel && !Log::parseLevel(*config.logLevel))
        {
            return std::unexpected(SharedData::Error{
                .type = SharedData::ErrorType::InvalidConfiguration,
                .path = path,
                .extraInfo = fmt::format("Unknown log level '{}'", *config.logLevel),
            });
        }

        Log::debug("Config: Loaded '{}'.", path.generic_string());
        return config;
    }

    std::expected<std::optional<Config>, SharedData::Error> locateConfig(
        std::optional<std::filesystem::path> const& explicitPath,
        std::filesystem::path const& workingDirectory)
    {
        auto path = explicitPath.value_or(workingDirectory / defaultConfigFileName);
        if (!explicitPath)
        {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(path, ec))
                return std::nullopt;
        }

        auto config = loadConfig(path);
        if (!config)
            return std::unexpected(std::move(config).error());
        return std::optional<Config>{std::move(config).value()};
    }
}
