#pragma once

#include <persistence/state_core.hpp>
#include <replace/rule_set.hpp>
#include <shared_data/error.hpp>

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Persistence
{
    constexpr char const* defaultConfigFileName = ".mane.json";

    /**
     * @brief Settings read from a JSON configuration file. Every member is optional, unset members are filled
     * from defaults() or left to the command line.
     */
    struct Config
    {
        std::optional<std::vector<Replace::Rule>> rules{std::nullopt};
        std::optional<std::string> logLevel{std::nullopt};
        std::optional<bool> includeGitIgnore{std::nullopt};
        std::optional<bool> caseAware{std::nullopt};
        std::optional<bool> renameFiles{std::nullopt};
        std::optional<bool> renameDirectories{std::nullopt};
        // No built-in default, copies skip hidden entries and in place rewrites do not.
        std::optional<bool> skipHidden{std::nullopt};
        std::optional<bool> verbose{std::nullopt};

        void useDefaultsFrom(Config const& other);

        static Config defaults();
    };
    void to_json(nlohmann::json& j, Config const& config);
    void from_json(nlohmann::json const& j, Config& config);

    /**
     * @brief Reads and validates a configuration file. Comments are allowed in the JSON.
     */
    std::expected<Config, SharedData::Error> loadConfig(std::filesystem::path const& path);

    /**
     * @brief Loads explicitPath if given (it must exist), otherwise the default file in workingDirectory if there
     * is one.
     *
     * @return std::nullopt when no configuration file is used.
     */
    std::expected<std::optional<Config>, SharedData::Error> locateConfig(
        std::optional<std::filesystem::path> const& explicitPath,
        std::filesystem::path const& workingDirectory);
}
