#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "core/Settings.hpp"
#include "util/Expected.hpp"

namespace trackr {

/**
 * @brief One configuration document in the load order
 *
 * Optional sources are skipped when the file does not exist; a required
 * source (given with --config) must exist.
 */
struct ConfigSource {
    std::filesystem::path path;
    bool required{false};
};

/**
 * @brief Loads layered YAML configuration into Settings
 *
 * Document layout:
 *   General:
 *     APIKey: <token>
 *     Me: <requester name>
 *     DefaultProject: <project name>
 *     ApiUrl: <base url>        (optional)
 *     Timeout: <seconds>        (optional)
 *   Projects:
 *     <name>: <integer id>
 *
 * Sources are folded left to right: each later document overrides earlier
 * values key by key, and project entries merge per name.
 */
class ConfigLoader {
public:
    /**
     * @brief Standard load order
     * @param home User home directory (nullopt if HOME is unset)
     * @param extra Path given with --config, appended as a required source
     * @return /etc/trackr.yml, ~/.trackr.yml, then extra
     */
    static std::vector<ConfigSource> defaultSources(const std::optional<std::filesystem::path>& home,
                                                    const std::optional<std::string>& extra);

    /// Home directory from $HOME
    static std::optional<std::filesystem::path> homeDirectory();

    /**
     * @brief Fold all sources into one Settings value
     * @return Settings, or ConfigError if no source exists, a required source
     *         is missing, or any existing source is malformed
     */
    static Expected<Settings> load(const std::vector<ConfigSource>& sources);

    /**
     * @brief Merge a single document over existing settings
     * @param path YAML file to read
     * @param settings Accumulated settings, updated in place
     */
    static Expected<void> mergeFile(const std::filesystem::path& path, Settings& settings);
};

}
