#include "core/ConfigLoader.hpp"

#include <cstdlib>

#include <yaml-cpp/yaml.h>

#include "core/Constants.hpp"
#include "util/Logger.hpp"

namespace fs = std::filesystem;

namespace trackr {

namespace {

Error configError(const fs::path& path, const std::string& problem) {
    return Error{ErrorCode::ConfigError, path.string() + ": " + problem};
}

// Copy a scalar from General into target when the key is present
Expected<void> readString(const YAML::Node& general, const char* key, const fs::path& path,
                          std::string& target) {
    YAML::Node node = general[key];
    if (!node) return {};
    if (!node.IsScalar()) {
        return configError(path, std::string("General.") + key + " must be a scalar");
    }
    target = node.as<std::string>();
    return {};
}

Expected<void> mergeGeneral(const YAML::Node& general, const fs::path& path, Settings& settings) {
    if (general.IsNull()) return {};
    if (!general.IsMap()) {
        return configError(path, "General must be a mapping");
    }
    auto res = readString(general, "APIKey", path, settings.apiKey);
    if (!res) return res;
    res = readString(general, "Me", path, settings.me);
    if (!res) return res;
    res = readString(general, "DefaultProject", path, settings.defaultProject);
    if (!res) return res;
    res = readString(general, "ApiUrl", path, settings.apiUrl);
    if (!res) return res;

    if (YAML::Node timeout = general["Timeout"]) {
        long seconds = 0;
        try {
            seconds = timeout.as<long>();
        } catch (const YAML::Exception&) {
            return configError(path, "General.Timeout must be an integer");
        }
        if (seconds <= 0) {
            return configError(path, "General.Timeout must be positive");
        }
        settings.timeoutSeconds = seconds;
    }
    return {};
}

Expected<void> mergeProjects(const YAML::Node& projects, const fs::path& path, Settings& settings) {
    if (projects.IsNull()) return {};
    if (!projects.IsMap()) {
        return configError(path, "Projects must be a mapping of name to id");
    }
    for (const auto& entry : projects) {
        std::string name = entry.first.as<std::string>();
        try {
            settings.projects[name] = entry.second.as<ProjectId>();
        } catch (const YAML::Exception&) {
            return configError(path, "project id for '" + name + "' is not an integer");
        }
    }
    return {};
}

}

std::optional<fs::path> ConfigLoader::homeDirectory() {
    const char* home = std::getenv("HOME");
    if (!home || !*home) return std::nullopt;
    return fs::path(home);
}

std::vector<ConfigSource> ConfigLoader::defaultSources(const std::optional<fs::path>& home,
                                                       const std::optional<std::string>& extra) {
    std::vector<ConfigSource> sources;
    sources.push_back({Constants::SYSTEM_CONFIG_PATH, false});
    if (home) {
        sources.push_back({*home / Constants::CONFIG_FILENAME, false});
    }
    if (extra) {
        sources.push_back({*extra, true});
    }
    return sources;
}

Expected<Settings> ConfigLoader::load(const std::vector<ConfigSource>& sources) {
    Settings settings;
    size_t loaded = 0;
    for (const auto& source : sources) {
        std::error_code ec;
        if (!fs::exists(source.path, ec)) {
            if (source.required) {
                return configError(source.path, "configuration file not found");
            }
            Logger::instance().debug("config: skipping missing " + source.path.string());
            continue;
        }
        auto res = mergeFile(source.path, settings);
        if (!res) return res.error();
        Logger::instance().debug("config: loaded " + source.path.string());
        ++loaded;
    }
    if (loaded == 0) {
        return Error{ErrorCode::ConfigError, "No configuration file found"};
    }
    return settings;
}

Expected<void> ConfigLoader::mergeFile(const fs::path& path, Settings& settings) {
    YAML::Node doc;
    try {
        doc = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        return configError(path, std::string("unable to parse: ") + e.what());
    }

    // An empty document contributes nothing
    if (doc.IsNull()) return {};
    if (!doc.IsMap()) {
        return configError(path, "top level must be a mapping");
    }

    try {
        if (YAML::Node general = doc["General"]) {
            auto res = mergeGeneral(general, path, settings);
            if (!res) return res;
        }
        if (YAML::Node projects = doc["Projects"]) {
            auto res = mergeProjects(projects, path, settings);
            if (!res) return res;
        }
    } catch (const YAML::Exception& e) {
        return configError(path, e.what());
    }
    return {};
}

}
