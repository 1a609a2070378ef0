#pragma once

#include <map>
#include <optional>
#include <string>

#include "core/Constants.hpp"
#include "core/Models.hpp"

namespace trackr {

/**
 * @brief Merged user configuration
 *
 * Built once per invocation by ConfigLoader and treated as read-only after.
 * Empty strings mean "not configured".
 */
struct Settings {
    std::string apiKey;
    std::string me;
    std::string defaultProject;
    std::map<std::string, ProjectId> projects;   // name -> id, ordered for listing
    std::string apiUrl{Constants::DEFAULT_API_URL};
    long timeoutSeconds{Constants::DEFAULT_TIMEOUT_SECONDS};

    /// Look up a named project
    std::optional<ProjectId> projectId(const std::string& name) const {
        auto it = projects.find(name);
        if (it == projects.end()) return std::nullopt;
        return it->second;
    }
};

}
