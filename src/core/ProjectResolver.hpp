#pragma once

#include <optional>

#include "core/Models.hpp"
#include "core/Options.hpp"
#include "core/Settings.hpp"
#include "util/Expected.hpp"

namespace trackr {

/**
 * @brief Determines the project a request targets
 *
 * Priority:
 *   1. --project <name>, looked up in the Projects table (unknown name fails)
 *   2. --project-id <id>, used verbatim
 *   3. General.DefaultProject looked up in the Projects table
 *
 * An unconfigured or unknown default yields nullopt; the request layer
 * decides what "no project" means.
 */
class ProjectResolver {
public:
    static constexpr const char* INVALID_PROJECT = "Invalid Project Name.";

    static Expected<std::optional<ProjectId>> resolve(const Options& options, const Settings& settings);
};

}
