#include "core/ProjectResolver.hpp"

#include "util/Logger.hpp"

namespace trackr {

Expected<std::optional<ProjectId>> ProjectResolver::resolve(const Options& options, const Settings& settings) {
    if (options.project) {
        auto id = settings.projectId(*options.project);
        if (!id) {
            return Error{ErrorCode::InvalidProject, INVALID_PROJECT};
        }
        Logger::instance().debug("project: '" + *options.project + "' -> " + std::to_string(*id));
        return std::optional<ProjectId>(*id);
    }

    if (options.projectId) {
        Logger::instance().debug("project: explicit id " + std::to_string(*options.projectId));
        return std::optional<ProjectId>(*options.projectId);
    }

    if (!settings.defaultProject.empty()) {
        auto id = settings.projectId(settings.defaultProject);
        if (id) {
            Logger::instance().debug("project: default '" + settings.defaultProject + "' -> " +
                                     std::to_string(*id));
        } else {
            Logger::instance().warn("DefaultProject '" + settings.defaultProject + "' is not in Projects");
        }
        return id;
    }

    Logger::instance().debug("project: none configured");
    return std::optional<ProjectId>();
}

}
