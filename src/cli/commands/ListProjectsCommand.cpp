#include "cli/commands/ListProjectsCommand.hpp"

namespace trackr {

/**
 * @brief Execute 'trackr --list-projects'
 *
 * Prints the Projects table from the configuration as "<name> (<id>)" in
 * name order. Works without a configuration file: a missing or unreadable
 * config simply has no named projects.
 */
Expected<void> ListProjectsCommand::execute(const AppContext& ctx) {
    if (ctx.settings.projects.empty()) {
        ctx.out << "No named projects found.\n";
        return {};
    }
    for (const auto& [name, id] : ctx.settings.projects) {
        ctx.out << name << " (" << id << ")\n";
    }
    return {};
}

}
