#include "cli/commands/ShowProjectCommand.hpp"

#include "core/ResponseRenderer.hpp"

namespace trackr {

Expected<void> ShowProjectCommand::execute(const AppContext& ctx) {
    auto project = ctx.client->fetchProject(ctx.project);
    if (!project) return project.error();
    ResponseRenderer::renderProject(ctx.out, project.value());
    return {};
}

}
