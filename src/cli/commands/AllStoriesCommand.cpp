#include "cli/commands/AllStoriesCommand.hpp"

#include "core/RequestBuilder.hpp"
#include "core/ResponseRenderer.hpp"

namespace trackr {

Expected<void> AllStoriesCommand::execute(const AppContext& ctx) {
    AllStoriesRequest req = RequestBuilder::buildAllStories(ctx.options);

    auto stories = ctx.client->fetchStories(ctx.project);
    if (!stories) return stories.error();

    if (stories.value().empty()) {
        ResponseRenderer::renderMessage(ctx.out, "No stories found.");
        return {};
    }
    ResponseRenderer::renderStories(ctx.out, stories.value(), req.display);
    return {};
}

}
