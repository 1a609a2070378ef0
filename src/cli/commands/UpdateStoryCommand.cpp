#include "cli/commands/UpdateStoryCommand.hpp"

#include "core/RequestBuilder.hpp"
#include "core/ResponseRenderer.hpp"
#include "util/Logger.hpp"

namespace trackr {

Expected<void> UpdateStoryCommand::execute(const AppContext& ctx) {
    auto req = RequestBuilder::buildUpdateStory(ctx.options);
    if (!req) return req.error();

    Logger::instance().debug("update-story: story " + std::to_string(req.value().storyId));
    auto story = ctx.client->updateStory(ctx.project, req.value().storyId, req.value().fields);
    if (!story) return story.error();

    DisplayOptions display;
    display.showNotes = ctx.options.showNotes;
    ResponseRenderer::renderStory(ctx.out, story.value(), display);
    return {};
}

}
