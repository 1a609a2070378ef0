#include "cli/commands/AddStoryCommand.hpp"

#include "core/RequestBuilder.hpp"
#include "core/ResponseRenderer.hpp"

namespace trackr {

/**
 * @brief Execute 'trackr --add-story --story <title>'
 *
 * Sends only the fields given on the command line. The requester falls
 * back to General.Me; type and state are left to the service's defaults
 * (feature, unscheduled) unless given. Prints the created story.
 */
Expected<void> AddStoryCommand::execute(const AppContext& ctx) {
    auto req = RequestBuilder::buildAddStory(ctx.options, ctx.settings);
    if (!req) return req.error();

    auto story = ctx.client->createStory(ctx.project, req.value().fields);
    if (!story) return story.error();

    DisplayOptions display;
    display.showNotes = ctx.options.showNotes;
    ResponseRenderer::renderStory(ctx.out, story.value(), display);
    return {};
}

}
