#include "cli/commands/ShowStoryCommand.hpp"

#include "core/RequestBuilder.hpp"
#include "core/ResponseRenderer.hpp"

namespace trackr {

/**
 * @brief Execute 'trackr --show-story --story-id <id>'
 *
 * --story-id is required here; without it the invocation is a usage error
 * and the service is never contacted. --show-notes adds the notes block.
 */
Expected<void> ShowStoryCommand::execute(const AppContext& ctx) {
    auto req = RequestBuilder::buildShowStory(ctx.options);
    if (!req) return req.error();

    auto story = ctx.client->fetchStory(ctx.project, req.value().storyId);
    if (!story) return story.error();

    ResponseRenderer::renderStory(ctx.out, story.value(), req.value().display);
    return {};
}

}
