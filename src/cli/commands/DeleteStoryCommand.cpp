#include "cli/commands/DeleteStoryCommand.hpp"

#include "core/RequestBuilder.hpp"
#include "core/ResponseRenderer.hpp"

namespace trackr {

Expected<void> DeleteStoryCommand::execute(const AppContext& ctx) {
    auto req = RequestBuilder::buildDeleteStory(ctx.options);
    if (!req) return req.error();

    auto message = ctx.client->deleteStory(ctx.project, req.value().storyId);
    if (!message) return message.error();

    ResponseRenderer::renderMessage(ctx.out, message.value());
    return {};
}

}
