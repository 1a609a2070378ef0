#include "cli/commands/SearchCommand.hpp"

#include "core/RequestBuilder.hpp"
#include "core/ResponseRenderer.hpp"

namespace trackr {

/**
 * @brief Execute 'trackr --search <filter>'
 *
 * The filter is passed to the service untouched (service search syntax,
 * e.g. "label:ui state:started"). Output is a summary line followed by the
 * matching stories.
 */
Expected<void> SearchCommand::execute(const AppContext& ctx) {
    auto req = RequestBuilder::buildSearch(ctx.options);
    if (!req) return req.error();

    auto stories = ctx.client->searchStories(ctx.project, req.value().filter);
    if (!stories) return stories.error();

    const size_t count = stories.value().size();
    ResponseRenderer::renderMessage(ctx.out, "Found " + std::to_string(count) +
                                                 (count == 1 ? " story" : " stories") + " matching \"" +
                                                 req.value().filter + "\".");
    if (count > 0) {
        ctx.out << "\n";
        ResponseRenderer::renderStories(ctx.out, stories.value(), req.value().display);
    }
    return {};
}

}
