#include "cli/commands/AddNoteCommand.hpp"

#include "core/RequestBuilder.hpp"
#include "core/ResponseRenderer.hpp"

namespace trackr {

// Note text is sent exactly as given to --add-note
Expected<void> AddNoteCommand::execute(const AppContext& ctx) {
    auto req = RequestBuilder::buildAddNote(ctx.options);
    if (!req) return req.error();

    auto note = ctx.client->addNote(ctx.project, req.value().storyId, req.value().text);
    if (!note) return note.error();

    ResponseRenderer::renderNote(ctx.out, note.value());
    return {};
}

}
