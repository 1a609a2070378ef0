#pragma once

#include "cli/ICommand.hpp"

namespace trackr {

class AddNoteCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx) override;
    const char* name() const override { return "add-note"; }
    const char* description() const override { return "Add a note to a story"; }
    const char* helpSynopsis() const override { return "trackr --add-note <text> --story-id <id>"; }
};

}
