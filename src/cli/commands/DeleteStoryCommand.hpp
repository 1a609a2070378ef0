#pragma once

#include "cli/ICommand.hpp"

namespace trackr {

class DeleteStoryCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx) override;
    const char* name() const override { return "delete-story"; }
    const char* description() const override { return "Delete a story"; }
    const char* helpSynopsis() const override { return "trackr --delete-story --story-id <id>"; }
};

}
