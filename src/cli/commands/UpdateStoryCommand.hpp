#pragma once

#include "cli/ICommand.hpp"

namespace trackr {

class UpdateStoryCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx) override;
    const char* name() const override { return "update-story"; }
    const char* description() const override { return "Update fields of a story"; }
    const char* helpSynopsis() const override { return "trackr --update-story --story-id <id> [story fields]"; }
};

}
