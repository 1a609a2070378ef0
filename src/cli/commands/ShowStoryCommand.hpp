#pragma once

#include "cli/ICommand.hpp"

namespace trackr {

class ShowStoryCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx) override;
    const char* name() const override { return "show-story"; }
    const char* description() const override { return "Show one story"; }
    const char* helpSynopsis() const override { return "trackr --show-story --story-id <id> [--show-notes]"; }
};

}
