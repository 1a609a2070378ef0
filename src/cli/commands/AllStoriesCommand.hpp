#pragma once

#include "cli/ICommand.hpp"

namespace trackr {

class AllStoriesCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx) override;
    const char* name() const override { return "all-stories"; }
    const char* description() const override { return "Show every story in the project"; }
    const char* helpSynopsis() const override { return "trackr --show-story --all-stories [--show-notes]"; }
};

}
