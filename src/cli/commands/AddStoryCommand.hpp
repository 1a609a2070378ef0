#pragma once

#include "cli/ICommand.hpp"

namespace trackr {

class AddStoryCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx) override;
    const char* name() const override { return "add-story"; }
    const char* description() const override { return "Create a story"; }
    const char* helpSynopsis() const override { return "trackr --add-story --story <title> [story fields]"; }
};

}
