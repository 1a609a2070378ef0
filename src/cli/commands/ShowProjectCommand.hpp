#pragma once

#include "cli/ICommand.hpp"

namespace trackr {

class ShowProjectCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx) override;
    const char* name() const override { return "show-project"; }
    const char* description() const override { return "Show project details"; }
    const char* helpSynopsis() const override { return "trackr --show-project [--project <name> | --project-id <id>]"; }
};

}
