#pragma once

#include "cli/ICommand.hpp"

namespace trackr {

class ListProjectsCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx) override;
    const char* name() const override { return "list-projects"; }
    const char* description() const override { return "List named projects"; }
    const char* helpSynopsis() const override { return "trackr --list-projects"; }
    bool needsService() const override { return false; }
};

}
