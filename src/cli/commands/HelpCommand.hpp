#pragma once

#include "cli/ICommand.hpp"

namespace trackr {

class HelpCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx) override;
    const char* name() const override { return "help"; }
    const char* description() const override { return "Show usage or the full manual"; }
    const char* helpSynopsis() const override { return "trackr --help | --man"; }
    bool needsService() const override { return false; }
};

}
