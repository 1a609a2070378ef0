#pragma once

#include "cli/ICommand.hpp"

namespace trackr {

class SearchCommand : public ICommand {
public:
    Expected<void> execute(const AppContext& ctx) override;
    const char* name() const override { return "search"; }
    const char* description() const override { return "Show stories matching a filter"; }
    const char* helpSynopsis() const override { return "trackr --search <filter> [--show-notes]"; }
};

}
