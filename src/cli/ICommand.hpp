#pragma once

#include <optional>
#include <ostream>

#include "core/ITrackerClient.hpp"
#include "core/Options.hpp"
#include "core/Settings.hpp"
#include "util/Expected.hpp"

namespace trackr {

/**
 * @brief Everything a command may use for one invocation
 *
 * client is null for commands that never call the service.
 */
struct AppContext {
    const Options& options;
    const Settings& settings;
    std::optional<ProjectId> project;
    ITrackerClient* client;
    std::ostream& out;
    std::ostream& err;
};

class ICommand {
public:
    virtual ~ICommand() = default;
    virtual Expected<void> execute(const AppContext& ctx) = 0;
    virtual const char* name() const = 0;
    virtual const char* description() const = 0;
    virtual const char* helpSynopsis() const = 0;      // usage synopsis
    /// False for commands that work from local configuration only
    virtual bool needsService() const { return true; }
};

}
