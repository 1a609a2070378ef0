#pragma once

#include "cli/ICommand.hpp"

namespace trackr {

/**
 * @brief Runs a command and reports its failure exactly once
 *
 * Service failures (ApiError, TransportError) go through the error
 * renderer; every other failure prints its message on the error stream.
 */
class CommandInvoker {
public:
    Expected<void> invoke(ICommand& cmd, const AppContext& ctx);

    static void report(const Error& error, std::ostream& err);
};

}
