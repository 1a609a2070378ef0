#pragma once

#include <functional>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "core/ITrackerClient.hpp"
#include "core/Options.hpp"
#include "core/Settings.hpp"

namespace trackr {

/**
 * @brief One invocation of trackr, from arguments to exit status
 *
 * Pipeline: parse options -> load configuration -> resolve project ->
 * select action -> run its command. Exits 0 on success, help, or when no
 * action was requested; 1 on any failure.
 */
class Application {
public:
    using ClientFactory = std::function<std::unique_ptr<ITrackerClient>(const Settings&, const Options&)>;

    explicit Application(ClientFactory clientFactory);

    /// @param args Process arguments without the program name
    int run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err);

    /// Factory producing the libcurl client
    static ClientFactory httpClientFactory();

private:
    ClientFactory clientFactory;
};

}
