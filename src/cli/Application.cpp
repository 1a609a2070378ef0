#include "cli/Application.hpp"

#include "cli/CommandFactory.hpp"
#include "cli/CommandInvoker.hpp"
#include "cli/OptionParser.hpp"
#include "core/ConfigLoader.hpp"
#include "core/HttpTrackerClient.hpp"
#include "core/ProjectResolver.hpp"
#include "core/RequestBuilder.hpp"
#include "util/Logger.hpp"

namespace trackr {

Application::Application(ClientFactory clientFactory) : clientFactory(std::move(clientFactory)) {
    registerBuiltinCommands();
}

Application::ClientFactory Application::httpClientFactory() {
    return [](const Settings& settings, const Options& options) -> std::unique_ptr<ITrackerClient> {
        HttpTrackerClient::Config config;
        config.apiUrl = settings.apiUrl;
        config.apiKey = settings.apiKey;
        config.timeoutSeconds = options.timeout.value_or(settings.timeoutSeconds);
        return std::make_unique<HttpTrackerClient>(std::move(config));
    };
}

int Application::run(const std::vector<std::string>& args, std::ostream& out, std::ostream& err) {
    OptionParser parser;
    auto parsed = parser.parse(args);
    if (!parsed) {
        err << "trackr: " << parsed.error().message << "\n"
            << "Try 'trackr --help' for more information.\n";
        return 1;
    }
    const Options& options = parsed.value();
    if (options.verbose) {
        Logger::instance().setLevel(LogLevel::Debug);
    }

    CommandInvoker invoker;
    auto& factory = CommandFactory::instance();

    // Help never touches configuration or the network
    if (options.help || options.manual) {
        Settings none;
        AppContext ctx{options, none, std::nullopt, nullptr, out, err};
        auto help = factory.create("help");
        return invoker.invoke(*help, ctx) ? 0 : 1;
    }

    auto loaded = ConfigLoader::load(ConfigLoader::defaultSources(ConfigLoader::homeDirectory(), options.config));
    Settings settings = loaded ? loaded.value() : Settings{};
    if (!loaded) {
        Logger::instance().debug("config: " + loaded.error().message);
    }

    auto project = ProjectResolver::resolve(options, settings);
    if (!project) {
        CommandInvoker::report(project.error(), err);
        return 1;
    }

    Action action = RequestBuilder::selectAction(options);
    if (action == Action::None) {
        Logger::instance().debug("no action requested");
        return 0;
    }
    Logger::instance().debug(std::string("action: ") + actionName(action));

    auto cmd = factory.create(actionName(action));
    if (!cmd) {
        CommandInvoker::report(Error{ErrorCode::InternalError, std::string("no command registered for ") +
                                                                   actionName(action)},
                               err);
        return 1;
    }

    std::unique_ptr<ITrackerClient> client;
    if (cmd->needsService()) {
        if (!loaded) {
            CommandInvoker::report(loaded.error(), err);
            return 1;
        }
        client = clientFactory(settings, options);
    }

    AppContext ctx{options, settings, project.value(), client.get(), out, err};
    return invoker.invoke(*cmd, ctx) ? 0 : 1;
}

}
