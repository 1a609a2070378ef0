#include "cli/CommandInvoker.hpp"

#include "core/ResponseRenderer.hpp"
#include "util/Logger.hpp"

namespace trackr {

Expected<void> CommandInvoker::invoke(ICommand& cmd, const AppContext& ctx) {
    Logger::instance().debug(std::string("Executing command: ") + cmd.name());
    auto res = cmd.execute(ctx);
    if (!res) {
        Logger::instance().debug(std::string(cmd.name()) + ": " + res.error().message);
        report(res.error(), ctx.err);
        return res;
    }
    return {};
}

void CommandInvoker::report(const Error& error, std::ostream& err) {
    switch (error.code) {
        case ErrorCode::ApiError:
        case ErrorCode::TransportError:
            if (error.details.empty()) {
                ResponseRenderer::renderErrors(err, {error.message});
            } else {
                ResponseRenderer::renderErrors(err, error.details);
            }
            break;
        default:
            err << error.message << "\n";
            break;
    }
}

}
