#include "cli/commands/HelpCommand.hpp"

#include <memory>
#include <string>
#include <vector>

#include "cli/CommandFactory.hpp"
#include "cli/OptionParser.hpp"
#include "core/Constants.hpp"

namespace trackr {

namespace {

void printManual(std::ostream& out) {
    out << "DESCRIPTION:\n"
        << "  trackr performs one action against the project tracker per invocation.\n"
        << "  When several action options are given, the first in this order wins:\n"
        << "  list-projects, show-project, show-story, search, add-story, update-story,\n"
        << "  delete-story, add-note.\n\n";

    std::vector<std::unique_ptr<ICommand>> cmds;
    CommandFactory::instance().listCommands(cmds);
    out << "ACTIONS:\n";
    for (const auto& c : cmds) {
        if (std::string(c->name()) == "help") continue;
        out << "  " << c->helpSynopsis() << "\n      " << c->description() << "\n";
    }
    out << "\n";

    out << "PROJECT:\n"
        << "  --project <name> is looked up in the Projects table, otherwise --project-id\n"
        << "  is used as given, otherwise General.DefaultProject.\n\n";

    out << "CONFIGURATION:\n"
        << "  " << Constants::SYSTEM_CONFIG_PATH << " then ~/" << Constants::CONFIG_FILENAME
        << " then --config <file>; later files override\n"
        << "  earlier ones key by key.\n\n"
        << "    General:\n"
        << "      APIKey: <token>\n"
        << "      Me: <your name>\n"
        << "      DefaultProject: <project name>\n"
        << "      Timeout: <seconds>\n"
        << "    Projects:\n"
        << "      <project name>: <project id>\n\n";

    out << "ENVIRONMENT:\n"
        << "  TRACKR_LOG   error, warn, info or debug\n\n";

    out << "EXIT STATUS:\n"
        << "  0 on success, 1 on a usage error, an invalid project name or a failed request.\n";
}

}

Expected<void> HelpCommand::execute(const AppContext& ctx) {
    OptionParser parser;
    ctx.out << "Usage: trackr <action> [options]\n\n";
    ctx.out << parser.describeOptions();
    if (ctx.options.manual) {
        printManual(ctx.out);
    }
    return {};
}

}
