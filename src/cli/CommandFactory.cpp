#include "cli/CommandFactory.hpp"

#include <algorithm>

#include "cli/commands/AddNoteCommand.hpp"
#include "cli/commands/AddStoryCommand.hpp"
#include "cli/commands/AllStoriesCommand.hpp"
#include "cli/commands/DeleteStoryCommand.hpp"
#include "cli/commands/HelpCommand.hpp"
#include "cli/commands/ListProjectsCommand.hpp"
#include "cli/commands/SearchCommand.hpp"
#include "cli/commands/ShowProjectCommand.hpp"
#include "cli/commands/ShowStoryCommand.hpp"
#include "cli/commands/UpdateStoryCommand.hpp"

namespace trackr {

CommandFactory& CommandFactory::instance() {
    static CommandFactory f;
    return f;
}

void CommandFactory::registerCreator(const std::string& name, Creator creator) {
    creators[name] = std::move(creator);
}

std::unique_ptr<ICommand> CommandFactory::create(const std::string& name) const {
    auto it = creators.find(name);
    if (it == creators.end()) return nullptr;
    return it->second();
}

void CommandFactory::listCommands(std::vector<std::unique_ptr<ICommand>>& out) const {
    out.clear();
    out.reserve(creators.size());
    for (const auto& kv : creators) {
        out.emplace_back(kv.second());
    }
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        return std::string(a->name()) < std::string(b->name());
    });
}

void registerBuiltinCommands() {
    auto& f = CommandFactory::instance();
    f.registerCreator("help", [] { return std::make_unique<HelpCommand>(); });
    f.registerCreator("list-projects", [] { return std::make_unique<ListProjectsCommand>(); });
    f.registerCreator("show-project", [] { return std::make_unique<ShowProjectCommand>(); });
    f.registerCreator("show-story", [] { return std::make_unique<ShowStoryCommand>(); });
    f.registerCreator("all-stories", [] { return std::make_unique<AllStoriesCommand>(); });
    f.registerCreator("search", [] { return std::make_unique<SearchCommand>(); });
    f.registerCreator("add-story", [] { return std::make_unique<AddStoryCommand>(); });
    f.registerCreator("update-story", [] { return std::make_unique<UpdateStoryCommand>(); });
    f.registerCreator("delete-story", [] { return std::make_unique<DeleteStoryCommand>(); });
    f.registerCreator("add-note", [] { return std::make_unique<AddNoteCommand>(); });
}

}
