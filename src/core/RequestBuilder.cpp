#include "core/RequestBuilder.hpp"

#include "util/Strings.hpp"

namespace trackr {

namespace {

Error usage(const std::string& message) {
    return Error{ErrorCode::UsageError, message};
}

Expected<StoryId> requireStoryId(const Options& options, const char* action) {
    if (!options.storyId) {
        return usage(std::string("A story id is required to ") + action + " (--story-id).");
    }
    return *options.storyId;
}

}

const char* actionName(Action action) {
    switch (action) {
        case Action::None: return "";
        case Action::ListProjects: return "list-projects";
        case Action::ShowProject: return "show-project";
        case Action::ShowStory: return "show-story";
        case Action::AllStories: return "all-stories";
        case Action::Search: return "search";
        case Action::AddStory: return "add-story";
        case Action::UpdateStory: return "update-story";
        case Action::DeleteStory: return "delete-story";
        case Action::AddNote: return "add-note";
    }
    return "";
}

Action RequestBuilder::selectAction(const Options& options) {
    if (options.listProjects) return Action::ListProjects;
    if (options.showProject) return Action::ShowProject;
    if (options.showStory) return options.allStories ? Action::AllStories : Action::ShowStory;
    if (options.search) return Action::Search;
    if (options.addStory) return Action::AddStory;
    if (options.updateStory) return Action::UpdateStory;
    if (options.deleteStory) return Action::DeleteStory;
    if (options.addNote) return Action::AddNote;
    return Action::None;
}

Expected<ShowStoryRequest> RequestBuilder::buildShowStory(const Options& options) {
    if (!options.storyId) {
        return usage("A story id is required (--story-id) unless --all-stories is given.");
    }
    ShowStoryRequest req;
    req.storyId = *options.storyId;
    req.display.showNotes = options.showNotes;
    return req;
}

AllStoriesRequest RequestBuilder::buildAllStories(const Options& options) {
    AllStoriesRequest req;
    req.display.showNotes = options.showNotes;
    return req;
}

Expected<SearchRequest> RequestBuilder::buildSearch(const Options& options) {
    if (!options.search || Strings::trim(*options.search).empty()) {
        return usage("A search filter is required (--search <filter>).");
    }
    SearchRequest req;
    req.filter = *options.search;
    req.display.showNotes = options.showNotes;
    return req;
}

Expected<AddStoryRequest> RequestBuilder::buildAddStory(const Options& options, const Settings& settings) {
    if (!options.story) {
        return usage("A story title is required to add a story (--story <title>).");
    }

    AddStoryRequest req;
    StoryFields& f = req.fields;
    f.name = options.story;

    // Explicit requester wins; otherwise fall back to the configured "Me"
    if (options.requestedBy) {
        f.requestedBy = options.requestedBy;
    } else if (!settings.me.empty()) {
        f.requestedBy = settings.me;
    }

    if (!options.labels.empty()) f.labels = joinLabels(options.labels);
    f.description = options.description;
    f.ownedBy = options.ownedBy;
    f.estimate = options.estimate;
    f.createdAt = options.createdAt;
    f.deadline = options.deadline;
    f.storyType = options.storyType;
    f.currentState = options.state;
    return req;
}

Expected<UpdateStoryRequest> RequestBuilder::buildUpdateStory(const Options& options) {
    auto id = requireStoryId(options, "update a story");
    if (!id) return id.error();

    UpdateStoryRequest req;
    req.storyId = id.value();
    StoryFields& f = req.fields;
    f.createdAt = options.createdAt;
    f.deadline = options.deadline;
    f.description = options.description;
    f.estimate = options.estimate;
    f.ownedBy = options.ownedBy;
    f.requestedBy = options.requestedBy;
    f.storyType = options.storyType;
    f.name = options.story;
    if (!options.labels.empty()) f.labels = joinLabels(options.labels);
    f.currentState = options.state;

    if (f.empty()) {
        return usage(EMPTY_UPDATE);
    }
    return req;
}

Expected<DeleteStoryRequest> RequestBuilder::buildDeleteStory(const Options& options) {
    auto id = requireStoryId(options, "delete a story");
    if (!id) return id.error();
    return DeleteStoryRequest{id.value()};
}

Expected<AddNoteRequest> RequestBuilder::buildAddNote(const Options& options) {
    auto id = requireStoryId(options, "add a note");
    if (!id) return id.error();
    AddNoteRequest req;
    req.storyId = id.value();
    req.text = options.addNote.value_or("");
    return req;
}

std::string RequestBuilder::joinLabels(const std::vector<std::string>& labels) {
    std::vector<std::string> flat;
    for (const auto& arg : labels) {
        for (const auto& part : Strings::split(arg, ',')) {
            std::string label = Strings::trim(part);
            if (!label.empty()) flat.push_back(label);
        }
    }
    return Strings::join(flat, ",");
}

}
