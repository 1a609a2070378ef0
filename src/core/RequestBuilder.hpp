#pragma once

#include <string>

#include "core/Models.hpp"
#include "core/Options.hpp"
#include "core/Settings.hpp"
#include "util/Expected.hpp"

namespace trackr {

enum class Action {
    None,
    ListProjects,
    ShowProject,
    ShowStory,
    AllStories,
    Search,
    AddStory,
    UpdateStory,
    DeleteStory,
    AddNote
};

/// Command name registered for an action ("show-story", ...); empty for None
const char* actionName(Action action);

struct ShowStoryRequest {
    StoryId storyId{0};
    DisplayOptions display;
};

struct AllStoriesRequest {
    DisplayOptions display;
};

struct SearchRequest {
    std::string filter;
    DisplayOptions display;
};

struct AddStoryRequest {
    StoryFields fields;
};

struct UpdateStoryRequest {
    StoryId storyId{0};
    StoryFields fields;
};

struct DeleteStoryRequest {
    StoryId storyId{0};
};

struct AddNoteRequest {
    StoryId storyId{0};
    std::string text;
};

/**
 * @brief Maps parsed options onto one action and its request payload
 *
 * Builders never touch the network. A builder failure is always a
 * UsageError, reported before any remote call is attempted.
 */
class RequestBuilder {
public:
    /**
     * @brief Pick the single action to perform
     *
     * Checked in fixed order, first match wins: list-projects, show-project,
     * show-story (all-stories when --all-stories is set), search, add-story,
     * update-story, delete-story, add-note. Action::None when nothing matches.
     */
    static Action selectAction(const Options& options);

    static Expected<ShowStoryRequest> buildShowStory(const Options& options);
    static AllStoriesRequest buildAllStories(const Options& options);
    static Expected<SearchRequest> buildSearch(const Options& options);
    static Expected<AddStoryRequest> buildAddStory(const Options& options, const Settings& settings);
    static Expected<UpdateStoryRequest> buildUpdateStory(const Options& options);
    static Expected<DeleteStoryRequest> buildDeleteStory(const Options& options);
    static Expected<AddNoteRequest> buildAddNote(const Options& options);

    /**
     * @brief Flatten repeated --label arguments into one comma-joined string
     *
     * Each argument may itself be a comma-separated list. Entries are trimmed
     * and empty entries dropped, so {"a", "b"} and {"a,b"} both give "a,b".
     */
    static std::string joinLabels(const std::vector<std::string>& labels);

    static constexpr const char* EMPTY_UPDATE = "Cannot update a story, without specifying what to update.";
};

}
