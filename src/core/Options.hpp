#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/Models.hpp"

namespace trackr {

/**
 * @brief Parsed command line
 *
 * Every value option is a std::optional: an engaged member means the user
 * supplied the option, whatever its value. Boolean members are presence
 * flags. Built once by OptionParser and never mutated afterwards.
 */
struct Options {
    // Informational
    bool help{false};
    bool manual{false};
    bool verbose{false};

    // Actions
    bool listProjects{false};
    bool showProject{false};
    bool showStory{false};
    bool allStories{false};
    bool showNotes{false};
    std::optional<std::string> search;
    bool addStory{false};
    bool updateStory{false};
    bool deleteStory{false};
    std::optional<std::string> addNote;

    // Project selection
    std::optional<std::string> project;
    std::optional<ProjectId> projectId;

    // Story fields
    std::optional<StoryId> storyId;
    std::optional<std::string> story;
    std::optional<std::string> description;
    std::optional<std::string> requestedBy;
    std::optional<std::string> ownedBy;
    std::vector<std::string> labels;    // raw arguments, may hold comma-separated lists
    std::optional<int> estimate;
    std::optional<std::string> createdAt;
    std::optional<std::string> deadline;
    std::optional<StoryType> storyType;
    std::optional<StoryState> state;

    // Environment
    std::optional<std::string> config;
    std::optional<long> timeout;
};

}
