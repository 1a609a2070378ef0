#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace trackr {

using ProjectId = int64_t;
using StoryId = int64_t;

enum class StoryType { Feature, Release, Bug, Chore };

enum class StoryState { Unscheduled, Unstarted, Started, Finished, Delivered, Accepted, Rejected };

const char* toString(StoryType type);
const char* toString(StoryState state);

/// Parse the lowercase wire name; nullopt for anything outside the closed set
std::optional<StoryType> parseStoryType(const std::string& name);
std::optional<StoryState> parseStoryState(const std::string& name);

/// Lowercase wire names in declaration order (used for help text and validation)
std::vector<std::string> storyTypeNames();
std::vector<std::string> storyStateNames();

/**
 * @brief Project metadata as returned by the service
 */
struct Project {
    ProjectId id{0};
    std::string name;
    std::string pointScale;
    std::optional<std::string> iterationsStart;
    int weeksPerIteration{0};
};

/**
 * @brief A comment attached to a story
 */
struct Note {
    int64_t id{0};
    std::string text;
    std::string author;
    std::string notedAt;
};

/**
 * @brief A story record as returned by the service
 *
 * Optional members are the ones the renderer prints only when present.
 * storyType and currentState stay plain strings: they are display values
 * the service owns, not user input.
 */
struct Story {
    StoryId id{0};
    std::string name;
    std::string storyType;
    std::string url;
    std::optional<int> estimate;
    std::string currentState;
    std::optional<std::string> description;
    std::string requestedBy;
    std::optional<std::string> ownedBy;
    std::string createdAt;
    std::optional<std::string> deadline;
    std::vector<std::string> labels;
    std::vector<Note> notes;
};

/**
 * @brief Field set for a create or update request
 *
 * Only engaged members are sent. An engaged empty string is a real value
 * ("clear this field"), distinct from a member that was never supplied.
 */
struct StoryFields {
    std::optional<std::string> name;
    std::optional<std::string> description;
    std::optional<std::string> requestedBy;
    std::optional<std::string> ownedBy;
    std::optional<std::string> labels;      // comma-joined
    std::optional<int> estimate;
    std::optional<std::string> createdAt;
    std::optional<std::string> deadline;
    std::optional<StoryType> storyType;
    std::optional<StoryState> currentState;

    bool empty() const;
};

/// Rendering switches derived from the command line
struct DisplayOptions {
    bool showNotes{false};
};

}
