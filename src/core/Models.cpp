#include "core/Models.hpp"

#include <array>
#include <utility>

namespace trackr {

namespace {

constexpr std::array<std::pair<StoryType, const char*>, 4> STORY_TYPES{{
    {StoryType::Feature, "feature"},
    {StoryType::Release, "release"},
    {StoryType::Bug, "bug"},
    {StoryType::Chore, "chore"},
}};

constexpr std::array<std::pair<StoryState, const char*>, 7> STORY_STATES{{
    {StoryState::Unscheduled, "unscheduled"},
    {StoryState::Unstarted, "unstarted"},
    {StoryState::Started, "started"},
    {StoryState::Finished, "finished"},
    {StoryState::Delivered, "delivered"},
    {StoryState::Accepted, "accepted"},
    {StoryState::Rejected, "rejected"},
}};

}

const char* toString(StoryType type) {
    for (const auto& [value, name] : STORY_TYPES) {
        if (value == type) return name;
    }
    return "feature";
}

const char* toString(StoryState state) {
    for (const auto& [value, name] : STORY_STATES) {
        if (value == state) return name;
    }
    return "unscheduled";
}

std::optional<StoryType> parseStoryType(const std::string& name) {
    for (const auto& [value, wire] : STORY_TYPES) {
        if (name == wire) return value;
    }
    return std::nullopt;
}

std::optional<StoryState> parseStoryState(const std::string& name) {
    for (const auto& [value, wire] : STORY_STATES) {
        if (name == wire) return value;
    }
    return std::nullopt;
}

std::vector<std::string> storyTypeNames() {
    std::vector<std::string> out;
    for (const auto& entry : STORY_TYPES) out.emplace_back(entry.second);
    return out;
}

std::vector<std::string> storyStateNames() {
    std::vector<std::string> out;
    for (const auto& entry : STORY_STATES) out.emplace_back(entry.second);
    return out;
}

bool StoryFields::empty() const {
    return !name && !description && !requestedBy && !ownedBy && !labels &&
           !estimate && !createdAt && !deadline && !storyType && !currentState;
}

}
