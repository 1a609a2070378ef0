#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/Models.hpp"
#include "util/Expected.hpp"

namespace trackr {

/**
 * @brief Remote tracker operations
 *
 * Every call is one blocking request. A failed call returns an Error with
 * code ApiError (the service refused) or TransportError (no usable
 * response); the service's error strings are in Error::details.
 *
 * The project is optional because resolution may legitimately find none;
 * implementations report that as a failed call.
 */
class ITrackerClient {
public:
    virtual ~ITrackerClient() = default;

    virtual Expected<Project> fetchProject(std::optional<ProjectId> project) = 0;
    virtual Expected<std::vector<Story>> fetchStories(std::optional<ProjectId> project) = 0;
    virtual Expected<Story> fetchStory(std::optional<ProjectId> project, StoryId story) = 0;
    virtual Expected<std::vector<Story>> searchStories(std::optional<ProjectId> project,
                                                       const std::string& filter) = 0;
    virtual Expected<Story> createStory(std::optional<ProjectId> project, const StoryFields& fields) = 0;
    virtual Expected<Story> updateStory(std::optional<ProjectId> project, StoryId story,
                                        const StoryFields& fields) = 0;
    /// Returns the confirmation message to print
    virtual Expected<std::string> deleteStory(std::optional<ProjectId> project, StoryId story) = 0;
    virtual Expected<Note> addNote(std::optional<ProjectId> project, StoryId story, const std::string& text) = 0;
};

}
