#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "core/Models.hpp"

namespace trackr {

/**
 * @brief Text rendering of service results
 *
 * Pure formatting: every function writes to the stream it is given and
 * has no other effect.
 *
 * Story layout:
 *   Story 42 (bug) < https://host/story/show/42 >
 *   Name:         Fix the login
 *   Estimate:     2
 *   State:        started
 *   Description:  first line
 *                 second line
 *   Requested By: Alice
 *   Owned By:     Bob             (only if owned)
 *   Created:      2024-01-02T03:04:05Z
 *   Deadline:     ...             (only if set)
 *   Label(s):     a, b            (only if labelled)
 *   Notes:                        (only with --show-notes)
 *     Alice @ 2024-01-03T00:00:00Z
 *         body
 */
class ResponseRenderer {
public:
    static constexpr const char* ERROR_HEADER = "Unable to process request:";

    static void renderProject(std::ostream& out, const Project& project);
    static void renderStory(std::ostream& out, const Story& story, const DisplayOptions& display);
    static void renderStories(std::ostream& out, const std::vector<Story>& stories, const DisplayOptions& display);
    static void renderNote(std::ostream& out, const Note& note);
    static void renderMessage(std::ostream& out, const std::string& message);
    static void renderErrors(std::ostream& err, const std::vector<std::string>& errors);
};

}
