#pragma once

#include <map>
#include <string>
#include <vector>

#include "core/Models.hpp"
#include "util/Expected.hpp"

namespace Json {
class Value;
}

namespace trackr {

/**
 * @brief JSON wire codec for the tracker service
 *
 * Decoders accept the response body text and fail with InternalError when
 * the body is not the JSON shape expected. Story decoding expects the
 * expanded representation requested with
 *   fields=:default,requested_by,owners,labels,comments(:default,person)
 * so that people and labels come back with names instead of ids.
 */
class TrackerJson {
public:
    static Expected<Project> parseProject(const std::string& body);
    static Expected<Story> parseStory(const std::string& body);
    static Expected<std::vector<Story>> parseStories(const std::string& body);
    static Expected<Note> parseNote(const std::string& body);

    /**
     * @brief Memberships as a person-name lookup table
     *
     * Keys are each member's name, initials and username, all lowercased.
     */
    static Expected<std::map<std::string, int64_t>> parsePeople(const std::string& body);

    /**
     * @brief Error strings from an error response
     *
     * Collects "error", "general_problem" and each validation error as
     * "field: problem". Falls back to the raw body text when it is not JSON.
     */
    static std::vector<std::string> parseErrors(const std::string& body);

    /**
     * @brief Request body for create/update
     * @param fields Only engaged members are written
     * @param personIds Lowercased person name -> member id, used for
     *        requested_by and owned_by
     * @return Body text, or ApiError naming an unknown person
     */
    static Expected<std::string> encodeStoryFields(const StoryFields& fields,
                                                   const std::map<std::string, int64_t>& personIds);

    static std::string encodeNote(const std::string& text);

    static Story storyFromJson(const Json::Value& value);
};

}
