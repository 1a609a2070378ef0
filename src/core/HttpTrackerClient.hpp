#pragma once

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "core/ITrackerClient.hpp"

namespace trackr {

/**
 * @brief ITrackerClient over the service's JSON REST API (libcurl)
 *
 * Requests:
 *   GET    /projects/{p}
 *   GET    /projects/{p}/stories[?filter=...]
 *   GET    /projects/{p}/stories/{s}
 *   POST   /projects/{p}/stories
 *   PUT    /projects/{p}/stories/{s}
 *   DELETE /projects/{p}/stories/{s}
 *   POST   /projects/{p}/stories/{s}/comments
 *   GET    /projects/{p}/memberships   (person name -> id for create/update)
 *
 * Authentication is the X-TrackerToken header. gzip responses are
 * negotiated and decoded by libcurl. One attempt per call; nothing is retried.
 */
class HttpTrackerClient : public ITrackerClient {
public:
    struct Config {
        std::string apiUrl;
        std::string apiKey;
        long timeoutSeconds{30};
    };

    explicit HttpTrackerClient(Config config);
    ~HttpTrackerClient() override;

    HttpTrackerClient(const HttpTrackerClient&) = delete;
    HttpTrackerClient& operator=(const HttpTrackerClient&) = delete;

    Expected<Project> fetchProject(std::optional<ProjectId> project) override;
    Expected<std::vector<Story>> fetchStories(std::optional<ProjectId> project) override;
    Expected<Story> fetchStory(std::optional<ProjectId> project, StoryId story) override;
    Expected<std::vector<Story>> searchStories(std::optional<ProjectId> project,
                                               const std::string& filter) override;
    Expected<Story> createStory(std::optional<ProjectId> project, const StoryFields& fields) override;
    Expected<Story> updateStory(std::optional<ProjectId> project, StoryId story,
                                const StoryFields& fields) override;
    Expected<std::string> deleteStory(std::optional<ProjectId> project, StoryId story) override;
    Expected<Note> addNote(std::optional<ProjectId> project, StoryId story, const std::string& text) override;

    using Query = std::vector<std::pair<std::string, std::string>>;

    /// Base URL + path, with each query value percent-encoded
    static Expected<std::string> buildUrl(const std::string& apiUrl, const std::string& path,
                                          const Query& query);

    /**
     * @brief Map a completed exchange onto the call result
     * @return body for status < 400; otherwise ApiError whose details are
     *         the service's error strings, or "HTTP <status>" when it sent none
     */
    static Expected<std::string> interpretResponse(long status, const std::string& body);

private:
    /**
     * @brief Perform one request
     * @return See interpretResponse; TransportError when no response arrived
     */
    Expected<std::string> perform(const std::string& method, const std::string& path,
                                  const Query& query = {}, const std::string& body = "");

    /// Person lookup table, only fetched when a field names a person
    Expected<std::map<std::string, int64_t>> peopleFor(ProjectId project, const StoryFields& fields);

    Config config;
};

}
