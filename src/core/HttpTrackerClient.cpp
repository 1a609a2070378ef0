#include "core/HttpTrackerClient.hpp"

#include <memory>

#include <curl/curl.h>

#include "core/Constants.hpp"
#include "core/TrackerJson.hpp"
#include "util/Logger.hpp"

namespace trackr {

namespace {

// Expanded story representation so people and labels carry names
constexpr const char* STORY_FIELDS = ":default,requested_by,owners,labels,comments(:default,person)";
constexpr const char* NOTE_FIELDS = ":default,person";

using CurlHandle = std::unique_ptr<CURL, decltype(&curl_easy_cleanup)>;
using HeaderList = std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)>;

size_t appendBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(ptr, size * nmemb);
    return size * nmemb;
}

Expected<ProjectId> requireProject(std::optional<ProjectId> project) {
    if (!project) {
        return Error{ErrorCode::ApiError, "No project",
                     {"A project must be specified with --project, --project-id or General.DefaultProject."}};
    }
    return *project;
}

std::string projectPath(ProjectId project) {
    return "/projects/" + std::to_string(project);
}

std::string storyPath(ProjectId project, StoryId story) {
    return projectPath(project) + "/stories/" + std::to_string(story);
}

}

HttpTrackerClient::HttpTrackerClient(Config config) : config(std::move(config)) {
    curl_global_init(CURL_GLOBAL_DEFAULT);
}

HttpTrackerClient::~HttpTrackerClient() {
    curl_global_cleanup();
}

Expected<std::string> HttpTrackerClient::perform(const std::string& method, const std::string& path,
                                                 const Query& query, const std::string& body) {
    if (config.apiKey.empty()) {
        return Error{ErrorCode::ApiError, "No API key",
                     {"No API key configured (General.APIKey in ~/.trackr.yml)."}};
    }

    auto url = buildUrl(config.apiUrl, path, query);
    if (!url) return url.error();

    CurlHandle curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return Error{ErrorCode::TransportError, "curl init failed", {"curl init failed"}};
    }

    const std::string token = std::string(Constants::TOKEN_HEADER) + ": " + config.apiKey;
    HeaderList headers(nullptr, &curl_slist_free_all);
    for (const char* h : {token.c_str(), "Content-Type: application/json", "Accept: application/json"}) {
        curl_slist* next = curl_slist_append(headers.get(), h);
        if (!next) {
            return Error{ErrorCode::TransportError, "header allocation failed", {"header allocation failed"}};
        }
        headers.release();
        headers.reset(next);
    }

    std::string response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.value().c_str());
    curl_easy_setopt(curl.get(), CURLOPT_ACCEPT_ENCODING, "gzip");
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, config.timeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, appendBody);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
    if (!body.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
    }

    Logger::instance().debug("http: " + method + " " + url.value());
    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        std::string reason = curl_easy_strerror(res);
        Logger::instance().debug("http: transport failure: " + reason);
        return Error{ErrorCode::TransportError, reason, {reason}};
    }

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    Logger::instance().debug("http: status " + std::to_string(status) + ", " +
                             std::to_string(response.size()) + " bytes");

    return interpretResponse(status, response);
}

Expected<std::string> HttpTrackerClient::buildUrl(const std::string& apiUrl, const std::string& path,
                                                  const Query& query) {
    CurlHandle escaper(curl_easy_init(), &curl_easy_cleanup);
    if (!escaper) {
        return Error{ErrorCode::TransportError, "curl init failed", {"curl init failed"}};
    }

    std::string url = apiUrl + path;
    for (size_t i = 0; i < query.size(); ++i) {
        std::unique_ptr<char, decltype(&curl_free)> value(
            curl_easy_escape(escaper.get(), query[i].second.c_str(), static_cast<int>(query[i].second.size())),
            &curl_free);
        if (!value) {
            return Error{ErrorCode::TransportError, "url encoding failed", {"url encoding failed"}};
        }
        url += (i == 0 ? "?" : "&") + query[i].first + "=" + value.get();
    }
    return url;
}

Expected<std::string> HttpTrackerClient::interpretResponse(long status, const std::string& body) {
    if (status < Constants::HTTP_ERROR_THRESHOLD) {
        return body;
    }
    std::vector<std::string> errors = TrackerJson::parseErrors(body);
    if (errors.empty()) {
        errors.push_back("HTTP " + std::to_string(status));
    }
    Logger::instance().debug("http: status " + std::to_string(status) + ": " + errors.front());
    return Error{ErrorCode::ApiError, "HTTP " + std::to_string(status), errors};
}

Expected<std::map<std::string, int64_t>> HttpTrackerClient::peopleFor(ProjectId project,
                                                                      const StoryFields& fields) {
    if (!fields.requestedBy && !fields.ownedBy) {
        return std::map<std::string, int64_t>{};
    }
    auto body = perform("GET", projectPath(project) + "/memberships");
    if (!body) return body.error();
    return TrackerJson::parsePeople(body.value());
}

Expected<Project> HttpTrackerClient::fetchProject(std::optional<ProjectId> project) {
    auto id = requireProject(project);
    if (!id) return id.error();
    auto body = perform("GET", projectPath(id.value()));
    if (!body) return body.error();
    return TrackerJson::parseProject(body.value());
}

Expected<std::vector<Story>> HttpTrackerClient::fetchStories(std::optional<ProjectId> project) {
    auto id = requireProject(project);
    if (!id) return id.error();
    auto body = perform("GET", projectPath(id.value()) + "/stories", {{"fields", STORY_FIELDS}});
    if (!body) return body.error();
    return TrackerJson::parseStories(body.value());
}

Expected<Story> HttpTrackerClient::fetchStory(std::optional<ProjectId> project, StoryId story) {
    auto id = requireProject(project);
    if (!id) return id.error();
    auto body = perform("GET", storyPath(id.value(), story), {{"fields", STORY_FIELDS}});
    if (!body) return body.error();
    return TrackerJson::parseStory(body.value());
}

Expected<std::vector<Story>> HttpTrackerClient::searchStories(std::optional<ProjectId> project,
                                                              const std::string& filter) {
    auto id = requireProject(project);
    if (!id) return id.error();
    auto body = perform("GET", projectPath(id.value()) + "/stories",
                        {{"filter", filter}, {"fields", STORY_FIELDS}});
    if (!body) return body.error();
    return TrackerJson::parseStories(body.value());
}

Expected<Story> HttpTrackerClient::createStory(std::optional<ProjectId> project, const StoryFields& fields) {
    auto id = requireProject(project);
    if (!id) return id.error();
    auto people = peopleFor(id.value(), fields);
    if (!people) return people.error();
    auto payload = TrackerJson::encodeStoryFields(fields, people.value());
    if (!payload) return payload.error();
    auto body = perform("POST", projectPath(id.value()) + "/stories", {{"fields", STORY_FIELDS}},
                        payload.value());
    if (!body) return body.error();
    return TrackerJson::parseStory(body.value());
}

Expected<Story> HttpTrackerClient::updateStory(std::optional<ProjectId> project, StoryId story,
                                               const StoryFields& fields) {
    auto id = requireProject(project);
    if (!id) return id.error();
    auto people = peopleFor(id.value(), fields);
    if (!people) return people.error();
    auto payload = TrackerJson::encodeStoryFields(fields, people.value());
    if (!payload) return payload.error();
    auto body = perform("PUT", storyPath(id.value(), story), {{"fields", STORY_FIELDS}}, payload.value());
    if (!body) return body.error();
    return TrackerJson::parseStory(body.value());
}

Expected<std::string> HttpTrackerClient::deleteStory(std::optional<ProjectId> project, StoryId story) {
    auto id = requireProject(project);
    if (!id) return id.error();
    auto body = perform("DELETE", storyPath(id.value(), story));
    if (!body) return body.error();
    return "Story " + std::to_string(story) + " deleted.";
}

Expected<Note> HttpTrackerClient::addNote(std::optional<ProjectId> project, StoryId story,
                                          const std::string& text) {
    auto id = requireProject(project);
    if (!id) return id.error();
    auto body = perform("POST", storyPath(id.value(), story) + "/comments", {{"fields", NOTE_FIELDS}},
                        TrackerJson::encodeNote(text));
    if (!body) return body.error();
    return TrackerJson::parseNote(body.value());
}

}
