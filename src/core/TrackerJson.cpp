#include "core/TrackerJson.hpp"

#include <memory>
#include <sstream>

#include <json/json.h>

#include "util/Strings.hpp"

namespace trackr {

namespace {

Expected<Json::Value> parseDocument(const std::string& body) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errs)) {
        return Error{ErrorCode::InternalError, "malformed JSON response: " + errs};
    }
    return root;
}

std::string stringField(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    if (v.isString()) return v.asString();
    if (v.isNumeric()) return v.asString();
    return {};
}

std::optional<std::string> optionalString(const Json::Value& obj, const char* key) {
    if (!obj.isMember(key) || obj[key].isNull()) return std::nullopt;
    return stringField(obj, key);
}

// Wrongly typed or out-of-range numbers read as the fallback instead of throwing
int64_t int64Field(const Json::Value& obj, const char* key, int64_t fallback = 0) {
    const Json::Value& v = obj[key];
    return v.isInt64() ? v.asInt64() : fallback;
}

std::optional<int> optionalInt(const Json::Value& obj, const char* key) {
    const Json::Value& v = obj[key];
    if (!v.isInt()) return std::nullopt;
    return v.asInt();
}

// Person objects come back as {"name": ...}; older payloads carry a bare string
std::string personName(const Json::Value& person) {
    if (person.isObject()) return stringField(person, "name");
    if (person.isString()) return person.asString();
    return {};
}

Note noteFromJson(const Json::Value& value) {
    Note note;
    note.id = int64Field(value, "id");
    note.text = stringField(value, "text");
    note.author = personName(value["person"]);
    note.notedAt = stringField(value, "created_at");
    return note;
}

std::string writeCompact(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

Expected<int64_t> lookupPerson(const std::map<std::string, int64_t>& personIds, const std::string& name) {
    auto it = personIds.find(Strings::toLower(Strings::trim(name)));
    if (it == personIds.end()) {
        return Error{ErrorCode::ApiError, "Unknown person", {"Unknown person: " + name}};
    }
    return it->second;
}

}

Story TrackerJson::storyFromJson(const Json::Value& value) {
    Story story;
    story.id = int64Field(value, "id");
    story.name = stringField(value, "name");
    story.storyType = stringField(value, "story_type");
    story.url = stringField(value, "url");
    story.estimate = optionalInt(value, "estimate");
    story.currentState = stringField(value, "current_state");
    story.description = optionalString(value, "description");
    story.requestedBy = personName(value["requested_by"]);
    story.createdAt = stringField(value, "created_at");
    story.deadline = optionalString(value, "deadline");

    std::vector<std::string> owners;
    for (const auto& owner : value["owners"]) {
        std::string name = personName(owner);
        if (!name.empty()) owners.push_back(name);
    }
    if (!owners.empty()) {
        story.ownedBy = Strings::join(owners, ", ");
    }

    for (const auto& label : value["labels"]) {
        std::string name = personName(label);
        if (!name.empty()) story.labels.push_back(name);
    }
    for (const auto& comment : value["comments"]) {
        if (!comment.isObject()) continue;
        story.notes.push_back(noteFromJson(comment));
    }
    return story;
}

Expected<Project> TrackerJson::parseProject(const std::string& body) {
    auto doc = parseDocument(body);
    if (!doc) return doc.error();
    const Json::Value& v = doc.value();
    if (!v.isObject()) {
        return Error{ErrorCode::InternalError, "project response is not an object"};
    }
    Project project;
    project.id = int64Field(v, "id");
    project.name = stringField(v, "name");
    project.pointScale = stringField(v, "point_scale");
    project.iterationsStart = optionalString(v, "start_time");
    project.weeksPerIteration = optionalInt(v, "iteration_length").value_or(0);
    return project;
}

Expected<Story> TrackerJson::parseStory(const std::string& body) {
    auto doc = parseDocument(body);
    if (!doc) return doc.error();
    if (!doc.value().isObject()) {
        return Error{ErrorCode::InternalError, "story response is not an object"};
    }
    return storyFromJson(doc.value());
}

Expected<std::vector<Story>> TrackerJson::parseStories(const std::string& body) {
    auto doc = parseDocument(body);
    if (!doc) return doc.error();
    if (!doc.value().isArray()) {
        return Error{ErrorCode::InternalError, "story list response is not an array"};
    }
    std::vector<Story> stories;
    for (const auto& item : doc.value()) {
        if (!item.isObject()) continue;
        stories.push_back(storyFromJson(item));
    }
    return stories;
}

Expected<Note> TrackerJson::parseNote(const std::string& body) {
    auto doc = parseDocument(body);
    if (!doc) return doc.error();
    if (!doc.value().isObject()) {
        return Error{ErrorCode::InternalError, "note response is not an object"};
    }
    return noteFromJson(doc.value());
}

Expected<std::map<std::string, int64_t>> TrackerJson::parsePeople(const std::string& body) {
    auto doc = parseDocument(body);
    if (!doc) return doc.error();
    if (!doc.value().isArray()) {
        return Error{ErrorCode::InternalError, "membership response is not an array"};
    }
    std::map<std::string, int64_t> people;
    for (const auto& membership : doc.value()) {
        if (!membership.isObject()) continue;
        const Json::Value& person = membership["person"];
        if (!person.isObject()) continue;
        if (!person["id"].isInt64()) continue;
        int64_t id = person["id"].asInt64();
        for (const char* key : {"name", "initials", "username"}) {
            std::string alias = Strings::toLower(stringField(person, key));
            if (!alias.empty()) people.emplace(alias, id);
        }
    }
    return people;
}

std::vector<std::string> TrackerJson::parseErrors(const std::string& body) {
    std::vector<std::string> errors;
    auto doc = parseDocument(body);
    if (!doc || !doc.value().isObject()) {
        std::string text = Strings::trim(body);
        if (!text.empty()) errors.push_back(text);
        return errors;
    }
    const Json::Value& v = doc.value();
    if (v["error"].isString()) errors.push_back(v["error"].asString());
    if (v["general_problem"].isString()) errors.push_back(v["general_problem"].asString());
    for (const auto& item : v["validation_errors"]) {
        if (!item.isObject()) continue;
        errors.push_back(stringField(item, "field") + ": " + stringField(item, "problem"));
    }
    return errors;
}

Expected<std::string> TrackerJson::encodeStoryFields(const StoryFields& fields,
                                                     const std::map<std::string, int64_t>& personIds) {
    Json::Value body(Json::objectValue);
    if (fields.name) body["name"] = *fields.name;
    if (fields.description) body["description"] = *fields.description;
    if (fields.estimate) body["estimate"] = *fields.estimate;
    if (fields.createdAt) body["created_at"] = *fields.createdAt;
    if (fields.deadline) body["deadline"] = *fields.deadline;
    if (fields.storyType) body["story_type"] = toString(*fields.storyType);
    if (fields.currentState) body["current_state"] = toString(*fields.currentState);

    if (fields.labels) {
        body["labels"] = Json::Value(Json::arrayValue);
        for (const auto& name : Strings::split(*fields.labels, ',')) {
            if (name.empty()) continue;
            Json::Value label(Json::objectValue);
            label["name"] = name;
            body["labels"].append(label);
        }
    }

    if (fields.requestedBy) {
        auto id = lookupPerson(personIds, *fields.requestedBy);
        if (!id) return id.error();
        body["requested_by_id"] = Json::Int64(id.value());
    }

    // An empty owner clears the story's owners
    if (fields.ownedBy) {
        body["owner_ids"] = Json::Value(Json::arrayValue);
        if (!Strings::trim(*fields.ownedBy).empty()) {
            auto id = lookupPerson(personIds, *fields.ownedBy);
            if (!id) return id.error();
            body["owner_ids"].append(Json::Int64(id.value()));
        }
    }

    return writeCompact(body);
}

std::string TrackerJson::encodeNote(const std::string& text) {
    Json::Value body(Json::objectValue);
    body["text"] = text;
    return writeCompact(body);
}

}
