#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <string>
#include <json/json.h>
#include "core/TrackerJson.hpp"

using namespace trackr;

namespace {

Json::Value parse(const std::string& text) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errs;
    reader->parse(text.data(), text.data() + text.size(), &root, &errs);
    return root;
}

const char* STORY_JSON = R"({
    "kind": "story",
    "id": 555,
    "name": "Fix login",
    "story_type": "bug",
    "url": "https://www.pivotaltracker.com/story/show/555",
    "current_state": "started",
    "description": "Steps:\n1. open\n2. crash",
    "requested_by": {"kind": "person", "id": 1, "name": "Alice"},
    "owners": [{"id": 2, "name": "Bob"}, {"id": 3, "name": "Carol"}],
    "created_at": "2024-01-02T03:04:05Z",
    "labels": [{"id": 9, "name": "ui"}, {"id": 10, "name": "login"}],
    "comments": [
        {"id": 70, "text": "First", "person": {"name": "Bob"}, "created_at": "2024-01-03T00:00:00Z"}
    ]
})";

}

TEST(TrackerJsonTest, ParsesExpandedStory) {
    auto res = TrackerJson::parseStory(STORY_JSON);
    ASSERT_TRUE(res.has_value()) << res.error().message;
    const Story& s = res.value();
    EXPECT_EQ(s.id, 555);
    EXPECT_EQ(s.name, "Fix login");
    EXPECT_EQ(s.storyType, "bug");
    EXPECT_EQ(s.currentState, "started");
    EXPECT_FALSE(s.estimate.has_value());
    EXPECT_EQ(s.description, std::optional<std::string>("Steps:\n1. open\n2. crash"));
    EXPECT_EQ(s.requestedBy, "Alice");
    EXPECT_EQ(s.ownedBy, std::optional<std::string>("Bob, Carol"));
    EXPECT_FALSE(s.deadline.has_value());
    EXPECT_EQ(s.labels, (std::vector<std::string>{"ui", "login"}));
    ASSERT_EQ(s.notes.size(), 1u);
    EXPECT_EQ(s.notes[0].id, 70);
    EXPECT_EQ(s.notes[0].author, "Bob");
    EXPECT_EQ(s.notes[0].text, "First");
}

// Test: Absent and null optional fields both stay absent
TEST(TrackerJsonTest, MissingOptionalFieldsStayAbsent) {
    auto res = TrackerJson::parseStory(R"({"id": 1, "name": "n", "description": null, "estimate": 3, "owners": []})");
    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE(res.value().description.has_value());
    EXPECT_FALSE(res.value().ownedBy.has_value());
    EXPECT_EQ(res.value().estimate, std::optional<int>(3));
    EXPECT_TRUE(res.value().notes.empty());
}

TEST(TrackerJsonTest, ParsesStoryListAndRejectsWrongShape) {
    auto list = TrackerJson::parseStories(R"([{"id": 1, "name": "a"}, {"id": 2, "name": "b"}])");
    ASSERT_TRUE(list.has_value());
    ASSERT_EQ(list.value().size(), 2u);
    EXPECT_EQ(list.value()[1].name, "b");

    auto notArray = TrackerJson::parseStories(R"({"id": 1})");
    ASSERT_FALSE(notArray.has_value());
    EXPECT_EQ(notArray.error().code, ErrorCode::InternalError);

    auto garbage = TrackerJson::parseStory("<html>");
    ASSERT_FALSE(garbage.has_value());
}

TEST(TrackerJsonTest, ParsesProject) {
    auto res = TrackerJson::parseProject(
        R"({"id": 1, "name": "Testing", "point_scale": "0,1,2,3", "iteration_length": 2,
            "start_time": "2024-01-01T00:00:00Z"})");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().name, "Testing");
    EXPECT_EQ(res.value().pointScale, "0,1,2,3");
    EXPECT_EQ(res.value().weeksPerIteration, 2);
    EXPECT_EQ(res.value().iterationsStart, std::optional<std::string>("2024-01-01T00:00:00Z"));
}

TEST(TrackerJsonTest, ParsesNote) {
    auto res = TrackerJson::parseNote(
        R"({"id": 8, "text": "hi", "person": {"name": "Alice"}, "created_at": "2024-02-02T00:00:00Z"})");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value().id, 8);
    EXPECT_EQ(res.value().author, "Alice");
    EXPECT_EQ(res.value().notedAt, "2024-02-02T00:00:00Z");
}

// Test: Error bodies flatten into one string per problem
TEST(TrackerJsonTest, FlattensErrorResponse) {
    auto errors = TrackerJson::parseErrors(R"({
        "code": "invalid_parameter",
        "kind": "error",
        "error": "One or more request parameters was missing or invalid.",
        "general_problem": "Story not found",
        "validation_errors": [{"field": "estimate", "problem": "must be on the point scale"}]
    })");
    ASSERT_EQ(errors.size(), 3u);
    EXPECT_EQ(errors[0], "One or more request parameters was missing or invalid.");
    EXPECT_EQ(errors[1], "Story not found");
    EXPECT_EQ(errors[2], "estimate: must be on the point scale");

    auto raw = TrackerJson::parseErrors("Service Unavailable\n");
    ASSERT_EQ(raw.size(), 1u);
    EXPECT_EQ(raw[0], "Service Unavailable");

    EXPECT_TRUE(TrackerJson::parseErrors("").empty());
}

TEST(TrackerJsonTest, MembershipsIndexNameInitialsAndUsername) {
    auto res = TrackerJson::parsePeople(R"([
        {"person": {"id": 11, "name": "Alice Smith", "initials": "AS", "username": "alice"}},
        {"person": {"id": 12, "name": "Bob"}}
    ])");
    ASSERT_TRUE(res.has_value());
    const auto& people = res.value();
    EXPECT_EQ(people.at("alice smith"), 11);
    EXPECT_EQ(people.at("as"), 11);
    EXPECT_EQ(people.at("alice"), 11);
    EXPECT_EQ(people.at("bob"), 12);
}

// Test: Only engaged fields are written
TEST(TrackerJsonTest, EncodesOnlySuppliedFields) {
    StoryFields fields;
    fields.name = "Fix bug";
    fields.storyType = StoryType::Bug;
    fields.requestedBy = "Alice";
    fields.labels = "ui,backend";

    auto body = TrackerJson::encodeStoryFields(fields, {{"alice", 11}});
    ASSERT_TRUE(body.has_value()) << body.error().message;

    Json::Value v = parse(body.value());
    EXPECT_EQ(v["name"].asString(), "Fix bug");
    EXPECT_EQ(v["story_type"].asString(), "bug");
    EXPECT_EQ(v["requested_by_id"].asInt64(), 11);
    ASSERT_EQ(v["labels"].size(), 2u);
    EXPECT_EQ(v["labels"][0]["name"].asString(), "ui");
    EXPECT_EQ(v["labels"][1]["name"].asString(), "backend");
    EXPECT_FALSE(v.isMember("description"));
    EXPECT_FALSE(v.isMember("estimate"));
    EXPECT_FALSE(v.isMember("current_state"));
    EXPECT_FALSE(v.isMember("owner_ids"));
}

// Test: Supplied-but-empty values are sent, not dropped
TEST(TrackerJsonTest, EncodesEmptyValuesThatWereSupplied) {
    StoryFields fields;
    fields.description = "";
    fields.estimate = 0;
    fields.ownedBy = "";

    auto body = TrackerJson::encodeStoryFields(fields, {});
    ASSERT_TRUE(body.has_value());
    Json::Value v = parse(body.value());
    ASSERT_TRUE(v.isMember("description"));
    EXPECT_EQ(v["description"].asString(), "");
    EXPECT_EQ(v["estimate"].asInt(), 0);
    ASSERT_TRUE(v["owner_ids"].isArray());
    EXPECT_EQ(v["owner_ids"].size(), 0u);
}

TEST(TrackerJsonTest, UnknownPersonIsApiError) {
    StoryFields fields;
    fields.ownedBy = "Mallory";

    auto body = TrackerJson::encodeStoryFields(fields, {{"alice", 11}});
    ASSERT_FALSE(body.has_value());
    EXPECT_EQ(body.error().code, ErrorCode::ApiError);
    ASSERT_EQ(body.error().details.size(), 1u);
    EXPECT_EQ(body.error().details[0], "Unknown person: Mallory");
}

TEST(TrackerJsonTest, EncodesNoteText) {
    Json::Value v = parse(TrackerJson::encodeNote("line 1\nline \"2\""));
    EXPECT_EQ(v["text"].asString(), "line 1\nline \"2\"");
}

// Test: Wrongly typed numbers decode to defaults instead of throwing
TEST(TrackerJsonTest, WronglyTypedNumbersDoNotThrow) {
    auto story = TrackerJson::parseStory(R"({"id": "8", "name": "x", "estimate": "big"})");
    ASSERT_TRUE(story.has_value());
    EXPECT_EQ(story.value().id, 0);
    EXPECT_EQ(story.value().name, "x");
    EXPECT_FALSE(story.value().estimate.has_value());

    auto huge = TrackerJson::parseStory(R"({"id": 1, "estimate": 1e300})");
    ASSERT_TRUE(huge.has_value());
    EXPECT_FALSE(huge.value().estimate.has_value());

    auto project = TrackerJson::parseProject(R"({"id": [1], "name": "P", "iteration_length": "two"})");
    ASSERT_TRUE(project.has_value());
    EXPECT_EQ(project.value().id, 0);
    EXPECT_EQ(project.value().weeksPerIteration, 0);

    auto note = TrackerJson::parseNote(R"({"id": {"n": 1}, "text": "t"})");
    ASSERT_TRUE(note.has_value());
    EXPECT_EQ(note.value().id, 0);
    EXPECT_EQ(note.value().text, "t");

    auto people = TrackerJson::parsePeople(R"([{"person": {"id": "11", "name": "Alice"}},
                                                {"person": {"id": 12, "name": "Bob"}}])");
    ASSERT_TRUE(people.has_value());
    EXPECT_EQ(people.value().count("alice"), 0u);
    EXPECT_EQ(people.value().at("bob"), 12);
}
