#include <gtest/gtest.h>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <vector>
#include "FakeTrackerClient.hpp"
#include "test_utils.hpp"
#include "cli/Application.hpp"

namespace fs = std::filesystem;

using namespace trackr;
using namespace trackr::test::utils;
using trackr::test::FakeTrackerClient;

namespace {

// Hands the application a client that forwards to a fixture-owned fake,
// so calls can be inspected after the application has released it
class ForwardingClient : public ITrackerClient {
public:
    explicit ForwardingClient(FakeTrackerClient& fake) : fake(fake) {}

    Expected<Project> fetchProject(std::optional<ProjectId> p) override { return fake.fetchProject(p); }
    Expected<std::vector<Story>> fetchStories(std::optional<ProjectId> p) override { return fake.fetchStories(p); }
    Expected<Story> fetchStory(std::optional<ProjectId> p, StoryId s) override { return fake.fetchStory(p, s); }
    Expected<std::vector<Story>> searchStories(std::optional<ProjectId> p, const std::string& f) override {
        return fake.searchStories(p, f);
    }
    Expected<Story> createStory(std::optional<ProjectId> p, const StoryFields& fields) override {
        return fake.createStory(p, fields);
    }
    Expected<Story> updateStory(std::optional<ProjectId> p, StoryId s, const StoryFields& fields) override {
        return fake.updateStory(p, s, fields);
    }
    Expected<std::string> deleteStory(std::optional<ProjectId> p, StoryId s) override {
        return fake.deleteStory(p, s);
    }
    Expected<Note> addNote(std::optional<ProjectId> p, StoryId s, const std::string& text) override {
        return fake.addNote(p, s, text);
    }

private:
    FakeTrackerClient& fake;
};

}

class ApplicationTest : public ::testing::Test {
protected:
    void SetUp() override {
        tempDir = createTempDir();
        home = std::make_unique<ScopedEnv>("HOME", tempDir.string());
    }

    void TearDown() override {
        home.reset();
        removeDir(tempDir);
    }

    void writeConfig(const std::string& text) {
        configPath = createFile(tempDir, "trackr.yml", text);
    }

    int run(std::vector<std::string> args) {
        if (!configPath.empty()) {
            args.push_back("--config");
            args.push_back(configPath.string());
        }
        Application app([this](const Settings& settings, const Options& options) -> std::unique_ptr<ITrackerClient> {
            seenSettings = settings;
            seenTimeout = options.timeout;
            return std::make_unique<ForwardingClient>(client);
        });
        return app.run(args, out, err);
    }

    fs::path tempDir;
    fs::path configPath;
    std::unique_ptr<ScopedEnv> home;
    FakeTrackerClient client;
    std::optional<Settings> seenSettings;
    std::optional<long> seenTimeout;
    std::ostringstream out;
    std::ostringstream err;
};

// Test: Service error for the default project is rendered and fails
TEST_F(ApplicationTest, ShowStoryErrorUsesDefaultProject) {
    writeConfig("Projects:\n  Testing: 1\nGeneral:\n  DefaultProject: Testing\n");
    client.failure = std::vector<std::string>{"Story not found"};

    EXPECT_EQ(run({"--show-story", "--story-id", "7"}), 1);
    EXPECT_EQ(err.str(), "Unable to process request:\n  Story not found\n");
    EXPECT_EQ(out.str(), "");
    ASSERT_EQ(client.calls.size(), 1u);
    EXPECT_EQ(client.calls[0].operation, "fetchStory");
    EXPECT_EQ(client.calls[0].project, std::optional<ProjectId>(1));
    EXPECT_EQ(client.calls[0].story, 7);
}

TEST_F(ApplicationTest, AddStoryBugWithConfiguredRequester) {
    writeConfig("General:\n  APIKey: k\n  Me: Alice\n  DefaultProject: Testing\nProjects:\n  Testing: 1\n");

    EXPECT_EQ(run({"--add-story", "--story", "Fix bug", "--bug"}), 0);
    ASSERT_EQ(client.calls.size(), 1u);
    const auto& call = client.calls[0];
    EXPECT_EQ(call.operation, "createStory");
    EXPECT_EQ(call.fields.requestedBy, std::optional<std::string>("Alice"));
    EXPECT_EQ(call.fields.storyType, std::optional<StoryType>(StoryType::Bug));
    EXPECT_EQ(err.str(), "");
}

// Test: An unknown project name fails before any request
TEST_F(ApplicationTest, InvalidProjectName) {
    writeConfig("Projects:\n  Testing: 1\n");

    EXPECT_EQ(run({"--show-project", "--project", "NonExistentName"}), 1);
    EXPECT_EQ(err.str(), "Invalid Project Name.\n");
    EXPECT_TRUE(client.calls.empty());
}

TEST_F(ApplicationTest, ExplicitProjectIdBeatsDefault) {
    writeConfig("General:\n  DefaultProject: Testing\nProjects:\n  Testing: 1\n");

    EXPECT_EQ(run({"--show-project", "--project-id", "42"}), 0);
    ASSERT_EQ(client.calls.size(), 1u);
    EXPECT_EQ(client.calls[0].project, std::optional<ProjectId>(42));
}

TEST_F(ApplicationTest, HelpExitsZeroWithoutService) {
    EXPECT_EQ(run({"--help"}), 0);
    EXPECT_EQ(out.str().rfind("Usage: trackr", 0), 0u);
    EXPECT_FALSE(seenSettings.has_value());
}

TEST_F(ApplicationTest, UnknownOptionIsUsageFailure) {
    EXPECT_EQ(run({"--frobnicate"}), 1);
    EXPECT_EQ(err.str(),
        "trackr: unrecognized option '--frobnicate'\n"
        "Try 'trackr --help' for more information.\n");
    EXPECT_TRUE(client.calls.empty());
}

TEST_F(ApplicationTest, EmptyUpdateIsUsageFailure) {
    writeConfig("Projects:\n  Testing: 1\n");

    EXPECT_EQ(run({"--update-story", "--story-id", "5"}), 1);
    EXPECT_EQ(err.str(), "Cannot update a story, without specifying what to update.\n");
    EXPECT_TRUE(client.calls.empty());
}

// Test: No action requested is a silent success
TEST_F(ApplicationTest, NoActionExitsZero) {
    writeConfig("Projects:\n  Testing: 1\n");

    EXPECT_EQ(run({"--story-id", "5"}), 0);
    EXPECT_EQ(out.str(), "");
    EXPECT_EQ(err.str(), "");
    EXPECT_TRUE(client.calls.empty());
}

// Test: Listing degrades gracefully without any configuration
TEST_F(ApplicationTest, ListProjectsWithoutConfig) {
    if (fs::exists(Constants::SYSTEM_CONFIG_PATH)) {
        GTEST_SKIP() << "system configuration present";
    }
    EXPECT_EQ(run({"--list-projects"}), 0);
    EXPECT_EQ(out.str(), "No named projects found.\n");
}

// Test: Service actions need a configuration
TEST_F(ApplicationTest, ServiceActionWithoutConfigFails) {
    if (fs::exists(Constants::SYSTEM_CONFIG_PATH)) {
        GTEST_SKIP() << "system configuration present";
    }
    EXPECT_EQ(run({"--show-project", "--project-id", "1"}), 1);
    EXPECT_NE(err.str().find("No configuration file found"), std::string::npos);
    EXPECT_TRUE(client.calls.empty());
}

TEST_F(ApplicationTest, ListProjectsFromHomeConfig) {
    createFile(tempDir, Constants::CONFIG_FILENAME, "Projects:\n  Website: 42\n  Testing: 1\n");

    EXPECT_EQ(run({"-l"}), 0);
    EXPECT_EQ(out.str(), "Testing (1)\nWebsite (42)\n");
}

TEST_F(ApplicationTest, TimeoutOptionReachesClientFactory) {
    writeConfig("General:\n  Timeout: 10\nProjects:\n  Testing: 1\n");

    EXPECT_EQ(run({"--show-project", "-P", "1", "--timeout", "5"}), 0);
    ASSERT_TRUE(seenSettings.has_value());
    EXPECT_EQ(seenSettings->timeoutSeconds, 10);
    EXPECT_EQ(seenTimeout, std::optional<long>(5));
}

TEST_F(ApplicationTest, MissingExplicitConfigFails) {
    configPath = tempDir / "absent.yml";

    EXPECT_EQ(run({"--show-project", "-P", "1"}), 1);
    EXPECT_NE(err.str().find("absent.yml"), std::string::npos);
    EXPECT_TRUE(client.calls.empty());
}
