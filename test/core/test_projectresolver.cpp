#include <gtest/gtest.h>
#include <iostream>
#include <sstream>
#include "core/ProjectResolver.hpp"
#include "util/Logger.hpp"

using namespace trackr;

class ProjectResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings.projects = {{"Testing", 1}, {"Website", 42000}};
        settings.defaultProject = "Testing";
    }

    Settings settings;
    Options options;
};

// Test: Named project is looked up in the Projects table
TEST_F(ProjectResolverTest, NamedProjectWins) {
    options.project = "Website";
    options.projectId = 7;

    auto res = ProjectResolver::resolve(options, settings);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), std::optional<ProjectId>(42000));
}

// Test: Unknown name fails even when an id is also given
TEST_F(ProjectResolverTest, UnknownNameIsInvalidProject) {
    options.project = "NonExistentName";
    options.projectId = 7;

    auto res = ProjectResolver::resolve(options, settings);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidProject);
    EXPECT_EQ(res.error().message, "Invalid Project Name.");
}

// Test: Explicit id beats the configured default and is not validated
TEST_F(ProjectResolverTest, ExplicitIdBeatsDefault) {
    options.projectId = 42;

    auto res = ProjectResolver::resolve(options, settings);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), std::optional<ProjectId>(42));
}

TEST_F(ProjectResolverTest, FallsBackToDefaultProject) {
    auto res = ProjectResolver::resolve(options, settings);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res.value(), std::optional<ProjectId>(1));
}

// Test: Unconfigured or dangling defaults resolve to "no project", not an error
TEST_F(ProjectResolverTest, MissingDefaultResolvesToNothing) {
    settings.defaultProject.clear();
    auto none = ProjectResolver::resolve(options, settings);
    ASSERT_TRUE(none.has_value());
    EXPECT_FALSE(none.value().has_value());

    settings.defaultProject = "Archived";
    auto dangling = ProjectResolver::resolve(options, settings);
    ASSERT_TRUE(dangling.has_value());
    EXPECT_FALSE(dangling.value().has_value());
}

// Test: With an empty configuration a named project can never resolve
TEST_F(ProjectResolverTest, EmptySettingsRejectNamedProject) {
    Settings empty;
    options.project = "Testing";

    auto res = ProjectResolver::resolve(options, empty);
    ASSERT_FALSE(res.has_value());
    EXPECT_EQ(res.error().code, ErrorCode::InvalidProject);
}

// Test: A DefaultProject missing from Projects is reported as a warning
TEST_F(ProjectResolverTest, DanglingDefaultIsWarned) {
    settings.defaultProject = "Archived";
    LogLevel saved = Logger::instance().level();
    Logger::instance().setLevel(LogLevel::Warn);

    std::ostringstream captured;
    std::streambuf* original = std::cerr.rdbuf(captured.rdbuf());
    auto res = ProjectResolver::resolve(options, settings);
    std::cerr.rdbuf(original);
    Logger::instance().setLevel(saved);

    ASSERT_TRUE(res.has_value());
    EXPECT_FALSE(res.value().has_value());
    EXPECT_NE(captured.str().find("[warn ] DefaultProject 'Archived' is not in Projects"), std::string::npos);
}
