#include "conduit/platform.hpp"

#include "conduit/runner.hpp"
#include "test_support.hpp"

#include "gtest/gtest.h"

#include <string>
#include <string_view>
#include <vector>

using namespace conduit;
using conduit::test_support::ScopedEnv;
using conduit::test_support::TestContext;

namespace {

TEST(PlatformTest, DetectsGitHubActions) {
    Environment env;
    {
        ScopedEnv actions("GITHUB_ACTIONS", "true");
        EXPECT_EQ(detect_platform(env)->name(), "GitHub Actions");
    }
    {
        ScopedEnv actions("GITHUB_ACTIONS", std::nullopt);
        EXPECT_EQ(detect_platform(env)->name(), "Local");
    }
}

TEST(PlatformTest, GitHubWorkspaceMustBeAnAbsolutePath) {
    Environment env;
    GitHubPlatform github(env);
    {
        ScopedEnv workspace("GITHUB_WORKSPACE", std::nullopt);
        auto res = github.workspace();
        ASSERT_FALSE(res.has_value());
        EXPECT_EQ(res.error().message, "Missing environment variable: GITHUB_WORKSPACE");
    }
    {
        ScopedEnv workspace("GITHUB_WORKSPACE", "relative/dir");
        EXPECT_FALSE(github.workspace().has_value());
    }
    {
        ScopedEnv workspace("GITHUB_WORKSPACE", "/home/runner/work/app");
        auto res = github.workspace();
        ASSERT_TRUE(res.has_value());
        EXPECT_EQ(*res, std::filesystem::path("/home/runner/work/app"));
    }
}

TEST(PlatformTest, WorkspaceOptionIsUsedOutsideCI) {
    LocalPlatform local;
    RunnerConfig config;
    EXPECT_FALSE(resolve_workspace(local, config).has_value());

    config.workspace = "/src/app";
    auto res = resolve_workspace(local, config);
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(*res, std::filesystem::path("/src/app"));
}

TEST(PlatformTest, CIWorkspaceWinsOverOption) {
    ScopedEnv ci("CI", "true");
    ScopedEnv workspace("GITHUB_WORKSPACE", "/home/runner/work/app");
    Environment env;
    GitHubPlatform github(env);
    RunnerConfig config;
    config.workspace = "/elsewhere";

    auto res = resolve_workspace(github, config);

    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(*res, std::filesystem::path("/home/runner/work/app"));
}

TEST(PlatformTest, GitHubLogGroupsPrintWorkflowCommandsInCI) {
    ScopedEnv actions("GITHUB_ACTIONS", "true");
    ScopedEnv ci("CI", "true");
    TestContext t;
    t.context.set_platform(detect_platform(t.context.environment()));

    ::testing::internal::CaptureStdout();
    {
        auto group = t.context.log_group("Build");
    }
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(out, "::group::Build\n::endgroup::\n");
}

/// Records group calls regardless of CI state.
class GroupRecorder : public LocalPlatform {
public:
    explicit GroupRecorder(bool supported) : supported_(supported) {
    }

    bool supports_log_groups() const override {
        return supported_;
    }
    void start_log_group(std::string_view group) override {
        calls.push_back("start:" + std::string(group));
    }
    void end_log_group(std::string_view group) override {
        calls.push_back("end:" + std::string(group));
    }

    std::vector<std::string> calls;

private:
    bool supported_;
};

TEST(PlatformTest, LogGroupsOnlyReachPlatformsThatSupportThem) {
    Environment env;
    EXPECT_TRUE(GitHubPlatform(env).supports_log_groups());
    EXPECT_FALSE(LocalPlatform().supports_log_groups());

    GroupRecorder supported(true);
    {
        LogGroup group(supported, "Compile");
    }
    EXPECT_EQ(supported.calls, (std::vector<std::string>{"start:Compile", "end:Compile"}));

    GroupRecorder unsupported(false);
    {
        LogGroup group(unsupported, "Compile");
    }
    EXPECT_TRUE(unsupported.calls.empty());
}

TEST(PlatformTest, LocalLogGroupsAreSilent) {
    TestContext t;

    ::testing::internal::CaptureStdout();
    {
        auto group = t.context.log_group("Build");
    }
    EXPECT_EQ(::testing::internal::GetCapturedStdout(), "");
}

} // namespace
