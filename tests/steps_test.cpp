#include "conduit/steps/export_environment.hpp"
#include "conduit/steps/shell_step.hpp"
#include "conduit/steps/temporary_directory.hpp"

#include "test_support.hpp"

#include "gtest/gtest.h"

#include <cstdlib>
#include <filesystem>
#include <string>

using namespace conduit;
using conduit::test_support::ScopedEnv;
using conduit::test_support::TestContext;

namespace {

TEST(StepsTest, TemporaryDirectoryIsRemovedOnCleanup) {
    TestContext t;

    auto dir = run_step(TemporaryDirectoryStep("conduit-steps"));

    ASSERT_TRUE(dir.has_value()) << describe(dir.error());
    EXPECT_TRUE(std::filesystem::is_directory(*dir));
    EXPECT_EQ(dir->filename().string().rfind("conduit-steps.", 0), 0u);

    EXPECT_EQ(t.context.cleanup_stack().unwind(std::nullopt, t.context.logger()), 0u);
    EXPECT_FALSE(std::filesystem::exists(*dir));
}

TEST(StepsTest, ExportedVariableIsRestoredOnCleanup) {
    TestContext t;
    ScopedEnv env("CONDUIT_TEST_STAGE", "build");

    ASSERT_TRUE(run_step(ExportEnvironmentStep("CONDUIT_TEST_STAGE", "test")).has_value());
    auto seen = t.context.shell()("echo \"$CONDUIT_TEST_STAGE\"", {}, {.quiet = true});
    ASSERT_TRUE(seen.has_value());
    EXPECT_EQ(*seen, "test");

    t.context.cleanup_stack().unwind(Error::step("later failure"), t.context.logger());
    EXPECT_EQ(t.context.environment().get("CONDUIT_TEST_STAGE"), "build");
}

TEST(StepsTest, ExportedVariableIsUnsetWhenItDidNotExist) {
    TestContext t;
    ScopedEnv env("CONDUIT_TEST_FRESH", std::nullopt);

    ASSERT_TRUE(run_step(ExportEnvironmentStep("CONDUIT_TEST_FRESH", "1")).has_value());
    EXPECT_EQ(t.context.environment().get("CONDUIT_TEST_FRESH"), "1");

    t.context.cleanup_stack().unwind(std::nullopt, t.context.logger());
    EXPECT_FALSE(t.context.environment().get("CONDUIT_TEST_FRESH").has_value());
}

TEST(StepsTest, ShellStepIsNamedAfterItsCommand) {
    TestContext t;
    ShellStep echo("echo", {"two words"}, {.quiet = true});
    EXPECT_EQ(echo.name(), "echo 'two words'");

    auto out = run_step(echo);

    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "two words");
    EXPECT_NE(t.output().find("info Step: echo 'two words'"), std::string::npos);
}

} // namespace
