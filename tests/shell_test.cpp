#include "conduit/shell.hpp"

#include "test_support.hpp"

#include "gtest/gtest.h"

#include <filesystem>
#include <string>

using namespace conduit;
using conduit::test_support::TempDir;
using conduit::test_support::TestContext;

namespace {

TEST(ShellTest, ReturnsTrimmedStdout) {
    TestContext t;

    auto out = t.context.shell()("echo", {"hello"}, {.quiet = true});

    ASSERT_TRUE(out.has_value()) << describe(out.error());
    EXPECT_EQ(*out, "hello");
}

TEST(ShellTest, EchoesOutputUnlessQuiet) {
    TestContext t;

    ::testing::internal::CaptureStdout();
    auto out = t.context.shell()("printf", {"one\ntwo\n"});
    std::string printed = ::testing::internal::GetCapturedStdout();

    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "one\ntwo");
    EXPECT_EQ(printed, "one\ntwo\n");
}

TEST(ShellTest, RunsInTheCurrentWorkingDirectory) {
    TestContext t;
    TempDir dir;
    ASSERT_TRUE(t.context.change_directory(dir.path()).has_value());

    auto out = t.context.shell()("pwd", {"-P"}, {.quiet = true});

    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(std::filesystem::path(*out), dir.path());
    EXPECT_NE(t.output().find("debug Shell (at: " + dir.path().string() + "): pwd -P"), std::string::npos);
}

TEST(ShellTest, NonZeroExitIsAShellErrorCarryingStderr) {
    TestContext t;

    auto out = t.context.shell()("echo oops >&2; exit 3", {}, {.quiet = true});

    ASSERT_FALSE(out.has_value());
    EXPECT_EQ(out.error().kind, ErrorKind::shell);
    EXPECT_NE(out.error().message.find("exit code 3"), std::string::npos);
    EXPECT_EQ(out.error().detail, "oops");
}

TEST(ShellTest, ArgumentsAreQuotedForTheShell) {
    EXPECT_EQ(Shell::command_line("git", {"commit", "-m", "it's done"}), "git commit -m 'it'\\''s done'");
    EXPECT_EQ(Shell::command_line("ls", {""}), "ls ''");

    TestContext t;
    auto out = t.context.shell()("printf", {"%s|", "a b", "$HOME"}, {.quiet = true});
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "a b|$HOME|");
}

} // namespace
