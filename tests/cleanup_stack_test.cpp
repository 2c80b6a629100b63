#include "conduit/cleanup_stack.hpp"

#include "test_support.hpp"

#include "gtest/gtest.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace conduit;
using conduit::test_support::Journal;
using conduit::test_support::RecordingStep;
using conduit::test_support::TestContext;

namespace {

class ThrowingCleanup : public BasicStep<void> {
public:
    explicit ThrowingCleanup(Journal &journal) : journal_(journal) {
    }

    Result<void> run() override {
        return {};
    }

    Result<void> cleanup(const std::optional<Error> &) override {
        journal_.events.push_back("cleanup:throwing");
        throw std::runtime_error("disk on fire");
    }

private:
    Journal &journal_;
};

TEST(CleanupStackTest, UnwindsInReverseRegistrationOrder) {
    TestContext t;
    Journal journal;
    CleanupStack stack;
    for (const char *label : {"1", "2", "3"}) {
        stack.push(std::make_shared<RecordingStep>(label, journal));
    }
    ASSERT_EQ(stack.size(), 3u);

    EXPECT_EQ(stack.unwind(std::nullopt, t.context.logger()), 0u);

    EXPECT_TRUE(stack.empty());
    EXPECT_EQ(journal.events, (std::vector<std::string>{"cleanup:3", "cleanup:2", "cleanup:1"}));
    for (const auto &error : journal.cleanup_errors) {
        EXPECT_FALSE(error.has_value());
    }
}

TEST(CleanupStackTest, PassesTerminalErrorToEveryCleanup) {
    TestContext t;
    Journal journal;
    CleanupStack stack;
    stack.push(std::make_shared<RecordingStep>("a", journal));
    stack.push(std::make_shared<RecordingStep>("b", journal));

    stack.unwind(Error::step("b failed"), t.context.logger());

    ASSERT_EQ(journal.cleanup_errors.size(), 2u);
    EXPECT_EQ(journal.cleanup_errors[0], "b failed");
    EXPECT_EQ(journal.cleanup_errors[1], "b failed");
}

TEST(CleanupStackTest, FailingCleanupDoesNotStopEarlierEntries) {
    TestContext t;
    Journal journal;
    CleanupStack stack;
    stack.push(std::make_shared<RecordingStep>("1", journal));
    auto failing = std::make_shared<RecordingStep>("2", journal);
    failing->failing_cleanup();
    stack.push(failing);
    stack.push(std::make_shared<ThrowingCleanup>(journal));

    EXPECT_EQ(stack.unwind(std::nullopt, t.context.logger()), 2u);

    EXPECT_EQ(journal.events, (std::vector<std::string>{"cleanup:throwing", "cleanup:2", "cleanup:1"}));
    std::string log = t.output();
    EXPECT_NE(log.find("Cleanup failed for step ThrowingCleanup: disk on fire"), std::string::npos);
    EXPECT_NE(log.find("Cleanup failed for step 2: 2 cleanup failed"), std::string::npos);
}

TEST(CleanupStackTest, EachStepIsCleanedUpOnce) {
    TestContext t;
    Journal journal;
    CleanupStack stack;
    stack.push(std::make_shared<RecordingStep>("only", journal));

    stack.unwind(std::nullopt, t.context.logger());
    stack.unwind(Error::step("later"), t.context.logger());

    EXPECT_EQ(journal.events, (std::vector<std::string>{"cleanup:only"}));
}

} // namespace
