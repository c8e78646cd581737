#include <AMessageLoop>

#include "FakeWindowSystem.h"
#include <gtest/gtest.h>

TEST(AMessageLoopTest, QuitSentinelOnFirstCallStopsWithoutDispatch) {
    FakeWindowSystem system;
    system.queueQuitSentinel(0);

    AMessageLoop loop(system);
    EXPECT_EQ(loop.state(), ELoopState::Running);
    EXPECT_EQ(loop.run(), ELoopExit::Quit);
    EXPECT_EQ(loop.state(), ELoopState::Stopped);
    EXPECT_EQ(loop.dispatchedCount(), 0u);
    EXPECT_EQ(system.translateCalls, 0);
    EXPECT_TRUE(system.routed.empty());
}

TEST(AMessageLoopTest, ExitCodeComesFromQuitSentinel) {
    FakeWindowSystem system;
    system.queueQuitSentinel(3);

    AMessageLoop loop(system);
    loop.run();
    EXPECT_EQ(loop.exitCode(), 3);
    EXPECT_FALSE(loop.lastError());
}

TEST(AMessageLoopTest, TranslatesThenDispatchesEachMessageInOrder) {
    FakeWindowSystem system;
    system.queueMessage(FakeWindowSystem::makeOther(FakeWindowSystem::kKeyDown, 0x41));
    system.queueMessage(FakeWindowSystem::makeOther(FakeWindowSystem::kMouseMove));
    system.queueQuitSentinel(0);

    AMessageLoop loop(system);
    EXPECT_EQ(loop.run(), ELoopExit::Quit);
    EXPECT_EQ(loop.dispatchedCount(), 2u);

    const std::vector<std::string> expected{
        "getMessage", "translateMessage", "dispatchMessage",
        "getMessage", "translateMessage", "dispatchMessage",
        "getMessage"};
    EXPECT_EQ(system.calls, expected);
    ASSERT_EQ(system.defaultCalls.size(), 2u);
    EXPECT_EQ(system.defaultCalls[0].id, FakeWindowSystem::kKeyDown);
    EXPECT_EQ(system.defaultCalls[1].id, FakeWindowSystem::kMouseMove);
}

TEST(AMessageLoopTest, RetrievalErrorStopsLoop) {
    FakeWindowSystem system;
    system.queueMessage(FakeWindowSystem::makeOther(FakeWindowSystem::kMouseMove));
    system.queueRetrievalError(FakeWindowSystem::kErrorInvalidHandle);
    system.queueMessage(FakeWindowSystem::makeOther(FakeWindowSystem::kKeyDown));

    AMessageLoop loop(system);
    EXPECT_EQ(loop.run(), ELoopExit::RetrievalFailed);
    EXPECT_EQ(loop.state(), ELoopState::Stopped);
    EXPECT_EQ(loop.dispatchedCount(), 1u);
    EXPECT_EQ(loop.lastError().kind, EWindowError::EventRetrievalFailed);
    EXPECT_EQ(loop.lastError().osCode, FakeWindowSystem::kErrorInvalidHandle);
}

TEST(AMessageLoopTest, StoppedLoopDoesNotRetrieveAgain) {
    FakeWindowSystem system;
    system.queueQuitSentinel(0);

    AMessageLoop loop(system);
    loop.run();
    system.calls.clear();

    EXPECT_EQ(loop.run(), ELoopExit::Quit);
    EXPECT_TRUE(system.calls.empty());
}
