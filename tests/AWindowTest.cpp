#include <AWindow>

#include "FakeWindowSystem.h"
#include <AWindowClass>
#include <AWindowProcedure>
#include <gtest/gtest.h>

namespace {

class AWindowTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(windowClass_.registerClass(AInstanceHandle{}, &procedure_, ACursorHandle{}, "WindowTestClass"));
    }

    FakeWindowSystem system_;
    APaintToggle toggle_;
    AWindowProcedure procedure_{system_, toggle_};
    AWindowClass windowClass_{system_};
};

} // namespace

TEST_F(AWindowTest, CreatesVisibleOverlappedWindowAtDefaultPlacement) {
    AWindow window(system_);
    ASSERT_TRUE(window.create(windowClass_.getId(), "Handmade Hero", AInstanceHandle{}));

    EXPECT_TRUE(window.isCreated());
    EXPECT_EQ(window.getNativeHandle(), system_.lastCreatedWindow());
    ASSERT_EQ(system_.createRequests.size(), 1u);
    const AWindowCreateDesc& desc = system_.createRequests[0];
    EXPECT_EQ(desc.classId, windowClass_.getId());
    EXPECT_EQ(desc.title, "Handmade Hero");
    EXPECT_TRUE(hasStyle(desc.style, EWindowStyle::OverlappedWindow));
    EXPECT_TRUE(hasStyle(desc.style, EWindowStyle::Visible));
    EXPECT_EQ(desc.x, AWindowCreateDesc::kUseDefault);
    EXPECT_EQ(desc.y, AWindowCreateDesc::kUseDefault);
    EXPECT_EQ(desc.width, AWindowCreateDesc::kUseDefault);
    EXPECT_EQ(desc.height, AWindowCreateDesc::kUseDefault);
}

TEST_F(AWindowTest, ProcedureToleratesCallsDuringCreation) {
    AWindow window(system_);
    ASSERT_TRUE(window.create(windowClass_.getId(), "Early", AInstanceHandle{}));

    ASSERT_EQ(system_.routed.size(), system_.creationMessages.size());
    ASSERT_EQ(system_.defaultCalls.size(), system_.creationMessages.size());
    for (size_t i = 0; i < system_.creationMessages.size(); ++i) {
        EXPECT_EQ(system_.defaultCalls[i].id, system_.creationMessages[i].id);
    }
    EXPECT_EQ(toggle_.current(), EPaintPattern::White);
}

TEST_F(AWindowTest, PaintDuringCreationUsesToggle) {
    system_.creationMessages.push_back(FakeWindowSystem::makeMessage(EMessageKind::Paint));

    AWindow window(system_);
    ASSERT_TRUE(window.create(windowClass_.getId(), "Early paint", AInstanceHandle{}));
    ASSERT_EQ(system_.fills.size(), 1u);
    EXPECT_EQ(system_.fills[0].pattern, EPaintPattern::White);
    EXPECT_EQ(toggle_.current(), EPaintPattern::Black);
}

TEST_F(AWindowTest, UnknownClassFailsWithOsCode) {
    AWindow window(system_);
    EXPECT_FALSE(window.create(AWindowClassId{0x1234}, "Nope", AInstanceHandle{}));
    EXPECT_FALSE(window.isCreated());
    EXPECT_EQ(window.lastError().kind, EWindowError::WindowCreationFailed);
    EXPECT_EQ(window.lastError().osCode, FakeWindowSystem::kErrorCannotFindClass);
}

TEST_F(AWindowTest, RefusedCreationFailsWithOsCode) {
    system_.createWindowError = 8;

    AWindow window(system_);
    EXPECT_FALSE(window.create(windowClass_.getId(), "Out of memory", AInstanceHandle{}));
    EXPECT_EQ(window.lastError().kind, EWindowError::WindowCreationFailed);
    EXPECT_EQ(window.lastError().osCode, 8u);
    EXPECT_TRUE(system_.routed.empty());
}
