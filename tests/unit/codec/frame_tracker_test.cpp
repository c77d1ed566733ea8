#include <gtest/gtest.h>

#include "csb/codec/frame_tracker.hpp"

using csb::codec::FrameKind;
using csb::codec::FrameTracker;
using csb::foundation::CodecOptions;
using csb::foundation::ErrorCode;
using csb::foundation::LogCategory;

namespace {

FrameTracker makeTracker(CodecOptions options = {}) {
    return FrameTracker("test", LogCategory::Core, options);
}

}  // namespace

TEST(FrameTrackerTest, SequenceVisitsInOrder) {
    auto tracker = makeTracker();
    auto scope = tracker.open(FrameKind::Sequence, 2);
    EXPECT_TRUE(tracker.element(0).hasValue());
    EXPECT_TRUE(tracker.element(1).hasValue());
    EXPECT_TRUE(tracker.close().hasValue());
}

TEST(FrameTrackerTest, SkippedIndexIsOrderViolation) {
    auto tracker = makeTracker();
    auto scope = tracker.open(FrameKind::Sequence, 3);
    ASSERT_TRUE(tracker.element(0).hasValue());
    auto r = tracker.element(2);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::FrameOrderViolation);
}

TEST(FrameTrackerTest, IndexBeyondLengthIsArityMismatch) {
    auto tracker = makeTracker();
    auto scope = tracker.open(FrameKind::Sequence, 1);
    ASSERT_TRUE(tracker.element(0).hasValue());
    auto r = tracker.element(1);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::FrameArityMismatch);
}

TEST(FrameTrackerTest, UnderVisitFailsOnCloseWhenStrict) {
    auto tracker = makeTracker();
    auto scope = tracker.open(FrameKind::Sequence, 2);
    ASSERT_TRUE(tracker.element(0).hasValue());
    auto r = tracker.close();
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::FrameArityMismatch);
}

TEST(FrameTrackerTest, UnderVisitAllowedWhenNotStrict) {
    CodecOptions options;
    options.strictArity = false;
    auto tracker = makeTracker(options);
    auto scope = tracker.open(FrameKind::Sequence, 2);
    ASSERT_TRUE(tracker.element(0).hasValue());
    EXPECT_TRUE(tracker.close().hasValue());
}

TEST(FrameTrackerTest, MapRequiresKeyBeforeValue) {
    auto tracker = makeTracker();
    auto scope = tracker.open(FrameKind::Map, 1);

    auto early = tracker.value(0);
    ASSERT_TRUE(early.hasError());
    EXPECT_EQ(early.error().code(), ErrorCode::FrameOrderViolation);

    ASSERT_TRUE(tracker.key(0).hasValue());
    auto twice = tracker.key(0);
    ASSERT_TRUE(twice.hasError());
    EXPECT_EQ(twice.error().code(), ErrorCode::FrameOrderViolation);

    EXPECT_TRUE(tracker.value(0).hasValue());
    EXPECT_TRUE(tracker.close().hasValue());
}

TEST(FrameTrackerTest, DanglingKeyFailsClose) {
    auto tracker = makeTracker();
    auto scope = tracker.open(FrameKind::Map, 1);
    ASSERT_TRUE(tracker.key(0).hasValue());
    auto r = tracker.close();
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::FrameArityMismatch);
}

TEST(FrameTrackerTest, WrongFrameKind) {
    auto tracker = makeTracker();
    auto scope = tracker.open(FrameKind::Sequence, 1);
    auto r = tracker.key(0);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::FrameOrderViolation);
}

TEST(FrameTrackerTest, ElementOutsideAnyFrame) {
    auto tracker = makeTracker();
    auto r = tracker.element(0);
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::FrameOrderViolation);
}

TEST(FrameTrackerTest, ScopePopsFrame) {
    auto tracker = makeTracker();
    {
        auto outer = tracker.open(FrameKind::Sequence, 1);
        ASSERT_TRUE(tracker.element(0).hasValue());
        {
            auto inner = tracker.open(FrameKind::Map, 0);
            EXPECT_EQ(tracker.depth(), 2u);
        }
        EXPECT_EQ(tracker.depth(), 1u);
    }
    EXPECT_EQ(tracker.depth(), 0u);
}

TEST(FrameTrackerTest, DepthLimit) {
    CodecOptions options;
    options.maxDepth = 2;
    auto tracker = makeTracker(options);

    ASSERT_TRUE(tracker.checkDepth().hasValue());
    auto a = tracker.open(FrameKind::Sequence, 1);
    ASSERT_TRUE(tracker.checkDepth().hasValue());
    auto b = tracker.open(FrameKind::Sequence, 1);

    auto r = tracker.checkDepth();
    ASSERT_TRUE(r.hasError());
    EXPECT_EQ(r.error().code(), ErrorCode::DepthLimitExceeded);
}
