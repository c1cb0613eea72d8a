#include <gtest/gtest.h>
#include "judge/submission_lifecycle.hpp"

using namespace std;
using namespace bridge;

class SubmissionLifecycleTest : public ::testing::Test {
protected:
    void start_grading(const string &id) {
        ASSERT_TRUE(lifecycle.begin(id));
        ASSERT_EQ(lifecycle.apply(lifecycle_event::ACKNOWLEDGED, id), transition::APPLIED);
        ASSERT_EQ(lifecycle.apply(lifecycle_event::GRADING_BEGIN, id), transition::APPLIED);
    }

    submission_lifecycle lifecycle;
};

TEST_F(SubmissionLifecycleTest, StartsIdle) {
    EXPECT_EQ(lifecycle.state(), lifecycle_state::IDLE);
    EXPECT_FALSE(lifecycle.current());
    EXPECT_FALSE(lifecycle.batch());
}

TEST_F(SubmissionLifecycleTest, BeginOnlyWhenIdle) {
    EXPECT_TRUE(lifecycle.begin("42"));
    EXPECT_EQ(lifecycle.state(), lifecycle_state::REQUESTED);
    EXPECT_EQ(lifecycle.current(), "42");

    EXPECT_FALSE(lifecycle.begin("43"));
    EXPECT_EQ(lifecycle.current(), "42");
}

TEST_F(SubmissionLifecycleTest, GradingEndReturnsToIdle) {
    start_grading("42");
    EXPECT_EQ(lifecycle.apply(lifecycle_event::BATCH_BEGIN, "42"), transition::APPLIED);
    EXPECT_EQ(lifecycle.batch(), 1);
    EXPECT_EQ(lifecycle.apply(lifecycle_event::TEST_CASE, "42"), transition::APPLIED);
    EXPECT_EQ(lifecycle.apply(lifecycle_event::BATCH_END, "42"), transition::APPLIED);
    EXPECT_FALSE(lifecycle.batch());
    EXPECT_EQ(lifecycle.apply(lifecycle_event::GRADING_END, "42"), transition::FINISHED);

    EXPECT_EQ(lifecycle.state(), lifecycle_state::IDLE);
    EXPECT_FALSE(lifecycle.current());
}

TEST_F(SubmissionLifecycleTest, BatchNumbersIncrease) {
    start_grading("42");
    for (int i = 1; i <= 3; ++i) {
        EXPECT_EQ(lifecycle.apply(lifecycle_event::BATCH_BEGIN, "42"), transition::APPLIED);
        EXPECT_EQ(lifecycle.batch(), i);
        EXPECT_EQ(lifecycle.apply(lifecycle_event::BATCH_END, "42"), transition::APPLIED);
    }

    // 重新开始评测时测试点组编号重新计数
    EXPECT_EQ(lifecycle.apply(lifecycle_event::GRADING_BEGIN, "42"), transition::APPLIED);
    EXPECT_EQ(lifecycle.apply(lifecycle_event::BATCH_BEGIN, "42"), transition::APPLIED);
    EXPECT_EQ(lifecycle.batch(), 1);
}

TEST_F(SubmissionLifecycleTest, EventsWhileIdleAreRejected) {
    EXPECT_EQ(lifecycle.apply(lifecycle_event::ACKNOWLEDGED, "42"), transition::NO_SUBMISSION);
    EXPECT_EQ(lifecycle.apply(lifecycle_event::GRADING_END, "42"), transition::NO_SUBMISSION);
    EXPECT_EQ(lifecycle.state(), lifecycle_state::IDLE);
}

TEST_F(SubmissionLifecycleTest, MismatchedIdIsRejected) {
    ASSERT_TRUE(lifecycle.begin("42"));
    EXPECT_EQ(lifecycle.apply(lifecycle_event::ACKNOWLEDGED, "43"), transition::ID_MISMATCH);
    EXPECT_EQ(lifecycle.state(), lifecycle_state::REQUESTED);
    EXPECT_EQ(lifecycle.apply(lifecycle_event::INTERNAL_ERROR, "43"), transition::ID_MISMATCH);
    EXPECT_EQ(lifecycle.current(), "42");
}

TEST_F(SubmissionLifecycleTest, OutOfOrderEventsAreRejected) {
    ASSERT_TRUE(lifecycle.begin("42"));
    EXPECT_EQ(lifecycle.apply(lifecycle_event::GRADING_BEGIN, "42"), transition::INVALID_STATE);
    EXPECT_EQ(lifecycle.apply(lifecycle_event::TEST_CASE, "42"), transition::INVALID_STATE);
    EXPECT_EQ(lifecycle.apply(lifecycle_event::GRADING_END, "42"), transition::INVALID_STATE);
    EXPECT_EQ(lifecycle.state(), lifecycle_state::REQUESTED);

    ASSERT_EQ(lifecycle.apply(lifecycle_event::ACKNOWLEDGED, "42"), transition::APPLIED);
    EXPECT_EQ(lifecycle.apply(lifecycle_event::ACKNOWLEDGED, "42"), transition::INVALID_STATE);
    EXPECT_EQ(lifecycle.apply(lifecycle_event::BATCH_BEGIN, "42"), transition::INVALID_STATE);

    ASSERT_EQ(lifecycle.apply(lifecycle_event::GRADING_BEGIN, "42"), transition::APPLIED);
    EXPECT_EQ(lifecycle.apply(lifecycle_event::BATCH_END, "42"), transition::INVALID_STATE);
}

TEST_F(SubmissionLifecycleTest, CompileErrorFinishesBeforeGrading) {
    ASSERT_TRUE(lifecycle.begin("42"));
    EXPECT_EQ(lifecycle.apply(lifecycle_event::COMPILE_MESSAGE, "42"), transition::APPLIED);
    EXPECT_EQ(lifecycle.apply(lifecycle_event::COMPILE_ERROR, "42"), transition::FINISHED);
    EXPECT_EQ(lifecycle.state(), lifecycle_state::IDLE);
}

TEST_F(SubmissionLifecycleTest, TerminationFinishesFromAnyState) {
    ASSERT_TRUE(lifecycle.begin("42"));
    EXPECT_EQ(lifecycle.apply(lifecycle_event::TERMINATED, "42"), transition::FINISHED);

    start_grading("43");
    EXPECT_EQ(lifecycle.apply(lifecycle_event::BATCH_BEGIN, "43"), transition::APPLIED);
    EXPECT_EQ(lifecycle.apply(lifecycle_event::INTERNAL_ERROR, "43"), transition::FINISHED);
    EXPECT_FALSE(lifecycle.batch());
    EXPECT_TRUE(lifecycle.begin("44"));
}

TEST_F(SubmissionLifecycleTest, ResetReturnsLostSubmission) {
    EXPECT_FALSE(lifecycle.reset());

    start_grading("42");
    EXPECT_EQ(lifecycle.reset(), "42");
    EXPECT_EQ(lifecycle.state(), lifecycle_state::IDLE);
    EXPECT_FALSE(lifecycle.reset());
}

TEST_F(SubmissionLifecycleTest, NamesForLogging) {
    EXPECT_STREQ(state_name(lifecycle_state::GRADING), "grading");
    EXPECT_STREQ(event_name(lifecycle_event::BATCH_BEGIN), "batch-begin");
    EXPECT_STREQ(transition_name(transition::ID_MISMATCH), "submission id mismatch");
}
