// CONCORD - Cascade Engine Tests
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <gtest/gtest.h>
#include <concord/cascade/engine.h>
#include <concord/db/memorydb.h>

using namespace concord;
using namespace concord::cascade;

// ============================================================================
// Test Fixture
// ============================================================================

class CascadeEngineTest : public ::testing::Test {
protected:
    db::GovernanceDB store_{std::make_unique<db::MemoryDatabase>()};
    util::ManualClock clock_;
    CascadeEngine engine_{store_, clock_};

    CascadeTask Create(const std::string& taskId, int32_t sequence, int32_t maxRetries = -1) {
        CreateTaskRequest request;
        request.traceId = "tr-1";
        request.taskId = taskId;
        request.sequence = sequence;
        request.requiredInput = {"brief"};
        request.producedOutput = {"artifact"};
        request.validationRules = {"non_empty:artifact"};
        request.input = {{"brief", "v1"}};
        request.maxRetries = maxRetries;
        CascadeTask task;
        EXPECT_TRUE(engine_.CreateTask(request, &task).ok());
        return task;
    }

    /// pending -> running -> self_test -> validated
    void DriveToValidated(const std::string& taskId) {
        db::TransitionResult r;
        ASSERT_TRUE(engine_.Start("tr-1", taskId, "claw-a", &r).ok());
        clock_.Advance(util::Milliseconds(1));
        SelfTestResult st;
        ASSERT_TRUE(engine_.RunSelfTest("tr-1", taskId, {{"artifact", "bin"}}, "claw-a", &st).ok());
        ASSERT_EQ(st.next, TaskStatus::Validated);
        clock_.Advance(util::Milliseconds(1));
    }

    AdvanceRequest Edge(const std::string& taskId, TaskStatus from, TaskStatus to) {
        AdvanceRequest request;
        request.traceId = "tr-1";
        request.taskId = taskId;
        request.from = from;
        request.to = to;
        request.actor = "claw-a";
        return request;
    }
};

// ============================================================================
// Creation
// ============================================================================

TEST_F(CascadeEngineTest, CreateAppliesDefaults) {
    CascadeTask task = Create("build", 1);
    EXPECT_EQ(task.status, TaskStatus::Pending);
    EXPECT_EQ(task.maxRetries, DEFAULT_MAX_RETRIES);
    EXPECT_EQ(task.createdAt, clock_.Now());

    CreateTaskRequest noTrace;
    noTrace.taskId = "x";
    CascadeTask generated;
    ASSERT_TRUE(engine_.CreateTask(noTrace, &generated).ok());
    EXPECT_EQ(generated.traceId.rfind("tr-", 0), 0u);
}

TEST_F(CascadeEngineTest, CreateRejectsBadContract) {
    CreateTaskRequest request;
    request.traceId = "tr-1";
    request.taskId = "build";
    request.sequence = 0;
    EXPECT_TRUE(engine_.CreateTask(request, nullptr).IsInvalidArgument());

    Create("build", 1);
    request.sequence = 1;
    EXPECT_TRUE(engine_.CreateTask(request, nullptr).IsDuplicateId());
}

TEST_F(CascadeEngineTest, IdempotencyKeyFormat) {
    EXPECT_EQ(CascadeIdempotencyKey("tr-1", "build", TaskStatus::SelfTest, TaskStatus::Pending, 2),
              "cascade:tr-1:build:self_test->pending#2");
}

// ============================================================================
// Compare-and-set
// ============================================================================

TEST_F(CascadeEngineTest, StaleFromIsConflictThenCommitSucceeds) {
    Create("build", 1);
    DriveToValidated("build");

    db::TransitionResult r;
    Status stale = engine_.Advance(Edge("build", TaskStatus::Running, TaskStatus::Failed), &r);
    EXPECT_TRUE(stale.IsStateConflict());

    CascadeTask task;
    engine_.GetTask("tr-1", "build", &task);
    EXPECT_EQ(task.status, TaskStatus::Validated);

    ASSERT_TRUE(engine_.Commit("tr-1", "build", "claw-a", &r).ok());
    EXPECT_EQ(r.task.status, TaskStatus::Committed);
    EXPECT_EQ(r.task.committedAt, clock_.Now());
}

TEST_F(CascadeEngineTest, EdgeOutsideTableRefused) {
    Create("build", 1);
    db::TransitionResult r;
    EXPECT_TRUE(engine_.Advance(Edge("build", TaskStatus::Pending, TaskStatus::Committed), &r)
                    .IsInvalidArgument());

    std::vector<CascadeTransition> transitions;
    engine_.ListTransitions("tr-1", "build", 0, &transitions);
    EXPECT_TRUE(transitions.empty());
}

TEST_F(CascadeEngineTest, ReplayReturnsOriginalTransition) {
    Create("build", 1);
    AdvanceRequest request = Edge("build", TaskStatus::Pending, TaskStatus::Running);
    request.idempotencyKey = "start-1";

    db::TransitionResult first;
    ASSERT_TRUE(engine_.Advance(request, &first).ok());
    EXPECT_TRUE(first.inserted);

    clock_.Advance(util::Seconds(5));
    db::TransitionResult replay;
    ASSERT_TRUE(engine_.Advance(request, &replay).ok());
    EXPECT_FALSE(replay.inserted);
    EXPECT_EQ(replay.transition.seq, first.transition.seq);
    EXPECT_EQ(replay.transition.createdAt, first.transition.createdAt);
    EXPECT_EQ(replay.task.status, TaskStatus::Running);
}

TEST_F(CascadeEngineTest, DerivedKeysMakeStepsIdempotent) {
    Create("build", 1);
    db::TransitionResult r;
    ASSERT_TRUE(engine_.Start("tr-1", "build", "claw-a", &r).ok());
    ASSERT_TRUE(engine_.Start("tr-1", "build", "claw-a", &r).ok());
    EXPECT_FALSE(r.inserted);

    std::vector<CascadeTransition> transitions;
    engine_.ListTransitions("tr-1", "build", 0, &transitions);
    EXPECT_EQ(transitions.size(), 1u);
}

// ============================================================================
// Self-test and Retry Budget
// ============================================================================

TEST_F(CascadeEngineTest, FailedSelfTestReturnsToPending) {
    Create("build", 1);
    db::TransitionResult r;
    engine_.Start("tr-1", "build", "claw-a", &r);

    SelfTestResult st;
    ASSERT_TRUE(engine_.RunSelfTest("tr-1", "build", {}, "claw-a", &st).ok());
    EXPECT_FALSE(st.validation.ok);
    EXPECT_EQ(st.next, TaskStatus::Pending);
    EXPECT_EQ(st.transition.task.retryCount, 1);
    EXPECT_EQ(st.transition.task.lastError, "missing_output");
    EXPECT_EQ(st.transition.task.remediation, st.validation.remediation);
    EXPECT_FALSE(st.transition.task.remediation.empty());
}

TEST_F(CascadeEngineTest, RetryBudgetEndsInFailed) {
    Create("build", 1, 3);
    db::TransitionResult r;
    SelfTestResult st;

    for (int attempt = 1; attempt <= 2; ++attempt) {
        ASSERT_TRUE(engine_.Start("tr-1", "build", "claw-a", &r).ok()) << attempt;
        ASSERT_TRUE(r.inserted);
        ASSERT_TRUE(engine_.RunSelfTest("tr-1", "build", {}, "claw-a", &st).ok());
        EXPECT_EQ(st.next, TaskStatus::Pending);
        EXPECT_EQ(st.transition.task.retryCount, attempt);
        clock_.Advance(util::Milliseconds(1));
    }

    ASSERT_TRUE(engine_.Start("tr-1", "build", "claw-a", &r).ok());
    ASSERT_TRUE(engine_.RunSelfTest("tr-1", "build", {}, "claw-a", &st).ok());
    EXPECT_EQ(st.next, TaskStatus::Failed);
    EXPECT_EQ(st.transition.task.status, TaskStatus::Failed);
    EXPECT_EQ(st.transition.task.retryCount, 3);

    EXPECT_FALSE(engine_.Start("tr-1", "build", "claw-a", &r).ok());
}

TEST_F(CascadeEngineTest, ManualRetryCannotSpendLastAttempt) {
    Create("build", 1, 2);
    db::TransitionResult r;

    // First retry leaves one attempt
    ASSERT_TRUE(engine_.Start("tr-1", "build", "claw-a", &r).ok());
    ASSERT_TRUE(engine_.Advance(Edge("build", TaskStatus::Running, TaskStatus::SelfTest), &r).ok());
    ASSERT_TRUE(engine_.Advance(Edge("build", TaskStatus::SelfTest, TaskStatus::Pending), &r).ok());
    EXPECT_EQ(r.task.retryCount, 1);
    clock_.Advance(util::Milliseconds(1));

    ASSERT_TRUE(engine_.Start("tr-1", "build", "claw-a", &r).ok());
    ASSERT_TRUE(engine_.Advance(Edge("build", TaskStatus::Running, TaskStatus::SelfTest), &r).ok());
    EXPECT_TRUE(engine_.Advance(Edge("build", TaskStatus::SelfTest, TaskStatus::Pending), &r)
                    .IsStateConflict());

    CascadeTask task;
    ASSERT_TRUE(engine_.GetTask("tr-1", "build", &task).ok());
    EXPECT_EQ(task.status, TaskStatus::SelfTest);
    EXPECT_EQ(task.retryCount, 1);

    ASSERT_TRUE(engine_.Advance(Edge("build", TaskStatus::SelfTest, TaskStatus::Failed), &r).ok());
    EXPECT_EQ(r.task.status, TaskStatus::Failed);
}

TEST_F(CascadeEngineTest, SelfTestRequiresActiveAttempt) {
    Create("build", 1);
    SelfTestResult st;
    EXPECT_TRUE(engine_.RunSelfTest("tr-1", "build", {{"artifact", "x"}}, "claw-a", &st)
                    .IsStateConflict());
}

TEST_F(CascadeEngineTest, FailFromCurrentState) {
    Create("build", 1);
    DriveToValidated("build");

    db::TransitionResult r;
    ASSERT_TRUE(engine_.Fail("tr-1", "build", "claw-a", "review rejected", &r).ok());
    EXPECT_EQ(r.task.status, TaskStatus::Failed);
    EXPECT_EQ(r.task.lastError, "review rejected");

    // Terminal tasks accept no further edges
    EXPECT_TRUE(engine_.Fail("tr-1", "build", "claw-a", "again", &r).IsInvalidArgument());
    EXPECT_TRUE(engine_.SetInput("tr-1", "build", {{"brief", "v2"}}).IsStateConflict());
}

// ============================================================================
// Stage Gate
// ============================================================================

TEST_F(CascadeEngineTest, NextTaskWaitsForCommit) {
    Create("design", 1);
    Create("build", 2);

    StartCheck check;
    ASSERT_TRUE(engine_.CanStart("tr-1", "build", &check).ok());
    EXPECT_FALSE(check.allowed);
    EXPECT_EQ(check.reason, "predecessor_not_committed");

    db::TransitionResult r;
    EXPECT_TRUE(engine_.Start("tr-1", "build", "claw-b", &r).IsStateConflict());

    DriveToValidated("design");
    EXPECT_TRUE(engine_.Start("tr-1", "build", "claw-b", &r).IsStateConflict());

    ASSERT_TRUE(engine_.Commit("tr-1", "design", "claw-a", &r).ok());
    ASSERT_TRUE(engine_.Start("tr-1", "build", "claw-b", &r).ok());
    EXPECT_EQ(r.task.status, TaskStatus::Running);

    ASSERT_TRUE(engine_.Release("tr-1", "design", "claw-a", &r).ok());
    EXPECT_EQ(r.task.status, TaskStatus::ReleasedNext);
}

TEST_F(CascadeEngineTest, SecondTaskAtSameStageRefused) {
    Create("design-a", 1);

    CreateTaskRequest request;
    request.traceId = "tr-1";
    request.taskId = "design-b";
    request.sequence = 1;
    EXPECT_TRUE(engine_.CreateTask(request, nullptr).IsDuplicateId());

    // Stage 2 stays gated on the only stage-1 task
    Create("build", 2);
    db::TransitionResult r;
    EXPECT_TRUE(engine_.Start("tr-1", "build", "claw-b", &r).IsStateConflict());
    DriveToValidated("design-a");
    ASSERT_TRUE(engine_.Commit("tr-1", "design-a", "claw-a", &r).ok());
    EXPECT_TRUE(engine_.Start("tr-1", "build", "claw-b", &r).ok());
}

TEST_F(CascadeEngineTest, MissingPredecessorBlocksStart) {
    Create("build", 2);
    StartCheck check;
    ASSERT_TRUE(engine_.CanStart("tr-1", "build", &check).ok());
    EXPECT_EQ(check.reason, "predecessor_not_found");
}

TEST_F(CascadeEngineTest, ListingOrder) {
    Create("build", 2);
    Create("design", 1);

    std::vector<CascadeTask> tasks;
    ASSERT_TRUE(engine_.ListTasks("tr-1", &tasks).ok());
    ASSERT_EQ(tasks.size(), 2u);
    EXPECT_EQ(tasks[0].taskId, "design");

    DriveToValidated("design");
    std::vector<CascadeTransition> transitions;
    ASSERT_TRUE(engine_.ListTransitions("tr-1", "", 0, &transitions).ok());
    ASSERT_EQ(transitions.size(), 3u);
    EXPECT_EQ(transitions[0].to, TaskStatus::Running);
    EXPECT_EQ(transitions[2].to, TaskStatus::Validated);
    EXPECT_EQ(transitions[2].reason, "validation_passed");
}

TEST_F(CascadeEngineTest, UnknownTaskNotFound) {
    db::TransitionResult r;
    EXPECT_TRUE(engine_.Start("tr-1", "ghost", "claw-a", &r).IsNotFound());
}
