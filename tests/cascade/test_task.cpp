// CONCORD - Cascade Task Protocol Tests
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <gtest/gtest.h>
#include <concord/cascade/task.h>

using namespace concord;
using namespace concord::cascade;

// ============================================================================
// Transition Table
// ============================================================================

TEST(TaskStatusTest, NamesRoundTrip) {
    for (int i = 0; i <= static_cast<int>(TaskStatus::Failed); ++i) {
        TaskStatus status = static_cast<TaskStatus>(i);
        auto parsed = ParseTaskStatus(TaskStatusToString(status));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, status);
    }
    EXPECT_STREQ(TaskStatusToString(TaskStatus::SelfTest), "self_test");
    EXPECT_FALSE(ParseTaskStatus("done").has_value());
}

TEST(TaskStatusTest, HappyPathEdges) {
    EXPECT_TRUE(CanTransition(TaskStatus::Pending, TaskStatus::Running));
    EXPECT_TRUE(CanTransition(TaskStatus::Running, TaskStatus::SelfTest));
    EXPECT_TRUE(CanTransition(TaskStatus::SelfTest, TaskStatus::Validated));
    EXPECT_TRUE(CanTransition(TaskStatus::Validated, TaskStatus::Committed));
    EXPECT_TRUE(CanTransition(TaskStatus::Committed, TaskStatus::ReleasedNext));
}

TEST(TaskStatusTest, FailureEdges) {
    EXPECT_TRUE(CanTransition(TaskStatus::Pending, TaskStatus::Failed));
    EXPECT_TRUE(CanTransition(TaskStatus::Running, TaskStatus::Failed));
    EXPECT_TRUE(CanTransition(TaskStatus::SelfTest, TaskStatus::Pending));
    EXPECT_TRUE(CanTransition(TaskStatus::SelfTest, TaskStatus::Failed));
    EXPECT_TRUE(CanTransition(TaskStatus::Validated, TaskStatus::Failed));
    EXPECT_FALSE(CanTransition(TaskStatus::Committed, TaskStatus::Failed));
}

TEST(TaskStatusTest, NoShortcutsOrExits) {
    EXPECT_FALSE(CanTransition(TaskStatus::Pending, TaskStatus::Committed));
    EXPECT_FALSE(CanTransition(TaskStatus::Running, TaskStatus::Validated));
    EXPECT_FALSE(CanTransition(TaskStatus::Running, TaskStatus::Running));
    EXPECT_TRUE(AllowedTransitions(TaskStatus::ReleasedNext).empty());
    EXPECT_TRUE(AllowedTransitions(TaskStatus::Failed).empty());
    EXPECT_TRUE(IsTerminal(TaskStatus::Failed));
    EXPECT_TRUE(IsTerminal(TaskStatus::ReleasedNext));
    EXPECT_FALSE(IsTerminal(TaskStatus::Committed));
}

// ============================================================================
// Contracts and Validation
// ============================================================================

TEST(TaskContractTest, Validate) {
    TaskContract contract{"build", 1, {"brief"}, {"artifact"}, {}};
    EXPECT_TRUE(contract.Validate().empty());

    TaskContract noId = contract;
    noId.taskId = "  ";
    EXPECT_FALSE(noId.Validate().empty());

    TaskContract badSeq = contract;
    badSeq.sequence = 0;
    EXPECT_FALSE(badSeq.Validate().empty());

    TaskContract emptyKey = contract;
    emptyKey.producedOutput = {"artifact", " "};
    EXPECT_FALSE(emptyKey.Validate().empty());
}

TEST(ValidateIOTest, AllPresent) {
    TaskContract contract{"build", 1, {"brief"}, {"artifact"}, {"non_empty:artifact"}};
    ValidationResult r = ValidateIO(contract, {{"brief", "v1"}}, {{"artifact", "bin"}});
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(r.remediation.empty());
    EXPECT_TRUE(r.FailureReason().empty());
}

TEST(ValidateIOTest, MissingFieldsReported) {
    TaskContract contract{"build", 1, {"brief", "owner"}, {"artifact"}, {}};
    ValidationResult r = ValidateIO(contract, {{"brief", "v1"}, {"owner", "  "}}, {});
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.missingInput, std::vector<std::string>{"owner"});
    EXPECT_EQ(r.missingOutput, std::vector<std::string>{"artifact"});
    EXPECT_EQ(r.FailureReason(), "missing_input");
    EXPECT_EQ(r.remediation, "missing_input=owner; missing_output=artifact");
}

TEST(ValidateIOTest, RulesCheckOutputOnly) {
    TaskContract contract{"build", 1, {}, {}, {"non_empty:artifact", "equals:status:ok"}};

    // Input values do not satisfy output rules
    ValidationResult fromInput = ValidateIO(contract, {{"artifact", "x"}, {"status", "ok"}}, {});
    EXPECT_FALSE(fromInput.ok);
    EXPECT_EQ(fromInput.invalidRules.size(), 2u);
    EXPECT_EQ(fromInput.FailureReason(), "invalid_rules");

    ValidationResult fromOutput = ValidateIO(contract, {}, {{"artifact", "x"}, {"status", " ok "}});
    EXPECT_TRUE(fromOutput.ok);
}

TEST(ValidateIOTest, UnknownRuleFails) {
    TaskContract contract{"build", 1, {}, {}, {"matches:artifact:.*", "non_empty", "equals:status"}};
    ValidationResult r = ValidateIO(contract, {}, {{"artifact", "x"}, {"status", "ok"}});
    EXPECT_FALSE(r.ok);
    EXPECT_EQ(r.invalidRules.size(), 3u);
}

// ============================================================================
// Stage Gate
// ============================================================================

namespace {

CascadeTask Task(int32_t sequence, TaskStatus status = TaskStatus::Pending) {
    CascadeTask t;
    t.traceId = "tr-1";
    t.taskId = "t" + std::to_string(sequence);
    t.sequence = sequence;
    t.status = status;
    t.maxRetries = 3;
    return t;
}

} // namespace

TEST(CanStartTest, FirstTaskNeedsNoPredecessor) {
    StartCheck check = CanStart(Task(1), nullptr);
    EXPECT_TRUE(check.allowed);
    EXPECT_TRUE(check.reason.empty());
}

TEST(CanStartTest, RefusalReasons) {
    EXPECT_EQ(CanStart(Task(1, TaskStatus::Running), nullptr).reason, "task_not_pending");

    CascadeTask exhausted = Task(1);
    exhausted.retryCount = 3;
    EXPECT_EQ(CanStart(exhausted, nullptr).reason, "retry_budget_exhausted");

    EXPECT_EQ(CanStart(Task(2), nullptr).reason, "predecessor_not_found");

    CascadeTask validated = Task(1, TaskStatus::Validated);
    EXPECT_EQ(CanStart(Task(2), &validated).reason, "predecessor_not_committed");
}

TEST(CanStartTest, CommittedOrReleasedPredecessorOpensGate) {
    CascadeTask committed = Task(1, TaskStatus::Committed);
    EXPECT_TRUE(CanStart(Task(2), &committed).allowed);

    CascadeTask released = Task(1, TaskStatus::ReleasedNext);
    EXPECT_TRUE(CanStart(Task(2), &released).allowed);
}

TEST(CanStartTest, UnlimitedRetries) {
    CascadeTask t = Task(1);
    t.maxRetries = 0;
    t.retryCount = 100;
    EXPECT_TRUE(CanStart(t, nullptr).allowed);
}

TEST(NextStateTest, RoutesOnValidation) {
    ValidationResult pass;
    ValidationResult fail;
    fail.ok = false;

    CascadeTask t = Task(1, TaskStatus::SelfTest);
    EXPECT_EQ(NextStateAfterValidation(t, pass), TaskStatus::Validated);
    EXPECT_EQ(NextStateAfterValidation(t, fail), TaskStatus::Pending);

    t.retryCount = 2;
    EXPECT_EQ(NextStateAfterValidation(t, fail), TaskStatus::Failed);
    EXPECT_EQ(NextStateAfterValidation(t, pass), TaskStatus::Validated);

    t.maxRetries = 0;
    EXPECT_EQ(NextStateAfterValidation(t, fail), TaskStatus::Pending);
}
