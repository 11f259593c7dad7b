// CONCORD - Cascading Task Engine Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/cascade/engine.h>
#include <concord/core/random.h>
#include <concord/util/logging.h>

namespace concord {
namespace cascade {

using util::LogCategory::CASCADE;

std::string CascadeIdempotencyKey(const std::string& traceId,
                                  const std::string& taskId,
                                  TaskStatus from,
                                  TaskStatus to,
                                  int32_t retryCount) {
    return "cascade:" + traceId + ":" + taskId + ":" + TaskStatusToString(from) + "->" +
           TaskStatusToString(to) + "#" + std::to_string(retryCount);
}

// ============================================================================
// Tasks
// ============================================================================

Status CascadeEngine::CreateTask(const CreateTaskRequest& request, CascadeTask* out) {
    CascadeTask task;
    task.traceId = request.traceId.empty() ? NewTraceId() : request.traceId;
    task.taskId = request.taskId;
    task.sequence = request.sequence;
    task.title = request.title;
    task.status = TaskStatus::Pending;
    task.requiredInput = request.requiredInput;
    task.producedOutput = request.producedOutput;
    task.validationRules = request.validationRules;
    task.input = request.input;
    task.maxRetries = request.maxRetries < 0 ? defaultMaxRetries_ : request.maxRetries;
    task.createdAt = clock_.Now();
    task.updatedAt = task.createdAt;

    Status s = store_.CreateCascadeTask(task);
    if (!s.ok()) {
        return s;
    }
    LOG_DEBUG(CASCADE) << "Created task " << task.traceId << "/" << task.taskId
                       << " seq=" << task.sequence << " maxRetries=" << task.maxRetries;
    if (out) {
        *out = task;
    }
    return Status::Ok();
}

Status CascadeEngine::GetTask(const std::string& traceId, const std::string& taskId,
                              CascadeTask* out) const {
    return store_.GetCascadeTask(traceId, taskId, out);
}

Status CascadeEngine::SetInput(const std::string& traceId, const std::string& taskId,
                               const FieldMap& input) {
    return store_.UpdateCascadeTaskIO(traceId, taskId, &input, nullptr, clock_.Now());
}

// ============================================================================
// Stage Gate
// ============================================================================

Status CascadeEngine::FindPredecessor(const CascadeTask& task, CascadeTask* out, bool* found) const {
    *found = false;
    if (task.sequence <= 1) {
        return Status::Ok();
    }
    std::vector<CascadeTask> tasks;
    Status s = store_.ListCascadeTasks(task.traceId, &tasks);
    if (!s.ok()) {
        return s;
    }
    for (const auto& candidate : tasks) {
        if (candidate.sequence == task.sequence - 1) {
            *out = candidate;
            *found = true;
            break;
        }
    }
    return Status::Ok();
}

Status CascadeEngine::CanStart(const std::string& traceId, const std::string& taskId,
                               StartCheck* check) const {
    CascadeTask task;
    Status s = store_.GetCascadeTask(traceId, taskId, &task);
    if (!s.ok()) {
        return s;
    }
    CascadeTask predecessor;
    bool found = false;
    s = FindPredecessor(task, &predecessor, &found);
    if (!s.ok()) {
        return s;
    }
    *check = cascade::CanStart(task, found ? &predecessor : nullptr);
    return Status::Ok();
}

// ============================================================================
// Transitions
// ============================================================================

Status CascadeEngine::Advance(const AdvanceRequest& request, db::TransitionResult* result) {
    if (!CanTransition(request.from, request.to)) {
        return Status::InvalidArgument(std::string("transition ") + TaskStatusToString(request.from) +
                                       " -> " + TaskStatusToString(request.to) + " is not allowed");
    }

    CascadeTask task;
    Status s = store_.GetCascadeTask(request.traceId, request.taskId, &task);
    if (!s.ok()) {
        return s;
    }

    db::TransitionRequest tr;
    tr.traceId = request.traceId;
    tr.taskId = request.taskId;
    tr.from = request.from;
    tr.to = request.to;
    tr.actor = request.actor;
    tr.reason = request.reason;
    tr.payload = request.payload;
    tr.remediation = request.remediation;
    tr.at = clock_.Now();
    tr.idempotencyKey = request.idempotencyKey.empty()
        ? CascadeIdempotencyKey(request.traceId, request.taskId, request.from, request.to, task.retryCount)
        : request.idempotencyKey;

    // The gate only applies to a live attempt; replays and stale `from`
    // values are settled by the store
    if (request.to == TaskStatus::Running && task.status == request.from &&
        !store_.HasAppliedTransition(tr.traceId, tr.taskId, tr.idempotencyKey)) {
        CascadeTask predecessor;
        bool found = false;
        s = FindPredecessor(task, &predecessor, &found);
        if (!s.ok()) {
            return s;
        }
        StartCheck gate = cascade::CanStart(task, found ? &predecessor : nullptr);
        if (!gate.allowed) {
            LOG_WARN(CASCADE) << "Start of " << request.taskId << " refused: " << gate.reason;
            return Status::StateConflict("cannot start " + request.taskId + ": " + gate.reason);
        }
    }

    // A retry that spends the last attempt would park the task in pending
    // where CanStart refuses it; the only way out is failed
    if (request.from == TaskStatus::SelfTest && request.to == TaskStatus::Pending &&
        task.status == request.from && task.maxRetries > 0 &&
        task.retryCount + 1 >= task.maxRetries &&
        !store_.HasAppliedTransition(tr.traceId, tr.taskId, tr.idempotencyKey)) {
        LOG_WARN(CASCADE) << "Retry of " << request.taskId << " refused: retry_budget_exhausted";
        return Status::StateConflict("cannot retry " + request.taskId +
                                     ": retry_budget_exhausted; route to failed");
    }

    s = store_.AdvanceCascadeTask(tr, result);
    if (s.IsStateConflict()) {
        LOG_WARN(CASCADE) << "Transition " << TaskStatusToString(request.from) << " -> "
                          << TaskStatusToString(request.to) << " on " << request.taskId
                          << " rejected: " << s.message();
        return s;
    }
    if (!s.ok()) {
        return s;
    }

    if (!result->inserted) {
        LOG_WARN(CASCADE) << "Replay of " << tr.idempotencyKey << " suppressed";
        return Status::Ok();
    }
    if (IsTerminal(request.to)) {
        LOG_INFO(CASCADE) << "Task " << request.traceId << "/" << request.taskId << " "
                          << TaskStatusToString(request.to)
                          << (request.reason.empty() ? "" : " (" + request.reason + ")");
    } else {
        LOG_DEBUG(CASCADE) << "Task " << request.taskId << " " << TaskStatusToString(request.from)
                           << " -> " << TaskStatusToString(request.to);
    }
    return Status::Ok();
}

Status CascadeEngine::Step(const std::string& traceId, const std::string& taskId,
                           TaskStatus from, TaskStatus to,
                           const std::string& actor, const std::string& reason,
                           db::TransitionResult* result) {
    AdvanceRequest request;
    request.traceId = traceId;
    request.taskId = taskId;
    request.from = from;
    request.to = to;
    request.actor = actor;
    request.reason = reason;
    return Advance(request, result);
}

Status CascadeEngine::Start(const std::string& traceId, const std::string& taskId,
                            const std::string& actor, db::TransitionResult* result) {
    return Step(traceId, taskId, TaskStatus::Pending, TaskStatus::Running, actor, "started", result);
}

Status CascadeEngine::Commit(const std::string& traceId, const std::string& taskId,
                             const std::string& actor, db::TransitionResult* result) {
    return Step(traceId, taskId, TaskStatus::Validated, TaskStatus::Committed, actor, "committed", result);
}

Status CascadeEngine::Release(const std::string& traceId, const std::string& taskId,
                              const std::string& actor, db::TransitionResult* result) {
    return Step(traceId, taskId, TaskStatus::Committed, TaskStatus::ReleasedNext, actor,
                "released_next", result);
}

Status CascadeEngine::Fail(const std::string& traceId, const std::string& taskId,
                           const std::string& actor, const std::string& reason,
                           db::TransitionResult* result) {
    CascadeTask task;
    Status s = store_.GetCascadeTask(traceId, taskId, &task);
    if (!s.ok()) {
        return s;
    }
    return Step(traceId, taskId, task.status, TaskStatus::Failed, actor, reason, result);
}

Status CascadeEngine::RunSelfTest(const std::string& traceId, const std::string& taskId,
                                  const FieldMap& output, const std::string& actor,
                                  SelfTestResult* result) {
    CascadeTask task;
    Status s = store_.GetCascadeTask(traceId, taskId, &task);
    if (!s.ok()) {
        return s;
    }

    if (task.status == TaskStatus::Running) {
        db::TransitionResult entered;
        s = Step(traceId, taskId, TaskStatus::Running, TaskStatus::SelfTest, actor, "self_test", &entered);
        if (!s.ok()) {
            return s;
        }
        task = entered.task;
    }
    if (task.status != TaskStatus::SelfTest) {
        return Status::StateConflict("task " + taskId + " is " + TaskStatusToString(task.status) +
                                     ", expected self_test");
    }

    s = store_.UpdateCascadeTaskIO(traceId, taskId, nullptr, &output, clock_.Now());
    if (!s.ok()) {
        return s;
    }
    task.output = output;

    result->validation = ValidateIO(task.Contract(), task.input, task.output);
    result->next = NextStateAfterValidation(task, result->validation);

    AdvanceRequest request;
    request.traceId = traceId;
    request.taskId = taskId;
    request.from = TaskStatus::SelfTest;
    request.to = result->next;
    request.actor = actor;
    request.reason = result->validation.ok ? "validation_passed" : result->validation.FailureReason();
    request.remediation = result->validation.remediation;
    request.payload = result->validation.remediation;

    if (!result->validation.ok) {
        LOG_INFO(CASCADE) << "Self-test of " << taskId << " failed (attempt " << task.retryCount + 1
                          << "): " << result->validation.remediation;
    }
    return Advance(request, &result->transition);
}

// ============================================================================
// Listing
// ============================================================================

Status CascadeEngine::ListTasks(const std::string& traceId, std::vector<CascadeTask>* out) const {
    return store_.ListCascadeTasks(traceId, out);
}

Status CascadeEngine::ListTransitions(const std::string& traceId, const std::string& taskId,
                                      size_t limit, std::vector<CascadeTransition>* out) const {
    return store_.ListCascadeTransitions(traceId, taskId, limit, out);
}

} // namespace cascade
} // namespace concord
