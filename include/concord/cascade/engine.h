// CONCORD - Cascading Task Engine
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Drives tasks through the cascade state machine on top of the governance
// store. Transitions are compare-and-set on the stored status and carry an
// idempotency key, so concurrent or repeated attempts are safe.

#ifndef CONCORD_CASCADE_ENGINE_H
#define CONCORD_CASCADE_ENGINE_H

#include <concord/cascade/task.h>
#include <concord/core/status.h>
#include <concord/db/governancedb.h>
#include <concord/util/time.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace concord {
namespace cascade {

/// Default retry budget for new tasks
static constexpr int32_t DEFAULT_MAX_RETRIES = 3;

/// "cascade:<trace>:<task>:<from>-><to>#<retryCount>"
std::string CascadeIdempotencyKey(const std::string& traceId,
                                  const std::string& taskId,
                                  TaskStatus from,
                                  TaskStatus to,
                                  int32_t retryCount);

struct CreateTaskRequest {
    std::string traceId;            ///< generated when empty
    std::string taskId;
    int32_t sequence{1};
    std::string title;
    std::vector<std::string> requiredInput;
    std::vector<std::string> producedOutput;
    std::vector<std::string> validationRules;
    FieldMap input;
    int32_t maxRetries{-1};         ///< negative = engine default
};

struct AdvanceRequest {
    std::string traceId;
    std::string taskId;
    TaskStatus from{TaskStatus::Pending};
    TaskStatus to{TaskStatus::Pending};
    std::string actor;
    std::string reason;
    std::string payload;
    std::string idempotencyKey;     ///< derived from the edge and retry count when empty
    std::string remediation;
};

struct SelfTestResult {
    ValidationResult validation;
    TaskStatus next{TaskStatus::Pending};
    db::TransitionResult transition;
};

class CascadeEngine {
public:
    CascadeEngine(db::GovernanceDB& store, const util::Clock& clock,
                  int32_t defaultMaxRetries = DEFAULT_MAX_RETRIES)
        : store_(store), clock_(clock), defaultMaxRetries_(defaultMaxRetries) {}

    /// INVALID_ARGUMENT on a bad contract, DUPLICATE_ID if the task exists
    Status CreateTask(const CreateTaskRequest& request, CascadeTask* out);

    Status GetTask(const std::string& traceId, const std::string& taskId, CascadeTask* out) const;

    /**
     * Move a task along one edge of the transition table.
     *
     * Edges outside the table are refused with INVALID_ARGUMENT before the
     * store is touched. pending -> running additionally requires the stage
     * gate (CanStart) to be open, else STATE_CONFLICT. A stored status
     * other than `from` is STATE_CONFLICT; a replayed idempotency key
     * returns the original transition with `inserted` false.
     */
    Status Advance(const AdvanceRequest& request, db::TransitionResult* result);

    /// pending -> running
    Status Start(const std::string& traceId, const std::string& taskId,
                 const std::string& actor, db::TransitionResult* result);

    /// Replace the task's input fields (non-terminal tasks only)
    Status SetInput(const std::string& traceId, const std::string& taskId, const FieldMap& input);

    /**
     * Store the produced output, validate the task contract and route the
     * task: validated on success, otherwise pending (retry) or failed once
     * the retry budget is spent. A running task is first moved to
     * self_test.
     */
    Status RunSelfTest(const std::string& traceId, const std::string& taskId,
                       const FieldMap& output, const std::string& actor,
                       SelfTestResult* result);

    /// validated -> committed
    Status Commit(const std::string& traceId, const std::string& taskId,
                  const std::string& actor, db::TransitionResult* result);

    /// committed -> released_next; unlocks the next task in the trace
    Status Release(const std::string& traceId, const std::string& taskId,
                   const std::string& actor, db::TransitionResult* result);

    /// Current status -> failed (where the table allows it)
    Status Fail(const std::string& traceId, const std::string& taskId,
                const std::string& actor, const std::string& reason,
                db::TransitionResult* result);

    /// Evaluate the stage gate against the stored predecessor
    Status CanStart(const std::string& traceId, const std::string& taskId, StartCheck* check) const;

    Status ListTasks(const std::string& traceId, std::vector<CascadeTask>* out) const;

    Status ListTransitions(const std::string& traceId, const std::string& taskId,
                           size_t limit, std::vector<CascadeTransition>* out) const;

private:
    db::GovernanceDB& store_;
    const util::Clock& clock_;
    int32_t defaultMaxRetries_;

    Status FindPredecessor(const CascadeTask& task, CascadeTask* out, bool* found) const;
    Status Step(const std::string& traceId, const std::string& taskId, TaskStatus from, TaskStatus to,
                const std::string& actor, const std::string& reason, db::TransitionResult* result);
};

} // namespace cascade
} // namespace concord

#endif // CONCORD_CASCADE_ENGINE_H
