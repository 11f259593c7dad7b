// CONCORD - Cascading Task Protocol
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Stage-gated task state machine. A trace is an ordered chain of tasks;
// task N+1 may only start once task N has committed its output.
//
//   pending -> running -> self_test -> validated -> committed -> released_next
//
// Failure edges: pending/running -> failed, self_test -> pending (retry) or
// failed, validated -> failed. released_next and failed are terminal.

#ifndef CONCORD_CASCADE_TASK_H
#define CONCORD_CASCADE_TASK_H

#include <concord/core/serialize.h>
#include <concord/util/time.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace concord {
namespace cascade {

// ============================================================================
// Task Status
// ============================================================================

enum class TaskStatus {
    Pending = 0,
    Running = 1,
    SelfTest = 2,
    Validated = 3,
    Committed = 4,
    ReleasedNext = 5,
    Failed = 6
};

/// Wire name ("pending", "self_test", "released_next", ...)
const char* TaskStatusToString(TaskStatus status);
std::optional<TaskStatus> ParseTaskStatus(const std::string& str);

inline bool IsTerminal(TaskStatus status) {
    return status == TaskStatus::ReleasedNext || status == TaskStatus::Failed;
}

/// True if `to` is reachable from `from` in one step
bool CanTransition(TaskStatus from, TaskStatus to);

/// All statuses reachable from `from` in one step
std::vector<TaskStatus> AllowedTransitions(TaskStatus from);

// ============================================================================
// Contracts and Validation
// ============================================================================

/// Explicit input/output boundary of one cascade step
struct TaskContract {
    std::string taskId;
    int32_t sequence{0};
    std::vector<std::string> requiredInput;
    std::vector<std::string> producedOutput;
    /// "non_empty:<field>" or "equals:<field>:<value>" checked against output;
    /// anything else fails
    std::vector<std::string> validationRules;

    /// Empty string when valid, otherwise the problem
    std::string Validate() const;
};

struct ValidationResult {
    bool ok{true};
    std::vector<std::string> missingInput;
    std::vector<std::string> missingOutput;
    std::vector<std::string> invalidRules;
    std::string remediation;

    /// "missing_input", "missing_output" or "invalid_rules" (first failing
    /// category in that order); empty when ok
    std::string FailureReason() const;
};

using FieldMap = std::map<std::string, std::string>;

/// Check required input, produced output and rules against the contract
ValidationResult ValidateIO(const TaskContract& contract,
                            const FieldMap& input,
                            const FieldMap& output);

// ============================================================================
// Records
// ============================================================================

struct CascadeTask {
    std::string traceId;
    std::string taskId;
    int32_t sequence{0};
    std::string title;
    TaskStatus status{TaskStatus::Pending};
    std::vector<std::string> requiredInput;
    std::vector<std::string> producedOutput;
    std::vector<std::string> validationRules;
    FieldMap input;
    FieldMap output;
    int32_t retryCount{0};
    int32_t maxRetries{0};          ///< 0 means unlimited
    std::string lastError;
    std::string remediation;
    util::TimePoint createdAt;
    util::TimePoint updatedAt;
    util::TimePoint committedAt;

    TaskContract Contract() const {
        return TaskContract{taskId, sequence, requiredInput, producedOutput, validationRules};
    }

    bool RetryBudgetExhausted() const {
        return maxRetries > 0 && retryCount >= maxRetries;
    }
};

struct CascadeTransition {
    std::string traceId;
    std::string taskId;
    uint64_t seq{0};                ///< per-task ordinal, starting at 1
    TaskStatus from{TaskStatus::Pending};
    TaskStatus to{TaskStatus::Pending};
    std::string actor;
    std::string reason;
    std::string payload;
    std::string idempotencyKey;
    util::TimePoint createdAt;
};

// ============================================================================
// Stage Gate
// ============================================================================

struct StartCheck {
    bool allowed{false};
    /// task_not_pending, retry_budget_exhausted, predecessor_not_found,
    /// predecessor_not_committed; empty when allowed
    std::string reason;
};

/**
 * Decide whether `task` may move pending -> running.
 * @param predecessor Task with sequence - 1 in the same trace, or nullptr
 */
StartCheck CanStart(const CascadeTask& task, const CascadeTask* predecessor);

/// validated on success; failed once the retry budget would be exhausted;
/// otherwise pending (another attempt)
TaskStatus NextStateAfterValidation(const CascadeTask& task, const ValidationResult& result);

// ============================================================================
// Serialization
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const CascadeTask& t) {
    Serialize(s, t.traceId);
    Serialize(s, t.taskId);
    Serialize(s, t.sequence);
    Serialize(s, t.title);
    Serialize(s, static_cast<uint32_t>(t.status));
    Serialize(s, t.requiredInput);
    Serialize(s, t.producedOutput);
    Serialize(s, t.validationRules);
    Serialize(s, t.input);
    Serialize(s, t.output);
    Serialize(s, t.retryCount);
    Serialize(s, t.maxRetries);
    Serialize(s, t.lastError);
    Serialize(s, t.remediation);
    Serialize(s, util::ToUnixMillis(t.createdAt));
    Serialize(s, util::ToUnixMillis(t.updatedAt));
    Serialize(s, util::ToUnixMillis(t.committedAt));
}

template<typename Stream>
TaskStatus UnserializeTaskStatus(Stream& s) {
    uint32_t raw = 0;
    Unserialize(s, raw);
    if (raw > static_cast<uint32_t>(TaskStatus::Failed)) {
        throw std::ios_base::failure("task status out of range");
    }
    return static_cast<TaskStatus>(raw);
}

template<typename Stream>
util::TimePoint UnserializeTimePoint(Stream& s) {
    int64_t ms = 0;
    Unserialize(s, ms);
    return util::FromUnixMillis(ms);
}

template<typename Stream>
void Unserialize(Stream& s, CascadeTask& t) {
    Unserialize(s, t.traceId);
    Unserialize(s, t.taskId);
    Unserialize(s, t.sequence);
    Unserialize(s, t.title);
    t.status = UnserializeTaskStatus(s);
    Unserialize(s, t.requiredInput);
    Unserialize(s, t.producedOutput);
    Unserialize(s, t.validationRules);
    Unserialize(s, t.input);
    Unserialize(s, t.output);
    Unserialize(s, t.retryCount);
    Unserialize(s, t.maxRetries);
    Unserialize(s, t.lastError);
    Unserialize(s, t.remediation);
    t.createdAt = UnserializeTimePoint(s);
    t.updatedAt = UnserializeTimePoint(s);
    t.committedAt = UnserializeTimePoint(s);
}

template<typename Stream>
void Serialize(Stream& s, const CascadeTransition& tr) {
    Serialize(s, tr.traceId);
    Serialize(s, tr.taskId);
    Serialize(s, tr.seq);
    Serialize(s, static_cast<uint32_t>(tr.from));
    Serialize(s, static_cast<uint32_t>(tr.to));
    Serialize(s, tr.actor);
    Serialize(s, tr.reason);
    Serialize(s, tr.payload);
    Serialize(s, tr.idempotencyKey);
    Serialize(s, util::ToUnixMillis(tr.createdAt));
}

template<typename Stream>
void Unserialize(Stream& s, CascadeTransition& tr) {
    Unserialize(s, tr.traceId);
    Unserialize(s, tr.taskId);
    Unserialize(s, tr.seq);
    tr.from = UnserializeTaskStatus(s);
    tr.to = UnserializeTaskStatus(s);
    Unserialize(s, tr.actor);
    Unserialize(s, tr.reason);
    Unserialize(s, tr.payload);
    Unserialize(s, tr.idempotencyKey);
    tr.createdAt = UnserializeTimePoint(s);
}

} // namespace cascade
} // namespace concord

#endif // CONCORD_CASCADE_TASK_H
