// CONCORD - Cascading Task Protocol Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/cascade/task.h>

#include <sstream>

namespace concord {
namespace cascade {

namespace {

std::string Trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

std::string FieldValue(const FieldMap& fields, const std::string& key) {
    auto it = fields.find(key);
    return it == fields.end() ? std::string() : Trim(it->second);
}

/// Rules are evaluated against produced output only
bool RulePasses(const std::string& rawRule, const FieldMap& output) {
    std::string rule = Trim(rawRule);
    if (rule.empty()) return true;

    size_t colon = rule.find(':');
    if (colon == std::string::npos) return false;
    std::string kind = Trim(rule.substr(0, colon));
    std::string rest = rule.substr(colon + 1);

    if (kind == "non_empty") {
        std::string field = Trim(rest);
        return !field.empty() && !FieldValue(output, field).empty();
    }
    if (kind == "equals") {
        size_t sep = rest.find(':');
        if (sep == std::string::npos) return false;
        std::string field = Trim(rest.substr(0, sep));
        std::string expected = Trim(rest.substr(sep + 1));
        return !field.empty() && FieldValue(output, field) == expected;
    }
    return false;
}

std::string JoinNames(const std::vector<std::string>& names) {
    std::string out;
    for (size_t i = 0; i < names.size(); ++i) {
        if (i > 0) out += ",";
        out += names[i];
    }
    return out;
}

} // namespace

// ============================================================================
// Task Status
// ============================================================================

const char* TaskStatusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::Running: return "running";
        case TaskStatus::SelfTest: return "self_test";
        case TaskStatus::Validated: return "validated";
        case TaskStatus::Committed: return "committed";
        case TaskStatus::ReleasedNext: return "released_next";
        case TaskStatus::Failed: return "failed";
    }
    return "unknown";
}

std::optional<TaskStatus> ParseTaskStatus(const std::string& str) {
    std::string s = Trim(str);
    if (s == "pending") return TaskStatus::Pending;
    if (s == "running") return TaskStatus::Running;
    if (s == "self_test") return TaskStatus::SelfTest;
    if (s == "validated") return TaskStatus::Validated;
    if (s == "committed") return TaskStatus::Committed;
    if (s == "released_next") return TaskStatus::ReleasedNext;
    if (s == "failed") return TaskStatus::Failed;
    return std::nullopt;
}

std::vector<TaskStatus> AllowedTransitions(TaskStatus from) {
    switch (from) {
        case TaskStatus::Pending:
            return {TaskStatus::Running, TaskStatus::Failed};
        case TaskStatus::Running:
            return {TaskStatus::SelfTest, TaskStatus::Failed};
        case TaskStatus::SelfTest:
            return {TaskStatus::Validated, TaskStatus::Pending, TaskStatus::Failed};
        case TaskStatus::Validated:
            return {TaskStatus::Committed, TaskStatus::Failed};
        case TaskStatus::Committed:
            return {TaskStatus::ReleasedNext};
        case TaskStatus::ReleasedNext:
        case TaskStatus::Failed:
            return {};
    }
    return {};
}

bool CanTransition(TaskStatus from, TaskStatus to) {
    for (TaskStatus next : AllowedTransitions(from)) {
        if (next == to) return true;
    }
    return false;
}

// ============================================================================
// Contracts and Validation
// ============================================================================

std::string TaskContract::Validate() const {
    if (Trim(taskId).empty()) {
        return "task id is required";
    }
    if (sequence <= 0) {
        return "sequence must be >= 1";
    }
    for (const auto& key : requiredInput) {
        if (Trim(key).empty()) return "required input contains an empty key";
    }
    for (const auto& key : producedOutput) {
        if (Trim(key).empty()) return "produced output contains an empty key";
    }
    return "";
}

std::string ValidationResult::FailureReason() const {
    if (ok) return "";
    if (!missingInput.empty()) return "missing_input";
    if (!missingOutput.empty()) return "missing_output";
    return "invalid_rules";
}

ValidationResult ValidateIO(const TaskContract& contract,
                            const FieldMap& input,
                            const FieldMap& output) {
    ValidationResult result;

    for (const auto& raw : contract.requiredInput) {
        std::string key = Trim(raw);
        if (key.empty()) continue;
        if (FieldValue(input, key).empty()) {
            result.missingInput.push_back(key);
        }
    }

    for (const auto& raw : contract.producedOutput) {
        std::string key = Trim(raw);
        if (key.empty()) continue;
        if (FieldValue(output, key).empty()) {
            result.missingOutput.push_back(key);
        }
    }

    for (const auto& rule : contract.validationRules) {
        if (!RulePasses(rule, output)) {
            result.invalidRules.push_back(Trim(rule));
        }
    }

    result.ok = result.missingInput.empty() &&
                result.missingOutput.empty() &&
                result.invalidRules.empty();

    if (!result.ok) {
        std::vector<std::string> parts;
        if (!result.missingInput.empty()) {
            parts.push_back("missing_input=" + JoinNames(result.missingInput));
        }
        if (!result.missingOutput.empty()) {
            parts.push_back("missing_output=" + JoinNames(result.missingOutput));
        }
        if (!result.invalidRules.empty()) {
            parts.push_back("invalid_rules=" + JoinNames(result.invalidRules));
        }
        std::ostringstream oss;
        for (size_t i = 0; i < parts.size(); ++i) {
            if (i > 0) oss << "; ";
            oss << parts[i];
        }
        result.remediation = oss.str();
    }

    return result;
}

// ============================================================================
// Stage Gate
// ============================================================================

StartCheck CanStart(const CascadeTask& task, const CascadeTask* predecessor) {
    StartCheck check;
    if (task.status != TaskStatus::Pending) {
        check.reason = "task_not_pending";
        return check;
    }
    if (task.RetryBudgetExhausted()) {
        check.reason = "retry_budget_exhausted";
        return check;
    }
    if (task.sequence > 1) {
        if (predecessor == nullptr) {
            check.reason = "predecessor_not_found";
            return check;
        }
        if (predecessor->status != TaskStatus::Committed &&
            predecessor->status != TaskStatus::ReleasedNext) {
            check.reason = "predecessor_not_committed";
            return check;
        }
    }
    check.allowed = true;
    return check;
}

TaskStatus NextStateAfterValidation(const CascadeTask& task, const ValidationResult& result) {
    if (result.ok) {
        return TaskStatus::Validated;
    }
    if (task.maxRetries > 0 && task.retryCount + 1 >= task.maxRetries) {
        return TaskStatus::Failed;
    }
    return TaskStatus::Pending;
}

} // namespace cascade
} // namespace concord
