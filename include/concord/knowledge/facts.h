// CONCORD - Fact Version Policy
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Versioned facts are keyed by (group, subject, predicate). The latest
// version is served; every accepted or conflicting write is kept as history.

#ifndef CONCORD_KNOWLEDGE_FACTS_H
#define CONCORD_KNOWLEDGE_FACTS_H

#include <concord/knowledge/types.h>
#include <concord/util/time.h>

#include <optional>
#include <string>

namespace concord {
namespace knowledge {

// ============================================================================
// Apply Policy
// ============================================================================

/// Outcome of offering a fact write against the stored latest version.
/// Stale and Conflict are recorded outcomes, not errors.
enum class FactApplyStatus {
    Accepted = 0,
    Stale = 1,
    Conflict = 2
};

const char* FactApplyStatusToString(FactApplyStatus status);

struct FactApplyResult {
    FactApplyStatus status{FactApplyStatus::Accepted};
    /// new_fact, sequential_update, same_version_race, duplicate,
    /// stale_version, invalid_version, new_fact_must_start_at_v1,
    /// version_gap_<a>_to_<b>
    std::string reason;
    /// True when the incoming fact replaced the latest row
    bool applied{false};
    /// Latest stored version before the write (0 if none)
    int64_t previousVersion{0};
};

/**
 * Decide what happens to `incoming` given the stored latest version.
 *
 * A write at the same version as the latest is a race between two
 * decisions: the lexicographically smaller source wins. The status is
 * Conflict either way; `applied` tells whether the incoming one won.
 */
FactApplyResult EvaluateFactApply(const Fact* existing, const Fact& incoming);

// ============================================================================
// Identity and Derivation
// ============================================================================

/// "fact-" + first 16 hex chars of SHA-256(group \0 subject \0 predicate)
std::string MakeFactId(const std::string& group,
                       const std::string& subject,
                       const std::string& predicate);

/// Source string recorded for facts derived from a decision
std::string DecisionSource(const std::string& proposalId);

struct FactTriple {
    std::string subject;
    std::string predicate;
    std::string object;
};

/**
 * Split a proposal statement into a fact triple.
 * "subject | predicate | object" is taken literally; anything else becomes
 * (title or id, "states", statement).
 */
FactTriple ParseStatement(const Proposal& proposal);

/// Build the fact an approved proposal derives at `version`
Fact DeriveFact(const Proposal& proposal, int64_t version, util::TimePoint now);

} // namespace knowledge
} // namespace concord

#endif // CONCORD_KNOWLEDGE_FACTS_H
