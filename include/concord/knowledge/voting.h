// CONCORD - Vote Tally & Quorum Evaluator
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Pure quorum evaluation. Any node that has observed the same vote set and
// uses the same policy computes the same Decision; nothing here touches the
// store or the clock.

#ifndef CONCORD_KNOWLEDGE_VOTING_H
#define CONCORD_KNOWLEDGE_VOTING_H

#include <concord/knowledge/types.h>
#include <concord/util/time.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <string>

namespace concord {
namespace knowledge {

// ============================================================================
// Voting Policy
// ============================================================================

struct VotingPolicy {
    bool enabled{true};
    int32_t minPoolSize{3};
    int32_t quorumYes{2};
    int32_t quorumNo{2};
    util::Seconds timeout{std::chrono::hours(24)};
    bool allowSelfVote{false};

    /// Empty string when valid, otherwise the problem
    std::string Validate() const;
};

// ============================================================================
// Decision
// ============================================================================

struct Decision {
    ProposalStatus status{ProposalStatus::Pending};
    int32_t yes{0};
    int32_t no{0};
    std::string reason;

    bool IsTerminal() const { return knowledge::IsTerminal(status); }

    bool operator==(const Decision& other) const {
        return status == other.status && yes == other.yes &&
               no == other.no && reason == other.reason;
    }
    bool operator!=(const Decision& other) const { return !(*this == other); }
};

/// Voter id -> vote; one entry per voter (re-votes already collapsed)
using VoteMap = std::map<std::string, VoteValue>;

/// Reason strings produced by Evaluate
namespace DecisionReason {
    constexpr const char* VOTING_DISABLED = "voting disabled";
    constexpr const char* POOL_BELOW_MINIMUM = "pool below minimum";
    constexpr const char* TIMEOUT = "timeout before quorum";
}

/**
 * Compute a decision from the collected votes.
 *
 * Order of checks:
 *   1. policy disabled            -> pending ("voting disabled")
 *   2. proposer's vote dropped unless allowSelfVote
 *   3. pool below minimum         -> pending ("pool below minimum")
 *   4. yes >= quorumYes           -> approved
 *   5. no >= quorumNo             -> rejected
 *   6. now - createdAt >= timeout -> expired ("timeout before quorum")
 *   7. otherwise                  -> pending
 *
 * Approval is checked before rejection, so a tally meeting both thresholds
 * resolves to approved. A policy that fails Validate() yields pending with
 * the validation message as the reason.
 */
Decision Evaluate(const std::string& proposerId,
                  int32_t poolSize,
                  const VoteMap& votes,
                  util::TimePoint createdAt,
                  util::TimePoint now,
                  const VotingPolicy& policy);

/// Count yes/no votes, skipping the proposer unless allowSelfVote
void TallyVotes(const VoteMap& votes, const std::string& proposerId,
                bool allowSelfVote, int32_t& yes, int32_t& no);

} // namespace knowledge
} // namespace concord

#endif // CONCORD_KNOWLEDGE_VOTING_H
