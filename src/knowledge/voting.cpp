// CONCORD - Vote Tally & Quorum Evaluator Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/knowledge/voting.h>

#include <algorithm>
#include <cctype>

namespace concord {
namespace knowledge {

namespace {

std::string CanonicalId(const std::string& id) {
    size_t start = id.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = id.find_last_not_of(" \t\r\n");
    std::string out = id.substr(start, end - start + 1);
    std::transform(out.begin(), out.end(), out.begin(), ::tolower);
    return out;
}

} // namespace

std::string VotingPolicy::Validate() const {
    if (minPoolSize <= 0) {
        return "min pool size must be > 0";
    }
    if (quorumYes <= 0 || quorumNo <= 0) {
        return "quorum yes/no must be > 0";
    }
    if (timeout.count() <= 0) {
        return "timeout must be > 0";
    }
    return "";
}

void TallyVotes(const VoteMap& votes, const std::string& proposerId,
                bool allowSelfVote, int32_t& yes, int32_t& no) {
    yes = 0;
    no = 0;
    const std::string proposer = CanonicalId(proposerId);
    for (const auto& [voterId, value] : votes) {
        if (!allowSelfVote && CanonicalId(voterId) == proposer) {
            continue;
        }
        if (value == VoteValue::Yes) {
            ++yes;
        } else {
            ++no;
        }
    }
}

Decision Evaluate(const std::string& proposerId,
                  int32_t poolSize,
                  const VoteMap& votes,
                  util::TimePoint createdAt,
                  util::TimePoint now,
                  const VotingPolicy& policy) {
    Decision decision;

    if (!policy.enabled) {
        decision.reason = DecisionReason::VOTING_DISABLED;
        return decision;
    }
    std::string invalid = policy.Validate();
    if (!invalid.empty()) {
        decision.reason = invalid;
        return decision;
    }

    TallyVotes(votes, proposerId, policy.allowSelfVote, decision.yes, decision.no);

    if (poolSize < policy.minPoolSize) {
        decision.reason = DecisionReason::POOL_BELOW_MINIMUM;
        return decision;
    }
    if (decision.yes >= policy.quorumYes) {
        decision.status = ProposalStatus::Approved;
        return decision;
    }
    if (decision.no >= policy.quorumNo) {
        decision.status = ProposalStatus::Rejected;
        return decision;
    }
    if (!util::IsZero(createdAt) && now - createdAt >= policy.timeout) {
        decision.status = ProposalStatus::Expired;
        decision.reason = DecisionReason::TIMEOUT;
        return decision;
    }
    return decision;
}

} // namespace knowledge
} // namespace concord
