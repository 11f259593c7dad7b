// CONCORD - Knowledge Service
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Local governance operations behind the CLI: propose, vote, re-evaluate,
// and list decisions and facts. Every mutation first checks the governance
// precondition, commits local state, then publishes envelopes.

#ifndef CONCORD_KNOWLEDGE_SERVICE_H
#define CONCORD_KNOWLEDGE_SERVICE_H

#include <concord/core/status.h>
#include <concord/knowledge/envelope.h>
#include <concord/knowledge/proposals.h>
#include <concord/knowledge/resolver.h>
#include <concord/knowledge/topics.h>
#include <concord/knowledge/types.h>
#include <concord/knowledge/voting.h>
#include <concord/util/time.h>

#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace concord {
namespace db {
class GovernanceDB;
}
namespace transport {
class Transport;
}

namespace knowledge {

// ============================================================================
// Configuration
// ============================================================================

struct KnowledgeConfig {
    bool enabled{true};
    bool governanceEnabled{true};
    std::string group;
    std::string clawId;
    std::string instanceId;
    VotingPolicy policy;

    bool GovernanceActive() const { return enabled && governanceEnabled; }
};

// ============================================================================
// Requests and Results
// ============================================================================

struct ProposeRequest {
    std::string id;                 ///< generated when empty
    std::string group;              ///< defaults to the configured group
    std::string title;
    std::string statement;
    std::vector<std::string> tags;
};

struct ProposeResult {
    Proposal proposal;
    std::string idempotencyKey;
    bool published{false};
    /// Envelopes handed to the transport (resend these on TRANSPORT_ERROR)
    std::vector<Envelope> envelopes;
};

struct VoteRequest {
    std::string proposalId;
    std::string voterId;            ///< defaults to the local claw id
    std::string voterInstance;      ///< defaults to the local instance id
    std::string value;              ///< yes|no
    std::string reason;
    int32_t poolSize{0};            ///< override for the estimator (0 = estimate)
};

struct VoteOutcome {
    Proposal proposal;              ///< state after the vote
    Decision decision;
    int32_t poolSize{0};
    ResolveResult resolved;
};

struct VoteResult {
    VoteOutcome outcome;
    bool published{false};
    std::vector<Envelope> envelopes;
};

struct ReevaluateResult {
    /// Proposals this pass moved to a terminal status
    std::vector<VoteOutcome> resolved;
    bool published{false};
    /// Decision and fact envelopes for `resolved` (resend on TRANSPORT_ERROR)
    std::vector<Envelope> envelopes;
};

struct StatusReport {
    bool enabled{false};
    bool governanceEnabled{false};
    std::string group;
    std::string clawId;
    std::string instanceId;
    Topics topics;
    std::map<std::string, size_t> counts;   ///< pending/approved/rejected/expired
    size_t facts{0};
};

// ============================================================================
// Knowledge Service
// ============================================================================

class KnowledgeService {
public:
    /**
     * @param transport Publisher for envelopes; nullptr keeps every
     *                  operation local (nothing is published)
     */
    KnowledgeService(KnowledgeConfig config,
                     db::GovernanceDB& store,
                     transport::Transport* transport,
                     const util::Clock& clock);

    const KnowledgeConfig& Config() const { return config_; }
    const Topics& GetTopics() const { return topics_; }

    /// GOVERNANCE_DISABLED unless knowledge and governance are both enabled
    Status RequireGovernance() const;

    Status GetStatus(StatusReport* report) const;

    /// Create a pending proposal and publish it
    Status Propose(const ProposeRequest& request, ProposeResult* result);

    /**
     * Record a local vote, re-evaluate the quorum and resolve a terminal
     * decision. Publishes the vote, plus decision and fact envelopes when
     * a decision was recorded.
     */
    Status CastVote(const VoteRequest& request, VoteResult* result);

    /**
     * Upsert a vote and re-evaluate its proposal (no publishing).
     * Shared by CastVote and the envelope handler. A vote on a terminal
     * proposal is stored but leaves the decision unchanged.
     */
    Status ApplyVote(const Vote& vote, int32_t poolOverride, VoteOutcome* outcome);

    /// Resolve a decision received from a peer, serialized with local votes
    Status ApplyDecision(const Proposal& proposal, const Decision& decision, ResolveResult* result);

    /**
     * Re-check every pending proposal at the current time. Timeouts are
     * only ever noticed here or on the next vote; there is no timer.
     * Decisions recorded before a failing proposal are still published.
     */
    Status ReevaluatePending(int32_t poolOverride, ReevaluateResult* result);

    Status ListDecisions(std::optional<ProposalStatus> status, size_t limit,
                         std::vector<Proposal>* out) const;

    Status ListFacts(const std::string& group, size_t limit, std::vector<Fact>* out) const;

    /// Publish an envelope on its type's topic, keyed by trace id
    Status Publish(const Envelope& envelope);

    ProposalRegistry& Registry() { return registry_; }
    DecisionResolver& Resolver() { return resolver_; }

private:
    KnowledgeConfig config_;
    Topics topics_;
    db::GovernanceDB& store_;
    transport::Transport* transport_;
    const util::Clock& clock_;
    ProposalRegistry registry_;
    DecisionResolver resolver_;

    /// Serializes vote upsert + decision recompute + fact write
    std::mutex mutex_;

    Status ApplyVoteLocked(const Vote& vote, int32_t poolOverride, VoteOutcome* outcome);
    Status EvaluateLocked(const Proposal& proposal, int32_t poolOverride, VoteOutcome* outcome);
    void AppendDecisionEnvelopes(const VoteOutcome& outcome, const std::string& traceId,
                                 std::vector<Envelope>* envelopes) const;
    Status PublishAll(const std::vector<Envelope>& envelopes, bool* published);
};

} // namespace knowledge
} // namespace concord

#endif // CONCORD_KNOWLEDGE_SERVICE_H
