// CONCORD - Knowledge Service Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/knowledge/service.h>
#include <concord/core/random.h>
#include <concord/db/governancedb.h>
#include <concord/knowledge/pool.h>
#include <concord/transport/transport.h>
#include <concord/util/logging.h>

namespace concord {
namespace knowledge {

using util::LogCategory::KNOWLEDGE;
using util::LogCategory::VOTING;

namespace {

std::string Trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

Decision StoredDecision(const Proposal& proposal) {
    Decision d;
    d.status = proposal.status;
    d.yes = proposal.yes;
    d.no = proposal.no;
    d.reason = proposal.reason;
    return d;
}

} // namespace

KnowledgeService::KnowledgeService(KnowledgeConfig config,
                                   db::GovernanceDB& store,
                                   transport::Transport* transport,
                                   const util::Clock& clock)
    : config_(std::move(config))
    , topics_(Topics::ForGroup(config_.group))
    , store_(store)
    , transport_(transport)
    , clock_(clock)
    , registry_(store, clock)
    , resolver_(store, clock)
{
}

Status KnowledgeService::RequireGovernance() const {
    if (!config_.enabled) {
        return Status::GovernanceDisabled("knowledge is disabled (knowledge.enabled=false)");
    }
    if (!config_.governanceEnabled) {
        return Status::GovernanceDisabled("knowledge governance is disabled (knowledge.governance_enabled=false)");
    }
    return Status::Ok();
}

// ============================================================================
// Status
// ============================================================================

Status KnowledgeService::GetStatus(StatusReport* report) const {
    report->enabled = config_.enabled;
    report->governanceEnabled = config_.governanceEnabled;
    report->group = config_.group;
    report->clawId = config_.clawId;
    report->instanceId = config_.instanceId;
    report->topics = topics_;
    report->counts.clear();

    for (ProposalStatus status : {ProposalStatus::Pending, ProposalStatus::Approved,
                                  ProposalStatus::Rejected, ProposalStatus::Expired}) {
        std::vector<Proposal> list;
        Status s = store_.ListProposals(status, 0, &list);
        if (!s.ok()) {
            return s;
        }
        report->counts[ProposalStatusToString(status)] = list.size();
    }
    return store_.CountFacts(config_.group, &report->facts);
}

// ============================================================================
// Propose
// ============================================================================

Status KnowledgeService::Propose(const ProposeRequest& request, ProposeResult* result) {
    Status s = RequireGovernance();
    if (!s.ok()) {
        return s;
    }
    if (Trim(config_.clawId).empty()) {
        return Status::InvalidArgument("node claw_id must be configured");
    }

    Proposal proposal;
    proposal.id = request.id;
    proposal.group = Trim(request.group).empty() ? config_.group : request.group;
    proposal.title = Trim(request.title);
    proposal.statement = request.statement;
    proposal.tags = request.tags;
    proposal.proposerId = config_.clawId;
    proposal.proposerInstance = config_.instanceId;
    proposal.traceId = NewTraceId();

    s = registry_.Create(&proposal);
    if (!s.ok()) {
        return s;
    }

    result->proposal = proposal;
    result->idempotencyKey = ProposalIdempotencyKey(proposal.id);
    result->envelopes.clear();

    ProposalPayload payload{proposal.id, proposal.group, proposal.title, proposal.statement, proposal.tags};
    result->envelopes.push_back(MakeEnvelope(payload, proposal.traceId, result->idempotencyKey,
                                             config_.clawId, config_.instanceId, clock_.Now()));

    LOG_INFO(KNOWLEDGE) << "Proposed " << proposal.id << " in " << proposal.group;
    return PublishAll(result->envelopes, &result->published);
}

// ============================================================================
// Voting
// ============================================================================

Status KnowledgeService::CastVote(const VoteRequest& request, VoteResult* result) {
    Status s = RequireGovernance();
    if (!s.ok()) {
        return s;
    }

    std::string proposalId = Trim(request.proposalId);
    if (proposalId.empty()) {
        return Status::InvalidArgument("proposal id is required");
    }
    std::optional<VoteValue> value = ParseVoteValue(request.value);
    if (!value) {
        return Status::InvalidArgument("vote must be yes|no");
    }
    std::string voterId = Trim(request.voterId).empty() ? config_.clawId : Trim(request.voterId);
    std::string voterInstance = Trim(request.voterInstance).empty() ? config_.instanceId
                                                                   : Trim(request.voterInstance);
    if (voterId.empty()) {
        return Status::InvalidArgument("voter id is required (configure node.claw_id or pass --as-claw)");
    }

    Vote vote;
    vote.proposalId = proposalId;
    vote.voterId = voterId;
    vote.value = *value;
    vote.reason = Trim(request.reason);
    vote.traceId = NewTraceId();
    vote.updatedAt = clock_.Now();

    s = ApplyVote(vote, request.poolSize, &result->outcome);
    if (!s.ok()) {
        return s;
    }

    result->envelopes.clear();
    VotePayload payload{proposalId, VoteValueToString(vote.value), vote.reason};
    result->envelopes.push_back(MakeEnvelope(payload, vote.traceId,
                                             VoteIdempotencyKey(proposalId, voterId),
                                             voterId, voterInstance, clock_.Now()));
    AppendDecisionEnvelopes(result->outcome, vote.traceId, &result->envelopes);

    return PublishAll(result->envelopes, &result->published);
}

Status KnowledgeService::ApplyVote(const Vote& vote, int32_t poolOverride, VoteOutcome* outcome) {
    std::lock_guard<std::mutex> lock(mutex_);
    return ApplyVoteLocked(vote, poolOverride, outcome);
}

Status KnowledgeService::ApplyVoteLocked(const Vote& vote, int32_t poolOverride, VoteOutcome* outcome) {
    *outcome = VoteOutcome();

    Proposal proposal;
    Status s = store_.GetProposal(vote.proposalId, &proposal);
    if (!s.ok()) {
        return s;
    }

    s = store_.UpsertVote(vote);
    if (!s.ok()) {
        return s;
    }
    LOG_DEBUG(VOTING) << vote.voterId << " voted " << VoteValueToString(vote.value)
                      << " on " << vote.proposalId;

    if (IsTerminal(proposal.status)) {
        outcome->proposal = proposal;
        outcome->decision = StoredDecision(proposal);
        return Status::Ok();
    }
    return EvaluateLocked(proposal, poolOverride, outcome);
}

Status KnowledgeService::EvaluateLocked(const Proposal& proposal, int32_t poolOverride,
                                        VoteOutcome* outcome) {
    std::vector<Vote> votes;
    Status s = store_.ListVotes(proposal.id, &votes);
    if (!s.ok()) {
        return s;
    }
    VoteMap voteMap;
    for (const auto& v : votes) {
        voteMap[v.voterId] = v.value;
    }

    outcome->poolSize = EstimatePoolSize(store_, proposal.group, poolOverride, config_.policy);
    outcome->decision = Evaluate(proposal.proposerId, outcome->poolSize, voteMap,
                                 proposal.createdAt, clock_.Now(), config_.policy);
    LOG_DEBUG(VOTING) << "Evaluated " << proposal.id << ": "
                      << ProposalStatusToString(outcome->decision.status)
                      << " yes=" << outcome->decision.yes << " no=" << outcome->decision.no
                      << " pool=" << outcome->poolSize;

    s = resolver_.Resolve(proposal, outcome->decision, &outcome->resolved);
    if (!s.ok()) {
        return s;
    }

    s = store_.GetProposal(proposal.id, &outcome->proposal);
    if (!s.ok()) {
        return s;
    }
    if (!outcome->resolved.decisionRecorded && IsTerminal(outcome->proposal.status)) {
        // Someone else decided first; report the stored decision
        outcome->decision = StoredDecision(outcome->proposal);
    }
    return Status::Ok();
}

Status KnowledgeService::ApplyDecision(const Proposal& proposal, const Decision& decision,
                                       ResolveResult* result) {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolver_.Resolve(proposal, decision, result);
}

Status KnowledgeService::ReevaluatePending(int32_t poolOverride, ReevaluateResult* result) {
    *result = ReevaluateResult();
    Status s = RequireGovernance();
    if (!s.ok()) {
        return s;
    }

    Status evaluated;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<Proposal> pending;
        s = store_.ListProposals(ProposalStatus::Pending, 0, &pending);
        if (!s.ok()) {
            return s;
        }
        for (const auto& proposal : pending) {
            VoteOutcome outcome;
            evaluated = EvaluateLocked(proposal, poolOverride, &outcome);
            if (!evaluated.ok()) {
                LOG_WARN(KNOWLEDGE) << "Re-evaluation stopped at " << proposal.id << ": "
                                    << evaluated.ToString();
                break;
            }
            if (outcome.resolved.decisionRecorded) {
                AppendDecisionEnvelopes(outcome, proposal.traceId.empty() ? NewTraceId() : proposal.traceId,
                                        &result->envelopes);
                result->resolved.push_back(std::move(outcome));
            }
        }
    }

    s = PublishAll(result->envelopes, &result->published);
    if (!evaluated.ok()) {
        return evaluated;
    }
    return s;
}

// ============================================================================
// Listing
// ============================================================================

Status KnowledgeService::ListDecisions(std::optional<ProposalStatus> status, size_t limit,
                                       std::vector<Proposal>* out) const {
    return store_.ListProposals(status, limit, out);
}

Status KnowledgeService::ListFacts(const std::string& group, size_t limit,
                                   std::vector<Fact>* out) const {
    return store_.ListFacts(group, limit, out);
}

// ============================================================================
// Publishing
// ============================================================================

void KnowledgeService::AppendDecisionEnvelopes(const VoteOutcome& outcome, const std::string& traceId,
                                               std::vector<Envelope>* envelopes) const {
    if (!outcome.resolved.decisionRecorded) {
        return;
    }
    const Proposal& p = outcome.proposal;
    DecisionPayload decision{p.id, ProposalStatusToString(outcome.decision.status),
                             outcome.decision.yes, outcome.decision.no, outcome.decision.reason};
    envelopes->push_back(MakeEnvelope(decision, traceId, DecisionIdempotencyKey(p.id),
                                      config_.clawId, config_.instanceId, clock_.Now()));

    if (outcome.resolved.fact && outcome.resolved.factResult.applied) {
        const Fact& f = *outcome.resolved.fact;
        FactPayload fact;
        fact.factId = f.id;
        fact.group = f.group;
        fact.subject = f.subject;
        fact.predicate = f.predicate;
        fact.object = f.object;
        fact.version = f.version;
        fact.source = f.source;
        fact.proposalId = f.proposalId;
        fact.decisionId = DecisionIdempotencyKey(p.id);
        fact.tags = f.tags;
        envelopes->push_back(MakeEnvelope(fact, traceId, FactIdempotencyKey(f.id, f.version),
                                          config_.clawId, config_.instanceId, clock_.Now()));
    }
}

Status KnowledgeService::Publish(const Envelope& envelope) {
    if (transport_ == nullptr) {
        return Status::TransportError("no transport configured");
    }
    Status s = Validate(envelope);
    if (!s.ok()) {
        return s;
    }
    const std::string& topic = topics_.ForType(PayloadType(envelope.payload));
    s = transport_->Produce(topic, envelope.traceId, EncodeEnvelope(envelope));
    if (!s.ok()) {
        LOG_WARN(util::LogCategory::TRANSPORT) << "Publish of " << envelope.idempotencyKey
                                               << " to " << topic << " failed: " << s.ToString();
        return s;
    }
    LOG_DEBUG(util::LogCategory::TRANSPORT) << "Published " << envelope.type << " "
                                            << envelope.idempotencyKey << " to " << topic;
    return Status::Ok();
}

Status KnowledgeService::PublishAll(const std::vector<Envelope>& envelopes, bool* published) {
    *published = false;
    if (transport_ == nullptr || envelopes.empty()) {
        return Status::Ok();
    }
    for (const auto& envelope : envelopes) {
        Status s = Publish(envelope);
        if (!s.ok()) {
            return s;
        }
    }
    *published = true;
    return Status::Ok();
}

} // namespace knowledge
} // namespace concord
