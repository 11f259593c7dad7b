// CONCORD - Knowledge Envelope Handler Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/knowledge/handler.h>
#include <concord/db/governancedb.h>
#include <concord/knowledge/facts.h>
#include <concord/knowledge/service.h>
#include <concord/util/logging.h>

#include <algorithm>
#include <cctype>

namespace concord {
namespace knowledge {

using util::LogCategory::ENVELOPE;

namespace {

std::string Lower(std::string str) {
    std::transform(str.begin(), str.end(), str.begin(), ::tolower);
    return str;
}

} // namespace

Status KnowledgeHandler::Process(const std::string& topic, const std::string& raw,
                                 ProcessResult* result) {
    *result = ProcessResult();

    Envelope envelope;
    Status s = DecodeEnvelope(raw, &envelope);
    if (!s.ok()) {
        LOG_WARN(ENVELOPE) << "Rejected envelope on " << topic << ": " << s.message();
        return s;
    }
    result->type = envelope.type;
    result->idempotencyKey = envelope.idempotencyKey;

    const KnowledgeConfig& config = service_.Config();
    EnvelopeType type = PayloadType(envelope.payload);
    if (!config.enabled || (IsGovernedType(type) && !config.governanceEnabled)) {
        return Status::GovernanceDisabled(std::string("cannot apply ") + envelope.type +
                                          " envelope: governance is disabled");
    }

    if (!topic.empty()) {
        std::optional<EnvelopeType> expected = service_.GetTopics().TypeOf(topic);
        if (expected && *expected != type) {
            return Status::InvalidArgument(envelope.type + " envelope on topic " + topic);
        }
    }

    if (!config.clawId.empty() && envelope.originId == config.clawId) {
        result->outcome = "ignored";
        result->detail = "own envelope";
        return Status::Ok();
    }

    if (store_.HasIdempotencyKey(envelope.idempotencyKey)) {
        result->outcome = "duplicate";
        LOG_DEBUG(ENVELOPE) << "Replay of " << envelope.idempotencyKey << " acknowledged";
        return Status::Ok();
    }

    s = Dispatch(envelope, result);
    if (!s.ok()) {
        return s;
    }

    bool inserted = false;
    s = store_.RecordIdempotency(envelope.idempotencyKey,
                                 envelope.type + ":" + result->outcome, &inserted);
    if (!s.ok()) {
        return s;
    }
    LOG_DEBUG(ENVELOPE) << "Applied " << envelope.type << " " << envelope.idempotencyKey
                        << " -> " << result->outcome;
    return Status::Ok();
}

Status KnowledgeHandler::Dispatch(const Envelope& envelope, ProcessResult* result) {
    const KnowledgeConfig& config = service_.Config();

    if (const auto* p = std::get_if<ProposalPayload>(&envelope.payload)) {
        Proposal proposal;
        proposal.id = p->proposalId;
        proposal.group = p->group;
        proposal.title = p->title;
        proposal.statement = p->statement;
        proposal.tags = p->tags;
        proposal.proposerId = envelope.originId;
        proposal.proposerInstance = envelope.instanceId;
        proposal.traceId = envelope.traceId;
        proposal.createdAt = envelope.timestamp;

        Status s = store_.CreateProposal(proposal);
        if (s.IsDuplicateId()) {
            result->outcome = "stale";
            result->detail = "proposal already known";
            return Status::Ok();
        }
        if (!s.ok()) {
            return s;
        }
        result->outcome = "accepted";
        return Status::Ok();
    }

    if (const auto* p = std::get_if<VotePayload>(&envelope.payload)) {
        Vote vote;
        vote.proposalId = p->proposalId;
        vote.voterId = envelope.originId;
        vote.value = *ParseVoteValue(p->vote);
        vote.reason = p->reason;
        vote.traceId = envelope.traceId;
        vote.updatedAt = envelope.timestamp;

        VoteOutcome outcome;
        Status s = service_.ApplyVote(vote, 0, &outcome);
        if (!s.ok()) {
            return s;
        }
        result->outcome = "accepted";
        result->detail = ProposalStatusToString(outcome.decision.status);
        return Status::Ok();
    }

    if (const auto* p = std::get_if<DecisionPayload>(&envelope.payload)) {
        Proposal proposal;
        Status s = store_.GetProposal(p->proposalId, &proposal);
        if (!s.ok()) {
            return s;
        }
        Decision decision;
        decision.status = *ParseProposalStatus(p->outcome);
        decision.yes = static_cast<int32_t>(p->yes);
        decision.no = static_cast<int32_t>(p->no);
        decision.reason = p->reason;

        ResolveResult resolved;
        s = service_.ApplyDecision(proposal, decision, &resolved);
        if (!s.ok()) {
            return s;
        }
        result->outcome = resolved.decisionRecorded ? "accepted" : "stale";
        if (!resolved.decisionRecorded) {
            result->detail = std::string("proposal already ") + ProposalStatusToString(proposal.status);
        }
        return Status::Ok();
    }

    if (const auto* p = std::get_if<FactPayload>(&envelope.payload)) {
        Fact fact;
        fact.group = p->group;
        fact.subject = p->subject;
        fact.predicate = p->predicate;
        fact.object = p->object;
        fact.version = p->version;
        fact.source = p->source;
        fact.proposalId = p->proposalId;
        fact.tags = p->tags;
        fact.createdAt = envelope.timestamp;
        fact.id = MakeFactId(fact.group, fact.subject, fact.predicate);
        if (p->factId != fact.id) {
            LOG_DEBUG(ENVELOPE) << "Fact id " << p->factId << " differs from derived " << fact.id;
        }

        FactApplyResult applied;
        Status s = service_.Resolver().ApplyFact(fact, &applied);
        if (!s.ok()) {
            return s;
        }
        result->outcome = FactApplyStatusToString(applied.status);
        result->detail = applied.reason;
        return Status::Ok();
    }

    if (const auto* p = std::get_if<PresencePayload>(&envelope.payload)) {
        GroupMember member;
        member.group = p->group.empty() ? config.group : p->group;
        member.clawId = envelope.originId;
        member.instanceId = envelope.instanceId;
        member.active = Lower(p->status) != "leave";
        member.lastSeen = envelope.timestamp;

        Status s = store_.UpsertGroupMember(member);
        if (!s.ok()) {
            return s;
        }
        result->outcome = "accepted";
        result->detail = member.active ? "active" : "inactive";
        return Status::Ok();
    }

    if (const auto* p = std::get_if<CapabilitiesPayload>(&envelope.payload)) {
        LOG_INFO(ENVELOPE) << envelope.originId << " advertises " << p->capabilities.size()
                           << " capabilities";
        result->outcome = "accepted";
        return Status::Ok();
    }

    return Status::InvalidArgument("unhandled envelope type " + envelope.type);
}

} // namespace knowledge
} // namespace concord
