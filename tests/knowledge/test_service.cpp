// CONCORD - Knowledge Service Tests
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <gtest/gtest.h>
#include <concord/knowledge/service.h>
#include <concord/db/governancedb.h>
#include <concord/db/memorydb.h>
#include <concord/transport/transport.h>

using namespace concord;
using namespace concord::knowledge;

// ============================================================================
// Test Fixture
// ============================================================================

class KnowledgeServiceTest : public ::testing::Test {
protected:
    db::GovernanceDB store_{std::make_unique<db::MemoryDatabase>()};
    transport::MemoryTransport bus_;
    util::ManualClock clock_;
    std::unique_ptr<KnowledgeService> service_;

    void SetUp() override {
        service_ = MakeService(DefaultConfig());
    }

    static KnowledgeConfig DefaultConfig() {
        KnowledgeConfig config;
        config.group = "ops";
        config.clawId = "claw-a";
        config.instanceId = "inst-a";
        return config;
    }

    std::unique_ptr<KnowledgeService> MakeService(KnowledgeConfig config) {
        return std::make_unique<KnowledgeService>(std::move(config), store_, &bus_, clock_);
    }

    Proposal Propose(const std::string& statement = "db | uses | leveldb") {
        ProposeRequest request;
        request.title = "Storage";
        request.statement = statement;
        ProposeResult result;
        EXPECT_TRUE(service_->Propose(request, &result).ok());
        return result.proposal;
    }

    Status VoteAs(const std::string& proposalId, const std::string& voter,
                  const std::string& value, VoteResult* result, int32_t pool = 4) {
        VoteRequest request;
        request.proposalId = proposalId;
        request.voterId = voter;
        request.value = value;
        request.poolSize = pool;
        return service_->CastVote(request, result);
    }
};

// ============================================================================
// Propose
// ============================================================================

TEST_F(KnowledgeServiceTest, ProposePersistsAndPublishes) {
    ProposeRequest request;
    request.statement = "db | uses | leveldb";
    request.tags = {"infra"};
    ProposeResult result;
    ASSERT_TRUE(service_->Propose(request, &result).ok());

    EXPECT_TRUE(result.published);
    EXPECT_EQ(result.proposal.group, "ops");
    EXPECT_EQ(result.proposal.proposerId, "claw-a");
    EXPECT_EQ(result.proposal.traceId.rfind("tr-", 0), 0u);
    EXPECT_EQ(result.idempotencyKey, "knowledge:proposal:" + result.proposal.id);

    auto messages = bus_.MessagesOn("ops.knowledge.proposals");
    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0].key, result.proposal.traceId);

    Envelope decoded;
    ASSERT_TRUE(DecodeEnvelope(messages[0].payload, &decoded).ok());
    EXPECT_EQ(decoded.originId, "claw-a");
    EXPECT_EQ(decoded.instanceId, "inst-a");
    EXPECT_EQ(decoded.idempotencyKey, result.idempotencyKey);
}

TEST_F(KnowledgeServiceTest, ProposeRequiresClawId) {
    KnowledgeConfig config = DefaultConfig();
    config.clawId.clear();
    service_ = MakeService(config);

    ProposeRequest request;
    request.statement = "s";
    ProposeResult result;
    EXPECT_TRUE(service_->Propose(request, &result).IsInvalidArgument());
}

TEST_F(KnowledgeServiceTest, GovernanceDisabledRejectsMutations) {
    KnowledgeConfig config = DefaultConfig();
    config.governanceEnabled = false;
    service_ = MakeService(config);

    ProposeRequest request;
    request.statement = "s";
    ProposeResult result;
    EXPECT_TRUE(service_->Propose(request, &result).IsGovernanceDisabled());

    VoteResult vote;
    EXPECT_TRUE(VoteAs("kp-1", "claw-b", "yes", &vote).IsGovernanceDisabled());

    ReevaluateResult refresh;
    EXPECT_TRUE(service_->ReevaluatePending(0, &refresh).IsGovernanceDisabled());

    std::vector<Proposal> all;
    store_.ListProposals(std::nullopt, 0, &all);
    EXPECT_TRUE(all.empty());
    EXPECT_EQ(bus_.Count(), 0u);
}

TEST_F(KnowledgeServiceTest, KnowledgeDisabledAlsoBlocks) {
    KnowledgeConfig config = DefaultConfig();
    config.enabled = false;
    service_ = MakeService(config);
    EXPECT_TRUE(service_->RequireGovernance().IsGovernanceDisabled());
}

TEST_F(KnowledgeServiceTest, TransportFailureAfterCommit) {
    bus_.FailNext(1);
    ProposeRequest request;
    request.statement = "db | uses | leveldb";
    ProposeResult result;
    Status s = service_->Propose(request, &result);
    EXPECT_TRUE(s.IsTransportError());
    EXPECT_FALSE(result.published);

    // Local state is committed; resending the same envelope succeeds
    Proposal stored;
    ASSERT_TRUE(store_.GetProposal(result.proposal.id, &stored).ok());
    ASSERT_EQ(result.envelopes.size(), 1u);
    ASSERT_TRUE(service_->Publish(result.envelopes[0]).ok());
    EXPECT_EQ(bus_.MessagesOn("ops.knowledge.proposals").size(), 1u);
}

TEST_F(KnowledgeServiceTest, NoTransportKeepsOperationsLocal) {
    service_ = std::make_unique<KnowledgeService>(DefaultConfig(), store_, nullptr, clock_);
    ProposeRequest request;
    request.statement = "s";
    ProposeResult result;
    ASSERT_TRUE(service_->Propose(request, &result).ok());
    EXPECT_FALSE(result.published);
    EXPECT_TRUE(service_->Publish(result.envelopes[0]).IsTransportError());
}

// ============================================================================
// Voting
// ============================================================================

TEST_F(KnowledgeServiceTest, TwoPeerVotesApprove) {
    Proposal p = Propose();
    bus_.Clear();

    VoteResult first;
    ASSERT_TRUE(VoteAs(p.id, "claw-b", "yes", &first).ok());
    EXPECT_EQ(first.outcome.decision.status, ProposalStatus::Pending);
    EXPECT_EQ(first.outcome.poolSize, 4);
    EXPECT_EQ(first.envelopes.size(), 1u);

    VoteResult second;
    ASSERT_TRUE(VoteAs(p.id, "claw-c", "yes", &second).ok());
    EXPECT_EQ(second.outcome.decision.status, ProposalStatus::Approved);
    EXPECT_EQ(second.outcome.proposal.status, ProposalStatus::Approved);
    EXPECT_TRUE(second.outcome.resolved.decisionRecorded);
    ASSERT_TRUE(second.outcome.resolved.fact.has_value());
    EXPECT_EQ(second.outcome.resolved.fact->version, 1);

    // vote + decision + fact
    ASSERT_EQ(second.envelopes.size(), 3u);
    EXPECT_EQ(second.envelopes[1].idempotencyKey, "knowledge:decision:" + p.id);
    EXPECT_EQ(bus_.MessagesOn("ops.knowledge.votes").size(), 2u);
    EXPECT_EQ(bus_.MessagesOn("ops.knowledge.decisions").size(), 1u);
    EXPECT_EQ(bus_.MessagesOn("ops.knowledge.facts").size(), 1u);
}

TEST_F(KnowledgeServiceTest, TwoNoVotesReject) {
    Proposal p = Propose();
    VoteResult r;
    VoteAs(p.id, "claw-b", "no", &r);
    ASSERT_TRUE(VoteAs(p.id, "claw-c", "NO", &r).ok());
    EXPECT_EQ(r.outcome.decision.status, ProposalStatus::Rejected);
    EXPECT_FALSE(r.outcome.resolved.fact.has_value());

    size_t facts = 0;
    store_.CountFacts("ops", &facts);
    EXPECT_EQ(facts, 0u);
}

TEST_F(KnowledgeServiceTest, ProposerVoteDoesNotCount) {
    Proposal p = Propose();
    VoteResult r;
    // Defaults to the local claw, which is the proposer
    ASSERT_TRUE(VoteAs(p.id, "", "yes", &r).ok());
    VoteAs(p.id, "claw-b", "yes", &r);
    EXPECT_EQ(r.outcome.decision.status, ProposalStatus::Pending);
    EXPECT_EQ(r.outcome.decision.yes, 1);
}

TEST_F(KnowledgeServiceTest, ReVoteReplacesEarlierValue) {
    Proposal p = Propose();
    VoteResult r;
    VoteAs(p.id, "claw-b", "yes", &r);
    VoteAs(p.id, "claw-b", "no", &r);
    EXPECT_EQ(r.outcome.decision.yes, 0);
    EXPECT_EQ(r.outcome.decision.no, 1);
}

TEST_F(KnowledgeServiceTest, VoteAfterDecisionKeepsDecision) {
    Proposal p = Propose();
    VoteResult r;
    VoteAs(p.id, "claw-b", "yes", &r);
    VoteAs(p.id, "claw-c", "yes", &r);
    bus_.Clear();

    ASSERT_TRUE(VoteAs(p.id, "claw-d", "no", &r).ok());
    EXPECT_EQ(r.outcome.decision.status, ProposalStatus::Approved);
    EXPECT_FALSE(r.outcome.resolved.decisionRecorded);
    EXPECT_EQ(r.envelopes.size(), 1u);

    std::vector<knowledge::Vote> votes;
    store_.ListVotes(p.id, &votes);
    EXPECT_EQ(votes.size(), 3u);
}

TEST_F(KnowledgeServiceTest, SmallPoolBlocksQuorum) {
    Proposal p = Propose();
    VoteResult r;
    VoteAs(p.id, "claw-b", "yes", &r, 2);
    ASSERT_TRUE(VoteAs(p.id, "claw-c", "yes", &r, 2).ok());
    EXPECT_EQ(r.outcome.decision.status, ProposalStatus::Pending);
    EXPECT_EQ(r.outcome.decision.reason, DecisionReason::POOL_BELOW_MINIMUM);
}

TEST_F(KnowledgeServiceTest, VoteValidation) {
    Proposal p = Propose();
    VoteResult r;
    EXPECT_TRUE(VoteAs(p.id, "claw-b", "maybe", &r).IsInvalidArgument());
    EXPECT_TRUE(VoteAs("", "claw-b", "yes", &r).IsInvalidArgument());
    EXPECT_TRUE(VoteAs("kp-missing", "claw-b", "yes", &r).IsNotFound());
}

// ============================================================================
// Re-evaluation
// ============================================================================

TEST_F(KnowledgeServiceTest, ReevaluateExpiresStaleProposals) {
    KnowledgeConfig config = DefaultConfig();
    config.policy.timeout = util::Seconds(120);
    service_ = MakeService(config);

    Proposal p = Propose();
    VoteResult r;
    VoteAs(p.id, "claw-b", "yes", &r);
    bus_.Clear();

    ReevaluateResult refresh;
    ASSERT_TRUE(service_->ReevaluatePending(4, &refresh).ok());
    EXPECT_TRUE(refresh.resolved.empty());
    EXPECT_FALSE(refresh.published);

    clock_.Advance(util::Seconds(125));
    ASSERT_TRUE(service_->ReevaluatePending(4, &refresh).ok());
    ASSERT_EQ(refresh.resolved.size(), 1u);
    EXPECT_EQ(refresh.resolved[0].decision.status, ProposalStatus::Expired);
    EXPECT_EQ(refresh.resolved[0].decision.reason, DecisionReason::TIMEOUT);
    EXPECT_EQ(refresh.resolved[0].decision.yes, 1);
    EXPECT_TRUE(refresh.published);
    EXPECT_EQ(refresh.envelopes.size(), 1u);

    auto decisions = bus_.MessagesOn("ops.knowledge.decisions");
    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].key, p.traceId);

    // Nothing left to resolve
    ASSERT_TRUE(service_->ReevaluatePending(4, &refresh).ok());
    EXPECT_TRUE(refresh.resolved.empty());
    EXPECT_TRUE(refresh.envelopes.empty());
}

TEST_F(KnowledgeServiceTest, ReevaluateReturnsUnsentEnvelopes) {
    KnowledgeConfig config = DefaultConfig();
    config.policy.timeout = util::Seconds(120);
    service_ = MakeService(config);

    Proposal p = Propose();
    bus_.Clear();
    clock_.Advance(util::Seconds(125));

    bus_.FailNext(1);
    ReevaluateResult refresh;
    EXPECT_TRUE(service_->ReevaluatePending(4, &refresh).IsTransportError());
    ASSERT_EQ(refresh.resolved.size(), 1u);
    EXPECT_FALSE(refresh.published);
    ASSERT_EQ(refresh.envelopes.size(), 1u);
    EXPECT_EQ(refresh.envelopes[0].type, EnvelopeTypeToString(EnvelopeType::Decision));
    EXPECT_TRUE(bus_.MessagesOn("ops.knowledge.decisions").empty());

    // The decision is already stored, so a second pass has nothing to send
    ReevaluateResult again;
    ASSERT_TRUE(service_->ReevaluatePending(4, &again).ok());
    EXPECT_TRUE(again.envelopes.empty());

    for (const auto& envelope : refresh.envelopes) {
        ASSERT_TRUE(service_->Publish(envelope).ok());
    }
    auto decisions = bus_.MessagesOn("ops.knowledge.decisions");
    ASSERT_EQ(decisions.size(), 1u);
    EXPECT_EQ(decisions[0].key, p.traceId);
}

// ============================================================================
// Decision Atomicity
// ============================================================================

namespace {

/// Fails batch writes only, so single-row vote writes still land
class BatchFailingDatabase : public db::MemoryDatabase {
public:
    db::Status Write(const db::WriteOptions& options, db::WriteBatch* batch) override {
        if (failBatches_ > 0) {
            --failBatches_;
            return db::Status::IOError("batch rejected");
        }
        return db::MemoryDatabase::Write(options, batch);
    }

    void FailNextBatches(int n) { failBatches_ = n; }

private:
    int failBatches_{0};
};

} // namespace

TEST(KnowledgeServiceAtomicityTest, FailedApprovalLeavesNoPartialState) {
    auto backend = std::make_unique<BatchFailingDatabase>();
    BatchFailingDatabase* failing = backend.get();
    db::GovernanceDB store(std::move(backend));
    transport::MemoryTransport bus;
    util::ManualClock clock;

    KnowledgeConfig config;
    config.group = "ops";
    config.clawId = "claw-a";
    config.instanceId = "inst-a";
    KnowledgeService service(config, store, &bus, clock);

    ProposeRequest propose;
    propose.statement = "db | uses | leveldb";
    ProposeResult proposed;
    ASSERT_TRUE(service.Propose(propose, &proposed).ok());
    const std::string id = proposed.proposal.id;

    VoteRequest vote;
    vote.proposalId = id;
    vote.value = "yes";
    vote.poolSize = 4;
    VoteResult result;
    vote.voterId = "claw-b";
    ASSERT_TRUE(service.CastVote(vote, &result).ok());
    bus.Clear();

    failing->FailNextBatches(1);
    vote.voterId = "claw-c";
    Status s = service.CastVote(vote, &result);
    EXPECT_EQ(s.code(), Status::STORAGE_ERROR);

    Proposal stored;
    ASSERT_TRUE(store.GetProposal(id, &stored).ok());
    EXPECT_EQ(stored.status, ProposalStatus::Pending);
    size_t facts = 0;
    ASSERT_TRUE(store.CountFacts("ops", &facts).ok());
    EXPECT_EQ(facts, 0u);
    EXPECT_EQ(bus.Count(), 0u);

    // Retrying the same vote records the approval and its fact together
    ASSERT_TRUE(service.CastVote(vote, &result).ok());
    EXPECT_EQ(result.outcome.decision.status, ProposalStatus::Approved);
    ASSERT_TRUE(result.outcome.resolved.fact.has_value());
    EXPECT_EQ(result.outcome.resolved.fact->version, 1);
    ASSERT_TRUE(store.GetProposal(id, &stored).ok());
    EXPECT_EQ(stored.status, ProposalStatus::Approved);
    EXPECT_EQ(bus.MessagesOn("ops.knowledge.decisions").size(), 1u);
    EXPECT_EQ(bus.MessagesOn("ops.knowledge.facts").size(), 1u);
}

// ============================================================================
// Status and Listing
// ============================================================================

TEST_F(KnowledgeServiceTest, StatusCountsByOutcome) {
    Proposal approved = Propose("a | b | c");
    Propose("d | e | f");
    VoteResult r;
    VoteAs(approved.id, "claw-b", "yes", &r);
    VoteAs(approved.id, "claw-c", "yes", &r);

    StatusReport report;
    ASSERT_TRUE(service_->GetStatus(&report).ok());
    EXPECT_TRUE(report.enabled);
    EXPECT_EQ(report.group, "ops");
    EXPECT_EQ(report.topics.votes, "ops.knowledge.votes");
    EXPECT_EQ(report.counts["pending"], 1u);
    EXPECT_EQ(report.counts["approved"], 1u);
    EXPECT_EQ(report.counts["rejected"], 0u);
    EXPECT_EQ(report.facts, 1u);

    std::vector<Proposal> decided;
    ASSERT_TRUE(service_->ListDecisions(ProposalStatus::Approved, 0, &decided).ok());
    ASSERT_EQ(decided.size(), 1u);
    EXPECT_EQ(decided[0].id, approved.id);

    std::vector<Fact> facts;
    ASSERT_TRUE(service_->ListFacts("ops", 0, &facts).ok());
    ASSERT_EQ(facts.size(), 1u);
    EXPECT_EQ(facts[0].subject, "a");
}
