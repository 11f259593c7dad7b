// CONCORD - Decision & Fact Resolver Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/knowledge/resolver.h>
#include <concord/db/governancedb.h>
#include <concord/util/logging.h>

namespace concord {
namespace knowledge {

using util::LogCategory::FACTS;
using util::LogCategory::KNOWLEDGE;

namespace {

void LogFactResult(const Fact& incoming, const FactApplyResult& result) {
    switch (result.status) {
        case FactApplyStatus::Accepted:
            LOG_INFO(FACTS) << "Fact " << incoming.subject << "/" << incoming.predicate
                            << " v" << incoming.version << " accepted (" << result.reason << ")";
            break;
        case FactApplyStatus::Conflict:
            LOG_WARN(FACTS) << "Conflicting fact " << incoming.subject << "/" << incoming.predicate
                            << " v" << incoming.version << " from " << incoming.source
                            << " (" << result.reason
                            << (result.applied ? ", replaced latest" : ", kept latest") << ")";
            break;
        case FactApplyStatus::Stale:
            LOG_DEBUG(FACTS) << "Stale fact " << incoming.subject << "/" << incoming.predicate
                             << " v" << incoming.version << " (" << result.reason << ")";
            break;
    }
}

} // namespace

Status DecisionResolver::Resolve(const Proposal& proposal, const Decision& decision,
                                 ResolveResult* result) {
    *result = ResolveResult();
    if (!decision.IsTerminal()) {
        return Status::Ok();
    }

    db::DecisionRecord record;
    Status s = store_.UpdateProposalDecision(proposal.id, decision, clock_.Now(), &record);
    if (!s.ok()) {
        return s;
    }
    if (!record.updated) {
        return Status::Ok();
    }
    result->decisionRecorded = true;
    LOG_INFO(KNOWLEDGE) << "Proposal " << proposal.id << " "
                        << ProposalStatusToString(decision.status)
                        << " (yes=" << decision.yes << " no=" << decision.no
                        << (decision.reason.empty() ? "" : ", " + decision.reason) << ")";

    if (record.fact) {
        LogFactResult(*record.fact, record.factResult);
        result->fact = record.fact;
        result->factResult = record.factResult;
    }
    return Status::Ok();
}

Status DecisionResolver::ApplyFact(const Fact& incoming, FactApplyResult* result) {
    Status s = store_.UpsertFactLatest(incoming, result);
    if (!s.ok()) {
        return s;
    }
    LogFactResult(incoming, *result);
    return Status::Ok();
}

} // namespace knowledge
} // namespace concord
