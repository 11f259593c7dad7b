// CONCORD - Decision & Fact Resolver
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Turns a terminal decision into durable state: the decision is written
// once onto the proposal, and an approval derives the next version of the
// fact named by the proposal statement.

#ifndef CONCORD_KNOWLEDGE_RESOLVER_H
#define CONCORD_KNOWLEDGE_RESOLVER_H

#include <concord/core/status.h>
#include <concord/knowledge/facts.h>
#include <concord/knowledge/types.h>
#include <concord/knowledge/voting.h>
#include <concord/util/time.h>

#include <optional>
#include <string>

namespace concord {
namespace db {
class GovernanceDB;
}

namespace knowledge {

struct ResolveResult {
    /// The decision was written (false if the proposal was already terminal)
    bool decisionRecorded{false};
    /// Derived fact, present when an approval was recorded
    std::optional<Fact> fact;
    FactApplyResult factResult;
};

class DecisionResolver {
public:
    DecisionResolver(db::GovernanceDB& store, const util::Clock& clock)
        : store_(store), clock_(clock) {}

    /**
     * Persist a terminal decision for `proposal`.
     *
     * A pending decision is a no-op. A proposal that is already terminal is
     * left untouched (late duplicate). Facts are derived only by the call
     * that actually records the approval, so re-resolving never bumps the
     * fact version twice.
     */
    Status Resolve(const Proposal& proposal, const Decision& decision, ResolveResult* result);

    /// Offer a fact (local or from a peer) to the version policy, logging
    /// conflicts at Warn
    Status ApplyFact(const Fact& incoming, FactApplyResult* result);

private:
    db::GovernanceDB& store_;
    const util::Clock& clock_;
};

} // namespace knowledge
} // namespace concord

#endif // CONCORD_KNOWLEDGE_RESOLVER_H
