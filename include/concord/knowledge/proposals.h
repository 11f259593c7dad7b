// CONCORD - Proposal Registry
// Copyright (c) 2024 CONCORD Developers
// MIT License

#ifndef CONCORD_KNOWLEDGE_PROPOSALS_H
#define CONCORD_KNOWLEDGE_PROPOSALS_H

#include <concord/core/status.h>
#include <concord/knowledge/types.h>
#include <concord/util/time.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace concord {
namespace db {
class GovernanceDB;
}

namespace knowledge {

/// "kp-" + 16 random hex chars
std::string NewProposalId();

class ProposalRegistry {
public:
    ProposalRegistry(db::GovernanceDB& store, const util::Clock& clock)
        : store_(store), clock_(clock) {}

    /**
     * Persist a new pending proposal.
     *
     * Assigns an id when empty and a creation time when unset; any status
     * set by the caller is replaced by pending.
     * @return INVALID_ARGUMENT without statement or group, DUPLICATE_ID if
     *         the id is taken
     */
    Status Create(Proposal* proposal);

    /// NOT_FOUND if absent
    Status Get(const std::string& id, Proposal* out) const;

    Status List(std::optional<ProposalStatus> status, size_t limit,
                std::vector<Proposal>* out) const;

private:
    db::GovernanceDB& store_;
    const util::Clock& clock_;
};

} // namespace knowledge
} // namespace concord

#endif // CONCORD_KNOWLEDGE_PROPOSALS_H
