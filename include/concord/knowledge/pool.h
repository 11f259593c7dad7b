// CONCORD - Pool-Size Estimator
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Estimates how many peers may vote on a proposal. The roster is itself
// only eventually consistent, so this is a heuristic: overestimating the
// pool makes quorum harder to reach, underestimating makes it easier.

#ifndef CONCORD_KNOWLEDGE_POOL_H
#define CONCORD_KNOWLEDGE_POOL_H

#include <concord/core/status.h>
#include <concord/knowledge/voting.h>

#include <cstdint>
#include <string>

namespace concord {
namespace db {
class GovernanceDB;
}

namespace knowledge {

/**
 * Resolution order: override (if > 0), active roster members (if any),
 * policy.minPoolSize (if > 0), then 1.
 */
int32_t EstimatePoolSize(int32_t overrideSize, int32_t activeMembers, const VotingPolicy& policy);

/// Same as above, reading the active member count of `group` from the store.
/// A roster read failure falls through to the policy minimum.
int32_t EstimatePoolSize(const db::GovernanceDB& store, const std::string& group,
                         int32_t overrideSize, const VotingPolicy& policy);

} // namespace knowledge
} // namespace concord

#endif // CONCORD_KNOWLEDGE_POOL_H
