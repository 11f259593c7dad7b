// CONCORD - Pool-Size Estimator Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/knowledge/pool.h>
#include <concord/db/governancedb.h>
#include <concord/util/logging.h>

namespace concord {
namespace knowledge {

int32_t EstimatePoolSize(int32_t overrideSize, int32_t activeMembers, const VotingPolicy& policy) {
    if (overrideSize > 0) {
        return overrideSize;
    }
    if (activeMembers > 0) {
        return activeMembers;
    }
    if (policy.minPoolSize > 0) {
        return policy.minPoolSize;
    }
    return 1;
}

int32_t EstimatePoolSize(const db::GovernanceDB& store, const std::string& group,
                         int32_t overrideSize, const VotingPolicy& policy) {
    if (overrideSize > 0) {
        return overrideSize;
    }
    std::vector<GroupMember> members;
    Status s = store.ListGroupMembers(group, true, &members);
    if (!s.ok()) {
        LOG_WARN(util::LogCategory::VOTING) << "Roster unavailable for " << group << ": " << s.ToString();
        members.clear();
    }
    return EstimatePoolSize(0, static_cast<int32_t>(members.size()), policy);
}

} // namespace knowledge
} // namespace concord
