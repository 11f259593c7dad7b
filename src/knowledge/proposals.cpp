// CONCORD - Proposal Registry Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/knowledge/proposals.h>
#include <concord/core/random.h>
#include <concord/db/governancedb.h>
#include <concord/util/logging.h>

namespace concord {
namespace knowledge {

namespace {

std::string Trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

} // namespace

std::string NewProposalId() {
    return "kp-" + GetRandHex(8);
}

Status ProposalRegistry::Create(Proposal* proposal) {
    proposal->statement = Trim(proposal->statement);
    proposal->group = Trim(proposal->group);
    proposal->id = Trim(proposal->id);

    if (proposal->statement.empty()) {
        return Status::InvalidArgument("proposal statement is required");
    }
    if (proposal->group.empty()) {
        return Status::InvalidArgument("proposal group is required");
    }
    if (proposal->id.empty()) {
        proposal->id = NewProposalId();
    }
    if (util::IsZero(proposal->createdAt)) {
        proposal->createdAt = clock_.Now();
    }
    proposal->status = ProposalStatus::Pending;
    proposal->yes = 0;
    proposal->no = 0;
    proposal->reason.clear();
    proposal->decidedAt = util::TimePoint();

    Status s = store_.CreateProposal(*proposal);
    if (!s.ok()) {
        return s;
    }
    LOG_DEBUG(util::LogCategory::KNOWLEDGE) << "Created proposal " << proposal->id
                                            << " in " << proposal->group;
    return Status::Ok();
}

Status ProposalRegistry::Get(const std::string& id, Proposal* out) const {
    return store_.GetProposal(Trim(id), out);
}

Status ProposalRegistry::List(std::optional<ProposalStatus> status, size_t limit,
                              std::vector<Proposal>* out) const {
    return store_.ListProposals(status, limit, out);
}

} // namespace knowledge
} // namespace concord
