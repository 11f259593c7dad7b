// CONCORD - Knowledge Data Model Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/knowledge/types.h>

#include <algorithm>
#include <cctype>

namespace concord {
namespace knowledge {

namespace {

std::string Normalize(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    std::string out = str.substr(start, end - start + 1);
    std::transform(out.begin(), out.end(), out.begin(), ::tolower);
    return out;
}

} // namespace

const char* ProposalStatusToString(ProposalStatus status) {
    switch (status) {
        case ProposalStatus::Pending: return "pending";
        case ProposalStatus::Approved: return "approved";
        case ProposalStatus::Rejected: return "rejected";
        case ProposalStatus::Expired: return "expired";
    }
    return "unknown";
}

std::optional<ProposalStatus> ParseProposalStatus(const std::string& str) {
    std::string s = Normalize(str);
    if (s == "pending") return ProposalStatus::Pending;
    if (s == "approved") return ProposalStatus::Approved;
    if (s == "rejected") return ProposalStatus::Rejected;
    if (s == "expired") return ProposalStatus::Expired;
    return std::nullopt;
}

const char* VoteValueToString(VoteValue value) {
    return value == VoteValue::Yes ? "yes" : "no";
}

std::optional<VoteValue> ParseVoteValue(const std::string& str) {
    std::string s = Normalize(str);
    if (s == "yes") return VoteValue::Yes;
    if (s == "no") return VoteValue::No;
    return std::nullopt;
}

} // namespace knowledge
} // namespace concord
