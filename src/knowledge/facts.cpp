// CONCORD - Fact Version Policy Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/knowledge/facts.h>
#include <concord/core/hash.h>

#include <vector>

namespace concord {
namespace knowledge {

namespace {

std::string Trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

FactApplyResult MakeResult(FactApplyStatus status, const std::string& reason,
                           bool applied, int64_t previous) {
    FactApplyResult result;
    result.status = status;
    result.reason = reason;
    result.applied = applied;
    result.previousVersion = previous;
    return result;
}

} // namespace

const char* FactApplyStatusToString(FactApplyStatus status) {
    switch (status) {
        case FactApplyStatus::Accepted: return "accepted";
        case FactApplyStatus::Stale: return "stale";
        case FactApplyStatus::Conflict: return "conflict";
    }
    return "unknown";
}

FactApplyResult EvaluateFactApply(const Fact* existing, const Fact& incoming) {
    const int64_t latest = existing ? existing->version : 0;

    if (incoming.version <= 0) {
        return MakeResult(FactApplyStatus::Conflict, "invalid_version", false, latest);
    }

    if (existing == nullptr) {
        if (incoming.version != 1) {
            return MakeResult(FactApplyStatus::Conflict, "new_fact_must_start_at_v1", false, 0);
        }
        return MakeResult(FactApplyStatus::Accepted, "new_fact", true, 0);
    }

    if (incoming.version == latest + 1) {
        return MakeResult(FactApplyStatus::Accepted, "sequential_update", true, latest);
    }

    if (incoming.version == latest) {
        if (incoming.SameContent(*existing)) {
            return MakeResult(FactApplyStatus::Stale, "duplicate", false, latest);
        }
        bool incomingWins = incoming.source < existing->source;
        return MakeResult(FactApplyStatus::Conflict, "same_version_race", incomingWins, latest);
    }

    if (incoming.version < latest) {
        return MakeResult(FactApplyStatus::Stale, "stale_version", false, latest);
    }

    return MakeResult(FactApplyStatus::Conflict,
                      "version_gap_" + std::to_string(latest) + "_to_" +
                          std::to_string(incoming.version),
                      false, latest);
}

std::string MakeFactId(const std::string& group,
                       const std::string& subject,
                       const std::string& predicate) {
    std::string material;
    material.reserve(group.size() + subject.size() + predicate.size() + 2);
    material.append(group);
    material.push_back('\0');
    material.append(subject);
    material.push_back('\0');
    material.append(predicate);
    return "fact-" + Sha256Hex(material).substr(0, 16);
}

std::string DecisionSource(const std::string& proposalId) {
    return "decision:" + proposalId;
}

FactTriple ParseStatement(const Proposal& proposal) {
    std::vector<std::string> parts;
    size_t start = 0;
    const std::string& statement = proposal.statement;
    while (true) {
        size_t bar = statement.find('|', start);
        if (bar == std::string::npos) {
            parts.push_back(Trim(statement.substr(start)));
            break;
        }
        parts.push_back(Trim(statement.substr(start, bar - start)));
        start = bar + 1;
    }

    if (parts.size() == 3 && !parts[0].empty() && !parts[1].empty() && !parts[2].empty()) {
        return FactTriple{parts[0], parts[1], parts[2]};
    }

    FactTriple triple;
    triple.subject = Trim(proposal.title).empty() ? proposal.id : Trim(proposal.title);
    triple.predicate = "states";
    triple.object = Trim(proposal.statement);
    return triple;
}

Fact DeriveFact(const Proposal& proposal, int64_t version, util::TimePoint now) {
    FactTriple triple = ParseStatement(proposal);
    Fact fact;
    fact.group = proposal.group;
    fact.subject = triple.subject;
    fact.predicate = triple.predicate;
    fact.object = triple.object;
    fact.id = MakeFactId(fact.group, fact.subject, fact.predicate);
    fact.version = version;
    fact.source = DecisionSource(proposal.id);
    fact.proposalId = proposal.id;
    fact.tags = proposal.tags;
    fact.createdAt = now;
    return fact;
}

} // namespace knowledge
} // namespace concord
