// CONCORD - Knowledge Topic Names Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/knowledge/topics.h>

namespace concord {
namespace knowledge {

Topics Topics::ForGroup(const std::string& group) {
    const std::string base = group + ".knowledge.";
    Topics t;
    t.proposals = base + "proposals";
    t.votes = base + "votes";
    t.decisions = base + "decisions";
    t.facts = base + "facts";
    t.presence = base + "presence";
    t.capabilities = base + "capabilities";
    return t;
}

const std::string& Topics::ForType(EnvelopeType type) const {
    switch (type) {
        case EnvelopeType::Proposal: return proposals;
        case EnvelopeType::Vote: return votes;
        case EnvelopeType::Decision: return decisions;
        case EnvelopeType::Fact: return facts;
        case EnvelopeType::Presence: return presence;
        case EnvelopeType::Capabilities: return capabilities;
    }
    return proposals;
}

std::optional<EnvelopeType> Topics::TypeOf(const std::string& topic) const {
    for (EnvelopeType type : {EnvelopeType::Proposal, EnvelopeType::Vote, EnvelopeType::Decision,
                              EnvelopeType::Fact, EnvelopeType::Presence, EnvelopeType::Capabilities}) {
        if (ForType(type) == topic) {
            return type;
        }
    }
    return std::nullopt;
}

std::vector<std::string> Topics::All() const {
    return {proposals, votes, decisions, facts, presence, capabilities};
}

} // namespace knowledge
} // namespace concord
