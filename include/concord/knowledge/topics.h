// CONCORD - Knowledge Topic Names
// Copyright (c) 2024 CONCORD Developers
// MIT License

#ifndef CONCORD_KNOWLEDGE_TOPICS_H
#define CONCORD_KNOWLEDGE_TOPICS_H

#include <concord/knowledge/envelope.h>

#include <optional>
#include <string>
#include <vector>

namespace concord {
namespace knowledge {

/// Topic set of one group: "{group}.knowledge.{proposals|votes|...}"
struct Topics {
    std::string proposals;
    std::string votes;
    std::string decisions;
    std::string facts;
    std::string presence;
    std::string capabilities;

    static Topics ForGroup(const std::string& group);

    const std::string& ForType(EnvelopeType type) const;

    /// Envelope type carried on `topic`, if it is one of ours
    std::optional<EnvelopeType> TypeOf(const std::string& topic) const;

    std::vector<std::string> All() const;
};

} // namespace knowledge
} // namespace concord

#endif // CONCORD_KNOWLEDGE_TOPICS_H
