// CONCORD - Knowledge Data Model
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Proposals, votes, facts and group roster entries shared by the store,
// the quorum evaluator and the fact resolver.

#ifndef CONCORD_KNOWLEDGE_TYPES_H
#define CONCORD_KNOWLEDGE_TYPES_H

#include <concord/core/serialize.h>
#include <concord/util/time.h>

#include <cstdint>
#include <ios>
#include <optional>
#include <string>
#include <vector>

namespace concord {
namespace knowledge {

// ============================================================================
// Enumerations
// ============================================================================

/// Proposal lifecycle. Every status except Pending is terminal.
enum class ProposalStatus {
    Pending = 0,
    Approved = 1,
    Rejected = 2,
    Expired = 3
};

const char* ProposalStatusToString(ProposalStatus status);
std::optional<ProposalStatus> ParseProposalStatus(const std::string& str);

inline bool IsTerminal(ProposalStatus status) {
    return status != ProposalStatus::Pending;
}

enum class VoteValue {
    Yes = 0,
    No = 1
};

const char* VoteValueToString(VoteValue value);

/// Accepts "yes"/"no" in any case, surrounding whitespace ignored
std::optional<VoteValue> ParseVoteValue(const std::string& str);

// ============================================================================
// Records
// ============================================================================

struct Proposal {
    std::string id;
    std::string group;
    std::string title;
    std::string statement;
    std::vector<std::string> tags;
    std::string proposerId;         ///< claw id of the proposer
    std::string proposerInstance;   ///< instance id of the proposer (optional)
    std::string traceId;
    ProposalStatus status{ProposalStatus::Pending};
    util::TimePoint createdAt;
    util::TimePoint decidedAt;
    int32_t yes{0};
    int32_t no{0};
    std::string reason;
};

/// Unique per (proposalId, voterId); a re-vote replaces the earlier value
struct Vote {
    std::string proposalId;
    std::string voterId;
    VoteValue value{VoteValue::Yes};
    std::string reason;
    std::string traceId;
    util::TimePoint updatedAt;
};

/// A versioned statement about (group, subject, predicate)
struct Fact {
    std::string id;
    std::string group;
    std::string subject;
    std::string predicate;
    std::string object;
    int64_t version{0};
    std::string source;             ///< e.g. "decision:<proposalId>"
    std::string proposalId;
    std::vector<std::string> tags;
    util::TimePoint createdAt;

    /// Same statement from the same source (version and timestamps ignored)
    bool SameContent(const Fact& other) const {
        return object == other.object && source == other.source;
    }
};

/// Group roster entry maintained from presence envelopes
struct GroupMember {
    std::string group;
    std::string clawId;
    std::string instanceId;
    bool active{true};
    util::TimePoint lastSeen;
};

// ============================================================================
// Serialization
// ============================================================================

namespace detail {

template<typename Stream>
void SerializeTime(Stream& s, util::TimePoint tp) {
    Serialize(s, util::ToUnixMillis(tp));
}

template<typename Stream>
void UnserializeTime(Stream& s, util::TimePoint& tp) {
    int64_t ms = 0;
    Unserialize(s, ms);
    tp = util::FromUnixMillis(ms);
}

template<typename Stream, typename Enum>
void UnserializeEnum(Stream& s, Enum& value, uint32_t maxValue) {
    uint32_t raw = 0;
    Unserialize(s, raw);
    if (raw > maxValue) {
        throw std::ios_base::failure("enum value out of range");
    }
    value = static_cast<Enum>(raw);
}

} // namespace detail

template<typename Stream>
void Serialize(Stream& s, const Proposal& p) {
    Serialize(s, p.id);
    Serialize(s, p.group);
    Serialize(s, p.title);
    Serialize(s, p.statement);
    Serialize(s, p.tags);
    Serialize(s, p.proposerId);
    Serialize(s, p.proposerInstance);
    Serialize(s, p.traceId);
    Serialize(s, static_cast<uint32_t>(p.status));
    detail::SerializeTime(s, p.createdAt);
    detail::SerializeTime(s, p.decidedAt);
    Serialize(s, p.yes);
    Serialize(s, p.no);
    Serialize(s, p.reason);
}

template<typename Stream>
void Unserialize(Stream& s, Proposal& p) {
    Unserialize(s, p.id);
    Unserialize(s, p.group);
    Unserialize(s, p.title);
    Unserialize(s, p.statement);
    Unserialize(s, p.tags);
    Unserialize(s, p.proposerId);
    Unserialize(s, p.proposerInstance);
    Unserialize(s, p.traceId);
    detail::UnserializeEnum(s, p.status, static_cast<uint32_t>(ProposalStatus::Expired));
    detail::UnserializeTime(s, p.createdAt);
    detail::UnserializeTime(s, p.decidedAt);
    Unserialize(s, p.yes);
    Unserialize(s, p.no);
    Unserialize(s, p.reason);
}

template<typename Stream>
void Serialize(Stream& s, const Vote& v) {
    Serialize(s, v.proposalId);
    Serialize(s, v.voterId);
    Serialize(s, static_cast<uint32_t>(v.value));
    Serialize(s, v.reason);
    Serialize(s, v.traceId);
    detail::SerializeTime(s, v.updatedAt);
}

template<typename Stream>
void Unserialize(Stream& s, Vote& v) {
    Unserialize(s, v.proposalId);
    Unserialize(s, v.voterId);
    detail::UnserializeEnum(s, v.value, static_cast<uint32_t>(VoteValue::No));
    Unserialize(s, v.reason);
    Unserialize(s, v.traceId);
    detail::UnserializeTime(s, v.updatedAt);
}

template<typename Stream>
void Serialize(Stream& s, const Fact& f) {
    Serialize(s, f.id);
    Serialize(s, f.group);
    Serialize(s, f.subject);
    Serialize(s, f.predicate);
    Serialize(s, f.object);
    Serialize(s, f.version);
    Serialize(s, f.source);
    Serialize(s, f.proposalId);
    Serialize(s, f.tags);
    detail::SerializeTime(s, f.createdAt);
}

template<typename Stream>
void Unserialize(Stream& s, Fact& f) {
    Unserialize(s, f.id);
    Unserialize(s, f.group);
    Unserialize(s, f.subject);
    Unserialize(s, f.predicate);
    Unserialize(s, f.object);
    Unserialize(s, f.version);
    Unserialize(s, f.source);
    Unserialize(s, f.proposalId);
    Unserialize(s, f.tags);
    detail::UnserializeTime(s, f.createdAt);
}

template<typename Stream>
void Serialize(Stream& s, const GroupMember& m) {
    Serialize(s, m.group);
    Serialize(s, m.clawId);
    Serialize(s, m.instanceId);
    Serialize(s, m.active);
    detail::SerializeTime(s, m.lastSeen);
}

template<typename Stream>
void Unserialize(Stream& s, GroupMember& m) {
    Unserialize(s, m.group);
    Unserialize(s, m.clawId);
    Unserialize(s, m.instanceId);
    Unserialize(s, m.active);
    detail::UnserializeTime(s, m.lastSeen);
}

} // namespace knowledge
} // namespace concord

#endif // CONCORD_KNOWLEDGE_TYPES_H
