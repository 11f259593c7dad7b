// CONCORD - Knowledge Envelope Codec
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Versioned wrapper for every message exchanged between peers. The payload
// is a tagged union selected by the envelope type and decoded through a
// type-indexed registry; unknown types are rejected.
//
// Wire format (stable JSON keys):
//   {schemaVersion, type, traceId, timestamp, idempotencyKey, originId,
//    instanceId, payload}

#ifndef CONCORD_KNOWLEDGE_ENVELOPE_H
#define CONCORD_KNOWLEDGE_ENVELOPE_H

#include <concord/core/status.h>
#include <concord/util/json.h>
#include <concord/util/time.h>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace concord {
namespace knowledge {

/// The only schema version this build understands
constexpr const char* CURRENT_SCHEMA_VERSION = "v1";

// ============================================================================
// Envelope Types
// ============================================================================

enum class EnvelopeType {
    Proposal = 0,
    Vote = 1,
    Decision = 2,
    Fact = 3,
    Presence = 4,
    Capabilities = 5
};

const char* EnvelopeTypeToString(EnvelopeType type);
std::optional<EnvelopeType> ParseEnvelopeType(const std::string& str);

/// Types that mutate governance state (rejected while governance is disabled)
bool IsGovernedType(EnvelopeType type);

// ============================================================================
// Payloads
// ============================================================================

struct ProposalPayload {
    std::string proposalId;
    std::string group;
    std::string title;
    std::string statement;
    std::vector<std::string> tags;

    std::string Validate() const;
};

struct VotePayload {
    std::string proposalId;
    std::string vote;               ///< yes|no
    std::string reason;

    std::string Validate() const;
};

struct DecisionPayload {
    std::string proposalId;
    std::string outcome;            ///< approved|rejected|expired
    int64_t yes{0};
    int64_t no{0};
    std::string reason;

    std::string Validate() const;
};

struct FactPayload {
    std::string factId;
    std::string group;
    std::string subject;
    std::string predicate;
    std::string object;
    int64_t version{0};
    std::string source;
    std::string proposalId;
    std::string decisionId;
    std::vector<std::string> tags;

    std::string Validate() const;
};

struct PresencePayload {
    std::string status;             ///< join|heartbeat|leave
    std::string group;

    std::string Validate() const;
};

struct CapabilitiesPayload {
    std::vector<std::string> capabilities;

    std::string Validate() const;
};

/// Alternative order matches EnvelopeType
using Payload = std::variant<ProposalPayload, VotePayload, DecisionPayload,
                             FactPayload, PresencePayload, CapabilitiesPayload>;

EnvelopeType PayloadType(const Payload& payload);

/// Payload-specific validation; empty string when valid
std::string ValidatePayload(const Payload& payload);

util::JSONValue PayloadToJSON(const Payload& payload);

// ============================================================================
// Envelope
// ============================================================================

struct Envelope {
    std::string schemaVersion{CURRENT_SCHEMA_VERSION};
    std::string type;
    std::string traceId;
    util::TimePoint timestamp;
    std::string idempotencyKey;
    std::string originId;           ///< sender claw id
    std::string instanceId;         ///< sender instance id (optional)
    Payload payload;
};

/**
 * Header checks: known schema version, known type, non-empty trace id,
 * idempotency key and origin id, non-zero timestamp.
 * @return INVALID_ARGUMENT naming the first failing field
 */
Status ValidateBase(const Envelope& envelope);

/// ValidateBase plus payload/type agreement and payload validation
Status Validate(const Envelope& envelope);

/// Build an envelope whose type is taken from the payload
Envelope MakeEnvelope(Payload payload,
                      const std::string& traceId,
                      const std::string& idempotencyKey,
                      const std::string& originId,
                      const std::string& instanceId,
                      util::TimePoint now);

util::JSONValue EnvelopeToJSON(const Envelope& envelope);

/// Compact JSON encoding of a validated envelope
std::string EncodeEnvelope(const Envelope& envelope);

// ============================================================================
// Payload Decoder Registry
// ============================================================================

class PayloadDecoderRegistry {
public:
    using Decoder = std::function<Status(const util::JSONValue&, Payload*)>;

    /// Registry with decoders for every EnvelopeType
    static const PayloadDecoderRegistry& Default();

    void Register(const std::string& type, Decoder decoder);
    bool Has(const std::string& type) const;

    /// INVALID_ARGUMENT for an unregistered type or a malformed payload
    Status Decode(const std::string& type, const util::JSONValue& json, Payload* out) const;

private:
    std::map<std::string, Decoder> decoders_;
};

/**
 * Parse and validate a raw JSON envelope.
 * @return INVALID_ARGUMENT for malformed JSON, a failed ValidateBase, an
 *         unknown type or an invalid payload
 */
Status DecodeEnvelope(const std::string& raw, Envelope* out,
                      const PayloadDecoderRegistry& registry = PayloadDecoderRegistry::Default());

// ============================================================================
// Idempotency Keys
// ============================================================================

std::string ProposalIdempotencyKey(const std::string& proposalId);
std::string VoteIdempotencyKey(const std::string& proposalId, const std::string& voterId);
std::string DecisionIdempotencyKey(const std::string& proposalId);
std::string FactIdempotencyKey(const std::string& factId, int64_t version);
std::string PresenceIdempotencyKey(const std::string& clawId, util::TimePoint at);

} // namespace knowledge
} // namespace concord

#endif // CONCORD_KNOWLEDGE_ENVELOPE_H
