// CONCORD - Knowledge Envelope Codec Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/knowledge/envelope.h>
#include <concord/knowledge/types.h>

#include <algorithm>
#include <cctype>

namespace concord {
namespace knowledge {

namespace {

std::string Trim(const std::string& str) {
    size_t start = str.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = str.find_last_not_of(" \t\r\n");
    return str.substr(start, end - start + 1);
}

bool Blank(const std::string& str) {
    return Trim(str).empty();
}

std::string Lower(const std::string& str) {
    std::string out = Trim(str);
    std::transform(out.begin(), out.end(), out.begin(), ::tolower);
    return out;
}

/// Fetch a string member; absent members read as empty, wrong types fail
bool ReadString(const util::JSONValue& obj, const char* key, std::string* out) {
    if (!obj.HasKey(key) || obj[key].IsNull()) {
        out->clear();
        return true;
    }
    if (!obj[key].IsString()) {
        return false;
    }
    *out = obj[key].GetString();
    return true;
}

bool ReadInt(const util::JSONValue& obj, const char* key, int64_t* out) {
    if (!obj.HasKey(key) || obj[key].IsNull()) {
        *out = 0;
        return true;
    }
    if (!obj[key].IsInt()) {
        return false;
    }
    *out = obj[key].GetInt();
    return true;
}

bool ReadStrings(const util::JSONValue& obj, const char* key, std::vector<std::string>* out) {
    out->clear();
    if (!obj.HasKey(key) || obj[key].IsNull()) {
        return true;
    }
    if (!obj[key].IsArray()) {
        return false;
    }
    for (size_t i = 0; i < obj[key].Size(); ++i) {
        if (!obj[key][i].IsString()) {
            return false;
        }
        out->push_back(obj[key][i].GetString());
    }
    return true;
}

Status FieldError(const char* type, const char* key) {
    return Status::InvalidArgument(std::string(type) + " payload: field '" + key + "' has the wrong type");
}

// ============================================================================
// Per-type decoders
// ============================================================================

Status DecodeProposal(const util::JSONValue& json, Payload* out) {
    ProposalPayload p;
    if (!ReadString(json, "proposalId", &p.proposalId)) return FieldError("proposal", "proposalId");
    if (!ReadString(json, "group", &p.group)) return FieldError("proposal", "group");
    if (!ReadString(json, "title", &p.title)) return FieldError("proposal", "title");
    if (!ReadString(json, "statement", &p.statement)) return FieldError("proposal", "statement");
    if (!ReadStrings(json, "tags", &p.tags)) return FieldError("proposal", "tags");
    *out = std::move(p);
    return Status::Ok();
}

Status DecodeVote(const util::JSONValue& json, Payload* out) {
    VotePayload p;
    if (!ReadString(json, "proposalId", &p.proposalId)) return FieldError("vote", "proposalId");
    if (!ReadString(json, "vote", &p.vote)) return FieldError("vote", "vote");
    if (!ReadString(json, "reason", &p.reason)) return FieldError("vote", "reason");
    *out = std::move(p);
    return Status::Ok();
}

Status DecodeDecision(const util::JSONValue& json, Payload* out) {
    DecisionPayload p;
    if (!ReadString(json, "proposalId", &p.proposalId)) return FieldError("decision", "proposalId");
    if (!ReadString(json, "outcome", &p.outcome)) return FieldError("decision", "outcome");
    if (!ReadInt(json, "yes", &p.yes)) return FieldError("decision", "yes");
    if (!ReadInt(json, "no", &p.no)) return FieldError("decision", "no");
    if (!ReadString(json, "reason", &p.reason)) return FieldError("decision", "reason");
    *out = std::move(p);
    return Status::Ok();
}

Status DecodeFact(const util::JSONValue& json, Payload* out) {
    FactPayload p;
    if (!ReadString(json, "factId", &p.factId)) return FieldError("fact", "factId");
    if (!ReadString(json, "group", &p.group)) return FieldError("fact", "group");
    if (!ReadString(json, "subject", &p.subject)) return FieldError("fact", "subject");
    if (!ReadString(json, "predicate", &p.predicate)) return FieldError("fact", "predicate");
    if (!ReadString(json, "object", &p.object)) return FieldError("fact", "object");
    if (!ReadInt(json, "version", &p.version)) return FieldError("fact", "version");
    if (!ReadString(json, "source", &p.source)) return FieldError("fact", "source");
    if (!ReadString(json, "proposalId", &p.proposalId)) return FieldError("fact", "proposalId");
    if (!ReadString(json, "decisionId", &p.decisionId)) return FieldError("fact", "decisionId");
    if (!ReadStrings(json, "tags", &p.tags)) return FieldError("fact", "tags");
    *out = std::move(p);
    return Status::Ok();
}

Status DecodePresence(const util::JSONValue& json, Payload* out) {
    PresencePayload p;
    if (!ReadString(json, "status", &p.status)) return FieldError("presence", "status");
    if (!ReadString(json, "group", &p.group)) return FieldError("presence", "group");
    *out = std::move(p);
    return Status::Ok();
}

Status DecodeCapabilities(const util::JSONValue& json, Payload* out) {
    CapabilitiesPayload p;
    if (!ReadStrings(json, "capabilities", &p.capabilities)) {
        return FieldError("capabilities", "capabilities");
    }
    *out = std::move(p);
    return Status::Ok();
}

// ============================================================================
// Per-type encoders
// ============================================================================

struct PayloadEncoder {
    util::JSONValue operator()(const ProposalPayload& p) const {
        util::JSONValue::Object obj;
        obj["proposalId"] = p.proposalId;
        obj["group"] = p.group;
        obj["title"] = p.title;
        obj["statement"] = p.statement;
        if (!p.tags.empty()) obj["tags"] = util::JSONValue::FromStrings(p.tags);
        return util::JSONValue(std::move(obj));
    }

    util::JSONValue operator()(const VotePayload& p) const {
        util::JSONValue::Object obj;
        obj["proposalId"] = p.proposalId;
        obj["vote"] = p.vote;
        if (!p.reason.empty()) obj["reason"] = p.reason;
        return util::JSONValue(std::move(obj));
    }

    util::JSONValue operator()(const DecisionPayload& p) const {
        util::JSONValue::Object obj;
        obj["proposalId"] = p.proposalId;
        obj["outcome"] = p.outcome;
        obj["yes"] = p.yes;
        obj["no"] = p.no;
        if (!p.reason.empty()) obj["reason"] = p.reason;
        return util::JSONValue(std::move(obj));
    }

    util::JSONValue operator()(const FactPayload& p) const {
        util::JSONValue::Object obj;
        obj["factId"] = p.factId;
        obj["group"] = p.group;
        obj["subject"] = p.subject;
        obj["predicate"] = p.predicate;
        obj["object"] = p.object;
        obj["version"] = p.version;
        obj["source"] = p.source;
        if (!p.proposalId.empty()) obj["proposalId"] = p.proposalId;
        if (!p.decisionId.empty()) obj["decisionId"] = p.decisionId;
        if (!p.tags.empty()) obj["tags"] = util::JSONValue::FromStrings(p.tags);
        return util::JSONValue(std::move(obj));
    }

    util::JSONValue operator()(const PresencePayload& p) const {
        util::JSONValue::Object obj;
        obj["status"] = p.status;
        if (!p.group.empty()) obj["group"] = p.group;
        return util::JSONValue(std::move(obj));
    }

    util::JSONValue operator()(const CapabilitiesPayload& p) const {
        util::JSONValue::Object obj;
        obj["capabilities"] = util::JSONValue::FromStrings(p.capabilities);
        return util::JSONValue(std::move(obj));
    }
};

} // namespace

// ============================================================================
// Envelope Types
// ============================================================================

const char* EnvelopeTypeToString(EnvelopeType type) {
    switch (type) {
        case EnvelopeType::Proposal: return "proposal";
        case EnvelopeType::Vote: return "vote";
        case EnvelopeType::Decision: return "decision";
        case EnvelopeType::Fact: return "fact";
        case EnvelopeType::Presence: return "presence";
        case EnvelopeType::Capabilities: return "capabilities";
    }
    return "unknown";
}

std::optional<EnvelopeType> ParseEnvelopeType(const std::string& str) {
    if (str == "proposal") return EnvelopeType::Proposal;
    if (str == "vote") return EnvelopeType::Vote;
    if (str == "decision") return EnvelopeType::Decision;
    if (str == "fact") return EnvelopeType::Fact;
    if (str == "presence") return EnvelopeType::Presence;
    if (str == "capabilities") return EnvelopeType::Capabilities;
    return std::nullopt;
}

bool IsGovernedType(EnvelopeType type) {
    return type == EnvelopeType::Proposal || type == EnvelopeType::Vote ||
           type == EnvelopeType::Decision || type == EnvelopeType::Fact;
}

// ============================================================================
// Payload Validation
// ============================================================================

std::string ProposalPayload::Validate() const {
    if (Blank(proposalId)) return "proposalId is required";
    if (Blank(group)) return "group is required";
    if (Blank(statement)) return "statement is required";
    return "";
}

std::string VotePayload::Validate() const {
    if (Blank(proposalId)) return "proposalId is required";
    if (!ParseVoteValue(vote)) return "vote must be yes|no";
    return "";
}

std::string DecisionPayload::Validate() const {
    if (Blank(proposalId)) return "proposalId is required";
    std::string o = Lower(outcome);
    if (o != "approved" && o != "rejected" && o != "expired") {
        return "outcome must be approved|rejected|expired";
    }
    if (yes < 0 || no < 0) return "yes/no must be >= 0";
    return "";
}

std::string FactPayload::Validate() const {
    if (Blank(factId)) return "factId is required";
    if (Blank(group)) return "group is required";
    if (Blank(subject) || Blank(predicate) || Blank(object)) {
        return "subject/predicate/object are required";
    }
    if (version <= 0) return "version must be > 0";
    if (Blank(source)) return "source is required";
    return "";
}

std::string PresencePayload::Validate() const {
    std::string s = Lower(status);
    if (s != "join" && s != "heartbeat" && s != "leave") {
        return "status must be join|heartbeat|leave";
    }
    return "";
}

std::string CapabilitiesPayload::Validate() const {
    for (const auto& c : capabilities) {
        if (Blank(c)) return "capabilities must not contain empty entries";
    }
    return "";
}

EnvelopeType PayloadType(const Payload& payload) {
    return static_cast<EnvelopeType>(payload.index());
}

std::string ValidatePayload(const Payload& payload) {
    return std::visit([](const auto& p) { return p.Validate(); }, payload);
}

util::JSONValue PayloadToJSON(const Payload& payload) {
    return std::visit(PayloadEncoder{}, payload);
}

// ============================================================================
// Envelope
// ============================================================================

Status ValidateBase(const Envelope& envelope) {
    if (Blank(envelope.schemaVersion)) {
        return Status::InvalidArgument("schemaVersion is required");
    }
    if (envelope.schemaVersion != CURRENT_SCHEMA_VERSION) {
        return Status::InvalidArgument("unsupported schemaVersion: " + envelope.schemaVersion);
    }
    if (Blank(envelope.type)) {
        return Status::InvalidArgument("type is required");
    }
    if (Blank(envelope.traceId)) {
        return Status::InvalidArgument("traceId is required");
    }
    if (util::IsZero(envelope.timestamp)) {
        return Status::InvalidArgument("timestamp is required");
    }
    if (Blank(envelope.idempotencyKey)) {
        return Status::InvalidArgument("idempotencyKey is required");
    }
    if (Blank(envelope.originId)) {
        return Status::InvalidArgument("originId is required");
    }
    if (!ParseEnvelopeType(envelope.type)) {
        return Status::InvalidArgument("unsupported type: " + envelope.type);
    }
    return Status::Ok();
}

Status Validate(const Envelope& envelope) {
    Status s = ValidateBase(envelope);
    if (!s.ok()) {
        return s;
    }
    EnvelopeType declared = *ParseEnvelopeType(envelope.type);
    if (PayloadType(envelope.payload) != declared) {
        return Status::InvalidArgument(std::string("payload does not match type ") + envelope.type);
    }
    std::string problem = ValidatePayload(envelope.payload);
    if (!problem.empty()) {
        return Status::InvalidArgument(envelope.type + " payload: " + problem);
    }
    return Status::Ok();
}

Envelope MakeEnvelope(Payload payload,
                      const std::string& traceId,
                      const std::string& idempotencyKey,
                      const std::string& originId,
                      const std::string& instanceId,
                      util::TimePoint now) {
    Envelope envelope;
    envelope.type = EnvelopeTypeToString(PayloadType(payload));
    envelope.traceId = traceId;
    envelope.timestamp = now;
    envelope.idempotencyKey = idempotencyKey;
    envelope.originId = originId;
    envelope.instanceId = instanceId;
    envelope.payload = std::move(payload);
    return envelope;
}

util::JSONValue EnvelopeToJSON(const Envelope& envelope) {
    util::JSONValue::Object obj;
    obj["schemaVersion"] = envelope.schemaVersion;
    obj["type"] = envelope.type;
    obj["traceId"] = envelope.traceId;
    obj["timestamp"] = util::FormatISO8601Millis(envelope.timestamp);
    obj["idempotencyKey"] = envelope.idempotencyKey;
    obj["originId"] = envelope.originId;
    if (!envelope.instanceId.empty()) {
        obj["instanceId"] = envelope.instanceId;
    }
    obj["payload"] = PayloadToJSON(envelope.payload);
    return util::JSONValue(std::move(obj));
}

std::string EncodeEnvelope(const Envelope& envelope) {
    return EnvelopeToJSON(envelope).ToJSON();
}

// ============================================================================
// Payload Decoder Registry
// ============================================================================

const PayloadDecoderRegistry& PayloadDecoderRegistry::Default() {
    static const PayloadDecoderRegistry registry = [] {
        PayloadDecoderRegistry r;
        r.Register("proposal", DecodeProposal);
        r.Register("vote", DecodeVote);
        r.Register("decision", DecodeDecision);
        r.Register("fact", DecodeFact);
        r.Register("presence", DecodePresence);
        r.Register("capabilities", DecodeCapabilities);
        return r;
    }();
    return registry;
}

void PayloadDecoderRegistry::Register(const std::string& type, Decoder decoder) {
    decoders_[type] = std::move(decoder);
}

bool PayloadDecoderRegistry::Has(const std::string& type) const {
    return decoders_.count(type) > 0;
}

Status PayloadDecoderRegistry::Decode(const std::string& type, const util::JSONValue& json,
                                      Payload* out) const {
    auto it = decoders_.find(type);
    if (it == decoders_.end()) {
        return Status::InvalidArgument("no decoder for type: " + type);
    }
    if (!json.IsObject()) {
        return Status::InvalidArgument(type + " payload must be an object");
    }
    return it->second(json, out);
}

Status DecodeEnvelope(const std::string& raw, Envelope* out,
                      const PayloadDecoderRegistry& registry) {
    std::optional<util::JSONValue> parsed = util::JSONValue::TryParse(raw);
    if (!parsed || !parsed->IsObject()) {
        return Status::InvalidArgument("envelope is not a JSON object");
    }
    const util::JSONValue& json = *parsed;

    Envelope envelope;
    std::string timestamp;
    if (!ReadString(json, "schemaVersion", &envelope.schemaVersion) ||
        !ReadString(json, "type", &envelope.type) ||
        !ReadString(json, "traceId", &envelope.traceId) ||
        !ReadString(json, "timestamp", &timestamp) ||
        !ReadString(json, "idempotencyKey", &envelope.idempotencyKey) ||
        !ReadString(json, "originId", &envelope.originId) ||
        !ReadString(json, "instanceId", &envelope.instanceId)) {
        return Status::InvalidArgument("envelope header field has the wrong type");
    }
    if (!timestamp.empty() && !util::ParseISO8601(timestamp, &envelope.timestamp)) {
        return Status::InvalidArgument("timestamp is not ISO-8601: " + timestamp);
    }

    Status s = ValidateBase(envelope);
    if (!s.ok()) {
        return s;
    }

    s = registry.Decode(envelope.type, json["payload"], &envelope.payload);
    if (!s.ok()) {
        return s;
    }

    s = Validate(envelope);
    if (!s.ok()) {
        return s;
    }
    *out = std::move(envelope);
    return Status::Ok();
}

// ============================================================================
// Idempotency Keys
// ============================================================================

std::string ProposalIdempotencyKey(const std::string& proposalId) {
    return "knowledge:proposal:" + proposalId;
}

std::string VoteIdempotencyKey(const std::string& proposalId, const std::string& voterId) {
    return "knowledge:vote:" + proposalId + ":" + voterId;
}

std::string DecisionIdempotencyKey(const std::string& proposalId) {
    return "knowledge:decision:" + proposalId;
}

std::string FactIdempotencyKey(const std::string& factId, int64_t version) {
    return "knowledge:fact:" + factId + ":v" + std::to_string(version);
}

std::string PresenceIdempotencyKey(const std::string& clawId, util::TimePoint at) {
    return "knowledge:presence:" + clawId + ":" + std::to_string(util::ToUnixMillis(at));
}

} // namespace knowledge
} // namespace concord
