// CONCORD - Envelope Codec Tests
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <gtest/gtest.h>
#include <concord/knowledge/envelope.h>

using namespace concord;
using namespace concord::knowledge;

namespace {

const util::TimePoint kNow = util::FromUnixMillis(1700000000123);

Envelope VoteEnvelope(const std::string& vote = "yes") {
    VotePayload p;
    p.proposalId = "kp-1";
    p.vote = vote;
    p.reason = "looks right";
    return MakeEnvelope(p, "tr-1", VoteIdempotencyKey("kp-1", "claw-b"), "claw-b", "inst-1", kNow);
}

std::string Reencode(const std::string& raw, const std::string& key, util::JSONValue value) {
    util::JSONValue json = util::JSONValue::Parse(raw);
    json[key] = std::move(value);
    return json.ToJSON();
}

} // namespace

// ============================================================================
// Types
// ============================================================================

TEST(EnvelopeTypeTest, NamesRoundTrip) {
    for (EnvelopeType type : {EnvelopeType::Proposal, EnvelopeType::Vote, EnvelopeType::Decision,
                              EnvelopeType::Fact, EnvelopeType::Presence, EnvelopeType::Capabilities}) {
        auto parsed = ParseEnvelopeType(EnvelopeTypeToString(type));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, type);
    }
    EXPECT_FALSE(ParseEnvelopeType("Vote").has_value());
    EXPECT_FALSE(ParseEnvelopeType("ballot").has_value());
}

TEST(EnvelopeTypeTest, GovernedTypes) {
    EXPECT_TRUE(IsGovernedType(EnvelopeType::Proposal));
    EXPECT_TRUE(IsGovernedType(EnvelopeType::Fact));
    EXPECT_FALSE(IsGovernedType(EnvelopeType::Presence));
    EXPECT_FALSE(IsGovernedType(EnvelopeType::Capabilities));
}

// ============================================================================
// Validation
// ============================================================================

TEST(EnvelopeValidateTest, WellFormedEnvelopePasses) {
    Envelope e = VoteEnvelope();
    EXPECT_EQ(e.type, "vote");
    EXPECT_EQ(e.schemaVersion, CURRENT_SCHEMA_VERSION);
    EXPECT_TRUE(Validate(e).ok());
}

TEST(EnvelopeValidateTest, MissingHeaderFields) {
    Envelope e = VoteEnvelope();
    e.traceId = " ";
    EXPECT_TRUE(ValidateBase(e).IsInvalidArgument());

    e = VoteEnvelope();
    e.idempotencyKey.clear();
    EXPECT_TRUE(ValidateBase(e).IsInvalidArgument());

    e = VoteEnvelope();
    e.originId.clear();
    EXPECT_TRUE(ValidateBase(e).IsInvalidArgument());

    e = VoteEnvelope();
    e.timestamp = util::TimePoint();
    EXPECT_TRUE(ValidateBase(e).IsInvalidArgument());
}

TEST(EnvelopeValidateTest, UnknownSchemaOrType) {
    Envelope e = VoteEnvelope();
    e.schemaVersion = "v2";
    Status s = ValidateBase(e);
    EXPECT_TRUE(s.IsInvalidArgument());
    EXPECT_NE(s.message().find("v2"), std::string::npos);

    e = VoteEnvelope();
    e.type = "ballot";
    EXPECT_TRUE(ValidateBase(e).IsInvalidArgument());
}

TEST(EnvelopeValidateTest, PayloadMustMatchType) {
    Envelope e = VoteEnvelope();
    e.type = "proposal";
    EXPECT_TRUE(ValidateBase(e).ok());
    EXPECT_TRUE(Validate(e).IsInvalidArgument());
}

TEST(EnvelopeValidateTest, PayloadRules) {
    EXPECT_TRUE(Validate(VoteEnvelope("maybe")).IsInvalidArgument());
    EXPECT_TRUE(Validate(VoteEnvelope(" NO ")).ok());

    DecisionPayload d;
    d.proposalId = "kp-1";
    d.outcome = "pending";
    EXPECT_FALSE(d.Validate().empty());
    d.outcome = "Approved";
    EXPECT_TRUE(d.Validate().empty());
    d.no = -1;
    EXPECT_FALSE(d.Validate().empty());

    FactPayload f;
    f.factId = "fact-1";
    f.group = "ops";
    f.subject = "db";
    f.predicate = "uses";
    f.object = "leveldb";
    f.source = "decision:kp-1";
    EXPECT_FALSE(f.Validate().empty());
    f.version = 1;
    EXPECT_TRUE(f.Validate().empty());

    PresencePayload p;
    p.status = "away";
    EXPECT_FALSE(p.Validate().empty());
    p.status = "heartbeat";
    EXPECT_TRUE(p.Validate().empty());

    CapabilitiesPayload c;
    c.capabilities = {"vote", ""};
    EXPECT_FALSE(c.Validate().empty());
}

// ============================================================================
// Encode / Decode
// ============================================================================

TEST(EnvelopeCodecTest, WireFieldNames) {
    util::JSONValue json = EnvelopeToJSON(VoteEnvelope());
    EXPECT_EQ(json["schemaVersion"].GetString(), "v1");
    EXPECT_EQ(json["type"].GetString(), "vote");
    EXPECT_EQ(json["traceId"].GetString(), "tr-1");
    EXPECT_EQ(json["timestamp"].GetString(), "2023-11-14T22:13:20.123Z");
    EXPECT_EQ(json["idempotencyKey"].GetString(), "knowledge:vote:kp-1:claw-b");
    EXPECT_EQ(json["originId"].GetString(), "claw-b");
    EXPECT_EQ(json["instanceId"].GetString(), "inst-1");
    EXPECT_EQ(json["payload"]["vote"].GetString(), "yes");
}

TEST(EnvelopeCodecTest, DecodeRestoresEnvelope) {
    std::string raw = EncodeEnvelope(VoteEnvelope());

    Envelope decoded;
    ASSERT_TRUE(DecodeEnvelope(raw, &decoded).ok());
    EXPECT_EQ(decoded.type, "vote");
    EXPECT_EQ(decoded.timestamp, kNow);
    EXPECT_EQ(decoded.instanceId, "inst-1");
    ASSERT_TRUE(std::holds_alternative<VotePayload>(decoded.payload));
    const auto& vote = std::get<VotePayload>(decoded.payload);
    EXPECT_EQ(vote.proposalId, "kp-1");
    EXPECT_EQ(vote.reason, "looks right");
}

TEST(EnvelopeCodecTest, DecodeFactPayload) {
    FactPayload f;
    f.factId = "fact-0011223344556677";
    f.group = "ops";
    f.subject = "db";
    f.predicate = "uses";
    f.object = "leveldb";
    f.version = 2;
    f.source = "decision:kp-1";
    f.tags = {"infra", "storage"};
    std::string raw = EncodeEnvelope(
        MakeEnvelope(f, "tr-1", FactIdempotencyKey(f.factId, 2), "claw-a", "", kNow));

    Envelope decoded;
    ASSERT_TRUE(DecodeEnvelope(raw, &decoded).ok());
    ASSERT_TRUE(std::holds_alternative<FactPayload>(decoded.payload));
    const auto& fact = std::get<FactPayload>(decoded.payload);
    EXPECT_EQ(fact.version, 2);
    EXPECT_EQ(fact.tags, f.tags);
    EXPECT_TRUE(decoded.instanceId.empty());
}

TEST(EnvelopeCodecTest, RejectsMalformedInput) {
    Envelope out;
    EXPECT_TRUE(DecodeEnvelope("not json", &out).IsInvalidArgument());
    EXPECT_TRUE(DecodeEnvelope("[1,2]", &out).IsInvalidArgument());

    std::string raw = EncodeEnvelope(VoteEnvelope());
    EXPECT_TRUE(DecodeEnvelope(Reencode(raw, "timestamp", "yesterday"), &out).IsInvalidArgument());
    EXPECT_TRUE(DecodeEnvelope(Reencode(raw, "traceId", 42), &out).IsInvalidArgument());
    EXPECT_TRUE(DecodeEnvelope(Reencode(raw, "type", "ballot"), &out).IsInvalidArgument());
    EXPECT_TRUE(DecodeEnvelope(Reencode(raw, "schemaVersion", "v9"), &out).IsInvalidArgument());
    EXPECT_TRUE(DecodeEnvelope(Reencode(raw, "payload", "flat"), &out).IsInvalidArgument());
}

TEST(EnvelopeCodecTest, PayloadFieldTypesChecked) {
    std::string raw = EncodeEnvelope(VoteEnvelope());
    util::JSONValue json = util::JSONValue::Parse(raw);
    json["payload"]["vote"] = util::JSONValue(true);

    Envelope out;
    Status s = DecodeEnvelope(json.ToJSON(), &out);
    EXPECT_TRUE(s.IsInvalidArgument());
    EXPECT_NE(s.message().find("vote"), std::string::npos);
}

TEST(EnvelopeCodecTest, FailedDecodeLeavesOutputUntouched) {
    Envelope out = VoteEnvelope();
    out.traceId = "keep";
    ASSERT_FALSE(DecodeEnvelope(Reencode(EncodeEnvelope(VoteEnvelope("maybe")), "x", 1), &out).ok());
    EXPECT_EQ(out.traceId, "keep");
}

// ============================================================================
// Registry
// ============================================================================

TEST(PayloadRegistryTest, DefaultCoversEveryType) {
    const auto& registry = PayloadDecoderRegistry::Default();
    for (const char* type : {"proposal", "vote", "decision", "fact", "presence", "capabilities"}) {
        EXPECT_TRUE(registry.Has(type)) << type;
    }
    EXPECT_FALSE(registry.Has("ballot"));
}

TEST(PayloadRegistryTest, UnregisteredTypeRejected) {
    PayloadDecoderRegistry registry;
    registry.Register("vote", [](const util::JSONValue&, Payload* out) {
        *out = VotePayload{"kp-1", "yes", ""};
        return Status::Ok();
    });

    Envelope out;
    EXPECT_TRUE(DecodeEnvelope(EncodeEnvelope(VoteEnvelope()), &out, registry).ok());

    PresencePayload presence;
    presence.status = "join";
    std::string raw = EncodeEnvelope(MakeEnvelope(presence, "tr-1", "k", "claw-a", "", kNow));
    EXPECT_TRUE(DecodeEnvelope(raw, &out, registry).IsInvalidArgument());
}

// ============================================================================
// Idempotency Keys
// ============================================================================

TEST(IdempotencyKeyTest, Formats) {
    EXPECT_EQ(ProposalIdempotencyKey("kp-1"), "knowledge:proposal:kp-1");
    EXPECT_EQ(VoteIdempotencyKey("kp-1", "claw-b"), "knowledge:vote:kp-1:claw-b");
    EXPECT_EQ(DecisionIdempotencyKey("kp-1"), "knowledge:decision:kp-1");
    EXPECT_EQ(FactIdempotencyKey("fact-1", 3), "knowledge:fact:fact-1:v3");
    EXPECT_EQ(PresenceIdempotencyKey("claw-a", util::FromUnixMillis(5)), "knowledge:presence:claw-a:5");
}
