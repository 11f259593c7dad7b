// CONCORD - JSON Value Tests
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <gtest/gtest.h>
#include <concord/util/json.h>

#include <stdexcept>

using namespace concord::util;

// ============================================================================
// Construction and Access
// ============================================================================

TEST(JSONValueTest, ScalarTypes) {
    EXPECT_TRUE(JSONValue().IsNull());
    EXPECT_TRUE(JSONValue(true).IsBool());
    EXPECT_TRUE(JSONValue(int64_t(5)).IsInt());
    EXPECT_TRUE(JSONValue(1.5).IsNumber());
    EXPECT_TRUE(JSONValue("x").IsString());
}

TEST(JSONValueTest, TypedGettersFallBack) {
    JSONValue s("text");
    EXPECT_EQ(s.GetInt(7), 7);
    EXPECT_FALSE(s.GetBool());
    EXPECT_EQ(JSONValue(int64_t(3)).GetString("def"), "def");
    EXPECT_EQ(JSONValue(2.9).GetInt(), 2);
}

TEST(JSONValueTest, ObjectAccess) {
    JSONValue obj;
    obj["type"] = "vote";
    obj["yes"] = 2;

    EXPECT_TRUE(obj.IsObject());
    EXPECT_TRUE(obj.HasKey("type"));
    EXPECT_FALSE(obj.HasKey("no"));
    EXPECT_EQ(obj["type"].GetString(), "vote");

    const JSONValue& c = obj;
    EXPECT_TRUE(c["missing"].IsNull());
}

TEST(JSONValueTest, StringArrays) {
    JSONValue arr = JSONValue::FromStrings({"a", "b"});
    arr.Push(JSONValue(int64_t(1)));
    EXPECT_EQ(arr.Size(), 3u);
    auto strings = arr.GetStrings();
    ASSERT_EQ(strings.size(), 2u);
    EXPECT_EQ(strings[1], "b");
    EXPECT_TRUE(arr[10].IsNull());
}

// ============================================================================
// Serialization
// ============================================================================

TEST(JSONValueTest, CompactOutputSortsKeys) {
    JSONValue obj;
    obj["b"] = 1;
    obj["a"] = "x";
    obj["c"] = JSONValue();
    EXPECT_EQ(obj.ToJSON(), "{\"a\":\"x\",\"b\":1,\"c\":null}");
}

TEST(JSONValueTest, EscapesControlCharacters) {
    JSONValue v(std::string("line\n\"q\"\x01"));
    EXPECT_EQ(v.ToJSON(), "\"line\\n\\\"q\\\"\\u0001\"");
}

TEST(JSONValueTest, PrettyOutput) {
    JSONValue obj;
    obj["k"] = JSONValue::FromStrings({"v"});
    EXPECT_EQ(obj.ToJSON(true), "{\n  \"k\": [\n    \"v\"\n  ]\n}");
}

// ============================================================================
// Parsing
// ============================================================================

TEST(JSONParseTest, ParsesNestedDocument) {
    auto v = JSONValue::Parse(
        R"({"type":"decision","payload":{"yes":2,"no":0,"tags":["a","b"]},"ok":true,"r":1.5})");
    EXPECT_EQ(v["type"].GetString(), "decision");
    EXPECT_EQ(v["payload"]["yes"].GetInt(), 2);
    EXPECT_EQ(v["payload"]["tags"].Size(), 2u);
    EXPECT_TRUE(v["ok"].GetBool());
    EXPECT_DOUBLE_EQ(v["r"].GetDouble(), 1.5);
}

TEST(JSONParseTest, UnicodeEscapes) {
    auto v = JSONValue::Parse(R"("caf\u00e9 \ud83d\ude00")");
    EXPECT_EQ(v.GetString(), "caf\xc3\xa9 \xf0\x9f\x98\x80");
}

TEST(JSONParseTest, RejectsMalformed) {
    EXPECT_FALSE(JSONValue::TryParse("").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{\"a\":1,}").has_value());
    EXPECT_FALSE(JSONValue::TryParse("[1 2]").has_value());
    EXPECT_FALSE(JSONValue::TryParse("{} trailing").has_value());
    EXPECT_THROW(JSONValue::Parse("nope"), std::runtime_error);
}

TEST(JSONParseTest, RejectsExcessiveNesting) {
    std::string deep(200, '[');
    deep += std::string(200, ']');
    EXPECT_FALSE(JSONValue::TryParse(deep).has_value());
}

TEST(JSONParseTest, ReparseMatchesOriginal) {
    JSONValue obj;
    obj["statement"] = "db | uses | leveldb";
    obj["version"] = int64_t(3);
    obj["tags"] = JSONValue::FromStrings({"infra"});
    EXPECT_EQ(JSONValue::Parse(obj.ToJSON()), obj);
}
