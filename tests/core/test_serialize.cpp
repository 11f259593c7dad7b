// CONCORD - Serialization Tests
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <gtest/gtest.h>
#include <concord/core/serialize.h>

#include <map>
#include <string>
#include <vector>

using namespace concord;

// ============================================================================
// DataStream Basic Tests
// ============================================================================

TEST(DataStreamTest, DefaultConstructor) {
    DataStream ds;
    EXPECT_TRUE(ds.empty());
    EXPECT_EQ(ds.size(), 0u);
}

TEST(DataStreamTest, WriteAndRead) {
    DataStream ds;
    std::vector<uint8_t> data = {0x01, 0x02, 0x03, 0x04};
    ds.Write(data.data(), data.size());

    EXPECT_EQ(ds.size(), 4u);

    std::vector<uint8_t> result(4);
    ds.Read(result.data(), result.size());
    EXPECT_EQ(result, data);
    EXPECT_TRUE(ds.empty());
}

TEST(DataStreamTest, ReadPastEndThrows) {
    DataStream ds;
    ds << uint32_t(7);
    uint64_t v = 0;
    EXPECT_THROW(ds >> v, std::ios_base::failure);
}

// ============================================================================
// Integer Serialization Tests (Little-Endian)
// ============================================================================

TEST(SerializeTest, Uint32LittleEndian) {
    DataStream ds;
    ds << uint32_t(0x12345678);

    ASSERT_EQ(ds.size(), 4u);
    EXPECT_EQ(ds.data()[0], 0x78);
    EXPECT_EQ(ds.data()[3], 0x12);

    uint32_t result = 0;
    ds >> result;
    EXPECT_EQ(result, 0x12345678u);
}

TEST(SerializeTest, NegativeInt64) {
    DataStream ds;
    ds << int64_t(-1700000000000);
    int64_t result = 0;
    ds >> result;
    EXPECT_EQ(result, -1700000000000);
}

TEST(SerializeTest, Bool) {
    DataStream ds;
    ds << true << false;
    bool a = false, b = true;
    ds >> a >> b;
    EXPECT_TRUE(a);
    EXPECT_FALSE(b);
}

// ============================================================================
// CompactSize Tests
// ============================================================================

TEST(CompactSizeTest, Boundaries) {
    struct Case { uint64_t value; size_t bytes; };
    for (const Case& c : {Case{0, 1}, Case{252, 1}, Case{253, 5}, Case{0xFFFFFFFF, 5}}) {
        DataStream ds;
        WriteCompactSize(ds, c.value);
        EXPECT_EQ(ds.size(), c.bytes) << c.value;
        if (c.value <= MAX_SIZE) {
            EXPECT_EQ(ReadCompactSize(ds), c.value);
        }
    }
}

TEST(CompactSizeTest, RejectsOversize) {
    DataStream ds;
    WriteCompactSize(ds, MAX_SIZE + 1);
    EXPECT_THROW(ReadCompactSize(ds), std::ios_base::failure);
}

// ============================================================================
// Container Tests
// ============================================================================

TEST(SerializeTest, StringsAndVectors) {
    std::vector<std::string> tags = {"infra", "", "storage"};
    DataStream ds;
    ds << std::string("hello") << tags;

    std::string s;
    std::vector<std::string> out;
    ds >> s >> out;
    EXPECT_EQ(s, "hello");
    EXPECT_EQ(out, tags);
}

TEST(SerializeTest, FieldMap) {
    std::map<std::string, std::string> fields = {{"artifact", "build.tgz"}, {"status", "ok"}};
    DataStream ds;
    ds << fields;

    std::map<std::string, std::string> out;
    ds >> out;
    EXPECT_EQ(out, fields);
}

TEST(SerializeTest, TruncatedStringThrows) {
    DataStream ds;
    WriteCompactSize(ds, 10);
    ds.Write("abc", 3);
    std::string s;
    EXPECT_THROW(ds >> s, std::ios_base::failure);
}

// ============================================================================
// Big-Endian Key Components
// ============================================================================

TEST(KeyEncodingTest, BE64PreservesOrder) {
    std::string a, b;
    AppendBE64(a, 9);
    AppendBE64(b, 10);
    EXPECT_LT(a, b);
    EXPECT_EQ(ReadBE64(a.data()), 9u);
    EXPECT_EQ(ReadBE64(b.data()), 10u);
}
