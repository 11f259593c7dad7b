// CONCORD - Database Tests
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <gtest/gtest.h>
#include <concord/db/database.h>
#include <concord/db/leveldb.h>
#include <concord/db/memorydb.h>

#include <filesystem>
#include <random>

using namespace concord;
using namespace concord::db;

// ============================================================================
// Test Utilities
// ============================================================================

class DatabaseTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("concord_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::unique_ptr<Database> OpenLevelDB(const std::string& name = "test_db") {
        Options opts;
        opts.create_if_missing = true;
        auto [status, db] = OpenDatabase(testDir_ / name, opts);
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(db);
    }

    /// Exercise the common contract against any backend
    static void CheckBasicContract(Database& db) {
        ASSERT_TRUE(db.Put(Slice("k1"), Slice("v1")).ok());

        std::string value;
        ASSERT_TRUE(db.Get(Slice("k1"), &value).ok());
        EXPECT_EQ(value, "v1");

        EXPECT_TRUE(db.Get(Slice("missing"), &value).IsNotFound());

        ASSERT_TRUE(db.Delete(Slice("k1")).ok());
        EXPECT_TRUE(db.Get(Slice("k1"), &value).IsNotFound());
    }

    static void CheckPrefixIteration(Database& db) {
        WriteBatch batch;
        batch.Put(Slice("a1"), Slice("x"));
        batch.Put(Slice("b2"), Slice("y"));
        batch.Put(Slice("b1"), Slice("z"));
        batch.Put(Slice("c1"), Slice("w"));
        ASSERT_TRUE(db.Write(&batch).ok());

        std::vector<std::string> keys;
        auto iter = db.NewIterator();
        for (iter->Seek(Slice("b")); iter->Valid(); iter->Next()) {
            if (!iter->key().starts_with(Slice("b"))) break;
            keys.push_back(iter->key().ToString());
        }
        ASSERT_TRUE(iter->status().ok());
        ASSERT_EQ(keys.size(), 2u);
        EXPECT_EQ(keys[0], "b1");
        EXPECT_EQ(keys[1], "b2");
    }
};

// ============================================================================
// Slice / WriteBatch Tests
// ============================================================================

TEST(SliceTest, Basics) {
    std::string s("abc\0def", 7);
    Slice slice(s);
    EXPECT_EQ(slice.size(), 7u);
    EXPECT_TRUE(slice.starts_with(Slice("abc")));
    EXPECT_FALSE(slice.starts_with(Slice("abd")));
    EXPECT_EQ(slice.ToString(), s);
    EXPECT_TRUE(Slice().empty());
}

TEST(WriteBatchTest, RecordsOperationsInOrder) {
    WriteBatch batch;
    batch.Put(Slice("a"), Slice("1"));
    batch.Delete(Slice("b"));
    EXPECT_EQ(batch.Count(), 2u);

    std::vector<std::string> seen;
    batch.Iterate([&](const std::string& key, const std::optional<std::string>& value) {
        seen.push_back(key + (value ? "=" + *value : " deleted"));
    });
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], "a=1");
    EXPECT_EQ(seen[1], "b deleted");

    batch.Clear();
    EXPECT_TRUE(batch.Empty());
}

TEST(KeyPrefixTest, MakeKey) {
    EXPECT_EQ(MakeKey(prefix::PROPOSAL, Slice("kp-1")), "pkp-1");
    EXPECT_EQ(MakeKey(prefix::TASK), "t");
}

// ============================================================================
// Memory Backend Tests
// ============================================================================

TEST_F(DatabaseTest, MemoryBasicContract) {
    MemoryDatabase db;
    CheckBasicContract(db);
}

TEST_F(DatabaseTest, MemoryPrefixIteration) {
    MemoryDatabase db;
    CheckPrefixIteration(db);
    EXPECT_EQ(db.Size(), 4u);
}

TEST_F(DatabaseTest, MemoryIteratorIsSnapshot) {
    MemoryDatabase db;
    db.Put(Slice("a"), Slice("1"));
    auto iter = db.NewIterator();
    db.Put(Slice("b"), Slice("2"));

    size_t count = 0;
    for (iter->SeekToFirst(); iter->Valid(); iter->Next()) ++count;
    EXPECT_EQ(count, 1u);
}

TEST_F(DatabaseTest, MemoryInjectedWriteFailures) {
    MemoryDatabase db;
    db.FailNextWrites(2);

    EXPECT_TRUE(db.Put(Slice("a"), Slice("1")).IsIOError());
    WriteBatch batch;
    batch.Put(Slice("b"), Slice("2"));
    EXPECT_TRUE(db.Write(&batch).IsIOError());

    // Failed batch leaves nothing behind
    std::string value;
    EXPECT_TRUE(db.Get(Slice("b"), &value).IsNotFound());

    EXPECT_TRUE(db.Put(Slice("a"), Slice("1")).ok());
}

// ============================================================================
// LevelDB Backend Tests
// ============================================================================

TEST_F(DatabaseTest, LevelDBBasicContract) {
    auto db = OpenLevelDB();
    ASSERT_NE(db, nullptr);
    CheckBasicContract(*db);
}

TEST_F(DatabaseTest, LevelDBPrefixIteration) {
    auto db = OpenLevelDB();
    ASSERT_NE(db, nullptr);
    CheckPrefixIteration(*db);
}

TEST_F(DatabaseTest, LevelDBPersistsAcrossReopen) {
    {
        auto db = OpenLevelDB("persist");
        ASSERT_NE(db, nullptr);
        ASSERT_TRUE(db->Put(Slice("durable"), Slice("yes")).ok());
    }
    auto db = OpenLevelDB("persist");
    ASSERT_NE(db, nullptr);
    std::string value;
    ASSERT_TRUE(db->Get(Slice("durable"), &value).ok());
    EXPECT_EQ(value, "yes");
}

TEST_F(DatabaseTest, LevelDBErrorIfExists) {
    {
        auto db = OpenLevelDB("exists");
        ASSERT_NE(db, nullptr);
    }
    Options opts;
    opts.error_if_exists = true;
    auto [status, db] = OpenDatabase(testDir_ / "exists", opts);
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(db, nullptr);
}

TEST_F(DatabaseTest, LevelDBDestroy) {
    {
        auto db = OpenLevelDB("destroy");
        ASSERT_NE(db, nullptr);
        db->Put(Slice("k"), Slice("v"));
    }
    EXPECT_TRUE(DestroyDatabase(testDir_ / "destroy").ok());
    auto db = OpenLevelDB("destroy");
    ASSERT_NE(db, nullptr);
    std::string value;
    EXPECT_TRUE(db->Get(Slice("k"), &value).IsNotFound());
}
