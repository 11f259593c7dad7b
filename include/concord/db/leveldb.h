// CONCORD - LevelDB Backend
// Copyright (c) 2024 CONCORD Developers
// MIT License

#ifndef CONCORD_DB_LEVELDB_H
#define CONCORD_DB_LEVELDB_H

#include <concord/db/database.h>

#include <leveldb/cache.h>
#include <leveldb/db.h>
#include <leveldb/filter_policy.h>

namespace concord {
namespace db {

/// Convert a LevelDB status into the database layer's Status
Status FromLevelDBStatus(const leveldb::Status& s);

class LevelDBIterator : public Iterator {
private:
    std::unique_ptr<leveldb::Iterator> iter_;

public:
    explicit LevelDBIterator(leveldb::Iterator* iter) : iter_(iter) {}

    bool Valid() const override { return iter_->Valid(); }
    void SeekToFirst() override { iter_->SeekToFirst(); }
    void Seek(const Slice& target) override {
        iter_->Seek(leveldb::Slice(target.data(), target.size()));
    }
    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Slice value() const override {
        leveldb::Slice v = iter_->value();
        return Slice(v.data(), v.size());
    }

    Status status() const override { return FromLevelDBStatus(iter_->status()); }
};

/**
 * Database backed by a LevelDB instance. Owns the DB handle together with
 * the block cache and filter policy it was opened with.
 */
class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(leveldb::DB* db, leveldb::Cache* cache,
                    const leveldb::FilterPolicy* filter)
        : cache_(cache), filterPolicy_(filter), db_(db) {}

    ~LevelDBDatabase() override;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    std::string GetStats() const override;

private:
    // Destroyed in reverse order: the DB must close before its cache/filter
    std::unique_ptr<leveldb::Cache> cache_;
    std::unique_ptr<const leveldb::FilterPolicy> filterPolicy_;
    std::unique_ptr<leveldb::DB> db_;
};

} // namespace db
} // namespace concord

#endif // CONCORD_DB_LEVELDB_H
