// CONCORD - In-Memory Database
// Copyright (c) 2024 CONCORD Developers
// MIT License

#ifndef CONCORD_DB_MEMORYDB_H
#define CONCORD_DB_MEMORYDB_H

#include <concord/db/database.h>

#include <map>
#include <mutex>

namespace concord {
namespace db {

/**
 * Ordered std::map backend. Selected with storage=memory and used by tests.
 * Iterators read from a snapshot taken when they are created, so writes made
 * while iterating are not observed.
 */
class MemoryDatabase : public Database {
public:
    MemoryDatabase() = default;

    Status Get(const ReadOptions& options, const Slice& key, std::string* value) override;
    Status Put(const WriteOptions& options, const Slice& key, const Slice& value) override;
    Status Delete(const WriteOptions& options, const Slice& key) override;
    Status Write(const WriteOptions& options, WriteBatch* batch) override;
    std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) override;
    std::string GetStats() const override;

    size_t Size() const;

    /// Make the next `n` writes fail with an IO error
    void FailNextWrites(int n);

private:
    bool ConsumeWriteFailure();

    std::map<std::string, std::string> data_;
    int failWrites_{0};
    mutable std::mutex mutex_;
};

} // namespace db
} // namespace concord

#endif // CONCORD_DB_MEMORYDB_H
