// CONCORD - LevelDB Backend Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/db/leveldb.h>

#include <leveldb/write_batch.h>

namespace concord {
namespace db {

Status FromLevelDBStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    if (s.IsNotSupportedError()) return Status::NotSupported(s.ToString());
    if (s.IsInvalidArgument()) return Status::InvalidArgument(s.ToString());
    return Status::IOError(s.ToString());
}

namespace {

leveldb::ReadOptions ToLevelDB(const ReadOptions& opts) {
    leveldb::ReadOptions lo;
    lo.verify_checksums = opts.verify_checksums;
    lo.fill_cache = opts.fill_cache;
    return lo;
}

leveldb::WriteOptions ToLevelDB(const WriteOptions& opts) {
    leveldb::WriteOptions lo;
    lo.sync = opts.sync;
    return lo;
}

} // namespace

LevelDBDatabase::~LevelDBDatabase() = default;

Status LevelDBDatabase::Get(const ReadOptions& options, const Slice& key, std::string* value) {
    return FromLevelDBStatus(
        db_->Get(ToLevelDB(options), leveldb::Slice(key.data(), key.size()), value));
}

Status LevelDBDatabase::Put(const WriteOptions& options, const Slice& key, const Slice& value) {
    return FromLevelDBStatus(db_->Put(ToLevelDB(options),
                                      leveldb::Slice(key.data(), key.size()),
                                      leveldb::Slice(value.data(), value.size())));
}

Status LevelDBDatabase::Delete(const WriteOptions& options, const Slice& key) {
    return FromLevelDBStatus(
        db_->Delete(ToLevelDB(options), leveldb::Slice(key.data(), key.size())));
}

Status LevelDBDatabase::Write(const WriteOptions& options, WriteBatch* batch) {
    leveldb::WriteBatch lb;
    batch->Iterate([&lb](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            lb.Put(key, *value);
        } else {
            lb.Delete(key);
        }
    });
    return FromLevelDBStatus(db_->Write(ToLevelDB(options), &lb));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator(const ReadOptions& options) {
    return std::make_unique<LevelDBIterator>(db_->NewIterator(ToLevelDB(options)));
}

std::string LevelDBDatabase::GetStats() const {
    std::string stats;
    if (!db_->GetProperty("leveldb.stats", &stats)) {
        return "";
    }
    return stats;
}

// ============================================================================
// Factory Functions
// ============================================================================

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options)
{
    if (options.create_if_missing) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path().empty() ? path : path.parent_path(), ec);
        if (ec) {
            return {Status::IOError("cannot create " + path.string() + ": " + ec.message()), nullptr};
        }
    }

    leveldb::Options lo;
    lo.create_if_missing = options.create_if_missing;
    lo.error_if_exists = options.error_if_exists;
    lo.paranoid_checks = options.paranoid_checks;
    lo.write_buffer_size = options.write_buffer_size;
    lo.max_open_files = options.max_open_files;

    std::unique_ptr<leveldb::Cache> cache;
    if (options.block_cache_size > 0) {
        cache.reset(leveldb::NewLRUCache(options.block_cache_size));
        lo.block_cache = cache.get();
    }

    std::unique_ptr<const leveldb::FilterPolicy> filter;
    if (options.bloom_filter_bits > 0) {
        filter.reset(leveldb::NewBloomFilterPolicy(options.bloom_filter_bits));
        lo.filter_policy = filter.get();
    }

    leveldb::DB* raw = nullptr;
    leveldb::Status s = leveldb::DB::Open(lo, path.string(), &raw);
    if (!s.ok()) {
        return {FromLevelDBStatus(s), nullptr};
    }

    return {Status::Ok(),
            std::make_unique<LevelDBDatabase>(raw, cache.release(), filter.release())};
}

Status DestroyDatabase(const std::filesystem::path& path) {
    return FromLevelDBStatus(leveldb::DestroyDB(path.string(), leveldb::Options()));
}

} // namespace db
} // namespace concord
