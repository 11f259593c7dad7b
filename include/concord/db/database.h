// CONCORD - Database Abstraction Layer
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Abstract ordered key/value interface underneath the governance store.
// Backends: LevelDB (on-disk) and an in-memory map (tests, ephemeral nodes).

#ifndef CONCORD_DB_DATABASE_H
#define CONCORD_DB_DATABASE_H

#include <concord/core/serialize.h>

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace concord {
namespace db {

// ============================================================================
// Database Status
// ============================================================================

/**
 * Status returned by backend operations. Mapped into concord::Status at the
 * governance store boundary.
 */
class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        NOT_SUPPORTED = 3,
        INVALID_ARGUMENT = 4,
        IO_ERROR = 5,
    };

private:
    Code code_;
    std::string message_;

public:
    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status NotFound(const std::string& msg = "") { return Status(NOT_FOUND, msg); }
    static Status Corruption(const std::string& msg = "") { return Status(CORRUPTION, msg); }
    static Status NotSupported(const std::string& msg = "") { return Status(NOT_SUPPORTED, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status IOError(const std::string& msg = "") { return Status(IO_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }
    bool IsCorruption() const { return code_ == CORRUPTION; }
    bool IsIOError() const { return code_ == IO_ERROR; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    std::string ToString() const;
};

// ============================================================================
// Slice
// ============================================================================

/// Non-owning view of a byte range; the buffer must outlive the Slice
class Slice {
private:
    const char* data_;
    size_t size_;

public:
    Slice() : data_(""), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }
    bool empty() const { return size_ == 0; }

    std::string ToString() const { return std::string(data_, size_); }

    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ && std::memcmp(data_, prefix.data_, prefix.size_) == 0;
    }

    bool operator==(const Slice& b) const {
        return size_ == b.size_ && std::memcmp(data_, b.data_, size_) == 0;
    }
    bool operator!=(const Slice& b) const { return !(*this == b); }
};

// ============================================================================
// Options
// ============================================================================

struct Options {
    bool create_if_missing = true;
    bool error_if_exists = false;
    bool paranoid_checks = false;
    /// Write buffer size (default 4MB)
    size_t write_buffer_size = 4 * 1024 * 1024;
    int max_open_files = 500;
    /// LRU block cache (default 8MB, 0 disables)
    size_t block_cache_size = 8 * 1024 * 1024;
    /// Bloom filter bits per key (0 disables)
    int bloom_filter_bits = 10;
};

struct ReadOptions {
    bool verify_checksums = false;
    bool fill_cache = true;
};

struct WriteOptions {
    /// fsync before returning
    bool sync = false;
};

// ============================================================================
// WriteBatch
// ============================================================================

/// Writes applied atomically by Database::Write
class WriteBatch {
private:
    std::vector<std::pair<std::string, std::optional<std::string>>> operations_;

public:
    void Put(const Slice& key, const Slice& value) {
        operations_.emplace_back(key.ToString(), value.ToString());
    }

    void Delete(const Slice& key) {
        operations_.emplace_back(key.ToString(), std::nullopt);
    }

    void Clear() { operations_.clear(); }
    size_t Count() const { return operations_.size(); }
    bool Empty() const { return operations_.empty(); }

    template<typename Func>
    void Iterate(Func&& func) const {
        for (const auto& [key, value] : operations_) {
            func(key, value);
        }
    }
};

// ============================================================================
// Iterator
// ============================================================================

class Iterator {
public:
    virtual ~Iterator() = default;

    virtual bool Valid() const = 0;
    virtual void SeekToFirst() = 0;
    /// Position at the first key >= target
    virtual void Seek(const Slice& target) = 0;
    virtual void Next() = 0;
    virtual Slice key() const = 0;
    virtual Slice value() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database
// ============================================================================

class Database {
public:
    virtual ~Database() = default;

    virtual Status Get(const ReadOptions& options, const Slice& key, std::string* value) = 0;
    Status Get(const Slice& key, std::string* value) {
        return Get(ReadOptions(), key, value);
    }

    virtual Status Put(const WriteOptions& options, const Slice& key, const Slice& value) = 0;
    Status Put(const Slice& key, const Slice& value) {
        return Put(WriteOptions(), key, value);
    }

    virtual Status Delete(const WriteOptions& options, const Slice& key) = 0;
    Status Delete(const Slice& key) {
        return Delete(WriteOptions(), key);
    }

    virtual Status Write(const WriteOptions& options, WriteBatch* batch) = 0;
    Status Write(WriteBatch* batch) {
        return Write(WriteOptions(), batch);
    }

    virtual std::unique_ptr<Iterator> NewIterator(const ReadOptions& options) = 0;
    std::unique_ptr<Iterator> NewIterator() {
        return NewIterator(ReadOptions());
    }

    /// Backend-specific statistics text
    virtual std::string GetStats() const { return ""; }
};

// ============================================================================
// Factory Functions
// ============================================================================

/**
 * Open (or create) a LevelDB database at `path`.
 * @return Pair of (status, database pointer); pointer is null on failure
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path,
    const Options& options = Options());

/// Delete a LevelDB database and all of its files
Status DestroyDatabase(const std::filesystem::path& path);

// ============================================================================
// Key Prefixes for Database Namespacing
// ============================================================================

namespace prefix {
    // Knowledge
    constexpr char PROPOSAL = 'p';        // proposal id -> proposal
    constexpr char VOTE = 'v';            // proposal id \0 voter id -> vote
    constexpr char FACT = 'f';            // group \0 subject \0 predicate -> latest fact
    constexpr char FACT_HISTORY = 'h';    // fact key + BE64 version + source -> fact
    constexpr char MEMBER = 'm';          // group \0 claw id -> roster entry

    // Dedup
    constexpr char IDEMPOTENCY = 'i';     // idempotency key -> meta

    // Cascade
    constexpr char TASK = 't';            // trace id \0 task id -> task
    constexpr char TRANSITION = 'r';      // trace id \0 task id \0 BE64 seq -> transition
    constexpr char TASK_SEQUENCE = 'q';   // trace id \0 BE64 sequence -> task id

    // Counters
    constexpr char COUNTER = 'c';         // name -> value
}

/**
 * Create a prefixed database key.
 */
inline std::string MakeKey(char prefix, const Slice& key) {
    std::string result;
    result.reserve(1 + key.size());
    result.push_back(prefix);
    result.append(key.data(), key.size());
    return result;
}

inline std::string MakeKey(char prefix) {
    return std::string(1, prefix);
}

// ============================================================================
// Serialization Helpers
// ============================================================================

/// Serialize a record with the project serialization framework
template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    ss << obj;
    return ss.str();
}

/// Decode a record; false if the bytes are truncated or malformed
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    try {
        DataStream ss(data);
        ss >> obj;
        return ss.empty();
    } catch (const std::ios_base::failure&) {
        return false;
    }
}

} // namespace db
} // namespace concord

#endif // CONCORD_DB_DATABASE_H
