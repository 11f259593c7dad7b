// CONCORD - In-Memory Database Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/db/memorydb.h>

namespace concord {
namespace db {

namespace {

class SnapshotIterator : public Iterator {
public:
    explicit SnapshotIterator(std::map<std::string, std::string> data)
        : data_(std::move(data)), iter_(data_.end()) {}

    bool Valid() const override { return iter_ != data_.end(); }
    void SeekToFirst() override { iter_ = data_.begin(); }
    void Seek(const Slice& target) override { iter_ = data_.lower_bound(target.ToString()); }
    void Next() override {
        if (iter_ != data_.end()) ++iter_;
    }
    Slice key() const override { return Slice(iter_->first); }
    Slice value() const override { return Slice(iter_->second); }
    Status status() const override { return Status::Ok(); }

private:
    std::map<std::string, std::string> data_;
    std::map<std::string, std::string>::const_iterator iter_;
};

} // namespace

bool MemoryDatabase::ConsumeWriteFailure() {
    if (failWrites_ > 0) {
        --failWrites_;
        return true;
    }
    return false;
}

Status MemoryDatabase::Get(const ReadOptions&, const Slice& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = data_.find(key.ToString());
    if (it == data_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const WriteOptions&, const Slice& key, const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ConsumeWriteFailure()) {
        return Status::IOError("injected write failure");
    }
    data_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const WriteOptions&, const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ConsumeWriteFailure()) {
        return Status::IOError("injected write failure");
    }
    data_.erase(key.ToString());
    return Status::Ok();
}

Status MemoryDatabase::Write(const WriteOptions&, WriteBatch* batch) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ConsumeWriteFailure()) {
        return Status::IOError("injected write failure");
    }
    batch->Iterate([this](const std::string& key, const std::optional<std::string>& value) {
        if (value) {
            data_[key] = *value;
        } else {
            data_.erase(key);
        }
    });
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator(const ReadOptions&) {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<SnapshotIterator>(data_);
}

std::string MemoryDatabase::GetStats() const {
    return "memory: " + std::to_string(Size()) + " keys";
}

size_t MemoryDatabase::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return data_.size();
}

void MemoryDatabase::FailNextWrites(int n) {
    std::lock_guard<std::mutex> lock(mutex_);
    failWrites_ = n;
}

} // namespace db
} // namespace concord
