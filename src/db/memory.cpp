// NUKLAI - In-Memory Database Implementation
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include "nuklai/db/memory.h"

namespace nuklai {
namespace db {

namespace {

class SnapshotIterator : public Iterator {
public:
    explicit SnapshotIterator(MemoryDatabase::Map snapshot)
        : records_(std::move(snapshot)), pos_(records_.end()) {}

    void Seek(const Slice& target) override { pos_ = records_.lower_bound(target.ToString()); }
    bool Valid() const override { return pos_ != records_.end(); }
    void Next() override { ++pos_; }
    Slice key() const override { return Slice(pos_->first); }
    Status status() const override { return Status::Ok(); }

private:
    MemoryDatabase::Map records_;
    MemoryDatabase::Map::const_iterator pos_;
};

} // namespace

Status MemoryDatabase::Get(const Slice& key, std::string* value) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(key.ToString());
    if (it == records_.end()) {
        return Status::NotFound();
    }
    *value = it->second;
    return Status::Ok();
}

Status MemoryDatabase::Put(const Slice& key, const Slice& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[key.ToString()] = value.ToString();
    return Status::Ok();
}

Status MemoryDatabase::Delete(const Slice& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(key.ToString());
    return Status::Ok();
}

std::unique_ptr<Iterator> MemoryDatabase::NewIterator() {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::make_unique<SnapshotIterator>(records_);
}

} // namespace db
} // namespace nuklai
