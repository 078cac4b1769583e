// NUKLAI - LevelDB Stake Database Implementation
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include "nuklai/db/leveldb.h"

#include "nuklai/util/logging.h"

#include <leveldb/iterator.h>

namespace nuklai {
namespace db {

namespace {

leveldb::Slice ToLevelDB(const Slice& s) {
    return leveldb::Slice(s.data(), s.size());
}

/// Holds a snapshot so the cursor sees a fixed view
class SnapshotIterator : public Iterator {
public:
    explicit SnapshotIterator(leveldb::DB* db) : db_(db), snapshot_(db->GetSnapshot()) {
        leveldb::ReadOptions opts;
        opts.snapshot = snapshot_;
        iter_.reset(db_->NewIterator(opts));
    }

    ~SnapshotIterator() override {
        iter_.reset();
        db_->ReleaseSnapshot(snapshot_);
    }

    void Seek(const Slice& target) override { iter_->Seek(ToLevelDB(target)); }
    bool Valid() const override { return iter_->Valid(); }
    void Next() override { iter_->Next(); }

    Slice key() const override {
        leveldb::Slice k = iter_->key();
        return Slice(k.data(), k.size());
    }

    Status status() const override { return LevelDBDatabase::ConvertStatus(iter_->status()); }

private:
    leveldb::DB* db_;
    const leveldb::Snapshot* snapshot_;
    std::unique_ptr<leveldb::Iterator> iter_;
};

} // namespace

LevelDBDatabase::LevelDBDatabase(std::unique_ptr<leveldb::DB> db, bool syncWrites)
    : db_(std::move(db)), syncWrites_(syncWrites) {}

Status LevelDBDatabase::ConvertStatus(const leveldb::Status& s) {
    if (s.ok()) return Status::Ok();
    if (s.IsNotFound()) return Status::NotFound(s.ToString());
    if (s.IsCorruption()) return Status::Corruption(s.ToString());
    return Status::IOError(s.ToString());
}

leveldb::WriteOptions LevelDBDatabase::WriteOpts() const {
    leveldb::WriteOptions opts;
    opts.sync = syncWrites_;
    return opts;
}

Status LevelDBDatabase::Get(const Slice& key, std::string* value) {
    return ConvertStatus(db_->Get(leveldb::ReadOptions(), ToLevelDB(key), value));
}

Status LevelDBDatabase::Put(const Slice& key, const Slice& value) {
    return ConvertStatus(db_->Put(WriteOpts(), ToLevelDB(key), ToLevelDB(value)));
}

Status LevelDBDatabase::Delete(const Slice& key) {
    return ConvertStatus(db_->Delete(WriteOpts(), ToLevelDB(key)));
}

std::unique_ptr<Iterator> LevelDBDatabase::NewIterator() {
    return std::make_unique<SnapshotIterator>(db_.get());
}

std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path, bool syncWrites) {
    leveldb::Options opts;
    opts.create_if_missing = true;

    leveldb::DB* raw = nullptr;
    leveldb::Status s = leveldb::DB::Open(opts, path.string(), &raw);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to open stake database "
                                         << path.string() << ": " << s.ToString();
        return {LevelDBDatabase::ConvertStatus(s), nullptr};
    }

    LOG_INFO(util::LogCategory::DB) << "Opened stake database at " << path.string();
    return {Status::Ok(), std::make_unique<LevelDBDatabase>(
                              std::unique_ptr<leveldb::DB>(raw), syncWrites)};
}

} // namespace db
} // namespace nuklai
