// NUKLAI - LevelDB Stake Database
// Copyright (c) 2024 NUKLAI Developers
// MIT License
//
// Persistent backend for stake records. Built as the separate
// nuklai_leveldb library when LevelDB is available.

#ifndef NUKLAI_DB_LEVELDB_H
#define NUKLAI_DB_LEVELDB_H

#include "nuklai/db/database.h"

#include <filesystem>
#include <utility>

#include <leveldb/db.h>

namespace nuklai {
namespace db {

class LevelDBDatabase : public Database {
public:
    LevelDBDatabase(std::unique_ptr<leveldb::DB> db, bool syncWrites);

    Status Get(const Slice& key, std::string* value) override;
    Status Put(const Slice& key, const Slice& value) override;
    Status Delete(const Slice& key) override;
    std::unique_ptr<Iterator> NewIterator() override;

    static Status ConvertStatus(const leveldb::Status& s);

private:
    leveldb::WriteOptions WriteOpts() const;

    std::unique_ptr<leveldb::DB> db_;
    bool syncWrites_;
};

/**
 * Open (creating if missing) the stake database at path.
 * With syncWrites every Put and Delete is flushed before returning.
 */
std::pair<Status, std::unique_ptr<Database>> OpenDatabase(
    const std::filesystem::path& path, bool syncWrites = true);

} // namespace db
} // namespace nuklai

#endif // NUKLAI_DB_LEVELDB_H
