// NUKLAI - In-Memory Database
// Copyright (c) 2024 NUKLAI Developers
// MIT License
//
// Ordered in-memory backend. Nodes without a configured stake database
// keep their records here, and the tests run against it.

#ifndef NUKLAI_DB_MEMORY_H
#define NUKLAI_DB_MEMORY_H

#include "nuklai/db/database.h"

#include <map>
#include <mutex>

namespace nuklai {
namespace db {

class MemoryDatabase : public Database {
public:
    using Map = std::map<std::string, std::string>;

    Status Get(const Slice& key, std::string* value) override;
    Status Put(const Slice& key, const Slice& value) override;
    Status Delete(const Slice& key) override;

    /// Iterates a copy; writes made after creation are not visible
    std::unique_ptr<Iterator> NewIterator() override;

private:
    Map records_;
    mutable std::mutex mutex_;
};

} // namespace db
} // namespace nuklai

#endif // NUKLAI_DB_MEMORY_H
