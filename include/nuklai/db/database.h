// NUKLAI - Database Abstraction Layer
// Copyright (c) 2024 NUKLAI Developers
// MIT License
//
// Ordered key-value store holding serialized stake records.
// Backends: MemoryDatabase (always available) and LevelDBDatabase.

#ifndef NUKLAI_DB_DATABASE_H
#define NUKLAI_DB_DATABASE_H

#include "nuklai/core/serialize.h"

#include <cstring>
#include <ios>
#include <memory>
#include <string>

namespace nuklai {
namespace db {

// ============================================================================
// Database Status
// ============================================================================

/**
 * Outcome of a storage call. Anything other than OK and NOT_FOUND is a
 * backend failure the caller cannot repair.
 */
class Status {
public:
    enum Code {
        OK = 0,
        NOT_FOUND = 1,
        CORRUPTION = 2,
        IO_ERROR = 3,
    };

    Status() = default;
    Status(Code code, std::string msg) : code_(code), message_(std::move(msg)) {}

    static Status Ok() { return Status(); }
    static Status NotFound(std::string msg = "") { return Status(NOT_FOUND, std::move(msg)); }
    static Status Corruption(std::string msg) { return Status(CORRUPTION, std::move(msg)); }
    static Status IOError(std::string msg) { return Status(IO_ERROR, std::move(msg)); }

    bool ok() const { return code_ == OK; }
    bool IsNotFound() const { return code_ == NOT_FOUND; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    /// "OK", or "<kind>: <message>"
    std::string ToString() const;

private:
    Code code_{OK};
    std::string message_;
};

// ============================================================================
// Slice
// ============================================================================

/// Non-owning view of a key or value; the buffer must outlive it
class Slice {
public:
    Slice() : data_(""), size_(0) {}
    Slice(const char* d, size_t n) : data_(d), size_(n) {}
    Slice(const std::string& s) : data_(s.data()), size_(s.size()) {}
    Slice(const char* s) : data_(s), size_(std::strlen(s)) {}

    const char* data() const { return data_; }
    size_t size() const { return size_; }

    std::string ToString() const { return std::string(data_, size_); }

    bool starts_with(const Slice& prefix) const {
        return size_ >= prefix.size_ &&
               (prefix.size_ == 0 || std::memcmp(data_, prefix.data_, prefix.size_) == 0);
    }

private:
    const char* data_;
    size_t size_;
};

// ============================================================================
// Iterator
// ============================================================================

/// Forward cursor over keys in bytewise order
class Iterator {
public:
    virtual ~Iterator() = default;

    /// Position at the first key >= target
    virtual void Seek(const Slice& target) = 0;
    virtual bool Valid() const = 0;
    virtual void Next() = 0;
    virtual Slice key() const = 0;
    virtual Status status() const = 0;
};

// ============================================================================
// Database
// ============================================================================

class Database {
public:
    virtual ~Database() = default;

    /// NotFound if the key is absent
    virtual Status Get(const Slice& key, std::string* value) = 0;
    virtual Status Put(const Slice& key, const Slice& value) = 0;
    /// Deleting an absent key succeeds
    virtual Status Delete(const Slice& key) = 0;

    /// Cursor over a consistent view taken at creation
    virtual std::unique_ptr<Iterator> NewIterator() = 0;

    bool Exists(const Slice& key) {
        std::string value;
        return Get(key, &value).ok();
    }
};

// ============================================================================
// Record Encoding
// ============================================================================

template<typename T>
std::string SerializeToString(const T& obj) {
    DataStream ss;
    ss << obj;
    return std::string(reinterpret_cast<const char*>(ss.data()), ss.size());
}

/// False on truncated or oversized input and on trailing bytes
template<typename T>
bool DeserializeFromString(const std::string& data, T& obj) {
    DataStream ss(reinterpret_cast<const uint8_t*>(data.data()), data.size());
    try {
        ss >> obj;
    } catch (const std::ios_base::failure&) {
        return false;
    }
    return ss.empty();
}

// ============================================================================
// Key Layout
// ============================================================================

namespace prefix {
    constexpr char DELEGATOR_STAKE = 'd';  // delegator + node id
    constexpr char VALIDATOR_STAKE = 'v';  // node id
}

inline std::string MakeKey(char tag, const Slice& body = Slice()) {
    std::string key(1, tag);
    key.append(body.data(), body.size());
    return key;
}

} // namespace db
} // namespace nuklai

#endif // NUKLAI_DB_DATABASE_H
