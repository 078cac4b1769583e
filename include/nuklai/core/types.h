// NUKLAI - Core Types Header
// Copyright (c) 2024 NUKLAI Developers
// MIT License
//
// This file defines fundamental types used throughout NUKLAI.

#ifndef NUKLAI_CORE_TYPES_H
#define NUKLAI_CORE_TYPES_H

#include <cstdint>
#include <cstddef>
#include <array>
#include <vector>
#include <string>
#include <algorithm>
#include <stdexcept>
#include <functional>
#include <cstring>

namespace nuklai {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Amount in smallest units of NAI
using Amount = uint64_t;

/// Timestamp (Unix epoch seconds, UTC)
using Timestamp = int64_t;

/// Block height
using Height = uint64_t;

/// Constants
constexpr Amount COIN = 1000000000ULL;  // 1 NAI = 10^9 base units

// ============================================================================
// Fixed-size Identifiers
// ============================================================================

/// Fixed-size opaque byte identifier
template<size_t N>
class FixedBytes {
public:
    static constexpr size_t SIZE = N;

    /// Default constructor - creates the empty (all-zero) identifier
    FixedBytes() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit FixedBytes(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero-padded)
    FixedBytes(const Byte* data, size_t len) noexcept {
        if (len >= SIZE) {
            std::memcpy(data_.data(), data, SIZE);
        } else {
            data_.fill(0);
            if (data && len > 0) {
                std::memcpy(data_.data(), data, len);
            }
        }
    }

    /// Check if identifier is all zeros
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    /// Set identifier to all zeros
    void SetNull() noexcept {
        data_.fill(0);
    }

    /// Size in bytes
    constexpr size_t size() const noexcept { return SIZE; }

    /// Element access
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    /// Raw data access
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    /// Iterators
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    /// Comparison operators (bytewise, first byte most significant)
    bool operator==(const FixedBytes& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const FixedBytes& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const FixedBytes& other) const noexcept {
        return std::memcmp(data_.data(), other.data_.data(), SIZE) < 0;
    }

    /// Convert to hex string (storage byte order)
    std::string ToHex() const;

    /// Create from hex string
    static FixedBytes FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Identifier Types
// ============================================================================

/// Network node identity (20 bytes)
class NodeId : public FixedBytes<20> {
public:
    using FixedBytes<20>::FixedBytes;
    NodeId() = default;
    explicit NodeId(const FixedBytes<20>& b) : FixedBytes<20>(b) {}

    static NodeId FromHex(const std::string& hex) {
        return NodeId(FixedBytes<20>::FromHex(hex));
    }

    /// The empty node id (selects every validator in queries)
    static const NodeId& Empty() {
        static const NodeId empty;
        return empty;
    }
};

/// Account address: 1 type byte followed by a 32 byte payload
class Address : public FixedBytes<33> {
public:
    using FixedBytes<33>::FixedBytes;
    Address() = default;
    explicit Address(const FixedBytes<33>& b) : FixedBytes<33>(b) {}

    static Address FromHex(const std::string& hex) {
        return Address(FixedBytes<33>::FromHex(hex));
    }

    /// Address type prefix
    Byte GetType() const { return data_[0]; }

    /// The empty address (the validator itself in reward claims)
    static const Address& Empty() {
        static const Address empty;
        return empty;
    }
};

/// 256-bit digest (32 bytes)
class Hash256 : public FixedBytes<32> {
public:
    using FixedBytes<32>::FixedBytes;
    Hash256() = default;
    explicit Hash256(const FixedBytes<32>& b) : FixedBytes<32>(b) {}
};

/// Hasher for unordered containers keyed by identifiers
template<typename T>
struct FixedBytesHasher {
    size_t operator()(const T& id) const noexcept {
        // FNV-1a over the raw bytes
        uint64_t h = 14695981039346656037ULL;
        for (Byte b : id) {
            h ^= b;
            h *= 1099511628211ULL;
        }
        return static_cast<size_t>(h);
    }
};

} // namespace nuklai

namespace std {

template<>
struct hash<nuklai::NodeId> : nuklai::FixedBytesHasher<nuklai::NodeId> {};

template<>
struct hash<nuklai::Address> : nuklai::FixedBytesHasher<nuklai::Address> {};

} // namespace std

#endif // NUKLAI_CORE_TYPES_H
