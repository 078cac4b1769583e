// NUKLAI - Serialization Header
// Copyright (c) 2024 NUKLAI Developers
// MIT License
//
// Serialization primitives used for persisted stake records and for the
// canonical ledger encoding that feeds the state digest. Integers are
// always written little-endian so every node produces identical bytes.

#ifndef NUKLAI_CORE_SERIALIZE_H
#define NUKLAI_CORE_SERIALIZE_H

#include "nuklai/core/types.h"

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <ios>
#include <string>
#include <type_traits>
#include <vector>

namespace nuklai {

/// Largest length prefix accepted when decoding (16 MB)
constexpr uint64_t MAX_SERIALIZED_LENGTH = 0x01000000;

// ============================================================================
// DataStream - In-memory byte buffer for serialization
// ============================================================================

/**
 * Append-only write buffer with a read cursor. Reads consume from the
 * front; reading past the end throws std::ios_base::failure.
 */
class DataStream {
public:
    DataStream() = default;
    explicit DataStream(std::vector<uint8_t> data) : buf_(std::move(data)) {}
    DataStream(const uint8_t* data, size_t len) : buf_(data, data + len) {}

    /// Unread bytes
    size_t size() const { return buf_.size() - pos_; }
    bool empty() const { return pos_ == buf_.size(); }
    const uint8_t* data() const { return buf_.data() + pos_; }

    void clear() {
        buf_.clear();
        pos_ = 0;
    }

    void Write(const void* src, size_t len) {
        const uint8_t* p = static_cast<const uint8_t*>(src);
        buf_.insert(buf_.end(), p, p + len);
    }

    void Read(void* dst, size_t len) {
        if (len > size()) {
            throw std::ios_base::failure("DataStream: read past end of data");
        }
        if (len > 0) {
            std::memcpy(dst, buf_.data() + pos_, len);
            pos_ += len;
        }
    }

    /// Unread bytes as lowercase hex
    std::string ToHex() const;

    template<typename T>
    DataStream& operator<<(const T& obj);

    template<typename T>
    DataStream& operator>>(T& obj);

private:
    std::vector<uint8_t> buf_;
    size_t pos_{0};
};

// ============================================================================
// Fixed-Width Little-Endian Integers
// ============================================================================

template<typename Stream, typename UInt>
void WriteLE(Stream& s, UInt value) {
    static_assert(std::is_unsigned<UInt>::value, "WriteLE takes unsigned integers");
    uint8_t bytes[sizeof(UInt)];
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        bytes[i] = static_cast<uint8_t>(value >> (8 * i));
    }
    s.Write(bytes, sizeof(UInt));
}

template<typename UInt, typename Stream>
UInt ReadLE(Stream& s) {
    static_assert(std::is_unsigned<UInt>::value, "ReadLE returns unsigned integers");
    uint8_t bytes[sizeof(UInt)];
    s.Read(bytes, sizeof(UInt));
    UInt value = 0;
    for (size_t i = 0; i < sizeof(UInt); ++i) {
        value |= static_cast<UInt>(bytes[i]) << (8 * i);
    }
    return value;
}

// ============================================================================
// CompactSize Length Prefix
// ============================================================================
//   value <  0xFD        -- 1 byte
//   value <= 0xFFFF      -- 0xFD + uint16
//   value <= 0xFFFFFFFF  -- 0xFE + uint32
//   otherwise            -- 0xFF + uint64
// Decoding rejects any value that has a shorter encoding.

template<typename Stream>
void WriteCompactSize(Stream& s, uint64_t value) {
    if (value < 0xFD) {
        WriteLE(s, static_cast<uint8_t>(value));
    } else if (value <= 0xFFFF) {
        WriteLE(s, static_cast<uint8_t>(0xFD));
        WriteLE(s, static_cast<uint16_t>(value));
    } else if (value <= 0xFFFFFFFFULL) {
        WriteLE(s, static_cast<uint8_t>(0xFE));
        WriteLE(s, static_cast<uint32_t>(value));
    } else {
        WriteLE(s, static_cast<uint8_t>(0xFF));
        WriteLE(s, value);
    }
}

template<typename Stream>
uint64_t ReadCompactSize(Stream& s, bool range_check = true) {
    uint64_t value = 0;
    uint64_t minimum = 0;
    switch (uint8_t marker = ReadLE<uint8_t>(s)) {
        case 0xFD: value = ReadLE<uint16_t>(s); minimum = 0xFD; break;
        case 0xFE: value = ReadLE<uint32_t>(s); minimum = 0x10000; break;
        case 0xFF: value = ReadLE<uint64_t>(s); minimum = 0x100000000ULL; break;
        default: value = marker; break;
    }
    if (value < minimum) {
        throw std::ios_base::failure("non-canonical compact size");
    }
    if (range_check && value > MAX_SERIALIZED_LENGTH) {
        throw std::ios_base::failure("compact size too large");
    }
    return value;
}

// ============================================================================
// Serialize/Unserialize
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, uint8_t v) { WriteLE(s, v); }
template<typename Stream>
void Unserialize(Stream& s, uint8_t& v) { v = ReadLE<uint8_t>(s); }

template<typename Stream>
void Serialize(Stream& s, uint32_t v) { WriteLE(s, v); }
template<typename Stream>
void Unserialize(Stream& s, uint32_t& v) { v = ReadLE<uint32_t>(s); }

template<typename Stream>
void Serialize(Stream& s, uint64_t v) { WriteLE(s, v); }
template<typename Stream>
void Unserialize(Stream& s, uint64_t& v) { v = ReadLE<uint64_t>(s); }

/// Two's complement, same width as uint64_t
template<typename Stream>
void Serialize(Stream& s, int64_t v) { WriteLE(s, static_cast<uint64_t>(v)); }
template<typename Stream>
void Unserialize(Stream& s, int64_t& v) { v = static_cast<int64_t>(ReadLE<uint64_t>(s)); }

template<typename Stream>
void Serialize(Stream& s, bool v) { WriteLE(s, static_cast<uint8_t>(v ? 1 : 0)); }
template<typename Stream>
void Unserialize(Stream& s, bool& v) { v = ReadLE<uint8_t>(s) != 0; }

/// Length-prefixed bytes
template<typename Stream>
void Serialize(Stream& s, const std::vector<uint8_t>& v) {
    WriteCompactSize(s, v.size());
    s.Write(v.data(), v.size());
}

template<typename Stream>
void Unserialize(Stream& s, std::vector<uint8_t>& v) {
    v.resize(ReadCompactSize(s));
    s.Read(v.data(), v.size());
}

/// Length-prefixed characters
template<typename Stream>
void Serialize(Stream& s, const std::string& str) {
    WriteCompactSize(s, str.size());
    s.Write(str.data(), str.size());
}

template<typename Stream>
void Unserialize(Stream& s, std::string& str) {
    str.resize(ReadCompactSize(s));
    s.Read(&str[0], str.size());
}

/// Identifiers are written raw, without a length prefix
template<typename Stream, size_t N>
void Serialize(Stream& s, const FixedBytes<N>& id) { s.Write(id.data(), N); }

template<typename Stream, size_t N>
void Unserialize(Stream& s, FixedBytes<N>& id) { s.Read(id.data(), N); }

template<typename T>
DataStream& DataStream::operator<<(const T& obj) {
    Serialize(*this, obj);
    return *this;
}

template<typename T>
DataStream& DataStream::operator>>(T& obj) {
    Unserialize(*this, obj);
    return *this;
}

} // namespace nuklai

#endif // NUKLAI_CORE_SERIALIZE_H
