// NUKLAI - SHA256 Hash Function
// Copyright (c) 2024 NUKLAI Developers
// MIT License
//
// Incremental SHA-256 backed by OpenSSL's EVP interface.

#ifndef NUKLAI_CRYPTO_SHA256_H
#define NUKLAI_CRYPTO_SHA256_H

#include <cstdint>
#include <cstddef>
#include <memory>
#include <vector>
#include "nuklai/core/types.h"

// Opaque OpenSSL context
struct evp_md_ctx_st;

namespace nuklai {

/// SHA-256 hasher class
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Default constructor - initializes to empty state
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    /// @param data Pointer to input data
    /// @param len Length of input data
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write to output
    /// @param hash Pointer to output buffer (must be at least OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct CtxDeleter {
        void operator()(evp_md_ctx_st* ctx) const;
    };

    std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

/// Compute SHA256 hash of a vector
inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

} // namespace nuklai

#endif // NUKLAI_CRYPTO_SHA256_H
