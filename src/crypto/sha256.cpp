// NUKLAI - SHA256 Implementation
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include "nuklai/crypto/sha256.h"

#include <openssl/err.h>
#include <openssl/evp.h>

#include <stdexcept>
#include <string>

namespace nuklai {

namespace {

[[noreturn]] void ThrowOpenSSLError(const char* what) {
    unsigned long code = ERR_get_error();
    char buf[256] = {0};
    if (code != 0) {
        ERR_error_string_n(code, buf, sizeof(buf));
    }
    throw std::runtime_error(std::string(what) + ": " + buf);
}

} // namespace

void SHA256::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
    EVP_MD_CTX_free(ctx);
}

SHA256::SHA256() : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
        ThrowOpenSSLError("EVP_MD_CTX_new failed");
    }
    Reset();
}

SHA256::~SHA256() = default;

SHA256& SHA256::Write(const Byte* data, size_t len) {
    if (len == 0) {
        return *this;
    }
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
        ThrowOpenSSLError("EVP_DigestUpdate failed");
    }
    return *this;
}

void SHA256::Finalize(Byte hash[OUTPUT_SIZE]) {
    unsigned int outLen = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), hash, &outLen) != 1 || outLen != OUTPUT_SIZE) {
        ThrowOpenSSLError("EVP_DigestFinal_ex failed");
    }
}

SHA256& SHA256::Reset() {
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        ThrowOpenSSLError("EVP_DigestInit_ex failed");
    }
    return *this;
}

Hash256 SHA256Hash(const Byte* data, size_t len) {
    std::array<Byte, SHA256::OUTPUT_SIZE> out;
    SHA256 hasher;
    hasher.Write(data, len).Finalize(out.data());
    return Hash256(out);
}

} // namespace nuklai
