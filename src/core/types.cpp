// NUKLAI - Core Types Implementation
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include "nuklai/core/types.h"
#include "nuklai/core/hex.h"

namespace nuklai {

// ============================================================================
// FixedBytes Implementation
// ============================================================================

template<size_t N>
std::string FixedBytes<N>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t N>
FixedBytes<N> FixedBytes<N>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for identifier");
    }

    std::vector<Byte> bytes = HexToBytes(hex);
    return FixedBytes(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class FixedBytes<20>;
template class FixedBytes<32>;
template class FixedBytes<33>;

} // namespace nuklai
