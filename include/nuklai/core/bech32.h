// NUKLAI - Bech32 Address Encoding
// Copyright (c) 2024 NUKLAI Developers
// MIT License
//
// Addresses are raw fixed-size identifiers everywhere inside the node. They
// are rendered as bech32 strings only at the RPC/wallet boundary.

#ifndef NUKLAI_CORE_BECH32_H
#define NUKLAI_CORE_BECH32_H

#include "nuklai/core/types.h"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nuklai {

/// Default human-readable part for NAI addresses
constexpr const char* DEFAULT_HRP = "nai";

/**
 * Encode arbitrary bytes as Bech32.
 * @param hrp Human-readable part
 * @param data Payload (8-bit groups)
 */
std::string EncodeBech32(const std::string& hrp, const std::vector<uint8_t>& data);

/**
 * Decode a Bech32 string.
 * Returns (hrp, payload) or nullopt if the string or checksum is invalid.
 */
std::optional<std::pair<std::string, std::vector<uint8_t>>>
DecodeBech32(const std::string& str);

/// Render an address for display
std::string EncodeAddress(const std::string& hrp, const Address& address);

/// Parse a displayed address; rejects wrong hrp and wrong payload length
std::optional<Address> DecodeAddress(const std::string& hrp, const std::string& str);

} // namespace nuklai

#endif // NUKLAI_CORE_BECH32_H
