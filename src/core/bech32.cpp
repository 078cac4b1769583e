// NUKLAI - Bech32 Address Encoding Implementation
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include "nuklai/core/bech32.h"

#include <cctype>

namespace nuklai {

namespace {

constexpr const char* BECH32_ALPHABET = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

/// Maximum encoded length (hrp + separator + data + checksum)
constexpr size_t MAX_BECH32_LENGTH = 128;

int8_t Bech32CharValue(char c) {
    for (int8_t i = 0; i < 32; ++i) {
        if (BECH32_ALPHABET[i] == c) {
            return i;
        }
    }
    return -1;
}

uint32_t Bech32Polymod(const std::vector<uint8_t>& values) {
    uint32_t chk = 1;
    for (uint8_t v : values) {
        uint8_t top = chk >> 25;
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        if (top & 1) chk ^= 0x3b6a57b2;
        if (top & 2) chk ^= 0x26508e6d;
        if (top & 4) chk ^= 0x1ea119fa;
        if (top & 8) chk ^= 0x3d4233dd;
        if (top & 16) chk ^= 0x2a1462b3;
    }
    return chk;
}

std::vector<uint8_t> Bech32HrpExpand(const std::string& hrp) {
    std::vector<uint8_t> ret;
    ret.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(c) >> 5);
    }
    ret.push_back(0);
    for (char c : hrp) {
        ret.push_back(static_cast<uint8_t>(c) & 31);
    }
    return ret;
}

bool Bech32VerifyChecksum(const std::string& hrp, const std::vector<uint8_t>& values) {
    auto hrpExp = Bech32HrpExpand(hrp);
    hrpExp.insert(hrpExp.end(), values.begin(), values.end());
    return Bech32Polymod(hrpExp) == 1;
}

std::vector<uint8_t> Bech32CreateChecksum(const std::string& hrp,
                                          const std::vector<uint8_t>& values) {
    auto hrpExp = Bech32HrpExpand(hrp);
    hrpExp.insert(hrpExp.end(), values.begin(), values.end());
    hrpExp.resize(hrpExp.size() + 6);
    uint32_t mod = Bech32Polymod(hrpExp) ^ 1;
    std::vector<uint8_t> ret(6);
    for (int i = 0; i < 6; ++i) {
        ret[i] = (mod >> (5 * (5 - i))) & 31;
    }
    return ret;
}

void ConvertBits8to5(const std::vector<uint8_t>& in, std::vector<uint8_t>& out) {
    uint32_t acc = 0;
    int bits = 0;
    for (uint8_t value : in) {
        acc = ((acc << 8) | value) & 0xfff;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back((acc >> bits) & 31);
        }
    }
    if (bits > 0) {
        out.push_back((acc << (5 - bits)) & 31);
    }
}

bool ConvertBits5to8(const std::vector<uint8_t>& in, std::vector<uint8_t>& out) {
    uint32_t acc = 0;
    int bits = 0;
    for (uint8_t value : in) {
        if (value >= 32) return false;
        acc = ((acc << 5) | value) & 0xfff;
        bits += 5;
        while (bits >= 8) {
            bits -= 8;
            out.push_back((acc >> bits) & 255);
        }
    }
    // Check for non-zero padding
    if (bits >= 5 || ((acc << (8 - bits)) & 255)) {
        return false;
    }
    return true;
}

} // namespace

std::string EncodeBech32(const std::string& hrp, const std::vector<uint8_t>& data) {
    std::vector<uint8_t> values;
    ConvertBits8to5(data, values);

    auto checksum = Bech32CreateChecksum(hrp, values);
    values.insert(values.end(), checksum.begin(), checksum.end());

    std::string result = hrp + "1";
    for (uint8_t v : values) {
        result += BECH32_ALPHABET[v];
    }
    return result;
}

std::optional<std::pair<std::string, std::vector<uint8_t>>>
DecodeBech32(const std::string& str) {
    if (str.size() > MAX_BECH32_LENGTH) {
        return std::nullopt;
    }

    // Mixed case is invalid; decode in lower case
    bool hasLower = false;
    bool hasUpper = false;
    std::string lower = str;
    for (char& c : lower) {
        if (std::islower(static_cast<unsigned char>(c))) hasLower = true;
        if (std::isupper(static_cast<unsigned char>(c))) {
            hasUpper = true;
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
    }
    if (hasLower && hasUpper) {
        return std::nullopt;
    }

    // Find separator
    size_t pos = lower.rfind('1');
    if (pos == std::string::npos || pos < 1 || pos + 7 > lower.size()) {
        return std::nullopt;
    }

    std::string hrp = lower.substr(0, pos);

    std::vector<uint8_t> values;
    for (size_t i = pos + 1; i < lower.size(); ++i) {
        int8_t val = Bech32CharValue(lower[i]);
        if (val < 0) {
            return std::nullopt;
        }
        values.push_back(static_cast<uint8_t>(val));
    }

    if (!Bech32VerifyChecksum(hrp, values)) {
        return std::nullopt;
    }

    // Remove checksum
    values.resize(values.size() - 6);

    std::vector<uint8_t> data;
    if (!ConvertBits5to8(values, data)) {
        return std::nullopt;
    }

    return std::make_pair(hrp, data);
}

std::string EncodeAddress(const std::string& hrp, const Address& address) {
    return EncodeBech32(hrp, std::vector<uint8_t>(address.begin(), address.end()));
}

std::optional<Address> DecodeAddress(const std::string& hrp, const std::string& str) {
    auto decoded = DecodeBech32(str);
    if (!decoded || decoded->first != hrp) {
        return std::nullopt;
    }
    if (decoded->second.size() != Address::SIZE) {
        return std::nullopt;
    }
    return Address(decoded->second.data(), decoded->second.size());
}

} // namespace nuklai
