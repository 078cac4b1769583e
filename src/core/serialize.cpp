// NUKLAI - Serialization Implementation
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include "nuklai/core/serialize.h"
#include "nuklai/core/hex.h"

namespace nuklai {

std::string DataStream::ToHex() const {
    return BytesToHex(data(), size());
}

} // namespace nuklai
