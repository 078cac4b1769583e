// NUKLAI - Database Status
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include "nuklai/db/database.h"

namespace nuklai {
namespace db {

std::string Status::ToString() const {
    switch (code_) {
        case OK: return "OK";
        case NOT_FOUND: return "NotFound: " + message_;
        case CORRUPTION: return "Corruption: " + message_;
        case IO_ERROR: return "IOError: " + message_;
    }
    return "Unknown: " + message_;
}

} // namespace db
} // namespace nuklai
