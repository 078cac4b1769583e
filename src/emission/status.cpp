// NUKLAI - Emission Ledger Status Implementation
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include "nuklai/emission/status.h"

#include "nuklai/util/logging.h"

namespace nuklai {
namespace emission {

const char* StatusCodeToString(Status::Code code) {
    switch (code) {
        case Status::OK: return "OK";
        case Status::VALIDATOR_NOT_FOUND: return "ValidatorNotFound";
        case Status::VALIDATOR_ALREADY_REGISTERED: return "ValidatorAlreadyRegistered";
        case Status::DELEGATOR_NOT_FOUND: return "DelegatorNotFound";
        case Status::DELEGATOR_ALREADY_STAKED: return "DelegatorAlreadyStaked";
        case Status::STAKE_NOT_FOUND: return "StakeNotFound";
        case Status::INVALID_ARGUMENT: return "InvalidArgument";
        case Status::STORAGE_ERROR: return "StorageError";
    }
    return "Unknown";
}

std::string Status::ToString() const {
    if (ok()) return "OK";
    std::string result = StatusCodeToString(code_);
    if (!message_.empty()) {
        result += ": " + message_;
    }
    return result;
}

std::string Status::ToOutput() const {
    switch (code_) {
        case OK: return "";
        case VALIDATOR_NOT_FOUND: return "validator not found";
        case VALIDATOR_ALREADY_REGISTERED: return "validator already registered";
        case DELEGATOR_NOT_FOUND: return "delegator not found";
        case DELEGATOR_ALREADY_STAKED: return "delegator already staked";
        case STAKE_NOT_FOUND: return "stake is missing";
        case INVALID_ARGUMENT: return message_.empty() ? "invalid argument" : message_;
        case STORAGE_ERROR: return "storage error";
    }
    return "unknown error";
}

void RaiseInvariantViolation(const std::string& what) {
    LOG_ERROR(util::LogCategory::EMISSION) << "Invariant violation: " << what;
    throw InvariantViolation(what);
}

} // namespace emission
} // namespace nuklai
