// NUKLAI - Emission Ledger Status
// Copyright (c) 2024 NUKLAI Developers
// MIT License
//
// Business outcomes of ledger operations, and the exception type raised
// when the ledger detects a state that its own guards should have made
// impossible.

#ifndef NUKLAI_EMISSION_STATUS_H
#define NUKLAI_EMISSION_STATUS_H

#include <stdexcept>
#include <string>

namespace nuklai {
namespace emission {

// ============================================================================
// Status
// ============================================================================

/**
 * Status returned by ledger operations.
 *
 * Business errors are deterministic: the same inputs always produce the
 * same status, so callers fail the triggering action instead of retrying.
 */
class Status {
public:
    enum Code {
        OK = 0,
        VALIDATOR_NOT_FOUND = 1,
        VALIDATOR_ALREADY_REGISTERED = 2,
        DELEGATOR_NOT_FOUND = 3,
        DELEGATOR_ALREADY_STAKED = 4,
        STAKE_NOT_FOUND = 5,
        INVALID_ARGUMENT = 6,
        STORAGE_ERROR = 7,
    };

private:
    Code code_;
    std::string message_;

public:
    Status() : code_(OK) {}
    Status(Code code, const std::string& msg = "") : code_(code), message_(msg) {}

    static Status Ok() { return Status(); }
    static Status ValidatorNotFound(const std::string& msg = "") { return Status(VALIDATOR_NOT_FOUND, msg); }
    static Status ValidatorAlreadyRegistered(const std::string& msg = "") { return Status(VALIDATOR_ALREADY_REGISTERED, msg); }
    static Status DelegatorNotFound(const std::string& msg = "") { return Status(DELEGATOR_NOT_FOUND, msg); }
    static Status DelegatorAlreadyStaked(const std::string& msg = "") { return Status(DELEGATOR_ALREADY_STAKED, msg); }
    static Status StakeNotFound(const std::string& msg = "") { return Status(STAKE_NOT_FOUND, msg); }
    static Status InvalidArgument(const std::string& msg = "") { return Status(INVALID_ARGUMENT, msg); }
    static Status StorageError(const std::string& msg = "") { return Status(STORAGE_ERROR, msg); }

    bool ok() const { return code_ == OK; }
    bool IsValidatorNotFound() const { return code_ == VALIDATOR_NOT_FOUND; }
    bool IsDelegatorNotFound() const { return code_ == DELEGATOR_NOT_FOUND; }
    bool IsStakeNotFound() const { return code_ == STAKE_NOT_FOUND; }

    Code code() const { return code_; }
    const std::string& message() const { return message_; }

    /// "<CodeName>: <message>"
    std::string ToString() const;

    /// Output message the action layer reports for a failed action
    std::string ToOutput() const;

    bool operator==(const Status& other) const { return code_ == other.code_; }
    bool operator!=(const Status& other) const { return code_ != other.code_; }
};

/// Stable name of a status code
const char* StatusCodeToString(Status::Code code);

// ============================================================================
// Invariant Violation
// ============================================================================

/**
 * Raised when an operation would drive the ledger into an impossible state
 * (counter underflow, overflow, minting past the supply cap). It is thrown
 * before anything is modified, so the ledger is left as it was.
 */
class InvariantViolation : public std::logic_error {
public:
    explicit InvariantViolation(const std::string& what)
        : std::logic_error(what) {}
};

/// Log `what` at Error under the emission category, then throw
[[noreturn]] void RaiseInvariantViolation(const std::string& what);

} // namespace emission
} // namespace nuklai

#endif // NUKLAI_EMISSION_STATUS_H
