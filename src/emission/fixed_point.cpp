// NUKLAI - Fixed-Point Reward Arithmetic Implementation
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include "nuklai/emission/fixed_point.h"

#include "nuklai/emission/status.h"

#include <iomanip>
#include <limits>
#include <sstream>

namespace nuklai {
namespace emission {

namespace {

constexpr uint128 UINT128_MAX_VALUE = ~static_cast<uint128>(0);

uint128 Mul128(uint128 a, uint128 b) {
    if (a != 0 && b > UINT128_MAX_VALUE / a) {
        RaiseInvariantViolation("128-bit multiplication overflow");
    }
    return a * b;
}

} // namespace

uint64_t MulDiv(uint64_t a, uint64_t b, uint64_t c) {
    if (c == 0) {
        RaiseInvariantViolation("MulDiv: division by zero");
    }
    uint128 result = static_cast<uint128>(a) * b / c;
    if (result > std::numeric_limits<uint64_t>::max()) {
        RaiseInvariantViolation("MulDiv: result exceeds 64 bits");
    }
    return static_cast<uint64_t>(result);
}

Amount CheckedAdd(Amount a, Amount b, const char* what) {
    if (a > std::numeric_limits<Amount>::max() - b) {
        RaiseInvariantViolation(std::string(what) + " overflow");
    }
    return a + b;
}

Amount CheckedSub(Amount a, Amount b, const char* what) {
    if (b > a) {
        RaiseInvariantViolation(std::string(what) + " underflow");
    }
    return a - b;
}

// ============================================================================
// Rate
// ============================================================================

std::string Rate::ToString() const {
    // Percent scaled by 10^4
    uint64_t scaled = MulDiv(num, 100 * BPS_DENOMINATOR, den);
    std::ostringstream ss;
    ss << scaled / BPS_DENOMINATOR << "."
       << std::setfill('0') << std::setw(4) << scaled % BPS_DENOMINATOR << "%";
    return ss.str();
}

Rate AprForValidators(uint64_t baseAprBps, uint64_t baseValidators,
                      uint64_t numValidators) {
    if (numValidators <= baseValidators) {
        return Rate{baseAprBps, BPS_DENOMINATOR};
    }
    uint128 num = Mul128(baseAprBps, baseValidators);
    uint128 den = Mul128(BPS_DENOMINATOR, numValidators);
    if (num > std::numeric_limits<uint64_t>::max() ||
        den > std::numeric_limits<uint64_t>::max()) {
        RaiseInvariantViolation("APR rate does not fit in 64 bits");
    }
    return Rate{static_cast<uint64_t>(num), static_cast<uint64_t>(den)};
}

Amount RewardsPerEpoch(Amount totalStaked, const Rate& apr,
                       uint64_t epochLength, uint64_t secondsPerBlock,
                       uint64_t secondsPerYear, Amount headroom) {
    uint128 num = Mul128(Mul128(Mul128(totalStaked, apr.num), epochLength),
                         secondsPerBlock);
    uint128 den = Mul128(apr.den, secondsPerYear);
    if (den == 0) {
        RaiseInvariantViolation("RewardsPerEpoch: zero denominator");
    }
    uint128 rewards = num / den;
    if (rewards > headroom) {
        return headroom;
    }
    return static_cast<Amount>(rewards);
}

std::string FormatAmount(Amount amount) {
    std::ostringstream ss;
    Amount whole = amount / COIN;
    Amount frac = amount % COIN;
    ss << whole;
    if (frac > 0) {
        ss << "." << std::setfill('0') << std::setw(9) << frac;
        std::string s = ss.str();
        s.erase(s.find_last_not_of('0') + 1);
        return s + " NAI";
    }
    return ss.str() + " NAI";
}

} // namespace emission
} // namespace nuklai
