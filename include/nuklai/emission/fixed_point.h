// NUKLAI - Fixed-Point Reward Arithmetic
// Copyright (c) 2024 NUKLAI Developers
// MIT License
//
// Integer arithmetic used by every consensus-relevant reward formula.
// All products are formed in 128 bits and floored once at the end, so
// every node computes bit-identical results.

#ifndef NUKLAI_EMISSION_FIXED_POINT_H
#define NUKLAI_EMISSION_FIXED_POINT_H

#include "nuklai/core/types.h"

#include <cstdint>
#include <string>

namespace nuklai {
namespace emission {

/// Unsigned 128-bit intermediate (GCC/Clang builtin)
using uint128 = unsigned __int128;

/// Basis points in 100 %
constexpr uint64_t BPS_DENOMINATOR = 10000;

/// Percent in 100 % (delegation fee rates are whole percents)
constexpr uint64_t PERCENT_DENOMINATOR = 100;

/// floor(a * b / c). Throws InvariantViolation if c == 0 or the result
/// does not fit in 64 bits.
uint64_t MulDiv(uint64_t a, uint64_t b, uint64_t c);

/// a + b, throwing InvariantViolation on overflow. `what` names the counter.
Amount CheckedAdd(Amount a, Amount b, const char* what);

/// a - b, throwing InvariantViolation on underflow. `what` names the counter.
Amount CheckedSub(Amount a, Amount b, const char* what);

// ============================================================================
// Rate
// ============================================================================

/**
 * A non-negative rational rate num / den.
 */
struct Rate {
    uint64_t num{0};
    uint64_t den{1};

    /// floor(amount * num / den)
    Amount ApplyTo(Amount amount) const { return MulDiv(amount, num, den); }

    /// Rate in basis points, floored
    uint64_t ToBps() const { return MulDiv(num, BPS_DENOMINATOR, den); }

    /// Percentage with four decimals, e.g. "25.0000%"
    std::string ToString() const;

    /// Exact comparison of the rational values
    bool operator==(const Rate& other) const {
        return static_cast<uint128>(num) * other.den ==
               static_cast<uint128>(other.num) * den;
    }
    bool operator!=(const Rate& other) const { return !(*this == other); }
};

/**
 * Annual reward rate for a validator set of the given size: the base rate
 * up to `baseValidators`, then decaying as baseValidators / numValidators.
 */
Rate AprForValidators(uint64_t baseAprBps, uint64_t baseValidators,
                      uint64_t numValidators);

/**
 * Reward minted for one epoch:
 *   min(headroom, floor(totalStaked * apr * epochLength * secondsPerBlock
 *                       / secondsPerYear))
 * where headroom is what remains below the supply cap.
 */
Amount RewardsPerEpoch(Amount totalStaked, const Rate& apr,
                       uint64_t epochLength, uint64_t secondsPerBlock,
                       uint64_t secondsPerYear, Amount headroom);

/// Format a base-unit amount as NAI, e.g. "1.5 NAI"
std::string FormatAmount(Amount amount);

} // namespace emission
} // namespace nuklai

#endif // NUKLAI_EMISSION_FIXED_POINT_H
