// NUKLAI - Fixed-Point Arithmetic Tests
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include <gtest/gtest.h>
#include "nuklai/emission/fixed_point.h"
#include "nuklai/emission/status.h"
#include "nuklai/emission/config.h"

#include <limits>

namespace nuklai {
namespace emission {
namespace test {

constexpr uint64_t U64_MAX = std::numeric_limits<uint64_t>::max();

// ============================================================================
// MulDiv and Checked Arithmetic
// ============================================================================

TEST(FixedPointTest, MulDivFloors) {
    EXPECT_EQ(MulDiv(10, 3, 4), 7);   // 7.5
    EXPECT_EQ(MulDiv(1, 1, 3), 0);
    EXPECT_EQ(MulDiv(0, 5, 7), 0);
}

TEST(FixedPointTest, MulDivUses128BitIntermediate) {
    EXPECT_EQ(MulDiv(U64_MAX, U64_MAX, U64_MAX), U64_MAX);
    EXPECT_EQ(MulDiv(U64_MAX, 2, 4), U64_MAX / 2);
}

TEST(FixedPointTest, MulDivRejectsZeroDivisor) {
    EXPECT_THROW(MulDiv(1, 1, 0), InvariantViolation);
}

TEST(FixedPointTest, MulDivRejectsOversizedResult) {
    EXPECT_THROW(MulDiv(U64_MAX, 2, 1), InvariantViolation);
}

TEST(FixedPointTest, CheckedAddSub) {
    EXPECT_EQ(CheckedAdd(1, 2, "x"), 3);
    EXPECT_EQ(CheckedSub(5, 5, "x"), 0);
    EXPECT_THROW(CheckedAdd(U64_MAX, 1, "x"), InvariantViolation);
    EXPECT_THROW(CheckedSub(1, 2, "x"), InvariantViolation);
}

TEST(FixedPointTest, CheckedSubNamesCounter) {
    try {
        CheckedSub(0, 1, "unclaimed delegated reward");
        FAIL() << "expected throw";
    } catch (const InvariantViolation& e) {
        EXPECT_STREQ(e.what(), "unclaimed delegated reward underflow");
    }
}

// ============================================================================
// Rate
// ============================================================================

TEST(RateTest, ToStringAndBps) {
    Rate r{2500, BPS_DENOMINATOR};
    EXPECT_EQ(r.ToString(), "25.0000%");
    EXPECT_EQ(r.ToBps(), 2500);

    Rate third{1, 3};
    EXPECT_EQ(third.ToString(), "33.3333%");
    EXPECT_EQ(third.ToBps(), 3333);
}

TEST(RateTest, ApplyToFloors) {
    Rate r{1, 3};
    EXPECT_EQ(r.ApplyTo(10), 3);
}

TEST(RateTest, EqualityIsRational) {
    EXPECT_EQ((Rate{1, 2}), (Rate{5000, 10000}));
    EXPECT_NE((Rate{1, 2}), (Rate{1, 3}));
}

// ============================================================================
// APR
// ============================================================================

TEST(AprTest, BaseRateUpToBaseValidators) {
    EXPECT_EQ(AprForValidators(2500, 100, 0), (Rate{2500, BPS_DENOMINATOR}));
    EXPECT_EQ(AprForValidators(2500, 100, 100), (Rate{2500, BPS_DENOMINATOR}));
}

TEST(AprTest, DecaysBeyondBaseValidators) {
    // 25% * 100 / 200 = 12.5%
    Rate r = AprForValidators(2500, 100, 200);
    EXPECT_EQ(r, (Rate{1250, BPS_DENOMINATOR}));
    EXPECT_EQ(r.ToString(), "12.5000%");

    // 25% * 100 / 300 = 8.3333%
    EXPECT_EQ(AprForValidators(2500, 100, 300).ToBps(), 833);
}

TEST(AprTest, MonotonicallyNonIncreasing) {
    Rate prev = AprForValidators(2500, 10, 1);
    for (uint64_t n = 2; n < 50; ++n) {
        Rate cur = AprForValidators(2500, 10, n);
        EXPECT_TRUE(static_cast<uint128>(cur.num) * prev.den <=
                    static_cast<uint128>(prev.num) * cur.den) << n;
        prev = cur;
    }
}

// ============================================================================
// Rewards per Epoch
// ============================================================================

TEST(RewardsPerEpochTest, MatchesFormula) {
    Rate apr{2500, BPS_DENOMINATOR};
    // 1,000,000 NAI * 25% * 10 blocks * 3 s / 31,536,000 s
    Amount staked = 1000000 * COIN;
    Amount expected = static_cast<Amount>(
        static_cast<uint128>(staked) * 2500 * 10 * 3 / (10000ULL * 31536000ULL));
    EXPECT_EQ(RewardsPerEpoch(staked, apr, 10, 3, DEFAULT_SECONDS_PER_YEAR, U64_MAX),
              expected);
    EXPECT_EQ(expected, 237823439ULL);
}

TEST(RewardsPerEpochTest, ClampedToHeadroom) {
    Rate apr{2500, BPS_DENOMINATOR};
    EXPECT_EQ(RewardsPerEpoch(1000000 * COIN, apr, 10, 3, DEFAULT_SECONDS_PER_YEAR, 5), 5);
    EXPECT_EQ(RewardsPerEpoch(1000000 * COIN, apr, 10, 3, DEFAULT_SECONDS_PER_YEAR, 0), 0);
}

TEST(RewardsPerEpochTest, ZeroStakeMintsNothing) {
    Rate apr{2500, BPS_DENOMINATOR};
    EXPECT_EQ(RewardsPerEpoch(0, apr, 10, 3, DEFAULT_SECONDS_PER_YEAR, U64_MAX), 0);
}

// ============================================================================
// Formatting
// ============================================================================

TEST(FormatAmountTest, TrimsTrailingZeros) {
    EXPECT_EQ(FormatAmount(0), "0 NAI");
    EXPECT_EQ(FormatAmount(COIN), "1 NAI");
    EXPECT_EQ(FormatAmount(COIN + COIN / 2), "1.5 NAI");
    EXPECT_EQ(FormatAmount(1), "0.000000001 NAI");
}

} // namespace test
} // namespace emission
} // namespace nuklai
