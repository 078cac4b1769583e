// NUKLAI - Staked Validator
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#ifndef NUKLAI_EMISSION_VALIDATOR_H
#define NUKLAI_EMISSION_VALIDATOR_H

#include "nuklai/core/types.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace nuklai {
namespace emission {

// ============================================================================
// Validator
// ============================================================================

/**
 * Stake and reward bookkeeping for one validator node.
 *
 * Delegator principals live in the stake store; the validator keeps only
 * the aggregate delegatedAmount and each delegator's last claim height.
 */
struct Validator {
    NodeId nodeId;
    std::vector<Byte> publicKey;

    /// Self-bonded stake
    Amount stakedAmount{0};

    /// Sum of all delegator principals
    Amount delegatedAmount{0};

    /// Whole percent of delegation proceeds credited to delegators (0..100)
    uint64_t delegationFeeRate{0};

    Amount unclaimedStakedReward{0};
    Amount unclaimedDelegatedReward{0};

    /// Counts toward total staked and receives rewards
    bool isActive{false};

    /// Stake withdrawn; never re-activated until registered again
    bool withdrawn{false};

    Timestamp stakeStartTime{0};
    Timestamp stakeEndTime{0};

    /// Delegator -> block height of the last claim
    std::map<Address, Height> delegatorsLastClaim;

    /// Epoch number -> delegation reward recorded for that epoch
    std::map<uint64_t, Amount> epochRewards;

    /// Own plus delegated stake (throws on overflow)
    Amount GetTotalStake() const;

    size_t NumDelegators() const { return delegatorsLastClaim.size(); }

    std::string ToString() const;
};

// ============================================================================
// Validator Snapshot
// ============================================================================

/**
 * Copy of a validator's public state, returned by queries.
 */
struct ValidatorSnapshot {
    NodeId nodeId;
    std::vector<Byte> publicKey;
    Amount stakedAmount{0};
    Amount delegatedAmount{0};
    uint64_t delegationFeeRate{0};
    Amount unclaimedStakedReward{0};
    Amount unclaimedDelegatedReward{0};
    bool isActive{false};
    bool withdrawn{false};
    Timestamp stakeStartTime{0};
    Timestamp stakeEndTime{0};
    size_t numDelegators{0};

    static ValidatorSnapshot From(const Validator& v);

    std::string ToString() const;
};

// ============================================================================
// Reward Split
// ============================================================================

struct RewardSplit {
    Amount validatorShare{0};
    Amount delegationShare{0};
};

/**
 * Split a validator's reward between the validator and its delegators.
 * The validator keeps everything when nothing is delegated; otherwise
 * delegators get floor(total * feeRate / 100).
 */
RewardSplit SplitValidatorReward(Amount total, uint64_t delegationFeeRate,
                                 Amount delegatedAmount);

} // namespace emission
} // namespace nuklai

#endif // NUKLAI_EMISSION_VALIDATOR_H
