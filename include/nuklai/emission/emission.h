// NUKLAI - Emission Ledger
// Copyright (c) 2024 NUKLAI Developers
// MIT License
//
// Tracks NAI supply, validator and delegator stake, and turns block fees
// and epoch boundaries into reward accruals under a hard supply cap.
//
// Key properties:
// - Deterministic: all reward math is integer arithmetic floored once
// - Capped: total supply never exceeds max supply
// - Thread-safe: mutations are exclusive, queries share a read lock
// - Reward disbursement is left to the caller; the ledger only accounts

#ifndef NUKLAI_EMISSION_EMISSION_H
#define NUKLAI_EMISSION_EMISSION_H

#include "nuklai/core/types.h"
#include "nuklai/emission/chain.h"
#include "nuklai/emission/config.h"
#include "nuklai/emission/fixed_point.h"
#include "nuklai/emission/status.h"
#include "nuklai/emission/validator.h"

#include <map>
#include <shared_mutex>
#include <string>
#include <vector>

namespace nuklai {
namespace emission {

// ============================================================================
// Ledger Types
// ============================================================================

/// Protocol fee sink, drained by an external claim action
struct EmissionAccount {
    Address address;
    Amount unclaimedBalance{0};
};

/// Reward schedule parameters
struct EpochTracker {
    uint64_t baseAprBps{DEFAULT_BASE_APR_BPS};
    uint64_t baseValidators{DEFAULT_BASE_VALIDATORS};
    uint64_t epochLength{DEFAULT_EPOCH_LENGTH};
};

/// Outcome of one DistributeFees call
struct FeeDistribution {
    /// Fee after clamping to the supply cap
    Amount fee{0};
    /// Credited to the emission account
    Amount emissionShare{0};
    /// Offered to active validators
    Amount validatorPool{0};
    /// Actually credited to validators (pool minus rounding dust)
    Amount distributed{0};
};

/// Compute units charged by the action layer for each ledger action
namespace ComputeUnits {
    constexpr uint64_t REGISTER_VALIDATOR_STAKE = 5;
    constexpr uint64_t WITHDRAW_VALIDATOR_STAKE = 1;
    constexpr uint64_t DELEGATE_USER_STAKE = 5;
    constexpr uint64_t UNDELEGATE_USER_STAKE = 1;
    constexpr uint64_t CLAIM_STAKING_REWARD = 2;
}

// ============================================================================
// Emission
// ============================================================================

class Emission {
public:
    /**
     * Create the ledger.
     *
     * @param config Reward schedule and supply cap
     * @param blocks Last accepted block (the ledger's only clock)
     * @param consensus Consensus validator set, for GetAllValidators
     * @param stakes Persisted delegator principals
     * @param totalSupply Supply already in circulation
     * @param maxSupply Supply cap, 0 to use config.maxSupply
     * @param emissionAddress Owner of the emission account
     *
     * Collaborators must outlive the ledger. Throws std::invalid_argument
     * on an invalid config or totalSupply above the cap.
     */
    Emission(const EmissionConfig& config,
             const BlockSource& blocks,
             const ConsensusView& consensus,
             const StakeReader& stakes,
             Amount totalSupply,
             Amount maxSupply,
             const Address& emissionAddress);

    Emission(const Emission&) = delete;
    Emission& operator=(const Emission&) = delete;

    // === Supply ===

    /// Add to total supply, clamped at the cap. Returns the new total.
    Amount AddToTotalSupply(Amount amount);

    // === Validator Registry ===

    /**
     * Register stake for a validator. An inactive entry is updated in
     * place (stake added, key, fee rate and window replaced) and keeps
     * its delegators and epoch history.
     *
     * @param delegationFeeRate Whole percent 0..100
     */
    Status RegisterValidatorStake(const NodeId& nodeId,
                                  const std::vector<Byte>& publicKey,
                                  Timestamp stakeStartTime,
                                  Timestamp stakeEndTime,
                                  Amount stakedAmount,
                                  uint64_t delegationFeeRate);

    /// Withdraw a validator's stake; *reward receives its unclaimed reward
    Status WithdrawValidatorStake(const NodeId& nodeId, Amount* reward);

    // === Delegation Ledger ===

    Status DelegateUserStake(const NodeId& nodeId, const Address& delegator,
                             Amount stakeAmount);

    /// Remove a delegation; *reward receives the delegator's pending reward
    Status UndelegateUserStake(const NodeId& nodeId, const Address& delegator,
                               Amount stakeAmount, Amount* reward);

    /**
     * Claim rewards. The empty address claims for the validator itself;
     * any other address claims as a delegator of nodeId.
     */
    Status ClaimStakingRewards(const NodeId& nodeId, const Address& actor,
                               Amount* reward);

    /**
     * Pending reward of a delegator as of currentHeight, summed over the
     * epochs [lastClaim / epochLength, currentHeight / epochLength).
     * Does not modify the ledger.
     */
    Status CalculateUserDelegationRewards(const NodeId& nodeId,
                                          const Address& delegator,
                                          Height currentHeight,
                                          Amount* reward) const;

    // === Block Processing ===

    /// Mint and apportion epoch rewards; 0 unless at an epoch boundary
    Amount MintNewNAI();

    /// Split a block's fees between the emission account and validators
    FeeDistribution DistributeFees(Amount fee);

    // === Queries ===

    /// One validator, or every validator when nodeId is empty
    std::vector<ValidatorSnapshot> GetStakedValidator(const NodeId& nodeId) const;

    /// Consensus validators merged with their stake bookkeeping
    std::vector<ValidatorSnapshot> GetAllValidators() const;

    /// Delegators of one validator, or of all when nodeId is empty
    size_t GetNumDelegators(const NodeId& nodeId) const;

    Rate GetAPRForValidators() const;
    Amount GetRewardsPerEpoch() const;

    Amount GetTotalSupply() const;
    Amount GetMaxSupply() const;
    Amount GetTotalStaked() const;
    size_t GetNumValidators() const;
    EmissionAccount GetEmissionAccount() const;
    EpochTracker GetEpochTracker() const;

    /// Drain the emission account; returns the amount drained
    Amount ClaimEmissionAccount();

    Height GetLastAcceptedBlockHeight() const;
    Timestamp GetLastAcceptedBlockTimestamp() const;

    /// SHA-256 of the canonical serialization of the whole ledger
    Hash256 GetStateDigest() const;

    std::string ToString() const;

private:
    /// Activity changes due at a block time, and the resulting total staked
    struct SweepPlan {
        std::vector<std::pair<Validator*, bool>> transitions;
        std::vector<Validator*> active;
        Amount totalStaked{0};
    };

    /// Reward credits computed against a sweep
    struct CreditPlan {
        struct Credit {
            Validator* validator;
            RewardSplit split;
            Amount newStakedReward;
            Amount newDelegatedReward;
        };
        std::vector<Credit> credits;
        Amount distributed{0};
    };

    SweepPlan PlanSweep(Timestamp now);
    CreditPlan PlanCredits(const SweepPlan& sweep, Amount pool) const;
    void ApplySweep(const SweepPlan& sweep);
    void ApplyCredits(const CreditPlan& plan);

    Status CalculateRewardsLocked(const Validator& validator,
                                  const Address& delegator,
                                  Height currentHeight,
                                  Amount* reward) const;

    Rate AprLocked() const;
    Amount RewardsPerEpochLocked(Amount totalStaked) const;

    const BlockSource& blocks_;
    const ConsensusView& consensus_;
    const StakeReader& stakes_;

    const uint64_t secondsPerBlock_;
    const uint64_t secondsPerYear_;

    Amount totalSupply_;
    Amount maxSupply_;
    Amount totalStaked_{0};
    EmissionAccount emissionAccount_;
    EpochTracker epochTracker_;
    std::map<NodeId, Validator> validators_;

    mutable std::shared_mutex mutex_;
};

} // namespace emission
} // namespace nuklai

#endif // NUKLAI_EMISSION_EMISSION_H
