// NUKLAI - Emission Ledger Tests
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include <gtest/gtest.h>
#include "nuklai/emission/emission.h"
#include "nuklai/emission/stake_store.h"
#include "nuklai/db/memory.h"
#include "test_fakes.h"

#include <memory>
#include <thread>
#include <vector>

namespace nuklai {
namespace emission {
namespace test {

using ::nuklai::test::FailingStakeReader;
using ::nuklai::test::FakeBlockSource;
using ::nuklai::test::FakeConsensusView;
using ::nuklai::test::MakeAddress;
using ::nuklai::test::MakeNodeId;

// ============================================================================
// Test Utilities
// ============================================================================

class EmissionTest : public ::testing::Test {
protected:
    static constexpr Amount MAX_SUPPLY = 1000000 * COIN;
    static constexpr Timestamp START = 100;
    static constexpr Timestamp END = 10000;
    static constexpr Timestamp NOW = 200;

    FakeBlockSource blocks_;
    FakeConsensusView consensus_;
    db::MemoryDatabase db_;
    StakeStore stakes_{&db_};
    EmissionConfig config_;
    std::unique_ptr<Emission> emission_;

    void SetUp() override {
        // At 25% APR, ten 3-second blocks out of a 30-second year earn a
        // quarter of the stake per epoch.
        config_.secondsPerYear = 30;
        config_.emissionAddress = MakeAddress(0xee);
        emission_ = MakeEmission(stakes_, 0, MAX_SUPPLY);
    }

    std::unique_ptr<Emission> MakeEmission(const StakeReader& stakes, Amount supply,
                                           Amount maxSupply) {
        return std::make_unique<Emission>(config_, blocks_, consensus_, stakes,
                                          supply, maxSupply, Address());
    }

    Status Register(const NodeId& node, Amount stake, uint64_t feeRate,
                    Timestamp start = START, Timestamp end = END) {
        return emission_->RegisterValidatorStake(node, {0x02, 0x03}, start, end,
                                                 stake, feeRate);
    }

    Status Delegate(const NodeId& node, const Address& delegator, Amount amount) {
        DelegatorStakeRecord record;
        record.stakedAmount = amount;
        record.stakeStartTime = blocks_.LastAcceptedBlock().timestamp;
        record.rewardAddress = delegator;
        EXPECT_TRUE(stakes_.PutDelegatorStake(delegator, node, record).ok());
        return emission_->DelegateUserStake(node, delegator, amount);
    }

    Amount MintAt(Height height, Timestamp timestamp = NOW) {
        blocks_.Set(height, timestamp);
        return emission_->MintNewNAI();
    }

    ValidatorSnapshot Snapshot(const NodeId& node) {
        auto list = emission_->GetStakedValidator(node);
        EXPECT_EQ(list.size(), 1);
        return list.empty() ? ValidatorSnapshot() : list.front();
    }

    /// Sum of own plus delegated stake over the active validators
    Amount ActiveStake() {
        Amount total = 0;
        for (const auto& v : emission_->GetStakedValidator(NodeId())) {
            if (v.isActive) {
                total += v.stakedAmount + v.delegatedAmount;
            }
        }
        return total;
    }
};

// ============================================================================
// Construction and Supply
// ============================================================================

TEST_F(EmissionTest, InitialState) {
    EXPECT_EQ(emission_->GetTotalSupply(), 0);
    EXPECT_EQ(emission_->GetMaxSupply(), MAX_SUPPLY);
    EXPECT_EQ(emission_->GetTotalStaked(), 0);
    EXPECT_EQ(emission_->GetNumValidators(), 0);
    EXPECT_EQ(emission_->GetEmissionAccount().address, MakeAddress(0xee));
    EXPECT_EQ(emission_->GetEmissionAccount().unclaimedBalance, 0);

    EpochTracker tracker = emission_->GetEpochTracker();
    EXPECT_EQ(tracker.baseAprBps, 2500);
    EXPECT_EQ(tracker.baseValidators, 100);
    EXPECT_EQ(tracker.epochLength, 10);
}

TEST_F(EmissionTest, ZeroMaxSupplyUsesConfig) {
    auto e = MakeEmission(stakes_, 0, 0);
    EXPECT_EQ(e->GetMaxSupply(), config_.maxSupply);
}

TEST_F(EmissionTest, ExplicitEmissionAddressWins) {
    Emission e(config_, blocks_, consensus_, stakes_, 0, MAX_SUPPLY, MakeAddress(0x42));
    EXPECT_EQ(e.GetEmissionAccount().address, MakeAddress(0x42));
}

TEST_F(EmissionTest, ConstructorRejectsBadInputs) {
    EXPECT_THROW(MakeEmission(stakes_, MAX_SUPPLY + 1, MAX_SUPPLY), std::invalid_argument);

    config_.epochLength = 0;
    EXPECT_THROW(MakeEmission(stakes_, 0, MAX_SUPPLY), std::invalid_argument);
}

TEST_F(EmissionTest, AddToTotalSupplyClampsAtCap) {
    EXPECT_EQ(emission_->AddToTotalSupply(10), 10);
    EXPECT_EQ(emission_->AddToTotalSupply(MAX_SUPPLY), MAX_SUPPLY);
    EXPECT_EQ(emission_->GetTotalSupply(), MAX_SUPPLY);
}

TEST_F(EmissionTest, AddToTotalSupplyNearCap) {
    auto e = MakeEmission(stakes_, 990, 1000);
    EXPECT_EQ(e->AddToTotalSupply(50), 1000);
    EXPECT_EQ(e->GetTotalSupply(), 1000);
}

TEST_F(EmissionTest, ReportsLastAcceptedBlock) {
    blocks_.Set(77, 12345);
    EXPECT_EQ(emission_->GetLastAcceptedBlockHeight(), 77);
    EXPECT_EQ(emission_->GetLastAcceptedBlockTimestamp(), 12345);
}

// ============================================================================
// Validator Registry
// ============================================================================

TEST_F(EmissionTest, RegisterCreatesInactiveValidator) {
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 10).ok());

    ValidatorSnapshot v = Snapshot(MakeNodeId(1));
    EXPECT_EQ(v.stakedAmount, 1000);
    EXPECT_EQ(v.delegationFeeRate, 10);
    EXPECT_FALSE(v.isActive);
    EXPECT_EQ(v.stakeStartTime, START);
    EXPECT_EQ(v.stakeEndTime, END);
    EXPECT_EQ(emission_->GetTotalStaked(), 0);
    EXPECT_EQ(emission_->GetNumValidators(), 1);
}

TEST_F(EmissionTest, RegisterRejectsInvalidArguments) {
    EXPECT_EQ(Register(MakeNodeId(1), 1000, 101).code(), Status::INVALID_ARGUMENT);
    EXPECT_EQ(Register(MakeNodeId(1), 1000, 10, 500, 400).code(), Status::INVALID_ARGUMENT);
    EXPECT_EQ(emission_->GetNumValidators(), 0);
}

TEST_F(EmissionTest, ReRegisterInactiveAddsStake) {
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 10).ok());
    ASSERT_TRUE(Register(MakeNodeId(1), 500, 20, START, END + 10).ok());

    ValidatorSnapshot v = Snapshot(MakeNodeId(1));
    EXPECT_EQ(v.stakedAmount, 1500);
    EXPECT_EQ(v.delegationFeeRate, 20);
    EXPECT_EQ(v.stakeEndTime, END + 10);
}

TEST_F(EmissionTest, RegisterActiveValidatorFails) {
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 10).ok());

    // Until the sweep activates it, registering again only adds stake
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 10).ok());
    ValidatorSnapshot pending = Snapshot(MakeNodeId(1));
    EXPECT_EQ(pending.stakedAmount, 2000);
    EXPECT_FALSE(pending.isActive);
    EXPECT_EQ(emission_->GetTotalStaked(), 0);

    MintAt(10);
    ASSERT_TRUE(Snapshot(MakeNodeId(1)).isActive);

    Status s = Register(MakeNodeId(1), 1000, 10);
    EXPECT_EQ(s.code(), Status::VALIDATOR_ALREADY_REGISTERED);
    EXPECT_EQ(s.ToOutput(), "validator already registered");
}

TEST_F(EmissionTest, AprDecaysWithValidatorCount) {
    config_.baseValidators = 2;
    emission_ = MakeEmission(stakes_, 0, MAX_SUPPLY);

    EXPECT_EQ(emission_->GetAPRForValidators(), (Rate{2500, BPS_DENOMINATOR}));
    for (Byte i = 1; i <= 4; ++i) {
        ASSERT_TRUE(Register(MakeNodeId(i), 1000, 0).ok());
    }
    EXPECT_EQ(emission_->GetAPRForValidators(), (Rate{1250, BPS_DENOMINATOR}));
}

// ============================================================================
// Activation Window
// ============================================================================

TEST_F(EmissionTest, ActivationNeedsTimeAfterStart) {
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 10).ok());

    EXPECT_EQ(MintAt(10, START), 0);
    EXPECT_FALSE(Snapshot(MakeNodeId(1)).isActive);

    EXPECT_EQ(MintAt(20, START + 1), 250);
    EXPECT_TRUE(Snapshot(MakeNodeId(1)).isActive);
    EXPECT_EQ(emission_->GetTotalStaked(), 1000);
}

TEST_F(EmissionTest, StaysActiveThroughEndTime) {
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 10, START, 300).ok());

    EXPECT_EQ(MintAt(10, 300), 250);
    EXPECT_TRUE(Snapshot(MakeNodeId(1)).isActive);

    EXPECT_EQ(MintAt(20, 301), 0);
    EXPECT_FALSE(Snapshot(MakeNodeId(1)).isActive);
    EXPECT_EQ(emission_->GetTotalStaked(), 0);
}

// ============================================================================
// Epoch Minting
// ============================================================================

TEST_F(EmissionTest, MintCreditsSingleValidator) {
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 10).ok());

    EXPECT_EQ(MintAt(10), 250);
    EXPECT_EQ(emission_->GetTotalSupply(), 250);

    ValidatorSnapshot v = Snapshot(MakeNodeId(1));
    EXPECT_EQ(v.unclaimedStakedReward, 250);
    EXPECT_EQ(v.unclaimedDelegatedReward, 0);
    EXPECT_EQ(emission_->GetRewardsPerEpoch(), 250);
}

TEST_F(EmissionTest, MintOffBoundaryIsNoOp) {
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 10).ok());
    Hash256 before = emission_->GetStateDigest();

    EXPECT_EQ(MintAt(11), 0);
    EXPECT_EQ(emission_->GetStateDigest(), before);
    EXPECT_FALSE(Snapshot(MakeNodeId(1)).isActive);
}

TEST_F(EmissionTest, MintSplitsByStakeShare) {
    ASSERT_TRUE(Register(MakeNodeId(1), 3000, 0).ok());
    ASSERT_TRUE(Register(MakeNodeId(2), 1000, 0).ok());

    EXPECT_EQ(MintAt(10), 1000);
    EXPECT_EQ(Snapshot(MakeNodeId(1)).unclaimedStakedReward, 750);
    EXPECT_EQ(Snapshot(MakeNodeId(2)).unclaimedStakedReward, 250);
}

TEST_F(EmissionTest, MintNeverExceedsCap) {
    emission_ = MakeEmission(stakes_, MAX_SUPPLY - 100, MAX_SUPPLY);
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 10).ok());

    EXPECT_EQ(MintAt(10), 100);
    EXPECT_EQ(emission_->GetTotalSupply(), MAX_SUPPLY);
    EXPECT_EQ(Snapshot(MakeNodeId(1)).unclaimedStakedReward, 100);

    EXPECT_EQ(MintAt(20), 0);
    EXPECT_EQ(emission_->GetTotalSupply(), MAX_SUPPLY);
    EXPECT_EQ(emission_->GetRewardsPerEpoch(), 0);
}

// ============================================================================
// Fee Distribution
// ============================================================================

TEST_F(EmissionTest, DistributeFeesHalvesBetweenAccountAndValidators) {
    ASSERT_TRUE(Register(MakeNodeId(1), 100, 10).ok());
    blocks_.Set(1, NOW);

    FeeDistribution d = emission_->DistributeFees(100);
    EXPECT_EQ(d.fee, 100);
    EXPECT_EQ(d.emissionShare, 50);
    EXPECT_EQ(d.validatorPool, 50);
    EXPECT_EQ(d.distributed, 50);

    EXPECT_EQ(emission_->GetEmissionAccount().unclaimedBalance, 50);
    ValidatorSnapshot v = Snapshot(MakeNodeId(1));
    EXPECT_TRUE(v.isActive);
    EXPECT_EQ(v.unclaimedStakedReward, 50);
    EXPECT_EQ(emission_->GetTotalSupply(), 0);
}

TEST_F(EmissionTest, DistributeFeesWithoutValidators) {
    blocks_.Set(1, NOW);
    FeeDistribution d = emission_->DistributeFees(101);
    EXPECT_EQ(d.emissionShare, 50);
    EXPECT_EQ(d.validatorPool, 51);
    EXPECT_EQ(d.distributed, 0);
    EXPECT_EQ(emission_->GetEmissionAccount().unclaimedBalance, 50);
}

TEST_F(EmissionTest, DistributeFeesClampedToHeadroom) {
    emission_ = MakeEmission(stakes_, MAX_SUPPLY - 10, MAX_SUPPLY);
    blocks_.Set(1, NOW);

    FeeDistribution d = emission_->DistributeFees(100);
    EXPECT_EQ(d.fee, 10);
    EXPECT_EQ(d.emissionShare, 5);
}

TEST_F(EmissionTest, ClaimEmissionAccountDrains) {
    blocks_.Set(1, NOW);
    emission_->DistributeFees(40);
    EXPECT_EQ(emission_->ClaimEmissionAccount(), 20);
    EXPECT_EQ(emission_->GetEmissionAccount().unclaimedBalance, 0);
    EXPECT_EQ(emission_->ClaimEmissionAccount(), 0);
}

// ============================================================================
// Delegation
// ============================================================================

TEST_F(EmissionTest, DelegateErrors) {
    blocks_.Set(1, NOW);
    EXPECT_EQ(Delegate(MakeNodeId(1), MakeAddress(1), 100).code(),
              Status::VALIDATOR_NOT_FOUND);

    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 80).ok());
    ASSERT_TRUE(Delegate(MakeNodeId(1), MakeAddress(1), 100).ok());
    EXPECT_EQ(Delegate(MakeNodeId(1), MakeAddress(1), 100).code(),
              Status::DELEGATOR_ALREADY_STAKED);

    EXPECT_EQ(Snapshot(MakeNodeId(1)).delegatedAmount, 100);
    EXPECT_EQ(emission_->GetNumDelegators(MakeNodeId(1)), 1);
    EXPECT_EQ(emission_->GetNumDelegators(NodeId()), 1);
}

TEST_F(EmissionTest, DelegationToActiveValidatorCountsImmediately) {
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 80).ok());
    MintAt(10);
    ASSERT_EQ(emission_->GetTotalStaked(), 1000);

    ASSERT_TRUE(Delegate(MakeNodeId(1), MakeAddress(1), 500).ok());
    EXPECT_EQ(emission_->GetTotalStaked(), 1500);
    EXPECT_EQ(ActiveStake(), emission_->GetTotalStaked());
}

TEST_F(EmissionTest, DelegationRewardSplit) {
    blocks_.Set(1, NOW);
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 80).ok());
    ASSERT_TRUE(Delegate(MakeNodeId(1), MakeAddress(1), 1000).ok());

    // 2000 staked earns 500; delegators take 80%
    EXPECT_EQ(MintAt(10), 500);
    ValidatorSnapshot v = Snapshot(MakeNodeId(1));
    EXPECT_EQ(v.unclaimedStakedReward, 100);
    EXPECT_EQ(v.unclaimedDelegatedReward, 400);

    blocks_.Set(20, NOW);
    Amount reward = 0;
    ASSERT_TRUE(emission_->ClaimStakingRewards(MakeNodeId(1), MakeAddress(1), &reward).ok());
    EXPECT_EQ(reward, 400);
    EXPECT_EQ(Snapshot(MakeNodeId(1)).unclaimedDelegatedReward, 0);

    // Already claimed through height 20
    ASSERT_TRUE(emission_->ClaimStakingRewards(MakeNodeId(1), MakeAddress(1), &reward).ok());
    EXPECT_EQ(reward, 0);
}

TEST_F(EmissionTest, RewardsAccumulateAcrossEpochs) {
    blocks_.Set(1, NOW);
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 80).ok());
    ASSERT_TRUE(Delegate(MakeNodeId(1), MakeAddress(1), 1000).ok());

    MintAt(10);
    MintAt(20);
    MintAt(30);

    Amount pending = 0;
    ASSERT_TRUE(emission_->CalculateUserDelegationRewards(MakeNodeId(1), MakeAddress(1),
                                                          30, &pending).ok());
    EXPECT_EQ(pending, 800);
    ASSERT_TRUE(emission_->CalculateUserDelegationRewards(MakeNodeId(1), MakeAddress(1),
                                                          40, &pending).ok());
    EXPECT_EQ(pending, 1200);

    blocks_.Set(40, NOW);
    Amount reward = 0;
    ASSERT_TRUE(emission_->ClaimStakingRewards(MakeNodeId(1), MakeAddress(1), &reward).ok());
    EXPECT_EQ(reward, 1200);
    EXPECT_EQ(Snapshot(MakeNodeId(1)).unclaimedDelegatedReward, 0);
}

TEST_F(EmissionTest, CalculateRewardsErrors) {
    Amount reward = 0;
    EXPECT_EQ(emission_->CalculateUserDelegationRewards(MakeNodeId(1), MakeAddress(1),
                                                        10, &reward).code(),
              Status::VALIDATOR_NOT_FOUND);

    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 80).ok());
    EXPECT_EQ(emission_->CalculateUserDelegationRewards(MakeNodeId(1), MakeAddress(1),
                                                        10, &reward).code(),
              Status::DELEGATOR_NOT_FOUND);

    // Tracked by the ledger but without a stake record
    ASSERT_TRUE(emission_->DelegateUserStake(MakeNodeId(1), MakeAddress(2), 100).ok());
    EXPECT_EQ(emission_->CalculateUserDelegationRewards(MakeNodeId(1), MakeAddress(2),
                                                        10, &reward).code(),
              Status::STAKE_NOT_FOUND);
}

TEST_F(EmissionTest, StorageErrorPropagates) {
    FailingStakeReader failing;
    emission_ = MakeEmission(failing, 0, MAX_SUPPLY);
    blocks_.Set(1, NOW);
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 80).ok());
    ASSERT_TRUE(emission_->DelegateUserStake(MakeNodeId(1), MakeAddress(1), 100).ok());

    Hash256 before = emission_->GetStateDigest();
    Amount reward = 0;
    Status s = emission_->ClaimStakingRewards(MakeNodeId(1), MakeAddress(1), &reward);
    EXPECT_EQ(s.code(), Status::STORAGE_ERROR);
    EXPECT_EQ(s.ToOutput(), "storage error");
    EXPECT_EQ(emission_->GetStateDigest(), before);
}

TEST_F(EmissionTest, UndelegateReturnsPendingReward) {
    blocks_.Set(1, NOW);
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 80).ok());
    ASSERT_TRUE(Delegate(MakeNodeId(1), MakeAddress(1), 1000).ok());
    MintAt(10);

    blocks_.Set(20, NOW);
    Amount reward = 0;
    ASSERT_TRUE(emission_->UndelegateUserStake(MakeNodeId(1), MakeAddress(1), 1000,
                                               &reward).ok());
    EXPECT_EQ(reward, 400);

    ValidatorSnapshot v = Snapshot(MakeNodeId(1));
    EXPECT_EQ(v.delegatedAmount, 0);
    EXPECT_EQ(v.unclaimedDelegatedReward, 0);
    EXPECT_EQ(v.numDelegators, 0);
    EXPECT_EQ(emission_->GetTotalStaked(), 1000);
    EXPECT_EQ(ActiveStake(), emission_->GetTotalStaked());
}

TEST_F(EmissionTest, UndelegateErrors) {
    Amount reward = 0;
    EXPECT_EQ(emission_->UndelegateUserStake(MakeNodeId(1), MakeAddress(1), 1, &reward)
                  .code(),
              Status::VALIDATOR_NOT_FOUND);

    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 80).ok());
    EXPECT_EQ(emission_->UndelegateUserStake(MakeNodeId(1), MakeAddress(1), 1, &reward)
                  .code(),
              Status::DELEGATOR_NOT_FOUND);

    blocks_.Set(1, NOW);
    ASSERT_TRUE(Delegate(MakeNodeId(1), MakeAddress(1), 100).ok());
    Hash256 before = emission_->GetStateDigest();
    EXPECT_EQ(emission_->UndelegateUserStake(MakeNodeId(1), MakeAddress(1), 101, &reward)
                  .code(),
              Status::INVALID_ARGUMENT);
    EXPECT_EQ(emission_->GetStateDigest(), before);
    EXPECT_EQ(Snapshot(MakeNodeId(1)).delegatedAmount, 100);
}

TEST_F(EmissionTest, OverdrawnDelegatedRewardThrowsAndKeepsState) {
    blocks_.Set(1, NOW);
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 80).ok());
    ASSERT_TRUE(Delegate(MakeNodeId(1), MakeAddress(1), 1000).ok());
    ASSERT_TRUE(Delegate(MakeNodeId(1), MakeAddress(2), 1000).ok());

    // 3000 staked earns 750; delegators take 600
    EXPECT_EQ(MintAt(10), 750);

    blocks_.Set(20, NOW);
    Amount reward = 0;
    ASSERT_TRUE(emission_->UndelegateUserStake(MakeNodeId(1), MakeAddress(1), 1000,
                                               &reward).ok());
    EXPECT_EQ(reward, 300);

    // The remaining delegator's share is now measured against 1000 delegated
    Hash256 before = emission_->GetStateDigest();
    EXPECT_THROW(emission_->ClaimStakingRewards(MakeNodeId(1), MakeAddress(2), &reward),
                 InvariantViolation);
    EXPECT_EQ(emission_->GetStateDigest(), before);
}

// ============================================================================
// Validator Claims and Withdrawal
// ============================================================================

TEST_F(EmissionTest, ValidatorClaim) {
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 10).ok());
    MintAt(10);

    Amount reward = 0;
    ASSERT_TRUE(emission_->ClaimStakingRewards(MakeNodeId(1), Address(), &reward).ok());
    EXPECT_EQ(reward, 250);
    EXPECT_EQ(Snapshot(MakeNodeId(1)).unclaimedStakedReward, 0);

    EXPECT_EQ(emission_->ClaimStakingRewards(MakeNodeId(9), Address(), &reward).code(),
              Status::VALIDATOR_NOT_FOUND);
}

TEST_F(EmissionTest, ValidatorClaimFoldsOrphanedDelegatedReward) {
    blocks_.Set(1, NOW);
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 80).ok());
    ASSERT_TRUE(Delegate(MakeNodeId(1), MakeAddress(1), 1000).ok());
    MintAt(10);

    // Leaving within the epoch that was just minted forfeits its reward
    Amount reward = 0;
    ASSERT_TRUE(emission_->UndelegateUserStake(MakeNodeId(1), MakeAddress(1), 1000,
                                               &reward).ok());
    EXPECT_EQ(reward, 0);
    EXPECT_EQ(Snapshot(MakeNodeId(1)).unclaimedDelegatedReward, 400);

    ASSERT_TRUE(emission_->ClaimStakingRewards(MakeNodeId(1), Address(), &reward).ok());
    EXPECT_EQ(reward, 500);
    EXPECT_EQ(Snapshot(MakeNodeId(1)).unclaimedDelegatedReward, 0);
}

TEST_F(EmissionTest, WithdrawWithoutDelegatorsRemovesValidator) {
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 10).ok());
    MintAt(10);

    Amount reward = 0;
    ASSERT_TRUE(emission_->WithdrawValidatorStake(MakeNodeId(1), &reward).ok());
    EXPECT_EQ(reward, 250);
    EXPECT_EQ(emission_->GetTotalStaked(), 0);
    EXPECT_EQ(emission_->GetNumValidators(), 0);
    EXPECT_TRUE(emission_->GetStakedValidator(MakeNodeId(1)).empty());

    EXPECT_EQ(emission_->WithdrawValidatorStake(MakeNodeId(1), &reward).code(),
              Status::VALIDATOR_NOT_FOUND);
}

TEST_F(EmissionTest, WithdrawWithDelegatorsKeepsEntryUntilLastLeaves) {
    blocks_.Set(1, NOW);
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 80).ok());
    ASSERT_TRUE(Delegate(MakeNodeId(1), MakeAddress(1), 1000).ok());
    MintAt(10);

    Amount reward = 0;
    ASSERT_TRUE(emission_->WithdrawValidatorStake(MakeNodeId(1), &reward).ok());
    EXPECT_EQ(reward, 100);
    EXPECT_EQ(emission_->GetTotalStaked(), 0);

    ValidatorSnapshot v = Snapshot(MakeNodeId(1));
    EXPECT_FALSE(v.isActive);
    EXPECT_TRUE(v.withdrawn);
    EXPECT_EQ(v.stakedAmount, 0);
    EXPECT_EQ(v.delegatedAmount, 1000);

    // A withdrawn validator is not re-activated by the sweep
    EXPECT_EQ(MintAt(20), 0);
    EXPECT_FALSE(Snapshot(MakeNodeId(1)).isActive);

    ASSERT_TRUE(emission_->UndelegateUserStake(MakeNodeId(1), MakeAddress(1), 1000,
                                               &reward).ok());
    EXPECT_EQ(reward, 400);
    EXPECT_EQ(emission_->GetNumValidators(), 0);
    EXPECT_EQ(emission_->GetTotalStaked(), 0);
}

TEST_F(EmissionTest, WithdrawAfterLastDelegatorLeftFoldsDelegatedReward) {
    blocks_.Set(1, NOW);
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 80).ok());
    ASSERT_TRUE(Delegate(MakeNodeId(1), MakeAddress(1), 1000).ok());
    MintAt(10);

    Amount reward = 0;
    ASSERT_TRUE(emission_->UndelegateUserStake(MakeNodeId(1), MakeAddress(1), 1000,
                                               &reward).ok());
    EXPECT_EQ(reward, 0);
    EXPECT_EQ(Snapshot(MakeNodeId(1)).unclaimedDelegatedReward, 400);

    ASSERT_TRUE(emission_->WithdrawValidatorStake(MakeNodeId(1), &reward).ok());
    EXPECT_EQ(reward, 100 + 400);
    EXPECT_EQ(emission_->GetNumValidators(), 0);
    EXPECT_EQ(emission_->GetTotalStaked(), 0);
}

TEST_F(EmissionTest, ReRegisterAfterWithdraw) {
    blocks_.Set(1, NOW);
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 80).ok());
    ASSERT_TRUE(Delegate(MakeNodeId(1), MakeAddress(1), 1000).ok());
    MintAt(10);

    Amount reward = 0;
    ASSERT_TRUE(emission_->WithdrawValidatorStake(MakeNodeId(1), &reward).ok());
    ASSERT_TRUE(Register(MakeNodeId(1), 2000, 50).ok());

    ValidatorSnapshot v = Snapshot(MakeNodeId(1));
    EXPECT_FALSE(v.withdrawn);
    EXPECT_EQ(v.stakedAmount, 2000);
    EXPECT_EQ(v.numDelegators, 1);

    MintAt(20);
    EXPECT_TRUE(Snapshot(MakeNodeId(1)).isActive);
    EXPECT_EQ(emission_->GetTotalStaked(), 3000);
}

TEST_F(EmissionTest, TotalStakedTracksActiveValidators) {
    blocks_.Set(1, NOW);
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 80).ok());
    ASSERT_TRUE(Register(MakeNodeId(2), 2000, 10, START, 500).ok());
    ASSERT_TRUE(Delegate(MakeNodeId(1), MakeAddress(1), 300).ok());
    EXPECT_EQ(ActiveStake(), emission_->GetTotalStaked());

    MintAt(10);
    EXPECT_EQ(emission_->GetTotalStaked(), 3300);
    EXPECT_EQ(ActiveStake(), emission_->GetTotalStaked());

    ASSERT_TRUE(Delegate(MakeNodeId(2), MakeAddress(2), 700).ok());
    EXPECT_EQ(ActiveStake(), emission_->GetTotalStaked());

    MintAt(20, 501);
    EXPECT_EQ(emission_->GetTotalStaked(), 1300);
    EXPECT_EQ(ActiveStake(), emission_->GetTotalStaked());

    Amount reward = 0;
    ASSERT_TRUE(emission_->WithdrawValidatorStake(MakeNodeId(1), &reward).ok());
    EXPECT_EQ(emission_->GetTotalStaked(), 0);
    EXPECT_EQ(ActiveStake(), emission_->GetTotalStaked());
}

// ============================================================================
// Queries
// ============================================================================

TEST_F(EmissionTest, GetStakedValidatorFilters) {
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 10).ok());
    ASSERT_TRUE(Register(MakeNodeId(2), 1000, 10).ok());

    EXPECT_EQ(emission_->GetStakedValidator(NodeId()).size(), 2);
    EXPECT_EQ(emission_->GetStakedValidator(MakeNodeId(2)).size(), 1);
    EXPECT_TRUE(emission_->GetStakedValidator(MakeNodeId(3)).empty());
}

TEST_F(EmissionTest, GetAllValidatorsMergesConsensus) {
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 10).ok());
    ASSERT_TRUE(Register(MakeNodeId(2), 500, 10).ok());
    consensus_.validators[MakeNodeId(1)] = {0xaa};
    consensus_.validators[MakeNodeId(3)] = {0xbb};

    auto all = emission_->GetAllValidators();
    ASSERT_EQ(all.size(), 2);

    const ValidatorSnapshot& staked = all[0].nodeId == MakeNodeId(1) ? all[0] : all[1];
    const ValidatorSnapshot& bare = all[0].nodeId == MakeNodeId(1) ? all[1] : all[0];
    EXPECT_EQ(staked.publicKey, std::vector<Byte>{0xaa});
    EXPECT_EQ(staked.stakedAmount, 1000);
    EXPECT_EQ(bare.nodeId, MakeNodeId(3));
    EXPECT_EQ(bare.publicKey, std::vector<Byte>{0xbb});
    EXPECT_EQ(bare.stakedAmount, 0);
    EXPECT_FALSE(bare.isActive);
}

TEST_F(EmissionTest, ToStringSummary) {
    std::string s = emission_->ToString();
    EXPECT_NE(s.find("supply: 0 NAI"), std::string::npos);
    EXPECT_NE(s.find("validators: 0"), std::string::npos);
}

// ============================================================================
// State Digest
// ============================================================================

TEST_F(EmissionTest, DigestIsDeterministic) {
    auto run = [this](Emission& e) {
        blocks_.Set(1, NOW);
        e.RegisterValidatorStake(MakeNodeId(1), {0x01}, START, END, 1000, 80);
        e.DelegateUserStake(MakeNodeId(1), MakeAddress(1), 500);
        blocks_.Set(10, NOW);
        e.MintNewNAI();
        e.DistributeFees(77);
    };

    DelegatorStakeRecord record;
    record.stakedAmount = 500;
    ASSERT_TRUE(stakes_.PutDelegatorStake(MakeAddress(1), MakeNodeId(1), record).ok());

    auto a = MakeEmission(stakes_, 0, MAX_SUPPLY);
    auto b = MakeEmission(stakes_, 0, MAX_SUPPLY);
    run(*a);
    run(*b);
    EXPECT_EQ(a->GetStateDigest(), b->GetStateDigest());

    b->DistributeFees(2);
    EXPECT_NE(a->GetStateDigest(), b->GetStateDigest());
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_F(EmissionTest, ConcurrentFeesAndQueries) {
    ASSERT_TRUE(Register(MakeNodeId(1), 1000, 10).ok());
    blocks_.Set(1, NOW);

    const int threads = 4;
    const int perThread = 100;
    std::vector<std::thread> workers;
    for (int t = 0; t < threads; ++t) {
        workers.emplace_back([this] {
            for (int i = 0; i < perThread; ++i) {
                emission_->DistributeFees(10);
                (void)emission_->GetTotalStaked();
                (void)emission_->GetStateDigest();
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    EXPECT_EQ(emission_->GetEmissionAccount().unclaimedBalance, threads * perThread * 5);
    EXPECT_EQ(Snapshot(MakeNodeId(1)).unclaimedStakedReward, threads * perThread * 5);
    EXPECT_EQ(emission_->GetTotalStaked(), 1000);
}

} // namespace test
} // namespace emission
} // namespace nuklai
