// NUKLAI - Emission Ledger Implementation
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include "nuklai/emission/emission.h"
#include "nuklai/core/serialize.h"
#include "nuklai/crypto/sha256.h"
#include "nuklai/util/logging.h"

#include <algorithm>
#include <mutex>
#include <sstream>
#include <stdexcept>

namespace nuklai {
namespace emission {

namespace {

Status Rejected(const char* operation, const Status& status) {
    LOG_DEBUG(util::LogCategory::EMISSION) << operation << " rejected: "
                                           << status.ToString();
    return status;
}

std::string ShortId(const NodeId& nodeId) {
    return nodeId.ToHex().substr(0, 12);
}

} // namespace

// ============================================================================
// Construction
// ============================================================================

Emission::Emission(const EmissionConfig& config,
                   const BlockSource& blocks,
                   const ConsensusView& consensus,
                   const StakeReader& stakes,
                   Amount totalSupply,
                   Amount maxSupply,
                   const Address& emissionAddress)
    : blocks_(blocks),
      consensus_(consensus),
      stakes_(stakes),
      secondsPerBlock_(config.secondsPerBlock),
      secondsPerYear_(config.secondsPerYear),
      totalSupply_(totalSupply),
      maxSupply_(maxSupply == 0 ? config.maxSupply : maxSupply) {
    Status s = config.Validate();
    if (!s.ok()) {
        throw std::invalid_argument("Invalid emission config: " + s.ToString());
    }
    if (totalSupply_ > maxSupply_) {
        throw std::invalid_argument("Total supply " + std::to_string(totalSupply_) +
                                    " exceeds max supply " + std::to_string(maxSupply_));
    }

    emissionAccount_.address =
        emissionAddress.IsNull() ? config.emissionAddress : emissionAddress;
    epochTracker_.baseAprBps = config.baseAprBps;
    epochTracker_.baseValidators = config.baseValidators;
    epochTracker_.epochLength = config.epochLength;

    LOG_INFO(util::LogCategory::EMISSION) << "Emission ledger initialized: supply "
        << FormatAmount(totalSupply_) << " of " << FormatAmount(maxSupply_)
        << ", epoch length " << epochTracker_.epochLength;
}

// ============================================================================
// Supply
// ============================================================================

Amount Emission::AddToTotalSupply(Amount amount) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    LOG_INFO(util::LogCategory::EMISSION) << "Adding " << FormatAmount(amount)
                                          << " to total supply";

    Amount headroom = maxSupply_ - totalSupply_;
    totalSupply_ += std::min(amount, headroom);
    return totalSupply_;
}

// ============================================================================
// Validator Registry
// ============================================================================

Status Emission::RegisterValidatorStake(const NodeId& nodeId,
                                        const std::vector<Byte>& publicKey,
                                        Timestamp stakeStartTime,
                                        Timestamp stakeEndTime,
                                        Amount stakedAmount,
                                        uint64_t delegationFeeRate) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    LOG_INFO(util::LogCategory::EMISSION) << "Registering validator stake for "
                                          << ShortId(nodeId);

    if (delegationFeeRate > PERCENT_DENOMINATOR) {
        return Rejected("RegisterValidatorStake",
                        Status::InvalidArgument("delegation fee rate above 100 percent"));
    }
    if (stakeEndTime < stakeStartTime) {
        return Rejected("RegisterValidatorStake",
                        Status::InvalidArgument("stake end time before start time"));
    }

    auto it = validators_.find(nodeId);
    if (it != validators_.end()) {
        Validator& v = it->second;
        if (v.isActive) {
            return Rejected("RegisterValidatorStake", Status::ValidatorAlreadyRegistered());
        }
        Amount newStake = CheckedAdd(v.stakedAmount, stakedAmount, "validator staked amount");
        v.publicKey = publicKey;
        v.stakedAmount = newStake;
        v.delegationFeeRate = delegationFeeRate;
        v.stakeStartTime = stakeStartTime;
        v.stakeEndTime = stakeEndTime;
        v.withdrawn = false;
        return Status::Ok();
    }

    Validator v;
    v.nodeId = nodeId;
    v.publicKey = publicKey;
    v.stakedAmount = stakedAmount;
    v.delegationFeeRate = delegationFeeRate;
    v.stakeStartTime = stakeStartTime;
    v.stakeEndTime = stakeEndTime;
    validators_.emplace(nodeId, std::move(v));
    return Status::Ok();
}

Status Emission::WithdrawValidatorStake(const NodeId& nodeId, Amount* reward) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    LOG_INFO(util::LogCategory::EMISSION) << "Withdrawing validator stake for "
                                          << ShortId(nodeId);

    auto it = validators_.find(nodeId);
    if (it == validators_.end()) {
        return Rejected("WithdrawValidatorStake", Status::ValidatorNotFound());
    }
    Validator& v = it->second;

    Amount newTotalStaked = totalStaked_;
    if (v.isActive) {
        newTotalStaked = CheckedSub(totalStaked_, v.GetTotalStake(), "total staked");
    }
    Amount payout = v.unclaimedStakedReward;
    bool remove = v.NumDelegators() == 0;
    if (remove) {
        payout = CheckedAdd(payout, v.unclaimedDelegatedReward, "withdrawal reward");
    }

    totalStaked_ = newTotalStaked;
    v.unclaimedStakedReward = 0;
    v.stakedAmount = 0;
    v.isActive = false;
    v.withdrawn = true;
    if (remove) {
        validators_.erase(it);
    }

    *reward = payout;
    return Status::Ok();
}

// ============================================================================
// Delegation Ledger
// ============================================================================

Status Emission::DelegateUserStake(const NodeId& nodeId, const Address& delegator,
                                   Amount stakeAmount) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    LOG_INFO(util::LogCategory::EMISSION) << "Delegating " << FormatAmount(stakeAmount)
                                          << " to " << ShortId(nodeId);

    auto it = validators_.find(nodeId);
    if (it == validators_.end()) {
        return Rejected("DelegateUserStake", Status::ValidatorNotFound());
    }
    Validator& v = it->second;
    if (v.delegatorsLastClaim.count(delegator) > 0) {
        return Rejected("DelegateUserStake", Status::DelegatorAlreadyStaked());
    }

    Amount newDelegated = CheckedAdd(v.delegatedAmount, stakeAmount, "delegated amount");
    Amount newTotalStaked = totalStaked_;
    if (v.isActive) {
        newTotalStaked = CheckedAdd(totalStaked_, stakeAmount, "total staked");
    }

    v.delegatedAmount = newDelegated;
    totalStaked_ = newTotalStaked;
    v.delegatorsLastClaim[delegator] = blocks_.LastAcceptedBlock().height;
    return Status::Ok();
}

Status Emission::UndelegateUserStake(const NodeId& nodeId, const Address& delegator,
                                     Amount stakeAmount, Amount* reward) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    LOG_INFO(util::LogCategory::EMISSION) << "Undelegating " << FormatAmount(stakeAmount)
                                          << " from " << ShortId(nodeId);

    auto it = validators_.find(nodeId);
    if (it == validators_.end()) {
        return Rejected("UndelegateUserStake", Status::ValidatorNotFound());
    }
    Validator& v = it->second;

    Amount pending = 0;
    Status s = CalculateRewardsLocked(v, delegator, blocks_.LastAcceptedBlock().height,
                                      &pending);
    if (!s.ok()) {
        return Rejected("UndelegateUserStake", s);
    }
    if (stakeAmount > v.delegatedAmount) {
        return Rejected("UndelegateUserStake",
                        Status::InvalidArgument("undelegated amount exceeds delegated stake"));
    }

    Amount newUnclaimed = CheckedSub(v.unclaimedDelegatedReward, pending,
                                     "unclaimed delegated reward");
    Amount newDelegated = CheckedSub(v.delegatedAmount, stakeAmount, "delegated amount");
    Amount newTotalStaked = totalStaked_;
    if (v.isActive) {
        newTotalStaked = CheckedSub(totalStaked_, stakeAmount, "total staked");
    }

    v.unclaimedDelegatedReward = newUnclaimed;
    v.delegatedAmount = newDelegated;
    totalStaked_ = newTotalStaked;
    v.delegatorsLastClaim.erase(delegator);
    if (!v.isActive && v.delegatorsLastClaim.empty()) {
        validators_.erase(it);
    }

    *reward = pending;
    return Status::Ok();
}

Status Emission::ClaimStakingRewards(const NodeId& nodeId, const Address& actor,
                                     Amount* reward) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    LOG_INFO(util::LogCategory::EMISSION) << "Claiming staking rewards from "
                                          << ShortId(nodeId);

    auto it = validators_.find(nodeId);
    if (it == validators_.end()) {
        return Rejected("ClaimStakingRewards", Status::ValidatorNotFound());
    }
    Validator& v = it->second;

    if (actor.IsNull()) {
        Amount payout = v.unclaimedStakedReward;
        bool foldDelegated = v.NumDelegators() == 0;
        if (foldDelegated) {
            payout = CheckedAdd(payout, v.unclaimedDelegatedReward, "validator reward");
        }
        v.unclaimedStakedReward = 0;
        if (foldDelegated) {
            v.unclaimedDelegatedReward = 0;
        }
        *reward = payout;
        return Status::Ok();
    }

    Height height = blocks_.LastAcceptedBlock().height;
    Amount pending = 0;
    Status s = CalculateRewardsLocked(v, actor, height, &pending);
    if (!s.ok()) {
        return Rejected("ClaimStakingRewards", s);
    }
    Amount newUnclaimed = CheckedSub(v.unclaimedDelegatedReward, pending,
                                     "unclaimed delegated reward");

    v.unclaimedDelegatedReward = newUnclaimed;
    v.delegatorsLastClaim[actor] = height;
    *reward = pending;
    return Status::Ok();
}

Status Emission::CalculateUserDelegationRewards(const NodeId& nodeId,
                                                const Address& delegator,
                                                Height currentHeight,
                                                Amount* reward) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    auto it = validators_.find(nodeId);
    if (it == validators_.end()) {
        return Status::ValidatorNotFound();
    }
    return CalculateRewardsLocked(it->second, delegator, currentHeight, reward);
}

Status Emission::CalculateRewardsLocked(const Validator& validator,
                                        const Address& delegator,
                                        Height currentHeight,
                                        Amount* reward) const {
    auto claim = validator.delegatorsLastClaim.find(delegator);
    if (claim == validator.delegatorsLastClaim.end()) {
        return Status::DelegatorNotFound();
    }

    DelegatorStakeRecord record;
    Status s = stakes_.GetDelegatorStake(delegator, validator.nodeId, &record);
    if (!s.ok()) {
        return s;
    }

    const uint64_t length = epochTracker_.epochLength;
    const uint64_t firstEpoch = claim->second / length;
    const uint64_t endEpoch = currentHeight / length;

    Amount total = 0;
    if (validator.delegatedAmount > 0) {
        for (auto e = validator.epochRewards.lower_bound(firstEpoch);
             e != validator.epochRewards.end() && e->first < endEpoch; ++e) {
            Amount share = MulDiv(e->second, record.stakedAmount, validator.delegatedAmount);
            total = CheckedAdd(total, share, "delegation reward");
        }
    }

    *reward = total;
    return Status::Ok();
}

// ============================================================================
// Activation Sweep and Reward Credits
// ============================================================================

Emission::SweepPlan Emission::PlanSweep(Timestamp now) {
    SweepPlan plan;
    plan.totalStaked = totalStaked_;

    for (auto& entry : validators_) {
        Validator& v = entry.second;
        if (v.isActive) {
            if (now > v.stakeEndTime) {
                plan.totalStaked = CheckedSub(plan.totalStaked, v.GetTotalStake(),
                                              "total staked");
                plan.transitions.emplace_back(&v, false);
            } else {
                plan.active.push_back(&v);
            }
        } else if (!v.withdrawn && now > v.stakeStartTime && !(now > v.stakeEndTime)) {
            plan.totalStaked = CheckedAdd(plan.totalStaked, v.GetTotalStake(),
                                          "total staked");
            plan.transitions.emplace_back(&v, true);
            plan.active.push_back(&v);
        }
    }
    return plan;
}

Emission::CreditPlan Emission::PlanCredits(const SweepPlan& sweep, Amount pool) const {
    CreditPlan plan;
    if (pool == 0 || sweep.totalStaked == 0) {
        return plan;
    }

    for (Validator* v : sweep.active) {
        Amount share = MulDiv(v->GetTotalStake(), pool, sweep.totalStaked);
        CreditPlan::Credit credit;
        credit.validator = v;
        credit.split = SplitValidatorReward(share, v->delegationFeeRate, v->delegatedAmount);
        credit.newStakedReward = CheckedAdd(v->unclaimedStakedReward,
                                            credit.split.validatorShare,
                                            "unclaimed staked reward");
        credit.newDelegatedReward = CheckedAdd(v->unclaimedDelegatedReward,
                                               credit.split.delegationShare,
                                               "unclaimed delegated reward");
        plan.distributed = CheckedAdd(plan.distributed, share, "distributed rewards");
        plan.credits.push_back(credit);
    }

    if (plan.distributed > pool) {
        RaiseInvariantViolation("distributed rewards exceed the reward pool");
    }
    return plan;
}

void Emission::ApplySweep(const SweepPlan& sweep) {
    for (const auto& [v, activate] : sweep.transitions) {
        v->isActive = activate;
        LOG_DEBUG(util::LogCategory::EMISSION) << "Validator " << ShortId(v->nodeId)
            << (activate ? " activated" : " deactivated");
    }
    totalStaked_ = sweep.totalStaked;
}

void Emission::ApplyCredits(const CreditPlan& plan) {
    for (const auto& credit : plan.credits) {
        credit.validator->unclaimedStakedReward = credit.newStakedReward;
        credit.validator->unclaimedDelegatedReward = credit.newDelegatedReward;
    }
}

// ============================================================================
// Block Processing
// ============================================================================

Amount Emission::MintNewNAI() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    BlockInfo block = blocks_.LastAcceptedBlock();
    if (block.height % epochTracker_.epochLength != 0) {
        return 0;
    }

    LOG_INFO(util::LogCategory::EMISSION) << "Minting epoch rewards at height "
                                          << block.height;

    SweepPlan sweep = PlanSweep(block.timestamp);
    Amount pool = RewardsPerEpoch(sweep.totalStaked, AprLocked(),
                                  epochTracker_.epochLength, secondsPerBlock_,
                                  secondsPerYear_, maxSupply_ - totalSupply_);
    CreditPlan credits = PlanCredits(sweep, pool);
    Amount newSupply = CheckedAdd(totalSupply_, credits.distributed, "total supply");
    if (newSupply > maxSupply_) {
        RaiseInvariantViolation("minting would exceed max supply");
    }

    ApplySweep(sweep);
    ApplyCredits(credits);
    const uint64_t epoch = block.height / epochTracker_.epochLength;
    for (const auto& credit : credits.credits) {
        credit.validator->epochRewards[epoch] = credit.split.delegationShare;
    }
    totalSupply_ = newSupply;

    LOG_INFO(util::LogCategory::EMISSION) << "Minted " << FormatAmount(credits.distributed)
        << " for epoch " << epoch << ", total supply " << FormatAmount(totalSupply_);
    return credits.distributed;
}

FeeDistribution Emission::DistributeFees(Amount fee) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    LOG_INFO(util::LogCategory::EMISSION) << "Distributing fees " << FormatAmount(fee);

    FeeDistribution result;
    result.fee = std::min(fee, maxSupply_ - totalSupply_);
    result.emissionShare = result.fee / 2;
    result.validatorPool = result.fee - result.emissionShare;

    SweepPlan sweep = PlanSweep(blocks_.LastAcceptedBlock().timestamp);
    CreditPlan credits = PlanCredits(sweep, result.validatorPool);
    Amount newBalance = CheckedAdd(emissionAccount_.unclaimedBalance,
                                   result.emissionShare, "emission account balance");

    emissionAccount_.unclaimedBalance = newBalance;
    ApplySweep(sweep);
    ApplyCredits(credits);
    result.distributed = credits.distributed;
    return result;
}

// ============================================================================
// Queries
// ============================================================================

std::vector<ValidatorSnapshot> Emission::GetStakedValidator(const NodeId& nodeId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<ValidatorSnapshot> result;
    if (nodeId.IsNull()) {
        result.reserve(validators_.size());
        for (const auto& entry : validators_) {
            result.push_back(ValidatorSnapshot::From(entry.second));
        }
        return result;
    }

    auto it = validators_.find(nodeId);
    if (it != validators_.end()) {
        result.push_back(ValidatorSnapshot::From(it->second));
    }
    return result;
}

std::vector<ValidatorSnapshot> Emission::GetAllValidators() const {
    ConsensusValidators current = consensus_.CurrentValidators();

    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::vector<ValidatorSnapshot> result;
    result.reserve(current.size());
    for (const auto& [nodeId, publicKey] : current) {
        ValidatorSnapshot snapshot;
        auto it = validators_.find(nodeId);
        if (it != validators_.end()) {
            snapshot = ValidatorSnapshot::From(it->second);
        }
        snapshot.nodeId = nodeId;
        snapshot.publicKey = publicKey;
        result.push_back(std::move(snapshot));
    }
    return result;
}

size_t Emission::GetNumDelegators(const NodeId& nodeId) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (nodeId.IsNull()) {
        size_t total = 0;
        for (const auto& entry : validators_) {
            total += entry.second.NumDelegators();
        }
        return total;
    }
    auto it = validators_.find(nodeId);
    return it == validators_.end() ? 0 : it->second.NumDelegators();
}

Rate Emission::AprLocked() const {
    return AprForValidators(epochTracker_.baseAprBps, epochTracker_.baseValidators,
                            validators_.size());
}

Amount Emission::RewardsPerEpochLocked(Amount totalStaked) const {
    return RewardsPerEpoch(totalStaked, AprLocked(), epochTracker_.epochLength,
                           secondsPerBlock_, secondsPerYear_, maxSupply_ - totalSupply_);
}

Rate Emission::GetAPRForValidators() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return AprLocked();
}

Amount Emission::GetRewardsPerEpoch() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return RewardsPerEpochLocked(totalStaked_);
}

Amount Emission::GetTotalSupply() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return totalSupply_;
}

Amount Emission::GetMaxSupply() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return maxSupply_;
}

Amount Emission::GetTotalStaked() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return totalStaked_;
}

size_t Emission::GetNumValidators() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return validators_.size();
}

EmissionAccount Emission::GetEmissionAccount() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return emissionAccount_;
}

EpochTracker Emission::GetEpochTracker() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return epochTracker_;
}

Amount Emission::ClaimEmissionAccount() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    LOG_INFO(util::LogCategory::EMISSION) << "Claiming emission account balance "
        << FormatAmount(emissionAccount_.unclaimedBalance);

    Amount balance = emissionAccount_.unclaimedBalance;
    emissionAccount_.unclaimedBalance = 0;
    return balance;
}

Height Emission::GetLastAcceptedBlockHeight() const {
    return blocks_.LastAcceptedBlock().height;
}

Timestamp Emission::GetLastAcceptedBlockTimestamp() const {
    return blocks_.LastAcceptedBlock().timestamp;
}

Hash256 Emission::GetStateDigest() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    DataStream ss;
    ss << totalSupply_ << maxSupply_ << totalStaked_;
    ss << emissionAccount_.address << emissionAccount_.unclaimedBalance;
    ss << epochTracker_.baseAprBps << epochTracker_.baseValidators
       << epochTracker_.epochLength;

    WriteCompactSize(ss, validators_.size());
    for (const auto& [nodeId, v] : validators_) {
        ss << nodeId << v.publicKey << v.stakedAmount << v.delegatedAmount
           << v.delegationFeeRate << v.unclaimedStakedReward
           << v.unclaimedDelegatedReward << v.isActive << v.withdrawn
           << v.stakeStartTime << v.stakeEndTime;
        WriteCompactSize(ss, v.delegatorsLastClaim.size());
        for (const auto& [delegator, height] : v.delegatorsLastClaim) {
            ss << delegator << height;
        }
        WriteCompactSize(ss, v.epochRewards.size());
        for (const auto& [epoch, amount] : v.epochRewards) {
            ss << epoch << amount;
        }
    }

    return SHA256Hash(ss.data(), ss.size());
}

std::string Emission::ToString() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    std::ostringstream ss;
    ss << "Emission {"
       << " supply: " << FormatAmount(totalSupply_)
       << ", max: " << FormatAmount(maxSupply_)
       << ", staked: " << FormatAmount(totalStaked_)
       << ", validators: " << validators_.size()
       << ", emission balance: " << FormatAmount(emissionAccount_.unclaimedBalance)
       << " }";
    return ss.str();
}

} // namespace emission
} // namespace nuklai
