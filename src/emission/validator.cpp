// NUKLAI - Staked Validator Implementation
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include "nuklai/emission/validator.h"

#include "nuklai/emission/fixed_point.h"

#include <sstream>

namespace nuklai {
namespace emission {

Amount Validator::GetTotalStake() const {
    return CheckedAdd(stakedAmount, delegatedAmount, "validator stake");
}

std::string Validator::ToString() const {
    return ValidatorSnapshot::From(*this).ToString();
}

ValidatorSnapshot ValidatorSnapshot::From(const Validator& v) {
    ValidatorSnapshot s;
    s.nodeId = v.nodeId;
    s.publicKey = v.publicKey;
    s.stakedAmount = v.stakedAmount;
    s.delegatedAmount = v.delegatedAmount;
    s.delegationFeeRate = v.delegationFeeRate;
    s.unclaimedStakedReward = v.unclaimedStakedReward;
    s.unclaimedDelegatedReward = v.unclaimedDelegatedReward;
    s.isActive = v.isActive;
    s.withdrawn = v.withdrawn;
    s.stakeStartTime = v.stakeStartTime;
    s.stakeEndTime = v.stakeEndTime;
    s.numDelegators = v.NumDelegators();
    return s;
}

std::string ValidatorSnapshot::ToString() const {
    std::ostringstream ss;
    ss << "Validator {"
       << " node: " << nodeId.ToHex().substr(0, 12) << "..."
       << ", active: " << (isActive ? "yes" : "no")
       << ", staked: " << FormatAmount(stakedAmount)
       << ", delegated: " << FormatAmount(delegatedAmount)
       << ", fee: " << delegationFeeRate << "%"
       << ", delegators: " << numDelegators
       << " }";
    return ss.str();
}

RewardSplit SplitValidatorReward(Amount total, uint64_t delegationFeeRate,
                                 Amount delegatedAmount) {
    RewardSplit split;
    if (delegatedAmount > 0) {
        split.delegationShare = MulDiv(total, delegationFeeRate, PERCENT_DENOMINATOR);
    }
    split.validatorShare = total - split.delegationShare;
    return split;
}

} // namespace emission
} // namespace nuklai
