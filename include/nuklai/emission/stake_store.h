// NUKLAI - Stake Record Store
// Copyright (c) 2024 NUKLAI Developers
// MIT License
//
// Persists delegator and validator stake records in a key-value database.
//
// Key layout:
//   'd' + delegator (33) + node id (20) -> DelegatorStakeRecord
//   'v' + node id (20)                  -> ValidatorStakeRecord

#ifndef NUKLAI_EMISSION_STAKE_STORE_H
#define NUKLAI_EMISSION_STAKE_STORE_H

#include "nuklai/core/serialize.h"
#include "nuklai/db/database.h"
#include "nuklai/emission/chain.h"

#include <string>
#include <vector>

namespace nuklai {
namespace emission {

// ============================================================================
// Record Serialization
// ============================================================================

template<typename Stream>
void Serialize(Stream& s, const DelegatorStakeRecord& r) {
    Serialize(s, r.stakedAmount);
    Serialize(s, r.stakeStartTime);
    Serialize(s, r.rewardAddress);
}

template<typename Stream>
void Unserialize(Stream& s, DelegatorStakeRecord& r) {
    Unserialize(s, r.stakedAmount);
    Unserialize(s, r.stakeStartTime);
    Unserialize(s, r.rewardAddress);
}

template<typename Stream>
void Serialize(Stream& s, const ValidatorStakeRecord& r) {
    Serialize(s, r.stakeStartTime);
    Serialize(s, r.stakeEndTime);
    Serialize(s, r.stakedAmount);
    Serialize(s, r.delegationFeeRate);
    Serialize(s, r.rewardAddress);
}

template<typename Stream>
void Unserialize(Stream& s, ValidatorStakeRecord& r) {
    Unserialize(s, r.stakeStartTime);
    Unserialize(s, r.stakeEndTime);
    Unserialize(s, r.stakedAmount);
    Unserialize(s, r.delegationFeeRate);
    Unserialize(s, r.rewardAddress);
}

// ============================================================================
// Stake Store
// ============================================================================

class StakeStore : public StakeReader {
public:
    /// The database must outlive the store
    explicit StakeStore(db::Database* db);

    Status PutDelegatorStake(const Address& delegator, const NodeId& nodeId,
                             const DelegatorStakeRecord& record);
    Status GetDelegatorStake(const Address& delegator, const NodeId& nodeId,
                             DelegatorStakeRecord* record) const override;
    /// Deleting a missing record is STAKE_NOT_FOUND
    Status DeleteDelegatorStake(const Address& delegator, const NodeId& nodeId);

    Status PutValidatorStake(const NodeId& nodeId, const ValidatorStakeRecord& record);
    Status GetValidatorStake(const NodeId& nodeId,
                             ValidatorStakeRecord* record) const override;
    Status DeleteValidatorStake(const NodeId& nodeId);

    /// Delegators with a stake record for nodeId, in address order
    Status GetDelegators(const NodeId& nodeId, std::vector<Address>* delegators) const;

    static std::string DelegatorKey(const Address& delegator, const NodeId& nodeId);
    static std::string ValidatorKey(const NodeId& nodeId);

private:
    template<typename Record>
    Status Load(const std::string& key, Record* record) const;

    template<typename Record>
    Status Store(const std::string& key, const Record& record);

    Status Remove(const std::string& key);

    db::Database* db_;
};

} // namespace emission
} // namespace nuklai

#endif // NUKLAI_EMISSION_STAKE_STORE_H
