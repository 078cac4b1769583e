// NUKLAI - Ledger Collaborators
// Copyright (c) 2024 NUKLAI Developers
// MIT License
//
// Interfaces the emission ledger reads from the surrounding VM: the last
// accepted block (its only clock), the consensus validator set, and the
// persisted stake records.

#ifndef NUKLAI_EMISSION_CHAIN_H
#define NUKLAI_EMISSION_CHAIN_H

#include "nuklai/core/types.h"
#include "nuklai/emission/status.h"

#include <map>
#include <vector>

namespace nuklai {
namespace emission {

// ============================================================================
// Block Source
// ============================================================================

/// Height and UTC timestamp of a block
struct BlockInfo {
    Height height{0};
    Timestamp timestamp{0};
};

class BlockSource {
public:
    virtual ~BlockSource() = default;

    /// The last block accepted by consensus
    virtual BlockInfo LastAcceptedBlock() const = 0;
};

// ============================================================================
// Consensus View
// ============================================================================

/// Node id -> public key bytes, as known to consensus
using ConsensusValidators = std::map<NodeId, std::vector<Byte>>;

class ConsensusView {
public:
    virtual ~ConsensusView() = default;

    /// The validator set currently known to consensus, independent of staking
    virtual ConsensusValidators CurrentValidators() const = 0;
};

// ============================================================================
// Stake Records
// ============================================================================

/// A delegator's stake with one validator
struct DelegatorStakeRecord {
    Amount stakedAmount{0};
    Timestamp stakeStartTime{0};
    Address rewardAddress;

    bool operator==(const DelegatorStakeRecord& other) const {
        return stakedAmount == other.stakedAmount &&
               stakeStartTime == other.stakeStartTime &&
               rewardAddress == other.rewardAddress;
    }
};

/// A validator's own registration
struct ValidatorStakeRecord {
    Timestamp stakeStartTime{0};
    Timestamp stakeEndTime{0};
    Amount stakedAmount{0};
    uint64_t delegationFeeRate{0};  // whole percent
    Address rewardAddress;

    bool operator==(const ValidatorStakeRecord& other) const {
        return stakeStartTime == other.stakeStartTime &&
               stakeEndTime == other.stakeEndTime &&
               stakedAmount == other.stakedAmount &&
               delegationFeeRate == other.delegationFeeRate &&
               rewardAddress == other.rewardAddress;
    }
};

// ============================================================================
// Stake Reader
// ============================================================================

/**
 * Read access to the persisted stake records. The delegator principal
 * stored here is authoritative; the ledger keeps only aggregates.
 */
class StakeReader {
public:
    virtual ~StakeReader() = default;

    /// STAKE_NOT_FOUND if no record, STORAGE_ERROR if the store failed
    virtual Status GetDelegatorStake(const Address& delegator, const NodeId& nodeId,
                                     DelegatorStakeRecord* record) const = 0;

    /// STAKE_NOT_FOUND if no record, STORAGE_ERROR if the store failed
    virtual Status GetValidatorStake(const NodeId& nodeId,
                                     ValidatorStakeRecord* record) const = 0;
};

} // namespace emission
} // namespace nuklai

#endif // NUKLAI_EMISSION_CHAIN_H
