// NUKLAI - Stake Record Store Implementation
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include "nuklai/emission/stake_store.h"

#include "nuklai/core/hex.h"
#include "nuklai/util/logging.h"

namespace nuklai {
namespace emission {

namespace {

std::string KeyToHex(const std::string& key) {
    return BytesToHex(reinterpret_cast<const Byte*>(key.data()), key.size());
}

Status FromDbStatus(const db::Status& s, const std::string& key) {
    if (s.ok()) {
        return Status::Ok();
    }
    if (s.IsNotFound()) {
        return Status::StakeNotFound();
    }
    LOG_ERROR(util::LogCategory::DB) << "Stake store failure on key "
                                     << KeyToHex(key) << ": " << s.ToString();
    return Status::StorageError(s.ToString());
}

} // namespace

StakeStore::StakeStore(db::Database* db) : db_(db) {}

std::string StakeStore::DelegatorKey(const Address& delegator, const NodeId& nodeId) {
    std::string key;
    key.reserve(1 + Address::SIZE + NodeId::SIZE);
    key.push_back(db::prefix::DELEGATOR_STAKE);
    key.append(reinterpret_cast<const char*>(delegator.data()), Address::SIZE);
    key.append(reinterpret_cast<const char*>(nodeId.data()), NodeId::SIZE);
    return key;
}

std::string StakeStore::ValidatorKey(const NodeId& nodeId) {
    return db::MakeKey(db::prefix::VALIDATOR_STAKE,
                       db::Slice(reinterpret_cast<const char*>(nodeId.data()), NodeId::SIZE));
}

template<typename Record>
Status StakeStore::Load(const std::string& key, Record* record) const {
    std::string value;
    Status s = FromDbStatus(db_->Get(key, &value), key);
    if (!s.ok()) {
        return s;
    }
    if (!db::DeserializeFromString(value, *record)) {
        LOG_ERROR(util::LogCategory::DB) << "Corrupt stake record " << KeyToHex(key);
        return Status::StorageError("corrupt stake record");
    }
    return Status::Ok();
}

template<typename Record>
Status StakeStore::Store(const std::string& key, const Record& record) {
    return FromDbStatus(db_->Put(key, db::SerializeToString(record)), key);
}

Status StakeStore::Remove(const std::string& key) {
    if (!db_->Exists(key)) {
        return Status::StakeNotFound();
    }
    return FromDbStatus(db_->Delete(key), key);
}

// ============================================================================
// Delegator Records
// ============================================================================

Status StakeStore::PutDelegatorStake(const Address& delegator, const NodeId& nodeId,
                                     const DelegatorStakeRecord& record) {
    LOG_DEBUG(util::LogCategory::DB) << "Put delegator stake " << delegator.ToHex()
                                     << " -> " << nodeId.ToHex()
                                     << " amount=" << record.stakedAmount;
    return Store(DelegatorKey(delegator, nodeId), record);
}

Status StakeStore::GetDelegatorStake(const Address& delegator, const NodeId& nodeId,
                                     DelegatorStakeRecord* record) const {
    return Load(DelegatorKey(delegator, nodeId), record);
}

Status StakeStore::DeleteDelegatorStake(const Address& delegator, const NodeId& nodeId) {
    LOG_DEBUG(util::LogCategory::DB) << "Delete delegator stake " << delegator.ToHex()
                                     << " -> " << nodeId.ToHex();
    return Remove(DelegatorKey(delegator, nodeId));
}

Status StakeStore::GetDelegators(const NodeId& nodeId,
                                 std::vector<Address>* delegators) const {
    delegators->clear();
    const std::string prefix = db::MakeKey(db::prefix::DELEGATOR_STAKE);
    const size_t keySize = 1 + Address::SIZE + NodeId::SIZE;

    auto it = db_->NewIterator();
    for (it->Seek(prefix); it->Valid() && it->key().starts_with(prefix); it->Next()) {
        db::Slice key = it->key();
        if (key.size() != keySize) {
            continue;
        }
        const Byte* raw = reinterpret_cast<const Byte*>(key.data());
        if (NodeId(raw + 1 + Address::SIZE, NodeId::SIZE) == nodeId) {
            delegators->emplace_back(raw + 1, Address::SIZE);
        }
    }
    return FromDbStatus(it->status(), prefix);
}

// ============================================================================
// Validator Records
// ============================================================================

Status StakeStore::PutValidatorStake(const NodeId& nodeId,
                                     const ValidatorStakeRecord& record) {
    LOG_DEBUG(util::LogCategory::DB) << "Put validator stake " << nodeId.ToHex()
                                     << " amount=" << record.stakedAmount;
    return Store(ValidatorKey(nodeId), record);
}

Status StakeStore::GetValidatorStake(const NodeId& nodeId,
                                     ValidatorStakeRecord* record) const {
    return Load(ValidatorKey(nodeId), record);
}

Status StakeStore::DeleteValidatorStake(const NodeId& nodeId) {
    LOG_DEBUG(util::LogCategory::DB) << "Delete validator stake " << nodeId.ToHex();
    return Remove(ValidatorKey(nodeId));
}

} // namespace emission
} // namespace nuklai
