// NUKLAI - LevelDB Database Tests
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include <gtest/gtest.h>
#include "nuklai/db/leveldb.h"
#include "nuklai/emission/stake_store.h"

#include <filesystem>
#include <random>

using namespace nuklai;
using namespace nuklai::db;

// ============================================================================
// Test Utilities
// ============================================================================

class LevelDBTest : public ::testing::Test {
protected:
    std::filesystem::path testDir_;

    void SetUp() override {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(0, 999999);

        testDir_ = std::filesystem::temp_directory_path() /
                   ("nuklai_db_test_" + std::to_string(dis(gen)));
        std::filesystem::create_directories(testDir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(testDir_, ec);
    }

    std::unique_ptr<Database> Open() {
        auto [status, db] = OpenDatabase(testDir_ / "stakes");
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(db);
    }
};

// ============================================================================
// Basic Operations
// ============================================================================

TEST_F(LevelDBTest, PutGetDelete) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    ASSERT_TRUE(db->Put(Slice("key1"), Slice("value1")).ok());

    std::string value;
    ASSERT_TRUE(db->Get(Slice("key1"), &value).ok());
    EXPECT_EQ(value, "value1");

    ASSERT_TRUE(db->Delete(Slice("key1")).ok());
    EXPECT_TRUE(db->Get(Slice("key1"), &value).IsNotFound());
}

TEST_F(LevelDBTest, IteratorSeek) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    db->Put(Slice("d1"), Slice("1"));
    db->Put(Slice("d2"), Slice("2"));
    db->Put(Slice("v1"), Slice("3"));

    auto iter = db->NewIterator();
    int count = 0;
    for (iter->Seek(Slice("d")); iter->Valid() && iter->key().starts_with(Slice("d"));
         iter->Next()) {
        ++count;
    }
    EXPECT_EQ(count, 2);
    EXPECT_TRUE(iter->status().ok());
}

TEST_F(LevelDBTest, DataSurvivesReopen) {
    {
        auto db = Open();
        ASSERT_NE(db, nullptr);
        ASSERT_TRUE(db->Put(Slice("persist"), Slice("yes")).ok());
    }

    auto db = Open();
    ASSERT_NE(db, nullptr);
    std::string value;
    ASSERT_TRUE(db->Get(Slice("persist"), &value).ok());
    EXPECT_EQ(value, "yes");
}

TEST_F(LevelDBTest, SecondOpenWhileLockedFails) {
    auto db = Open();
    ASSERT_NE(db, nullptr);

    auto [status, second] = OpenDatabase(testDir_ / "stakes");
    EXPECT_FALSE(status.ok());
    EXPECT_EQ(second, nullptr);
}

// ============================================================================
// Stake Store over LevelDB
// ============================================================================

TEST_F(LevelDBTest, StakeStoreRecordsPersist) {
    NodeId node;
    node[0] = 0x42;
    Address delegator;
    delegator[1] = 0x07;

    emission::DelegatorStakeRecord record;
    record.stakedAmount = 250 * COIN;
    record.stakeStartTime = 1700000000;
    record.rewardAddress = delegator;

    {
        auto db = Open();
        ASSERT_NE(db, nullptr);
        emission::StakeStore store(db.get());
        ASSERT_TRUE(store.PutDelegatorStake(delegator, node, record).ok());
    }

    auto db = Open();
    ASSERT_NE(db, nullptr);
    emission::StakeStore store(db.get());

    emission::DelegatorStakeRecord loaded;
    ASSERT_TRUE(store.GetDelegatorStake(delegator, node, &loaded).ok());
    EXPECT_EQ(loaded, record);

    std::vector<Address> delegators;
    ASSERT_TRUE(store.GetDelegators(node, &delegators).ok());
    ASSERT_EQ(delegators.size(), 1);
    EXPECT_EQ(delegators[0], delegator);
}
