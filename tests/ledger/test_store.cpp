// AMOCA - Ledger Persistence Tests
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <gtest/gtest.h>
#include <amoca/ledger/store.h>
#include <amoca/ledger/executor.h>
#include <amoca/ledger/clock.h>
#include <amoca/db/leveldb.h>
#include <filesystem>
#include <random>

namespace amoca {
namespace ledger {
namespace test {

constexpr Timestamp T0 = 1700000000;
constexpr int64_t WEEK = staking::DEFAULT_MIN_STAKE_DURATION;

class LedgerStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        treasury_[0] = 0x7E;
        alice_[0] = 0xA1;
        bob_[0] = 0xB0;
        
        GenesisParams params;
        params.treasury = treasury_;
        params.rewardRate = 8;
        ledger_ = Ledger::Genesis(params, T0);
        clock_ = std::make_unique<ManualClock>(T0);
        executor_ = std::make_unique<Executor>(*ledger_, *clock_);
    }
    
    /// Drive the ledger through every kind of record
    void Populate() {
        AuthorityToken mint = *ledger_->FindAuthority(Capability::Mint);
        ASSERT_TRUE(Run(treasury_, MintTokens{mint, 1000 * COIN, alice_}));
        ASSERT_TRUE(Run(alice_, TransferTokens{bob_, 100 * COIN}));
        
        TxResult staked = executor_->ExecuteAs(alice_, StakeTokens{200 * COIN, WEEK});
        ASSERT_TRUE(staked.committed);
        stakeId_ = *staked.createdId;
        TxResult other = executor_->ExecuteAs(bob_, StakeTokens{50 * COIN, WEEK});
        ASSERT_TRUE(other.committed);
        
        TxResult proposed = executor_->ExecuteAs(bob_, CreateProposal{"Upgrade", "v2", 3600});
        ASSERT_TRUE(proposed.committed);
        proposalId_ = *proposed.createdId;
        ASSERT_TRUE(Run(alice_, VoteOnProposal{proposalId_, governance::VoteChoice::Yes, 40}));
        
        TxResult granted = executor_->ExecuteAs(
            alice_, CreateDataAccessRight{"dataset/a", bob_, 2, T0 + 86400});
        ASSERT_TRUE(granted.committed);
        rightId_ = *granted.createdId;
        
        clock_->Advance(WEEK);
        ASSERT_TRUE(Run(alice_, ClaimRewards{stakeId_}));
        ASSERT_TRUE(Run(alice_, UnstakeTokens{stakeId_}));
    }
    
    bool Run(const Address& caller, Operation op) {
        TxResult r = executor_->ExecuteAs(caller, std::move(op));
        EXPECT_TRUE(r.committed) << r.ToString();
        return r.committed;
    }
    
    std::unique_ptr<Ledger> SaveAndLoad(db::Database& db) {
        LedgerStore store(db);
        db::Status s = store.Save(*ledger_);
        EXPECT_TRUE(s.ok()) << s.ToString();
        auto [status, loaded] = store.Load();
        EXPECT_TRUE(status.ok()) << status.ToString();
        return std::move(loaded);
    }
    
    Address treasury_;
    Address alice_;
    Address bob_;
    ObjectId stakeId_;
    ObjectId proposalId_;
    ObjectId rightId_;
    std::unique_ptr<Ledger> ledger_;
    std::unique_ptr<ManualClock> clock_;
    std::unique_ptr<Executor> executor_;
};

// ============================================================================
// Empty Store
// ============================================================================

TEST_F(LedgerStoreTest, EmptyDatabase) {
    db::MemoryDatabase db;
    LedgerStore store(db);
    EXPECT_FALSE(store.Exists());
    
    auto [status, loaded] = store.Load();
    EXPECT_TRUE(status.IsNotFound());
    EXPECT_EQ(loaded, nullptr);
}

TEST_F(LedgerStoreTest, FreshGenesisRoundTrip) {
    db::MemoryDatabase db;
    auto loaded = SaveAndLoad(db);
    ASSERT_NE(loaded, nullptr);
    
    EXPECT_TRUE(LedgerStore(db).Exists());
    EXPECT_EQ(loaded->GetParams().treasury, treasury_);
    EXPECT_EQ(loaded->GetParams().rewardRate, 8u);
    EXPECT_EQ(loaded->GetGenesisTime(), T0);
    EXPECT_EQ(loaded->Gate().GetAll().size(), 2u);
    EXPECT_EQ(loaded->Tokens().TotalSupply(), 0u);
}

// ============================================================================
// Full Round Trip
// ============================================================================

TEST_F(LedgerStoreTest, RoundTripPreservesState) {
    Populate();
    db::MemoryDatabase db;
    auto loaded = SaveAndLoad(db);
    ASSERT_NE(loaded, nullptr);
    
    EXPECT_EQ(loaded->Tokens().GetAccounts(), ledger_->Tokens().GetAccounts());
    EXPECT_EQ(loaded->Tokens().TotalSupply(), ledger_->Tokens().TotalSupply());
    EXPECT_EQ(loaded->GetLastTime(), T0 + WEEK);
    EXPECT_EQ(loaded->GetNonces(), ledger_->GetNonces());
    
    // Unstaked record is gone, the other survives
    EXPECT_FALSE(loaded->Staking().GetStake(stakeId_).has_value());
    ASSERT_EQ(loaded->Staking().ListStakes().size(), 1u);
    EXPECT_EQ(loaded->Staking().ListStakes()[0].owner, bob_);
    EXPECT_EQ(loaded->Staking().GetPool().totalStaked, 50 * COIN);
    EXPECT_EQ(loaded->Staking().GetPool().rewardRate, 8u);
    
    auto proposal = loaded->Governance().GetProposal(proposalId_);
    ASSERT_TRUE(proposal.has_value());
    EXPECT_EQ(proposal->title, "Upgrade");
    EXPECT_EQ(proposal->yesVotes, 40u);
    
    auto rights = loaded->Access().ListByOwner(bob_);
    ASSERT_EQ(rights.size(), 1u);
    EXPECT_EQ(rights[0].id, rightId_);
    EXPECT_EQ(rights[0].dataId, "dataset/a");
    
    auto before = ledger_->Events().GetAll();
    auto after = loaded->Events().GetAll();
    ASSERT_EQ(after.size(), before.size());
    for (size_t i = 0; i < before.size(); ++i) {
        EXPECT_EQ(after[i].ToString(), before[i].ToString());
    }
    
    EXPECT_TRUE(loaded->CheckSupplyInvariant());
}

TEST_F(LedgerStoreTest, LoadedLedgerContinuesSequences) {
    Populate();
    db::MemoryDatabase db;
    auto loaded = SaveAndLoad(db);
    ASSERT_NE(loaded, nullptr);
    
    ManualClock clock(T0 + WEEK);
    Executor original(*ledger_, clock);
    Executor resumed(*loaded, clock);
    
    TxResult a = original.ExecuteAs(bob_, CreateProposal{"Next", "", 60});
    TxResult b = resumed.ExecuteAs(bob_, CreateProposal{"Next", "", 60});
    ASSERT_TRUE(a.committed);
    ASSERT_TRUE(b.committed);
    EXPECT_EQ(*a.createdId, *b.createdId);
    EXPECT_EQ(a.events[0].sequence, b.events[0].sequence);
}

TEST_F(LedgerStoreTest, ResaveDropsRemovedRecords) {
    db::MemoryDatabase db;
    LedgerStore store(db);
    
    AuthorityToken mint = *ledger_->FindAuthority(Capability::Mint);
    ASSERT_TRUE(Run(treasury_, MintTokens{mint, 10 * COIN, alice_}));
    TxResult staked = executor_->ExecuteAs(alice_, StakeTokens{10 * COIN, WEEK});
    ASSERT_TRUE(staked.committed);
    ASSERT_TRUE(store.Save(*ledger_).ok());
    
    clock_->Advance(WEEK);
    ASSERT_TRUE(Run(alice_, UnstakeTokens{*staked.createdId}));
    ASSERT_TRUE(store.Save(*ledger_).ok());
    
    auto [status, loaded] = store.Load();
    ASSERT_TRUE(status.ok()) << status.ToString();
    EXPECT_TRUE(loaded->Staking().ListStakes().empty());
    EXPECT_EQ(loaded->Tokens().BalanceOf(alice_), 10 * COIN);
}

// ============================================================================
// Damaged Stores
// ============================================================================

TEST_F(LedgerStoreTest, VersionMismatch) {
    db::MemoryDatabase db;
    ASSERT_TRUE(LedgerStore(db).Save(*ledger_).ok());
    
    std::string key = db::MakeKey(db::prefix::META, db::Slice("version"));
    ASSERT_TRUE(db.Put(key, db::SerializeToString(STORE_VERSION + 1)).ok());
    
    auto [status, loaded] = LedgerStore(db).Load();
    EXPECT_EQ(status.code(), db::Status::NOT_SUPPORTED);
    EXPECT_EQ(loaded, nullptr);
}

TEST_F(LedgerStoreTest, UndecodableRecord) {
    Populate();
    db::MemoryDatabase db;
    ASSERT_TRUE(LedgerStore(db).Save(*ledger_).ok());
    
    std::string key = db::MakeKey(db::prefix::PROPOSAL, proposalId_);
    ASSERT_TRUE(db.Put(key, std::string("\x01", 1)).ok());
    
    auto [status, loaded] = LedgerStore(db).Load();
    EXPECT_TRUE(status.IsCorruption());
    EXPECT_EQ(loaded, nullptr);
}

TEST_F(LedgerStoreTest, UnknownPrefix) {
    db::MemoryDatabase db;
    ASSERT_TRUE(LedgerStore(db).Save(*ledger_).ok());
    ASSERT_TRUE(db.Put(std::string("zzz"), std::string("x")).ok());
    
    auto [status, loaded] = LedgerStore(db).Load();
    EXPECT_TRUE(status.IsCorruption());
}

TEST_F(LedgerStoreTest, InconsistentSupply) {
    Populate();
    db::MemoryDatabase db;
    ASSERT_TRUE(LedgerStore(db).Save(*ledger_).ok());
    
    // Inflate one balance without touching the recorded supply
    std::string key = db::MakeKey(db::prefix::ACCOUNT, bob_);
    ASSERT_TRUE(db.Put(key, db::SerializeToString(Amount(999 * COIN))).ok());
    
    auto [status, loaded] = LedgerStore(db).Load();
    EXPECT_TRUE(status.IsCorruption());
}

TEST_F(LedgerStoreTest, OverflowingBalances) {
    Populate();
    db::MemoryDatabase db;
    ASSERT_TRUE(LedgerStore(db).Save(*ledger_).ok());
    
    // Balances whose sum exceeds the amount range cannot be checked
    std::string key = db::MakeKey(db::prefix::ACCOUNT, bob_);
    ASSERT_TRUE(db.Put(key, db::SerializeToString(MAX_AMOUNT)).ok());
    
    auto [status, loaded] = LedgerStore(db).Load();
    EXPECT_TRUE(status.IsCorruption()) << status.ToString();
    EXPECT_EQ(loaded, nullptr);
}

TEST_F(LedgerStoreTest, OverflowingStakes) {
    Populate();
    db::MemoryDatabase db;
    ASSERT_TRUE(LedgerStore(db).Save(*ledger_).ok());
    
    auto stakes = ledger_->Staking().ListStakes();
    ASSERT_FALSE(stakes.empty());
    staking::StakeInfo info = stakes.front();
    info.amount = MAX_AMOUNT;
    info.id[0] ^= 0xFF;
    ASSERT_TRUE(db.Put(db::MakeKey(db::prefix::STAKE, info.id),
                       db::SerializeToString(info)).ok());
    
    auto [status, loaded] = LedgerStore(db).Load();
    EXPECT_TRUE(status.IsCorruption()) << status.ToString();
    EXPECT_EQ(loaded, nullptr);
}

TEST_F(LedgerStoreTest, MissingMetadata) {
    db::MemoryDatabase db;
    ASSERT_TRUE(LedgerStore(db).Save(*ledger_).ok());
    ASSERT_TRUE(db.Delete(db::MakeKey(db::prefix::META, db::Slice("pool"))).ok());
    
    auto [status, loaded] = LedgerStore(db).Load();
    EXPECT_TRUE(status.IsCorruption());
}

// ============================================================================
// On Disk
// ============================================================================

TEST_F(LedgerStoreTest, PersistsAcrossReopen) {
    std::random_device rd;
    auto dir = std::filesystem::temp_directory_path() /
               ("amoca_store_test_" + std::to_string(rd()));
    
    Populate();
    db::Options opts;
    opts.create_if_missing = true;
    {
        auto [status, db] = db::OpenDatabase(dir, opts);
        ASSERT_TRUE(status.ok()) << status.ToString();
        ASSERT_TRUE(LedgerStore(*db).Save(*ledger_).ok());
    }
    {
        auto [status, db] = db::OpenDatabase(dir, opts);
        ASSERT_TRUE(status.ok()) << status.ToString();
        auto [loadStatus, loaded] = LedgerStore(*db).Load();
        ASSERT_TRUE(loadStatus.ok()) << loadStatus.ToString();
        EXPECT_EQ(loaded->Tokens().GetAccounts(), ledger_->Tokens().GetAccounts());
        EXPECT_EQ(loaded->Events().Size(), ledger_->Events().Size());
    }
    
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
}

} // namespace test
} // namespace ledger
} // namespace amoca
