// AMOCA - Token Ledger Tests
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <gtest/gtest.h>
#include <amoca/ledger/token.h>
#include <amoca/core/error.h>

#include <functional>

namespace amoca {
namespace ledger {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class TokenLedgerTest : public ::testing::Test {
protected:
    TokenLedgerTest() : tokens_(gate_, events_) {}
    
    void SetUp() override {
        admin_[0] = 0xAD;
        alice_[0] = 0x01;
        bob_[0] = 0x02;
        mint_ = gate_.Issue(Capability::Mint, admin_);
    }
    
    void MintTo(const Address& to, Amount amount) {
        tokens_.Deposit(to, tokens_.Mint(mint_, admin_, amount, to, 1000));
    }
    
    static ErrorCode CodeOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const LedgerError& e) {
            return e.Code();
        }
        return ErrorCode::OK;
    }
    
    Amount AccountSum() const {
        Amount sum = 0;
        for (const auto& [owner, amount] : tokens_.GetAccounts()) {
            sum += amount;
        }
        return sum;
    }
    
    CapabilityGate gate_;
    EventLog events_;
    TokenLedger tokens_;
    Address admin_;
    Address alice_;
    Address bob_;
    AuthorityToken mint_;
};

// ============================================================================
// Balance
// ============================================================================

TEST_F(TokenLedgerTest, BalanceSplitAndJoin) {
    Balance b = tokens_.ProtocolMint(10);
    Balance part = b.Split(4);
    EXPECT_EQ(b.Value(), 6u);
    EXPECT_EQ(part.Value(), 4u);
    
    b.Join(std::move(part));
    EXPECT_EQ(b.Value(), 10u);
    EXPECT_TRUE(part.IsZero());
    
    EXPECT_EQ(CodeOf([&b] { b.Split(11); }), ErrorCode::InsufficientBalance);
    EXPECT_EQ(b.Value(), 10u);
    
    tokens_.Deposit(alice_, std::move(b));
}

TEST_F(TokenLedgerTest, MovedFromBalanceIsEmpty) {
    Balance a = tokens_.ProtocolMint(7);
    Balance b(std::move(a));
    EXPECT_TRUE(a.IsZero());
    EXPECT_EQ(b.Value(), 7u);
    tokens_.Deposit(alice_, std::move(b));
}

// ============================================================================
// Mint
// ============================================================================

TEST_F(TokenLedgerTest, MintWithAuthority) {
    MintTo(alice_, 100 * COIN);
    
    EXPECT_EQ(tokens_.BalanceOf(alice_), 100 * COIN);
    EXPECT_EQ(tokens_.TotalSupply(), 100 * COIN);
    ASSERT_EQ(events_.Size(), 1u);
    
    Event e = events_.GetAll()[0];
    ASSERT_EQ(e.GetType(), EventType::TokensMinted);
    EXPECT_EQ(std::get<TokensMinted>(e.payload).amount, 100 * COIN);
    EXPECT_EQ(std::get<TokensMinted>(e.payload).recipient, alice_);
}

TEST_F(TokenLedgerTest, MintByNonHolderRejected) {
    EXPECT_EQ(CodeOf([this] { tokens_.Mint(mint_, alice_, COIN, alice_, 1000); }),
              ErrorCode::Unauthorized);
    EXPECT_EQ(tokens_.TotalSupply(), 0u);
    EXPECT_EQ(events_.Size(), 0u);
}

TEST_F(TokenLedgerTest, MintWithForgedAuthorityRejected) {
    AuthorityToken forged;
    forged.id[0] = 0x42;
    forged.holder = alice_;
    forged.capability = Capability::Mint;
    
    EXPECT_EQ(CodeOf([&] { tokens_.Mint(forged, alice_, COIN, alice_, 1000); }),
              ErrorCode::Unauthorized);
    
    AuthorityToken poolAdmin = gate_.Issue(Capability::PoolAdmin, admin_);
    EXPECT_EQ(CodeOf([&] { tokens_.Mint(poolAdmin, admin_, COIN, alice_, 1000); }),
              ErrorCode::Unauthorized);
    EXPECT_EQ(tokens_.TotalSupply(), 0u);
}

TEST_F(TokenLedgerTest, MintOverflowRejected) {
    MintTo(alice_, MAX_AMOUNT - 5);
    EXPECT_EQ(CodeOf([this] { tokens_.Mint(mint_, admin_, 6, bob_, 1000); }),
              ErrorCode::ArithmeticOverflow);
    EXPECT_EQ(tokens_.TotalSupply(), MAX_AMOUNT - 5);
    EXPECT_EQ(events_.Size(), 1u);
    
    MintTo(bob_, 5);
    EXPECT_EQ(tokens_.TotalSupply(), MAX_AMOUNT);
}

TEST_F(TokenLedgerTest, ZeroMintIsAllowed) {
    MintTo(alice_, 0);
    EXPECT_EQ(tokens_.BalanceOf(alice_), 0u);
    EXPECT_TRUE(tokens_.GetAccounts().empty());
    EXPECT_EQ(events_.Size(), 1u);
}

TEST_F(TokenLedgerTest, ProtocolMintEmitsNoEvent) {
    tokens_.Deposit(alice_, tokens_.ProtocolMint(3));
    EXPECT_EQ(tokens_.TotalSupply(), 3u);
    EXPECT_EQ(events_.Size(), 0u);
}

// ============================================================================
// Transfer
// ============================================================================

TEST_F(TokenLedgerTest, TransferMovesTokens) {
    MintTo(alice_, 10 * COIN);
    tokens_.Transfer(alice_, bob_, 4 * COIN, 1001);
    
    EXPECT_EQ(tokens_.BalanceOf(alice_), 6 * COIN);
    EXPECT_EQ(tokens_.BalanceOf(bob_), 4 * COIN);
    EXPECT_EQ(tokens_.TotalSupply(), 10 * COIN);
    EXPECT_EQ(AccountSum(), tokens_.TotalSupply());
    
    Event e = events_.GetAll().back();
    ASSERT_EQ(e.GetType(), EventType::TokensTransferred);
    EXPECT_EQ(e.time, 1001);
}

TEST_F(TokenLedgerTest, TransferEntireBalanceRemovesAccount) {
    MintTo(alice_, 5);
    tokens_.Transfer(alice_, bob_, 5, 1001);
    EXPECT_EQ(tokens_.GetAccounts().count(alice_), 0u);
    EXPECT_EQ(tokens_.BalanceOf(bob_), 5u);
}

TEST_F(TokenLedgerTest, TransferInsufficientRejected) {
    MintTo(alice_, 5);
    size_t before = events_.Size();
    EXPECT_EQ(CodeOf([this] { tokens_.Transfer(alice_, bob_, 6, 1001); }),
              ErrorCode::InsufficientBalance);
    EXPECT_EQ(CodeOf([this] { tokens_.Transfer(bob_, alice_, 1, 1001); }),
              ErrorCode::InsufficientBalance);
    EXPECT_EQ(tokens_.BalanceOf(alice_), 5u);
    EXPECT_EQ(events_.Size(), before);
}

TEST_F(TokenLedgerTest, SelfTransferIsNoop) {
    MintTo(alice_, 5);
    tokens_.Transfer(alice_, alice_, 5, 1001);
    EXPECT_EQ(tokens_.BalanceOf(alice_), 5u);
    EXPECT_EQ(events_.Size(), 2u);
}

// ============================================================================
// Burn / Withdraw / Deposit
// ============================================================================

TEST_F(TokenLedgerTest, BurnReducesSupply) {
    MintTo(alice_, 10);
    Amount burned = tokens_.Burn(tokens_.Withdraw(alice_, 4), alice_, 1002);
    
    EXPECT_EQ(burned, 4u);
    EXPECT_EQ(tokens_.BalanceOf(alice_), 6u);
    EXPECT_EQ(tokens_.TotalSupply(), 6u);
    EXPECT_EQ(events_.GetAll().back().GetType(), EventType::TokensBurned);
}

TEST_F(TokenLedgerTest, WithdrawInsufficientLeavesBalance) {
    MintTo(alice_, 3);
    EXPECT_EQ(CodeOf([this] { tokens_.Withdraw(alice_, 4); }),
              ErrorCode::InsufficientBalance);
    EXPECT_EQ(tokens_.BalanceOf(alice_), 3u);
}

TEST_F(TokenLedgerTest, WithdrawDepositPreservesSupply) {
    MintTo(alice_, 8);
    Balance held = tokens_.Withdraw(alice_, 8);
    EXPECT_EQ(tokens_.BalanceOf(alice_), 0u);
    EXPECT_EQ(tokens_.TotalSupply(), 8u);
    
    tokens_.Deposit(bob_, std::move(held));
    EXPECT_TRUE(held.IsZero());
    EXPECT_EQ(tokens_.BalanceOf(bob_), 8u);
    EXPECT_EQ(AccountSum(), tokens_.TotalSupply());
}

TEST_F(TokenLedgerTest, SplitDepositsRejoin) {
    MintTo(alice_, MAX_AMOUNT);
    Balance moved = tokens_.Withdraw(alice_, 1);
    Balance extra = moved.Split(1);
    tokens_.Deposit(alice_, std::move(moved));
    tokens_.Deposit(alice_, std::move(extra));
    EXPECT_EQ(tokens_.BalanceOf(alice_), MAX_AMOUNT);
}

TEST_F(TokenLedgerTest, RestoreDropsEmptyAccounts) {
    std::map<Address, Amount> accounts{{alice_, 5}, {bob_, 0}};
    tokens_.Restore(accounts, 5);
    EXPECT_EQ(tokens_.GetAccounts().size(), 1u);
    EXPECT_EQ(tokens_.TotalSupply(), 5u);
}

} // namespace test
} // namespace ledger
} // namespace amoca
