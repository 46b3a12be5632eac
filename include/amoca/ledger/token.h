// AMOCA - Token Ledger
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// Fungible balance issuance, movement and burn. Every other engine moves
// value only through this class.

#ifndef AMOCA_LEDGER_TOKEN_H
#define AMOCA_LEDGER_TOKEN_H

#include <amoca/core/types.h>
#include <amoca/ledger/auth.h>
#include <amoca/ledger/events.h>

#include <map>
#include <mutex>

namespace amoca {
namespace ledger {

class TokenLedger;
class LedgerStore;

// ============================================================================
// Balance
// ============================================================================

/**
 * Tokens detached from any account.
 *
 * Move-only: a Balance has exactly one owner at a time, and moving it leaves
 * the source empty. Only TokenLedger creates non-empty balances. A Balance
 * must end up deposited, burned, or held by a record (e.g. a Stake); one that
 * is dropped while non-empty leaves circulation but stays in TotalSupply().
 */
class Balance {
public:
    Balance() = default;
    
    Balance(Balance&& other) noexcept : value_(other.value_) { other.value_ = 0; }
    Balance& operator=(Balance&&) = delete;
    Balance(const Balance&) = delete;
    Balance& operator=(const Balance&) = delete;
    
    Amount Value() const noexcept { return value_; }
    bool IsZero() const noexcept { return value_ == 0; }
    
    /// Detach amount into a new Balance; throws InsufficientBalance
    Balance Split(Amount amount);
    
    /// Absorb other, leaving it empty; throws ArithmeticOverflow
    void Join(Balance&& other);

private:
    explicit Balance(Amount value) noexcept : value_(value) {}
    
    Amount value_{0};
    
    friend class TokenLedger;
};

// ============================================================================
// Token Ledger
// ============================================================================

class TokenLedger {
public:
    TokenLedger(CapabilityGate& gate, EventLog& events);
    
    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;
    
    // ========================================================================
    // Queries
    // ========================================================================
    
    Amount BalanceOf(const Address& owner) const;
    Amount TotalSupply() const;
    
    /// Non-zero account balances
    std::map<Address, Amount> GetAccounts() const;
    
    // ========================================================================
    // Issuance
    // ========================================================================
    
    /**
     * Create new tokens under the treasury authority.
     *
     * @param authority Token presented by the caller; must be a registered
     *                  Mint authority held by caller
     * @param recipient Recorded in the TokensMinted event
     * @throws LedgerError Unauthorized, ArithmeticOverflow
     */
    Balance Mint(const AuthorityToken& authority, const Address& caller,
                 Amount amount, const Address& recipient, Timestamp now);
    
    /// Internal protocol issuance (staking rewards). No gate, no event.
    Balance ProtocolMint(Amount amount);
    
    /// Destroy tokens; emits TokensBurned. Returns the amount destroyed.
    Amount Burn(Balance&& balance, const Address& owner, Timestamp now);
    
    // ========================================================================
    // Movement
    // ========================================================================
    
    /// Move amount between accounts; emits TokensTransferred
    /// @throws LedgerError InsufficientBalance
    void Transfer(const Address& from, const Address& to, Amount amount, Timestamp now);
    
    /// Detach amount from an account; throws InsufficientBalance
    Balance Withdraw(const Address& owner, Amount amount);
    
    /// Credit a detached balance to an account, leaving it empty
    void Deposit(const Address& owner, Balance&& balance);
    
    // ========================================================================
    // Persistence
    // ========================================================================
    
    void Restore(const std::map<Address, Amount>& accounts, Amount totalSupply);

private:
    /// Re-create a detached balance that was persisted inside a record
    static Balance Reconstitute(Amount amount) { return Balance(amount); }
    
    CapabilityGate& gate_;
    EventLog& events_;
    
    mutable std::mutex mutex_;
    std::map<Address, Amount> accounts_;
    Amount totalSupply_{0};
    
    friend class LedgerStore;
};

} // namespace ledger
} // namespace amoca

#endif // AMOCA_LEDGER_TOKEN_H
