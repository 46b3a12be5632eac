// AMOCA - Token Ledger Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/ledger/token.h>
#include <amoca/core/error.h>
#include <amoca/util/logging.h>

namespace amoca {
namespace ledger {

// ============================================================================
// Balance
// ============================================================================

Balance Balance::Split(Amount amount) {
    if (amount > value_) {
        throw LedgerError(ErrorCode::InsufficientBalance,
                          "cannot split " + FormatAmount(amount) + " from " + FormatAmount(value_));
    }
    value_ -= amount;
    return Balance(amount);
}

void Balance::Join(Balance&& other) {
    value_ = CheckedAdd(value_, other.value_);
    other.value_ = 0;
}

// ============================================================================
// Token Ledger
// ============================================================================

TokenLedger::TokenLedger(CapabilityGate& gate, EventLog& events)
    : gate_(gate), events_(events) {}

Amount TokenLedger::BalanceOf(const Address& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(owner);
    return it == accounts_.end() ? 0 : it->second;
}

Amount TokenLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

std::map<Address, Amount> TokenLedger::GetAccounts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_;
}

Balance TokenLedger::Mint(const AuthorityToken& authority, const Address& caller,
                          Amount amount, const Address& recipient, Timestamp now) {
    gate_.Require(authority, caller, Capability::Mint);
    
    {
        std::lock_guard<std::mutex> lock(mutex_);
        totalSupply_ = CheckedAdd(totalSupply_, amount);
    }
    events_.Append(now, TokensMinted{amount, recipient});
    
    LOG_INFO(util::LogCategory::LEDGER) << "Minted " << FormatAmount(amount)
                                        << " for " << recipient.ToHex();
    return Balance(amount);
}

Balance TokenLedger::ProtocolMint(Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    totalSupply_ = CheckedAdd(totalSupply_, amount);
    return Balance(amount);
}

Amount TokenLedger::Burn(Balance&& balance, const Address& owner, Timestamp now) {
    Amount amount = balance.value_;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        totalSupply_ = CheckedSub(totalSupply_, amount);
        balance.value_ = 0;
    }
    events_.Append(now, TokensBurned{owner, amount});
    
    LOG_INFO(util::LogCategory::LEDGER) << "Burned " << FormatAmount(amount)
                                        << " from " << owner.ToHex();
    return amount;
}

void TokenLedger::Transfer(const Address& from, const Address& to, Amount amount,
                           Timestamp now) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Amount fromBalance = accounts_.count(from) ? accounts_[from] : 0;
        if (amount > fromBalance) {
            throw LedgerError(ErrorCode::InsufficientBalance,
                              from.ToHex() + " holds " + FormatAmount(fromBalance));
        }
        if (from != to) {
            Amount toBalance = accounts_.count(to) ? accounts_[to] : 0;
            Amount newTo = CheckedAdd(toBalance, amount);
            
            Amount newFrom = fromBalance - amount;
            if (newFrom == 0) {
                accounts_.erase(from);
            } else {
                accounts_[from] = newFrom;
            }
            if (newTo != 0) {
                accounts_[to] = newTo;
            }
        }
    }
    events_.Append(now, TokensTransferred{from, to, amount});
    
    LOG_DEBUG(util::LogCategory::LEDGER) << "Transferred " << FormatAmount(amount)
                                         << " " << from.ToHex() << " -> " << to.ToHex();
}

Balance TokenLedger::Withdraw(const Address& owner, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(owner);
    Amount held = it == accounts_.end() ? 0 : it->second;
    if (amount > held) {
        throw LedgerError(ErrorCode::InsufficientBalance,
                          owner.ToHex() + " holds " + FormatAmount(held));
    }
    if (held == amount) {
        if (it != accounts_.end()) {
            accounts_.erase(it);
        }
    } else {
        it->second = held - amount;
    }
    return Balance(amount);
}

void TokenLedger::Deposit(const Address& owner, Balance&& balance) {
    if (balance.IsZero()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(owner);
    Amount held = it == accounts_.end() ? 0 : it->second;
    accounts_[owner] = CheckedAdd(held, balance.value_);
    balance.value_ = 0;
}

void TokenLedger::Restore(const std::map<Address, Amount>& accounts, Amount totalSupply) {
    std::lock_guard<std::mutex> lock(mutex_);
    accounts_.clear();
    for (const auto& [owner, amount] : accounts) {
        if (amount != 0) {
            accounts_[owner] = amount;
        }
    }
    totalSupply_ = totalSupply;
}

} // namespace ledger
} // namespace amoca
