// AMOCA - Transaction Executor Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/ledger/executor.h>
#include <amoca/util/logging.h>

#include <algorithm>
#include <sstream>

namespace amoca {
namespace ledger {

std::string TxResult::ToString() const {
    std::ostringstream os;
    if (committed) {
        os << "committed";
        if (createdId) {
            os << " id=" << createdId->ToHex();
        }
        if (verified) {
            os << " verified=" << (*verified ? "true" : "false");
        }
        if (amount != 0) {
            os << " amount=" << FormatAmount(amount);
        }
        os << " events=" << events.size();
    } else {
        os << "aborted: " << ErrorCodeToString(error);
        if (!message.empty()) {
            os << " (" << message << ")";
        }
    }
    return os.str();
}

Executor::Executor(Ledger& ledger, Clock& clock) : ledger_(ledger), clock_(clock) {}

TxResult Executor::Execute(const Transaction& tx) {
    std::lock_guard<std::mutex> lock(mutex_);
    util::LogScope scope("tx " + tx.GetHash().ToShortHex());
    
    if (!tx.VerifySignature()) {
        LOG_WARN(util::LogCategory::TX) << "Rejected " << OperationName(tx.op)
                                        << ": invalid signature";
        return TxResult::Failure(ErrorCode::InvalidSignature, "signature does not verify");
    }
    
    Address sender = tx.GetSender();
    uint64_t expected = ledger_.GetNextNonce(sender);
    if (tx.nonce != expected) {
        LOG_WARN(util::LogCategory::TX) << "Rejected " << OperationName(tx.op) << " from "
                                        << sender.ToHex() << ": nonce " << tx.nonce
                                        << ", expected " << expected;
        return TxResult::Failure(ErrorCode::InvalidNonce,
                                 "expected nonce " + std::to_string(expected));
    }
    
    TxResult result = Apply(sender, tx.op);
    if (result.committed) {
        ledger_.AdvanceNonce(sender);
    }
    return result;
}

TxResult Executor::ExecuteAs(const Address& caller, const Operation& op) {
    std::lock_guard<std::mutex> lock(mutex_);
    return Apply(caller, op);
}

TxResult Executor::Apply(const Address& caller, const Operation& op) {
    util::LogScope scope(OperationName(op));
    Timestamp now = std::max(clock_.Now(), ledger_.GetLastTime());
    EventLog& events = ledger_.Events();
    size_t mark = events.Size();
    
    TxResult result = TxResult::Success();
    try {
        std::visit([&](const auto& o) { Run(result, caller, o, now); }, op);
    } catch (const LedgerError& e) {
        events.Truncate(mark);
        LOG_WARN(util::LogCategory::TX) << "Aborted for " << caller.ToHex() << ": "
                                        << e.what();
        return TxResult::Failure(e.Code(), e.what());
    } catch (const std::exception& e) {
        events.Truncate(mark);
        LOG_ERROR(util::LogCategory::TX) << "Failed for " << caller.ToHex() << ": "
                                         << e.what();
        throw;
    }
    
    result.events = events.Since(mark);
    result.time = now;
    ledger_.SetLastTime(now);
    
    LOG_INFO(util::LogCategory::TX) << caller.ToHex() << " " << result.ToString();
    return result;
}

// ============================================================================
// Token Ledger
// ============================================================================

void Executor::Run(TxResult& result, const Address& caller, const MintTokens& op,
                   Timestamp now) {
    TokenLedger& tokens = ledger_.Tokens();
    tokens.Deposit(op.recipient, tokens.Mint(op.authority, caller, op.amount, op.recipient, now));
    result.amount = op.amount;
}

void Executor::Run(TxResult& /*result*/, const Address& caller, const TransferTokens& op,
                   Timestamp now) {
    ledger_.Tokens().Transfer(caller, op.to, op.amount, now);
}

void Executor::Run(TxResult& result, const Address& caller, const BurnTokens& op,
                   Timestamp now) {
    TokenLedger& tokens = ledger_.Tokens();
    Balance balance = tokens.Withdraw(caller, op.amount);
    try {
        result.amount = tokens.Burn(std::move(balance), caller, now);
    } catch (const LedgerError&) {
        tokens.Deposit(caller, std::move(balance));
        throw;
    }
}

// ============================================================================
// Staking
// ============================================================================

void Executor::Run(TxResult& result, const Address& caller, const StakeTokens& op,
                   Timestamp now) {
    TokenLedger& tokens = ledger_.Tokens();
    Balance balance = tokens.Withdraw(caller, op.amount);
    try {
        result.createdId = ledger_.Staking().StakeTokens(caller, std::move(balance),
                                                         op.duration, now);
    } catch (const LedgerError&) {
        // StakeTokens leaves the balance untouched when it throws
        tokens.Deposit(caller, std::move(balance));
        throw;
    }
    result.amount = op.amount;
}

void Executor::Run(TxResult& result, const Address& caller, const ClaimRewards& op,
                   Timestamp now) {
    result.amount = ledger_.Staking().ClaimRewards(caller, op.stakeId, now);
}

void Executor::Run(TxResult& result, const Address& caller, const UnstakeTokens& op,
                   Timestamp now) {
    result.amount = ledger_.Staking().Unstake(caller, op.stakeId, now);
}

// ============================================================================
// Governance
// ============================================================================

void Executor::Run(TxResult& result, const Address& caller, const CreateProposal& op,
                   Timestamp now) {
    result.createdId = ledger_.Governance().CreateProposal(caller, op.title, op.description,
                                                           op.duration, now);
}

void Executor::Run(TxResult& /*result*/, const Address& caller, const VoteOnProposal& op,
                   Timestamp now) {
    ledger_.Governance().Vote(caller, op.proposalId, op.choice, op.weight, now);
}

// ============================================================================
// Access Rights
// ============================================================================

void Executor::Run(TxResult& result, const Address& caller, const CreateDataAccessRight& op,
                   Timestamp now) {
    result.createdId = ledger_.Access().Grant(caller, op.dataId, op.recipient,
                                              op.accessLevel, op.expiration, now);
}

void Executor::Run(TxResult& result, const Address& caller, const VerifyDataAccess& op,
                   Timestamp now) {
    result.verified = ledger_.Access().Verify(op.rightId, op.requiredLevel, caller, now);
}

// ============================================================================
// Capability Gate
// ============================================================================

void Executor::Run(TxResult& /*result*/, const Address& caller, const TransferAuthority& op,
                   Timestamp /*now*/) {
    ledger_.Gate().Transfer(op.authority, caller, op.newHolder);
}

} // namespace ledger
} // namespace amoca
