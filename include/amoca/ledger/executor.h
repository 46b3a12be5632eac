// AMOCA - Transaction Executor
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// Runs one transaction at a time against the ledger. A transaction either
// commits with all of its effects and events, or aborts with none.

#ifndef AMOCA_LEDGER_EXECUTOR_H
#define AMOCA_LEDGER_EXECUTOR_H

#include <amoca/core/error.h>
#include <amoca/core/types.h>
#include <amoca/ledger/clock.h>
#include <amoca/ledger/events.h>
#include <amoca/ledger/ledger.h>
#include <amoca/ledger/transaction.h>

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace amoca {
namespace ledger {

// ============================================================================
// Transaction Result
// ============================================================================

struct TxResult {
    bool committed{false};
    ErrorCode error{ErrorCode::OK};
    std::string message;
    
    /// Events emitted by this transaction (empty on abort)
    std::vector<Event> events;
    
    /// Set by verify_data_access
    std::optional<bool> verified;
    
    /// Id of the stake, proposal or access right created
    std::optional<ObjectId> createdId;
    
    /// Minted amount, claimed reward or released principal
    Amount amount{0};
    
    /// Commit time
    Timestamp time{0};
    
    static TxResult Success() {
        TxResult r;
        r.committed = true;
        return r;
    }
    
    static TxResult Failure(ErrorCode code, const std::string& msg) {
        TxResult r;
        r.error = code;
        r.message = msg;
        return r;
    }
    
    std::string ToString() const;
};

// ============================================================================
// Executor
// ============================================================================

class Executor {
public:
    Executor(Ledger& ledger, Clock& clock);
    
    /**
     * Authenticate and run a signed transaction.
     *
     * Aborts with InvalidSignature if the signature does not verify for the
     * embedded key, and with InvalidNonce unless tx.nonce equals the sender's
     * next nonce. The nonce advances only on commit.
     */
    TxResult Execute(const Transaction& tx);
    
    /// Run an operation for an already authenticated caller (no nonce)
    TxResult ExecuteAs(const Address& caller, const Operation& op);

private:
    TxResult Apply(const Address& caller, const Operation& op);
    
    void Run(TxResult& result, const Address& caller, const MintTokens& op, Timestamp now);
    void Run(TxResult& result, const Address& caller, const TransferTokens& op, Timestamp now);
    void Run(TxResult& result, const Address& caller, const BurnTokens& op, Timestamp now);
    void Run(TxResult& result, const Address& caller, const StakeTokens& op, Timestamp now);
    void Run(TxResult& result, const Address& caller, const ClaimRewards& op, Timestamp now);
    void Run(TxResult& result, const Address& caller, const UnstakeTokens& op, Timestamp now);
    void Run(TxResult& result, const Address& caller, const CreateProposal& op, Timestamp now);
    void Run(TxResult& result, const Address& caller, const VoteOnProposal& op, Timestamp now);
    void Run(TxResult& result, const Address& caller, const CreateDataAccessRight& op, Timestamp now);
    void Run(TxResult& result, const Address& caller, const VerifyDataAccess& op, Timestamp now);
    void Run(TxResult& result, const Address& caller, const TransferAuthority& op, Timestamp now);
    
    Ledger& ledger_;
    Clock& clock_;
    std::mutex mutex_;
};

} // namespace ledger
} // namespace amoca

#endif // AMOCA_LEDGER_EXECUTOR_H
