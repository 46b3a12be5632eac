// AMOCA - Transactions
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// A transaction is one signed state-transition request. The signature binds
// the operation to the sender's key; the nonce makes every request single-use.

#ifndef AMOCA_LEDGER_TRANSACTION_H
#define AMOCA_LEDGER_TRANSACTION_H

#include <amoca/core/serialize.h>
#include <amoca/core/types.h>
#include <amoca/crypto/keys.h>
#include <amoca/governance/proposal.h>
#include <amoca/ledger/auth.h>

#include <string>
#include <variant>
#include <vector>

namespace amoca {
namespace ledger {

// ============================================================================
// Operations
// ============================================================================

/// Issue tokens; caller must hold the presented Mint authority
struct MintTokens {
    AuthorityToken authority;
    Amount amount{0};
    Address recipient;
};

struct TransferTokens {
    Address to;
    Amount amount{0};
};

struct BurnTokens {
    Amount amount{0};
};

/// Lock amount from the sender's account for duration seconds
struct StakeTokens {
    Amount amount{0};
    int64_t duration{0};
};

struct ClaimRewards {
    ObjectId stakeId;
};

struct UnstakeTokens {
    ObjectId stakeId;
};

struct CreateProposal {
    std::string title;
    std::string description;
    int64_t duration{0};
};

struct VoteOnProposal {
    ObjectId proposalId;
    governance::VoteChoice choice{governance::VoteChoice::Yes};
    Amount weight{0};
};

struct CreateDataAccessRight {
    std::string dataId;
    Address recipient;
    uint64_t accessLevel{0};
    Timestamp expiration{0};
};

/// Read-only check that the sender may use a right
struct VerifyDataAccess {
    ObjectId rightId;
    uint64_t requiredLevel{0};
};

/// Hand an authority token to another address
struct TransferAuthority {
    AuthorityToken authority;
    Address newHolder;
};

using Operation = std::variant<
    MintTokens,
    TransferTokens,
    BurnTokens,
    StakeTokens,
    ClaimRewards,
    UnstakeTokens,
    CreateProposal,
    VoteOnProposal,
    CreateDataAccessRight,
    VerifyDataAccess,
    TransferAuthority>;

/// Wire name of the operation ("mint_tokens", "stake_tokens", ...)
const char* OperationName(const Operation& op);

void Serialize(DataStream& s, const Operation& op);
void Unserialize(DataStream& s, Operation& op);

// ============================================================================
// Transaction
// ============================================================================

struct Transaction {
    /// SEC1 public key of the sender
    std::vector<uint8_t> senderKey;
    /// Must equal the sender's next nonce
    uint64_t nonce{0};
    Operation op;
    /// DER ECDSA signature over GetSigningHash()
    std::vector<uint8_t> signature;
    
    /// SHA256d of the unsigned body
    Hash256 GetSigningHash() const;
    
    /// Set senderKey from key and sign; false if signing fails
    bool Sign(const PrivateKey& key);
    
    /// True if the signature is valid for senderKey
    bool VerifySignature() const;
    
    /// Address of senderKey (null if the key is malformed)
    Address GetSender() const;
    
    /// Hash of the full signed transaction
    Hash256 GetHash() const;
};

void Serialize(DataStream& s, const Transaction& tx);
void Unserialize(DataStream& s, Transaction& tx);

/// Build an unsigned transaction
Transaction MakeTransaction(const PublicKey& sender, uint64_t nonce, Operation op);

} // namespace ledger
} // namespace amoca

#endif // AMOCA_LEDGER_TRANSACTION_H
