// AMOCA - Transactions Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/ledger/transaction.h>
#include <amoca/crypto/sha256.h>

namespace amoca {
namespace ledger {

namespace {

/// Domain separator so a signature is never valid for another message kind
constexpr const char* SIGNING_TAG = "AMOCA/tx/v1";

// ============================================================================
// Per-operation encoding
// ============================================================================

void WriteOp(DataStream& s, const MintTokens& op) {
    s << op.authority << op.amount << op.recipient;
}
void WriteOp(DataStream& s, const TransferTokens& op) {
    s << op.to << op.amount;
}
void WriteOp(DataStream& s, const BurnTokens& op) {
    s << op.amount;
}
void WriteOp(DataStream& s, const StakeTokens& op) {
    s << op.amount << op.duration;
}
void WriteOp(DataStream& s, const ClaimRewards& op) {
    s << op.stakeId;
}
void WriteOp(DataStream& s, const UnstakeTokens& op) {
    s << op.stakeId;
}
void WriteOp(DataStream& s, const CreateProposal& op) {
    s << op.title << op.description << op.duration;
}
void WriteOp(DataStream& s, const VoteOnProposal& op) {
    s << op.proposalId << static_cast<uint8_t>(op.choice) << op.weight;
}
void WriteOp(DataStream& s, const CreateDataAccessRight& op) {
    s << op.dataId << op.recipient << op.accessLevel << op.expiration;
}
void WriteOp(DataStream& s, const VerifyDataAccess& op) {
    s << op.rightId << op.requiredLevel;
}
void WriteOp(DataStream& s, const TransferAuthority& op) {
    s << op.authority << op.newHolder;
}

void ReadOp(DataStream& s, MintTokens& op) {
    s >> op.authority >> op.amount >> op.recipient;
}
void ReadOp(DataStream& s, TransferTokens& op) {
    s >> op.to >> op.amount;
}
void ReadOp(DataStream& s, BurnTokens& op) {
    s >> op.amount;
}
void ReadOp(DataStream& s, StakeTokens& op) {
    s >> op.amount >> op.duration;
}
void ReadOp(DataStream& s, ClaimRewards& op) {
    s >> op.stakeId;
}
void ReadOp(DataStream& s, UnstakeTokens& op) {
    s >> op.stakeId;
}
void ReadOp(DataStream& s, CreateProposal& op) {
    s >> op.title >> op.description >> op.duration;
}
void ReadOp(DataStream& s, VoteOnProposal& op) {
    uint8_t choice = 0;
    s >> op.proposalId >> choice >> op.weight;
    if (choice > static_cast<uint8_t>(governance::VoteChoice::No)) {
        throw std::ios_base::failure("unknown vote choice");
    }
    op.choice = static_cast<governance::VoteChoice>(choice);
}
void ReadOp(DataStream& s, CreateDataAccessRight& op) {
    s >> op.dataId >> op.recipient >> op.accessLevel >> op.expiration;
}
void ReadOp(DataStream& s, VerifyDataAccess& op) {
    s >> op.rightId >> op.requiredLevel;
}
void ReadOp(DataStream& s, TransferAuthority& op) {
    s >> op.authority >> op.newHolder;
}

template<typename T>
Operation ReadAs(DataStream& s) {
    T op;
    ReadOp(s, op);
    return op;
}

void WriteBody(DataStream& s, const Transaction& tx) {
    s << tx.senderKey << tx.nonce << tx.op;
}

} // namespace

const char* OperationName(const Operation& op) {
    static const char* const NAMES[] = {
        "mint_tokens",
        "transfer_tokens",
        "burn_tokens",
        "stake_tokens",
        "claim_rewards",
        "unstake_tokens",
        "create_proposal",
        "vote_on_proposal",
        "create_data_access_right",
        "verify_data_access",
        "transfer_authority",
    };
    static_assert(sizeof(NAMES) / sizeof(NAMES[0]) == std::variant_size_v<Operation>,
                  "operation name table out of sync");
    return NAMES[op.index()];
}

void Serialize(DataStream& s, const Operation& op) {
    s << static_cast<uint8_t>(op.index());
    std::visit([&s](const auto& o) { WriteOp(s, o); }, op);
}

void Unserialize(DataStream& s, Operation& op) {
    uint8_t type = 0;
    s >> type;
    switch (type) {
        case 0:  op = ReadAs<MintTokens>(s); break;
        case 1:  op = ReadAs<TransferTokens>(s); break;
        case 2:  op = ReadAs<BurnTokens>(s); break;
        case 3:  op = ReadAs<StakeTokens>(s); break;
        case 4:  op = ReadAs<ClaimRewards>(s); break;
        case 5:  op = ReadAs<UnstakeTokens>(s); break;
        case 6:  op = ReadAs<CreateProposal>(s); break;
        case 7:  op = ReadAs<VoteOnProposal>(s); break;
        case 8:  op = ReadAs<CreateDataAccessRight>(s); break;
        case 9:  op = ReadAs<VerifyDataAccess>(s); break;
        case 10: op = ReadAs<TransferAuthority>(s); break;
        default:
            throw std::ios_base::failure("unknown operation type");
    }
}

// ============================================================================
// Transaction
// ============================================================================

Hash256 Transaction::GetSigningHash() const {
    DataStream ss;
    ss << std::string(SIGNING_TAG);
    WriteBody(ss, *this);
    return DoubleSHA256(ss.GetBytes());
}

bool Transaction::Sign(const PrivateKey& key) {
    if (!key.IsValid()) {
        return false;
    }
    senderKey = key.GetPublicKey().GetBytes();
    signature = key.Sign(GetSigningHash());
    return !signature.empty();
}

bool Transaction::VerifySignature() const {
    if (signature.empty()) {
        return false;
    }
    PublicKey pubkey(senderKey);
    if (!pubkey.IsValid()) {
        return false;
    }
    return pubkey.Verify(GetSigningHash(), signature);
}

Address Transaction::GetSender() const {
    PublicKey pubkey(senderKey);
    if (!pubkey.IsValid()) {
        return Address();
    }
    return pubkey.GetAddress();
}

Hash256 Transaction::GetHash() const {
    DataStream ss;
    ss << *this;
    return DoubleSHA256(ss.GetBytes());
}

void Serialize(DataStream& s, const Transaction& tx) {
    WriteBody(s, tx);
    s << tx.signature;
}

void Unserialize(DataStream& s, Transaction& tx) {
    s >> tx.senderKey >> tx.nonce >> tx.op >> tx.signature;
}

Transaction MakeTransaction(const PublicKey& sender, uint64_t nonce, Operation op) {
    Transaction tx;
    tx.senderKey = sender.GetBytes();
    tx.nonce = nonce;
    tx.op = std::move(op);
    return tx;
}

} // namespace ledger
} // namespace amoca
