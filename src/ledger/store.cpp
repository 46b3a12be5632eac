// AMOCA - Ledger Persistence Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/ledger/store.h>
#include <amoca/core/error.h>
#include <amoca/util/logging.h>

namespace amoca {
namespace ledger {

namespace {

// Metadata entries under prefix::META
constexpr const char* META_VERSION = "version";
constexpr const char* META_PARAMS = "params";
constexpr const char* META_TIMES = "times";
constexpr const char* META_SUPPLY = "supply";
constexpr const char* META_POOL = "pool";
constexpr const char* META_SEQUENCES = "sequences";

std::string MetaKey(const char* name) {
    return db::MakeKey(db::prefix::META, db::Slice(name));
}

/// Events are keyed by big-endian sequence so iteration yields log order
std::string EventKey(uint64_t sequence) {
    std::string key(1, db::prefix::EVENT);
    for (int shift = 56; shift >= 0; shift -= 8) {
        key.push_back(static_cast<char>((sequence >> shift) & 0xff));
    }
    return key;
}

template<typename T>
bool DecodeValue(const db::Slice& value, T& out) {
    return db::DeserializeFromString(value.ToString(), out);
}

/// Decode the part of a key after its one-byte prefix
template<typename T>
bool DecodeKey(const db::Slice& key, T& out) {
    return db::DeserializeFromString(std::string(key.data() + 1, key.size() - 1), out);
}

template<typename T>
db::Status ReadMeta(db::Database& db, const char* name, T& out) {
    std::string value;
    db::Status s = db.Get(MetaKey(name), &value);
    if (!s.ok()) {
        return s.IsNotFound() ? db::Status::Corruption(std::string("missing ") + name) : s;
    }
    if (!db::DeserializeFromString(value, out)) {
        return db::Status::Corruption(std::string("bad ") + name);
    }
    return db::Status::Ok();
}

struct Sequences {
    uint64_t authority{0};
    uint64_t stake{0};
    uint64_t proposal{0};
    uint64_t access{0};
};

void Serialize(DataStream& s, const Sequences& seq) {
    s << seq.authority << seq.stake << seq.proposal << seq.access;
}

void Unserialize(DataStream& s, Sequences& seq) {
    s >> seq.authority >> seq.stake >> seq.proposal >> seq.access;
}

struct Times {
    Timestamp genesis{0};
    Timestamp last{0};
};

void Serialize(DataStream& s, const Times& t) {
    s << t.genesis << t.last;
}

void Unserialize(DataStream& s, Times& t) {
    s >> t.genesis >> t.last;
}

} // namespace

bool LedgerStore::Exists() {
    return db_.Exists(MetaKey(META_VERSION));
}

// ============================================================================
// Save
// ============================================================================

db::Status LedgerStore::Save(const Ledger& ledger) {
    db::WriteBatch batch;
    
    // Start from an empty key space; puts below re-create live records
    {
        auto it = db_.NewIterator();
        for (it->SeekToFirst(); it->Valid(); it->Next()) {
            batch.Delete(it->key());
        }
        db::Status s = it->status();
        if (!s.ok()) {
            return s;
        }
    }
    
    Sequences seq;
    seq.authority = ledger.Gate().GetSequence();
    seq.stake = ledger.Staking().GetSequence();
    seq.proposal = ledger.Governance().GetSequence();
    seq.access = ledger.Access().GetSequence();
    
    Times times{ledger.GetGenesisTime(), ledger.GetLastTime()};
    
    batch.Put(MetaKey(META_VERSION), db::SerializeToString(STORE_VERSION));
    batch.Put(MetaKey(META_PARAMS), db::SerializeToString(ledger.GetParams()));
    batch.Put(MetaKey(META_TIMES), db::SerializeToString(times));
    batch.Put(MetaKey(META_SUPPLY), db::SerializeToString(ledger.Tokens().TotalSupply()));
    batch.Put(MetaKey(META_POOL), db::SerializeToString(ledger.Staking().GetPool()));
    batch.Put(MetaKey(META_SEQUENCES), db::SerializeToString(seq));
    
    for (const auto& [owner, amount] : ledger.Tokens().GetAccounts()) {
        batch.Put(db::MakeKey(db::prefix::ACCOUNT, owner), db::SerializeToString(amount));
    }
    for (const auto& token : ledger.Gate().GetAll()) {
        batch.Put(db::MakeKey(db::prefix::AUTHORITY, token.id), db::SerializeToString(token));
    }
    for (const auto& stake : ledger.Staking().ListStakes()) {
        batch.Put(db::MakeKey(db::prefix::STAKE, stake.id), db::SerializeToString(stake));
    }
    for (const auto& proposal : ledger.Governance().ListProposals()) {
        batch.Put(db::MakeKey(db::prefix::PROPOSAL, proposal.id), db::SerializeToString(proposal));
    }
    for (const auto& right : ledger.Access().GetAll()) {
        batch.Put(db::MakeKey(db::prefix::ACCESS_RIGHT, right.id), db::SerializeToString(right));
    }
    for (const auto& [sender, nonce] : ledger.GetNonces()) {
        batch.Put(db::MakeKey(db::prefix::NONCE, sender), db::SerializeToString(nonce));
    }
    for (const auto& event : ledger.Events().GetAll()) {
        batch.Put(EventKey(event.sequence), db::SerializeToString(event));
    }
    
    db::Status s = db_.Write(&batch);
    if (!s.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Failed to save ledger: " << s.ToString();
        return s;
    }
    LOG_DEBUG(util::LogCategory::DB) << "Saved ledger (" << batch.Count() << " operations)";
    return db::Status::Ok();
}

// ============================================================================
// Load
// ============================================================================

std::pair<db::Status, std::unique_ptr<Ledger>> LedgerStore::Load() {
    std::string value;
    db::Status s = db_.Get(MetaKey(META_VERSION), &value);
    if (s.IsNotFound()) {
        return {db::Status::NotFound("no ledger in database"), nullptr};
    }
    if (!s.ok()) {
        return {s, nullptr};
    }
    uint32_t version = 0;
    if (!db::DeserializeFromString(value, version) || version != STORE_VERSION) {
        return {db::Status::NotSupported("unsupported store version"), nullptr};
    }
    
    GenesisParams params;
    Times times;
    Amount supply = 0;
    staking::StakingPool pool;
    Sequences seq;
    
    if (!(s = ReadMeta(db_, META_PARAMS, params)).ok() ||
        !(s = ReadMeta(db_, META_TIMES, times)).ok() ||
        !(s = ReadMeta(db_, META_SUPPLY, supply)).ok() ||
        !(s = ReadMeta(db_, META_POOL, pool)).ok() ||
        !(s = ReadMeta(db_, META_SEQUENCES, seq)).ok()) {
        return {s, nullptr};
    }
    
    std::map<Address, Amount> accounts;
    std::vector<AuthorityToken> authorities;
    std::vector<staking::Stake> stakes;
    std::vector<governance::Proposal> proposals;
    std::vector<access::DataAccessRight> rights;
    std::map<Address, uint64_t> nonces;
    std::vector<Event> events;
    
    auto it = db_.NewIterator();
    for (it->SeekToFirst(); it->Valid(); it->Next()) {
        db::Slice key = it->key();
        db::Slice val = it->value();
        if (key.empty()) {
            return {db::Status::Corruption("empty key"), nullptr};
        }
        
        bool ok = true;
        switch (key[0]) {
            case db::prefix::META:
                break;
            case db::prefix::ACCOUNT: {
                Address owner;
                Amount amount = 0;
                ok = DecodeKey(key, owner) && DecodeValue(val, amount);
                accounts[owner] = amount;
                break;
            }
            case db::prefix::AUTHORITY: {
                AuthorityToken token;
                ok = DecodeValue(val, token);
                authorities.push_back(token);
                break;
            }
            case db::prefix::STAKE: {
                staking::StakeInfo info;
                ok = DecodeValue(val, info);
                if (ok) {
                    stakes.push_back(staking::Stake{info.id, info.owner,
                                                    TokenLedger::Reconstitute(info.amount),
                                                    info.startTime, info.endTime, info.claimed});
                }
                break;
            }
            case db::prefix::PROPOSAL: {
                governance::Proposal proposal;
                ok = DecodeValue(val, proposal);
                proposals.push_back(proposal);
                break;
            }
            case db::prefix::ACCESS_RIGHT: {
                access::DataAccessRight right;
                ok = DecodeValue(val, right);
                rights.push_back(right);
                break;
            }
            case db::prefix::NONCE: {
                Address sender;
                uint64_t nonce = 0;
                ok = DecodeKey(key, sender) && DecodeValue(val, nonce);
                nonces[sender] = nonce;
                break;
            }
            case db::prefix::EVENT: {
                Event event;
                ok = DecodeValue(val, event) && event.sequence == events.size();
                events.push_back(event);
                break;
            }
            default:
                ok = false;
                break;
        }
        if (!ok) {
            return {db::Status::Corruption("bad record under prefix '" +
                                           std::string(1, key[0]) + "'"), nullptr};
        }
    }
    if (!(s = it->status()).ok()) {
        return {s, nullptr};
    }
    
    std::unique_ptr<Ledger> ledger;
    try {
        ledger.reset(new Ledger(params, pool, times.genesis));
        ledger->gate_.Restore(authorities, seq.authority);
        ledger->tokens_.Restore(accounts, supply);
        ledger->staking_.Restore(pool, std::move(stakes), seq.stake);
        ledger->governance_.Restore(proposals, seq.proposal);
        ledger->access_.Restore(rights, seq.access);
        ledger->events_.Restore(std::move(events));
        ledger->nonces_ = std::move(nonces);
        ledger->lastTime_ = times.last;

        if (!ledger->Staking().CheckConservation()) {
            return {db::Status::Corruption("staking pool total does not match stakes"), nullptr};
        }
        if (!ledger->CheckSupplyInvariant()) {
            return {db::Status::Corruption("total supply does not match balances"), nullptr};
        }
    } catch (const LedgerError& e) {
        // Balances or stakes whose sums overflow the amount range
        return {db::Status::Corruption(e.what()), nullptr};
    }

    LOG_DEBUG(util::LogCategory::DB) << "Loaded ledger: " << accounts.size() << " accounts, "
                                     << ledger->Staking().ListStakes().size() << " stakes, "
                                     << ledger->Events().Size() << " events";
    return {db::Status::Ok(), std::move(ledger)};
}

} // namespace ledger
} // namespace amoca
