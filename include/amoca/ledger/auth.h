// AMOCA - Capability Gate
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// Authority tokens and the single predicate that checks them. Possession of
// a registered token by the calling address is the only form of privilege.

#ifndef AMOCA_LEDGER_AUTH_H
#define AMOCA_LEDGER_AUTH_H

#include <amoca/core/serialize.h>
#include <amoca/core/types.h>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace amoca {
namespace ledger {

// ============================================================================
// Capability
// ============================================================================

enum class Capability : uint8_t {
    /// Issue new tokens (the treasury authority)
    Mint = 0,
    /// Configure the staking pool
    PoolAdmin = 1,
};

const char* CapabilityToString(Capability cap);
std::optional<Capability> CapabilityFromString(const std::string& str);

// ============================================================================
// Authority Token
// ============================================================================

/// Capability record bound to one holder
struct AuthorityToken {
    ObjectId id;
    Address holder;
    Capability capability{Capability::Mint};
    
    bool operator==(const AuthorityToken& other) const {
        return id == other.id && holder == other.holder && capability == other.capability;
    }
    bool operator!=(const AuthorityToken& other) const { return !(*this == other); }
    
    std::string ToString() const;
};

void Serialize(DataStream& s, const AuthorityToken& token);
void Unserialize(DataStream& s, AuthorityToken& token);

// ============================================================================
// Capability Gate
// ============================================================================

/**
 * Registry of issued authority tokens.
 *
 * A presented token is honored only if the gate issued it, it is currently
 * held by the caller, and it grants the requested capability. Copies with an
 * altered holder or kind therefore fail.
 */
class CapabilityGate {
public:
    CapabilityGate() = default;
    
    /// Create and register a new token (genesis only)
    AuthorityToken Issue(Capability capability, const Address& holder);
    
    /// True if the presented token authorizes caller for capability
    bool Check(const AuthorityToken& presented, const Address& caller,
               Capability capability) const;
    
    /// Check, throwing LedgerError(Unauthorized) on failure
    void Require(const AuthorityToken& presented, const Address& caller,
                 Capability capability) const;
    
    /**
     * Hand a token to a new holder.
     * Only the current holder may do this.
     * @return The token as now registered
     */
    AuthorityToken Transfer(const AuthorityToken& presented, const Address& caller,
                            const Address& newHolder);
    
    /// Look up a registered token by id
    std::optional<AuthorityToken> Get(const ObjectId& id) const;
    
    /// All tokens held by an address
    std::vector<AuthorityToken> FindByHolder(const Address& holder) const;
    
    /// All registered tokens
    std::vector<AuthorityToken> GetAll() const;
    
    uint64_t GetSequence() const;
    
    /// Replace the registry with persisted state
    void Restore(const std::vector<AuthorityToken>& tokens, uint64_t sequence);

private:
    mutable std::mutex mutex_;
    std::map<ObjectId, AuthorityToken> registry_;
    uint64_t sequence_{0};
    
    bool CheckLocked(const AuthorityToken& presented, const Address& caller,
                     Capability capability) const;
};

} // namespace ledger
} // namespace amoca

#endif // AMOCA_LEDGER_AUTH_H
