// AMOCA - Capability Gate Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/ledger/auth.h>
#include <amoca/core/error.h>
#include <amoca/ledger/objectid.h>
#include <amoca/util/logging.h>

namespace amoca {
namespace ledger {

// ============================================================================
// Capability
// ============================================================================

const char* CapabilityToString(Capability cap) {
    switch (cap) {
        case Capability::Mint:      return "mint";
        case Capability::PoolAdmin: return "pooladmin";
    }
    return "unknown";
}

std::optional<Capability> CapabilityFromString(const std::string& str) {
    if (str == "mint") return Capability::Mint;
    if (str == "pooladmin") return Capability::PoolAdmin;
    return std::nullopt;
}

// ============================================================================
// Authority Token
// ============================================================================

std::string AuthorityToken::ToString() const {
    return std::string("AuthorityToken(") + CapabilityToString(capability) +
           ", id=" + id.ToShortHex() + ", holder=" + holder.ToHex() + ")";
}

void Serialize(DataStream& s, const AuthorityToken& token) {
    s << token.id << token.holder << static_cast<uint8_t>(token.capability);
}

void Unserialize(DataStream& s, AuthorityToken& token) {
    uint8_t cap = 0;
    s >> token.id >> token.holder >> cap;
    if (cap > static_cast<uint8_t>(Capability::PoolAdmin)) {
        throw std::ios_base::failure("unknown capability");
    }
    token.capability = static_cast<Capability>(cap);
}

// ============================================================================
// Capability Gate
// ============================================================================

AuthorityToken CapabilityGate::Issue(Capability capability, const Address& holder) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    DataStream body;
    body << static_cast<uint8_t>(capability) << holder;
    
    AuthorityToken token;
    token.id = DeriveObjectId("authority", body, sequence_++);
    token.holder = holder;
    token.capability = capability;
    registry_[token.id] = token;
    
    LOG_INFO(util::LogCategory::AUTH) << "Issued " << token.ToString();
    return token;
}

bool CapabilityGate::CheckLocked(const AuthorityToken& presented, const Address& caller,
                                 Capability capability) const {
    auto it = registry_.find(presented.id);
    if (it == registry_.end()) {
        return false;
    }
    const AuthorityToken& registered = it->second;
    return registered == presented &&
           registered.holder == caller &&
           registered.capability == capability;
}

bool CapabilityGate::Check(const AuthorityToken& presented, const Address& caller,
                           Capability capability) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return CheckLocked(presented, caller, capability);
}

void CapabilityGate::Require(const AuthorityToken& presented, const Address& caller,
                             Capability capability) const {
    if (!Check(presented, caller, capability)) {
        LOG_WARN(util::LogCategory::AUTH) << "Rejected " << CapabilityToString(capability)
                                          << " authority " << presented.id.ToShortHex()
                                          << " presented by " << caller.ToHex();
        throw LedgerError(ErrorCode::Unauthorized,
                          std::string("caller does not hold ") +
                          CapabilityToString(capability) + " authority");
    }
}

AuthorityToken CapabilityGate::Transfer(const AuthorityToken& presented, const Address& caller,
                                        const Address& newHolder) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!CheckLocked(presented, caller, presented.capability)) {
        throw LedgerError(ErrorCode::Unauthorized, "only the holder may transfer an authority");
    }
    AuthorityToken& registered = registry_[presented.id];
    registered.holder = newHolder;
    
    LOG_INFO(util::LogCategory::AUTH) << "Transferred " << CapabilityToString(registered.capability)
                                      << " authority " << registered.id.ToShortHex()
                                      << " to " << newHolder.ToHex();
    return registered;
}

std::optional<AuthorityToken> CapabilityGate::Get(const ObjectId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = registry_.find(id);
    if (it == registry_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<AuthorityToken> CapabilityGate::FindByHolder(const Address& holder) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuthorityToken> result;
    for (const auto& [id, token] : registry_) {
        if (token.holder == holder) {
            result.push_back(token);
        }
    }
    return result;
}

std::vector<AuthorityToken> CapabilityGate::GetAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<AuthorityToken> result;
    result.reserve(registry_.size());
    for (const auto& [id, token] : registry_) {
        result.push_back(token);
    }
    return result;
}

uint64_t CapabilityGate::GetSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

void CapabilityGate::Restore(const std::vector<AuthorityToken>& tokens, uint64_t sequence) {
    std::lock_guard<std::mutex> lock(mutex_);
    registry_.clear();
    for (const auto& token : tokens) {
        registry_[token.id] = token;
    }
    sequence_ = sequence;
}

} // namespace ledger
} // namespace amoca
