// AMOCA - Ledger State
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// The complete committed state: capability registry, accounts, staking pool,
// proposals, access rights, event log and per-sender nonces.

#ifndef AMOCA_LEDGER_LEDGER_H
#define AMOCA_LEDGER_LEDGER_H

#include <amoca/access/access.h>
#include <amoca/core/serialize.h>
#include <amoca/core/types.h>
#include <amoca/governance/governance.h>
#include <amoca/ledger/auth.h>
#include <amoca/ledger/events.h>
#include <amoca/ledger/token.h>
#include <amoca/staking/staking.h>

#include <map>
#include <memory>
#include <mutex>
#include <optional>

namespace amoca {
namespace ledger {

/// Parameters fixed at genesis for the lifetime of the ledger
struct GenesisParams {
    /// Holder of the Mint and PoolAdmin authorities
    Address treasury;
    uint64_t rewardRate{staking::DEFAULT_REWARD_RATE};
    int64_t minStakeDuration{staking::DEFAULT_MIN_STAKE_DURATION};
};

void Serialize(DataStream& s, const GenesisParams& params);
void Unserialize(DataStream& s, GenesisParams& params);

class Ledger {
public:
    /**
     * Create a fresh ledger.
     * Issues one Mint and one PoolAdmin authority to the treasury and opens
     * the staking pool with the given parameters.
     *
     * @throws LedgerError InvalidArgument for a negative minimum duration
     */
    static std::unique_ptr<Ledger> Genesis(const GenesisParams& params, Timestamp now);
    
    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;
    
    CapabilityGate& Gate() { return gate_; }
    const CapabilityGate& Gate() const { return gate_; }
    EventLog& Events() { return events_; }
    const EventLog& Events() const { return events_; }
    TokenLedger& Tokens() { return tokens_; }
    const TokenLedger& Tokens() const { return tokens_; }
    staking::StakingEngine& Staking() { return staking_; }
    const staking::StakingEngine& Staking() const { return staking_; }
    governance::GovernanceEngine& Governance() { return governance_; }
    const governance::GovernanceEngine& Governance() const { return governance_; }
    access::AccessRightsEngine& Access() { return access_; }
    const access::AccessRightsEngine& Access() const { return access_; }
    
    const GenesisParams& GetParams() const { return params_; }
    Timestamp GetGenesisTime() const { return genesisTime_; }
    
    /// Time of the latest committed transaction
    Timestamp GetLastTime() const;
    
    /// Nonce the sender's next transaction must carry
    uint64_t GetNextNonce(const Address& sender) const;
    std::map<Address, uint64_t> GetNonces() const;
    
    /// First registered authority of the given kind
    std::optional<AuthorityToken> FindAuthority(Capability capability) const;
    
    /// TotalSupply == accounts + live stakes
    bool CheckSupplyInvariant() const;

private:
    Ledger(const GenesisParams& params, const staking::StakingPool& pool, Timestamp genesisTime);
    
    void AdvanceNonce(const Address& sender);
    void SetLastTime(Timestamp time);
    
    GenesisParams params_;
    Timestamp genesisTime_;
    
    CapabilityGate gate_;
    EventLog events_;
    TokenLedger tokens_;
    staking::StakingEngine staking_;
    governance::GovernanceEngine governance_;
    access::AccessRightsEngine access_;
    
    mutable std::mutex mutex_;
    std::map<Address, uint64_t> nonces_;
    Timestamp lastTime_;
    
    friend class Executor;
    friend class LedgerStore;
};

} // namespace ledger
} // namespace amoca

#endif // AMOCA_LEDGER_LEDGER_H
