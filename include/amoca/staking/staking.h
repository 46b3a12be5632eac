// AMOCA - Staking Engine
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// Time-locked staking with a fixed annual reward rate. The pool is a shared
// singleton; each Stake exclusively owns the tokens it locks.

#ifndef AMOCA_STAKING_STAKING_H
#define AMOCA_STAKING_STAKING_H

#include <amoca/core/serialize.h>
#include <amoca/core/types.h>
#include <amoca/ledger/events.h>
#include <amoca/ledger/token.h>

#include <map>
#include <mutex>
#include <optional>
#include <vector>

namespace amoca {
namespace staking {

// ============================================================================
// Constants
// ============================================================================

/// Reward rate is expressed in whole percent per year
constexpr uint64_t RATE_DENOMINATOR = 100;

/// Default pool parameters used by genesis when not configured
constexpr uint64_t DEFAULT_REWARD_RATE = 5;
constexpr int64_t DEFAULT_MIN_STAKE_DURATION = 7 * 24 * 60 * 60;

// ============================================================================
// Records
// ============================================================================

/// Shared pool accounting; totalStaked equals the sum of live stake amounts
struct StakingPool {
    ObjectId id;
    Amount totalStaked{0};
    uint64_t rewardRate{DEFAULT_REWARD_RATE};
    int64_t minStakeDuration{DEFAULT_MIN_STAKE_DURATION};
};

void Serialize(DataStream& s, const StakingPool& pool);
void Unserialize(DataStream& s, StakingPool& pool);

/// Copyable view of a Stake
struct StakeInfo {
    ObjectId id;
    Address owner;
    Amount amount{0};
    Timestamp startTime{0};
    Timestamp endTime{0};
    bool claimed{false};
    
    int64_t Duration() const { return endTime - startTime; }
    bool IsMatured(Timestamp now) const { return now >= endTime; }
};

void Serialize(DataStream& s, const StakeInfo& info);
void Unserialize(DataStream& s, StakeInfo& info);

/// Locked tokens owned by one address
struct Stake {
    ObjectId id;
    Address owner;
    ledger::Balance amount;
    Timestamp startTime{0};
    Timestamp endTime{0};
    /// false -> true exactly once, never reset
    bool claimed{false};
    
    StakeInfo Info() const {
        return StakeInfo{id, owner, amount.Value(), startTime, endTime, claimed};
    }
};

// ============================================================================
// Reward Computation
// ============================================================================

/**
 * floor(amount * rate * duration / (100 * SECONDS_PER_YEAR)).
 *
 * Truncates toward zero, so short durations or tiny amounts earn nothing.
 * The product is formed in 128 bits.
 *
 * @throws LedgerError ArithmeticOverflow if the reward does not fit in Amount
 * @throws LedgerError InvalidArgument if duration is negative
 */
Amount CalculateReward(Amount amount, uint64_t rewardRate, int64_t duration);

// ============================================================================
// Staking Engine
// ============================================================================

class StakingEngine {
public:
    StakingEngine(ledger::TokenLedger& tokens, ledger::EventLog& events, StakingPool pool);
    
    StakingEngine(const StakingEngine&) = delete;
    StakingEngine& operator=(const StakingEngine&) = delete;
    
    /**
     * Lock balance in a new stake ending at now + duration.
     *
     * balance is consumed only on success; on failure the caller still
     * holds it. Emits StakeCreated.
     *
     * @throws LedgerError InvalidDuration if duration < minStakeDuration
     */
    ObjectId StakeTokens(const Address& caller, ledger::Balance&& balance,
                         int64_t duration, Timestamp now);
    
    /**
     * Mint the reward for a matured stake to its owner.
     * The stake and its principal stay in place. Emits RewardClaimed.
     *
     * @return Reward paid (may be zero)
     * @throws LedgerError NotFound, Unauthorized, AlreadyClaimed, StakeNotMatured
     */
    Amount ClaimRewards(const Address& caller, const ObjectId& stakeId, Timestamp now);
    
    /**
     * Destroy a matured stake and return its principal to the owner.
     * Independent of ClaimRewards; once unstaked the id is gone for good.
     *
     * @return Principal released
     * @throws LedgerError NotFound, Unauthorized, StakeNotMatured
     */
    Amount Unstake(const Address& caller, const ObjectId& stakeId, Timestamp now);
    
    // ========================================================================
    // Queries
    // ========================================================================
    
    StakingPool GetPool() const;
    std::optional<StakeInfo> GetStake(const ObjectId& id) const;
    std::vector<StakeInfo> ListStakes() const;
    std::vector<StakeInfo> ListStakesByOwner(const Address& owner) const;
    
    /// Sum of amounts over live stakes
    Amount SumLiveStakes() const;
    
    /// pool.totalStaked == SumLiveStakes()
    bool CheckConservation() const;
    
    uint64_t GetSequence() const;
    
    // ========================================================================
    // Persistence
    // ========================================================================
    
    void Restore(const StakingPool& pool, std::vector<Stake>&& stakes, uint64_t sequence);

private:
    Stake& FindOwned(const Address& caller, const ObjectId& stakeId);
    
    ledger::TokenLedger& tokens_;
    ledger::EventLog& events_;
    
    mutable std::mutex mutex_;
    StakingPool pool_;
    std::map<ObjectId, Stake> stakes_;
    uint64_t sequence_{0};
};

} // namespace staking
} // namespace amoca

#endif // AMOCA_STAKING_STAKING_H
