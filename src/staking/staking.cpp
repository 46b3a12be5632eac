// AMOCA - Staking Engine Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/staking/staking.h>
#include <amoca/core/error.h>
#include <amoca/ledger/objectid.h>
#include <amoca/util/logging.h>
#include <amoca/util/time.h>

#include <limits>

namespace amoca {
namespace staking {

// ============================================================================
// Serialization
// ============================================================================

void Serialize(DataStream& s, const StakingPool& pool) {
    s << pool.id << pool.totalStaked << pool.rewardRate << pool.minStakeDuration;
}

void Unserialize(DataStream& s, StakingPool& pool) {
    s >> pool.id >> pool.totalStaked >> pool.rewardRate >> pool.minStakeDuration;
}

void Serialize(DataStream& s, const StakeInfo& info) {
    s << info.id << info.owner << info.amount << info.startTime << info.endTime << info.claimed;
}

void Unserialize(DataStream& s, StakeInfo& info) {
    s >> info.id >> info.owner >> info.amount >> info.startTime >> info.endTime >> info.claimed;
}

// ============================================================================
// Reward Computation
// ============================================================================

Amount CalculateReward(Amount amount, uint64_t rewardRate, int64_t duration) {
    if (duration < 0) {
        throw LedgerError(ErrorCode::InvalidArgument, "negative stake duration");
    }
    if (amount == 0 || rewardRate == 0 || duration == 0) {
        return 0;
    }
    
    using u128 = unsigned __int128;
    
    // amount * rate always fits; the third factor may not
    u128 product = static_cast<u128>(amount) * static_cast<u128>(rewardRate);
    u128 d = static_cast<u128>(duration);
    if (product > std::numeric_limits<u128>::max() / d) {
        throw LedgerError(ErrorCode::ArithmeticOverflow, "reward product exceeds 128 bits");
    }
    product *= d;
    
    u128 reward = product / (static_cast<u128>(RATE_DENOMINATOR) *
                             static_cast<u128>(util::SECONDS_PER_YEAR));
    if (reward > static_cast<u128>(MAX_AMOUNT)) {
        throw LedgerError(ErrorCode::ArithmeticOverflow, "reward exceeds maximum amount");
    }
    return static_cast<Amount>(reward);
}

// ============================================================================
// Staking Engine
// ============================================================================

StakingEngine::StakingEngine(ledger::TokenLedger& tokens, ledger::EventLog& events,
                             StakingPool pool)
    : tokens_(tokens), events_(events), pool_(pool) {}

ObjectId StakingEngine::StakeTokens(const Address& caller, ledger::Balance&& balance,
                                    int64_t duration, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    if (duration < 0 || duration < pool_.minStakeDuration) {
        throw LedgerError(ErrorCode::InvalidDuration,
                          "duration " + util::FormatDuration(duration) + " below minimum " +
                          util::FormatDuration(pool_.minStakeDuration));
    }
    Timestamp endTime = CheckedTimeAdd(now, duration);
    Amount amount = balance.Value();
    Amount newTotal = CheckedAdd(pool_.totalStaked, amount);
    
    DataStream body;
    body << caller << amount << now << endTime;
    ObjectId id = ledger::DeriveObjectId("stake", body, sequence_);
    
    Stake stake{id, caller, std::move(balance), now, endTime, false};
    stakes_.emplace(id, std::move(stake));
    ++sequence_;
    pool_.totalStaked = newTotal;
    
    events_.Append(now, ledger::StakeCreated{id, caller, amount, now, endTime});
    
    LOG_INFO(util::LogCategory::STAKING) << "Stake " << id.ToShortHex() << " created by "
                                         << caller.ToHex() << ": " << FormatAmount(amount)
                                         << " until " << util::FormatISO8601(endTime);
    return id;
}

Stake& StakingEngine::FindOwned(const Address& caller, const ObjectId& stakeId) {
    auto it = stakes_.find(stakeId);
    if (it == stakes_.end()) {
        throw LedgerError(ErrorCode::NotFound, "stake " + stakeId.ToHex());
    }
    if (it->second.owner != caller) {
        throw LedgerError(ErrorCode::Unauthorized, "caller does not own stake");
    }
    return it->second;
}

Amount StakingEngine::ClaimRewards(const Address& caller, const ObjectId& stakeId,
                                   Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    Stake& stake = FindOwned(caller, stakeId);
    if (stake.claimed) {
        throw LedgerError(ErrorCode::AlreadyClaimed);
    }
    if (now < stake.endTime) {
        throw LedgerError(ErrorCode::StakeNotMatured,
                          "matures at " + util::FormatISO8601(stake.endTime));
    }
    
    Amount reward = CalculateReward(stake.amount.Value(), pool_.rewardRate,
                                    stake.endTime - stake.startTime);
    tokens_.Deposit(stake.owner, tokens_.ProtocolMint(reward));
    stake.claimed = true;
    
    events_.Append(now, ledger::RewardClaimed{stake.id, stake.owner, reward});
    
    LOG_INFO(util::LogCategory::STAKING) << "Stake " << stakeId.ToShortHex()
                                         << " claimed reward " << FormatAmount(reward);
    return reward;
}

Amount StakingEngine::Unstake(const Address& caller, const ObjectId& stakeId, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    Stake& stake = FindOwned(caller, stakeId);
    if (now < stake.endTime) {
        throw LedgerError(ErrorCode::StakeNotMatured,
                          "matures at " + util::FormatISO8601(stake.endTime));
    }
    
    Amount amount = stake.amount.Value();
    Amount newTotal = CheckedSub(pool_.totalStaked, amount);
    
    ledger::Balance principal(std::move(stake.amount));
    Address owner = stake.owner;
    stakes_.erase(stakeId);
    pool_.totalStaked = newTotal;
    tokens_.Deposit(owner, std::move(principal));
    
    LOG_INFO(util::LogCategory::STAKING) << "Stake " << stakeId.ToShortHex()
                                         << " unstaked, released " << FormatAmount(amount)
                                         << " to " << owner.ToHex();
    return amount;
}

// ============================================================================
// Queries
// ============================================================================

StakingPool StakingEngine::GetPool() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pool_;
}

std::optional<StakeInfo> StakingEngine::GetStake(const ObjectId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = stakes_.find(id);
    if (it == stakes_.end()) {
        return std::nullopt;
    }
    return it->second.Info();
}

std::vector<StakeInfo> StakingEngine::ListStakes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StakeInfo> result;
    result.reserve(stakes_.size());
    for (const auto& [id, stake] : stakes_) {
        result.push_back(stake.Info());
    }
    return result;
}

std::vector<StakeInfo> StakingEngine::ListStakesByOwner(const Address& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StakeInfo> result;
    for (const auto& [id, stake] : stakes_) {
        if (stake.owner == owner) {
            result.push_back(stake.Info());
        }
    }
    return result;
}

Amount StakingEngine::SumLiveStakes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Amount sum = 0;
    for (const auto& [id, stake] : stakes_) {
        sum = CheckedAdd(sum, stake.amount.Value());
    }
    return sum;
}

bool StakingEngine::CheckConservation() const {
    return GetPool().totalStaked == SumLiveStakes();
}

uint64_t StakingEngine::GetSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

void StakingEngine::Restore(const StakingPool& pool, std::vector<Stake>&& stakes,
                            uint64_t sequence) {
    std::lock_guard<std::mutex> lock(mutex_);
    pool_ = pool;
    stakes_.clear();
    for (auto& stake : stakes) {
        ObjectId id = stake.id;
        stakes_.emplace(id, std::move(stake));
    }
    sequence_ = sequence;
}

} // namespace staking
} // namespace amoca
