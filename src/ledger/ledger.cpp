// AMOCA - Ledger State Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/ledger/ledger.h>
#include <amoca/core/error.h>
#include <amoca/ledger/objectid.h>
#include <amoca/util/logging.h>
#include <amoca/util/time.h>

namespace amoca {
namespace ledger {

void Serialize(DataStream& s, const GenesisParams& params) {
    s << params.treasury << params.rewardRate << params.minStakeDuration;
}

void Unserialize(DataStream& s, GenesisParams& params) {
    s >> params.treasury >> params.rewardRate >> params.minStakeDuration;
}

Ledger::Ledger(const GenesisParams& params, const staking::StakingPool& pool,
               Timestamp genesisTime)
    : params_(params)
    , genesisTime_(genesisTime)
    , tokens_(gate_, events_)
    , staking_(tokens_, events_, pool)
    , governance_(events_)
    , access_(events_)
    , lastTime_(genesisTime) {}

std::unique_ptr<Ledger> Ledger::Genesis(const GenesisParams& params, Timestamp now) {
    if (params.minStakeDuration < 0) {
        throw LedgerError(ErrorCode::InvalidArgument, "negative minimum stake duration");
    }
    if (params.treasury.IsNull()) {
        throw LedgerError(ErrorCode::InvalidArgument, "treasury address not set");
    }
    
    DataStream body;
    body << params << now;
    
    staking::StakingPool pool;
    pool.id = DeriveObjectId("pool", body, 0);
    pool.rewardRate = params.rewardRate;
    pool.minStakeDuration = params.minStakeDuration;
    
    std::unique_ptr<Ledger> ledger(new Ledger(params, pool, now));
    ledger->gate_.Issue(Capability::Mint, params.treasury);
    ledger->gate_.Issue(Capability::PoolAdmin, params.treasury);
    
    LOG_INFO(util::LogCategory::LEDGER) << "Genesis at " << util::FormatISO8601(now)
                                        << ", treasury " << params.treasury.ToHex()
                                        << ", reward rate " << params.rewardRate << "%"
                                        << ", min stake "
                                        << util::FormatDuration(params.minStakeDuration);
    return ledger;
}

Timestamp Ledger::GetLastTime() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastTime_;
}

void Ledger::SetLastTime(Timestamp time) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (time > lastTime_) {
        lastTime_ = time;
    }
}

uint64_t Ledger::GetNextNonce(const Address& sender) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = nonces_.find(sender);
    return it == nonces_.end() ? 0 : it->second;
}

std::map<Address, uint64_t> Ledger::GetNonces() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nonces_;
}

void Ledger::AdvanceNonce(const Address& sender) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++nonces_[sender];
}

std::optional<AuthorityToken> Ledger::FindAuthority(Capability capability) const {
    for (const auto& token : gate_.GetAll()) {
        if (token.capability == capability) {
            return token;
        }
    }
    return std::nullopt;
}

bool Ledger::CheckSupplyInvariant() const {
    Amount sum = 0;
    for (const auto& [owner, amount] : tokens_.GetAccounts()) {
        sum = CheckedAdd(sum, amount);
    }
    sum = CheckedAdd(sum, staking_.SumLiveStakes());
    return sum == tokens_.TotalSupply();
}

} // namespace ledger
} // namespace amoca
