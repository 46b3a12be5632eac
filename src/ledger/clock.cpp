// AMOCA - Ledger Clock Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/ledger/clock.h>
#include <amoca/core/error.h>
#include <amoca/util/time.h>

namespace amoca {
namespace ledger {

Timestamp SystemClock::Now() {
    std::lock_guard<std::mutex> lock(mutex_);
    Timestamp t = util::GetTime();
    if (t > last_) {
        last_ = t;
    }
    return last_;
}

Timestamp ManualClock::Now() {
    std::lock_guard<std::mutex> lock(mutex_);
    return now_;
}

void ManualClock::Set(Timestamp t) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (t < now_) {
        throw LedgerError(ErrorCode::InvalidArgument, "clock cannot move backwards");
    }
    now_ = t;
}

void ManualClock::Advance(int64_t seconds) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = CheckedTimeAdd(now_, seconds);
}

} // namespace ledger
} // namespace amoca
