// AMOCA - Ledger Clock
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// Injected source of "now" for every time-gated rule.

#ifndef AMOCA_LEDGER_CLOCK_H
#define AMOCA_LEDGER_CLOCK_H

#include <amoca/core/types.h>

#include <mutex>

namespace amoca {
namespace ledger {

/// Monotonic epoch source in seconds
class Clock {
public:
    virtual ~Clock() = default;
    
    /// Current ledger time; never smaller than a value previously returned
    virtual Timestamp Now() = 0;
};

/**
 * Wall clock backed by util::GetTime().
 *
 * Honors the process mock time, and never goes backwards: if the system
 * clock steps back, the last returned value is repeated.
 */
class SystemClock : public Clock {
public:
    /// @param floor Lowest value ever returned (e.g. the last committed time)
    explicit SystemClock(Timestamp floor = 0) : last_(floor) {}
    
    Timestamp Now() override;

private:
    std::mutex mutex_;
    Timestamp last_;
};

/// Explicitly driven clock for tests and replays
class ManualClock : public Clock {
public:
    explicit ManualClock(Timestamp start = 0) : now_(start) {}
    
    Timestamp Now() override;
    
    /// Move to an absolute time; throws LedgerError(InvalidArgument) if t < Now()
    void Set(Timestamp t);
    
    /// Move forward; throws LedgerError(InvalidArgument) if seconds < 0
    void Advance(int64_t seconds);

private:
    std::mutex mutex_;
    Timestamp now_;
};

} // namespace ledger
} // namespace amoca

#endif // AMOCA_LEDGER_CLOCK_H
