// AMOCA - Ledger Error Taxonomy
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// Every rejected state transition carries exactly one ErrorCode. Engines
// raise LedgerError; the executor turns it into a failed TxResult.

#ifndef AMOCA_CORE_ERROR_H
#define AMOCA_CORE_ERROR_H

#include <amoca/core/types.h>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace amoca {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode : uint8_t {
    OK = 0,
    
    /// Capability or ownership check failed
    Unauthorized,
    
    /// Requested stake duration is below the pool minimum
    InvalidDuration,
    
    /// Stake reward was already paid out
    AlreadyClaimed,
    
    /// Stake end time has not been reached
    StakeNotMatured,
    
    /// Vote submitted outside [start_time, end_time]
    VotingClosed,
    
    /// Proposal has been executed and no longer accepts votes
    ProposalAlreadyExecuted,
    
    /// Result would exceed the representable range
    ArithmeticOverflow,
    
    /// Result would go negative
    ArithmeticUnderflow,
    
    /// Account does not hold the requested amount
    InsufficientBalance,
    
    /// Referenced record does not exist (or was consumed)
    NotFound,
    
    /// Transaction signature does not match the sender key
    InvalidSignature,
    
    /// Transaction nonce is not the sender's next nonce
    InvalidNonce,
    
    /// Malformed request parameter
    InvalidArgument,
};

/// Stable identifier ("DurationTooShort", "AlreadyClaimed", ...)
const char* ErrorCodeToString(ErrorCode code);

/// Human readable description
const char* ErrorCodeDescription(ErrorCode code);

// ============================================================================
// LedgerError
// ============================================================================

/// Raised by engines when a guard condition fails. No state has been
/// mutated at the point it is thrown.
class LedgerError : public std::runtime_error {
public:
    explicit LedgerError(ErrorCode code);
    LedgerError(ErrorCode code, const std::string& detail);
    
    ErrorCode Code() const noexcept { return code_; }

private:
    ErrorCode code_;
};

// ============================================================================
// Checked Arithmetic
// ============================================================================

/// a + b, throws ArithmeticOverflow instead of wrapping
Amount CheckedAdd(Amount a, Amount b);

/// a - b, throws ArithmeticUnderflow when b > a
Amount CheckedSub(Amount a, Amount b);

/// a * b, throws ArithmeticOverflow instead of wrapping
Amount CheckedMul(Amount a, Amount b);

/// t + seconds for non-negative offsets, throws ArithmeticOverflow
Timestamp CheckedTimeAdd(Timestamp t, int64_t seconds);

} // namespace amoca

#endif // AMOCA_CORE_ERROR_H
