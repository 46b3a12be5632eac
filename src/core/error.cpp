// AMOCA - Ledger Error Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/core/error.h>

#include <limits>

namespace amoca {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "OK";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::InvalidDuration: return "DurationTooShort";
        case ErrorCode::AlreadyClaimed: return "AlreadyClaimed";
        case ErrorCode::StakeNotMatured: return "StakeNotMatured";
        case ErrorCode::VotingClosed: return "VotingClosed";
        case ErrorCode::ProposalAlreadyExecuted: return "ProposalAlreadyExecuted";
        case ErrorCode::ArithmeticOverflow: return "ArithmeticOverflow";
        case ErrorCode::ArithmeticUnderflow: return "ArithmeticUnderflow";
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidSignature: return "InvalidSignature";
        case ErrorCode::InvalidNonce: return "InvalidNonce";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        default: return "Unknown";
    }
}

const char* ErrorCodeDescription(ErrorCode code) {
    switch (code) {
        case ErrorCode::OK: return "success";
        case ErrorCode::Unauthorized: return "caller does not hold the required capability or ownership";
        case ErrorCode::InvalidDuration: return "stake duration is below the pool minimum";
        case ErrorCode::AlreadyClaimed: return "stake reward already claimed";
        case ErrorCode::StakeNotMatured: return "stake has not reached its end time";
        case ErrorCode::VotingClosed: return "proposal voting window is closed";
        case ErrorCode::ProposalAlreadyExecuted: return "proposal already executed";
        case ErrorCode::ArithmeticOverflow: return "arithmetic overflow";
        case ErrorCode::ArithmeticUnderflow: return "arithmetic underflow";
        case ErrorCode::InsufficientBalance: return "insufficient balance";
        case ErrorCode::NotFound: return "record not found";
        case ErrorCode::InvalidSignature: return "invalid transaction signature";
        case ErrorCode::InvalidNonce: return "unexpected transaction nonce";
        case ErrorCode::InvalidArgument: return "invalid argument";
        default: return "unknown error";
    }
}

LedgerError::LedgerError(ErrorCode code)
    : std::runtime_error(std::string(ErrorCodeToString(code)) + ": " +
                         ErrorCodeDescription(code))
    , code_(code) {}

LedgerError::LedgerError(ErrorCode code, const std::string& detail)
    : std::runtime_error(std::string(ErrorCodeToString(code)) + ": " + detail)
    , code_(code) {}

Amount CheckedAdd(Amount a, Amount b) {
    if (a > MAX_AMOUNT - b) {
        throw LedgerError(ErrorCode::ArithmeticOverflow);
    }
    return a + b;
}

Amount CheckedSub(Amount a, Amount b) {
    if (b > a) {
        throw LedgerError(ErrorCode::ArithmeticUnderflow);
    }
    return a - b;
}

Amount CheckedMul(Amount a, Amount b) {
    if (a != 0 && b > MAX_AMOUNT / a) {
        throw LedgerError(ErrorCode::ArithmeticOverflow);
    }
    return a * b;
}

Timestamp CheckedTimeAdd(Timestamp t, int64_t seconds) {
    if (seconds < 0) {
        throw LedgerError(ErrorCode::InvalidArgument, "negative time offset");
    }
    if (t > std::numeric_limits<Timestamp>::max() - seconds) {
        throw LedgerError(ErrorCode::ArithmeticOverflow);
    }
    return t + seconds;
}

} // namespace amoca
