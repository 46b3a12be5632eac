// AMOCA - Ledger Error Tests
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <gtest/gtest.h>
#include <amoca/core/error.h>

#include <functional>
#include <limits>

namespace amoca {
namespace test {

// ============================================================================
// Error Codes
// ============================================================================

TEST(ErrorCodeTest, StableNames) {
    EXPECT_STREQ(ErrorCodeToString(ErrorCode::Unauthorized), "Unauthorized");
    EXPECT_STREQ(ErrorCodeToString(ErrorCode::InvalidDuration), "DurationTooShort");
    EXPECT_STREQ(ErrorCodeToString(ErrorCode::AlreadyClaimed), "AlreadyClaimed");
    EXPECT_STREQ(ErrorCodeToString(ErrorCode::StakeNotMatured), "StakeNotMatured");
    EXPECT_STREQ(ErrorCodeToString(ErrorCode::VotingClosed), "VotingClosed");
    EXPECT_STREQ(ErrorCodeToString(ErrorCode::ProposalAlreadyExecuted),
                 "ProposalAlreadyExecuted");
    EXPECT_STREQ(ErrorCodeToString(ErrorCode::ArithmeticOverflow), "ArithmeticOverflow");
    EXPECT_STREQ(ErrorCodeToString(ErrorCode::NotFound), "NotFound");
}

TEST(LedgerErrorTest, MessageWithoutDetail) {
    LedgerError err(ErrorCode::AlreadyClaimed);
    EXPECT_EQ(err.Code(), ErrorCode::AlreadyClaimed);
    EXPECT_STREQ(err.what(), "AlreadyClaimed: stake reward already claimed");
}

TEST(LedgerErrorTest, MessageWithDetail) {
    LedgerError err(ErrorCode::NotFound, "stake abc");
    EXPECT_EQ(err.Code(), ErrorCode::NotFound);
    EXPECT_STREQ(err.what(), "NotFound: stake abc");
}

TEST(LedgerErrorTest, CaughtAsRuntimeError) {
    try {
        throw LedgerError(ErrorCode::VotingClosed);
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("VotingClosed"), std::string::npos);
        return;
    }
    FAIL() << "LedgerError not caught as runtime_error";
}

// ============================================================================
// Checked Arithmetic
// ============================================================================

namespace {

ErrorCode CodeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const LedgerError& e) {
        return e.Code();
    }
    return ErrorCode::OK;
}

} // namespace

TEST(CheckedMathTest, Add) {
    EXPECT_EQ(CheckedAdd(2, 3), 5u);
    EXPECT_EQ(CheckedAdd(MAX_AMOUNT - 1, 1), MAX_AMOUNT);
    EXPECT_EQ(CodeOf([] { CheckedAdd(MAX_AMOUNT, 1); }), ErrorCode::ArithmeticOverflow);
}

TEST(CheckedMathTest, Sub) {
    EXPECT_EQ(CheckedSub(5, 5), 0u);
    EXPECT_EQ(CodeOf([] { CheckedSub(4, 5); }), ErrorCode::ArithmeticUnderflow);
}

TEST(CheckedMathTest, Mul) {
    EXPECT_EQ(CheckedMul(0, MAX_AMOUNT), 0u);
    EXPECT_EQ(CheckedMul(MAX_AMOUNT, 1), MAX_AMOUNT);
    EXPECT_EQ(CodeOf([] { CheckedMul(MAX_AMOUNT / 2 + 1, 2); }),
              ErrorCode::ArithmeticOverflow);
}

TEST(CheckedMathTest, TimeAdd) {
    EXPECT_EQ(CheckedTimeAdd(100, 0), 100);
    EXPECT_EQ(CheckedTimeAdd(100, 50), 150);
    Timestamp max = std::numeric_limits<Timestamp>::max();
    EXPECT_EQ(CheckedTimeAdd(max - 1, 1), max);
    EXPECT_EQ(CodeOf([max] { CheckedTimeAdd(max, 1); }), ErrorCode::ArithmeticOverflow);
    EXPECT_EQ(CodeOf([] { CheckedTimeAdd(100, -1); }), ErrorCode::InvalidArgument);
}

} // namespace test
} // namespace amoca
