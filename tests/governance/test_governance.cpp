// AMOCA - Governance Tests
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <gtest/gtest.h>
#include <amoca/governance/governance.h>
#include <amoca/core/error.h>

#include <functional>

namespace amoca {
namespace governance {
namespace test {

constexpr Timestamp T0 = 1700000000;
constexpr int64_t PERIOD = 3 * 24 * 60 * 60;

// ============================================================================
// Test Fixtures
// ============================================================================

class GovernanceTest : public ::testing::Test {
protected:
    GovernanceTest() : engine_(events_) {}
    
    void SetUp() override {
        proposer_[0] = 0x0A;
        alice_[0] = 0x01;
        bob_[0] = 0x02;
    }
    
    ObjectId Propose(int64_t duration = PERIOD) {
        return engine_.CreateProposal(proposer_, "Raise reward rate",
                                      "Raise the pool rate to 6%", duration, T0);
    }
    
    static ErrorCode CodeOf(const std::function<void()>& fn) {
        try {
            fn();
        } catch (const LedgerError& e) {
            return e.Code();
        }
        return ErrorCode::OK;
    }
    
    ledger::EventLog events_;
    GovernanceEngine engine_;
    Address proposer_;
    Address alice_;
    Address bob_;
};

// ============================================================================
// Vote Choice
// ============================================================================

TEST(VoteChoiceTest, Parsing) {
    EXPECT_EQ(VoteChoiceFromString("yes"), VoteChoice::Yes);
    EXPECT_EQ(VoteChoiceFromString("n"), VoteChoice::No);
    EXPECT_EQ(VoteChoiceFromString("1"), VoteChoice::Yes);
    EXPECT_FALSE(VoteChoiceFromString("abstain").has_value());
    EXPECT_STREQ(VoteChoiceToString(VoteChoice::No), "no");
}

// ============================================================================
// Create Proposal
// ============================================================================

TEST_F(GovernanceTest, CreateProposal) {
    ObjectId id = Propose();
    
    auto proposal = engine_.GetProposal(id);
    ASSERT_TRUE(proposal.has_value());
    EXPECT_EQ(proposal->title, "Raise reward rate");
    EXPECT_EQ(proposal->proposer, proposer_);
    EXPECT_EQ(proposal->startTime, T0);
    EXPECT_EQ(proposal->endTime, T0 + PERIOD);
    EXPECT_EQ(proposal->TotalVotes(), 0u);
    EXPECT_FALSE(proposal->executed);
    
    ASSERT_EQ(events_.Size(), 1u);
    ledger::Event e = events_.GetAll()[0];
    ASSERT_EQ(e.GetType(), ledger::EventType::ProposalCreated);
    EXPECT_EQ(std::get<ledger::ProposalCreated>(e.payload).proposalId, id);
}

TEST_F(GovernanceTest, IdenticalProposalsGetDistinctIds) {
    ObjectId a = Propose();
    ObjectId b = Propose();
    EXPECT_NE(a, b);
    EXPECT_EQ(engine_.ListProposals().size(), 2u);
}

TEST_F(GovernanceTest, NegativeDurationRejected) {
    EXPECT_EQ(CodeOf([this] { Propose(-1); }), ErrorCode::InvalidDuration);
    EXPECT_TRUE(engine_.ListProposals().empty());
}

TEST_F(GovernanceTest, OversizedTextRejected) {
    std::string longTitle(MAX_TITLE_LENGTH + 1, 't');
    EXPECT_EQ(CodeOf([&] { engine_.CreateProposal(proposer_, longTitle, "", PERIOD, T0); }),
              ErrorCode::InvalidArgument);
    
    std::string longBody(MAX_DESCRIPTION_LENGTH + 1, 'd');
    EXPECT_EQ(CodeOf([&] { engine_.CreateProposal(proposer_, "t", longBody, PERIOD, T0); }),
              ErrorCode::InvalidArgument);
    EXPECT_EQ(events_.Size(), 0u);
}

TEST_F(GovernanceTest, ZeroDurationIsSingleInstantWindow) {
    ObjectId id = Propose(0);
    engine_.Vote(alice_, id, VoteChoice::Yes, 1, T0);
    EXPECT_EQ(CodeOf([&] { engine_.Vote(alice_, id, VoteChoice::Yes, 1, T0 + 1); }),
              ErrorCode::VotingClosed);
}

// ============================================================================
// Vote
// ============================================================================

TEST_F(GovernanceTest, VotesAreTallied) {
    ObjectId id = Propose();
    engine_.Vote(alice_, id, VoteChoice::Yes, 10, T0 + 1);
    engine_.Vote(bob_, id, VoteChoice::No, 4, T0 + 2);
    engine_.Vote(bob_, id, VoteChoice::Yes, 1, T0 + 3);
    
    auto proposal = engine_.GetProposal(id);
    EXPECT_EQ(proposal->yesVotes, 11u);
    EXPECT_EQ(proposal->noVotes, 4u);
    EXPECT_EQ(proposal->TotalVotes(), 15u);
    EXPECT_EQ(events_.Size(), 4u);
    
    ledger::Event e = events_.GetAll().back();
    ASSERT_EQ(e.GetType(), ledger::EventType::VoteCast);
    EXPECT_EQ(std::get<ledger::VoteCast>(e.payload).voter, bob_);
}

TEST_F(GovernanceTest, WindowIsInclusive) {
    ObjectId id = Propose();
    engine_.Vote(alice_, id, VoteChoice::Yes, 1, T0);
    engine_.Vote(alice_, id, VoteChoice::Yes, 1, T0 + PERIOD);
    EXPECT_EQ(engine_.GetProposal(id)->yesVotes, 2u);
}

TEST_F(GovernanceTest, VoteAfterEndRejected) {
    ObjectId id = Propose();
    EXPECT_EQ(CodeOf([&] { engine_.Vote(alice_, id, VoteChoice::Yes, 1, T0 + PERIOD + 1); }),
              ErrorCode::VotingClosed);
    EXPECT_EQ(engine_.GetProposal(id)->TotalVotes(), 0u);
    EXPECT_EQ(events_.Size(), 1u);
}

TEST_F(GovernanceTest, VoteBeforeStartRejected) {
    ObjectId id = Propose();
    EXPECT_EQ(CodeOf([&] { engine_.Vote(alice_, id, VoteChoice::No, 1, T0 - 1); }),
              ErrorCode::VotingClosed);
}

TEST_F(GovernanceTest, VoteOnUnknownProposal) {
    ObjectId missing;
    missing[0] = 0x77;
    EXPECT_EQ(CodeOf([&] { engine_.Vote(alice_, missing, VoteChoice::Yes, 1, T0); }),
              ErrorCode::NotFound);
}

TEST_F(GovernanceTest, TallyOrderDoesNotMatter) {
    ledger::EventLog otherEvents;
    GovernanceEngine other(otherEvents);
    ObjectId a = Propose();
    ObjectId b = other.CreateProposal(proposer_, "Raise reward rate",
                                      "Raise the pool rate to 6%", PERIOD, T0);
    
    engine_.Vote(alice_, a, VoteChoice::Yes, 7, T0 + 1);
    engine_.Vote(bob_, a, VoteChoice::No, 3, T0 + 1);
    engine_.Vote(bob_, a, VoteChoice::Yes, 2, T0 + 1);
    
    other.Vote(bob_, b, VoteChoice::Yes, 2, T0 + 1);
    other.Vote(bob_, b, VoteChoice::No, 3, T0 + 1);
    other.Vote(alice_, b, VoteChoice::Yes, 7, T0 + 1);
    
    EXPECT_EQ(engine_.GetProposal(a)->yesVotes, other.GetProposal(b)->yesVotes);
    EXPECT_EQ(engine_.GetProposal(a)->noVotes, other.GetProposal(b)->noVotes);
}

TEST_F(GovernanceTest, TallyOverflowRejected) {
    ObjectId id = Propose();
    engine_.Vote(alice_, id, VoteChoice::Yes, MAX_AMOUNT, T0);
    EXPECT_EQ(CodeOf([&] { engine_.Vote(bob_, id, VoteChoice::Yes, 1, T0); }),
              ErrorCode::ArithmeticOverflow);
    EXPECT_EQ(engine_.GetProposal(id)->yesVotes, MAX_AMOUNT);
    
    engine_.Vote(bob_, id, VoteChoice::No, 1, T0);
    EXPECT_EQ(engine_.GetProposal(id)->noVotes, 1u);
}

TEST_F(GovernanceTest, ExecutedProposalRejectsVotes) {
    ObjectId id = Propose();
    Proposal executed = *engine_.GetProposal(id);
    executed.executed = true;
    engine_.Restore({executed}, engine_.GetSequence());
    
    // Checked before the window, so even an in-window vote reports executed
    EXPECT_EQ(CodeOf([&] { engine_.Vote(alice_, id, VoteChoice::Yes, 1, T0 + 1); }),
              ErrorCode::ProposalAlreadyExecuted);
    EXPECT_EQ(CodeOf([&] { engine_.Vote(alice_, id, VoteChoice::Yes, 1, T0 + PERIOD + 1); }),
              ErrorCode::ProposalAlreadyExecuted);
    EXPECT_TRUE(engine_.ListOpen(T0 + 1).empty());
}

TEST_F(GovernanceTest, ListOpen) {
    ObjectId shortVote = Propose(10);
    ObjectId longVote = Propose(PERIOD);
    
    EXPECT_EQ(engine_.ListOpen(T0 + 5).size(), 2u);
    auto open = engine_.ListOpen(T0 + 11);
    ASSERT_EQ(open.size(), 1u);
    EXPECT_EQ(open[0].id, longVote);
    EXPECT_NE(open[0].id, shortVote);
}

// ============================================================================
// Serialization
// ============================================================================

TEST_F(GovernanceTest, ProposalSerializeRoundTrip) {
    ObjectId id = Propose();
    engine_.Vote(alice_, id, VoteChoice::No, 9, T0);
    Proposal original = *engine_.GetProposal(id);
    
    DataStream s;
    Serialize(s, original);
    Proposal back;
    Unserialize(s, back);
    EXPECT_TRUE(s.empty());
    EXPECT_EQ(back.id, original.id);
    EXPECT_EQ(back.description, original.description);
    EXPECT_EQ(back.noVotes, 9u);
    EXPECT_EQ(back.endTime, original.endTime);
}

} // namespace test
} // namespace governance
} // namespace amoca
