// AMOCA - Governance Engine
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// Proposal lifecycle and vote tallying inside a fixed voting window.

#ifndef AMOCA_GOVERNANCE_GOVERNANCE_H
#define AMOCA_GOVERNANCE_GOVERNANCE_H

#include <amoca/core/types.h>
#include <amoca/governance/proposal.h>
#include <amoca/ledger/events.h>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace amoca {
namespace governance {

/// Upper bounds on proposal text
constexpr size_t MAX_TITLE_LENGTH = 256;
constexpr size_t MAX_DESCRIPTION_LENGTH = 16 * 1024;

/**
 * Open governance: anyone may propose and vote.
 *
 * Vote weight is declared by the voter and the same voter may vote any
 * number of times. No operation marks a proposal executed.
 */
class GovernanceEngine {
public:
    explicit GovernanceEngine(ledger::EventLog& events);
    
    GovernanceEngine(const GovernanceEngine&) = delete;
    GovernanceEngine& operator=(const GovernanceEngine&) = delete;
    
    /**
     * Open a proposal voting from now to now + duration inclusive.
     * Emits ProposalCreated.
     *
     * @throws LedgerError InvalidDuration if duration < 0,
     *         InvalidArgument if title or description is too long
     */
    ObjectId CreateProposal(const Address& proposer, const std::string& title,
                            const std::string& description, int64_t duration,
                            Timestamp now);
    
    /**
     * Add weight to one side of the tally. Emits VoteCast.
     *
     * @throws LedgerError NotFound, ProposalAlreadyExecuted, VotingClosed,
     *         ArithmeticOverflow
     */
    void Vote(const Address& voter, const ObjectId& proposalId, VoteChoice choice,
              Amount weight, Timestamp now);
    
    // ========================================================================
    // Queries
    // ========================================================================
    
    std::optional<Proposal> GetProposal(const ObjectId& id) const;
    std::vector<Proposal> ListProposals() const;
    
    /// Proposals whose window contains now
    std::vector<Proposal> ListOpen(Timestamp now) const;
    
    uint64_t GetSequence() const;
    
    void Restore(const std::vector<Proposal>& proposals, uint64_t sequence);

private:
    ledger::EventLog& events_;
    
    mutable std::mutex mutex_;
    std::map<ObjectId, Proposal> proposals_;
    uint64_t sequence_{0};
};

} // namespace governance
} // namespace amoca

#endif // AMOCA_GOVERNANCE_GOVERNANCE_H
