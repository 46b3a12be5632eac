// AMOCA - Governance Engine Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/governance/governance.h>
#include <amoca/core/error.h>
#include <amoca/ledger/objectid.h>
#include <amoca/util/logging.h>
#include <amoca/util/time.h>

namespace amoca {
namespace governance {

GovernanceEngine::GovernanceEngine(ledger::EventLog& events) : events_(events) {}

ObjectId GovernanceEngine::CreateProposal(const Address& proposer, const std::string& title,
                                          const std::string& description, int64_t duration,
                                          Timestamp now) {
    if (duration < 0) {
        throw LedgerError(ErrorCode::InvalidDuration, "negative voting period");
    }
    if (title.size() > MAX_TITLE_LENGTH) {
        throw LedgerError(ErrorCode::InvalidArgument, "title too long");
    }
    if (description.size() > MAX_DESCRIPTION_LENGTH) {
        throw LedgerError(ErrorCode::InvalidArgument, "description too long");
    }
    Timestamp endTime = CheckedTimeAdd(now, duration);
    
    std::lock_guard<std::mutex> lock(mutex_);
    
    DataStream body;
    body << proposer << title << description << now << endTime;
    
    Proposal proposal;
    proposal.id = ledger::DeriveObjectId("proposal", body, sequence_++);
    proposal.title = title;
    proposal.description = description;
    proposal.proposer = proposer;
    proposal.startTime = now;
    proposal.endTime = endTime;
    proposals_[proposal.id] = proposal;
    
    events_.Append(now, ledger::ProposalCreated{proposal.id, proposer, title, now, endTime});
    
    LOG_INFO(util::LogCategory::GOVERNANCE) << "Proposal " << proposal.id.ToShortHex()
                                            << " \"" << title << "\" open until "
                                            << util::FormatISO8601(endTime);
    return proposal.id;
}

void GovernanceEngine::Vote(const Address& voter, const ObjectId& proposalId,
                            VoteChoice choice, Amount weight, Timestamp now) {
    std::lock_guard<std::mutex> lock(mutex_);
    
    auto it = proposals_.find(proposalId);
    if (it == proposals_.end()) {
        throw LedgerError(ErrorCode::NotFound, "proposal " + proposalId.ToHex());
    }
    Proposal& proposal = it->second;
    
    if (proposal.executed) {
        throw LedgerError(ErrorCode::ProposalAlreadyExecuted);
    }
    if (!proposal.IsVotingOpen(now)) {
        throw LedgerError(ErrorCode::VotingClosed,
                          "window " + util::FormatISO8601(proposal.startTime) + " .. " +
                          util::FormatISO8601(proposal.endTime));
    }
    
    if (choice == VoteChoice::Yes) {
        proposal.yesVotes = CheckedAdd(proposal.yesVotes, weight);
    } else {
        proposal.noVotes = CheckedAdd(proposal.noVotes, weight);
    }
    
    events_.Append(now, ledger::VoteCast{proposalId, voter, choice, weight});
    
    LOG_DEBUG(util::LogCategory::GOVERNANCE) << "Vote " << VoteChoiceToString(choice)
                                             << " x" << weight << " on "
                                             << proposalId.ToShortHex() << " by "
                                             << voter.ToHex();
}

std::optional<Proposal> GovernanceEngine::GetProposal(const ObjectId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = proposals_.find(id);
    if (it == proposals_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Proposal> GovernanceEngine::ListProposals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Proposal> result;
    result.reserve(proposals_.size());
    for (const auto& [id, proposal] : proposals_) {
        result.push_back(proposal);
    }
    return result;
}

std::vector<Proposal> GovernanceEngine::ListOpen(Timestamp now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Proposal> result;
    for (const auto& [id, proposal] : proposals_) {
        if (!proposal.executed && proposal.IsVotingOpen(now)) {
            result.push_back(proposal);
        }
    }
    return result;
}

uint64_t GovernanceEngine::GetSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

void GovernanceEngine::Restore(const std::vector<Proposal>& proposals, uint64_t sequence) {
    std::lock_guard<std::mutex> lock(mutex_);
    proposals_.clear();
    for (const auto& proposal : proposals) {
        proposals_[proposal.id] = proposal;
    }
    sequence_ = sequence;
}

} // namespace governance
} // namespace amoca
