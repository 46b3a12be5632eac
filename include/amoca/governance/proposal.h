// AMOCA - Governance Records
// Copyright (c) 2024 AMOCA Developers
// MIT License

#ifndef AMOCA_GOVERNANCE_PROPOSAL_H
#define AMOCA_GOVERNANCE_PROPOSAL_H

#include <amoca/core/serialize.h>
#include <amoca/core/types.h>

#include <optional>
#include <string>

namespace amoca {
namespace governance {

/// Side a vote is cast for
enum class VoteChoice : uint8_t {
    Yes = 0,
    No = 1,
};

const char* VoteChoiceToString(VoteChoice choice);
std::optional<VoteChoice> VoteChoiceFromString(const std::string& str);

/**
 * Time-boxed governance item.
 *
 * yesVotes and noVotes never decrease. executed exists for a future
 * execution transition; no operation sets it today.
 */
struct Proposal {
    ObjectId id;
    std::string title;
    std::string description;
    Address proposer;
    Timestamp startTime{0};
    Timestamp endTime{0};
    Amount yesVotes{0};
    Amount noVotes{0};
    bool executed{false};
    
    /// start <= now <= end (both bounds inclusive)
    bool IsVotingOpen(Timestamp now) const {
        return now >= startTime && now <= endTime;
    }
    
    Amount TotalVotes() const { return yesVotes + noVotes; }
};

void Serialize(DataStream& s, const Proposal& proposal);
void Unserialize(DataStream& s, Proposal& proposal);

} // namespace governance
} // namespace amoca

#endif // AMOCA_GOVERNANCE_PROPOSAL_H
