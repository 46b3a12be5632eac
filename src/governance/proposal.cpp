// AMOCA - Governance Records
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/governance/proposal.h>

namespace amoca {
namespace governance {

const char* VoteChoiceToString(VoteChoice choice) {
    switch (choice) {
        case VoteChoice::Yes: return "yes";
        case VoteChoice::No:  return "no";
    }
    return "unknown";
}

std::optional<VoteChoice> VoteChoiceFromString(const std::string& str) {
    if (str == "yes" || str == "y" || str == "1") return VoteChoice::Yes;
    if (str == "no" || str == "n" || str == "0") return VoteChoice::No;
    return std::nullopt;
}

void Serialize(DataStream& s, const Proposal& proposal) {
    s << proposal.id << proposal.title << proposal.description << proposal.proposer
      << proposal.startTime << proposal.endTime
      << proposal.yesVotes << proposal.noVotes << proposal.executed;
}

void Unserialize(DataStream& s, Proposal& proposal) {
    s >> proposal.id >> proposal.title >> proposal.description >> proposal.proposer
      >> proposal.startTime >> proposal.endTime
      >> proposal.yesVotes >> proposal.noVotes >> proposal.executed;
}

} // namespace governance
} // namespace amoca
