// AMOCA - Ledger Events Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/ledger/events.h>
#include <amoca/util/time.h>

#include <sstream>
#include <type_traits>

namespace amoca {
namespace ledger {

const char* EventTypeToString(EventType type) {
    switch (type) {
        case EventType::TokensMinted:           return "TokensMinted";
        case EventType::TokensTransferred:      return "TokensTransferred";
        case EventType::TokensBurned:           return "TokensBurned";
        case EventType::StakeCreated:           return "StakeCreated";
        case EventType::RewardClaimed:          return "RewardClaimed";
        case EventType::ProposalCreated:        return "ProposalCreated";
        case EventType::VoteCast:               return "VoteCast";
        case EventType::DataAccessRightCreated: return "DataAccessRightCreated";
    }
    return "Unknown";
}

// ============================================================================
// Formatting
// ============================================================================

namespace {

void Describe(std::ostream& os, const TokensMinted& e) {
    os << "amount=" << FormatAmount(e.amount) << " recipient=" << e.recipient.ToHex();
}

void Describe(std::ostream& os, const TokensTransferred& e) {
    os << "from=" << e.from.ToHex() << " to=" << e.to.ToHex()
       << " amount=" << FormatAmount(e.amount);
}

void Describe(std::ostream& os, const TokensBurned& e) {
    os << "owner=" << e.owner.ToHex() << " amount=" << FormatAmount(e.amount);
}

void Describe(std::ostream& os, const StakeCreated& e) {
    os << "stake=" << e.stakeId.ToHex() << " owner=" << e.owner.ToHex()
       << " amount=" << FormatAmount(e.amount)
       << " start=" << util::FormatISO8601(e.startTime)
       << " end=" << util::FormatISO8601(e.endTime);
}

void Describe(std::ostream& os, const RewardClaimed& e) {
    os << "stake=" << e.stakeId.ToHex() << " owner=" << e.owner.ToHex()
       << " reward=" << FormatAmount(e.reward);
}

void Describe(std::ostream& os, const ProposalCreated& e) {
    os << "proposal=" << e.proposalId.ToHex() << " proposer=" << e.proposer.ToHex()
       << " title=\"" << e.title << "\""
       << " start=" << util::FormatISO8601(e.startTime)
       << " end=" << util::FormatISO8601(e.endTime);
}

void Describe(std::ostream& os, const VoteCast& e) {
    os << "proposal=" << e.proposalId.ToHex() << " voter=" << e.voter.ToHex()
       << " choice=" << governance::VoteChoiceToString(e.choice)
       << " weight=" << e.weight;
}

void Describe(std::ostream& os, const DataAccessRightCreated& e) {
    os << "right=" << e.rightId.ToHex() << " data=\"" << e.dataId << "\""
       << " owner=" << e.owner.ToHex() << " level=" << e.accessLevel
       << " expires=" << util::FormatISO8601(e.expiration);
}

} // namespace

std::string Event::ToString() const {
    std::ostringstream os;
    os << "#" << sequence << " " << util::FormatISO8601(time) << " "
       << EventTypeToString(GetType()) << " ";
    std::visit([&os](const auto& e) { Describe(os, e); }, payload);
    return os.str();
}

// ============================================================================
// Serialization
// ============================================================================

namespace {

void WritePayload(DataStream& s, const TokensMinted& e) {
    s << e.amount << e.recipient;
}
void WritePayload(DataStream& s, const TokensTransferred& e) {
    s << e.from << e.to << e.amount;
}
void WritePayload(DataStream& s, const TokensBurned& e) {
    s << e.owner << e.amount;
}
void WritePayload(DataStream& s, const StakeCreated& e) {
    s << e.stakeId << e.owner << e.amount << e.startTime << e.endTime;
}
void WritePayload(DataStream& s, const RewardClaimed& e) {
    s << e.stakeId << e.owner << e.reward;
}
void WritePayload(DataStream& s, const ProposalCreated& e) {
    s << e.proposalId << e.proposer << e.title << e.startTime << e.endTime;
}
void WritePayload(DataStream& s, const VoteCast& e) {
    s << e.proposalId << e.voter << static_cast<uint8_t>(e.choice) << e.weight;
}
void WritePayload(DataStream& s, const DataAccessRightCreated& e) {
    s << e.rightId << e.dataId << e.owner << e.accessLevel << e.expiration;
}

void ReadPayload(DataStream& s, TokensMinted& e) {
    s >> e.amount >> e.recipient;
}
void ReadPayload(DataStream& s, TokensTransferred& e) {
    s >> e.from >> e.to >> e.amount;
}
void ReadPayload(DataStream& s, TokensBurned& e) {
    s >> e.owner >> e.amount;
}
void ReadPayload(DataStream& s, StakeCreated& e) {
    s >> e.stakeId >> e.owner >> e.amount >> e.startTime >> e.endTime;
}
void ReadPayload(DataStream& s, RewardClaimed& e) {
    s >> e.stakeId >> e.owner >> e.reward;
}
void ReadPayload(DataStream& s, ProposalCreated& e) {
    s >> e.proposalId >> e.proposer >> e.title >> e.startTime >> e.endTime;
}
void ReadPayload(DataStream& s, VoteCast& e) {
    uint8_t choice = 0;
    s >> e.proposalId >> e.voter >> choice >> e.weight;
    if (choice > static_cast<uint8_t>(governance::VoteChoice::No)) {
        throw std::ios_base::failure("unknown vote choice");
    }
    e.choice = static_cast<governance::VoteChoice>(choice);
}
void ReadPayload(DataStream& s, DataAccessRightCreated& e) {
    s >> e.rightId >> e.dataId >> e.owner >> e.accessLevel >> e.expiration;
}

template<typename T>
EventPayload ReadAs(DataStream& s) {
    T e;
    ReadPayload(s, e);
    return e;
}

} // namespace

void Serialize(DataStream& s, const Event& event) {
    s << event.sequence << event.time << static_cast<uint8_t>(event.payload.index());
    std::visit([&s](const auto& e) { WritePayload(s, e); }, event.payload);
}

void Unserialize(DataStream& s, Event& event) {
    uint8_t type = 0;
    s >> event.sequence >> event.time >> type;
    switch (static_cast<EventType>(type)) {
        case EventType::TokensMinted:           event.payload = ReadAs<TokensMinted>(s); break;
        case EventType::TokensTransferred:      event.payload = ReadAs<TokensTransferred>(s); break;
        case EventType::TokensBurned:           event.payload = ReadAs<TokensBurned>(s); break;
        case EventType::StakeCreated:           event.payload = ReadAs<StakeCreated>(s); break;
        case EventType::RewardClaimed:          event.payload = ReadAs<RewardClaimed>(s); break;
        case EventType::ProposalCreated:        event.payload = ReadAs<ProposalCreated>(s); break;
        case EventType::VoteCast:               event.payload = ReadAs<VoteCast>(s); break;
        case EventType::DataAccessRightCreated: event.payload = ReadAs<DataAccessRightCreated>(s); break;
        default:
            throw std::ios_base::failure("unknown event type");
    }
}

// ============================================================================
// Event Log
// ============================================================================

Event EventLog::Append(Timestamp time, EventPayload payload) {
    std::lock_guard<std::mutex> lock(mutex_);
    Event event;
    event.sequence = events_.size();
    event.time = time;
    event.payload = std::move(payload);
    events_.push_back(event);
    return event;
}

size_t EventLog::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

void EventLog::Truncate(size_t size) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (size < events_.size()) {
        events_.resize(size);
    }
}

std::vector<Event> EventLog::Since(uint64_t from) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (from >= events_.size()) {
        return {};
    }
    return std::vector<Event>(events_.begin() + static_cast<std::ptrdiff_t>(from), events_.end());
}

void EventLog::Restore(std::vector<Event> events) {
    std::lock_guard<std::mutex> lock(mutex_);
    events_ = std::move(events);
}

} // namespace ledger
} // namespace amoca
