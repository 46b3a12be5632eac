// AMOCA - Ledger Events
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// Records emitted by committed transitions. Aborted transitions leave no
// trace in the log.

#ifndef AMOCA_LEDGER_EVENTS_H
#define AMOCA_LEDGER_EVENTS_H

#include <amoca/core/serialize.h>
#include <amoca/core/types.h>
#include <amoca/governance/proposal.h>

#include <mutex>
#include <string>
#include <variant>
#include <vector>

namespace amoca {
namespace ledger {

// ============================================================================
// Event Payloads
// ============================================================================

struct TokensMinted {
    Amount amount{0};
    Address recipient;
};

struct TokensTransferred {
    Address from;
    Address to;
    Amount amount{0};
};

struct TokensBurned {
    Address owner;
    Amount amount{0};
};

struct StakeCreated {
    ObjectId stakeId;
    Address owner;
    Amount amount{0};
    Timestamp startTime{0};
    Timestamp endTime{0};
};

struct RewardClaimed {
    ObjectId stakeId;
    Address owner;
    Amount reward{0};
};

struct ProposalCreated {
    ObjectId proposalId;
    Address proposer;
    std::string title;
    Timestamp startTime{0};
    Timestamp endTime{0};
};

struct VoteCast {
    ObjectId proposalId;
    Address voter;
    governance::VoteChoice choice{governance::VoteChoice::Yes};
    Amount weight{0};
};

struct DataAccessRightCreated {
    ObjectId rightId;
    std::string dataId;
    Address owner;
    uint64_t accessLevel{0};
    Timestamp expiration{0};
};

using EventPayload = std::variant<
    TokensMinted,
    TokensTransferred,
    TokensBurned,
    StakeCreated,
    RewardClaimed,
    ProposalCreated,
    VoteCast,
    DataAccessRightCreated>;

/// Discriminator, in variant index order
enum class EventType : uint8_t {
    TokensMinted = 0,
    TokensTransferred,
    TokensBurned,
    StakeCreated,
    RewardClaimed,
    ProposalCreated,
    VoteCast,
    DataAccessRightCreated,
};

const char* EventTypeToString(EventType type);

// ============================================================================
// Event
// ============================================================================

struct Event {
    /// Position in the log, starting at 0
    uint64_t sequence{0};
    Timestamp time{0};
    EventPayload payload;
    
    EventType GetType() const { return static_cast<EventType>(payload.index()); }
    
    /// One-line human readable form
    std::string ToString() const;
};

void Serialize(DataStream& s, const Event& event);
void Unserialize(DataStream& s, Event& event);

// ============================================================================
// Event Log
// ============================================================================

/// Append-only (except for rollback of an aborted transition) event record
class EventLog {
public:
    EventLog() = default;
    
    /// Append an event stamped with the next sequence number
    Event Append(Timestamp time, EventPayload payload);
    
    size_t Size() const;
    
    /// Drop events at positions >= size
    void Truncate(size_t size);
    
    /// Events with sequence >= from
    std::vector<Event> Since(uint64_t from) const;
    
    std::vector<Event> GetAll() const { return Since(0); }
    
    /// Replace the log with persisted events (sequences must be 0..n-1)
    void Restore(std::vector<Event> events);

private:
    mutable std::mutex mutex_;
    std::vector<Event> events_;
};

} // namespace ledger
} // namespace amoca

#endif // AMOCA_LEDGER_EVENTS_H
