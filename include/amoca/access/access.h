// AMOCA - Access Rights Engine
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// Time-boxed, leveled data access grants. A right is immutable once issued
// and verifying it never consumes it.

#ifndef AMOCA_ACCESS_ACCESS_H
#define AMOCA_ACCESS_ACCESS_H

#include <amoca/core/serialize.h>
#include <amoca/core/types.h>
#include <amoca/ledger/events.h>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace amoca {
namespace access {

/// Upper bound on a data identifier
constexpr size_t MAX_DATA_ID_LENGTH = 256;

/// Ordinal privilege; a higher level includes every lower one
using AccessLevel = uint64_t;

struct DataAccessRight {
    ObjectId id;
    std::string dataId;
    /// Sole address the right verifies for
    Address owner;
    /// Address that issued the grant (informational only)
    Address grantor;
    AccessLevel accessLevel{0};
    /// Last second (inclusive) at which the right verifies
    Timestamp expiration{0};
    
    /**
     * caller == owner && now <= expiration && accessLevel >= required.
     * Pure; returns false instead of failing.
     */
    bool Verify(AccessLevel requiredLevel, const Address& caller, Timestamp now) const noexcept {
        return caller == owner && now <= expiration && accessLevel >= requiredLevel;
    }
};

void Serialize(DataStream& s, const DataAccessRight& right);
void Unserialize(DataStream& s, DataAccessRight& right);

/**
 * Registry of issued rights.
 *
 * Grant performs no issuer check: any caller may grant any level on any
 * data id to anyone.
 */
class AccessRightsEngine {
public:
    explicit AccessRightsEngine(ledger::EventLog& events);
    
    AccessRightsEngine(const AccessRightsEngine&) = delete;
    AccessRightsEngine& operator=(const AccessRightsEngine&) = delete;
    
    /// Issue a right to recipient. Emits DataAccessRightCreated.
    /// @throws LedgerError InvalidArgument if dataId is empty or too long
    ObjectId Grant(const Address& grantor, const std::string& dataId,
                   const Address& recipient, AccessLevel level,
                   Timestamp expiration, Timestamp now);
    
    /// Verify by id; false when the right does not exist
    bool Verify(const ObjectId& rightId, AccessLevel requiredLevel,
                const Address& caller, Timestamp now) const;
    
    std::optional<DataAccessRight> Get(const ObjectId& id) const;
    std::vector<DataAccessRight> ListByOwner(const Address& owner) const;
    std::vector<DataAccessRight> GetAll() const;
    
    uint64_t GetSequence() const;
    
    void Restore(const std::vector<DataAccessRight>& rights, uint64_t sequence);

private:
    ledger::EventLog& events_;
    
    mutable std::mutex mutex_;
    std::map<ObjectId, DataAccessRight> rights_;
    uint64_t sequence_{0};
};

} // namespace access
} // namespace amoca

#endif // AMOCA_ACCESS_ACCESS_H
