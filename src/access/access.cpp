// AMOCA - Access Rights Engine Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/access/access.h>
#include <amoca/core/error.h>
#include <amoca/ledger/objectid.h>
#include <amoca/util/logging.h>
#include <amoca/util/time.h>

namespace amoca {
namespace access {

void Serialize(DataStream& s, const DataAccessRight& right) {
    s << right.id << right.dataId << right.owner << right.grantor
      << right.accessLevel << right.expiration;
}

void Unserialize(DataStream& s, DataAccessRight& right) {
    s >> right.id >> right.dataId >> right.owner >> right.grantor
      >> right.accessLevel >> right.expiration;
}

AccessRightsEngine::AccessRightsEngine(ledger::EventLog& events) : events_(events) {}

ObjectId AccessRightsEngine::Grant(const Address& grantor, const std::string& dataId,
                                   const Address& recipient, AccessLevel level,
                                   Timestamp expiration, Timestamp now) {
    if (dataId.empty() || dataId.size() > MAX_DATA_ID_LENGTH) {
        throw LedgerError(ErrorCode::InvalidArgument, "invalid data id");
    }
    
    std::lock_guard<std::mutex> lock(mutex_);
    
    DataStream body;
    body << grantor << dataId << recipient << level << expiration;
    
    DataAccessRight right;
    right.id = ledger::DeriveObjectId("access", body, sequence_++);
    right.dataId = dataId;
    right.owner = recipient;
    right.grantor = grantor;
    right.accessLevel = level;
    right.expiration = expiration;
    rights_[right.id] = right;
    
    events_.Append(now, ledger::DataAccessRightCreated{right.id, dataId, recipient,
                                                       level, expiration});
    
    if (expiration < now) {
        LOG_WARN(util::LogCategory::ACCESS) << "Right " << right.id.ToShortHex()
                                            << " granted already expired";
    }
    LOG_INFO(util::LogCategory::ACCESS) << "Granted level " << level << " on \"" << dataId
                                        << "\" to " << recipient.ToHex() << " until "
                                        << util::FormatISO8601(expiration);
    return right.id;
}

bool AccessRightsEngine::Verify(const ObjectId& rightId, AccessLevel requiredLevel,
                                const Address& caller, Timestamp now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rights_.find(rightId);
    if (it == rights_.end()) {
        return false;
    }
    return it->second.Verify(requiredLevel, caller, now);
}

std::optional<DataAccessRight> AccessRightsEngine::Get(const ObjectId& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = rights_.find(id);
    if (it == rights_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DataAccessRight> AccessRightsEngine::ListByOwner(const Address& owner) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DataAccessRight> result;
    for (const auto& [id, right] : rights_) {
        if (right.owner == owner) {
            result.push_back(right);
        }
    }
    return result;
}

std::vector<DataAccessRight> AccessRightsEngine::GetAll() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DataAccessRight> result;
    result.reserve(rights_.size());
    for (const auto& [id, right] : rights_) {
        result.push_back(right);
    }
    return result;
}

uint64_t AccessRightsEngine::GetSequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

void AccessRightsEngine::Restore(const std::vector<DataAccessRight>& rights, uint64_t sequence) {
    std::lock_guard<std::mutex> lock(mutex_);
    rights_.clear();
    for (const auto& right : rights) {
        rights_[right.id] = right;
    }
    sequence_ = sequence;
}

} // namespace access
} // namespace amoca
