// AMOCA - Record Identifiers
// Copyright (c) 2024 AMOCA Developers
// MIT License

#ifndef AMOCA_LEDGER_OBJECTID_H
#define AMOCA_LEDGER_OBJECTID_H

#include <amoca/core/serialize.h>
#include <amoca/core/types.h>

#include <string>

namespace amoca {
namespace ledger {

/**
 * Derive a record id as SHA256(tag || body || sequence).
 *
 * Each record family owns its tag and a strictly increasing sequence, so ids
 * are never reused, including after the record is destroyed.
 */
ObjectId DeriveObjectId(const std::string& tag, const DataStream& body, uint64_t sequence);

} // namespace ledger
} // namespace amoca

#endif // AMOCA_LEDGER_OBJECTID_H
