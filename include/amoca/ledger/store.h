// AMOCA - Ledger Persistence
// Copyright (c) 2024 AMOCA Developers
// MIT License

#ifndef AMOCA_LEDGER_STORE_H
#define AMOCA_LEDGER_STORE_H

#include <amoca/db/database.h>
#include <amoca/ledger/ledger.h>

#include <memory>
#include <utility>

namespace amoca {
namespace ledger {

/// Current on-disk layout version
constexpr uint32_t STORE_VERSION = 1;

/**
 * Saves and loads the full ledger state through a Database.
 *
 * Save writes every record in one WriteBatch, deleting keys that no longer
 * have a record (e.g. unstaked stakes), so the stored state always matches a
 * single committed ledger.
 */
class LedgerStore {
public:
    explicit LedgerStore(db::Database& db) : db_(db) {}
    
    /// True if a ledger has been saved
    bool Exists();
    
    db::Status Save(const Ledger& ledger);
    
    /// NotFound if no ledger was saved, Corruption on undecodable records
    std::pair<db::Status, std::unique_ptr<Ledger>> Load();

private:
    db::Database& db_;
};

} // namespace ledger
} // namespace amoca

#endif // AMOCA_LEDGER_STORE_H
