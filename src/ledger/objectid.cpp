// AMOCA - Record Identifiers
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/ledger/objectid.h>
#include <amoca/crypto/sha256.h>

namespace amoca {
namespace ledger {

ObjectId DeriveObjectId(const std::string& tag, const DataStream& body, uint64_t sequence) {
    DataStream ss;
    ss << tag;
    ss.Write(body.data(), body.size());
    ss << sequence;
    return SHA256Hash(ss.GetBytes());
}

} // namespace ledger
} // namespace amoca
