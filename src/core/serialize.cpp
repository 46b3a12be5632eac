// AMOCA - Serialization Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/core/serialize.h>
#include <amoca/core/hex.h>

namespace amoca {

std::string DataStream::ToHex() const {
    return BytesToHex(data(), size());
}

} // namespace amoca
