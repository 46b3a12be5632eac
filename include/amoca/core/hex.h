// AMOCA - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 AMOCA Developers
// MIT License

#ifndef AMOCA_CORE_HEX_H
#define AMOCA_CORE_HEX_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace amoca {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

/// Convert hex string to bytes; throws std::invalid_argument
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

} // namespace amoca

#endif // AMOCA_CORE_HEX_H
