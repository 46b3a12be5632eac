// AMOCA - Core Types Header
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// Fundamental value and identifier types shared by every ledger module.

#ifndef AMOCA_CORE_TYPES_H
#define AMOCA_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

namespace amoca {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token quantity in base units (never negative)
using Amount = uint64_t;

/// Timestamp (Unix epoch seconds, as supplied by the ledger clock)
using Timestamp = int64_t;

/// Fixed-point precision of the utility token
constexpr int DECIMALS = 9;

/// 1 AMOCA = 10^9 base units
constexpr Amount COIN = 1000000000ULL;

/// Largest representable amount
constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-width opaque identifier
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;
    
    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }
    
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept 
        : data_(data) {}
    
    /// Construct from raw bytes (short input is zero padded)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }
    
    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }
    
    void SetNull() noexcept {
        data_.fill(0);
    }
    
    constexpr size_t size() const noexcept { return SIZE; }
    
    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }
    
    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }
    
    Byte* begin() noexcept { return data_.data(); }
    const Byte* begin() const noexcept { return data_.data(); }
    Byte* end() noexcept { return data_.data() + SIZE; }
    const Byte* end() const noexcept { return data_.data() + SIZE; }
    
    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }
    
    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }
    
    bool operator<(const BaseHash& other) const noexcept {
        return std::memcmp(data_.data(), other.data_.data(), SIZE) < 0;
    }
    
    /// Lowercase hex in storage order
    std::string ToHex() const;
    
    /// Parse hex produced by ToHex(); throws std::invalid_argument
    static BaseHash FromHex(const std::string& hex);
    
    /// Abbreviated form for log lines
    std::string ToShortHex() const { return ToHex().substr(0, 12); }

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& base) noexcept : BaseHash<256>(base) {}
    
    static Hash256 FromHex(const std::string& hex) {
        return Hash256(BaseHash<256>::FromHex(hex));
    }
};

/// 160-bit hash (20 bytes) - for addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& base) noexcept : BaseHash<160>(base) {}
    
    static Hash160 FromHex(const std::string& hex) {
        return Hash160(BaseHash<160>::FromHex(hex));
    }
};

// ============================================================================
// Ledger Identifiers
// ============================================================================

/// Authenticated account identity (derived from a public key)
using Address = Hash160;

/// Stable identifier of a ledger-resident record
using ObjectId = Hash256;

// ============================================================================
// Amount Formatting
// ============================================================================

/// Format base units as a decimal token string ("1.500000000")
std::string FormatAmount(Amount amount);

/// Parse a decimal token string into base units.
/// Accepts up to DECIMALS fractional digits. Returns false on malformed
/// input or when the value does not fit in Amount.
bool ParseAmount(const std::string& str, Amount& out);

} // namespace amoca

#endif // AMOCA_CORE_TYPES_H
