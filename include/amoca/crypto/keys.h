// AMOCA - Key Management
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// secp256k1 key pairs used to authenticate transaction senders.
// A caller's Address is derived from its compressed public key.

#ifndef AMOCA_CRYPTO_KEYS_H
#define AMOCA_CRYPTO_KEYS_H

#include <amoca/core/types.h>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace amoca {

// ============================================================================
// secp256k1 Constants
// ============================================================================

namespace secp256k1 {
    /// Private key size (32 bytes)
    constexpr size_t PRIVATE_KEY_SIZE = 32;
    
    /// Compressed public key size (33 bytes: 0x02/0x03 + 32 bytes X)
    constexpr size_t COMPRESSED_PUBKEY_SIZE = 33;
    
    /// Uncompressed public key size (65 bytes: 0x04 + X + Y)
    constexpr size_t UNCOMPRESSED_PUBKEY_SIZE = 65;
    
    /// DER encoded ECDSA signature upper bound
    constexpr size_t MAX_SIGNATURE_SIZE = 72;
}

// ============================================================================
// PublicKey
// ============================================================================

/**
 * A secp256k1 public key in SEC1 encoding (compressed or uncompressed).
 */
class PublicKey {
public:
    static constexpr size_t MAX_SIZE = secp256k1::UNCOMPRESSED_PUBKEY_SIZE;
    
    PublicKey() = default;
    explicit PublicKey(const std::vector<uint8_t>& data) : data_(data) {}
    
    /// Check encoding and that the point lies on the curve
    bool IsValid() const;
    
    bool IsCompressed() const { return data_.size() == secp256k1::COMPRESSED_PUBKEY_SIZE; }
    
    size_t size() const { return data_.size(); }
    const std::vector<uint8_t>& GetBytes() const { return data_; }
    
    /// Verify a DER encoded ECDSA signature over a 32-byte digest
    bool Verify(const Hash256& hash, const std::vector<uint8_t>& signature) const;
    
    /// Ledger address: first 20 bytes of SHA256(SHA256(compressed key))
    Address GetAddress() const;
    
    std::string ToHex() const;
    static std::optional<PublicKey> FromHex(const std::string& hex);
    
    bool operator==(const PublicKey& other) const { return data_ == other.data_; }
    bool operator!=(const PublicKey& other) const { return data_ != other.data_; }

private:
    std::vector<uint8_t> data_;
};

// ============================================================================
// PrivateKey
// ============================================================================

/**
 * A secp256k1 secret scalar. Memory is cleared on destruction.
 */
class PrivateKey {
public:
    static constexpr size_t SIZE = secp256k1::PRIVATE_KEY_SIZE;
    
    /// Default constructor - invalid key
    PrivateKey() { data_.fill(0); }
    
    /// Construct from raw 32 bytes; IsValid() reports range check
    explicit PrivateKey(const std::array<uint8_t, SIZE>& data);
    
    ~PrivateKey();
    
    PrivateKey(const PrivateKey& other) = default;
    PrivateKey& operator=(const PrivateKey& other) = default;
    
    /// Generate a fresh key from the OpenSSL CSPRNG
    static PrivateKey Generate();
    
    /// Parse 64 hex characters
    static std::optional<PrivateKey> FromHex(const std::string& hex);
    
    bool IsValid() const { return valid_; }
    
    /// Compressed public key
    PublicKey GetPublicKey() const;
    
    /// DER encoded ECDSA signature, empty on failure
    std::vector<uint8_t> Sign(const Hash256& hash) const;
    
    std::string ToHex() const;

private:
    std::array<uint8_t, SIZE> data_;
    bool valid_{false};
};

} // namespace amoca

#endif // AMOCA_CRYPTO_KEYS_H
