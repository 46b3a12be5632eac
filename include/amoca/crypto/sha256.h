// AMOCA - SHA256 Hash Function
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// Incremental SHA-256 backed by the OpenSSL EVP digest interface.

#ifndef AMOCA_CRYPTO_SHA256_H
#define AMOCA_CRYPTO_SHA256_H

#include <amoca/core/types.h>

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

// Forward declaration to keep OpenSSL headers out of the public interface
typedef struct evp_md_ctx_st EVP_MD_CTX;

namespace amoca {

/// SHA-256 hasher class
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;
    
    SHA256();
    ~SHA256();
    
    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;
    
    /// Write data to the hasher
    SHA256& Write(const Byte* data, size_t len);
    
    SHA256& Write(const std::string& str) {
        return Write(reinterpret_cast<const Byte*>(str.data()), str.size());
    }
    
    /// Finalize the hash and write OUTPUT_SIZE bytes to output.
    /// The hasher is reset afterwards.
    void Finalize(Byte hash[OUTPUT_SIZE]);
    
    /// Reset hasher to initial state
    SHA256& Reset();

private:
    EVP_MD_CTX* ctx_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// Compute SHA256(SHA256(data))
Hash256 DoubleSHA256(const Byte* data, size_t len);

inline Hash256 DoubleSHA256(const std::vector<Byte>& data) {
    return DoubleSHA256(data.data(), data.size());
}

} // namespace amoca

#endif // AMOCA_CRYPTO_SHA256_H
