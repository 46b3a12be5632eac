// AMOCA - Key Management Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/crypto/keys.h>
#include <amoca/core/hex.h>
#include <amoca/crypto/sha256.h>

#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/obj_mac.h>

#include <algorithm>
#include <memory>
#include <stdexcept>

namespace amoca {

namespace {

struct EcKeyDeleter {
    void operator()(EC_KEY* key) const { EC_KEY_free(key); }
};
struct EcPointDeleter {
    void operator()(EC_POINT* point) const { EC_POINT_free(point); }
};
struct BignumDeleter {
    void operator()(BIGNUM* bn) const { BN_clear_free(bn); }
};

using EcKeyPtr = std::unique_ptr<EC_KEY, EcKeyDeleter>;
using EcPointPtr = std::unique_ptr<EC_POINT, EcPointDeleter>;
using BignumPtr = std::unique_ptr<BIGNUM, BignumDeleter>;

EcKeyPtr NewCurveKey() {
    return EcKeyPtr(EC_KEY_new_by_curve_name(NID_secp256k1));
}

/// Load a SEC1 encoded point into a fresh key
EcKeyPtr LoadPublicKey(const std::vector<uint8_t>& data) {
    EcKeyPtr key = NewCurveKey();
    if (!key || data.empty()) {
        return nullptr;
    }
    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    EcPointPtr point(EC_POINT_new(group));
    if (!point) {
        return nullptr;
    }
    if (!EC_POINT_oct2point(group, point.get(), data.data(), data.size(), nullptr)) {
        return nullptr;
    }
    if (!EC_KEY_set_public_key(key.get(), point.get())) {
        return nullptr;
    }
    return key;
}

/// Build a key pair from a secret scalar
EcKeyPtr LoadPrivateKey(const std::array<uint8_t, PrivateKey::SIZE>& secret) {
    EcKeyPtr key = NewCurveKey();
    if (!key) {
        return nullptr;
    }
    BignumPtr priv(BN_bin2bn(secret.data(), static_cast<int>(secret.size()), nullptr));
    if (!priv || !EC_KEY_set_private_key(key.get(), priv.get())) {
        return nullptr;
    }
    
    // pubkey = priv * G
    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    EcPointPtr pub(EC_POINT_new(group));
    if (!pub || !EC_POINT_mul(group, pub.get(), priv.get(), nullptr, nullptr, nullptr)) {
        return nullptr;
    }
    if (!EC_KEY_set_public_key(key.get(), pub.get())) {
        return nullptr;
    }
    return key;
}

bool IsValidSecret(const std::array<uint8_t, PrivateKey::SIZE>& secret) {
    EcKeyPtr key = NewCurveKey();
    if (!key) {
        return false;
    }
    BignumPtr priv(BN_bin2bn(secret.data(), static_cast<int>(secret.size()), nullptr));
    BignumPtr order(BN_new());
    if (!priv || !order) {
        return false;
    }
    if (!EC_GROUP_get_order(EC_KEY_get0_group(key.get()), order.get(), nullptr)) {
        return false;
    }
    // 0 < priv < n
    return !BN_is_zero(priv.get()) && BN_cmp(priv.get(), order.get()) < 0;
}

} // namespace

// ============================================================================
// PublicKey Implementation
// ============================================================================

bool PublicKey::IsValid() const {
    if (data_.size() != secp256k1::COMPRESSED_PUBKEY_SIZE &&
        data_.size() != secp256k1::UNCOMPRESSED_PUBKEY_SIZE) {
        return false;
    }
    EcKeyPtr key = LoadPublicKey(data_);
    return key && EC_KEY_check_key(key.get()) == 1;
}

bool PublicKey::Verify(const Hash256& hash, const std::vector<uint8_t>& signature) const {
    if (signature.empty() || signature.size() > secp256k1::MAX_SIGNATURE_SIZE) {
        return false;
    }
    EcKeyPtr key = LoadPublicKey(data_);
    if (!key) {
        return false;
    }
    int result = ECDSA_verify(0, hash.data(), static_cast<int>(hash.size()),
                              signature.data(), static_cast<int>(signature.size()),
                              key.get());
    return result == 1;
}

Address PublicKey::GetAddress() const {
    std::vector<uint8_t> encoded = data_;
    
    // Addresses are always derived from the compressed form
    if (!IsCompressed()) {
        EcKeyPtr key = LoadPublicKey(data_);
        if (!key) {
            return Address();
        }
        const EC_GROUP* group = EC_KEY_get0_group(key.get());
        encoded.assign(secp256k1::COMPRESSED_PUBKEY_SIZE, 0);
        size_t len = EC_POINT_point2oct(group, EC_KEY_get0_public_key(key.get()),
                                        POINT_CONVERSION_COMPRESSED,
                                        encoded.data(), encoded.size(), nullptr);
        if (len != secp256k1::COMPRESSED_PUBKEY_SIZE) {
            return Address();
        }
    }
    
    Hash256 digest = DoubleSHA256(encoded);
    return Address(digest.data(), Address::SIZE);
}

std::string PublicKey::ToHex() const {
    return BytesToHex(data_);
}

std::optional<PublicKey> PublicKey::FromHex(const std::string& hex) {
    if (!IsValidHex(hex)) {
        return std::nullopt;
    }
    PublicKey key(HexToBytes(hex));
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

// ============================================================================
// PrivateKey Implementation
// ============================================================================

PrivateKey::PrivateKey(const std::array<uint8_t, SIZE>& data) : data_(data) {
    valid_ = IsValidSecret(data_);
}

PrivateKey::~PrivateKey() {
    OPENSSL_cleanse(data_.data(), data_.size());
}

PrivateKey PrivateKey::Generate() {
    EcKeyPtr key = NewCurveKey();
    if (!key || EC_KEY_generate_key(key.get()) != 1) {
        throw std::runtime_error("PrivateKey::Generate: EC_KEY_generate_key failed");
    }
    std::array<uint8_t, SIZE> secret;
    if (BN_bn2binpad(EC_KEY_get0_private_key(key.get()), secret.data(),
                     static_cast<int>(secret.size())) != static_cast<int>(SIZE)) {
        throw std::runtime_error("PrivateKey::Generate: BN_bn2binpad failed");
    }
    PrivateKey result(secret);
    OPENSSL_cleanse(secret.data(), secret.size());
    return result;
}

std::optional<PrivateKey> PrivateKey::FromHex(const std::string& hex) {
    if (hex.size() != SIZE * 2 || !IsValidHex(hex)) {
        return std::nullopt;
    }
    std::vector<uint8_t> bytes = HexToBytes(hex);
    std::array<uint8_t, SIZE> secret;
    std::copy(bytes.begin(), bytes.end(), secret.begin());
    PrivateKey key(secret);
    OPENSSL_cleanse(secret.data(), secret.size());
    OPENSSL_cleanse(bytes.data(), bytes.size());
    if (!key.IsValid()) {
        return std::nullopt;
    }
    return key;
}

PublicKey PrivateKey::GetPublicKey() const {
    if (!valid_) {
        return PublicKey();
    }
    EcKeyPtr key = LoadPrivateKey(data_);
    if (!key) {
        return PublicKey();
    }
    const EC_GROUP* group = EC_KEY_get0_group(key.get());
    std::vector<uint8_t> encoded(secp256k1::COMPRESSED_PUBKEY_SIZE);
    size_t len = EC_POINT_point2oct(group, EC_KEY_get0_public_key(key.get()),
                                    POINT_CONVERSION_COMPRESSED,
                                    encoded.data(), encoded.size(), nullptr);
    if (len != encoded.size()) {
        return PublicKey();
    }
    return PublicKey(encoded);
}

std::vector<uint8_t> PrivateKey::Sign(const Hash256& hash) const {
    if (!valid_) {
        return {};
    }
    EcKeyPtr key = LoadPrivateKey(data_);
    if (!key) {
        return {};
    }
    
    unsigned int sigLen = static_cast<unsigned int>(ECDSA_size(key.get()));
    std::vector<uint8_t> signature(sigLen);
    if (!ECDSA_sign(0, hash.data(), static_cast<int>(hash.size()),
                    signature.data(), &sigLen, key.get())) {
        return {};
    }
    signature.resize(sigLen);
    return signature;
}

std::string PrivateKey::ToHex() const {
    return BytesToHex(data_.data(), data_.size());
}

} // namespace amoca
