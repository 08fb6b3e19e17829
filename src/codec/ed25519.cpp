#include "codec/ed25519.hpp"

#include <algorithm>
#include <memory>
#include <openssl/evp.h>
#include <openssl/rand.h>

namespace nexus::codec {

using core::errors::NexusError;
using core::errors::ErrorCategory;

namespace {

struct PkeyDeleter {
    void operator()(EVP_PKEY* key) const { EVP_PKEY_free(key); }
};

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;
using MdCtxPtr = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

// Small-order point encodings, compared with the sign bit cleared.
constexpr std::uint8_t kSmallOrderPoints[][32] = {
    // 0 (order 4)
    {0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
     0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
     0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00},
    // 1 (order 1)
    {0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
     0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00,
     0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00},
    // order 8
    {0x26, 0xe8, 0x95, 0x8f, 0xc2, 0xb2, 0x27, 0xb0, 0x45, 0xc3, 0xf4,
     0x89, 0xf2, 0xef, 0x98, 0xf0, 0xd5, 0xdf, 0xac, 0x05, 0xd3, 0xc6,
     0x33, 0x39, 0xb1, 0x38, 0x02, 0x88, 0x6d, 0x53, 0xfc, 0x05},
    // order 8
    {0xc7, 0x17, 0x6a, 0x70, 0x3d, 0x4d, 0xd8, 0x4f, 0xba, 0x3c, 0x0b,
     0x76, 0x0d, 0x10, 0x67, 0x0f, 0x2a, 0x20, 0x53, 0xfa, 0x2c, 0x39,
     0xcc, 0xc6, 0x4e, 0xc7, 0xfd, 0x77, 0x92, 0xac, 0x03, 0x7a},
    // p - 1 (order 2)
    {0xec, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
    // p (non-canonical 0)
    {0xed, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
    // p + 1 (non-canonical 1)
    {0xee, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
     0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0x7f},
};

bool has_small_order(const std::uint8_t* point) {
    for (const auto& candidate : kSmallOrderPoints) {
        if (std::equal(candidate, candidate + 31, point) &&
            candidate[31] == (point[31] & 0x7f)) {
            return true;
        }
    }
    return false;
}

NexusError crypto_failure(const std::string& what) {
    return NexusError{ErrorCategory::Internal, "OpenSSL: " + what,
                      "crypto_backend_failure"};
}

}  // namespace

VerifyingKey::VerifyingKey(const Ed25519PublicKey& bytes) : bytes_(bytes) {}

core::errors::Result<VerifyingKey> VerifyingKey::from_bytes(const Bytes& bytes) {
    if (bytes.size() != 32) {
        return NexusError{ErrorCategory::Keys,
                          "Ed25519 public key must be 32 bytes, got " +
                              std::to_string(bytes.size()) + ".",
                          "invalid_length"};
    }
    Ed25519PublicKey raw{};
    std::copy(bytes.begin(), bytes.end(), raw.begin());
    return VerifyingKey(raw);
}

bool VerifyingKey::is_weak() const {
    return has_small_order(bytes_.data());
}

bool VerifyingKey::verify_strict(const std::uint8_t* message, const std::size_t size,
                                 const Ed25519Signature& signature) const {
    if (is_weak() || has_small_order(signature.data())) {
        return false;
    }

    PkeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr,
                                            bytes_.data(), bytes_.size()));
    if (!key) {
        return false;
    }
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return false;
    }
    if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return false;
    }
    // libcrypto rejects S >= L and undecodable points itself.
    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message,
                            size) == 1;
}

bool VerifyingKey::verify_strict(const Bytes& message,
                                 const Ed25519Signature& signature) const {
    return verify_strict(message.data(), message.size(), signature);
}

SigningKey::SigningKey(const Ed25519Seed& seed, const VerifyingKey& verifying_key)
    : seed_(seed), verifying_key_(verifying_key) {}

core::errors::Result<SigningKey> SigningKey::from_seed(const Ed25519Seed& seed) {
    PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                             seed.data(), seed.size()));
    if (!key) {
        return crypto_failure("unable to load Ed25519 private key");
    }

    Ed25519PublicKey public_key{};
    std::size_t public_len = public_key.size();
    if (EVP_PKEY_get_raw_public_key(key.get(), public_key.data(), &public_len) != 1 ||
        public_len != public_key.size()) {
        return crypto_failure("unable to derive Ed25519 public key");
    }
    return SigningKey(seed, VerifyingKey(public_key));
}

core::errors::Result<SigningKey> SigningKey::from_bytes(const Bytes& seed) {
    if (seed.size() != 32) {
        return NexusError{ErrorCategory::Keys,
                          "Ed25519 seed must be 32 bytes, got " +
                              std::to_string(seed.size()) + ".",
                          "invalid_length"};
    }
    Ed25519Seed raw{};
    std::copy(seed.begin(), seed.end(), raw.begin());
    return from_seed(raw);
}

core::errors::Result<SigningKey> SigningKey::generate() {
    auto seed = random_bytes(32);
    if (core::errors::is_error(seed)) {
        return core::errors::get_error(seed);
    }
    return from_bytes(core::errors::get_value(seed));
}

core::errors::Result<Ed25519Signature> SigningKey::sign(const std::uint8_t* message,
                                                        const std::size_t size) const {
    PkeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                             seed_.data(), seed_.size()));
    if (!key) {
        return crypto_failure("unable to load Ed25519 private key");
    }
    MdCtxPtr ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return crypto_failure("unable to allocate digest context");
    }
    if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
        return crypto_failure("unable to initialise Ed25519 signing");
    }

    Ed25519Signature signature{};
    std::size_t signature_len = signature.size();
    if (EVP_DigestSign(ctx.get(), signature.data(), &signature_len, message, size) != 1 ||
        signature_len != signature.size()) {
        return crypto_failure("Ed25519 signing failed");
    }
    return signature;
}

core::errors::Result<Ed25519Signature> SigningKey::sign(const Bytes& message) const {
    return sign(message.data(), message.size());
}

core::errors::Result<Bytes> random_bytes(const std::size_t size) {
    Bytes out(size);
    if (size > 0 && RAND_bytes(out.data(), static_cast<int>(size)) != 1) {
        return crypto_failure("RAND_bytes failed");
    }
    return out;
}

}  // namespace nexus::codec
