#pragma once

#include <array>
#include <cstdint>
#include "codec/bytes.hpp"
#include "core/errors/nexus_errors.hpp"

namespace nexus::codec {

using Ed25519Seed = std::array<std::uint8_t, 32>;
using Ed25519PublicKey = std::array<std::uint8_t, 32>;
using Ed25519Signature = std::array<std::uint8_t, 64>;

class VerifyingKey {
public:
    explicit VerifyingKey(const Ed25519PublicKey& bytes);

    // Fails with invalid_length unless exactly 32 bytes.
    static core::errors::Result<VerifyingKey> from_bytes(const Bytes& bytes);

    const Ed25519PublicKey& bytes() const { return bytes_; }

    // True for encodings of small-order points, which strict verification
    // never accepts.
    bool is_weak() const;

    // Rejects weak keys, small-order R and non-canonical S.
    bool verify_strict(const std::uint8_t* message, std::size_t size,
                       const Ed25519Signature& signature) const;
    bool verify_strict(const Bytes& message,
                       const Ed25519Signature& signature) const;

    bool operator==(const VerifyingKey& other) const {
        return bytes_ == other.bytes_;
    }
    bool operator!=(const VerifyingKey& other) const { return !(*this == other); }

private:
    Ed25519PublicKey bytes_;
};

class SigningKey {
public:
    static core::errors::Result<SigningKey> from_seed(const Ed25519Seed& seed);
    static core::errors::Result<SigningKey> from_bytes(const Bytes& seed);
    static core::errors::Result<SigningKey> generate();

    const Ed25519Seed& seed() const { return seed_; }
    const VerifyingKey& verifying_key() const { return verifying_key_; }

    core::errors::Result<Ed25519Signature> sign(const std::uint8_t* message,
                                                std::size_t size) const;
    core::errors::Result<Ed25519Signature> sign(const Bytes& message) const;

private:
    SigningKey(const Ed25519Seed& seed, const VerifyingKey& verifying_key);

    Ed25519Seed seed_;
    VerifyingKey verifying_key_;
};

// CSPRNG output from libcrypto.
core::errors::Result<Bytes> random_bytes(std::size_t size);

}  // namespace nexus::codec
