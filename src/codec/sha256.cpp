#include "codec/sha256.hpp"

#include <stdexcept>
#include <openssl/evp.h>
#include "codec/hex.hpp"

namespace nexus::codec {

Sha256Digest sha256(const std::uint8_t* data, const std::size_t size) {
    Sha256Digest out{};
    unsigned int out_len = 0;
    // EVP_Digest only fails on allocation failure inside libcrypto.
    if (EVP_Digest(data, size, out.data(), &out_len, EVP_sha256(), nullptr) != 1 ||
        out_len != out.size()) {
        throw std::runtime_error("OpenSSL: SHA-256 digest failed");
    }
    return out;
}

Sha256Digest sha256(const Bytes& bytes) {
    return sha256(bytes.data(), bytes.size());
}

Sha256Digest sha256(const std::string& text) {
    return sha256(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

std::string sha256_hex(const Bytes& bytes) {
    const auto digest = sha256(bytes);
    return hex_encode(digest.data(), digest.size());
}

std::string sha256_hex(const std::string& text) {
    const auto digest = sha256(text);
    return hex_encode(digest.data(), digest.size());
}

}  // namespace nexus::codec
