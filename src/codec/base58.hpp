#pragma once

#include <string>
#include "codec/bytes.hpp"
#include "core/errors/nexus_errors.hpp"

namespace nexus::codec {

// Bitcoin alphabet, as used for ledger transaction and object digests.
std::string base58_encode(const Bytes& bytes);

// Fails with invalid_base58 on characters outside the alphabet.
core::errors::Result<Bytes> base58_decode(const std::string& text);

// Digests are exactly 32 bytes once decoded.
core::errors::Result<Bytes> decode_digest(const std::string& text);

}  // namespace nexus::codec
