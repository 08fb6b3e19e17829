#pragma once

#include <string>
#include "codec/bytes.hpp"
#include "core/errors/nexus_errors.hpp"

namespace nexus::codec {

// URL-safe alphabet, no padding. Used for every signed-HTTP header.
std::string base64url_encode_no_pad(const Bytes& bytes);

// Strict inverse of base64url_encode_no_pad: rejects padding, characters
// outside the URL-safe alphabet, impossible lengths and non-zero trailing
// bits. Fails with invalid_base64.
core::errors::Result<Bytes> base64url_decode_no_pad(const std::string& text);

// Lenient decoder for key material: standard or URL-safe alphabet, padded
// or not.
core::errors::Result<Bytes> base64_decode_any(const std::string& text);

}  // namespace nexus::codec
