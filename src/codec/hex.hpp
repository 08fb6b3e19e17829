#pragma once

#include <string>
#include "codec/bytes.hpp"
#include "core/errors/nexus_errors.hpp"

namespace nexus::codec {

// Lowercase, no prefix.
std::string hex_encode(const std::uint8_t* data, std::size_t size);
std::string hex_encode(const Bytes& bytes);

// Accepts an optional "0x" prefix and either case. Fails with invalid_hex.
core::errors::Result<Bytes> hex_decode(const std::string& text);

bool is_lower_hex(const std::string& text, std::size_t expected_length);

}  // namespace nexus::codec
