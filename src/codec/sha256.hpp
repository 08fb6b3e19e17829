#pragma once

#include <array>
#include <string>
#include "codec/bytes.hpp"

namespace nexus::codec {

using Sha256Digest = std::array<std::uint8_t, 32>;

Sha256Digest sha256(const std::uint8_t* data, std::size_t size);
Sha256Digest sha256(const Bytes& bytes);
Sha256Digest sha256(const std::string& text);

// 64-char lowercase hex.
std::string sha256_hex(const Bytes& bytes);
std::string sha256_hex(const std::string& text);

}  // namespace nexus::codec
