#pragma once

#include <cstdint>
#include <optional>
#include <utility>
#include <string>
#include <vector>
#include "codec/address.hpp"
#include "codec/bytes.hpp"

namespace nexus::codec {

// Canonical binary encoding used for pure transaction arguments:
// little-endian fixed-width integers, ULEB128 length prefixes.
class BcsWriter {
public:
    BcsWriter& u8(std::uint8_t value);
    BcsWriter& u16(std::uint16_t value);
    BcsWriter& u32(std::uint32_t value);
    BcsWriter& u64(std::uint64_t value);
    BcsWriter& boolean(bool value);
    BcsWriter& uleb128(std::uint64_t value);
    BcsWriter& fixed(const std::uint8_t* data, std::size_t size);
    BcsWriter& byte_vector(const Bytes& bytes);
    BcsWriter& string(const std::string& text);
    BcsWriter& address(const Address& value);
    BcsWriter& option_u64(const std::optional<std::uint64_t>& value);
    BcsWriter& option_byte_vector(const std::optional<Bytes>& value);
    BcsWriter& string_vector(const std::vector<std::string>& values);

    const Bytes& bytes() const { return buffer_; }
    Bytes take() { return std::move(buffer_); }

private:
    Bytes buffer_;
};

// One-shot encoders for the common pure argument shapes.
Bytes bcs_u8(std::uint8_t value);
Bytes bcs_u64(std::uint64_t value);
Bytes bcs_bool(bool value);
Bytes bcs_string(const std::string& text);
Bytes bcs_bytes(const Bytes& bytes);
Bytes bcs_address(const Address& value);
Bytes bcs_option_u64(const std::optional<std::uint64_t>& value);
Bytes bcs_option_bytes(const std::optional<Bytes>& value);
Bytes bcs_string_vector(const std::vector<std::string>& values);

}  // namespace nexus::codec
