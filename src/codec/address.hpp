#pragma once

#include <array>
#include <cstdint>
#include <string>
#include "core/errors/nexus_errors.hpp"

namespace nexus::codec {

// 32-byte ledger address / object id, rendered as "0x" + 64 lowercase hex.
struct Address {
    std::array<std::uint8_t, 32> bytes{};

    // Accepts an optional 0x prefix and short forms ("0x2"), left-padded.
    static core::errors::Result<Address> from_hex(const std::string& text);
    static Address from_u64(std::uint64_t value);

    std::string to_hex() const;

    bool operator==(const Address& other) const { return bytes == other.bytes; }
    bool operator!=(const Address& other) const { return bytes != other.bytes; }
    bool operator<(const Address& other) const { return bytes < other.bytes; }
};

// Well-known framework addresses.
inline Address framework_address() { return Address::from_u64(0x2); }
inline Address move_stdlib_address() { return Address::from_u64(0x1); }
inline Address clock_object_id() { return Address::from_u64(0x6); }

}  // namespace nexus::codec
