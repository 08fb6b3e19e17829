#include "codec/address.hpp"

#include <algorithm>
#include "codec/hex.hpp"

namespace nexus::codec {

using core::errors::NexusError;
using core::errors::ErrorCategory;

core::errors::Result<Address> Address::from_hex(const std::string& text) {
    std::string digits = text;
    if (digits.size() >= 2 && digits[0] == '0' && (digits[1] == 'x' || digits[1] == 'X')) {
        digits = digits.substr(2);
    }
    if (digits.empty() || digits.size() > 64) {
        return NexusError{ErrorCategory::Input,
                          "Address must have between 1 and 64 hex digits: '" + text + "'.",
                          "invalid_address"};
    }
    digits.insert(0, 64 - digits.size(), '0');

    auto decoded = hex_decode(digits);
    if (core::errors::is_error(decoded)) {
        return NexusError{ErrorCategory::Input,
                          "Address is not valid hex: '" + text + "'.",
                          "invalid_address"};
    }

    Address address;
    const auto& raw = core::errors::get_value(decoded);
    std::copy(raw.begin(), raw.end(), address.bytes.begin());
    return address;
}

Address Address::from_u64(std::uint64_t value) {
    Address address;
    for (int i = 31; i >= 24; --i) {
        address.bytes[static_cast<std::size_t>(i)] = static_cast<std::uint8_t>(value & 0xff);
        value >>= 8;
    }
    return address;
}

std::string Address::to_hex() const {
    return "0x" + hex_encode(bytes.data(), bytes.size());
}

}  // namespace nexus::codec
