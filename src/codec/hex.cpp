#include "codec/hex.hpp"

namespace nexus::codec {

using core::errors::NexusError;
using core::errors::ErrorCategory;

namespace {

int nibble(const char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

}  // namespace

std::string hex_encode(const std::uint8_t* data, const std::size_t size) {
    static constexpr char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (std::size_t i = 0; i < size; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0f]);
    }
    return out;
}

std::string hex_encode(const Bytes& bytes) {
    return hex_encode(bytes.data(), bytes.size());
}

core::errors::Result<Bytes> hex_decode(const std::string& text) {
    std::size_t offset = 0;
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        offset = 2;
    }

    const std::size_t digits = text.size() - offset;
    if (digits % 2 != 0) {
        return NexusError{ErrorCategory::Input,
                          "Hex string has an odd number of digits.",
                          "invalid_hex"};
    }

    Bytes out;
    out.reserve(digits / 2);
    for (std::size_t i = offset; i < text.size(); i += 2) {
        const int hi = nibble(text[i]);
        const int lo = nibble(text[i + 1]);
        if (hi < 0 || lo < 0) {
            return NexusError{ErrorCategory::Input,
                              "Hex string contains a non-hex character.",
                              "invalid_hex"};
        }
        out.push_back(static_cast<std::uint8_t>((hi << 4) | lo));
    }
    return out;
}

bool is_lower_hex(const std::string& text, const std::size_t expected_length) {
    if (text.size() != expected_length) {
        return false;
    }
    for (const char c : text) {
        const bool digit = c >= '0' && c <= '9';
        const bool lower = c >= 'a' && c <= 'f';
        if (!digit && !lower) {
            return false;
        }
    }
    return true;
}

}  // namespace nexus::codec
