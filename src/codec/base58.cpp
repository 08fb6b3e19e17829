#include "codec/base58.hpp"

namespace nexus::codec {

using core::errors::NexusError;
using core::errors::ErrorCategory;

namespace {

constexpr char kAlphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int digit_value(const char c) {
    for (int i = 0; i < 58; ++i) {
        if (kAlphabet[i] == c) {
            return i;
        }
    }
    return -1;
}

}  // namespace

std::string base58_encode(const Bytes& bytes) {
    std::size_t zeros = 0;
    while (zeros < bytes.size() && bytes[zeros] == 0) {
        ++zeros;
    }

    // Base-58 digits, least significant first.
    std::vector<std::uint8_t> digits;
    for (std::size_t i = zeros; i < bytes.size(); ++i) {
        int carry = bytes[i];
        for (auto& digit : digits) {
            carry += digit * 256;
            digit = static_cast<std::uint8_t>(carry % 58);
            carry /= 58;
        }
        while (carry > 0) {
            digits.push_back(static_cast<std::uint8_t>(carry % 58));
            carry /= 58;
        }
    }

    std::string out(zeros, '1');
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        out.push_back(kAlphabet[*it]);
    }
    return out;
}

core::errors::Result<Bytes> base58_decode(const std::string& text) {
    std::size_t zeros = 0;
    while (zeros < text.size() && text[zeros] == '1') {
        ++zeros;
    }

    // Base-256 bytes, least significant first.
    Bytes bytes;
    for (std::size_t i = zeros; i < text.size(); ++i) {
        int carry = digit_value(text[i]);
        if (carry < 0) {
            return NexusError{ErrorCategory::Input,
                              "Base58 string contains invalid character '" +
                                  std::string(1, text[i]) + "'.",
                              "invalid_base58"};
        }
        for (auto& byte : bytes) {
            carry += byte * 58;
            byte = static_cast<std::uint8_t>(carry & 0xff);
            carry >>= 8;
        }
        while (carry > 0) {
            bytes.push_back(static_cast<std::uint8_t>(carry & 0xff));
            carry >>= 8;
        }
    }

    Bytes out(zeros, 0);
    out.insert(out.end(), bytes.rbegin(), bytes.rend());
    return out;
}

core::errors::Result<Bytes> decode_digest(const std::string& text) {
    auto decoded = base58_decode(text);
    if (core::errors::is_error(decoded)) {
        return decoded;
    }
    if (core::errors::get_value(decoded).size() != 32) {
        return NexusError{ErrorCategory::Input,
                          "Digest '" + text + "' does not decode to 32 bytes.",
                          "invalid_length"};
    }
    return decoded;
}

}  // namespace nexus::codec
