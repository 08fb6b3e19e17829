#include "codec/base64.hpp"

#include <utility>
#include <openssl/evp.h>

namespace nexus::codec {

using core::errors::NexusError;
using core::errors::ErrorCategory;

namespace {

int url_value(const char c) {
    if (c >= 'A' && c <= 'Z') {
        return c - 'A';
    }
    if (c >= 'a' && c <= 'z') {
        return c - 'a' + 26;
    }
    if (c >= '0' && c <= '9') {
        return c - '0' + 52;
    }
    if (c == '-') {
        return 62;
    }
    if (c == '_') {
        return 63;
    }
    return -1;
}

NexusError invalid_base64(const std::string& reason) {
    return NexusError{ErrorCategory::Input, "Invalid base64: " + reason,
                      "invalid_base64"};
}

// Decodes unpadded standard-alphabet text whose length is not 1 mod 4.
core::errors::Result<Bytes> decode_standard_unpadded(std::string text) {
    if (text.empty()) {
        return Bytes{};
    }

    const std::size_t remainder = text.size() % 4;
    std::size_t pad = 0;
    if (remainder == 2) {
        pad = 2;
    } else if (remainder == 3) {
        pad = 1;
    }
    text.append(pad, '=');

    Bytes out(text.size() / 4 * 3);
    const int written = EVP_DecodeBlock(
        out.data(), reinterpret_cast<const unsigned char*>(text.data()),
        static_cast<int>(text.size()));
    if (written < 0) {
        return invalid_base64("decoder rejected input");
    }
    out.resize(static_cast<std::size_t>(written) - pad);
    return out;
}

}  // namespace

std::string base64url_encode_no_pad(const Bytes& bytes) {
    if (bytes.empty()) {
        return "";
    }

    std::string encoded(4 * ((bytes.size() + 2) / 3), '\0');
    const int written = EVP_EncodeBlock(
        reinterpret_cast<unsigned char*>(encoded.data()), bytes.data(),
        static_cast<int>(bytes.size()));
    encoded.resize(static_cast<std::size_t>(written));

    while (!encoded.empty() && encoded.back() == '=') {
        encoded.pop_back();
    }
    for (auto& c : encoded) {
        if (c == '+') {
            c = '-';
        } else if (c == '/') {
            c = '_';
        }
    }
    return encoded;
}

core::errors::Result<Bytes> base64url_decode_no_pad(const std::string& text) {
    if (text.size() % 4 == 1) {
        return invalid_base64("impossible length " + std::to_string(text.size()));
    }

    std::string standard = text;
    for (auto& c : standard) {
        if (url_value(c) < 0) {
            return invalid_base64("unexpected character");
        }
        if (c == '-') {
            c = '+';
        } else if (c == '_') {
            c = '/';
        }
    }

    // Canonical encodings leave the unused low bits of the last symbol zero.
    if (!text.empty()) {
        const int last = url_value(text.back());
        const std::size_t remainder = text.size() % 4;
        if ((remainder == 2 && (last & 0x0f) != 0) ||
            (remainder == 3 && (last & 0x03) != 0)) {
            return invalid_base64("non-zero trailing bits");
        }
    }

    return decode_standard_unpadded(std::move(standard));
}

core::errors::Result<Bytes> base64_decode_any(const std::string& text) {
    std::string trimmed = text;
    std::size_t padding = 0;
    while (!trimmed.empty() && trimmed.back() == '=' && padding < 2) {
        trimmed.pop_back();
        ++padding;
    }
    if (padding > 0 && (trimmed.size() + padding) % 4 != 0) {
        return invalid_base64("misplaced padding");
    }
    if (trimmed.size() % 4 == 1) {
        return invalid_base64("impossible length " + std::to_string(text.size()));
    }

    for (auto& c : trimmed) {
        if (c == '-') {
            c = '+';
        } else if (c == '_') {
            c = '/';
        } else if (c != '+' && c != '/' && url_value(c) < 0) {
            return invalid_base64("unexpected character");
        }
    }
    return decode_standard_unpadded(std::move(trimmed));
}

}  // namespace nexus::codec
