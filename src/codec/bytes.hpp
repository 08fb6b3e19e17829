#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace nexus::codec {

using Bytes = std::vector<std::uint8_t>;

inline Bytes to_bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

inline std::string to_string(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

}  // namespace nexus::codec
