#include "codec/bcs.hpp"

#include <utility>

namespace nexus::codec {

BcsWriter& BcsWriter::u8(const std::uint8_t value) {
    buffer_.push_back(value);
    return *this;
}

BcsWriter& BcsWriter::u16(const std::uint16_t value) {
    for (int shift = 0; shift < 16; shift += 8) {
        buffer_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xff));
    }
    return *this;
}

BcsWriter& BcsWriter::u32(const std::uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        buffer_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xff));
    }
    return *this;
}

BcsWriter& BcsWriter::u64(const std::uint64_t value) {
    for (int shift = 0; shift < 64; shift += 8) {
        buffer_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xff));
    }
    return *this;
}

BcsWriter& BcsWriter::boolean(const bool value) {
    buffer_.push_back(value ? 1 : 0);
    return *this;
}

BcsWriter& BcsWriter::uleb128(std::uint64_t value) {
    do {
        std::uint8_t byte = static_cast<std::uint8_t>(value & 0x7f);
        value >>= 7;
        if (value != 0) {
            byte |= 0x80;
        }
        buffer_.push_back(byte);
    } while (value != 0);
    return *this;
}

BcsWriter& BcsWriter::fixed(const std::uint8_t* data, const std::size_t size) {
    buffer_.insert(buffer_.end(), data, data + size);
    return *this;
}

BcsWriter& BcsWriter::byte_vector(const Bytes& bytes) {
    uleb128(bytes.size());
    return fixed(bytes.data(), bytes.size());
}

BcsWriter& BcsWriter::string(const std::string& text) {
    uleb128(text.size());
    return fixed(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

BcsWriter& BcsWriter::address(const Address& value) {
    return fixed(value.bytes.data(), value.bytes.size());
}

BcsWriter& BcsWriter::option_u64(const std::optional<std::uint64_t>& value) {
    if (!value.has_value()) {
        return u8(0);
    }
    u8(1);
    return u64(value.value());
}

BcsWriter& BcsWriter::option_byte_vector(const std::optional<Bytes>& value) {
    if (!value.has_value()) {
        return u8(0);
    }
    u8(1);
    return byte_vector(value.value());
}

BcsWriter& BcsWriter::string_vector(const std::vector<std::string>& values) {
    uleb128(values.size());
    for (const auto& value : values) {
        string(value);
    }
    return *this;
}

Bytes bcs_u8(const std::uint8_t value) { return BcsWriter().u8(value).take(); }
Bytes bcs_u64(const std::uint64_t value) { return BcsWriter().u64(value).take(); }
Bytes bcs_bool(const bool value) { return BcsWriter().boolean(value).take(); }
Bytes bcs_string(const std::string& text) { return BcsWriter().string(text).take(); }
Bytes bcs_bytes(const Bytes& bytes) { return BcsWriter().byte_vector(bytes).take(); }
Bytes bcs_address(const Address& value) { return BcsWriter().address(value).take(); }

Bytes bcs_option_u64(const std::optional<std::uint64_t>& value) {
    return BcsWriter().option_u64(value).take();
}

Bytes bcs_option_bytes(const std::optional<Bytes>& value) {
    return BcsWriter().option_byte_vector(value).take();
}

Bytes bcs_string_vector(const std::vector<std::string>& values) {
    return BcsWriter().string_vector(values).take();
}

}  // namespace nexus::codec
