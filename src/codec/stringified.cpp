#include "codec/stringified.hpp"

#include <charconv>
#include <system_error>

namespace nexus::codec {

using core::errors::NexusError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

NexusError malformed(const std::string& field, const std::string& reason) {
    return NexusError{ErrorCategory::Event,
                      "Field '" + field + "' " + reason + ".",
                      "malformed_payload"};
}

// Accepts both a bare address string and the {"id": "0x.."} UID shape.
const json* unwrap_uid(const json& value) {
    if (value.is_object() && value.contains("id")) {
        return unwrap_uid(value.at("id"));
    }
    return &value;
}

}  // namespace

core::errors::Result<std::uint64_t> parse_stringified_u64(const std::string& text) {
    if (text.empty()) {
        return NexusError{ErrorCategory::Input, "Empty stringified u64.",
                          "invalid_stringified_u64"};
    }

    std::uint64_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc() || ptr != end) {
        return NexusError{ErrorCategory::Input,
                          "Not a stringified u64: '" + text + "'.",
                          "invalid_stringified_u64"};
    }
    return value;
}

std::string serialize_stringified_u64(const std::uint64_t value) {
    return std::to_string(value);
}

core::errors::Result<std::uint64_t> read_u64(const json& object,
                                             const std::string& field) {
    if (!object.is_object() || !object.contains(field)) {
        return malformed(field, "is missing");
    }
    const auto& value = object.at(field);
    if (!value.is_string()) {
        return malformed(field, "must be a stringified u64");
    }
    auto parsed = parse_stringified_u64(value.get<std::string>());
    if (core::errors::is_error(parsed)) {
        return malformed(field, "is not a stringified u64");
    }
    return core::errors::get_value(parsed);
}

core::errors::Result<std::optional<std::uint64_t>> read_optional_u64(
    const json& object, const std::string& field) {
    if (!object.is_object() || !object.contains(field) || object.at(field).is_null()) {
        return std::optional<std::uint64_t>{};
    }
    auto parsed = read_u64(object, field);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    return std::optional<std::uint64_t>(core::errors::get_value(parsed));
}

core::errors::Result<std::string> read_string(const json& object,
                                              const std::string& field) {
    if (!object.is_object() || !object.contains(field)) {
        return malformed(field, "is missing");
    }
    const auto& value = object.at(field);
    if (!value.is_string()) {
        return malformed(field, "must be a string");
    }
    return value.get<std::string>();
}

core::errors::Result<bool> read_bool(const json& object, const std::string& field) {
    if (!object.is_object() || !object.contains(field)) {
        return malformed(field, "is missing");
    }
    const auto& value = object.at(field);
    if (!value.is_boolean()) {
        return malformed(field, "must be a boolean");
    }
    return value.get<bool>();
}

core::errors::Result<Address> read_address(const json& object,
                                           const std::string& field) {
    if (!object.is_object() || !object.contains(field)) {
        return malformed(field, "is missing");
    }
    const json* value = unwrap_uid(object.at(field));
    if (!value->is_string()) {
        return malformed(field, "must be an address string");
    }
    auto address = Address::from_hex(value->get<std::string>());
    if (core::errors::is_error(address)) {
        return malformed(field, "is not a valid address");
    }
    return core::errors::get_value(address);
}

core::errors::Result<std::vector<std::uint8_t>> read_byte_array(
    const json& object, const std::string& field) {
    if (!object.is_object() || !object.contains(field)) {
        return malformed(field, "is missing");
    }
    const auto& value = object.at(field);
    if (!value.is_array()) {
        return malformed(field, "must be an array of bytes");
    }
    std::vector<std::uint8_t> out;
    out.reserve(value.size());
    for (const auto& item : value) {
        if (!is_json_u64(item) || item.get<std::uint64_t>() > 0xff) {
            return malformed(field, "contains a non-byte element");
        }
        out.push_back(static_cast<std::uint8_t>(item.get<std::uint64_t>()));
    }
    return out;
}

bool is_json_u64(const json& value) {
    if (value.is_number_unsigned()) {
        return true;
    }
    return value.is_number_integer() && value.get<std::int64_t>() >= 0;
}

json u64_to_json(const std::uint64_t value) {
    return serialize_stringified_u64(value);
}

json optional_u64_to_json(const std::optional<std::uint64_t>& value) {
    if (!value.has_value()) {
        return nullptr;
    }
    return serialize_stringified_u64(value.value());
}

}  // namespace nexus::codec
