#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "codec/address.hpp"
#include "core/errors/nexus_errors.hpp"

namespace nexus::codec {

// 64-bit integers cross the ledger boundary as decimal strings.
core::errors::Result<std::uint64_t> parse_stringified_u64(const std::string& text);
std::string serialize_stringified_u64(std::uint64_t value);

// Non-negative JSON integer. Literals built in code are stored signed, text
// parsed from a document is stored unsigned; both are accepted.
bool is_json_u64(const nlohmann::json& value);

// Field readers over JSON objects. Errors carry code "malformed_payload" and
// name the offending field.
core::errors::Result<std::uint64_t> read_u64(const nlohmann::json& object,
                                             const std::string& field);
core::errors::Result<std::optional<std::uint64_t>> read_optional_u64(
    const nlohmann::json& object, const std::string& field);
core::errors::Result<std::string> read_string(const nlohmann::json& object,
                                              const std::string& field);
core::errors::Result<bool> read_bool(const nlohmann::json& object,
                                     const std::string& field);
core::errors::Result<Address> read_address(const nlohmann::json& object,
                                           const std::string& field);
// Byte vectors arrive as arrays of numbers.
core::errors::Result<std::vector<std::uint8_t>> read_byte_array(
    const nlohmann::json& object, const std::string& field);

nlohmann::json u64_to_json(std::uint64_t value);
nlohmann::json optional_u64_to_json(const std::optional<std::uint64_t>& value);

}  // namespace nexus::codec
