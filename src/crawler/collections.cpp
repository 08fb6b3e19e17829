#include "crawler/collections.hpp"

namespace nexus::crawler {

codec::Address content_address(const nlohmann::json& object, const std::string& field) {
    auto parsed = codec::read_address(object, field);
    if (core::errors::is_error(parsed)) {
        throw ContentError(core::errors::get_error(parsed).message);
    }
    return core::errors::get_value(parsed);
}

std::uint64_t content_u64(const nlohmann::json& object, const std::string& field) {
    auto parsed = codec::read_u64(object, field);
    if (core::errors::is_error(parsed)) {
        throw ContentError(core::errors::get_error(parsed).message);
    }
    return core::errors::get_value(parsed);
}

std::uint64_t content_index(const nlohmann::json& value) {
    if (codec::is_json_u64(value)) {
        return value.get<std::uint64_t>();
    }
    if (value.is_string()) {
        auto parsed = codec::parse_stringified_u64(value.get<std::string>());
        if (!core::errors::is_error(parsed)) {
            return core::errors::get_value(parsed);
        }
    }
    throw ContentError("Expected a u64, got " + value.dump());
}

void from_json(const nlohmann::json& value, StringifiedU64& out) {
    out.value = content_index(value);
}

CollectionHandle collection_handle_from_json(const nlohmann::json& value) {
    return CollectionHandle{content_address(value, "id"), content_u64(value, "size")};
}

}  // namespace nexus::crawler
