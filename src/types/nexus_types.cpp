#include "types/nexus_types.hpp"

#include <charconv>
#include <system_error>
#include "codec/bcs.hpp"
#include "codec/stringified.hpp"

namespace nexus::types {

using core::errors::NexusError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr const char* kInlineTag = "inline";
constexpr const char* kWalrusTag = "walrus";

NexusError malformed(const std::string& reason) {
    return NexusError{ErrorCategory::Event, reason + ".", "malformed_payload"};
}

json bytes_to_json(const codec::Bytes& bytes) {
    json out = json::array();
    for (const auto b : bytes) {
        out.push_back(b);
    }
    return out;
}

core::errors::Result<codec::Bytes> bytes_from_json(const json& value, const std::string& what) {
    if (!value.is_array()) {
        return malformed(what + " must be a byte array");
    }
    codec::Bytes out;
    out.reserve(value.size());
    for (const auto& item : value) {
        if (!codec::is_json_u64(item) || item.get<std::uint64_t>() > 0xff) {
            return malformed(what + " contains a non-byte element");
        }
        out.push_back(static_cast<std::uint8_t>(item.get<std::uint64_t>()));
    }
    return out;
}

core::errors::Result<json> parse_embedded_json(const codec::Bytes& bytes) {
    json parsed = json::parse(bytes.begin(), bytes.end(), nullptr, false);
    if (parsed.is_discarded()) {
        return malformed("NexusData bytes are not valid JSON");
    }
    return parsed;
}

}  // namespace

core::errors::Result<ToolFqn> ToolFqn::parse(const std::string& text) {
    const auto at = text.rfind('@');
    if (at == std::string::npos) {
        return NexusError{ErrorCategory::Input, "Tool FQN '" + text + "' is missing '@version'.",
                          "invalid_tool_fqn"};
    }
    const std::string head = text.substr(0, at);
    const std::string version_text = text.substr(at + 1);
    const auto dot = head.rfind('.');
    if (dot == std::string::npos || dot == 0 || dot + 1 == head.size()) {
        return NexusError{ErrorCategory::Input,
                          "Tool FQN '" + text + "' must look like domain.name@version.",
                          "invalid_tool_fqn"};
    }

    std::uint64_t version = 0;
    const char* begin = version_text.data();
    const char* end = version_text.data() + version_text.size();
    auto [ptr, ec] = std::from_chars(begin, end, version);
    if (version_text.empty() || ec != std::errc() || ptr != end) {
        return NexusError{ErrorCategory::Input,
                          "Tool FQN '" + text + "' has a non-numeric version.",
                          "invalid_tool_fqn"};
    }
    return ToolFqn{head.substr(0, dot), head.substr(dot + 1), version};
}

std::string ToolFqn::to_string() const {
    return domain + "." + name + "@" + std::to_string(version);
}

core::errors::Result<ToolFqn> tool_fqn_from_json(const json& value) {
    if (!value.is_string()) {
        return malformed("Tool FQN must be a string");
    }
    auto parsed = ToolFqn::parse(value.get<std::string>());
    if (core::errors::is_error(parsed)) {
        return malformed(core::errors::get_error(parsed).message);
    }
    return parsed;
}

core::errors::Result<TypeName> type_name_from_json(const json& value) {
    if (value.is_string()) {
        return TypeName{value.get<std::string>()};
    }
    auto name = codec::read_string(value, "name");
    if (core::errors::is_error(name)) {
        return core::errors::get_error(name);
    }
    return TypeName{core::errors::get_value(name)};
}

json to_json(const TypeName& value) {
    return json{{"name", value.name}};
}

core::errors::Result<RuntimeVertex> runtime_vertex_from_json(const json& value) {
    auto variant = codec::read_string(value, "@variant");
    if (core::errors::is_error(variant)) {
        return core::errors::get_error(variant);
    }
    if (!value.contains("vertex")) {
        return malformed("RuntimeVertex is missing 'vertex'");
    }
    auto vertex = type_name_from_json(value.at("vertex"));
    if (core::errors::is_error(vertex)) {
        return core::errors::get_error(vertex);
    }

    RuntimeVertex out;
    out.vertex = core::errors::get_value(vertex);
    const std::string& tag = core::errors::get_value(variant);
    if (tag == "Plain") {
        out.kind = RuntimeVertex::Kind::Plain;
        return out;
    }
    if (tag != "WithIterator") {
        return malformed("Unknown RuntimeVertex variant '" + tag + "'");
    }
    auto iteration = codec::read_u64(value, "iteration");
    if (core::errors::is_error(iteration)) {
        return core::errors::get_error(iteration);
    }
    auto out_of = codec::read_u64(value, "out_of");
    if (core::errors::is_error(out_of)) {
        return core::errors::get_error(out_of);
    }
    out.kind = RuntimeVertex::Kind::WithIterator;
    out.iteration = core::errors::get_value(iteration);
    out.out_of = core::errors::get_value(out_of);
    return out;
}

json to_json(const RuntimeVertex& value) {
    json out;
    if (value.kind == RuntimeVertex::Kind::Plain) {
        out["@variant"] = "Plain";
        out["vertex"] = to_json(value.vertex);
        return out;
    }
    out["@variant"] = "WithIterator";
    out["vertex"] = to_json(value.vertex);
    out["iteration"] = codec::u64_to_json(value.iteration);
    out["out_of"] = codec::u64_to_json(value.out_of);
    return out;
}

core::errors::Result<PolicySymbol> policy_symbol_from_json(const json& value) {
    if (!value.is_object()) {
        return malformed("Policy symbol must be an object");
    }

    PolicySymbol out;
    if (value.contains("variant")) {
        const auto& variant = value.at("variant");
        if (!variant.is_string() || !value.contains("fields") ||
            !value.at("fields").is_object() || !value.at("fields").contains("pos0")) {
            return malformed("Policy symbol enum is missing 'fields.pos0'");
        }
        const json& pos0 = value.at("fields").at("pos0");
        if (variant == "Witness") {
            auto name = codec::read_string(pos0, "name");
            if (core::errors::is_error(name)) {
                return core::errors::get_error(name);
            }
            out.kind = PolicySymbol::Kind::Witness;
            out.witness = core::errors::get_value(name);
            return out;
        }
        if (variant == "Uid") {
            json holder{{"uid", pos0}};
            auto uid = codec::read_address(holder, "uid");
            if (core::errors::is_error(uid)) {
                return core::errors::get_error(uid);
            }
            out.kind = PolicySymbol::Kind::Uid;
            out.uid = core::errors::get_value(uid);
            return out;
        }
        return malformed("Unknown policy symbol variant '" + variant.dump() + "'");
    }

    // Legacy {kind: 0, witness: {name}} / {kind: 1, uid}.
    if (!value.contains("kind") || !codec::is_json_u64(value.at("kind"))) {
        return malformed("Policy symbol has neither 'variant' nor 'kind'");
    }
    const auto kind = value.at("kind").get<std::uint64_t>();
    if (kind == 0 && value.contains("witness") && !value.at("witness").is_null()) {
        auto name = codec::read_string(value.at("witness"), "name");
        if (core::errors::is_error(name)) {
            return core::errors::get_error(name);
        }
        out.kind = PolicySymbol::Kind::Witness;
        out.witness = core::errors::get_value(name);
        return out;
    }
    if (kind == 1 && value.contains("uid") && !value.at("uid").is_null()) {
        auto uid = codec::read_address(value, "uid");
        if (core::errors::is_error(uid)) {
            return core::errors::get_error(uid);
        }
        out.kind = PolicySymbol::Kind::Uid;
        out.uid = core::errors::get_value(uid);
        return out;
    }
    return malformed("Invalid legacy policy symbol representation");
}

json to_json(const PolicySymbol& value) {
    if (value.kind == PolicySymbol::Kind::Witness) {
        return json{{"variant", "Witness"},
                    {"fields", {{"pos0", {{"name", value.witness}}}}}};
    }
    return json{{"variant", "Uid"}, {"fields", {{"pos0", value.uid.to_hex()}}}};
}

core::errors::Result<SharedObjectRef> shared_object_ref_from_json(const json& value) {
    auto id = codec::read_address(value, "id");
    if (core::errors::is_error(id)) {
        return core::errors::get_error(id);
    }
    auto ref_mut = codec::read_bool(value, "ref_mut");
    if (core::errors::is_error(ref_mut)) {
        return core::errors::get_error(ref_mut);
    }
    return SharedObjectRef{core::errors::get_value(id), core::errors::get_value(ref_mut)};
}

json to_json(const SharedObjectRef& value) {
    return json{{"id", value.id.to_hex()}, {"ref_mut", value.ref_mut}};
}

core::errors::Result<NexusData> nexus_data_from_json(const json& value) {
    if (!value.is_object() || !value.contains("storage") || !value.contains("one") ||
        !value.contains("many") || !value.contains("encrypted")) {
        return malformed("NexusData needs storage, one, many and encrypted");
    }
    auto storage = bytes_from_json(value.at("storage"), "NexusData.storage");
    if (core::errors::is_error(storage)) {
        return core::errors::get_error(storage);
    }
    auto one = bytes_from_json(value.at("one"), "NexusData.one");
    if (core::errors::is_error(one)) {
        return core::errors::get_error(one);
    }
    if (!value.at("many").is_array() || !value.at("encrypted").is_boolean()) {
        return malformed("NexusData.many must be an array and encrypted a boolean");
    }

    NexusData out;
    out.encrypted = value.at("encrypted").get<bool>();

    const std::string tag = codec::to_string(core::errors::get_value(storage));
    if (tag == kInlineTag) {
        out.storage = StorageKind::Inline;
    } else if (tag == kWalrusTag) {
        out.storage = StorageKind::Walrus;
    } else {
        return malformed("Unknown NexusData storage '" + tag + "'");
    }

    const codec::Bytes& one_bytes = core::errors::get_value(one);
    if (!one_bytes.empty()) {
        auto parsed = parse_embedded_json(one_bytes);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        out.data = core::errors::take_value(parsed);
        return out;
    }

    out.data = json::array();
    for (const auto& item : value.at("many")) {
        auto bytes = bytes_from_json(item, "NexusData.many[]");
        if (core::errors::is_error(bytes)) {
            return core::errors::get_error(bytes);
        }
        auto parsed = parse_embedded_json(core::errors::get_value(bytes));
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        out.data.push_back(core::errors::take_value(parsed));
    }
    return out;
}

json to_json(const NexusData& value) {
    json out;
    out["storage"] = bytes_to_json(
        codec::to_bytes(value.storage == StorageKind::Inline ? kInlineTag : kWalrusTag));
    out["many"] = json::array();
    if (value.data.is_array()) {
        out["one"] = json::array();
        for (const auto& item : value.data) {
            out["many"].push_back(bytes_to_json(codec::to_bytes(item.dump())));
        }
    } else {
        out["one"] = bytes_to_json(codec::to_bytes(value.data.dump()));
    }
    out["encrypted"] = value.encrypted;
    return out;
}

codec::Bytes nexus_data_to_bcs(const NexusData& value) {
    codec::BcsWriter writer;
    writer.byte_vector(
        codec::to_bytes(value.storage == StorageKind::Inline ? kInlineTag : kWalrusTag));
    if (value.data.is_array()) {
        writer.byte_vector(codec::Bytes{});
        writer.uleb128(value.data.size());
        for (const auto& item : value.data) {
            writer.byte_vector(codec::to_bytes(item.dump()));
        }
    } else {
        writer.byte_vector(codec::to_bytes(value.data.dump()));
        writer.uleb128(0);
    }
    writer.boolean(value.encrypted);
    return writer.take();
}

core::errors::Result<PortsData> ports_data_from_json(const json& value) {
    if (!value.is_object() || !value.contains("contents") || !value.at("contents").is_array()) {
        return malformed("Ports data must be {contents: [...]}");
    }
    PortsData out;
    for (const auto& entry : value.at("contents")) {
        if (!entry.is_object() || !entry.contains("key") || !entry.contains("value")) {
            return malformed("Ports data entry needs key and value");
        }
        auto key = type_name_from_json(entry.at("key"));
        if (core::errors::is_error(key)) {
            return core::errors::get_error(key);
        }
        auto data = nexus_data_from_json(entry.at("value"));
        if (core::errors::is_error(data)) {
            return core::errors::get_error(data);
        }
        out[core::errors::get_value(key).name] = core::errors::take_value(data);
    }
    return out;
}

json ports_data_to_json(const PortsData& value) {
    json contents = json::array();
    for (const auto& [port, data] : value) {
        contents.push_back(json{{"key", to_json(TypeName{port})}, {"value", to_json(data)}});
    }
    return json{{"contents", contents}};
}

}  // namespace nexus::types
