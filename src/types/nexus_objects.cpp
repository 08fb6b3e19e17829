#include "types/nexus_objects.hpp"

#include <utility>
#include "codec/stringified.hpp"

namespace nexus::types {

using core::errors::NexusError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

NexusError configuration(const std::string& field, const std::string& reason) {
    return NexusError{ErrorCategory::Ledger, "Nexus objects: '" + field + "' " + reason + ".",
                      "configuration"};
}

core::errors::Status read_package(const json& value, const char* field, codec::Address& out) {
    auto parsed = codec::read_address(value, field);
    if (core::errors::is_error(parsed)) {
        return configuration(field, "is missing or not an address");
    }
    out = core::errors::get_value(parsed);
    return core::errors::ok();
}

core::errors::Status read_ref(const json& value, const char* field, ledger::ObjectRef& out) {
    if (!value.contains(field)) {
        return configuration(field, "is missing");
    }
    auto parsed = ledger::object_ref_from_json(value.at(field));
    if (core::errors::is_error(parsed)) {
        return configuration(field, core::errors::get_error(parsed).message);
    }
    out = core::errors::get_value(parsed);
    return core::errors::ok();
}

}  // namespace

core::errors::Result<NexusObjects> nexus_objects_from_json(const json& value) {
    if (!value.is_object()) {
        return configuration("nexus_objects", "must be an object");
    }

    NexusObjects out;
    const std::pair<const char*, codec::Address*> packages[] = {
        {"workflow_pkg_id", &out.workflow_pkg_id},
        {"primitives_pkg_id", &out.primitives_pkg_id},
        {"interface_pkg_id", &out.interface_pkg_id},
        {"network_id", &out.network_id},
    };
    for (const auto& [field, target] : packages) {
        auto status = read_package(value, field, *target);
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }
    }

    const std::pair<const char*, ledger::ObjectRef*> refs[] = {
        {"tool_registry", &out.tool_registry},
        {"default_tap", &out.default_tap},
        {"gas_service", &out.gas_service},
        {"pre_key_vault", &out.pre_key_vault},
        {"network_auth", &out.network_auth},
    };
    for (const auto& [field, target] : refs) {
        auto status = read_ref(value, field, *target);
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }
    }
    return out;
}

json to_json(const NexusObjects& objects) {
    json out;
    out["workflow_pkg_id"] = objects.workflow_pkg_id.to_hex();
    out["primitives_pkg_id"] = objects.primitives_pkg_id.to_hex();
    out["interface_pkg_id"] = objects.interface_pkg_id.to_hex();
    out["network_id"] = objects.network_id.to_hex();
    out["tool_registry"] = ledger::to_json(objects.tool_registry);
    out["default_tap"] = ledger::to_json(objects.default_tap);
    out["gas_service"] = ledger::to_json(objects.gas_service);
    out["pre_key_vault"] = ledger::to_json(objects.pre_key_vault);
    out["network_auth"] = ledger::to_json(objects.network_auth);
    return out;
}

}  // namespace nexus::types
