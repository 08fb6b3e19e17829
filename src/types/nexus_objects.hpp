#pragma once

#include <nlohmann/json.hpp>
#include "codec/address.hpp"
#include "core/errors/nexus_errors.hpp"
#include "ledger/ledger_types.hpp"

namespace nexus::types {

// Where a Nexus deployment lives. Shared object refs carry the initial
// shared version in `version`.
struct NexusObjects {
    codec::Address workflow_pkg_id;
    codec::Address primitives_pkg_id;
    codec::Address interface_pkg_id;
    codec::Address network_id;
    ledger::ObjectRef tool_registry;
    ledger::ObjectRef default_tap;
    ledger::ObjectRef gas_service;
    ledger::ObjectRef pre_key_vault;
    ledger::ObjectRef network_auth;

    bool is_nexus_package(const codec::Address& package) const {
        return package == workflow_pkg_id || package == primitives_pkg_id ||
               package == interface_pkg_id;
    }
};

// Failures are Ledger/configuration errors naming the field.
core::errors::Result<NexusObjects> nexus_objects_from_json(const nlohmann::json& value);
nlohmann::json to_json(const NexusObjects& objects);

}  // namespace nexus::types
