#include "client/network_auth_actions.hpp"

#include "codec/hex.hpp"
#include "codec/stringified.hpp"
#include "core/logging/logger.hpp"
#include "transactions/idents.hpp"
#include "transactions/network_auth.hpp"

namespace nexus::client {

using core::errors::NexusError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

std::optional<std::uint64_t> content_optional_u64(const json& object, const std::string& field) {
    auto parsed = codec::read_optional_u64(object, field);
    if (core::errors::is_error(parsed)) {
        throw crawler::ContentError(core::errors::get_error(parsed).message);
    }
    return core::errors::get_value(parsed);
}

NexusError binding_error(const codec::Address& binding, const std::string& reason) {
    return NexusError{ErrorCategory::Ledger, "Key binding " + binding.to_hex() + " " + reason + ".",
                      "parsing"};
}

}  // namespace

void from_json(const json& value, KeyRecord& out) {
    const auto scheme = crawler::content_u64(value, "scheme");
    if (scheme > 0xff) {
        throw crawler::ContentError("KeyRecord scheme does not fit a u8");
    }
    out.scheme = static_cast<std::uint8_t>(scheme);
    auto key = codec::read_byte_array(value, "public_key");
    if (core::errors::is_error(key)) {
        throw crawler::ContentError(core::errors::get_error(key).message);
    }
    out.public_key = core::errors::take_value(key);
    out.added_at_ms = crawler::content_u64(value, "added_at_ms");
    out.revoked_at_ms = content_optional_u64(value, "revoked_at_ms");
}

void from_json(const json& value, KeyBinding& out) {
    out.id = crawler::content_address(value, "id");
    out.next_key_id = crawler::content_u64(value, "next_key_id");
    out.active_key_id = content_optional_u64(value, "active_key_id");
    if (!value.contains("keys")) {
        throw crawler::ContentError("KeyBinding has no 'keys'");
    }
    out.keys = value.at("keys").get<crawler::DynamicMap<crawler::StringifiedU64, KeyRecord>>();
}

core::errors::Result<NetworkAuthActions::BindingState> NetworkAuthActions::binding_state(
    const std::optional<codec::Address>& binding_id) const {
    if (!binding_id.has_value()) {
        return BindingState{};
    }
    auto binding = client_.crawler().get_object<KeyBinding>(*binding_id);
    if (core::errors::is_error(binding)) {
        return core::errors::get_error(binding);
    }
    const auto& response = core::errors::get_value(binding);
    return BindingState{response.object_ref(), response.data.next_key_id};
}

core::errors::Result<RegisteredKey> NetworkAuthActions::finish(const SubmittedTransaction& tx,
                                                               const BindingState& binding,
                                                               const codec::SigningKey& key) const {
    RegisteredKey out;
    out.tx_digest = tx.digest;
    out.kid = binding.next_key_id;
    out.public_key = key.verifying_key().bytes();
    if (binding.ref.has_value()) {
        out.binding_id = binding.ref->object_id;
    } else {
        const auto& ident = transactions::idents::network_auth::kKeyBinding;
        auto created = find_created_object(tx, ident.module, ident.name);
        if (created.has_value()) {
            out.binding_id = created->object_id;
        }
    }
    NEXUS_LOG_INFO("NetworkAuth: registered key " + std::to_string(out.kid) + " in " +
                   tx.digest);
    return out;
}

core::errors::Result<RegisteredKey> NetworkAuthActions::register_tool_key(
    const types::ToolFqn& fqn, const codec::Address& owner_cap_over_tool,
    const std::optional<codec::Address>& binding_id, const codec::SigningKey& key,
    const std::optional<std::string>& description, const CancelToken& cancel_token) {
    auto state = binding_state(binding_id);
    if (core::errors::is_error(state)) {
        return core::errors::get_error(state);
    }
    const auto& binding = core::errors::get_value(state);

    auto pop = transactions::sign_proof_of_possession(
        key, transactions::IdentityKey::for_tool(fqn), binding.next_key_id);
    if (core::errors::is_error(pop)) {
        return core::errors::get_error(pop);
    }
    auto cap = client_.owned_object_ref(owner_cap_over_tool);
    if (core::errors::is_error(cap)) {
        return core::errors::get_error(cap);
    }

    transactions::TransactionBuilder tx;
    transactions::compose_register_tool_key(tx, client_.objects(), fqn,
                                            core::errors::get_value(cap), binding.ref,
                                            client_.sender(), key.verifying_key().bytes(),
                                            core::errors::get_value(pop), description);
    auto submitted = client_.submit(tx, cancel_token);
    if (core::errors::is_error(submitted)) {
        return core::errors::get_error(submitted);
    }
    return finish(core::errors::get_value(submitted), binding, key);
}

core::errors::Result<RegisteredKey> NetworkAuthActions::register_leader_key(
    const codec::Address& leader, const codec::Address& leader_cap,
    const std::optional<codec::Address>& binding_id, const codec::SigningKey& key,
    const std::optional<std::string>& description, const CancelToken& cancel_token) {
    auto state = binding_state(binding_id);
    if (core::errors::is_error(state)) {
        return core::errors::get_error(state);
    }
    const auto& binding = core::errors::get_value(state);

    auto pop = transactions::sign_proof_of_possession(
        key, transactions::IdentityKey::for_leader(leader), binding.next_key_id);
    if (core::errors::is_error(pop)) {
        return core::errors::get_error(pop);
    }
    // The leader cap is shared.
    auto cap = client_.shared_object_ref(leader_cap);
    if (core::errors::is_error(cap)) {
        return core::errors::get_error(cap);
    }

    transactions::TransactionBuilder tx;
    transactions::compose_register_leader_key(tx, client_.objects(), core::errors::get_value(cap),
                                              binding.ref, client_.sender(),
                                              key.verifying_key().bytes(),
                                              core::errors::get_value(pop), description);
    auto submitted = client_.submit(tx, cancel_token);
    if (core::errors::is_error(submitted)) {
        return core::errors::get_error(submitted);
    }
    return finish(core::errors::get_value(submitted), binding, key);
}

core::errors::Result<json> NetworkAuthActions::export_allowed_leaders(
    const std::map<codec::Address, codec::Address>& bindings) const {
    json leaders = json::array();
    for (const auto& entry : bindings) {
        const auto& leader = entry.first;
        const auto& binding_id = entry.second;

        auto binding = client_.crawler().get_object<KeyBinding>(binding_id);
        if (core::errors::is_error(binding)) {
            return core::errors::get_error(binding);
        }
        const auto& data = core::errors::get_value(binding).data;
        if (!data.active_key_id.has_value()) {
            return binding_error(binding_id, "has no active key");
        }

        auto records = client_.crawler().get_dynamic_fields(data.keys);
        if (core::errors::is_error(records)) {
            return core::errors::get_error(records);
        }
        const auto& by_kid = core::errors::get_value(records);
        auto record = by_kid.find(crawler::StringifiedU64{*data.active_key_id});
        if (record == by_kid.end()) {
            return binding_error(binding_id, "is missing its active key record");
        }
        if (record->second.scheme != kKeySchemeEd25519) {
            return binding_error(binding_id, "uses unsupported key scheme " +
                                                 std::to_string(record->second.scheme));
        }
        if (record->second.public_key.size() != 32) {
            return binding_error(binding_id, "has an active key that is not 32 bytes");
        }

        json key;
        key["kid"] = *data.active_key_id;
        key["public_key"] = codec::hex_encode(record->second.public_key);
        json leader_entry;
        leader_entry["leader_id"] = leader.to_hex();
        leader_entry["keys"] = json::array();
        leader_entry["keys"].push_back(key);
        leaders.push_back(leader_entry);
    }
    json out;
    out["version"] = 1;
    out["leaders"] = leaders;
    return out;
}

}  // namespace nexus::client
