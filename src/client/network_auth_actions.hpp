#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "client/nexus_client.hpp"
#include "codec/address.hpp"
#include "codec/bytes.hpp"
#include "codec/ed25519.hpp"
#include "core/errors/nexus_errors.hpp"
#include "crawler/collections.hpp"
#include "types/nexus_types.hpp"

namespace nexus::client {

inline constexpr std::uint8_t kKeySchemeEd25519 = 0;

// Projection of network_auth::KeyRecord.
struct KeyRecord {
    std::uint8_t scheme = kKeySchemeEd25519;
    codec::Bytes public_key;
    std::uint64_t added_at_ms = 0;
    std::optional<std::uint64_t> revoked_at_ms;
};

// Projection of network_auth::KeyBinding; records live in a table keyed by
// key id.
struct KeyBinding {
    codec::Address id;
    std::uint64_t next_key_id = 0;
    std::optional<std::uint64_t> active_key_id;
    crawler::DynamicMap<crawler::StringifiedU64, KeyRecord> keys;
};

void from_json(const nlohmann::json& value, KeyRecord& out);
void from_json(const nlohmann::json& value, KeyBinding& out);

struct RegisteredKey {
    std::string tx_digest;
    std::uint64_t kid = 0;
    codec::Ed25519PublicKey public_key{};
    // Known when an existing binding was used or a new one was created.
    std::optional<codec::Address> binding_id;
};

class NetworkAuthActions {
public:
    explicit NetworkAuthActions(NexusClient& client) : client_(client) {}

    // Without `binding_id` a binding is created for the tool and sent to
    // the signer. The proof of possession is signed over the binding's
    // next key id.
    core::errors::Result<RegisteredKey> register_tool_key(
        const types::ToolFqn& fqn, const codec::Address& owner_cap_over_tool,
        const std::optional<codec::Address>& binding_id, const codec::SigningKey& key,
        const std::optional<std::string>& description = std::nullopt,
        const CancelToken& cancel_token = nullptr);

    core::errors::Result<RegisteredKey> register_leader_key(
        const codec::Address& leader, const codec::Address& leader_cap,
        const std::optional<codec::Address>& binding_id, const codec::SigningKey& key,
        const std::optional<std::string>& description = std::nullopt,
        const CancelToken& cancel_token = nullptr);

    // Allowed-leaders document (version 1) with each leader's active key.
    // `bindings` maps leader address to its KeyBinding object.
    core::errors::Result<nlohmann::json> export_allowed_leaders(
        const std::map<codec::Address, codec::Address>& bindings) const;

private:
    struct BindingState {
        std::optional<ledger::ObjectRef> ref;
        std::uint64_t next_key_id = 0;
    };

    core::errors::Result<BindingState> binding_state(
        const std::optional<codec::Address>& binding_id) const;

    core::errors::Result<RegisteredKey> finish(const SubmittedTransaction& tx,
                                               const BindingState& binding,
                                               const codec::SigningKey& key) const;

    NexusClient& client_;
};

}  // namespace nexus::client
