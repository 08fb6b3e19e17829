#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "codec/address.hpp"
#include "codec/bytes.hpp"
#include "codec/ed25519.hpp"
#include "core/errors/nexus_errors.hpp"
#include "ledger/ledger_types.hpp"
#include "transactions/transaction_builder.hpp"
#include "types/nexus_objects.hpp"
#include "types/nexus_types.hpp"

namespace nexus::transactions {

constexpr const char* kProofOfPossessionDomainV1 = "nexus_workflow.network_auth.pop_v1";

// Off-chain identity a signing key is bound to: a leader address or a tool.
struct IdentityKey {
    enum class Kind { Leader, Tool };

    Kind kind = Kind::Tool;
    codec::Address leader;
    std::string tool_fqn;

    static IdentityKey for_leader(const codec::Address& address) {
        return IdentityKey{Kind::Leader, address, {}};
    }
    static IdentityKey for_tool(const types::ToolFqn& fqn) {
        return IdentityKey{Kind::Tool, codec::Address{}, fqn.to_string()};
    }
};

codec::Bytes identity_key_to_bcs(const IdentityKey& identity);

// domain || bcs(identity) || bcs(key_id) || public_key. `key_id` is the
// binding's next key id, so a proof is single-use.
codec::Bytes proof_of_possession_message(const IdentityKey& identity, std::uint64_t key_id,
                                         const codec::Ed25519PublicKey& public_key);

core::errors::Result<codec::Ed25519Signature> sign_proof_of_possession(
    const codec::SigningKey& key, const IdentityKey& identity, std::uint64_t key_id);

// New key for a tool. Creates the binding and transfers it to `owner` when
// `binding` is empty, otherwise rotates in a key on the existing binding.
Argument compose_register_tool_key(TransactionBuilder& tx, const types::NexusObjects& objects,
                                   const types::ToolFqn& fqn,
                                   const ledger::ObjectRef& owner_cap_over_tool,
                                   const std::optional<ledger::ObjectRef>& binding,
                                   const codec::Address& owner,
                                   const codec::Ed25519PublicKey& public_key,
                                   const codec::Ed25519Signature& pop_signature,
                                   const std::optional<std::string>& description);

// Same for a leader, proven through its shared CloneableOwnerCap<OverNetwork>.
Argument compose_register_leader_key(TransactionBuilder& tx, const types::NexusObjects& objects,
                                     const ledger::ObjectRef& leader_cap,
                                     const std::optional<ledger::ObjectRef>& binding,
                                     const codec::Address& owner,
                                     const codec::Ed25519PublicKey& public_key,
                                     const codec::Ed25519Signature& pop_signature,
                                     const std::optional<std::string>& description);

}  // namespace nexus::transactions
