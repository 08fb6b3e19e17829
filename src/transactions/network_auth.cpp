#include "transactions/network_auth.hpp"

#include <functional>
#include <vector>
#include "codec/bcs.hpp"
#include "transactions/idents.hpp"

namespace nexus::transactions {

namespace {

using ProofFactory = std::function<Argument()>;

Argument register_key(TransactionBuilder& tx, const types::NexusObjects& objects,
                      const ProofFactory& prove, const std::optional<ledger::ObjectRef>& binding,
                      const codec::Address& owner, const codec::Ed25519PublicKey& public_key,
                      const codec::Ed25519Signature& pop_signature,
                      const std::optional<std::string>& description) {
    const auto& pkg = objects.workflow_pkg_id;

    Argument binding_arg;
    if (binding.has_value()) {
        binding_arg = tx.owned_object(*binding);
    } else {
        const auto network_auth = shared_input(tx, objects.network_auth, true);
        std::optional<codec::Bytes> description_bytes;
        if (description.has_value()) {
            description_bytes = codec::to_bytes(*description);
        }
        // create_binding consumes its proof.
        const auto proof = prove();
        binding_arg = call(tx, pkg, idents::network_auth::kCreateBinding,
                           {network_auth, proof, tx.pure(codec::bcs_option_bytes(description_bytes))});
    }

    const auto proof = prove();
    const auto key = tx.pure(codec::bcs_bytes(codec::Bytes(public_key.begin(), public_key.end())));
    const auto signature =
        tx.pure(codec::bcs_bytes(codec::Bytes(pop_signature.begin(), pop_signature.end())));
    const auto proof_of_key =
        call(tx, pkg, idents::network_auth::kNewProofOfKey, {binding_arg, proof, key, signature});
    const auto registered = call(tx, pkg, idents::network_auth::kRegisterKey,
                                 {binding_arg, proof, proof_of_key, clock_input(tx)});

    if (binding.has_value()) {
        return registered;
    }
    return tx.transfer_objects({binding_arg}, tx.pure_address(owner));
}

}  // namespace

codec::Bytes identity_key_to_bcs(const IdentityKey& identity) {
    codec::BcsWriter writer;
    if (identity.kind == IdentityKey::Kind::Leader) {
        writer.uleb128(0);
        writer.address(identity.leader);
    } else {
        writer.uleb128(1);
        writer.string(identity.tool_fqn);
    }
    return writer.take();
}

codec::Bytes proof_of_possession_message(const IdentityKey& identity, const std::uint64_t key_id,
                                         const codec::Ed25519PublicKey& public_key) {
    auto message = codec::to_bytes(kProofOfPossessionDomainV1);
    const auto identity_bcs = identity_key_to_bcs(identity);
    message.insert(message.end(), identity_bcs.begin(), identity_bcs.end());
    const auto key_id_bcs = codec::bcs_u64(key_id);
    message.insert(message.end(), key_id_bcs.begin(), key_id_bcs.end());
    message.insert(message.end(), public_key.begin(), public_key.end());
    return message;
}

core::errors::Result<codec::Ed25519Signature> sign_proof_of_possession(
    const codec::SigningKey& key, const IdentityKey& identity, const std::uint64_t key_id) {
    return key.sign(proof_of_possession_message(identity, key_id, key.verifying_key().bytes()));
}

Argument compose_register_tool_key(TransactionBuilder& tx, const types::NexusObjects& objects,
                                   const types::ToolFqn& fqn,
                                   const ledger::ObjectRef& owner_cap_over_tool,
                                   const std::optional<ledger::ObjectRef>& binding,
                                   const codec::Address& owner,
                                   const codec::Ed25519PublicKey& public_key,
                                   const codec::Ed25519Signature& pop_signature,
                                   const std::optional<std::string>& description) {
    const auto registry = shared_input(tx, objects.tool_registry, false);
    const auto owner_cap = tx.owned_object(owner_cap_over_tool);
    const auto fqn_arg = tx.pure_string(fqn.to_string());
    const ProofFactory prove = [&]() {
        return call(tx, objects.workflow_pkg_id, idents::network_auth::kProveOffchainTool,
                    {registry, owner_cap, fqn_arg});
    };
    return register_key(tx, objects, prove, binding, owner, public_key, pop_signature,
                        description);
}

Argument compose_register_leader_key(TransactionBuilder& tx, const types::NexusObjects& objects,
                                     const ledger::ObjectRef& leader_cap,
                                     const std::optional<ledger::ObjectRef>& binding,
                                     const codec::Address& owner,
                                     const codec::Ed25519PublicKey& public_key,
                                     const codec::Ed25519Signature& pop_signature,
                                     const std::optional<std::string>& description) {
    const auto cap = shared_input(tx, leader_cap, false);
    const ProofFactory prove = [&]() {
        return call(tx, objects.workflow_pkg_id, idents::network_auth::kProveLeader, {cap});
    };
    return register_key(tx, objects, prove, binding, owner, public_key, pop_signature,
                        description);
}

}  // namespace nexus::transactions
