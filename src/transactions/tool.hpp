#pragma once

#include <cstdint>
#include <string>
#include <nlohmann/json.hpp>
#include "codec/address.hpp"
#include "ledger/ledger_types.hpp"
#include "transactions/transaction_builder.hpp"
#include "types/nexus_objects.hpp"
#include "types/nexus_types.hpp"

namespace nexus::transactions {

struct OffChainToolMeta {
    types::ToolFqn fqn;
    std::string url;
    std::string description;
    nlohmann::json input_schema;
    nlohmann::json output_schema;
};

struct OnChainToolMeta {
    types::ToolFqn fqn;
    codec::Address package_address;
    std::string module_name;
    std::string description;
    nlohmann::json input_schema;
    nlohmann::json output_schema;
    codec::Address witness_id;
};

// Splits `amount` off the gas coin for use as a `Coin<SUI>` payment.
Argument split_payment(TransactionBuilder& tx, std::uint64_t amount);

// Registers the tool, de-escalates its owner cap into a gas cap, sets the
// per-invocation cost and hands both caps to `owner`. `pay_with` is the
// collateral coin. Returns the last transfer.
Argument compose_register_off_chain_tool(TransactionBuilder& tx,
                                         const types::NexusObjects& objects,
                                         const OffChainToolMeta& meta,
                                         const codec::Address& owner, Argument pay_with,
                                         std::uint64_t invocation_cost_mist);

Argument compose_register_on_chain_tool(TransactionBuilder& tx,
                                        const types::NexusObjects& objects,
                                        const OnChainToolMeta& meta,
                                        const codec::Address& owner, Argument pay_with);

// `owner_cap_over_gas` is the owned CloneableOwnerCap<OverGas>.
Argument compose_set_invocation_cost(TransactionBuilder& tx, const types::NexusObjects& objects,
                                     const types::ToolFqn& fqn,
                                     const ledger::ObjectRef& owner_cap_over_gas,
                                     std::uint64_t invocation_cost_mist);

// `owner_cap_over_tool` is the owned CloneableOwnerCap<OverTool>.
Argument compose_unregister_tool(TransactionBuilder& tx, const types::NexusObjects& objects,
                                 const types::ToolFqn& fqn,
                                 const ledger::ObjectRef& owner_cap_over_tool);

Argument compose_claim_collateral(TransactionBuilder& tx, const types::NexusObjects& objects,
                                  const types::ToolFqn& fqn,
                                  const ledger::ObjectRef& owner_cap_over_tool);

}  // namespace nexus::transactions
