#include "transactions/tool.hpp"

#include <utility>
#include <vector>
#include "codec/bcs.hpp"
#include "codec/bytes.hpp"
#include "transactions/idents.hpp"

namespace nexus::transactions {

namespace {

Argument json_bytes(TransactionBuilder& tx, const nlohmann::json& value) {
    return tx.pure(codec::bcs_bytes(codec::to_bytes(value.dump())));
}

Argument text_bytes(TransactionBuilder& tx, const std::string& value) {
    return tx.pure(codec::bcs_bytes(codec::to_bytes(value)));
}

}  // namespace

Argument split_payment(TransactionBuilder& tx, const std::uint64_t amount) {
    const auto coins = tx.split_coins(Argument::gas_coin(), {tx.pure_u64(amount)});
    return coins.nested_result(0);
}

Argument compose_register_off_chain_tool(TransactionBuilder& tx,
                                         const types::NexusObjects& objects,
                                         const OffChainToolMeta& meta,
                                         const codec::Address& owner, const Argument pay_with,
                                         const std::uint64_t invocation_cost_mist) {
    const auto& pkg = objects.workflow_pkg_id;
    const auto registry = shared_input(tx, objects.tool_registry, true);
    const auto fqn = tx.pure_string(meta.fqn.to_string());

    std::vector<Argument> args{registry,
                               fqn,
                               text_bytes(tx, meta.url),
                               text_bytes(tx, meta.description),
                               json_bytes(tx, meta.input_schema),
                               json_bytes(tx, meta.output_schema),
                               pay_with,
                               clock_input(tx)};
    // Returns (tool, owner_cap_over_tool).
    const auto registered =
        call(tx, pkg, idents::tool_registry::kRegisterOffChainTool, std::move(args));
    const auto over_tool = registered.nested_result(1);

    const auto over_gas = call(tx, pkg, idents::gas::kDeescalate, {registry, over_tool, fqn});

    const auto gas_service = shared_input(tx, objects.gas_service, true);
    call(tx, pkg, idents::gas::kSetSingleInvocationCostMist,
         {gas_service, registry, over_gas, fqn, tx.pure_u64(invocation_cost_mist)});

    public_transfer(tx, over_tool,
                    cloneable_owner_cap_type(objects.primitives_pkg_id, pkg,
                                             idents::tool_registry::kOverTool),
                    owner);
    return public_transfer(
        tx, over_gas,
        cloneable_owner_cap_type(objects.primitives_pkg_id, pkg, idents::gas::kOverGas), owner);
}

Argument compose_register_on_chain_tool(TransactionBuilder& tx,
                                        const types::NexusObjects& objects,
                                        const OnChainToolMeta& meta,
                                        const codec::Address& owner, const Argument pay_with) {
    const auto& pkg = objects.workflow_pkg_id;
    std::vector<Argument> args{shared_input(tx, objects.tool_registry, true),
                               tx.pure_address(meta.package_address),
                               tx.pure_string(meta.module_name),
                               json_bytes(tx, meta.input_schema),
                               json_bytes(tx, meta.output_schema),
                               tx.pure_string(meta.fqn.to_string()),
                               text_bytes(tx, meta.description),
                               tx.pure_address(meta.witness_id),
                               pay_with,
                               clock_input(tx)};
    const auto registered =
        call(tx, pkg, idents::tool_registry::kRegisterOnChainTool, std::move(args));

    return public_transfer(tx, registered.nested_result(1),
                           cloneable_owner_cap_type(objects.primitives_pkg_id, pkg,
                                                    idents::tool_registry::kOverTool),
                           owner);
}

Argument compose_set_invocation_cost(TransactionBuilder& tx, const types::NexusObjects& objects,
                                     const types::ToolFqn& fqn,
                                     const ledger::ObjectRef& owner_cap_over_gas,
                                     const std::uint64_t invocation_cost_mist) {
    std::vector<Argument> args{shared_input(tx, objects.gas_service, true),
                               shared_input(tx, objects.tool_registry, true),
                               tx.owned_object(owner_cap_over_gas),
                               tx.pure_string(fqn.to_string()),
                               tx.pure_u64(invocation_cost_mist)};
    return call(tx, objects.workflow_pkg_id, idents::gas::kSetSingleInvocationCostMist,
                std::move(args));
}

Argument compose_unregister_tool(TransactionBuilder& tx, const types::NexusObjects& objects,
                                 const types::ToolFqn& fqn,
                                 const ledger::ObjectRef& owner_cap_over_tool) {
    std::vector<Argument> args{shared_input(tx, objects.tool_registry, true),
                               tx.owned_object(owner_cap_over_tool),
                               tx.pure_string(fqn.to_string()), clock_input(tx)};
    return call(tx, objects.workflow_pkg_id, idents::tool_registry::kUnregisterTool,
                std::move(args));
}

Argument compose_claim_collateral(TransactionBuilder& tx, const types::NexusObjects& objects,
                                  const types::ToolFqn& fqn,
                                  const ledger::ObjectRef& owner_cap_over_tool) {
    std::vector<Argument> args{shared_input(tx, objects.tool_registry, true),
                               tx.owned_object(owner_cap_over_tool),
                               tx.pure_string(fqn.to_string()), clock_input(tx)};
    return call(tx, objects.workflow_pkg_id, idents::tool_registry::kClaimCollateralForSelf,
                std::move(args));
}

}  // namespace nexus::transactions
