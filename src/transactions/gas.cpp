#include "transactions/gas.hpp"

#include <utility>
#include <vector>
#include "transactions/idents.hpp"

namespace nexus::transactions {

namespace {

// (gas_service, tool_registry, owner_cap, ...) prefix shared by the owner
// side of both extensions.
std::vector<Argument> owner_args(TransactionBuilder& tx, const types::NexusObjects& objects,
                                 const ledger::ObjectRef& owner_cap_over_gas) {
    return {shared_input(tx, objects.gas_service, true),
            shared_input(tx, objects.tool_registry, false), tx.owned_object(owner_cap_over_gas)};
}

}  // namespace

Argument compose_add_gas_budget(TransactionBuilder& tx, const types::NexusObjects& objects,
                                const codec::Address& invoker, const Argument coin) {
    const auto& pkg = objects.workflow_pkg_id;
    const auto gas_service = shared_input(tx, objects.gas_service, true);
    const auto scope =
        call(tx, pkg, idents::gas::kScopeInvokerAddress, {tx.pure_address(invoker)});
    const auto balance =
        call(tx, codec::framework_address(), idents::framework::kIntoBalance, {coin},
             {struct_type(codec::framework_address(), idents::framework::kSui)});
    return call(tx, pkg, idents::gas::kAddGasBudget, {gas_service, scope, balance});
}

Argument compose_enable_expiry(TransactionBuilder& tx, const types::NexusObjects& objects,
                               const types::ToolFqn& fqn,
                               const ledger::ObjectRef& owner_cap_over_gas,
                               const std::uint64_t cost_per_minute) {
    auto args = owner_args(tx, objects, owner_cap_over_gas);
    args.push_back(tx.pure_u64(cost_per_minute));
    args.push_back(tx.pure_string(fqn.to_string()));
    return call(tx, objects.workflow_pkg_id, idents::gas_extension::kEnableExpiry,
                std::move(args));
}

Argument compose_disable_expiry(TransactionBuilder& tx, const types::NexusObjects& objects,
                                const types::ToolFqn& fqn,
                                const ledger::ObjectRef& owner_cap_over_gas) {
    auto args = owner_args(tx, objects, owner_cap_over_gas);
    args.push_back(tx.pure_string(fqn.to_string()));
    return call(tx, objects.workflow_pkg_id, idents::gas_extension::kDisableExpiry,
                std::move(args));
}

Argument compose_buy_expiry_ticket(TransactionBuilder& tx, const types::NexusObjects& objects,
                                   const types::ToolFqn& fqn, const std::uint64_t minutes,
                                   const Argument pay_with) {
    std::vector<Argument> args{shared_input(tx, objects.gas_service, true),
                               shared_input(tx, objects.tool_registry, false),
                               tx.pure_string(fqn.to_string()),
                               tx.pure_u64(minutes),
                               pay_with,
                               clock_input(tx)};
    return call(tx, objects.workflow_pkg_id, idents::gas_extension::kBuyExpiryGasTicket,
                std::move(args));
}

Argument compose_enable_limited_invocations(TransactionBuilder& tx,
                                            const types::NexusObjects& objects,
                                            const types::ToolFqn& fqn,
                                            const ledger::ObjectRef& owner_cap_over_gas,
                                            const std::uint64_t cost_per_invocation,
                                            const std::uint64_t min_invocations,
                                            const std::uint64_t max_invocations) {
    auto args = owner_args(tx, objects, owner_cap_over_gas);
    args.push_back(tx.pure_u64(cost_per_invocation));
    args.push_back(tx.pure_u64(min_invocations));
    args.push_back(tx.pure_u64(max_invocations));
    args.push_back(tx.pure_string(fqn.to_string()));
    return call(tx, objects.workflow_pkg_id, idents::gas_extension::kEnableLimitedInvocations,
                std::move(args));
}

Argument compose_disable_limited_invocations(TransactionBuilder& tx,
                                             const types::NexusObjects& objects,
                                             const types::ToolFqn& fqn,
                                             const ledger::ObjectRef& owner_cap_over_gas) {
    auto args = owner_args(tx, objects, owner_cap_over_gas);
    args.push_back(tx.pure_string(fqn.to_string()));
    return call(tx, objects.workflow_pkg_id, idents::gas_extension::kDisableLimitedInvocations,
                std::move(args));
}

Argument compose_buy_limited_invocations_ticket(TransactionBuilder& tx,
                                                const types::NexusObjects& objects,
                                                const types::ToolFqn& fqn,
                                                const std::uint64_t invocations,
                                                const Argument pay_with) {
    std::vector<Argument> args{shared_input(tx, objects.gas_service, true),
                               shared_input(tx, objects.tool_registry, false),
                               tx.pure_string(fqn.to_string()),
                               tx.pure_u64(invocations),
                               pay_with,
                               clock_input(tx)};
    return call(tx, objects.workflow_pkg_id,
                idents::gas_extension::kBuyLimitedInvocationsGasTicket, std::move(args));
}

}  // namespace nexus::transactions
