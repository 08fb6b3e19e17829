#include "client/tool_actions.hpp"

#include "core/logging/logger.hpp"
#include "transactions/idents.hpp"

namespace nexus::client {

using core::errors::NexusError;
using core::errors::ErrorCategory;

namespace {

core::errors::Status check_collateral(const std::uint64_t collateral_mist) {
    if (collateral_mist == 0) {
        return NexusError{ErrorCategory::Ledger, "Tool collateral must be greater than zero.",
                          "configuration"};
    }
    return core::errors::ok();
}

}  // namespace

core::errors::Result<RegisteredTool> ToolActions::registered_from(const SubmittedTransaction& tx,
                                                                  const bool expect_gas_cap) const {
    const auto& cap = transactions::idents::primitives::kCloneableOwnerCap;
    RegisteredTool out;
    out.tx_digest = tx.digest;

    auto over_tool = find_created_object(tx, cap.module, cap.name,
                                         transactions::idents::tool_registry::kOverTool.name);
    if (!over_tool.has_value()) {
        return NexusError{ErrorCategory::Ledger,
                          "Transaction " + tx.digest + " did not create an OverTool owner cap.",
                          "parsing"};
    }
    out.owner_cap_over_tool = over_tool->object_id;

    if (expect_gas_cap) {
        auto over_gas = find_created_object(tx, cap.module, cap.name,
                                            transactions::idents::gas::kOverGas.name);
        if (!over_gas.has_value()) {
            return NexusError{ErrorCategory::Ledger,
                              "Transaction " + tx.digest + " did not create an OverGas owner cap.",
                              "parsing"};
        }
        out.owner_cap_over_gas = over_gas->object_id;
    }

    auto decoded = client_.nexus_events(tx);
    if (core::errors::is_error(decoded)) {
        return core::errors::get_error(decoded);
    }
    for (const auto& event : core::errors::get_value(decoded)) {
        if (const auto* registered = event.data.as<events::ToolRegistered>()) {
            out.tool_id = registered->tool;
            break;
        }
    }
    return out;
}

core::errors::Result<RegisteredTool> ToolActions::register_off_chain(
    const transactions::OffChainToolMeta& meta, const std::uint64_t collateral_mist,
    const std::uint64_t invocation_cost_mist, const CancelToken& cancel_token) {
    auto valid = check_collateral(collateral_mist);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    transactions::TransactionBuilder tx;
    const auto payment = transactions::split_payment(tx, collateral_mist);
    transactions::compose_register_off_chain_tool(tx, client_.objects(), meta, client_.sender(),
                                                  payment, invocation_cost_mist);
    auto submitted = client_.submit(tx, cancel_token);
    if (core::errors::is_error(submitted)) {
        return core::errors::get_error(submitted);
    }
    NEXUS_LOG_INFO("Tools: registered off-chain tool " + meta.fqn.to_string());
    return registered_from(core::errors::get_value(submitted), true);
}

core::errors::Result<RegisteredTool> ToolActions::register_on_chain(
    const transactions::OnChainToolMeta& meta, const std::uint64_t collateral_mist,
    const CancelToken& cancel_token) {
    auto valid = check_collateral(collateral_mist);
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    transactions::TransactionBuilder tx;
    const auto payment = transactions::split_payment(tx, collateral_mist);
    transactions::compose_register_on_chain_tool(tx, client_.objects(), meta, client_.sender(),
                                                 payment);
    auto submitted = client_.submit(tx, cancel_token);
    if (core::errors::is_error(submitted)) {
        return core::errors::get_error(submitted);
    }
    NEXUS_LOG_INFO("Tools: registered on-chain tool " + meta.fqn.to_string());
    return registered_from(core::errors::get_value(submitted), false);
}

core::errors::Result<std::string> ToolActions::set_invocation_cost(
    const types::ToolFqn& fqn, const codec::Address& owner_cap_over_gas,
    const std::uint64_t invocation_cost_mist, const CancelToken& cancel_token) {
    return submit_with_owned_object(
        client_, owner_cap_over_gas,
        [&](transactions::TransactionBuilder& tx, const ledger::ObjectRef& cap) {
            transactions::compose_set_invocation_cost(tx, client_.objects(), fqn, cap,
                                                      invocation_cost_mist);
        },
        cancel_token);
}

core::errors::Result<std::string> ToolActions::unregister(const types::ToolFqn& fqn,
                                                          const codec::Address& owner_cap_over_tool,
                                                          const CancelToken& cancel_token) {
    return submit_with_owned_object(
        client_, owner_cap_over_tool,
        [&](transactions::TransactionBuilder& tx, const ledger::ObjectRef& cap) {
            transactions::compose_unregister_tool(tx, client_.objects(), fqn, cap);
        },
        cancel_token);
}

core::errors::Result<std::string> ToolActions::claim_collateral(
    const types::ToolFqn& fqn, const codec::Address& owner_cap_over_tool,
    const CancelToken& cancel_token) {
    return submit_with_owned_object(
        client_, owner_cap_over_tool,
        [&](transactions::TransactionBuilder& tx, const ledger::ObjectRef& cap) {
            transactions::compose_claim_collateral(tx, client_.objects(), fqn, cap);
        },
        cancel_token);
}

}  // namespace nexus::client
