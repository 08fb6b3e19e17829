#include "client/gas_actions.hpp"

#include "core/logging/logger.hpp"
#include "transactions/gas.hpp"
#include "transactions/tool.hpp"

namespace nexus::client {

using core::errors::NexusError;
using core::errors::ErrorCategory;

namespace {

core::errors::Status require_positive(const std::uint64_t value, const std::string& what) {
    if (value == 0) {
        return NexusError{ErrorCategory::Ledger, what + " must be greater than zero.",
                          "configuration"};
    }
    return core::errors::ok();
}

}  // namespace

core::errors::Result<std::string> GasActions::submit(const transactions::TransactionBuilder& tx,
                                                     const CancelToken& cancel_token) {
    auto submitted = client_.submit(tx, cancel_token);
    if (core::errors::is_error(submitted)) {
        return core::errors::get_error(submitted);
    }
    return core::errors::get_value(submitted).digest;
}

core::errors::Result<std::string> GasActions::add_budget(const std::uint64_t amount_mist,
                                                         const CancelToken& cancel_token) {
    auto valid = require_positive(amount_mist, "Gas budget amount");
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    transactions::TransactionBuilder tx;
    const auto coin = transactions::split_payment(tx, amount_mist);
    transactions::compose_add_gas_budget(tx, client_.objects(), client_.sender(), coin);
    NEXUS_LOG_INFO("Gas: adding " + std::to_string(amount_mist) + " MIST to invoker budget");
    return submit(tx, cancel_token);
}

core::errors::Result<std::string> GasActions::enable_expiry(
    const types::ToolFqn& fqn, const codec::Address& owner_cap_over_gas,
    const std::uint64_t cost_per_minute, const CancelToken& cancel_token) {
    return submit_with_owned_object(
        client_, owner_cap_over_gas,
        [&](transactions::TransactionBuilder& tx, const ledger::ObjectRef& cap) {
            transactions::compose_enable_expiry(tx, client_.objects(), fqn, cap, cost_per_minute);
        },
        cancel_token);
}

core::errors::Result<std::string> GasActions::disable_expiry(
    const types::ToolFqn& fqn, const codec::Address& owner_cap_over_gas,
    const CancelToken& cancel_token) {
    return submit_with_owned_object(
        client_, owner_cap_over_gas,
        [&](transactions::TransactionBuilder& tx, const ledger::ObjectRef& cap) {
            transactions::compose_disable_expiry(tx, client_.objects(), fqn, cap);
        },
        cancel_token);
}

core::errors::Result<std::string> GasActions::buy_expiry_ticket(const types::ToolFqn& fqn,
                                                                const std::uint64_t minutes,
                                                                const std::uint64_t cost_mist,
                                                                const CancelToken& cancel_token) {
    auto valid = require_positive(minutes, "Ticket minutes");
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    transactions::TransactionBuilder tx;
    const auto payment = transactions::split_payment(tx, cost_mist);
    transactions::compose_buy_expiry_ticket(tx, client_.objects(), fqn, minutes, payment);
    return submit(tx, cancel_token);
}

core::errors::Result<std::string> GasActions::enable_limited_invocations(
    const types::ToolFqn& fqn, const codec::Address& owner_cap_over_gas,
    const std::uint64_t cost_per_invocation, const std::uint64_t min_invocations,
    const std::uint64_t max_invocations, const CancelToken& cancel_token) {
    if (min_invocations > max_invocations) {
        return NexusError{ErrorCategory::Ledger,
                          "Minimum invocations cannot exceed maximum invocations.",
                          "configuration"};
    }
    return submit_with_owned_object(
        client_, owner_cap_over_gas,
        [&](transactions::TransactionBuilder& tx, const ledger::ObjectRef& cap) {
            transactions::compose_enable_limited_invocations(tx, client_.objects(), fqn, cap,
                                                             cost_per_invocation,
                                                             min_invocations, max_invocations);
        },
        cancel_token);
}

core::errors::Result<std::string> GasActions::disable_limited_invocations(
    const types::ToolFqn& fqn, const codec::Address& owner_cap_over_gas,
    const CancelToken& cancel_token) {
    return submit_with_owned_object(
        client_, owner_cap_over_gas,
        [&](transactions::TransactionBuilder& tx, const ledger::ObjectRef& cap) {
            transactions::compose_disable_limited_invocations(tx, client_.objects(), fqn, cap);
        },
        cancel_token);
}

core::errors::Result<std::string> GasActions::buy_limited_invocations_ticket(
    const types::ToolFqn& fqn, const std::uint64_t invocations, const std::uint64_t cost_mist,
    const CancelToken& cancel_token) {
    auto valid = require_positive(invocations, "Ticket invocations");
    if (core::errors::is_error(valid)) {
        return core::errors::get_error(valid);
    }
    transactions::TransactionBuilder tx;
    const auto payment = transactions::split_payment(tx, cost_mist);
    transactions::compose_buy_limited_invocations_ticket(tx, client_.objects(), fqn, invocations,
                                                         payment);
    return submit(tx, cancel_token);
}

}  // namespace nexus::client
