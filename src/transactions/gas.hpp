#pragma once

#include <cstdint>
#include "codec/address.hpp"
#include "ledger/ledger_types.hpp"
#include "transactions/transaction_builder.hpp"
#include "types/nexus_objects.hpp"
#include "types/nexus_types.hpp"

namespace nexus::transactions {

// Converts `coin` into a balance and credits it to `invoker`'s gas budget.
Argument compose_add_gas_budget(TransactionBuilder& tx, const types::NexusObjects& objects,
                                const codec::Address& invoker, Argument coin);

// Expiry tickets: the tool owner sets a per-minute price, invokers buy
// minutes.
Argument compose_enable_expiry(TransactionBuilder& tx, const types::NexusObjects& objects,
                               const types::ToolFqn& fqn,
                               const ledger::ObjectRef& owner_cap_over_gas,
                               std::uint64_t cost_per_minute);
Argument compose_disable_expiry(TransactionBuilder& tx, const types::NexusObjects& objects,
                                const types::ToolFqn& fqn,
                                const ledger::ObjectRef& owner_cap_over_gas);
Argument compose_buy_expiry_ticket(TransactionBuilder& tx, const types::NexusObjects& objects,
                                   const types::ToolFqn& fqn, std::uint64_t minutes,
                                   Argument pay_with);

// Limited-invocation tickets: bounded bundles of invocations.
Argument compose_enable_limited_invocations(TransactionBuilder& tx,
                                            const types::NexusObjects& objects,
                                            const types::ToolFqn& fqn,
                                            const ledger::ObjectRef& owner_cap_over_gas,
                                            std::uint64_t cost_per_invocation,
                                            std::uint64_t min_invocations,
                                            std::uint64_t max_invocations);
Argument compose_disable_limited_invocations(TransactionBuilder& tx,
                                             const types::NexusObjects& objects,
                                             const types::ToolFqn& fqn,
                                             const ledger::ObjectRef& owner_cap_over_gas);
Argument compose_buy_limited_invocations_ticket(TransactionBuilder& tx,
                                                const types::NexusObjects& objects,
                                                const types::ToolFqn& fqn,
                                                std::uint64_t invocations, Argument pay_with);

}  // namespace nexus::transactions
