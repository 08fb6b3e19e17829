#pragma once

#include <cstdint>
#include <string>
#include "client/nexus_client.hpp"
#include "codec/address.hpp"
#include "core/errors/nexus_errors.hpp"
#include "types/nexus_types.hpp"

namespace nexus::client {

// Gas budget and ticket actions. Payments are split off the leased gas
// coin; owner actions take the tool's CloneableOwnerCap<OverGas>.
class GasActions {
public:
    explicit GasActions(NexusClient& client) : client_(client) {}

    // Credits `amount_mist` to the signer's invoker budget.
    core::errors::Result<std::string> add_budget(std::uint64_t amount_mist,
                                                 const CancelToken& cancel_token = nullptr);

    core::errors::Result<std::string> enable_expiry(const types::ToolFqn& fqn,
                                                    const codec::Address& owner_cap_over_gas,
                                                    std::uint64_t cost_per_minute,
                                                    const CancelToken& cancel_token = nullptr);
    core::errors::Result<std::string> disable_expiry(const types::ToolFqn& fqn,
                                                     const codec::Address& owner_cap_over_gas,
                                                     const CancelToken& cancel_token = nullptr);
    core::errors::Result<std::string> buy_expiry_ticket(const types::ToolFqn& fqn,
                                                        std::uint64_t minutes,
                                                        std::uint64_t cost_mist,
                                                        const CancelToken& cancel_token = nullptr);

    core::errors::Result<std::string> enable_limited_invocations(
        const types::ToolFqn& fqn, const codec::Address& owner_cap_over_gas,
        std::uint64_t cost_per_invocation, std::uint64_t min_invocations,
        std::uint64_t max_invocations, const CancelToken& cancel_token = nullptr);
    core::errors::Result<std::string> disable_limited_invocations(
        const types::ToolFqn& fqn, const codec::Address& owner_cap_over_gas,
        const CancelToken& cancel_token = nullptr);
    core::errors::Result<std::string> buy_limited_invocations_ticket(
        const types::ToolFqn& fqn, std::uint64_t invocations, std::uint64_t cost_mist,
        const CancelToken& cancel_token = nullptr);

private:
    core::errors::Result<std::string> submit(const transactions::TransactionBuilder& tx,
                                             const CancelToken& cancel_token);

    NexusClient& client_;
};

}  // namespace nexus::client
