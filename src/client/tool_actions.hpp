#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "client/nexus_client.hpp"
#include "codec/address.hpp"
#include "core/errors/nexus_errors.hpp"
#include "transactions/tool.hpp"
#include "types/nexus_types.hpp"

namespace nexus::client {

struct RegisteredTool {
    std::string tx_digest;
    std::optional<codec::Address> tool_id;
    codec::Address owner_cap_over_tool;
    // Off-chain tools only.
    std::optional<codec::Address> owner_cap_over_gas;
};

class ToolActions {
public:
    explicit ToolActions(NexusClient& client) : client_(client) {}

    // Collateral is split off the gas coin. Both caps go to the signer.
    core::errors::Result<RegisteredTool> register_off_chain(
        const transactions::OffChainToolMeta& meta, std::uint64_t collateral_mist,
        std::uint64_t invocation_cost_mist, const CancelToken& cancel_token = nullptr);

    core::errors::Result<RegisteredTool> register_on_chain(
        const transactions::OnChainToolMeta& meta, std::uint64_t collateral_mist,
        const CancelToken& cancel_token = nullptr);

    core::errors::Result<std::string> set_invocation_cost(
        const types::ToolFqn& fqn, const codec::Address& owner_cap_over_gas,
        std::uint64_t invocation_cost_mist, const CancelToken& cancel_token = nullptr);

    core::errors::Result<std::string> unregister(const types::ToolFqn& fqn,
                                                 const codec::Address& owner_cap_over_tool,
                                                 const CancelToken& cancel_token = nullptr);

    core::errors::Result<std::string> claim_collateral(const types::ToolFqn& fqn,
                                                       const codec::Address& owner_cap_over_tool,
                                                       const CancelToken& cancel_token = nullptr);

private:
    core::errors::Result<RegisteredTool> registered_from(const SubmittedTransaction& tx,
                                                         bool expect_gas_cap) const;

    NexusClient& client_;
};

}  // namespace nexus::client
