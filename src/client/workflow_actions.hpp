#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "client/artifact_storage.hpp"
#include "client/nexus_client.hpp"
#include "codec/address.hpp"
#include "core/errors/nexus_errors.hpp"
#include "transactions/dag.hpp"

namespace nexus::client {

struct PublishResult {
    std::string tx_digest;
    codec::Address dag_object_id;
};

struct ExecuteRequest {
    codec::Address dag_id;
    // {"vertex": {"port": <json>}}
    nlohmann::json entry_data;
    // Per-unit price of the execute transaction; the reference price when
    // unset.
    std::optional<std::uint64_t> gas_price;
    std::string entry_group = transactions::kDefaultEntryGroup;
    StorageConf storage;
};

struct ExecuteResult {
    std::string tx_digest;
    codec::Address execution_id;
};

class WorkflowActions {
public:
    explicit WorkflowActions(NexusClient& client) : client_(client) {}

    core::errors::Result<PublishResult> publish(const transactions::Dag& dag,
                                                const CancelToken& cancel_token = nullptr);

    // Commits entry data to storage, then begins the execution through the
    // default TAP.
    core::errors::Result<ExecuteResult> execute(const ExecuteRequest& request,
                                                const CancelToken& cancel_token = nullptr);

private:
    NexusClient& client_;
};

}  // namespace nexus::client
