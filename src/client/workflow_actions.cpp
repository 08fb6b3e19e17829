#include "client/workflow_actions.hpp"

#include "core/logging/logger.hpp"
#include "transactions/idents.hpp"

namespace nexus::client {

using core::errors::NexusError;
using core::errors::ErrorCategory;

namespace {

NexusError missing_created(const std::string& what, const std::string& digest) {
    return NexusError{ErrorCategory::Ledger,
                      "Transaction " + digest + " did not create a " + what + ".", "parsing"};
}

}  // namespace

core::errors::Result<PublishResult> WorkflowActions::publish(const transactions::Dag& dag,
                                                             const CancelToken& cancel_token) {
    transactions::TransactionBuilder tx;
    auto composed = transactions::compose_dag_publish(tx, client_.objects(), dag);
    if (core::errors::is_error(composed)) {
        return core::errors::get_error(composed);
    }

    auto submitted = client_.submit(tx, cancel_token);
    if (core::errors::is_error(submitted)) {
        return core::errors::get_error(submitted);
    }
    const auto& response = core::errors::get_value(submitted);

    auto created = find_created_object(response, transactions::idents::dag::kDag.module,
                                       transactions::idents::dag::kDag.name);
    if (!created.has_value()) {
        return missing_created("DAG", response.digest);
    }
    NEXUS_LOG_INFO("Workflow: published DAG " + created->object_id.to_hex());
    return PublishResult{response.digest, created->object_id};
}

core::errors::Result<ExecuteResult> WorkflowActions::execute(const ExecuteRequest& request,
                                                             const CancelToken& cancel_token) {
    auto inputs = commit_entry_data(request.entry_data, request.storage);
    if (core::errors::is_error(inputs)) {
        return core::errors::get_error(inputs);
    }

    auto dag = client_.shared_object_ref(request.dag_id);
    if (core::errors::is_error(dag)) {
        return core::errors::get_error(dag);
    }

    transactions::TransactionBuilder tx;
    transactions::compose_dag_execute(tx, client_.objects(), core::errors::get_value(dag),
                                      request.entry_group, core::errors::get_value(inputs));

    auto submitted = client_.submit_at_price(
        tx, request.gas_price.value_or(client_.reference_gas_price()), cancel_token);
    if (core::errors::is_error(submitted)) {
        return core::errors::get_error(submitted);
    }
    const auto& response = core::errors::get_value(submitted);

    auto created = find_created_object(response, transactions::idents::dag::kDagExecution.module,
                                       transactions::idents::dag::kDagExecution.name);
    if (!created.has_value()) {
        return missing_created("DAGExecution", response.digest);
    }
    NEXUS_LOG_INFO("Workflow: started execution " + created->object_id.to_hex());
    return ExecuteResult{response.digest, created->object_id};
}

}  // namespace nexus::client
