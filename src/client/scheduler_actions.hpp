#pragma once

#include <optional>
#include <string>
#include "client/nexus_client.hpp"
#include "codec/address.hpp"
#include "core/errors/nexus_errors.hpp"
#include "events/event_kinds.hpp"
#include "transactions/scheduler.hpp"

namespace nexus::client {

struct CreateTaskResult {
    std::string tx_digest;
    codec::Address task_id;
    // Present when an initial occurrence was requested.
    std::optional<std::string> schedule_tx_digest;
    std::optional<events::OccurrenceScheduled> initial_schedule;
};

struct ScheduleResult {
    std::string tx_digest;
    std::optional<events::OccurrenceScheduled> scheduled;
};

struct PeriodicResult {
    std::string tx_digest;
    std::optional<events::PeriodicScheduleConfigured> configured;
};

class SchedulerActions {
public:
    explicit SchedulerActions(NexusClient& client) : client_(client) {}

    // Creates and shares the task, then schedules `initial_occurrence` in a
    // second transaction. The occurrence is validated before anything is
    // submitted.
    core::errors::Result<CreateTaskResult> create_task(
        const transactions::TaskCreateParams& params,
        const std::optional<transactions::OccurrenceRequest>& initial_occurrence = std::nullopt,
        const CancelToken& cancel_token = nullptr);

    core::errors::Result<std::string> update_metadata(const codec::Address& task_id,
                                                      const transactions::TaskMetadata& metadata,
                                                      const CancelToken& cancel_token = nullptr);

    core::errors::Result<std::string> set_task_state(const codec::Address& task_id,
                                                     transactions::TaskStateAction action,
                                                     const CancelToken& cancel_token = nullptr);

    core::errors::Result<ScheduleResult> add_occurrence(
        const codec::Address& task_id, const transactions::OccurrenceRequest& request,
        const CancelToken& cancel_token = nullptr);

    core::errors::Result<PeriodicResult> configure_periodic(
        const codec::Address& task_id, const transactions::PeriodicScheduleConfig& config,
        const CancelToken& cancel_token = nullptr);

    core::errors::Result<std::string> disable_periodic(const codec::Address& task_id,
                                                       const CancelToken& cancel_token = nullptr);

private:
    template <typename Compose>
    core::errors::Result<SubmittedTransaction> submit_for_task(const codec::Address& task_id,
                                                               Compose compose,
                                                               const CancelToken& cancel_token);

    template <typename Kind>
    core::errors::Result<std::optional<Kind>> find_event(const SubmittedTransaction& tx) const;

    NexusClient& client_;
};

}  // namespace nexus::client
