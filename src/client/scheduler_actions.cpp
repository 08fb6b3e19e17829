#include "client/scheduler_actions.hpp"

#include <utility>
#include "core/logging/logger.hpp"
#include "transactions/idents.hpp"

namespace nexus::client {

using core::errors::NexusError;
using core::errors::ErrorCategory;

namespace {

const char* action_name(const transactions::TaskStateAction action) {
    switch (action) {
        case transactions::TaskStateAction::Pause:
            return "pause";
        case transactions::TaskStateAction::Resume:
            return "resume";
        case transactions::TaskStateAction::Cancel:
            return "cancel";
    }
    return "unknown";
}

}  // namespace

template <typename Compose>
core::errors::Result<SubmittedTransaction> SchedulerActions::submit_for_task(
    const codec::Address& task_id, Compose compose, const CancelToken& cancel_token) {
    auto task = client_.shared_object_ref(task_id);
    if (core::errors::is_error(task)) {
        return core::errors::get_error(task);
    }
    transactions::TransactionBuilder tx;
    core::errors::Status composed = compose(tx, core::errors::get_value(task));
    if (core::errors::is_error(composed)) {
        return core::errors::get_error(composed);
    }
    return client_.submit(tx, cancel_token);
}

template <typename Kind>
core::errors::Result<std::optional<Kind>> SchedulerActions::find_event(
    const SubmittedTransaction& tx) const {
    auto decoded = client_.nexus_events(tx);
    if (core::errors::is_error(decoded)) {
        return core::errors::get_error(decoded);
    }
    for (const auto& event : core::errors::get_value(decoded)) {
        if (const auto* kind = event.data.as<Kind>()) {
            return std::optional<Kind>{*kind};
        }
    }
    return std::optional<Kind>{};
}

core::errors::Result<CreateTaskResult> SchedulerActions::create_task(
    const transactions::TaskCreateParams& params,
    const std::optional<transactions::OccurrenceRequest>& initial_occurrence,
    const CancelToken& cancel_token) {
    if (initial_occurrence.has_value()) {
        auto valid = transactions::validate_occurrence(*initial_occurrence, false);
        if (core::errors::is_error(valid)) {
            return core::errors::get_error(valid);
        }
    }

    transactions::TransactionBuilder tx;
    transactions::compose_task_create(tx, client_.objects(), params);
    auto submitted = client_.submit(tx, cancel_token);
    if (core::errors::is_error(submitted)) {
        return core::errors::get_error(submitted);
    }
    const auto& created = core::errors::get_value(submitted);

    CreateTaskResult result;
    result.tx_digest = created.digest;

    auto task_created = find_event<events::TaskCreated>(created);
    if (core::errors::is_error(task_created)) {
        return core::errors::get_error(task_created);
    }
    if (core::errors::get_value(task_created).has_value()) {
        result.task_id = core::errors::get_value(task_created)->task;
    } else {
        auto object = find_created_object(created, transactions::idents::scheduler::kTask.module,
                                          transactions::idents::scheduler::kTask.name);
        if (!object.has_value()) {
            return NexusError{ErrorCategory::Ledger,
                              "Transaction " + created.digest + " did not create a Task.",
                              "parsing"};
        }
        result.task_id = object->object_id;
    }
    NEXUS_LOG_INFO("Scheduler: created task " + result.task_id.to_hex());

    if (!initial_occurrence.has_value()) {
        return result;
    }
    auto scheduled = add_occurrence(result.task_id, *initial_occurrence, cancel_token);
    if (core::errors::is_error(scheduled)) {
        auto error = core::errors::get_error(scheduled);
        error.hint = "Task " + result.task_id.to_hex() +
                     " was created; retry scheduling against it.";
        return error;
    }
    auto& schedule = std::get<ScheduleResult>(scheduled);
    result.schedule_tx_digest = std::move(schedule.tx_digest);
    result.initial_schedule = std::move(schedule.scheduled);
    return result;
}

core::errors::Result<std::string> SchedulerActions::update_metadata(
    const codec::Address& task_id, const transactions::TaskMetadata& metadata,
    const CancelToken& cancel_token) {
    auto submitted = submit_for_task(
        task_id,
        [&](transactions::TransactionBuilder& tx, const ledger::ObjectRef& task) {
            transactions::compose_update_metadata(tx, client_.objects(), task, metadata);
            return core::errors::ok();
        },
        cancel_token);
    if (core::errors::is_error(submitted)) {
        return core::errors::get_error(submitted);
    }
    return core::errors::get_value(submitted).digest;
}

core::errors::Result<std::string> SchedulerActions::set_task_state(
    const codec::Address& task_id, const transactions::TaskStateAction action,
    const CancelToken& cancel_token) {
    auto submitted = submit_for_task(
        task_id,
        [&](transactions::TransactionBuilder& tx, const ledger::ObjectRef& task) {
            transactions::compose_set_task_state(tx, client_.objects(), task, action);
            return core::errors::ok();
        },
        cancel_token);
    if (core::errors::is_error(submitted)) {
        return core::errors::get_error(submitted);
    }
    NEXUS_LOG_INFO(std::string("Scheduler: ") + action_name(action) + " task " +
                   task_id.to_hex());
    return core::errors::get_value(submitted).digest;
}

core::errors::Result<ScheduleResult> SchedulerActions::add_occurrence(
    const codec::Address& task_id, const transactions::OccurrenceRequest& request,
    const CancelToken& cancel_token) {
    auto submitted = submit_for_task(
        task_id,
        [&](transactions::TransactionBuilder& tx,
            const ledger::ObjectRef& task) -> core::errors::Status {
            auto composed =
                transactions::compose_add_occurrence(tx, client_.objects(), task, request);
            if (core::errors::is_error(composed)) {
                return core::errors::get_error(composed);
            }
            return core::errors::ok();
        },
        cancel_token);
    if (core::errors::is_error(submitted)) {
        return core::errors::get_error(submitted);
    }
    const auto& response = core::errors::get_value(submitted);

    auto scheduled = find_event<events::OccurrenceScheduled>(response);
    if (core::errors::is_error(scheduled)) {
        return core::errors::get_error(scheduled);
    }
    return ScheduleResult{response.digest, core::errors::get_value(scheduled)};
}

core::errors::Result<PeriodicResult> SchedulerActions::configure_periodic(
    const codec::Address& task_id, const transactions::PeriodicScheduleConfig& config,
    const CancelToken& cancel_token) {
    auto submitted = submit_for_task(
        task_id,
        [&](transactions::TransactionBuilder& tx,
            const ledger::ObjectRef& task) -> core::errors::Status {
            auto composed =
                transactions::compose_configure_periodic(tx, client_.objects(), task, config);
            if (core::errors::is_error(composed)) {
                return core::errors::get_error(composed);
            }
            return core::errors::ok();
        },
        cancel_token);
    if (core::errors::is_error(submitted)) {
        return core::errors::get_error(submitted);
    }
    const auto& response = core::errors::get_value(submitted);

    auto configured = find_event<events::PeriodicScheduleConfigured>(response);
    if (core::errors::is_error(configured)) {
        return core::errors::get_error(configured);
    }
    return PeriodicResult{response.digest, core::errors::get_value(configured)};
}

core::errors::Result<std::string> SchedulerActions::disable_periodic(
    const codec::Address& task_id, const CancelToken& cancel_token) {
    auto submitted = submit_for_task(
        task_id,
        [&](transactions::TransactionBuilder& tx, const ledger::ObjectRef& task) {
            transactions::compose_disable_periodic(tx, client_.objects(), task);
            return core::errors::ok();
        },
        cancel_token);
    if (core::errors::is_error(submitted)) {
        return core::errors::get_error(submitted);
    }
    return core::errors::get_value(submitted).digest;
}

}  // namespace nexus::client
