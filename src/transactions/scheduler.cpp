#include "transactions/scheduler.hpp"

#include <utility>
#include <vector>
#include "codec/bcs.hpp"
#include "transactions/idents.hpp"

namespace nexus::transactions {

using core::errors::NexusError;
using core::errors::ErrorCategory;

namespace {

NexusError schedule_error(const std::string& message) {
    return NexusError{ErrorCategory::Ledger, message, "configuration"};
}

// BCS of vector<policy::Symbol> holding one witness symbol.
codec::Bytes witness_sequence(const std::string& witness_type_name) {
    codec::BcsWriter writer;
    writer.uleb128(1);
    writer.uleb128(0);
    writer.string(witness_type_name);
    return writer.take();
}

Argument task_input(TransactionBuilder& tx, const ledger::ObjectRef& task) {
    return shared_input(tx, task, true);
}

}  // namespace

const char* to_string(const GeneratorKind kind) {
    return kind == GeneratorKind::Queue ? "queue" : "periodic";
}

core::errors::Result<GeneratorKind> generator_kind_from_string(const std::string& text) {
    if (text == "queue") {
        return GeneratorKind::Queue;
    }
    if (text == "periodic") {
        return GeneratorKind::Periodic;
    }
    return schedule_error("Unknown generator '" + text + "', expected queue or periodic.");
}

const char* to_string(const OccurrenceCall call) {
    switch (call) {
        case OccurrenceCall::Absolute:        return "add_occurrence_absolute";
        case OccurrenceCall::WithOffset:      return "add_occurrence_with_offset";
        case OccurrenceCall::RelativeFromNow: return "add_occurrence_with_offsets_from_now";
    }
    return "unknown";
}

core::errors::Status validate_occurrence(const OccurrenceRequest& request,
                                         const bool require_start) {
    const bool has_start = request.start_ms.has_value();
    const bool has_start_offset = request.start_offset_ms.has_value();

    if (require_start && !has_start && !has_start_offset) {
        return schedule_error("Provide either an absolute start or a start offset");
    }
    if (request.deadline_ms.has_value() && !has_start) {
        return schedule_error("Absolute deadlines require an absolute start time");
    }
    if (!has_start && !has_start_offset &&
        (request.deadline_ms.has_value() || request.deadline_offset_ms.has_value())) {
        return schedule_error("Deadline flags require a corresponding start flag");
    }
    if (has_start && request.deadline_ms.has_value() && *request.deadline_ms < *request.start_ms) {
        return schedule_error("Deadline (" + std::to_string(*request.deadline_ms) +
                              ") cannot be earlier than start (" +
                              std::to_string(*request.start_ms) + ")");
    }
    if (request.deadline_offset_ms.has_value() && !has_start && !has_start_offset) {
        return schedule_error("Deadline offset requires either an absolute start or a start offset");
    }
    return core::errors::ok();
}

core::errors::Result<OccurrenceRequest> OccurrenceRequest::create(
    std::optional<std::uint64_t> start_ms, std::optional<std::uint64_t> deadline_ms,
    std::optional<std::uint64_t> start_offset_ms, std::optional<std::uint64_t> deadline_offset_ms,
    const std::uint64_t gas_price, const bool require_start) {
    OccurrenceRequest request{start_ms, deadline_ms, start_offset_ms, deadline_offset_ms,
                              gas_price};
    auto status = validate_occurrence(request, require_start);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    return request;
}

OccurrenceCall choose_occurrence_call(const OccurrenceRequest& request) {
    if (request.start_ms.has_value()) {
        return request.deadline_offset_ms.has_value() ? OccurrenceCall::WithOffset
                                                      : OccurrenceCall::Absolute;
    }
    return OccurrenceCall::RelativeFromNow;
}

codec::Bytes metadata_to_bcs(const TaskMetadata& metadata) {
    codec::BcsWriter writer;
    writer.uleb128(metadata.size());
    for (const auto& entry : metadata) {
        writer.string(entry.first);
        writer.string(entry.second);
    }
    return writer.take();
}

Argument compose_task_create(TransactionBuilder& tx, const types::NexusObjects& objects,
                             const TaskCreateParams& params) {
    const auto& pkg = objects.workflow_pkg_id;

    const auto metadata =
        call(tx, pkg, idents::scheduler::kNewMetadata, {tx.pure(metadata_to_bcs(params.metadata))});

    const bool periodic = params.generator == GeneratorKind::Periodic;
    const auto witness = periodic ? idents::scheduler::kPeriodicGeneratorWitness
                                  : idents::scheduler::kQueueGeneratorWitness;
    const auto constraints =
        call(tx, pkg, idents::scheduler::kNewConstraintsPolicy,
             {tx.pure(witness_sequence(type_name_string(pkg, witness)))});
    const auto state = call(tx, pkg,
                            periodic ? idents::scheduler::kNewPeriodicGeneratorState
                                     : idents::scheduler::kNewQueueGeneratorState,
                            {});
    call(tx, pkg,
         periodic ? idents::scheduler::kRegisterPeriodicGenerator
                  : idents::scheduler::kRegisterQueueGenerator,
         {constraints, state});

    const auto execution = call(
        tx, pkg, idents::scheduler::kNewExecutionPolicy,
        {tx.pure(witness_sequence(
            type_name_string(pkg, idents::default_tap::kBeginDagExecutionWitness)))});
    const auto config =
        call(tx, pkg, idents::dag::kNewDagExecutionConfig,
             {tx.pure_address(params.dag_id), tx.pure_address(objects.network_id),
              tx.pure_string(params.entry_group), tx.pure(vertex_inputs_to_bcs(params.input_data)),
              tx.pure_u64(params.execution_gas_price)});
    call(tx, pkg, idents::default_tap::kRegisterBeginExecution, {execution, config});

    const auto task = call(tx, pkg, idents::scheduler::kNew, {metadata, constraints, execution});
    return share_object(tx, task, struct_type(pkg, idents::scheduler::kTask));
}

Argument compose_update_metadata(TransactionBuilder& tx, const types::NexusObjects& objects,
                                 const ledger::ObjectRef& task, const TaskMetadata& metadata) {
    const auto& pkg = objects.workflow_pkg_id;
    const auto task_arg = task_input(tx, task);
    const auto metadata_arg =
        call(tx, pkg, idents::scheduler::kNewMetadata, {tx.pure(metadata_to_bcs(metadata))});
    return call(tx, pkg, idents::scheduler::kUpdateMetadata, {task_arg, metadata_arg});
}

core::errors::Result<Argument> compose_add_occurrence(TransactionBuilder& tx,
                                                      const types::NexusObjects& objects,
                                                      const ledger::ObjectRef& task,
                                                      const OccurrenceRequest& request) {
    auto status = validate_occurrence(request, false);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }

    const auto task_arg = task_input(tx, task);
    switch (choose_occurrence_call(request)) {
        case OccurrenceCall::Absolute: {
            std::vector<Argument> args{task_arg, tx.pure_u64(*request.start_ms),
                                       tx.pure(codec::bcs_option_u64(request.deadline_ms)),
                                       tx.pure_u64(request.gas_price), clock_input(tx)};
            return call(tx, objects.workflow_pkg_id, idents::scheduler::kAddOccurrenceAbsolute,
                        std::move(args));
        }
        case OccurrenceCall::WithOffset: {
            std::vector<Argument> args{task_arg, tx.pure_u64(*request.start_ms),
                                       tx.pure(codec::bcs_option_u64(request.deadline_offset_ms)),
                                       tx.pure_u64(request.gas_price), clock_input(tx)};
            return call(tx, objects.workflow_pkg_id, idents::scheduler::kAddOccurrenceWithOffset,
                        std::move(args));
        }
        case OccurrenceCall::RelativeFromNow:
            break;
    }
    // No start at all means "as soon as possible".
    std::vector<Argument> args{task_arg, tx.pure_u64(request.start_offset_ms.value_or(0)),
                               tx.pure(codec::bcs_option_u64(request.deadline_offset_ms)),
                               tx.pure_u64(request.gas_price), clock_input(tx)};
    return call(tx, objects.workflow_pkg_id, idents::scheduler::kAddOccurrenceRelative,
                std::move(args));
}

core::errors::Result<Argument> compose_configure_periodic(TransactionBuilder& tx,
                                                          const types::NexusObjects& objects,
                                                          const ledger::ObjectRef& task,
                                                          const PeriodicScheduleConfig& config) {
    if (config.period_ms == 0) {
        return schedule_error("Period must be greater than zero");
    }
    if (config.max_iterations.has_value() && *config.max_iterations == 0) {
        return schedule_error("Max iterations must be greater than zero when set");
    }
    std::vector<Argument> args{task_input(tx, task),
                               tx.pure_u64(config.first_start_ms),
                               tx.pure_u64(config.period_ms),
                               tx.pure(codec::bcs_option_u64(config.deadline_offset_ms)),
                               tx.pure(codec::bcs_option_u64(config.max_iterations)),
                               tx.pure_u64(config.gas_price)};
    return call(tx, objects.workflow_pkg_id, idents::scheduler::kNewOrModifyPeriodic,
                std::move(args));
}

Argument compose_disable_periodic(TransactionBuilder& tx, const types::NexusObjects& objects,
                                  const ledger::ObjectRef& task) {
    return call(tx, objects.workflow_pkg_id, idents::scheduler::kDisablePeriodic,
                {task_input(tx, task)});
}

Argument compose_set_task_state(TransactionBuilder& tx, const types::NexusObjects& objects,
                                const ledger::ObjectRef& task, const TaskStateAction action) {
    MoveIdent ident = idents::scheduler::kPause;
    if (action == TaskStateAction::Resume) {
        ident = idents::scheduler::kResume;
    } else if (action == TaskStateAction::Cancel) {
        ident = idents::scheduler::kCancel;
    }
    return call(tx, objects.workflow_pkg_id, ident, {task_input(tx, task)});
}

Argument compose_execute_scheduled_occurrence(TransactionBuilder& tx,
                                              const types::NexusObjects& objects,
                                              const ledger::ObjectRef& task,
                                              const ledger::ObjectRef& dag) {
    const auto& pkg = objects.workflow_pkg_id;
    const auto task_arg = task_input(tx, task);
    call(tx, pkg, idents::scheduler::kCheckTimeConstraint, {task_arg, clock_input(tx)});

    std::vector<Argument> args{shared_input(tx, objects.default_tap, true), task_arg,
                               shared_input(tx, dag, false),
                               shared_input(tx, objects.gas_service, true), clock_input(tx)};
    return call(tx, pkg, idents::default_tap::kDagBeginExecutionFromScheduler, std::move(args));
}

}  // namespace nexus::transactions
