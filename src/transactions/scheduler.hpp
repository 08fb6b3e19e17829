#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "codec/address.hpp"
#include "core/errors/nexus_errors.hpp"
#include "ledger/ledger_types.hpp"
#include "transactions/dag.hpp"
#include "transactions/transaction_builder.hpp"
#include "types/nexus_objects.hpp"

namespace nexus::transactions {

enum class GeneratorKind { Queue, Periodic };

const char* to_string(GeneratorKind kind);
core::errors::Result<GeneratorKind> generator_kind_from_string(const std::string& text);

using TaskMetadata = std::vector<std::pair<std::string, std::string>>;

struct TaskCreateParams {
    codec::Address dag_id;
    std::string entry_group = kDefaultEntryGroup;
    VertexInputs input_data;
    TaskMetadata metadata;
    std::uint64_t execution_gas_price = 0;
    GeneratorKind generator = GeneratorKind::Queue;
};

// One sporadic occurrence. Absolute times are epoch milliseconds; offsets are
// relative to the ledger clock at execution.
struct OccurrenceRequest {
    std::optional<std::uint64_t> start_ms;
    std::optional<std::uint64_t> deadline_ms;
    std::optional<std::uint64_t> start_offset_ms;
    std::optional<std::uint64_t> deadline_offset_ms;
    std::uint64_t gas_price = 0;

    // Validates before anything is composed. Failures are
    // Ledger/configuration.
    static core::errors::Result<OccurrenceRequest> create(
        std::optional<std::uint64_t> start_ms, std::optional<std::uint64_t> deadline_ms,
        std::optional<std::uint64_t> start_offset_ms,
        std::optional<std::uint64_t> deadline_offset_ms, std::uint64_t gas_price,
        bool require_start);
};

core::errors::Status validate_occurrence(const OccurrenceRequest& request, bool require_start);

enum class OccurrenceCall { Absolute, WithOffset, RelativeFromNow };

const char* to_string(OccurrenceCall call);

// start + deadline offset -> WithOffset; start alone or with an absolute
// deadline -> Absolute; otherwise RelativeFromNow.
OccurrenceCall choose_occurrence_call(const OccurrenceRequest& request);

struct PeriodicScheduleConfig {
    std::uint64_t first_start_ms = 0;
    std::uint64_t period_ms = 0;
    std::optional<std::uint64_t> deadline_offset_ms;
    std::optional<std::uint64_t> max_iterations;
    std::uint64_t gas_price = 0;
};

enum class TaskStateAction { Pause, Resume, Cancel };

// BCS of VecMap<String, String>.
codec::Bytes metadata_to_bcs(const TaskMetadata& metadata);

// Builds metadata, constraint and execution policies, creates the task and
// shares it. Returns the share call.
Argument compose_task_create(TransactionBuilder& tx, const types::NexusObjects& objects,
                             const TaskCreateParams& params);

// `task` is the shared task object with its initial shared version.
Argument compose_update_metadata(TransactionBuilder& tx, const types::NexusObjects& objects,
                                 const ledger::ObjectRef& task, const TaskMetadata& metadata);

core::errors::Result<Argument> compose_add_occurrence(TransactionBuilder& tx,
                                                      const types::NexusObjects& objects,
                                                      const ledger::ObjectRef& task,
                                                      const OccurrenceRequest& request);

core::errors::Result<Argument> compose_configure_periodic(TransactionBuilder& tx,
                                                          const types::NexusObjects& objects,
                                                          const ledger::ObjectRef& task,
                                                          const PeriodicScheduleConfig& config);

Argument compose_disable_periodic(TransactionBuilder& tx, const types::NexusObjects& objects,
                                  const ledger::ObjectRef& task);

Argument compose_set_task_state(TransactionBuilder& tx, const types::NexusObjects& objects,
                                const ledger::ObjectRef& task, TaskStateAction action);

// Consumes the next due occurrence and starts the DAG through the default TAP.
Argument compose_execute_scheduled_occurrence(TransactionBuilder& tx,
                                              const types::NexusObjects& objects,
                                              const ledger::ObjectRef& task,
                                              const ledger::ObjectRef& dag);

}  // namespace nexus::transactions
