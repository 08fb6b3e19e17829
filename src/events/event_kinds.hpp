#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "codec/address.hpp"
#include "codec/bytes.hpp"
#include "core/errors/nexus_errors.hpp"
#include "types/nexus_types.hpp"
#include "types/type_tag.hpp"

namespace nexus::events {

using types::StructTag;
using types::TypeTag;

// Reserved discriminator the decoder splices into event payloads.
inline constexpr const char* kEventTypeKey = "_nexus_event_type";
inline constexpr const char* kScheduledExecutionName = "RequestScheduledExecution";

struct NexusEventKind;

struct RequestWalkExecution {
    codec::Address dag;
    codec::Address execution;
    codec::Address invoker;
    std::uint64_t walk_index = 0;
    types::RuntimeVertex next_vertex;
    codec::Address evaluations;
    types::TypeName worksheet_from_type;
};

struct AnnounceInterfacePackage {
    std::vector<types::SharedObjectRef> shared_objects;
};

// Emitted under ToolRegisteredEvent and the off-chain/on-chain specific names.
struct ToolRegistered {
    enum class Origin { Any, OffChain, OnChain };

    codec::Address tool;
    types::ToolFqn fqn;
    Origin origin = Origin::Any;
};

struct ToolUnregistered {
    codec::Address tool;
    types::ToolFqn fqn;
};

struct WalkAdvanced {
    codec::Address dag;
    codec::Address execution;
    std::uint64_t walk_index = 0;
    types::RuntimeVertex vertex;
    types::TypeName variant;
    types::PortsData variant_ports_to_data;
};

struct WalkFailed {
    codec::Address dag;
    codec::Address execution;
    std::uint64_t walk_index = 0;
    types::RuntimeVertex vertex;
    std::string reason;
};

struct EndStateReached {
    codec::Address dag;
    codec::Address execution;
    std::uint64_t walk_index = 0;
    types::RuntimeVertex vertex;
    types::TypeName variant;
    types::PortsData variant_ports_to_data;
};

struct ExecutionFinished {
    codec::Address dag;
    codec::Address execution;
    bool has_any_walk_failed = false;
    bool has_any_walk_succeeded = false;
};

// Carries another event; its kind is named by the wrapper's type parameter,
// not by the payload.
struct RequestScheduledExecution {
    std::shared_ptr<const NexusEventKind> request;
    std::uint64_t priority = 0;
    std::uint64_t request_ms = 0;
    std::uint64_t start_ms = 0;
    std::uint64_t deadline_ms = 0;
};

struct OccurrenceScheduled {
    codec::Address task;
    types::PolicySymbol generator;
};

struct MissedOccurrence {
    codec::Address task;
    std::uint64_t start_time_ms = 0;
    std::optional<std::uint64_t> deadline_ms;
    std::uint64_t pruned_at = 0;
    std::uint64_t priority_fee_per_gas_unit = 0;
    types::PolicySymbol generator;
};

struct TaskCreated {
    codec::Address task;
    codec::Address owner;
};

struct TaskPaused {
    codec::Address task;
};

struct TaskResumed {
    codec::Address task;
};

struct TaskCanceled {
    codec::Address task;
    std::uint64_t cleared_occurrences = 0;
    bool had_periodic = false;
};

struct OccurrenceConsumed {
    codec::Address task;
    std::uint64_t start_time_ms = 0;
    std::optional<std::uint64_t> deadline_ms;
    std::uint64_t priority_fee_per_gas_unit = 0;
    types::PolicySymbol generator;
    std::uint64_t executed_at = 0;
};

struct PeriodicScheduleConfigured {
    codec::Address task;
    std::optional<std::uint64_t> period_ms;
    std::optional<std::uint64_t> deadline_offset_ms;
    std::optional<std::uint64_t> max_iterations;
    std::optional<std::uint64_t> generated;
    std::optional<std::uint64_t> priority_fee_per_gas_unit;
    std::optional<std::uint64_t> last_generated_start_ms;
};

struct FoundingLeaderCapCreated {
    codec::Address leader_cap;
    codec::Address network;
};

struct GasSettlementUpdate {
    codec::Address execution;
    types::ToolFqn tool_fqn;
    types::RuntimeVertex vertex;
    bool was_settled = false;
};

struct PreKeyVaultCreated {
    codec::Address vault;
    codec::Address crypto_cap;
};

struct PreKeyRequested {
    codec::Address requested_by;
};

struct PreKeyFulfilled {
    codec::Address requested_by;
    codec::Bytes pre_key_bytes;
};

struct PreKeyAssociated {
    codec::Address claimed_by;
    codec::Bytes pre_key;
    codec::Bytes initial_message;
};

struct DAGCreated {
    codec::Address dag;
};

struct ToolRegistryCreated {
    codec::Address registry;
    codec::Address slashing_cap;
};

// Kinds kept as raw JSON: DAG construction steps, gas claims and owner
// allow-list changes.
struct OpaqueEvent {
    std::string name;
    nlohmann::json payload;
};

using EventKindVariant = std::variant<
    RequestWalkExecution, AnnounceInterfacePackage, ToolRegistered, ToolUnregistered,
    WalkAdvanced, WalkFailed, EndStateReached, ExecutionFinished, RequestScheduledExecution,
    OccurrenceScheduled, MissedOccurrence, TaskCreated, TaskPaused, TaskResumed, TaskCanceled,
    OccurrenceConsumed, PeriodicScheduleConfigured, FoundingLeaderCapCreated,
    GasSettlementUpdate, PreKeyVaultCreated, PreKeyRequested, PreKeyFulfilled, PreKeyAssociated,
    DAGCreated, ToolRegistryCreated, OpaqueEvent>;

struct NexusEventKind {
    EventKindVariant value;

    // Ledger struct name, e.g. "WalkAdvancedEvent".
    std::string name() const;
    // Module the struct lives in, used when emitting type tags.
    std::string module() const;

    template <typename T>
    const T* as() const {
        return std::get_if<T>(&value);
    }
};

// `event` is the bare payload object; scheduled requests inside it must
// already be tagged as {_nexus_event_type, event}.
core::errors::Result<NexusEventKind> kind_from_json(const std::string& name,
                                                    const nlohmann::json& event);
// {_nexus_event_type: name, event: {...}}
core::errors::Result<NexusEventKind> kind_from_tagged_json(const nlohmann::json& tagged);

// Bare payload as the ledger emits it; scheduled requests are untagged.
nlohmann::json kind_to_json(const NexusEventKind& kind);

bool is_known_event_name(const std::string& name);

}  // namespace nexus::events
