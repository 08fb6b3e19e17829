#include "events/event_kinds.hpp"

#include <utility>
#include "codec/stringified.hpp"

namespace nexus::events {

using core::errors::NexusError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr const char* kOpaqueEventNames[] = {
    "DAGVertexAddedEvent",
    "DAGEdgeAddedEvent",
    "DAGOutputAddedEvent",
    "DAGEntryVertexInputPortAddedEvent",
    "DAGDefaultValueAddedEvent",
    "LeaderClaimedGasEvent",
    "AllowedOwnerAddedEvent",
    "AllowedOwnerRemovedEvent",
};

NexusError malformed(const std::string& reason) {
    return NexusError{ErrorCategory::Event, reason + ".", "malformed_payload"};
}

// Reads typed fields off one payload object and keeps the first failure,
// so each kind parser reads straight through and checks once at the end.
class FieldReader {
public:
    explicit FieldReader(const json& object) : object_(object) {}

    codec::Address address(const char* field) { return take(codec::read_address(object_, field)); }
    std::uint64_t u64(const char* field) { return take(codec::read_u64(object_, field)); }
    std::optional<std::uint64_t> optional_u64(const char* field) {
        return take(codec::read_optional_u64(object_, field));
    }
    bool boolean(const char* field) { return take(codec::read_bool(object_, field)); }
    std::string string(const char* field) { return take(codec::read_string(object_, field)); }
    codec::Bytes bytes(const char* field) { return take(codec::read_byte_array(object_, field)); }

    types::RuntimeVertex vertex(const char* field) {
        return take(nested(field, types::runtime_vertex_from_json));
    }
    types::TypeName type_name(const char* field) {
        return take(nested(field, types::type_name_from_json));
    }
    types::ToolFqn fqn(const char* field) { return take(nested(field, types::tool_fqn_from_json)); }
    types::PolicySymbol policy_symbol(const char* field) {
        return take(nested(field, types::policy_symbol_from_json));
    }
    types::PortsData ports_data(const char* field) {
        return take(nested(field, types::ports_data_from_json));
    }

    const json* raw(const char* field) {
        if (!object_.is_object() || !object_.contains(field)) {
            record(malformed(std::string("Missing field '") + field + "'"));
            return nullptr;
        }
        return &object_.at(field);
    }

    void record(NexusError error) {
        if (!error_.has_value()) {
            error_ = std::move(error);
        }
    }

    const std::optional<NexusError>& error() const { return error_; }

private:
    template <typename T>
    T take(core::errors::Result<T> result) {
        if (core::errors::is_error(result)) {
            record(core::errors::get_error(result));
            return T{};
        }
        return core::errors::take_value(result);
    }

    template <typename Fn>
    auto nested(const char* field, Fn fn) -> decltype(fn(std::declval<const json&>())) {
        if (!object_.is_object() || !object_.contains(field)) {
            return malformed(std::string("Missing field '") + field + "'");
        }
        return fn(object_.at(field));
    }

    const json& object_;
    std::optional<NexusError> error_;
};

template <typename T>
core::errors::Result<NexusEventKind> finish(const FieldReader& reader, T kind) {
    if (reader.error().has_value()) {
        return *reader.error();
    }
    return NexusEventKind{EventKindVariant{std::move(kind)}};
}

core::errors::Result<NexusEventKind> parse_request_walk_execution(const json& e) {
    FieldReader r(e);
    RequestWalkExecution k;
    k.dag = r.address("dag");
    k.execution = r.address("execution");
    k.invoker = r.address("invoker");
    k.walk_index = r.u64("walk_index");
    k.next_vertex = r.vertex("next_vertex");
    k.evaluations = r.address("evaluations");
    k.worksheet_from_type = r.type_name("worksheet_from_type");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_announce_interface_package(const json& e) {
    FieldReader r(e);
    AnnounceInterfacePackage k;
    if (const json* objects = r.raw("shared_objects")) {
        if (!objects->is_array()) {
            r.record(malformed("Field 'shared_objects' must be an array"));
        } else {
            for (const auto& item : *objects) {
                auto parsed = types::shared_object_ref_from_json(item);
                if (core::errors::is_error(parsed)) {
                    r.record(core::errors::get_error(parsed));
                    break;
                }
                k.shared_objects.push_back(core::errors::get_value(parsed));
            }
        }
    }
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_tool_registered(const json& e,
                                                          const ToolRegistered::Origin origin) {
    FieldReader r(e);
    ToolRegistered k;
    k.tool = r.address("tool");
    k.fqn = r.fqn("fqn");
    k.origin = origin;
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_tool_unregistered(const json& e) {
    FieldReader r(e);
    ToolUnregistered k;
    k.tool = r.address("tool");
    k.fqn = r.fqn("fqn");
    return finish(r, std::move(k));
}

template <typename T>
core::errors::Result<NexusEventKind> parse_walk_outcome(const json& e) {
    FieldReader r(e);
    T k;
    k.dag = r.address("dag");
    k.execution = r.address("execution");
    k.walk_index = r.u64("walk_index");
    k.vertex = r.vertex("vertex");
    k.variant = r.type_name("variant");
    k.variant_ports_to_data = r.ports_data("variant_ports_to_data");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_walk_failed(const json& e) {
    FieldReader r(e);
    WalkFailed k;
    k.dag = r.address("dag");
    k.execution = r.address("execution");
    k.walk_index = r.u64("walk_index");
    k.vertex = r.vertex("vertex");
    k.reason = r.string("reason");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_execution_finished(const json& e) {
    FieldReader r(e);
    ExecutionFinished k;
    k.dag = r.address("dag");
    k.execution = r.address("execution");
    k.has_any_walk_failed = r.boolean("has_any_walk_failed");
    k.has_any_walk_succeeded = r.boolean("has_any_walk_succeeded");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_scheduled_execution(const json& e) {
    FieldReader r(e);
    RequestScheduledExecution k;
    if (const json* request = r.raw("request")) {
        auto inner = kind_from_tagged_json(*request);
        if (core::errors::is_error(inner)) {
            return core::errors::get_error(inner);
        }
        k.request = std::make_shared<const NexusEventKind>(core::errors::take_value(inner));
    }
    k.priority = r.u64("priority");
    k.request_ms = r.u64("request_ms");
    k.start_ms = r.u64("start_ms");
    k.deadline_ms = r.u64("deadline_ms");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_occurrence_scheduled(const json& e) {
    FieldReader r(e);
    OccurrenceScheduled k;
    k.task = r.address("task");
    k.generator = r.policy_symbol("generator");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_missed_occurrence(const json& e) {
    FieldReader r(e);
    MissedOccurrence k;
    k.task = r.address("task");
    k.start_time_ms = r.u64("start_time_ms");
    k.deadline_ms = r.optional_u64("deadline_ms");
    k.pruned_at = r.u64("pruned_at");
    k.priority_fee_per_gas_unit = r.u64("priority_fee_per_gas_unit");
    k.generator = r.policy_symbol("generator");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_task_created(const json& e) {
    FieldReader r(e);
    TaskCreated k;
    k.task = r.address("task");
    k.owner = r.address("owner");
    return finish(r, std::move(k));
}

template <typename T>
core::errors::Result<NexusEventKind> parse_task_only(const json& e) {
    FieldReader r(e);
    T k;
    k.task = r.address("task");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_task_canceled(const json& e) {
    FieldReader r(e);
    TaskCanceled k;
    k.task = r.address("task");
    k.cleared_occurrences = r.u64("cleared_occurrences");
    k.had_periodic = r.boolean("had_periodic");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_occurrence_consumed(const json& e) {
    FieldReader r(e);
    OccurrenceConsumed k;
    k.task = r.address("task");
    k.start_time_ms = r.u64("start_time_ms");
    k.deadline_ms = r.optional_u64("deadline_ms");
    k.priority_fee_per_gas_unit = r.u64("priority_fee_per_gas_unit");
    k.generator = r.policy_symbol("generator");
    k.executed_at = r.u64("executed_at");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_periodic_configured(const json& e) {
    FieldReader r(e);
    PeriodicScheduleConfigured k;
    k.task = r.address("task");
    k.period_ms = r.optional_u64("period_ms");
    k.deadline_offset_ms = r.optional_u64("deadline_offset_ms");
    k.max_iterations = r.optional_u64("max_iterations");
    k.generated = r.optional_u64("generated");
    k.priority_fee_per_gas_unit = r.optional_u64("priority_fee_per_gas_unit");
    k.last_generated_start_ms = r.optional_u64("last_generated_start_ms");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_founding_leader_cap(const json& e) {
    FieldReader r(e);
    FoundingLeaderCapCreated k;
    k.leader_cap = r.address("leader_cap");
    k.network = r.address("network");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_gas_settlement(const json& e) {
    FieldReader r(e);
    GasSettlementUpdate k;
    k.execution = r.address("execution");
    k.tool_fqn = r.fqn("tool_fqn");
    k.vertex = r.vertex("vertex");
    k.was_settled = r.boolean("was_settled");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_pre_key_vault_created(const json& e) {
    FieldReader r(e);
    PreKeyVaultCreated k;
    k.vault = r.address("vault");
    k.crypto_cap = r.address("crypto_cap");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_pre_key_requested(const json& e) {
    FieldReader r(e);
    PreKeyRequested k;
    k.requested_by = r.address("requested_by");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_pre_key_fulfilled(const json& e) {
    FieldReader r(e);
    PreKeyFulfilled k;
    k.requested_by = r.address("requested_by");
    k.pre_key_bytes = r.bytes("pre_key_bytes");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_pre_key_associated(const json& e) {
    FieldReader r(e);
    PreKeyAssociated k;
    k.claimed_by = r.address("claimed_by");
    k.pre_key = r.bytes("pre_key");
    k.initial_message = r.bytes("initial_message");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_dag_created(const json& e) {
    FieldReader r(e);
    DAGCreated k;
    k.dag = r.address("dag");
    return finish(r, std::move(k));
}

core::errors::Result<NexusEventKind> parse_tool_registry_created(const json& e) {
    FieldReader r(e);
    ToolRegistryCreated k;
    k.registry = r.address("registry");
    k.slashing_cap = r.address("slashing_cap");
    return finish(r, std::move(k));
}

using KindParser = core::errors::Result<NexusEventKind> (*)(const json&);

struct KindEntry {
    const char* name;
    KindParser parse;
};

const KindEntry kKindTable[] = {
    {"RequestWalkExecutionEvent", parse_request_walk_execution},
    {"AnnounceInterfacePackageEvent", parse_announce_interface_package},
    {"ToolRegisteredEvent",
     [](const json& e) { return parse_tool_registered(e, ToolRegistered::Origin::Any); }},
    {"OffChainToolRegisteredEvent",
     [](const json& e) { return parse_tool_registered(e, ToolRegistered::Origin::OffChain); }},
    {"OnChainToolRegisteredEvent",
     [](const json& e) { return parse_tool_registered(e, ToolRegistered::Origin::OnChain); }},
    {"ToolUnregisteredEvent", parse_tool_unregistered},
    {"WalkAdvancedEvent", parse_walk_outcome<WalkAdvanced>},
    {"WalkFailedEvent", parse_walk_failed},
    {"EndStateReachedEvent", parse_walk_outcome<EndStateReached>},
    {"ExecutionFinishedEvent", parse_execution_finished},
    {kScheduledExecutionName, parse_scheduled_execution},
    {"OccurrenceScheduledEvent", parse_occurrence_scheduled},
    {"MissedOccurrenceEvent", parse_missed_occurrence},
    {"TaskCreatedEvent", parse_task_created},
    {"TaskPausedEvent", parse_task_only<TaskPaused>},
    {"TaskResumedEvent", parse_task_only<TaskResumed>},
    {"TaskCanceledEvent", parse_task_canceled},
    {"OccurrenceConsumedEvent", parse_occurrence_consumed},
    {"PeriodicScheduleConfiguredEvent", parse_periodic_configured},
    {"FoundingLeaderCapCreatedEvent", parse_founding_leader_cap},
    {"GasSettlementUpdateEvent", parse_gas_settlement},
    {"PreKeyVaultCreatedEvent", parse_pre_key_vault_created},
    {"PreKeyRequestedEvent", parse_pre_key_requested},
    {"PreKeyFulfilledEvent", parse_pre_key_fulfilled},
    {"PreKeyAssociatedEvent", parse_pre_key_associated},
    {"DAGCreatedEvent", parse_dag_created},
    {"ToolRegistryCreatedEvent", parse_tool_registry_created},
};

bool is_opaque_event_name(const std::string& name) {
    for (const auto* opaque : kOpaqueEventNames) {
        if (name == opaque) {
            return true;
        }
    }
    return false;
}

json vertex_json(const types::RuntimeVertex& vertex) {
    return types::to_json(vertex);
}

json bytes_json(const codec::Bytes& bytes) {
    json out = json::array();
    for (const auto b : bytes) {
        out.push_back(b);
    }
    return out;
}

struct NameVisitor {
    std::string operator()(const RequestWalkExecution&) const { return "RequestWalkExecutionEvent"; }
    std::string operator()(const AnnounceInterfacePackage&) const {
        return "AnnounceInterfacePackageEvent";
    }
    std::string operator()(const ToolRegistered& k) const {
        switch (k.origin) {
            case ToolRegistered::Origin::OffChain: return "OffChainToolRegisteredEvent";
            case ToolRegistered::Origin::OnChain:  return "OnChainToolRegisteredEvent";
            case ToolRegistered::Origin::Any:      break;
        }
        return "ToolRegisteredEvent";
    }
    std::string operator()(const ToolUnregistered&) const { return "ToolUnregisteredEvent"; }
    std::string operator()(const WalkAdvanced&) const { return "WalkAdvancedEvent"; }
    std::string operator()(const WalkFailed&) const { return "WalkFailedEvent"; }
    std::string operator()(const EndStateReached&) const { return "EndStateReachedEvent"; }
    std::string operator()(const ExecutionFinished&) const { return "ExecutionFinishedEvent"; }
    std::string operator()(const RequestScheduledExecution&) const {
        return kScheduledExecutionName;
    }
    std::string operator()(const OccurrenceScheduled&) const { return "OccurrenceScheduledEvent"; }
    std::string operator()(const MissedOccurrence&) const { return "MissedOccurrenceEvent"; }
    std::string operator()(const TaskCreated&) const { return "TaskCreatedEvent"; }
    std::string operator()(const TaskPaused&) const { return "TaskPausedEvent"; }
    std::string operator()(const TaskResumed&) const { return "TaskResumedEvent"; }
    std::string operator()(const TaskCanceled&) const { return "TaskCanceledEvent"; }
    std::string operator()(const OccurrenceConsumed&) const { return "OccurrenceConsumedEvent"; }
    std::string operator()(const PeriodicScheduleConfigured&) const {
        return "PeriodicScheduleConfiguredEvent";
    }
    std::string operator()(const FoundingLeaderCapCreated&) const {
        return "FoundingLeaderCapCreatedEvent";
    }
    std::string operator()(const GasSettlementUpdate&) const { return "GasSettlementUpdateEvent"; }
    std::string operator()(const PreKeyVaultCreated&) const { return "PreKeyVaultCreatedEvent"; }
    std::string operator()(const PreKeyRequested&) const { return "PreKeyRequestedEvent"; }
    std::string operator()(const PreKeyFulfilled&) const { return "PreKeyFulfilledEvent"; }
    std::string operator()(const PreKeyAssociated&) const { return "PreKeyAssociatedEvent"; }
    std::string operator()(const DAGCreated&) const { return "DAGCreatedEvent"; }
    std::string operator()(const ToolRegistryCreated&) const { return "ToolRegistryCreatedEvent"; }
    std::string operator()(const OpaqueEvent& k) const { return k.name; }
};

struct ModuleVisitor {
    std::string operator()(const ToolRegistered&) const { return "tool_registry"; }
    std::string operator()(const ToolUnregistered&) const { return "tool_registry"; }
    std::string operator()(const ToolRegistryCreated&) const { return "tool_registry"; }
    std::string operator()(const RequestScheduledExecution&) const { return "scheduler"; }
    std::string operator()(const OccurrenceScheduled&) const { return "scheduler"; }
    std::string operator()(const MissedOccurrence&) const { return "scheduler"; }
    std::string operator()(const TaskCreated&) const { return "scheduler"; }
    std::string operator()(const TaskPaused&) const { return "scheduler"; }
    std::string operator()(const TaskResumed&) const { return "scheduler"; }
    std::string operator()(const TaskCanceled&) const { return "scheduler"; }
    std::string operator()(const OccurrenceConsumed&) const { return "scheduler"; }
    std::string operator()(const PeriodicScheduleConfigured&) const { return "scheduler"; }
    std::string operator()(const FoundingLeaderCapCreated&) const { return "leader_cap"; }
    std::string operator()(const GasSettlementUpdate&) const { return "gas"; }
    std::string operator()(const PreKeyVaultCreated&) const { return "pre_key_vault"; }
    std::string operator()(const PreKeyRequested&) const { return "pre_key_vault"; }
    std::string operator()(const PreKeyFulfilled&) const { return "pre_key_vault"; }
    std::string operator()(const PreKeyAssociated&) const { return "pre_key_vault"; }
    std::string operator()(const OpaqueEvent& k) const {
        if (k.name.rfind("DAG", 0) == 0) {
            return "dag";
        }
        return "gas";
    }
    // Walk, execution and DAG lifecycle events.
    template <typename T>
    std::string operator()(const T&) const {
        return "dag";
    }
};

struct ToJsonVisitor {
    json operator()(const RequestWalkExecution& k) const {
        return json{{"dag", k.dag.to_hex()},
                    {"execution", k.execution.to_hex()},
                    {"invoker", k.invoker.to_hex()},
                    {"walk_index", codec::u64_to_json(k.walk_index)},
                    {"next_vertex", vertex_json(k.next_vertex)},
                    {"evaluations", k.evaluations.to_hex()},
                    {"worksheet_from_type", types::to_json(k.worksheet_from_type)}};
    }
    json operator()(const AnnounceInterfacePackage& k) const {
        json objects = json::array();
        for (const auto& object : k.shared_objects) {
            objects.push_back(types::to_json(object));
        }
        return json{{"shared_objects", objects}};
    }
    json operator()(const ToolRegistered& k) const {
        return json{{"tool", k.tool.to_hex()}, {"fqn", k.fqn.to_string()}};
    }
    json operator()(const ToolUnregistered& k) const {
        return json{{"tool", k.tool.to_hex()}, {"fqn", k.fqn.to_string()}};
    }
    json operator()(const WalkAdvanced& k) const { return walk_outcome(k); }
    json operator()(const EndStateReached& k) const { return walk_outcome(k); }
    json operator()(const WalkFailed& k) const {
        return json{{"dag", k.dag.to_hex()},
                    {"execution", k.execution.to_hex()},
                    {"walk_index", codec::u64_to_json(k.walk_index)},
                    {"vertex", vertex_json(k.vertex)},
                    {"reason", k.reason}};
    }
    json operator()(const ExecutionFinished& k) const {
        return json{{"dag", k.dag.to_hex()},
                    {"execution", k.execution.to_hex()},
                    {"has_any_walk_failed", k.has_any_walk_failed},
                    {"has_any_walk_succeeded", k.has_any_walk_succeeded}};
    }
    json operator()(const RequestScheduledExecution& k) const {
        return json{{"request", k.request ? kind_to_json(*k.request) : json::object()},
                    {"priority", codec::u64_to_json(k.priority)},
                    {"request_ms", codec::u64_to_json(k.request_ms)},
                    {"start_ms", codec::u64_to_json(k.start_ms)},
                    {"deadline_ms", codec::u64_to_json(k.deadline_ms)}};
    }
    json operator()(const OccurrenceScheduled& k) const {
        return json{{"task", k.task.to_hex()}, {"generator", types::to_json(k.generator)}};
    }
    json operator()(const MissedOccurrence& k) const {
        return json{{"task", k.task.to_hex()},
                    {"start_time_ms", codec::u64_to_json(k.start_time_ms)},
                    {"deadline_ms", codec::optional_u64_to_json(k.deadline_ms)},
                    {"pruned_at", codec::u64_to_json(k.pruned_at)},
                    {"priority_fee_per_gas_unit", codec::u64_to_json(k.priority_fee_per_gas_unit)},
                    {"generator", types::to_json(k.generator)}};
    }
    json operator()(const TaskCreated& k) const {
        return json{{"task", k.task.to_hex()}, {"owner", k.owner.to_hex()}};
    }
    json operator()(const TaskPaused& k) const { return json{{"task", k.task.to_hex()}}; }
    json operator()(const TaskResumed& k) const { return json{{"task", k.task.to_hex()}}; }
    json operator()(const TaskCanceled& k) const {
        return json{{"task", k.task.to_hex()},
                    {"cleared_occurrences", codec::u64_to_json(k.cleared_occurrences)},
                    {"had_periodic", k.had_periodic}};
    }
    json operator()(const OccurrenceConsumed& k) const {
        return json{{"task", k.task.to_hex()},
                    {"start_time_ms", codec::u64_to_json(k.start_time_ms)},
                    {"deadline_ms", codec::optional_u64_to_json(k.deadline_ms)},
                    {"priority_fee_per_gas_unit", codec::u64_to_json(k.priority_fee_per_gas_unit)},
                    {"generator", types::to_json(k.generator)},
                    {"executed_at", codec::u64_to_json(k.executed_at)}};
    }
    json operator()(const PeriodicScheduleConfigured& k) const {
        return json{
            {"task", k.task.to_hex()},
            {"period_ms", codec::optional_u64_to_json(k.period_ms)},
            {"deadline_offset_ms", codec::optional_u64_to_json(k.deadline_offset_ms)},
            {"max_iterations", codec::optional_u64_to_json(k.max_iterations)},
            {"generated", codec::optional_u64_to_json(k.generated)},
            {"priority_fee_per_gas_unit", codec::optional_u64_to_json(k.priority_fee_per_gas_unit)},
            {"last_generated_start_ms", codec::optional_u64_to_json(k.last_generated_start_ms)}};
    }
    json operator()(const FoundingLeaderCapCreated& k) const {
        return json{{"leader_cap", k.leader_cap.to_hex()}, {"network", k.network.to_hex()}};
    }
    json operator()(const GasSettlementUpdate& k) const {
        return json{{"execution", k.execution.to_hex()},
                    {"tool_fqn", k.tool_fqn.to_string()},
                    {"vertex", vertex_json(k.vertex)},
                    {"was_settled", k.was_settled}};
    }
    json operator()(const PreKeyVaultCreated& k) const {
        return json{{"vault", k.vault.to_hex()}, {"crypto_cap", k.crypto_cap.to_hex()}};
    }
    json operator()(const PreKeyRequested& k) const {
        return json{{"requested_by", k.requested_by.to_hex()}};
    }
    json operator()(const PreKeyFulfilled& k) const {
        return json{{"requested_by", k.requested_by.to_hex()},
                    {"pre_key_bytes", bytes_json(k.pre_key_bytes)}};
    }
    json operator()(const PreKeyAssociated& k) const {
        return json{{"claimed_by", k.claimed_by.to_hex()},
                    {"pre_key", bytes_json(k.pre_key)},
                    {"initial_message", bytes_json(k.initial_message)}};
    }
    json operator()(const DAGCreated& k) const { return json{{"dag", k.dag.to_hex()}}; }
    json operator()(const ToolRegistryCreated& k) const {
        return json{{"registry", k.registry.to_hex()}, {"slashing_cap", k.slashing_cap.to_hex()}};
    }
    json operator()(const OpaqueEvent& k) const { return k.payload; }

    template <typename T>
    static json walk_outcome(const T& k) {
        return json{{"dag", k.dag.to_hex()},
                    {"execution", k.execution.to_hex()},
                    {"walk_index", codec::u64_to_json(k.walk_index)},
                    {"vertex", vertex_json(k.vertex)},
                    {"variant", types::to_json(k.variant)},
                    {"variant_ports_to_data", types::ports_data_to_json(k.variant_ports_to_data)}};
    }
};

}  // namespace

std::string NexusEventKind::name() const {
    return std::visit(NameVisitor{}, value);
}

std::string NexusEventKind::module() const {
    return std::visit(ModuleVisitor{}, value);
}

bool is_known_event_name(const std::string& name) {
    for (const auto& entry : kKindTable) {
        if (name == entry.name) {
            return true;
        }
    }
    return is_opaque_event_name(name);
}

core::errors::Result<NexusEventKind> kind_from_json(const std::string& name, const json& event) {
    if (!event.is_object()) {
        return malformed("Event '" + name + "' payload must be an object");
    }
    for (const auto& entry : kKindTable) {
        if (name == entry.name) {
            return entry.parse(event);
        }
    }
    if (is_opaque_event_name(name)) {
        return NexusEventKind{EventKindVariant{OpaqueEvent{name, event}}};
    }
    return NexusError{ErrorCategory::Event, "Unknown event kind '" + name + "'.",
                      "unknown_event_kind"};
}

core::errors::Result<NexusEventKind> kind_from_tagged_json(const json& tagged) {
    if (!tagged.is_object() || !tagged.contains(kEventTypeKey) ||
        !tagged.at(kEventTypeKey).is_string()) {
        return malformed(std::string("Tagged event is missing '") + kEventTypeKey + "'");
    }
    if (!tagged.contains("event")) {
        return malformed("Tagged event is missing 'event'");
    }
    return kind_from_json(tagged.at(kEventTypeKey).get<std::string>(), tagged.at("event"));
}

json kind_to_json(const NexusEventKind& kind) {
    return std::visit(ToJsonVisitor{}, kind.value);
}

}  // namespace nexus::events
