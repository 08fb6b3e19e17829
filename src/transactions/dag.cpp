#include "transactions/dag.hpp"

#include <set>
#include <utility>
#include "codec/bcs.hpp"
#include "core/logging/logger.hpp"
#include "transactions/idents.hpp"

namespace nexus::transactions {

using core::errors::NexusError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

NexusError dag_error(const std::string& message) {
    return NexusError{ErrorCategory::Ledger, message, "configuration"};
}

core::errors::Result<std::string> require_string(const json& object, const char* key,
                                                 const std::string& context) {
    if (!object.is_object() || !object.contains(key) || !object.at(key).is_string()) {
        return dag_error(context + " is missing string field '" + key + "'.");
    }
    return object.at(key).get<std::string>();
}

bool optional_bool(const json& object, const char* key) {
    return object.is_object() && object.contains(key) && object.at(key).is_boolean() &&
           object.at(key).get<bool>();
}

core::errors::Result<DagVertex> parse_vertex(const json& value) {
    auto name = require_string(value, "name", "Vertex");
    if (core::errors::is_error(name)) {
        return core::errors::get_error(name);
    }
    DagVertex vertex;
    vertex.name = core::errors::take_value(name);

    const std::string context = "Vertex '" + vertex.name + "'";
    if (!value.contains("kind") || !value.at("kind").is_object()) {
        return dag_error(context + " has no kind.");
    }
    const auto& kind = value.at("kind");
    auto variant = require_string(kind, "variant", context + " kind");
    if (core::errors::is_error(variant)) {
        return core::errors::get_error(variant);
    }
    const auto& variant_name = core::errors::get_value(variant);
    if (variant_name == "off_chain") {
        vertex.kind = DagVertex::Kind::OffChain;
    } else if (variant_name == "on_chain") {
        vertex.kind = DagVertex::Kind::OnChain;
    } else {
        return dag_error(context + " has unknown kind '" + variant_name + "'.");
    }

    auto fqn_text = require_string(kind, "tool_fqn", context + " kind");
    if (core::errors::is_error(fqn_text)) {
        return core::errors::get_error(fqn_text);
    }
    auto fqn = types::ToolFqn::parse(core::errors::get_value(fqn_text));
    if (core::errors::is_error(fqn)) {
        return dag_error(context + ": " + core::errors::get_error(fqn).message);
    }
    vertex.tool_fqn = core::errors::take_value(fqn);

    if (value.contains("entry_ports")) {
        const auto& ports = value.at("entry_ports");
        if (!ports.is_array()) {
            return dag_error(context + " entry_ports must be an array.");
        }
        for (const auto& port : ports) {
            if (!port.is_string()) {
                return dag_error(context + " entry_ports must hold port names.");
            }
            vertex.entry_ports.push_back(port.get<std::string>());
        }
    }
    return vertex;
}

core::errors::Result<DagEdge> parse_edge(const json& value) {
    if (!value.is_object() || !value.contains("from") || !value.contains("to")) {
        return dag_error("Edge needs 'from' and 'to'.");
    }
    const auto& from = value.at("from");
    const auto& to = value.at("to");

    auto from_vertex = require_string(from, "vertex", "Edge source");
    auto output_variant = require_string(from, "output_variant", "Edge source");
    auto output_port = require_string(from, "output_port", "Edge source");
    auto to_vertex = require_string(to, "vertex", "Edge target");
    auto input_port = require_string(to, "input_port", "Edge target");
    for (const auto* field : {&from_vertex, &output_variant, &output_port, &to_vertex, &input_port}) {
        if (core::errors::is_error(*field)) {
            return core::errors::get_error(*field);
        }
    }
    return DagEdge{core::errors::take_value(from_vertex), core::errors::take_value(output_variant),
                   core::errors::take_value(output_port), core::errors::take_value(to_vertex),
                   core::errors::take_value(input_port), optional_bool(value, "encrypted")};
}

core::errors::Result<DagDefaultValue> parse_default_value(const json& value) {
    auto vertex = require_string(value, "vertex", "Default value");
    if (core::errors::is_error(vertex)) {
        return core::errors::get_error(vertex);
    }
    auto port = require_string(value, "input_port", "Default value");
    if (core::errors::is_error(port)) {
        return core::errors::get_error(port);
    }
    const std::string context = "Default value for '" + core::errors::get_value(vertex) + "." +
                                core::errors::get_value(port) + "'";
    if (!value.contains("value") || !value.at("value").is_object()) {
        return dag_error(context + " has no value.");
    }
    const auto& data = value.at("value");
    auto storage = require_string(data, "storage", context);
    if (core::errors::is_error(storage)) {
        return core::errors::get_error(storage);
    }
    types::NexusData nexus_data;
    const auto& storage_name = core::errors::get_value(storage);
    if (storage_name == "inline") {
        nexus_data.storage = types::StorageKind::Inline;
    } else if (storage_name == "walrus") {
        nexus_data.storage = types::StorageKind::Walrus;
    } else {
        return dag_error(context + " has unknown storage '" + storage_name + "'.");
    }
    if (!data.contains("data")) {
        return dag_error(context + " has no data.");
    }
    nexus_data.data = data.at("data");
    nexus_data.encrypted = optional_bool(data, "encrypted");

    return DagDefaultValue{core::errors::take_value(vertex), core::errors::take_value(port),
                           std::move(nexus_data)};
}

core::errors::Result<DagOutput> parse_output(const json& value) {
    auto vertex = require_string(value, "vertex", "Output");
    auto variant = require_string(value, "output_variant", "Output");
    auto port = require_string(value, "output_port", "Output");
    for (const auto* field : {&vertex, &variant, &port}) {
        if (core::errors::is_error(*field)) {
            return core::errors::get_error(*field);
        }
    }
    return DagOutput{core::errors::take_value(vertex), core::errors::take_value(variant),
                     core::errors::take_value(port), optional_bool(value, "encrypted")};
}

core::errors::Result<DagEntryGroup> parse_entry_group(const json& value) {
    auto name = require_string(value, "name", "Entry group");
    if (core::errors::is_error(name)) {
        return core::errors::get_error(name);
    }
    DagEntryGroup group;
    group.name = core::errors::take_value(name);
    if (!value.contains("vertices") || !value.at("vertices").is_array()) {
        return dag_error("Entry group '" + group.name + "' needs a vertices array.");
    }
    for (const auto& vertex : value.at("vertices")) {
        if (!vertex.is_string()) {
            return dag_error("Entry group '" + group.name + "' must list vertex names.");
        }
        group.vertices.push_back(vertex.get<std::string>());
    }
    return group;
}

// Parses the optional array `key` with `parse`, appending into `out`.
template <typename T, typename Parser>
core::errors::Status parse_list(const json& value, const char* key, Parser parse,
                                std::vector<T>& out) {
    if (!value.contains(key) || value.at(key).is_null()) {
        return core::errors::ok();
    }
    if (!value.at(key).is_array()) {
        return dag_error(std::string("DAG field '") + key + "' must be an array.");
    }
    for (const auto& item : value.at(key)) {
        auto parsed = parse(item);
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        out.push_back(core::errors::take_value(parsed));
    }
    return core::errors::ok();
}

codec::Bytes vertex_kind_to_bcs(const DagVertex& vertex) {
    codec::BcsWriter writer;
    writer.uleb128(vertex.kind == DagVertex::Kind::OffChain ? 0 : 1);
    writer.string(vertex.tool_fqn.to_string());
    return writer.take();
}

}  // namespace

std::map<std::string, std::vector<std::pair<std::string, std::string>>> entry_ports_by_group(
    const Dag& dag) {
    std::map<std::string, std::vector<std::pair<std::string, std::string>>> out;
    std::set<std::string> grouped;

    for (const auto& group : dag.entry_groups) {
        auto& ports = out[group.name];
        for (const auto& name : group.vertices) {
            grouped.insert(name);
            for (const auto& vertex : dag.vertices) {
                if (vertex.name != name) {
                    continue;
                }
                for (const auto& port : vertex.entry_ports) {
                    ports.emplace_back(vertex.name, port);
                }
            }
        }
    }

    for (const auto& vertex : dag.vertices) {
        if (vertex.entry_ports.empty() || grouped.count(vertex.name) > 0) {
            continue;
        }
        auto& ports = out[kDefaultEntryGroup];
        for (const auto& port : vertex.entry_ports) {
            ports.emplace_back(vertex.name, port);
        }
    }
    return out;
}

core::errors::Result<Dag> parse_dag(const json& value) {
    if (!value.is_object()) {
        return dag_error("DAG definition must be a JSON object.");
    }
    if (!value.contains("vertices")) {
        return dag_error("DAG definition has no vertices.");
    }

    Dag dag;
    auto status = parse_list(value, "vertices", parse_vertex, dag.vertices);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    status = parse_list(value, "edges", parse_edge, dag.edges);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    status = parse_list(value, "default_values", parse_default_value, dag.default_values);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    status = parse_list(value, "outputs", parse_output, dag.outputs);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    status = parse_list(value, "entry_groups", parse_entry_group, dag.entry_groups);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    return dag;
}

core::errors::Status validate_dag(const Dag& dag) {
    if (dag.vertices.empty()) {
        return dag_error("DAG has no vertices.");
    }

    std::set<std::string> names;
    for (const auto& vertex : dag.vertices) {
        if (!names.insert(vertex.name).second) {
            return dag_error("Duplicate vertex '" + vertex.name + "'.");
        }
    }

    const auto known = [&names](const std::string& name) { return names.count(name) > 0; };

    for (const auto& edge : dag.edges) {
        if (!known(edge.from_vertex)) {
            return dag_error("Edge starts at unknown vertex '" + edge.from_vertex + "'.");
        }
        if (!known(edge.to_vertex)) {
            return dag_error("Edge ends at unknown vertex '" + edge.to_vertex + "'.");
        }
    }
    for (const auto& value : dag.default_values) {
        if (!known(value.vertex)) {
            return dag_error("Default value for unknown vertex '" + value.vertex + "'.");
        }
    }
    for (const auto& output : dag.outputs) {
        if (!known(output.vertex)) {
            return dag_error("Output on unknown vertex '" + output.vertex + "'.");
        }
    }
    std::set<std::string> group_names;
    for (const auto& group : dag.entry_groups) {
        if (!group_names.insert(group.name).second) {
            return dag_error("Duplicate entry group '" + group.name + "'.");
        }
        for (const auto& name : group.vertices) {
            if (!known(name)) {
                return dag_error("Entry group '" + group.name + "' names unknown vertex '" +
                                 name + "'.");
            }
        }
    }

    std::size_t entry_ports = 0;
    for (const auto& group : entry_ports_by_group(dag)) {
        entry_ports += group.second.size();
    }
    if (entry_ports == 0) {
        return dag_error("DAG has no entry ports.");
    }
    return core::errors::ok();
}

std::size_t publish_call_count(const Dag& dag) {
    std::size_t entry_ports = 0;
    for (const auto& group : entry_ports_by_group(dag)) {
        entry_ports += group.second.size();
    }
    return dag.vertices.size() + dag.default_values.size() + dag.edges.size() +
           dag.outputs.size() + entry_ports + 2;
}

core::errors::Result<Argument> compose_dag_publish(TransactionBuilder& tx,
                                                   const types::NexusObjects& objects,
                                                   const Dag& dag) {
    auto status = validate_dag(dag);
    if (core::errors::is_error(status)) {
        return core::errors::get_error(status);
    }
    const auto& pkg = objects.workflow_pkg_id;

    auto current = call(tx, pkg, idents::dag::kNew, {});

    for (const auto& vertex : dag.vertices) {
        const auto name = tx.pure_string(vertex.name);
        const auto kind = tx.pure(vertex_kind_to_bcs(vertex));
        current = call(tx, pkg, idents::dag::kWithVertex, {current, name, kind});
    }

    for (const auto& value : dag.default_values) {
        const auto vertex = tx.pure_string(value.vertex);
        const auto port = tx.pure_string(value.input_port);
        const auto data = tx.pure(types::nexus_data_to_bcs(value.value));
        current = call(tx, pkg, idents::dag::kWithDefaultValue, {current, vertex, port, data});
    }

    for (const auto& edge : dag.edges) {
        std::vector<Argument> args{current,
                                   tx.pure_string(edge.from_vertex),
                                   tx.pure_string(edge.output_variant),
                                   tx.pure_string(edge.output_port),
                                   tx.pure_string(edge.to_vertex),
                                   tx.pure_string(edge.input_port)};
        current = call(tx, pkg,
                       edge.encrypted ? idents::dag::kWithEncryptedEdge : idents::dag::kWithEdge,
                       std::move(args));
    }

    for (const auto& output : dag.outputs) {
        std::vector<Argument> args{current, tx.pure_string(output.vertex),
                                   tx.pure_string(output.output_variant),
                                   tx.pure_string(output.output_port)};
        current = call(tx, pkg,
                       output.encrypted ? idents::dag::kWithEncryptedOutput
                                        : idents::dag::kWithOutput,
                       std::move(args));
    }

    for (const auto& group : entry_ports_by_group(dag)) {
        for (const auto& entry : group.second) {
            std::vector<Argument> args{current, tx.pure_string(group.first),
                                       tx.pure_string(entry.first), tx.pure_string(entry.second)};
            current = call(tx, pkg, idents::dag::kWithEntryPortInGroup, std::move(args));
        }
    }

    NEXUS_LOG_DEBUG("Dag: Composed " + std::to_string(dag.vertices.size()) + " vertices, " +
                    std::to_string(dag.edges.size()) + " edges");
    return share_object(tx, current, struct_type(pkg, idents::dag::kDag));
}

codec::Bytes vertex_inputs_to_bcs(const VertexInputs& inputs) {
    codec::BcsWriter writer;
    writer.uleb128(inputs.size());
    for (const auto& vertex : inputs) {
        writer.string(vertex.first);
        writer.uleb128(vertex.second.size());
        for (const auto& port : vertex.second) {
            writer.string(port.first);
            const auto data = types::nexus_data_to_bcs(port.second);
            writer.fixed(data.data(), data.size());
        }
    }
    return writer.take();
}

core::errors::Result<VertexInputs> vertex_inputs_from_json(const json& value) {
    if (!value.is_object()) {
        return NexusError{ErrorCategory::Input,
                          "Input data must map entry vertices to their port values.",
                          "configuration"};
    }
    VertexInputs inputs;
    for (auto vertex = value.begin(); vertex != value.end(); ++vertex) {
        if (!vertex.value().is_object()) {
            return NexusError{ErrorCategory::Input,
                              "Input data for vertex '" + vertex.key() +
                                  "' must map ports to values.",
                              "configuration"};
        }
        auto& ports = inputs[vertex.key()];
        for (auto port = vertex.value().begin(); port != vertex.value().end(); ++port) {
            ports[port.key()] = types::NexusData::inline_plain(port.value());
        }
    }
    return inputs;
}

Argument compose_dag_execute(TransactionBuilder& tx, const types::NexusObjects& objects,
                             const ledger::ObjectRef& dag, const std::string& entry_group,
                             const VertexInputs& inputs) {
    const auto tap = shared_input(tx, objects.default_tap, true);
    const auto dag_arg = shared_input(tx, dag, false);
    const auto network = tx.pure_address(objects.network_id);
    const auto group = tx.pure_string(entry_group);
    const auto with_vertex_inputs = tx.pure(vertex_inputs_to_bcs(inputs));
    return call(tx, objects.workflow_pkg_id, idents::default_tap::kBeginDagExecution,
                {tap, dag_arg, network, group, with_vertex_inputs});
}

}  // namespace nexus::transactions
