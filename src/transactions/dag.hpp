#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "codec/bytes.hpp"
#include "core/errors/nexus_errors.hpp"
#include "ledger/ledger_types.hpp"
#include "transactions/transaction_builder.hpp"
#include "types/nexus_objects.hpp"
#include "types/nexus_types.hpp"

namespace nexus::transactions {

// Entry vertices that no entry group names belong to this group.
constexpr const char* kDefaultEntryGroup = "_default_group";

struct DagVertex {
    enum class Kind { OffChain, OnChain };

    Kind kind = Kind::OffChain;
    std::string name;
    types::ToolFqn tool_fqn;
    // Non-empty for entry vertices.
    std::vector<std::string> entry_ports;
};

struct DagDefaultValue {
    std::string vertex;
    std::string input_port;
    types::NexusData value;
};

struct DagEdge {
    std::string from_vertex;
    std::string output_variant;
    std::string output_port;
    std::string to_vertex;
    std::string input_port;
    bool encrypted = false;
};

struct DagOutput {
    std::string vertex;
    std::string output_variant;
    std::string output_port;
    bool encrypted = false;
};

struct DagEntryGroup {
    std::string name;
    std::vector<std::string> vertices;
};

struct Dag {
    std::vector<DagVertex> vertices;
    std::vector<DagDefaultValue> default_values;
    std::vector<DagEdge> edges;
    std::vector<DagOutput> outputs;
    std::vector<DagEntryGroup> entry_groups;
};

// Entry group -> (vertex, port) pairs marked as entry ports, with the default
// group filled in from entry vertices no explicit group mentions.
std::map<std::string, std::vector<std::pair<std::string, std::string>>> entry_ports_by_group(
    const Dag& dag);

// Parses the DAG definition file:
//
// {
//   "vertices": [{"kind": {"variant": "off_chain", "tool_fqn": "..."},
//                 "name": "...", "entry_ports": ["..."]}],
//   "edges": [{"from": {"vertex", "output_variant", "output_port"},
//              "to": {"vertex", "input_port"}, "encrypted": false}],
//   "default_values": [{"vertex", "input_port",
//                       "value": {"storage": "inline", "data": ...}}],
//   "outputs": [{"vertex", "output_variant", "output_port", "encrypted"}],
//   "entry_groups": [{"name", "vertices": ["..."]}]
// }
//
// Shape errors are Ledger/configuration.
core::errors::Result<Dag> parse_dag(const nlohmann::json& value);

// Structural checks: at least one vertex and one entry port, unique vertex
// names, and every reference naming a known vertex.
core::errors::Status validate_dag(const Dag& dag);

// Number of move calls compose_dag_publish emits for this DAG.
std::size_t publish_call_count(const Dag& dag);

// `dag::new`, then one builder call per vertex, default value, edge, output
// and entry port, then `public_share_object`. Returns the share call.
core::errors::Result<Argument> compose_dag_publish(TransactionBuilder& tx,
                                                   const types::NexusObjects& objects,
                                                   const Dag& dag);

// Vertex name -> port name -> committed data.
using VertexInputs = std::map<std::string, types::PortsData>;

// BCS of VecMap<Vertex, VecMap<InputPort, NexusData>>.
codec::Bytes vertex_inputs_to_bcs(const VertexInputs& inputs);

// Parses {"vertex": {"port": <json>}} as inline, unencrypted data.
core::errors::Result<VertexInputs> vertex_inputs_from_json(const nlohmann::json& value);

// `default_tap::begin_dag_execution`. `dag` carries the DAG's initial shared
// version.
Argument compose_dag_execute(TransactionBuilder& tx, const types::NexusObjects& objects,
                             const ledger::ObjectRef& dag, const std::string& entry_group,
                             const VertexInputs& inputs);

}  // namespace nexus::transactions
