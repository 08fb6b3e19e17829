#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "app/commands.hpp"
#include "core/config/correlation_id.hpp"
#include "events/encoder.hpp"
#include "mock_ledger.hpp"
#include "types/nexus_objects.hpp"

namespace {

using nexus::app::cli::CliRequest;
using nexus::app::cli::Command;
using nexus::codec::Address;
using nexus::core::errors::get_error;
using nexus::core::errors::get_value;
using nexus::core::errors::is_error;
using nexus::testing::object_ref;
using nlohmann::json;

class CommandWorkspace {
public:
    CommandWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_commands_" + std::get<std::string>(nexus::core::config::generate_correlation_id()));
        std::filesystem::create_directories(root_);
    }

    ~CommandWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    std::filesystem::path write(const std::string& name, const json& value) const {
        const auto path = root_ / name;
        std::ofstream out(path);
        out << value.dump(2);
        return path;
    }

private:
    std::filesystem::path root_;
};

json client_config_json() {
    nexus::types::NexusObjects objects;
    objects.workflow_pkg_id = Address::from_u64(0xbb);
    objects.primitives_pkg_id = Address::from_u64(0xaa);
    objects.interface_pkg_id = Address::from_u64(0xcc);
    objects.network_id = Address::from_u64(0xdd);
    objects.tool_registry = object_ref(0x101, 4);
    objects.default_tap = object_ref(0x102, 4);
    objects.gas_service = object_ref(0x103, 4);
    objects.pre_key_vault = object_ref(0x104, 4);
    objects.network_auth = object_ref(0x105, 4);
    return json{{"rpc_url", "http://127.0.0.1:9000"},
                {"gas_budget", 5000000},
                {"gas_coins", json::array({nexus::ledger::to_json(object_ref(0x900, 2))})},
                {"nexus_objects", nexus::types::to_json(objects)}};
}

json two_vertex_dag() {
    const json kind{{"variant", "off_chain"}, {"tool_fqn", "xyz.dummy.tool@1"}};
    return json{{"vertices", json::array({{{"name", "a"}, {"kind", kind},
                                           {"entry_ports", json::array({"input"})}},
                                          {{"name", "b"}, {"kind", kind}}})},
                {"edges", json::array({{{"from", {{"vertex", "a"},
                                                  {"output_variant", "ok"},
                                                  {"output_port", "out"}}},
                                        {"to", {{"vertex", "b"}, {"input_port", "in"}}}}})}};
}

TEST(CommandsTest, ComposeDagReportsFinishedTransaction) {
    CommandWorkspace workspace;
    CliRequest req;
    req.command = Command::ComposeDag;
    req.config_file = workspace.write("client.json", client_config_json());
    req.dag_file = workspace.write("dag.json", two_vertex_dag());

    auto result = nexus::app::commands::dispatch(req);
    ASSERT_FALSE(is_error(result));
    const auto& out = get_value(result);
    EXPECT_EQ(out.at("move_calls").get<std::size_t>(), 6u);
    EXPECT_EQ(out.at("expected_move_calls"), out.at("move_calls"));
    EXPECT_TRUE(out.at("transaction").is_object());
}

TEST(CommandsTest, ComposeDagSurfacesInvalidDag) {
    CommandWorkspace workspace;
    auto dag = two_vertex_dag();
    dag["edges"][0]["to"]["vertex"] = "missing";
    CliRequest req;
    req.command = Command::ComposeDag;
    req.config_file = workspace.write("client.json", client_config_json());
    req.dag_file = workspace.write("dag.json", dag);

    EXPECT_TRUE(is_error(nexus::app::commands::dispatch(req)));
}

TEST(CommandsTest, CheckOccurrenceNamesTheCall) {
    CliRequest req;
    req.command = Command::CheckOccurrence;
    req.start_offset_ms = 1000;
    req.gas_price = 1000;
    auto result = nexus::app::commands::dispatch(req);
    ASSERT_FALSE(is_error(result));
    EXPECT_TRUE(get_value(result).at("valid").get<bool>());

    req.start_offset_ms.reset();
    req.start_ms = 50;
    req.deadline_ms = 40;
    auto rejected = nexus::app::commands::dispatch(req);
    ASSERT_TRUE(is_error(rejected));
    EXPECT_EQ(get_error(rejected).code, "configuration");
}

TEST(CommandsTest, DecodeEventPrintsTheKind) {
    CommandWorkspace workspace;
    nexus::events::NexusEvent event{
        nexus::ledger::EventId{"tx", 3}, {},
        nexus::events::NexusEventKind{nexus::events::TaskPaused{Address::from_u64(1)}}};
    const auto encoded =
        nexus::events::encode_event(event, Address::from_u64(0xaa), Address::from_u64(0xbb));

    CliRequest req;
    req.command = Command::DecodeEvent;
    req.event_file = workspace.write(
        "event.json", json{{"type", encoded.type},
                           {"contents", encoded.contents},
                           {"id", {{"tx_digest", "tx"}, {"sequence", 3}}}});
    auto result = nexus::app::commands::dispatch(req);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).at("name"), event.data.name());
}

}  // namespace
