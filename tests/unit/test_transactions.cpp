#include <algorithm>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "codec/address.hpp"
#include "codec/ed25519.hpp"
#include "mock_ledger.hpp"
#include "transactions/dag.hpp"
#include "transactions/gas.hpp"
#include "transactions/network_auth.hpp"
#include "transactions/scheduler.hpp"
#include "transactions/tool.hpp"
#include "transactions/transaction_builder.hpp"

namespace {

using nexus::codec::Address;
using nexus::core::errors::get_error;
using nexus::core::errors::get_value;
using nexus::core::errors::is_error;
using nexus::testing::object_ref;
using nlohmann::json;
namespace tx = nexus::transactions;

nexus::types::NexusObjects test_objects() {
    nexus::types::NexusObjects objects;
    objects.workflow_pkg_id = Address::from_u64(0xbb);
    objects.primitives_pkg_id = Address::from_u64(0xaa);
    objects.interface_pkg_id = Address::from_u64(0xcc);
    objects.network_id = Address::from_u64(0xdd);
    objects.tool_registry = object_ref(0x101, 4);
    objects.default_tap = object_ref(0x102, 4);
    objects.gas_service = object_ref(0x103, 4);
    objects.network_auth = object_ref(0x104, 4);
    return objects;
}

json vertex(const std::string& name, std::vector<std::string> entry_ports = {}) {
    json out{{"name", name},
             {"kind", {{"variant", "off_chain"}, {"tool_fqn", "xyz.dummy.tool@1"}}}};
    if (!entry_ports.empty()) {
        out["entry_ports"] = entry_ports;
    }
    return out;
}

json two_vertex_dag() {
    return json{{"vertices", json::array({vertex("a", {"input"}), vertex("b")})},
                {"edges", json::array({{{"from", {{"vertex", "a"},
                                                  {"output_variant", "ok"},
                                                  {"output_port", "out"}}},
                                        {"to", {{"vertex", "b"}, {"input_port", "in"}}}}})}};
}

std::vector<std::string> function_names(const tx::TransactionBuilder& builder) {
    std::vector<std::string> names;
    for (const auto& command : builder.commands()) {
        if (const auto* call = std::get_if<tx::MoveCall>(&command)) {
            names.push_back(call->function);
        }
    }
    return names;
}

TEST(DagPublishTest, TwoVerticesOneEdgeIsSixCalls) {
    auto dag = tx::parse_dag(two_vertex_dag());
    ASSERT_FALSE(is_error(dag));

    tx::TransactionBuilder builder;
    auto shared = tx::compose_dag_publish(builder, test_objects(), get_value(dag));
    ASSERT_FALSE(is_error(shared));

    EXPECT_EQ(builder.commands().size(), 6u);
    EXPECT_EQ(tx::publish_call_count(get_value(dag)), 6u);
    EXPECT_EQ(function_names(builder),
              (std::vector<std::string>{"new", "with_vertex", "with_vertex", "with_edge",
                                        "with_entry_port_in_group", "public_share_object"}));

    const auto& share = std::get<tx::MoveCall>(builder.commands().back());
    EXPECT_EQ(share.package, nexus::codec::framework_address());
    ASSERT_EQ(share.type_arguments.size(), 1u);
}

TEST(DagPublishTest, CallCountCoversDefaultsOutputsAndGroups) {
    auto definition = two_vertex_dag();
    definition["vertices"].push_back(vertex("c", {"x", "y"}));
    definition["default_values"] = json::array(
        {{{"vertex", "b"}, {"input_port", "limit"}, {"value", {{"storage", "inline"}, {"data", 5}}}}});
    definition["outputs"] = json::array(
        {{{"vertex", "b"}, {"output_variant", "ok"}, {"output_port", "result"}, {"encrypted", true}}});
    definition["entry_groups"] = json::array({{{"name", "only_c"}, {"vertices", json::array({"c"})}}});

    auto dag = tx::parse_dag(definition);
    ASSERT_FALSE(is_error(dag));
    const auto groups = tx::entry_ports_by_group(get_value(dag));
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups.at("only_c").size(), 2u);
    EXPECT_EQ(groups.at(tx::kDefaultEntryGroup).size(), 1u);

    tx::TransactionBuilder builder;
    ASSERT_FALSE(is_error(tx::compose_dag_publish(builder, test_objects(), get_value(dag))));
    // new + 3 vertices + 1 default + 1 edge + 1 output + 3 entry ports + share
    EXPECT_EQ(builder.commands().size(), 11u);
    EXPECT_EQ(tx::publish_call_count(get_value(dag)), builder.commands().size());

    const auto names = function_names(builder);
    EXPECT_NE(std::find(names.begin(), names.end(), "with_encrypted_output"), names.end());
}

TEST(DagPublishTest, InvalidDagsAreRejected) {
    auto no_entry = two_vertex_dag();
    no_entry["vertices"][0].erase("entry_ports");
    auto parsed = tx::parse_dag(no_entry);
    ASSERT_FALSE(is_error(parsed));
    tx::TransactionBuilder builder;
    auto composed = tx::compose_dag_publish(builder, test_objects(), get_value(parsed));
    ASSERT_TRUE(is_error(composed));
    EXPECT_EQ(get_error(composed).code, "configuration");
    EXPECT_TRUE(builder.commands().empty());

    auto dangling = two_vertex_dag();
    dangling["edges"][0]["to"]["vertex"] = "ghost";
    auto dangling_dag = tx::parse_dag(dangling);
    ASSERT_FALSE(is_error(dangling_dag));
    auto status = tx::validate_dag(get_value(dangling_dag));
    ASSERT_TRUE(is_error(status));
    EXPECT_NE(get_error(status).message.find("ghost"), std::string::npos);

    auto duplicate = two_vertex_dag();
    duplicate["vertices"].push_back(vertex("a"));
    auto duplicate_dag = tx::parse_dag(duplicate);
    ASSERT_FALSE(is_error(duplicate_dag));
    EXPECT_TRUE(is_error(tx::validate_dag(get_value(duplicate_dag))));

    auto bad_kind = two_vertex_dag();
    bad_kind["vertices"][1]["kind"]["variant"] = "sideways";
    EXPECT_TRUE(is_error(tx::parse_dag(bad_kind)));
}

TEST(OccurrenceTest, DeadlineBeforeStartIsConfigurationError) {
    auto request = tx::OccurrenceRequest::create(50, 40, std::nullopt, std::nullopt, 1, true);
    ASSERT_TRUE(is_error(request));
    EXPECT_EQ(get_error(request).code, "configuration");
    EXPECT_NE(get_error(request).message.find("cannot be earlier than start"), std::string::npos);
}

TEST(OccurrenceTest, FlagCombinationsAreValidated) {
    EXPECT_TRUE(is_error(tx::OccurrenceRequest::create(std::nullopt, std::nullopt, std::nullopt,
                                                       std::nullopt, 1, true)));
    EXPECT_FALSE(is_error(tx::OccurrenceRequest::create(std::nullopt, std::nullopt, std::nullopt,
                                                        std::nullopt, 1, false)));
    // Absolute deadline with only a start offset.
    EXPECT_TRUE(is_error(
        tx::OccurrenceRequest::create(std::nullopt, 100, 10, std::nullopt, 1, false)));
    // Deadline offset with no start at all.
    EXPECT_TRUE(is_error(
        tx::OccurrenceRequest::create(std::nullopt, std::nullopt, std::nullopt, 10, 1, false)));
    EXPECT_FALSE(is_error(tx::OccurrenceRequest::create(50, 50, std::nullopt, std::nullopt, 1, true)));
}

TEST(OccurrenceTest, ChoosesCallFromFlags) {
    tx::OccurrenceRequest with_offset{100, std::nullopt, std::nullopt, 20, 1};
    EXPECT_EQ(tx::choose_occurrence_call(with_offset), tx::OccurrenceCall::WithOffset);

    tx::OccurrenceRequest absolute{100, 200, std::nullopt, std::nullopt, 1};
    EXPECT_EQ(tx::choose_occurrence_call(absolute), tx::OccurrenceCall::Absolute);

    tx::OccurrenceRequest relative{std::nullopt, std::nullopt, 5, 20, 1};
    EXPECT_EQ(tx::choose_occurrence_call(relative), tx::OccurrenceCall::RelativeFromNow);
}

TEST(OccurrenceTest, ComposesRelativeCallAgainstTask) {
    tx::TransactionBuilder builder;
    tx::OccurrenceRequest relative{std::nullopt, std::nullopt, 5, std::nullopt, 1000};
    auto call = tx::compose_add_occurrence(builder, test_objects(), object_ref(0x300, 9), relative);
    ASSERT_FALSE(is_error(call));
    EXPECT_EQ(function_names(builder),
              (std::vector<std::string>{"add_occurrence_relative_for_task"}));

    tx::TransactionBuilder rejected;
    tx::OccurrenceRequest invalid{50, 40, std::nullopt, std::nullopt, 1};
    EXPECT_TRUE(is_error(tx::compose_add_occurrence(rejected, test_objects(), object_ref(0x300, 9),
                                                    invalid)));
    EXPECT_TRUE(rejected.commands().empty());
}

TEST(PeriodicTest, ZeroPeriodIsRejected) {
    tx::TransactionBuilder builder;
    tx::PeriodicScheduleConfig config;
    config.first_start_ms = 10;
    EXPECT_TRUE(is_error(
        tx::compose_configure_periodic(builder, test_objects(), object_ref(0x300, 9), config)));

    config.period_ms = 1000;
    EXPECT_FALSE(is_error(
        tx::compose_configure_periodic(builder, test_objects(), object_ref(0x300, 9), config)));
}

TEST(TaskCreateTest, SharesTheTaskLast) {
    tx::TransactionBuilder builder;
    tx::TaskCreateParams params;
    params.dag_id = Address::from_u64(0x400);
    params.metadata = {{"owner", "tests"}};
    tx::compose_task_create(builder, test_objects(), params);

    const auto names = function_names(builder);
    ASSERT_FALSE(names.empty());
    EXPECT_EQ(names.front(), "new_metadata");
    EXPECT_EQ(names.back(), "public_share_object");
    EXPECT_NE(std::find(names.begin(), names.end(), "register_queue_generator"), names.end());
}

TEST(TransactionBuilderTest, SharedInputsAreDeduplicatedAndUpgraded) {
    tx::TransactionBuilder builder;
    const auto ref = object_ref(0x200, 3);
    const auto first = builder.shared_object(ref, false);
    const auto second = builder.shared_object(ref, true);
    EXPECT_EQ(first, second);
    ASSERT_EQ(builder.inputs().size(), 1u);
    EXPECT_TRUE(builder.inputs()[0].shared.is_mutable);

    const auto owned = builder.owned_object(object_ref(0x201, 1));
    EXPECT_EQ(builder.owned_object(object_ref(0x201, 1)), owned);
    EXPECT_EQ(builder.inputs().size(), 2u);
}

TEST(TransactionBuilderTest, SplitPaymentTakesFirstNestedResult) {
    tx::TransactionBuilder builder;
    const auto payment = tx::split_payment(builder, 500);
    EXPECT_EQ(payment.kind, tx::Argument::Kind::NestedResult);
    EXPECT_EQ(payment.index, 0u);
    EXPECT_EQ(payment.sub_index, 0u);
    ASSERT_EQ(builder.commands().size(), 1u);
    EXPECT_TRUE(std::holds_alternative<tx::SplitCoins>(builder.commands()[0]));

    auto finished = builder.finish();
    ASSERT_FALSE(is_error(finished));
    EXPECT_EQ(get_value(finished).move_call_count(), 0u);
}

TEST(TransactionBuilderTest, SerializationValidatesDigests) {
    tx::TransactionBuilder builder;
    tx::split_payment(builder, 1);
    auto finished = builder.finish();
    ASSERT_FALSE(is_error(finished));

    tx::TransactionData data;
    data.kind = get_value(finished);
    data.sender = Address::from_u64(1);
    data.gas.owner = data.sender;
    data.gas.price = 1000;
    data.gas.budget = 5000000;
    data.gas.payment = {object_ref(0x900, 2)};

    auto bytes = tx::transaction_data_to_bcs(data);
    ASSERT_FALSE(is_error(bytes));
    const auto message = tx::transaction_intent_message(get_value(bytes));
    ASSERT_EQ(message.size(), get_value(bytes).size() + 3);
    EXPECT_EQ(message[0], 0);
    EXPECT_EQ(message[1], 0);
    EXPECT_EQ(message[2], 0);

    data.gas.payment[0].digest = "not-base58!";
    EXPECT_TRUE(is_error(tx::transaction_data_to_bcs(data)));
}

nexus::types::ToolFqn dummy_fqn() {
    return nexus::types::ToolFqn{"xyz", "dummy", 1};
}

TEST(ToolTest, OffChainRegistrationHandsBothCapsToOwner) {
    tx::TransactionBuilder builder;
    tx::OffChainToolMeta meta;
    meta.fqn = dummy_fqn();
    meta.url = "https://tool.example/";
    meta.input_schema = json::object();
    meta.output_schema = json::object();
    const auto collateral = tx::split_payment(builder, 100);
    tx::compose_register_off_chain_tool(builder, test_objects(), meta, Address::from_u64(0x7),
                                        collateral, 25);

    EXPECT_EQ(function_names(builder),
              (std::vector<std::string>{"register_off_chain_tool", "deescalate",
                                        "set_single_invocation_cost_mist", "public_transfer",
                                        "public_transfer"}));
}

TEST(ToolTest, OwnerCapCallsTakeTheFqn) {
    tx::TransactionBuilder builder;
    tx::compose_unregister_tool(builder, test_objects(), dummy_fqn(), object_ref(0x500, 2));
    tx::compose_claim_collateral(builder, test_objects(), dummy_fqn(), object_ref(0x500, 2));
    EXPECT_EQ(function_names(builder),
              (std::vector<std::string>{"unregister_tool", "claim_collateral_for_self"}));
    // The owner cap is declared once.
    EXPECT_EQ(std::count_if(builder.inputs().begin(), builder.inputs().end(),
                            [](const tx::CallArg& arg) { return arg.kind == tx::CallArg::Kind::OwnedObject; }),
              1);
}

TEST(GasTest, BudgetIsScopedToInvoker) {
    tx::TransactionBuilder builder;
    const auto coin = tx::split_payment(builder, 1000);
    tx::compose_add_gas_budget(builder, test_objects(), Address::from_u64(0x7), coin);
    EXPECT_EQ(function_names(builder),
              (std::vector<std::string>{"scope_invoker_address", "into_balance", "add_gas_budget"}));
}

TEST(GasTest, TicketLifecycleUsesGasExtension) {
    tx::TransactionBuilder builder;
    const auto cap = object_ref(0x501, 3);
    tx::compose_enable_expiry(builder, test_objects(), dummy_fqn(), cap, 10);
    tx::compose_buy_expiry_ticket(builder, test_objects(), dummy_fqn(), 30,
                                  tx::split_payment(builder, 300));
    tx::compose_disable_expiry(builder, test_objects(), dummy_fqn(), cap);
    tx::compose_enable_limited_invocations(builder, test_objects(), dummy_fqn(), cap, 5, 1, 100);
    tx::compose_buy_limited_invocations_ticket(builder, test_objects(), dummy_fqn(), 20,
                                               tx::split_payment(builder, 100));
    tx::compose_disable_limited_invocations(builder, test_objects(), dummy_fqn(), cap);

    EXPECT_EQ(function_names(builder),
              (std::vector<std::string>{"enable_expiry", "buy_expiry_gas_ticket", "disable_expiry",
                                        "enable_limited_invocations",
                                        "buy_limited_invocations_gas_ticket",
                                        "disable_limited_invocations"}));
}

TEST(KeyBindingTest, NewBindingIsCreatedThenTransferred) {
    tx::TransactionBuilder builder;
    tx::compose_register_tool_key(builder, test_objects(), dummy_fqn(), object_ref(0x502, 1),
                                  std::nullopt, Address::from_u64(0x7),
                                  nexus::codec::Ed25519PublicKey{}, nexus::codec::Ed25519Signature{},
                                  std::string("primary"));
    EXPECT_EQ(function_names(builder),
              (std::vector<std::string>{"prove_offchain_tool", "create_binding",
                                        "prove_offchain_tool", "new_proof_of_key",
                                        "register_key"}));
    EXPECT_TRUE(std::holds_alternative<tx::TransferObjects>(builder.commands().back()));
}

TEST(KeyBindingTest, RotationReusesTheExistingBinding) {
    tx::TransactionBuilder builder;
    tx::compose_register_leader_key(builder, test_objects(), object_ref(0x503, 6),
                                    object_ref(0x504, 2), Address::from_u64(0x7),
                                    nexus::codec::Ed25519PublicKey{},
                                    nexus::codec::Ed25519Signature{}, std::nullopt);
    EXPECT_EQ(function_names(builder),
              (std::vector<std::string>{"prove_leader", "new_proof_of_key", "register_key"}));
    EXPECT_TRUE(std::holds_alternative<tx::MoveCall>(builder.commands().back()));
}

TEST(ProofOfPossessionTest, MessageBindsIdentityAndKeyId) {
    auto created = nexus::codec::SigningKey::from_seed(nexus::codec::Ed25519Seed{});
    ASSERT_FALSE(is_error(created));
    const auto& key = get_value(created);
    const auto identity = tx::IdentityKey::for_leader(Address::from_u64(0x55));
    const auto& public_key = key.verifying_key().bytes();

    const auto message = tx::proof_of_possession_message(identity, 4, public_key);
    const std::string domain = tx::kProofOfPossessionDomainV1;
    ASSERT_GT(message.size(), domain.size() + public_key.size());
    EXPECT_EQ(std::string(message.begin(), message.begin() + domain.size()), domain);
    EXPECT_NE(message, tx::proof_of_possession_message(identity, 5, public_key));

    auto signature = tx::sign_proof_of_possession(key, identity, 4);
    ASSERT_FALSE(is_error(signature));
    EXPECT_TRUE(key.verifying_key().verify_strict(message, get_value(signature)));
}

}  // namespace
