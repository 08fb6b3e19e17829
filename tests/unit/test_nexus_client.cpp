#include <atomic>
#include <chrono>
#include <memory>
#include <numeric>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "client/gas_actions.hpp"
#include "client/network_auth_actions.hpp"
#include "client/nexus_client.hpp"
#include "client/scheduler_actions.hpp"
#include "client/workflow_actions.hpp"
#include "codec/ed25519.hpp"
#include "codec/hex.hpp"
#include "events/encoder.hpp"
#include "mock_ledger.hpp"
#include "signed_http/keys.hpp"
#include "transactions/dag.hpp"

namespace {

using nexus::codec::Address;
using nexus::core::errors::get_error;
using nexus::core::errors::get_value;
using nexus::core::errors::is_error;
using nexus::core::errors::take_value;
using nexus::testing::FakeSigner;
using nexus::testing::MockLedger;
using nexus::testing::object_ref;
using nlohmann::json;
namespace client = nexus::client;
namespace events = nexus::events;
namespace ledger = nexus::ledger;

const Address kWorkflow = Address::from_u64(0xbb);
const Address kPrimitives = Address::from_u64(0xaa);
const Address kSender = Address::from_u64(0x77);

nexus::core::config::ClientConfig test_config() {
    nexus::core::config::ClientConfig config;
    config.rpc_url = "http://127.0.0.1:9000";
    config.gas_budget = 5000000;
    config.gas_coins = {object_ref(0x900, 2)};
    config.transaction_timeout_ms = 1000;
    config.nexus_objects.workflow_pkg_id = kWorkflow;
    config.nexus_objects.primitives_pkg_id = kPrimitives;
    config.nexus_objects.interface_pkg_id = Address::from_u64(0xcc);
    config.nexus_objects.network_id = Address::from_u64(0xdd);
    config.nexus_objects.tool_registry = object_ref(0x101, 4);
    config.nexus_objects.default_tap = object_ref(0x102, 4);
    config.nexus_objects.gas_service = object_ref(0x103, 4);
    return config;
}

ledger::ChangedObject created(std::uint64_t id, const std::string& type) {
    ledger::ChangedObject change;
    change.object_id = Address::from_u64(id);
    change.change = ledger::ChangedObject::Change::Created;
    change.object_type = type;
    change.owner = ledger::Owner::shared(10);
    change.version = 10;
    change.digest = nexus::testing::digest_for(10);
    return change;
}

ledger::ExecutedTransaction success(const std::string& digest, std::uint64_t gas_version) {
    ledger::ExecutedTransaction executed;
    executed.digest = digest;
    executed.effects.success = true;
    executed.effects.gas_object = object_ref(0x900, gas_version);
    return executed;
}

ledger::LedgerEvent nexus_event(events::NexusEventKind kind, std::uint64_t sequence) {
    events::NexusEvent event{ledger::EventId{"tx", sequence}, {}, std::move(kind)};
    return events::encode_event(event, kPrimitives, kWorkflow);
}

// GasData.price sits before the budget and the expiration tag at the end of
// the transaction bytes.
std::uint64_t signed_gas_price(const nexus::codec::Bytes& transaction) {
    std::uint64_t price = 0;
    const std::size_t offset = transaction.size() - 17;
    for (std::size_t i = 0; i < 8; ++i) {
        price |= static_cast<std::uint64_t>(transaction[offset + i]) << (8 * i);
    }
    return price;
}

class NexusClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        ledger_ = std::make_shared<MockLedger>();
        signer_ = std::make_shared<FakeSigner>(kSender);
    }

    std::unique_ptr<client::NexusClient> build(nexus::core::config::ClientConfig config) {
        auto built = client::NexusClientBuilder(std::move(config))
                         .with_ledger(ledger_)
                         .with_signer(signer_)
                         .with_sleeper([this](std::chrono::milliseconds duration) {
                             sleeps_.push_back(duration.count());
                         })
                         .build();
        EXPECT_FALSE(is_error(built));
        return take_value(built);
    }

    std::unique_ptr<client::NexusClient> build() { return build(test_config()); }

    std::uint64_t slept_ms() const {
        return std::accumulate(sleeps_.begin(), sleeps_.end(), std::uint64_t{0});
    }

    std::shared_ptr<MockLedger> ledger_;
    std::shared_ptr<FakeSigner> signer_;
    std::vector<std::int64_t> sleeps_;
};

nexus::transactions::Dag one_vertex_dag() {
    auto dag = nexus::transactions::parse_dag(json{
        {"vertices",
         json::array({{{"name", "only"},
                       {"kind", {{"variant", "off_chain"}, {"tool_fqn", "xyz.dummy.tool@1"}}},
                       {"entry_ports", json::array({"input"})}}})}});
    return take_value(dag);
}

TEST_F(NexusClientTest, BuildValidatesConfiguration) {
    auto no_signer = client::NexusClientBuilder(test_config()).with_ledger(ledger_).build();
    ASSERT_TRUE(is_error(no_signer));
    EXPECT_EQ(get_error(no_signer).code, "configuration");

    auto duplicate = test_config();
    duplicate.gas_coins.push_back(object_ref(0x900, 2));
    auto built = client::NexusClientBuilder(duplicate).with_ledger(ledger_).with_signer(signer_).build();
    ASSERT_TRUE(is_error(built));
    EXPECT_NE(get_error(built).message.find("twice"), std::string::npos);

    auto no_budget = test_config();
    no_budget.gas_budget = 0;
    EXPECT_TRUE(is_error(
        client::NexusClientBuilder(no_budget).with_ledger(ledger_).with_signer(signer_).build()));

    auto no_coins = test_config();
    no_coins.gas_coins.clear();
    EXPECT_TRUE(is_error(
        client::NexusClientBuilder(no_coins).with_ledger(ledger_).with_signer(signer_).build()));
    EXPECT_EQ(ledger_->epoch_calls, 0);

    ledger_->set_epoch(9, 750);
    auto client = build();
    EXPECT_EQ(client->reference_gas_price(), 750u);
    EXPECT_EQ(client->sender(), kSender);
}

TEST_F(NexusClientTest, PublishFindsCreatedDagAndUpdatesGasCoin) {
    auto client = build();
    auto executed = success("tx-publish", 3);
    executed.effects.changed_objects.push_back(created(0xd00, kWorkflow.to_hex() + "::dag::DAG"));
    ledger_->push_execution(executed);
    ledger_->set_checkpoint("tx-publish", 12, 2);

    auto published = client->workflow().publish(one_vertex_dag());
    ASSERT_FALSE(is_error(published));
    EXPECT_EQ(get_value(published).tx_digest, "tx-publish");
    EXPECT_EQ(get_value(published).dag_object_id, Address::from_u64(0xd00));

    EXPECT_EQ(signer_->signed_count, 1);
    ASSERT_EQ(ledger_->executed_signatures.size(), 1u);
    EXPECT_EQ(ledger_->executed_signatures[0][0], "c2lnbmF0dXJl");
    EXPECT_EQ(ledger_->executed_transactions[0], signer_->last_signed);
    EXPECT_EQ(ledger_->checkpoint_polls, 3);
    EXPECT_EQ(sleeps_, (std::vector<std::int64_t>{100, 200}));

    auto lease = client->gas_coins().acquire(std::chrono::milliseconds(10));
    ASSERT_FALSE(is_error(lease));
    EXPECT_EQ(take_value(lease).coin().version, 3u);
}

TEST_F(NexusClientTest, ExecuteCommitsEntryDataAndReturnsExecution) {
    auto client = build();
    const auto dag_id = Address::from_u64(0xd00);
    ledger_->put_object(dag_id, ledger::Owner::shared(8), 9, kWorkflow.to_hex() + "::dag::DAG",
                        json::object());
    auto executed = success("tx-execute", 4);
    executed.effects.changed_objects.push_back(
        created(0xe00, kWorkflow.to_hex() + "::dag::DAGExecution"));
    ledger_->push_execution(executed);
    ledger_->set_checkpoint("tx-execute", 13, 0);

    client::ExecuteRequest request;
    request.dag_id = dag_id;
    request.entry_data = json{{"only", {{"input", "hello"}}}};
    auto result = client->workflow().execute(request);
    ASSERT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result).tx_digest, "tx-execute");
    EXPECT_EQ(get_value(result).execution_id, Address::from_u64(0xe00));
    ASSERT_EQ(ledger_->executed_transactions.size(), 1u);
    EXPECT_EQ(signed_gas_price(ledger_->executed_transactions[0]), 1000u);
}

TEST_F(NexusClientTest, ExecutePaysTheRequestedGasPrice) {
    auto client = build();
    const auto dag_id = Address::from_u64(0xd02);
    ledger_->put_object(dag_id, ledger::Owner::shared(8), 9, kWorkflow.to_hex() + "::dag::DAG",
                        json::object());
    client::ExecuteRequest request;
    request.dag_id = dag_id;
    request.entry_data = json{{"only", {{"input", 1}}}};

    request.gas_price = 999;
    auto too_cheap = client->workflow().execute(request);
    ASSERT_TRUE(is_error(too_cheap));
    EXPECT_EQ(get_error(too_cheap).code, "configuration");
    EXPECT_TRUE(ledger_->executed_transactions.empty());

    auto executed = success("tx-priority", 4);
    executed.effects.changed_objects.push_back(
        created(0xe01, kWorkflow.to_hex() + "::dag::DAGExecution"));
    ledger_->push_execution(executed);
    ledger_->set_checkpoint("tx-priority", 15, 0);
    request.gas_price = 2500;
    auto result = client->workflow().execute(request);
    ASSERT_FALSE(is_error(result));
    ASSERT_EQ(ledger_->executed_transactions.size(), 1u);
    EXPECT_EQ(signed_gas_price(ledger_->executed_transactions[0]), 2500u);
}

TEST_F(NexusClientTest, ExecuteRejectsUnsharedDagAndBadEntryData) {
    auto client = build();
    const auto dag_id = Address::from_u64(0xd01);
    ledger_->put_object(dag_id, ledger::Owner::address_owner(kSender), 2,
                        kWorkflow.to_hex() + "::dag::DAG", json::object());

    client::ExecuteRequest request;
    request.dag_id = dag_id;
    request.entry_data = json{{"only", {{"input", 1}}}};
    auto unshared = client->workflow().execute(request);
    ASSERT_TRUE(is_error(unshared));
    EXPECT_EQ(get_error(unshared).code, "configuration");

    request.entry_data = json::array();
    EXPECT_TRUE(is_error(client->workflow().execute(request)));
    EXPECT_TRUE(ledger_->executed_transactions.empty());
}

TEST_F(NexusClientTest, GasBudgetRequiresPositiveAmount) {
    auto client = build();
    EXPECT_TRUE(is_error(client->gas().add_budget(0)));
    EXPECT_TRUE(ledger_->executed_transactions.empty());

    ledger_->push_execution(success("tx-budget", 3));
    ledger_->set_checkpoint("tx-budget", 14, 0);
    auto digest = client->gas().add_budget(1000);
    ASSERT_FALSE(is_error(digest));
    EXPECT_EQ(get_value(digest), "tx-budget");
}

TEST_F(NexusClientTest, FailedTransactionIsWalletErrorAndStillBumpsCoin) {
    auto client = build();
    auto executed = success("tx-abort", 5);
    executed.effects.success = false;
    executed.effects.error = "MoveAbort in dag::with_edge";
    executed.effects.status_code = 3;
    ledger_->push_execution(executed);

    auto published = client->workflow().publish(one_vertex_dag());
    ASSERT_TRUE(is_error(published));
    EXPECT_EQ(get_error(published).code, "wallet");
    ASSERT_TRUE(get_error(published).status_code.has_value());
    EXPECT_EQ(*get_error(published).status_code, 3u);
    EXPECT_EQ(ledger_->checkpoint_polls, 0);

    EXPECT_EQ(client->gas_coins().available(), 1u);
    auto lease = client->gas_coins().acquire(std::chrono::milliseconds(10));
    ASSERT_FALSE(is_error(lease));
    EXPECT_EQ(take_value(lease).coin().version, 5u);
}

TEST_F(NexusClientTest, SignerFailureLeavesLedgerUntouched) {
    auto client = build();
    signer_->fail = true;
    auto published = client->workflow().publish(one_vertex_dag());
    ASSERT_TRUE(is_error(published));
    EXPECT_EQ(get_error(published).code, "wallet");
    EXPECT_TRUE(ledger_->executed_transactions.empty());
    EXPECT_EQ(client->gas_coins().available(), 1u);
}

TEST_F(NexusClientTest, UncheckpointedTransactionTimesOut) {
    auto client = build();
    ledger_->push_execution(success("tx-slow", 3));

    nexus::transactions::TransactionBuilder tx;
    tx.split_coins(nexus::transactions::Argument::gas_coin(), {tx.pure_u64(1)});
    auto submitted = client->submit(tx);
    ASSERT_TRUE(is_error(submitted));
    EXPECT_EQ(get_error(submitted).code, "timeout");
    EXPECT_EQ(slept_ms(), 1000u);
    EXPECT_EQ(sleeps_.back(), 300);
}

TEST_F(NexusClientTest, CancelledWaitStopsPolling) {
    auto client = build();
    ledger_->push_execution(success("tx-cancel", 3));
    auto cancel = std::make_shared<std::atomic_bool>(false);

    nexus::transactions::TransactionBuilder tx;
    tx.split_coins(nexus::transactions::Argument::gas_coin(), {tx.pure_u64(1)});
    ledger_->set_checkpoint("tx-cancel", std::nullopt);
    cancel->store(true);
    auto submitted = client->submit(tx, cancel);
    ASSERT_TRUE(is_error(submitted));
    EXPECT_EQ(get_error(submitted).code, "cancelled");
    EXPECT_EQ(ledger_->checkpoint_polls, 1);
}

TEST_F(NexusClientTest, NexusEventsSkipForeignPackages) {
    auto client = build();
    client::SubmittedTransaction tx;

    ledger::LedgerEvent foreign;
    foreign.id = ledger::EventId{"tx", 0};
    foreign.package_id = Address::from_u64(0x99);
    foreign.type = Address::from_u64(0x99).to_hex() + "::coin::Minted";
    foreign.contents = json::object();
    tx.events.push_back(foreign);
    tx.events.push_back(nexus_event(
        events::NexusEventKind{events::TaskCreated{Address::from_u64(0x300), kSender}}, 1));

    auto decoded = client->nexus_events(tx);
    ASSERT_FALSE(is_error(decoded));
    ASSERT_EQ(get_value(decoded).size(), 1u);
    EXPECT_NE(get_value(decoded)[0].data.as<events::TaskCreated>(), nullptr);
}

TEST(FindCreatedObjectTest, MatchesModuleNameAndTypeParam) {
    const std::string over_tool = kWorkflow.to_hex() + "::tool_registry::OverTool";
    const std::string over_gas = kWorkflow.to_hex() + "::gas::OverGas";
    client::SubmittedTransaction tx;
    tx.effects.changed_objects.push_back(
        created(0x1, kPrimitives.to_hex() + "::owner_cap::CloneableOwnerCap<" + over_gas + ">"));
    tx.effects.changed_objects.push_back(
        created(0x2, kPrimitives.to_hex() + "::owner_cap::CloneableOwnerCap<" + over_tool + ">"));

    auto tool_cap = client::find_created_object(tx, "owner_cap", "CloneableOwnerCap", "OverTool");
    ASSERT_TRUE(tool_cap.has_value());
    EXPECT_EQ(tool_cap->object_id, Address::from_u64(0x2));

    auto any_cap = client::find_created_object(tx, "owner_cap", "CloneableOwnerCap");
    ASSERT_TRUE(any_cap.has_value());
    EXPECT_EQ(any_cap->object_id, Address::from_u64(0x1));

    EXPECT_FALSE(client::find_created_object(tx, "dag", "DAG").has_value());
}

TEST_F(NexusClientTest, CreateTaskThenSchedulesInitialOccurrence) {
    auto client = build();
    const Address task_id = Address::from_u64(0x300);
    ledger_->put_object(task_id, ledger::Owner::shared(8), 9,
                        kWorkflow.to_hex() + "::scheduler::Task", json::object());

    auto create = success("tx-create", 3);
    create.events.push_back(
        nexus_event(events::NexusEventKind{events::TaskCreated{task_id, kSender}}, 0));
    ledger_->push_execution(create);
    ledger_->set_checkpoint("tx-create", 20);

    auto schedule = success("tx-schedule", 4);
    events::OccurrenceScheduled scheduled;
    scheduled.task = task_id;
    scheduled.generator.witness = "queue";
    schedule.events.push_back(nexus_event(events::NexusEventKind{scheduled}, 0));
    ledger_->push_execution(schedule);
    ledger_->set_checkpoint("tx-schedule", 21);

    nexus::transactions::TaskCreateParams params;
    params.dag_id = Address::from_u64(0xd00);
    nexus::transactions::OccurrenceRequest occurrence{std::nullopt, std::nullopt, 1000,
                                                      std::nullopt, 1000};

    auto result = client->scheduler().create_task(params, occurrence);
    ASSERT_FALSE(is_error(result));
    const auto& task = get_value(result);
    EXPECT_EQ(task.tx_digest, "tx-create");
    EXPECT_EQ(task.task_id, task_id);
    ASSERT_TRUE(task.schedule_tx_digest.has_value());
    EXPECT_EQ(*task.schedule_tx_digest, "tx-schedule");
    ASSERT_TRUE(task.initial_schedule.has_value());
    EXPECT_EQ(task.initial_schedule->task, task_id);
    EXPECT_EQ(ledger_->executed_transactions.size(), 2u);
}

TEST_F(NexusClientTest, InvalidOccurrenceIsRejectedBeforeSubmitting) {
    auto client = build();
    nexus::transactions::TaskCreateParams params;
    params.dag_id = Address::from_u64(0xd00);
    nexus::transactions::OccurrenceRequest occurrence{50, 40, std::nullopt, std::nullopt, 1};

    auto result = client->scheduler().create_task(params, occurrence);
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "configuration");
    EXPECT_TRUE(ledger_->executed_transactions.empty());
}

TEST_F(NexusClientTest, SchedulingFailureAfterCreationNamesTheTask) {
    auto client = build();
    const Address task_id = Address::from_u64(0x301);
    auto create = success("tx-create", 3);
    create.events.push_back(
        nexus_event(events::NexusEventKind{events::TaskCreated{task_id, kSender}}, 0));
    ledger_->push_execution(create);
    ledger_->set_checkpoint("tx-create", 20);

    nexus::transactions::TaskCreateParams params;
    params.dag_id = Address::from_u64(0xd00);
    nexus::transactions::OccurrenceRequest occurrence{std::nullopt, std::nullopt, 10,
                                                      std::nullopt, 1};

    // The task object was never put on the mock ledger.
    auto result = client->scheduler().create_task(params, occurrence);
    ASSERT_TRUE(is_error(result));
    EXPECT_NE(get_error(result).hint.find(task_id.to_hex()), std::string::npos);
}

TEST_F(NexusClientTest, ExportedLeadersFeedTheAllowlist) {
    auto client = build();
    const Address leader = Address::from_u64(0x1ead);
    const Address binding = Address::from_u64(0xb1);
    const Address keys_table = Address::from_u64(0xb2);

    nexus::codec::Ed25519Seed seed{};
    seed.fill(9);
    auto created_key = nexus::codec::SigningKey::from_seed(seed);
    ASSERT_FALSE(is_error(created_key));
    const auto& public_key = get_value(created_key).verifying_key().bytes();

    ledger_->put_object(binding, ledger::Owner::shared(2), 2,
                        kWorkflow.to_hex() + "::network_auth::KeyBinding",
                        json{{"id", binding.to_hex()},
                             {"next_key_id", "1"},
                             {"active_key_id", "0"},
                             {"keys", {{"id", keys_table.to_hex()}, {"size", "1"}}}});
    ledger_->put_dynamic_field(keys_table, Address::from_u64(0xb3), "0",
                               json{{"scheme", "0"},
                                    {"public_key", json(std::vector<unsigned>(public_key.begin(),
                                                                              public_key.end()))},
                                    {"added_at_ms", "5"},
                                    {"revoked_at_ms", nullptr}});

    auto exported = client->network_auth().export_allowed_leaders({{leader, binding}});
    ASSERT_FALSE(is_error(exported));
    EXPECT_EQ(get_value(exported)["version"], 1);

    auto allowlist = nexus::signed_http::AllowedLeaders::from_json_text(get_value(exported).dump());
    ASSERT_FALSE(is_error(allowlist));
    auto resolved = get_value(allowlist).resolve(leader.to_hex(), 0);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(resolved->bytes(), public_key);
    EXPECT_FALSE(get_value(allowlist).resolve(leader.to_hex(), 1).has_value());
}

TEST_F(NexusClientTest, ExportFailsWithoutActiveKey) {
    auto client = build();
    const Address binding = Address::from_u64(0xb1);
    ledger_->put_object(binding, ledger::Owner::shared(2), 2,
                        kWorkflow.to_hex() + "::network_auth::KeyBinding",
                        json{{"id", binding.to_hex()},
                             {"next_key_id", "0"},
                             {"active_key_id", nullptr},
                             {"keys", {{"id", Address::from_u64(0xb2).to_hex()}, {"size", "0"}}}});

    auto exported = client->network_auth().export_allowed_leaders({{Address::from_u64(1), binding}});
    ASSERT_TRUE(is_error(exported));
    EXPECT_EQ(get_error(exported).code, "parsing");
}

}  // namespace
