#include <memory>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "codec/address.hpp"
#include "events/decoder.hpp"
#include "events/encoder.hpp"
#include "events/event_kinds.hpp"
#include "types/nexus_objects.hpp"

namespace {

using nexus::core::errors::get_error;
using nexus::core::errors::get_value;
using nexus::core::errors::is_error;
using nexus::codec::Address;
using nlohmann::json;
namespace events = nexus::events;

const Address kPrimitives = Address::from_u64(0xaa);
const Address kWorkflow = Address::from_u64(0xbb);

std::string wrapped(const std::string& inner) {
    return kPrimitives.to_hex() + "::event::EventWrapper<" + inner + ">";
}

std::string workflow_type(const std::string& module, const std::string& name) {
    return kWorkflow.to_hex() + "::" + module + "::" + name;
}

json walk_execution_payload() {
    return json{{"dag", Address::from_u64(0xd).to_hex()},
                {"execution", Address::from_u64(0xe).to_hex()},
                {"invoker", Address::from_u64(0xf).to_hex()},
                {"walk_index", "42"},
                {"next_vertex", {{"@variant", "Plain"}, {"vertex", {{"name", "summarize"}}}}},
                {"evaluations", Address::from_u64(0x10).to_hex()},
                {"worksheet_from_type", {{"name", "0x1::worksheet::Sheet"}}}};
}

nexus::ledger::LedgerEvent ledger_event(const std::string& type, json payload) {
    nexus::ledger::LedgerEvent event;
    event.id = nexus::ledger::EventId{"digest", 0};
    event.package_id = kWorkflow;
    event.type = type;
    event.contents = json{{"event", std::move(payload)}};
    return event;
}

TEST(EventDecoderTest, DecodesScheduledWalkExecution) {
    const auto type = wrapped(workflow_type("scheduler", "RequestScheduledExecution") + "<" +
                              workflow_type("dag", "RequestWalkExecutionEvent") + ">");
    const json payload{{"request", walk_execution_payload()},
                       {"priority", "7"},
                       {"request_ms", "1"},
                       {"start_ms", "2"},
                       {"deadline_ms", "3"}};

    auto decoded = events::decode_event(ledger_event(type, payload));
    ASSERT_FALSE(is_error(decoded));
    const auto& event = get_value(decoded);
    ASSERT_EQ(event.generics.size(), 1u);

    const auto* scheduled = event.data.as<events::RequestScheduledExecution>();
    ASSERT_NE(scheduled, nullptr);
    EXPECT_EQ(scheduled->priority, 7u);
    EXPECT_EQ(scheduled->start_ms, 2u);
    EXPECT_EQ(scheduled->deadline_ms, 3u);
    ASSERT_TRUE(scheduled->request);
    const auto* walk = scheduled->request->as<events::RequestWalkExecution>();
    ASSERT_NE(walk, nullptr);
    EXPECT_EQ(walk->walk_index, 42u);
    EXPECT_EQ(walk->next_vertex, nexus::types::RuntimeVertex::plain("summarize"));
    EXPECT_EQ(walk->dag, Address::from_u64(0xd));
}

TEST(EventDecoderTest, NestedScheduledRoundTripsAtDepthThree) {
    events::RequestWalkExecution walk;
    walk.dag = Address::from_u64(1);
    walk.walk_index = 9;
    walk.next_vertex = nexus::types::RuntimeVertex::plain("v");
    walk.worksheet_from_type = nexus::types::TypeName{"sheet"};

    events::RequestScheduledExecution inner;
    inner.request = std::make_shared<const events::NexusEventKind>(events::NexusEventKind{walk});
    inner.priority = 5;
    inner.start_ms = 100;

    events::RequestScheduledExecution outer;
    outer.request = std::make_shared<const events::NexusEventKind>(events::NexusEventKind{inner});
    outer.priority = 6;
    outer.deadline_ms = 300;

    events::NexusEvent original{nexus::ledger::EventId{"tx", 3}, {}, events::NexusEventKind{outer}};
    const auto encoded = events::encode_event(original, kPrimitives, kWorkflow);

    nexus::types::NexusObjects objects;
    objects.primitives_pkg_id = kPrimitives;
    objects.workflow_pkg_id = kWorkflow;
    auto decoded = events::decode_event(encoded, &objects);
    ASSERT_FALSE(is_error(decoded));
    const auto& event = get_value(decoded);
    EXPECT_EQ(event.id, original.id);

    const auto* level1 = event.data.as<events::RequestScheduledExecution>();
    ASSERT_NE(level1, nullptr);
    EXPECT_EQ(level1->priority, 6u);
    EXPECT_EQ(level1->deadline_ms, 300u);
    const auto* level2 = level1->request->as<events::RequestScheduledExecution>();
    ASSERT_NE(level2, nullptr);
    EXPECT_EQ(level2->priority, 5u);
    EXPECT_EQ(level2->start_ms, 100u);
    const auto* level3 = level2->request->as<events::RequestWalkExecution>();
    ASSERT_NE(level3, nullptr);
    EXPECT_EQ(level3->walk_index, 9u);
    EXPECT_EQ(level3->worksheet_from_type, walk.worksheet_from_type);

    EXPECT_EQ(events::kind_to_json(event.data), events::kind_to_json(original.data));
}

TEST(EventDecoderTest, ToolRegisteredOriginFollowsStructName) {
    const json payload{{"tool", Address::from_u64(0x77).to_hex()}, {"fqn", "xyz.dummy.tool@1"}};
    auto decoded = events::decode_event(
        ledger_event(wrapped(workflow_type("tool_registry", "OffChainToolRegisteredEvent")), payload));
    ASSERT_FALSE(is_error(decoded));
    const auto* registered = get_value(decoded).data.as<events::ToolRegistered>();
    ASSERT_NE(registered, nullptr);
    EXPECT_EQ(registered->origin, events::ToolRegistered::Origin::OffChain);
    EXPECT_EQ(registered->fqn.to_string(), "xyz.dummy.tool@1");
    EXPECT_EQ(get_value(decoded).data.name(), "OffChainToolRegisteredEvent");
}

TEST(EventDecoderTest, RejectsForeignAndUnknownEvents) {
    auto foreign = events::decode_event(
        ledger_event(workflow_type("coin", "CoinMinted"), json::object()));
    ASSERT_TRUE(is_error(foreign));
    EXPECT_EQ(get_error(foreign).code, "not_nexus_event");

    auto unknown = events::decode_event(
        ledger_event(wrapped(workflow_type("dag", "SomethingNewEvent")), json::object()));
    ASSERT_TRUE(is_error(unknown));
    EXPECT_EQ(get_error(unknown).code, "unknown_event_kind");

    auto primitive = events::decode_event(ledger_event(wrapped("u64"), json::object()));
    ASSERT_TRUE(is_error(primitive));
    EXPECT_EQ(get_error(primitive).code, "not_a_struct");
}

TEST(EventDecoderTest, MalformedStringifiedIntegerFails) {
    auto payload = walk_execution_payload();
    payload["walk_index"] = "forty-two";
    auto decoded = events::decode_event(
        ledger_event(wrapped(workflow_type("dag", "RequestWalkExecutionEvent")), payload));
    ASSERT_TRUE(is_error(decoded));
    EXPECT_EQ(get_error(decoded).code, "malformed_payload");
}

TEST(EventDecoderTest, PackageFilterAppliesWithObjects) {
    nexus::types::NexusObjects objects;
    objects.primitives_pkg_id = kPrimitives;
    objects.workflow_pkg_id = Address::from_u64(0xcc);

    const json payload{{"task", Address::from_u64(1).to_hex()},
                       {"owner", Address::from_u64(2).to_hex()}};
    auto event = ledger_event(wrapped(workflow_type("scheduler", "TaskCreatedEvent")), payload);

    auto filtered = events::decode_event(event, &objects);
    ASSERT_TRUE(is_error(filtered));
    EXPECT_EQ(get_error(filtered).code, "not_nexus_event");

    auto unfiltered = events::decode_event(event);
    ASSERT_FALSE(is_error(unfiltered));
    ASSERT_NE(get_value(unfiltered).data.as<events::TaskCreated>(), nullptr);
}

}  // namespace
