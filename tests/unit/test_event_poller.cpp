#include <atomic>
#include <chrono>
#include <memory>
#include <vector>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "events/encoder.hpp"
#include "events/event_poller.hpp"
#include "mock_ledger.hpp"

namespace {

using nexus::codec::Address;
using nexus::core::errors::get_error;
using nexus::core::errors::get_value;
using nexus::core::errors::is_error;
using nexus::testing::MockLedger;
namespace events = nexus::events;

const Address kPrimitives = Address::from_u64(0xaa);
const Address kWorkflow = Address::from_u64(0xbb);

nexus::types::NexusObjects objects() {
    nexus::types::NexusObjects out;
    out.primitives_pkg_id = kPrimitives;
    out.workflow_pkg_id = kWorkflow;
    return out;
}

nexus::ledger::LedgerEvent encoded(events::NexusEventKind kind, std::uint64_t sequence) {
    events::NexusEvent event{nexus::ledger::EventId{"tx", sequence}, {}, std::move(kind)};
    return events::encode_event(event, kPrimitives, kWorkflow);
}

std::shared_ptr<MockLedger> ledger_with_events() {
    auto mock = std::make_shared<MockLedger>();
    nexus::ledger::LedgerEvent foreign;
    foreign.id = nexus::ledger::EventId{"tx", 0};
    foreign.package_id = Address::from_u64(0x99);
    foreign.type = Address::from_u64(0x99).to_hex() + "::coin::Minted";
    foreign.contents = nlohmann::json::object();
    mock->events.push_back(foreign);
    mock->events.push_back(
        encoded(events::NexusEventKind{events::TaskCreated{Address::from_u64(1), Address::from_u64(2)}}, 1));
    mock->events.push_back(encoded(events::NexusEventKind{events::TaskPaused{Address::from_u64(1)}}, 2));
    return mock;
}

TEST(EventPollerTest, PagesAdvanceTheCursorAndSkipForeignEvents) {
    auto mock = ledger_with_events();
    events::EventPollerOptions options;
    options.page_size = 2;
    events::EventPoller poller(mock, objects(), options, [](std::chrono::milliseconds) {});

    auto first = poller.poll_once();
    ASSERT_FALSE(is_error(first));
    ASSERT_EQ(get_value(first).size(), 1u);
    EXPECT_NE(get_value(first)[0].data.as<events::TaskCreated>(), nullptr);
    EXPECT_EQ(poller.cursor(), std::optional<std::string>("2"));

    auto second = poller.poll_once();
    ASSERT_FALSE(is_error(second));
    ASSERT_EQ(get_value(second).size(), 1u);
    EXPECT_NE(get_value(second)[0].data.as<events::TaskPaused>(), nullptr);

    auto empty = poller.poll_once();
    ASSERT_FALSE(is_error(empty));
    EXPECT_TRUE(get_value(empty).empty());
}

TEST(EventPollerTest, MalformedNexusEventKeepsCursor) {
    auto mock = std::make_shared<MockLedger>();
    auto broken = encoded(events::NexusEventKind{events::TaskPaused{Address::from_u64(1)}}, 0);
    broken.contents = nlohmann::json{{"event", {{"task", 17}}}};
    mock->events.push_back(broken);
    events::EventPoller poller(mock, objects(), events::EventPollerOptions{},
                               [](std::chrono::milliseconds) {});

    auto result = poller.poll_once();
    ASSERT_TRUE(is_error(result));
    EXPECT_FALSE(poller.cursor().has_value());
}

TEST(EventPollerTest, RunBacksOffOnEmptyPagesUntilCancelled) {
    auto mock = ledger_with_events();
    auto cancel = std::make_shared<std::atomic_bool>(false);
    std::vector<std::int64_t> sleeps;
    events::EventPollerOptions options;
    options.page_size = 10;
    events::EventPoller poller(mock, objects(), options,
                               [&](std::chrono::milliseconds duration) {
                                   sleeps.push_back(duration.count());
                                   if (sleeps.size() == 3) {
                                       cancel->store(true);
                                   }
                               });

    int handled = 0;
    auto status = poller.run(
        [&handled](const events::NexusEvent&) {
            ++handled;
            return nexus::core::errors::ok();
        },
        cancel);
    ASSERT_FALSE(is_error(status));
    EXPECT_EQ(handled, 2);
    // 100 ms then 200 ms, sliced for the cancellation check.
    EXPECT_EQ(sleeps, (std::vector<std::int64_t>{50, 50, 50}));
}

TEST(EventPollerTest, HandlerFailureStopsTheLoop) {
    auto mock = ledger_with_events();
    events::EventPoller poller(mock, objects(), events::EventPollerOptions{},
                               [](std::chrono::milliseconds) {});
    auto status = poller.run(
        [](const events::NexusEvent&) -> nexus::core::errors::Status {
            return nexus::core::errors::NexusError{nexus::core::errors::ErrorCategory::Internal,
                                                   "handler refused", "handler_failed"};
        },
        std::make_shared<std::atomic_bool>(false));
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "handler_failed");
}

}  // namespace
