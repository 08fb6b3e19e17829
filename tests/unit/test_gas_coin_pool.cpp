#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <gtest/gtest.h>
#include "client/gas_coin_pool.hpp"
#include "mock_ledger.hpp"

namespace {

using nexus::client::GasCoinPool;
using nexus::core::errors::get_error;
using nexus::core::errors::is_error;
using nexus::core::errors::take_value;
using nexus::testing::object_ref;

TEST(GasCoinPoolTest, LeaseReturnsUpdatedCoin) {
    GasCoinPool pool({object_ref(0x900, 1)});
    {
        auto acquired = pool.acquire(std::chrono::milliseconds(10));
        ASSERT_FALSE(is_error(acquired));
        auto lease = take_value(acquired);
        EXPECT_EQ(pool.available(), 0u);
        lease.update(object_ref(0x900, 2));
    }
    EXPECT_EQ(pool.available(), 1u);

    auto again = pool.acquire(std::chrono::milliseconds(10));
    ASSERT_FALSE(is_error(again));
    EXPECT_EQ(take_value(again).coin().version, 2u);
}

TEST(GasCoinPoolTest, TimesOutWhenExhausted) {
    GasCoinPool pool({object_ref(0x900, 1)});
    auto held = pool.acquire(std::chrono::milliseconds(10));
    ASSERT_FALSE(is_error(held));

    auto second = pool.acquire(std::chrono::milliseconds(20));
    ASSERT_TRUE(is_error(second));
    EXPECT_EQ(get_error(second).code, "timeout");
}

TEST(GasCoinPoolTest, CancelledWaitStops) {
    GasCoinPool pool({object_ref(0x900, 1)});
    auto held = pool.acquire(std::chrono::milliseconds(10));
    ASSERT_FALSE(is_error(held));

    auto cancel = std::make_shared<std::atomic_bool>(true);
    auto waiting = pool.acquire(std::chrono::seconds(5), cancel);
    ASSERT_TRUE(is_error(waiting));
    EXPECT_EQ(get_error(waiting).code, "cancelled");
}

TEST(GasCoinPoolTest, WaiterGetsReleasedCoin) {
    GasCoinPool pool({object_ref(0x900, 1)});
    auto held = pool.acquire(std::chrono::milliseconds(10));
    ASSERT_FALSE(is_error(held));
    auto lease = take_value(held);

    auto waiter = std::async(std::launch::async, [&pool]() {
        return pool.acquire(std::chrono::seconds(5));
    });
    lease.update(object_ref(0x900, 7));
    lease.release();

    auto acquired = waiter.get();
    ASSERT_FALSE(is_error(acquired));
    EXPECT_EQ(take_value(acquired).coin().version, 7u);
    EXPECT_EQ(pool.size(), 1u);
}

}  // namespace
