#include <gtest/gtest.h>
#include "core/errors/nexus_errors.hpp"

using namespace nexus::core::errors;

// Simulates a ledger read that can fail
Result<std::string> simulate_fetch(bool should_fail) {
    if (should_fail) {
        return NexusError{ErrorCategory::Ledger, "Object not found", "object_not_found"};
    }
    return std::string("object contents");
}

TEST(ErrorModelTest, HandlesSuccess) {
    auto result = simulate_fetch(false);

    EXPECT_FALSE(is_error(result));
    EXPECT_EQ(get_value(result), "object contents");
}

TEST(ErrorModelTest, HandlesFailure) {
    auto result = simulate_fetch(true);

    EXPECT_TRUE(is_error(result));

    auto error = get_error(result);
    EXPECT_EQ(error.category, ErrorCategory::Ledger);
    EXPECT_EQ(error.message, "Object not found");
    EXPECT_EQ(error.code, "object_not_found");
}

TEST(ErrorModelTest, TakeValueMovesOut) {
    auto result = simulate_fetch(false);
    auto value = take_value(result);
    EXPECT_EQ(value, "object contents");
}

TEST(ErrorModelTest, RendersForTheCli) {
    NexusError error{ErrorCategory::Ledger, "Transaction failed", "wallet"};
    error.status_code = 7;

    auto rendered = error_to_json(error);
    EXPECT_EQ(rendered["kind"], "wallet");
    EXPECT_EQ(rendered["category"], "ledger");
    EXPECT_EQ(rendered["reason"], "Transaction failed");
    EXPECT_EQ(rendered["status_code"], 7);
    EXPECT_FALSE(rendered.contains("hint"));

    error.status_code.reset();
    error.hint = "retry later";
    rendered = error_to_json(error);
    EXPECT_TRUE(rendered["status_code"].is_null());
    EXPECT_EQ(rendered["hint"], "retry later");
}

TEST(ErrorModelTest, StatusHoldsNoValue) {
    Status status = ok();
    EXPECT_FALSE(is_error(status));
    EXPECT_EQ(to_string(ErrorCategory::Replay), "replay");
}
