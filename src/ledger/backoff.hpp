#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace nexus::ledger {

// Exponential backoff: initial, doubled each step, capped at max.
struct BackoffPolicy {
    std::uint32_t max_attempts = 3;
    std::uint64_t initial_backoff_ms = 100;
    std::uint64_t max_backoff_ms = 2000;

    std::uint64_t next_delay_ms(std::uint64_t current_ms) const {
        if (current_ms == 0) {
            return std::min(initial_backoff_ms, max_backoff_ms);
        }
        if (current_ms >= max_backoff_ms / 2) {
            return max_backoff_ms;
        }
        return current_ms * 2;
    }
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

Sleeper thread_sleeper();

// Returns false when the token was set before or during the wait.
bool sleep_unless_cancelled(const Sleeper& sleeper, std::chrono::milliseconds duration,
                            const std::shared_ptr<std::atomic_bool>& cancel_token);

inline bool is_cancelled(const std::shared_ptr<std::atomic_bool>& cancel_token) {
    return cancel_token && cancel_token->load();
}

}  // namespace nexus::ledger
