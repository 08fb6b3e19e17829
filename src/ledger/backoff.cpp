#include "ledger/backoff.hpp"

#include <thread>

namespace nexus::ledger {

namespace {

constexpr std::chrono::milliseconds kCancelCheckInterval{50};

}  // namespace

Sleeper thread_sleeper() {
    return [](const std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
}

bool sleep_unless_cancelled(const Sleeper& sleeper, std::chrono::milliseconds duration,
                            const std::shared_ptr<std::atomic_bool>& cancel_token) {
    if (is_cancelled(cancel_token)) {
        return false;
    }
    if (!cancel_token) {
        sleeper(duration);
        return true;
    }
    while (duration.count() > 0) {
        const auto slice = std::min(duration, kCancelCheckInterval);
        sleeper(slice);
        duration -= slice;
        if (is_cancelled(cancel_token)) {
            return false;
        }
    }
    return true;
}

}  // namespace nexus::ledger
