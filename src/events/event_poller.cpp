#include "events/event_poller.hpp"

#include <chrono>
#include <utility>
#include "core/logging/logger.hpp"

namespace nexus::events {

EventPoller::EventPoller(std::shared_ptr<ledger::LedgerClient> ledger, types::NexusObjects objects,
                         EventPollerOptions options, ledger::Sleeper sleeper)
    : ledger_(std::move(ledger)),
      objects_(std::move(objects)),
      options_(options),
      sleeper_(std::move(sleeper)) {}

core::errors::Result<std::vector<NexusEvent>> EventPoller::poll_once() {
    auto page = ledger_->query_events(cursor_, options_.page_size);
    if (core::errors::is_error(page)) {
        return core::errors::get_error(page);
    }
    const auto& events = core::errors::get_value(page);

    std::vector<NexusEvent> decoded;
    for (const auto& event : events.events) {
        auto result = decode_event(event, &objects_);
        if (core::errors::is_error(result)) {
            const auto& error = core::errors::get_error(result);
            if (error.code == "not_nexus_event") {
                NEXUS_LOG_DEBUG("EventPoller: Skipping " + event.type);
                continue;
            }
            return error;
        }
        decoded.push_back(core::errors::take_value(result));
    }

    if (events.next_cursor.has_value()) {
        cursor_ = events.next_cursor;
    }
    return decoded;
}

core::errors::Status EventPoller::run(const EventHandler& handler,
                                      std::shared_ptr<std::atomic_bool> cancel_token) {
    ledger::BackoffPolicy backoff;
    backoff.initial_backoff_ms = options_.initial_backoff_ms;
    backoff.max_backoff_ms = options_.max_backoff_ms;
    std::uint64_t delay_ms = 0;

    while (!ledger::is_cancelled(cancel_token)) {
        auto batch = poll_once();
        if (core::errors::is_error(batch)) {
            return core::errors::get_error(batch);
        }
        const auto& events = core::errors::get_value(batch);
        for (const auto& event : events) {
            auto status = handler(event);
            if (core::errors::is_error(status)) {
                return status;
            }
        }

        if (!events.empty()) {
            delay_ms = 0;
            continue;
        }
        delay_ms = backoff.next_delay_ms(delay_ms);
        if (!ledger::sleep_unless_cancelled(sleeper_, std::chrono::milliseconds(delay_ms),
                                            cancel_token)) {
            break;
        }
    }
    NEXUS_LOG_INFO("EventPoller: Stopped.");
    return core::errors::ok();
}

}  // namespace nexus::events
