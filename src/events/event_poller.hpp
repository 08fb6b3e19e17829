#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/nexus_errors.hpp"
#include "events/decoder.hpp"
#include "ledger/backoff.hpp"
#include "ledger/ledger_client.hpp"
#include "types/nexus_objects.hpp"

namespace nexus::events {

struct EventPollerOptions {
    std::uint32_t page_size = 50;
    std::uint64_t initial_backoff_ms = 100;
    std::uint64_t max_backoff_ms = 2000;
};

using EventHandler = std::function<core::errors::Status(const NexusEvent&)>;

// Pulls pages of ledger events from a cursor and decodes the Nexus ones.
class EventPoller {
public:
    EventPoller(std::shared_ptr<ledger::LedgerClient> ledger, types::NexusObjects objects,
                EventPollerOptions options = EventPollerOptions{},
                ledger::Sleeper sleeper = ledger::thread_sleeper());

    // One page. Events from other packages are skipped; any other decode
    // failure is returned and the cursor stays put.
    core::errors::Result<std::vector<NexusEvent>> poll_once();

    // Polls until the handler fails or the token is set. Empty pages back
    // off exponentially; a non-empty page resets the delay.
    core::errors::Status run(const EventHandler& handler,
                             std::shared_ptr<std::atomic_bool> cancel_token);

    const std::optional<std::string>& cursor() const { return cursor_; }
    void set_cursor(std::optional<std::string> cursor) { cursor_ = std::move(cursor); }

private:
    std::shared_ptr<ledger::LedgerClient> ledger_;
    types::NexusObjects objects_;
    EventPollerOptions options_;
    ledger::Sleeper sleeper_;
    std::optional<std::string> cursor_;
};

}  // namespace nexus::events
