#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <vector>
#include "core/errors/nexus_errors.hpp"
#include "ledger/ledger_types.hpp"

namespace nexus::client {

class GasCoinPool;

// Exclusive use of one gas coin. The coin goes back to its pool when the
// lease is destroyed or released, carrying the ref last set by update().
class GasCoinLease {
public:
    GasCoinLease(GasCoinLease&& other) noexcept;
    GasCoinLease& operator=(GasCoinLease&& other) noexcept;
    GasCoinLease(const GasCoinLease&) = delete;
    GasCoinLease& operator=(const GasCoinLease&) = delete;
    ~GasCoinLease();

    const ledger::ObjectRef& coin() const { return coin_; }

    // The coin as it exists after a transaction used it.
    void update(const ledger::ObjectRef& coin) { coin_ = coin; }

    void release();

private:
    friend class GasCoinPool;
    GasCoinLease(GasCoinPool* pool, ledger::ObjectRef coin);

    GasCoinPool* pool_ = nullptr;
    ledger::ObjectRef coin_;
};

// FIFO of owned gas coins shared by every action of one client. The pool
// must outlive its leases.
class GasCoinPool {
public:
    explicit GasCoinPool(std::vector<ledger::ObjectRef> coins);

    // Waits until a coin is free. Fails with Ledger/timeout after `timeout`
    // and Ledger/cancelled once the token is set.
    core::errors::Result<GasCoinLease> acquire(
        std::chrono::milliseconds timeout,
        const std::shared_ptr<std::atomic_bool>& cancel_token = nullptr);

    std::size_t available() const;
    std::size_t size() const { return size_; }

private:
    friend class GasCoinLease;
    void give_back(ledger::ObjectRef coin);

    mutable std::mutex mutex_;
    std::condition_variable coin_returned_;
    std::deque<ledger::ObjectRef> coins_;
    std::size_t size_ = 0;
};

}  // namespace nexus::client
