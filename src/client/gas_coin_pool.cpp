#include "client/gas_coin_pool.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace nexus::client {

using core::errors::NexusError;
using core::errors::ErrorCategory;

namespace {

// Cancellation is observed at this granularity while waiting.
constexpr std::chrono::milliseconds kCancelPollInterval{50};

std::string short_id(const ledger::ObjectRef& coin) {
    return coin.object_id.to_hex().substr(0, 10);
}

}  // namespace

GasCoinLease::GasCoinLease(GasCoinPool* pool, ledger::ObjectRef coin)
    : pool_(pool), coin_(std::move(coin)) {}

GasCoinLease::GasCoinLease(GasCoinLease&& other) noexcept
    : pool_(other.pool_), coin_(std::move(other.coin_)) {
    other.pool_ = nullptr;
}

GasCoinLease& GasCoinLease::operator=(GasCoinLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        coin_ = std::move(other.coin_);
        other.pool_ = nullptr;
    }
    return *this;
}

GasCoinLease::~GasCoinLease() {
    release();
}

void GasCoinLease::release() {
    if (pool_ == nullptr) {
        return;
    }
    auto* pool = pool_;
    pool_ = nullptr;
    pool->give_back(coin_);
}

GasCoinPool::GasCoinPool(std::vector<ledger::ObjectRef> coins)
    : coins_(coins.begin(), coins.end()), size_(coins.size()) {}

core::errors::Result<GasCoinLease> GasCoinPool::acquire(
    const std::chrono::milliseconds timeout,
    const std::shared_ptr<std::atomic_bool>& cancel_token) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    while (coins_.empty()) {
        if (cancel_token && cancel_token->load()) {
            return NexusError{ErrorCategory::Ledger, "Gas coin acquisition was cancelled.",
                              "cancelled"};
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            NEXUS_LOG_WARN("GasCoinPool: no gas coin became free in time");
            return NexusError{ErrorCategory::Ledger,
                              "Timed out waiting for a free gas coin.", "timeout",
                              "Add gas coins to the client or lower concurrency."};
        }
        auto wait_for = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (cancel_token && wait_for > kCancelPollInterval) {
            wait_for = kCancelPollInterval;
        }
        coin_returned_.wait_for(lock, wait_for);
    }

    auto coin = std::move(coins_.front());
    coins_.pop_front();
    NEXUS_LOG_INFO("GasCoinPool: acquired coin " + short_id(coin) + " (" +
                   std::to_string(coins_.size()) + " free)");
    return GasCoinLease(this, std::move(coin));
}

void GasCoinPool::give_back(ledger::ObjectRef coin) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        NEXUS_LOG_INFO("GasCoinPool: released coin " + short_id(coin) + " at version " +
                       std::to_string(coin.version));
        coins_.push_back(std::move(coin));
    }
    coin_returned_.notify_one();
}

std::size_t GasCoinPool::available() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return coins_.size();
}

}  // namespace nexus::client
