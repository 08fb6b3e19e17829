#include "signed_http/replay_store.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace nexus::signed_http {

namespace {

// Log only a prefix of the nonce key; the full key is replayable material.
std::string redact(const std::string& nonce_key) {
    constexpr std::size_t kVisible = 12;
    if (nonce_key.size() <= kVisible) {
        return nonce_key;
    }
    return nonce_key.substr(0, kVisible) + "...";
}

}  // namespace

ReplayDecision InMemoryReplayStore::begin_or_replay(const std::string& nonce_key,
                                                    const std::string& request_hash,
                                                    const std::uint64_t expires_at_ms,
                                                    const std::uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_locked(now_ms);

    const auto it = entries_.find(nonce_key);
    if (it == entries_.end()) {
        entries_.emplace(nonce_key, Entry{request_hash, expires_at_ms, std::nullopt});
        return ReplayDecision{ReplayDecision::Kind::Proceed, std::nullopt};
    }
    if (it->second.request_hash != request_hash) {
        NEXUS_LOG_WARN("ReplayStore: Conflicting request for nonce " + redact(nonce_key));
        return ReplayDecision{ReplayDecision::Kind::Reject, std::nullopt};
    }
    if (!it->second.response.has_value()) {
        NEXUS_LOG_DEBUG("ReplayStore: Request still in flight for nonce " + redact(nonce_key));
        return ReplayDecision{ReplayDecision::Kind::InFlight, std::nullopt};
    }
    NEXUS_LOG_DEBUG("ReplayStore: Returning cached response for nonce " + redact(nonce_key));
    return ReplayDecision{ReplayDecision::Kind::Return, it->second.response};
}

void InMemoryReplayStore::complete(const std::string& nonce_key,
                                   const std::string& request_hash,
                                   const std::uint64_t expires_at_ms,
                                   const SignedResponse& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[nonce_key] = Entry{request_hash, expires_at_ms, response};
}

void InMemoryReplayStore::remove(const std::string& nonce_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(nonce_key);
}

void InMemoryReplayStore::purge_expired(const std::uint64_t now_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    purge_locked(now_ms);
}

std::size_t InMemoryReplayStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void InMemoryReplayStore::purge_locked(const std::uint64_t now_ms) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.expires_at_ms < now_ms) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

InFlightGuard::InFlightGuard(std::shared_ptr<ReplayStore> store, std::string nonce_key)
    : store_(std::move(store)), nonce_key_(std::move(nonce_key)) {}

InFlightGuard::~InFlightGuard() {
    release();
}

InFlightGuard::InFlightGuard(InFlightGuard&& other) noexcept
    : store_(std::move(other.store_)),
      nonce_key_(std::move(other.nonce_key_)),
      armed_(other.armed_) {
    other.armed_ = false;
}

InFlightGuard& InFlightGuard::operator=(InFlightGuard&& other) noexcept {
    if (this != &other) {
        release();
        store_ = std::move(other.store_);
        nonce_key_ = std::move(other.nonce_key_);
        armed_ = other.armed_;
        other.armed_ = false;
    }
    return *this;
}

void InFlightGuard::release() {
    if (!armed_ || !store_) {
        return;
    }
    armed_ = false;
    store_->remove(nonce_key_);
}

}  // namespace nexus::signed_http
