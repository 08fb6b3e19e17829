#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include "signed_http/wire.hpp"

namespace nexus::signed_http {

// What the responder should do with an authenticated request.
struct ReplayDecision {
    enum class Kind {
        Proceed,   // first sighting; an InFlight reservation was taken
        InFlight,  // same request still being processed
        Return,    // same request already answered; cached response attached
        Reject     // same nonce, different request
    };

    Kind kind = Kind::Proceed;
    std::optional<SignedResponse> cached;
};

// Responder-side nonce bookkeeping. Implementations must linearize calls for
// the same nonce key so that exactly one caller observes Proceed.
class ReplayStore {
public:
    virtual ~ReplayStore() = default;

    // Purges expired entries, then decides. request_hash is the hex SHA-256
    // of the signed request bytes.
    virtual ReplayDecision begin_or_replay(const std::string& nonce_key,
                                           const std::string& request_hash,
                                           std::uint64_t expires_at_ms,
                                           std::uint64_t now_ms) = 0;

    // Stores the signed response for bit-exact retries.
    virtual void complete(const std::string& nonce_key, const std::string& request_hash,
                          std::uint64_t expires_at_ms, const SignedResponse& response) = 0;

    // Drops an InFlight reservation.
    virtual void remove(const std::string& nonce_key) = 0;

    // Drops entries with expires_at_ms < now_ms.
    virtual void purge_expired(std::uint64_t now_ms) = 0;
};

class InMemoryReplayStore : public ReplayStore {
public:
    ReplayDecision begin_or_replay(const std::string& nonce_key,
                                   const std::string& request_hash,
                                   std::uint64_t expires_at_ms,
                                   std::uint64_t now_ms) override;
    void complete(const std::string& nonce_key, const std::string& request_hash,
                  std::uint64_t expires_at_ms, const SignedResponse& response) override;
    void remove(const std::string& nonce_key) override;
    void purge_expired(std::uint64_t now_ms) override;

    std::size_t size() const;

private:
    struct Entry {
        std::string request_hash;
        std::uint64_t expires_at_ms = 0;
        std::optional<SignedResponse> response;  // empty while InFlight
    };

    void purge_locked(std::uint64_t now_ms);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

// Releases an InFlight reservation unless disarmed. Move-only.
class InFlightGuard {
public:
    InFlightGuard(std::shared_ptr<ReplayStore> store, std::string nonce_key);
    ~InFlightGuard();

    InFlightGuard(InFlightGuard&& other) noexcept;
    InFlightGuard& operator=(InFlightGuard&& other) noexcept;
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

    void disarm() { armed_ = false; }
    bool armed() const { return armed_; }

private:
    void release();

    std::shared_ptr<ReplayStore> store_;
    std::string nonce_key_;
    bool armed_ = true;
};

}  // namespace nexus::signed_http
