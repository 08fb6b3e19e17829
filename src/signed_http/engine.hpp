#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include "codec/bytes.hpp"
#include "codec/ed25519.hpp"
#include "core/errors/nexus_errors.hpp"
#include "signed_http/keys.hpp"
#include "signed_http/replay_store.hpp"
#include "signed_http/wire.hpp"

namespace nexus::signed_http {

// Time source in milliseconds since the UNIX epoch.
class Clock {
public:
    virtual ~Clock() = default;
    virtual std::uint64_t now_ms() const = 0;
};

class SystemClock : public Clock {
public:
    std::uint64_t now_ms() const override;
};

// Test clock; only moves when told to.
class ManualClock : public Clock {
public:
    explicit ManualClock(std::uint64_t now_ms) : now_ms_(now_ms) {}

    std::uint64_t now_ms() const override { return now_ms_.load(); }
    void set(std::uint64_t now_ms) { now_ms_.store(now_ms); }
    void advance(std::uint64_t delta_ms) { now_ms_.fetch_add(delta_ms); }

private:
    std::atomic<std::uint64_t> now_ms_;
};

struct EnginePolicy {
    std::uint64_t max_clock_skew_ms = kDefaultMaxClockSkewMs;
    std::uint64_t max_validity_ms = kDefaultMaxValidityMs;
};

// The parts of the HTTP request that the signature binds.
struct HttpRequestMeta {
    std::string method;
    std::string path;
    std::string query;
};

struct VerifiedOutboundResponse {
    std::string tool_id;
    std::uint64_t tool_kid = 0;
    std::string nonce;
    std::uint16_t status = 0;
    codec::Ed25519PublicKey tool_public_key{};
    std::string response_sig_input_sha256;
};

// One signed request and the state needed to verify its response. Headers
// are fixed at creation so transport retries resend identical bytes.
class OutboundSession {
public:
    const SignatureHeaders& request_headers() const { return headers_; }
    const RequestClaimsV1& claims() const { return claims_; }
    const std::string& nonce() const { return claims_.nonce; }
    const codec::Bytes& sig_input() const { return sig_input_; }
    const std::string& sig_input_sha256() const { return sig_input_sha256_; }

    core::errors::Result<VerifiedOutboundResponse> verify_response(
        std::uint16_t status, const ReceivedSignatureHeaders& headers,
        const codec::Bytes& body, const KeyResolver& tool_keys) const;

private:
    friend class Invoker;

    OutboundSession(RequestClaimsV1 claims, codec::Bytes sig_input, SignatureHeaders headers,
                    EnginePolicy policy, std::shared_ptr<const Clock> clock);

    RequestClaimsV1 claims_;
    codec::Bytes sig_input_;
    std::string sig_input_sha256_;
    SignatureHeaders headers_;
    EnginePolicy policy_;
    std::shared_ptr<const Clock> clock_;
};

// Leader side: signs outbound tool invocations.
class Invoker {
public:
    Invoker(std::string leader_id, std::uint64_t leader_kid, codec::SigningKey signing_key,
            EnginePolicy policy = EnginePolicy{},
            std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>());

    // Draws a fresh 16-byte nonce.
    core::errors::Result<OutboundSession> begin_invoke(const std::string& tool_id,
                                                       const HttpRequestMeta& http,
                                                       const codec::Bytes& body) const;

    core::errors::Result<OutboundSession> begin_invoke_with_nonce(
        const std::string& tool_id, const HttpRequestMeta& http, const codec::Bytes& body,
        const std::string& nonce) const;

    const std::string& leader_id() const { return leader_id_; }
    std::uint64_t leader_kid() const { return leader_kid_; }

private:
    std::string leader_id_;
    std::uint64_t leader_kid_;
    codec::SigningKey signing_key_;
    EnginePolicy policy_;
    std::shared_ptr<const Clock> clock_;
};

// Who called, exposed to tool handlers for logging and authorization.
struct AuthContext {
    std::string leader_id;
    std::uint64_t leader_kid = 0;
    std::string tool_id;
    std::uint64_t iat_ms = 0;
    std::uint64_t exp_ms = 0;
    std::string nonce;
    std::string method;
    std::string path;
    std::string query;
    codec::Ed25519PublicKey leader_public_key{};
    std::string request_sig_input_sha256;
};

// Identity the responder signs responses with.
struct ResponderIdentity {
    std::string tool_id;
    std::uint64_t tool_kid;
    codec::SigningKey signing_key;
    EnginePolicy policy;
    std::shared_ptr<const Clock> clock;
};

// A request whose signature has been verified. Can always sign a response
// bound to itself, including for replay rejections.
class AuthenticatedRequest {
public:
    AuthenticatedRequest(std::shared_ptr<const ResponderIdentity> identity,
                         RequestClaimsV1 claims, codec::Bytes sig_input,
                         codec::Ed25519PublicKey leader_public_key);

    AuthContext auth_context() const;
    const RequestClaimsV1& claims() const { return claims_; }
    const std::string& sig_input_sha256() const { return sig_input_sha256_; }

    core::errors::Result<SignedResponse> sign_response(std::uint16_t status,
                                                       const codec::Bytes& body) const;

private:
    std::shared_ptr<const ResponderIdentity> identity_;
    RequestClaimsV1 claims_;
    codec::Bytes sig_input_;
    std::string sig_input_sha256_;
    codec::Ed25519PublicKey leader_public_key_;
};

// Holds the InFlight reservation for one nonce until finish() or drop.
class InboundSession {
public:
    InboundSession(AuthenticatedRequest request, std::shared_ptr<ReplayStore> store,
                   std::string nonce_key, std::uint64_t expires_at_ms);

    AuthContext auth_context() const { return request_.auth_context(); }
    const AuthenticatedRequest& request() const { return request_; }

    // Signs, caches for retries and releases the reservation guard. One-shot:
    // later calls return Internal/session_finished.
    core::errors::Result<SignedResponse> finish(std::uint16_t status, codec::Bytes body);

private:
    AuthenticatedRequest request_;
    std::shared_ptr<ReplayStore> store_;
    std::string nonce_key_;
    std::uint64_t expires_at_ms_;
    InFlightGuard guard_;
};

enum class RejectionKind { ReplayConflict, InFlight };

struct ResponderRejection {
    RejectionKind kind;
    AuthenticatedRequest request;
};

// Proceed, Return(cached) or Reject.
using ResponderDecision = std::variant<InboundSession, SignedResponse, ResponderRejection>;

// Tool side: authenticates leader requests and signs responses.
class Responder {
public:
    Responder(std::string tool_id, std::uint64_t tool_kid, codec::SigningKey signing_key,
              std::shared_ptr<const KeyResolver> leader_keys,
              std::shared_ptr<ReplayStore> replay_store = std::make_shared<InMemoryReplayStore>(),
              EnginePolicy policy = EnginePolicy{},
              std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>());

    core::errors::Result<ResponderDecision> authenticate_invoke(
        const HttpRequestMeta& http, const codec::Bytes& body,
        const ReceivedSignatureHeaders& headers) const;

    const std::string& tool_id() const { return identity_->tool_id; }

private:
    core::errors::Result<AuthenticatedRequest> verify_inbound(const DecodedSignature& decoded,
                                                              const HttpRequestMeta& http,
                                                              const codec::Bytes& body) const;

    std::shared_ptr<const ResponderIdentity> identity_;
    std::shared_ptr<const KeyResolver> leader_keys_;
    std::shared_ptr<ReplayStore> replay_store_;
};

const char* to_string(RejectionKind kind);

}  // namespace nexus::signed_http
