#include "signed_http/engine.hpp"

#include <algorithm>
#include <chrono>
#include <limits>
#include <utility>
#include "codec/base64.hpp"
#include "codec/hex.hpp"
#include "codec/sha256.hpp"
#include "core/logging/logger.hpp"

namespace nexus::signed_http {

using core::errors::NexusError;
using core::errors::ErrorCategory;

namespace {

constexpr std::size_t kNonceBytes = 16;

std::uint64_t saturating_add(const std::uint64_t a, const std::uint64_t b) {
    if (a > std::numeric_limits<std::uint64_t>::max() - b) {
        return std::numeric_limits<std::uint64_t>::max();
    }
    return a + b;
}

TimeWindowPolicy window_for(const EnginePolicy& policy, const Clock& clock) {
    return TimeWindowPolicy{clock.now_ms(), policy.max_clock_skew_ms, policy.max_validity_ms};
}

// Case-insensitive comparison of a claimed 32-byte hex digest against raw bytes.
core::errors::Status check_body_hash(const std::string& claimed, const codec::Bytes& body) {
    auto decoded = codec::hex_decode(claimed);
    if (core::errors::is_error(decoded) || core::errors::get_value(decoded).size() != 32 ||
        claimed.rfind("0x", 0) == 0) {
        return NexusError{ErrorCategory::Binding,
                          "body_sha256 is not 64 hex chars: '" + claimed + "'.",
                          "invalid_body_sha256_hex"};
    }
    const codec::Sha256Digest actual = codec::sha256(body);
    const codec::Bytes& expected = core::errors::get_value(decoded);
    if (!std::equal(actual.begin(), actual.end(), expected.begin())) {
        return NexusError{ErrorCategory::Binding, "Body hash does not match body_sha256.",
                          "body_hash_mismatch"};
    }
    return core::errors::ok();
}

NexusError binding_mismatch(const std::string& field, const std::string& claimed,
                            const std::string& actual) {
    return NexusError{ErrorCategory::Binding,
                      "Claimed " + field + " '" + claimed + "' does not match actual '" +
                          actual + "'.",
                      field + "_mismatch"};
}

std::string lowercase(std::string text) {
    for (auto& c : text) {
        if (c >= 'A' && c <= 'F') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return text;
}

}  // namespace

std::uint64_t SystemClock::now_ms() const {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count();
    return ms < 0 ? 0 : static_cast<std::uint64_t>(ms);
}

// ---- Invoker ----

OutboundSession::OutboundSession(RequestClaimsV1 claims, codec::Bytes sig_input,
                                 SignatureHeaders headers, EnginePolicy policy,
                                 std::shared_ptr<const Clock> clock)
    : claims_(std::move(claims)),
      sig_input_(std::move(sig_input)),
      sig_input_sha256_(codec::sha256_hex(sig_input_)),
      headers_(std::move(headers)),
      policy_(policy),
      clock_(std::move(clock)) {}

core::errors::Result<VerifiedOutboundResponse> OutboundSession::verify_response(
    const std::uint16_t status, const ReceivedSignatureHeaders& headers,
    const codec::Bytes& body, const KeyResolver& tool_keys) const {
    auto decoded_result = decode_signature_headers(headers);
    if (core::errors::is_error(decoded_result)) {
        return core::errors::get_error(decoded_result);
    }
    const DecodedSignature& decoded = core::errors::get_value(decoded_result);

    auto claims_result = parse_response_claims(decoded.sig_input);
    if (core::errors::is_error(claims_result)) {
        return core::errors::get_error(claims_result);
    }
    const ResponseClaimsV1& claims = core::errors::get_value(claims_result);

    if (claims.status != status) {
        NexusError error{ErrorCategory::Binding,
                         "Claimed status " + std::to_string(claims.status) +
                             " does not match received status " + std::to_string(status) + ".",
                         "status_mismatch"};
        error.status_code = status;
        return error;
    }

    const auto tool_key = tool_keys.resolve(claims.tool_id, claims.tool_kid);
    if (!tool_key.has_value()) {
        return NexusError{ErrorCategory::Keys,
                          "Unknown tool key tool_id=" + claims.tool_id +
                              " tool_kid=" + std::to_string(claims.tool_kid) + ".",
                          "unknown_responder_key"};
    }

    if (claims.tool_id != claims_.tool_id) {
        return binding_mismatch("tool_id", claims.tool_id, claims_.tool_id);
    }

    auto body_check = check_body_hash(claims.body_sha256, body);
    if (core::errors::is_error(body_check)) {
        return core::errors::get_error(body_check);
    }

    auto window = validate_time_window(claims.iat_ms, claims.exp_ms, window_for(policy_, *clock_));
    if (core::errors::is_error(window)) {
        return core::errors::get_error(window);
    }

    if (lowercase(claims.req_sig_input_sha256) != sig_input_sha256_) {
        return NexusError{ErrorCategory::Binding,
                          "Response is not bound to this request.",
                          "request_binding_mismatch"};
    }

    if (tool_key->is_weak()) {
        return NexusError{ErrorCategory::Keys,
                          "Tool public key is not a valid Ed25519 key.",
                          "invalid_responder_public_key"};
    }
    if (!verify_claims(kResponseDomain, decoded.sig_input, decoded.signature, *tool_key)) {
        return NexusError{ErrorCategory::Keys, "Response signature verification failed.",
                          "invalid_signature"};
    }

    VerifiedOutboundResponse verified;
    verified.tool_id = claims.tool_id;
    verified.tool_kid = claims.tool_kid;
    verified.nonce = claims.nonce;
    verified.status = claims.status;
    verified.tool_public_key = tool_key->bytes();
    verified.response_sig_input_sha256 = codec::sha256_hex(decoded.sig_input);
    return verified;
}

Invoker::Invoker(std::string leader_id, const std::uint64_t leader_kid,
                 codec::SigningKey signing_key, const EnginePolicy policy,
                 std::shared_ptr<const Clock> clock)
    : leader_id_(std::move(leader_id)),
      leader_kid_(leader_kid),
      signing_key_(std::move(signing_key)),
      policy_(policy),
      clock_(std::move(clock)) {}

core::errors::Result<OutboundSession> Invoker::begin_invoke(const std::string& tool_id,
                                                            const HttpRequestMeta& http,
                                                            const codec::Bytes& body) const {
    auto nonce_bytes = codec::random_bytes(kNonceBytes);
    if (core::errors::is_error(nonce_bytes)) {
        return core::errors::get_error(nonce_bytes);
    }
    return begin_invoke_with_nonce(tool_id, http, body,
                                   codec::base64url_encode_no_pad(
                                       core::errors::get_value(nonce_bytes)));
}

core::errors::Result<OutboundSession> Invoker::begin_invoke_with_nonce(
    const std::string& tool_id, const HttpRequestMeta& http, const codec::Bytes& body,
    const std::string& nonce) const {
    RequestClaimsV1 claims;
    claims.leader_id = leader_id_;
    claims.leader_kid = leader_kid_;
    claims.tool_id = tool_id;
    claims.iat_ms = clock_->now_ms();
    claims.exp_ms = saturating_add(claims.iat_ms, policy_.max_validity_ms);
    claims.nonce = nonce;
    claims.method = http.method;
    claims.path = http.path;
    claims.query = http.query;
    claims.body_sha256 = codec::sha256_hex(body);

    codec::Bytes sig_input = encode_request_claims(claims);
    auto signature = sign_claims(kRequestDomain, sig_input, signing_key_);
    if (core::errors::is_error(signature)) {
        return core::errors::get_error(signature);
    }
    SignatureHeaders headers =
        encode_signature_headers(sig_input, core::errors::get_value(signature));

    NEXUS_LOG_DEBUG("Invoker: Signed " + http.method + " " + http.path + " for tool " + tool_id);
    return OutboundSession(std::move(claims), std::move(sig_input), std::move(headers),
                           policy_, clock_);
}

// ---- Responder ----

AuthenticatedRequest::AuthenticatedRequest(std::shared_ptr<const ResponderIdentity> identity,
                                           RequestClaimsV1 claims, codec::Bytes sig_input,
                                           const codec::Ed25519PublicKey leader_public_key)
    : identity_(std::move(identity)),
      claims_(std::move(claims)),
      sig_input_(std::move(sig_input)),
      sig_input_sha256_(codec::sha256_hex(sig_input_)),
      leader_public_key_(leader_public_key) {}

AuthContext AuthenticatedRequest::auth_context() const {
    AuthContext context;
    context.leader_id = claims_.leader_id;
    context.leader_kid = claims_.leader_kid;
    context.tool_id = claims_.tool_id;
    context.iat_ms = claims_.iat_ms;
    context.exp_ms = claims_.exp_ms;
    context.nonce = claims_.nonce;
    context.method = claims_.method;
    context.path = claims_.path;
    context.query = claims_.query;
    context.leader_public_key = leader_public_key_;
    context.request_sig_input_sha256 = sig_input_sha256_;
    return context;
}

core::errors::Result<SignedResponse> AuthenticatedRequest::sign_response(
    const std::uint16_t status, const codec::Bytes& body) const {
    ResponseClaimsV1 claims;
    claims.tool_id = identity_->tool_id;
    claims.tool_kid = identity_->tool_kid;
    claims.iat_ms = identity_->clock->now_ms();
    claims.exp_ms = saturating_add(claims.iat_ms, identity_->policy.max_validity_ms);
    claims.nonce = claims_.nonce;
    claims.req_sig_input_sha256 = sig_input_sha256_;
    claims.status = status;
    claims.body_sha256 = codec::sha256_hex(body);

    const codec::Bytes sig_input = encode_response_claims(claims);
    auto signature = sign_claims(kResponseDomain, sig_input, identity_->signing_key);
    if (core::errors::is_error(signature)) {
        return core::errors::get_error(signature);
    }

    SignedResponse response;
    response.status = status;
    response.body = body;
    response.headers = encode_signature_headers(sig_input, core::errors::get_value(signature));
    return response;
}

InboundSession::InboundSession(AuthenticatedRequest request, std::shared_ptr<ReplayStore> store,
                               std::string nonce_key, const std::uint64_t expires_at_ms)
    : request_(std::move(request)),
      store_(store),
      nonce_key_(nonce_key),
      expires_at_ms_(expires_at_ms),
      guard_(std::move(store), std::move(nonce_key)) {}

core::errors::Result<SignedResponse> InboundSession::finish(const std::uint16_t status,
                                                            codec::Bytes body) {
    if (!guard_.armed()) {
        return NexusError{ErrorCategory::Internal,
                          "Inbound session already finished for nonce key " + nonce_key_ + ".",
                          "session_finished"};
    }
    auto response = request_.sign_response(status, body);
    if (core::errors::is_error(response)) {
        // Guard stays armed: the reservation is released when the session drops.
        return response;
    }
    store_->complete(nonce_key_, request_.sig_input_sha256(), expires_at_ms_,
                     core::errors::get_value(response));
    guard_.disarm();
    return response;
}

Responder::Responder(std::string tool_id, const std::uint64_t tool_kid,
                     codec::SigningKey signing_key,
                     std::shared_ptr<const KeyResolver> leader_keys,
                     std::shared_ptr<ReplayStore> replay_store, const EnginePolicy policy,
                     std::shared_ptr<const Clock> clock)
    : identity_(std::make_shared<const ResponderIdentity>(ResponderIdentity{
          std::move(tool_id), tool_kid, std::move(signing_key), policy, std::move(clock)})),
      leader_keys_(std::move(leader_keys)),
      replay_store_(std::move(replay_store)) {}

core::errors::Result<ResponderDecision> Responder::authenticate_invoke(
    const HttpRequestMeta& http, const codec::Bytes& body,
    const ReceivedSignatureHeaders& headers) const {
    auto decoded = decode_signature_headers(headers);
    if (core::errors::is_error(decoded)) {
        return core::errors::get_error(decoded);
    }

    auto verified = verify_inbound(core::errors::get_value(decoded), http, body);
    if (core::errors::is_error(verified)) {
        NEXUS_LOG_WARN("Responder: Rejected request: " + core::errors::get_error(verified).code);
        return core::errors::get_error(verified);
    }
    AuthenticatedRequest request = core::errors::take_value(verified);

    const std::string nonce_key = request.claims().leader_id + ":" + request.claims().nonce;
    const std::uint64_t expires_at_ms = request.claims().exp_ms;

    ReplayDecision decision = replay_store_->begin_or_replay(
        nonce_key, request.sig_input_sha256(), expires_at_ms, identity_->clock->now_ms());

    switch (decision.kind) {
        case ReplayDecision::Kind::Proceed:
            return ResponderDecision(std::in_place_type<InboundSession>, std::move(request),
                                     replay_store_, nonce_key, expires_at_ms);
        case ReplayDecision::Kind::Return:
            if (!decision.cached.has_value()) {
                return NexusError{ErrorCategory::Internal,
                                  "Replay store returned no cached response.",
                                  "replay_store_inconsistent"};
            }
            return ResponderDecision(std::in_place_type<SignedResponse>,
                                     std::move(decision.cached.value()));
        case ReplayDecision::Kind::InFlight:
            return ResponderDecision(std::in_place_type<ResponderRejection>,
                                     ResponderRejection{RejectionKind::InFlight,
                                                        std::move(request)});
        case ReplayDecision::Kind::Reject:
            break;
    }
    return ResponderDecision(std::in_place_type<ResponderRejection>,
                             ResponderRejection{RejectionKind::ReplayConflict,
                                                std::move(request)});
}

core::errors::Result<AuthenticatedRequest> Responder::verify_inbound(
    const DecodedSignature& decoded, const HttpRequestMeta& http,
    const codec::Bytes& body) const {
    auto claims_result = parse_request_claims(decoded.sig_input);
    if (core::errors::is_error(claims_result)) {
        return core::errors::get_error(claims_result);
    }
    RequestClaimsV1 claims = core::errors::take_value(claims_result);

    if (claims.tool_id != identity_->tool_id) {
        return binding_mismatch("tool_id", claims.tool_id, identity_->tool_id);
    }
    if (claims.method != http.method) {
        return binding_mismatch("method", claims.method, http.method);
    }
    if (claims.path != http.path) {
        return binding_mismatch("path", claims.path, http.path);
    }
    if (claims.query != http.query) {
        return binding_mismatch("query", claims.query, http.query);
    }

    auto body_check = check_body_hash(claims.body_sha256, body);
    if (core::errors::is_error(body_check)) {
        return core::errors::get_error(body_check);
    }

    auto window = validate_time_window(claims.iat_ms, claims.exp_ms,
                                       window_for(identity_->policy, *identity_->clock));
    if (core::errors::is_error(window)) {
        return core::errors::get_error(window);
    }

    const auto leader_key = leader_keys_->resolve(claims.leader_id, claims.leader_kid);
    if (!leader_key.has_value()) {
        return NexusError{ErrorCategory::Keys,
                          "Unknown leader key leader_id=" + claims.leader_id +
                              " leader_kid=" + std::to_string(claims.leader_kid) + ".",
                          "unknown_invoker_key"};
    }
    if (leader_key->is_weak()) {
        return NexusError{ErrorCategory::Keys,
                          "Leader public key is not a valid Ed25519 key.",
                          "invalid_invoker_public_key"};
    }
    if (!verify_claims(kRequestDomain, decoded.sig_input, decoded.signature, *leader_key)) {
        return NexusError{ErrorCategory::Keys, "Request signature verification failed.",
                          "invalid_signature"};
    }

    return AuthenticatedRequest(identity_, std::move(claims), decoded.sig_input,
                                leader_key->bytes());
}

const char* to_string(const RejectionKind kind) {
    switch (kind) {
        case RejectionKind::ReplayConflict: return "replay_conflict";
        case RejectionKind::InFlight:       return "in_flight";
    }
    return "unknown";
}

}  // namespace nexus::signed_http
