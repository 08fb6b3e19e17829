#include "signed_http/wire.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <nlohmann/json.hpp>
#include "codec/base64.hpp"
#include "codec/stringified.hpp"

namespace nexus::signed_http {

using core::errors::NexusError;
using core::errors::ErrorCategory;
using nlohmann::json;
using nlohmann::ordered_json;

namespace {

NexusError invalid_claims(const std::string& reason) {
    return NexusError{ErrorCategory::Protocol,
                      "Signed input is not valid claims JSON: " + reason + ".",
                      "invalid_signed_input_json"};
}

NexusError missing_header(const char* name) {
    return NexusError{ErrorCategory::Protocol,
                      std::string("Missing header ") + name + ".",
                      "missing_header"};
}

// Claim readers: every field is required and strictly typed.
bool read_string_claim(const json& doc, const char* field, std::string& out,
                       std::string& reason) {
    if (!doc.contains(field) || !doc.at(field).is_string()) {
        reason = std::string("field '") + field + "' must be a string";
        return false;
    }
    out = doc.at(field).get<std::string>();
    return true;
}

bool read_u64_claim(const json& doc, const char* field, std::uint64_t& out,
                    std::string& reason) {
    if (!doc.contains(field) || !codec::is_json_u64(doc.at(field))) {
        reason = std::string("field '") + field + "' must be an unsigned integer";
        return false;
    }
    out = doc.at(field).get<std::uint64_t>();
    return true;
}

core::errors::Result<json> parse_claims_document(const codec::Bytes& sig_input) {
    json doc = json::parse(sig_input.begin(), sig_input.end(), nullptr, false);
    if (doc.is_discarded()) {
        return invalid_claims("malformed JSON");
    }
    if (!doc.is_object()) {
        return invalid_claims("expected an object");
    }
    return doc;
}

codec::Bytes domain_message(const char* domain, const codec::Bytes& sig_input) {
    const std::size_t domain_size = std::strlen(domain);
    codec::Bytes message;
    message.reserve(domain_size + sig_input.size());
    message.insert(message.end(), domain, domain + domain_size);
    message.insert(message.end(), sig_input.begin(), sig_input.end());
    return message;
}

codec::Bytes dump_bytes(const ordered_json& doc) {
    return codec::to_bytes(doc.dump());
}

}  // namespace

bool RequestClaimsV1::operator==(const RequestClaimsV1& other) const {
    return leader_id == other.leader_id && leader_kid == other.leader_kid &&
           tool_id == other.tool_id && iat_ms == other.iat_ms &&
           exp_ms == other.exp_ms && nonce == other.nonce &&
           method == other.method && path == other.path &&
           query == other.query && body_sha256 == other.body_sha256;
}

bool ResponseClaimsV1::operator==(const ResponseClaimsV1& other) const {
    return tool_id == other.tool_id && tool_kid == other.tool_kid &&
           iat_ms == other.iat_ms && exp_ms == other.exp_ms &&
           nonce == other.nonce &&
           req_sig_input_sha256 == other.req_sig_input_sha256 &&
           status == other.status && body_sha256 == other.body_sha256;
}

SignatureHeaders encode_signature_headers(const codec::Bytes& sig_input,
                                          const codec::Ed25519Signature& signature) {
    SignatureHeaders headers;
    headers.sig_input = codec::base64url_encode_no_pad(sig_input);
    headers.sig = codec::base64url_encode_no_pad(
        codec::Bytes(signature.begin(), signature.end()));
    return headers;
}

core::errors::Result<DecodedSignature> decode_signature_headers(
    const ReceivedSignatureHeaders& headers) {
    if (!headers.version.has_value()) {
        return missing_header(kHeaderSigVersion);
    }
    if (headers.version.value() != kProtocolVersion) {
        return NexusError{ErrorCategory::Protocol,
                          "Unsupported signature version '" + headers.version.value() + "'.",
                          "unsupported_version"};
    }
    if (!headers.sig_input.has_value()) {
        return missing_header(kHeaderSigInput);
    }
    if (!headers.sig.has_value()) {
        return missing_header(kHeaderSig);
    }

    auto sig_input = codec::base64url_decode_no_pad(headers.sig_input.value());
    if (core::errors::is_error(sig_input)) {
        return NexusError{ErrorCategory::Protocol,
                          std::string("Invalid base64 in header ") + kHeaderSigInput + ".",
                          "invalid_base64"};
    }
    auto sig_bytes = codec::base64url_decode_no_pad(headers.sig.value());
    if (core::errors::is_error(sig_bytes)) {
        return NexusError{ErrorCategory::Protocol,
                          std::string("Invalid base64 in header ") + kHeaderSig + ".",
                          "invalid_base64"};
    }

    const codec::Bytes& raw_sig = core::errors::get_value(sig_bytes);
    if (raw_sig.size() != 64) {
        return NexusError{ErrorCategory::Protocol,
                          "Invalid signature length " + std::to_string(raw_sig.size()) +
                              ", expected 64.",
                          "invalid_signature_length"};
    }

    DecodedSignature decoded;
    decoded.sig_input = core::errors::take_value(sig_input);
    std::copy(raw_sig.begin(), raw_sig.end(), decoded.signature.begin());
    return decoded;
}

codec::Bytes encode_request_claims(const RequestClaimsV1& claims) {
    ordered_json doc;
    doc["leader_id"] = claims.leader_id;
    doc["leader_kid"] = claims.leader_kid;
    doc["tool_id"] = claims.tool_id;
    doc["iat_ms"] = claims.iat_ms;
    doc["exp_ms"] = claims.exp_ms;
    doc["nonce"] = claims.nonce;
    doc["method"] = claims.method;
    doc["path"] = claims.path;
    doc["query"] = claims.query;
    doc["body_sha256"] = claims.body_sha256;
    return dump_bytes(doc);
}

codec::Bytes encode_response_claims(const ResponseClaimsV1& claims) {
    ordered_json doc;
    doc["tool_id"] = claims.tool_id;
    doc["tool_kid"] = claims.tool_kid;
    doc["iat_ms"] = claims.iat_ms;
    doc["exp_ms"] = claims.exp_ms;
    doc["nonce"] = claims.nonce;
    doc["req_sig_input_sha256"] = claims.req_sig_input_sha256;
    doc["status"] = claims.status;
    doc["body_sha256"] = claims.body_sha256;
    return dump_bytes(doc);
}

core::errors::Result<RequestClaimsV1> parse_request_claims(const codec::Bytes& sig_input) {
    auto parsed = parse_claims_document(sig_input);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const json& doc = core::errors::get_value(parsed);

    RequestClaimsV1 claims;
    std::string reason;
    const bool complete =
        read_string_claim(doc, "leader_id", claims.leader_id, reason) &&
        read_u64_claim(doc, "leader_kid", claims.leader_kid, reason) &&
        read_string_claim(doc, "tool_id", claims.tool_id, reason) &&
        read_u64_claim(doc, "iat_ms", claims.iat_ms, reason) &&
        read_u64_claim(doc, "exp_ms", claims.exp_ms, reason) &&
        read_string_claim(doc, "nonce", claims.nonce, reason) &&
        read_string_claim(doc, "method", claims.method, reason) &&
        read_string_claim(doc, "path", claims.path, reason) &&
        read_string_claim(doc, "query", claims.query, reason) &&
        read_string_claim(doc, "body_sha256", claims.body_sha256, reason);
    if (!complete) {
        return invalid_claims(reason);
    }
    return claims;
}

core::errors::Result<ResponseClaimsV1> parse_response_claims(const codec::Bytes& sig_input) {
    auto parsed = parse_claims_document(sig_input);
    if (core::errors::is_error(parsed)) {
        return core::errors::get_error(parsed);
    }
    const json& doc = core::errors::get_value(parsed);

    ResponseClaimsV1 claims;
    std::string reason;
    std::uint64_t status = 0;
    const bool complete =
        read_string_claim(doc, "tool_id", claims.tool_id, reason) &&
        read_u64_claim(doc, "tool_kid", claims.tool_kid, reason) &&
        read_u64_claim(doc, "iat_ms", claims.iat_ms, reason) &&
        read_u64_claim(doc, "exp_ms", claims.exp_ms, reason) &&
        read_string_claim(doc, "nonce", claims.nonce, reason) &&
        read_string_claim(doc, "req_sig_input_sha256", claims.req_sig_input_sha256, reason) &&
        read_u64_claim(doc, "status", status, reason) &&
        read_string_claim(doc, "body_sha256", claims.body_sha256, reason);
    if (!complete) {
        return invalid_claims(reason);
    }
    if (status > std::numeric_limits<std::uint16_t>::max()) {
        return invalid_claims("field 'status' out of range");
    }
    claims.status = static_cast<std::uint16_t>(status);
    return claims;
}

core::errors::Status validate_time_window(const std::uint64_t iat_ms,
                                          const std::uint64_t exp_ms,
                                          const TimeWindowPolicy& policy) {
    if (exp_ms < iat_ms) {
        return NexusError{ErrorCategory::Time, "exp_ms is earlier than iat_ms.",
                          "invalid_time_window"};
    }

    const std::uint64_t validity_ms = exp_ms - iat_ms;
    if (validity_ms > policy.max_validity_ms) {
        return NexusError{ErrorCategory::Time,
                          "Validity " + std::to_string(validity_ms) + "ms exceeds max " +
                              std::to_string(policy.max_validity_ms) + "ms.",
                          "validity_too_large"};
    }

    const std::uint64_t now_ms = policy.now_ms;
    const std::uint64_t skew = policy.max_clock_skew_ms;
    const std::uint64_t latest_iat =
        now_ms > std::numeric_limits<std::uint64_t>::max() - skew
            ? std::numeric_limits<std::uint64_t>::max()
            : now_ms + skew;
    const std::uint64_t earliest_exp = now_ms > skew ? now_ms - skew : 0;

    if (iat_ms > latest_iat) {
        return NexusError{ErrorCategory::Time,
                          "Not yet valid: iat_ms=" + std::to_string(iat_ms) +
                              " now_ms=" + std::to_string(now_ms) + ".",
                          "not_yet_valid"};
    }
    if (exp_ms < earliest_exp) {
        return NexusError{ErrorCategory::Time,
                          "Expired: exp_ms=" + std::to_string(exp_ms) +
                              " now_ms=" + std::to_string(now_ms) + ".",
                          "expired"};
    }
    return core::errors::ok();
}

core::errors::Result<codec::Ed25519Signature> sign_claims(const char* domain,
                                                          const codec::Bytes& sig_input,
                                                          const codec::SigningKey& key) {
    return key.sign(domain_message(domain, sig_input));
}

bool verify_claims(const char* domain, const codec::Bytes& sig_input,
                   const codec::Ed25519Signature& signature,
                   const codec::VerifyingKey& key) {
    return key.verify_strict(domain_message(domain, sig_input), signature);
}

}  // namespace nexus::signed_http
