#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include "codec/bytes.hpp"
#include "codec/ed25519.hpp"
#include "core/errors/nexus_errors.hpp"

namespace nexus::signed_http {

inline constexpr const char* kHeaderSigVersion = "X-Nexus-Sig-V";
inline constexpr const char* kHeaderSigInput = "X-Nexus-Sig-Input";
inline constexpr const char* kHeaderSig = "X-Nexus-Sig";
inline constexpr const char* kProtocolVersion = "1";

// Domain tags prepended to the claims bytes before signing.
inline constexpr const char* kRequestDomain = "nexus.leader_tool.request.v1.";
inline constexpr const char* kResponseDomain = "nexus.leader_tool.response.v1.";

inline constexpr std::uint64_t kDefaultMaxClockSkewMs = 30'000;
inline constexpr std::uint64_t kDefaultMaxValidityMs = 60'000;

// Header values ready for transport.
struct SignatureHeaders {
    std::string version = kProtocolVersion;
    std::string sig_input;
    std::string sig;

    bool operator==(const SignatureHeaders& other) const {
        return version == other.version && sig_input == other.sig_input &&
               sig == other.sig;
    }
};

// Header values as received; any of them may be absent.
struct ReceivedSignatureHeaders {
    std::optional<std::string> version;
    std::optional<std::string> sig_input;
    std::optional<std::string> sig;

    static ReceivedSignatureHeaders from(const SignatureHeaders& headers) {
        return ReceivedSignatureHeaders{headers.version, headers.sig_input, headers.sig};
    }
};

struct DecodedSignature {
    codec::Bytes sig_input;
    codec::Ed25519Signature signature{};
};

SignatureHeaders encode_signature_headers(const codec::Bytes& sig_input,
                                          const codec::Ed25519Signature& signature);

// Checks run in a fixed order: presence of each header, version literal,
// base64 of the input then the signature, signature length.
core::errors::Result<DecodedSignature> decode_signature_headers(
    const ReceivedSignatureHeaders& headers);

struct RequestClaimsV1 {
    std::string leader_id;
    std::uint64_t leader_kid = 0;
    std::string tool_id;
    std::uint64_t iat_ms = 0;
    std::uint64_t exp_ms = 0;
    std::string nonce;
    std::string method;
    std::string path;
    std::string query;
    std::string body_sha256;

    bool operator==(const RequestClaimsV1& other) const;
};

struct ResponseClaimsV1 {
    std::string tool_id;
    std::uint64_t tool_kid = 0;
    std::uint64_t iat_ms = 0;
    std::uint64_t exp_ms = 0;
    std::string nonce;
    std::string req_sig_input_sha256;
    std::uint16_t status = 0;
    std::string body_sha256;

    bool operator==(const ResponseClaimsV1& other) const;
};

// Canonical claims bytes: compact JSON, keys in declaration order.
codec::Bytes encode_request_claims(const RequestClaimsV1& claims);
codec::Bytes encode_response_claims(const ResponseClaimsV1& claims);

core::errors::Result<RequestClaimsV1> parse_request_claims(const codec::Bytes& sig_input);
core::errors::Result<ResponseClaimsV1> parse_response_claims(const codec::Bytes& sig_input);

struct TimeWindowPolicy {
    std::uint64_t now_ms = 0;
    std::uint64_t max_clock_skew_ms = kDefaultMaxClockSkewMs;
    std::uint64_t max_validity_ms = kDefaultMaxValidityMs;
};

core::errors::Status validate_time_window(std::uint64_t iat_ms, std::uint64_t exp_ms,
                                          const TimeWindowPolicy& policy);

// Signs domain || sig_input.
core::errors::Result<codec::Ed25519Signature> sign_claims(const char* domain,
                                                          const codec::Bytes& sig_input,
                                                          const codec::SigningKey& key);

bool verify_claims(const char* domain, const codec::Bytes& sig_input,
                   const codec::Ed25519Signature& signature,
                   const codec::VerifyingKey& key);

// A signed response as handed to the HTTP transport.
struct SignedResponse {
    std::uint16_t status = 0;
    codec::Bytes body;
    SignatureHeaders headers;
};

}  // namespace nexus::signed_http
