#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include "codec/ed25519.hpp"
#include "core/errors/nexus_errors.hpp"

namespace nexus::signed_http {

// Resolves the public key of a counterparty by (id, kid). Used by the
// responder to look up leaders and by the invoker to look up tools.
class KeyResolver {
public:
    virtual ~KeyResolver() = default;
    virtual std::optional<codec::VerifyingKey> resolve(const std::string& id,
                                                       std::uint64_t kid) const = 0;
};

// Accepted encodings: hex (64 chars or 0x-prefixed), base64 or base64url,
// padded or not. 33-byte inputs must start with the 0x00 Ed25519 scheme flag.
core::errors::Result<codec::SigningKey> parse_ed25519_signing_key(const std::string& raw);
core::errors::Result<codec::VerifyingKey> parse_ed25519_public_key(const std::string& raw);

// Tool-side allowlist of leader keys.
//
// File format:
//   {"version": 1, "leaders": [{"leader_id": "...",
//                               "keys": [{"kid": 0, "public_key": "<64 hex>"}]}]}
class AllowedLeaders : public KeyResolver {
public:
    static core::errors::Result<AllowedLeaders> from_json_text(const std::string& text);
    static core::errors::Result<AllowedLeaders> load(const std::filesystem::path& path);

    std::optional<codec::VerifyingKey> resolve(const std::string& leader_id,
                                               std::uint64_t kid) const override;

    std::size_t leader_count() const { return leaders_.size(); }
    const std::optional<std::filesystem::path>& source_path() const { return source_path_; }

private:
    std::map<std::string, std::map<std::uint64_t, codec::Ed25519PublicKey>> leaders_;
    std::optional<std::filesystem::path> source_path_;
};

// Resolves exactly one (id, kid) pair. Leaders use it for the tool they call.
class StaticKeyResolver : public KeyResolver {
public:
    StaticKeyResolver(std::string id, std::uint64_t kid, codec::VerifyingKey key);

    std::optional<codec::VerifyingKey> resolve(const std::string& id,
                                               std::uint64_t kid) const override;

private:
    std::string id_;
    std::uint64_t kid_;
    codec::VerifyingKey key_;
};

}  // namespace nexus::signed_http
