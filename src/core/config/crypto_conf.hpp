#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "codec/ed25519.hpp"
#include "core/errors/nexus_errors.hpp"

namespace nexus::core::config {

// Local key material: an optional client identity key and the state of
// active sessions keyed by 32-byte session id (64 lowercase hex).
class CryptoConf {
public:
    const std::optional<codec::Ed25519Seed>& identity_key() const { return identity_key_; }
    void set_identity_key(const codec::Ed25519Seed& seed) { identity_key_ = seed; }

    errors::Result<std::optional<codec::SigningKey>> identity_signing_key() const;

    const std::map<std::string, nlohmann::json>& sessions() const { return sessions_; }

    // Stores (or replaces) the state of a session that is no longer held.
    errors::Status release_session(const std::string& session_id, nlohmann::json state);

    // Removes and returns the state so exactly one holder has it.
    std::optional<nlohmann::json> take_session(const std::string& session_id);

    static errors::Result<CryptoConf> from_json(const nlohmann::json& value);
    nlohmann::json to_json() const;

private:
    std::optional<codec::Ed25519Seed> identity_key_;
    std::map<std::string, nlohmann::json> sessions_;
};

// A missing file is an empty configuration.
errors::Result<CryptoConf> load_crypto_conf(const std::filesystem::path& path);

// Writes a sibling temp file with owner-only permissions, then renames it
// over `path`.
errors::Status save_crypto_conf(const std::filesystem::path& path, const CryptoConf& conf);

}  // namespace nexus::core::config
