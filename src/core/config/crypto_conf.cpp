#include "core/config/crypto_conf.hpp"

#include <algorithm>
#include <fstream>
#include <system_error>
#include <utility>
#include "codec/hex.hpp"

namespace nexus::core::config {

using errors::NexusError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

NexusError crypto_conf_error(const std::string& message) {
    return NexusError{ErrorCategory::Ledger, message, "configuration"};
}

bool is_session_id(const std::string& text) {
    return codec::is_lower_hex(text, 64);
}

}  // namespace

errors::Result<std::optional<codec::SigningKey>> CryptoConf::identity_signing_key() const {
    if (!identity_key_.has_value()) {
        return std::optional<codec::SigningKey>{};
    }
    auto key = codec::SigningKey::from_seed(*identity_key_);
    if (errors::is_error(key)) {
        return errors::get_error(key);
    }
    return std::optional<codec::SigningKey>{errors::take_value(key)};
}

errors::Status CryptoConf::release_session(const std::string& session_id, json state) {
    if (!is_session_id(session_id)) {
        return NexusError{ErrorCategory::Input,
                          "Session id must be 64 lowercase hex characters.", "invalid_hex"};
    }
    sessions_[session_id] = std::move(state);
    return errors::ok();
}

std::optional<json> CryptoConf::take_session(const std::string& session_id) {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    auto state = std::move(it->second);
    sessions_.erase(it);
    return state;
}

errors::Result<CryptoConf> CryptoConf::from_json(const json& value) {
    if (!value.is_object()) {
        return crypto_conf_error("Crypto config must be a JSON object.");
    }
    CryptoConf conf;

    if (value.contains("identity_key") && !value.at("identity_key").is_null()) {
        if (!value.at("identity_key").is_string()) {
            return crypto_conf_error("Crypto config 'identity_key' must be a hex string.");
        }
        auto bytes = codec::hex_decode(value.at("identity_key").get<std::string>());
        if (errors::is_error(bytes)) {
            return errors::get_error(bytes);
        }
        const auto& seed_bytes = errors::get_value(bytes);
        if (seed_bytes.size() != 32) {
            return NexusError{ErrorCategory::Input, "Identity key must be 32 bytes.",
                              "invalid_length"};
        }
        codec::Ed25519Seed seed{};
        std::copy(seed_bytes.begin(), seed_bytes.end(), seed.begin());
        conf.identity_key_ = seed;
    }

    if (value.contains("sessions") && !value.at("sessions").is_null()) {
        const auto& sessions = value.at("sessions");
        if (!sessions.is_object()) {
            return crypto_conf_error("Crypto config 'sessions' must be an object.");
        }
        for (auto it = sessions.begin(); it != sessions.end(); ++it) {
            if (!is_session_id(it.key())) {
                return crypto_conf_error("Crypto config has malformed session id '" + it.key() +
                                         "'.");
            }
            conf.sessions_[it.key()] = it.value();
        }
    }
    return conf;
}

json CryptoConf::to_json() const {
    json sessions = json::object();
    for (const auto& entry : sessions_) {
        sessions[entry.first] = entry.second;
    }
    json out{{"sessions", sessions}};
    if (identity_key_.has_value()) {
        out["identity_key"] = codec::hex_encode(identity_key_->data(), identity_key_->size());
    } else {
        out["identity_key"] = nullptr;
    }
    return out;
}

errors::Result<CryptoConf> load_crypto_conf(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec) || ec) {
        return CryptoConf{};
    }
    std::ifstream in(path);
    if (!in.is_open()) {
        return crypto_conf_error("Unable to open crypto config: " + path.string());
    }
    json value = json::parse(in, nullptr, false);
    if (value.is_discarded()) {
        return crypto_conf_error("Crypto config is not valid JSON: " + path.string());
    }
    return CryptoConf::from_json(value);
}

errors::Status save_crypto_conf(const std::filesystem::path& path, const CryptoConf& conf) {
    std::error_code ec;
    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            return NexusError{ErrorCategory::Internal,
                              "Unable to create config directory: " + parent.string(),
                              "config_dir_create_failed"};
        }
    }

    auto temp = path;
    temp += ".tmp";
    // A failed save never leaves the partial temp file behind.
    const auto discard = [&temp](NexusError error) {
        std::error_code cleanup;
        std::filesystem::remove(temp, cleanup);
        return error;
    };
    {
        std::ofstream out(temp, std::ios::trunc);
        if (!out.is_open()) {
            return discard(NexusError{ErrorCategory::Internal,
                                      "Unable to open crypto config for writing: " + temp.string(),
                                      "config_write_failed"});
        }
        std::filesystem::permissions(
            temp, std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
            std::filesystem::perm_options::replace, ec);
        if (ec) {
            return discard(NexusError{ErrorCategory::Internal,
                                      "Unable to restrict crypto config permissions: " +
                                          temp.string(),
                                      "config_write_failed"});
        }
        out << conf.to_json().dump(2) << "\n";
        out.flush();
        if (!out.good()) {
            return discard(NexusError{ErrorCategory::Internal,
                                      "Unable to write crypto config: " + temp.string(),
                                      "config_write_failed"});
        }
    }

    std::filesystem::rename(temp, path, ec);
    if (ec) {
        return discard(NexusError{ErrorCategory::Internal,
                                  "Unable to replace crypto config: " + path.string(),
                                  "config_write_failed"});
    }
    return errors::ok();
}

}  // namespace nexus::core::config
