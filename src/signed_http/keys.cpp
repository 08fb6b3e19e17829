#include "signed_http/keys.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <utility>
#include <nlohmann/json.hpp>
#include "codec/base64.hpp"
#include "codec/hex.hpp"
#include "codec/stringified.hpp"

namespace nexus::signed_http {

using core::errors::NexusError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr std::uint8_t kEd25519SchemeFlag = 0x00;

std::string trim(const std::string& text) {
    const auto first = std::find_if_not(text.begin(), text.end(),
                                        [](unsigned char c) { return std::isspace(c); });
    const auto last = std::find_if_not(text.rbegin(), text.rend(),
                                       [](unsigned char c) { return std::isspace(c); }).base();
    if (first >= last) {
        return "";
    }
    return std::string(first, last);
}

bool looks_like_hex(const std::string& raw) {
    if (raw.rfind("0x", 0) == 0) {
        return true;
    }
    if (raw.size() != 64 && raw.size() != 66) {
        return false;
    }
    return std::all_of(raw.begin(), raw.end(),
                       [](unsigned char c) { return std::isxdigit(c) != 0; });
}

// Returns the raw 32 key bytes from any accepted encoding.
core::errors::Result<codec::Ed25519Seed> decode_key_material(const std::string& input) {
    const std::string raw = trim(input);

    core::errors::Result<codec::Bytes> decoded = codec::Bytes{};
    if (looks_like_hex(raw)) {
        decoded = codec::hex_decode(raw);
        if (core::errors::is_error(decoded)) {
            return NexusError{ErrorCategory::Keys, "Invalid hex key material.",
                              "invalid_hex"};
        }
    } else {
        decoded = codec::base64_decode_any(raw);
        if (core::errors::is_error(decoded)) {
            return NexusError{ErrorCategory::Keys,
                              "Expected hex, base64 or base64url key material.",
                              "invalid_base64"};
        }
    }

    const codec::Bytes& bytes = core::errors::get_value(decoded);
    codec::Ed25519Seed out{};
    if (bytes.size() == 32) {
        std::copy(bytes.begin(), bytes.end(), out.begin());
        return out;
    }
    if (bytes.size() == 33) {
        if (bytes[0] != kEd25519SchemeFlag) {
            std::ostringstream msg;
            msg << "Unsupported key scheme flag 0x" << std::hex << static_cast<int>(bytes[0])
                << " (expected 0x00 for ed25519).";
            return NexusError{ErrorCategory::Keys, msg.str(),
                              "unsupported_sui_key_scheme_flag"};
        }
        std::copy(bytes.begin() + 1, bytes.end(), out.begin());
        return out;
    }
    return NexusError{ErrorCategory::Keys,
                      "Invalid key length " + std::to_string(bytes.size()) +
                          ", expected 32 bytes or 33 bytes (0x00 + key).",
                      "invalid_length"};
}

NexusError invalid_file(const std::string& reason) {
    return NexusError{ErrorCategory::Keys, "Invalid allowed leaders file: " + reason + ".",
                      "invalid_allowed_leaders_file"};
}

}  // namespace

core::errors::Result<codec::SigningKey> parse_ed25519_signing_key(const std::string& raw) {
    auto material = decode_key_material(raw);
    if (core::errors::is_error(material)) {
        return core::errors::get_error(material);
    }
    return codec::SigningKey::from_seed(core::errors::get_value(material));
}

core::errors::Result<codec::VerifyingKey> parse_ed25519_public_key(const std::string& raw) {
    auto material = decode_key_material(raw);
    if (core::errors::is_error(material)) {
        return core::errors::get_error(material);
    }
    return codec::VerifyingKey(core::errors::get_value(material));
}

core::errors::Result<AllowedLeaders> AllowedLeaders::from_json_text(const std::string& text) {
    const json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return invalid_file("not a JSON object");
    }
    if (!doc.contains("version") || !codec::is_json_u64(doc.at("version")) ||
        doc.at("version").get<std::uint64_t>() != 1) {
        return invalid_file("unsupported version, expected 1");
    }
    if (!doc.contains("leaders") || !doc.at("leaders").is_array()) {
        return invalid_file("'leaders' must be an array");
    }

    AllowedLeaders allowed;
    for (const auto& leader : doc.at("leaders")) {
        if (!leader.is_object() || !leader.contains("leader_id") ||
            !leader.at("leader_id").is_string()) {
            return invalid_file("leader entry without a string leader_id");
        }
        const std::string leader_id = leader.at("leader_id").get<std::string>();
        if (!leader.contains("keys") || !leader.at("keys").is_array()) {
            return invalid_file("leader_id=" + leader_id + ": 'keys' must be an array");
        }

        std::map<std::uint64_t, codec::Ed25519PublicKey> keys;
        for (const auto& key : leader.at("keys")) {
            if (!key.is_object() || !key.contains("kid") ||
                !codec::is_json_u64(key.at("kid"))) {
                return invalid_file("leader_id=" + leader_id + ": key without an integer kid");
            }
            const std::uint64_t kid = key.at("kid").get<std::uint64_t>();
            const std::string where =
                "leader_id=" + leader_id + " kid=" + std::to_string(kid);
            if (!key.contains("public_key") || !key.at("public_key").is_string()) {
                return invalid_file(where + ": missing public_key");
            }
            const std::string hex = key.at("public_key").get<std::string>();
            if (hex.size() != 64) {
                return invalid_file(where + ": public_key must be 64 hex chars");
            }
            auto bytes = codec::hex_decode(hex);
            if (core::errors::is_error(bytes)) {
                return invalid_file(where + ": invalid public_key hex");
            }
            if (keys.count(kid) != 0) {
                return invalid_file(where + ": duplicate kid");
            }
            codec::Ed25519PublicKey pk{};
            const codec::Bytes& raw = core::errors::get_value(bytes);
            std::copy(raw.begin(), raw.end(), pk.begin());
            keys.emplace(kid, pk);
        }
        allowed.leaders_[leader_id] = std::move(keys);
    }
    return allowed;
}

core::errors::Result<AllowedLeaders> AllowedLeaders::load(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return NexusError{ErrorCategory::Keys,
                          "Cannot open allowed leaders file " + path.string() + ".",
                          "invalid_allowed_leaders_file"};
    }
    std::stringstream buffer;
    buffer << in.rdbuf();

    auto parsed = from_json_text(buffer.str());
    if (core::errors::is_error(parsed)) {
        return parsed;
    }
    AllowedLeaders allowed = core::errors::take_value(parsed);
    allowed.source_path_ = path;
    return allowed;
}

std::optional<codec::VerifyingKey> AllowedLeaders::resolve(const std::string& leader_id,
                                                           const std::uint64_t kid) const {
    const auto leader = leaders_.find(leader_id);
    if (leader == leaders_.end()) {
        return std::nullopt;
    }
    const auto key = leader->second.find(kid);
    if (key == leader->second.end()) {
        return std::nullopt;
    }
    return codec::VerifyingKey(key->second);
}

StaticKeyResolver::StaticKeyResolver(std::string id, const std::uint64_t kid,
                                     codec::VerifyingKey key)
    : id_(std::move(id)), kid_(kid), key_(std::move(key)) {}

std::optional<codec::VerifyingKey> StaticKeyResolver::resolve(const std::string& id,
                                                              const std::uint64_t kid) const {
    if (id != id_ || kid != kid_) {
        return std::nullopt;
    }
    return key_;
}

}  // namespace nexus::signed_http
