#include "core/config/client_config.hpp"

#include <fstream>
#include "codec/stringified.hpp"

namespace nexus::core::config {

using errors::NexusError;
using errors::ErrorCategory;
using nlohmann::json;

namespace {

NexusError config_error(const std::string& field, const std::string& reason) {
    return NexusError{ErrorCategory::Ledger, "Client config: '" + field + "' " + reason + ".",
                      "configuration"};
}

// Accepts a JSON number or a stringified u64. Absent keys keep `out`.
errors::Status read_u64_field(const json& object, const char* field, std::uint64_t& out) {
    if (!object.contains(field) || object.at(field).is_null()) {
        return errors::ok();
    }
    const auto& value = object.at(field);
    if (codec::is_json_u64(value)) {
        out = value.get<std::uint64_t>();
        return errors::ok();
    }
    if (value.is_string()) {
        auto parsed = codec::parse_stringified_u64(value.get<std::string>());
        if (errors::is_error(parsed)) {
            return config_error(field, "is not a valid u64");
        }
        out = errors::get_value(parsed);
        return errors::ok();
    }
    return config_error(field, "must be an unsigned integer");
}

errors::Status read_retry_section(const json& value, ledger::BackoffPolicy& out) {
    if (!value.is_object()) {
        return config_error("read_retry", "must be an object");
    }
    std::uint64_t attempts = out.max_attempts;
    for (auto status : {read_u64_field(value, "max_attempts", attempts),
                        read_u64_field(value, "initial_backoff_ms", out.initial_backoff_ms),
                        read_u64_field(value, "max_backoff_ms", out.max_backoff_ms)}) {
        if (errors::is_error(status)) {
            return status;
        }
    }
    if (attempts == 0) {
        return config_error("read_retry.max_attempts", "must be at least 1");
    }
    out.max_attempts = static_cast<std::uint32_t>(attempts);
    return errors::ok();
}

errors::Status read_signed_http_section(const json& value, signed_http::EnginePolicy& out) {
    if (!value.is_object()) {
        return config_error("signed_http", "must be an object");
    }
    auto status = read_u64_field(value, "max_clock_skew_ms", out.max_clock_skew_ms);
    if (errors::is_error(status)) {
        return status;
    }
    return read_u64_field(value, "max_validity_ms", out.max_validity_ms);
}

}  // namespace

errors::Result<ClientConfig> client_config_from_json(const json& value) {
    if (!value.is_object()) {
        return config_error("<root>", "must be a JSON object");
    }

    ClientConfig config;
    if (!value.contains("rpc_url") || !value.at("rpc_url").is_string() ||
        value.at("rpc_url").get<std::string>().empty()) {
        return config_error("rpc_url", "is missing");
    }
    config.rpc_url = value.at("rpc_url").get<std::string>();

    auto status = read_u64_field(value, "gas_budget", config.gas_budget);
    if (errors::is_error(status)) {
        return errors::get_error(status);
    }
    status = read_u64_field(value, "transaction_timeout_ms", config.transaction_timeout_ms);
    if (errors::is_error(status)) {
        return errors::get_error(status);
    }

    if (value.contains("gas_coins")) {
        const auto& coins = value.at("gas_coins");
        if (!coins.is_array()) {
            return config_error("gas_coins", "must be an array of object refs");
        }
        for (const auto& coin : coins) {
            auto ref = ledger::object_ref_from_json(coin);
            if (errors::is_error(ref)) {
                return config_error("gas_coins", errors::get_error(ref).message);
            }
            config.gas_coins.push_back(errors::take_value(ref));
        }
    }

    if (!value.contains("nexus_objects")) {
        return config_error("nexus_objects", "is missing");
    }
    auto objects = types::nexus_objects_from_json(value.at("nexus_objects"));
    if (errors::is_error(objects)) {
        return errors::get_error(objects);
    }
    config.nexus_objects = errors::take_value(objects);

    if (value.contains("read_retry")) {
        status = read_retry_section(value.at("read_retry"), config.read_retry);
        if (errors::is_error(status)) {
            return errors::get_error(status);
        }
    }
    if (value.contains("signed_http")) {
        status = read_signed_http_section(value.at("signed_http"), config.signed_http);
        if (errors::is_error(status)) {
            return errors::get_error(status);
        }
    }
    if (value.contains("allowed_leaders_path") && !value.at("allowed_leaders_path").is_null()) {
        if (!value.at("allowed_leaders_path").is_string()) {
            return config_error("allowed_leaders_path", "must be a string");
        }
        config.allowed_leaders_path =
            std::filesystem::path(value.at("allowed_leaders_path").get<std::string>());
    }
    return config;
}

errors::Result<ClientConfig> load_client_config(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return NexusError{ErrorCategory::Ledger, "Unable to open config file: " + path.string(),
                          "configuration"};
    }
    json value = json::parse(in, nullptr, false);
    if (value.is_discarded()) {
        return NexusError{ErrorCategory::Ledger, "Config file is not valid JSON: " + path.string(),
                          "configuration"};
    }
    return client_config_from_json(value);
}

json to_json(const ClientConfig& config) {
    json coins = json::array();
    for (const auto& coin : config.gas_coins) {
        coins.push_back(ledger::to_json(coin));
    }
    json out{{"rpc_url", config.rpc_url},
             {"gas_budget", config.gas_budget},
             {"gas_coins", coins},
             {"nexus_objects", types::to_json(config.nexus_objects)},
             {"transaction_timeout_ms", config.transaction_timeout_ms},
             {"read_retry",
              {{"max_attempts", config.read_retry.max_attempts},
               {"initial_backoff_ms", config.read_retry.initial_backoff_ms},
               {"max_backoff_ms", config.read_retry.max_backoff_ms}}},
             {"signed_http",
              {{"max_clock_skew_ms", config.signed_http.max_clock_skew_ms},
               {"max_validity_ms", config.signed_http.max_validity_ms}}}};
    if (config.allowed_leaders_path.has_value()) {
        out["allowed_leaders_path"] = config.allowed_leaders_path->string();
    } else {
        out["allowed_leaders_path"] = nullptr;
    }
    return out;
}

}  // namespace nexus::core::config
