#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/errors/nexus_errors.hpp"
#include "ledger/backoff.hpp"
#include "ledger/ledger_types.hpp"
#include "signed_http/engine.hpp"
#include "types/nexus_objects.hpp"

namespace nexus::core::config {

constexpr std::uint64_t kDefaultTransactionTimeoutMs = 5000;

// Everything a client needs to talk to one Nexus deployment.
struct ClientConfig {
    std::string rpc_url;
    std::uint64_t gas_budget = 0;
    std::vector<ledger::ObjectRef> gas_coins;
    types::NexusObjects nexus_objects;
    std::uint64_t transaction_timeout_ms = kDefaultTransactionTimeoutMs;
    ledger::BackoffPolicy read_retry;
    signed_http::EnginePolicy signed_http;
    std::optional<std::filesystem::path> allowed_leaders_path;
};

// Missing optional sections keep their defaults. Failures are
// Ledger/configuration naming the offending field.
errors::Result<ClientConfig> client_config_from_json(const nlohmann::json& value);
errors::Result<ClientConfig> load_client_config(const std::filesystem::path& path);
nlohmann::json to_json(const ClientConfig& config);

}  // namespace nexus::core::config
