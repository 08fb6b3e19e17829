#pragma once
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "core/errors/nexus_errors.hpp"

namespace nexus::app::commands {

    // Runs the parsed command. The returned document is what the CLI prints
    // on stdout.
    nexus::core::errors::Result<nlohmann::json> dispatch(const cli::CliRequest& req);
}
