#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "app/cli_parser.hpp"
#include "app/commands.hpp"
#include "core/config/correlation_id.hpp"
#include "core/errors/nexus_errors.hpp"
#include "core/logging/logger.hpp"

namespace {

using nexus::core::errors::NexusError;
using nlohmann::json;

void report_error(const NexusError& err, const std::string& context, bool json_output) {
    if (json_output) {
        std::cout << json{{"error", nexus::core::errors::error_to_json(err)}}.dump(2) << std::endl;
        return;
    }
    NEXUS_LOG_ERROR(context + " [" + err.code + "]: " + err.message);
    if (!err.hint.empty()) {
        NEXUS_LOG_INFO("Hint: " + err.hint);
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    // 1. Correlate every log line of this invocation
    auto correlation_id = nexus::core::config::generate_correlation_id();
    if (nexus::core::errors::is_error(correlation_id)) {
        report_error(nexus::core::errors::get_error(correlation_id), "Startup error", false);
        return 1;
    }
    nexus::core::logging::Logger::get().set_context_id(
        nexus::core::errors::get_value(correlation_id));

    // 2. Parse CLI input and return normalized input errors
    auto parsed = nexus::app::cli::parse_and_validate(argc, argv);
    if (nexus::core::errors::is_error(parsed)) {
        report_error(nexus::core::errors::get_error(parsed), "Input error", false);
        return 2;
    }
    const auto& req = nexus::core::errors::get_value(parsed);
    if (req.json_output) {
        nexus::core::logging::Logger::get().set_format(nexus::core::logging::LogFormat::Json);
    }
    if (req.verbose) {
        nexus::core::logging::Logger::get().set_min_level(nexus::core::logging::LogLevel::DEBUG);
    }
    NEXUS_LOG_DEBUG(std::string("Running command ") + nexus::app::cli::to_string(req.command));

    // 3. Run the command; stdout carries only its JSON result
    auto result = nexus::app::commands::dispatch(req);
    if (nexus::core::errors::is_error(result)) {
        report_error(nexus::core::errors::get_error(result),
                     std::string(nexus::app::cli::to_string(req.command)) + " failed",
                     req.json_output);
        return 1;
    }
    std::cout << nexus::core::errors::get_value(result).dump(2) << std::endl;
    return 0;
}
