#pragma once
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/nexus_errors.hpp"

namespace nexus::app::cli {

    enum class Command {
        DecodeEvent,
        SignRequest,
        VerifyRequest,
        CheckOccurrence,
        ComposeDag
    };

    const char* to_string(Command command);

    // Validated command line. Only the fields of the selected command are set.
    struct CliRequest {
        Command command = Command::DecodeEvent;
        bool json_output = false;
        bool verbose = false;

        // decode-event
        std::optional<std::filesystem::path> event_file;

        // sign-request / verify-request
        std::optional<std::string> signing_key;
        std::optional<std::string> leader_id;
        std::optional<std::uint64_t> leader_kid;
        std::optional<std::string> tool_id;
        std::string method = "POST";
        std::string path = "/invoke";
        std::string query;
        std::optional<std::filesystem::path> body_file;
        std::optional<std::string> nonce;
        std::optional<std::filesystem::path> headers_file;
        std::optional<std::filesystem::path> allowed_leaders_file;

        // check-occurrence
        std::optional<std::uint64_t> start_ms;
        std::optional<std::uint64_t> deadline_ms;
        std::optional<std::uint64_t> start_offset_ms;
        std::optional<std::uint64_t> deadline_offset_ms;
        std::uint64_t gas_price = 0;

        // compose-dag
        std::optional<std::filesystem::path> dag_file;
        std::optional<std::filesystem::path> config_file;
    };

    nexus::core::errors::Result<CliRequest> parse_and_validate(int argc, char* argv[]);
}
