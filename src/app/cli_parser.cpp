#include "cli_parser.hpp"
#include <charconv>
#include <map>
#include <system_error>
#include <vector>

namespace nexus::app::cli {

    using namespace nexus::core::errors;

    namespace {

        const char* kUsage =
            "Usage: nexus_cli <decode-event|sign-request|verify-request|check-occurrence|compose-dag> "
            "[flags] [--json]";

        const std::map<std::string, Command>& commands() {
            static const std::map<std::string, Command> table{
                {"decode-event", Command::DecodeEvent},
                {"sign-request", Command::SignRequest},
                {"verify-request", Command::VerifyRequest},
                {"check-occurrence", Command::CheckOccurrence},
                {"compose-dag", Command::ComposeDag}};
            return table;
        }

        // Flags that take a value. Everything else is a switch.
        bool takes_value(const std::string& flag) {
            return flag != "--json" && flag != "--verbose";
        }

        // Exception-free integer parsing
        Result<std::uint64_t> parse_u64(const std::string& flag, const std::string& text) {
            std::uint64_t value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (text.empty() || ec != std::errc() || ptr != end) {
                return NexusError{ErrorCategory::Input, "Invalid number for " + flag, "invalid_integer",
                                  "Provide a non-negative integer."};
            }
            return value;
        }

        Result<std::filesystem::path> existing_file(const std::string& flag, const std::string& text) {
            std::filesystem::path p(text);
            std::error_code ec;
            const bool is_file = std::filesystem::is_regular_file(p, ec);
            if (ec || !is_file) {
                return NexusError{ErrorCategory::Input, "File for " + flag + " does not exist: " + text,
                                  "invalid_path"};
            }
            return p;
        }

        NexusError missing_flag(const std::string& flag, Command command) {
            return NexusError{ErrorCategory::Input,
                              std::string("Missing ") + flag + " for " + to_string(command),
                              "missing_required_flag"};
        }

    }  // namespace

    const char* to_string(const Command command) {
        switch (command) {
            case Command::DecodeEvent: return "decode-event";
            case Command::SignRequest: return "sign-request";
            case Command::VerifyRequest: return "verify-request";
            case Command::CheckOccurrence: return "check-occurrence";
            case Command::ComposeDag: return "compose-dag";
        }
        return "unknown";
    }

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return NexusError{ErrorCategory::Input, "No command provided.", "missing_command", kUsage};
        }

        const std::string command_text = argv[1];
        auto command = commands().find(command_text);
        if (command == commands().end()) {
            return NexusError{ErrorCategory::Input, "Unknown command: " + command_text, "unknown_command",
                              kUsage};
        }

        CliRequest req;
        req.command = command->second;

        // 1. Parser Phase: collect raw flag values
        std::map<std::string, std::string> raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) {
            args.push_back(argv[i]);
        }
        for (std::size_t i = 0; i < args.size(); ++i) {
            const auto& flag = args[i];
            if (flag == "--json") {
                req.json_output = true;
                continue;
            }
            if (flag == "--verbose") {
                req.verbose = true;
                continue;
            }
            if (flag.rfind("--", 0) != 0 || !takes_value(flag)) {
                return NexusError{ErrorCategory::Input, "Unknown argument: " + flag, "unknown_argument"};
            }
            if (i + 1 >= args.size()) {
                return NexusError{ErrorCategory::Input, "Missing value for " + flag, "missing_value"};
            }
            raw[flag] = args[++i];
        }

        // 2. Validator Phase: per-command flags and bounds
        std::vector<std::string> allowed;
        switch (req.command) {
            case Command::DecodeEvent:
                allowed = {"--event-file"};
                break;
            case Command::SignRequest:
                allowed = {"--signing-key", "--leader-id", "--leader-kid", "--tool-id", "--method",
                           "--path", "--query", "--body-file", "--nonce"};
                break;
            case Command::VerifyRequest:
                allowed = {"--allowed-leaders", "--tool-id", "--headers-file", "--method", "--path",
                           "--query", "--body-file", "--signing-key"};
                break;
            case Command::CheckOccurrence:
                allowed = {"--start-ms", "--deadline-ms", "--start-offset-ms", "--deadline-offset-ms",
                           "--gas-price"};
                break;
            case Command::ComposeDag:
                allowed = {"--dag", "--config"};
                break;
        }
        for (const auto& entry : raw) {
            bool known = false;
            for (const auto& flag : allowed) {
                known = known || flag == entry.first;
            }
            if (!known) {
                return NexusError{ErrorCategory::Input,
                                  "Unknown argument for " + command_text + ": " + entry.first,
                                  "unknown_argument"};
            }
        }

        auto text = [&](const std::string& flag) -> std::optional<std::string> {
            auto it = raw.find(flag);
            if (it == raw.end()) return std::nullopt;
            return it->second;
        };
        auto number = [&](const std::string& flag, std::optional<std::uint64_t>& out) -> Status {
            auto value = text(flag);
            if (!value) return ok();
            auto parsed = parse_u64(flag, *value);
            if (is_error(parsed)) return get_error(parsed);
            out = get_value(parsed);
            return ok();
        };
        auto file = [&](const std::string& flag, std::optional<std::filesystem::path>& out) -> Status {
            auto value = text(flag);
            if (!value) return ok();
            auto parsed = existing_file(flag, *value);
            if (is_error(parsed)) return get_error(parsed);
            out = get_value(parsed);
            return ok();
        };

        std::vector<Status> checks;
        switch (req.command) {
            case Command::DecodeEvent:
                checks.push_back(file("--event-file", req.event_file));
                if (!req.event_file) checks.push_back(missing_flag("--event-file", req.command));
                break;
            case Command::SignRequest:
                req.signing_key = text("--signing-key");
                req.leader_id = text("--leader-id");
                req.tool_id = text("--tool-id");
                req.nonce = text("--nonce");
                checks.push_back(number("--leader-kid", req.leader_kid));
                checks.push_back(file("--body-file", req.body_file));
                if (!req.signing_key) checks.push_back(missing_flag("--signing-key", req.command));
                if (!req.leader_id) checks.push_back(missing_flag("--leader-id", req.command));
                if (!req.leader_kid) checks.push_back(missing_flag("--leader-kid", req.command));
                if (!req.tool_id) checks.push_back(missing_flag("--tool-id", req.command));
                break;
            case Command::VerifyRequest:
                req.signing_key = text("--signing-key");
                req.tool_id = text("--tool-id");
                checks.push_back(file("--allowed-leaders", req.allowed_leaders_file));
                checks.push_back(file("--headers-file", req.headers_file));
                checks.push_back(file("--body-file", req.body_file));
                if (!req.tool_id) checks.push_back(missing_flag("--tool-id", req.command));
                if (!req.allowed_leaders_file) checks.push_back(missing_flag("--allowed-leaders", req.command));
                if (!req.headers_file) checks.push_back(missing_flag("--headers-file", req.command));
                break;
            case Command::CheckOccurrence: {
                checks.push_back(number("--start-ms", req.start_ms));
                checks.push_back(number("--deadline-ms", req.deadline_ms));
                checks.push_back(number("--start-offset-ms", req.start_offset_ms));
                checks.push_back(number("--deadline-offset-ms", req.deadline_offset_ms));
                std::optional<std::uint64_t> gas_price;
                checks.push_back(number("--gas-price", gas_price));
                req.gas_price = gas_price.value_or(0);
                break;
            }
            case Command::ComposeDag:
                checks.push_back(file("--dag", req.dag_file));
                checks.push_back(file("--config", req.config_file));
                if (!req.dag_file) checks.push_back(missing_flag("--dag", req.command));
                if (!req.config_file) checks.push_back(missing_flag("--config", req.command));
                break;
        }
        for (const auto& check : checks) {
            if (is_error(check)) return get_error(check);
        }

        if (auto method = text("--method")) req.method = *method;
        if (auto path = text("--path")) req.path = *path;
        if (auto query = text("--query")) req.query = *query;
        if (req.method.empty() || req.path.empty() || req.path.front() != '/') {
            return NexusError{ErrorCategory::Input, "--method must be set and --path must start with '/'",
                              "invalid_http_target"};
        }

        return req;
    }

} // namespace nexus::app::cli
