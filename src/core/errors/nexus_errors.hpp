#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <nlohmann/json.hpp>

namespace nexus::core::errors {

    // 1. Typed error categories, one per failure domain
    enum class ErrorCategory {
        Protocol,  // Signed-HTTP header or claims encoding
        Binding,   // Claims do not match the actual request/response
        Time,      // iat/exp window violations
        Keys,      // Key lookup, parsing and signature checks
        Ledger,    // RPC, parsing, transaction building, timeouts, config
        Crawler,   // Object and dynamic-field traversal
        Event,     // Event decoding
        Replay,    // Replay store decisions surfaced as errors
        Input,     // Caller supplied invalid arguments
        Internal   // Crypto backend or logic failure
    };

    // The standardized error payload
    struct NexusError {
        ErrorCategory category;
        std::string message;
        std::string code = "unknown_error";
        std::string hint = "";
        std::optional<std::uint32_t> status_code = std::nullopt;
    };

    // 2. Propagation strategy (Result object)
    // A Result holds either a successful value of type T, OR a NexusError.
    template <typename T>
    using Result = std::variant<T, NexusError>;

    // Result for operations that produce no value.
    using Status = Result<std::monostate>;

    inline Status ok() { return std::monostate{}; }

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<NexusError>(result);
    }

    template <typename T>
    const NexusError& get_error(const Result<T>& result) {
        return std::get<NexusError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>& result) {
        return std::move(std::get<T>(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Protocol: return "protocol";
            case ErrorCategory::Binding:  return "binding";
            case ErrorCategory::Time:     return "time";
            case ErrorCategory::Keys:     return "keys";
            case ErrorCategory::Ledger:   return "ledger";
            case ErrorCategory::Crawler:  return "crawler";
            case ErrorCategory::Event:    return "event";
            case ErrorCategory::Replay:   return "replay";
            case ErrorCategory::Input:    return "input";
            case ErrorCategory::Internal: return "internal";
        }
        return "unknown";
    }

    // CLI-facing rendering: kind, reason and optional status code.
    inline nlohmann::json error_to_json(const NexusError& error) {
        nlohmann::json out;
        out["kind"] = error.code;
        out["category"] = to_string(error.category);
        out["reason"] = error.message;
        if (error.status_code.has_value()) {
            out["status_code"] = error.status_code.value();
        } else {
            out["status_code"] = nullptr;
        }
        if (!error.hint.empty()) {
            out["hint"] = error.hint;
        }
        return out;
    }

} // namespace nexus::core::errors
