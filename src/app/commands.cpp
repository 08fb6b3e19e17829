#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <nlohmann/json.hpp>
#include "app/commands.hpp"
#include "codec/bytes.hpp"
#include "codec/hex.hpp"
#include "core/config/client_config.hpp"
#include "core/errors/nexus_errors.hpp"
#include "core/logging/logger.hpp"
#include "events/decoder.hpp"
#include "signed_http/engine.hpp"
#include "signed_http/keys.hpp"
#include "signed_http/wire.hpp"
#include "transactions/dag.hpp"
#include "transactions/scheduler.hpp"
#include "transactions/transaction_builder.hpp"

namespace {

using nexus::app::cli::CliRequest;
using nexus::app::cli::Command;
using nexus::core::errors::ErrorCategory;
using nexus::core::errors::NexusError;
using nexus::core::errors::Result;
using nlohmann::json;

Result<std::string> read_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return NexusError{ErrorCategory::Input, "Unable to open file: " + path.string(),
                          "invalid_path"};
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

Result<json> read_json(const std::filesystem::path& path) {
    auto text = read_text(path);
    if (nexus::core::errors::is_error(text)) {
        return nexus::core::errors::get_error(text);
    }
    json value = json::parse(nexus::core::errors::get_value(text), nullptr, false);
    if (value.is_discarded()) {
        return NexusError{ErrorCategory::Input, "File is not valid JSON: " + path.string(),
                          "invalid_json"};
    }
    return value;
}

Result<nexus::codec::Bytes> read_body(const CliRequest& req) {
    if (!req.body_file.has_value()) {
        return nexus::codec::Bytes{};
    }
    auto text = read_text(*req.body_file);
    if (nexus::core::errors::is_error(text)) {
        return nexus::core::errors::get_error(text);
    }
    return nexus::codec::to_bytes(nexus::core::errors::get_value(text));
}

nexus::signed_http::HttpRequestMeta http_meta(const CliRequest& req) {
    return nexus::signed_http::HttpRequestMeta{req.method, req.path, req.query};
}

// {"type": "...", "contents": {...}, "id": {"tx_digest": "...", "sequence": 0}}
Result<json> run_decode_event(const CliRequest& req) {
    auto file = read_json(*req.event_file);
    if (nexus::core::errors::is_error(file)) {
        return nexus::core::errors::get_error(file);
    }
    const auto& value = nexus::core::errors::get_value(file);
    if (!value.is_object() || !value.contains("type") || !value.at("type").is_string() ||
        !value.contains("contents")) {
        return NexusError{ErrorCategory::Input, "Event file needs 'type' and 'contents'.",
                          "invalid_event_file"};
    }

    nexus::ledger::LedgerEvent event;
    event.type = value.at("type").get<std::string>();
    event.contents = value.at("contents");
    if (value.contains("id") && value.at("id").is_object()) {
        const auto& id = value.at("id");
        event.id.tx_digest = id.value("tx_digest", std::string{});
        event.id.sequence = id.value("sequence", std::uint64_t{0});
    }

    auto decoded = nexus::events::decode_event(event);
    if (nexus::core::errors::is_error(decoded)) {
        return nexus::core::errors::get_error(decoded);
    }
    const auto& nexus_event = nexus::core::errors::get_value(decoded);
    json generics = json::array();
    for (const auto& tag : nexus_event.generics) {
        generics.push_back(nexus::types::to_string(tag));
    }
    NEXUS_LOG_INFO("DecodeEvent: decoded " + nexus_event.data.name());
    return json{{"name", nexus_event.data.name()},
                {"module", nexus_event.data.module()},
                {"generics", generics},
                {"data", nexus::events::kind_to_json(nexus_event.data)}};
}

Result<json> run_sign_request(const CliRequest& req) {
    auto key = nexus::signed_http::parse_ed25519_signing_key(*req.signing_key);
    if (nexus::core::errors::is_error(key)) {
        return nexus::core::errors::get_error(key);
    }
    auto body = read_body(req);
    if (nexus::core::errors::is_error(body)) {
        return nexus::core::errors::get_error(body);
    }

    nexus::signed_http::Invoker invoker(*req.leader_id, *req.leader_kid,
                                        nexus::core::errors::take_value(key));
    auto session = req.nonce.has_value()
                       ? invoker.begin_invoke_with_nonce(*req.tool_id, http_meta(req),
                                                         nexus::core::errors::get_value(body),
                                                         *req.nonce)
                       : invoker.begin_invoke(*req.tool_id, http_meta(req),
                                              nexus::core::errors::get_value(body));
    if (nexus::core::errors::is_error(session)) {
        return nexus::core::errors::get_error(session);
    }
    const auto& outbound = nexus::core::errors::get_value(session);
    const auto& headers = outbound.request_headers();
    NEXUS_LOG_INFO("SignRequest: signed " + req.method + " " + req.path + " for " + *req.tool_id);
    return json{{"headers",
                 {{nexus::signed_http::kHeaderSigVersion, headers.version},
                  {nexus::signed_http::kHeaderSigInput, headers.sig_input},
                  {nexus::signed_http::kHeaderSig, headers.sig}}},
                {"nonce", outbound.nonce()},
                {"sig_input_sha256", outbound.sig_input_sha256()}};
}

std::optional<std::string> header_value(const json& headers, const char* name) {
    if (headers.contains(name) && headers.at(name).is_string()) {
        return headers.at(name).get<std::string>();
    }
    return std::nullopt;
}

Result<json> run_verify_request(const CliRequest& req) {
    auto leaders = nexus::signed_http::AllowedLeaders::load(*req.allowed_leaders_file);
    if (nexus::core::errors::is_error(leaders)) {
        return nexus::core::errors::get_error(leaders);
    }
    auto headers_file = read_json(*req.headers_file);
    if (nexus::core::errors::is_error(headers_file)) {
        return nexus::core::errors::get_error(headers_file);
    }
    auto body = read_body(req);
    if (nexus::core::errors::is_error(body)) {
        return nexus::core::errors::get_error(body);
    }

    // Only request verification matters here, so an ephemeral tool key will do.
    auto key = req.signing_key.has_value()
                   ? nexus::signed_http::parse_ed25519_signing_key(*req.signing_key)
                   : nexus::codec::SigningKey::generate();
    if (nexus::core::errors::is_error(key)) {
        return nexus::core::errors::get_error(key);
    }

    const auto& raw_headers = nexus::core::errors::get_value(headers_file);
    nexus::signed_http::ReceivedSignatureHeaders received{
        header_value(raw_headers, nexus::signed_http::kHeaderSigVersion),
        header_value(raw_headers, nexus::signed_http::kHeaderSigInput),
        header_value(raw_headers, nexus::signed_http::kHeaderSig)};

    nexus::signed_http::Responder responder(
        *req.tool_id, 0, nexus::core::errors::take_value(key),
        std::make_shared<const nexus::signed_http::AllowedLeaders>(
            nexus::core::errors::take_value(leaders)));
    auto decision =
        responder.authenticate_invoke(http_meta(req), nexus::core::errors::get_value(body), received);
    if (nexus::core::errors::is_error(decision)) {
        return nexus::core::errors::get_error(decision);
    }

    const auto& outcome = nexus::core::errors::get_value(decision);
    if (const auto* rejection = std::get_if<nexus::signed_http::ResponderRejection>(&outcome)) {
        return json{{"decision", "reject"},
                    {"reason", nexus::signed_http::to_string(rejection->kind)}};
    }
    if (std::holds_alternative<nexus::signed_http::SignedResponse>(outcome)) {
        return json{{"decision", "replay"}};
    }
    const auto auth = std::get<nexus::signed_http::InboundSession>(outcome).auth_context();
    NEXUS_LOG_INFO("VerifyRequest: accepted leader " + auth.leader_id + " kid " +
                   std::to_string(auth.leader_kid));
    return json{{"decision", "proceed"},
                {"auth",
                 {{"leader_id", auth.leader_id},
                  {"leader_kid", auth.leader_kid},
                  {"tool_id", auth.tool_id},
                  {"iat_ms", auth.iat_ms},
                  {"exp_ms", auth.exp_ms},
                  {"nonce", auth.nonce},
                  {"method", auth.method},
                  {"path", auth.path},
                  {"query", auth.query},
                  {"leader_public_key", nexus::codec::hex_encode(auth.leader_public_key.data(),
                                                                 auth.leader_public_key.size())},
                  {"request_sig_input_sha256", auth.request_sig_input_sha256}}}};
}

Result<json> run_check_occurrence(const CliRequest& req) {
    auto request = nexus::transactions::OccurrenceRequest::create(
        req.start_ms, req.deadline_ms, req.start_offset_ms, req.deadline_offset_ms, req.gas_price,
        false);
    if (nexus::core::errors::is_error(request)) {
        return nexus::core::errors::get_error(request);
    }
    const auto call =
        nexus::transactions::choose_occurrence_call(nexus::core::errors::get_value(request));
    return json{{"valid", true}, {"call", nexus::transactions::to_string(call)}};
}

Result<json> run_compose_dag(const CliRequest& req) {
    auto config = nexus::core::config::load_client_config(*req.config_file);
    if (nexus::core::errors::is_error(config)) {
        return nexus::core::errors::get_error(config);
    }
    auto dag_json = read_json(*req.dag_file);
    if (nexus::core::errors::is_error(dag_json)) {
        return nexus::core::errors::get_error(dag_json);
    }
    auto dag = nexus::transactions::parse_dag(nexus::core::errors::get_value(dag_json));
    if (nexus::core::errors::is_error(dag)) {
        return nexus::core::errors::get_error(dag);
    }

    nexus::transactions::TransactionBuilder tx;
    auto composed = nexus::transactions::compose_dag_publish(
        tx, nexus::core::errors::get_value(config).nexus_objects,
        nexus::core::errors::get_value(dag));
    if (nexus::core::errors::is_error(composed)) {
        return nexus::core::errors::get_error(composed);
    }
    auto finished = tx.finish();
    if (nexus::core::errors::is_error(finished)) {
        return nexus::core::errors::get_error(finished);
    }
    const auto move_calls = nexus::core::errors::get_value(finished).move_call_count();
    NEXUS_LOG_INFO("ComposeDag: " + std::to_string(move_calls) + " move calls");
    return json{{"move_calls", move_calls},
                {"expected_move_calls",
                 nexus::transactions::publish_call_count(nexus::core::errors::get_value(dag))},
                {"transaction", tx.to_json()}};
}

}  // namespace

namespace nexus::app::commands {

Result<json> dispatch(const CliRequest& req) {
    switch (req.command) {
        case Command::DecodeEvent: return run_decode_event(req);
        case Command::SignRequest: return run_sign_request(req);
        case Command::VerifyRequest: return run_verify_request(req);
        case Command::CheckOccurrence: return run_check_occurrence(req);
        case Command::ComposeDag: return run_compose_dag(req);
    }
    return NexusError{ErrorCategory::Internal, "Unhandled command.", "unknown_command"};
}

}  // namespace nexus::app::commands
