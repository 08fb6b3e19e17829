#include <filesystem>
#include <fstream>
#include <string>
#include <vector>
#include <gtest/gtest.h>
#include "app/cli_parser.hpp"
#include "core/config/correlation_id.hpp"
#include "core/errors/nexus_errors.hpp"

namespace {

using nexus::app::cli::CliRequest;
using nexus::app::cli::Command;
using nexus::app::cli::parse_and_validate;
using nexus::core::errors::ErrorCategory;
using nexus::core::errors::get_error;
using nexus::core::errors::get_value;
using nexus::core::errors::is_error;

nexus::core::errors::Result<CliRequest> parse_tokens(const std::vector<std::string>& tokens) {
    std::vector<std::string> owned_args;
    owned_args.reserve(tokens.size() + 1);
    owned_args.emplace_back("nexus_cli");
    for (const auto& token : tokens) {
        owned_args.push_back(token);
    }

    std::vector<char*> argv;
    argv.reserve(owned_args.size());
    for (auto& arg : owned_args) {
        argv.push_back(arg.data());
    }

    return parse_and_validate(static_cast<int>(argv.size()), argv.data());
}

class TempFile {
public:
    TempFile() {
        path_ = std::filesystem::current_path() /
                (".tmp_cli_" + std::get<std::string>(nexus::core::config::generate_correlation_id()) + ".json");
        std::ofstream out(path_);
        out << "{}";
    }

    ~TempFile() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    std::string path() const { return path_.string(); }

private:
    std::filesystem::path path_;
};

TEST(CliParserTest, FailsWhenCommandMissing) {
    auto result = parse_tokens({});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).category, ErrorCategory::Input);
    EXPECT_EQ(get_error(result).code, "missing_command");
}

TEST(CliParserTest, FailsWhenCommandUnknown) {
    auto result = parse_tokens({"publish"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_command");
}

TEST(CliParserTest, FailsWhenRequiredFlagMissing) {
    auto result = parse_tokens({"sign-request", "--signing-key", "00", "--leader-id", "leader"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_required_flag");
    EXPECT_NE(get_error(result).message.find("--leader-kid"), std::string::npos);
}

TEST(CliParserTest, FailsWhenKidNotNumeric) {
    auto result = parse_tokens({"sign-request", "--signing-key", "00", "--leader-id", "leader",
                                "--leader-kid", "seven", "--tool-id", "tool"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_integer");
}

TEST(CliParserTest, FailsOnFlagFromAnotherCommand) {
    auto result = parse_tokens({"check-occurrence", "--tool-id", "tool"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "unknown_argument");
}

TEST(CliParserTest, FailsWhenValueMissing) {
    auto result = parse_tokens({"check-occurrence", "--start-ms"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "missing_value");
}

TEST(CliParserTest, FailsWhenFileDoesNotExist) {
    auto result = parse_tokens({"decode-event", "--event-file", "definitely_missing_event.json"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_path");
}

TEST(CliParserTest, FailsWhenPathIsNotAbsolute) {
    auto result = parse_tokens({"sign-request", "--signing-key", "00", "--leader-id", "leader",
                                "--leader-kid", "1", "--tool-id", "tool", "--path", "invoke"});
    ASSERT_TRUE(is_error(result));
    EXPECT_EQ(get_error(result).code, "invalid_http_target");
}

TEST(CliParserTest, ParsesSignRequest) {
    auto result = parse_tokens({"sign-request", "--signing-key", "00", "--leader-id", "leader",
                                "--leader-kid", "7", "--tool-id", "tool", "--query", "a=1",
                                "--json"});
    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result);
    EXPECT_EQ(req.command, Command::SignRequest);
    EXPECT_TRUE(req.json_output);
    EXPECT_FALSE(req.verbose);
    EXPECT_EQ(*req.leader_kid, 7u);
    EXPECT_EQ(req.method, "POST");
    EXPECT_EQ(req.path, "/invoke");
    EXPECT_EQ(req.query, "a=1");
    EXPECT_FALSE(req.nonce.has_value());
}

TEST(CliParserTest, ParsesCheckOccurrenceOffsets) {
    auto result = parse_tokens({"check-occurrence", "--start-offset-ms", "1000",
                                "--deadline-offset-ms", "500", "--gas-price", "1000", "--verbose"});
    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result);
    EXPECT_EQ(req.command, Command::CheckOccurrence);
    EXPECT_TRUE(req.verbose);
    EXPECT_FALSE(req.start_ms.has_value());
    EXPECT_EQ(*req.start_offset_ms, 1000u);
    EXPECT_EQ(*req.deadline_offset_ms, 500u);
    EXPECT_EQ(req.gas_price, 1000u);
}

TEST(CliParserTest, ParsesVerifyRequestWithExistingFiles) {
    TempFile leaders;
    TempFile headers;
    auto result = parse_tokens({"verify-request", "--tool-id", "tool", "--allowed-leaders",
                                leaders.path(), "--headers-file", headers.path()});
    ASSERT_FALSE(is_error(result));
    const auto& req = get_value(result);
    EXPECT_EQ(req.command, Command::VerifyRequest);
    EXPECT_EQ(req.allowed_leaders_file->string(), leaders.path());
    EXPECT_FALSE(req.body_file.has_value());
}

}  // namespace
