#include <filesystem>
#include <fstream>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "core/config/client_config.hpp"
#include "core/config/correlation_id.hpp"
#include "core/config/crypto_conf.hpp"
#include "mock_ledger.hpp"

namespace {

using nexus::codec::Address;
using nexus::core::errors::get_error;
using nexus::core::errors::get_value;
using nexus::core::errors::is_error;
using nexus::testing::object_ref;
using nlohmann::json;
namespace config = nexus::core::config;

class TempDir {
public:
    TempDir() {
        root_ = std::filesystem::current_path() /
                (".tmp_config_" + std::get<std::string>(config::generate_correlation_id()));
        std::filesystem::create_directories(root_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

json objects_json() {
    nexus::types::NexusObjects objects;
    objects.workflow_pkg_id = Address::from_u64(0xbb);
    objects.primitives_pkg_id = Address::from_u64(0xaa);
    objects.interface_pkg_id = Address::from_u64(0xcc);
    objects.network_id = Address::from_u64(0xdd);
    objects.tool_registry = object_ref(0x101, 4);
    objects.default_tap = object_ref(0x102, 4);
    objects.gas_service = object_ref(0x103, 4);
    objects.pre_key_vault = object_ref(0x104, 4);
    objects.network_auth = object_ref(0x105, 4);
    return nexus::types::to_json(objects);
}

json minimal_config() {
    return json{{"rpc_url", "http://127.0.0.1:9000"},
                {"gas_budget", 5000000},
                {"gas_coins", json::array({nexus::ledger::to_json(object_ref(0x900, 2))})},
                {"nexus_objects", objects_json()}};
}

TEST(ClientConfigTest, DefaultsOptionalSections) {
    auto parsed = config::client_config_from_json(minimal_config());
    ASSERT_FALSE(is_error(parsed));
    const auto& conf = get_value(parsed);
    EXPECT_EQ(conf.gas_budget, 5000000u);
    ASSERT_EQ(conf.gas_coins.size(), 1u);
    EXPECT_EQ(conf.gas_coins[0].object_id, Address::from_u64(0x900));
    EXPECT_EQ(conf.transaction_timeout_ms, config::kDefaultTransactionTimeoutMs);
    EXPECT_EQ(conf.signed_http.max_clock_skew_ms, 30000u);
    EXPECT_EQ(conf.signed_http.max_validity_ms, 60000u);
    EXPECT_FALSE(conf.allowed_leaders_path.has_value());
    EXPECT_EQ(conf.nexus_objects.workflow_pkg_id, Address::from_u64(0xbb));
}

TEST(ClientConfigTest, ReadsOverridesAndStringifiedNumbers) {
    auto value = minimal_config();
    value["gas_budget"] = "18446744073709551615";
    value["read_retry"] = {{"max_attempts", 5}, {"initial_backoff_ms", 10}};
    value["signed_http"] = {{"max_clock_skew_ms", 1000}};
    value["allowed_leaders_path"] = "leaders.json";

    auto parsed = config::client_config_from_json(value);
    ASSERT_FALSE(is_error(parsed));
    const auto& conf = get_value(parsed);
    EXPECT_EQ(conf.gas_budget, 18446744073709551615ULL);
    EXPECT_EQ(conf.read_retry.max_attempts, 5u);
    EXPECT_EQ(conf.read_retry.initial_backoff_ms, 10u);
    EXPECT_EQ(conf.signed_http.max_clock_skew_ms, 1000u);
    EXPECT_EQ(conf.signed_http.max_validity_ms, 60000u);
    EXPECT_EQ(conf.allowed_leaders_path->string(), "leaders.json");
}

TEST(ClientConfigTest, ErrorsNameTheField) {
    auto no_url = minimal_config();
    no_url.erase("rpc_url");
    auto parsed = config::client_config_from_json(no_url);
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "configuration");
    EXPECT_NE(get_error(parsed).message.find("rpc_url"), std::string::npos);

    auto zero_attempts = minimal_config();
    zero_attempts["read_retry"] = {{"max_attempts", 0}};
    EXPECT_TRUE(is_error(config::client_config_from_json(zero_attempts)));

    auto bad_objects = minimal_config();
    bad_objects["nexus_objects"].erase("workflow_pkg_id");
    parsed = config::client_config_from_json(bad_objects);
    ASSERT_TRUE(is_error(parsed));
    EXPECT_NE(get_error(parsed).message.find("workflow_pkg_id"), std::string::npos);
}

TEST(ClientConfigTest, NumbersBuiltInCodeMatchParsedOnes) {
    auto built = minimal_config();
    built["transaction_timeout_ms"] = 2500;
    auto from_text = nlohmann::json::parse(built.dump());

    auto a = config::client_config_from_json(built);
    auto b = config::client_config_from_json(from_text);
    ASSERT_FALSE(is_error(a));
    ASSERT_FALSE(is_error(b));
    EXPECT_EQ(get_value(a).transaction_timeout_ms, 2500u);
    EXPECT_EQ(get_value(b).transaction_timeout_ms, 2500u);

    built["gas_budget"] = -5;
    auto negative = config::client_config_from_json(built);
    ASSERT_TRUE(is_error(negative));
    EXPECT_NE(get_error(negative).message.find("gas_budget"), std::string::npos);
}

TEST(ClientConfigTest, LoadsFromFile) {
    TempDir dir;
    const auto path = dir.root() / "client.json";
    {
        std::ofstream out(path);
        out << minimal_config().dump(2);
    }
    auto loaded = config::load_client_config(path);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded).rpc_url, "http://127.0.0.1:9000");

    auto missing = config::load_client_config(dir.root() / "absent.json");
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "configuration");
}

TEST(CryptoConfTest, MissingFileIsEmpty) {
    TempDir dir;
    auto loaded = config::load_crypto_conf(dir.root() / "crypto.json");
    ASSERT_FALSE(is_error(loaded));
    EXPECT_FALSE(get_value(loaded).identity_key().has_value());
    EXPECT_TRUE(get_value(loaded).sessions().empty());
}

TEST(CryptoConfTest, SavesWithOwnerOnlyPermissionsAndReloads) {
    TempDir dir;
    const auto path = dir.root() / "nested" / "crypto.json";
    const std::string session(64, 'a');

    config::CryptoConf conf;
    conf.set_identity_key(nexus::codec::Ed25519Seed{});
    ASSERT_FALSE(is_error(conf.release_session(session, json{{"chain_key", "abc"}})));
    ASSERT_FALSE(is_error(config::save_crypto_conf(path, conf)));

    const auto perms = std::filesystem::status(path).permissions();
    EXPECT_EQ(perms & std::filesystem::perms::group_all, std::filesystem::perms::none);
    EXPECT_EQ(perms & std::filesystem::perms::others_all, std::filesystem::perms::none);

    auto loaded = config::load_crypto_conf(path);
    ASSERT_FALSE(is_error(loaded));
    auto reloaded = get_value(loaded);
    ASSERT_TRUE(reloaded.identity_key().has_value());
    auto key = reloaded.identity_signing_key();
    ASSERT_FALSE(is_error(key));
    EXPECT_TRUE(get_value(key).has_value());

    auto state = reloaded.take_session(session);
    ASSERT_TRUE(state.has_value());
    EXPECT_EQ((*state)["chain_key"], "abc");
    EXPECT_FALSE(reloaded.take_session(session).has_value());
}

TEST(CryptoConfTest, RejectsMalformedSessionIds) {
    config::CryptoConf conf;
    auto status = conf.release_session("ABC", json::object());
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "invalid_hex");

    auto parsed = config::CryptoConf::from_json(json{{"sessions", {{"not-hex", 1}}}});
    ASSERT_TRUE(is_error(parsed));
    EXPECT_EQ(get_error(parsed).code, "configuration");

    auto short_key = config::CryptoConf::from_json(json{{"identity_key", "00ff"}});
    ASSERT_TRUE(is_error(short_key));
    EXPECT_EQ(get_error(short_key).code, "invalid_length");
}

TEST(CryptoConfTest, FailedSaveLeavesNoTempFile) {
    TempDir dir;
    // The target is a non-empty directory, so the final rename fails.
    const auto path = dir.root() / "crypto.json";
    std::filesystem::create_directories(path / "occupied");

    config::CryptoConf conf;
    conf.set_identity_key(nexus::codec::Ed25519Seed{});
    auto status = config::save_crypto_conf(path, conf);
    ASSERT_TRUE(is_error(status));
    EXPECT_EQ(get_error(status).code, "config_write_failed");

    auto temp = path;
    temp += ".tmp";
    EXPECT_FALSE(std::filesystem::exists(temp));
    EXPECT_TRUE(std::filesystem::is_directory(path));
}

TEST(CorrelationIdTest, IsPrefixedRandomHex) {
    auto first = config::generate_correlation_id();
    auto second = config::generate_correlation_id();
    ASSERT_FALSE(is_error(first));
    ASSERT_FALSE(is_error(second));

    const auto& id = get_value(first);
    ASSERT_EQ(id.size(), 11u);
    EXPECT_EQ(id.rfind("nx-", 0), 0u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef", 3), std::string::npos);
    EXPECT_NE(id, get_value(second));
}

}  // namespace
