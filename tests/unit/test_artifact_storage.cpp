#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "client/artifact_storage.hpp"
#include "codec/sha256.hpp"
#include "core/config/correlation_id.hpp"

namespace {

using nexus::client::ArtifactStorage;
using nexus::client::FileArtifactStorage;
using nexus::client::InMemoryArtifactStorage;
using nexus::client::StorageConf;
using nexus::core::errors::get_error;
using nexus::core::errors::get_value;
using nexus::core::errors::is_error;
using nlohmann::json;
namespace client = nexus::client;

class TempWorkspace {
public:
    TempWorkspace() {
        root_ = std::filesystem::current_path() /
                (".tmp_artifacts_" + std::get<std::string>(nexus::core::config::generate_correlation_id()));
        std::filesystem::create_directories(root_);
    }

    ~TempWorkspace() {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& root() const { return root_; }

private:
    std::filesystem::path root_;
};

// Wraps values so the test can tell they went through the encryptor.
class TaggingEncryptor : public client::PayloadEncryptor {
public:
    nexus::core::errors::Result<json> encrypt(const json& plain) override {
        ++calls;
        return json{{"sealed", plain}};
    }

    int calls = 0;
};

TEST(ArtifactStorageTest, FileStorageWritesUnderArtifactDir) {
    TempWorkspace workspace;
    FileArtifactStorage storage(workspace.root());
    const std::string payload = "{\"large\":true}";
    const auto key = nexus::codec::sha256_hex(payload);

    ASSERT_FALSE(is_error(storage.put(key, payload)));
    EXPECT_TRUE(std::filesystem::exists(workspace.root() / ".nexus_artifacts" / (key + ".json")));

    auto loaded = storage.get(key);
    ASSERT_FALSE(is_error(loaded));
    EXPECT_EQ(get_value(loaded), payload);
}

TEST(ArtifactStorageTest, KeyMustMatchPayload) {
    InMemoryArtifactStorage storage;
    auto mismatch = storage.put(nexus::codec::sha256_hex(std::string("a")), "b");
    ASSERT_TRUE(is_error(mismatch));
    EXPECT_EQ(get_error(mismatch).code, "artifact_key_mismatch");

    auto malformed = storage.put("../escape", "b");
    ASSERT_TRUE(is_error(malformed));
    EXPECT_EQ(get_error(malformed).code, "invalid_artifact_key");

    auto missing = storage.get(std::string(64, '0'));
    ASSERT_TRUE(is_error(missing));
    EXPECT_EQ(get_error(missing).code, "artifact_not_found");
}

TEST(ArtifactStorageTest, CorruptedFileIsDetected) {
    TempWorkspace workspace;
    FileArtifactStorage storage(workspace.root());
    const std::string payload = "[1,2,3]";
    const auto key = nexus::codec::sha256_hex(payload);
    ASSERT_FALSE(is_error(storage.put(key, payload)));

    {
        std::ofstream out(workspace.root() / ".nexus_artifacts" / (key + ".json"), std::ios::trunc);
        out << "[1,2,4]";
    }
    auto loaded = storage.get(key);
    ASSERT_TRUE(is_error(loaded));
    EXPECT_EQ(get_error(loaded).code, "artifact_corrupted");
}

TEST(EntryDataTest, InlinePortsStayPlain) {
    auto inputs = client::commit_entry_data(json{{"a", {{"input", 42}}}}, StorageConf{});
    ASSERT_FALSE(is_error(inputs));
    const auto& data = get_value(inputs).at("a").at("input");
    EXPECT_EQ(data.storage, nexus::types::StorageKind::Inline);
    EXPECT_FALSE(data.encrypted);
    EXPECT_EQ(data.data, 42);
}

TEST(EntryDataTest, OffloadedEncryptedPortRoundTrips) {
    auto storage = std::make_shared<InMemoryArtifactStorage>();
    auto encryptor = std::make_shared<TaggingEncryptor>();
    StorageConf conf;
    conf.remote_ports = {client::port_key("a", "doc")};
    conf.encrypted_ports = {client::port_key("a", "doc")};
    conf.storage = storage;
    conf.encryptor = encryptor;

    const json document{{"text", std::string(512, 'x')}};
    auto committed = client::commit_port_data("a", "doc", document, conf);
    ASSERT_FALSE(is_error(committed));
    const auto& data = get_value(committed);
    EXPECT_EQ(data.storage, nexus::types::StorageKind::Walrus);
    EXPECT_TRUE(data.encrypted);
    EXPECT_EQ(encryptor->calls, 1);
    EXPECT_EQ(storage->size(), 1u);

    auto fetched = client::fetch_port_data(data, *storage);
    ASSERT_FALSE(is_error(fetched));
    EXPECT_EQ(get_value(fetched), (json{{"sealed", document}}));
}

TEST(EntryDataTest, MissingCollaboratorsAreConfigurationErrors) {
    StorageConf remote_only;
    remote_only.remote_ports = {client::port_key("a", "doc")};
    auto no_storage = client::commit_port_data("a", "doc", json(1), remote_only);
    ASSERT_TRUE(is_error(no_storage));
    EXPECT_EQ(get_error(no_storage).code, "configuration");

    StorageConf encrypted_only;
    encrypted_only.encrypted_ports = {client::port_key("a", "doc")};
    auto no_session = client::commit_port_data("a", "doc", json(1), encrypted_only);
    ASSERT_TRUE(is_error(no_session));
    EXPECT_EQ(get_error(no_session).code, "configuration");

    EXPECT_TRUE(is_error(client::commit_entry_data(json::array(), StorageConf{})));
}

}  // namespace
