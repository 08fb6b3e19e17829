#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/nexus_errors.hpp"
#include "transactions/dag.hpp"
#include "types/nexus_types.hpp"

namespace nexus::client {

// Content-addressed blob store for port data too large to keep inline.
// Keys are the lowercase hex SHA-256 of the stored payload.
class ArtifactStorage {
public:
    virtual ~ArtifactStorage() = default;

    virtual core::errors::Status put(const std::string& key, const std::string& payload) = 0;
    virtual core::errors::Result<std::string> get(const std::string& key) const = 0;
};

class InMemoryArtifactStorage : public ArtifactStorage {
public:
    core::errors::Status put(const std::string& key, const std::string& payload) override;
    core::errors::Result<std::string> get(const std::string& key) const override;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::string> blobs_;
};

// One file per blob, `<root>/<subdir>/<key>.json`.
class FileArtifactStorage : public ArtifactStorage {
public:
    explicit FileArtifactStorage(std::filesystem::path root,
                                 std::filesystem::path artifact_subdir = ".nexus_artifacts");

    core::errors::Status put(const std::string& key, const std::string& payload) override;
    core::errors::Result<std::string> get(const std::string& key) const override;

    core::errors::Result<std::filesystem::path> blob_path(const std::string& key) const;

private:
    std::filesystem::path root_;
    std::filesystem::path artifact_subdir_;
};

// Encrypts port data for a session with the leader. The ratchet itself is
// an external collaborator.
class PayloadEncryptor {
public:
    virtual ~PayloadEncryptor() = default;

    virtual core::errors::Result<nlohmann::json> encrypt(const nlohmann::json& plain) = 0;
};

// How entry data is committed before execution. Ports are named
// "vertex.port".
struct StorageConf {
    std::set<std::string> remote_ports;
    std::shared_ptr<ArtifactStorage> storage;
    std::set<std::string> encrypted_ports;
    std::shared_ptr<PayloadEncryptor> encryptor;
};

std::string port_key(const std::string& vertex, const std::string& port);

// Encrypts when the port is marked encrypted, then either keeps the value
// inline or stores it and keeps its key.
core::errors::Result<types::NexusData> commit_port_data(const std::string& vertex,
                                                        const std::string& port,
                                                        const nlohmann::json& value,
                                                        const StorageConf& conf);

// {"vertex": {"port": <json>}} -> committed inputs.
core::errors::Result<transactions::VertexInputs> commit_entry_data(const nlohmann::json& entry_data,
                                                                   const StorageConf& conf);

// Inverse of an offloaded commit: the stored JSON behind a Walrus-kind value.
core::errors::Result<nlohmann::json> fetch_port_data(const types::NexusData& data,
                                                     const ArtifactStorage& storage);

}  // namespace nexus::client
