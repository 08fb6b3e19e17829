#include "client/artifact_storage.hpp"

#include <fstream>
#include <iterator>
#include <utility>
#include "codec/hex.hpp"
#include "codec/sha256.hpp"
#include "core/logging/logger.hpp"

namespace nexus::client {

using core::errors::NexusError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

core::errors::Status check_key(const std::string& key, const std::string& payload) {
    if (!codec::is_lower_hex(key, 64)) {
        return NexusError{ErrorCategory::Input, "Artifact key must be 64 lowercase hex.",
                          "invalid_artifact_key"};
    }
    if (codec::sha256_hex(payload) != key) {
        return NexusError{ErrorCategory::Input, "Artifact key does not match its payload.",
                          "artifact_key_mismatch"};
    }
    return core::errors::ok();
}

NexusError artifact_not_found(const std::string& key) {
    return NexusError{ErrorCategory::Input, "No artifact stored under key " + key + ".",
                      "artifact_not_found"};
}

}  // namespace

core::errors::Status InMemoryArtifactStorage::put(const std::string& key,
                                                  const std::string& payload) {
    auto status = check_key(key, payload);
    if (core::errors::is_error(status)) {
        return status;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    blobs_[key] = payload;
    return core::errors::ok();
}

core::errors::Result<std::string> InMemoryArtifactStorage::get(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = blobs_.find(key);
    if (it == blobs_.end()) {
        return artifact_not_found(key);
    }
    return it->second;
}

std::size_t InMemoryArtifactStorage::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return blobs_.size();
}

FileArtifactStorage::FileArtifactStorage(std::filesystem::path root,
                                         std::filesystem::path artifact_subdir)
    : root_(std::move(root)), artifact_subdir_(std::move(artifact_subdir)) {}

core::errors::Result<std::filesystem::path> FileArtifactStorage::blob_path(
    const std::string& key) const {
    if (!codec::is_lower_hex(key, 64)) {
        return NexusError{ErrorCategory::Input, "Artifact key must be 64 lowercase hex.",
                          "invalid_artifact_key"};
    }

    std::error_code ec;
    if (!std::filesystem::is_directory(root_, ec) || ec) {
        return NexusError{ErrorCategory::Input,
                          "Artifact root is not a directory: " + root_.string(),
                          "invalid_artifact_root"};
    }
    const auto canonical_root = std::filesystem::weakly_canonical(root_, ec);
    if (ec) {
        return NexusError{ErrorCategory::Input,
                          "Unable to resolve artifact root: " + root_.string(),
                          "invalid_artifact_root"};
    }

    auto artifacts_dir = canonical_root / artifact_subdir_;
    std::filesystem::create_directories(artifacts_dir, ec);
    if (ec) {
        return NexusError{ErrorCategory::Internal,
                          "Unable to create artifacts directory: " + artifacts_dir.string(),
                          "artifact_dir_create_failed"};
    }
    return artifacts_dir / (key + ".json");
}

core::errors::Status FileArtifactStorage::put(const std::string& key,
                                              const std::string& payload) {
    auto status = check_key(key, payload);
    if (core::errors::is_error(status)) {
        return status;
    }
    auto path_result = blob_path(key);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    // Same key, same bytes.
    std::error_code ec;
    if (std::filesystem::exists(path, ec) && !ec) {
        return core::errors::ok();
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return NexusError{ErrorCategory::Internal, "Unable to open artifact file: " + path.string(),
                          "artifact_open_failed"};
    }
    out << payload;
    if (!out.good()) {
        return NexusError{ErrorCategory::Internal, "Unable to write artifact: " + path.string(),
                          "artifact_write_failed"};
    }
    NEXUS_LOG_DEBUG("FileArtifactStorage: stored " + key.substr(0, 12));
    return core::errors::ok();
}

core::errors::Result<std::string> FileArtifactStorage::get(const std::string& key) const {
    auto path_result = blob_path(key);
    if (core::errors::is_error(path_result)) {
        return core::errors::get_error(path_result);
    }
    const auto path = core::errors::get_value(path_result);

    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return artifact_not_found(key);
    }
    std::string payload((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (codec::sha256_hex(payload) != key) {
        return NexusError{ErrorCategory::Internal, "Artifact content does not match key " + key + ".",
                          "artifact_corrupted"};
    }
    return payload;
}

std::string port_key(const std::string& vertex, const std::string& port) {
    return vertex + "." + port;
}

core::errors::Result<types::NexusData> commit_port_data(const std::string& vertex,
                                                        const std::string& port,
                                                        const json& value,
                                                        const StorageConf& conf) {
    const auto key = port_key(vertex, port);
    types::NexusData committed;
    committed.data = value;

    if (conf.encrypted_ports.count(key) != 0) {
        if (!conf.encryptor) {
            return NexusError{ErrorCategory::Ledger,
                              "Port " + key + " is encrypted but no session is configured.",
                              "configuration"};
        }
        auto sealed = conf.encryptor->encrypt(value);
        if (core::errors::is_error(sealed)) {
            return core::errors::get_error(sealed);
        }
        committed.data = core::errors::take_value(sealed);
        committed.encrypted = true;
    }

    if (conf.remote_ports.count(key) != 0) {
        if (!conf.storage) {
            return NexusError{ErrorCategory::Ledger,
                              "Port " + key + " is offloaded but no artifact storage is configured.",
                              "configuration"};
        }
        const auto payload = committed.data.dump();
        const auto blob_key = codec::sha256_hex(payload);
        auto status = conf.storage->put(blob_key, payload);
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }
        committed.storage = types::StorageKind::Walrus;
        committed.data = blob_key;
    }
    return committed;
}

core::errors::Result<transactions::VertexInputs> commit_entry_data(const json& entry_data,
                                                                   const StorageConf& conf) {
    if (!entry_data.is_object()) {
        return NexusError{ErrorCategory::Input, "Entry data must map vertices to ports.",
                          "configuration"};
    }
    transactions::VertexInputs inputs;
    for (auto vertex = entry_data.begin(); vertex != entry_data.end(); ++vertex) {
        if (!vertex.value().is_object()) {
            return NexusError{ErrorCategory::Input,
                              "Entry data for vertex '" + vertex.key() + "' must be an object.",
                              "configuration"};
        }
        auto& ports = inputs[vertex.key()];
        for (auto port = vertex.value().begin(); port != vertex.value().end(); ++port) {
            auto committed = commit_port_data(vertex.key(), port.key(), port.value(), conf);
            if (core::errors::is_error(committed)) {
                return core::errors::get_error(committed);
            }
            ports.emplace(port.key(), core::errors::take_value(committed));
        }
    }
    return inputs;
}

core::errors::Result<json> fetch_port_data(const types::NexusData& data,
                                           const ArtifactStorage& storage) {
    if (data.storage == types::StorageKind::Inline) {
        return data.data;
    }
    if (!data.data.is_string()) {
        return NexusError{ErrorCategory::Input, "Offloaded data must reference a key.",
                          "invalid_artifact_key"};
    }
    auto payload = storage.get(data.data.get<std::string>());
    if (core::errors::is_error(payload)) {
        return core::errors::get_error(payload);
    }
    json value = json::parse(core::errors::get_value(payload), nullptr, false);
    if (value.is_discarded()) {
        return NexusError{ErrorCategory::Internal, "Stored artifact is not valid JSON.",
                          "artifact_corrupted"};
    }
    return value;
}

}  // namespace nexus::client
