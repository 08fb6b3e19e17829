#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <nlohmann/json.hpp>
#include "codec/address.hpp"
#include "codec/bytes.hpp"
#include "core/errors/nexus_errors.hpp"

namespace nexus::types {

// Fully-qualified tool name: domain.name@version.
struct ToolFqn {
    std::string domain;
    std::string name;
    std::uint64_t version = 0;

    static core::errors::Result<ToolFqn> parse(const std::string& text);
    std::string to_string() const;

    bool operator==(const ToolFqn& other) const {
        return domain == other.domain && name == other.name && version == other.version;
    }
    bool operator<(const ToolFqn& other) const { return to_string() < other.to_string(); }
};

// Move-side `TypeName`-shaped label ({"name": "..."}) used for vertices,
// output variants and ports.
struct TypeName {
    std::string name;

    bool operator==(const TypeName& other) const { return name == other.name; }
};

struct RuntimeVertex {
    enum class Kind { Plain, WithIterator };

    Kind kind = Kind::Plain;
    TypeName vertex;
    std::uint64_t iteration = 0;
    std::uint64_t out_of = 0;

    static RuntimeVertex plain(const std::string& name) {
        return RuntimeVertex{Kind::Plain, TypeName{name}, 0, 0};
    }

    bool operator==(const RuntimeVertex& other) const {
        return kind == other.kind && vertex == other.vertex &&
               iteration == other.iteration && out_of == other.out_of;
    }
};

// Scheduler generator identity: a witness type name or an object id.
struct PolicySymbol {
    enum class Kind { Witness, Uid };

    Kind kind = Kind::Witness;
    std::string witness;
    codec::Address uid;

    bool operator==(const PolicySymbol& other) const {
        return kind == other.kind && witness == other.witness && uid == other.uid;
    }
};

struct SharedObjectRef {
    codec::Address id;
    bool ref_mut = false;

    bool operator==(const SharedObjectRef& other) const {
        return id == other.id && ref_mut == other.ref_mut;
    }
};

enum class StorageKind { Inline, Walrus };

// A port value as stored on the ledger: JSON that is either inline or a
// reference into remote storage, optionally encrypted.
struct NexusData {
    StorageKind storage = StorageKind::Inline;
    nlohmann::json data;
    bool encrypted = false;

    static NexusData inline_plain(nlohmann::json data) {
        return NexusData{StorageKind::Inline, std::move(data), false};
    }

    bool operator==(const NexusData& other) const {
        return storage == other.storage && data == other.data && encrypted == other.encrypted;
    }
};

// Port name -> data.
using PortsData = std::map<std::string, NexusData>;

// JSON codecs in the ledger's shapes. Failures are malformed_payload.
core::errors::Result<ToolFqn> tool_fqn_from_json(const nlohmann::json& value);
core::errors::Result<TypeName> type_name_from_json(const nlohmann::json& value);
nlohmann::json to_json(const TypeName& value);

// {"@variant": "Plain"|"WithIterator", "vertex": {"name"}, "iteration", "out_of"}
core::errors::Result<RuntimeVertex> runtime_vertex_from_json(const nlohmann::json& value);
nlohmann::json to_json(const RuntimeVertex& value);

// Accepts the enum shape {"variant", "fields": {"pos0"}} and the legacy
// {"kind", "witness"|"uid"} shape.
core::errors::Result<PolicySymbol> policy_symbol_from_json(const nlohmann::json& value);
nlohmann::json to_json(const PolicySymbol& value);

core::errors::Result<SharedObjectRef> shared_object_ref_from_json(const nlohmann::json& value);
nlohmann::json to_json(const SharedObjectRef& value);

// {"storage": [bytes], "one": [bytes], "many": [[bytes]], "encrypted": bool}
core::errors::Result<NexusData> nexus_data_from_json(const nlohmann::json& value);
nlohmann::json to_json(const NexusData& value);

// BCS of the NexusData struct: storage, one, many, encrypted.
codec::Bytes nexus_data_to_bcs(const NexusData& value);

// {"contents": [{"key": {"name"}, "value": NexusData}]}
core::errors::Result<PortsData> ports_data_from_json(const nlohmann::json& value);
nlohmann::json ports_data_to_json(const PortsData& value);

}  // namespace nexus::types
