#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "codec/address.hpp"
#include "codec/bytes.hpp"
#include "core/errors/nexus_errors.hpp"

namespace nexus::ledger {

// (id, version, digest). Digests are base58 text as the ledger renders them.
struct ObjectRef {
    codec::Address object_id;
    std::uint64_t version = 0;
    std::string digest;

    bool operator==(const ObjectRef& other) const {
        return object_id == other.object_id && version == other.version && digest == other.digest;
    }
};

// {"object_id", "version", "digest"} with a stringified version.
core::errors::Result<ObjectRef> object_ref_from_json(const nlohmann::json& value);
nlohmann::json to_json(const ObjectRef& ref);

struct Owner {
    enum class Kind { Address, Shared, Immutable, Object };

    Kind kind = Kind::Immutable;
    // Address and Object owners.
    codec::Address address;
    // Shared objects only.
    std::uint64_t initial_shared_version = 0;

    static Owner address_owner(const codec::Address& address) {
        return Owner{Kind::Address, address, 0};
    }
    static Owner shared(std::uint64_t initial_shared_version) {
        return Owner{Kind::Shared, codec::Address{}, initial_shared_version};
    }
    static Owner immutable() { return Owner{Kind::Immutable, codec::Address{}, 0}; }
    static Owner object_owner(const codec::Address& parent) {
        return Owner{Kind::Object, parent, 0};
    }
};

struct LedgerField;

// Self-describing value tree carried in the `json` field of an object.
struct LedgerValue {
    enum class Kind { Null, Bool, Number, String, List, Struct };

    Kind kind = Kind::Null;
    bool boolean = false;
    double number = 0.0;
    std::string string;
    std::vector<LedgerValue> list;
    std::vector<LedgerField> fields;
};

struct LedgerField {
    std::string name;
    LedgerValue value;
};

// Integral numbers become unsigned (or signed when negative); anything
// else stays a float.
nlohmann::json ledger_value_to_json(const LedgerValue& value);
LedgerValue ledger_value_from_json(const nlohmann::json& value);

// Paths requested from GetObject/BatchGetObjects.
struct FieldMask {
    std::vector<std::string> paths;

    bool wants(const std::string& path) const;

    static FieldMask metadata();
    static FieldMask with_content();
};

struct LedgerObject {
    codec::Address object_id;
    Owner owner;
    std::uint64_t version = 0;
    std::string digest;
    std::string object_type;
    std::optional<std::uint64_t> balance;
    std::optional<LedgerValue> content;
};

struct DynamicFieldInfo {
    enum class Kind { Field, Object };

    Kind kind = Kind::Field;
    LedgerValue name;
    codec::Address field_id;
    // The wrapped object for dynamic object fields.
    std::optional<codec::Address> child_id;
};

struct DynamicFieldPage {
    std::vector<DynamicFieldInfo> fields;
    std::optional<std::string> next_page_token;
};

struct EpochInfo {
    std::uint64_t epoch = 0;
    std::uint64_t reference_gas_price = 0;
    std::optional<std::uint64_t> end_timestamp_ms;
};

struct EventId {
    std::string tx_digest;
    std::uint64_t sequence = 0;

    bool operator==(const EventId& other) const {
        return tx_digest == other.tx_digest && sequence == other.sequence;
    }
};

// One event as the ledger reports it: textual struct type plus JSON body.
struct LedgerEvent {
    EventId id;
    codec::Address package_id;
    std::string type;
    nlohmann::json contents;
};

struct EventPage {
    std::vector<LedgerEvent> events;
    std::optional<std::string> next_cursor;
};

struct ChangedObject {
    enum class Change { Created, Mutated, Deleted };

    codec::Address object_id;
    Change change = Change::Created;
    std::string object_type;
    Owner owner;
    std::uint64_t version = 0;
    std::string digest;

    ObjectRef object_ref() const { return ObjectRef{object_id, version, digest}; }
};

struct TransactionEffects {
    bool success = true;
    std::string error;
    std::optional<std::uint32_t> status_code;
    std::vector<ChangedObject> changed_objects;
    // Gas coin after execution.
    std::optional<ObjectRef> gas_object;
};

struct ExecutedTransaction {
    std::string digest;
    TransactionEffects effects;
    std::vector<LedgerEvent> events;
};

}  // namespace nexus::ledger
