#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "codec/address.hpp"
#include "core/errors/nexus_errors.hpp"
#include "crawler/collections.hpp"
#include "ledger/ledger_client.hpp"
#include "ledger/ledger_types.hpp"

namespace nexus::crawler {

// A fetched object with its content decoded into T.
template <typename T>
struct Response {
    codec::Address object_id;
    ledger::Owner owner;
    std::uint64_t version = 0;
    std::string digest;
    T data;
    std::optional<std::uint64_t> balance;

    bool is_shared() const { return owner.kind == ledger::Owner::Kind::Shared; }

    std::optional<std::uint64_t> get_initial_version() const {
        if (!is_shared()) {
            return std::nullopt;
        }
        return owner.initial_shared_version;
    }

    ledger::ObjectRef object_ref() const { return ledger::ObjectRef{object_id, version, digest}; }

    // Shared inputs are referenced by their initial version, never the
    // current one. Owned objects fall back to their current ref.
    ledger::ObjectRef shared_ref() const {
        return ledger::ObjectRef{object_id, get_initial_version().value_or(version), digest};
    }
};

using MetadataResponse = Response<std::monostate>;

// Decodes content through nlohmann from_json(); shape errors become
// Ledger/parsing.
template <typename T>
core::errors::Result<T> decode_content(const nlohmann::json& value, const std::string& context) {
    try {
        return value.get<T>();
    } catch (const nlohmann::json::exception& e) {
        return core::errors::NexusError{core::errors::ErrorCategory::Ledger,
                                        "Failed to decode " + context + ": " + e.what(),
                                        "parsing"};
    } catch (const ContentError& e) {
        return core::errors::NexusError{core::errors::ErrorCategory::Ledger,
                                        "Failed to decode " + context + ": " + e.what(),
                                        "parsing"};
    }
}

// Typed, top-down traversal of ledger objects and their dynamic fields.
// Never follows references on its own.
class Crawler {
public:
    explicit Crawler(std::shared_ptr<ledger::LedgerClient> ledger);

    template <typename T>
    core::errors::Result<Response<T>> get_object(const codec::Address& object_id) const;

    // Order follows `object_ids`.
    template <typename T>
    core::errors::Result<std::vector<Response<T>>> get_objects(
        const std::vector<codec::Address>& object_ids) const;

    core::errors::Result<MetadataResponse> get_object_metadata(
        const codec::Address& object_id) const;
    core::errors::Result<std::vector<MetadataResponse>> get_objects_metadata(
        const std::vector<codec::Address>& object_ids) const;

    template <typename K, typename V>
    core::errors::Result<std::map<K, V>> get_dynamic_fields(const DynamicMap<K, V>& parent) const;

    template <typename K, typename V>
    core::errors::Result<std::map<K, Response<V>>> get_dynamic_field_objects(
        const DynamicObjectMap<K, V>& parent) const;

    template <typename T>
    core::errors::Result<std::vector<T>> get_table_vec(const TableVec<T>& parent) const;

    // All listing pages for `parent`; fails unless exactly `expected_size`
    // fields come back.
    core::errors::Result<std::vector<ledger::DynamicFieldInfo>> list_dynamic_fields(
        const codec::Address& parent, std::uint64_t expected_size) const;

    // Objects with content, in order; a missing one is object_not_found.
    core::errors::Result<std::vector<ledger::LedgerObject>> fetch_objects(
        const std::vector<codec::Address>& object_ids, const ledger::FieldMask& mask) const;

private:
    template <typename T>
    static core::errors::Result<Response<T>> to_response(const ledger::LedgerObject& object);

    static core::errors::Result<nlohmann::json> content_json(const ledger::LedgerObject& object);

    std::shared_ptr<ledger::LedgerClient> ledger_;
};

core::errors::NexusError metadata_missing(const std::string& field, const codec::Address& id);
core::errors::NexusError duplicate_field_key(const codec::Address& parent, const std::string& key);

template <typename T>
core::errors::Result<Response<T>> Crawler::to_response(const ledger::LedgerObject& object) {
    auto content = content_json(object);
    if (core::errors::is_error(content)) {
        return core::errors::get_error(content);
    }
    auto data = decode_content<T>(core::errors::get_value(content),
                                  "object " + object.object_id.to_hex());
    if (core::errors::is_error(data)) {
        return core::errors::get_error(data);
    }
    return Response<T>{object.object_id, object.owner,  object.version,
                       object.digest,    core::errors::take_value(data), object.balance};
}

template <typename T>
core::errors::Result<Response<T>> Crawler::get_object(const codec::Address& object_id) const {
    auto objects = fetch_objects({object_id}, ledger::FieldMask::with_content());
    if (core::errors::is_error(objects)) {
        return core::errors::get_error(objects);
    }
    return to_response<T>(core::errors::get_value(objects).front());
}

template <typename T>
core::errors::Result<std::vector<Response<T>>> Crawler::get_objects(
    const std::vector<codec::Address>& object_ids) const {
    auto objects = fetch_objects(object_ids, ledger::FieldMask::with_content());
    if (core::errors::is_error(objects)) {
        return core::errors::get_error(objects);
    }
    std::vector<Response<T>> out;
    out.reserve(object_ids.size());
    for (const auto& object : core::errors::get_value(objects)) {
        auto response = to_response<T>(object);
        if (core::errors::is_error(response)) {
            return core::errors::get_error(response);
        }
        out.push_back(core::errors::take_value(response));
    }
    return out;
}

template <typename K, typename V>
core::errors::Result<std::map<K, V>> Crawler::get_dynamic_fields(
    const DynamicMap<K, V>& parent) const {
    auto fields = list_dynamic_fields(parent.id, parent.size);
    if (core::errors::is_error(fields)) {
        return core::errors::get_error(fields);
    }

    std::vector<codec::Address> field_ids;
    for (const auto& field : core::errors::get_value(fields)) {
        field_ids.push_back(field.field_id);
    }
    auto objects = fetch_objects(field_ids, ledger::FieldMask::with_content());
    if (core::errors::is_error(objects)) {
        return core::errors::get_error(objects);
    }

    // Each field object is Field<K, V>: {id, name, value}.
    std::map<K, V> out;
    for (const auto& object : core::errors::get_value(objects)) {
        auto content = content_json(object);
        if (core::errors::is_error(content)) {
            return core::errors::get_error(content);
        }
        const auto& json = core::errors::get_value(content);
        if (!json.is_object() || !json.contains("name") || !json.contains("value")) {
            return metadata_missing("name/value", object.object_id);
        }
        auto key = decode_content<K>(json.at("name"), "dynamic field name");
        if (core::errors::is_error(key)) {
            return core::errors::get_error(key);
        }
        auto value = decode_content<V>(json.at("value"), "dynamic field value");
        if (core::errors::is_error(value)) {
            return core::errors::get_error(value);
        }
        if (!out.emplace(core::errors::take_value(key), core::errors::take_value(value)).second) {
            return duplicate_field_key(parent.id, json.at("name").dump());
        }
    }
    return out;
}

template <typename K, typename V>
core::errors::Result<std::map<K, Response<V>>> Crawler::get_dynamic_field_objects(
    const DynamicObjectMap<K, V>& parent) const {
    auto fields = list_dynamic_fields(parent.id, parent.size);
    if (core::errors::is_error(fields)) {
        return core::errors::get_error(fields);
    }

    std::vector<K> keys;
    std::vector<codec::Address> child_ids;
    for (const auto& field : core::errors::get_value(fields)) {
        if (!field.child_id.has_value()) {
            return metadata_missing("child_id", field.field_id);
        }
        auto key = decode_content<K>(ledger::ledger_value_to_json(field.name),
                                     "dynamic object field name");
        if (core::errors::is_error(key)) {
            return core::errors::get_error(key);
        }
        keys.push_back(core::errors::take_value(key));
        child_ids.push_back(*field.child_id);
    }

    auto children = get_objects<V>(child_ids);
    if (core::errors::is_error(children)) {
        return core::errors::get_error(children);
    }
    auto& responses = std::get<std::vector<Response<V>>>(children);
    std::map<K, Response<V>> out;
    for (std::size_t i = 0; i < keys.size(); ++i) {
        if (!out.emplace(std::move(keys[i]), std::move(responses[i])).second) {
            return duplicate_field_key(parent.id, child_ids[i].to_hex());
        }
    }
    return out;
}

template <typename T>
core::errors::Result<std::vector<T>> Crawler::get_table_vec(const TableVec<T>& parent) const {
    auto entries = get_dynamic_fields(DynamicMap<StringifiedU64, T>{{parent.id, parent.size}});
    if (core::errors::is_error(entries)) {
        return core::errors::get_error(entries);
    }

    std::vector<std::optional<T>> slots(parent.size);
    for (auto& [index, value] : std::get<std::map<StringifiedU64, T>>(entries)) {
        if (index.value >= parent.size) {
            return core::errors::NexusError{
                core::errors::ErrorCategory::Crawler,
                "Table vector index " + std::to_string(index.value) + " is out of bounds for size " +
                    std::to_string(parent.size) + ".",
                "index_out_of_bounds"};
        }
        slots[index.value] = std::move(value);
    }

    std::vector<T> out;
    out.reserve(slots.size());
    for (std::size_t i = 0; i < slots.size(); ++i) {
        if (!slots[i].has_value()) {
            return core::errors::NexusError{core::errors::ErrorCategory::Crawler,
                                            "Table vector is missing index " +
                                                std::to_string(i) + ".",
                                            "index_out_of_bounds"};
        }
        out.push_back(std::move(*slots[i]));
    }
    return out;
}

}  // namespace nexus::crawler
