#pragma once

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "codec/address.hpp"
#include "codec/stringified.hpp"

namespace nexus::crawler {

// Thrown from from_json() overloads when content does not have the expected
// shape. The crawler turns it into a Ledger/parsing error.
class ContentError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Helpers for from_json() overloads over ledger content.
codec::Address content_address(const nlohmann::json& object, const std::string& field);
std::uint64_t content_u64(const nlohmann::json& object, const std::string& field);
// u64 given as a decimal string or a plain unsigned number.
std::uint64_t content_index(const nlohmann::json& value);

// A u64 that crosses the ledger boundary as a decimal string (plain numbers
// are accepted too).
struct StringifiedU64 {
    std::uint64_t value = 0;

    bool operator==(const StringifiedU64& other) const { return value == other.value; }
    bool operator<(const StringifiedU64& other) const { return value < other.value; }
};

void from_json(const nlohmann::json& value, StringifiedU64& out);

// (id, size) of a container whose entries are dynamic fields.
struct CollectionHandle {
    codec::Address id;
    std::uint64_t size = 0;
};

CollectionHandle collection_handle_from_json(const nlohmann::json& value);

struct Bag : CollectionHandle {};
struct ObjectBag : CollectionHandle {};

template <typename K, typename V>
struct Table : CollectionHandle {};

// 0-indexed vector stored as a Table<u64, T>.
template <typename T>
struct TableVec : CollectionHandle {};

// Contents are fetched by Crawler::get_dynamic_fields.
template <typename K, typename V>
struct DynamicMap : CollectionHandle {};

// Values are objects; fetched by Crawler::get_dynamic_field_objects.
template <typename K, typename V>
struct DynamicObjectMap : CollectionHandle {};

// VecMap as the ledger renders it: {contents: [{key, value}]} or
// {contents: {k: v}}.
template <typename K, typename V>
struct Map {
    std::map<K, V> entries;
};

// VecSet: {contents: [items]} or {contents: {item: ...}}.
template <typename T>
struct Set {
    std::vector<T> items;
};

inline void from_json(const nlohmann::json& value, Bag& out) {
    static_cast<CollectionHandle&>(out) = collection_handle_from_json(value);
}

inline void from_json(const nlohmann::json& value, ObjectBag& out) {
    static_cast<CollectionHandle&>(out) = collection_handle_from_json(value);
}

template <typename K, typename V>
void from_json(const nlohmann::json& value, Table<K, V>& out) {
    static_cast<CollectionHandle&>(out) = collection_handle_from_json(value);
}

template <typename T>
void from_json(const nlohmann::json& value, TableVec<T>& out) {
    // TableVec wraps its table under `contents`.
    if (value.is_object() && value.contains("contents") && value.at("contents").is_object()) {
        static_cast<CollectionHandle&>(out) = collection_handle_from_json(value.at("contents"));
        return;
    }
    static_cast<CollectionHandle&>(out) = collection_handle_from_json(value);
}

template <typename K, typename V>
void from_json(const nlohmann::json& value, DynamicMap<K, V>& out) {
    static_cast<CollectionHandle&>(out) = collection_handle_from_json(value);
}

template <typename K, typename V>
void from_json(const nlohmann::json& value, DynamicObjectMap<K, V>& out) {
    static_cast<CollectionHandle&>(out) = collection_handle_from_json(value);
}

template <typename K, typename V>
void from_json(const nlohmann::json& value, Map<K, V>& out) {
    if (!value.is_object() || !value.contains("contents")) {
        throw ContentError("Map content has no 'contents'");
    }
    const auto& contents = value.at("contents");
    out.entries.clear();
    if (contents.is_array()) {
        for (const auto& entry : contents) {
            if (!entry.is_object() || !entry.contains("key") || !entry.contains("value")) {
                throw ContentError("Map entry needs key and value");
            }
            out.entries.emplace(entry.at("key").template get<K>(),
                                entry.at("value").template get<V>());
        }
        return;
    }
    if (contents.is_object()) {
        for (auto it = contents.begin(); it != contents.end(); ++it) {
            out.entries.emplace(nlohmann::json(it.key()).template get<K>(),
                                it.value().template get<V>());
        }
        return;
    }
    throw ContentError("Map 'contents' must be an array or object");
}

template <typename T>
void from_json(const nlohmann::json& value, Set<T>& out) {
    if (!value.is_object() || !value.contains("contents")) {
        throw ContentError("Set content has no 'contents'");
    }
    const auto& contents = value.at("contents");
    out.items.clear();
    if (contents.is_array()) {
        for (const auto& item : contents) {
            out.items.push_back(item.template get<T>());
        }
        return;
    }
    if (contents.is_object()) {
        for (auto it = contents.begin(); it != contents.end(); ++it) {
            out.items.push_back(nlohmann::json(it.key()).template get<T>());
        }
        return;
    }
    throw ContentError("Set 'contents' must be an array or object");
}

}  // namespace nexus::crawler
