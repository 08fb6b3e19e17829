#include "crawler/crawler.hpp"

#include <map>
#include "core/logging/logger.hpp"

namespace nexus::crawler {

using core::errors::NexusError;
using core::errors::ErrorCategory;

NexusError metadata_missing(const std::string& field, const codec::Address& id) {
    return NexusError{ErrorCategory::Crawler,
                      "Field '" + field + "' missing for object " + id.to_hex() + ".",
                      "metadata_missing"};
}

Crawler::Crawler(std::shared_ptr<ledger::LedgerClient> ledger) : ledger_(std::move(ledger)) {}

core::errors::Result<nlohmann::json> Crawler::content_json(const ledger::LedgerObject& object) {
    if (!object.content.has_value()) {
        return metadata_missing("json", object.object_id);
    }
    return ledger::ledger_value_to_json(*object.content);
}

core::errors::Result<std::vector<ledger::LedgerObject>> Crawler::fetch_objects(
    const std::vector<codec::Address>& object_ids, const ledger::FieldMask& mask) const {
    if (object_ids.empty()) {
        return std::vector<ledger::LedgerObject>{};
    }

    auto batch = ledger_->batch_get_objects(object_ids, mask);
    if (core::errors::is_error(batch)) {
        return core::errors::get_error(batch);
    }
    auto& found = std::get<std::vector<std::optional<ledger::LedgerObject>>>(batch);
    if (found.size() != object_ids.size()) {
        return NexusError{ErrorCategory::Ledger,
                          "BatchGetObjects returned " + std::to_string(found.size()) +
                              " results for " + std::to_string(object_ids.size()) + " ids.",
                          "rpc"};
    }

    // Results are matched by id, not position.
    std::map<codec::Address, ledger::LedgerObject> by_id;
    for (auto& entry : found) {
        if (entry.has_value()) {
            auto id = entry->object_id;
            by_id.emplace(id, std::move(*entry));
        }
    }

    std::vector<ledger::LedgerObject> out;
    out.reserve(object_ids.size());
    for (const auto& id : object_ids) {
        auto it = by_id.find(id);
        if (it == by_id.end()) {
            return NexusError{ErrorCategory::Crawler, "Object " + id.to_hex() + " not found.",
                              "object_not_found"};
        }
        out.push_back(it->second);
    }
    return out;
}

NexusError duplicate_field_key(const codec::Address& parent, const std::string& key) {
    return NexusError{ErrorCategory::Ledger,
                      "Dynamic field key " + key + " appears twice under " + parent.to_hex() + ".",
                      "parsing"};
}

core::errors::Result<MetadataResponse> Crawler::get_object_metadata(
    const codec::Address& object_id) const {
    auto many = get_objects_metadata({object_id});
    if (core::errors::is_error(many)) {
        return core::errors::get_error(many);
    }
    return core::errors::get_value(many).front();
}

core::errors::Result<std::vector<MetadataResponse>> Crawler::get_objects_metadata(
    const std::vector<codec::Address>& object_ids) const {
    auto objects = fetch_objects(object_ids, ledger::FieldMask::metadata());
    if (core::errors::is_error(objects)) {
        return core::errors::get_error(objects);
    }
    std::vector<MetadataResponse> out;
    for (const auto& object : core::errors::get_value(objects)) {
        out.push_back(MetadataResponse{object.object_id, object.owner, object.version,
                                       object.digest, std::monostate{}, object.balance});
    }
    return out;
}

core::errors::Result<std::vector<ledger::DynamicFieldInfo>> Crawler::list_dynamic_fields(
    const codec::Address& parent, const std::uint64_t expected_size) const {
    std::vector<ledger::DynamicFieldInfo> fields;
    std::optional<std::string> page_token;
    std::size_t pages = 0;
    do {
        auto page = ledger_->list_dynamic_fields(parent, ledger::kDynamicFieldPageSize, page_token);
        if (core::errors::is_error(page)) {
            return core::errors::get_error(page);
        }
        auto& listed = std::get<ledger::DynamicFieldPage>(page);
        for (auto& field : listed.fields) {
            fields.push_back(std::move(field));
        }
        page_token = std::move(listed.next_page_token);
        ++pages;
    } while (page_token.has_value());

    NEXUS_LOG_DEBUG("Crawler: Listed " + std::to_string(fields.size()) +
                    " dynamic fields of " + parent.to_hex() + " in " + std::to_string(pages) +
                    " page(s)");

    if (fields.size() != expected_size) {
        NexusError error{ErrorCategory::Crawler,
                         "Dynamic field count mismatch: expected " +
                             std::to_string(expected_size) + ", got " +
                             std::to_string(fields.size()) + ".",
                         "dynamic_field_size_mismatch"};
        error.hint = "expected=" + std::to_string(expected_size) +
                     " got=" + std::to_string(fields.size());
        return error;
    }
    return fields;
}

}  // namespace nexus::crawler
