#include "ledger/ledger_types.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <limits>
#include "codec/stringified.hpp"

namespace nexus::ledger {

using nlohmann::json;

namespace {

json number_to_json(const double number) {
    if (!std::isfinite(number) || std::floor(number) != number) {
        return number;
    }
    if (number >= 0.0 && number < 18446744073709551616.0) {
        return static_cast<std::uint64_t>(number);
    }
    if (number < 0.0 && number >= static_cast<double>(std::numeric_limits<std::int64_t>::min())) {
        return static_cast<std::int64_t>(number);
    }
    return number;
}

}  // namespace

json ledger_value_to_json(const LedgerValue& value) {
    switch (value.kind) {
        case LedgerValue::Kind::Null:
            return nullptr;
        case LedgerValue::Kind::Bool:
            return value.boolean;
        case LedgerValue::Kind::Number:
            return number_to_json(value.number);
        case LedgerValue::Kind::String:
            return value.string;
        case LedgerValue::Kind::List: {
            json out = json::array();
            for (const auto& item : value.list) {
                out.push_back(ledger_value_to_json(item));
            }
            return out;
        }
        case LedgerValue::Kind::Struct: {
            json out = json::object();
            for (const auto& field : value.fields) {
                out[field.name] = ledger_value_to_json(field.value);
            }
            return out;
        }
    }
    return nullptr;
}

LedgerValue ledger_value_from_json(const json& value) {
    LedgerValue out;
    if (value.is_boolean()) {
        out.kind = LedgerValue::Kind::Bool;
        out.boolean = value.get<bool>();
    } else if (value.is_number()) {
        out.kind = LedgerValue::Kind::Number;
        out.number = value.get<double>();
    } else if (value.is_string()) {
        out.kind = LedgerValue::Kind::String;
        out.string = value.get<std::string>();
    } else if (value.is_array()) {
        out.kind = LedgerValue::Kind::List;
        for (const auto& item : value) {
            out.list.push_back(ledger_value_from_json(item));
        }
    } else if (value.is_object()) {
        out.kind = LedgerValue::Kind::Struct;
        for (auto it = value.begin(); it != value.end(); ++it) {
            out.fields.push_back(LedgerField{it.key(), ledger_value_from_json(it.value())});
        }
    }
    return out;
}

core::errors::Result<ObjectRef> object_ref_from_json(const json& value) {
    auto id = codec::read_address(value, "object_id");
    if (core::errors::is_error(id)) {
        return core::errors::get_error(id);
    }
    auto version = codec::read_u64(value, "version");
    if (core::errors::is_error(version)) {
        return core::errors::get_error(version);
    }
    auto digest = codec::read_string(value, "digest");
    if (core::errors::is_error(digest)) {
        return core::errors::get_error(digest);
    }
    return ObjectRef{core::errors::get_value(id), core::errors::get_value(version),
                     core::errors::get_value(digest)};
}

json to_json(const ObjectRef& ref) {
    return json{{"object_id", ref.object_id.to_hex()},
                {"version", codec::u64_to_json(ref.version)},
                {"digest", ref.digest}};
}

bool FieldMask::wants(const std::string& path) const {
    return std::find(paths.begin(), paths.end(), path) != paths.end();
}

FieldMask FieldMask::metadata() {
    return FieldMask{{"object_id", "owner", "version", "digest", "balance"}};
}

FieldMask FieldMask::with_content() {
    return FieldMask{{"object_id", "owner", "version", "digest", "balance", "json"}};
}

}  // namespace nexus::ledger
