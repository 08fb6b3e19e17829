#pragma once

#include <algorithm>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "client/signer.hpp"
#include "codec/address.hpp"
#include "codec/base58.hpp"
#include "core/errors/nexus_errors.hpp"
#include "ledger/ledger_client.hpp"
#include "ledger/ledger_types.hpp"

namespace nexus::testing {

// Valid 32-byte base58 digest derived from a small number.
inline std::string digest_for(std::uint64_t seed) {
    return codec::base58_encode(codec::Bytes(32, static_cast<std::uint8_t>(seed + 1)));
}

inline ledger::ObjectRef object_ref(std::uint64_t id, std::uint64_t version) {
    return ledger::ObjectRef{codec::Address::from_u64(id), version, digest_for(version)};
}

// In-memory ledger for tests. Objects, dynamic fields and transaction
// outcomes are scripted up front; calls are counted.
class MockLedger : public ledger::LedgerClient {
public:
    void put_object(const codec::Address& id, const ledger::Owner& owner, std::uint64_t version,
                    const std::string& type, const nlohmann::json& content) {
        ledger::LedgerObject object;
        object.object_id = id;
        object.owner = owner;
        object.version = version;
        object.digest = digest_for(version);
        object.object_type = type;
        object.content = ledger::ledger_value_from_json(content);
        objects_[id] = object;
    }

    // Adds a Field<K, V> object under `parent` named by `name`.
    void put_dynamic_field(const codec::Address& parent, const codec::Address& field_id,
                           const nlohmann::json& name, const nlohmann::json& value) {
        put_object(field_id, ledger::Owner::object_owner(parent), 1, "0x2::dynamic_field::Field",
                   nlohmann::json{{"id", field_id.to_hex()}, {"name", name}, {"value", value}});
        ledger::DynamicFieldInfo info;
        info.kind = ledger::DynamicFieldInfo::Kind::Field;
        info.name = ledger::ledger_value_from_json(name);
        info.field_id = field_id;
        fields_[parent].push_back(info);
    }

    // Adds a dynamic object field: the listing names `child`, which is stored
    // as its own object.
    void put_dynamic_object_field(const codec::Address& parent, const codec::Address& field_id,
                                  const nlohmann::json& name, const codec::Address& child) {
        ledger::DynamicFieldInfo info;
        info.kind = ledger::DynamicFieldInfo::Kind::Object;
        info.name = ledger::ledger_value_from_json(name);
        info.field_id = field_id;
        info.child_id = child;
        fields_[parent].push_back(info);
    }

    // Batch answers come back in reverse request order.
    void reverse_batches(bool reverse) { reverse_batches_ = reverse; }

    void set_epoch(std::uint64_t epoch, std::uint64_t reference_gas_price) {
        epoch_.epoch = epoch;
        epoch_.reference_gas_price = reference_gas_price;
    }

    // Page size the mock uses regardless of what the caller asks for.
    void set_page_size(std::uint32_t page_size) { page_size_ = page_size; }

    void fail_next_reads(int count) { failing_reads_ = count; }

    // Queued execution outcomes, consumed in order.
    void push_execution(ledger::ExecutedTransaction executed) {
        executions_.push_back(std::move(executed));
    }

    // Checkpoint becomes visible after `polls_before` empty answers; nullopt
    // never checkpoints.
    void set_checkpoint(const std::string& digest, std::optional<std::uint64_t> checkpoint,
                        int polls_before = 0) {
        checkpoints_[digest] = PendingCheckpoint{checkpoint, polls_before};
    }

    core::errors::Result<ledger::LedgerObject> get_object(const codec::Address& object_id,
                                                          const ledger::FieldMask& mask) override {
        auto many = batch_get_objects({object_id}, mask);
        if (core::errors::is_error(many)) {
            return core::errors::get_error(many);
        }
        const auto& found = core::errors::get_value(many).front();
        if (!found.has_value()) {
            return core::errors::NexusError{core::errors::ErrorCategory::Ledger,
                                            "Object not found.", "rpc"};
        }
        return *found;
    }

    core::errors::Result<std::vector<std::optional<ledger::LedgerObject>>> batch_get_objects(
        const std::vector<codec::Address>& object_ids, const ledger::FieldMask& mask) override {
        ++batch_calls;
        if (failing_reads_ > 0) {
            --failing_reads_;
            return rpc_unavailable();
        }
        std::vector<std::optional<ledger::LedgerObject>> out;
        for (const auto& id : object_ids) {
            auto it = objects_.find(id);
            if (it == objects_.end()) {
                out.push_back(std::nullopt);
                continue;
            }
            auto object = it->second;
            if (!mask.wants("json")) {
                object.content.reset();
            }
            out.push_back(std::move(object));
        }
        if (reverse_batches_) {
            std::reverse(out.begin(), out.end());
        }
        return out;
    }

    core::errors::Result<ledger::EpochInfo> get_epoch() override {
        ++epoch_calls;
        if (failing_reads_ > 0) {
            --failing_reads_;
            return rpc_unavailable();
        }
        return epoch_;
    }

    core::errors::Result<ledger::DynamicFieldPage> list_dynamic_fields(
        const codec::Address& parent, std::uint32_t page_size,
        const std::optional<std::string>& page_token) override {
        ++list_calls;
        const std::uint32_t size = page_size_ > 0 ? page_size_ : page_size;
        const auto& all = fields_[parent];
        const std::size_t start = page_token.has_value() ? std::stoul(*page_token) : 0;
        ledger::DynamicFieldPage page;
        for (std::size_t i = start; i < all.size() && i < start + size; ++i) {
            page.fields.push_back(all[i]);
        }
        if (start + size < all.size()) {
            page.next_page_token = std::to_string(start + size);
        }
        return page;
    }

    core::errors::Result<ledger::ExecutedTransaction> execute_transaction(
        const codec::Bytes& transaction, const std::vector<std::string>& signatures) override {
        executed_transactions.push_back(transaction);
        executed_signatures.push_back(signatures);
        if (executions_.empty()) {
            return core::errors::NexusError{core::errors::ErrorCategory::Ledger,
                                            "No scripted execution.", "rpc"};
        }
        auto next = std::move(executions_.front());
        executions_.pop_front();
        return next;
    }

    core::errors::Result<std::optional<std::uint64_t>> get_transaction_checkpoint(
        const std::string& digest) override {
        ++checkpoint_polls;
        auto it = checkpoints_.find(digest);
        if (it == checkpoints_.end()) {
            return std::optional<std::uint64_t>{};
        }
        if (it->second.polls_before > 0) {
            --it->second.polls_before;
            return std::optional<std::uint64_t>{};
        }
        return it->second.checkpoint;
    }

    core::errors::Result<ledger::EventPage> query_events(const std::optional<std::string>& cursor,
                                                         std::uint32_t limit) override {
        const std::size_t start = cursor.has_value() ? std::stoul(*cursor) : 0;
        ledger::EventPage page;
        for (std::size_t i = start; i < events.size() && i < start + limit; ++i) {
            page.events.push_back(events[i]);
        }
        page.next_cursor = std::to_string(std::min(events.size(), start + limit));
        return page;
    }

    std::vector<ledger::LedgerEvent> events;
    std::vector<codec::Bytes> executed_transactions;
    std::vector<std::vector<std::string>> executed_signatures;
    int batch_calls = 0;
    int epoch_calls = 0;
    int list_calls = 0;
    int checkpoint_polls = 0;

private:
    struct PendingCheckpoint {
        std::optional<std::uint64_t> checkpoint;
        int polls_before = 0;
    };

    static core::errors::NexusError rpc_unavailable() {
        core::errors::NexusError error{core::errors::ErrorCategory::Ledger, "Unavailable.", "rpc"};
        error.hint = "transient";
        return error;
    }

    std::map<codec::Address, ledger::LedgerObject> objects_;
    std::map<codec::Address, std::vector<ledger::DynamicFieldInfo>> fields_;
    std::map<std::string, PendingCheckpoint> checkpoints_;
    std::deque<ledger::ExecutedTransaction> executions_;
    ledger::EpochInfo epoch_{1, 1000, std::nullopt};
    std::uint32_t page_size_ = 0;
    int failing_reads_ = 0;
    bool reverse_batches_ = false;
};

// Signs nothing; returns a fixed signature and records what it was given.
class FakeSigner : public client::TransactionSigner {
public:
    explicit FakeSigner(codec::Address address) : address_(address) {}

    codec::Address address() const override { return address_; }

    core::errors::Result<std::string> sign_transaction(const codec::Bytes& transaction_bcs) override {
        signed_count++;
        if (fail) {
            return core::errors::NexusError{core::errors::ErrorCategory::Ledger,
                                            "Wallet is locked.", "wallet"};
        }
        last_signed = transaction_bcs;
        return std::string("c2lnbmF0dXJl");
    }

    bool fail = false;
    int signed_count = 0;
    codec::Bytes last_signed;

private:
    codec::Address address_;
};

}  // namespace nexus::testing
