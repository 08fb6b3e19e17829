#include "ledger/retrying_ledger_client.hpp"

#include <utility>
#include "core/logging/logger.hpp"

namespace nexus::ledger {

RetryingLedgerClient::RetryingLedgerClient(std::shared_ptr<LedgerClient> inner,
                                           BackoffPolicy policy, Sleeper sleeper)
    : inner_(std::move(inner)), policy_(policy), sleeper_(std::move(sleeper)) {}

template <typename Call>
auto RetryingLedgerClient::with_retry(const std::string& operation, Call call)
    -> decltype(call()) {
    const std::uint32_t attempts = policy_.max_attempts == 0 ? 1 : policy_.max_attempts;
    std::uint64_t delay_ms = 0;
    for (std::uint32_t attempt = 1;; ++attempt) {
        auto result = call();
        if (!core::errors::is_error(result)) {
            return result;
        }
        const auto& error = core::errors::get_error(result);
        if (error.code != "rpc" || attempt >= attempts) {
            return result;
        }
        delay_ms = policy_.next_delay_ms(delay_ms);
        NEXUS_LOG_WARN("Ledger: " + operation + " failed (attempt " + std::to_string(attempt) +
                       "/" + std::to_string(attempts) + "), retrying in " +
                       std::to_string(delay_ms) + "ms: " + error.message);
        sleeper_(std::chrono::milliseconds(delay_ms));
    }
}

core::errors::Result<LedgerObject> RetryingLedgerClient::get_object(
    const codec::Address& object_id, const FieldMask& mask) {
    return with_retry("GetObject", [&]() { return inner_->get_object(object_id, mask); });
}

core::errors::Result<std::vector<std::optional<LedgerObject>>>
RetryingLedgerClient::batch_get_objects(const std::vector<codec::Address>& object_ids,
                                        const FieldMask& mask) {
    return with_retry("BatchGetObjects",
                      [&]() { return inner_->batch_get_objects(object_ids, mask); });
}

core::errors::Result<EpochInfo> RetryingLedgerClient::get_epoch() {
    return with_retry("GetEpoch", [&]() { return inner_->get_epoch(); });
}

core::errors::Result<DynamicFieldPage> RetryingLedgerClient::list_dynamic_fields(
    const codec::Address& parent, const std::uint32_t page_size,
    const std::optional<std::string>& page_token) {
    return with_retry("ListDynamicFields", [&]() {
        return inner_->list_dynamic_fields(parent, page_size, page_token);
    });
}

core::errors::Result<ExecutedTransaction> RetryingLedgerClient::execute_transaction(
    const codec::Bytes& transaction, const std::vector<std::string>& signatures) {
    return inner_->execute_transaction(transaction, signatures);
}

core::errors::Result<std::optional<std::uint64_t>>
RetryingLedgerClient::get_transaction_checkpoint(const std::string& digest) {
    return with_retry("GetTransaction",
                      [&]() { return inner_->get_transaction_checkpoint(digest); });
}

core::errors::Result<EventPage> RetryingLedgerClient::query_events(
    const std::optional<std::string>& cursor, const std::uint32_t limit) {
    return with_retry("QueryEvents", [&]() { return inner_->query_events(cursor, limit); });
}

}  // namespace nexus::ledger
