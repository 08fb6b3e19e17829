#pragma once

#include <memory>
#include <string>
#include "ledger/backoff.hpp"
#include "ledger/ledger_client.hpp"

namespace nexus::ledger {

// Retries idempotent reads that fail with `rpc` errors. Submissions pass
// straight through and are never retried.
class RetryingLedgerClient : public LedgerClient {
public:
    RetryingLedgerClient(std::shared_ptr<LedgerClient> inner, BackoffPolicy policy = BackoffPolicy{},
                         Sleeper sleeper = thread_sleeper());

    core::errors::Result<LedgerObject> get_object(const codec::Address& object_id,
                                                  const FieldMask& mask) override;
    core::errors::Result<std::vector<std::optional<LedgerObject>>> batch_get_objects(
        const std::vector<codec::Address>& object_ids, const FieldMask& mask) override;
    core::errors::Result<EpochInfo> get_epoch() override;
    core::errors::Result<DynamicFieldPage> list_dynamic_fields(
        const codec::Address& parent, std::uint32_t page_size,
        const std::optional<std::string>& page_token) override;
    core::errors::Result<ExecutedTransaction> execute_transaction(
        const codec::Bytes& transaction, const std::vector<std::string>& signatures) override;
    core::errors::Result<std::optional<std::uint64_t>> get_transaction_checkpoint(
        const std::string& digest) override;
    core::errors::Result<EventPage> query_events(const std::optional<std::string>& cursor,
                                                 std::uint32_t limit) override;

private:
    template <typename Call>
    auto with_retry(const std::string& operation, Call call) -> decltype(call());

    std::shared_ptr<LedgerClient> inner_;
    BackoffPolicy policy_;
    Sleeper sleeper_;
};

}  // namespace nexus::ledger
