#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "codec/address.hpp"
#include "codec/bytes.hpp"
#include "core/errors/nexus_errors.hpp"
#include "ledger/ledger_types.hpp"

namespace nexus::ledger {

inline constexpr std::uint32_t kDynamicFieldPageSize = 1000;

// The ledger RPC surface the SDK consumes. Transport failures are reported
// as Ledger/rpc errors; the concrete gRPC channel lives outside this library.
class LedgerClient {
public:
    virtual ~LedgerClient() = default;

    virtual core::errors::Result<LedgerObject> get_object(const codec::Address& object_id,
                                                          const FieldMask& mask) = 0;

    // Same order as `object_ids`; nullopt where the object does not exist.
    virtual core::errors::Result<std::vector<std::optional<LedgerObject>>> batch_get_objects(
        const std::vector<codec::Address>& object_ids, const FieldMask& mask) = 0;

    virtual core::errors::Result<EpochInfo> get_epoch() = 0;

    virtual core::errors::Result<DynamicFieldPage> list_dynamic_fields(
        const codec::Address& parent, std::uint32_t page_size,
        const std::optional<std::string>& page_token) = 0;

    // `transaction` is the BCS TransactionData; signatures are base64
    // serialized signatures.
    virtual core::errors::Result<ExecutedTransaction> execute_transaction(
        const codec::Bytes& transaction, const std::vector<std::string>& signatures) = 0;

    // Checkpoint sequence that includes the transaction, once there is one.
    virtual core::errors::Result<std::optional<std::uint64_t>> get_transaction_checkpoint(
        const std::string& digest) = 0;

    virtual core::errors::Result<EventPage> query_events(const std::optional<std::string>& cursor,
                                                         std::uint32_t limit) = 0;
};

}  // namespace nexus::ledger
