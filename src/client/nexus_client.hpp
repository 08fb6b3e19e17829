#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "client/gas_coin_pool.hpp"
#include "client/signer.hpp"
#include "core/config/client_config.hpp"
#include "core/errors/nexus_errors.hpp"
#include "crawler/crawler.hpp"
#include "events/decoder.hpp"
#include "ledger/backoff.hpp"
#include "ledger/ledger_client.hpp"
#include "ledger/ledger_types.hpp"
#include "transactions/transaction_builder.hpp"

namespace nexus::client {

using CancelToken = std::shared_ptr<std::atomic_bool>;

// A transaction that executed successfully and made it into a checkpoint.
struct SubmittedTransaction {
    std::string digest;
    std::uint64_t checkpoint = 0;
    ledger::TransactionEffects effects;
    std::vector<ledger::LedgerEvent> events;
};

// First created object whose type is `<any>::module::name`. With
// `type_param`, the first type parameter must be a struct of that name
// (CloneableOwnerCap<...::OverTool>).
std::optional<ledger::ChangedObject> find_created_object(const SubmittedTransaction& tx,
                                                          const std::string& module,
                                                          const std::string& name,
                                                          const std::string& type_param = "");

class WorkflowActions;
class SchedulerActions;
class ToolActions;
class GasActions;
class NetworkAuthActions;

class NexusClient {
public:
    const core::config::ClientConfig& config() const { return config_; }
    const types::NexusObjects& objects() const { return config_.nexus_objects; }
    codec::Address sender() const { return signer_->address(); }
    std::uint64_t reference_gas_price() const { return reference_gas_price_; }
    GasCoinPool& gas_coins() { return *gas_coins_; }
    const crawler::Crawler& crawler() const { return crawler_; }

    // Shared objects resolve to their initial shared version; anything else
    // is Ledger/configuration.
    core::errors::Result<ledger::ObjectRef> shared_object_ref(const codec::Address& id) const;
    // Current ref of an address-owned object.
    core::errors::Result<ledger::ObjectRef> owned_object_ref(const codec::Address& id) const;

    // Sets sender, budget, price and a leased gas coin, signs, executes and
    // waits for checkpoint inclusion. The coin returns to the pool on every
    // path, at its post-execution version when the ledger reports one.
    core::errors::Result<SubmittedTransaction> submit(const transactions::TransactionBuilder& tx,
                                                      const CancelToken& cancel_token = nullptr);
    // Same, paying `gas_price` per unit. Prices below the reference price
    // are a configuration error.
    core::errors::Result<SubmittedTransaction> submit_at_price(
        const transactions::TransactionBuilder& tx, std::uint64_t gas_price,
        const CancelToken& cancel_token = nullptr);

    // Nexus events of a submitted transaction; events from other packages
    // are skipped, malformed Nexus events fail.
    core::errors::Result<std::vector<events::NexusEvent>> nexus_events(
        const SubmittedTransaction& tx) const;

    WorkflowActions workflow();
    SchedulerActions scheduler();
    ToolActions tools();
    GasActions gas();
    NetworkAuthActions network_auth();

private:
    friend class NexusClientBuilder;
    NexusClient(core::config::ClientConfig config, std::shared_ptr<ledger::LedgerClient> ledger,
                std::shared_ptr<TransactionSigner> signer, std::uint64_t reference_gas_price,
                ledger::Sleeper sleeper);

    core::errors::Result<std::uint64_t> await_checkpoint(const std::string& digest,
                                                         const CancelToken& cancel_token);

    core::config::ClientConfig config_;
    std::shared_ptr<ledger::LedgerClient> ledger_;
    std::shared_ptr<TransactionSigner> signer_;
    std::unique_ptr<GasCoinPool> gas_coins_;
    crawler::Crawler crawler_;
    std::uint64_t reference_gas_price_ = 0;
    ledger::Sleeper sleeper_;
};

using OwnedObjectCompose =
    std::function<void(transactions::TransactionBuilder&, const ledger::ObjectRef&)>;

// Resolves an owned object (usually a capability), composes around it and
// submits. Returns the transaction digest.
core::errors::Result<std::string> submit_with_owned_object(NexusClient& client,
                                                           const codec::Address& object_id,
                                                           const OwnedObjectCompose& compose,
                                                           const CancelToken& cancel_token);

class NexusClientBuilder {
public:
    explicit NexusClientBuilder(core::config::ClientConfig config);

    NexusClientBuilder& with_ledger(std::shared_ptr<ledger::LedgerClient> ledger);
    NexusClientBuilder& with_signer(std::shared_ptr<TransactionSigner> signer);
    // Wraps reads in a RetryingLedgerClient using the configured read_retry.
    NexusClientBuilder& with_read_retries(bool enabled);
    // Replaces the thread sleeper used for confirmation backoff.
    NexusClientBuilder& with_sleeper(ledger::Sleeper sleeper);

    // Validates the configuration and fetches the reference gas price.
    // Failures are Ledger/configuration unless the ledger itself fails.
    core::errors::Result<std::unique_ptr<NexusClient>> build();

private:
    core::config::ClientConfig config_;
    std::shared_ptr<ledger::LedgerClient> ledger_;
    std::shared_ptr<TransactionSigner> signer_;
    bool read_retries_ = true;
    ledger::Sleeper sleeper_;
};

}  // namespace nexus::client
