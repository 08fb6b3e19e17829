#include "client/nexus_client.hpp"

#include <algorithm>
#include <set>
#include <utility>
#include "client/gas_actions.hpp"
#include "client/network_auth_actions.hpp"
#include "client/scheduler_actions.hpp"
#include "client/tool_actions.hpp"
#include "client/workflow_actions.hpp"
#include "core/logging/logger.hpp"
#include "ledger/retrying_ledger_client.hpp"
#include "types/type_tag.hpp"

namespace nexus::client {

using core::errors::NexusError;
using core::errors::ErrorCategory;

namespace {

// Confirmation polling: 100 ms doubling up to 2 s.
const ledger::BackoffPolicy kConfirmationBackoff{0, 100, 2000};

NexusError configuration_error(const std::string& message) {
    return NexusError{ErrorCategory::Ledger, message, "configuration"};
}

std::string short_digest(const std::string& digest) {
    return digest.size() > 12 ? digest.substr(0, 12) : digest;
}

}  // namespace

std::optional<ledger::ChangedObject> find_created_object(const SubmittedTransaction& tx,
                                                          const std::string& module,
                                                          const std::string& name,
                                                          const std::string& type_param) {
    for (const auto& change : tx.effects.changed_objects) {
        if (change.change != ledger::ChangedObject::Change::Created) {
            continue;
        }
        auto tag = types::parse_struct_tag(change.object_type);
        if (core::errors::is_error(tag)) {
            continue;
        }
        const auto& parsed = core::errors::get_value(tag);
        if (parsed.module != module || parsed.name != name) {
            continue;
        }
        if (!type_param.empty() &&
            (parsed.type_params.empty() || !parsed.type_params.front().is_struct() ||
             parsed.type_params.front().struct_tag->name != type_param)) {
            continue;
        }
        return change;
    }
    return std::nullopt;
}

NexusClient::NexusClient(core::config::ClientConfig config,
                         std::shared_ptr<ledger::LedgerClient> ledger,
                         std::shared_ptr<TransactionSigner> signer,
                         const std::uint64_t reference_gas_price, ledger::Sleeper sleeper)
    : config_(std::move(config)),
      ledger_(std::move(ledger)),
      signer_(std::move(signer)),
      gas_coins_(std::make_unique<GasCoinPool>(config_.gas_coins)),
      crawler_(ledger_),
      reference_gas_price_(reference_gas_price),
      sleeper_(std::move(sleeper)) {}

core::errors::Result<ledger::ObjectRef> NexusClient::shared_object_ref(
    const codec::Address& id) const {
    auto metadata = crawler_.get_object_metadata(id);
    if (core::errors::is_error(metadata)) {
        return core::errors::get_error(metadata);
    }
    const auto& object = core::errors::get_value(metadata);
    if (!object.is_shared()) {
        return configuration_error("Object " + id.to_hex() + " is not shared.");
    }
    return object.shared_ref();
}

core::errors::Result<ledger::ObjectRef> NexusClient::owned_object_ref(
    const codec::Address& id) const {
    auto metadata = crawler_.get_object_metadata(id);
    if (core::errors::is_error(metadata)) {
        return core::errors::get_error(metadata);
    }
    const auto& object = core::errors::get_value(metadata);
    if (object.owner.kind != ledger::Owner::Kind::Address) {
        return configuration_error("Object " + id.to_hex() + " is not address-owned.");
    }
    return object.object_ref();
}

core::errors::Result<SubmittedTransaction> NexusClient::submit(
    const transactions::TransactionBuilder& tx, const CancelToken& cancel_token) {
    return submit_at_price(tx, reference_gas_price_, cancel_token);
}

core::errors::Result<SubmittedTransaction> NexusClient::submit_at_price(
    const transactions::TransactionBuilder& tx, const std::uint64_t gas_price,
    const CancelToken& cancel_token) {
    if (gas_price < reference_gas_price_) {
        return configuration_error("Gas price " + std::to_string(gas_price) +
                                   " is below the reference gas price " +
                                   std::to_string(reference_gas_price_) + ".");
    }
    auto programmable = tx.finish();
    if (core::errors::is_error(programmable)) {
        return core::errors::get_error(programmable);
    }

    auto lease_result = gas_coins_->acquire(
        std::chrono::milliseconds(config_.transaction_timeout_ms), cancel_token);
    if (core::errors::is_error(lease_result)) {
        return core::errors::get_error(lease_result);
    }
    auto lease = core::errors::take_value(lease_result);

    const auto sender_address = signer_->address();
    transactions::TransactionData data;
    data.kind = core::errors::take_value(programmable);
    data.sender = sender_address;
    data.gas.payment = {lease.coin()};
    data.gas.owner = sender_address;
    data.gas.price = gas_price;
    data.gas.budget = config_.gas_budget;

    auto bcs = transactions::transaction_data_to_bcs(data);
    if (core::errors::is_error(bcs)) {
        return core::errors::get_error(bcs);
    }
    const auto& transaction_bytes = core::errors::get_value(bcs);

    auto signature = signer_->sign_transaction(transaction_bytes);
    if (core::errors::is_error(signature)) {
        return core::errors::get_error(signature);
    }

    NEXUS_LOG_INFO("NexusClient: submitting transaction (" +
                   std::to_string(data.kind.commands.size()) + " commands, " +
                   std::to_string(data.kind.move_call_count()) + " move calls)");
    auto executed = ledger_->execute_transaction(transaction_bytes,
                                                 {core::errors::get_value(signature)});
    if (core::errors::is_error(executed)) {
        return core::errors::get_error(executed);
    }
    auto response = core::errors::take_value(executed);

    // Failed transactions still consume gas and bump the coin.
    if (response.effects.gas_object.has_value()) {
        lease.update(*response.effects.gas_object);
    }
    if (!response.effects.success) {
        NEXUS_LOG_ERROR("NexusClient: transaction " + short_digest(response.digest) +
                        " failed: " + response.effects.error);
        NexusError error{ErrorCategory::Ledger,
                         "Transaction " + response.digest + " failed: " + response.effects.error,
                         "wallet"};
        error.status_code = response.effects.status_code;
        return error;
    }

    auto checkpoint = await_checkpoint(response.digest, cancel_token);
    if (core::errors::is_error(checkpoint)) {
        return core::errors::get_error(checkpoint);
    }
    NEXUS_LOG_INFO("NexusClient: transaction " + short_digest(response.digest) +
                   " confirmed in checkpoint " +
                   std::to_string(core::errors::get_value(checkpoint)));

    SubmittedTransaction submitted;
    submitted.digest = std::move(response.digest);
    submitted.checkpoint = core::errors::get_value(checkpoint);
    submitted.effects = std::move(response.effects);
    submitted.events = std::move(response.events);
    return submitted;
}

core::errors::Result<std::uint64_t> NexusClient::await_checkpoint(
    const std::string& digest, const CancelToken& cancel_token) {
    const std::uint64_t timeout_ms = config_.transaction_timeout_ms;
    std::uint64_t waited_ms = 0;
    std::uint64_t delay_ms = 0;
    while (true) {
        auto checkpoint = ledger_->get_transaction_checkpoint(digest);
        if (core::errors::is_error(checkpoint)) {
            return core::errors::get_error(checkpoint);
        }
        if (core::errors::get_value(checkpoint).has_value()) {
            return *core::errors::get_value(checkpoint);
        }
        if (waited_ms >= timeout_ms) {
            return NexusError{ErrorCategory::Ledger,
                              "Transaction " + digest + " was not checkpointed within " +
                                  std::to_string(timeout_ms) + "ms.",
                              "timeout"};
        }
        delay_ms = std::min(kConfirmationBackoff.next_delay_ms(delay_ms), timeout_ms - waited_ms);
        NEXUS_LOG_DEBUG("NexusClient: waiting " + std::to_string(delay_ms) +
                        "ms for checkpoint of " + short_digest(digest));
        if (!ledger::sleep_unless_cancelled(sleeper_, std::chrono::milliseconds(delay_ms),
                                            cancel_token)) {
            return NexusError{ErrorCategory::Ledger,
                              "Waiting for transaction " + digest + " was cancelled.",
                              "cancelled"};
        }
        waited_ms += delay_ms;
    }
}

core::errors::Result<std::vector<events::NexusEvent>> NexusClient::nexus_events(
    const SubmittedTransaction& tx) const {
    std::vector<events::NexusEvent> out;
    for (const auto& event : tx.events) {
        auto decoded = events::decode_event(event, &config_.nexus_objects);
        if (core::errors::is_error(decoded)) {
            if (core::errors::get_error(decoded).code == "not_nexus_event") {
                continue;
            }
            return core::errors::get_error(decoded);
        }
        out.push_back(core::errors::take_value(decoded));
    }
    return out;
}

WorkflowActions NexusClient::workflow() {
    return WorkflowActions(*this);
}

SchedulerActions NexusClient::scheduler() {
    return SchedulerActions(*this);
}

ToolActions NexusClient::tools() {
    return ToolActions(*this);
}

GasActions NexusClient::gas() {
    return GasActions(*this);
}

NetworkAuthActions NexusClient::network_auth() {
    return NetworkAuthActions(*this);
}

core::errors::Result<std::string> submit_with_owned_object(NexusClient& client,
                                                           const codec::Address& object_id,
                                                           const OwnedObjectCompose& compose,
                                                           const CancelToken& cancel_token) {
    auto object = client.owned_object_ref(object_id);
    if (core::errors::is_error(object)) {
        return core::errors::get_error(object);
    }
    transactions::TransactionBuilder tx;
    compose(tx, core::errors::get_value(object));
    auto submitted = client.submit(tx, cancel_token);
    if (core::errors::is_error(submitted)) {
        return core::errors::get_error(submitted);
    }
    return core::errors::get_value(submitted).digest;
}

NexusClientBuilder::NexusClientBuilder(core::config::ClientConfig config)
    : config_(std::move(config)), sleeper_(ledger::thread_sleeper()) {}

NexusClientBuilder& NexusClientBuilder::with_ledger(std::shared_ptr<ledger::LedgerClient> ledger) {
    ledger_ = std::move(ledger);
    return *this;
}

NexusClientBuilder& NexusClientBuilder::with_signer(std::shared_ptr<TransactionSigner> signer) {
    signer_ = std::move(signer);
    return *this;
}

NexusClientBuilder& NexusClientBuilder::with_read_retries(const bool enabled) {
    read_retries_ = enabled;
    return *this;
}

NexusClientBuilder& NexusClientBuilder::with_sleeper(ledger::Sleeper sleeper) {
    sleeper_ = std::move(sleeper);
    return *this;
}

core::errors::Result<std::unique_ptr<NexusClient>> NexusClientBuilder::build() {
    if (!signer_) {
        return configuration_error("No transaction signer configured.");
    }
    if (!ledger_) {
        return configuration_error("No ledger client configured.");
    }
    if (config_.gas_coins.empty()) {
        return configuration_error("At least one gas coin is required.");
    }
    std::set<codec::Address> coin_ids;
    for (const auto& coin : config_.gas_coins) {
        if (!coin_ids.insert(coin.object_id).second) {
            return configuration_error("Gas coin " + coin.object_id.to_hex() +
                                       " is listed twice.");
        }
    }
    if (config_.gas_budget == 0) {
        return configuration_error("Gas budget must be greater than zero.");
    }
    const codec::Address unset{};
    if (config_.nexus_objects.workflow_pkg_id == unset ||
        config_.nexus_objects.primitives_pkg_id == unset) {
        return configuration_error("Nexus package ids are not configured.");
    }

    std::shared_ptr<ledger::LedgerClient> ledger = ledger_;
    if (read_retries_) {
        ledger = std::make_shared<ledger::RetryingLedgerClient>(ledger_, config_.read_retry,
                                                                sleeper_);
    }

    auto epoch = ledger->get_epoch();
    if (core::errors::is_error(epoch)) {
        return core::errors::get_error(epoch);
    }
    const auto price = core::errors::get_value(epoch).reference_gas_price;
    NEXUS_LOG_INFO("NexusClient: epoch " + std::to_string(core::errors::get_value(epoch).epoch) +
                   ", reference gas price " + std::to_string(price));

    return std::unique_ptr<NexusClient>(
        new NexusClient(config_, std::move(ledger), signer_, price, sleeper_));
}

}  // namespace nexus::client
