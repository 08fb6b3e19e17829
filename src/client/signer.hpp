#pragma once

#include <string>
#include "codec/address.hpp"
#include "codec/bytes.hpp"
#include "core/errors/nexus_errors.hpp"

namespace nexus::client {

// Wallet seam. Implementations hash the intent message of the transaction
// (see transactions::transaction_intent_message) with their key scheme and
// return the serialized signature in base64, as the ledger accepts it.
class TransactionSigner {
public:
    virtual ~TransactionSigner() = default;

    virtual codec::Address address() const = 0;

    // Failures are Ledger/wallet.
    virtual core::errors::Result<std::string> sign_transaction(
        const codec::Bytes& transaction_bcs) = 0;
};

}  // namespace nexus::client
