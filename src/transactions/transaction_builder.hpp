#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include <nlohmann/json.hpp>
#include "codec/address.hpp"
#include "codec/bytes.hpp"
#include "core/errors/nexus_errors.hpp"
#include "ledger/ledger_types.hpp"
#include "types/type_tag.hpp"

namespace nexus::transactions {

// Handle to a value inside a programmable transaction.
struct Argument {
    enum class Kind { GasCoin, Input, Result, NestedResult };

    Kind kind = Kind::GasCoin;
    std::uint16_t index = 0;
    std::uint16_t sub_index = 0;

    static Argument gas_coin() { return Argument{Kind::GasCoin, 0, 0}; }
    static Argument input(std::uint16_t index) { return Argument{Kind::Input, index, 0}; }
    static Argument result(std::uint16_t index) { return Argument{Kind::Result, index, 0}; }
    static Argument nested(std::uint16_t index, std::uint16_t sub_index) {
        return Argument{Kind::NestedResult, index, sub_index};
    }

    // Element `position` of a multi-value call result.
    Argument nested_result(std::uint16_t position) const { return nested(index, position); }

    bool operator==(const Argument& other) const {
        return kind == other.kind && index == other.index && sub_index == other.sub_index;
    }
};

struct SharedObjectInput {
    codec::Address object_id;
    std::uint64_t initial_shared_version = 0;
    bool is_mutable = false;
};

// Pure bytes, an owned/immutable object ref, or a shared object.
struct CallArg {
    enum class Kind { Pure, OwnedObject, SharedObject };

    Kind kind = Kind::Pure;
    codec::Bytes pure;
    ledger::ObjectRef object;
    SharedObjectInput shared;
};

struct MoveCall {
    codec::Address package;
    std::string module;
    std::string function;
    std::vector<types::TypeTag> type_arguments;
    std::vector<Argument> arguments;
};

struct TransferObjects {
    std::vector<Argument> objects;
    Argument recipient;
};

struct SplitCoins {
    Argument coin;
    std::vector<Argument> amounts;
};

struct MakeMoveVec {
    std::optional<types::TypeTag> element_type;
    std::vector<Argument> elements;
};

using Command = std::variant<MoveCall, TransferObjects, SplitCoins, MakeMoveVec>;

struct ProgrammableTransaction {
    std::vector<CallArg> inputs;
    std::vector<Command> commands;

    std::size_t move_call_count() const;
};

struct GasData {
    std::vector<ledger::ObjectRef> payment;
    codec::Address owner;
    std::uint64_t price = 0;
    std::uint64_t budget = 0;
};

struct TransactionData {
    ProgrammableTransaction kind;
    codec::Address sender;
    GasData gas;
};

// Assembles one programmable transaction. Object inputs are deduplicated by
// id; requesting a shared object mutably upgrades an earlier immutable use.
class TransactionBuilder {
public:
    Argument pure(codec::Bytes bcs);
    Argument pure_u64(std::uint64_t value);
    Argument pure_bool(bool value);
    Argument pure_string(const std::string& value);
    Argument pure_address(const codec::Address& value);

    Argument owned_object(const ledger::ObjectRef& ref);
    // `ref.version` is the initial shared version.
    Argument shared_object(const ledger::ObjectRef& ref, bool is_mutable);
    Argument shared_object(const SharedObjectInput& input);

    Argument move_call(const codec::Address& package, const std::string& module,
                       const std::string& function, std::vector<types::TypeTag> type_arguments,
                       std::vector<Argument> arguments);
    Argument transfer_objects(std::vector<Argument> objects, Argument recipient);
    Argument split_coins(Argument coin, std::vector<Argument> amounts);
    Argument make_move_vec(std::optional<types::TypeTag> element_type,
                           std::vector<Argument> elements);

    const std::vector<CallArg>& inputs() const { return inputs_; }
    const std::vector<Command>& commands() const { return commands_; }

    // Fails with transaction_building when input or command counts exceed
    // the u16 argument space.
    core::errors::Result<ProgrammableTransaction> finish() const;

    // Dry-run rendering of inputs and commands.
    nlohmann::json to_json() const;

private:
    Argument push_input(CallArg arg);
    Argument push_command(Command command);

    std::vector<CallArg> inputs_;
    std::vector<Command> commands_;
};

// Canonical binary form submitted to the ledger and signed with intent
// prefix [0, 0, 0]. Fails when an object digest is not valid base58.
core::errors::Result<codec::Bytes> transaction_data_to_bcs(const TransactionData& data);

// Intent-prefixed message a signer hashes.
codec::Bytes transaction_intent_message(const codec::Bytes& transaction_bcs);

nlohmann::json to_json(const Argument& argument);

}  // namespace nexus::transactions
