#include "transactions/transaction_builder.hpp"

#include <limits>
#include <utility>
#include "codec/base58.hpp"
#include "codec/bcs.hpp"
#include "codec/hex.hpp"

namespace nexus::transactions {

using core::errors::NexusError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr std::size_t kMaxArgumentIndex = std::numeric_limits<std::uint16_t>::max();

void write_type_tag(codec::BcsWriter& writer, const types::TypeTag& tag);

void write_struct_tag(codec::BcsWriter& writer, const types::StructTag& tag) {
    writer.address(tag.address);
    writer.string(tag.module);
    writer.string(tag.name);
    writer.uleb128(tag.type_params.size());
    for (const auto& param : tag.type_params) {
        write_type_tag(writer, param);
    }
}

void write_type_tag(codec::BcsWriter& writer, const types::TypeTag& tag) {
    using Kind = types::TypeTag::Kind;
    switch (tag.kind) {
        case Kind::Bool:    writer.uleb128(0); return;
        case Kind::U8:      writer.uleb128(1); return;
        case Kind::U64:     writer.uleb128(2); return;
        case Kind::U128:    writer.uleb128(3); return;
        case Kind::Address: writer.uleb128(4); return;
        case Kind::Signer:  writer.uleb128(5); return;
        case Kind::Vector:
            writer.uleb128(6);
            write_type_tag(writer, *tag.element);
            return;
        case Kind::Struct:
            writer.uleb128(7);
            write_struct_tag(writer, *tag.struct_tag);
            return;
        case Kind::U16:     writer.uleb128(8); return;
        case Kind::U32:     writer.uleb128(9); return;
        case Kind::U256:    writer.uleb128(10); return;
    }
}

void write_argument(codec::BcsWriter& writer, const Argument& argument) {
    switch (argument.kind) {
        case Argument::Kind::GasCoin:
            writer.uleb128(0);
            return;
        case Argument::Kind::Input:
            writer.uleb128(1).u16(argument.index);
            return;
        case Argument::Kind::Result:
            writer.uleb128(2).u16(argument.index);
            return;
        case Argument::Kind::NestedResult:
            writer.uleb128(3).u16(argument.index).u16(argument.sub_index);
            return;
    }
}

void write_arguments(codec::BcsWriter& writer, const std::vector<Argument>& arguments) {
    writer.uleb128(arguments.size());
    for (const auto& argument : arguments) {
        write_argument(writer, argument);
    }
}

core::errors::Status write_object_ref(codec::BcsWriter& writer, const ledger::ObjectRef& ref) {
    auto digest = codec::decode_digest(ref.digest);
    if (core::errors::is_error(digest)) {
        return NexusError{ErrorCategory::Ledger,
                          "Object " + ref.object_id.to_hex() + " has an invalid digest: " +
                              core::errors::get_error(digest).message,
                          "transaction_building"};
    }
    writer.address(ref.object_id);
    writer.u64(ref.version);
    writer.byte_vector(core::errors::get_value(digest));
    return core::errors::ok();
}

core::errors::Status write_call_arg(codec::BcsWriter& writer, const CallArg& arg) {
    switch (arg.kind) {
        case CallArg::Kind::Pure:
            writer.uleb128(0);
            writer.byte_vector(arg.pure);
            return core::errors::ok();
        case CallArg::Kind::OwnedObject:
            writer.uleb128(1).uleb128(0);
            return write_object_ref(writer, arg.object);
        case CallArg::Kind::SharedObject:
            writer.uleb128(1).uleb128(1);
            writer.address(arg.shared.object_id);
            writer.u64(arg.shared.initial_shared_version);
            writer.boolean(arg.shared.is_mutable);
            return core::errors::ok();
    }
    return core::errors::ok();
}

struct CommandWriter {
    codec::BcsWriter& writer;

    void operator()(const MoveCall& call) const {
        writer.uleb128(0);
        writer.address(call.package);
        writer.string(call.module);
        writer.string(call.function);
        writer.uleb128(call.type_arguments.size());
        for (const auto& tag : call.type_arguments) {
            write_type_tag(writer, tag);
        }
        write_arguments(writer, call.arguments);
    }
    void operator()(const TransferObjects& transfer) const {
        writer.uleb128(1);
        write_arguments(writer, transfer.objects);
        write_argument(writer, transfer.recipient);
    }
    void operator()(const SplitCoins& split) const {
        writer.uleb128(2);
        write_argument(writer, split.coin);
        write_arguments(writer, split.amounts);
    }
    void operator()(const MakeMoveVec& make) const {
        writer.uleb128(5);
        if (make.element_type.has_value()) {
            writer.u8(1);
            write_type_tag(writer, *make.element_type);
        } else {
            writer.u8(0);
        }
        write_arguments(writer, make.elements);
    }
};

json arguments_json(const std::vector<Argument>& arguments) {
    json out = json::array();
    for (const auto& argument : arguments) {
        out.push_back(to_json(argument));
    }
    return out;
}

struct CommandJson {
    json operator()(const MoveCall& call) const {
        json type_arguments = json::array();
        for (const auto& tag : call.type_arguments) {
            type_arguments.push_back(types::to_string(tag));
        }
        return json{{"MoveCall",
                     {{"package", call.package.to_hex()},
                      {"module", call.module},
                      {"function", call.function},
                      {"type_arguments", type_arguments},
                      {"arguments", arguments_json(call.arguments)}}}};
    }
    json operator()(const TransferObjects& transfer) const {
        return json{{"TransferObjects",
                     {{"objects", arguments_json(transfer.objects)},
                      {"recipient", to_json(transfer.recipient)}}}};
    }
    json operator()(const SplitCoins& split) const {
        return json{{"SplitCoins",
                     {{"coin", to_json(split.coin)}, {"amounts", arguments_json(split.amounts)}}}};
    }
    json operator()(const MakeMoveVec& make) const {
        return json{{"MakeMoveVec",
                     {{"type", make.element_type.has_value()
                                   ? json(types::to_string(*make.element_type))
                                   : json(nullptr)},
                      {"elements", arguments_json(make.elements)}}}};
    }
};

}  // namespace

std::size_t ProgrammableTransaction::move_call_count() const {
    std::size_t count = 0;
    for (const auto& command : commands) {
        if (std::holds_alternative<MoveCall>(command)) {
            ++count;
        }
    }
    return count;
}

Argument TransactionBuilder::push_input(CallArg arg) {
    inputs_.push_back(std::move(arg));
    return Argument::input(static_cast<std::uint16_t>(inputs_.size() - 1));
}

Argument TransactionBuilder::push_command(Command command) {
    commands_.push_back(std::move(command));
    return Argument::result(static_cast<std::uint16_t>(commands_.size() - 1));
}

Argument TransactionBuilder::pure(codec::Bytes bcs) {
    CallArg arg;
    arg.kind = CallArg::Kind::Pure;
    arg.pure = std::move(bcs);
    return push_input(std::move(arg));
}

Argument TransactionBuilder::pure_u64(const std::uint64_t value) {
    return pure(codec::bcs_u64(value));
}

Argument TransactionBuilder::pure_bool(const bool value) {
    return pure(codec::bcs_bool(value));
}

Argument TransactionBuilder::pure_string(const std::string& value) {
    return pure(codec::bcs_string(value));
}

Argument TransactionBuilder::pure_address(const codec::Address& value) {
    return pure(codec::bcs_address(value));
}

Argument TransactionBuilder::owned_object(const ledger::ObjectRef& ref) {
    for (std::size_t i = 0; i < inputs_.size(); ++i) {
        const auto& existing = inputs_[i];
        if (existing.kind == CallArg::Kind::OwnedObject &&
            existing.object.object_id == ref.object_id) {
            return Argument::input(static_cast<std::uint16_t>(i));
        }
    }
    CallArg arg;
    arg.kind = CallArg::Kind::OwnedObject;
    arg.object = ref;
    return push_input(std::move(arg));
}

Argument TransactionBuilder::shared_object(const ledger::ObjectRef& ref, const bool is_mutable) {
    return shared_object(SharedObjectInput{ref.object_id, ref.version, is_mutable});
}

Argument TransactionBuilder::shared_object(const SharedObjectInput& input) {
    for (std::size_t i = 0; i < inputs_.size(); ++i) {
        auto& existing = inputs_[i];
        if (existing.kind == CallArg::Kind::SharedObject &&
            existing.shared.object_id == input.object_id) {
            existing.shared.is_mutable = existing.shared.is_mutable || input.is_mutable;
            return Argument::input(static_cast<std::uint16_t>(i));
        }
    }
    CallArg arg;
    arg.kind = CallArg::Kind::SharedObject;
    arg.shared = input;
    return push_input(std::move(arg));
}

Argument TransactionBuilder::move_call(const codec::Address& package, const std::string& module,
                                       const std::string& function,
                                       std::vector<types::TypeTag> type_arguments,
                                       std::vector<Argument> arguments) {
    return push_command(
        MoveCall{package, module, function, std::move(type_arguments), std::move(arguments)});
}

Argument TransactionBuilder::transfer_objects(std::vector<Argument> objects, Argument recipient) {
    return push_command(TransferObjects{std::move(objects), recipient});
}

Argument TransactionBuilder::split_coins(Argument coin, std::vector<Argument> amounts) {
    return push_command(SplitCoins{coin, std::move(amounts)});
}

Argument TransactionBuilder::make_move_vec(std::optional<types::TypeTag> element_type,
                                           std::vector<Argument> elements) {
    return push_command(MakeMoveVec{std::move(element_type), std::move(elements)});
}

core::errors::Result<ProgrammableTransaction> TransactionBuilder::finish() const {
    if (inputs_.size() > kMaxArgumentIndex || commands_.size() > kMaxArgumentIndex) {
        return NexusError{ErrorCategory::Ledger,
                          "Transaction has too many inputs or commands.",
                          "transaction_building"};
    }
    if (commands_.empty()) {
        return NexusError{ErrorCategory::Ledger, "Transaction has no commands.",
                          "transaction_building"};
    }
    return ProgrammableTransaction{inputs_, commands_};
}

json TransactionBuilder::to_json() const {
    json inputs = json::array();
    for (const auto& input : inputs_) {
        switch (input.kind) {
            case CallArg::Kind::Pure:
                inputs.push_back(json{{"Pure", codec::hex_encode(input.pure)}});
                break;
            case CallArg::Kind::OwnedObject:
                inputs.push_back(json{{"Object", ledger::to_json(input.object)}});
                break;
            case CallArg::Kind::SharedObject:
                inputs.push_back(
                    json{{"Shared",
                          {{"object_id", input.shared.object_id.to_hex()},
                           {"initial_shared_version", input.shared.initial_shared_version},
                           {"mutable", input.shared.is_mutable}}}});
                break;
        }
    }
    json commands = json::array();
    for (const auto& command : commands_) {
        commands.push_back(std::visit(CommandJson{}, command));
    }
    return json{{"inputs", inputs}, {"commands", commands}};
}

core::errors::Result<codec::Bytes> transaction_data_to_bcs(const TransactionData& data) {
    codec::BcsWriter writer;
    // TransactionData::V1, TransactionKind::ProgrammableTransaction
    writer.uleb128(0);
    writer.uleb128(0);

    writer.uleb128(data.kind.inputs.size());
    for (const auto& input : data.kind.inputs) {
        auto status = write_call_arg(writer, input);
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }
    }
    writer.uleb128(data.kind.commands.size());
    for (const auto& command : data.kind.commands) {
        std::visit(CommandWriter{writer}, command);
    }

    writer.address(data.sender);
    writer.uleb128(data.gas.payment.size());
    for (const auto& coin : data.gas.payment) {
        auto status = write_object_ref(writer, coin);
        if (core::errors::is_error(status)) {
            return core::errors::get_error(status);
        }
    }
    writer.address(data.gas.owner);
    writer.u64(data.gas.price);
    writer.u64(data.gas.budget);
    // TransactionExpiration::None
    writer.uleb128(0);
    return writer.take();
}

codec::Bytes transaction_intent_message(const codec::Bytes& transaction_bcs) {
    codec::Bytes message{0, 0, 0};
    message.insert(message.end(), transaction_bcs.begin(), transaction_bcs.end());
    return message;
}

json to_json(const Argument& argument) {
    switch (argument.kind) {
        case Argument::Kind::GasCoin:
            return "GasCoin";
        case Argument::Kind::Input:
            return json{{"Input", argument.index}};
        case Argument::Kind::Result:
            return json{{"Result", argument.index}};
        case Argument::Kind::NestedResult:
            return json{{"NestedResult", {argument.index, argument.sub_index}}};
    }
    return nullptr;
}

}  // namespace nexus::transactions
