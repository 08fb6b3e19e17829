#include "transactions/idents.hpp"

#include <utility>

namespace nexus::transactions {

types::TypeTag struct_type(const codec::Address& package, const MoveIdent ident,
                           std::vector<types::TypeTag> type_params) {
    return types::TypeTag::of_struct(
        types::StructTag{package, ident.module, ident.name, std::move(type_params)});
}

std::string type_name_string(const codec::Address& package, const MoveIdent ident) {
    return package.to_hex().substr(2) + "::" + ident.module + "::" + ident.name;
}

Argument call(TransactionBuilder& tx, const codec::Address& package, const MoveIdent ident,
              std::vector<Argument> arguments, std::vector<types::TypeTag> type_arguments) {
    return tx.move_call(package, ident.module, ident.name, std::move(type_arguments),
                        std::move(arguments));
}

Argument clock_input(TransactionBuilder& tx) {
    return tx.shared_object(SharedObjectInput{codec::clock_object_id(), 1, false});
}

Argument shared_input(TransactionBuilder& tx, const ledger::ObjectRef& ref, const bool is_mutable) {
    return tx.shared_object(ref, is_mutable);
}

Argument share_object(TransactionBuilder& tx, const Argument object, types::TypeTag type) {
    return call(tx, codec::framework_address(), idents::framework::kPublicShareObject, {object},
                {std::move(type)});
}

Argument public_transfer(TransactionBuilder& tx, const Argument object, types::TypeTag type,
                         const codec::Address& recipient) {
    const auto to = tx.pure_address(recipient);
    return call(tx, codec::framework_address(), idents::framework::kPublicTransfer, {object, to},
                {std::move(type)});
}

types::TypeTag cloneable_owner_cap_type(const codec::Address& primitives_pkg,
                                        const codec::Address& workflow_pkg, const MoveIdent over) {
    return struct_type(primitives_pkg, idents::primitives::kCloneableOwnerCap,
                       {struct_type(workflow_pkg, over)});
}

}  // namespace nexus::transactions
