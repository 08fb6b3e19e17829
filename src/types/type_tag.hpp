#pragma once

#include <memory>
#include <string>
#include <vector>
#include "codec/address.hpp"
#include "core/errors/nexus_errors.hpp"

namespace nexus::types {

struct TypeTag;

// `0x<addr>::<module>::<Name><T1, T2, ...>`
struct StructTag {
    codec::Address address;
    std::string module;
    std::string name;
    std::vector<TypeTag> type_params;
};

struct TypeTag {
    enum class Kind { Bool, U8, U16, U32, U64, U128, U256, Address, Signer, Vector, Struct };

    Kind kind = Kind::Bool;
    // Set for Vector.
    std::shared_ptr<TypeTag> element;
    // Set for Struct.
    std::shared_ptr<StructTag> struct_tag;

    static TypeTag primitive(Kind kind);
    static TypeTag vector_of(TypeTag element);
    static TypeTag of_struct(StructTag tag);

    bool is_struct() const { return kind == Kind::Struct && struct_tag != nullptr; }
};

bool operator==(const StructTag& lhs, const StructTag& rhs);
bool operator==(const TypeTag& lhs, const TypeTag& rhs);
inline bool operator!=(const TypeTag& lhs, const TypeTag& rhs) { return !(lhs == rhs); }

// Parses the ledger's textual type representation. Failures are
// malformed_payload; a valid non-struct tag given to parse_struct_tag is
// not_a_struct.
core::errors::Result<TypeTag> parse_type_tag(const std::string& text);
core::errors::Result<StructTag> parse_struct_tag(const std::string& text);

std::string to_string(const TypeTag& tag);
std::string to_string(const StructTag& tag);

}  // namespace nexus::types
