#include "types/type_tag.hpp"

#include <cctype>
#include <utility>

namespace nexus::types {

using core::errors::NexusError;
using core::errors::ErrorCategory;

namespace {

struct Primitive {
    const char* text;
    TypeTag::Kind kind;
};

constexpr Primitive kPrimitives[] = {
    {"bool", TypeTag::Kind::Bool},     {"u8", TypeTag::Kind::U8},
    {"u16", TypeTag::Kind::U16},       {"u32", TypeTag::Kind::U32},
    {"u64", TypeTag::Kind::U64},       {"u128", TypeTag::Kind::U128},
    {"u256", TypeTag::Kind::U256},     {"address", TypeTag::Kind::Address},
    {"signer", TypeTag::Kind::Signer},
};

NexusError malformed(const std::string& text, const std::string& reason) {
    return NexusError{ErrorCategory::Event, "Invalid type tag '" + text + "': " + reason + ".",
                      "malformed_payload"};
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

// Recursive descent over one type string. Whitespace after commas is
// tolerated since the ledger renders `Foo<A, B>`.
class TypeTagParser {
public:
    explicit TypeTagParser(const std::string& text) : text_(text) {}

    core::errors::Result<TypeTag> parse_all() {
        auto tag = parse_type();
        if (core::errors::is_error(tag)) {
            return tag;
        }
        skip_spaces();
        if (pos_ != text_.size()) {
            return malformed(text_, "trailing characters at offset " + std::to_string(pos_));
        }
        return tag;
    }

private:
    core::errors::Result<TypeTag> parse_type() {
        skip_spaces();
        if (peek_prefix("0x")) {
            auto tag = parse_struct();
            if (core::errors::is_error(tag)) {
                return core::errors::get_error(tag);
            }
            return TypeTag::of_struct(core::errors::take_value(tag));
        }

        const std::string ident = read_ident();
        if (ident.empty()) {
            return malformed(text_, "expected a type at offset " + std::to_string(pos_));
        }
        if (ident == "vector") {
            if (!consume('<')) {
                return malformed(text_, "vector without '<'");
            }
            auto element = parse_type();
            if (core::errors::is_error(element)) {
                return element;
            }
            skip_spaces();
            if (!consume('>')) {
                return malformed(text_, "unterminated vector");
            }
            return TypeTag::vector_of(core::errors::take_value(element));
        }
        for (const auto& primitive : kPrimitives) {
            if (ident == primitive.text) {
                return TypeTag::primitive(primitive.kind);
            }
        }
        return malformed(text_, "unknown type '" + ident + "'");
    }

    core::errors::Result<StructTag> parse_struct() {
        const std::size_t start = pos_;
        pos_ += 2;
        while (pos_ < text_.size() && std::isxdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
            ++pos_;
        }
        auto address = codec::Address::from_hex(text_.substr(start, pos_ - start));
        if (core::errors::is_error(address)) {
            return malformed(text_, "bad address");
        }

        StructTag tag;
        tag.address = core::errors::get_value(address);
        if (!consume_separator()) {
            return malformed(text_, "expected '::' after address");
        }
        tag.module = read_ident();
        if (tag.module.empty() || !consume_separator()) {
            return malformed(text_, "expected module name");
        }
        tag.name = read_ident();
        if (tag.name.empty()) {
            return malformed(text_, "expected struct name");
        }

        if (!consume('<')) {
            return tag;
        }
        while (true) {
            auto param = parse_type();
            if (core::errors::is_error(param)) {
                return core::errors::get_error(param);
            }
            tag.type_params.push_back(core::errors::take_value(param));
            skip_spaces();
            if (consume(',')) {
                continue;
            }
            if (consume('>')) {
                return tag;
            }
            return malformed(text_, "unterminated type parameter list");
        }
    }

    std::string read_ident() {
        const std::size_t start = pos_;
        while (pos_ < text_.size() && is_ident_char(text_[pos_])) {
            ++pos_;
        }
        return text_.substr(start, pos_ - start);
    }

    bool consume(char c) {
        if (pos_ < text_.size() && text_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    bool consume_separator() {
        if (peek_prefix("::")) {
            pos_ += 2;
            return true;
        }
        return false;
    }

    bool peek_prefix(const char* prefix) const {
        return text_.compare(pos_, std::char_traits<char>::length(prefix), prefix) == 0;
    }

    void skip_spaces() {
        while (pos_ < text_.size() && text_[pos_] == ' ') {
            ++pos_;
        }
    }

    const std::string& text_;
    std::size_t pos_ = 0;
};

}  // namespace

TypeTag TypeTag::primitive(const Kind kind) {
    TypeTag tag;
    tag.kind = kind;
    return tag;
}

TypeTag TypeTag::vector_of(TypeTag element) {
    TypeTag tag;
    tag.kind = Kind::Vector;
    tag.element = std::make_shared<TypeTag>(std::move(element));
    return tag;
}

TypeTag TypeTag::of_struct(StructTag struct_tag) {
    TypeTag tag;
    tag.kind = Kind::Struct;
    tag.struct_tag = std::make_shared<StructTag>(std::move(struct_tag));
    return tag;
}

bool operator==(const StructTag& lhs, const StructTag& rhs) {
    return lhs.address == rhs.address && lhs.module == rhs.module && lhs.name == rhs.name &&
           lhs.type_params == rhs.type_params;
}

bool operator==(const TypeTag& lhs, const TypeTag& rhs) {
    if (lhs.kind != rhs.kind) {
        return false;
    }
    if (lhs.kind == TypeTag::Kind::Vector) {
        return lhs.element && rhs.element && *lhs.element == *rhs.element;
    }
    if (lhs.kind == TypeTag::Kind::Struct) {
        return lhs.struct_tag && rhs.struct_tag && *lhs.struct_tag == *rhs.struct_tag;
    }
    return true;
}

core::errors::Result<TypeTag> parse_type_tag(const std::string& text) {
    TypeTagParser parser(text);
    return parser.parse_all();
}

core::errors::Result<StructTag> parse_struct_tag(const std::string& text) {
    auto tag = parse_type_tag(text);
    if (core::errors::is_error(tag)) {
        return core::errors::get_error(tag);
    }
    const TypeTag& parsed = core::errors::get_value(tag);
    if (!parsed.is_struct()) {
        return NexusError{ErrorCategory::Event, "Type '" + text + "' is not a struct.",
                          "not_a_struct"};
    }
    return *parsed.struct_tag;
}

std::string to_string(const TypeTag& tag) {
    switch (tag.kind) {
        case TypeTag::Kind::Vector:
            return "vector<" + (tag.element ? to_string(*tag.element) : std::string()) + ">";
        case TypeTag::Kind::Struct:
            return tag.struct_tag ? to_string(*tag.struct_tag) : std::string();
        default:
            break;
    }
    for (const auto& primitive : kPrimitives) {
        if (primitive.kind == tag.kind) {
            return primitive.text;
        }
    }
    return "";
}

std::string to_string(const StructTag& tag) {
    std::string out = tag.address.to_hex() + "::" + tag.module + "::" + tag.name;
    if (tag.type_params.empty()) {
        return out;
    }
    out += "<";
    for (std::size_t i = 0; i < tag.type_params.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += to_string(tag.type_params[i]);
    }
    out += ">";
    return out;
}

}  // namespace nexus::types
