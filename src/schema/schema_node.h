/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "schema_byte_cursor.h"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

namespace binstruct::schema {

enum class ScalarType : std::uint8_t {
    Int8,
    Uint8,
    Int16,
    Uint16,
    Int32,
    Uint32,
    Float32,
    Float64,
};

std::size_t scalar_size(ScalarType type);
bool is_float_type(ScalarType type);
bool is_signed_type(ScalarType type);
std::string_view scalar_name(ScalarType type);
std::optional<ScalarType> try_parse_scalar_type(std::string_view name);

struct SchemaNode;
using NodePtr = std::shared_ptr<const SchemaNode>;

using ScalarRef = std::variant<std::int64_t, double>;

struct ScalarNode {
    ScalarType type = ScalarType::Uint8;
    Endian endian = Endian::Big;
    std::size_t padded_to = 0;
    std::optional<ScalarRef> ref;
    bool negate = false;

    std::size_t width() const { return std::max(scalar_size(type), padded_to); }
};

struct FixedStringNode {
    std::size_t padded_to = 0;
    std::optional<std::string> ref;
    bool negate = false;
};

struct CStringNode {
    // 0 means unbounded: read up to and including the terminator.
    std::size_t padded_to = 0;
    std::optional<std::string> ref;
    bool negate = false;
};

struct LengthTerm {
    char op = '+';
    std::variant<std::int64_t, std::string> operand;
};

struct LengthSpec {
    enum class Kind : std::uint8_t {
        Literal,
        Remainder,
        Expression,
        Field,
        FromEnd,
    };

    Kind kind = Kind::Literal;
    // Literal count, or the (negative) adjustment for FromEnd.
    std::int64_t value = 0;
    std::string field;
    std::vector<LengthTerm> terms;
};

struct ArrayNode {
    NodePtr element;
    LengthSpec length;
};

struct BranchNode {
    std::vector<NodePtr> alternatives;
};

struct StructField {
    std::string name;
    NodePtr node;
};

struct StructNode {
    std::vector<StructField> fields;

    const StructField* find(std::string_view name) const;
};

struct SchemaNode {
    using Variant =
        std::variant<ScalarNode, FixedStringNode, CStringNode, ArrayNode, BranchNode, StructNode>;

    Variant value;

    template <typename T>
    bool is() const {
        return std::holds_alternative<T>(value);
    }

    template <typename T>
    const T& as() const {
        return std::get<T>(value);
    }

    template <typename T>
    const T* get_if() const {
        return std::get_if<T>(&value);
    }
};

template <typename T>
NodePtr make_node(T node) {
    return std::make_shared<const SchemaNode>(SchemaNode{SchemaNode::Variant(std::move(node))});
}

// Parses a leaf tag: base[le][:paddedTo][=ref[!]], base[le][:paddedTo]!=ref,
// string:paddedTo[=ref] and cstring[:paddedTo][=ref]. Throws SchemaError.
SchemaNode parse_tag(std::string_view tag);

// Non-throwing parse_tag; nullopt when `tag` is not a leaf tag.
std::optional<SchemaNode> try_parse_tag(std::string_view tag);

// True when `tag` parses as a leaf tag.
bool is_tag(std::string_view tag);

// Byte width when every instance of the node occupies the same number of
// bytes (no cstring without padding, no branches, only literal array lengths).
std::optional<std::size_t> fixed_width(const SchemaNode& node);

// True if the node or any descendant carries a reference constraint.
bool has_reference(const SchemaNode& node);

// Renders a node back to the JSON description it compiles from.
nlohmann::ordered_json describe_node(const SchemaNode& node);
std::string describe_tag(const SchemaNode& node);
std::string describe_length(const LengthSpec& spec);

}  // namespace binstruct::schema
