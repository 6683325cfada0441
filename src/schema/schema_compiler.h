/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "schema_node.h"

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace binstruct::schema {

// Immutable compiled schema. Copies share the node tree.
class Schema {
   public:
    Schema() = default;
    explicit Schema(NodePtr root) : root_(std::move(root)) {}

    bool empty() const { return root_ == nullptr; }
    const SchemaNode& root() const;
    const NodePtr& root_ptr() const { return root_; }

    nlohmann::ordered_json describe() const;

   private:
    NodePtr root_;
};

/**
 * Compiles a JSON schema description:
 *   "uint16le:4=7"            leaf tag
 *   {"a": ..., "b": ...}       struct, fields in declaration order
 *   [element, length]          array; length is an integer, "*", a field or an expression
 *   [alt0, alt1, ...]          branch, alternatives tried in order
 *
 * Array lengths may only name fields declared earlier in the nearest
 * enclosing struct. Errors are thrown as SchemaError carrying the JSON path.
 */
Schema compile_schema(const nlohmann::ordered_json& description);

// Same as compile_schema after parsing `json_text`.
Schema compile_schema_text(std::string_view json_text);

}  // namespace binstruct::schema
