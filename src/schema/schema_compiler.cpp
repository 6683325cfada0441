/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "schema/schema_compiler.h"
#include "schema/schema_length_expr.h"

#include <algorithm>

namespace binstruct::schema {
namespace {
using FieldScope = std::vector<std::string>;

bool in_scope(const FieldScope* scope, const std::string& name) {
    return scope != nullptr && std::find(scope->begin(), scope->end(), name) != scope->end();
}

[[noreturn]] void fail(const std::string& path, const std::string& msg) {
    throw SchemaError(path + ": " + msg);
}

NodePtr compile_node(const nlohmann::ordered_json& j, const std::string& path, const FieldScope* scope);

// A two element list is an array when its second element is a length. A tag
// string in that slot is only a length if it names an earlier field.
bool is_array_literal(const nlohmann::ordered_json& j, const FieldScope* scope) {
    if (j.size() != 2) {
        return false;
    }
    const auto& second = j[1];
    if (second.is_number()) {
        return true;
    }
    if (!second.is_string()) {
        return false;
    }
    const auto text = second.get<std::string>();
    if (!is_tag(text)) {
        return true;
    }
    return in_scope(scope, text);
}

NodePtr compile_array(const nlohmann::ordered_json& j, const std::string& path, const FieldScope* scope) {
    ArrayNode node{};
    try {
        node.length = parse_length_spec(j[1]);
    } catch (const SchemaError& ex) {
        fail(path, ex.what());
    }
    for (const auto& name : referenced_fields(node.length)) {
        if (!in_scope(scope, name)) {
            fail(path, "array length references field '" + name + "' before it is declared");
        }
    }
    node.element = compile_node(j[0], path + "[]", scope);
    return make_node(std::move(node));
}

NodePtr compile_branch(const nlohmann::ordered_json& j, const std::string& path, const FieldScope* scope) {
    if (j.size() < 2) {
        fail(path, "a branch needs at least two alternatives, an array needs [type, length]");
    }
    BranchNode node{};
    node.alternatives.reserve(j.size());
    for (std::size_t i = 0; i < j.size(); i++) {
        node.alternatives.push_back(compile_node(j[i], path + "[" + std::to_string(i) + "]", scope));
    }
    return make_node(std::move(node));
}

NodePtr compile_struct(const nlohmann::ordered_json& j, const std::string& path) {
    StructNode node{};
    FieldScope declared;
    declared.reserve(j.size());
    for (const auto& kv : j.items()) {
        const std::string field_path = path + "." + kv.key();
        node.fields.push_back(StructField{kv.key(), compile_node(kv.value(), field_path, &declared)});
        declared.push_back(kv.key());
    }
    return make_node(std::move(node));
}

NodePtr compile_node(const nlohmann::ordered_json& j, const std::string& path, const FieldScope* scope) {
    if (j.is_string()) {
        try {
            return std::make_shared<const SchemaNode>(parse_tag(j.get<std::string>()));
        } catch (const SchemaError& ex) {
            fail(path, ex.what());
        }
    }
    if (j.is_object()) {
        return compile_struct(j, path);
    }
    if (j.is_array()) {
        if (is_array_literal(j, scope)) {
            return compile_array(j, path, scope);
        }
        return compile_branch(j, path, scope);
    }
    fail(path, "expected a type tag, an object or a list, got " + j.dump());
}
}  // namespace

const SchemaNode& Schema::root() const {
    if (!root_) {
        throw std::logic_error("Schema is empty");
    }
    return *root_;
}

nlohmann::ordered_json Schema::describe() const {
    if (!root_) {
        return nullptr;
    }
    return describe_node(*root_);
}

Schema compile_schema(const nlohmann::ordered_json& description) {
    return Schema(compile_node(description, "$", nullptr));
}

Schema compile_schema_text(std::string_view json_text) {
    nlohmann::ordered_json description;
    try {
        description = nlohmann::ordered_json::parse(json_text);
    } catch (const nlohmann::json::parse_error& ex) {
        throw SchemaError(std::string("Schema is not valid JSON: ") + ex.what());
    }
    return compile_schema(description);
}

}  // namespace binstruct::schema
