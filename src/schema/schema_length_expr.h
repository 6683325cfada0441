/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "schema_byte_cursor.h"
#include "schema_node.h"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace binstruct::schema {

// Accepts a JSON integer (negative counts from the end of the data), "*",
// a field name, a digit string, or an arithmetic expression such as
// "width*height/8" or "n-1". Throws SchemaError on malformed input.
LengthSpec parse_length_spec(const nlohmann::ordered_json& spec);

// Field names the length reads from the enclosing struct, in order of use.
std::vector<std::string> referenced_fields(const LengthSpec& spec);

// Length for the Literal, Field and Expression forms, evaluated against the
// enclosing struct. Returns nullopt for the cursor-dependent forms.
std::optional<std::size_t>
evaluate_length(const LengthSpec& spec, const nlohmann::ordered_json* scope);

// Element count for every form except Remainder, which has no fixed count and
// yields nullopt. Throws SchemaError for an undefined or non-numeric field and
// OutOfBoundsError for a negative or non-finite result.
std::optional<std::size_t> resolve_length(
    const LengthSpec& spec,
    const nlohmann::ordered_json* scope,
    const ByteCursor& cursor
);

}  // namespace binstruct::schema
