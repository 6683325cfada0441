/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "schema_byte_cursor.h"
#include "schema_compiler.h"
#include "schema_node.h"

#include <optional>

#include <nlohmann/json.hpp>

namespace binstruct::schema {

using Record = nlohmann::ordered_json;

/**
 * Decodes one value of `schema` starting at the cursor position.
 *
 * Returns nullopt (NoMatch) when a reference constraint or every branch
 * alternative fails. Throws OutOfBoundsError when the data ends early and
 * SchemaError for schema mistakes that could not be caught at compile time.
 * On success the cursor sits just past the consumed bytes.
 */
std::optional<Record> decode(const Schema& schema, ByteCursor& cursor);

// `scope` is the struct being filled by the caller; array lengths that name
// fields are looked up there.
std::optional<Record>
decode_node(const SchemaNode& node, ByteCursor& cursor, const Record* scope = nullptr);

}  // namespace binstruct::schema
