/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "schema_byte_cursor.h"
#include "schema_compiler.h"
#include "schema_node.h"

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace binstruct::schema {

/**
 * Writes `record` at the cursor position following `schema` and returns the
 * number of bytes written. Reference constraints are not checked. Branch
 * nodes cannot be encoded because a record does not say which alternative it
 * came from; they throw SchemaError. A record of the wrong shape throws
 * RecordError, a full non-growable cursor BufferFullError.
 */
std::size_t encode(const Schema& schema, ByteCursor& cursor, const nlohmann::ordered_json& record);

std::size_t encode_node(
    const SchemaNode& node,
    ByteCursor& cursor,
    const nlohmann::ordered_json& value,
    const nlohmann::ordered_json* scope = nullptr,
    const std::string& path = "$"
);

}  // namespace binstruct::schema
