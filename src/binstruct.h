/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "schema/schema_byte_cursor.h"
#include "schema/schema_compiler.h"

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace binstruct {

struct DecodeOptions {
    std::size_t offset = 0;
    // Treat bytes left over after the record as a failed match.
    bool require_full_consumption = false;
    bool debug = false;
};

// Without a match, end_offset is the start offset and nothing is consumed.
struct DecodeResult {
    std::optional<nlohmann::ordered_json> record;
    std::size_t end_offset = 0;
    std::size_t bytes_consumed = 0;

    bool matched() const { return record.has_value(); }
};

struct EncodeOptions {
    std::size_t initial_capacity = 0;
    schema::Endian default_endian = schema::Endian::Big;
    bool debug = false;
};

struct EncodeResult {
    std::vector<std::uint8_t> bytes;
    std::size_t bytes_written = 0;
};

class BinStruct {
   public:
    static schema::Schema LoadSchemaFile(const std::filesystem::path& path);
    static schema::Schema ParseSchema(std::string_view json_text);

    static DecodeResult DecodeBytes(
        const schema::Schema& schema,
        std::span<const std::uint8_t> bytes,
        const DecodeOptions& opt = {},
        std::string_view label = {}
    );
    static DecodeResult DecodeFile(
        const schema::Schema& schema,
        const std::filesystem::path& path,
        const DecodeOptions& opt = {}
    );

    static EncodeResult Encode(
        const schema::Schema& schema,
        const nlohmann::ordered_json& record,
        const EncodeOptions& opt = {},
        std::string_view label = {}
    );
    // Writes at `offset` inside an existing cursor, growing it as allowed.
    static std::size_t EncodeInto(
        const schema::Schema& schema,
        const nlohmann::ordered_json& record,
        schema::ByteCursor& cursor,
        std::size_t offset
    );
};

}  // namespace binstruct
