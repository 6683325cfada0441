/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "binstruct.h"

#include "schema/schema_decoder.h"
#include "schema/schema_encoder.h"
#include "utils/fs_utils.h"
#include "utils/log.h"

#include <chrono>
#include <stdexcept>
#include <string>

namespace binstruct {

schema::Schema BinStruct::LoadSchemaFile(const std::filesystem::path& path) {
    const std::string text = fs_utils::read_text_file(path);
    if (text.empty()) {
        throw std::runtime_error("Schema file is empty: " + path.string());
    }
    try {
        return schema::compile_schema_text(text);
    } catch (const schema::SchemaError& ex) {
        throw schema::SchemaError(path.string() + ": " + ex.what());
    }
}

schema::Schema BinStruct::ParseSchema(std::string_view json_text) {
    return schema::compile_schema_text(json_text);
}

DecodeResult BinStruct::DecodeBytes(
    const schema::Schema& schema,
    std::span<const std::uint8_t> bytes,
    const DecodeOptions& opt,
    std::string_view label
) {
    if (opt.offset > bytes.size()) {
        throw schema::OutOfBoundsError(
            "Decode offset " + std::to_string(opt.offset) + " is past the end of "
            + std::to_string(bytes.size()) + " bytes"
        );
    }

    const auto t0 = std::chrono::steady_clock::now();
    schema::ByteCursor cursor(bytes);
    cursor.seek(static_cast<double>(opt.offset));

    DecodeResult result{};
    result.record = schema::decode(schema, cursor);
    result.end_offset = cursor.position();
    result.bytes_consumed = result.end_offset - opt.offset;
    if (result.record.has_value() && opt.require_full_consumption && !cursor.eof()) {
        BINSTRUCT_LOG_DEBUG(
            "%s: %zu trailing bytes after record", std::string(label).c_str(), cursor.remaining()
        );
        result.record.reset();
    }
    if (!result.record.has_value()) {
        result.end_offset = opt.offset;
        result.bytes_consumed = 0;
    }
    const auto t1 = std::chrono::steady_clock::now();

    if (opt.debug) {
        const auto us = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count();
        BINSTRUCT_LOG_INFO(
            "Decode %s: bytes=%zu offset=%zu consumed=%zu matched=%s time=%lldus",
            std::string(label).c_str(), bytes.size(), opt.offset, result.bytes_consumed,
            result.record.has_value() ? "yes" : "no", static_cast<long long>(us)
        );
    }
    return result;
}

DecodeResult BinStruct::DecodeFile(
    const schema::Schema& schema,
    const std::filesystem::path& path,
    const DecodeOptions& opt
) {
    const auto bytes = fs_utils::read_file(path);
    return DecodeBytes(schema, bytes, opt, path.filename().string());
}

EncodeResult BinStruct::Encode(
    const schema::Schema& schema,
    const nlohmann::ordered_json& record,
    const EncodeOptions& opt,
    std::string_view label
) {
    const auto t0 = std::chrono::steady_clock::now();
    schema::ByteCursor cursor(opt.initial_capacity, opt.default_endian, true);
    const std::size_t written = schema::encode(schema, cursor, record);

    EncodeResult result{};
    result.bytes = cursor.take_bytes();
    result.bytes_written = written;
    const auto t1 = std::chrono::steady_clock::now();

    if (opt.debug) {
        const auto us = std::chrono::duration_cast<std::chrono::microseconds>(t1 - t0).count();
        BINSTRUCT_LOG_INFO(
            "Encode %s: bytes=%zu time=%lldus", std::string(label).c_str(), written,
            static_cast<long long>(us)
        );
    }
    return result;
}

std::size_t BinStruct::EncodeInto(
    const schema::Schema& schema,
    const nlohmann::ordered_json& record,
    schema::ByteCursor& cursor,
    std::size_t offset
) {
    if (offset > cursor.length()) {
        throw schema::OutOfBoundsError(
            "Encode offset " + std::to_string(offset) + " is past the end of data ("
            + std::to_string(cursor.length()) + ")"
        );
    }
    cursor.seek(static_cast<double>(offset));
    return schema::encode(schema, cursor, record);
}

}  // namespace binstruct
