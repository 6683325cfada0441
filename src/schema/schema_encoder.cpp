/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "schema/schema_encoder.h"
#include "schema/schema_length_expr.h"
#include "utils/log.h"

#include <cmath>
#include <limits>

namespace binstruct::schema {
namespace {
using Json = nlohmann::ordered_json;

std::int64_t integer_value(const Json& v, const std::string& path) {
    if (v.is_number_unsigned()) {
        return static_cast<std::int64_t>(v.get<std::uint64_t>());
    }
    if (v.is_number_integer()) {
        return v.get<std::int64_t>();
    }
    if (v.is_number_float()) {
        const double d = v.get<double>();
        if (!std::isfinite(d) || d < static_cast<double>(std::numeric_limits<std::int64_t>::min())
            || d >= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            throw RecordError(path + ": " + v.dump() + " does not fit an integer field");
        }
        return static_cast<std::int64_t>(d);
    }
    throw RecordError(path + ": expected a number, got " + std::string(v.type_name()));
}

double float_value(const Json& v, const std::string& path) {
    if (!v.is_number()) {
        throw RecordError(path + ": expected a number, got " + std::string(v.type_name()));
    }
    return v.get<double>();
}

// Raw field bytes for a string value; each character must be U+0000..U+00FF.
std::string string_bytes(const Json& v, const std::string& path) {
    if (!v.is_string()) {
        throw RecordError(path + ": expected a string, got " + std::string(v.type_name()));
    }
    auto bytes = text_to_bytes(v.get_ref<const std::string&>());
    if (!bytes.has_value()) {
        throw RecordError(path + ": string holds a character above U+00FF or invalid UTF-8");
    }
    return std::move(*bytes);
}

void write_scalar(ByteCursor& cursor, const ScalarNode& node, const Json& v, const std::string& path) {
    switch (node.type) {
        case ScalarType::Int8:
            cursor.write_i8(static_cast<std::int8_t>(integer_value(v, path)));
            break;
        case ScalarType::Uint8:
            cursor.write_u8(static_cast<std::uint8_t>(integer_value(v, path)));
            break;
        case ScalarType::Int16:
            cursor.write_i16(static_cast<std::int16_t>(integer_value(v, path)), node.endian);
            break;
        case ScalarType::Uint16:
            cursor.write_u16(static_cast<std::uint16_t>(integer_value(v, path)), node.endian);
            break;
        case ScalarType::Int32:
            cursor.write_i32(static_cast<std::int32_t>(integer_value(v, path)), node.endian);
            break;
        case ScalarType::Uint32:
            cursor.write_u32(static_cast<std::uint32_t>(integer_value(v, path)), node.endian);
            break;
        case ScalarType::Float32:
            cursor.write_f32(static_cast<float>(float_value(v, path)), node.endian);
            break;
        case ScalarType::Float64:
            cursor.write_f64(float_value(v, path), node.endian);
            break;
    }
    const std::size_t natural = scalar_size(node.type);
    if (node.padded_to > natural) {
        cursor.write_zeros(node.padded_to - natural);
    }
}

void check_array_length(const ArrayNode& node, const Json& value, const Json* scope, const std::string& path) {
    std::optional<std::size_t> expected;
    try {
        expected = evaluate_length(node.length, scope);
    } catch (const OutOfBoundsError& ex) {
        throw RecordError(path + ": " + ex.what());
    }
    if (expected.has_value() && *expected != value.size()) {
        throw RecordError(
            path + ": array has " + std::to_string(value.size()) + " elements, length '"
            + describe_length(node.length) + "' requires " + std::to_string(*expected)
        );
    }
}

class Encoder {
   public:
    explicit Encoder(ByteCursor& cursor) : cursor_(cursor) {}

    void encode(const SchemaNode& node, const Json& value, const Json* scope, const std::string& path) {
        if (const auto* s = node.get_if<ScalarNode>()) {
            write_scalar(cursor_, *s, value, path);
        } else if (const auto* s = node.get_if<FixedStringNode>()) {
            cursor_.write_string(string_bytes(value, path), s->padded_to);
        } else if (const auto* s = node.get_if<CStringNode>()) {
            cursor_.write_cstring(string_bytes(value, path), s->padded_to);
        } else if (const auto* a = node.get_if<ArrayNode>()) {
            encode_array(*a, value, scope, path);
        } else if (node.is<BranchNode>()) {
            throw SchemaError(path + ": branch nodes cannot be encoded, encode the chosen alternative");
        } else {
            encode_struct(node.as<StructNode>(), value, path);
        }
    }

   private:
    void encode_array(const ArrayNode& node, const Json& value, const Json* scope, const std::string& path) {
        if (!value.is_array()) {
            throw RecordError(path + ": expected an array, got " + std::string(value.type_name()));
        }
        check_array_length(node, value, scope, path);
        for (std::size_t i = 0; i < value.size(); i++) {
            encode(*node.element, value[i], scope, path + "[" + std::to_string(i) + "]");
        }
    }

    void encode_struct(const StructNode& node, const Json& value, const std::string& path) {
        if (!value.is_object()) {
            throw RecordError(path + ": expected an object, got " + std::string(value.type_name()));
        }
        for (const auto& field : node.fields) {
            const std::string field_path = path + "." + field.name;
            const auto it = value.find(field.name);
            if (it == value.end()) {
                throw RecordError(field_path + ": missing field");
            }
            encode(*field.node, *it, &value, field_path);
        }
    }

    ByteCursor& cursor_;
};
}  // namespace

std::size_t encode(const Schema& schema, ByteCursor& cursor, const nlohmann::ordered_json& record) {
    return encode_node(schema.root(), cursor, record, nullptr, "$");
}

std::size_t encode_node(
    const SchemaNode& node,
    ByteCursor& cursor,
    const nlohmann::ordered_json& value,
    const nlohmann::ordered_json* scope,
    const std::string& path
) {
    const std::size_t start = cursor.position();
    Encoder encoder(cursor);
    encoder.encode(node, value, scope, path);
    const std::size_t written = cursor.position() - start;
    BINSTRUCT_LOG_DEBUG("encoded %s: %zu bytes at offset %zu", path.c_str(), written, start);
    return written;
}

}  // namespace binstruct::schema
