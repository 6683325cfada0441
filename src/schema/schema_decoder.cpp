/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "schema/schema_decoder.h"
#include "schema/schema_length_expr.h"
#include "utils/log.h"

namespace binstruct::schema {
namespace {
Record read_scalar_value(ByteCursor& cursor, const ScalarNode& node) {
    switch (node.type) {
        case ScalarType::Int8:
            return static_cast<std::int64_t>(cursor.read_i8());
        case ScalarType::Uint8:
            return static_cast<std::uint64_t>(cursor.read_u8());
        case ScalarType::Int16:
            return static_cast<std::int64_t>(cursor.read_i16(node.endian));
        case ScalarType::Uint16:
            return static_cast<std::uint64_t>(cursor.read_u16(node.endian));
        case ScalarType::Int32:
            return static_cast<std::int64_t>(cursor.read_i32(node.endian));
        case ScalarType::Uint32:
            return static_cast<std::uint64_t>(cursor.read_u32(node.endian));
        case ScalarType::Float32:
            return static_cast<double>(cursor.read_f32(node.endian));
        case ScalarType::Float64:
            return cursor.read_f64(node.endian);
    }
    throw SchemaError("Unhandled scalar type");
}

bool scalar_matches(const ScalarNode& node, const Record& value) {
    bool equal = false;
    if (const auto* ref = std::get_if<std::int64_t>(&*node.ref)) {
        equal = value.is_number_float() ? value.get<double>() == static_cast<double>(*ref)
                                        : value.get<std::int64_t>() == *ref;
    } else {
        equal = value.get<double>() == std::get<double>(*node.ref);
    }
    return equal != node.negate;
}

template <typename T>
Record map_typed_array(ByteCursor& cursor, std::size_t count, Endian endian) {
    const auto values = cursor.map_array<T>(count, endian);
    Record out = Record::array();
    for (const T v : values.values()) {
        if constexpr (std::is_floating_point_v<T>) {
            out.push_back(static_cast<double>(v));
        } else if constexpr (std::is_signed_v<T>) {
            out.push_back(static_cast<std::int64_t>(v));
        } else {
            out.push_back(static_cast<std::uint64_t>(v));
        }
    }
    return out;
}

Record map_scalar_array(ByteCursor& cursor, const ScalarNode& elem, std::size_t count) {
    switch (elem.type) {
        case ScalarType::Int8:
            return map_typed_array<std::int8_t>(cursor, count, elem.endian);
        case ScalarType::Uint8:
            return map_typed_array<std::uint8_t>(cursor, count, elem.endian);
        case ScalarType::Int16:
            return map_typed_array<std::int16_t>(cursor, count, elem.endian);
        case ScalarType::Uint16:
            return map_typed_array<std::uint16_t>(cursor, count, elem.endian);
        case ScalarType::Int32:
            return map_typed_array<std::int32_t>(cursor, count, elem.endian);
        case ScalarType::Uint32:
            return map_typed_array<std::uint32_t>(cursor, count, elem.endian);
        case ScalarType::Float32:
            return map_typed_array<float>(cursor, count, elem.endian);
        case ScalarType::Float64:
            return map_typed_array<double>(cursor, count, elem.endian);
    }
    throw SchemaError("Unhandled scalar type");
}

class Decoder {
   public:
    explicit Decoder(ByteCursor& cursor) : cursor_(cursor) {}

    std::optional<Record> decode(const SchemaNode& node, const Record* scope) {
        if (const auto* s = node.get_if<ScalarNode>()) {
            return decode_scalar(*s);
        }
        if (const auto* s = node.get_if<FixedStringNode>()) {
            return decode_fixed_string(*s);
        }
        if (const auto* s = node.get_if<CStringNode>()) {
            return decode_cstring(*s);
        }
        if (const auto* a = node.get_if<ArrayNode>()) {
            return decode_array(*a, scope);
        }
        if (const auto* b = node.get_if<BranchNode>()) {
            return decode_branch(*b, scope);
        }
        return decode_struct(node.as<StructNode>());
    }

   private:
    std::optional<Record> decode_scalar(const ScalarNode& node) {
        const std::size_t start = cursor_.position();
        Record value = read_scalar_value(cursor_, node);
        const std::size_t natural = scalar_size(node.type);
        if (node.padded_to > natural) {
            cursor_.skip(node.padded_to - natural);
        }
        if (node.ref.has_value() && !scalar_matches(node, value)) {
            BINSTRUCT_LOG_DEBUG(
                "no match: %s at offset %zu read %s", describe_tag(SchemaNode{node}).c_str(), start,
                value.dump().c_str()
            );
            return std::nullopt;
        }
        return value;
    }

    std::optional<Record> decode_fixed_string(const FixedStringNode& node) {
        std::string value = bytes_to_text(cursor_.read_string(node.padded_to));
        if (node.ref.has_value() && ((value == *node.ref) == node.negate)) {
            BINSTRUCT_LOG_DEBUG(
                "no match: string:%zu at offset %zu", node.padded_to,
                cursor_.position() - node.padded_to
            );
            return std::nullopt;
        }
        return Record(std::move(value));
    }

    std::optional<Record> decode_cstring(const CStringNode& node) {
        const std::size_t start = cursor_.position();
        std::string value = bytes_to_text(cursor_.read_cstring(node.padded_to));
        if (node.ref.has_value() && ((value == *node.ref) == node.negate)) {
            BINSTRUCT_LOG_DEBUG("no match: cstring at offset %zu", start);
            return std::nullopt;
        }
        return Record(std::move(value));
    }

    std::optional<Record> decode_array(const ArrayNode& node, const Record* scope) {
        const auto count = resolve_length(node.length, scope, cursor_);
        if (!count.has_value()) {
            return decode_remainder(node, scope);
        }

        // Plain scalars go through the typed mapping; padded or constrained
        // elements need the per-element path.
        const auto* elem = node.element->get_if<ScalarNode>();
        if (elem != nullptr && elem->padded_to <= scalar_size(elem->type) && !elem->ref.has_value()) {
            return map_scalar_array(cursor_, *elem, *count);
        }

        Record out = Record::array();
        for (std::size_t i = 0; i < *count; i++) {
            auto v = decode(*node.element, scope);
            if (!v.has_value()) {
                BINSTRUCT_LOG_DEBUG("no match: array element %zu of %zu", i, *count);
                return std::nullopt;
            }
            out.push_back(std::move(*v));
        }
        return out;
    }

    std::optional<Record> decode_remainder(const ArrayNode& node, const Record* scope) {
        Record out = Record::array();
        while (!cursor_.eof()) {
            const std::size_t before = cursor_.position();
            auto v = decode(*node.element, scope);
            if (!v.has_value()) {
                cursor_.seek(static_cast<double>(before));
                break;
            }
            if (cursor_.position() == before) {
                break;
            }
            out.push_back(std::move(*v));
        }
        return out;
    }

    std::optional<Record> decode_branch(const BranchNode& node, const Record* scope) {
        const std::size_t start = cursor_.position();
        for (std::size_t i = 0; i < node.alternatives.size(); i++) {
            cursor_.seek(static_cast<double>(start));
            auto v = decode(*node.alternatives[i], scope);
            if (v.has_value()) {
                BINSTRUCT_LOG_DEBUG("branch at offset %zu took alternative %zu", start, i);
                return v;
            }
        }
        cursor_.seek(static_cast<double>(start));
        BINSTRUCT_LOG_DEBUG("no match: all %zu alternatives at offset %zu", node.alternatives.size(), start);
        return std::nullopt;
    }

    std::optional<Record> decode_struct(const StructNode& node) {
        Record out = Record::object();
        for (const auto& field : node.fields) {
            auto v = decode(*field.node, &out);
            if (!v.has_value()) {
                BINSTRUCT_LOG_DEBUG("no match: field '%s'", field.name.c_str());
                return std::nullopt;
            }
            out[field.name] = std::move(*v);
        }
        return out;
    }

    ByteCursor& cursor_;
};
}  // namespace

std::optional<Record> decode(const Schema& schema, ByteCursor& cursor) {
    return decode_node(schema.root(), cursor, nullptr);
}

std::optional<Record> decode_node(const SchemaNode& node, ByteCursor& cursor, const Record* scope) {
    Decoder decoder(cursor);
    return decoder.decode(node, scope);
}

}  // namespace binstruct::schema
