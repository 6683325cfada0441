/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "schema/schema_node.h"

#include <array>
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace binstruct::schema {
namespace {
struct ScalarInfo {
    std::string_view name;
    ScalarType type;
    std::size_t size;
};

constexpr std::array<ScalarInfo, 8> kScalarTypes = {{
    {"int8", ScalarType::Int8, 1},
    {"uint8", ScalarType::Uint8, 1},
    {"int16", ScalarType::Int16, 2},
    {"uint16", ScalarType::Uint16, 2},
    {"int32", ScalarType::Int32, 4},
    {"uint32", ScalarType::Uint32, 4},
    {"float32", ScalarType::Float32, 4},
    {"float64", ScalarType::Float64, 8},
}};

bool all_digits(std::string_view s) {
    if (s.empty()) {
        return false;
    }
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    return true;
}

std::optional<std::size_t> parse_padding(std::string_view s, std::string_view tag, std::string& error) {
    if (!all_digits(s)) {
        error = "Invalid padding '" + std::string(s) + "' in tag '" + std::string(tag) + "'";
        return std::nullopt;
    }
    std::size_t v = 0;
    for (char c : s) {
        const std::size_t digit = static_cast<std::size_t>(c - '0');
        if (v > (std::numeric_limits<std::size_t>::max() - digit) / 10) {
            error = "Padding overflows in tag '" + std::string(tag) + "'";
            return std::nullopt;
        }
        v = v * 10 + digit;
    }
    return v;
}

std::optional<std::int64_t> parse_int_ref(std::string_view s, std::string_view tag, std::string& error) {
    std::string text(s);
    int base = 10;
    std::size_t start = 0;
    if (!text.empty() && (text[0] == '-' || text[0] == '+')) {
        start = 1;
    }
    if (text.size() > start + 2 && text[start] == '0' && (text[start + 1] == 'x' || text[start + 1] == 'X')) {
        base = 16;
    }
    errno = 0;
    char* end = nullptr;
    const long long v = std::strtoll(text.c_str(), &end, base);
    if (text.empty() || end != text.c_str() + text.size() || errno == ERANGE) {
        error = "Invalid integer reference '" + text + "' in tag '" + std::string(tag) + "'";
        return std::nullopt;
    }
    return static_cast<std::int64_t>(v);
}

std::optional<double> parse_float_ref(std::string_view s, std::string_view tag, std::string& error) {
    std::string text(s);
    errno = 0;
    char* end = nullptr;
    const double v = std::strtod(text.c_str(), &end);
    if (text.empty() || end != text.c_str() + text.size()) {
        error = "Invalid float reference '" + text + "' in tag '" + std::string(tag) + "'";
        return std::nullopt;
    }
    return v;
}

std::string render_scalar_ref(const ScalarRef& ref) {
    if (const auto* i = std::get_if<std::int64_t>(&ref)) {
        return std::to_string(*i);
    }
    return nlohmann::json(std::get<double>(ref)).dump();
}

template <typename Node>
std::string with_ref(std::string base, const Node& node, const std::string& ref_text) {
    if (node.padded_to > 0) {
        base += ':';
        base += std::to_string(node.padded_to);
    }
    if (node.ref.has_value()) {
        base += node.negate ? "!=" : "=";
        base += ref_text;
    }
    return base;
}
}  // namespace

std::size_t scalar_size(ScalarType type) {
    for (const auto& info : kScalarTypes) {
        if (info.type == type) {
            return info.size;
        }
    }
    return 0;
}

bool is_float_type(ScalarType type) {
    return type == ScalarType::Float32 || type == ScalarType::Float64;
}

bool is_signed_type(ScalarType type) {
    return type == ScalarType::Int8 || type == ScalarType::Int16 || type == ScalarType::Int32
           || is_float_type(type);
}

std::string_view scalar_name(ScalarType type) {
    for (const auto& info : kScalarTypes) {
        if (info.type == type) {
            return info.name;
        }
    }
    return "unknown";
}

std::optional<ScalarType> try_parse_scalar_type(std::string_view name) {
    for (const auto& info : kScalarTypes) {
        if (info.name == name) {
            return info.type;
        }
    }
    return std::nullopt;
}

const StructField* StructNode::find(std::string_view name) const {
    for (const auto& f : fields) {
        if (f.name == name) {
            return &f;
        }
    }
    return nullptr;
}

namespace {
// Shared by parse_tag and try_parse_tag; `error` explains a nullopt.
std::optional<SchemaNode> parse_tag_impl(std::string_view tag, std::string& error) {
    std::string_view type = tag;
    std::optional<std::string_view> ref;
    bool negate = false;

    // =ref first, then :paddedTo, then the le suffix.
    const std::size_t eq = type.find('=');
    if (eq != std::string_view::npos) {
        ref = type.substr(eq + 1);
        type = type.substr(0, eq);
        if (!type.empty() && type.back() == '!') {
            type.remove_suffix(1);
            negate = true;
        }
    }

    std::size_t padded_to = 0;
    bool has_padding = false;
    const std::size_t colon = type.find(':');
    if (colon != std::string_view::npos) {
        const auto padding = parse_padding(type.substr(colon + 1), tag, error);
        if (!padding.has_value()) {
            return std::nullopt;
        }
        padded_to = *padding;
        has_padding = true;
        type = type.substr(0, colon);
    }

    if (type == "string") {
        if (!has_padding) {
            error = "Tag 'string' requires a :paddedTo width ('" + std::string(tag) + "')";
            return std::nullopt;
        }
        FixedStringNode node{};
        node.padded_to = padded_to;
        node.negate = negate;
        if (ref.has_value()) {
            node.ref = std::string(*ref);
        }
        return SchemaNode{node};
    }
    if (type == "cstring") {
        CStringNode node{};
        node.padded_to = padded_to;
        node.negate = negate;
        if (ref.has_value()) {
            node.ref = std::string(*ref);
        }
        return SchemaNode{node};
    }

    Endian endian = Endian::Big;
    if (type.size() > 2 && type.substr(type.size() - 2) == "le") {
        if (try_parse_scalar_type(type.substr(0, type.size() - 2)).has_value()) {
            type.remove_suffix(2);
            endian = Endian::Little;
        }
    }

    const auto scalar = try_parse_scalar_type(type);
    if (!scalar.has_value()) {
        error = "Unknown type tag '" + std::string(tag) + "'";
        return std::nullopt;
    }

    ScalarNode node{};
    node.type = *scalar;
    node.endian = endian;
    node.padded_to = padded_to;
    node.negate = negate;
    if (ref.has_value()) {
        std::string_view ref_text = *ref;
        if (!negate && !ref_text.empty() && ref_text.back() == '!') {
            ref_text.remove_suffix(1);
            node.negate = true;
        }
        if (is_float_type(node.type)) {
            const auto v = parse_float_ref(ref_text, tag, error);
            if (!v.has_value()) {
                return std::nullopt;
            }
            node.ref = *v;
        } else {
            const auto v = parse_int_ref(ref_text, tag, error);
            if (!v.has_value()) {
                return std::nullopt;
            }
            node.ref = *v;
        }
    }
    return SchemaNode{node};
}
}  // namespace

SchemaNode parse_tag(std::string_view tag) {
    std::string error;
    auto node = parse_tag_impl(tag, error);
    if (!node.has_value()) {
        throw SchemaError(error);
    }
    return std::move(*node);
}

std::optional<SchemaNode> try_parse_tag(std::string_view tag) {
    std::string error;
    return parse_tag_impl(tag, error);
}

bool is_tag(std::string_view tag) {
    return try_parse_tag(tag).has_value();
}

std::optional<std::size_t> fixed_width(const SchemaNode& node) {
    if (const auto* s = node.get_if<ScalarNode>()) {
        return s->width();
    }
    if (const auto* s = node.get_if<FixedStringNode>()) {
        return s->padded_to;
    }
    if (const auto* s = node.get_if<CStringNode>()) {
        if (s->padded_to == 0) {
            return std::nullopt;
        }
        return s->padded_to;
    }
    if (const auto* a = node.get_if<ArrayNode>()) {
        if (a->length.kind != LengthSpec::Kind::Literal || a->length.value < 0) {
            return std::nullopt;
        }
        const auto elem = fixed_width(*a->element);
        if (!elem.has_value()) {
            return std::nullopt;
        }
        return *elem * static_cast<std::size_t>(a->length.value);
    }
    if (const auto* st = node.get_if<StructNode>()) {
        std::size_t total = 0;
        for (const auto& f : st->fields) {
            const auto w = fixed_width(*f.node);
            if (!w.has_value()) {
                return std::nullopt;
            }
            total += *w;
        }
        return total;
    }
    return std::nullopt;
}

bool has_reference(const SchemaNode& node) {
    if (const auto* s = node.get_if<ScalarNode>()) {
        return s->ref.has_value();
    }
    if (const auto* s = node.get_if<FixedStringNode>()) {
        return s->ref.has_value();
    }
    if (const auto* s = node.get_if<CStringNode>()) {
        return s->ref.has_value();
    }
    if (const auto* a = node.get_if<ArrayNode>()) {
        return has_reference(*a->element);
    }
    if (const auto* b = node.get_if<BranchNode>()) {
        for (const auto& alt : b->alternatives) {
            if (has_reference(*alt)) {
                return true;
            }
        }
        return false;
    }
    for (const auto& f : node.as<StructNode>().fields) {
        if (has_reference(*f.node)) {
            return true;
        }
    }
    return false;
}

std::string describe_tag(const SchemaNode& node) {
    if (const auto* s = node.get_if<ScalarNode>()) {
        std::string base(scalar_name(s->type));
        if (s->endian == Endian::Little) {
            base += "le";
        }
        return with_ref(std::move(base), *s, s->ref.has_value() ? render_scalar_ref(*s->ref) : "");
    }
    if (const auto* s = node.get_if<FixedStringNode>()) {
        std::string out = "string:" + std::to_string(s->padded_to);
        if (s->ref.has_value()) {
            out += s->negate ? "!=" : "=";
            out += *s->ref;
        }
        return out;
    }
    if (const auto* s = node.get_if<CStringNode>()) {
        return with_ref("cstring", *s, s->ref.value_or(""));
    }
    throw std::invalid_argument("describe_tag called on a composite node");
}

std::string describe_length(const LengthSpec& spec) {
    switch (spec.kind) {
        case LengthSpec::Kind::Literal:
        case LengthSpec::Kind::FromEnd:
            return std::to_string(spec.value);
        case LengthSpec::Kind::Remainder:
            return "*";
        case LengthSpec::Kind::Field:
            return spec.field;
        case LengthSpec::Kind::Expression: {
            std::string out;
            for (std::size_t i = 0; i < spec.terms.size(); i++) {
                const auto& term = spec.terms[i];
                if (i > 0 || term.op != '+') {
                    out += term.op;
                }
                if (const auto* n = std::get_if<std::int64_t>(&term.operand)) {
                    out += std::to_string(*n);
                } else {
                    out += std::get<std::string>(term.operand);
                }
            }
            return out;
        }
    }
    return {};
}

nlohmann::ordered_json describe_node(const SchemaNode& node) {
    if (const auto* a = node.get_if<ArrayNode>()) {
        nlohmann::ordered_json out = nlohmann::ordered_json::array();
        out.push_back(describe_node(*a->element));
        if (a->length.kind == LengthSpec::Kind::Literal || a->length.kind == LengthSpec::Kind::FromEnd) {
            out.push_back(a->length.value);
        } else {
            out.push_back(describe_length(a->length));
        }
        return out;
    }
    if (const auto* b = node.get_if<BranchNode>()) {
        nlohmann::ordered_json out = nlohmann::ordered_json::array();
        for (const auto& alt : b->alternatives) {
            out.push_back(describe_node(*alt));
        }
        return out;
    }
    if (const auto* st = node.get_if<StructNode>()) {
        nlohmann::ordered_json out = nlohmann::ordered_json::object();
        for (const auto& f : st->fields) {
            out[f.name] = describe_node(*f.node);
        }
        return out;
    }
    return describe_tag(node);
}

}  // namespace binstruct::schema
