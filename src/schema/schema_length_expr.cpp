/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "schema/schema_length_expr.h"

#include <cctype>
#include <cmath>
#include <limits>

namespace binstruct::schema {
namespace {
bool is_operator(char c) {
    return c == '+' || c == '-' || c == '*' || c == '/';
}

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

std::int64_t parse_count(std::string_view s, std::string_view spec) {
    std::int64_t v = 0;
    for (char c : s) {
        const std::int64_t digit = c - '0';
        if (v > (std::numeric_limits<std::int64_t>::max() - digit) / 10) {
            throw SchemaError("Array length overflows: '" + std::string(spec) + "'");
        }
        v = v * 10 + digit;
    }
    return v;
}

double field_value(const std::string& name, const nlohmann::ordered_json* scope) {
    if (scope == nullptr || !scope->is_object()) {
        throw SchemaError("Array length references field '" + name + "' outside of a struct");
    }
    const auto it = scope->find(name);
    if (it == scope->end()) {
        throw SchemaError("Array length references undefined field '" + name + "'");
    }
    if (!it->is_number()) {
        throw SchemaError("Array length field '" + name + "' is not numeric");
    }
    return it->get<double>();
}

std::size_t to_count(double v, const LengthSpec& spec) {
    if (!std::isfinite(v) || v < 0.0) {
        throw OutOfBoundsError(
            "Array length '" + describe_length(spec) + "' evaluated to " + nlohmann::json(v).dump()
        );
    }
    if (v >= static_cast<double>(std::numeric_limits<std::size_t>::max())) {
        throw OutOfBoundsError("Array length '" + describe_length(spec) + "' is too large");
    }
    return static_cast<std::size_t>(v);
}
}  // namespace

LengthSpec parse_length_spec(const nlohmann::ordered_json& spec) {
    LengthSpec out{};
    if (spec.is_number_integer() || spec.is_number_unsigned()) {
        const std::int64_t n = spec.get<std::int64_t>();
        out.kind = n < 0 ? LengthSpec::Kind::FromEnd : LengthSpec::Kind::Literal;
        out.value = n;
        return out;
    }
    if (!spec.is_string()) {
        throw SchemaError("Array length must be an integer or a string, got " + spec.dump());
    }

    std::string text;
    for (char c : spec.get<std::string>()) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            text.push_back(c);
        }
    }
    if (text.empty()) {
        throw SchemaError("Array length is empty");
    }
    if (text == "*") {
        out.kind = LengthSpec::Kind::Remainder;
        return out;
    }
    if (all_digits(text)) {
        out.kind = LengthSpec::Kind::Literal;
        out.value = parse_count(text, text);
        return out;
    }

    bool has_operator = false;
    for (char c : text) {
        if (is_operator(c)) {
            has_operator = true;
            break;
        }
    }
    if (!has_operator) {
        out.kind = LengthSpec::Kind::Field;
        out.field = text;
        return out;
    }

    // Split in front of every operator; a leading term without one adds.
    out.kind = LengthSpec::Kind::Expression;
    std::size_t start = 0;
    while (start < text.size()) {
        std::size_t end = start + 1;
        while (end < text.size() && !is_operator(text[end])) {
            end++;
        }
        std::string_view seg(text.data() + start, end - start);
        LengthTerm term{};
        if (is_operator(seg.front())) {
            term.op = seg.front();
            seg.remove_prefix(1);
        }
        if (seg.empty()) {
            throw SchemaError("Missing operand in array length '" + text + "'");
        }
        if (all_digits(seg)) {
            term.operand = parse_count(seg, text);
        } else {
            term.operand = std::string(seg);
        }
        out.terms.push_back(std::move(term));
        start = end;
    }
    return out;
}

std::vector<std::string> referenced_fields(const LengthSpec& spec) {
    std::vector<std::string> out;
    if (spec.kind == LengthSpec::Kind::Field) {
        out.push_back(spec.field);
    } else if (spec.kind == LengthSpec::Kind::Expression) {
        for (const auto& term : spec.terms) {
            if (const auto* name = std::get_if<std::string>(&term.operand)) {
                out.push_back(*name);
            }
        }
    }
    return out;
}

std::optional<std::size_t>
evaluate_length(const LengthSpec& spec, const nlohmann::ordered_json* scope) {
    switch (spec.kind) {
        case LengthSpec::Kind::Literal:
            return to_count(static_cast<double>(spec.value), spec);
        case LengthSpec::Kind::Field:
            return to_count(field_value(spec.field, scope), spec);
        case LengthSpec::Kind::Expression: {
            double sum = 0.0;
            for (const auto& term : spec.terms) {
                double v = 0.0;
                if (const auto* n = std::get_if<std::int64_t>(&term.operand)) {
                    v = static_cast<double>(*n);
                } else {
                    v = field_value(std::get<std::string>(term.operand), scope);
                }
                switch (term.op) {
                    case '+':
                        sum += v;
                        break;
                    case '-':
                        sum -= v;
                        break;
                    case '*':
                        sum *= v;
                        break;
                    case '/':
                        sum /= v;
                        break;
                    default:
                        sum = v;
                        break;
                }
            }
            return to_count(sum, spec);
        }
        case LengthSpec::Kind::Remainder:
        case LengthSpec::Kind::FromEnd:
            return std::nullopt;
    }
    return std::nullopt;
}

std::optional<std::size_t> resolve_length(
    const LengthSpec& spec,
    const nlohmann::ordered_json* scope,
    const ByteCursor& cursor
) {
    if (spec.kind == LengthSpec::Kind::Remainder) {
        return std::nullopt;
    }
    if (spec.kind == LengthSpec::Kind::FromEnd) {
        const double n = static_cast<double>(cursor.remaining()) + static_cast<double>(spec.value);
        return to_count(n, spec);
    }
    return evaluate_length(spec, scope);
}

}  // namespace binstruct::schema
