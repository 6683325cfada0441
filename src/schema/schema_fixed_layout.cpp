/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "schema/schema_fixed_layout.h"
#include "schema/schema_byte_cursor.h"
#include "schema/schema_decoder.h"
#include "schema/schema_encoder.h"

#include <algorithm>
#include <stdexcept>

namespace binstruct::schema {

FixedLayout FixedLayout::build(const Schema& schema) {
    const auto* root = schema.root().get_if<StructNode>();
    if (root == nullptr) {
        throw SchemaError("A fixed layout needs a struct at the schema root");
    }

    FixedLayout out{};
    for (const auto& f : root->fields) {
        const auto width = fixed_width(*f.node);
        if (!width.has_value()) {
            throw SchemaError("Field '" + f.name + "' has no fixed size");
        }
        if (has_reference(*f.node)) {
            throw SchemaError("Field '" + f.name + "' carries a reference constraint");
        }
        out.fields_.push_back(LayoutField{f.name, out.size_, *width, f.node});
        out.size_ += *width;
    }
    return out;
}

const LayoutField& FixedLayout::field(std::string_view name) const {
    const auto it = std::find_if(fields_.begin(), fields_.end(), [&](const LayoutField& f) {
        return f.name == name;
    });
    if (it == fields_.end()) {
        throw std::out_of_range("No field named '" + std::string(name) + "' in layout");
    }
    return *it;
}

void FixedLayout::require_size(std::size_t available) const {
    if (available < size_) {
        throw OutOfBoundsError(
            "Buffer of " + std::to_string(available) + " bytes is smaller than the layout ("
            + std::to_string(size_) + ")"
        );
    }
}

nlohmann::ordered_json FixedLayout::get(std::span<const std::uint8_t> bytes, std::string_view name) const {
    require_size(bytes.size());
    const auto& f = field(name);
    ByteCursor cursor(bytes.subspan(f.offset, f.size));
    auto value = decode_node(*f.node, cursor);
    if (!value.has_value()) {
        throw SchemaError("Field '" + f.name + "' did not decode");
    }
    return std::move(*value);
}

void FixedLayout::set(
    std::span<std::uint8_t> bytes,
    std::string_view name,
    const nlohmann::ordered_json& value
) const {
    require_size(bytes.size());
    const auto& f = field(name);
    ByteCursor cursor(f.size, Endian::Big, false);
    encode_node(*f.node, cursor, value, nullptr, "$." + f.name);
    const auto written = cursor.bytes();
    std::copy(written.begin(), written.end(), bytes.begin() + static_cast<std::ptrdiff_t>(f.offset));
}

nlohmann::ordered_json FixedLayout::read_all(std::span<const std::uint8_t> bytes) const {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    for (const auto& f : fields_) {
        out[f.name] = get(bytes, f.name);
    }
    return out;
}

}  // namespace binstruct::schema
