/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "schema_compiler.h"
#include "schema_node.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace binstruct::schema {

struct LayoutField {
    std::string name;
    std::size_t offset = 0;
    std::size_t size = 0;
    NodePtr node;
};

// Random access to the fields of a struct whose members all sit at fixed
// offsets. Reads and writes touch only the addressed field's bytes.
class FixedLayout {
   public:
    static FixedLayout build(const Schema& schema);

    std::size_t size() const { return size_; }
    const std::vector<LayoutField>& fields() const { return fields_; }
    const LayoutField& field(std::string_view name) const;

    nlohmann::ordered_json get(std::span<const std::uint8_t> bytes, std::string_view name) const;
    void set(std::span<std::uint8_t> bytes, std::string_view name, const nlohmann::ordered_json& value) const;

    // Every field, in declaration order.
    nlohmann::ordered_json read_all(std::span<const std::uint8_t> bytes) const;

   private:
    void require_size(std::size_t available) const;

    std::vector<LayoutField> fields_;
    std::size_t size_ = 0;
};

}  // namespace binstruct::schema
