/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <stdexcept>
#include <string>

namespace binstruct::schema {

// A read ran past the logical end of the data, or an array length resolved to
// something that cannot be read. Terminal for the decode call.
class OutOfBoundsError : public std::runtime_error {
   public:
    explicit OutOfBoundsError(const std::string& what) : std::runtime_error(what) {}
};

// A write needed more capacity on a cursor that is not allowed to grow.
class BufferFullError : public std::runtime_error {
   public:
    explicit BufferFullError(const std::string& what) : std::runtime_error(what) {}
};

// The schema itself is malformed (bad tag, undefined field reference, ...).
class SchemaError : public std::invalid_argument {
   public:
    explicit SchemaError(const std::string& what) : std::invalid_argument(what) {}
};

// The record handed to the encoder does not have the shape the schema expects.
class RecordError : public std::invalid_argument {
   public:
    explicit RecordError(const std::string& what) : std::invalid_argument(what) {}
};

}  // namespace binstruct::schema
