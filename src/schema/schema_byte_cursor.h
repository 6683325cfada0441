/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include "schema_errors.h"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace binstruct::schema {

enum class Endian : std::uint8_t {
    Big,
    Little,
};

constexpr Endian native_endian() {
    return std::endian::native == std::endian::little ? Endian::Little : Endian::Big;
}

// Reverses the bytes of every element_size-wide slot in place.
void flip_endianness(std::span<std::uint8_t> bytes, std::size_t element_size);

// Field text is one code point per byte (U+0000..U+00FF), stored as UTF-8 so
// records dump as valid JSON. bytes_to_text maps raw bytes to that form;
// text_to_bytes reverses it and returns nullopt for malformed UTF-8 or a code
// point above U+00FF.
std::string bytes_to_text(std::string_view bytes);
std::optional<std::string> text_to_bytes(std::string_view text);

template <typename T>
void flip_endianness(std::span<T> values) {
    flip_endianness(
        std::span<std::uint8_t>(reinterpret_cast<std::uint8_t*>(values.data()), values.size_bytes()),
        sizeof(T)
    );
}

// Result of ByteCursor::map_array. Either a view straight into the cursor's
// buffer or an owned copy; both hold values in native byte order. A view is
// invalidated by any write that grows the cursor.
template <typename T>
class TypedArray {
   public:
    TypedArray() = default;

    static TypedArray view(std::span<const T> values) {
        TypedArray out;
        out.view_ = values;
        out.zero_copy_ = true;
        return out;
    }

    static TypedArray owned(std::vector<T> values) {
        TypedArray out;
        out.owned_ = std::move(values);
        out.zero_copy_ = false;
        return out;
    }

    bool zero_copy() const { return zero_copy_; }
    std::size_t size() const { return zero_copy_ ? view_.size() : owned_.size(); }
    std::size_t byte_length() const { return size() * sizeof(T); }
    bool empty() const { return size() == 0; }

    std::span<const T> values() const {
        return zero_copy_ ? view_ : std::span<const T>(owned_.data(), owned_.size());
    }

    T operator[](std::size_t i) const { return values()[i]; }

    std::vector<T> to_vector() const {
        const auto v = values();
        return std::vector<T>(v.begin(), v.end());
    }

   private:
    std::span<const T> view_;
    std::vector<T> owned_;
    bool zero_copy_ = false;
};

class ByteCursor {
   public:
    static constexpr std::size_t kMinCapacity = 32;

    explicit ByteCursor(
        std::size_t initial_capacity = 0,
        Endian default_endian = Endian::Big,
        bool growable = true
    );
    explicit ByteCursor(
        std::vector<std::uint8_t> data,
        Endian default_endian = Endian::Big,
        bool growable = true
    );
    explicit ByteCursor(
        std::span<const std::uint8_t> data,
        Endian default_endian = Endian::Big,
        bool growable = true
    );

    std::size_t position() const { return _pos; }
    // Clamped to [0, length()]; NaN and infinities land on 0.
    void seek(double pos);

    std::size_t length() const { return _length; }
    std::size_t capacity() const { return _buf.size(); }
    std::size_t remaining() const { return _length - _pos; }
    bool eof() const { return _pos == _length; }

    bool growable() const { return _growable; }
    void set_growable(bool growable) { _growable = growable; }
    Endian default_endian() const { return _endian; }
    void set_default_endian(Endian endian) { _endian = endian; }

    const std::uint8_t* data() const { return _buf.data(); }
    std::span<const std::uint8_t> bytes() const {
        return std::span<const std::uint8_t>(_buf.data(), _length);
    }
    std::vector<std::uint8_t> take_bytes();

    std::uint8_t read_u8();
    std::int8_t read_i8();
    std::uint16_t read_u16(std::optional<Endian> endian = std::nullopt);
    std::int16_t read_i16(std::optional<Endian> endian = std::nullopt);
    std::uint32_t read_u32(std::optional<Endian> endian = std::nullopt);
    std::int32_t read_i32(std::optional<Endian> endian = std::nullopt);
    float read_f32(std::optional<Endian> endian = std::nullopt);
    double read_f64(std::optional<Endian> endian = std::nullopt);

    void write_u8(std::uint8_t v);
    void write_i8(std::int8_t v);
    void write_u16(std::uint16_t v, std::optional<Endian> endian = std::nullopt);
    void write_i16(std::int16_t v, std::optional<Endian> endian = std::nullopt);
    void write_u32(std::uint32_t v, std::optional<Endian> endian = std::nullopt);
    void write_i32(std::int32_t v, std::optional<Endian> endian = std::nullopt);
    void write_f32(float v, std::optional<Endian> endian = std::nullopt);
    void write_f64(double v, std::optional<Endian> endian = std::nullopt);

    // Exactly `length` raw bytes.
    std::string read_string(std::size_t length);
    // Stops at the first NUL. With max_length > 0 the whole max_length slot is
    // consumed; otherwise the terminator is consumed and must be present.
    std::string read_cstring(std::size_t max_length = 0);

    // Writes at most padded_to bytes of `s`, zero filling the rest of the slot.
    void write_string(std::string_view s, std::size_t padded_to);
    // padded_to == 0 writes `s` and a terminating zero.
    void write_cstring(std::string_view s, std::size_t padded_to = 0);
    void write_bytes(std::span<const std::uint8_t> bytes);
    void write_zeros(std::size_t count);

    void skip(std::size_t count);

    template <typename T>
    TypedArray<T> map_array(std::size_t count, std::optional<Endian> endian = std::nullopt) {
        static_assert(std::is_arithmetic_v<T>, "map_array needs a scalar element type");
        if (count > (_length - _pos) / sizeof(T)) {
            throw OutOfBoundsError(
                "map_array of " + std::to_string(count) + " elements at offset "
                + std::to_string(_pos) + " runs past end of data ("
                + std::to_string(_length) + ")"
            );
        }
        const std::size_t byte_len = count * sizeof(T);
        const std::uint8_t* src = _buf.data() + _pos;
        const Endian order = endian.value_or(_endian);
        const bool needs_swap = sizeof(T) > 1 && order != native_endian();
        const bool aligned = reinterpret_cast<std::uintptr_t>(src) % alignof(T) == 0;

        TypedArray<T> out;
        if (aligned && !needs_swap) {
            out = TypedArray<T>::view(std::span<const T>(reinterpret_cast<const T*>(src), count));
        } else {
            std::vector<T> copy(count);
            if (byte_len != 0) {
                std::memcpy(copy.data(), src, byte_len);
            }
            if (needs_swap) {
                flip_endianness(std::span<T>(copy));
            }
            out = TypedArray<T>::owned(std::move(copy));
        }
        _pos += byte_len;
        return out;
    }

   private:
    template <typename T>
    T read_scalar(std::optional<Endian> endian);
    template <typename T>
    void write_scalar(T value, std::optional<Endian> endian);

    void require_readable(std::size_t count, const char* what) const;
    void ensure_capacity(std::size_t more_bytes);
    void commit(std::size_t count);

    std::vector<std::uint8_t> _buf;
    std::size_t _pos = 0;
    std::size_t _length = 0;
    Endian _endian = Endian::Big;
    bool _growable = true;
};

}  // namespace binstruct::schema
