/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#include "schema/schema_byte_cursor.h"

#include <algorithm>
#include <array>
#include <cmath>

namespace binstruct::schema {

void flip_endianness(std::span<std::uint8_t> bytes, std::size_t element_size) {
    if (element_size == 0) {
        throw std::invalid_argument("element_size must be > 0");
    }
    if (bytes.size() % element_size != 0) {
        throw std::invalid_argument("byte count is not a multiple of element_size");
    }
    for (std::size_t i = 0; i < bytes.size(); i += element_size) {
        std::reverse(bytes.begin() + i, bytes.begin() + i + element_size);
    }
}

std::string bytes_to_text(std::string_view bytes) {
    std::string out;
    out.reserve(bytes.size());
    for (const char c : bytes) {
        const auto b = static_cast<std::uint8_t>(c);
        if (b < 0x80) {
            out.push_back(static_cast<char>(b));
        } else {
            out.push_back(static_cast<char>(0xC0 | (b >> 6)));
            out.push_back(static_cast<char>(0x80 | (b & 0x3F)));
        }
    }
    return out;
}

std::optional<std::string> text_to_bytes(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); i++) {
        const auto b = static_cast<std::uint8_t>(text[i]);
        if (b < 0x80) {
            out.push_back(static_cast<char>(b));
            continue;
        }
        // Only the two-byte sequences C2 xx and C3 xx encode U+0080..U+00FF.
        if ((b != 0xC2 && b != 0xC3) || i + 1 >= text.size()) {
            return std::nullopt;
        }
        const auto next = static_cast<std::uint8_t>(text[i + 1]);
        if ((next & 0xC0) != 0x80) {
            return std::nullopt;
        }
        out.push_back(static_cast<char>(((b & 0x03) << 6) | (next & 0x3F)));
        i++;
    }
    return out;
}

ByteCursor::ByteCursor(std::size_t initial_capacity, Endian default_endian, bool growable)
    : _buf(initial_capacity, 0), _pos(0), _length(0), _endian(default_endian), _growable(growable) {}

ByteCursor::ByteCursor(std::vector<std::uint8_t> data, Endian default_endian, bool growable)
    : _buf(std::move(data)), _pos(0), _endian(default_endian), _growable(growable) {
    _length = _buf.size();
}

ByteCursor::ByteCursor(std::span<const std::uint8_t> data, Endian default_endian, bool growable)
    : _buf(data.begin(), data.end()),
      _pos(0),
      _length(data.size()),
      _endian(default_endian),
      _growable(growable) {}

void ByteCursor::seek(double pos) {
    if (!std::isfinite(pos) || pos <= 0.0) {
        _pos = 0;
        return;
    }
    const double end = static_cast<double>(_length);
    _pos = pos >= end ? _length : static_cast<std::size_t>(pos);
}

std::vector<std::uint8_t> ByteCursor::take_bytes() {
    std::vector<std::uint8_t> out = std::move(_buf);
    out.resize(_length);
    _buf.clear();
    _pos = 0;
    _length = 0;
    return out;
}

void ByteCursor::require_readable(std::size_t count, const char* what) const {
    if (count > _length - _pos) {
        throw OutOfBoundsError(
            std::string(what) + " of " + std::to_string(count) + " bytes at offset "
            + std::to_string(_pos) + " runs past end of data (" + std::to_string(_length) + ")"
        );
    }
}

void ByteCursor::ensure_capacity(std::size_t more_bytes) {
    const std::size_t need = _pos + more_bytes;
    if (need < _pos) {
        throw BufferFullError("write size overflows the address space");
    }
    if (need <= _buf.size()) {
        return;
    }
    if (!_growable) {
        throw BufferFullError(
            "write of " + std::to_string(more_bytes) + " bytes at offset " + std::to_string(_pos)
            + " exceeds fixed capacity " + std::to_string(_buf.size())
        );
    }
    std::size_t new_len = std::max(_buf.size(), kMinCapacity);
    while (new_len < need) {
        new_len *= 2;
    }
    _buf.resize(new_len, 0);
}

void ByteCursor::commit(std::size_t count) {
    _pos += count;
    if (_pos > _length) {
        _length = _pos;
    }
}

template <typename T>
T ByteCursor::read_scalar(std::optional<Endian> endian) {
    require_readable(sizeof(T), "read");
    std::array<std::uint8_t, sizeof(T)> raw{};
    std::memcpy(raw.data(), _buf.data() + _pos, sizeof(T));
    if (endian.value_or(_endian) != native_endian()) {
        std::reverse(raw.begin(), raw.end());
    }
    _pos += sizeof(T);
    return std::bit_cast<T>(raw);
}

template <typename T>
void ByteCursor::write_scalar(T value, std::optional<Endian> endian) {
    ensure_capacity(sizeof(T));
    auto raw = std::bit_cast<std::array<std::uint8_t, sizeof(T)>>(value);
    if (endian.value_or(_endian) != native_endian()) {
        std::reverse(raw.begin(), raw.end());
    }
    std::memcpy(_buf.data() + _pos, raw.data(), sizeof(T));
    commit(sizeof(T));
}

std::uint8_t ByteCursor::read_u8() {
    return read_scalar<std::uint8_t>(std::nullopt);
}

std::int8_t ByteCursor::read_i8() {
    return read_scalar<std::int8_t>(std::nullopt);
}

std::uint16_t ByteCursor::read_u16(std::optional<Endian> endian) {
    return read_scalar<std::uint16_t>(endian);
}

std::int16_t ByteCursor::read_i16(std::optional<Endian> endian) {
    return read_scalar<std::int16_t>(endian);
}

std::uint32_t ByteCursor::read_u32(std::optional<Endian> endian) {
    return read_scalar<std::uint32_t>(endian);
}

std::int32_t ByteCursor::read_i32(std::optional<Endian> endian) {
    return read_scalar<std::int32_t>(endian);
}

float ByteCursor::read_f32(std::optional<Endian> endian) {
    return read_scalar<float>(endian);
}

double ByteCursor::read_f64(std::optional<Endian> endian) {
    return read_scalar<double>(endian);
}

void ByteCursor::write_u8(std::uint8_t v) {
    write_scalar(v, std::nullopt);
}

void ByteCursor::write_i8(std::int8_t v) {
    write_scalar(v, std::nullopt);
}

void ByteCursor::write_u16(std::uint16_t v, std::optional<Endian> endian) {
    write_scalar(v, endian);
}

void ByteCursor::write_i16(std::int16_t v, std::optional<Endian> endian) {
    write_scalar(v, endian);
}

void ByteCursor::write_u32(std::uint32_t v, std::optional<Endian> endian) {
    write_scalar(v, endian);
}

void ByteCursor::write_i32(std::int32_t v, std::optional<Endian> endian) {
    write_scalar(v, endian);
}

void ByteCursor::write_f32(float v, std::optional<Endian> endian) {
    write_scalar(v, endian);
}

void ByteCursor::write_f64(double v, std::optional<Endian> endian) {
    write_scalar(v, endian);
}

std::string ByteCursor::read_string(std::size_t length) {
    require_readable(length, "read_string");
    std::string out(reinterpret_cast<const char*>(_buf.data() + _pos), length);
    _pos += length;
    return out;
}

std::string ByteCursor::read_cstring(std::size_t max_length) {
    if (max_length > 0) {
        require_readable(max_length, "read_cstring");
        const std::uint8_t* start = _buf.data() + _pos;
        const auto* end = std::find(start, start + max_length, std::uint8_t{0});
        std::string out(reinterpret_cast<const char*>(start), static_cast<std::size_t>(end - start));
        _pos += max_length;
        return out;
    }

    const std::uint8_t* start = _buf.data() + _pos;
    const std::uint8_t* limit = _buf.data() + _length;
    const auto* end = std::find(start, limit, std::uint8_t{0});
    if (end == limit) {
        throw OutOfBoundsError(
            "Unterminated cstring at offset " + std::to_string(_pos) + " (data ends at "
            + std::to_string(_length) + ")"
        );
    }
    std::string out(reinterpret_cast<const char*>(start), static_cast<std::size_t>(end - start));
    _pos += out.size() + 1;
    return out;
}

void ByteCursor::write_string(std::string_view s, std::size_t padded_to) {
    const std::size_t n = std::min(s.size(), padded_to);
    ensure_capacity(padded_to);
    if (n != 0) {
        std::memcpy(_buf.data() + _pos, s.data(), n);
    }
    std::fill(_buf.begin() + static_cast<std::ptrdiff_t>(_pos + n),
              _buf.begin() + static_cast<std::ptrdiff_t>(_pos + padded_to), std::uint8_t{0});
    commit(padded_to);
}

void ByteCursor::write_cstring(std::string_view s, std::size_t padded_to) {
    if (padded_to > 0) {
        write_string(s, padded_to);
        return;
    }
    ensure_capacity(s.size() + 1);
    if (!s.empty()) {
        std::memcpy(_buf.data() + _pos, s.data(), s.size());
    }
    _buf[_pos + s.size()] = 0;
    commit(s.size() + 1);
}

void ByteCursor::write_bytes(std::span<const std::uint8_t> bytes) {
    if (bytes.empty()) {
        return;
    }
    ensure_capacity(bytes.size());
    std::memcpy(_buf.data() + _pos, bytes.data(), bytes.size());
    commit(bytes.size());
}

void ByteCursor::write_zeros(std::size_t count) {
    if (count == 0) {
        return;
    }
    ensure_capacity(count);
    std::fill(_buf.begin() + static_cast<std::ptrdiff_t>(_pos),
              _buf.begin() + static_cast<std::ptrdiff_t>(_pos + count), std::uint8_t{0});
    commit(count);
}

void ByteCursor::skip(std::size_t count) {
    require_readable(count, "skip");
    _pos += count;
}

}  // namespace binstruct::schema
