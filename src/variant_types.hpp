#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
using std::string;
using std::string_view;

using int128_t = __int128;

// Metadata header

const uint8_t VARIANT_VERSION = 1;
const uint8_t METADATA_VERSION_MASK = 0x0F;
const uint8_t METADATA_SORTED_MASK = 0x10;
const uint8_t METADATA_RESERVED_MASK = 0x20;
const unsigned METADATA_OFFSET_SIZE_SHIFT = 6;

// Value header

const unsigned BASIC_TYPE_BITS = 2;
const uint8_t BASIC_TYPE_MASK = 0x03;
const size_t MAX_SHORT_STRING_SIZE = 63;
const size_t MAX_SMALL_ELEMENTS = 255;

enum class basic_type : uint8_t
{
    primitive = 0,
    short_string = 1,
    object = 2,
    array = 3,
};

enum class primitive_type : uint8_t
{
    null_value = 0,
    boolean_true = 1,
    boolean_false = 2,
    int8 = 3,
    int16 = 4,
    int32 = 5,
    int64 = 6,
    double_value = 7,
    decimal4 = 8,
    decimal8 = 9,
    decimal16 = 10,
    date = 11,
    timestamp_micros = 12,
    timestamp_ntz_micros = 13,
    float_value = 14,
    binary = 15,
    string = 16,
};

const uint8_t MAX_PRIMITIVE_TYPE = 16;

enum class variant_kind
{
    null_value,
    boolean,
    int8,
    int16,
    int32,
    int64,
    float_value,
    double_value,
    decimal4,
    decimal8,
    decimal16,
    date,
    timestamp_micros,
    timestamp_ntz_micros,
    binary,
    short_string,
    string,
    object,
    array,
};

const char *kind_name(variant_kind kind);

// Largest number of decimal digits each decimal width can hold.
const uint8_t DECIMAL4_MAX_PRECISION = 9;
const uint8_t DECIMAL8_MAX_PRECISION = 18;
const uint8_t DECIMAL16_MAX_PRECISION = 38;

struct variant_decimal
{
    int128_t unscaled = 0;
    uint8_t precision = 0;
    uint8_t scale = 0;
};

// 10^digits, digits <= 38
int128_t pow10_i128(unsigned digits);

// Number of decimal digits in |value| (0 has one digit).
unsigned decimal_digits(int128_t value);

enum class error_kind
{
    unsupported_version,
    offset_out_of_bounds,
    invalid_utf8,
    duplicate_field,
    type_mismatch,
    unsorted_dictionary,
    recursion_limit_exceeded,
    json_parse_error,
    invalid_header,
    invalid_field_id,
    decimal_out_of_range,
    value_too_large,
};

const char *error_kind_name(error_kind kind);

const size_t NO_OFFSET = static_cast<size_t>(-1);

class variant_error : public std::runtime_error
{
public:
    variant_error(error_kind kind, const string &message, size_t offset = NO_OFFSET)
        : std::runtime_error(message), kind_(kind), offset_(offset) {}

    error_kind kind() const noexcept { return kind_; }

    // Byte offset where the problem was detected, or NO_OFFSET.
    size_t offset() const noexcept { return offset_; }

private:
    error_kind kind_;
    size_t offset_;
};

class json_error : public variant_error
{
public:
    json_error(error_kind kind, size_t position, const string &message)
        : variant_error(kind, message + " at position " + std::to_string(position)), position_(position) {}

    size_t position() const noexcept { return position_; }

private:
    size_t position_;
};

inline uint8_t make_header(basic_type basic, uint8_t value_header)
{
    return static_cast<uint8_t>((value_header << BASIC_TYPE_BITS) | static_cast<uint8_t>(basic));
}

inline uint8_t primitive_header(primitive_type type)
{
    return make_header(basic_type::primitive, static_cast<uint8_t>(type));
}

inline uint8_t byte_at(string_view s, size_t pos)
{
    return static_cast<uint8_t>(s[pos]);
}

// Minimal byte width (1..4) that represents `value`.
inline unsigned minimal_width(uint32_t value)
{
    if (value <= 0xFF)
    {
        return 1;
    }
    if (value <= 0xFFFF)
    {
        return 2;
    }
    if (value <= 0xFFFFFF)
    {
        return 3;
    }
    return 4;
}

// Reads a `width`-byte little-endian unsigned integer at `pos`. Bounds are the caller's job.
inline uint32_t read_uint_le(string_view s, size_t pos, unsigned width)
{
    uint32_t value = 0;
    for (unsigned i = 0; i < width; i++)
    {
        value |= static_cast<uint32_t>(byte_at(s, pos + i)) << (8 * i);
    }
    return value;
}

template <typename T>
inline T read_le(string_view s, size_t pos)
{
    unsigned char bytes[sizeof(T)];
    memcpy(bytes, s.data() + pos, sizeof(T));
#if defined(__BYTE_ORDER__) && __BYTE_ORDER__ == __ORDER_BIG_ENDIAN__
    std::reverse(bytes, bytes + sizeof(T));
#endif
    T value;
    memcpy(&value, bytes, sizeof(T));
    return value;
}

// Throws offset_out_of_bounds unless [pos, pos + count) lies inside `s`.
inline void check_range(string_view s, size_t pos, size_t count, const char *what)
{
    if (pos > s.size() || count > s.size() - pos)
    {
        throw variant_error(error_kind::offset_out_of_bounds,
                            string(what) + " out of bounds: needs " + std::to_string(count) + " bytes at offset " +
                                std::to_string(pos) + ", buffer has " + std::to_string(s.size()),
                            pos);
    }
}

bool is_valid_utf8(string_view s);
