#include "variant_types.hpp"
#include "simdjson.h"

const char *kind_name(variant_kind kind)
{
    switch (kind)
    {
    case variant_kind::null_value:
        return "null";
    case variant_kind::boolean:
        return "boolean";
    case variant_kind::int8:
        return "int8";
    case variant_kind::int16:
        return "int16";
    case variant_kind::int32:
        return "int32";
    case variant_kind::int64:
        return "int64";
    case variant_kind::float_value:
        return "float";
    case variant_kind::double_value:
        return "double";
    case variant_kind::decimal4:
        return "decimal4";
    case variant_kind::decimal8:
        return "decimal8";
    case variant_kind::decimal16:
        return "decimal16";
    case variant_kind::date:
        return "date";
    case variant_kind::timestamp_micros:
        return "timestamp";
    case variant_kind::timestamp_ntz_micros:
        return "timestamp_ntz";
    case variant_kind::binary:
        return "binary";
    case variant_kind::short_string:
        return "short_string";
    case variant_kind::string:
        return "string";
    case variant_kind::object:
        return "object";
    case variant_kind::array:
        return "array";
    }
    return "unknown";
}

const char *error_kind_name(error_kind kind)
{
    switch (kind)
    {
    case error_kind::unsupported_version:
        return "UnsupportedVersion";
    case error_kind::offset_out_of_bounds:
        return "OffsetOutOfBounds";
    case error_kind::invalid_utf8:
        return "InvalidUtf8";
    case error_kind::duplicate_field:
        return "DuplicateField";
    case error_kind::type_mismatch:
        return "TypeMismatch";
    case error_kind::unsorted_dictionary:
        return "UnsortedDictionary";
    case error_kind::recursion_limit_exceeded:
        return "RecursionLimitExceeded";
    case error_kind::json_parse_error:
        return "JsonParseError";
    case error_kind::invalid_header:
        return "InvalidHeader";
    case error_kind::invalid_field_id:
        return "InvalidFieldId";
    case error_kind::decimal_out_of_range:
        return "DecimalOutOfRange";
    case error_kind::value_too_large:
        return "ValueTooLarge";
    }
    return "Unknown";
}

int128_t pow10_i128(unsigned digits)
{
    int128_t result = 1;
    for (unsigned i = 0; i < digits; i++)
    {
        result *= 10;
    }
    return result;
}

unsigned decimal_digits(int128_t value)
{
    // Magnitude as unsigned so the most negative value does not overflow.
    unsigned __int128 magnitude = value < 0 ? static_cast<unsigned __int128>(0) - static_cast<unsigned __int128>(value)
                                            : static_cast<unsigned __int128>(value);
    unsigned digits = 1;
    while (magnitude >= 10)
    {
        magnitude /= 10;
        digits++;
    }
    return digits;
}

bool is_valid_utf8(string_view s)
{
    return simdjson::validate_utf8(s.data(), s.size());
}
