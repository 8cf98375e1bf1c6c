#include "variant.hpp"

uint8_t variant_value::header() const
{
    check_range(value_, 0, 1, "value header");
    return byte_at(value_, 0);
}

variant_kind variant_value::kind() const
{
    uint8_t h = header();
    switch (static_cast<basic_type>(h & BASIC_TYPE_MASK))
    {
    case basic_type::short_string:
        return variant_kind::short_string;
    case basic_type::object:
        return variant_kind::object;
    case basic_type::array:
        return variant_kind::array;
    case basic_type::primitive:
        break;
    }
    switch (static_cast<primitive_type>(h >> BASIC_TYPE_BITS))
    {
    case primitive_type::null_value:
        return variant_kind::null_value;
    case primitive_type::boolean_true:
    case primitive_type::boolean_false:
        return variant_kind::boolean;
    case primitive_type::int8:
        return variant_kind::int8;
    case primitive_type::int16:
        return variant_kind::int16;
    case primitive_type::int32:
        return variant_kind::int32;
    case primitive_type::int64:
        return variant_kind::int64;
    case primitive_type::double_value:
        return variant_kind::double_value;
    case primitive_type::decimal4:
        return variant_kind::decimal4;
    case primitive_type::decimal8:
        return variant_kind::decimal8;
    case primitive_type::decimal16:
        return variant_kind::decimal16;
    case primitive_type::date:
        return variant_kind::date;
    case primitive_type::timestamp_micros:
        return variant_kind::timestamp_micros;
    case primitive_type::timestamp_ntz_micros:
        return variant_kind::timestamp_ntz_micros;
    case primitive_type::float_value:
        return variant_kind::float_value;
    case primitive_type::binary:
        return variant_kind::binary;
    case primitive_type::string:
        return variant_kind::string;
    }
    throw variant_error(error_kind::invalid_header,
                        "unknown primitive type " + std::to_string(h >> BASIC_TYPE_BITS), 0);
}

bool variant_value::is_string() const
{
    variant_kind k = kind();
    return k == variant_kind::short_string || k == variant_kind::string;
}

bool variant_value::is_integer() const
{
    switch (kind())
    {
    case variant_kind::int8:
    case variant_kind::int16:
    case variant_kind::int32:
    case variant_kind::int64:
        return true;
    default:
        return false;
    }
}

void variant_value::mismatch(const char *wanted) const
{
    throw variant_error(error_kind::type_mismatch,
                        string("expected ") + wanted + ", found " + kind_name(kind()), 0);
}

string_view variant_value::payload(size_t count) const
{
    check_range(value_, 1, count, "value payload");
    return value_.substr(1, count);
}

string_view variant_value::length_prefixed() const
{
    check_range(value_, 1, 4, "length field");
    uint32_t length = read_le<uint32_t>(value_, 1);
    check_range(value_, 5, length, "length-prefixed payload");
    return value_.substr(5, length);
}

bool variant_value::as_bool() const
{
    if (kind() != variant_kind::boolean)
    {
        mismatch("boolean");
    }
    return static_cast<primitive_type>(value_header()) == primitive_type::boolean_true;
}

int64_t variant_value::as_int() const
{
    switch (kind())
    {
    case variant_kind::int8:
        return read_le<int8_t>(payload(1), 0);
    case variant_kind::int16:
        return read_le<int16_t>(payload(2), 0);
    case variant_kind::int32:
        return read_le<int32_t>(payload(4), 0);
    case variant_kind::int64:
        return read_le<int64_t>(payload(8), 0);
    default:
        mismatch("integer");
    }
}

float variant_value::as_float() const
{
    if (kind() != variant_kind::float_value)
    {
        mismatch("float");
    }
    return read_le<float>(payload(4), 0);
}

double variant_value::as_double() const
{
    if (kind() != variant_kind::double_value)
    {
        mismatch("double");
    }
    return read_le<double>(payload(8), 0);
}

variant_decimal variant_value::as_decimal() const
{
    variant_decimal result;
    switch (kind())
    {
    case variant_kind::decimal4:
    {
        string_view p = payload(5);
        result.scale = byte_at(p, 0);
        result.unscaled = read_le<int32_t>(p, 1);
        result.precision = DECIMAL4_MAX_PRECISION;
        break;
    }
    case variant_kind::decimal8:
    {
        string_view p = payload(9);
        result.scale = byte_at(p, 0);
        result.unscaled = read_le<int64_t>(p, 1);
        result.precision = DECIMAL8_MAX_PRECISION;
        break;
    }
    case variant_kind::decimal16:
    {
        string_view p = payload(17);
        result.scale = byte_at(p, 0);
        uint64_t low = read_le<uint64_t>(p, 1);
        int64_t high = read_le<int64_t>(p, 9);
        result.unscaled = static_cast<int128_t>((static_cast<unsigned __int128>(static_cast<uint64_t>(high)) << 64) | low);
        result.precision = DECIMAL16_MAX_PRECISION;
        break;
    }
    default:
        mismatch("decimal");
    }
    if (result.scale > result.precision)
    {
        throw variant_error(error_kind::decimal_out_of_range,
                            "decimal scale " + std::to_string(result.scale) + " exceeds " +
                                std::to_string(result.precision),
                            1);
    }
    return result;
}

int32_t variant_value::as_date() const
{
    if (kind() != variant_kind::date)
    {
        mismatch("date");
    }
    return read_le<int32_t>(payload(4), 0);
}

int64_t variant_value::as_timestamp_micros() const
{
    variant_kind k = kind();
    if (k != variant_kind::timestamp_micros && k != variant_kind::timestamp_ntz_micros)
    {
        mismatch("timestamp");
    }
    return read_le<int64_t>(payload(8), 0);
}

string_view variant_value::as_binary() const
{
    if (kind() != variant_kind::binary)
    {
        mismatch("binary");
    }
    return length_prefixed();
}

string_view variant_value::as_string() const
{
    variant_kind k = kind();
    if (k == variant_kind::short_string)
    {
        return payload(value_header());
    }
    if (k != variant_kind::string)
    {
        mismatch("string");
    }
    return length_prefixed();
}

variant_object variant_value::as_object() const
{
    if (basic() != basic_type::object)
    {
        mismatch("object");
    }
    return variant_object(*metadata_, value_);
}

variant_array variant_value::as_array() const
{
    if (basic() != basic_type::array)
    {
        mismatch("array");
    }
    return variant_array(*metadata_, value_);
}

size_t variant_value::size_bytes() const
{
    switch (kind())
    {
    case variant_kind::null_value:
    case variant_kind::boolean:
        return 1;
    case variant_kind::int8:
        return payload(1).size() + 1;
    case variant_kind::int16:
        return payload(2).size() + 1;
    case variant_kind::int32:
    case variant_kind::float_value:
    case variant_kind::date:
        return payload(4).size() + 1;
    case variant_kind::int64:
    case variant_kind::double_value:
    case variant_kind::timestamp_micros:
    case variant_kind::timestamp_ntz_micros:
        return payload(8).size() + 1;
    case variant_kind::decimal4:
        return payload(5).size() + 1;
    case variant_kind::decimal8:
        return payload(9).size() + 1;
    case variant_kind::decimal16:
        return payload(17).size() + 1;
    case variant_kind::binary:
    case variant_kind::string:
        return 5 + length_prefixed().size();
    case variant_kind::short_string:
        return 1 + payload(value_header()).size();
    case variant_kind::object:
        return as_object().size_bytes();
    case variant_kind::array:
        return as_array().size_bytes();
    }
    return 1;
}

// Object

variant_object::variant_object(const variant_metadata &metadata, string_view value)
    : metadata_(&metadata), value_(value)
{
    check_range(value_, 0, 1, "object header");
    uint8_t vh = byte_at(value_, 0) >> BASIC_TYPE_BITS;
    offset_size_ = (vh & 0x03) + 1;
    id_size_ = ((vh >> 2) & 0x03) + 1;
    unsigned count_size = ((vh >> 4) & 0x01) ? 4 : 1;

    check_range(value_, 1, count_size, "object field count");
    num_elements_ = read_uint_le(value_, 1, count_size);
    ids_start_ = 1 + count_size;

    uint64_t ids_size = static_cast<uint64_t>(num_elements_) * id_size_;
    uint64_t offsets_size = (static_cast<uint64_t>(num_elements_) + 1) * offset_size_;
    check_range(value_, ids_start_, ids_size + offsets_size, "object field tables");
    offsets_start_ = ids_start_ + ids_size;
    data_start_ = offsets_start_ + offsets_size;

    data_size_ = field_offset(num_elements_);
    check_range(value_, data_start_, data_size_, "object values");
}

uint32_t variant_object::field_offset(size_t index) const
{
    return read_uint_le(value_, offsets_start_ + index * offset_size_, offset_size_);
}

uint32_t variant_object::field_id(size_t index) const
{
    if (index >= num_elements_)
    {
        throw variant_error(error_kind::offset_out_of_bounds, "field index " + std::to_string(index) + " out of range");
    }
    return read_uint_le(value_, ids_start_ + index * id_size_, id_size_);
}

string_view variant_object::field_name(size_t index) const
{
    return metadata_->get(field_id(index));
}

variant_value variant_object::field_value(size_t index) const
{
    if (index >= num_elements_)
    {
        throw variant_error(error_kind::offset_out_of_bounds, "field index " + std::to_string(index) + " out of range");
    }
    uint32_t start = field_offset(index);
    if (start >= data_size_)
    {
        throw variant_error(error_kind::offset_out_of_bounds,
                            "field offset " + std::to_string(start) + " past object data of " +
                                std::to_string(data_size_) + " bytes",
                            offsets_start_ + index * offset_size_);
    }
    // Children may be stored out of id order, so a child is bounded by the end
    // of the data region and its own header decides its length.
    return variant_value(*metadata_, value_.substr(data_start_ + start, data_size_ - start));
}

std::optional<variant_value> variant_object::get(string_view name) const
{
    size_t low = 0;
    size_t high = num_elements_;
    while (low < high)
    {
        size_t mid = low + (high - low) / 2;
        int cmp = field_name(mid).compare(name);
        if (cmp == 0)
        {
            return field_value(mid);
        }
        if (cmp < 0)
        {
            low = mid + 1;
        }
        else
        {
            high = mid;
        }
    }
    return std::nullopt;
}

std::optional<variant_value> variant_object::get_by_id(uint32_t id) const
{
    if (!metadata_->is_sorted())
    {
        throw variant_error(error_kind::unsorted_dictionary, "field id lookup needs a sorted dictionary");
    }
    size_t low = 0;
    size_t high = num_elements_;
    while (low < high)
    {
        size_t mid = low + (high - low) / 2;
        uint32_t current = field_id(mid);
        if (current == id)
        {
            return field_value(mid);
        }
        if (current < id)
        {
            low = mid + 1;
        }
        else
        {
            high = mid;
        }
    }
    return std::nullopt;
}

// Array

variant_array::variant_array(const variant_metadata &metadata, string_view value)
    : metadata_(&metadata), value_(value)
{
    check_range(value_, 0, 1, "array header");
    uint8_t vh = byte_at(value_, 0) >> BASIC_TYPE_BITS;
    offset_size_ = (vh & 0x03) + 1;
    unsigned count_size = ((vh >> 2) & 0x01) ? 4 : 1;

    check_range(value_, 1, count_size, "array element count");
    num_elements_ = read_uint_le(value_, 1, count_size);
    offsets_start_ = 1 + count_size;

    uint64_t offsets_size = (static_cast<uint64_t>(num_elements_) + 1) * offset_size_;
    check_range(value_, offsets_start_, offsets_size, "array offsets");
    data_start_ = offsets_start_ + offsets_size;

    data_size_ = element_offset(num_elements_);
    check_range(value_, data_start_, data_size_, "array values");
}

uint32_t variant_array::element_offset(size_t index) const
{
    return read_uint_le(value_, offsets_start_ + index * offset_size_, offset_size_);
}

variant_value variant_array::element(size_t index) const
{
    if (index >= num_elements_)
    {
        throw variant_error(error_kind::offset_out_of_bounds,
                            "array index " + std::to_string(index) + " out of range");
    }
    uint32_t start = element_offset(index);
    uint32_t end = element_offset(index + 1);
    if (start > end || end > data_size_)
    {
        throw variant_error(error_kind::offset_out_of_bounds,
                            "array element " + std::to_string(index) + " spans [" + std::to_string(start) + ", " +
                                std::to_string(end) + ") outside " + std::to_string(data_size_) + " data bytes",
                            offsets_start_ + index * offset_size_);
    }
    return variant_value(*metadata_, value_.substr(data_start_ + start, end - start));
}

std::optional<variant_value> variant_array::get(size_t index) const
{
    if (index >= num_elements_)
    {
        return std::nullopt;
    }
    return element(index);
}
