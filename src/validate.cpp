#include "validate.hpp"
#include "metadata.hpp"
#include <algorithm>
#include <vector>
using std::vector;

namespace
{

[[noreturn]] void reject(error_kind kind, size_t offset, const string &message)
{
    throw variant_error(kind, message, offset);
}

void require(string_view s, size_t pos, uint64_t count, size_t base, const char *what)
{
    if (pos > s.size() || count > s.size() - pos)
    {
        reject(error_kind::offset_out_of_bounds, base + pos,
               string(what) + " needs " + std::to_string(count) + " bytes but only " +
                   std::to_string(pos > s.size() ? 0 : s.size() - pos) + " remain");
    }
}

// Payload size of each primitive type; strings and binaries add their length.
const unsigned PRIMITIVE_SIZES[MAX_PRIMITIVE_TYPE + 1] = {
    0,  // null
    0,  // true
    0,  // false
    1,  // int8
    2,  // int16
    4,  // int32
    8,  // int64
    8,  // double
    5,  // decimal4
    9,  // decimal8
    17, // decimal16
    4,  // date
    8,  // timestamp
    8,  // timestamp_ntz
    4,  // float
    4,  // binary length
    4,  // string length
};

void check_sorted_dictionary(const variant_metadata &metadata)
{
    for (uint32_t i = 1; i < metadata.size(); i++)
    {
        if (!(metadata.get(i - 1) < metadata.get(i)))
        {
            reject(error_kind::unsorted_dictionary, 1 + metadata.offset_size() * (i + 1),
                   "sorted dictionary entry " + std::to_string(i) + " is not greater than its predecessor");
        }
    }
}

class validator
{
public:
    validator(const variant_metadata &metadata, const validate_options &options)
        : metadata_(metadata), options_(options) {}

    // Validates the value spanning `s` (which starts at `base` in the value
    // buffer) and returns its encoded size.
    size_t value(string_view s, size_t base, size_t depth)
    {
        require(s, 0, 1, base, "value header");
        uint8_t header = byte_at(s, 0);
        uint8_t vh = header >> BASIC_TYPE_BITS;
        switch (static_cast<basic_type>(header & BASIC_TYPE_MASK))
        {
        case basic_type::primitive:
            return primitive(s, base, vh);
        case basic_type::short_string:
            require(s, 1, vh, base, "short string");
            utf8(s.substr(1, vh), base + 1);
            return 1 + vh;
        case basic_type::object:
            return object(s, base, vh, depth + 1);
        case basic_type::array:
            return array(s, base, vh, depth + 1);
        }
        return 0;
    }

private:
    void utf8(string_view bytes, size_t base)
    {
        if (!is_valid_utf8(bytes))
        {
            reject(error_kind::invalid_utf8, base, "string is not valid UTF-8");
        }
    }

    void nesting(size_t depth, size_t base)
    {
        if (depth > options_.max_depth)
        {
            reject(error_kind::recursion_limit_exceeded, base,
                   "nesting deeper than " + std::to_string(options_.max_depth));
        }
    }

    size_t primitive(string_view s, size_t base, uint8_t type_id)
    {
        if (type_id > MAX_PRIMITIVE_TYPE)
        {
            reject(error_kind::invalid_header, base, "unknown primitive type " + std::to_string(type_id));
        }
        unsigned size = PRIMITIVE_SIZES[type_id];
        require(s, 1, size, base, "primitive payload");
        switch (static_cast<primitive_type>(type_id))
        {
        case primitive_type::decimal4:
            decimal(byte_at(s, 1), read_le<int32_t>(s, 2), DECIMAL4_MAX_PRECISION, base);
            break;
        case primitive_type::decimal8:
            decimal(byte_at(s, 1), read_le<int64_t>(s, 2), DECIMAL8_MAX_PRECISION, base);
            break;
        case primitive_type::decimal16:
        {
            uint64_t low = read_le<uint64_t>(s, 2);
            int64_t high = read_le<int64_t>(s, 10);
            int128_t unscaled = static_cast<int128_t>(
                (static_cast<unsigned __int128>(static_cast<uint64_t>(high)) << 64) | low);
            decimal(byte_at(s, 1), unscaled, DECIMAL16_MAX_PRECISION, base);
            break;
        }
        case primitive_type::binary:
        case primitive_type::string:
        {
            uint32_t length = read_le<uint32_t>(s, 1);
            require(s, 5, length, base, "length-prefixed payload");
            if (static_cast<primitive_type>(type_id) == primitive_type::string)
            {
                if (length <= MAX_SHORT_STRING_SIZE)
                {
                    reject(error_kind::invalid_header, base,
                           "string of " + std::to_string(length) + " bytes must use the short string form");
                }
                utf8(s.substr(5, length), base + 5);
            }
            return 5 + static_cast<size_t>(length);
        }
        default:
            break;
        }
        return 1 + size;
    }

    void decimal(uint8_t scale, int128_t unscaled, uint8_t max_precision, size_t base)
    {
        if (scale > max_precision)
        {
            reject(error_kind::decimal_out_of_range, base + 1,
                   "decimal scale " + std::to_string(scale) + " exceeds " + std::to_string(max_precision));
        }
        int128_t limit = pow10_i128(max_precision);
        if (unscaled >= limit || unscaled <= -limit)
        {
            reject(error_kind::decimal_out_of_range, base + 2,
                   "decimal unscaled value has more than " + std::to_string(max_precision) + " digits");
        }
    }

    size_t object(string_view s, size_t base, uint8_t vh, size_t depth)
    {
        nesting(depth, base);
        if (vh & 0x20)
        {
            reject(error_kind::invalid_header, base, "reserved object header bit is set");
        }
        unsigned offset_size = (vh & 0x03) + 1;
        unsigned id_size = ((vh >> 2) & 0x03) + 1;
        unsigned count_size = ((vh >> 4) & 0x01) ? 4 : 1;

        require(s, 1, count_size, base, "object field count");
        uint32_t num_elements = read_uint_le(s, 1, count_size);
        size_t ids_start = 1 + count_size;
        uint64_t ids_size = static_cast<uint64_t>(num_elements) * id_size;
        uint64_t offsets_size = (static_cast<uint64_t>(num_elements) + 1) * offset_size;
        require(s, ids_start, ids_size + offsets_size, base, "object field tables");
        size_t offsets_start = ids_start + ids_size;
        size_t data_start = offsets_start + offsets_size;

        size_t last_at = offsets_start + static_cast<size_t>(num_elements) * offset_size;
        uint32_t data_size = read_uint_le(s, last_at, offset_size);
        require(s, data_start, data_size, base, "object values");
        if (num_elements == 0 && data_size != 0)
        {
            reject(error_kind::offset_out_of_bounds, base + last_at, "empty object with a non-empty data region");
        }

        vector<uint32_t> offsets(num_elements);
        string_view previous_name;
        for (uint32_t i = 0; i < num_elements; i++)
        {
            size_t id_at = ids_start + static_cast<size_t>(i) * id_size;
            uint32_t id = read_uint_le(s, id_at, id_size);
            if (id >= metadata_.size())
            {
                reject(error_kind::invalid_field_id, base + id_at,
                       "field id " + std::to_string(id) + " is not in a dictionary of " +
                           std::to_string(metadata_.size()) + " entries");
            }
            string_view name = metadata_.get(id);
            if (i > 0)
            {
                if (name == previous_name)
                {
                    reject(error_kind::duplicate_field, base + id_at, "duplicate field \"" + string(name) + "\"");
                }
                if (name < previous_name)
                {
                    reject(error_kind::unsorted_dictionary, base + id_at,
                           "field \"" + string(name) + "\" is out of name order");
                }
            }
            previous_name = name;

            size_t offset_at = offsets_start + static_cast<size_t>(i) * offset_size;
            offsets[i] = read_uint_le(s, offset_at, offset_size);
            if (offsets[i] >= data_size)
            {
                reject(error_kind::offset_out_of_bounds, base + offset_at,
                       "field offset " + std::to_string(offsets[i]) + " is past object data of " +
                           std::to_string(data_size) + " bytes");
            }
        }

        // Children may be stored in any physical order; each one ends where
        // the next larger offset begins.
        vector<uint32_t> starts(offsets);
        std::sort(starts.begin(), starts.end());
        if (!starts.empty() && starts.front() != 0)
        {
            reject(error_kind::offset_out_of_bounds, base + offsets_start, "object data does not start at offset zero");
        }
        for (uint32_t i = 0; i < num_elements; i++)
        {
            auto next = std::upper_bound(starts.begin(), starts.end(), offsets[i]);
            uint32_t end = next == starts.end() ? data_size : *next;
            child(s, base, data_start, offsets[i], end, depth);
        }
        return data_start + data_size;
    }

    size_t array(string_view s, size_t base, uint8_t vh, size_t depth)
    {
        nesting(depth, base);
        if (vh & 0x38)
        {
            reject(error_kind::invalid_header, base, "reserved array header bits are set");
        }
        unsigned offset_size = (vh & 0x03) + 1;
        unsigned count_size = ((vh >> 2) & 0x01) ? 4 : 1;

        require(s, 1, count_size, base, "array element count");
        uint32_t num_elements = read_uint_le(s, 1, count_size);
        size_t offsets_start = 1 + count_size;
        uint64_t offsets_size = (static_cast<uint64_t>(num_elements) + 1) * offset_size;
        require(s, offsets_start, offsets_size, base, "array offsets");
        size_t data_start = offsets_start + offsets_size;

        uint32_t data_size =
            read_uint_le(s, offsets_start + static_cast<size_t>(num_elements) * offset_size, offset_size);
        require(s, data_start, data_size, base, "array values");

        uint32_t start = read_uint_le(s, offsets_start, offset_size);
        if (start != 0)
        {
            reject(error_kind::offset_out_of_bounds, base + offsets_start, "first array offset is not zero");
        }
        for (uint32_t i = 0; i < num_elements; i++)
        {
            size_t end_at = offsets_start + (static_cast<size_t>(i) + 1) * offset_size;
            uint32_t end = read_uint_le(s, end_at, offset_size);
            if (end < start || end > data_size)
            {
                reject(error_kind::offset_out_of_bounds, base + end_at,
                       "array offset " + std::to_string(end) + " is outside [" + std::to_string(start) + ", " +
                           std::to_string(data_size) + "]");
            }
            child(s, base, data_start, start, end, depth);
            start = end;
        }
        return data_start + data_size;
    }

    // A child must fill its span exactly.
    void child(string_view s, size_t base, size_t data_start, uint32_t start, uint32_t end, size_t depth)
    {
        size_t child_base = base + data_start + start;
        size_t size = value(s.substr(data_start + start, end - start), child_base, depth);
        if (size != end - start)
        {
            reject(error_kind::offset_out_of_bounds, child_base,
                   "child value is " + std::to_string(size) + " bytes but its span is " +
                       std::to_string(end - start));
        }
    }

    const variant_metadata &metadata_;
    const validate_options &options_;
};

validation_result failure(const variant_error &error, bool in_metadata)
{
    validation_result result;
    result.valid = false;
    result.kind = error.kind();
    result.offset = error.offset() == NO_OFFSET ? 0 : error.offset();
    result.in_metadata = in_metadata;
    result.message = error.what();
    return result;
}

} // namespace

validation_result validate_metadata(string_view metadata)
{
    try
    {
        variant_metadata md(metadata);
        if (md.is_sorted())
        {
            check_sorted_dictionary(md);
        }
    }
    catch (const variant_error &e)
    {
        return failure(e, true);
    }
    return {};
}

validation_result validate_variant(string_view metadata, string_view value, const validate_options &options)
{
    validation_result md_result = validate_metadata(metadata);
    if (!md_result)
    {
        return md_result;
    }
    try
    {
        variant_metadata md(metadata);
        validator v(md, options);
        size_t size = v.value(value, 0, 0);
        if (size != value.size())
        {
            reject(error_kind::offset_out_of_bounds, size,
                   std::to_string(value.size() - size) + " trailing bytes after the root value");
        }
    }
    catch (const variant_error &e)
    {
        return failure(e, false);
    }
    return {};
}
