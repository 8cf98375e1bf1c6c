#include "print_json.hpp"
#include <charconv>
#include <cmath>

namespace
{

const char BASE64_CHARS[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

void append_base64(growing_string &out, string_view bytes)
{
    out.reserve_extra((bytes.size() + 2) / 3 * 4 + 2);
    out.append('"');
    uint32_t value = 0;
    unsigned bits = 0;
    for (char c : bytes)
    {
        value = (value << 8) | static_cast<uint8_t>(c);
        bits += 8;
        while (bits >= 6)
        {
            bits -= 6;
            out.append(BASE64_CHARS[(value >> bits) & 0x3F]);
        }
        value &= (1u << bits) - 1;
    }
    if (bits > 0)
    {
        out.append(BASE64_CHARS[(value << (6 - bits)) & 0x3F]);
    }
    for (size_t n = (bytes.size() + 2) / 3 * 4 - (bytes.size() * 8 + 5) / 6; n > 0; n--)
    {
        out.append('=');
    }
    out.append('"');
}

template <typename T>
void append_number(growing_string &out, T value)
{
    char buf[64];
    auto result = std::to_chars(buf, buf + sizeof(buf), value);
    out.append(string_view(buf, result.ptr - buf));
}

// Shortest round-trip form, always with a fraction or an exponent.
template <typename T>
void append_floating(growing_string &out, T value)
{
    if (!std::isfinite(value))
    {
        out.append("null");
        return;
    }
    char buf[64];
    auto result = std::to_chars(buf, buf + sizeof(buf), value);
    string_view text(buf, result.ptr - buf);
    out.append(text);
    if (text.find_first_of(".e") == string_view::npos)
    {
        out.append(".0");
    }
}

void append_decimal(growing_string &out, const variant_decimal &decimal)
{
    unsigned __int128 magnitude = decimal.unscaled < 0 ? -static_cast<unsigned __int128>(decimal.unscaled)
                                                       : static_cast<unsigned __int128>(decimal.unscaled);
    // Scale is at most 38 (checked by as_decimal), magnitude at most 39 digits.
    char digits[40];
    size_t n = 0;
    do
    {
        digits[n++] = static_cast<char>('0' + static_cast<unsigned>(magnitude % 10));
        magnitude /= 10;
    } while (magnitude != 0);
    while (n <= decimal.scale)
    {
        digits[n++] = '0';
    }
    if (decimal.unscaled < 0)
    {
        out.append('-');
    }
    for (size_t i = n; i > 0; i--)
    {
        if (i == decimal.scale && decimal.scale > 0)
        {
            out.append('.');
        }
        out.append(digits[i - 1]);
    }
}

void append_padded(growing_string &out, int64_t value, unsigned width)
{
    uint64_t magnitude = static_cast<uint64_t>(value);
    if (value < 0)
    {
        out.append('-');
        magnitude = 0 - magnitude;
    }
    char buf[24];
    auto result = std::to_chars(buf, buf + sizeof(buf), magnitude);
    for (size_t len = result.ptr - buf; len < width; len++)
    {
        out.append('0');
    }
    out.append(string_view(buf, result.ptr - buf));
}

// Proleptic Gregorian date of a day count since 1970-01-01, with 64-bit years.
void append_civil_date(growing_string &out, int64_t days)
{
    int64_t z = days + 719468;
    int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    int64_t doe = z - era * 146097;
    int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    int64_t mp = (5 * doy + 2) / 153;
    int64_t day = doy - (153 * mp + 2) / 5 + 1;
    int64_t month = mp < 10 ? mp + 3 : mp - 9;
    int64_t year = yoe + era * 400 + (month <= 2 ? 1 : 0);

    append_padded(out, year, 4);
    out.append('-');
    append_padded(out, month, 2);
    out.append('-');
    append_padded(out, day, 2);
}

void append_date(growing_string &out, int32_t days)
{
    out.append('"');
    append_civil_date(out, days);
    out.append('"');
}

const int64_t MICROS_PER_SECOND = 1000000;
const int64_t MICROS_PER_DAY = 86400 * MICROS_PER_SECOND;

void append_timestamp(growing_string &out, int64_t micros, bool utc)
{
    int64_t days = micros / MICROS_PER_DAY;
    int64_t tod = micros % MICROS_PER_DAY;
    if (tod < 0)
    {
        tod += MICROS_PER_DAY;
        days--;
    }
    int64_t seconds = tod / MICROS_PER_SECOND;

    out.append('"');
    append_civil_date(out, days);
    out.append('T');
    append_padded(out, seconds / 3600, 2);
    out.append(':');
    append_padded(out, seconds / 60 % 60, 2);
    out.append(':');
    append_padded(out, seconds % 60, 2);
    out.append('.');
    append_padded(out, tod % MICROS_PER_SECOND, 6);
    if (utc)
    {
        out.append("+00:00");
    }
    out.append('"');
}

struct json_printer
{
    growing_string &out;
    const unsigned flags;
    const size_t max_depth;
    const char *root;
    growing_string indent;

    void nesting(const variant_value &value, size_t depth)
    {
        if (depth > max_depth)
        {
            throw variant_error(error_kind::recursion_limit_exceeded,
                                "nesting deeper than " + std::to_string(max_depth),
                                value.bytes().data() - root);
        }
    }

    void open(char bracket)
    {
        out.append(bracket);
        if (flags & NEWLINE)
        {
            out.append('\n');
        }
        if (flags & INDENT)
        {
            indent.append("  ");
        }
    }

    void separator()
    {
        out.append(',');
        if (flags & NEWLINE)
        {
            out.append('\n');
        }
        else if (flags & SPACES)
        {
            out.append(' ');
        }
    }

    void close(char bracket)
    {
        if (flags & INDENT)
        {
            indent.erase(indent.size() - 2);
        }
        if (flags & NEWLINE)
        {
            out.append('\n');
        }
        out.append(indent.view());
        out.append(bracket);
    }

    void print_array(const variant_value &value, size_t depth)
    {
        nesting(value, depth);
        variant_array array = value.as_array();
        if (array.len() == 0)
        {
            out.append("[]");
            return;
        }
        open('[');
        bool first = true;
        for (variant_value item : array)
        {
            if (!first)
            {
                separator();
            }
            first = false;
            out.append(indent.view());
            print(item, depth);
        }
        close(']');
    }

    void print_object(const variant_value &value, size_t depth)
    {
        nesting(value, depth);
        variant_object object = value.as_object();
        if (object.field_count() == 0)
        {
            out.append("{}");
            return;
        }
        open('{');
        bool first = true;
        for (auto [name, item] : object)
        {
            if (!first)
            {
                separator();
            }
            first = false;
            out.append(indent.view());
            append_json_string(out, name);
            out.append(flags & SPACES ? ": " : ":");
            print(item, depth);
        }
        close('}');
    }

    void print(const variant_value &value, size_t depth)
    {
        switch (value.kind())
        {
        case variant_kind::null_value:
            out.append("null");
            break;
        case variant_kind::boolean:
            out.append(value.as_bool() ? "true" : "false");
            break;
        case variant_kind::int8:
        case variant_kind::int16:
        case variant_kind::int32:
        case variant_kind::int64:
            append_number(out, value.as_int());
            break;
        case variant_kind::float_value:
            append_floating(out, value.as_float());
            break;
        case variant_kind::double_value:
            append_floating(out, value.as_double());
            break;
        case variant_kind::decimal4:
        case variant_kind::decimal8:
        case variant_kind::decimal16:
            append_decimal(out, value.as_decimal());
            break;
        case variant_kind::date:
            append_date(out, value.as_date());
            break;
        case variant_kind::timestamp_micros:
            append_timestamp(out, value.as_timestamp_micros(), true);
            break;
        case variant_kind::timestamp_ntz_micros:
            append_timestamp(out, value.as_timestamp_micros(), false);
            break;
        case variant_kind::binary:
            append_base64(out, value.as_binary());
            break;
        case variant_kind::short_string:
        case variant_kind::string:
            append_json_string(out, value.as_string());
            break;
        case variant_kind::array:
            print_array(value, depth + 1);
            break;
        case variant_kind::object:
            print_object(value, depth + 1);
            break;
        }
    }
};

} // namespace

void to_json(growing_string &out, const variant_value &value, unsigned flags, size_t max_depth)
{
    json_printer printer{out, flags, max_depth, value.bytes().data(), growing_string()};
    printer.print(value, 0);
}

string to_json(string_view metadata, string_view value, unsigned flags, size_t max_depth)
{
    variant_metadata md(metadata);
    growing_string out;
    to_json(out, variant_value(md, value), flags, max_depth);
    return out.str();
}
