#include "parse_json.hpp"
#include "simdjson.h"
#include <string>
#include <utility>

using namespace simdjson;

namespace
{

struct json_walker
{
    variant_builder &builder;
    const json_options &options;
    const char *base;

    template <typename T>
    size_t position(T &element)
    {
        std::string_view token = element.raw_json_token();
        return token.data() - base;
    }

    // Works on both the document (for the root) and on nested values.
    template <typename T>
    void walk(T &element, size_t depth)
    {
        switch (element.type())
        {
        case ondemand::json_type::array:
        {
            enter(element, depth);
            array_builder array_scope = builder.start_array();
            for (auto child : element.get_array())
            {
                ondemand::value child_value = child.value();
                walk(child_value, depth + 1);
            }
            array_scope.end_array();
            break;
        }
        case ondemand::json_type::object:
        {
            enter(element, depth);
            object_builder object_scope = builder.start_object();
            for (auto field_result : element.get_object())
            {
                ondemand::field field = std::move(field_result).take_value();
                size_t key_position = field.key().raw() - base - 1;
                std::string_view key = field.unescaped_key();
                try
                {
                    object_scope.field(key);
                }
                catch (const variant_error &e)
                {
                    throw json_error(e.kind(), key_position, e.what());
                }
                ondemand::value child_value = field.value();
                walk(child_value, depth + 1);
            }
            object_scope.end_object();
            break;
        }
        case ondemand::json_type::number:
            number(element);
            break;
        case ondemand::json_type::string:
        {
            std::string_view text = element.get_string();
            builder.append_string(text);
            break;
        }
        case ondemand::json_type::boolean:
        {
            bool flag = element.get_bool();
            builder.append_bool(flag);
            break;
        }
        case ondemand::json_type::null:
        {
            bool is_null = element.is_null();
            if (!is_null)
            {
                throw json_error(error_kind::json_parse_error, position(element), "invalid null literal");
            }
            builder.append_null();
            break;
        }
        default:
            throw json_error(error_kind::json_parse_error, position(element), "unexpected JSON value");
        }
    }

    template <typename T>
    void enter(T &element, size_t depth)
    {
        if (depth + 1 > options.max_depth)
        {
            throw json_error(error_kind::recursion_limit_exceeded, position(element),
                             "nesting deeper than " + std::to_string(options.max_depth));
        }
    }

    template <typename T>
    void number(T &element)
    {
        switch (element.get_number_type())
        {
        case ondemand::number_type::signed_integer:
        {
            int64_t value = element.get_int64();
            builder.append_int(value);
            break;
        }
        case ondemand::number_type::floating_point_number:
        {
            double value = element.get_double();
            builder.append_double(value);
            break;
        }
        case ondemand::number_type::unsigned_integer:
        case ondemand::number_type::big_integer:
            big_integer(element);
            break;
        }
    }

    template <typename T>
    void big_integer(T &element)
    {
        size_t at = position(element);
        std::string_view token = element.raw_json_token();
        while (!token.empty() && (token.back() == ' ' || token.back() == '\t' || token.back() == '\n' ||
                                  token.back() == '\r'))
        {
            token.remove_suffix(1);
        }
        switch (options.big_integers)
        {
        case big_integer_policy::reject:
            throw json_error(error_kind::json_parse_error, at,
                             "integer " + std::string(token) + " does not fit in 64 bits");
        case big_integer_policy::to_double:
        {
            double value = element.get_double();
            builder.append_double(value);
            return;
        }
        case big_integer_policy::decimal:
            break;
        }

        bool negative = !token.empty() && token.front() == '-';
        std::string_view digits = negative ? token.substr(1) : token;
        if (digits.size() > DECIMAL16_MAX_PRECISION)
        {
            throw json_error(error_kind::decimal_out_of_range, at,
                             "integer " + std::string(token) + " has more than 38 digits");
        }
        int128_t unscaled = 0;
        for (char c : digits)
        {
            if (c < '0' || c > '9')
            {
                throw json_error(error_kind::json_parse_error, at, "malformed integer " + std::string(token));
            }
            unscaled = unscaled * 10 + (c - '0');
        }
        if (negative)
        {
            unscaled = -unscaled;
        }
        builder.append_decimal(unscaled, static_cast<uint8_t>(digits.size()), 0);
    }
};

} // namespace

variant_buffers from_json(string_view json, const json_options &options)
{
    padded_string padded(json);
    ondemand::parser parser;
    ondemand::document doc;
    bool started = false;
    variant_builder builder(options.builder);
    try
    {
        doc = parser.iterate(padded);
        started = true;
        json_walker walker{builder, options, padded.data()};
        walker.walk(doc, 0);
        if (!doc.at_end())
        {
            const char *location = nullptr;
            size_t at = doc.current_location().get(location) == SUCCESS ? location - padded.data() : json.size();
            throw json_error(error_kind::json_parse_error, at, "trailing content after the JSON value");
        }
    }
    catch (const simdjson_error &e)
    {
        size_t at = 0;
        const char *location = nullptr;
        if (started && doc.current_location().get(location) == SUCCESS)
        {
            at = location - padded.data();
        }
        else if (started)
        {
            at = json.size();
        }
        throw json_error(error_kind::json_parse_error, at, e.what());
    }
    return builder.finish();
}
