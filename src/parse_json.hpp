#pragma once

#include "builder.hpp"
#include <cstddef>
#include <string_view>
using std::string_view;

// What to do with integral JSON numbers outside the int64 range.
enum class big_integer_policy
{
    reject,
    // Decimal with scale 0, up to 38 digits.
    decimal,
    // Nearest double.
    to_double,
};

struct json_options
{
    big_integer_policy big_integers = big_integer_policy::reject;
    // Deepest allowed nesting of arrays and objects.
    size_t max_depth = 1024;
    builder_options builder;
};

// Parses `json` and encodes it. Integers take the narrowest integer type,
// other numbers become doubles, object keys go through the dictionary.
// Throws json_error carrying the character position of the problem.
variant_buffers from_json(string_view json, const json_options &options = {});
