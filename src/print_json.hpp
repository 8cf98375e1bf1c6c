#pragma once

#include "growing_string.hpp"
#include "jsonutils.hpp"
#include "variant.hpp"
#include <cstddef>
#include <string>
#include <string_view>
using std::string;
using std::string_view;

// Renders `value` as JSON onto `out`. Object fields come out in their stored
// (name) order, which need not be the key order of the original JSON.
// `flags` is a mix of SPACES, INDENT and NEWLINE. Nesting deeper than
// `max_depth` composites throws recursion_limit_exceeded; malformed bytes
// throw the decoder's variant_error.
void to_json(growing_string &out, const variant_value &value, unsigned flags = 0, size_t max_depth = 1024);

string to_json(string_view metadata, string_view value, unsigned flags = 0, size_t max_depth = 1024);
