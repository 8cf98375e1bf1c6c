#pragma once

#include "variant_types.hpp"
#include <cstddef>
#include <string>
#include <string_view>
using std::string;
using std::string_view;

struct validate_options
{
    // Deepest allowed nesting of arrays and objects; the root composite is level 1.
    size_t max_depth = 128;
};

struct validation_result
{
    bool valid = true;
    error_kind kind = error_kind::offset_out_of_bounds;
    // Byte offset of the failure, relative to the metadata buffer when
    // `in_metadata` is set and to the value buffer otherwise.
    size_t offset = 0;
    bool in_metadata = false;
    string message;

    explicit operator bool() const { return valid; }
};

// Proves that an untrusted (metadata, value) pair is well formed: recognized
// headers, offsets and lengths inside their enclosing spans, field ids in
// range, UTF-8 strings, decimals within their width, object fields strictly
// ordered by name, no trailing bytes. Stops at the first violation.
validation_result validate_variant(string_view metadata, string_view value, const validate_options &options = {});

// Metadata only, including the sorted-flag ordering check.
validation_result validate_metadata(string_view metadata);
