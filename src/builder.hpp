#pragma once

#include "growing_string.hpp"
#include "metadata.hpp"
#include "variant_types.hpp"
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>
using std::string;
using std::string_view;
using std::vector;

struct builder_options
{
    // Emit the dictionary in byte order with the sorted flag set.
    bool sorted_keys = true;
};

struct variant_buffers
{
    string metadata;
    string value;
};

class object_builder;
class array_builder;

// Serializes one value tree together with its field-name dictionary.
//
// Scalars are written with append_*(). Composites are opened with
// start_object()/start_array(), which return a scope handle; only the
// handle's end_object()/end_array() commits the composite to its parent.
// A handle that goes away without being ended, or a build error inside it
// (duplicate field, out-of-range decimal, oversized value), discards every
// byte staged for that composite.
//
// Inside an object, name the next value with object_builder::field(name).
// Inside an array, values are appended in order. A document has exactly one
// root value. Not thread-safe.
class variant_builder
{
public:
    explicit variant_builder(builder_options options = {}) : options_(options) {}

    variant_builder(const variant_builder &) = delete;
    variant_builder &operator=(const variant_builder &) = delete;

    variant_builder &append_null();
    variant_builder &append_bool(bool value);
    // Narrowest of int8/16/32/64 that holds `value`.
    variant_builder &append_int(int64_t value);
    variant_builder &append_float(float value);
    variant_builder &append_double(double value);
    // Narrowest of decimal4/8/16 that holds both the digits of `unscaled` and `scale`.
    variant_builder &append_decimal(int128_t unscaled, uint8_t precision, uint8_t scale);
    variant_builder &append_date(int32_t days_since_epoch);
    variant_builder &append_timestamp(int64_t micros_since_epoch, bool utc_adjusted = true);
    variant_builder &append_binary(string_view bytes);
    // Short string up to 63 bytes, long string above.
    variant_builder &append_string(string_view value);

    object_builder start_object();
    array_builder start_array();

    // Registers a field name without writing a value.
    uint32_t add_key(string_view name);

    // Finalizes the dictionary, remapping insertion-order ids to dictionary
    // positions. The builder cannot be used afterwards.
    variant_buffers finish();

private:
    friend class object_builder;
    friend class array_builder;

    struct entry
    {
        uint32_t field_id;
        // Start of the child relative to the scope's data start.
        size_t offset;
    };

    struct scope
    {
        basic_type type;
        size_t start;
        uint64_t serial;
        vector<entry> entries;
        std::unordered_set<uint32_t> field_ids;
        bool has_pending = false;
        uint32_t pending_id = 0;
    };

    void check_usable() const;
    void before_value();
    [[noreturn]] void fail(const variant_error &error);
    void rollback(size_t depth);
    scope &active_scope(size_t depth, uint64_t serial, const char *operation);
    size_t open_scope(basic_type type);
    void name_field(size_t depth, uint64_t serial, string_view name);
    void end_object(size_t depth, uint64_t serial);
    void end_array(size_t depth, uint64_t serial);
    void abandon(size_t depth, uint64_t serial);
    bool is_live(size_t depth, uint64_t serial) const;

    builder_options options_;
    metadata_builder dictionary_;
    growing_string buffer_;
    vector<scope> scopes_;
    uint64_t next_serial_ = 0;
    bool root_written_ = false;
    bool finished_ = false;
};

// Scope handle for an object under construction. Move-only.
class object_builder
{
public:
    object_builder(object_builder &&other) noexcept;
    object_builder &operator=(object_builder &&other) = delete;
    object_builder(const object_builder &) = delete;
    object_builder &operator=(const object_builder &) = delete;
    ~object_builder();

    // Names the next value. Throws duplicate_field, and drops this object,
    // when `name` is already present.
    variant_builder &field(string_view name);

    object_builder start_object(string_view name);
    array_builder start_array(string_view name);

    // Sorts the fields by name and commits the object to its parent.
    void end_object();

private:
    friend class variant_builder;
    object_builder(variant_builder *builder, size_t depth, uint64_t serial)
        : builder_(builder), depth_(depth), serial_(serial) {}

    variant_builder *builder_;
    size_t depth_;
    uint64_t serial_;
};

// Scope handle for an array under construction. Move-only.
class array_builder
{
public:
    array_builder(array_builder &&other) noexcept;
    array_builder &operator=(array_builder &&other) = delete;
    array_builder(const array_builder &) = delete;
    array_builder &operator=(const array_builder &) = delete;
    ~array_builder();

    // The builder to append the next element with.
    variant_builder &element();

    object_builder start_object();
    array_builder start_array();

    void end_array();

private:
    friend class variant_builder;
    array_builder(variant_builder *builder, size_t depth, uint64_t serial)
        : builder_(builder), depth_(depth), serial_(serial) {}

    variant_builder *builder_;
    size_t depth_;
    uint64_t serial_;
};

// Writers shared by the builder and the id remapping pass.
// `offsets` holds num_elements + 1 entries, the last one being data.size().
void write_object(growing_string &out, const vector<uint32_t> &field_ids, const vector<uint32_t> &offsets,
                  string_view data);
void write_array(growing_string &out, const vector<uint32_t> &offsets, string_view data);
