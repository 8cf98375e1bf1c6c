#pragma once

#include "metadata.hpp"
#include "variant_types.hpp"
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>
#include <string_view>
#include <utility>
using std::string_view;

class variant_object;
class variant_array;

// Lazy, non-owning view over one encoded value. Both the metadata view and
// the value bytes must outlive it. Accessors throw type_mismatch on a wrong
// kind and offset_out_of_bounds when a read would leave the byte span.
// Results on unvalidated input are bounded but may be wrong; run
// validate_variant() first on untrusted buffers.
class variant_value
{
public:
    variant_value(const variant_metadata &metadata, string_view value) : metadata_(&metadata), value_(value) {}

    // Inspects the header byte only.
    variant_kind kind() const;
    basic_type basic() const { return static_cast<basic_type>(header() & BASIC_TYPE_MASK); }

    bool is_null() const { return kind() == variant_kind::null_value; }
    bool is_string() const;
    bool is_integer() const;

    bool as_bool() const;
    // Any of the integer widths.
    int64_t as_int() const;
    float as_float() const;
    double as_double() const;
    variant_decimal as_decimal() const;
    // Days since 1970-01-01.
    int32_t as_date() const;
    // Microseconds since the epoch, for both timestamp kinds.
    int64_t as_timestamp_micros() const;
    string_view as_binary() const;
    // Short and long strings.
    string_view as_string() const;
    variant_object as_object() const;
    variant_array as_array() const;

    // Exact encoded length of this value, which may be shorter than bytes().
    size_t size_bytes() const;

    const variant_metadata &metadata() const { return *metadata_; }
    string_view bytes() const { return value_; }

private:
    uint8_t header() const;
    uint8_t value_header() const { return header() >> BASIC_TYPE_BITS; }
    [[noreturn]] void mismatch(const char *wanted) const;
    string_view payload(size_t count) const;
    string_view length_prefixed() const;

    const variant_metadata *metadata_;
    string_view value_;
};

class variant_object
{
public:
    variant_object(const variant_metadata &metadata, string_view value);

    size_t field_count() const { return num_elements_; }
    uint32_t field_id(size_t index) const;
    string_view field_name(size_t index) const;
    variant_value field_value(size_t index) const;

    // Binary search over the name-ordered field table.
    std::optional<variant_value> get(string_view name) const;

    // Binary search over the field-id table. Id order equals name order only in
    // a sorted dictionary, so unsorted metadata throws unsorted_dictionary.
    std::optional<variant_value> get_by_id(uint32_t id) const;

    size_t size_bytes() const { return data_start_ + data_size_; }

    class iterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = std::pair<string_view, variant_value>;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = value_type;

        iterator(const variant_object *object, size_t index) : object_(object), index_(index) {}

        value_type operator*() const
        {
            return {object_->field_name(index_), object_->field_value(index_)};
        }

        iterator &operator++()
        {
            index_++;
            return *this;
        }

        iterator operator++(int)
        {
            iterator copy = *this;
            index_++;
            return copy;
        }

        bool operator==(const iterator &other) const { return object_ == other.object_ && index_ == other.index_; }
        bool operator!=(const iterator &other) const { return !(*this == other); }

    private:
        const variant_object *object_;
        size_t index_;
    };

    // Walks the offset table again on every call.
    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, num_elements_); }

private:
    uint32_t field_offset(size_t index) const;

    const variant_metadata *metadata_;
    string_view value_;
    uint32_t num_elements_ = 0;
    unsigned id_size_ = 1;
    unsigned offset_size_ = 1;
    size_t ids_start_ = 0;
    size_t offsets_start_ = 0;
    size_t data_start_ = 0;
    uint32_t data_size_ = 0;
};

class variant_array
{
public:
    variant_array(const variant_metadata &metadata, string_view value);

    size_t len() const { return num_elements_; }

    // std::nullopt when `index` is past the end.
    std::optional<variant_value> get(size_t index) const;

    size_t size_bytes() const { return data_start_ + data_size_; }

    class iterator
    {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = variant_value;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = variant_value;

        iterator(const variant_array *array, size_t index) : array_(array), index_(index) {}

        variant_value operator*() const { return array_->element(index_); }

        iterator &operator++()
        {
            index_++;
            return *this;
        }

        iterator operator++(int)
        {
            iterator copy = *this;
            index_++;
            return copy;
        }

        bool operator==(const iterator &other) const { return array_ == other.array_ && index_ == other.index_; }
        bool operator!=(const iterator &other) const { return !(*this == other); }

    private:
        const variant_array *array_;
        size_t index_;
    };

    iterator begin() const { return iterator(this, 0); }
    iterator end() const { return iterator(this, num_elements_); }

private:
    uint32_t element_offset(size_t index) const;
    variant_value element(size_t index) const;

    const variant_metadata *metadata_;
    string_view value_;
    uint32_t num_elements_ = 0;
    unsigned offset_size_ = 1;
    size_t offsets_start_ = 0;
    size_t data_start_ = 0;
    uint32_t data_size_ = 0;
};
