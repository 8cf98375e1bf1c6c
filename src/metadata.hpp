#pragma once

#include "variant_types.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
using std::string;
using std::string_view;
using std::vector;

// Field-name dictionary of one document while it is being built.
// Ids are handed out in insertion order; finish() emits the dictionary and
// reports where every insertion id ended up.
class metadata_builder
{
public:
    // Returns the existing id if `name` was added before.
    uint32_t add_key(string_view name);

    size_t size() const { return names_.size(); }

    // Name of an insertion-order id.
    string_view key(uint32_t id) const { return *names_.at(id); }

    // `remap[insertion_id]` receives the final dictionary position of that id.
    // With `sorted` the entries are written in byte order and the sorted flag is set,
    // otherwise they keep insertion order and `remap` is the identity.
    string finish(bool sorted, vector<uint32_t> &remap) const;

private:
    std::map<string, uint32_t, std::less<>> ids_;
    vector<const string *> names_;
};

// Read-only view over serialized metadata. The bytes must outlive the view.
// Construction checks the header, the offset table and UTF-8 of every entry.
class variant_metadata
{
public:
    explicit variant_metadata(string_view bytes);

    size_t size() const { return dictionary_size_; }
    bool is_sorted() const { return sorted_; }
    unsigned offset_size() const { return offset_size_; }
    string_view bytes() const { return bytes_; }

    // Throws invalid_field_id when `id` is not in the dictionary.
    string_view get(uint32_t id) const;

    // Binary search; throws unsorted_dictionary when the sorted flag is not set.
    std::optional<uint32_t> find(string_view name) const;

private:
    uint32_t offset(size_t index) const
    {
        return read_uint_le(bytes_, offsets_start_ + index * offset_size_, offset_size_);
    }

    string_view bytes_;
    uint32_t dictionary_size_ = 0;
    unsigned offset_size_ = 1;
    size_t offsets_start_ = 0;
    size_t strings_start_ = 0;
    bool sorted_ = false;
};

// Empty dictionary (version 1, sorted, no entries).
string empty_metadata();
