#include "metadata.hpp"
#include "growing_string.hpp"
#include <limits>

uint32_t metadata_builder::add_key(string_view name)
{
    auto it = ids_.find(name);
    if (it != ids_.end())
    {
        return it->second;
    }
    if (names_.size() >= std::numeric_limits<uint32_t>::max())
    {
        throw variant_error(error_kind::value_too_large, "too many dictionary entries");
    }
    uint32_t id = static_cast<uint32_t>(names_.size());
    it = ids_.emplace(string(name), id).first;
    names_.push_back(&it->first);
    return id;
}

string metadata_builder::finish(bool sorted, vector<uint32_t> &remap) const
{
    vector<const string *> order;
    order.reserve(names_.size());
    remap.assign(names_.size(), 0);
    if (sorted)
    {
        // The map already iterates in byte order.
        for (auto &entry : ids_)
        {
            remap[entry.second] = static_cast<uint32_t>(order.size());
            order.push_back(&entry.first);
        }
    }
    else
    {
        for (uint32_t id = 0; id < names_.size(); id++)
        {
            remap[id] = id;
            order.push_back(names_[id]);
        }
    }

    uint64_t total = 0;
    for (const string *name : order)
    {
        total += name->size();
    }
    if (total > std::numeric_limits<uint32_t>::max())
    {
        throw variant_error(error_kind::value_too_large, "dictionary strings exceed 4 GiB");
    }
    uint32_t dictionary_size = static_cast<uint32_t>(order.size());
    unsigned offset_size = minimal_width(std::max(dictionary_size, static_cast<uint32_t>(total)));

    uint8_t header = VARIANT_VERSION;
    if (sorted)
    {
        header |= METADATA_SORTED_MASK;
    }
    header |= static_cast<uint8_t>((offset_size - 1) << METADATA_OFFSET_SIZE_SHIFT);

    growing_string out;
    out.reserve_extra(1 + offset_size * (dictionary_size + 2) + total);
    out.append_byte(header);
    out.append_uint_le(dictionary_size, offset_size);
    uint32_t offset = 0;
    out.append_uint_le(offset, offset_size);
    for (const string *name : order)
    {
        offset += static_cast<uint32_t>(name->size());
        out.append_uint_le(offset, offset_size);
    }
    for (const string *name : order)
    {
        out.append(*name);
    }
    return out.str();
}

variant_metadata::variant_metadata(string_view bytes) : bytes_(bytes)
{
    check_range(bytes_, 0, 1, "metadata header");
    uint8_t header = byte_at(bytes_, 0);
    uint8_t version = header & METADATA_VERSION_MASK;
    if (version != VARIANT_VERSION)
    {
        throw variant_error(error_kind::unsupported_version,
                            "unsupported metadata version " + std::to_string(version), 0);
    }
    if (header & METADATA_RESERVED_MASK)
    {
        throw variant_error(error_kind::invalid_header, "reserved metadata header bit is set", 0);
    }
    sorted_ = (header & METADATA_SORTED_MASK) != 0;
    offset_size_ = ((header >> METADATA_OFFSET_SIZE_SHIFT) & 0x03) + 1;

    check_range(bytes_, 1, offset_size_, "dictionary size");
    dictionary_size_ = read_uint_le(bytes_, 1, offset_size_);
    offsets_start_ = 1 + offset_size_;

    uint64_t table_size = (static_cast<uint64_t>(dictionary_size_) + 1) * offset_size_;
    if (table_size > bytes_.size() - offsets_start_)
    {
        throw variant_error(error_kind::offset_out_of_bounds,
                            "dictionary offset table of " + std::to_string(dictionary_size_ + 1ull) +
                                " entries does not fit in metadata",
                            offsets_start_);
    }
    strings_start_ = offsets_start_ + table_size;
    size_t available = bytes_.size() - strings_start_;

    if (offset(0) != 0)
    {
        throw variant_error(error_kind::offset_out_of_bounds, "first dictionary offset is not zero", offsets_start_);
    }
    uint32_t previous = 0;
    for (size_t i = 1; i <= dictionary_size_; i++)
    {
        uint32_t current = offset(i);
        size_t at = offsets_start_ + i * offset_size_;
        if (current < previous || current > available)
        {
            throw variant_error(error_kind::offset_out_of_bounds,
                                "dictionary offset " + std::to_string(i) + " is out of bounds", at);
        }
        string_view entry = bytes_.substr(strings_start_ + previous, current - previous);
        if (!is_valid_utf8(entry))
        {
            throw variant_error(error_kind::invalid_utf8,
                                "dictionary entry " + std::to_string(i - 1) + " is not valid UTF-8",
                                strings_start_ + previous);
        }
        previous = current;
    }
}

string_view variant_metadata::get(uint32_t id) const
{
    if (id >= dictionary_size_)
    {
        throw variant_error(error_kind::invalid_field_id,
                            "field id " + std::to_string(id) + " is not in a dictionary of " +
                                std::to_string(dictionary_size_) + " entries");
    }
    uint32_t start = offset(id);
    uint32_t end = offset(id + 1);
    return bytes_.substr(strings_start_ + start, end - start);
}

std::optional<uint32_t> variant_metadata::find(string_view name) const
{
    if (!sorted_)
    {
        throw variant_error(error_kind::unsorted_dictionary, "sorted lookup of \"" + string(name) +
                                                                 "\" on unsorted metadata");
    }
    uint32_t low = 0;
    uint32_t high = dictionary_size_;
    while (low < high)
    {
        uint32_t mid = low + (high - low) / 2;
        int cmp = get(mid).compare(name);
        if (cmp == 0)
        {
            return mid;
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

string empty_metadata()
{
    vector<uint32_t> remap;
    return metadata_builder().finish(true, remap);
}
