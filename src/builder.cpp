#include "builder.hpp"
#include <algorithm>
#include <limits>
#include <numeric>

const uint64_t MAX_U32 = std::numeric_limits<uint32_t>::max();

void write_object(growing_string &out, const vector<uint32_t> &field_ids, const vector<uint32_t> &offsets,
                  string_view data)
{
    uint32_t num_elements = static_cast<uint32_t>(field_ids.size());
    uint32_t max_id = 0;
    for (uint32_t id : field_ids)
    {
        max_id = std::max(max_id, id);
    }
    unsigned id_size = minimal_width(max_id);
    unsigned offset_size = minimal_width(static_cast<uint32_t>(data.size()));
    bool is_large = num_elements > MAX_SMALL_ELEMENTS;

    uint8_t vh = static_cast<uint8_t>((offset_size - 1) | ((id_size - 1) << 2) | ((is_large ? 1 : 0) << 4));
    out.reserve_extra(1 + 4 + num_elements * id_size + (num_elements + 1) * offset_size + data.size());
    out.append_byte(make_header(basic_type::object, vh));
    out.append_uint_le(num_elements, is_large ? 4 : 1);
    for (uint32_t id : field_ids)
    {
        out.append_uint_le(id, id_size);
    }
    for (uint32_t offset : offsets)
    {
        out.append_uint_le(offset, offset_size);
    }
    out.append(data);
}

void write_array(growing_string &out, const vector<uint32_t> &offsets, string_view data)
{
    uint32_t num_elements = static_cast<uint32_t>(offsets.size() - 1);
    unsigned offset_size = minimal_width(static_cast<uint32_t>(data.size()));
    bool is_large = num_elements > MAX_SMALL_ELEMENTS;

    uint8_t vh = static_cast<uint8_t>((offset_size - 1) | ((is_large ? 1 : 0) << 2));
    out.reserve_extra(1 + 4 + (num_elements + 1) * offset_size + data.size());
    out.append_byte(make_header(basic_type::array, vh));
    out.append_uint_le(num_elements, is_large ? 4 : 1);
    for (uint32_t offset : offsets)
    {
        out.append_uint_le(offset, offset_size);
    }
    out.append(data);
}

// Rewrites every object field id through `remap`. The input is builder
// output, so composite children are laid out back to back in offset order.
static void remap_field_ids(string_view value, const vector<uint32_t> &remap, growing_string &out)
{
    uint8_t header = byte_at(value, 0);
    basic_type basic = static_cast<basic_type>(header & BASIC_TYPE_MASK);
    if (basic == basic_type::primitive || basic == basic_type::short_string)
    {
        out.append(value);
        return;
    }
    uint8_t vh = header >> BASIC_TYPE_BITS;
    bool is_object = basic == basic_type::object;
    unsigned offset_size = (vh & 0x03) + 1;
    unsigned id_size = is_object ? ((vh >> 2) & 0x03) + 1 : 0;
    bool is_large = is_object ? ((vh >> 4) & 0x01) : ((vh >> 2) & 0x01);
    unsigned count_size = is_large ? 4 : 1;

    uint32_t num_elements = read_uint_le(value, 1, count_size);
    size_t ids_start = 1 + count_size;
    size_t offsets_start = ids_start + static_cast<size_t>(num_elements) * id_size;
    size_t data_start = offsets_start + (static_cast<size_t>(num_elements) + 1) * offset_size;

    growing_string children;
    vector<uint32_t> ids;
    vector<uint32_t> offsets;
    ids.reserve(num_elements);
    offsets.reserve(num_elements + 1);
    for (uint32_t i = 0; i < num_elements; i++)
    {
        uint32_t start = read_uint_le(value, offsets_start + i * offset_size, offset_size);
        uint32_t end = read_uint_le(value, offsets_start + (i + 1) * offset_size, offset_size);
        offsets.push_back(static_cast<uint32_t>(children.size()));
        remap_field_ids(value.substr(data_start + start, end - start), remap, children);
        if (is_object)
        {
            ids.push_back(remap[read_uint_le(value, ids_start + i * id_size, id_size)]);
        }
    }
    offsets.push_back(static_cast<uint32_t>(children.size()));

    if (is_object)
    {
        write_object(out, ids, offsets, children.view());
    }
    else
    {
        write_array(out, offsets, children.view());
    }
}

void variant_builder::check_usable() const
{
    if (finished_)
    {
        throw std::logic_error("variant builder used after finish()");
    }
}

void variant_builder::before_value()
{
    if (scopes_.empty())
    {
        if (root_written_)
        {
            throw std::logic_error("a document holds exactly one root value");
        }
        root_written_ = true;
        return;
    }
    scope &top = scopes_.back();
    size_t offset = buffer_.size() - top.start;
    if (top.type == basic_type::object)
    {
        if (!top.has_pending)
        {
            throw std::logic_error("object value written without a field name");
        }
        top.entries.push_back({top.pending_id, offset});
        top.field_ids.insert(top.pending_id);
        top.has_pending = false;
    }
    else
    {
        top.entries.push_back({0, offset});
    }
}

void variant_builder::fail(const variant_error &error)
{
    if (!scopes_.empty())
    {
        rollback(scopes_.size() - 1);
    }
    throw error;
}

void variant_builder::rollback(size_t depth)
{
    buffer_.erase(scopes_[depth].start);
    scopes_.erase(scopes_.begin() + depth, scopes_.end());
    if (depth == 0)
    {
        root_written_ = false;
        return;
    }
    // Undo the entry the parent recorded when this scope was opened.
    scope &parent = scopes_[depth - 1];
    entry dropped = parent.entries.back();
    parent.entries.pop_back();
    if (parent.type == basic_type::object)
    {
        parent.field_ids.erase(dropped.field_id);
    }
}

bool variant_builder::is_live(size_t depth, uint64_t serial) const
{
    return !finished_ && depth < scopes_.size() && scopes_[depth].serial == serial;
}

variant_builder::scope &variant_builder::active_scope(size_t depth, uint64_t serial, const char *operation)
{
    if (!is_live(depth, serial))
    {
        throw std::logic_error(string(operation) + " on a closed or aborted scope");
    }
    if (depth + 1 != scopes_.size())
    {
        throw std::logic_error(string(operation) + " while a nested scope is still open");
    }
    return scopes_[depth];
}

size_t variant_builder::open_scope(basic_type type)
{
    check_usable();
    before_value();
    scope s;
    s.type = type;
    s.start = buffer_.size();
    s.serial = next_serial_++;
    scopes_.push_back(std::move(s));
    return scopes_.size() - 1;
}

void variant_builder::abandon(size_t depth, uint64_t serial)
{
    if (is_live(depth, serial))
    {
        rollback(depth);
    }
}

variant_builder &variant_builder::append_null()
{
    check_usable();
    before_value();
    buffer_.append_byte(primitive_header(primitive_type::null_value));
    return *this;
}

variant_builder &variant_builder::append_bool(bool value)
{
    check_usable();
    before_value();
    buffer_.append_byte(primitive_header(value ? primitive_type::boolean_true : primitive_type::boolean_false));
    return *this;
}

variant_builder &variant_builder::append_int(int64_t value)
{
    check_usable();
    before_value();
    if (value >= std::numeric_limits<int8_t>::min() && value <= std::numeric_limits<int8_t>::max())
    {
        buffer_.append_byte(primitive_header(primitive_type::int8));
        buffer_.append_le(static_cast<int8_t>(value));
    }
    else if (value >= std::numeric_limits<int16_t>::min() && value <= std::numeric_limits<int16_t>::max())
    {
        buffer_.append_byte(primitive_header(primitive_type::int16));
        buffer_.append_le(static_cast<int16_t>(value));
    }
    else if (value >= std::numeric_limits<int32_t>::min() && value <= std::numeric_limits<int32_t>::max())
    {
        buffer_.append_byte(primitive_header(primitive_type::int32));
        buffer_.append_le(static_cast<int32_t>(value));
    }
    else
    {
        buffer_.append_byte(primitive_header(primitive_type::int64));
        buffer_.append_le(value);
    }
    return *this;
}

variant_builder &variant_builder::append_float(float value)
{
    check_usable();
    before_value();
    buffer_.append_byte(primitive_header(primitive_type::float_value));
    buffer_.append_le(value);
    return *this;
}

variant_builder &variant_builder::append_double(double value)
{
    check_usable();
    before_value();
    buffer_.append_byte(primitive_header(primitive_type::double_value));
    buffer_.append_le(value);
    return *this;
}

variant_builder &variant_builder::append_decimal(int128_t unscaled, uint8_t precision, uint8_t scale)
{
    check_usable();
    if (precision == 0 || precision > DECIMAL16_MAX_PRECISION || scale > precision)
    {
        fail(variant_error(error_kind::decimal_out_of_range,
                           "invalid decimal precision " + std::to_string(precision) + " / scale " +
                               std::to_string(scale)));
    }
    unsigned digits = decimal_digits(unscaled);
    if (digits > precision)
    {
        fail(variant_error(error_kind::decimal_out_of_range,
                           "decimal with " + std::to_string(digits) + " digits exceeds precision " +
                               std::to_string(precision)));
    }
    unsigned needed = std::max<unsigned>(digits, scale);
    before_value();
    if (needed <= DECIMAL4_MAX_PRECISION)
    {
        buffer_.append_byte(primitive_header(primitive_type::decimal4));
        buffer_.append_byte(scale);
        buffer_.append_le(static_cast<int32_t>(unscaled));
    }
    else if (needed <= DECIMAL8_MAX_PRECISION)
    {
        buffer_.append_byte(primitive_header(primitive_type::decimal8));
        buffer_.append_byte(scale);
        buffer_.append_le(static_cast<int64_t>(unscaled));
    }
    else
    {
        buffer_.append_byte(primitive_header(primitive_type::decimal16));
        buffer_.append_byte(scale);
        buffer_.append_le(static_cast<uint64_t>(unscaled));
        buffer_.append_le(static_cast<int64_t>(unscaled >> 64));
    }
    return *this;
}

variant_builder &variant_builder::append_date(int32_t days_since_epoch)
{
    check_usable();
    before_value();
    buffer_.append_byte(primitive_header(primitive_type::date));
    buffer_.append_le(days_since_epoch);
    return *this;
}

variant_builder &variant_builder::append_timestamp(int64_t micros_since_epoch, bool utc_adjusted)
{
    check_usable();
    before_value();
    buffer_.append_byte(primitive_header(utc_adjusted ? primitive_type::timestamp_micros
                                                      : primitive_type::timestamp_ntz_micros));
    buffer_.append_le(micros_since_epoch);
    return *this;
}

variant_builder &variant_builder::append_binary(string_view bytes)
{
    check_usable();
    if (bytes.size() > MAX_U32)
    {
        fail(variant_error(error_kind::value_too_large, "binary value exceeds 4 GiB"));
    }
    before_value();
    buffer_.append_byte(primitive_header(primitive_type::binary));
    buffer_.append_uint_le(static_cast<uint32_t>(bytes.size()), 4);
    buffer_.append(bytes);
    return *this;
}

variant_builder &variant_builder::append_string(string_view value)
{
    check_usable();
    if (value.size() > MAX_U32)
    {
        fail(variant_error(error_kind::value_too_large, "string value exceeds 4 GiB"));
    }
    if (!is_valid_utf8(value))
    {
        fail(variant_error(error_kind::invalid_utf8, "string value is not valid UTF-8"));
    }
    before_value();
    if (value.size() <= MAX_SHORT_STRING_SIZE)
    {
        buffer_.append_byte(make_header(basic_type::short_string, static_cast<uint8_t>(value.size())));
    }
    else
    {
        buffer_.append_byte(primitive_header(primitive_type::string));
        buffer_.append_uint_le(static_cast<uint32_t>(value.size()), 4);
    }
    buffer_.append(value);
    return *this;
}

object_builder variant_builder::start_object()
{
    size_t depth = open_scope(basic_type::object);
    return object_builder(this, depth, scopes_[depth].serial);
}

array_builder variant_builder::start_array()
{
    size_t depth = open_scope(basic_type::array);
    return array_builder(this, depth, scopes_[depth].serial);
}

uint32_t variant_builder::add_key(string_view name)
{
    check_usable();
    if (!is_valid_utf8(name))
    {
        throw variant_error(error_kind::invalid_utf8, "field name is not valid UTF-8");
    }
    return dictionary_.add_key(name);
}

void variant_builder::name_field(size_t depth, uint64_t serial, string_view name)
{
    scope &s = active_scope(depth, serial, "field()");
    if (s.has_pending)
    {
        throw std::logic_error("field \"" + string(dictionary_.key(s.pending_id)) + "\" has no value yet");
    }
    if (!is_valid_utf8(name))
    {
        fail(variant_error(error_kind::invalid_utf8, "field name is not valid UTF-8"));
    }
    uint32_t id = dictionary_.add_key(name);
    if (s.field_ids.count(id) != 0)
    {
        fail(variant_error(error_kind::duplicate_field, "duplicate field \"" + string(name) + "\""));
    }
    s.pending_id = id;
    s.has_pending = true;
}

void variant_builder::end_object(size_t depth, uint64_t serial)
{
    scope &s = active_scope(depth, serial, "end_object()");
    if (s.has_pending)
    {
        throw std::logic_error("field \"" + string(dictionary_.key(s.pending_id)) + "\" has no value");
    }
    size_t data_size = buffer_.size() - s.start;
    if (data_size > MAX_U32 || s.entries.size() > MAX_U32)
    {
        fail(variant_error(error_kind::value_too_large, "object exceeds the 32-bit size limit"));
    }

    size_t num_elements = s.entries.size();
    vector<size_t> order(num_elements);
    std::iota(order.begin(), order.end(), 0);
    std::sort(order.begin(), order.end(), [&](size_t a, size_t b)
              { return dictionary_.key(s.entries[a].field_id) < dictionary_.key(s.entries[b].field_id); });

    string data(buffer_.view(s.start, data_size));
    string sorted_data;
    sorted_data.reserve(data_size);
    vector<uint32_t> ids;
    vector<uint32_t> offsets;
    ids.reserve(num_elements);
    offsets.reserve(num_elements + 1);
    for (size_t index : order)
    {
        size_t start = s.entries[index].offset;
        size_t end = index + 1 < num_elements ? s.entries[index + 1].offset : data_size;
        ids.push_back(s.entries[index].field_id);
        offsets.push_back(static_cast<uint32_t>(sorted_data.size()));
        sorted_data.append(data, start, end - start);
    }
    offsets.push_back(static_cast<uint32_t>(sorted_data.size()));

    buffer_.erase(s.start);
    scopes_.pop_back();
    write_object(buffer_, ids, offsets, sorted_data);
}

void variant_builder::end_array(size_t depth, uint64_t serial)
{
    scope &s = active_scope(depth, serial, "end_array()");
    size_t data_size = buffer_.size() - s.start;
    if (data_size > MAX_U32 || s.entries.size() > MAX_U32)
    {
        fail(variant_error(error_kind::value_too_large, "array exceeds the 32-bit size limit"));
    }
    vector<uint32_t> offsets;
    offsets.reserve(s.entries.size() + 1);
    for (const entry &e : s.entries)
    {
        offsets.push_back(static_cast<uint32_t>(e.offset));
    }
    offsets.push_back(static_cast<uint32_t>(data_size));

    string data(buffer_.view(s.start, data_size));
    buffer_.erase(s.start);
    scopes_.pop_back();
    write_array(buffer_, offsets, data);
}

variant_buffers variant_builder::finish()
{
    check_usable();
    if (!scopes_.empty())
    {
        throw std::logic_error("finish() with " + std::to_string(scopes_.size()) + " open scope(s)");
    }
    if (!root_written_)
    {
        throw std::logic_error("finish() before a root value was written");
    }
    finished_ = true;

    vector<uint32_t> remap;
    variant_buffers result;
    result.metadata = dictionary_.finish(options_.sorted_keys, remap);

    bool identity = true;
    for (uint32_t id = 0; id < remap.size(); id++)
    {
        if (remap[id] != id)
        {
            identity = false;
            break;
        }
    }
    if (identity)
    {
        result.value = buffer_.str();
    }
    else
    {
        growing_string remapped;
        remap_field_ids(buffer_.view(), remap, remapped);
        result.value = remapped.str();
    }
    return result;
}

// Scope handles

object_builder::object_builder(object_builder &&other) noexcept
    : builder_(other.builder_), depth_(other.depth_), serial_(other.serial_)
{
    other.builder_ = nullptr;
}

object_builder::~object_builder()
{
    if (builder_ != nullptr)
    {
        builder_->abandon(depth_, serial_);
    }
}

variant_builder &object_builder::field(string_view name)
{
    if (builder_ == nullptr)
    {
        throw std::logic_error("field() on a finished object");
    }
    builder_->name_field(depth_, serial_, name);
    return *builder_;
}

object_builder object_builder::start_object(string_view name)
{
    return field(name).start_object();
}

array_builder object_builder::start_array(string_view name)
{
    return field(name).start_array();
}

void object_builder::end_object()
{
    if (builder_ == nullptr)
    {
        throw std::logic_error("end_object() called twice");
    }
    builder_->end_object(depth_, serial_);
    builder_ = nullptr;
}

array_builder::array_builder(array_builder &&other) noexcept
    : builder_(other.builder_), depth_(other.depth_), serial_(other.serial_)
{
    other.builder_ = nullptr;
}

array_builder::~array_builder()
{
    if (builder_ != nullptr)
    {
        builder_->abandon(depth_, serial_);
    }
}

variant_builder &array_builder::element()
{
    if (builder_ == nullptr)
    {
        throw std::logic_error("element() on a finished array");
    }
    builder_->active_scope(depth_, serial_, "element()");
    return *builder_;
}

object_builder array_builder::start_object()
{
    return element().start_object();
}

array_builder array_builder::start_array()
{
    return element().start_array();
}

void array_builder::end_array()
{
    if (builder_ == nullptr)
    {
        throw std::logic_error("end_array() called twice");
    }
    builder_->end_array(depth_, serial_);
    builder_ = nullptr;
}
