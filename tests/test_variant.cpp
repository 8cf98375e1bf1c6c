#include "builder.hpp"
#include "variant.hpp"
#include <gtest/gtest.h>
#include <cmath>
#include <initializer_list>
#include <string>
#include <vector>

static std::string bytes(std::initializer_list<int> values) {
  std::string out;
  for (int v : values)
    out.push_back(static_cast<char>(v));
  return out;
}

// {"name": "fastvariant", "tags": [1, 2.5, null], "ok": true, "id": 300}
static variant_buffers sample() {
  variant_builder builder;
  object_builder root = builder.start_object();
  root.field("name").append_string("fastvariant");
  {
    array_builder tags = root.start_array("tags");
    tags.element().append_int(1);
    tags.element().append_double(2.5);
    tags.element().append_null();
    tags.end_array();
  }
  root.field("ok").append_bool(true);
  root.field("id").append_int(300);
  root.end_object();
  return builder.finish();
}

TEST(Variant, ScalarKindsAndAccessors) {
  variant_metadata md(empty_metadata());

  std::string int8 = bytes({0x0C, 0xFE});
  variant_value v(md, int8);
  EXPECT_EQ(v.kind(), variant_kind::int8);
  EXPECT_TRUE(v.is_integer());
  EXPECT_EQ(v.as_int(), -2);
  EXPECT_EQ(v.size_bytes(), 2u);

  std::string int16 = bytes({0x10, 0x2C, 0x01});
  EXPECT_EQ(variant_value(md, int16).as_int(), 300);

  std::string null_value = bytes({0x00});
  EXPECT_TRUE(variant_value(md, null_value).is_null());

  std::string short_string = bytes({0x0D, 'a', 'b', 'c'});
  variant_value s(md, short_string);
  EXPECT_EQ(s.kind(), variant_kind::short_string);
  EXPECT_TRUE(s.is_string());
  EXPECT_EQ(s.as_string(), "abc");

  std::string long_string = bytes({0x40, 0x02, 0x00, 0x00, 0x00, 'h', 'i'});
  variant_value l(md, long_string);
  EXPECT_EQ(l.kind(), variant_kind::string);
  EXPECT_EQ(l.as_string(), "hi");
  EXPECT_EQ(l.size_bytes(), 7u);

  std::string binary = bytes({0x3C, 0x03, 0x00, 0x00, 0x00, 0x00, 0x01, 0x02});
  EXPECT_EQ(variant_value(md, binary).as_binary(), bytes({0x00, 0x01, 0x02}));
}

TEST(Variant, FloatingPointAndTemporal) {
  variant_builder builder;
  array_builder array = builder.start_array();
  array.element().append_float(0.5f);
  array.element().append_double(-1.25);
  array.element().append_date(-1);
  array.element().append_timestamp(1700000000000000);
  array.element().append_timestamp(42, false);
  array.end_array();
  variant_buffers out = builder.finish();

  variant_metadata md(out.metadata);
  variant_array values = variant_value(md, out.value).as_array();
  ASSERT_EQ(values.len(), 5u);
  EXPECT_EQ(values.get(0)->as_float(), 0.5f);
  EXPECT_EQ(values.get(1)->as_double(), -1.25);
  EXPECT_EQ(values.get(2)->as_date(), -1);
  EXPECT_EQ(values.get(3)->kind(), variant_kind::timestamp_micros);
  EXPECT_EQ(values.get(3)->as_timestamp_micros(), 1700000000000000);
  EXPECT_EQ(values.get(4)->kind(), variant_kind::timestamp_ntz_micros);
  EXPECT_EQ(values.get(4)->as_timestamp_micros(), 42);
}

TEST(Variant, DecimalDecode) {
  variant_builder builder;
  builder.append_decimal(-12345, 5, 2);
  variant_buffers out = builder.finish();
  variant_metadata md(out.metadata);
  variant_decimal d = variant_value(md, out.value).as_decimal();
  EXPECT_TRUE(d.unscaled == -12345);
  EXPECT_EQ(d.scale, 2);
  EXPECT_EQ(d.precision, 9);
}

TEST(Variant, Decimal16Decode) {
  int128_t big = -(int128_t(1) << 100);
  variant_builder builder;
  builder.append_decimal(big, 38, 10);
  variant_buffers out = builder.finish();
  variant_metadata md(out.metadata);
  variant_value v(md, out.value);
  EXPECT_EQ(v.kind(), variant_kind::decimal16);
  variant_decimal d = v.as_decimal();
  EXPECT_TRUE(d.unscaled == big);
  EXPECT_EQ(d.scale, 10);
  EXPECT_EQ(d.precision, 38);
}

TEST(Variant, TypeMismatch) {
  variant_metadata md(empty_metadata());
  std::string value = bytes({0x04});
  variant_value v(md, value);
  EXPECT_TRUE(v.as_bool());
  try {
    v.as_int();
    FAIL() << "expected type_mismatch";
  } catch (const variant_error &e) {
    EXPECT_EQ(e.kind(), error_kind::type_mismatch);
  }
  EXPECT_THROW(v.as_string(), variant_error);
  EXPECT_THROW(v.as_object(), variant_error);
  EXPECT_THROW(v.as_array(), variant_error);
  EXPECT_THROW(v.as_double(), variant_error);
}

TEST(Variant, UnknownPrimitiveType) {
  variant_metadata md(empty_metadata());
  std::string value = bytes({20 << 2});
  try {
    variant_value(md, value).kind();
    FAIL() << "expected invalid_header";
  } catch (const variant_error &e) {
    EXPECT_EQ(e.kind(), error_kind::invalid_header);
  }
}

TEST(Variant, ObjectLookup) {
  variant_buffers out = sample();
  variant_metadata md(out.metadata);
  variant_value root(md, out.value);
  ASSERT_EQ(root.kind(), variant_kind::object);
  EXPECT_EQ(root.size_bytes(), out.value.size());

  variant_object object = root.as_object();
  EXPECT_EQ(object.field_count(), 4u);
  EXPECT_EQ(object.get("name")->as_string(), "fastvariant");
  EXPECT_EQ(object.get("id")->as_int(), 300);
  EXPECT_TRUE(object.get("ok")->as_bool());
  EXPECT_FALSE(object.get("missing").has_value());

  std::optional<uint32_t> id = md.find("ok");
  ASSERT_TRUE(id.has_value());
  EXPECT_TRUE(object.get_by_id(*id)->as_bool());
  EXPECT_FALSE(object.get_by_id(1000).has_value());
}

TEST(Variant, ObjectIterationIsNameOrdered) {
  variant_buffers out = sample();
  variant_metadata md(out.metadata);
  variant_object object = variant_value(md, out.value).as_object();

  std::vector<std::string> names;
  for (auto [name, value] : object)
    names.emplace_back(name);
  EXPECT_EQ(names, (std::vector<std::string>{"id", "name", "ok", "tags"}));
}

TEST(Variant, ArrayAccess) {
  variant_buffers out = sample();
  variant_metadata md(out.metadata);
  variant_array tags = variant_value(md, out.value).as_object().get("tags")->as_array();
  ASSERT_EQ(tags.len(), 3u);
  EXPECT_EQ(tags.get(0)->as_int(), 1);
  EXPECT_EQ(tags.get(1)->as_double(), 2.5);
  EXPECT_TRUE(tags.get(2)->is_null());
  EXPECT_FALSE(tags.get(3).has_value());

  size_t count = 0;
  for (variant_value item : tags) {
    (void)item;
    count++;
  }
  EXPECT_EQ(count, 3u);
}

TEST(Variant, GetByIdNeedsSortedDictionary) {
  builder_options options;
  options.sorted_keys = false;
  variant_builder builder(options);
  object_builder root = builder.start_object();
  root.field("b").append_int(1);
  root.field("a").append_int(2);
  root.end_object();
  variant_buffers out = builder.finish();

  variant_metadata md(out.metadata);
  variant_object object = variant_value(md, out.value).as_object();
  // Name lookup works on both dictionary kinds.
  EXPECT_EQ(object.get("a")->as_int(), 2);
  EXPECT_EQ(object.get("b")->as_int(), 1);
  try {
    object.get_by_id(0);
    FAIL() << "expected unsorted_dictionary";
  } catch (const variant_error &e) {
    EXPECT_EQ(e.kind(), error_kind::unsorted_dictionary);
  }
}

TEST(Variant, TruncatedBufferStaysInBounds) {
  variant_metadata md(empty_metadata());
  std::string value = bytes({0x14, 0x01, 0x02});
  variant_value v(md, value);
  EXPECT_EQ(v.kind(), variant_kind::int32);
  try {
    v.as_int();
    FAIL() << "expected offset_out_of_bounds";
  } catch (const variant_error &e) {
    EXPECT_EQ(e.kind(), error_kind::offset_out_of_bounds);
  }

  std::string array = bytes({0x03, 0x02, 0x00, 0x02});
  EXPECT_THROW(variant_value(md, array).as_array(), variant_error);

  std::string empty;
  EXPECT_THROW(variant_value(md, empty).kind(), variant_error);
}

TEST(Variant, BadFieldIdInObject) {
  variant_metadata md(empty_metadata());
  std::string value = bytes({0x02, 0x01, 0x05, 0x00, 0x01, 0x00});
  variant_object object = variant_value(md, value).as_object();
  try {
    object.field_name(0);
    FAIL() << "expected invalid_field_id";
  } catch (const variant_error &e) {
    EXPECT_EQ(e.kind(), error_kind::invalid_field_id);
  }
}

TEST(Variant, SmallObjectExample) {
  variant_builder builder;
  object_builder root = builder.start_object();
  root.field("a").append_int(1);
  root.field("b").append_string("x");
  root.end_object();
  variant_buffers out = builder.finish();

  variant_metadata md(out.metadata);
  variant_object object = variant_value(md, out.value).as_object();
  EXPECT_EQ(object.field_count(), 2u);
  EXPECT_EQ(object.get("a")->as_int(), 1);
  EXPECT_EQ(object.get("b")->as_string(), "x");

  auto it = object.begin();
  EXPECT_EQ((*it).first, "a");
  EXPECT_EQ((*it).second.as_int(), 1);
  ++it;
  EXPECT_EQ((*it).first, "b");
  EXPECT_EQ((*it).second.as_string(), "x");
  ++it;
  EXPECT_TRUE(it == object.end());
}

// Rebuilds a decoded tree with a fresh builder; the bytes must come out the same.
static void copy_value(const variant_value &value, variant_builder &builder) {
  switch (value.kind()) {
  case variant_kind::null_value:
    builder.append_null();
    break;
  case variant_kind::boolean:
    builder.append_bool(value.as_bool());
    break;
  case variant_kind::int8:
  case variant_kind::int16:
  case variant_kind::int32:
  case variant_kind::int64:
    builder.append_int(value.as_int());
    break;
  case variant_kind::float_value:
    builder.append_float(value.as_float());
    break;
  case variant_kind::double_value:
    builder.append_double(value.as_double());
    break;
  case variant_kind::decimal4:
  case variant_kind::decimal8:
  case variant_kind::decimal16: {
    variant_decimal d = value.as_decimal();
    builder.append_decimal(d.unscaled, d.precision, d.scale);
    break;
  }
  case variant_kind::date:
    builder.append_date(value.as_date());
    break;
  case variant_kind::timestamp_micros:
    builder.append_timestamp(value.as_timestamp_micros(), true);
    break;
  case variant_kind::timestamp_ntz_micros:
    builder.append_timestamp(value.as_timestamp_micros(), false);
    break;
  case variant_kind::binary:
    builder.append_binary(value.as_binary());
    break;
  case variant_kind::short_string:
  case variant_kind::string:
    builder.append_string(value.as_string());
    break;
  case variant_kind::array: {
    array_builder array = builder.start_array();
    for (variant_value item : value.as_array())
      copy_value(item, array.element());
    array.end_array();
    break;
  }
  case variant_kind::object: {
    object_builder object = builder.start_object();
    for (auto [name, item] : value.as_object())
      copy_value(item, object.field(name));
    object.end_object();
    break;
  }
  }
}

TEST(Variant, DecodeAndRebuildReproducesBytes) {
  variant_builder builder;
  {
    object_builder root = builder.start_object();
    root.field("when").append_timestamp(1700000000000000);
    root.field("day").append_date(19000);
    root.field("price").append_decimal(-99999, 7, 2);
    root.field("big").append_decimal(int128_t(1) << 80, 30, 5);
    root.field("ratio").append_float(0.25f);
    root.field("blob").append_binary(std::string("\x00\x01\xFF", 3));
    root.field("text").append_string(std::string(80, 'z'));
    {
      array_builder list = root.start_array("list");
      list.element().append_int(-70000);
      list.element().append_bool(false);
      object_builder inner = list.start_object();
      inner.field("k").append_null();
      inner.end_object();
      list.end_array();
    }
    root.end_object();
  }
  variant_buffers original = builder.finish();

  variant_metadata md(original.metadata);
  variant_builder copy;
  copy_value(variant_value(md, original.value), copy);
  variant_buffers rebuilt = copy.finish();

  EXPECT_EQ(rebuilt.metadata, original.metadata);
  EXPECT_EQ(rebuilt.value, original.value);
}
