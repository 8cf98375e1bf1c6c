#include "builder.hpp"
#include "parse_json.hpp"
#include "validate.hpp"
#include <gtest/gtest.h>
#include <initializer_list>
#include <string>

static std::string bytes(std::initializer_list<int> values) {
  std::string out;
  for (int v : values)
    out.push_back(static_cast<char>(v));
  return out;
}

static void nest_arrays(variant_builder &builder, int depth) {
  if (depth == 0) {
    builder.append_null();
    return;
  }
  array_builder array = builder.start_array();
  nest_arrays(builder, depth - 1);
  array.end_array();
}

static variant_buffers nested(int depth) {
  variant_builder builder;
  nest_arrays(builder, depth);
  return builder.finish();
}

// Metadata ["a", "b"], sorted.
static const std::string AB = bytes({0x11, 0x02, 0x00, 0x01, 0x02, 'a', 'b'});

TEST(Validate, AcceptsBuilderOutput) {
  variant_buffers out = from_json(R"({"users":[{"name":"ann","age":31},{"name":"bob","tags":["x",1.5,null]}],)"
                                  R"("count":2,"ok":false,"note":"a string that is longer than sixty-three bytes, to use the long form"})");
  validation_result result = validate_variant(out.metadata, out.value);
  EXPECT_TRUE(result.valid) << result.message;
  EXPECT_TRUE(static_cast<bool>(result));
}

TEST(Validate, AcceptsUnsortedDictionary) {
  json_options options;
  options.builder.sorted_keys = false;
  variant_buffers out = from_json(R"({"z":1,"a":{"y":2,"b":3}})", options);
  EXPECT_TRUE(validate_variant(out.metadata, out.value).valid);
}

TEST(Validate, AcceptsEmptyComposites) {
  std::string md = empty_metadata();
  EXPECT_TRUE(validate_variant(md, bytes({0x02, 0x00, 0x00})).valid);
  EXPECT_TRUE(validate_variant(md, bytes({0x03, 0x00, 0x00})).valid);
}

TEST(Validate, DepthLimit) {
  variant_buffers at_limit = nested(128);
  EXPECT_TRUE(validate_variant(at_limit.metadata, at_limit.value).valid);

  variant_buffers past_limit = nested(129);
  validation_result result = validate_variant(past_limit.metadata, past_limit.value);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.kind, error_kind::recursion_limit_exceeded);

  validate_options options;
  options.max_depth = 3;
  variant_buffers small = nested(3);
  EXPECT_TRUE(validate_variant(small.metadata, small.value, options).valid);
  variant_buffers deeper = nested(4);
  EXPECT_FALSE(validate_variant(deeper.metadata, deeper.value, options).valid);
}

TEST(Validate, ManipulatedArrayOffset) {
  std::string md = empty_metadata();
  std::string value = bytes({0x03, 0x02, 0x00, 0x02, 0x04, 0x0C, 0x01, 0x0C, 0x02});
  ASSERT_TRUE(validate_variant(md, value).valid);

  value[3] = 0x05;
  validation_result result = validate_variant(md, value);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.kind, error_kind::offset_out_of_bounds);
  EXPECT_EQ(result.offset, 3u);
  EXPECT_FALSE(result.in_metadata);
}

TEST(Validate, ChildMustFillItsSpan) {
  std::string md = empty_metadata();
  // First element claims three bytes but an int8 is two.
  std::string value = bytes({0x03, 0x02, 0x00, 0x03, 0x05, 0x0C, 0x01, 0x00, 0x00, 0x00});
  validation_result result = validate_variant(md, value);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.kind, error_kind::offset_out_of_bounds);
  EXPECT_EQ(result.offset, 5u);
}

TEST(Validate, TruncatedValue) {
  std::string md = empty_metadata();
  validation_result result = validate_variant(md, bytes({0x18, 0x01, 0x02}));
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.kind, error_kind::offset_out_of_bounds);
}

TEST(Validate, TrailingBytes) {
  validation_result result = validate_variant(empty_metadata(), bytes({0x00, 0x00}));
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.kind, error_kind::offset_out_of_bounds);
  EXPECT_EQ(result.offset, 1u);
}

TEST(Validate, FieldIdOutOfRange) {
  validation_result result = validate_variant(AB, bytes({0x02, 0x01, 0x07, 0x00, 0x01, 0x00}));
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.kind, error_kind::invalid_field_id);
  EXPECT_EQ(result.offset, 2u);
}

TEST(Validate, FieldsOutOfNameOrder) {
  std::string value = bytes({0x02, 0x02, 0x01, 0x00, 0x00, 0x02, 0x04, 0x0C, 0x01, 0x0C, 0x02});
  validation_result result = validate_variant(AB, value);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.kind, error_kind::unsorted_dictionary);
  EXPECT_EQ(result.offset, 3u);
}

TEST(Validate, DuplicateFieldInObject) {
  std::string value = bytes({0x02, 0x02, 0x00, 0x00, 0x00, 0x02, 0x04, 0x0C, 0x01, 0x0C, 0x02});
  validation_result result = validate_variant(AB, value);
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.kind, error_kind::duplicate_field);
  EXPECT_EQ(result.offset, 3u);
}

TEST(Validate, InvalidUtf8String) {
  validation_result result = validate_variant(empty_metadata(), bytes({0x05, 0xFF}));
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.kind, error_kind::invalid_utf8);
  EXPECT_EQ(result.offset, 1u);
}

TEST(Validate, UnknownPrimitive) {
  validation_result result = validate_variant(empty_metadata(), bytes({17 << 2}));
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.kind, error_kind::invalid_header);
}

TEST(Validate, DecimalScaleTooLarge) {
  validation_result result = validate_variant(empty_metadata(), bytes({0x20, 0x0A, 0x01, 0x00, 0x00, 0x00}));
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.kind, error_kind::decimal_out_of_range);
}

TEST(Validate, DecimalDigitsTooMany) {
  // 1'000'000'000 has ten digits, one more than decimal4 holds.
  validation_result result = validate_variant(empty_metadata(), bytes({0x20, 0x00, 0x00, 0xCA, 0x9A, 0x3B}));
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.kind, error_kind::decimal_out_of_range);
}

TEST(Validate, MetadataErrors) {
  validation_result version = validate_metadata(bytes({0x03, 0x00, 0x00}));
  EXPECT_FALSE(version.valid);
  EXPECT_EQ(version.kind, error_kind::unsupported_version);
  EXPECT_TRUE(version.in_metadata);

  validation_result unsorted = validate_metadata(bytes({0x11, 0x02, 0x00, 0x01, 0x02, 'b', 'a'}));
  EXPECT_FALSE(unsorted.valid);
  EXPECT_EQ(unsorted.kind, error_kind::unsorted_dictionary);

  validation_result duplicate = validate_metadata(bytes({0x11, 0x02, 0x00, 0x01, 0x02, 'a', 'a'}));
  EXPECT_EQ(duplicate.kind, error_kind::unsorted_dictionary);

  validation_result through_value = validate_variant(bytes({0x11, 0x02, 0x00, 0x01, 0x02, 'b', 'a'}), bytes({0x00}));
  EXPECT_FALSE(through_value.valid);
  EXPECT_TRUE(through_value.in_metadata);
}

TEST(Validate, EmptyObjectWithData) {
  validation_result result = validate_variant(empty_metadata(), bytes({0x02, 0x00, 0x01, 0x00}));
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.kind, error_kind::offset_out_of_bounds);
}

TEST(Validate, AcceptsLargeObject) {
  for (bool sorted : {true, false}) {
    builder_options options;
    options.sorted_keys = sorted;
    variant_builder builder(options);
    object_builder object = builder.start_object();
    for (int i = 300; i >= 0; i--)
      object.field("field" + std::to_string(i)).append_int(i);
    object.end_object();
    variant_buffers out = builder.finish();
    ASSERT_EQ(static_cast<uint8_t>(out.value[0]) & 0x40, 0x40);

    validation_result result = validate_variant(out.metadata, out.value);
    EXPECT_TRUE(result.valid) << result.message;
  }
}

TEST(Validate, LongFormForShortString) {
  // "hi" with a four-byte length prefix; the canonical form is 0x09 'h' 'i'.
  validation_result result = validate_variant(empty_metadata(), bytes({0x40, 0x02, 0x00, 0x00, 0x00, 'h', 'i'}));
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.kind, error_kind::invalid_header);
  EXPECT_EQ(result.offset, 0u);

  std::string text(64, 'x');
  std::string value = bytes({0x40, 64, 0x00, 0x00, 0x00}) + text;
  EXPECT_TRUE(validate_variant(empty_metadata(), value).valid);
}

TEST(Validate, MetadataReservedBit) {
  validation_result result = validate_metadata(bytes({0x31, 0x00, 0x00}));
  EXPECT_FALSE(result.valid);
  EXPECT_EQ(result.kind, error_kind::invalid_header);
  EXPECT_EQ(result.offset, 0u);
  EXPECT_TRUE(result.in_metadata);
}
