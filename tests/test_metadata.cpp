#include "metadata.hpp"
#include <gtest/gtest.h>
#include <initializer_list>
#include <string>
#include <vector>

static std::string bytes(std::initializer_list<int> values) {
  std::string out;
  for (int v : values)
    out.push_back(static_cast<char>(v));
  return out;
}

TEST(Metadata, EmptyDictionary) {
  EXPECT_EQ(empty_metadata(), bytes({0x11, 0x00, 0x00}));

  variant_metadata md(empty_metadata());
  EXPECT_EQ(md.size(), 0u);
  EXPECT_TRUE(md.is_sorted());
  EXPECT_FALSE(md.find("a").has_value());
}

TEST(Metadata, AddKeyReturnsExistingId) {
  metadata_builder builder;
  EXPECT_EQ(builder.add_key("b"), 0u);
  EXPECT_EQ(builder.add_key("a"), 1u);
  EXPECT_EQ(builder.add_key("b"), 0u);
  EXPECT_EQ(builder.size(), 2u);
  EXPECT_EQ(builder.key(1), "a");
}

TEST(Metadata, SortedFinishRemapsIds) {
  metadata_builder builder;
  builder.add_key("b");
  builder.add_key("a");

  std::vector<uint32_t> remap;
  std::string out = builder.finish(true, remap);
  EXPECT_EQ(out, bytes({0x11, 0x02, 0x00, 0x01, 0x02, 'a', 'b'}));
  ASSERT_EQ(remap.size(), 2u);
  EXPECT_EQ(remap[0], 1u);
  EXPECT_EQ(remap[1], 0u);
}

TEST(Metadata, UnsortedFinishKeepsInsertionOrder) {
  metadata_builder builder;
  builder.add_key("b");
  builder.add_key("a");

  std::vector<uint32_t> remap;
  std::string out = builder.finish(false, remap);
  EXPECT_EQ(out, bytes({0x01, 0x02, 0x00, 0x01, 0x02, 'b', 'a'}));
  EXPECT_EQ(remap, (std::vector<uint32_t>{0, 1}));
}

TEST(Metadata, OffsetWidthGrowsWithStringBytes) {
  metadata_builder builder;
  builder.add_key(std::string(300, 'x'));

  std::vector<uint32_t> remap;
  std::string out = builder.finish(true, remap);
  // offset_size 2 lands in bits 6-7 of the header.
  EXPECT_EQ(static_cast<uint8_t>(out[0]), 0x51);
  EXPECT_EQ(out.size(), 1u + 2u + 2u * 2u + 300u);

  variant_metadata md(out);
  EXPECT_EQ(md.offset_size(), 2u);
  EXPECT_EQ(md.get(0).size(), 300u);
}

TEST(Metadata, GetAndFind) {
  std::string raw = bytes({0x11, 0x03, 0x00, 0x01, 0x03, 0x06, 'a', 'b', 'c', 'x', 'y', 'z'});
  variant_metadata md(raw);
  EXPECT_EQ(md.size(), 3u);
  EXPECT_EQ(md.get(0), "a");
  EXPECT_EQ(md.get(1), "bc");
  EXPECT_EQ(md.get(2), "xyz");
  EXPECT_EQ(md.find("bc"), 1u);
  EXPECT_EQ(md.find("xyz"), 2u);
  EXPECT_FALSE(md.find("b").has_value());

  try {
    md.get(3);
    FAIL() << "expected invalid_field_id";
  } catch (const variant_error &e) {
    EXPECT_EQ(e.kind(), error_kind::invalid_field_id);
  }
}

TEST(Metadata, FindNeedsSortedDictionary) {
  std::string raw = bytes({0x01, 0x02, 0x00, 0x01, 0x02, 'b', 'a'});
  variant_metadata md(raw);
  EXPECT_FALSE(md.is_sorted());
  EXPECT_EQ(md.get(0), "b");
  try {
    md.find("a");
    FAIL() << "expected unsorted_dictionary";
  } catch (const variant_error &e) {
    EXPECT_EQ(e.kind(), error_kind::unsorted_dictionary);
  }
}

TEST(Metadata, RejectsUnsupportedVersion) {
  try {
    variant_metadata md(bytes({0x12, 0x00, 0x00}));
    FAIL() << "expected unsupported_version";
  } catch (const variant_error &e) {
    EXPECT_EQ(e.kind(), error_kind::unsupported_version);
    EXPECT_EQ(e.offset(), 0u);
  }
}

TEST(Metadata, RejectsReservedHeaderBit) {
  try {
    variant_metadata md(bytes({0x31, 0x00, 0x00}));
    FAIL() << "expected invalid_header";
  } catch (const variant_error &e) {
    EXPECT_EQ(e.kind(), error_kind::invalid_header);
    EXPECT_EQ(e.offset(), 0u);
  }
}

TEST(Metadata, RejectsTruncatedOffsetTable) {
  try {
    variant_metadata md(bytes({0x11, 0x05, 0x00, 0x01}));
    FAIL() << "expected offset_out_of_bounds";
  } catch (const variant_error &e) {
    EXPECT_EQ(e.kind(), error_kind::offset_out_of_bounds);
  }
}

TEST(Metadata, RejectsOffsetPastStrings) {
  try {
    variant_metadata md(bytes({0x11, 0x01, 0x00, 0x09, 'a'}));
    FAIL() << "expected offset_out_of_bounds";
  } catch (const variant_error &e) {
    EXPECT_EQ(e.kind(), error_kind::offset_out_of_bounds);
    EXPECT_EQ(e.offset(), 3u);
  }
}

TEST(Metadata, RejectsInvalidUtf8Entry) {
  try {
    variant_metadata md(bytes({0x11, 0x01, 0x00, 0x01, 0xFF}));
    FAIL() << "expected invalid_utf8";
  } catch (const variant_error &e) {
    EXPECT_EQ(e.kind(), error_kind::invalid_utf8);
    EXPECT_EQ(e.offset(), 4u);
  }
}

TEST(Metadata, FindAgreesWithLinearScan) {
  metadata_builder builder;
  const char *names[] = {"zeta", "alpha", "", "Beta", "beta", "alpha2", "\xC3\xA9t\xC3\xA9", "m", "a b", "~"};
  for (const char *name : names)
    builder.add_key(name);
  builder.add_key("alpha");

  std::vector<uint32_t> remap;
  std::string raw = builder.finish(true, remap);
  variant_metadata md(raw);
  ASSERT_EQ(md.size(), 10u);

  for (uint32_t i = 1; i < md.size(); i++)
    EXPECT_LT(md.get(i - 1), md.get(i));

  for (const char *name : names) {
    std::optional<uint32_t> linear;
    for (uint32_t i = 0; i < md.size(); i++) {
      if (md.get(i) == name)
        linear = i;
    }
    ASSERT_TRUE(linear.has_value()) << name;
    EXPECT_EQ(md.find(name), linear) << name;
  }
  EXPECT_FALSE(md.find("alpha1").has_value());
}
