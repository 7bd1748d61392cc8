#include "BinaryPack.hpp"
#include "Serialize.hpp"
#include <gtest/gtest.h>

#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct Inner {
  int32_t delta{ 0 };
  std::string label;

  template <typename Archive> void serialize(Archive &ar) { ar & delta & label; }

  bool operator==(const Inner &other) const {
    return delta == other.delta && label == other.label;
  }
};

struct Outer {
  uint16_t version{ 1 };
  bool flag{ false };
  int64_t amount{ 0 };
  std::vector<Inner> items;
  std::map<uint64_t, int64_t> balances;

  template <typename Archive> void serialize(Archive &ar) {
    ar & version & flag & amount & items & balances;
  }
};

} // namespace

TEST(SerializeTest, IntegersAreBigEndian) {
  std::ostringstream oss;
  lw::OutputArchive ar(oss);
  ar & static_cast<uint32_t>(0x01020304);
  EXPECT_EQ(oss.str(), std::string("\x01\x02\x03\x04", 4));
}

TEST(SerializeTest, NegativeValuesSurvive) {
  std::string packed = lw::utl::binaryPack(static_cast<int64_t>(-123456789));
  auto result = lw::utl::binaryUnpack<int64_t>(packed);
  ASSERT_TRUE(result.isOk());
  EXPECT_EQ(result.value(), -123456789);
}

TEST(SerializeTest, StringIsLengthPrefixed) {
  std::string packed = lw::utl::binaryPack(std::string("abc"));
  EXPECT_EQ(packed.size(), 8u + 3u);
  EXPECT_EQ(packed.substr(8), "abc");
}

TEST(SerializeTest, NestedStructure) {
  Outer outer;
  outer.flag = true;
  outer.amount = -5;
  outer.items = {{1, "one"}, {-2, std::string("t\0wo", 4)}};
  outer.balances = {{0, 100}, {7, -3}};

  auto result = lw::utl::binaryUnpack<Outer>(lw::utl::binaryPack(outer));
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_TRUE(result->flag);
  EXPECT_EQ(result->amount, -5);
  EXPECT_EQ(result->items, outer.items);
  EXPECT_EQ(result->balances, outer.balances);
}

TEST(SerializeTest, TruncatedInputFails) {
  Outer outer;
  outer.items = {{1, "one"}};
  std::string packed = lw::utl::binaryPack(outer);
  packed.resize(packed.size() - 2);

  auto result = lw::utl::binaryUnpack<Outer>(packed);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 1);
}

TEST(SerializeTest, TrailingBytesFail) {
  std::string packed = lw::utl::binaryPack(static_cast<uint32_t>(5)) + "x";
  auto result = lw::utl::binaryUnpack<uint32_t>(packed);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, 2);
}

TEST(SerializeTest, OversizedLengthFails) {
  // Claimed string length far beyond MAX_ELEMENTS
  std::string packed(8, '\xff');
  auto result = lw::utl::binaryUnpack<std::string>(packed);
  EXPECT_TRUE(result.isError());
}
