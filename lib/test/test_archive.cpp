#include "BinaryPack.hpp"
#include "ResultOrError.hpp"
#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace sy;

namespace {

struct Pair {
  uint32_t id{ 0 };
  std::string name;

  template <typename Archive> void serialize(Archive &ar) { ar & id & name; }
};

struct Outer {
  int64_t amount{ 0 };
  std::vector<Pair> items;

  template <typename Archive> void serialize(Archive &ar) {
    ar & amount & items;
  }
};

struct TestError : RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

ResultOrError<int, TestError> half(int value) {
  if (value % 2 != 0) {
    return TestError(7, "odd");
  }
  return value / 2;
}

} // namespace

TEST(ArchiveTest, IntegersAreBigEndian) {
  EXPECT_EQ(utl::binaryPack(uint32_t{ 0x01020304 }),
            std::string("\x01\x02\x03\x04", 4));
  EXPECT_EQ(utl::binaryPack(uint16_t{ 0x0a0b }), std::string("\x0a\x0b", 2));
  EXPECT_EQ(utl::binaryPack(int64_t{ -1 }), std::string(8, '\xff'));
}

TEST(ArchiveTest, StringCarriesSizePrefix) {
  std::string packed = utl::binaryPack(std::string("ab"));
  EXPECT_EQ(packed, std::string("\0\0\0\0\0\0\0\x02" "ab", 10));
}

TEST(ArchiveTest, CustomTypesFollowFieldOrder) {
  Outer outer;
  outer.amount = 5;
  outer.items.push_back({ 1, "x" });

  std::string expected;
  expected += std::string("\0\0\0\0\0\0\0\x05", 8);  // amount
  expected += std::string("\0\0\0\0\0\0\0\x01", 8);  // items size
  expected += std::string("\0\0\0\x01", 4);          // id
  expected += std::string("\0\0\0\0\0\0\0\x01" "x", 9); // name
  EXPECT_EQ(utl::binaryPack(outer), expected);
}

TEST(ArchiveTest, DistinctValuesPackDistinctly) {
  Pair a{ 1, "ab" };
  Pair b{ 1, "a" };
  EXPECT_NE(utl::binaryPack(a), utl::binaryPack(b));
}

TEST(ResultOrErrorTest, CarriesValueOrError) {
  auto ok = half(4);
  ASSERT_TRUE(ok.isOk());
  EXPECT_EQ(*ok, 2);
  EXPECT_EQ(ok.valueOr(-1), 2);

  auto err = half(3);
  ASSERT_TRUE(err.isError());
  EXPECT_FALSE(err);
  EXPECT_EQ(err.error().code, 7);
  EXPECT_EQ(err.error().message, "odd");
  EXPECT_EQ(err.valueOr(-1), -1);
  EXPECT_THROW(err.value(), std::runtime_error);
}

TEST(ResultOrErrorTest, VoidSpecialization) {
  ResultOrError<void, TestError> ok;
  EXPECT_TRUE(ok.isOk());
  EXPECT_THROW(ok.error(), std::runtime_error);

  ResultOrError<void, TestError> err = TestError("plain");
  EXPECT_TRUE(err.isError());
  EXPECT_EQ(err.error().code, -1);
}
