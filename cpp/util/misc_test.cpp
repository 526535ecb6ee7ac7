#include "util/misc.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAreArray;
using ::testing::IsEmpty;

/*
 * Split
 */

// NOLINTNEXTLINE
TEST(Misc, Split) {
  std::string str = "/usr/bin:/bin";
  auto pieces = util::split(str, ':');
  EXPECT_THAT(pieces, ElementsAreArray({"/usr/bin", "/bin"}));
}

// NOLINTNEXTLINE
TEST(Misc, SplitEmpty) {
  std::string str;
  auto pieces = util::split(str, ' ');
  EXPECT_THAT(pieces, IsEmpty());
}

// NOLINTNEXTLINE
TEST(Misc, SplitSkipEmpty) {
  std::string str = "::/usr/bin:::/bin:";
  auto pieces = util::split(str, ':');
  EXPECT_THAT(pieces, ElementsAreArray({"/usr/bin", "/bin"}));
}

/*
 * Trim
 */

// NOLINTNEXTLINE
TEST(Misc, Trim) {
  EXPECT_EQ(util::trim("  print(1)\n\t"), "print(1)");
  EXPECT_EQ(util::trim("a b"), "a b");
}

// NOLINTNEXTLINE
TEST(Misc, TrimOnlyWhitespace) {
  EXPECT_EQ(util::trim(" \n\r\t\v\f"), "");
  EXPECT_EQ(util::trim(""), "");
}

/*
 * Setters
 */

// NOLINTNEXTLINE
TEST(Misc, SetBool) {
  bool x = false;
  util::setBool(x)();
  EXPECT_TRUE(x);
}

// NOLINTNEXTLINE
TEST(Misc, SetString) {
  std::string x;
  util::setString(x)("namespace");
  EXPECT_EQ(x, "namespace");
}

// NOLINTNEXTLINE
TEST(Misc, SetInt) {
  int x = 0;
  EXPECT_TRUE(util::setInt(x)("300"));
  EXPECT_EQ(x, 300);
}

// NOLINTNEXTLINE
TEST(Misc, SetIntRejectsGarbage) {
  int x = 7;
  EXPECT_FALSE(util::setInt(x)("lots"));
  EXPECT_EQ(x, 7);
}

// NOLINTNEXTLINE
TEST(Misc, SetUInt) {
  uint32_t x = 0;
  EXPECT_TRUE(util::setUint(x)("1048576"));
  EXPECT_EQ(x, 1048576);
}

}  // namespace
