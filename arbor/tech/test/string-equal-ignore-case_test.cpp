#include "arbor/string-equal-ignore-case.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

namespace arbor {

TEST(StringEqualIgnoreCase, EqualStrings) {
  EXPECT_TRUE(CaseInsensitiveEqual("hello", "HELLO"));
  EXPECT_TRUE(CaseInsensitiveEqual("Hello", "hello"));
  EXPECT_TRUE(CaseInsensitiveEqual("Content-Type", "content-type"));
  EXPECT_TRUE(CaseInsensitiveEqual("", ""));
}

TEST(StringEqualIgnoreCase, UnequalStrings) {
  EXPECT_FALSE(CaseInsensitiveEqual("hello", "world"));
  EXPECT_FALSE(CaseInsensitiveEqual("HELLO", "hell"));
  EXPECT_FALSE(CaseInsensitiveEqual("", "a"));
  EXPECT_FALSE(CaseInsensitiveEqual("Location", "Locations"));
}

TEST(StringEqualIgnoreCase, NonLettersAreComparedExactly) {
  EXPECT_TRUE(CaseInsensitiveEqual("x-1_2", "X-1_2"));
  EXPECT_FALSE(CaseInsensitiveEqual("a-b", "a_b"));
  // '@' and '`' differ from 'A' and 'a' only by the case bit, but are not letters
  EXPECT_FALSE(CaseInsensitiveEqual("@", "`"));
  EXPECT_FALSE(CaseInsensitiveEqual("[", "{"));
}

TEST(StringEqualIgnoreCase, StringVariants) {
  std::string lhs = "FooBar";
  std::string_view rhs = "foobar";
  EXPECT_TRUE(CaseInsensitiveEqual(lhs, rhs));
  EXPECT_FALSE(CaseInsensitiveEqual(lhs, "foo"));
}

TEST(AsciiToLower, LettersOnly) {
  EXPECT_EQ(AsciiToLower('A'), 'a');
  EXPECT_EQ(AsciiToLower('Z'), 'z');
  EXPECT_EQ(AsciiToLower('m'), 'm');
  EXPECT_EQ(AsciiToLower('@'), '@');
  EXPECT_EQ(AsciiToLower('['), '[');
  EXPECT_EQ(AsciiToLower('0'), '0');
}

TEST(StringEqualIgnoreCase, Constexpr) {
  static_assert(CaseInsensitiveEqual("GET", "get"));
  static_assert(!CaseInsensitiveEqual("GET", "got"));
}

}  // namespace arbor
