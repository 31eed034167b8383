#include "ember/string-equal-ignore-case.hpp"

#include <gtest/gtest.h>

#include "ember/string-trim.hpp"

namespace ember {

TEST(CaseInsensitiveEqual, Basic) {
  EXPECT_TRUE(CaseInsensitiveEqual("gzip", "GZIP"));
  EXPECT_TRUE(CaseInsensitiveEqual("Br", "bR"));
  EXPECT_TRUE(CaseInsensitiveEqual("", ""));
  EXPECT_FALSE(CaseInsensitiveEqual("gzip", "gzi"));
  EXPECT_FALSE(CaseInsensitiveEqual("br", "bz"));
}

TEST(CaseInsensitiveEqual, Constexpr) {
  static_assert(CaseInsensitiveEqual("Content-Type", "content-type"));
  static_assert(!CaseInsensitiveEqual("Content-Type", "Content-Length"));
}

TEST(TrimOws, SpacesAndTabs) {
  EXPECT_EQ(TrimOws("  gzip\t"), "gzip");
  EXPECT_EQ(TrimOws("\t \t"), "");
  EXPECT_EQ(TrimOws("br"), "br");
  EXPECT_EQ(TrimOws(" a b "), "a b");
}

TEST(TrimOws, OnlySpaceAndHorizontalTab) {
  static_assert(TrimOws(" \tbr;q=0.5 ") == "br;q=0.5");
  EXPECT_EQ(TrimOws("\r\ngzip\n"), "\r\ngzip\n");
  EXPECT_EQ(TrimOws("\v gzip"), "\v gzip");
}

}  // namespace ember
