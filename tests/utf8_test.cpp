#include "upecho/wire/utf8.hpp"
#include <gtest/gtest.h>
#include <string>

namespace {

using upecho::wire::IsValidUtf8;

TEST(Utf8Test, AcceptsWellFormedText) {
  EXPECT_TRUE(IsValidUtf8(""));
  EXPECT_TRUE(IsValidUtf8("plain ascii"));
  EXPECT_TRUE(IsValidUtf8("\xC3\xA9"));         // U+00E9
  EXPECT_TRUE(IsValidUtf8("\xE2\x82\xAC"));     // U+20AC
  EXPECT_TRUE(IsValidUtf8("\xEF\xBF\xBF"));     // U+FFFF
  EXPECT_TRUE(IsValidUtf8("\xF0\x9F\x98\x80")); // U+1F600
  EXPECT_TRUE(IsValidUtf8("\xF4\x8F\xBF\xBF")); // U+10FFFF
  EXPECT_TRUE(IsValidUtf8(std::string("a\0b", 3)));
}

TEST(Utf8Test, RejectsOverlongForms) {
  EXPECT_FALSE(IsValidUtf8("\xC0\x80"));
  EXPECT_FALSE(IsValidUtf8("\xC1\xBF"));
  EXPECT_FALSE(IsValidUtf8("\xE0\x80\x80"));
  EXPECT_FALSE(IsValidUtf8("\xF0\x80\x80\x80"));
}

TEST(Utf8Test, RejectsSurrogatesAndOutOfRange) {
  EXPECT_FALSE(IsValidUtf8("\xED\xA0\x80")); // U+D800
  EXPECT_FALSE(IsValidUtf8("\xED\xBF\xBF")); // U+DFFF
  EXPECT_FALSE(IsValidUtf8("\xF4\x90\x80\x80"));
  EXPECT_FALSE(IsValidUtf8("\xF5\x80\x80\x80"));
}

TEST(Utf8Test, RejectsBrokenSequences) {
  EXPECT_FALSE(IsValidUtf8("\x80"));
  EXPECT_FALSE(IsValidUtf8("\xC3"));
  EXPECT_FALSE(IsValidUtf8("\xE2\x82"));
  EXPECT_FALSE(IsValidUtf8("\xE2\x28\xA1"));
  EXPECT_FALSE(IsValidUtf8("ok\xF0\x9F\x98"));
  EXPECT_FALSE(IsValidUtf8("\xFF"));
}

} // namespace
