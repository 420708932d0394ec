#include "cronrunner/util/base64.hpp"

#include "gtest/gtest.h"

using namespace cronrunner;

TEST(Base64Test, DecodesSchedule) {
  auto result = base64_decode("KiAqICogKiAq");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, "* * * * *");
}

TEST(Base64Test, DecodesWithPadding) {
  EXPECT_EQ(base64_decode("ZWNobyBoZWxsbw==").value_or(""), "echo hello");
  EXPECT_EQ(base64_decode("YWI=").value_or(""), "ab");
  EXPECT_EQ(base64_decode("YQ==").value_or(""), "a");
}

TEST(Base64Test, KeepsEmbeddedNewline) {
  EXPECT_EQ(base64_decode("ZWNobyBoaQo=").value_or(""), "echo hi\n");
}

TEST(Base64Test, IgnoresLineBreaksInInput) {
  auto result = base64_decode("ZWNobyBo\r\nZWxsbw==\n");
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(*result, "echo hello");
}

TEST(Base64Test, EmptyInputDecodesToEmpty) {
  auto result = base64_decode("");
  ASSERT_TRUE(result.has_value());
  EXPECT_TRUE(result->empty());
}

TEST(Base64Test, RejectsBadLength) {
  auto result = base64_decode("KiAqI");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().value(), static_cast<int>(Error::DecodeError));
}

TEST(Base64Test, RejectsInvalidCharacters) {
  auto result = base64_decode("a!b?");
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().value(), static_cast<int>(Error::DecodeError));
}
