#include "courier/http-header.hpp"

#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "courier/invalid_argument_exception.hpp"

namespace courier {

TEST(HttpHeader, IsHeaderWhitespace) {
  EXPECT_TRUE(http::IsHeaderWhitespace(' '));
  EXPECT_TRUE(http::IsHeaderWhitespace('\t'));
  EXPECT_FALSE(http::IsHeaderWhitespace('A'));
  EXPECT_FALSE(http::IsHeaderWhitespace('\n'));
}

TEST(HttpHeader, IsValidHeaderName) {
  EXPECT_TRUE(http::IsValidHeaderName("Content-Type"));
  EXPECT_TRUE(http::IsValidHeaderName("X-Custom-Header_123"));
  EXPECT_FALSE(http::IsValidHeaderName("Invalid<Header"));
  EXPECT_FALSE(http::IsValidHeaderName(""));
  EXPECT_FALSE(http::IsValidHeaderName("Invalid Header"));
  EXPECT_FALSE(http::IsValidHeaderName("Invalid:Header"));
}

TEST(HttpHeader, IsValidHeaderValue) {
  EXPECT_TRUE(http::IsValidHeaderValue("W/\"33a64df551425fcc55e4d42a148795d9f25f89d4\""));
  EXPECT_TRUE(http::IsValidHeaderValue("Value with\ttab character."));
  EXPECT_FALSE(http::IsValidHeaderValue("Invalid value with \r carriage return."));
  EXPECT_FALSE(http::IsValidHeaderValue("Invalid value with \n line feed."));
  EXPECT_TRUE(http::IsValidHeaderValue(""));

  EXPECT_FALSE(http::IsValidHeaderValue(std::string_view("\x01\x02\x03", 3)));
  EXPECT_TRUE(http::IsValidHeaderValue(std::string_view("\x09\x20\x7E", 3)));
  EXPECT_TRUE(http::IsValidHeaderValue("caf\xC3\xA9"));  // obs-text
}

TEST(HttpHeader, NameAndTrimmedValue) {
  http::Header header("ETag", "  \"abc\"\t");
  EXPECT_EQ(header.name(), "ETag");
  EXPECT_EQ(header.value(), "\"abc\"");
  EXPECT_EQ(header.raw(), "ETag: \"abc\"");
  EXPECT_EQ(http::Header("Empty-Value", "   ").value(), "");
}

TEST(HttpHeader, InvalidHeaderThrows) {
  EXPECT_THROW(http::Header("Invalid Header", "Value"), invalid_argument);
  EXPECT_THROW(http::Header("", "Value"), invalid_argument);
  EXPECT_THROW(http::Header("X-Test", "Invalid\rValue"), invalid_argument);
}

TEST(HttpHeader, FindHeaderValueIsCaseInsensitiveAndReturnsFirst) {
  const std::vector<http::Header> headers{{"Set-Cookie", "a=1"}, {"ETag", "\"v1\""}, {"set-cookie", "b=2"}};

  EXPECT_EQ(http::FindHeaderValue(headers, "etag"), "\"v1\"");
  EXPECT_EQ(http::FindHeaderValue(headers, "SET-COOKIE"), "a=1");
  EXPECT_FALSE(http::FindHeaderValue(headers, "Date").has_value());
}

}  // namespace courier
