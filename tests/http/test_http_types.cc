#include <gtest/gtest.h>

#include "reasm/http/headers.h"
#include "reasm/http/http_types.h"

namespace reasm {
namespace http {
namespace {

TEST(HttpTypesTest, MethodNames) {
  EXPECT_STREQ("GET", httpMethodToString(HttpMethod::GET));
  EXPECT_STREQ("DELETE", httpMethodToString(HttpMethod::DELETE));
  EXPECT_STREQ("UNKNOWN", httpMethodToString(HttpMethod::UNKNOWN));

  EXPECT_EQ(HttpMethod::PATCH, httpMethodFromString("patch"));
  EXPECT_EQ(HttpMethod::OPTIONS, httpMethodFromString("OPTIONS"));
  EXPECT_EQ(HttpMethod::UNKNOWN, httpMethodFromString("BREW"));
}

TEST(HttpTypesTest, StatusCodes) {
  EXPECT_STREQ("OK", httpStatusCodeToString(HttpStatusCode::OK));
  EXPECT_STREQ("Switching Protocols",
               httpStatusCodeToString(HttpStatusCode::SwitchingProtocols));
  EXPECT_STREQ("Not Found", httpStatusCodeToString(HttpStatusCode::NotFound));
  EXPECT_STREQ("Unknown",
               httpStatusCodeToString(static_cast<HttpStatusCode>(299)));
  EXPECT_EQ(204, statusCodeValue(HttpStatusCode::NoContent));
}

TEST(HttpTypesTest, Version) {
  EXPECT_EQ("HTTP/1.1", HttpVersion(1, 1).toString());
  EXPECT_EQ("HTTP/1.0", HttpVersion(1, 0).toString());
  EXPECT_EQ(HttpVersion(1, 1), HttpVersion(1, 1));
  EXPECT_NE(HttpVersion(1, 0), HttpVersion(1, 1));
  EXPECT_EQ(HttpVersion(0, 0), HttpVersion());
}

TEST(HeadersTest, NamesAreCaseInsensitive) {
  Headers headers;
  headers.set("Content-Type", "text/plain");

  EXPECT_TRUE(headers.has("content-type"));
  EXPECT_EQ("text/plain", headers.get("CONTENT-TYPE").value());
  EXPECT_FALSE(headers.get("Content-Length").has_value());

  headers.set("content-type", "text/html");
  EXPECT_EQ(1u, headers.size());
  EXPECT_EQ("text/html", headers.get("Content-Type").value());

  // First spelling is kept
  EXPECT_EQ("Content-Type", headers.begin()->first);
}

TEST(HeadersTest, SubscriptInsertsEmptyValue) {
  Headers headers;
  headers["X-New"];

  EXPECT_TRUE(headers.has("x-new"));
  EXPECT_EQ("", headers.get("X-New").value());

  headers["x-new"] += "v";
  EXPECT_EQ("v", headers.get("X-New").value());
}

TEST(HeadersTest, RemoveAndClear) {
  Headers headers{{"A", "1"}, {"B", "2"}};

  headers.remove("a");
  EXPECT_FALSE(headers.has("A"));
  EXPECT_EQ(1u, headers.size());

  headers.clear();
  EXPECT_TRUE(headers.empty());
}

TEST(HeadersTest, EqualityIgnoresNameCase) {
  EXPECT_EQ((Headers{{"Host", "x"}}), (Headers{{"host", "x"}}));
  EXPECT_NE((Headers{{"Host", "x"}}), (Headers{{"Host", "X"}}));
  EXPECT_NE((Headers{{"Host", "x"}}), (Headers{{"Host", "x"}, {"A", ""}}));
}

TEST(HeadersTest, EqualsIgnoreCase) {
  EXPECT_TRUE(equalsIgnoreCase("Set-Cookie", "set-COOKIE"));
  EXPECT_FALSE(equalsIgnoreCase("Set-Cookie", "Set-Cookies"));
  EXPECT_TRUE(equalsIgnoreCase("", ""));
}

}  // namespace
}  // namespace http
}  // namespace reasm
