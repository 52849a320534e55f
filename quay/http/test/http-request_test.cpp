#include "quay/http-request.hpp"

#include <gtest/gtest.h>

#include <string>
#include <string_view>

#include "quay/http-status-code.hpp"

namespace quay {

namespace {
http::StatusCode Parse(std::string_view raw, HttpRequest& req) { return ParseRequestHead(raw, "10.0.0.1:1234", req); }
}  // namespace

TEST(HttpRequestParse, SimpleGet) {
  HttpRequest req;
  ASSERT_EQ(Parse("GET /index.html HTTP/1.1\r\nHost: example.com\r\nUser-Agent: curl/8.0\r\n\r\n", req), 0);
  EXPECT_EQ(req.method(), "GET");
  EXPECT_EQ(req.target(), "/index.html");
  EXPECT_EQ(req.path(), "/index.html");
  EXPECT_TRUE(req.rawQuery().empty());
  EXPECT_EQ(req.versionMajor(), 1);
  EXPECT_EQ(req.versionMinor(), 1);
  EXPECT_TRUE(req.isHttp11OrLater());
  EXPECT_EQ(req.userAgent(), "curl/8.0");
  EXPECT_EQ(req.remoteAddr(), "10.0.0.1:1234");
  EXPECT_EQ(req.headerValueOrEmpty("host"), "example.com");
  EXPECT_FALSE(req.hasBody());
  EXPECT_TRUE(req.wantsKeepAlive());
}

TEST(HttpRequestParse, DecodesPathKeepsRawQuery) {
  HttpRequest req;
  ASSERT_EQ(Parse("GET /a%20b/c%2Cd?x=%41&y HTTP/1.1\r\nHost: h\r\n\r\n", req), 0);
  EXPECT_EQ(req.path(), "/a b/c,d");
  EXPECT_EQ(req.rawQuery(), "x=%41&y");
  EXPECT_EQ(req.target(), "/a%20b/c%2Cd?x=%41&y");
}

TEST(HttpRequestParse, PlusIsNotASpaceInPath) {
  HttpRequest req;
  ASSERT_EQ(Parse("GET /a+b HTTP/1.1\r\nHost: h\r\n\r\n", req), 0);
  EXPECT_EQ(req.path(), "/a+b");
}

TEST(HttpRequestParse, BareLineFeedsAndLeadingEmptyLines) {
  HttpRequest req;
  ASSERT_EQ(Parse("\r\n\nGET / HTTP/1.1\nHost: h\n\n", req), 0);
  EXPECT_EQ(req.path(), "/");
}

TEST(HttpRequestParse, Http10WithoutHost) {
  HttpRequest req;
  ASSERT_EQ(Parse("GET / HTTP/1.0\r\n\r\n", req), 0);
  EXPECT_FALSE(req.isHttp11OrLater());
  EXPECT_FALSE(req.wantsKeepAlive());
  ASSERT_EQ(Parse("GET / HTTP/1.0\r\nConnection: Keep-Alive\r\n\r\n", req), 0);
  EXPECT_TRUE(req.wantsKeepAlive());
}

TEST(HttpRequestParse, ConnectionClose) {
  HttpRequest req;
  ASSERT_EQ(Parse("GET / HTTP/1.1\r\nHost: h\r\nConnection: keep-alive, close\r\n\r\n", req), 0);
  EXPECT_FALSE(req.wantsKeepAlive());
}

TEST(HttpRequestParse, AbsoluteFormAndAsterisk) {
  HttpRequest req;
  ASSERT_EQ(Parse("GET http://example.com/p/q?z HTTP/1.1\r\nHost: example.com\r\n\r\n", req), 0);
  EXPECT_EQ(req.path(), "/p/q");
  EXPECT_EQ(req.rawQuery(), "z");
  ASSERT_EQ(Parse("GET http://example.com HTTP/1.1\r\nHost: example.com\r\n\r\n", req), 0);
  EXPECT_EQ(req.path(), "/");
  ASSERT_EQ(Parse("OPTIONS * HTTP/1.1\r\nHost: h\r\n\r\n", req), 0);
  EXPECT_EQ(req.path(), "*");
}

TEST(HttpRequestParse, BodyIsAnnounced) {
  HttpRequest req;
  ASSERT_EQ(Parse("POST /x HTTP/1.1\r\nHost: h\r\nContent-Length: 5\r\n\r\n", req), 0);
  EXPECT_TRUE(req.hasBody());
  ASSERT_EQ(Parse("POST /x HTTP/1.1\r\nHost: h\r\nContent-Length: 0\r\n\r\n", req), 0);
  EXPECT_FALSE(req.hasBody());
  ASSERT_EQ(Parse("POST /x HTTP/1.1\r\nHost: h\r\nTransfer-Encoding: chunked\r\n\r\n", req), 0);
  EXPECT_TRUE(req.hasBody());
}

TEST(HttpRequestParse, MalformedRequests) {
  HttpRequest req;
  for (std::string_view raw : {
           "\r\n\r\n",
           "GET\r\n\r\n",
           "GET /\r\n\r\n",
           "GET / HTTP/1.1\r\n\r\n",                                   // missing Host
           "GET / HTTP/1.1\r\nHost: a\r\nHost: b\r\n\r\n",             // duplicated Host
           "GET / HTTP/x.1\r\nHost: h\r\n\r\n",                        // bad version
           "G(T / HTTP/1.1\r\nHost: h\r\n\r\n",                        // bad method token
           "GET / HTTP/1.1\r\nHost: h\r\nBad Name: v\r\n\r\n",         // bad field name
           "GET / HTTP/1.1\r\nHost: h\r\nNoColon\r\n\r\n",             // no colon
           "GET / HTTP/1.1\r\nHost: h\r\n folded\r\n\r\n",             // obs-fold
           "GET /%zz HTTP/1.1\r\nHost: h\r\n\r\n",                     // bad escape
           "GET /%00 HTTP/1.1\r\nHost: h\r\n\r\n",                     // NUL in path
           "GET relative HTTP/1.1\r\nHost: h\r\n\r\n",                 // not origin-form
           "GET / HTTP/1.1\r\nHost: h\r\nContent-Length: -1\r\n\r\n",  // invalid length
           "GET / HTTP/1.1\r\nHost: h\r\nContent-Length: 1\r\nContent-Length: 2\r\n\r\n",
       }) {
    EXPECT_EQ(Parse(raw, req), http::StatusCodeBadRequest) << raw;
  }
}

TEST(HttpRequestParse, UnsupportedMajorVersion) {
  HttpRequest req;
  EXPECT_EQ(Parse("GET / HTTP/2.0\r\nHost: h\r\n\r\n", req), http::StatusCodeHTTPVersionNotSupported);
}

TEST(HttpRequestParse, HeaderValuesAreTrimmed) {
  HttpRequest req;
  ASSERT_EQ(Parse("GET / HTTP/1.1\r\nHost:   h  \r\nX-Empty:\r\n\r\n", req), 0);
  EXPECT_EQ(req.headerValueOrEmpty("Host"), "h");
  ASSERT_TRUE(req.headerValue("x-empty").has_value());
  EXPECT_TRUE(req.headerValue("x-empty")->empty());
  EXPECT_FALSE(req.headerValue("X-Missing").has_value());
}

TEST(FindRequestHeadEnd, Incomplete) {
  EXPECT_EQ(FindRequestHeadEnd(""), std::string_view::npos);
  EXPECT_EQ(FindRequestHeadEnd("GET / HTTP/1.1\r\nHost: h\r\n"), std::string_view::npos);
  EXPECT_EQ(FindRequestHeadEnd("GET / HTTP/1.1\r\nHost: h\r\n\r"), std::string_view::npos);
  EXPECT_EQ(FindRequestHeadEnd("\r\n\r\n"), std::string_view::npos);
}

TEST(FindRequestHeadEnd, Complete) {
  static constexpr std::string_view kHead = "GET / HTTP/1.1\r\nHost: h\r\n\r\n";
  EXPECT_EQ(FindRequestHeadEnd(kHead), kHead.size());
  EXPECT_EQ(FindRequestHeadEnd(std::string(kHead) + "GET /next"), kHead.size());
  EXPECT_EQ(FindRequestHeadEnd("GET / HTTP/1.0\n\n"), 16U);
  EXPECT_EQ(FindRequestHeadEnd("GET / HTTP/1.0\nA: b\r\n\n"), 22U);
}

TEST(FindRequestHeadEnd, LeadingEmptyLinesBelongToHead) {
  static constexpr std::string_view kHead = "\r\n\r\nGET / HTTP/1.0\r\n\r\n";
  EXPECT_EQ(FindRequestHeadEnd(kHead), kHead.size());
}

}  // namespace quay
