#include "quay/connection-response-writer.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>

#include <stdexcept>
#include <string>
#include <string_view>

#include "quay/base-fd.hpp"
#include "quay/http-constants.hpp"
#include "quay/http-request.hpp"
#include "quay/http-status-code.hpp"
#include "quay/log-capture.hpp"
#include "quay/test-http-client.hpp"

namespace quay {

class ConnectionResponseWriterTest : public ::testing::Test {
 protected:
  ConnectionResponseWriterTest() {
    int fds[2];
    EXPECT_EQ(::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds), 0);
    serverSide = BaseFd(fds[0]);
    clientSide = BaseFd(fds[1]);
    parse("GET /x HTTP/1.1\r\nHost: h\r\n\r\n");
  }

  void parse(std::string_view raw) {
    req = HttpRequest{};
    ASSERT_EQ(ParseRequestHead(raw, "127.0.0.1:9", req), 0);
  }

  ConnectionResponseWriter makeWriter() {
    return ConnectionResponseWriter(serverSide.fd(), req, req.wantsKeepAlive(), logs.logger());
  }

  test::ParsedResponse readResponse() {
    const bool isHead = req.method() == http::HEAD;
    const std::string raw = test::recvResponse(clientSide.fd(), isHead, std::chrono::milliseconds{1000});
    auto parsed = test::parseResponse(raw, isHead);
    EXPECT_TRUE(parsed.has_value()) << raw;
    return parsed.value_or(test::ParsedResponse{});
  }

  BaseFd serverSide;
  BaseFd clientSide;
  HttpRequest req;
  test::LogCapture logs;
};

TEST_F(ConnectionResponseWriterTest, SmallBodyGetsContentLength) {
  auto writer = makeWriter();
  EXPECT_EQ(writer.write("hello"), 5U);
  EXPECT_TRUE(writer.finish());
  EXPECT_TRUE(writer.ok());

  const auto resp = readResponse();
  EXPECT_EQ(resp.version, "HTTP/1.1");
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.reason, "OK");
  EXPECT_EQ(resp.headers.getOrEmpty(http::ContentLength), "5");
  EXPECT_EQ(resp.headers.getOrEmpty(http::ContentType), "text/plain; charset=utf-8");
  EXPECT_EQ(resp.headers.getOrEmpty(http::Date).size(), 29U);
  EXPECT_FALSE(resp.headers.contains(http::Connection));
  EXPECT_EQ(resp.body, "hello");
}

TEST_F(ConnectionResponseWriterTest, EmptyResponseImpliesOk) {
  auto writer = makeWriter();
  EXPECT_TRUE(writer.finish());
  EXPECT_EQ(writer.status(), http::StatusCodeOK);
  const auto resp = readResponse();
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.headers.getOrEmpty(http::ContentLength), "0");
  EXPECT_TRUE(resp.body.empty());
}

TEST_F(ConnectionResponseWriterTest, LargeBodyIsChunkedInHttp11) {
  const std::string payload(ConnectionResponseWriter::kBufferSize * 3 + 17, 'z');
  auto writer = makeWriter();
  EXPECT_EQ(writer.write(payload), payload.size());
  EXPECT_TRUE(writer.headSent());
  EXPECT_TRUE(writer.finish());

  const auto resp = readResponse();
  EXPECT_TRUE(resp.chunked);
  EXPECT_FALSE(resp.headers.contains(http::ContentLength));
  EXPECT_EQ(resp.body, payload);
}

TEST_F(ConnectionResponseWriterTest, LargeBodyIsCloseDelimitedInHttp10) {
  parse("GET /x HTTP/1.0\r\nConnection: keep-alive\r\n\r\n");
  const std::string payload(ConnectionResponseWriter::kBufferSize + 1, 'y');
  {
    auto writer = makeWriter();
    EXPECT_EQ(writer.write(payload), payload.size());
    EXPECT_FALSE(writer.finish());
  }
  serverSide.close();
  const std::string raw = test::recvUntilClosed(clientSide.fd(), std::chrono::milliseconds{1000});
  const auto resp = test::parseResponse(raw);
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->version, "HTTP/1.0");
  EXPECT_FALSE(resp->headers.contains(http::ContentLength));
  EXPECT_FALSE(resp->headers.contains(http::TransferEncoding));
  EXPECT_EQ(resp->body, payload);
}

TEST_F(ConnectionResponseWriterTest, DeclaredContentLengthIsEnforced) {
  auto writer = makeWriter();
  writer.headers().set(http::ContentLength, "3");
  writer.writeHeader(http::StatusCodeOK);
  EXPECT_EQ(writer.write("abcdef"), 0U);
  EXPECT_EQ(writer.write("abc"), 3U);
  EXPECT_TRUE(writer.finish());
  EXPECT_EQ(readResponse().body, "abc");
}

TEST_F(ConnectionResponseWriterTest, ShortBodyPreventsReuse) {
  auto writer = makeWriter();
  writer.headers().set(http::ContentLength, "10");
  writer.writeHeader(http::StatusCodeOK);
  EXPECT_EQ(writer.write("abc"), 3U);
  EXPECT_FALSE(writer.finish());
}

TEST_F(ConnectionResponseWriterTest, InvalidDeclaredContentLengthIsDropped) {
  auto writer = makeWriter();
  writer.headers().set(http::ContentLength, "ten");
  writer.writeHeader(http::StatusCodeOK);
  writer.write("abc");
  EXPECT_TRUE(writer.finish());
  EXPECT_EQ(readResponse().headers.getOrEmpty(http::ContentLength), "3");
  EXPECT_EQ(logs.withMessage("invalid Content-Length set by handler").size(), 1U);
}

TEST_F(ConnectionResponseWriterTest, HeadCountsBytesButSendsNoBody) {
  parse("HEAD /x HTTP/1.1\r\nHost: h\r\n\r\n");
  auto writer = makeWriter();
  EXPECT_EQ(writer.write("<html>hello</html>"), 18U);
  EXPECT_TRUE(writer.finish());
  const auto resp = readResponse();
  EXPECT_EQ(resp.headers.getOrEmpty(http::ContentLength), "18");
  EXPECT_EQ(resp.headers.getOrEmpty(http::ContentType), "text/html; charset=utf-8");
  EXPECT_TRUE(test::recvUntilClosed(clientSide.fd(), std::chrono::milliseconds{50}).empty());
}

TEST_F(ConnectionResponseWriterTest, NotModifiedHasNoBody) {
  auto writer = makeWriter();
  writer.writeHeader(http::StatusCodeNotModified);
  EXPECT_EQ(writer.write("ignored"), 0U);
  EXPECT_TRUE(writer.finish());
  const auto resp = readResponse();
  EXPECT_EQ(resp.statusCode, http::StatusCodeNotModified);
  EXPECT_FALSE(resp.headers.contains(http::ContentLength));
}

TEST_F(ConnectionResponseWriterTest, SuperfluousWriteHeaderIsIgnored) {
  auto writer = makeWriter();
  writer.writeHeader(http::StatusCodePartialContent);
  writer.writeHeader(http::StatusCodeNotFound);
  EXPECT_EQ(writer.status(), http::StatusCodePartialContent);
  EXPECT_EQ(logs.withMessage("superfluous writeHeader call").size(), 1U);
}

TEST_F(ConnectionResponseWriterTest, InvalidStatusThrows) {
  auto writer = makeWriter();
  EXPECT_THROW(writer.writeHeader(42), std::invalid_argument);
  EXPECT_THROW(writer.writeHeader(1000), std::invalid_argument);
}

TEST_F(ConnectionResponseWriterTest, UnknownStatusGetsGenericReason) {
  auto writer = makeWriter();
  writer.writeHeader(599);
  EXPECT_TRUE(writer.finish());
  const auto resp = readResponse();
  EXPECT_EQ(resp.statusCode, 599);
  EXPECT_EQ(resp.reason, "status code 599");
}

TEST_F(ConnectionResponseWriterTest, ConnectionCloseRequested) {
  parse("GET /x HTTP/1.1\r\nHost: h\r\nConnection: close\r\n\r\n");
  auto writer = makeWriter();
  writer.write("a");
  EXPECT_FALSE(writer.finish());
  EXPECT_EQ(readResponse().headers.getOrEmpty(http::Connection), "close");
}

TEST_F(ConnectionResponseWriterTest, HandlerCanCloseConnection) {
  auto writer = makeWriter();
  writer.headers().set(http::Connection, "close");
  writer.write("a");
  EXPECT_FALSE(writer.finish());
}

TEST_F(ConnectionResponseWriterTest, Http10KeepAliveIsAcknowledged) {
  parse("GET /x HTTP/1.0\r\nConnection: keep-alive\r\n\r\n");
  auto writer = makeWriter();
  writer.write("a");
  EXPECT_TRUE(writer.finish());
  const auto resp = readResponse();
  EXPECT_EQ(resp.version, "HTTP/1.0");
  EXPECT_EQ(resp.headers.getOrEmpty(http::Connection), "keep-alive");
}

TEST_F(ConnectionResponseWriterTest, WriteFailureMarksWriterNotOk) {
  clientSide.close();
  auto writer = makeWriter();
  const std::string payload(ConnectionResponseWriter::kBufferSize * 2, 'q');
  EXPECT_EQ(writer.write(payload), 0U);
  EXPECT_FALSE(writer.ok());
  EXPECT_FALSE(writer.finish());
}

TEST_F(ConnectionResponseWriterTest, TransportError) {
  EXPECT_TRUE(SendTransportError(serverSide.fd(), http::StatusCodeRequestHeaderFieldsTooLarge));
  const auto resp = readResponse();
  EXPECT_EQ(resp.statusCode, http::StatusCodeRequestHeaderFieldsTooLarge);
  EXPECT_EQ(resp.reason, "Request Header Fields Too Large");
  EXPECT_EQ(resp.headers.getOrEmpty(http::Connection), "close");
  EXPECT_EQ(resp.body, "431 Request Header Fields Too Large");
}

}  // namespace quay
