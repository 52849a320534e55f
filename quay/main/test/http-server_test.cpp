#include "quay/http-server.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "quay/http-constants.hpp"
#include "quay/http-handler.hpp"
#include "quay/http-request.hpp"
#include "quay/http-status-code.hpp"
#include "quay/log-capture.hpp"
#include "quay/response-writer.hpp"
#include "quay/server-config.hpp"
#include "quay/socket-ops.hpp"
#include "quay/test-http-client.hpp"
#include "quay/timedef.hpp"

namespace quay {

using namespace std::chrono_literals;

namespace {

// Blocks handler calls until released, and tells when a handler call started.
class Gate {
 public:
  void enterAndWait() {
    std::unique_lock lock(_mutex);
    ++_entered;
    _cv.notify_all();
    _cv.wait(lock, [this] { return _open; });
  }

  bool waitEntered(int count, std::chrono::milliseconds timeout) {
    std::unique_lock lock(_mutex);
    return _cv.wait_for(lock, timeout, [&] { return _entered >= count; });
  }

  void open() {
    std::scoped_lock lock(_mutex);
    _open = true;
    _cv.notify_all();
  }

 private:
  std::mutex _mutex;
  std::condition_variable _cv;
  int _entered{0};
  bool _open{false};
};

ServerConfig TestConfig() { return ServerConfig{}.withPort("0").withStaticDir("."); }

}  // namespace

class HttpServerTest : public ::testing::Test {
 protected:
  void startServer(ServerConfig config = TestConfig()) {
    auto handler = std::make_shared<const HandlerFunc>([this, gate = gate](const HttpRequest& req,
                                                                           ResponseWriter& writer) {
      ++nbCalls;
      if (req.path() == "/throw") {
        throw std::runtime_error("boom");
      }
      if (req.path() == "/slow") {
        gate->enterAndWait();
      }
      writer.headers().set(http::ContentType, "text/plain");
      writer.write("path=");
      writer.write(req.path());
    });
    server = std::make_unique<HttpServer>(std::move(config), std::move(handler), logs.logger());
    server->start();
    port = server->port();
  }

  // Shared with the handler, which may still run after a forced shutdown.
  std::shared_ptr<Gate> gate = std::make_shared<Gate>();
  std::atomic<int> nbCalls{0};
  test::LogCapture logs;
  std::unique_ptr<HttpServer> server;
  uint16_t port{0};
};

TEST_F(HttpServerTest, ConstructionValidatesArguments) {
  EXPECT_THROW(HttpServer(TestConfig(), nullptr, logs.logger()), std::invalid_argument);
  auto handler = std::make_shared<const HandlerFunc>([](const HttpRequest&, ResponseWriter&) {});
  EXPECT_THROW(HttpServer(TestConfig().withReadTimeout(0ms), handler, logs.logger()), std::invalid_argument);
}

TEST_F(HttpServerTest, StateTransitions) {
  auto handler = std::make_shared<const HandlerFunc>([](const HttpRequest&, ResponseWriter&) {});
  HttpServer srv(TestConfig(), handler, logs.logger());
  EXPECT_EQ(srv.state(), HttpServer::State::Idle);
  EXPECT_EQ(srv.port(), 0);
  EXPECT_EQ(srv.config().port, "0");
  srv.start();
  EXPECT_EQ(srv.state(), HttpServer::State::Running);
  EXPECT_NE(srv.port(), 0);
  EXPECT_THROW(srv.start(), std::logic_error);
  EXPECT_EQ(srv.shutdown(1s), HttpServer::ShutdownResult::Clean);
  EXPECT_EQ(srv.state(), HttpServer::State::Stopped);
  EXPECT_THROW(srv.start(), std::logic_error);
  EXPECT_EQ(srv.shutdown(1s), HttpServer::ShutdownResult::Clean);
}

TEST_F(HttpServerTest, ShutdownOfIdleServer) {
  auto handler = std::make_shared<const HandlerFunc>([](const HttpRequest&, ResponseWriter&) {});
  HttpServer srv(TestConfig(), handler, logs.logger());
  EXPECT_EQ(srv.shutdown(1s), HttpServer::ShutdownResult::Clean);
  EXPECT_EQ(srv.state(), HttpServer::State::Stopped);
  EXPECT_THROW(srv.start(), std::logic_error);
}

TEST_F(HttpServerTest, ListenFailures) {
  startServer();
  auto handler = std::make_shared<const HandlerFunc>([](const HttpRequest&, ResponseWriter&) {});

  HttpServer samePort(TestConfig().withPort(std::to_string(port)), handler, logs.logger());
  EXPECT_THROW(samePort.start(), std::system_error);
  EXPECT_EQ(samePort.state(), HttpServer::State::Idle);

  HttpServer outOfRange(TestConfig().withPort("99999"), handler, logs.logger());
  EXPECT_THROW(outOfRange.start(), std::system_error);

  HttpServer notANumber(TestConfig().withPort("not-a-port"), handler, logs.logger());
  EXPECT_THROW(notANumber.start(), std::system_error);
}

TEST_F(HttpServerTest, AcceptFailureIsReported) {
  startServer();
  EXPECT_EQ(WaitReadable(server->failureFd(), SteadyClock::now() + 50ms), WaitResult::Timeout);
  EXPECT_TRUE(server->failure().empty());

  // A listening socket shut down under the accept loop makes accept fail with EINVAL.
  const int listenFd = test::FindListeningSocket(port);
  ASSERT_NE(listenFd, -1);
  ASSERT_EQ(::shutdown(listenFd, SHUT_RDWR), 0);

  ASSERT_EQ(WaitReadable(server->failureFd(), SteadyClock::now() + 5s), WaitResult::Ready);
  EXPECT_NE(server->failure().find("accept tcp :0"), std::string::npos) << server->failure();
  EXPECT_EQ(server->state(), HttpServer::State::Running);
  EXPECT_EQ(server->shutdown(1s), HttpServer::ShutdownResult::Clean);
}

TEST_F(HttpServerTest, ServesRequest) {
  startServer();
  const auto resp = test::requestOrThrow(port, {.target = "/hello"});
  EXPECT_EQ(resp.statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp.body, "path=/hello");
  EXPECT_EQ(resp.headers.getOrEmpty(http::ContentLength), "11");
  EXPECT_EQ(resp.headers.getOrEmpty(http::Connection), "close");
  EXPECT_FALSE(resp.headers.getOrEmpty(http::Date).empty());
  EXPECT_EQ(nbCalls.load(), 1);
}

TEST_F(HttpServerTest, KeepAliveConnectionServesSeveralRequests) {
  startServer();
  test::ClientConnection conn(port);
  for (std::string_view target : {"/a", "/b", "/c"}) {
    ASSERT_TRUE(test::sendAll(conn.fd(), test::buildRequest({.target = std::string(target), .connection = ""})));
    const auto resp = test::parseResponse(test::recvResponse(conn.fd()));
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ(resp->body, "path=" + std::string(target));
    EXPECT_FALSE(resp->headers.contains(http::Connection));
  }
  EXPECT_EQ(server->nbConnections(), 1U);
}

TEST_F(HttpServerTest, PipelinedRequestsAreAnsweredInOrder) {
  startServer();
  test::ClientConnection conn(port);
  const std::string requests = test::buildRequest({.target = "/first", .connection = ""}) +
                               test::buildRequest({.target = "/second", .connection = "close"});
  ASSERT_TRUE(test::sendAll(conn.fd(), requests));
  const std::string raw = test::recvUntilClosed(conn.fd());
  const auto secondPos = raw.find("HTTP/1.1", 1);
  ASSERT_NE(secondPos, std::string::npos);
  const auto first = test::parseResponse(raw.substr(0, secondPos));
  const auto second = test::parseResponse(raw.substr(secondPos));
  ASSERT_TRUE(first.has_value());
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(first->body, "path=/first");
  EXPECT_EQ(second->body, "path=/second");
}

TEST_F(HttpServerTest, Http10ClosesByDefault) {
  startServer();
  test::ClientConnection conn(port);
  ASSERT_TRUE(test::sendAll(conn.fd(), "GET /old HTTP/1.0\r\n\r\n"));
  const auto resp = test::parseResponse(test::recvUntilClosed(conn.fd()));
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->version, "HTTP/1.0");
  EXPECT_EQ(resp->body, "path=/old");
}

TEST_F(HttpServerTest, OversizedHeadIsRejected) {
  startServer(TestConfig().withMaxHeaderBytes(1024));
  test::RequestOptions opt;
  opt.headers.emplace_back("X-Big", std::string(2048, 'x'));
  const auto resp = test::parseResponse(test::sendAndCollect(port, test::buildRequest(opt)));
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->statusCode, http::StatusCodeRequestHeaderFieldsTooLarge);
  EXPECT_EQ(resp->headers.getOrEmpty(http::Connection), "close");
  EXPECT_EQ(nbCalls.load(), 0);
  EXPECT_TRUE(logs.withMessage("HTTP Request").empty());
}

TEST_F(HttpServerTest, MalformedRequestsAreRejected) {
  startServer();
  auto resp = test::parseResponse(test::sendAndCollect(port, "GET / HTTP/1.1\r\n\r\n"));  // no Host
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->statusCode, http::StatusCodeBadRequest);

  resp = test::parseResponse(test::sendAndCollect(port, "NOT A REQUEST\r\n\r\n"));
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->statusCode, http::StatusCodeBadRequest);

  resp = test::parseResponse(test::sendAndCollect(port, "GET / HTTP/2.0\r\nHost: h\r\n\r\n"));
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->statusCode, http::StatusCodeHTTPVersionNotSupported);
  EXPECT_EQ(nbCalls.load(), 0);
}

TEST_F(HttpServerTest, RequestWithBodyClosesConnection) {
  startServer();
  test::ClientConnection conn(port);
  ASSERT_TRUE(test::sendAll(conn.fd(), "POST /upload HTTP/1.1\r\nHost: h\r\nContent-Length: 5\r\n\r\nhello"));
  const auto resp = test::parseResponse(test::recvUntilClosed(conn.fd()));
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp->headers.getOrEmpty(http::Connection), "close");
  EXPECT_EQ(resp->body, "path=/upload");
}

TEST_F(HttpServerTest, HandlerExceptionClosesConnection) {
  startServer();
  test::ClientConnection conn(port);
  ASSERT_TRUE(test::sendAll(conn.fd(), test::buildRequest({.target = "/throw", .connection = ""})));
  EXPECT_TRUE(test::WaitForPeerClose(conn.fd(), 2s));
  ASSERT_TRUE(logs.waitForMessage("panic serving"));
  const auto records = logs.withMessage("panic serving");
  ASSERT_EQ(records.size(), 1U);
  EXPECT_EQ(test::JsonStringField(records.front(), "level"), "ERROR");
  EXPECT_EQ(test::JsonStringField(records.front(), "error"), "boom");
  EXPECT_TRUE(test::JsonStringField(records.front(), "remote_addr").starts_with("127.0.0.1:"));

  // The server keeps serving other connections.
  EXPECT_EQ(test::requestOrThrow(port, {.target = "/after"}).body, "path=/after");
}

TEST_F(HttpServerTest, IdleConnectionIsClosedAfterReadTimeout) {
  startServer(TestConfig().withReadTimeout(100ms));
  test::ClientConnection conn(port);
  EXPECT_TRUE(test::WaitForPeerClose(conn.fd(), 2s));
}

TEST_F(HttpServerTest, ShutdownClosesListenerAndIdleConnections) {
  startServer();
  test::ClientConnection conn(port);
  ASSERT_TRUE(test::sendAll(conn.fd(), test::buildRequest({.target = "/idle", .connection = ""})));
  ASSERT_TRUE(test::parseResponse(test::recvResponse(conn.fd())).has_value());

  const auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(server->shutdown(5s), HttpServer::ShutdownResult::Clean);
  EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
  EXPECT_TRUE(test::WaitForPeerClose(conn.fd(), 1s));
  EXPECT_FALSE(test::AttemptConnect(port));
  EXPECT_EQ(server->nbConnections(), 0U);
}

TEST_F(HttpServerTest, ShutdownWaitsForActiveRequest) {
  startServer();
  test::ClientConnection conn(port);
  ASSERT_TRUE(test::sendAll(conn.fd(), test::buildRequest({.target = "/slow", .connection = ""})));
  ASSERT_TRUE(gate->waitEntered(1, 2s));

  std::jthread releaser([gate = gate] {
    std::this_thread::sleep_for(100ms);
    gate->open();
  });
  EXPECT_EQ(server->shutdown(5s), HttpServer::ShutdownResult::Clean);

  const std::string raw = test::recvUntilClosed(conn.fd());
  const auto resp = test::parseResponse(raw);
  ASSERT_TRUE(resp.has_value()) << raw;
  EXPECT_EQ(resp->statusCode, http::StatusCodeOK);
  EXPECT_EQ(resp->body, "path=/slow");
}

TEST_F(HttpServerTest, ShutdownDeadlineExceeded) {
  startServer();
  test::ClientConnection conn(port);
  ASSERT_TRUE(test::sendAll(conn.fd(), test::buildRequest({.target = "/slow"})));
  ASSERT_TRUE(gate->waitEntered(1, 2s));

  const auto start = std::chrono::steady_clock::now();
  EXPECT_EQ(server->shutdown(100ms), HttpServer::ShutdownResult::DeadlineExceeded);
  EXPECT_GE(std::chrono::steady_clock::now() - start, 100ms);
  EXPECT_EQ(server->state(), HttpServer::State::Stopped);
  EXPECT_EQ(server->nbActiveConnections(), 1U);
  EXPECT_EQ(server->shutdown(1s), HttpServer::ShutdownResult::DeadlineExceeded);

  // The request left running still completes.
  gate->open();
  const auto resp = test::parseResponse(test::recvUntilClosed(conn.fd()));
  ASSERT_TRUE(resp.has_value());
  EXPECT_EQ(resp->body, "path=/slow");
}

TEST_F(HttpServerTest, ConcurrentConnections) {
  startServer();
  static constexpr int kNbClients = 8;
  std::atomic<int> nbOk{0};
  {
    std::jthread clients[kNbClients];
    for (int idx = 0; idx < kNbClients; ++idx) {
      clients[idx] = std::jthread([&, idx] {
        const auto target = "/client/" + std::to_string(idx);
        try {
          const auto resp = test::requestOrThrow(port, {.target = target});
          if (resp.statusCode == http::StatusCodeOK && resp.body == "path=" + target) {
            ++nbOk;
          }
        } catch (const std::exception& ex) {
          ADD_FAILURE() << target << ": " << ex.what();
        }
      });
    }
  }
  EXPECT_EQ(nbOk.load(), kNbClients);
}

}  // namespace quay
