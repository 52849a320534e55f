#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "quay/http-headers.hpp"
#include "quay/http-status-code.hpp"
#include "quay/socket.hpp"

namespace quay::test {
using namespace std::chrono_literals;

// Blocking TCP connection to 127.0.0.1 on given port, with a receive timeout.
class ClientConnection {
 public:
  ClientConnection() noexcept = default;

  // Throws std::system_error if the connection cannot be established.
  explicit ClientConnection(uint16_t port, std::chrono::milliseconds timeout = 2000ms);

  [[nodiscard]] int fd() const noexcept { return _socket.fd(); }

  void close() noexcept { _socket.close(); }

 private:
  Socket _socket;
};

// Minimal parsed HTTP response representation for test assertions.
struct ParsedResponse {
  http::StatusCode statusCode{0};
  std::string version;
  std::string reason;
  HttpHeaders headers;
  std::string body;  // de-chunked
  bool chunked{false};
};

struct RequestOptions {
  std::string method{"GET"};
  std::string target{"/"};
  std::string host{"localhost"};
  std::string connection{"close"};
  std::string version{"HTTP/1.1"};
  std::vector<std::pair<std::string, std::string>> headers;  // additional headers
};

std::string buildRequest(const RequestOptions& opt);

bool sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout = 2000ms);

// Reads exactly one HTTP response (head + body framed by Content-Length, chunked encoding or connection close).
// 'headRequest' tells that the response has no body whatever its headers say.
// Returns the raw bytes read (possibly incomplete on timeout).
std::string recvResponse(int fd, bool headRequest = false, std::chrono::milliseconds totalTimeout = 3000ms);

// Reads until the peer closes the connection or the timeout expires.
std::string recvUntilClosed(int fd, std::chrono::milliseconds totalTimeout = 3000ms);

// Very small HTTP/1.x response parser, enough for test consumption.
std::optional<ParsedResponse> parseResponse(std::string_view raw, bool headRequest = false);

// Opens a connection, sends the request built from 'opt' and parses the response.
// Throws std::runtime_error on connection, timeout or parsing failures.
ParsedResponse requestOrThrow(uint16_t port, const RequestOptions& opt = {});

// Sends raw bytes on a fresh connection and returns everything received until the server closes it.
std::string sendAndCollect(uint16_t port, std::string_view raw);

bool AttemptConnect(uint16_t port);

// File descriptor of this process listening on given TCP port, -1 if there is none.
int FindListeningSocket(uint16_t port);

// Waits until the peer closes the connection (read returns 0 or an error).
bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout);

}  // namespace quay::test
