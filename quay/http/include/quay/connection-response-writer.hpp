#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "quay/http-headers.hpp"
#include "quay/http-request.hpp"
#include "quay/http-status-code.hpp"
#include "quay/platform.hpp"
#include "quay/response-writer.hpp"
#include "quay/structured-logger.hpp"

namespace quay {

// ResponseWriter serializing an HTTP/1.x response on a connected socket.
//
// The body is buffered up to kBufferSize bytes before the head is sent, so that small responses get an exact
// Content-Length. Past that point, responses without an explicit Content-Length are sent with chunked encoding
// (HTTP/1.1) or delimited by closing the connection (HTTP/1.0).
// A Date header is always added, and Content-Type is sniffed from the first body bytes when the handler did not set
// it. Body bytes written for a HEAD request are counted but not sent.
// The socket is expected to be blocking with a send timeout (SO_SNDTIMEO) bounding each send.
class ConnectionResponseWriter final : public ResponseWriter {
 public:
  static constexpr std::size_t kBufferSize = 4096;

  // 'keepAlive' tells whether the connection may be reused after this response if the handler does not prevent it.
  ConnectionResponseWriter(NativeHandle fd, const HttpRequest& request, bool keepAlive,
                           const StructuredLogger& logger) noexcept;

  HttpHeaders& headers() override { return _headers; }

  void writeHeader(http::StatusCode code) override;

  std::size_t write(std::string_view data) override;

  [[nodiscard]] bool ok() const noexcept override { return _ok; }

  // Completes the response: sends the head if not done yet, the remaining buffered body and the last chunk.
  // Returns true if the connection can be reused for another request.
  bool finish();

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] bool headSent() const noexcept { return _headSent; }

 private:
  enum class Framing : uint8_t { ContentLength, Chunked, CloseDelimited, NoBody };

  void sendHead(bool final);

  void flushBuffer();

  bool sendAll(std::string_view data);

  NativeHandle _fd;
  const HttpRequest& _request;
  const StructuredLogger& _logger;
  HttpHeaders _headers;
  std::string _buffer;
  std::optional<uint64_t> _declaredLength;
  uint64_t _bodyBytes{0};
  http::StatusCode _status{0};
  Framing _framing{Framing::ContentLength};
  bool _isHead;
  bool _keepAlive;
  bool _headSent{false};
  bool _ok{true};
};

// Sends a minimal error response for requests rejected before reaching a handler (malformed head, oversized head,
// unsupported version). The connection must be closed afterwards.
// Returns false if the response could not be fully sent.
bool SendTransportError(NativeHandle fd, http::StatusCode code);

}  // namespace quay
