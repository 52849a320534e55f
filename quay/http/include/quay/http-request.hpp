#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "quay/http-headers.hpp"
#include "quay/http-status-code.hpp"

namespace quay {

// A parsed HTTP/1.x request head. The body, if any, is never read.
class HttpRequest {
 public:
  // Method token, case-sensitive ("GET", "HEAD", ...).
  [[nodiscard]] std::string_view method() const noexcept { return _method; }

  // The raw request target as received ("/a%20b?x=1", "*", "http://host/a").
  [[nodiscard]] std::string_view target() const noexcept { return _target; }

  // The percent-decoded path of the target, without the query string.
  // Example:
  //  GET /path               -> '/path'
  //  GET /path?key=val       -> '/path'
  //  GET /path%2Caaa?key=val -> '/path,aaa'
  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  // The raw (still encoded) query string, without the '?'.
  [[nodiscard]] std::string_view rawQuery() const noexcept { return _rawQuery; }

  [[nodiscard]] uint8_t versionMajor() const noexcept { return _versionMajor; }
  [[nodiscard]] uint8_t versionMinor() const noexcept { return _versionMinor; }

  // True for HTTP/1.1 and later minor versions.
  [[nodiscard]] bool isHttp11OrLater() const noexcept { return _versionMajor == 1 && _versionMinor >= 1; }

  [[nodiscard]] const HttpHeaders& headers() const noexcept { return _headers; }

  [[nodiscard]] std::optional<std::string_view> headerValue(std::string_view name) const noexcept {
    return _headers.get(name);
  }

  [[nodiscard]] std::string_view headerValueOrEmpty(std::string_view name) const noexcept {
    return _headers.getOrEmpty(name);
  }

  [[nodiscard]] std::string_view userAgent() const noexcept;

  // Remote peer address of the connection, "ip:port".
  [[nodiscard]] std::string_view remoteAddr() const noexcept { return _remoteAddr; }

  // Whether the request announces a body (Content-Length > 0 or Transfer-Encoding).
  [[nodiscard]] bool hasBody() const noexcept { return _hasBody; }

  // Whether the client asked for the connection to stay open after this request.
  // HTTP/1.1: unless "Connection: close". HTTP/1.0: only with "Connection: keep-alive".
  [[nodiscard]] bool wantsKeepAlive() const noexcept;

 private:
  friend http::StatusCode ParseRequestHead(std::string_view head, std::string_view remoteAddr, HttpRequest& request);

  std::string _method;
  std::string _target;
  std::string _path;
  std::string _rawQuery;
  std::string _remoteAddr;
  HttpHeaders _headers;
  uint8_t _versionMajor{1};
  uint8_t _versionMinor{1};
  bool _hasBody{false};
};

// Parses a complete request head (request line + header fields, terminated by an empty line) into 'request'.
// Lines may be terminated by CRLF or by a bare LF. Leading empty lines are ignored.
// Returns 0 on success, otherwise the status code of the error response to send:
//  - 400 for malformed request line, target, header fields, bad percent-escapes, missing or duplicated Host in
//    HTTP/1.1 and invalid Content-Length.
//  - 505 for a well formed but unsupported major version.
[[nodiscard]] http::StatusCode ParseRequestHead(std::string_view head, std::string_view remoteAddr,
                                                HttpRequest& request);

// Returns the size of the complete request head at the beginning of 'data' (its terminating empty line included),
// or std::string_view::npos if the terminating empty line has not been received yet.
// Leading empty lines are part of the head.
[[nodiscard]] std::size_t FindRequestHeadEnd(std::string_view data) noexcept;

}  // namespace quay
