#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "quay/http-headers.hpp"
#include "quay/http-status-code.hpp"
#include "quay/response-writer.hpp"

namespace quay {

// ResponseWriter decorator observing what a handler sends.
// Every call is forwarded unchanged to the wrapped writer. On the way it records:
//  - the first status code (explicit writeHeader(), or the implicit 200 of a write() without it),
//    status() stays 0 if the handler did neither,
//  - the sum of the byte counts returned by the wrapped writer's write().
// One instance per request, never shared between threads.
class ResponseCapture final : public ResponseWriter {
 public:
  explicit ResponseCapture(ResponseWriter& inner) noexcept : _inner(inner) {}

  HttpHeaders& headers() override { return _inner.headers(); }

  void writeHeader(http::StatusCode code) override;

  std::size_t write(std::string_view data) override;

  [[nodiscard]] bool ok() const noexcept override { return _inner.ok(); }

  [[nodiscard]] http::StatusCode status() const noexcept { return _status; }

  [[nodiscard]] uint64_t bytes() const noexcept { return _bytes; }

 private:
  ResponseWriter& _inner;
  http::StatusCode _status{0};
  uint64_t _bytes{0};
};

}  // namespace quay
