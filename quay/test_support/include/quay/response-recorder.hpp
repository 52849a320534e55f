#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "quay/http-headers.hpp"
#include "quay/http-status-code.hpp"
#include "quay/response-writer.hpp"

namespace quay::test {

// In-memory ResponseWriter recording what a handler produced, for handler unit tests.
// Headers are snapshotted when the status is committed (as a real connection would send them).
class ResponseRecorder final : public ResponseWriter {
 public:
  HttpHeaders& headers() override { return _headers; }

  void writeHeader(http::StatusCode code) override {
    ++writeHeaderCalls;
    if (status != 0) {
      return;
    }
    status = code;
    sentHeaders = _headers;
  }

  std::size_t write(std::string_view data) override {
    if (status == 0) {
      writeHeader(http::StatusCodeOK);
    }
    if (failWrites) {
      return 0;
    }
    body.append(data);
    ++writeCalls;
    return data.size();
  }

  [[nodiscard]] bool ok() const noexcept override { return !failWrites; }

  http::StatusCode status{0};
  HttpHeaders sentHeaders;
  std::string body;
  int writeHeaderCalls{0};
  int writeCalls{0};
  bool failWrites{false};

 private:
  HttpHeaders _headers;
};

}  // namespace quay::test
