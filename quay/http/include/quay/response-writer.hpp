#pragma once

#include <cstddef>
#include <string_view>

#include "quay/http-headers.hpp"
#include "quay/http-status-code.hpp"

namespace quay {

// Capability used by handlers to produce a response.
// - headers() may be modified until writeHeader() (or the first write()) is called.
// - writeHeader() sets the status. Only the first call has an effect.
// - write() appends body bytes. Without a prior writeHeader(), it implies status 200.
//   It returns the number of bytes accepted, which is smaller than data.size() only on failure.
// - ok() is false once a write to the underlying transport failed.
class ResponseWriter {
 public:
  ResponseWriter() noexcept = default;
  ResponseWriter(const ResponseWriter&) = delete;
  ResponseWriter(ResponseWriter&&) = delete;
  ResponseWriter& operator=(const ResponseWriter&) = delete;
  ResponseWriter& operator=(ResponseWriter&&) = delete;

  virtual ~ResponseWriter() = default;

  virtual HttpHeaders& headers() = 0;

  virtual void writeHeader(http::StatusCode code) = 0;

  virtual std::size_t write(std::string_view data) = 0;

  [[nodiscard]] virtual bool ok() const noexcept = 0;
};

}  // namespace quay
