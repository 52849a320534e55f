#include "quay/response-capture.hpp"

#include <cstddef>
#include <string_view>

#include "quay/http-status-code.hpp"

namespace quay {

void ResponseCapture::writeHeader(http::StatusCode code) {
  if (_status == 0) {
    _status = code;
  }
  _inner.writeHeader(code);
}

std::size_t ResponseCapture::write(std::string_view data) {
  if (_status == 0) {
    _status = http::StatusCodeOK;
  }
  const std::size_t written = _inner.write(data);
  _bytes += written;
  return written;
}

}  // namespace quay
