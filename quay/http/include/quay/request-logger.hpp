#pragma once

#include <memory>
#include <utility>

#include "quay/http-handler.hpp"
#include "quay/http-request.hpp"
#include "quay/response-writer.hpp"
#include "quay/structured-logger.hpp"

namespace quay {

// Middleware emitting exactly one INFO record "HTTP Request" per request served by the wrapped handler, with fields
// method, path, status, remote_addr, user_agent, duration (ns) and bytes.
// The response itself is never altered. If the wrapped handler throws, the record is still emitted (with what was
// observed so far) and the exception is rethrown unchanged.
class RequestLogger final : public HttpHandler {
 public:
  RequestLogger(std::shared_ptr<const HttpHandler> next, StructuredLogger logger) noexcept
      : _next(std::move(next)), _logger(std::move(logger)) {}

  void serve(const HttpRequest& request, ResponseWriter& writer) const override;

 private:
  std::shared_ptr<const HttpHandler> _next;
  StructuredLogger _logger;
};

}  // namespace quay
