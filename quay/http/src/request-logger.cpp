#include "quay/request-logger.hpp"

#include <chrono>

#include "quay/http-request.hpp"
#include "quay/response-capture.hpp"
#include "quay/response-writer.hpp"
#include "quay/structured-logger.hpp"
#include "quay/timedef.hpp"

namespace quay {

namespace {

void LogRequest(const StructuredLogger& logger, const HttpRequest& request, const ResponseCapture& capture,
                SteadyTimePoint start) {
  const auto duration = std::chrono::duration_cast<std::chrono::nanoseconds>(SteadyClock::now() - start);
  logger.info("HTTP Request", {{"method", request.method()},
                               {"path", request.path()},
                               {"status", capture.status()},
                               {"remote_addr", request.remoteAddr()},
                               {"user_agent", request.userAgent()},
                               {"duration", duration},
                               {"bytes", capture.bytes()}});
}

}  // namespace

void RequestLogger::serve(const HttpRequest& request, ResponseWriter& writer) const {
  const auto start = SteadyClock::now();
  ResponseCapture capture(writer);
  try {
    _next->serve(request, capture);
  } catch (...) {
    LogRequest(_logger, request, capture, start);
    throw;
  }
  LogRequest(_logger, request, capture, start);
}

}  // namespace quay
