#include "quay/lifecycle-controller.hpp"

#include <csignal>
#include <cstddef>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "quay/errno-throw.hpp"
#include "quay/http-server.hpp"
#include "quay/platform.hpp"
#include "quay/request-logger.hpp"
#include "quay/signal-handler.hpp"
#include "quay/socket-ops.hpp"
#include "quay/static-file-handler.hpp"
#include "quay/timedef.hpp"

namespace quay {

LifecycleController::LifecycleController(ServerConfig config, StructuredLogger logger)
    : _config(std::move(config)), _logger(std::move(logger)) {}

int LifecycleController::run() {
  // Before any server thread is spawned, so that they all inherit the blocked signal mask.
  const SignalHandler signals({SIGINT, SIGTERM});

  auto staticFiles = std::make_shared<const StaticFileHandler>(_config.staticDir, _config.staticFiles, _logger);
  auto handler = std::make_shared<const RequestLogger>(std::move(staticFiles), _logger);
  HttpServer server(_config, std::move(handler), _logger);

  _logger.info("Starting server", {{"port", _config.port}, {"dir", _config.staticDir.string()}});
  try {
    server.start();
  } catch (const std::system_error& ex) {
    _logger.error("Could not listen on", {{"addr", _config.port}, {"error", ex.what()}});
    setState(State::Stopped);
    return EXIT_FAILURE;
  }
  _boundPort.store(server.port(), std::memory_order_release);
  setState(State::Running);

  const NativeHandle fds[] = {signals.fd(), server.failureFd()};
  int sigNum = 0;
  while (sigNum == 0) {
    std::size_t readyIdx = 0;
    if (WaitAnyReadable(fds, SteadyTimePoint::max(), readyIdx) == WaitResult::Error) {
      throw_errno("Unable to wait for termination signals");
    }
    if (readyIdx == 1) {
      // Fatal: no draining, connections still open are abandoned by the server destructor.
      _logger.error("Could not listen on", {{"addr", _config.port}, {"error", server.failure()}});
      _logger.flush();
      setState(State::Stopped);
      return EXIT_FAILURE;
    }
    sigNum = signals.tryConsume();
  }

  setState(State::ShutdownRequested);
  _logger.info("Server is shutting down...", {{"signal", SignalHandler::SignalName(sigNum)}});

  setState(State::ShuttingDown);
  if (server.shutdown(_config.shutdownTimeout) == HttpServer::ShutdownResult::DeadlineExceeded) {
    _logger.error("Server forced to shutdown", {{"error", "context deadline exceeded"}});
  }
  setState(State::Stopped);
  _logger.info("Server exited properly");
  _logger.flush();
  return EXIT_SUCCESS;
}

std::string_view LifecycleController::StateName(State state) noexcept {
  switch (state) {
    case State::Initial:
      return "Initial";
    case State::Running:
      return "Running";
    case State::ShutdownRequested:
      return "ShutdownRequested";
    case State::ShuttingDown:
      return "ShuttingDown";
    case State::Stopped:
      return "Stopped";
    default:
      return "Unknown";
  }
}

}  // namespace quay
