#pragma once

#include <atomic>
#include <cstdint>
#include <string_view>

#include "quay/server-config.hpp"
#include "quay/structured-logger.hpp"

namespace quay {

// Runs the static file server for the whole life of the process:
//  - assembles RequestLogger(StaticFileHandler) and starts an HttpServer with it,
//  - blocks until SIGINT or SIGTERM is received (or the server stops accepting on a fatal error),
//  - shuts the server down within the configured shutdown timeout.
// Lifecycle records are emitted on the given logger.
class LifecycleController {
 public:
  enum class State : uint8_t { Initial, Running, ShutdownRequested, ShuttingDown, Stopped };

  LifecycleController(ServerConfig config, StructuredLogger logger);

  // Blocks SIGINT and SIGTERM in the calling thread (they are then only received synchronously), runs the server
  // until one of them is received and returns the process exit code:
  //  - 0 after a graceful shutdown, whether all connections completed before the deadline or not,
  //  - 1 if the server could not listen, or stopped accepting connections on a non transient error (returned at
  //    once, open connections are not drained).
  // Throws std::invalid_argument if the configuration is invalid.
  int run();

  [[nodiscard]] State state() const noexcept { return _state.load(std::memory_order_acquire); }

  // Port the server is listening on, 0 until it is listening.
  [[nodiscard]] uint16_t boundPort() const noexcept { return _boundPort.load(std::memory_order_acquire); }

  [[nodiscard]] const ServerConfig& config() const noexcept { return _config; }

  static std::string_view StateName(State state) noexcept;

 private:
  void setState(State state) noexcept { _state.store(state, std::memory_order_release); }

  ServerConfig _config;
  StructuredLogger _logger;
  std::atomic<State> _state{State::Initial};
  std::atomic<uint16_t> _boundPort{0};
};

}  // namespace quay
