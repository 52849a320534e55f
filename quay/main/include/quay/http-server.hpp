#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

#include "quay/event-fd.hpp"
#include "quay/http-handler.hpp"
#include "quay/platform.hpp"
#include "quay/server-config.hpp"
#include "quay/socket.hpp"
#include "quay/structured-logger.hpp"

namespace quay {

// HTTP/1.x server dispatching every request to a single handler.
//
// start() binds the listening socket and spawns the accept thread. Each accepted connection is served by its own
// detached thread, reading request heads with the configured read timeout and dispatching them sequentially to
// the handler (persistent connections are supported, pipelined requests are answered in order).
//
// Lifecycle: Idle -> Running -> ShuttingDown -> Stopped. A server cannot be restarted.
// The handler, the logger and the connection registry are shared with the connection threads, so that threads
// still running after a shutdown deadline was exceeded never access a destroyed server.
class HttpServer {
 public:
  enum class State : uint8_t { Idle, Running, ShuttingDown, Stopped };

  enum class ShutdownResult : uint8_t {
    Clean,            // all connections completed before the deadline
    DeadlineExceeded  // some connections were still active at the deadline, they are left running
  };

  // Throws std::invalid_argument if the configuration is invalid or the handler is null.
  HttpServer(ServerConfig config, std::shared_ptr<const HttpHandler> handler, StructuredLogger logger);

  HttpServer(const HttpServer&) = delete;
  HttpServer(HttpServer&&) = delete;
  HttpServer& operator=(const HttpServer&) = delete;
  HttpServer& operator=(HttpServer&&) = delete;

  // Stops accepting and closes idle connections without waiting for active ones.
  ~HttpServer();

  // Binds, listens and starts accepting connections.
  // Throws std::system_error if the port cannot be resolved or bound, std::logic_error if not Idle.
  void start();

  // Stops accepting new connections (the listening socket is closed at once), closes idle connections, and waits
  // until active ones complete their current response or the timeout expires.
  // Calling it on an Idle server only moves it to Stopped. Subsequent calls return the first result.
  ShutdownResult shutdown(std::chrono::milliseconds timeout);

  [[nodiscard]] State state() const noexcept { return _state.load(std::memory_order_acquire); }

  // Effective listening port, 0 if the server was not started.
  [[nodiscard]] uint16_t port() const noexcept { return _port.load(std::memory_order_acquire); }

  // Becomes readable when the accept loop stopped on a non transient error while Running.
  [[nodiscard]] NativeHandle failureFd() const noexcept { return _failureFd.fd(); }

  // Description of the accept loop failure, empty if none happened.
  [[nodiscard]] std::string failure() const;

  [[nodiscard]] const ServerConfig& config() const noexcept;

  // Number of connections currently open.
  [[nodiscard]] std::size_t nbConnections() const;

  // Number of connections currently serving a request.
  [[nodiscard]] std::size_t nbActiveConnections() const;

 private:
  struct Shared;

  static void ServeConnection(const std::shared_ptr<Shared>& shared, Socket socket);

  void acceptLoop(const std::stop_token& stopToken);

  void spawnConnection(Socket socket);

  void reportFailure(std::string message);

  void stopAccepting() noexcept;

  std::shared_ptr<Shared> _shared;
  Socket _listenSocket;
  EventFd _wakeupFd;
  EventFd _failureFd;
  std::jthread _acceptThread;
  std::mutex _lifecycleMutex;
  mutable std::mutex _failureMutex;
  std::string _failure;
  std::atomic<State> _state{State::Idle};
  std::atomic<uint16_t> _port{0};
  ShutdownResult _shutdownResult{ShutdownResult::Clean};
};

}  // namespace quay
