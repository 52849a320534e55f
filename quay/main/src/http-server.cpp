#include "quay/http-server.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <exception>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <utility>

#include "quay/connection-registry.hpp"
#include "quay/connection-response-writer.hpp"
#include "quay/http-request.hpp"
#include "quay/http-status-code.hpp"
#include "quay/log.hpp"
#include "quay/socket-ops.hpp"
#include "quay/timedef.hpp"

namespace quay {

struct HttpServer::Shared {
  Shared(ServerConfig cfg, std::shared_ptr<const HttpHandler> hdl, StructuredLogger lgr)
      : config(std::move(cfg)), handler(std::move(hdl)), logger(std::move(lgr)) {}

  ServerConfig config;
  std::shared_ptr<const HttpHandler> handler;
  StructuredLogger logger;
  ConnectionRegistry registry;
};

namespace {

using namespace std::chrono_literals;

constexpr std::size_t kReadChunkSize = 16 * 1024;
constexpr auto kMinAcceptBackoff = 5ms;
constexpr auto kMaxAcceptBackoff = 1s;
// Upper bound for draining unread request bytes before closing, so that the peer receives the response instead of
// a connection reset.
constexpr auto kLingerTimeout = 500ms;

enum class HeadReadStatus : uint8_t { Complete, Closed, TooLarge };

// Reads from 'fd' into 'buffer' until it starts with a complete request head, whose size is stored in 'headSize'.
HeadReadStatus ReadRequestHead(NativeHandle fd, std::string& buffer, std::size_t maxHeaderBytes,
                               SteadyTimePoint deadline, std::size_t& headSize) {
  while (true) {
    headSize = FindRequestHeadEnd(buffer);
    if (headSize != std::string_view::npos) {
      return headSize > maxHeaderBytes ? HeadReadStatus::TooLarge : HeadReadStatus::Complete;
    }
    if (buffer.size() >= maxHeaderBytes) {
      return HeadReadStatus::TooLarge;
    }
    if (WaitReadable(fd, deadline) != WaitResult::Ready) {
      return HeadReadStatus::Closed;
    }
    const auto oldSize = buffer.size();
    buffer.resize(oldSize + kReadChunkSize);
    const auto nbRead = SafeRecv(fd, buffer.data() + oldSize, kReadChunkSize);
    buffer.resize(oldSize + static_cast<std::size_t>(std::max<int64_t>(nbRead, 0)));
    if (nbRead <= 0) {
      return HeadReadStatus::Closed;
    }
  }
}

// Half-closes the connection and discards what the peer still sends for a short while, so that the response is
// not destroyed by a reset caused by unread data.
void LingeringClose(NativeHandle fd) {
  if (!ShutdownWrite(fd)) {
    return;
  }
  const auto deadline = SteadyClock::now() + kLingerTimeout;
  char discard[4096];
  while (WaitReadable(fd, deadline) == WaitResult::Ready && SafeRecv(fd, discard, sizeof(discard)) > 0) {
  }
}

void RejectRequest(NativeHandle fd, http::StatusCode code) {
  if (SendTransportError(fd, code)) {
    LingeringClose(fd);
  } else {
    log::debug("Unable to send {} response on fd # {}: {}", code, fd, std::strerror(errno));
  }
}

class RegistrationGuard {
 public:
  RegistrationGuard(ConnectionRegistry& registry, NativeHandle fd) noexcept : _registry(registry), _fd(fd) {}

  RegistrationGuard(const RegistrationGuard&) = delete;
  RegistrationGuard(RegistrationGuard&&) = delete;
  RegistrationGuard& operator=(const RegistrationGuard&) = delete;
  RegistrationGuard& operator=(RegistrationGuard&&) = delete;

  ~RegistrationGuard() { _registry.remove(_fd); }

 private:
  ConnectionRegistry& _registry;
  NativeHandle _fd;
};

}  // namespace

HttpServer::HttpServer(ServerConfig config, std::shared_ptr<const HttpHandler> handler, StructuredLogger logger) {
  config.validate();
  if (!handler) {
    throw std::invalid_argument("HttpServer requires a handler");
  }
  _shared = std::make_shared<Shared>(std::move(config), std::move(handler), std::move(logger));
}

HttpServer::~HttpServer() {
  if (state() == State::Running) {
    stopAccepting();
    _shared->registry.beginShutdown();
    _state.store(State::Stopped, std::memory_order_release);
  }
}

void HttpServer::start() {
  std::scoped_lock lock(_lifecycleMutex);
  if (state() != State::Idle) {
    throw std::logic_error("HttpServer can only be started once");
  }
  _listenSocket = Socket::Listen(_shared->config.port, _shared->config.listenBacklog);
  _port.store(_listenSocket.localPort(), std::memory_order_release);
  _state.store(State::Running, std::memory_order_release);
  _acceptThread = std::jthread([this](const std::stop_token& stopToken) { acceptLoop(stopToken); });
  log::debug("Server listening on port {} (fd # {})", port(), _listenSocket.fd());
}

HttpServer::ShutdownResult HttpServer::shutdown(std::chrono::milliseconds timeout) {
  std::scoped_lock lock(_lifecycleMutex);
  switch (state()) {
    case State::Idle:
      _state.store(State::Stopped, std::memory_order_release);
      return ShutdownResult::Clean;
    case State::Running:
      break;
    default:
      return _shutdownResult;
  }
  const auto deadline = SteadyClock::now() + timeout;
  _state.store(State::ShuttingDown, std::memory_order_release);

  stopAccepting();
  _shared->registry.beginShutdown();
  if (_shared->registry.waitUntilEmpty(deadline)) {
    _shutdownResult = ShutdownResult::Clean;
  } else {
    _shutdownResult = ShutdownResult::DeadlineExceeded;
    log::debug("{} connection(s) still active at shutdown deadline", _shared->registry.size());
  }
  _state.store(State::Stopped, std::memory_order_release);
  return _shutdownResult;
}

std::string HttpServer::failure() const {
  std::scoped_lock lock(_failureMutex);
  return _failure;
}

const ServerConfig& HttpServer::config() const noexcept { return _shared->config; }

std::size_t HttpServer::nbConnections() const { return _shared->registry.size(); }

std::size_t HttpServer::nbActiveConnections() const { return _shared->registry.nbActive(); }

void HttpServer::stopAccepting() noexcept {
  if (_acceptThread.joinable()) {
    _acceptThread.request_stop();
    _wakeupFd.send();
    _acceptThread.join();
  }
  _listenSocket.close();
}

void HttpServer::reportFailure(std::string message) {
  {
    std::scoped_lock lock(_failureMutex);
    _failure = std::move(message);
  }
  _failureFd.send();
}

void HttpServer::acceptLoop(const std::stop_token& stopToken) {
  const NativeHandle fds[] = {_listenSocket.fd(), _wakeupFd.fd()};
  std::chrono::milliseconds backoff{0};
  while (!stopToken.stop_requested()) {
    std::size_t readyIdx = 0;
    if (WaitAnyReadable(fds, SteadyTimePoint::max(), readyIdx) == WaitResult::Error) {
      reportFailure(fmt::format("poll: {}", std::strerror(errno)));
      return;
    }
    if (readyIdx != 0) {
      _wakeupFd.read();
      continue;
    }
    Socket socket = _listenSocket.accept();
    if (!socket) {
      const int err = errno;
      if (!IsTransientAcceptError(err)) {
        reportFailure(fmt::format("accept tcp {}: {}", _shared->config.listenAddress(), std::strerror(err)));
        return;
      }
      if (err == EAGAIN || err == EWOULDBLOCK) {
        continue;
      }
      backoff = backoff.count() == 0 ? std::chrono::milliseconds{kMinAcceptBackoff}
                                     : std::min<std::chrono::milliseconds>(backoff * 2, kMaxAcceptBackoff);
      log::warn("Accept error: {}; retrying in {} ms", std::strerror(err), backoff.count());
      if (WaitReadable(_wakeupFd.fd(), SteadyClock::now() + backoff) == WaitResult::Error) {
        log::error("Unable to wait for accept backoff: {}", std::strerror(errno));
      }
      continue;
    }
    backoff = std::chrono::milliseconds{0};
    spawnConnection(std::move(socket));
  }
}

void HttpServer::spawnConnection(Socket socket) {
  const NativeHandle fd = socket.fd();
  if (!_shared->registry.add(fd)) {
    return;
  }
  try {
    std::thread(&HttpServer::ServeConnection, _shared, std::move(socket)).detach();
  } catch (const std::system_error& ex) {
    _shared->registry.remove(fd);
    log::error("Unable to spawn connection thread: {}", ex.what());
  }
}

void HttpServer::ServeConnection(const std::shared_ptr<Shared>& shared, Socket socket) {
  // Declared after the socket: the fd is unregistered before being closed.
  const Socket conn = std::move(socket);
  const NativeHandle fd = conn.fd();
  const RegistrationGuard registration(shared->registry, fd);
  const ServerConfig& config = shared->config;

  if (!SetTcpNoDelay(fd)) {
    log::debug("Unable to set TCP_NODELAY on fd # {}: {}", fd, std::strerror(errno));
  }
  if (!SetSendTimeout(fd, config.writeTimeout)) {
    log::warn("Unable to set send timeout on fd # {}: {}", fd, std::strerror(errno));
  }
  std::string remoteAddr;
  if (sockaddr_storage addr{}; GetPeerAddress(fd, addr)) {
    remoteAddr = FormatAddress(addr);
  }

  std::string buffer;
  while (true) {
    const auto deadline = SteadyClock::now() + config.readTimeout;
    if (buffer.empty() && WaitReadable(fd, deadline) != WaitResult::Ready) {
      return;
    }
    if (!shared->registry.beginRequest(fd)) {
      return;
    }

    std::size_t headSize = 0;
    switch (ReadRequestHead(fd, buffer, config.maxHeaderBytes, deadline, headSize)) {
      case HeadReadStatus::Complete:
        break;
      case HeadReadStatus::TooLarge:
        RejectRequest(fd, http::StatusCodeRequestHeaderFieldsTooLarge);
        return;
      default:
        return;
    }

    HttpRequest request;
    const auto parseStatus = ParseRequestHead(std::string_view(buffer).substr(0, headSize), remoteAddr, request);
    if (parseStatus != 0) {
      RejectRequest(fd, parseStatus);
      return;
    }
    buffer.erase(0, headSize);

    // The body of a request is never read: the connection cannot be reused after it.
    const bool keepAlive = request.wantsKeepAlive() && !request.hasBody() && !shared->registry.isShuttingDown();
    ConnectionResponseWriter writer(fd, request, keepAlive, shared->logger);
    try {
      shared->handler->serve(request, writer);
    } catch (...) {
      shared->logger.error("panic serving",
                           {{"remote_addr", remoteAddr}, {"error", ExceptionMessage(std::current_exception())}});
      return;
    }
    if (!writer.finish()) {
      if (writer.ok()) {
        LingeringClose(fd);
      }
      return;
    }
    if (!shared->registry.endRequest(fd)) {
      return;
    }
  }
}

}  // namespace quay
