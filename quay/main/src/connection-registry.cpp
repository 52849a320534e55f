#include "quay/connection-registry.hpp"

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstring>
#include <mutex>

#include "quay/log.hpp"
#include "quay/socket-ops.hpp"
#include "quay/timedef.hpp"

namespace quay {

bool ConnectionRegistry::add(NativeHandle fd) {
  std::scoped_lock lock(_mutex);
  if (_shuttingDown) {
    return false;
  }
  _connections.insert_or_assign(fd, false);
  return true;
}

bool ConnectionRegistry::beginRequest(NativeHandle fd) {
  std::scoped_lock lock(_mutex);
  if (_shuttingDown) {
    return false;
  }
  if (auto it = _connections.find(fd); it != _connections.end()) {
    it->second = true;
  }
  return true;
}

bool ConnectionRegistry::endRequest(NativeHandle fd) {
  std::scoped_lock lock(_mutex);
  if (auto it = _connections.find(fd); it != _connections.end()) {
    it->second = false;
  }
  return !_shuttingDown;
}

void ConnectionRegistry::remove(NativeHandle fd) {
  std::scoped_lock lock(_mutex);
  if (_connections.erase(fd) != 0) {
    _cv.notify_all();
  }
}

void ConnectionRegistry::beginShutdown() {
  std::scoped_lock lock(_mutex);
  if (_shuttingDown) {
    return;
  }
  _shuttingDown = true;
  for (const auto& [fd, active] : _connections) {
    // The fd stays owned (and open) by its connection thread: it cannot be reused while registered.
    if (!active && !ShutdownReadWrite(fd) && errno != ENOTCONN) {
      log::warn("shutdown of idle connection fd # {} failed: {}", fd, std::strerror(errno));
    }
  }
  _cv.notify_all();
}

bool ConnectionRegistry::waitUntilEmpty(SteadyTimePoint deadline) {
  std::unique_lock lock(_mutex);
  return _cv.wait_until(lock, deadline, [this] { return _connections.empty(); });
}

std::size_t ConnectionRegistry::size() const {
  std::scoped_lock lock(_mutex);
  return _connections.size();
}

std::size_t ConnectionRegistry::nbActive() const {
  std::scoped_lock lock(_mutex);
  return static_cast<std::size_t>(
      std::ranges::count_if(_connections, [](const auto& entry) { return entry.second; }));
}

bool ConnectionRegistry::isShuttingDown() const {
  std::scoped_lock lock(_mutex);
  return _shuttingDown;
}

}  // namespace quay
