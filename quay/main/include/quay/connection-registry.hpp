#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <unordered_map>

#include "quay/platform.hpp"
#include "quay/timedef.hpp"

namespace quay {

// Tracks the open connections of a server and whether each of them is serving a request, so that shutdown can
// close idle connections at once and let active ones finish their current response.
// All methods are thread safe. Connection threads call add / beginRequest / endRequest / remove on their own fd.
class ConnectionRegistry {
 public:
  // Registers a new idle connection. Returns false (and does not register it) if shutdown has begun.
  [[nodiscard]] bool add(NativeHandle fd);

  // Marks the connection active. Returns false if shutdown has begun: the connection should be closed.
  [[nodiscard]] bool beginRequest(NativeHandle fd);

  // Marks the connection idle again. Returns false if shutdown has begun: the connection should be closed.
  [[nodiscard]] bool endRequest(NativeHandle fd);

  // Unregisters the connection. Must be called before the fd is closed.
  void remove(NativeHandle fd);

  // Refuses new connections and requests, and shuts down the sockets of idle connections so that their threads
  // stop waiting for a next request. Idempotent.
  void beginShutdown();

  // Waits until all connections are removed or the deadline is reached.
  // Returns true if no connection remains.
  bool waitUntilEmpty(SteadyTimePoint deadline);

  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] std::size_t nbActive() const;

  [[nodiscard]] bool isShuttingDown() const;

 private:
  mutable std::mutex _mutex;
  std::condition_variable _cv;
  // fd -> active (serving a request)
  std::unordered_map<NativeHandle, bool> _connections;
  bool _shuttingDown{false};
};

}  // namespace quay
