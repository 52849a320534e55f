#pragma once

#include <cstdint>
#include <string_view>

#include "quay/base-fd.hpp"
#include "quay/platform.hpp"

namespace quay {

// RAII class wrapping a TCP socket file descriptor (listening or connected).
class Socket {
 public:
  Socket() noexcept = default;

  // Takes ownership of an already opened socket.
  explicit Socket(NativeHandle fd) noexcept : _baseFd(fd) {}

  // Creates a listening socket on all interfaces for given port (numeric or service name, "0" for an ephemeral
  // port). IPv6 dual stack is preferred, falling back to IPv4 when IPv6 is not available.
  // The socket is non-blocking and close-on-exec, with SO_REUSEADDR set.
  // Throws std::system_error on failure (including port resolution failures).
  static Socket Listen(std::string_view port, int backlog);

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

  explicit operator bool() const noexcept { return static_cast<bool>(_baseFd); }

  // Local port of a bound socket. Throws std::system_error on failure.
  [[nodiscard]] uint16_t localPort() const;

  // Accepts a pending connection as a blocking, close-on-exec socket.
  // Returns an empty Socket with errno set if accept failed.
  [[nodiscard]] Socket accept() const noexcept;

  void close() noexcept { _baseFd.close(); }

 private:
  BaseFd _baseFd;
};

// Returns true if given accept() errno is transient (the listener is still usable and accept can be retried).
bool IsTransientAcceptError(int err) noexcept;

}  // namespace quay
