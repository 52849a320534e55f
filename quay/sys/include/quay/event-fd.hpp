#pragma once

#include "quay/base-fd.hpp"
#include "quay/platform.hpp"

namespace quay {

// Simple RAII class wrapping a non-blocking, close-on-exec eventfd, used to wake up poll() loops.
class EventFd {
 public:
  // Throws std::system_error on failure.
  EventFd();

  // Send a wakeup event.
  void send() const noexcept;

  // Drain pending wakeup events.
  void read() const noexcept;

  // Returns true if at least one event was sent and not drained yet. Does not consume it.
  [[nodiscard]] bool isSignaled() const noexcept;

  [[nodiscard]] NativeHandle fd() const noexcept { return _baseFd.fd(); }

 private:
  BaseFd _baseFd;
};

}  // namespace quay
