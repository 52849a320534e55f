#pragma once

#include <signal.h>

#include <initializer_list>
#include <string_view>

#include "quay/base-fd.hpp"
#include "quay/platform.hpp"

namespace quay {

// Synchronous reception of termination signals through a signalfd.
// Construction blocks the given signals in the calling thread (threads spawned afterwards inherit the mask) so that
// they are only observable through fd(). The destructor discards still pending occurrences and restores the previous
// signal mask.
class SignalHandler {
 public:
  // Throws std::system_error on failure.
  explicit SignalHandler(std::initializer_list<int> signals = {SIGINT, SIGTERM});

  SignalHandler(const SignalHandler&) = delete;
  SignalHandler(SignalHandler&&) = delete;
  SignalHandler& operator=(const SignalHandler&) = delete;
  SignalHandler& operator=(SignalHandler&&) = delete;

  ~SignalHandler();

  // Readable when a signal is pending.
  [[nodiscard]] NativeHandle fd() const noexcept { return _signalFd.fd(); }

  // Consumes one pending signal without blocking.
  // Returns its number, or 0 if no signal is pending.
  [[nodiscard]] int tryConsume() const noexcept;

  // "SIGINT", "SIGTERM", ... or "signal" for numbers without a known name.
  static std::string_view SignalName(int sigNum) noexcept;

 private:
  sigset_t _oldMask;
  BaseFd _signalFd;
};

}  // namespace quay
