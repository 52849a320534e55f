#pragma once

#include "quay/platform.hpp"

namespace quay {

// Simple RAII class wrapping a file descriptor.
class BaseFd {
 public:
  static constexpr NativeHandle kClosedFd = kInvalidHandle;

  explicit BaseFd(NativeHandle fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd& other) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd& other) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept;

  ~BaseFd() { close(); }

  [[nodiscard]] NativeHandle fd() const noexcept { return _fd; }

  // Returns true if the underlying fd is valid (not closed).
  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Release ownership of the underlying fd without closing it.
  [[nodiscard]] NativeHandle release() noexcept;

  // Close the underlying file descriptor immediately.
  // Idempotent: multiple calls after the first one are no-ops.
  void close() noexcept;

  bool operator==(const BaseFd&) const noexcept = default;

 private:
  NativeHandle _fd;
};

}  // namespace quay
