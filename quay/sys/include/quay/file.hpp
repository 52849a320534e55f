#pragma once

#include <cstdint>
#include <span>

#include "quay/base-fd.hpp"
#include "quay/platform.hpp"
#include "quay/timedef.hpp"

namespace quay {

// Read-only file (or directory) handle with the metadata captured at opening.
class File {
 public:
  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Opens 'path' (must be null-terminated) read-only. O_NONBLOCK is used so that opening a FIFO never blocks.
  // On failure, operator bool() returns false and error() holds the errno of the failed call.
  explicit File(const char* path) noexcept;

  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  [[nodiscard]] int error() const noexcept { return _errno; }

  [[nodiscard]] bool isDirectory() const noexcept { return _isDirectory; }

  [[nodiscard]] bool isRegular() const noexcept { return _isRegular; }

  // Size in bytes at the time of opening.
  [[nodiscard]] uint64_t size() const noexcept { return _size; }

  [[nodiscard]] SysTimePoint lastModified() const noexcept { return _lastModified; }

  // Reads up to dst.size() bytes starting at the given absolute offset (pread, the file offset is not modified).
  // Returns the number of bytes read (0 on EOF), or -1 on error (errno is set).
  [[nodiscard]] int64_t readAt(std::span<char> dst, uint64_t offset) const noexcept;

  [[nodiscard]] NativeHandle fd() const noexcept { return _fd.fd(); }

 private:
  BaseFd _fd;
  SysTimePoint _lastModified;
  uint64_t _size{0};
  int _errno{0};
  bool _isDirectory{false};
  bool _isRegular{false};
};

}  // namespace quay
