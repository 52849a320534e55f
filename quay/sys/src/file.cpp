#include "quay/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <span>

#include "quay/log.hpp"
#include "quay/timedef.hpp"

namespace quay {

File::File(const char* path) noexcept : _fd(::open(path, O_RDONLY | O_CLOEXEC | O_NONBLOCK)) {
  if (!_fd) {
    _errno = errno;
    return;
  }
  struct stat st{};
  if (::fstat(_fd.fd(), &st) != 0) {
    _errno = errno;
    _fd.close();
    return;
  }
  _isDirectory = S_ISDIR(st.st_mode);
  _isRegular = S_ISREG(st.st_mode);
  _size = static_cast<uint64_t>(st.st_size);
  _lastModified = SysTimePoint(std::chrono::duration_cast<SysDuration>(std::chrono::seconds{st.st_mtim.tv_sec} +
                                                                       std::chrono::nanoseconds{st.st_mtim.tv_nsec}));
  log::trace("File fd # {} opened ({} bytes)", _fd.fd(), _size);
}

int64_t File::readAt(std::span<char> dst, uint64_t offset) const noexcept {
  while (true) {
    const auto nbRead = ::pread(_fd.fd(), dst.data(), dst.size(), static_cast<off_t>(offset));
    if (nbRead == -1 && errno == EINTR) {
      continue;
    }
    return static_cast<int64_t>(nbRead);
  }
}

}  // namespace quay
