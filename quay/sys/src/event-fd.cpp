#include "quay/event-fd.hpp"

#include <poll.h>
#include <sys/eventfd.h>

#include <cerrno>
#include <cstring>

#include "quay/base-fd.hpp"
#include "quay/errno-throw.hpp"
#include "quay/log.hpp"

namespace quay {

EventFd::EventFd() : _baseFd(::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC)) {
  if (fd() == -1) {
    throw_errno("Unable to create a new EventFd");
  }
  log::trace("EventFd fd # {} opened", fd());
}

void EventFd::send() const noexcept {
  static constexpr eventfd_t kOne = 1;
  if (::eventfd_write(fd(), kOne) == -1) {
    const auto savedErr = errno;
    if (savedErr != EAGAIN) {
      log::error("EventFd send failed err={}: {}", savedErr, std::strerror(savedErr));
    }
  }
}

void EventFd::read() const noexcept {
  eventfd_t counterValue;
  if (::eventfd_read(fd(), &counterValue) == -1) {
    const auto savedErr = errno;
    if (savedErr != EAGAIN) {
      log::error("EventFd read failed err={}: {}", savedErr, std::strerror(savedErr));
    }
  }
}

bool EventFd::isSignaled() const noexcept {
  pollfd pfd{fd(), POLLIN, 0};
  return ::poll(&pfd, 1, 0) == 1 && (pfd.revents & POLLIN) != 0;
}

}  // namespace quay
