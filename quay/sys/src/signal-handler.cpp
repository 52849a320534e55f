#include "quay/signal-handler.hpp"

#include <pthread.h>
#include <signal.h>
#include <sys/signalfd.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <initializer_list>
#include <string_view>
#include <system_error>

#include "quay/errno-throw.hpp"
#include "quay/log.hpp"

namespace quay {

namespace {

sigset_t MakeSigSet(std::initializer_list<int> signals) {
  sigset_t set;
  sigemptyset(&set);
  for (int sigNum : signals) {
    sigaddset(&set, sigNum);
  }
  return set;
}

}  // namespace

SignalHandler::SignalHandler(std::initializer_list<int> signals) : _oldMask() {
  const sigset_t set = MakeSigSet(signals);
  const int err = ::pthread_sigmask(SIG_BLOCK, &set, &_oldMask);
  if (err != 0) {
    throw std::system_error(std::error_code(err, std::generic_category()), "pthread_sigmask failed");
  }
  _signalFd = BaseFd(::signalfd(-1, &set, SFD_NONBLOCK | SFD_CLOEXEC));
  if (!_signalFd) {
    const int savedErr = errno;
    ::pthread_sigmask(SIG_SETMASK, &_oldMask, nullptr);
    errno = savedErr;
    throw_errno("Unable to create a signalfd");
  }
  log::trace("SignalFd fd # {} opened", _signalFd.fd());
}

SignalHandler::~SignalHandler() {
  // Occurrences received after the first one would otherwise be delivered with their default action once unblocked.
  while (tryConsume() != 0) {
  }
  _signalFd.close();
  const int err = ::pthread_sigmask(SIG_SETMASK, &_oldMask, nullptr);
  if (err != 0) {
    log::error("Unable to restore signal mask: {}", std::strerror(err));
  }
}

int SignalHandler::tryConsume() const noexcept {
  signalfd_siginfo info;
  while (true) {
    const auto nbRead = ::read(_signalFd.fd(), &info, sizeof(info));
    if (nbRead == static_cast<decltype(nbRead)>(sizeof(info))) {
      return static_cast<int>(info.ssi_signo);
    }
    if (nbRead == -1 && errno == EINTR) {
      continue;
    }
    if (nbRead == -1 && errno != EAGAIN) {
      log::error("signalfd read failed: {}", std::strerror(errno));
    }
    return 0;
  }
}

std::string_view SignalHandler::SignalName(int sigNum) noexcept {
  switch (sigNum) {
    case SIGINT:
      return "SIGINT";
    case SIGTERM:
      return "SIGTERM";
    default:
      return "signal";
  }
}

}  // namespace quay
