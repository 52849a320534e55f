#include "quay/socket-ops.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include <fmt/format.h>

#include "quay/timedef.hpp"

namespace quay {

namespace {

WaitResult PollUntil(std::span<pollfd> pfds, SteadyTimePoint deadline) noexcept {
  while (true) {
    const auto remaining =
        std::chrono::ceil<std::chrono::milliseconds>(deadline - SteadyClock::now()).count();
    if (remaining <= 0) {
      return WaitResult::Timeout;
    }
    const int ret = ::poll(pfds.data(), static_cast<nfds_t>(pfds.size()),
                           static_cast<int>(std::min<int64_t>(remaining, 60 * 60 * 1000)));
    if (ret > 0) {
      // Errors and hang ups are reported as ready: the following read / send call will observe them.
      return WaitResult::Ready;
    }
    if (ret == -1 && errno != EINTR) {
      return WaitResult::Error;
    }
  }
}

WaitResult WaitFor(NativeHandle fd, short events, SteadyTimePoint deadline) noexcept {
  pollfd pfd{fd, events, 0};
  return PollUntil(std::span<pollfd>(&pfd, 1), deadline);
}

}  // namespace

bool SetTcpNoDelay(NativeHandle fd) noexcept {
  static constexpr int kEnable = 1;
  return ::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &kEnable, sizeof(kEnable)) == 0;
}

bool SetSendTimeout(NativeHandle fd, std::chrono::milliseconds timeout) noexcept {
  const auto usecs = std::chrono::duration_cast<std::chrono::microseconds>(timeout).count();
  timeval tv{};
  tv.tv_sec = static_cast<decltype(tv.tv_sec)>(usecs / 1000000);
  tv.tv_usec = static_cast<decltype(tv.tv_usec)>(usecs % 1000000);
  return ::setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

bool GetPeerAddress(NativeHandle fd, sockaddr_storage& addr) noexcept {
  socklen_t len = sizeof(addr);
  return ::getpeername(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0;
}

std::string FormatAddress(const sockaddr_storage& addr) {
  char buf[INET6_ADDRSTRLEN];
  if (addr.ss_family == AF_INET) {
    const auto* in = reinterpret_cast<const sockaddr_in*>(&addr);
    if (::inet_ntop(AF_INET, &in->sin_addr, buf, sizeof(buf)) == nullptr) {
      return {};
    }
    return fmt::format("{}:{}", buf, ntohs(in->sin_port));
  }
  if (addr.ss_family == AF_INET6) {
    const auto* in6 = reinterpret_cast<const sockaddr_in6*>(&addr);
    if (IN6_IS_ADDR_V4MAPPED(&in6->sin6_addr)) {
      // last 4 bytes hold the IPv4 address
      if (::inet_ntop(AF_INET, &in6->sin6_addr.s6_addr[12], buf, sizeof(buf)) == nullptr) {
        return {};
      }
      return fmt::format("{}:{}", buf, ntohs(in6->sin6_port));
    }
    if (::inet_ntop(AF_INET6, &in6->sin6_addr, buf, sizeof(buf)) == nullptr) {
      return {};
    }
    return fmt::format("[{}]:{}", buf, ntohs(in6->sin6_port));
  }
  return {};
}

int64_t SafeSend(NativeHandle fd, const void* data, std::size_t len) noexcept {
  return static_cast<int64_t>(::send(fd, data, len, MSG_NOSIGNAL));
}

int64_t SafeRecv(NativeHandle fd, void* buf, std::size_t len) noexcept {
  while (true) {
    const auto ret = ::recv(fd, buf, len, 0);
    if (ret == -1 && errno == EINTR) {
      continue;
    }
    return static_cast<int64_t>(ret);
  }
}

bool ShutdownWrite(NativeHandle fd) noexcept { return ::shutdown(fd, SHUT_WR) == 0; }

bool ShutdownReadWrite(NativeHandle fd) noexcept { return ::shutdown(fd, SHUT_RDWR) == 0; }

WaitResult WaitReadable(NativeHandle fd, SteadyTimePoint deadline) noexcept { return WaitFor(fd, POLLIN, deadline); }

WaitResult WaitWritable(NativeHandle fd, SteadyTimePoint deadline) noexcept { return WaitFor(fd, POLLOUT, deadline); }

WaitResult WaitAnyReadable(std::span<const NativeHandle> fds, SteadyTimePoint deadline, std::size_t& readyIdx) noexcept {
  if (fds.size() > kMaxWaitFds) {
    errno = EINVAL;
    return WaitResult::Error;
  }
  std::array<pollfd, kMaxWaitFds> pfds{};
  for (std::size_t idx = 0; idx < fds.size(); ++idx) {
    pfds[idx] = pollfd{fds[idx], POLLIN, 0};
  }
  const auto res = PollUntil(std::span<pollfd>(pfds.data(), fds.size()), deadline);
  if (res == WaitResult::Ready) {
    readyIdx = static_cast<std::size_t>(
        std::ranges::find_if(pfds, [](const pollfd& pfd) { return pfd.revents != 0; }) - pfds.begin());
  }
  return res;
}

}  // namespace quay
