#include "quay/socket.hpp"

#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/format.h>

#include "quay/base-fd.hpp"
#include "quay/errno-throw.hpp"
#include "quay/log.hpp"

namespace quay {

namespace {

struct AddrInfoDeleter {
  void operator()(addrinfo* ai) const noexcept { ::freeaddrinfo(ai); }
};

using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

// getaddrinfo silently truncates numeric services above 65535.
bool IsOutOfRangeNumericPort(std::string_view port) {
  if (port.empty() || !std::ranges::all_of(port, [](char ch) { return ch >= '0' && ch <= '9'; })) {
    return false;
  }
  uint32_t value = 0;
  for (char ch : port) {
    value = (value * 10U) + static_cast<uint32_t>(ch - '0');
    if (value > 65535U) {
      return true;
    }
  }
  return false;
}

AddrInfoPtr ResolvePassive(const std::string& port, int family) {
  if (IsOutOfRangeNumericPort(port)) {
    throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                            fmt::format("listen tcp :{}: invalid port", port));
  }
  addrinfo hints{};
  hints.ai_family = family;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_PASSIVE;
  addrinfo* result = nullptr;
  const int rc = ::getaddrinfo(nullptr, port.c_str(), &hints, &result);
  if (rc != 0) {
    if (rc == EAI_SYSTEM) {
      throw_errno("lookup port {}", port);
    }
    throw std::system_error(std::make_error_code(std::errc::invalid_argument),
                            fmt::format("lookup port {}: {}", port, ::gai_strerror(rc)));
  }
  return AddrInfoPtr(result);
}

// Returns an invalid BaseFd with errno set on failure.
BaseFd TryBindListen(const addrinfo& ai, int backlog) {
  BaseFd baseFd(::socket(ai.ai_family, ai.ai_socktype | SOCK_NONBLOCK | SOCK_CLOEXEC, ai.ai_protocol));
  if (!baseFd) {
    return baseFd;
  }
  static constexpr int kEnable = 1;
  static constexpr int kDisable = 0;
  if (::setsockopt(baseFd.fd(), SOL_SOCKET, SO_REUSEADDR, &kEnable, sizeof(kEnable)) != 0) {
    throw_errno("setsockopt(SO_REUSEADDR) failed");
  }
  if (ai.ai_family == AF_INET6 &&
      ::setsockopt(baseFd.fd(), IPPROTO_IPV6, IPV6_V6ONLY, &kDisable, sizeof(kDisable)) != 0) {
    throw_errno("setsockopt(IPV6_V6ONLY) failed");
  }
  if (::bind(baseFd.fd(), ai.ai_addr, ai.ai_addrlen) != 0 || ::listen(baseFd.fd(), backlog) != 0) {
    const int savedErr = errno;
    baseFd.close();
    errno = savedErr;
  }
  return baseFd;
}

}  // namespace

Socket Socket::Listen(std::string_view port, int backlog) {
  const std::string portStr(port);

  // IPv6 wildcard first (dual stack), then IPv4 only if IPv6 is not supported on this host.
  int lastErr = 0;
  for (int family : {AF_INET6, AF_INET}) {
    AddrInfoPtr addrs;
    try {
      addrs = ResolvePassive(portStr, family);
    } catch (const std::system_error& ex) {
      if (family == AF_INET) {
        throw;
      }
      log::debug("No IPv6 address for port {}: {}", portStr, ex.what());
      continue;
    }
    for (const addrinfo* ai = addrs.get(); ai != nullptr; ai = ai->ai_next) {
      BaseFd baseFd = TryBindListen(*ai, backlog);
      if (baseFd) {
        log::debug("Listening socket fd # {} opened on port {}", baseFd.fd(), portStr);
        return Socket(baseFd.release());
      }
      lastErr = errno;
      if (lastErr != EAFNOSUPPORT && lastErr != EPROTONOSUPPORT) {
        // A real bind error (address in use, permission denied) is not solved by switching family.
        throw std::system_error(std::error_code(lastErr, std::generic_category()),
                                fmt::format("listen tcp :{}", portStr));
      }
    }
  }
  throw std::system_error(std::error_code(lastErr, std::generic_category()), fmt::format("listen tcp :{}", portStr));
}

uint16_t Socket::localPort() const {
  sockaddr_storage addr{};
  socklen_t len = sizeof(addr);
  if (::getsockname(fd(), reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
    throw_errno("getsockname failed for fd # {}", fd());
  }
  if (addr.ss_family == AF_INET6) {
    return ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
  }
  return ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
}

Socket Socket::accept() const noexcept {
  return Socket(::accept4(fd(), nullptr, nullptr, SOCK_CLOEXEC));
}

bool IsTransientAcceptError(int err) noexcept {
  switch (err) {
    case EAGAIN:
    case EINTR:
    case ECONNABORTED:
    case EPROTO:
    case EMFILE:
    case ENFILE:
    case ENOBUFS:
    case ENOMEM:
    case EPERM:
    case ENETDOWN:
    case ENOPROTOOPT:
    case EHOSTDOWN:
    case ENONET:
    case EHOSTUNREACH:
    case EOPNOTSUPP:
    case ENETUNREACH:
      return true;
    default:
      return false;
  }
}

}  // namespace quay
