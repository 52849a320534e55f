#include "quay/test-http-client.hpp"

#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <charconv>
#include <chrono>
#include <filesystem>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "quay/errno-throw.hpp"
#include "quay/http-headers.hpp"
#include "quay/socket-ops.hpp"
#include "quay/socket.hpp"
#include "quay/string-equal-ignore-case.hpp"
#include "quay/timedef.hpp"

namespace quay::test {

namespace {

constexpr std::string_view kHeadEnd = "\r\n\r\n";

// How the body following a response head is delimited.
struct Framing {
  std::optional<std::size_t> contentLength;
  bool chunked{false};
  bool noBody{false};
};

Framing FramingOf(std::string_view head, bool headRequest) {
  Framing framing;
  const auto parsed = parseResponse(std::string(head), true);
  if (!parsed) {
    return framing;
  }
  const auto status = parsed->statusCode;
  framing.noBody = headRequest || (status >= 100 && status < 200) || status == 204 || status == 304;
  framing.chunked = CaseInsensitiveListContains(parsed->headers.getOrEmpty("Transfer-Encoding"), "chunked");
  if (const auto contentLength = parsed->headers.get("Content-Length")) {
    std::size_t value = 0;
    const auto [ptr, ec] = std::from_chars(contentLength->data(), contentLength->data() + contentLength->size(), value);
    if (ec == std::errc{}) {
      framing.contentLength = value;
    }
  }
  return framing;
}

// Decodes a chunked body. Returns std::nullopt if incomplete.
std::optional<std::string> Dechunk(std::string_view data) {
  std::string out;
  while (true) {
    const auto lineEnd = data.find("\r\n");
    if (lineEnd == std::string_view::npos) {
      return std::nullopt;
    }
    std::size_t chunkSize = 0;
    const auto [ptr, ec] = std::from_chars(data.data(), data.data() + lineEnd, chunkSize, 16);
    if (ec != std::errc{}) {
      return std::nullopt;
    }
    data.remove_prefix(lineEnd + 2U);
    if (chunkSize == 0) {
      return data.starts_with("\r\n") ? std::optional<std::string>(std::move(out)) : std::nullopt;
    }
    if (data.size() < chunkSize + 2U) {
      return std::nullopt;
    }
    out.append(data.substr(0, chunkSize));
    data.remove_prefix(chunkSize + 2U);
  }
}

}  // namespace

ClientConnection::ClientConnection(uint16_t port, std::chrono::milliseconds timeout)
    : _socket(::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0)) {
  if (!_socket) {
    throw_errno("socket");
  }
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
  tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
  if (::setsockopt(_socket.fd(), SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) != 0) {
    throw_errno("setsockopt SO_RCVTIMEO");
  }
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::connect(_socket.fd(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
    throw_errno("connect to port {}", port);
  }
}

std::string buildRequest(const RequestOptions& opt) {
  std::string req;
  req.append(opt.method).append(" ").append(opt.target).append(" ").append(opt.version).append("\r\n");
  if (!opt.host.empty()) {
    req.append("Host: ").append(opt.host).append("\r\n");
  }
  if (!opt.connection.empty()) {
    req.append("Connection: ").append(opt.connection).append("\r\n");
  }
  for (const auto& [name, value] : opt.headers) {
    req.append(name).append(": ").append(value).append("\r\n");
  }
  req.append("\r\n");
  return req;
}

bool sendAll(int fd, std::string_view data, std::chrono::milliseconds totalTimeout) {
  const auto deadline = SteadyClock::now() + totalTimeout;
  while (!data.empty()) {
    const auto sent = SafeSend(fd, data);
    if (sent > 0) {
      data.remove_prefix(static_cast<std::size_t>(sent));
      continue;
    }
    if (sent == -1 && errno == EINTR) {
      continue;
    }
    if (sent == -1 && (errno == EAGAIN || errno == EWOULDBLOCK) &&
        WaitWritable(fd, deadline) == WaitResult::Ready) {
      continue;
    }
    return false;
  }
  return true;
}

std::string recvResponse(int fd, bool headRequest, std::chrono::milliseconds totalTimeout) {
  const auto deadline = SteadyClock::now() + totalTimeout;
  std::string out;
  char buf[4096];
  while (true) {
    const auto headEnd = out.find(kHeadEnd);
    if (headEnd != std::string::npos) {
      const std::size_t bodyBeg = headEnd + kHeadEnd.size();
      const Framing framing = FramingOf(std::string_view(out).substr(0, bodyBeg), headRequest);
      if (framing.noBody) {
        return out;
      }
      if (framing.chunked) {
        if (Dechunk(std::string_view(out).substr(bodyBeg))) {
          return out;
        }
      } else if (framing.contentLength && out.size() - bodyBeg >= *framing.contentLength) {
        return out;
      }
    }
    if (WaitReadable(fd, deadline) != WaitResult::Ready) {
      return out;
    }
    const auto nbRead = ::recv(fd, buf, sizeof(buf), 0);
    if (nbRead == -1 && errno == EINTR) {
      continue;
    }
    if (nbRead <= 0) {
      return out;
    }
    out.append(buf, static_cast<std::size_t>(nbRead));
  }
}

std::string recvUntilClosed(int fd, std::chrono::milliseconds totalTimeout) {
  const auto deadline = SteadyClock::now() + totalTimeout;
  std::string out;
  char buf[4096];
  while (WaitReadable(fd, deadline) == WaitResult::Ready) {
    const auto nbRead = ::recv(fd, buf, sizeof(buf), 0);
    if (nbRead == -1 && errno == EINTR) {
      continue;
    }
    if (nbRead <= 0) {
      break;
    }
    out.append(buf, static_cast<std::size_t>(nbRead));
  }
  return out;
}

std::optional<ParsedResponse> parseResponse(std::string_view raw, bool headRequest) {
  const auto headEnd = raw.find(kHeadEnd);
  if (headEnd == std::string_view::npos) {
    return std::nullopt;
  }
  ParsedResponse resp;
  std::string_view head = raw.substr(0, headEnd + 2U);

  const auto statusLineEnd = head.find("\r\n");
  const auto statusLine = head.substr(0, statusLineEnd);
  const auto firstSpace = statusLine.find(' ');
  if (firstSpace == std::string_view::npos || statusLine.size() < firstSpace + 4U) {
    return std::nullopt;
  }
  resp.version = statusLine.substr(0, firstSpace);
  int status = 0;
  const auto codeStr = statusLine.substr(firstSpace + 1U, 3U);
  const auto [ptr, ec] = std::from_chars(codeStr.data(), codeStr.data() + codeStr.size(), status);
  if (ec != std::errc{}) {
    return std::nullopt;
  }
  resp.statusCode = static_cast<http::StatusCode>(status);
  if (statusLine.size() > firstSpace + 5U) {
    resp.reason = statusLine.substr(firstSpace + 5U);
  }

  head.remove_prefix(statusLineEnd + 2U);
  while (!head.empty()) {
    const auto lineEnd = head.find("\r\n");
    const auto line = head.substr(0, lineEnd);
    const auto colon = line.find(':');
    if (colon != std::string_view::npos) {
      auto value = line.substr(colon + 1U);
      while (!value.empty() && value.front() == ' ') {
        value.remove_prefix(1);
      }
      resp.headers.add(line.substr(0, colon), value);
    }
    head.remove_prefix(lineEnd + 2U);
  }

  std::string_view body = raw.substr(headEnd + kHeadEnd.size());
  if (headRequest) {
    return resp;
  }
  resp.chunked = CaseInsensitiveListContains(resp.headers.getOrEmpty("Transfer-Encoding"), "chunked");
  if (resp.chunked) {
    auto dechunked = Dechunk(body);
    if (!dechunked) {
      return std::nullopt;
    }
    resp.body = std::move(*dechunked);
  } else {
    resp.body = body;
  }
  return resp;
}

ParsedResponse requestOrThrow(uint16_t port, const RequestOptions& opt) {
  ClientConnection conn(port);
  if (!sendAll(conn.fd(), buildRequest(opt))) {
    throw std::runtime_error("requestOrThrow: send failed");
  }
  const bool headRequest = opt.method == "HEAD";
  const std::string raw = recvResponse(conn.fd(), headRequest);
  auto parsed = parseResponse(raw, headRequest);
  if (!parsed) {
    throw std::runtime_error("requestOrThrow: invalid or incomplete response: '" + raw + "'");
  }
  return std::move(*parsed);
}

std::string sendAndCollect(uint16_t port, std::string_view raw) {
  ClientConnection conn(port);
  if (!sendAll(conn.fd(), raw)) {
    throw std::runtime_error("sendAndCollect: send failed");
  }
  return recvUntilClosed(conn.fd());
}

bool AttemptConnect(uint16_t port) {
  try {
    ClientConnection conn(port, 200ms);
    return true;
  } catch (const std::system_error&) {
    return false;
  }
}

bool WaitForPeerClose(int fd, std::chrono::milliseconds timeout) {
  const auto deadline = SteadyClock::now() + timeout;
  char buf[512];
  while (WaitReadable(fd, deadline) == WaitResult::Ready) {
    const auto nbRead = ::recv(fd, buf, sizeof(buf), 0);
    if (nbRead == -1 && errno == EINTR) {
      continue;
    }
    if (nbRead <= 0) {
      return true;
    }
  }
  return false;
}

int FindListeningSocket(uint16_t port) {
  std::error_code ec;
  for (const auto& entry : std::filesystem::directory_iterator("/proc/self/fd", ec)) {
    int fd = -1;
    const std::string name = entry.path().filename().string();
    if (std::from_chars(name.data(), name.data() + name.size(), fd).ec != std::errc{}) {
      continue;
    }
    int accepting = 0;
    socklen_t optLen = sizeof(accepting);
    if (::getsockopt(fd, SOL_SOCKET, SO_ACCEPTCONN, &accepting, &optLen) != 0 || accepting == 0) {
      continue;
    }
    sockaddr_storage addr{};
    socklen_t addrLen = sizeof(addr);
    if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &addrLen) != 0) {
      continue;
    }
    uint16_t boundPort = 0;
    if (addr.ss_family == AF_INET) {
      boundPort = ntohs(reinterpret_cast<const sockaddr_in*>(&addr)->sin_port);
    } else if (addr.ss_family == AF_INET6) {
      boundPort = ntohs(reinterpret_cast<const sockaddr_in6*>(&addr)->sin6_port);
    }
    if (boundPort == port) {
      return fd;
    }
  }
  return -1;
}

}  // namespace quay::test
