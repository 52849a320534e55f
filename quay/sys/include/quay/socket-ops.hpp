#pragma once

#include <sys/socket.h>  // sockaddr_storage

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "quay/platform.hpp"
#include "quay/timedef.hpp"

namespace quay {

// Thin wrappers centralising socket system calls so that the http and main layers never include
// networking headers directly.

// Enable TCP_NODELAY (disable Nagle's algorithm) on a TCP socket.
// Returns true on success.
bool SetTcpNoDelay(NativeHandle fd) noexcept;

// Set SO_SNDTIMEO so that a blocking send on `fd` fails with EAGAIN after `timeout` without progress.
// Returns true on success.
bool SetSendTimeout(NativeHandle fd, std::chrono::milliseconds timeout) noexcept;

// Fill `addr` with the remote peer address of `fd`.
// Returns true on success.
bool GetPeerAddress(NativeHandle fd, sockaddr_storage& addr) noexcept;

// Formats an IPv4 or IPv6 socket address as "host:port" ("[host]:port" for IPv6).
// IPv4-mapped IPv6 addresses are rendered in their IPv4 form.
std::string FormatAddress(const sockaddr_storage& addr);

// Send data on a connected socket with MSG_NOSIGNAL.
// Returns the number of bytes sent, or -1 on error (errno is set).
int64_t SafeSend(NativeHandle fd, const void* data, std::size_t len) noexcept;

inline int64_t SafeSend(NativeHandle fd, std::string_view data) noexcept {
  return SafeSend(fd, data.data(), data.size());
}

// Receive available data from a connected socket, retrying on EINTR.
// Returns the number of bytes read, 0 when the peer closed the connection, or -1 on error (errno is set).
int64_t SafeRecv(NativeHandle fd, void* buf, std::size_t len) noexcept;

// Shutdown the write half of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownWrite(NativeHandle fd) noexcept;

// Shutdown both read and write halves of a socket connection.
// Returns true on success, false on error (errno is set).
bool ShutdownReadWrite(NativeHandle fd) noexcept;

enum class WaitResult : uint8_t { Ready, Timeout, Error };

// Block until `fd` is readable (or writable), or until `deadline` is reached.
// Interruptions by signals are retried with the remaining time.
WaitResult WaitReadable(NativeHandle fd, SteadyTimePoint deadline) noexcept;
WaitResult WaitWritable(NativeHandle fd, SteadyTimePoint deadline) noexcept;

inline constexpr std::size_t kMaxWaitFds = 4;

// Block until at least one of `fds` (at most kMaxWaitFds) is readable, or until `deadline` is reached.
// On Ready, `readyIdx` is the index of the first readable fd.
WaitResult WaitAnyReadable(std::span<const NativeHandle> fds, SteadyTimePoint deadline, std::size_t& readyIdx) noexcept;

}  // namespace quay
