#pragma once

#include <fmt/format.h>

#include <cerrno>
#include <system_error>
#include <utility>

namespace quay {

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: throw_errno("bind failed for {}", addr);
template <typename... Args>
[[noreturn]] void throw_errno(fmt::format_string<Args...> fmt, Args&&... args) {
  const int savedErr = errno;
  throw std::system_error(std::error_code(savedErr, std::generic_category()),
                          fmt::format(fmt, std::forward<Args>(args)...));
}

}  // namespace quay
