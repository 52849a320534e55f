#pragma once

#include <string_view>

namespace quay {

// Trim OWS (optional whitespace) per RFC7230: SP and HTAB only.
constexpr std::string_view TrimOws(std::string_view sv) noexcept {
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) {
    sv.remove_suffix(1);
  }
  return sv;
}

}  // namespace quay
