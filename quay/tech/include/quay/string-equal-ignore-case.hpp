#pragma once

#include <string_view>

#include "quay/string-trim.hpp"
#include "quay/toupperlower.hpp"

namespace quay {

constexpr bool CaseInsensitiveEqual(std::string_view lhs, std::string_view rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }

  const char* pLhs = lhs.data();
  const char* pRhs = rhs.data();
  const char* end = pLhs + lhs.size();

  for (; pLhs != end; ++pLhs, ++pRhs) {
    if (tolower(*pLhs) != tolower(*pRhs)) {
      return false;
    }
  }
  return true;
}

constexpr bool StartsWithCaseInsensitive(std::string_view value, std::string_view prefix) {
  if (value.size() < prefix.size()) {
    return false;
  }
  return CaseInsensitiveEqual(value.substr(0, prefix.size()), prefix);
}

// Returns true if the comma separated list 'values' contains 'token' (case-insensitive, surrounding spaces ignored).
// Typical use: Connection header tokens ("keep-alive", "close").
constexpr bool CaseInsensitiveListContains(std::string_view values, std::string_view token) {
  while (!values.empty()) {
    const auto commaPos = values.find(',');
    if (CaseInsensitiveEqual(TrimOws(values.substr(0, commaPos)), token)) {
      return true;
    }
    if (commaPos == std::string_view::npos) {
      break;
    }
    values.remove_prefix(commaPos + 1);
  }
  return false;
}

}  // namespace quay
